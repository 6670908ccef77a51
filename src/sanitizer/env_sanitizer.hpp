#pragma once

// ---------------------------------------------------------------------------
// env_sanitizer.hpp
//
// 하위 프로세스에 전달할 환경변수 맵을 EnvironmentPolicy 로 필터링한다.
//
// [키별 판정 순서]
// (a) blocked_vars 에 포함 → 제거 (항상 우선)
// (b) allow_passthrough == false 이고 allowed_vars 에 없음 → 제거
// (c) 키 이름에 민감 부분 문자열(대소문자 무관)이 있고
//     allowed_vars 에 없음 → 제거
// (d) sanitize_vars 에 포함 → 값에서 [A-Za-z0-9_.\-/] 외 문자를 제거
//
// [오류 없음]
// 판정 결과는 항상 "남길 것 / 뺄 것" 두 가지이며 호출을 실패시키지 않는다.
// 제거된 키는 로그에 남기지만 값은 절대 로그에 출력하지 않는다.
// ---------------------------------------------------------------------------

#include <array>
#include <map>
#include <string>
#include <string_view>

#include "policy/rule.hpp"

using EnvMap = std::map<std::string, std::string>;

// 키 이름에 포함되면 명시적 허용 없이 전달하지 않는 부분 문자열 (소문자)
inline constexpr std::array<std::string_view, 9> kSensitiveEnvKeyFragments{
    "pass", "pwd", "key", "token", "secret", "api", "auth", "credential", "private",
};

class EnvVarSanitizer {
public:
    explicit EnvVarSanitizer(EnvironmentPolicy policy);

    [[nodiscard]] EnvMap sanitize_env_vars(const EnvMap& env) const;

    [[nodiscard]] const EnvironmentPolicy& policy() const noexcept { return policy_; }

private:
    EnvironmentPolicy policy_;
};

// 키에 민감 부분 문자열이 (대소문자 무관) 포함되어 있으면 true
[[nodiscard]] bool is_sensitive_env_key(std::string_view key);
