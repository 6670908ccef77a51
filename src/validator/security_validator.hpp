#pragma once

// ---------------------------------------------------------------------------
// security_validator.hpp
//
// 도구 호출 하나에 대한 전체 보안 검증 파이프라인.
//
// [파이프라인]
// 1. classify_tool(tool_name) → (InputContext, ToolCategory)
// 2. InputSanitizer::sanitize_json(arguments, input_context)
// 3. 카테고리별 검사 (default 없는 switch)
//    - kFilesystem   : PathValidator
//    - kProcess      : 명령 block/allow, 셸 실행, args 제한
//    - kNetwork      : URL 파싱, 프로토콜, 사설망/루프백, URL 패턴
//    - kUnclassified : strict_mode 이면 경고만 남기고 허용
// 4. 감사 로그 (성공/실패 모두 AuditPolicy 조건에 따라)
// 5. 정제된 인자 반환
//
// [소유권]
// SecurityPolicy 는 shared_ptr<const> 로 공유한다. validator 는 생성 후
// 상태를 바꾸지 않으므로 여러 스레드에서 동시에 호출해도 안전하다.
// 정책 교체는 ValidatorRegistry 가 validator 자체를 교체하는 방식으로 한다.
//
// [정책 정규식 fail-close]
// blocked_urls / blocked_args_patterns 중 컴파일에 실패한 패턴이 있으면
// 해당 검사가 필요한 모든 호출 (URL 이 있는 네트워크 호출 / args 가 있는
// 프로세스 호출) 을 거부한다.
// ---------------------------------------------------------------------------

#include <cstdint>
#include <expected>
#include <filesystem>
#include <memory>
#include <optional>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "common/types.hpp"
#include "logger/audit_logger.hpp"
#include "policy/pattern_set.hpp"
#include "policy/rule.hpp"
#include "sanitizer/env_sanitizer.hpp"
#include "sanitizer/input_sanitizer.hpp"
#include "validator/path_validator.hpp"

class ValidationStats;

namespace spdlog {
class logger;
}

// ---------------------------------------------------------------------------
// ToolClassification
//   도구 이름 하나로부터 동시에 결정되는 두 분류.
// ---------------------------------------------------------------------------
struct ToolClassification {
    InputContext input_context{InputContext::kGeneric};
    ToolCategory category{ToolCategory::kUnclassified};
};

// classify_tool
//   소문자로 변환한 도구 이름의 부분 문자열로 분류한다.
//   input_context: file|path → kFilePath, exec|command → kCommand,
//                  sql|query → kSqlQuery, url|http → kWebUrl, 그 외 kGeneric
//   category     : file|read|write → kFilesystem, exec|run|command → kProcess,
//                  http|fetch|url → kNetwork, 그 외 kUnclassified
[[nodiscard]] ToolClassification classify_tool(std::string_view tool_name);

class SecurityValidator {
public:
    // policy     : nullptr 이면 std::invalid_argument
    // audit_sink : 감사 로그 대상. nullptr 이면 spdlog 기본 로거
    // stats      : 선택. 주어지면 모든 validate_tool_call 결과를 집계한다.
    explicit SecurityValidator(std::shared_ptr<const SecurityPolicy> policy,
                               std::shared_ptr<spdlog::logger>       audit_sink = nullptr,
                               std::shared_ptr<ValidationStats>      stats      = nullptr);

    ~SecurityValidator();

    SecurityValidator(const SecurityValidator&)            = delete;
    SecurityValidator& operator=(const SecurityValidator&) = delete;
    SecurityValidator(SecurityValidator&&) noexcept;
    SecurityValidator& operator=(SecurityValidator&&) noexcept;

    // validate_tool_call
    //   성공: 정제된 인자 트리
    //   실패: 첫 번째로 위반한 규칙의 SecurityError
    [[nodiscard]] std::expected<nlohmann::json, SecurityError>
    validate_tool_call(std::string_view       tool_name,
                       const nlohmann::json&  arguments,
                       const SecurityContext& context) const;

    // 카테고리별 검사. arguments 는 이미 정제된 인자 트리여야 한다.
    [[nodiscard]] std::expected<void, SecurityError>
    validate_filesystem_tool(const nlohmann::json& arguments) const;

    [[nodiscard]] std::expected<void, SecurityError>
    validate_process_tool(const nlohmann::json& arguments) const;

    [[nodiscard]] std::expected<void, SecurityError>
    validate_network_tool(const nlohmann::json& arguments) const;

    [[nodiscard]] std::expected<void, SecurityError>
    validate_file_size(std::uint64_t size) const;

    // 하위 프로세스 생성 직전에 호출한다. 실패하지 않는다.
    [[nodiscard]] EnvMap sanitize_environment(const EnvMap& env) const;

    [[nodiscard]] const SecurityPolicy& policy() const noexcept { return *policy_; }

    [[nodiscard]] const std::shared_ptr<const SecurityPolicy>& shared_policy() const noexcept {
        return policy_;
    }

private:
    // 승인된 파일 접근 하나 (민감 접근 감사용)
    struct FileAccess {
        std::filesystem::path canonical;
        FileOperation         op;
    };

    // 경로 인자가 없으면 빈 벡터
    [[nodiscard]] std::expected<std::vector<FileAccess>, SecurityError>
    check_filesystem(const nlohmann::json& arguments) const;

    [[nodiscard]] std::expected<void, SecurityError>
    check_command(std::string_view command) const;

    [[nodiscard]] std::expected<void, SecurityError>
    check_arguments(const nlohmann::json& args) const;

    [[nodiscard]] std::expected<void, SecurityError>
    check_url(std::string_view url) const;

    std::shared_ptr<const SecurityPolicy> policy_;
    PathValidator                         path_validator_;
    InputSanitizer                        input_sanitizer_;
    EnvVarSanitizer                       env_sanitizer_;
    AuditLogger                           audit_logger_;
    PatternSet                            blocked_url_patterns_;
    PatternSet                            allowed_url_patterns_;
    PatternSet                            blocked_arg_patterns_;
    PatternSet                            allowed_arg_patterns_;
    std::shared_ptr<ValidationStats>      stats_;
};
