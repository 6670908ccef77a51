#pragma once

// ---------------------------------------------------------------------------
// policy_loader.hpp
//
// YAML 정책 파일을 로드하여 GateConfig 로 변환하는 로더.
// YAML 은 JSON 의 상위 집합이므로 JSON 정책 파일도 그대로 읽는다.
//
// [설계 원칙]
// - load() 실패 시 std::unexpected(error_message) 반환. 호출자는
//   실패 시 반드시 기존 정책을 유지하거나 서비스를 차단해야 한다.
// - All-or-nothing: 한 필드라도 잘못되면 부분 정책을 반환하지 않는다.
// - 정책 노드는 preset 을 기반으로 시작하고 (생략 시 restrictive),
//   노드에 있는 키만 기반 값을 대체한다 (base-plus-overrides).
//
// [순환 의존성]
// policy_loader.hpp → rule.hpp, presets.hpp (단방향만)
//
// [보안 고려사항]
// - 파싱 실패 원인은 로깅하되, YAML 파일 전체를 로그에 출력하지 말 것.
// - 잘못된 정규식은 로드 실패로 처리한다. validator 의 fail-close 는
//   코드로 직접 만든 정책에 대한 마지막 방어선이다.
// ---------------------------------------------------------------------------

#include <cstdint>
#include <expected>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>

#include "presets.hpp"
#include "rule.hpp"

// ---------------------------------------------------------------------------
// GlobalConfig
//   프로세스 전역 설정. 정책과 달리 reload 시에도 적용되지 않는다
//   (로그 싱크/스레드 풀은 기동 시 한 번 구성).
// ---------------------------------------------------------------------------
struct GlobalConfig {
    std::string                          log_level{"info"};
    std::optional<std::filesystem::path> audit_log_path{};  // nullopt = stderr 만
    std::uint32_t                        worker_threads{4};
};

// ---------------------------------------------------------------------------
// GateConfig
//   정책 파일 전체. server_policies 에 없는 서버는 default_policy 를 쓴다.
// ---------------------------------------------------------------------------
struct GateConfig {
    GlobalConfig                          global{};
    SecurityPolicy                        default_policy{make_restrictive_policy()};
    std::map<std::string, SecurityPolicy> server_policies{};
};

class PolicyLoader {
public:
    PolicyLoader()  = delete;

    // load
    //   지정된 경로의 파일을 읽어 GateConfig 로 파싱한다.
    //   파일 없음, 파싱 오류, 스키마 불일치, 알 수 없는 preset,
    //   잘못된 정규식 모두 실패로 처리한다.
    [[nodiscard]] static std::expected<GateConfig, std::string>
    load(const std::filesystem::path& config_path);

    // load_from_string
    //   문자열로 주어진 YAML/JSON 을 파싱한다. 의미는 load 와 동일.
    [[nodiscard]] static std::expected<GateConfig, std::string>
    load_from_string(std::string_view text);
};
