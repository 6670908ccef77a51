#pragma once

// ---------------------------------------------------------------------------
// rule.hpp
//
// 보안 정책 설정 구조체 정의 (헤더만, 구현 없음).
// presets.cpp 의 생성 함수 또는 PolicyLoader (yaml-cpp) 로부터 만들어진다.
//
// [설계 원칙]
// - 이 헤더는 표준 라이브러리 외 다른 헤더에 의존하지 않는다 (독립적).
// - 모든 멤버는 기본값을 명시한다. 기본값은 항상 fail-close 쪽이다
//   (쓰기/삭제/숨김파일/심볼릭 링크/셸 모두 거부).
// - 구조체 자체는 판정 로직을 포함하지 않는다.
// - 생성 후 변경하지 않는다. 정책 갱신은 새 SecurityPolicy 를 만들고
//   ValidatorRegistry 에서 validator 를 원자적으로 교체하는 방식으로만 한다.
//
// [우선순위 불변식]
// - 모든 판정 지점에서 blocklist 가 allowlist 보다 우선한다.
// - 빈 allowlist 는 "전부 거부" 가 아니라 "allowlist 제한 없음" 을 뜻한다.
//   blocklist 와 나머지 검사는 그대로 적용된다.
// ---------------------------------------------------------------------------

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// FilesystemPolicy
//   경로 기반 접근 제어.
//   allowed_paths / blocked_paths 는 절대 경로이며 컴포넌트 단위 prefix 로
//   비교한다 ("/etc" 는 "/etcfoo" 를 포함하지 않는다).
//   확장자는 점을 포함해 적는다 (예: ".txt"). 비교는 대소문자 무관.
// ---------------------------------------------------------------------------
struct FilesystemPolicy {
    std::vector<std::filesystem::path>      allowed_paths{};       // 빈값 = allowlist 제한 없음
    std::vector<std::filesystem::path>      blocked_paths{};       // 항상 우선
    std::optional<std::vector<std::string>> allowed_extensions{};  // nullopt = 모든 확장자 허용
    std::vector<std::string>                blocked_extensions{};
    std::optional<std::uint64_t>            max_file_size{};       // 바이트, nullopt = 제한 없음
    bool                                    allow_hidden{false};
    bool                                    allow_symlinks{false};
    bool                                    allow_write{false};
    bool                                    allow_delete{false};
};

// ---------------------------------------------------------------------------
// ProcessPolicy
//   명령 실행 제어.
//   blocked_commands: 명령 문자열에 부분 문자열로 포함되면 차단.
//   allowed_commands: 정확히 일치하거나 "<allowed> " 로 시작해야 허용.
//   *_args_patterns : ECMAScript 정규식. args 배열의 각 원소에 적용된다.
// ---------------------------------------------------------------------------
struct ProcessPolicy {
    std::vector<std::string>   allowed_commands{};
    std::vector<std::string>   blocked_commands{};
    std::vector<std::string>   allowed_args_patterns{};
    std::vector<std::string>   blocked_args_patterns{};
    std::optional<std::size_t> max_args{};
    std::optional<std::size_t> max_arg_length{};
    bool                       allow_shell{false};
};

// ---------------------------------------------------------------------------
// NetworkPolicy
//   아웃바운드 요청 제어.
//   allowed_urls / blocked_urls: URL 전체 문자열에 대한 ECMAScript 정규식.
//   allowed_protocols: 빈값 = 모든 scheme 허용.
//   allowed_ports: 선언만 되어 있다 (DESIGN.md 참고).
// ---------------------------------------------------------------------------
struct NetworkPolicy {
    std::vector<std::string>                  allowed_urls{};
    std::vector<std::string>                  blocked_urls{};
    std::vector<std::string>                  allowed_protocols{};
    std::optional<std::vector<std::uint16_t>> allowed_ports{};
    bool                                      block_private_ips{true};
    bool                                      block_loopback{true};
};

// ---------------------------------------------------------------------------
// EnvironmentPolicy
//   하위 프로세스에 전달할 환경변수 필터.
//   sanitize_vars 에 포함된 변수는 값에서 [A-Za-z0-9_.\-/] 외 문자를 제거한다.
// ---------------------------------------------------------------------------
struct EnvironmentPolicy {
    std::vector<std::string> allowed_vars{};
    std::vector<std::string> blocked_vars{};   // 항상 우선
    std::vector<std::string> sanitize_vars{};
    bool                     allow_passthrough{false};
};

// ---------------------------------------------------------------------------
// RateLimitPolicy
//   선언 전용. 이 코어의 어떤 컴포넌트도 강제하지 않는다.
//   상위 디스패치 레이어가 읽어 사용할 수 있도록 정책과 함께 배포된다.
// ---------------------------------------------------------------------------
struct RateLimitPolicy {
    std::optional<std::uint32_t> max_requests_per_minute{};
    std::optional<std::uint32_t> max_concurrent{};
    std::optional<std::uint64_t> max_total_operations{};
};

// ---------------------------------------------------------------------------
// AuditPolicy
//   감사 로그 기록 조건.
//   include_arguments = false 이면 인자는 "REDACTED" 로 대체된다.
// ---------------------------------------------------------------------------
struct AuditPolicy {
    bool log_all_operations{false};
    bool log_failures{true};
    bool log_sensitive_access{true};
    bool include_arguments{false};
};

// ---------------------------------------------------------------------------
// SecurityPolicy
//   전체 보안 정책의 루트 구조체.
//   presets.hpp 의 생성 함수나 PolicyLoader::load 가 반환한다.
//   SecurityValidator 는 std::shared_ptr<const SecurityPolicy> 로 공유한다.
// ---------------------------------------------------------------------------
struct SecurityPolicy {
    std::string                id{};
    std::optional<std::string> description{};
    FilesystemPolicy           filesystem{};
    ProcessPolicy              process{};
    NetworkPolicy              network{};
    EnvironmentPolicy          environment{};
    RateLimitPolicy            rate_limits{};
    AuditPolicy                audit{};
    bool                       strict_mode{true};
};
