#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

// ---------------------------------------------------------------------------
// SecurityContext
//   도구 호출 하나를 식별하는 불변 컨텍스트.
//   디스패치 레이어가 호출마다 생성하고 validator/logger 레이어에
//   const-ref 로 전달한다. 코어는 이 값을 저장하지 않는다.
// ---------------------------------------------------------------------------
struct SecurityContext {
    std::string                           server_id{};     // 도구를 제공하는 MCP 서버 ID
    std::string                           tool_name{};     // 호출된 도구 이름
    std::string                           operation_id{};  // 호출 단위 고유 ID (감사 로그 상관관계용)
    std::chrono::system_clock::time_point timestamp{};     // 호출 수신 시각
    std::optional<std::string>            user_context{};  // 상위 레이어가 인증한 사용자 정보
};

// ---------------------------------------------------------------------------
// FileOperation
//   파일시스템 권한 판정용 분류 태그. 리소스를 소유하지 않는다.
// ---------------------------------------------------------------------------
enum class FileOperation : std::uint8_t {
    kRead   = 0,
    kWrite  = 1,
    kDelete = 2,
    kList   = 3,
};

// ---------------------------------------------------------------------------
// InputContext
//   InputSanitizer 가 적용할 탐지 규칙 집합.
// ---------------------------------------------------------------------------
enum class InputContext : std::uint8_t {
    kFilePath = 0,
    kCommand  = 1,
    kSqlQuery = 2,
    kWebUrl   = 3,
    kGeneric  = 4,
};

// ---------------------------------------------------------------------------
// ToolCategory
//   도구 이름으로부터 결정되는 검사 카테고리.
//   SecurityValidator 는 이 값에 대해 default 없는 switch 로 분기한다.
// ---------------------------------------------------------------------------
enum class ToolCategory : std::uint8_t {
    kFilesystem   = 0,
    kProcess      = 1,
    kNetwork      = 2,
    kUnclassified = 3,
};

// ---------------------------------------------------------------------------
// InjectionKind
//   kInjectionDetected 오류의 세부 분류.
// ---------------------------------------------------------------------------
enum class InjectionKind : std::uint8_t {
    kNone    = 0,
    kSql     = 1,
    kCommand = 2,
    kPath    = 3,
    kScript  = 4,
};

// ---------------------------------------------------------------------------
// SecurityErrorCode
//   검증 단계에서 발생 가능한 거부 사유 분류.
//   첫 번째 위반 규칙이 호출 전체를 중단시킨다 (fail-fast, fail-close).
// ---------------------------------------------------------------------------
enum class SecurityErrorCode : std::uint8_t {
    // 파일시스템
    kPathTraversal           = 0,
    kPathNotAbsolute         = 1,
    kPathBlocked             = 2,
    kPathNotAllowlisted      = 3,
    kExtensionBlocked        = 4,
    kExtensionNotAllowlisted = 5,
    kHiddenFileDenied        = 6,
    kSymlinkDenied           = 7,
    kOperationNotPermitted   = 8,
    kFileTooLarge            = 9,
    kCanonicalizationFailed  = 10,  // 경로 정규화 실패 (존재하지 않는 경로 등)

    // 입력 정제
    kInjectionDetected       = 20,
    kInvalidJsonKey          = 21,
    kInputTooLong            = 22,

    // 프로세스
    kCommandBlocked          = 30,
    kCommandNotAllowlisted   = 31,
    kShellExecutionDenied    = 32,
    kTooManyArguments        = 33,
    kArgumentTooLong         = 34,
    kArgumentBlocked         = 35,
    kArgumentNotAllowlisted  = 36,

    // 네트워크
    kInvalidUrl              = 40,
    kProtocolNotAllowed      = 41,
    kPrivateNetworkBlocked   = 42,
    kLoopbackBlocked         = 43,
    kUrlBlocked              = 44,
    kUrlNotAllowlisted       = 45,

    // 정책 자체를 사용할 수 없음 (fail-close)
    kPolicyUnavailable       = 50,
};

// ---------------------------------------------------------------------------
// SecurityError
//   거부 시 반환되는 오류 정보.
//   std::expected<T, SecurityError> 패턴과 함께 사용한다.
//   message 는 도구 호출 오류로 클라이언트에 그대로 전달될 수 있다.
// ---------------------------------------------------------------------------
struct SecurityError {
    SecurityErrorCode code{SecurityErrorCode::kPolicyUnavailable};
    InjectionKind     injection{InjectionKind::kNone};  // kInjectionDetected 일 때만 의미 있음
    std::string       message{};                         // 사람이 읽을 수 있는 거부 사유
};

// 로그/응답용 문자열 변환. 반환값은 정적 문자열이다.
[[nodiscard]] std::string_view to_string(SecurityErrorCode code) noexcept;
[[nodiscard]] std::string_view to_string(InjectionKind kind) noexcept;
[[nodiscard]] std::string_view to_string(FileOperation op) noexcept;
[[nodiscard]] std::string_view to_string(InputContext ctx) noexcept;
[[nodiscard]] std::string_view to_string(ToolCategory category) noexcept;
