#pragma once

// ---------------------------------------------------------------------------
// audit_logger.hpp
//
// 도구 호출 검증 결과를 감사 로그로 기록한다.
//
// [기록 조건]
// - 성공: AuditPolicy::log_all_operations 가 true 일 때만 (info)
// - 실패: AuditPolicy::log_failures 가 true 일 때만 (warn)
// - 민감 접근 (Write/Delete 승인): log_sensitive_access 가 true 일 때 (info)
//
// [라인 형식]
//   security_audit: server=<id> tool=<name> operation=<op> args=<...> status=SUCCESS
//   security_audit: server=<id> tool=<name> operation=<op> args=<...> status=FAILED error=<msg>
//   args: include_arguments 가 false 면 REDACTED, 인자가 없으면 N/A, 그 외 JSON 직렬화
//
// [격리 원칙]
// 감사 로그 실패가 검증 결과로 전파되지 않도록 모든 기록 메서드는 noexcept 이다.
// spdlog 예외는 내부에서 잡아 stderr 로 한 줄 남긴다.
// ---------------------------------------------------------------------------

#include <expected>
#include <filesystem>
#include <memory>
#include <string_view>

#include <nlohmann/json.hpp>

#include "common/types.hpp"
#include "policy/rule.hpp"

namespace spdlog {
class logger;
}

class AuditLogger {
public:
    // sink: nullptr 이면 생성 시점의 spdlog 기본 로거를 사용한다.
    explicit AuditLogger(AuditPolicy policy, std::shared_ptr<spdlog::logger> sink = nullptr);

    // log_operation
    //   operation: 수행한 작업 이름 (보통 도구 이름)
    //   arguments: 기록할 인자 트리. nullptr 이면 "N/A"
    void log_operation(const SecurityContext&                    context,
                       std::string_view                          operation,
                       const nlohmann::json*                     arguments,
                       const std::expected<void, SecurityError>& result) const noexcept;

    // log_sensitive_access
    //   승인된 Write / Delete 파일 작업을 기록한다. Read / List 는 무시.
    void log_sensitive_access(const SecurityContext&       context,
                              const std::filesystem::path& path,
                              FileOperation                op) const noexcept;

    [[nodiscard]] const AuditPolicy& policy() const noexcept { return policy_; }

private:
    AuditPolicy                     policy_;
    std::shared_ptr<spdlog::logger> sink_;
};
