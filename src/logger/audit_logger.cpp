// ---------------------------------------------------------------------------
// audit_logger.cpp
// ---------------------------------------------------------------------------

#include "logger/audit_logger.hpp"

#include <cstdio>
#include <exception>
#include <string>
#include <utility>

#include <spdlog/spdlog.h>

AuditLogger::AuditLogger(AuditPolicy policy, std::shared_ptr<spdlog::logger> sink)
    : policy_(policy)
    , sink_(sink ? std::move(sink) : spdlog::default_logger()) {}

void AuditLogger::log_operation(const SecurityContext&                    context,
                                std::string_view                          operation,
                                const nlohmann::json*                     arguments,
                                const std::expected<void, SecurityError>& result) const noexcept {
    const bool should_log = result.has_value() ? policy_.log_all_operations
                                               : policy_.log_failures;
    if (!should_log || !sink_) {
        return;
    }

    try {
        std::string args_str;
        if (!policy_.include_arguments) {
            args_str = "REDACTED";
        } else if (arguments == nullptr) {
            args_str = "N/A";
        } else {
            // 잘못된 UTF-8 이 있어도 로그 기록은 실패하지 않도록 replace
            args_str = arguments->dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
        }

        if (result.has_value()) {
            sink_->info("security_audit: server={} tool={} operation={} args={} status=SUCCESS",
                        context.server_id, context.tool_name, operation, args_str);
        } else {
            sink_->warn(
                "security_audit: server={} tool={} operation={} args={} status=FAILED error={}",
                context.server_id, context.tool_name, operation, args_str,
                result.error().message);
        }
    } catch (const std::exception& e) {
        std::fprintf(stderr, "audit_logger: failed to write audit record: %s\n", e.what());
    }
}

void AuditLogger::log_sensitive_access(const SecurityContext&       context,
                                       const std::filesystem::path& path,
                                       FileOperation                op) const noexcept {
    if (!policy_.log_sensitive_access || !sink_) {
        return;
    }
    if (op != FileOperation::kWrite && op != FileOperation::kDelete) {
        return;
    }

    try {
        sink_->info("security_audit: server={} tool={} sensitive_access={} path={}",
                    context.server_id, context.tool_name, to_string(op), path.string());
    } catch (const std::exception& e) {
        std::fprintf(stderr, "audit_logger: failed to write audit record: %s\n", e.what());
    }
}
