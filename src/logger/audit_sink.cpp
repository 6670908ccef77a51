// ---------------------------------------------------------------------------
// audit_sink.cpp
// ---------------------------------------------------------------------------

#include "logger/audit_sink.hpp"

#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>

#include <spdlog/common.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_sinks.h>
#include <spdlog/spdlog.h>

namespace {

spdlog::level::level_enum to_spdlog_level(LogLevel level) {
    switch (level) {
        case LogLevel::kDebug:
            return spdlog::level::debug;
        case LogLevel::kInfo:
            return spdlog::level::info;
        case LogLevel::kWarn:
            return spdlog::level::warn;
        case LogLevel::kError:
            return spdlog::level::err;
    }
    return spdlog::level::info;
}

}  // namespace

std::shared_ptr<spdlog::logger>
make_audit_sink(LogLevel min_level, const std::optional<std::filesystem::path>& log_path) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_sink_mt>());

    if (log_path.has_value()) {
        const auto parent = log_path->parent_path();
        if (!parent.empty()) {
            std::error_code ec;
            std::filesystem::create_directories(parent, ec);
            if (ec) {
                throw std::runtime_error("Audit log directory creation failed: " +
                                         parent.string() + ": " + ec.message());
            }
        }

        // Rotating file sink (100MB, 3개 파일 유지)
        constexpr std::size_t kMaxFileSize = 100 * 1024 * 1024;
        constexpr std::size_t kMaxFiles    = 3;
        try {
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                log_path->string(), kMaxFileSize, kMaxFiles));
        } catch (const spdlog::spdlog_ex& ex) {
            throw std::runtime_error(std::string("Audit log initialization failed: ") + ex.what());
        }
    }

    auto logger = std::make_shared<spdlog::logger>(kAuditLoggerName, sinks.begin(), sinks.end());
    logger->set_level(to_spdlog_level(min_level));

    // 구조화 필드는 AuditLogger 가 메시지 본문에 직접 구성한다.
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [audit] [%l] %v");

    // 감사 로그는 유실되면 안 되므로 매 로그마다 플러시
    logger->flush_on(spdlog::level::trace);

    return logger;
}

void set_diagnostic_level(LogLevel level) {
    spdlog::set_level(to_spdlog_level(level));
}
