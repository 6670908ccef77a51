#include "gate/gate_server.hpp"

#include <boost/asio/io_context.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <optional>
#include <string>
#include <string_view>

// ---------------------------------------------------------------------------
// Helper: 환경변수 읽기 (없거나 비어 있으면 std::nullopt)
// ---------------------------------------------------------------------------
namespace {

std::optional<std::string> env_str(const char* name) {
    const char* val = std::getenv(name);  // NOLINT(concurrency-mt-unsafe)
    if (val != nullptr && val[0] != '\0') {
        return std::string(val);
    }
    return std::nullopt;
}

std::optional<std::uint32_t> env_u32(const char* name) {
    const auto raw = env_str(name);
    if (!raw.has_value()) {
        return std::nullopt;
    }
    std::uint32_t parsed{0};
    const char*   end = raw->data() + raw->size();
    const auto [ptr, ec] = std::from_chars(raw->data(), end, parsed);
    if (ec != std::errc{} || ptr != end || parsed == 0) {
        spdlog::warn("env {}: invalid value '{}', ignoring", name, *raw);
        return std::nullopt;
    }
    return parsed;
}

} // namespace

// ---------------------------------------------------------------------------
// main
// ---------------------------------------------------------------------------
int main(int /*argc*/, char* /*argv*/[]) {

    // ── 진단 로그는 stderr 로 (stdout 은 응답 채널) ─────────────────────
    spdlog::set_default_logger(spdlog::stderr_color_mt("toolgate"));

    // ── 설정 로드 (환경변수, 없으면 정책 파일 global 섹션 / 기본값) ──────
    GateOptions options;
    if (auto path = env_str("TOOLGATE_POLICY_PATH")) {
        options.policy_path = std::move(*path);
    }
    options.preset         = env_str("TOOLGATE_PRESET").value_or("restrictive");
    options.log_level      = env_str("TOOLGATE_LOG_LEVEL");
    if (auto audit = env_str("TOOLGATE_AUDIT_LOG")) {
        options.audit_log_path = std::move(*audit);
    }
    options.worker_threads = env_u32("TOOLGATE_WORKERS");

    spdlog::info("Starting toolgate");
    spdlog::info("Policy: {}", options.policy_path.has_value()
                                   ? options.policy_path->string()
                                   : "preset '" + options.preset + "'");

    // ── GateServer 생성 및 실행 ─────────────────────────────────────────
    boost::asio::io_context ioc{1};
    GateServer server{options};
    if (!server.start(ioc)) {
        return EXIT_FAILURE;
    }
    ioc.run();

    // ── 종료 처리 ───────────────────────────────────────────────────────
    spdlog::info("toolgate stopped");

    return EXIT_SUCCESS;
}
