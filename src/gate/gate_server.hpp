#pragma once

// ---------------------------------------------------------------------------
// gate_server.hpp
//
// stdin/stdout 줄 단위 JSON 게이트 서버.
//
//   사용 예:
//     GateServer server(options);
//     if (!server.start(io_ctx)) { ... }   // 정책 로드 실패 등
//     io_ctx.run();
//
// [종료 조건]
// - stdin EOF: 진행 중인 요청이 모두 응답된 뒤 종료한다.
// - SIGINT / SIGTERM: 입력 수신을 멈추고 진행 중인 요청 응답 후 종료한다.
// - SIGHUP: 정책 파일을 다시 읽는다. 실패하면 기존 정책을 유지한다.
//
// [스레드 모델]
// io_context 는 단일 스레드에서 실행한다. stdout 쓰기, 요청 카운터는
// io_context 스레드에서만 접근하므로 별도 잠금이 없다.
// 검증 자체는 AsyncValidator 의 thread_pool 에서 실행된다.
// ---------------------------------------------------------------------------

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <utility>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/posix/stream_descriptor.hpp>
#include <boost/asio/signal_set.hpp>

#include "gate/async_validator.hpp"
#include "gate/line_protocol.hpp"
#include "logger/log_types.hpp"
#include "validator/validator_registry.hpp"

namespace spdlog {
class logger;
}

// ---------------------------------------------------------------------------
// GateOptions
//   환경변수(TOOLGATE_*)에서 읽은 기동 옵션.
//   policy_path 가 있으면 정책 파일의 global 섹션이 log_level / audit_log_path /
//   worker_threads 의 기본값이 되고, 명시된 환경변수가 이를 덮어쓴다.
// ---------------------------------------------------------------------------
struct GateOptions {
    std::optional<std::filesystem::path> policy_path{};
    std::string                          preset{"restrictive"};
    std::optional<std::string>           log_level{};
    std::optional<std::filesystem::path> audit_log_path{};
    std::optional<std::uint32_t>         worker_threads{};
};

class GateServer {
public:
    explicit GateServer(GateOptions options);

    ~GateServer();

    GateServer(const GateServer&)            = delete;
    GateServer& operator=(const GateServer&) = delete;
    GateServer(GateServer&&)                 = delete;
    GateServer& operator=(GateServer&&)      = delete;

    // start
    //   정책 로드, 감사 로거/validator 구성, 시그널 등록, 입력 루프 시작.
    //   초기 정책 로드 실패 시 false (fail-close: 기동하지 않는다).
    [[nodiscard]] bool start(boost::asio::io_context& io_ctx);

    // 입력 수신 중단. 진행 중인 요청이 끝나면 io_context 의 작업이 소진된다.
    void stop();

    // 정책 파일 재로드. 파일 경로 없이 preset 으로 기동했다면 아무 것도 하지 않는다.
    void reload_policy();

    [[nodiscard]] const ValidatorRegistry& registry() const noexcept { return *registry_; }

private:
    boost::asio::awaitable<void> read_loop();
    boost::asio::awaitable<void> handle_line(std::string line);

    void dispatch_line(std::string line);
    void write_response(const nlohmann::json& response);
    void on_request_finished();
    void maybe_finish();

    [[nodiscard]] SecurityContext make_context(const GateRequest& request);

    GateOptions                                            options_;
    boost::asio::io_context*                               io_ctx_{nullptr};
    std::shared_ptr<spdlog::logger>                        audit_sink_;
    std::unique_ptr<ValidatorRegistry>                     registry_;
    std::unique_ptr<AsyncValidator>                        async_validator_;
    std::unique_ptr<boost::asio::posix::stream_descriptor> input_;
    std::unique_ptr<boost::asio::signal_set>               stop_signals_;
    std::unique_ptr<boost::asio::signal_set>               hup_signals_;

    std::size_t   in_flight_{0};
    bool          input_closed_{false};
    bool          stopping_{false};
    bool          finished_{false};
    std::uint64_t next_operation_{0};
};
