// ---------------------------------------------------------------------------
// gate_server.cpp
//
// [기동 순서]
//   1. 정책 로드 (파일 또는 preset)
//   2. 로그 레벨 / 감사 싱크 구성
//   3. ValidatorRegistry::reload + AsyncValidator 생성
//   4. 시그널 핸들러 (SIGINT/SIGTERM → stop, SIGHUP → reload_policy)
//   5. 입력 루프 co_spawn
//
// [stdin 종류]
// 파이프/터미널은 posix::stream_descriptor 로 비동기 읽기한다.
// 일반 파일은 epoll 에 등록할 수 없으므로 (EPERM) std::getline 으로 읽는다.
// 파일 입력은 끝이 있으므로 io_context 스레드를 무기한 막지 않는다.
// ---------------------------------------------------------------------------

#include "gate/gate_server.hpp"

#include <chrono>
#include <csignal>
#include <cstdio>
#include <exception>
#include <iostream>
#include <utility>

#include <unistd.h>  // dup, STDIN_FILENO

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/read_until.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "logger/audit_sink.hpp"
#include "policy/policy_loader.hpp"
#include "policy/presets.hpp"

namespace {

void log_coroutine_error(std::string_view what, std::exception_ptr eptr) {
    if (eptr) {
        try {
            std::rethrow_exception(eptr);
        } catch (const std::exception& e) {
            spdlog::error("gate_server: {} error: {}", what, e.what());
        }
    }
}

bool is_blank(std::string_view line) {
    return line.find_first_not_of(" \t\r") == std::string_view::npos;
}

}  // namespace

GateServer::GateServer(GateOptions options)
    : options_(std::move(options)) {}

GateServer::~GateServer() = default;

// ---------------------------------------------------------------------------
// GateServer::start
// ---------------------------------------------------------------------------
bool GateServer::start(boost::asio::io_context& io_ctx) {
    io_ctx_ = &io_ctx;

    // 1. 정책
    GateConfig config{};
    if (options_.policy_path.has_value()) {
        auto loaded = PolicyLoader::load(options_.policy_path.value());
        if (!loaded) {
            spdlog::error("gate_server: initial policy load failed, refusing to start: {}",
                          loaded.error());
            return false;
        }
        config = std::move(loaded.value());
    } else {
        auto preset = preset_by_name(options_.preset);
        if (!preset.has_value()) {
            spdlog::error("gate_server: unknown preset '{}', refusing to start", options_.preset);
            return false;
        }
        config.default_policy = std::move(preset.value());
    }

    // 2. 로그
    const std::string level_name = options_.log_level.value_or(config.global.log_level);
    const auto        level      = parse_log_level(level_name);
    if (!level.has_value()) {
        spdlog::error("gate_server: invalid log level '{}'", level_name);
        return false;
    }
    set_diagnostic_level(level.value());

    const auto audit_path = options_.audit_log_path.has_value() ? options_.audit_log_path
                                                                : config.global.audit_log_path;
    try {
        audit_sink_ = make_audit_sink(level.value(), audit_path);
    } catch (const std::runtime_error& e) {
        spdlog::error("gate_server: {}", e.what());
        return false;
    }

    // 3. validator
    const std::uint32_t workers = options_.worker_threads.value_or(config.global.worker_threads);
    registry_        = std::make_unique<ValidatorRegistry>(audit_sink_);
    registry_->reload(config);
    async_validator_ = std::make_unique<AsyncValidator>(*registry_, workers);

    spdlog::info("gate_server: started (policy='{}', servers={}, workers={}, audit={})",
                 config.default_policy.id, config.server_policies.size(), workers,
                 audit_path.has_value() ? audit_path->string() : std::string("stderr"));

    // 4. 시그널 핸들러
    //    SIGTERM / SIGINT → stop()
    //    SIGHUP           → reload_policy()
    stop_signals_ = std::make_unique<boost::asio::signal_set>(io_ctx, SIGTERM, SIGINT);
    stop_signals_->async_wait([this](const boost::system::error_code& ec, int /*signum*/) {
        if (!ec) {
            spdlog::info("gate_server: shutdown signal received");
            stop();
        }
    });

    hup_signals_ = std::make_unique<boost::asio::signal_set>(io_ctx, SIGHUP);
    boost::asio::co_spawn(
        io_ctx,
        [this]() -> boost::asio::awaitable<void> {
            for (;;) {
                boost::system::error_code ec;
                co_await hup_signals_->async_wait(
                    boost::asio::redirect_error(boost::asio::use_awaitable, ec));
                if (ec) {
                    co_return;
                }
                reload_policy();
            }
        },
        [](std::exception_ptr eptr) { log_coroutine_error("sighup", eptr); });

    // 5. 입력
    const int fd = ::dup(STDIN_FILENO);
    if (fd >= 0) {
        try {
            input_ = std::make_unique<boost::asio::posix::stream_descriptor>(io_ctx, fd);
        } catch (const boost::system::system_error& e) {
            ::close(fd);
            spdlog::debug("gate_server: stdin is not pollable ({}), using blocking reads", e.what());
        }
    }

    boost::asio::co_spawn(
        io_ctx,
        read_loop(),
        [](std::exception_ptr eptr) { log_coroutine_error("read_loop", eptr); });

    return true;
}

void GateServer::stop() {
    if (stopping_) {
        return;
    }
    stopping_ = true;

    if (input_) {
        boost::system::error_code ec;
        input_->cancel(ec);
    }
    maybe_finish();
}

void GateServer::reload_policy() {
    if (!options_.policy_path.has_value()) {
        spdlog::info("gate_server: no policy file configured, nothing to reload");
        return;
    }

    auto loaded = PolicyLoader::load(options_.policy_path.value());
    if (!loaded) {
        spdlog::error("gate_server: policy reload failed, keeping current policy: {}",
                      loaded.error());
        return;
    }
    registry_->reload(loaded.value());
}

// ---------------------------------------------------------------------------
// 입력 루프
// ---------------------------------------------------------------------------
boost::asio::awaitable<void> GateServer::read_loop() {
    if (input_) {
        std::string buffer;
        bool        discarding = false;  // 상한을 넘은 줄의 나머지를 버리는 중
        while (!stopping_) {
            boost::system::error_code ec;
            const std::size_t n = co_await boost::asio::async_read_until(
                *input_, boost::asio::dynamic_buffer(buffer, kMaxRequestBytes + 1), '\n',
                boost::asio::redirect_error(boost::asio::use_awaitable, ec));

            if (ec == boost::asio::error::not_found) {
                // 개행 없이 상한을 채웠다. 한 번만 응답하고 개행이 나올 때까지 버린다.
                if (!discarding) {
                    spdlog::warn("gate_server: request line exceeds {} bytes, discarding",
                                 kMaxRequestBytes);
                    write_response(make_bad_request_response(make_oversized_request_error()));
                    discarding = true;
                }
                buffer.clear();
                continue;
            }

            if (ec) {
                if (ec == boost::asio::error::eof) {
                    // 마지막 줄에 개행이 없을 수 있다
                    if (!buffer.empty() && !discarding) {
                        dispatch_line(std::move(buffer));
                    }
                } else if (ec != boost::asio::error::operation_aborted) {
                    spdlog::error("gate_server: stdin read failed: {}", ec.message());
                }
                break;
            }

            if (discarding) {
                buffer.erase(0, n);
                discarding = false;
                continue;
            }

            std::string line = buffer.substr(0, n - 1);
            buffer.erase(0, n);
            dispatch_line(std::move(line));
        }
    } else {
        std::string line;
        while (!stopping_ && std::getline(std::cin, line)) {
            dispatch_line(std::move(line));
            // 요청 코루틴이 진행될 기회를 준다
            co_await boost::asio::post(*io_ctx_, boost::asio::use_awaitable);
        }
    }

    spdlog::debug("gate_server: input closed");
    input_closed_ = true;
    maybe_finish();
}

void GateServer::dispatch_line(std::string line) {
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
    if (is_blank(line)) {
        return;
    }

    ++in_flight_;
    boost::asio::co_spawn(
        *io_ctx_,
        handle_line(std::move(line)),
        [](std::exception_ptr eptr) { log_coroutine_error("request", eptr); });
}

boost::asio::awaitable<void> GateServer::handle_line(std::string line) {
    nlohmann::json id       = nullptr;
    nlohmann::json response;

    try {
        auto request = parse_request(line);
        if (!request) {
            response = make_bad_request_response(request.error());
        } else {
            id = request->id;
            switch (request->method) {
                case GateMethod::kValidateToolCall: {
                    SecurityContext context = make_context(*request);
                    const auto result = co_await async_validator_->validate(
                        request->tool, std::move(request->arguments), std::move(context));
                    response = make_validation_response(id, result);
                    break;
                }
                case GateMethod::kSanitizeEnvironment: {
                    const auto env = co_await async_validator_->sanitize_environment(
                        request->server_id, std::move(request->env));
                    response = make_environment_response(id, env);
                    break;
                }
                case GateMethod::kStats:
                    response = make_stats_response(id, registry_->stats());
                    break;
            }
        }
    } catch (const std::exception& e) {
        spdlog::error("gate_server: request processing failed: {}", e.what());
        response = {
            {"id", id},
            {"allowed", false},
            {"error", {{"kind", "InternalError"}, {"message", "internal error while validating request"}}},
        };
    }

    write_response(response);
    on_request_finished();
}

SecurityContext GateServer::make_context(const GateRequest& request) {
    SecurityContext context{};
    context.server_id    = request.server_id;
    context.tool_name    = request.tool;
    context.operation_id = request.operation_id.value_or(fmt::format("op-{}", ++next_operation_));
    context.timestamp    = std::chrono::system_clock::now();
    context.user_context = request.user;
    return context;
}

void GateServer::write_response(const nlohmann::json& response) {
    std::string out = serialize_response(response);
    out.push_back('\n');

    if (std::fwrite(out.data(), 1, out.size(), stdout) != out.size() || std::fflush(stdout) != 0) {
        spdlog::error("gate_server: failed to write response to stdout");
    }
}

void GateServer::on_request_finished() {
    if (in_flight_ > 0) {
        --in_flight_;
    }
    maybe_finish();
}

void GateServer::maybe_finish() {
    if (finished_ || !input_closed_ || in_flight_ > 0) {
        return;
    }
    finished_ = true;

    // 남은 비동기 작업(시그널 대기)을 정리하면 io_context::run 이 반환된다.
    boost::system::error_code ec;
    if (stop_signals_) {
        stop_signals_->cancel(ec);
    }
    if (hup_signals_) {
        hup_signals_->cancel(ec);
    }
    if (input_) {
        input_->close(ec);
    }
    spdlog::info("gate_server: all requests answered, shutting down");
}
