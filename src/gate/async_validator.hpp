#pragma once

// ---------------------------------------------------------------------------
// async_validator.hpp
//
// ValidatorRegistry 의 동기 검증을 전용 thread_pool 에서 실행하는 awaitable 래퍼.
//
// [설계 원칙]
// - 검증 파이프라인은 realpath / lstat 등 blocking syscall 을 수행한다.
//   io_context 스레드에서 직접 호출하면 다른 요청 처리가 멈추므로
//   co_spawn(pool_, ..., use_awaitable) 로 풀에서 실행하고 호출자
//   코루틴은 자신의 executor 에서 재개된다.
// - 결과는 동기 호출과 동일하다. 래퍼는 실행 위치만 바꾼다.
// - registry 는 참조로 보관한다. AsyncValidator 보다 오래 살아야 한다.
// ---------------------------------------------------------------------------

#include <cstddef>
#include <expected>
#include <string>
#include <utility>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/thread_pool.hpp>
#include <nlohmann/json.hpp>

#include "common/types.hpp"
#include "sanitizer/env_sanitizer.hpp"

class ValidatorRegistry;

class AsyncValidator {
public:
    // worker_threads: 0 이면 1 로 보정한다.
    AsyncValidator(ValidatorRegistry& registry, std::size_t worker_threads);

    // 진행 중인 작업이 끝날 때까지 대기 후 풀을 정리한다.
    ~AsyncValidator();

    AsyncValidator(const AsyncValidator&)            = delete;
    AsyncValidator& operator=(const AsyncValidator&) = delete;
    AsyncValidator(AsyncValidator&&)                 = delete;
    AsyncValidator& operator=(AsyncValidator&&)      = delete;

    // 인자는 풀 스레드로 넘어가므로 값으로 받는다.
    [[nodiscard]] boost::asio::awaitable<std::expected<nlohmann::json, SecurityError>>
    validate(std::string tool_name, nlohmann::json arguments, SecurityContext context);

    [[nodiscard]] boost::asio::awaitable<EnvMap>
    sanitize_environment(std::string server_id, EnvMap env);

    // 이미 제출된 검증이 끝날 때까지 기다린 뒤 풀 스레드를 join 한다.
    // 새 작업을 거부하지는 않으므로 호출 이후에는 validate 를 부르지 않는다.
    // 여러 번 호출해도 안전.
    void shutdown();

private:
    ValidatorRegistry&       registry_;
    boost::asio::thread_pool pool_;
};
