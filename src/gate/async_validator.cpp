// ---------------------------------------------------------------------------
// async_validator.cpp
// ---------------------------------------------------------------------------

#include "gate/async_validator.hpp"

#include <algorithm>
#include <utility>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/use_awaitable.hpp>

#include "validator/validator_registry.hpp"

AsyncValidator::AsyncValidator(ValidatorRegistry& registry, std::size_t worker_threads)
    : registry_(registry)
    , pool_(std::max<std::size_t>(worker_threads, 1)) {}

AsyncValidator::~AsyncValidator() {
    shutdown();
}

void AsyncValidator::shutdown() {
    pool_.join();
}

boost::asio::awaitable<std::expected<nlohmann::json, SecurityError>>
AsyncValidator::validate(std::string tool_name, nlohmann::json arguments, SecurityContext context) {
    co_return co_await boost::asio::co_spawn(
        pool_,
        [this,
         tool_name = std::move(tool_name),
         arguments = std::move(arguments),
         context   = std::move(context)]()
            -> boost::asio::awaitable<std::expected<nlohmann::json, SecurityError>> {
            co_return registry_.validate_tool_call(tool_name, arguments, context);
        },
        boost::asio::use_awaitable);
}

boost::asio::awaitable<EnvMap>
AsyncValidator::sanitize_environment(std::string server_id, EnvMap env) {
    co_return co_await boost::asio::co_spawn(
        pool_,
        [this, server_id = std::move(server_id), env = std::move(env)]()
            -> boost::asio::awaitable<EnvMap> {
            co_return registry_.sanitize_environment(server_id, env);
        },
        boost::asio::use_awaitable);
}
