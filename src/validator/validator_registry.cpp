// ---------------------------------------------------------------------------
// validator_registry.cpp
// ---------------------------------------------------------------------------

#include "validator/validator_registry.hpp"

#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

ValidatorRegistry::ValidatorRegistry(std::shared_ptr<spdlog::logger> audit_sink)
    : audit_sink_(std::move(audit_sink))
    , stats_(std::make_shared<ValidationStats>())
    , snapshot_(std::make_shared<Snapshot>()) {}

std::shared_ptr<const SecurityValidator>
ValidatorRegistry::make_validator(SecurityPolicy policy) const {
    return std::make_shared<SecurityValidator>(
        std::make_shared<SecurityPolicy>(std::move(policy)), audit_sink_, stats_);
}

void ValidatorRegistry::reload(const GateConfig& config) {
    // validator 생성 (regex 컴파일) 은 잠금 밖에서 한다.
    auto next               = std::make_shared<Snapshot>();
    next->default_validator = make_validator(config.default_policy);
    for (const auto& [server_id, policy] : config.server_policies) {
        next->servers.emplace(server_id, make_validator(policy));
    }

    {
        std::lock_guard<std::mutex> lock(writer_mutex_);
        snapshot_.store(std::move(next));
    }

    spdlog::info("validator_registry: reloaded (default='{}', servers={})",
                 config.default_policy.id, config.server_policies.size());
}

void ValidatorRegistry::set_default_policy(SecurityPolicy policy) {
    const std::string policy_id = policy.id;
    auto validator = make_validator(std::move(policy));

    std::lock_guard<std::mutex> lock(writer_mutex_);
    auto next               = std::make_shared<Snapshot>(*snapshot_.load());
    next->default_validator = std::move(validator);
    snapshot_.store(std::move(next));

    spdlog::info("validator_registry: default policy set to '{}'", policy_id);
}

void ValidatorRegistry::set_server_policy(const std::string& server_id, SecurityPolicy policy) {
    const std::string policy_id = policy.id;
    auto validator = make_validator(std::move(policy));

    std::lock_guard<std::mutex> lock(writer_mutex_);
    auto next = std::make_shared<Snapshot>(*snapshot_.load());
    next->servers.insert_or_assign(server_id, std::move(validator));
    snapshot_.store(std::move(next));

    spdlog::info("validator_registry: server '{}' now uses policy '{}'", server_id, policy_id);
}

bool ValidatorRegistry::remove_server_policy(const std::string& server_id) {
    std::lock_guard<std::mutex> lock(writer_mutex_);
    const auto current = snapshot_.load();
    if (current->servers.find(server_id) == current->servers.end()) {
        return false;
    }

    auto next = std::make_shared<Snapshot>(*current);
    next->servers.erase(server_id);
    snapshot_.store(std::move(next));

    spdlog::info("validator_registry: server '{}' policy removed", server_id);
    return true;
}

std::shared_ptr<const SecurityValidator>
ValidatorRegistry::validator_for(std::string_view server_id) const {
    const auto current = snapshot_.load();
    if (const auto it = current->servers.find(server_id); it != current->servers.end()) {
        return it->second;
    }
    return current->default_validator;
}

std::expected<nlohmann::json, SecurityError>
ValidatorRegistry::validate_tool_call(std::string_view       tool_name,
                                      const nlohmann::json&  arguments,
                                      const SecurityContext& context) const {
    const auto validator = validator_for(context.server_id);
    if (!validator) {
        spdlog::error("validator_registry: no policy for server '{}', rejecting tool '{}'",
                      context.server_id, tool_name);
        return std::unexpected(SecurityError{
            SecurityErrorCode::kPolicyUnavailable, InjectionKind::kNone,
            fmt::format("No security policy available for server '{}'", context.server_id)});
    }
    return validator->validate_tool_call(tool_name, arguments, context);
}

EnvMap ValidatorRegistry::sanitize_environment(std::string_view server_id, const EnvMap& env) const {
    const auto validator = validator_for(server_id);
    if (!validator) {
        spdlog::error("validator_registry: no policy for server '{}', passing empty environment",
                      server_id);
        return {};
    }
    return validator->sanitize_environment(env);
}

bool ValidatorRegistry::has_default_policy() const {
    return snapshot_.load()->default_validator != nullptr;
}
