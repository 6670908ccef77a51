// ---------------------------------------------------------------------------
// line_protocol.cpp
// ---------------------------------------------------------------------------

#include "gate/line_protocol.hpp"

#include <utility>

#include <fmt/format.h>

namespace {

std::unexpected<GateProtocolError> bad_request(const nlohmann::json& id, std::string message) {
    return std::unexpected(GateProtocolError{id, std::move(message)});
}

}  // namespace

GateProtocolError make_oversized_request_error() {
    return GateProtocolError{nullptr,
                             fmt::format("request line exceeds {} bytes", kMaxRequestBytes)};
}

std::expected<GateRequest, GateProtocolError> parse_request(std::string_view line) {
    if (line.size() > kMaxRequestBytes) {
        return std::unexpected(make_oversized_request_error());
    }
    const auto root = nlohmann::json::parse(line.begin(), line.end(), nullptr, false);
    if (root.is_discarded()) {
        return bad_request(nullptr, "request is not valid JSON");
    }
    if (!root.is_object()) {
        return bad_request(nullptr, "request must be a JSON object");
    }

    GateRequest request{};
    if (const auto it = root.find("id"); it != root.end()) {
        request.id = *it;
    }

    if (const auto it = root.find("method"); it != root.end()) {
        if (!it->is_string()) {
            return bad_request(request.id, "'method' must be a string");
        }
        const auto& method = it->get_ref<const std::string&>();
        if (method == "validate_tool_call") {
            request.method = GateMethod::kValidateToolCall;
        } else if (method == "sanitize_environment") {
            request.method = GateMethod::kSanitizeEnvironment;
        } else if (method == "stats") {
            request.method = GateMethod::kStats;
        } else {
            return bad_request(request.id, fmt::format("unknown method '{}'", method));
        }
    }

    if (const auto it = root.find("server_id"); it != root.end()) {
        if (!it->is_string()) {
            return bad_request(request.id, "'server_id' must be a string");
        }
        request.server_id = it->get<std::string>();
    }

    switch (request.method) {
        case GateMethod::kValidateToolCall: {
            const auto tool = root.find("tool");
            if (tool == root.end() || !tool->is_string() || tool->get_ref<const std::string&>().empty()) {
                return bad_request(request.id, "'tool' must be a non-empty string");
            }
            request.tool = tool->get<std::string>();

            if (const auto it = root.find("arguments"); it != root.end() && !it->is_null()) {
                request.arguments = *it;
            }
            if (const auto it = root.find("user"); it != root.end() && !it->is_null()) {
                if (!it->is_string()) {
                    return bad_request(request.id, "'user' must be a string");
                }
                request.user = it->get<std::string>();
            }
            if (const auto it = root.find("operation_id"); it != root.end() && !it->is_null()) {
                if (!it->is_string()) {
                    return bad_request(request.id, "'operation_id' must be a string");
                }
                request.operation_id = it->get<std::string>();
            }
            break;
        }
        case GateMethod::kSanitizeEnvironment: {
            const auto env = root.find("env");
            if (env == root.end() || !env->is_object()) {
                return bad_request(request.id, "'env' must be an object");
            }
            for (const auto& [key, value] : env->items()) {
                if (!value.is_string()) {
                    return bad_request(request.id,
                                       fmt::format("environment value for '{}' must be a string", key));
                }
                request.env.emplace(key, value.get<std::string>());
            }
            break;
        }
        case GateMethod::kStats:
            break;
    }

    return request;
}

nlohmann::json make_validation_response(const nlohmann::json&                               id,
                                        const std::expected<nlohmann::json, SecurityError>& result) {
    nlohmann::json response = {{"id", id}};
    if (result.has_value()) {
        response["allowed"]   = true;
        response["arguments"] = result.value();
        return response;
    }

    const SecurityError& error = result.error();
    nlohmann::json injection   = nullptr;
    if (error.code == SecurityErrorCode::kInjectionDetected) {
        injection = std::string(to_string(error.injection));
    }

    response["allowed"] = false;
    response["error"]   = {
        {"kind", std::string(to_string(error.code))},
        {"injection", injection},
        {"message", error.message},
    };
    return response;
}

nlohmann::json make_environment_response(const nlohmann::json& id, const EnvMap& env) {
    nlohmann::json env_json = nlohmann::json::object();
    for (const auto& [key, value] : env) {
        env_json[key] = value;
    }
    return {{"id", id}, {"env", std::move(env_json)}};
}

nlohmann::json make_stats_response(const nlohmann::json& id, const ValidationStatsSnapshot& stats) {
    return {
        {"id", id},
        {"stats", {
            {"total_validations", stats.total_validations},
            {"rejected_validations", stats.rejected_validations},
            {"injection_rejections", stats.injection_rejections},
            {"filesystem_calls", stats.filesystem_calls},
            {"process_calls", stats.process_calls},
            {"network_calls", stats.network_calls},
            {"unclassified_calls", stats.unclassified_calls},
            {"reject_rate", stats.reject_rate},
        }},
    };
}

nlohmann::json make_bad_request_response(const GateProtocolError& error) {
    return {
        {"id", error.id},
        {"error", {{"kind", "BadRequest"}, {"message", error.message}}},
    };
}

std::string serialize_response(const nlohmann::json& response) {
    return response.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}
