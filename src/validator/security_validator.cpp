// ---------------------------------------------------------------------------
// security_validator.cpp
//
// [인자 키 탐색]
// 경로: path / file / filename, 명령: command / cmd, URL: url / uri / endpoint.
// 후보 키 중 문자열 값을 가진 키는 모두 검사한다. 첫 키만 보고 나머지를
// 건너뛰면 {"path": 1, "file": "/etc/shadow"} 같은 인자가 검사를 우회한다.
// 문자열이 아닌 값은 도구가 경로/명령/URL 로 쓸 수 없으므로 검사 대상이 아니다.
//
// [오탐/미탐 트레이드오프]
// - 셸 검사는 prefix 비교이므로 "shasum", "cmdline-tool" 도 차단된다.
// - blocked_commands 는 부분 문자열 비교이므로 "rm" 은 "format" 도 차단한다.
// - 도구 이름 기반 분류이므로 이름을 바꾼 도구는 kUnclassified 로 떨어진다.
//   strict_mode 는 이를 경고로만 알린다.
// ---------------------------------------------------------------------------

#include "validator/security_validator.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <initializer_list>
#include <stdexcept>
#include <string>
#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "net/url.hpp"
#include "stats/validation_stats.hpp"

namespace {

constexpr std::array<std::string_view, 7> kShellCommands{
    "sh", "bash", "cmd", "powershell", "pwsh", "zsh", "fish",
};

std::string to_lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

bool contains_any(std::string_view haystack, std::initializer_list<std::string_view> needles) {
    return std::any_of(needles.begin(), needles.end(), [haystack](std::string_view needle) {
        return haystack.find(needle) != std::string_view::npos;
    });
}

bool has_key(const nlohmann::json& arguments, const char* key) {
    return arguments.is_object() && arguments.contains(key);
}

// 후보 키 중 문자열 값을 가진 것을 모두 반환한다.
std::vector<std::string> string_values(const nlohmann::json&             arguments,
                                       std::initializer_list<const char*> keys) {
    std::vector<std::string> values;
    if (!arguments.is_object()) {
        return values;
    }
    for (const char* key : keys) {
        const auto it = arguments.find(key);
        if (it != arguments.end() && it->is_string()) {
            values.push_back(it->get<std::string>());
        }
    }
    return values;
}

SecurityError make_error(SecurityErrorCode code, std::string message) {
    return SecurityError{code, InjectionKind::kNone, std::move(message)};
}

}  // namespace

ToolClassification classify_tool(std::string_view tool_name) {
    const std::string name = to_lower(tool_name);

    ToolClassification result{};

    if (contains_any(name, {"file", "path"})) {
        result.input_context = InputContext::kFilePath;
    } else if (contains_any(name, {"exec", "command"})) {
        result.input_context = InputContext::kCommand;
    } else if (contains_any(name, {"sql", "query"})) {
        result.input_context = InputContext::kSqlQuery;
    } else if (contains_any(name, {"url", "http"})) {
        result.input_context = InputContext::kWebUrl;
    }

    if (contains_any(name, {"file", "read", "write"})) {
        result.category = ToolCategory::kFilesystem;
    } else if (contains_any(name, {"exec", "run", "command"})) {
        result.category = ToolCategory::kProcess;
    } else if (contains_any(name, {"http", "fetch", "url"})) {
        result.category = ToolCategory::kNetwork;
    }

    return result;
}

namespace {

std::shared_ptr<const SecurityPolicy> require_policy(std::shared_ptr<const SecurityPolicy> policy) {
    if (!policy) {
        throw std::invalid_argument("SecurityValidator requires a policy");
    }
    return policy;
}

}  // namespace

SecurityValidator::SecurityValidator(std::shared_ptr<const SecurityPolicy> policy,
                                     std::shared_ptr<spdlog::logger>       audit_sink,
                                     std::shared_ptr<ValidationStats>      stats)
    : policy_(require_policy(std::move(policy)))
    , path_validator_(policy_->filesystem)
    , input_sanitizer_()
    , env_sanitizer_(policy_->environment)
    , audit_logger_(policy_->audit, std::move(audit_sink))
    , blocked_url_patterns_(policy_->network.blocked_urls, "network.blocked_urls")
    , allowed_url_patterns_(policy_->network.allowed_urls, "network.allowed_urls")
    , blocked_arg_patterns_(policy_->process.blocked_args_patterns, "process.blocked_args_patterns")
    , allowed_arg_patterns_(policy_->process.allowed_args_patterns, "process.allowed_args_patterns")
    , stats_(std::move(stats)) {
    if (blocked_url_patterns_.has_invalid()) {
        spdlog::error("security_validator: policy '{}' has invalid blocked_urls patterns, "
                      "network tools with a URL will be rejected (fail-close)", policy_->id);
    }
    if (blocked_arg_patterns_.has_invalid()) {
        spdlog::error("security_validator: policy '{}' has invalid blocked_args_patterns, "
                      "process tools with args will be rejected (fail-close)", policy_->id);
    }
    spdlog::debug("security_validator: initialized for policy '{}'", policy_->id);
}

SecurityValidator::~SecurityValidator() = default;

SecurityValidator::SecurityValidator(SecurityValidator&&) noexcept            = default;
SecurityValidator& SecurityValidator::operator=(SecurityValidator&&) noexcept = default;

std::expected<nlohmann::json, SecurityError>
SecurityValidator::validate_tool_call(std::string_view       tool_name,
                                      const nlohmann::json&  arguments,
                                      const SecurityContext& context) const {
    const ToolClassification classification = classify_tool(tool_name);

    auto reject = [&](SecurityError error) -> std::expected<nlohmann::json, SecurityError> {
        spdlog::debug("security_validator: rejected tool '{}' from server '{}': {}",
                      tool_name, context.server_id, error.message);
        audit_logger_.log_operation(context, tool_name, &arguments, std::unexpected(error));
        if (stats_) {
            stats_->on_validation(classification.category, &error);
        }
        return std::unexpected(std::move(error));
    };

    // 1. 인자 정제 (인젝션 탐지)
    auto sanitized = input_sanitizer_.sanitize_json(arguments, classification.input_context);
    if (!sanitized) {
        return reject(std::move(sanitized.error()));
    }

    // 2. 카테고리별 검사
    std::vector<FileAccess> approved_access;

    switch (classification.category) {
        case ToolCategory::kFilesystem: {
            auto checked = check_filesystem(sanitized.value());
            if (!checked) {
                return reject(std::move(checked.error()));
            }
            approved_access = std::move(checked.value());
            break;
        }
        case ToolCategory::kProcess:
            if (auto checked = validate_process_tool(sanitized.value()); !checked) {
                return reject(std::move(checked.error()));
            }
            break;
        case ToolCategory::kNetwork:
            if (auto checked = validate_network_tool(sanitized.value()); !checked) {
                return reject(std::move(checked.error()));
            }
            break;
        case ToolCategory::kUnclassified:
            if (policy_->strict_mode) {
                spdlog::warn("security_validator: unknown tool type '{}' in strict mode", tool_name);
            }
            break;
    }

    // 3. 감사 로그
    audit_logger_.log_operation(context, tool_name, &sanitized.value(), {});
    for (const auto& access : approved_access) {
        audit_logger_.log_sensitive_access(context, access.canonical, access.op);
    }
    if (stats_) {
        stats_->on_validation(classification.category, nullptr);
    }

    return std::move(sanitized.value());
}

// ---------------------------------------------------------------------------
// 파일시스템
// ---------------------------------------------------------------------------
std::expected<std::vector<SecurityValidator::FileAccess>, SecurityError>
SecurityValidator::check_filesystem(const nlohmann::json& arguments) const {
    std::vector<FileAccess> accesses;

    const auto paths = string_values(arguments, {"path", "file", "filename"});
    if (paths.empty()) {
        return accesses;
    }

    FileOperation op = FileOperation::kRead;
    if (has_key(arguments, "write") || has_key(arguments, "content")) {
        op = FileOperation::kWrite;
    } else if (has_key(arguments, "delete")) {
        op = FileOperation::kDelete;
    }

    for (const auto& path : paths) {
        auto canonical = path_validator_.validate_path(path, op);
        if (!canonical) {
            return std::unexpected(std::move(canonical.error()));
        }
        accesses.push_back(FileAccess{std::move(canonical.value()), op});
    }
    return accesses;
}

std::expected<void, SecurityError>
SecurityValidator::validate_filesystem_tool(const nlohmann::json& arguments) const {
    if (auto checked = check_filesystem(arguments); !checked) {
        return std::unexpected(std::move(checked.error()));
    }
    return {};
}

std::expected<void, SecurityError> SecurityValidator::validate_file_size(std::uint64_t size) const {
    return path_validator_.validate_file_size(size);
}

// ---------------------------------------------------------------------------
// 프로세스
// ---------------------------------------------------------------------------
std::expected<void, SecurityError>
SecurityValidator::validate_process_tool(const nlohmann::json& arguments) const {
    for (const auto& command : string_values(arguments, {"command", "cmd"})) {
        if (auto checked = check_command(command); !checked) {
            return checked;
        }
    }

    if (has_key(arguments, "args") && arguments.at("args").is_array()) {
        return check_arguments(arguments.at("args"));
    }
    return {};
}

std::expected<void, SecurityError> SecurityValidator::check_command(std::string_view command) const {
    const ProcessPolicy& process = policy_->process;

    // blocklist 우선
    for (const auto& blocked : process.blocked_commands) {
        if (!blocked.empty() && command.find(blocked) != std::string_view::npos) {
            return std::unexpected(make_error(
                SecurityErrorCode::kCommandBlocked,
                fmt::format("Blocked command detected: {}", command)));
        }
    }

    if (!process.allowed_commands.empty()) {
        const bool is_allowed = std::any_of(
            process.allowed_commands.begin(), process.allowed_commands.end(),
            [command](const std::string& allowed) {
                return command == allowed ||
                       (command.size() > allowed.size() && command.starts_with(allowed) &&
                        command[allowed.size()] == ' ');
            });
        if (!is_allowed) {
            return std::unexpected(make_error(
                SecurityErrorCode::kCommandNotAllowlisted,
                fmt::format("Command not in allowlist: {}", command)));
        }
    }

    // allowlist 에 있어도 셸은 allow_shell 없이는 거부
    if (!process.allow_shell) {
        for (const auto shell : kShellCommands) {
            if (command.starts_with(shell)) {
                return std::unexpected(make_error(
                    SecurityErrorCode::kShellExecutionDenied,
                    fmt::format("Shell execution not allowed: {}", command)));
            }
        }
    }
    return {};
}

std::expected<void, SecurityError> SecurityValidator::check_arguments(const nlohmann::json& args) const {
    const ProcessPolicy& process = policy_->process;

    if (process.max_args.has_value() && args.size() > process.max_args.value()) {
        return std::unexpected(make_error(
            SecurityErrorCode::kTooManyArguments,
            fmt::format("Too many arguments: {} > {}", args.size(), process.max_args.value())));
    }

    if (blocked_arg_patterns_.has_invalid()) {
        return std::unexpected(make_error(
            SecurityErrorCode::kArgumentBlocked,
            "Argument blocklist is unavailable (invalid pattern in policy)"));
    }

    for (const auto& item : args) {
        const std::string arg = item.is_string() ? item.get<std::string>() : item.dump();

        if (process.max_arg_length.has_value() && arg.size() > process.max_arg_length.value()) {
            return std::unexpected(make_error(
                SecurityErrorCode::kArgumentTooLong,
                fmt::format("Argument exceeds maximum length ({} > {})",
                            arg.size(), process.max_arg_length.value())));
        }

        if (auto matched = blocked_arg_patterns_.first_match(arg); matched.has_value()) {
            return std::unexpected(make_error(
                SecurityErrorCode::kArgumentBlocked,
                fmt::format("Argument matches blocked pattern '{}'", matched.value())));
        }

        if (!process.allowed_args_patterns.empty() && !allowed_arg_patterns_.matches_any(arg)) {
            return std::unexpected(make_error(
                SecurityErrorCode::kArgumentNotAllowlisted,
                fmt::format("Argument not in allowlist: {}", arg)));
        }
    }
    return {};
}

// ---------------------------------------------------------------------------
// 네트워크
// ---------------------------------------------------------------------------
std::expected<void, SecurityError>
SecurityValidator::validate_network_tool(const nlohmann::json& arguments) const {
    for (const auto& url : string_values(arguments, {"url", "uri", "endpoint"})) {
        if (auto checked = check_url(url); !checked) {
            return checked;
        }
    }
    return {};
}

std::expected<void, SecurityError> SecurityValidator::check_url(std::string_view url) const {
    const NetworkPolicy& network = policy_->network;

    auto parsed = parse_url(url);
    if (!parsed) {
        return std::unexpected(make_error(
            SecurityErrorCode::kInvalidUrl,
            fmt::format("Invalid URL format: {}", parsed.error())));
    }

    if (!network.allowed_protocols.empty()) {
        const bool is_allowed = std::any_of(
            network.allowed_protocols.begin(), network.allowed_protocols.end(),
            [&parsed](const std::string& p) { return to_lower(p) == parsed->scheme; });
        if (!is_allowed) {
            return std::unexpected(make_error(
                SecurityErrorCode::kProtocolNotAllowed,
                fmt::format("Protocol '{}' not allowed", parsed->scheme)));
        }
    }

    if (!parsed->host.empty()) {
        if (network.block_private_ips && is_private_host(parsed->host)) {
            return std::unexpected(make_error(
                SecurityErrorCode::kPrivateNetworkBlocked,
                "Access to private IP addresses is blocked"));
        }
        if (network.block_loopback && is_loopback_host(parsed->host)) {
            return std::unexpected(make_error(
                SecurityErrorCode::kLoopbackBlocked,
                "Access to loopback addresses is blocked"));
        }
    }

    if (blocked_url_patterns_.has_invalid()) {
        return std::unexpected(make_error(
            SecurityErrorCode::kUrlBlocked,
            "URL blocklist is unavailable (invalid pattern in policy)"));
    }
    if (auto matched = blocked_url_patterns_.first_match(url); matched.has_value()) {
        spdlog::debug("security_validator: URL matched blocked pattern '{}'", matched.value());
        return std::unexpected(make_error(
            SecurityErrorCode::kUrlBlocked, "URL matches blocked pattern"));
    }

    if (!network.allowed_urls.empty() && !allowed_url_patterns_.matches_any(url)) {
        return std::unexpected(make_error(
            SecurityErrorCode::kUrlNotAllowlisted,
            fmt::format("URL not in allowlist: {}", url)));
    }
    return {};
}

EnvMap SecurityValidator::sanitize_environment(const EnvMap& env) const {
    return env_sanitizer_.sanitize_env_vars(env);
}
