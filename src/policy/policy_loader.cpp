// ---------------------------------------------------------------------------
// policy_loader.cpp
//
// YAML 정책 파일을 로드하여 GateConfig 구조체로 파싱한다.
//
// [설계 원칙]
// - All-or-nothing: 파싱 실패 시 부분 정책을 반환하지 않는다.
// - 타입이 맞지 않는 값은 기본값으로 대체하지 않고 로드를 실패시킨다.
//   보안 설정의 오타가 조용히 기본값으로 바뀌면 의도와 다른 정책이 적용된다.
// - 알 수 없는 키는 경고만 남긴다 (상위 버전 정책 파일 호환).
// - YAML 파일 전체를 로그에 출력하지 않는다 (민감 정보 보호).
//
// [스키마]
//   global:
//     log_level: info                 # debug | info | warn | error
//     audit_log_path: /var/log/toolgate/audit.log
//     worker_threads: 4
//   default_policy:                   # 생략 시 restrictive preset
//     preset: restrictive
//     filesystem: { allowed_paths: [/srv/data] }
//   servers:
//     <server_id>:
//       preset: moderate
//       network: { allowed_protocols: [https] }
//
// [알려진 한계]
// - 절대 경로가 아닌 allowed_paths / blocked_paths 항목은 경고만 남긴다.
//   정책 파일이 Windows 경로를 함께 담는 경우가 있기 때문이다. 이런 항목은
//   Linux 의 canonical 경로와 절대 일치하지 않는다.
// ---------------------------------------------------------------------------

#include "policy/policy_loader.hpp"

#include <algorithm>
#include <initializer_list>
#include <regex>
#include <stdexcept>
#include <system_error>
#include <utility>
#include <vector>

#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

#include "logger/log_types.hpp"

namespace {

// 스키마 위반. 최상위에서 잡아 std::unexpected 로 변환한다.
class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

constexpr std::uint32_t kMaxWorkerThreads = 256;

// ---------------------------------------------------------------------------
// 내부 헬퍼: 스칼라 읽기
// ---------------------------------------------------------------------------
template <typename T>
[[nodiscard]] T read_scalar(const YAML::Node& node, std::string_view key) {
    if (!node.IsScalar()) {
        throw ConfigError(fmt::format("'{}' must be a scalar", key));
    }
    try {
        return node.as<T>();
    } catch (const YAML::BadConversion&) {
        throw ConfigError(fmt::format("'{}' has invalid value '{}'", key, node.Scalar()));
    }
}

// null 이면 std::nullopt (제한 없음)
template <typename T>
[[nodiscard]] std::optional<T> read_optional_scalar(const YAML::Node& node, std::string_view key) {
    if (node.IsNull()) {
        return std::nullopt;
    }
    return read_scalar<T>(node, key);
}

[[nodiscard]] std::vector<std::string> read_string_sequence(const YAML::Node& node,
                                                            std::string_view  key) {
    if (node.IsNull()) {
        return {};
    }
    if (!node.IsSequence()) {
        throw ConfigError(fmt::format("'{}' must be a sequence", key));
    }
    std::vector<std::string> result;
    result.reserve(node.size());
    for (const auto& item : node) {
        result.push_back(read_scalar<std::string>(item, key));
    }
    return result;
}

[[nodiscard]] std::vector<std::filesystem::path> read_path_sequence(const YAML::Node& node,
                                                                    std::string_view  key) {
    std::vector<std::filesystem::path> result;
    for (auto& raw : read_string_sequence(node, key)) {
        std::filesystem::path p{std::move(raw)};
        if (!p.is_absolute()) {
            spdlog::warn("policy_loader: '{}' entry '{}' is not an absolute path and will never match",
                         key, p.string());
        }
        result.push_back(std::move(p));
    }
    return result;
}

[[nodiscard]] std::vector<std::string> read_extension_sequence(const YAML::Node& node,
                                                               std::string_view  key) {
    auto exts = read_string_sequence(node, key);
    for (const auto& ext : exts) {
        if (ext.empty() || ext.front() != '.') {
            throw ConfigError(fmt::format("'{}' entry '{}' must start with '.'", key, ext));
        }
    }
    return exts;
}

// 정규식 목록: 하나라도 컴파일에 실패하면 로드 실패
[[nodiscard]] std::vector<std::string> read_regex_sequence(const YAML::Node& node,
                                                           std::string_view  key) {
    auto patterns = read_string_sequence(node, key);
    for (const auto& p : patterns) {
        try {
            std::regex re(p, std::regex_constants::ECMAScript);
            (void)re;  // 컴파일만 확인
        } catch (const std::regex_error& e) {
            throw ConfigError(fmt::format("'{}' contains invalid regex '{}': {}", key, p, e.what()));
        }
    }
    return patterns;
}

[[nodiscard]] std::vector<std::uint16_t> read_port_sequence(const YAML::Node& node,
                                                            std::string_view  key) {
    if (!node.IsSequence()) {
        throw ConfigError(fmt::format("'{}' must be a sequence", key));
    }
    std::vector<std::uint16_t> ports;
    ports.reserve(node.size());
    for (const auto& item : node) {
        ports.push_back(read_scalar<std::uint16_t>(item, key));
    }
    return ports;
}

// ---------------------------------------------------------------------------
// 내부 헬퍼: map 노드 확인 + 알 수 없는 키 경고
// ---------------------------------------------------------------------------
void require_map(const YAML::Node& node, std::string_view section) {
    if (!node.IsMap()) {
        throw ConfigError(fmt::format("'{}' must be a map", section));
    }
}

void warn_unknown_keys(const YAML::Node&                       node,
                       std::string_view                        section,
                       std::initializer_list<std::string_view> known) {
    for (const auto& kv : node) {
        const auto key = kv.first.as<std::string>();
        if (std::find(known.begin(), known.end(), key) == known.end()) {
            spdlog::warn("policy_loader: unknown key '{}.{}' ignored", section, key);
        }
    }
}

[[nodiscard]] std::string join_key(std::string_view section, std::string_view key) {
    return fmt::format("{}.{}", section, key);
}

// ---------------------------------------------------------------------------
// 섹션별 override 적용
// ---------------------------------------------------------------------------
void apply_filesystem(const YAML::Node& node, std::string_view section, FilesystemPolicy& fs) {
    require_map(node, section);
    warn_unknown_keys(node, section,
                      {"allowed_paths", "blocked_paths", "allowed_extensions", "blocked_extensions",
                       "max_file_size", "allow_hidden", "allow_symlinks", "allow_write",
                       "allow_delete"});

    if (const auto n = node["allowed_paths"]) {
        fs.allowed_paths = read_path_sequence(n, join_key(section, "allowed_paths"));
    }
    if (const auto n = node["blocked_paths"]) {
        fs.blocked_paths = read_path_sequence(n, join_key(section, "blocked_paths"));
    }
    if (const auto n = node["allowed_extensions"]) {
        if (n.IsNull()) {
            fs.allowed_extensions = std::nullopt;
        } else {
            fs.allowed_extensions = read_extension_sequence(n, join_key(section, "allowed_extensions"));
        }
    }
    if (const auto n = node["blocked_extensions"]) {
        fs.blocked_extensions = read_extension_sequence(n, join_key(section, "blocked_extensions"));
    }
    if (const auto n = node["max_file_size"]) {
        fs.max_file_size = read_optional_scalar<std::uint64_t>(n, join_key(section, "max_file_size"));
    }
    if (const auto n = node["allow_hidden"]) {
        fs.allow_hidden = read_scalar<bool>(n, join_key(section, "allow_hidden"));
    }
    if (const auto n = node["allow_symlinks"]) {
        fs.allow_symlinks = read_scalar<bool>(n, join_key(section, "allow_symlinks"));
    }
    if (const auto n = node["allow_write"]) {
        fs.allow_write = read_scalar<bool>(n, join_key(section, "allow_write"));
    }
    if (const auto n = node["allow_delete"]) {
        fs.allow_delete = read_scalar<bool>(n, join_key(section, "allow_delete"));
    }
}

void apply_process(const YAML::Node& node, std::string_view section, ProcessPolicy& proc) {
    require_map(node, section);
    warn_unknown_keys(node, section,
                      {"allowed_commands", "blocked_commands", "allowed_args_patterns",
                       "blocked_args_patterns", "max_args", "max_arg_length", "allow_shell"});

    if (const auto n = node["allowed_commands"]) {
        proc.allowed_commands = read_string_sequence(n, join_key(section, "allowed_commands"));
    }
    if (const auto n = node["blocked_commands"]) {
        proc.blocked_commands = read_string_sequence(n, join_key(section, "blocked_commands"));
        if (std::any_of(proc.blocked_commands.begin(), proc.blocked_commands.end(),
                        [](const std::string& c) { return c.empty(); })) {
            throw ConfigError(fmt::format("'{}' must not contain empty entries",
                                          join_key(section, "blocked_commands")));
        }
    }
    if (const auto n = node["allowed_args_patterns"]) {
        proc.allowed_args_patterns = read_regex_sequence(n, join_key(section, "allowed_args_patterns"));
    }
    if (const auto n = node["blocked_args_patterns"]) {
        proc.blocked_args_patterns = read_regex_sequence(n, join_key(section, "blocked_args_patterns"));
    }
    if (const auto n = node["max_args"]) {
        proc.max_args = read_optional_scalar<std::size_t>(n, join_key(section, "max_args"));
    }
    if (const auto n = node["max_arg_length"]) {
        proc.max_arg_length = read_optional_scalar<std::size_t>(n, join_key(section, "max_arg_length"));
    }
    if (const auto n = node["allow_shell"]) {
        proc.allow_shell = read_scalar<bool>(n, join_key(section, "allow_shell"));
    }
}

void apply_network(const YAML::Node& node, std::string_view section, NetworkPolicy& net) {
    require_map(node, section);
    warn_unknown_keys(node, section,
                      {"allowed_urls", "blocked_urls", "allowed_protocols", "allowed_ports",
                       "block_private_ips", "block_loopback"});

    if (const auto n = node["allowed_urls"]) {
        net.allowed_urls = read_regex_sequence(n, join_key(section, "allowed_urls"));
    }
    if (const auto n = node["blocked_urls"]) {
        net.blocked_urls = read_regex_sequence(n, join_key(section, "blocked_urls"));
    }
    if (const auto n = node["allowed_protocols"]) {
        net.allowed_protocols = read_string_sequence(n, join_key(section, "allowed_protocols"));
    }
    if (const auto n = node["allowed_ports"]) {
        if (n.IsNull()) {
            net.allowed_ports = std::nullopt;
        } else {
            net.allowed_ports = read_port_sequence(n, join_key(section, "allowed_ports"));
        }
    }
    if (const auto n = node["block_private_ips"]) {
        net.block_private_ips = read_scalar<bool>(n, join_key(section, "block_private_ips"));
    }
    if (const auto n = node["block_loopback"]) {
        net.block_loopback = read_scalar<bool>(n, join_key(section, "block_loopback"));
    }
}

void apply_environment(const YAML::Node& node, std::string_view section, EnvironmentPolicy& env) {
    require_map(node, section);
    warn_unknown_keys(node, section,
                      {"allowed_vars", "blocked_vars", "sanitize_vars", "allow_passthrough"});

    if (const auto n = node["allowed_vars"]) {
        env.allowed_vars = read_string_sequence(n, join_key(section, "allowed_vars"));
    }
    if (const auto n = node["blocked_vars"]) {
        env.blocked_vars = read_string_sequence(n, join_key(section, "blocked_vars"));
    }
    if (const auto n = node["sanitize_vars"]) {
        env.sanitize_vars = read_string_sequence(n, join_key(section, "sanitize_vars"));
    }
    if (const auto n = node["allow_passthrough"]) {
        env.allow_passthrough = read_scalar<bool>(n, join_key(section, "allow_passthrough"));
    }
}

void apply_rate_limits(const YAML::Node& node, std::string_view section, RateLimitPolicy& rl) {
    require_map(node, section);
    warn_unknown_keys(node, section,
                      {"max_requests_per_minute", "max_concurrent", "max_total_operations"});

    if (const auto n = node["max_requests_per_minute"]) {
        rl.max_requests_per_minute =
            read_optional_scalar<std::uint32_t>(n, join_key(section, "max_requests_per_minute"));
    }
    if (const auto n = node["max_concurrent"]) {
        rl.max_concurrent = read_optional_scalar<std::uint32_t>(n, join_key(section, "max_concurrent"));
    }
    if (const auto n = node["max_total_operations"]) {
        rl.max_total_operations =
            read_optional_scalar<std::uint64_t>(n, join_key(section, "max_total_operations"));
    }
}

void apply_audit(const YAML::Node& node, std::string_view section, AuditPolicy& audit) {
    require_map(node, section);
    warn_unknown_keys(node, section,
                      {"log_all_operations", "log_failures", "log_sensitive_access",
                       "include_arguments"});

    if (const auto n = node["log_all_operations"]) {
        audit.log_all_operations = read_scalar<bool>(n, join_key(section, "log_all_operations"));
    }
    if (const auto n = node["log_failures"]) {
        audit.log_failures = read_scalar<bool>(n, join_key(section, "log_failures"));
    }
    if (const auto n = node["log_sensitive_access"]) {
        audit.log_sensitive_access = read_scalar<bool>(n, join_key(section, "log_sensitive_access"));
    }
    if (const auto n = node["include_arguments"]) {
        audit.include_arguments = read_scalar<bool>(n, join_key(section, "include_arguments"));
    }
}

// ---------------------------------------------------------------------------
// 내부 헬퍼: 정책 노드 하나 파싱 (preset + overrides)
//   null 노드는 preset 기본값(restrictive) 그대로.
// ---------------------------------------------------------------------------
[[nodiscard]] SecurityPolicy parse_policy(const YAML::Node& node,
                                          std::string_view  section,
                                          std::string_view  fallback_id) {
    if (node.IsNull()) {
        SecurityPolicy policy = make_restrictive_policy();
        policy.id = std::string(fallback_id);
        return policy;
    }
    require_map(node, section);
    warn_unknown_keys(node, section,
                      {"preset", "id", "description", "strict_mode", "filesystem", "process",
                       "network", "environment", "rate_limits", "audit"});

    std::string preset_name = "restrictive";
    if (const auto n = node["preset"]) {
        preset_name = read_scalar<std::string>(n, join_key(section, "preset"));
    }
    auto base = preset_by_name(preset_name);
    if (!base.has_value()) {
        throw ConfigError(fmt::format("'{}' names unknown preset '{}'",
                                      join_key(section, "preset"), preset_name));
    }

    SecurityPolicy policy = std::move(base.value());
    policy.id             = std::string(fallback_id);

    if (const auto n = node["id"]) {
        policy.id = read_scalar<std::string>(n, join_key(section, "id"));
    }
    if (const auto n = node["description"]) {
        policy.description = read_optional_scalar<std::string>(n, join_key(section, "description"));
    }
    if (const auto n = node["strict_mode"]) {
        policy.strict_mode = read_scalar<bool>(n, join_key(section, "strict_mode"));
    }
    if (const auto n = node["filesystem"]) {
        apply_filesystem(n, join_key(section, "filesystem"), policy.filesystem);
    }
    if (const auto n = node["process"]) {
        apply_process(n, join_key(section, "process"), policy.process);
    }
    if (const auto n = node["network"]) {
        apply_network(n, join_key(section, "network"), policy.network);
    }
    if (const auto n = node["environment"]) {
        apply_environment(n, join_key(section, "environment"), policy.environment);
    }
    if (const auto n = node["rate_limits"]) {
        apply_rate_limits(n, join_key(section, "rate_limits"), policy.rate_limits);
    }
    if (const auto n = node["audit"]) {
        apply_audit(n, join_key(section, "audit"), policy.audit);
    }

    return policy;
}

// ---------------------------------------------------------------------------
// 내부 헬퍼: GlobalConfig 파싱
// ---------------------------------------------------------------------------
[[nodiscard]] GlobalConfig parse_global(const YAML::Node& node) {
    GlobalConfig cfg{};
    if (node.IsNull()) {
        return cfg;
    }
    require_map(node, "global");
    warn_unknown_keys(node, "global", {"log_level", "audit_log_path", "worker_threads"});

    if (const auto n = node["log_level"]) {
        cfg.log_level = read_scalar<std::string>(n, "global.log_level");
        if (!parse_log_level(cfg.log_level).has_value()) {
            throw ConfigError(fmt::format("'global.log_level' has invalid value '{}'", cfg.log_level));
        }
    }
    if (const auto n = node["audit_log_path"]) {
        if (n.IsNull()) {
            cfg.audit_log_path = std::nullopt;
        } else {
            cfg.audit_log_path = read_scalar<std::string>(n, "global.audit_log_path");
        }
    }
    if (const auto n = node["worker_threads"]) {
        cfg.worker_threads = read_scalar<std::uint32_t>(n, "global.worker_threads");
        if (cfg.worker_threads == 0 || cfg.worker_threads > kMaxWorkerThreads) {
            throw ConfigError(fmt::format("'global.worker_threads' must be between 1 and {}",
                                          kMaxWorkerThreads));
        }
    }
    return cfg;
}

// ---------------------------------------------------------------------------
// 내부 헬퍼: 최상위 노드 → GateConfig
// ---------------------------------------------------------------------------
[[nodiscard]] std::expected<GateConfig, std::string> parse_root(const YAML::Node& root,
                                                                std::string_view  source) {
    if (!root || !root.IsMap()) {
        const std::string err = fmt::format(
            "policy_loader: '{}' is not a valid YAML map (top-level)", source);
        spdlog::error("{}", err);
        return std::unexpected(err);
    }

    GateConfig cfg{};

    try {
        warn_unknown_keys(root, "<root>", {"global", "default_policy", "servers"});

        if (const auto n = root["global"]) {
            cfg.global = parse_global(n);
        }
        if (const auto n = root["default_policy"]) {
            cfg.default_policy = parse_policy(n, "default_policy", "default");
        }
        if (const auto n = root["servers"]) {
            if (!n.IsNull()) {
                require_map(n, "servers");
                for (const auto& kv : n) {
                    const auto server_id = kv.first.as<std::string>();
                    if (server_id.empty()) {
                        throw ConfigError("'servers' contains an empty server id");
                    }
                    cfg.server_policies.emplace(
                        server_id,
                        parse_policy(kv.second, join_key("servers", server_id), server_id));
                }
            }
        }
    } catch (const ConfigError& e) {
        const std::string err = fmt::format("policy_loader: invalid policy in '{}': {}",
                                            source, e.what());
        spdlog::error("{}", err);
        return std::unexpected(err);
    } catch (const YAML::Exception& e) {
        const std::string err = fmt::format("policy_loader: YAML error in '{}': {}",
                                            source, e.what());
        spdlog::error("{}", err);
        return std::unexpected(err);
    }

    spdlog::info(
        "policy_loader: policy loaded successfully from '{}' (default='{}', servers={})",
        source, cfg.default_policy.id, cfg.server_policies.size());

    return cfg;
}

}  // namespace

// ---------------------------------------------------------------------------
// PolicyLoader::load 구현
// ---------------------------------------------------------------------------
std::expected<GateConfig, std::string>
PolicyLoader::load(const std::filesystem::path& config_path) {
    // 1. 경로 정규화
    std::error_code ec;
    const auto canonical_path = std::filesystem::canonical(config_path, ec);
    if (ec) {
        const std::string err = fmt::format(
            "policy_loader: cannot resolve config path '{}': {}",
            config_path.string(), ec.message()
        );
        spdlog::error("{}", err);
        return std::unexpected(err);
    }

    spdlog::info("policy_loader: loading policy from '{}'", canonical_path.string());

    // 2. YAML 파일 로드 (yaml-cpp 예외 처리)
    YAML::Node root;
    try {
        root = YAML::LoadFile(canonical_path.string());
    } catch (const YAML::BadFile& e) {
        const std::string err = fmt::format(
            "policy_loader: cannot open file '{}': {}",
            canonical_path.string(), e.what()
        );
        spdlog::error("{}", err);
        return std::unexpected(err);
    } catch (const YAML::ParserException& e) {
        // 라인 번호 포함한 상세 에러 메시지
        const std::string err = fmt::format(
            "policy_loader: YAML parse error in '{}' at line {}, col {}: {}",
            canonical_path.string(),
            e.mark.line + 1,   // yaml-cpp는 0-based
            e.mark.column + 1,
            e.what()
        );
        spdlog::error("{}", err);
        return std::unexpected(err);
    } catch (const YAML::Exception& e) {
        const std::string err = fmt::format(
            "policy_loader: YAML error in '{}': {}",
            canonical_path.string(), e.what()
        );
        spdlog::error("{}", err);
        return std::unexpected(err);
    }

    // 3. 스키마 파싱
    return parse_root(root, canonical_path.string());
}

std::expected<GateConfig, std::string> PolicyLoader::load_from_string(std::string_view text) {
    YAML::Node root;
    try {
        root = YAML::Load(std::string(text));
    } catch (const YAML::ParserException& e) {
        const std::string err = fmt::format(
            "policy_loader: YAML parse error at line {}, col {}: {}",
            e.mark.line + 1, e.mark.column + 1, e.what());
        spdlog::error("{}", err);
        return std::unexpected(err);
    } catch (const YAML::Exception& e) {
        const std::string err = fmt::format("policy_loader: YAML error: {}", e.what());
        spdlog::error("{}", err);
        return std::unexpected(err);
    }

    return parse_root(root, "<string>");
}
