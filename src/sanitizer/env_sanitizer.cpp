// ---------------------------------------------------------------------------
// env_sanitizer.cpp
// ---------------------------------------------------------------------------

#include "sanitizer/env_sanitizer.hpp"

#include <algorithm>
#include <cctype>
#include <iterator>
#include <utility>

#include <spdlog/spdlog.h>

namespace {

bool contains(const std::vector<std::string>& list, const std::string& key) {
    return std::find(list.begin(), list.end(), key) != list.end();
}

bool is_safe_value_char(unsigned char c) {
    return std::isalnum(c) != 0 || c == '_' || c == '.' || c == '-' || c == '/';
}

}  // namespace

bool is_sensitive_env_key(std::string_view key) {
    std::string lowered(key);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    return std::any_of(kSensitiveEnvKeyFragments.begin(), kSensitiveEnvKeyFragments.end(),
                       [&lowered](std::string_view fragment) {
                           return lowered.find(fragment) != std::string::npos;
                       });
}

EnvVarSanitizer::EnvVarSanitizer(EnvironmentPolicy policy)
    : policy_(std::move(policy)) {}

EnvMap EnvVarSanitizer::sanitize_env_vars(const EnvMap& env) const {
    EnvMap sanitized;

    for (const auto& [key, value] : env) {
        // (a) blocklist
        if (contains(policy_.blocked_vars, key)) {
            spdlog::info("env_sanitizer: blocked environment variable: {}", key);
            continue;
        }

        const bool explicitly_allowed = contains(policy_.allowed_vars, key);

        // (b) passthrough 가 없으면 allowlist 만 통과
        if (!policy_.allow_passthrough && !explicitly_allowed) {
            continue;
        }

        // (c) 민감 키
        if (!explicitly_allowed && is_sensitive_env_key(key)) {
            spdlog::warn("env_sanitizer: blocked potentially sensitive environment variable: {}",
                         key);
            continue;
        }

        // (d) 값 정제
        if (contains(policy_.sanitize_vars, key)) {
            std::string cleaned;
            cleaned.reserve(value.size());
            std::copy_if(value.begin(), value.end(), std::back_inserter(cleaned),
                         [](char c) { return is_safe_value_char(static_cast<unsigned char>(c)); });
            sanitized.emplace(key, std::move(cleaned));
            continue;
        }

        sanitized.emplace(key, value);
    }

    return sanitized;
}
