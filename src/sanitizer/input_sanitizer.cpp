// ---------------------------------------------------------------------------
// input_sanitizer.cpp
//
// 도구 인자 인젝션 탐지기 구현.
//
// [패턴 — 컨텍스트별 1개, 생성 시 컴파일]
//  Sql     : \b(SELECT|...|REVOKE)\b | -- | /\* | \*/ | xp_ | sp_   (icase)
//  Command : [;&|`$()<>{}\[\]\\]                                   (&&, ||, >>, << 포함)
//  Path    : \.\.[/\\] | ~[/\\] | %2e%2e | %252e | \.\.%2f | \.\.%5c (icase)
//  Script  : <\s{0,8}script | javascript: | on\w{1,32}\s{0,8}= |
//            eval\s{0,8}\( | setTimeout | setInterval |
//            Function\s{0,8}\(                                      (icase)
//
// [Path 패턴 대소문자]
// 퍼센트 인코딩은 %2E%2E 처럼 대문자로도 쓰일 수 있으므로 icase 로 컴파일한다.
//
// [고정 패턴 컴파일 실패]
// 패턴이 상수이므로 컴파일 실패는 구현 결함이다. 생성자에서 std::regex_error
// 가 그대로 전파되어 validator 생성이 실패한다 (탐지기 없는 상태로 동작 금지).
// ---------------------------------------------------------------------------

#include "sanitizer/input_sanitizer.hpp"

#include <regex>
#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

struct InputSanitizer::Patterns {
    std::regex sql_injection{
        R"((\b(SELECT|INSERT|UPDATE|DELETE|DROP|UNION|CREATE|ALTER|EXEC|EXECUTE|SCRIPT|GRANT|REVOKE)\b|--|/\*|\*/|xp_|sp_))",
        std::regex_constants::ECMAScript | std::regex_constants::icase
    };
    std::regex command_injection{
        R"([;&|`$()<>{}\[\]\\])",
        std::regex_constants::ECMAScript
    };
    std::regex path_traversal{
        R"(\.\.[/\\]|~[/\\]|%2e%2e|%252e|\.\.%2f|\.\.%5c)",
        std::regex_constants::ECMAScript | std::regex_constants::icase
    };
    std::regex script_injection{
        R"(<\s{0,8}script|javascript:|on\w{1,32}\s{0,8}=|eval\s{0,8}\(|setTimeout|setInterval|Function\s{0,8}\()",
        std::regex_constants::ECMAScript | std::regex_constants::icase
    };
};

namespace {

SecurityError injection_error(InjectionKind kind, std::string message) {
    return SecurityError{SecurityErrorCode::kInjectionDetected, kind, std::move(message)};
}

bool search(std::string_view input, const std::regex& re) {
    return std::regex_search(input.begin(), input.end(), re);
}

SecurityError too_long(std::size_t size, std::size_t limit) {
    return SecurityError{SecurityErrorCode::kInputTooLong, InjectionKind::kNone,
                         fmt::format("Input exceeds maximum length ({} > {})", size, limit)};
}

}  // namespace

std::string strip_control_characters(std::string_view input) {
    std::string result;
    result.reserve(input.size());

    for (std::size_t i = 0; i < input.size(); ++i) {
        const auto ch = static_cast<unsigned char>(input[i]);

        // C0: TAB(0x09) ~ CR(0x0D) 는 공백으로 취급하여 유지
        if (ch < 0x20) {
            if (ch >= 0x09 && ch <= 0x0D) {
                result.push_back(static_cast<char>(ch));
            }
            continue;
        }
        if (ch == 0x7F) {
            continue;
        }

        // C1 (U+0080..U+009F) 는 UTF-8 에서 0xC2 0x80..0x9F. NEL(U+0085) 은 공백.
        if (ch == 0xC2 && i + 1 < input.size()) {
            const auto next = static_cast<unsigned char>(input[i + 1]);
            if (next >= 0x80 && next <= 0x9F && next != 0x85) {
                ++i;
                continue;
            }
        }

        result.push_back(static_cast<char>(ch));
    }
    return result;
}

InputSanitizer::InputSanitizer()
    : patterns_(std::make_unique<Patterns>()) {}

InputSanitizer::~InputSanitizer() = default;

InputSanitizer::InputSanitizer(InputSanitizer&&) noexcept            = default;
InputSanitizer& InputSanitizer::operator=(InputSanitizer&&) noexcept = default;

std::expected<std::string, SecurityError>
InputSanitizer::sanitize_string(std::string_view input, InputContext context) const {
    if (context != InputContext::kGeneric && input.size() > kMaxContextInputLength) {
        return std::unexpected(too_long(input.size(), kMaxContextInputLength));
    }

    switch (context) {
        case InputContext::kFilePath:
            if (search(input, patterns_->path_traversal)) {
                return std::unexpected(injection_error(
                    InjectionKind::kPath, "Path traversal pattern detected in input"));
            }
            if (input.find('\0') != std::string_view::npos) {
                return std::unexpected(injection_error(
                    InjectionKind::kPath, "Null byte detected in path"));
            }
            break;

        case InputContext::kCommand:
            if (search(input, patterns_->command_injection)) {
                return std::unexpected(injection_error(
                    InjectionKind::kCommand, "Command injection pattern detected in input"));
            }
            break;

        case InputContext::kSqlQuery:
            if (search(input, patterns_->sql_injection)) {
                return std::unexpected(injection_error(
                    InjectionKind::kSql, "SQL injection pattern detected in input"));
            }
            break;

        case InputContext::kWebUrl:
            if (search(input, patterns_->script_injection)) {
                return std::unexpected(injection_error(
                    InjectionKind::kScript, "Script injection pattern detected in input"));
            }
            if (!input.starts_with("http://") && !input.starts_with("https://")) {
                return std::unexpected(SecurityError{
                    SecurityErrorCode::kInvalidUrl, InjectionKind::kNone, "Invalid URL scheme"});
            }
            break;

        case InputContext::kGeneric:
            if (input.size() > kMaxGenericInputLength) {
                return std::unexpected(too_long(input.size(), kMaxGenericInputLength));
            }
            break;
    }

    return strip_control_characters(input);
}

std::expected<nlohmann::json, SecurityError>
InputSanitizer::sanitize_json(const nlohmann::json& value, InputContext context) const {
    if (value.is_string()) {
        auto sanitized = sanitize_string(value.get_ref<const std::string&>(), context);
        if (!sanitized) {
            return std::unexpected(std::move(sanitized.error()));
        }
        return nlohmann::json(std::move(sanitized.value()));
    }

    if (value.is_object()) {
        nlohmann::json sanitized_object = nlohmann::json::object();
        for (const auto& [key, item] : value.items()) {
            if (key.size() > kMaxJsonKeyLength || key.find('\0') != std::string::npos) {
                spdlog::debug("input_sanitizer: rejecting object key of length {}", key.size());
                return std::unexpected(SecurityError{
                    SecurityErrorCode::kInvalidJsonKey, InjectionKind::kNone,
                    fmt::format("Invalid object key: {}",
                                strip_control_characters(key.substr(0, kMaxJsonKeyLength)))});
            }
            auto sanitized = sanitize_json(item, context);
            if (!sanitized) {
                return std::unexpected(std::move(sanitized.error()));
            }
            sanitized_object[key] = std::move(sanitized.value());
        }
        return sanitized_object;
    }

    if (value.is_array()) {
        nlohmann::json sanitized_array = nlohmann::json::array();
        for (const auto& item : value) {
            auto sanitized = sanitize_json(item, context);
            if (!sanitized) {
                return std::unexpected(std::move(sanitized.error()));
            }
            sanitized_array.push_back(std::move(sanitized.value()));
        }
        return sanitized_array;
    }

    // 숫자, 불리언, null
    return value;
}
