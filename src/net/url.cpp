// ---------------------------------------------------------------------------
// url.cpp
// ---------------------------------------------------------------------------

#include "net/url.hpp"

#include <algorithm>
#include <arpa/inet.h>      // inet_aton, inet_ntop, inet_pton, AF_INET6
#include <array>
#include <cctype>
#include <charconv>
#include <cstring>
#include <netinet/in.h>     // in_addr, in6_addr

#include <fmt/format.h>

namespace {

std::string to_lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

bool is_scheme_char(unsigned char c) {
    return std::isalnum(c) != 0 || c == '+' || c == '-' || c == '.';
}

bool requires_host(std::string_view scheme) {
    static constexpr std::array<std::string_view, 5> kHostSchemes{
        "http", "https", "ws", "wss", "ftp",
    };
    return std::find(kHostSchemes.begin(), kHostSchemes.end(), scheme) != kHostSchemes.end();
}

// 대괄호 없는 IPv6 리터럴을 16 바이트로 변환한다. IPv6 가 아니면 nullopt.
std::optional<std::array<std::uint8_t, 16>> parse_ipv6(std::string_view host) {
    if (host.find(':') == std::string_view::npos) {
        return std::nullopt;
    }
    in6_addr addr{};
    const std::string host_str(host);
    if (inet_pton(AF_INET6, host_str.c_str(), &addr) != 1) {
        return std::nullopt;
    }
    std::array<std::uint8_t, 16> bytes{};
    std::copy(std::begin(addr.s6_addr), std::end(addr.s6_addr), bytes.begin());
    return bytes;
}

std::string format_ipv4(const in_addr& addr) {
    std::array<char, INET_ADDRSTRLEN> buf{};
    if (inet_ntop(AF_INET, &addr, buf.data(), static_cast<socklen_t>(buf.size())) == nullptr) {
        return {};
    }
    return std::string(buf.data());
}

}  // namespace

std::string normalize_host(std::string_view host) {
    std::string out = to_lower(host);
    if (out.size() > 1 && out.back() == '.') {
        out.pop_back();
    }

    if (const auto v6 = parse_ipv6(out); v6.has_value()) {
        // ::ffff:a.b.c.d → a.b.c.d
        const auto& b = v6.value();
        const bool v4_mapped = std::all_of(b.begin(), b.begin() + 10,
                                           [](std::uint8_t x) { return x == 0; }) &&
                               b[10] == 0xFF && b[11] == 0xFF;
        if (v4_mapped) {
            in_addr v4{};
            std::memcpy(&v4.s_addr, b.data() + 12, 4);
            if (auto dotted = format_ipv4(v4); !dotted.empty()) {
                return dotted;
            }
        }
        return out;
    }

    // inet_aton 은 10진 정수(2130706433), 16진(0x7f000001), 8진(0177.0.0.1),
    // 축약형(127.1) 을 모두 받는다. 성공하면 점 4개 표기로 다시 쓴다.
    in_addr v4{};
    if (!out.empty() && inet_aton(out.c_str(), &v4) != 0) {
        if (auto dotted = format_ipv4(v4); !dotted.empty()) {
            return dotted;
        }
    }
    return out;
}

std::expected<ParsedUrl, std::string> parse_url(std::string_view input) {
    if (input.empty()) {
        return std::unexpected(std::string("empty URL"));
    }
    const bool has_space_or_control = std::any_of(input.begin(), input.end(), [](char c) {
        const auto uc = static_cast<unsigned char>(c);
        return uc <= 0x20 || uc == 0x7F;
    });
    if (has_space_or_control) {
        return std::unexpected(std::string("URL contains whitespace or control characters"));
    }

    // scheme
    const auto colon = input.find(':');
    if (colon == std::string_view::npos || colon == 0) {
        return std::unexpected(std::string("relative URL without a scheme"));
    }
    const std::string_view scheme_raw = input.substr(0, colon);
    if (std::isalpha(static_cast<unsigned char>(scheme_raw.front())) == 0 ||
        !std::all_of(scheme_raw.begin(), scheme_raw.end(),
                     [](char c) { return is_scheme_char(static_cast<unsigned char>(c)); })) {
        return std::unexpected(fmt::format("invalid scheme '{}'", scheme_raw));
    }

    ParsedUrl url{};
    url.scheme = to_lower(scheme_raw);

    std::string_view rest = input.substr(colon + 1);

    if (rest.starts_with("//")) {
        rest.remove_prefix(2);
        const auto authority_end = rest.find_first_of("/?#");
        std::string_view authority = rest.substr(0, authority_end);
        url.path = authority_end == std::string_view::npos ? std::string{}
                                                           : std::string(rest.substr(authority_end));

        // userinfo 제거
        if (const auto at = authority.rfind('@'); at != std::string_view::npos) {
            authority.remove_prefix(at + 1);
        }

        std::string_view host;
        std::string_view port_str;
        bool             has_port = false;

        if (authority.starts_with('[')) {
            const auto close = authority.find(']');
            if (close == std::string_view::npos) {
                return std::unexpected(std::string("unterminated IPv6 literal"));
            }
            host = authority.substr(1, close - 1);
            const std::string_view after = authority.substr(close + 1);
            if (!after.empty()) {
                if (!after.starts_with(':')) {
                    return std::unexpected(std::string("unexpected characters after IPv6 literal"));
                }
                has_port = true;
                port_str = after.substr(1);
            }
            if (!parse_ipv6(host).has_value()) {
                return std::unexpected(fmt::format("invalid IPv6 address '{}'", host));
            }
        } else {
            const auto port_sep = authority.rfind(':');
            if (port_sep != std::string_view::npos) {
                has_port = true;
                port_str = authority.substr(port_sep + 1);
                host     = authority.substr(0, port_sep);
            } else {
                host = authority;
            }
        }

        if (has_port && !port_str.empty()) {
            std::uint16_t port{0};
            const auto [ptr, ec] = std::from_chars(port_str.data(),
                                                   port_str.data() + port_str.size(), port);
            if (ec != std::errc{} || ptr != port_str.data() + port_str.size()) {
                return std::unexpected(fmt::format("invalid port '{}'", port_str));
            }
            url.port = port;
        }

        url.host = normalize_host(host);
    } else {
        url.path = std::string(rest);
    }

    if (url.host.empty() && requires_host(url.scheme)) {
        return std::unexpected(fmt::format("empty host in '{}' URL", url.scheme));
    }

    return url;
}

bool is_private_host(std::string_view raw_host) {
    const std::string normalized = normalize_host(raw_host);
    const std::string_view host  = normalized;
    if (host == "localhost" || host.ends_with(".local")) {
        return true;
    }
    if (host.starts_with("10.") || host.starts_with("172.") || host.starts_with("192.168.") ||
        host.starts_with("127.") || host.starts_with("169.254.")) {
        return true;
    }

    if (const auto v6 = parse_ipv6(host); v6.has_value()) {
        const auto& b = v6.value();
        const bool unique_local = (b[0] & 0xFE) == 0xFC;                  // fc00::/7
        const bool link_local   = b[0] == 0xFE && (b[1] & 0xC0) == 0x80;  // fe80::/10
        return unique_local || link_local;
    }
    return false;
}

bool is_loopback_host(std::string_view raw_host) {
    const std::string normalized = normalize_host(raw_host);
    const std::string_view host  = normalized;
    // 0.0.0.0/8 은 Linux 에서 로컬 호스트로 연결된다
    if (host == "localhost" || host.starts_with("127.") || host.starts_with("0.")) {
        return true;
    }
    if (const auto v6 = parse_ipv6(host); v6.has_value()) {
        static constexpr std::array<std::uint8_t, 16> kLoopback{
            0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 1,
        };
        static constexpr std::array<std::uint8_t, 16> kUnspecified{};
        return v6.value() == kLoopback || v6.value() == kUnspecified;
    }
    return false;
}
