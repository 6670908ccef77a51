#pragma once

// ---------------------------------------------------------------------------
// url.hpp
//
// 네트워크 도구 인자의 URL 을 scheme / host / port / path 로 분해하고
// host 가 사설망 또는 루프백인지 판정한다.
//
// [파서 범위]
// - 형식: scheme ":" [ "//" [userinfo "@"] host [":" port] ] path
// - scheme 은 영문자로 시작하고 영숫자, '+', '-', '.' 만 포함한다. 소문자로 정규화.
// - host 는 normalize_host 로 정규화하고 IPv6 리터럴의 대괄호를 제거한다.
// - http / https / ws / wss / ftp 는 host 가 반드시 있어야 한다.
// - 공백/제어 문자가 포함된 입력은 거부한다.
// - 퍼센트 디코딩, IDNA 변환은 하지 않는다.
//
// [host 정규화]
// 숫자 IPv4 의 다른 표기 (2130706433, 0x7f000001, 0177.0.0.1, 127.1) 와
// IPv4-mapped IPv6 (::ffff:127.0.0.1) 는 점 4개 표기로 바꾼 뒤 분류한다.
// 끝의 '.' 하나는 제거한다 ("localhost." → "localhost").
//
// [host 분류]
// is_private_host 는 정규화된 host 에 대한 문자열 prefix 기반이다. "10." 로 시작하는 호스트 이름
// ("10.example.com") 도 사설망으로 판정한다 (fail-close 방향 오탐).
// IPv6 리터럴은 inet_pton 으로 파싱하여 fc00::/7, fe80::/10 을 판정한다.
// ---------------------------------------------------------------------------

#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>

struct ParsedUrl {
    std::string                  scheme{};  // 소문자
    std::string                  host{};    // normalize_host 결과, 대괄호 없음, 없으면 빈 문자열
    std::optional<std::uint16_t> port{};
    std::string                  path{};    // 경로 + 쿼리 + fragment (원문)
};

// parse_url
//   실패 시 사람이 읽을 수 있는 사유 문자열을 반환한다.
[[nodiscard]] std::expected<ParsedUrl, std::string> parse_url(std::string_view input);

// 소문자 변환, 끝 '.' 제거, 숫자 IPv4 / IPv4-mapped IPv6 → 점 4개 표기.
// 그 외 host 는 소문자 변환만 한다.
[[nodiscard]] std::string normalize_host(std::string_view host);

// 인자를 normalize_host 로 정규화한 뒤 판정한다.
// 10.*, 172.*, 192.168.*, 169.254.*, 127.*, localhost, *.local,
// IPv6 ULA(fc00::/7), link-local(fe80::/10)
[[nodiscard]] bool is_private_host(std::string_view host);

// localhost, 127.*, 0.*, ::1, ::
[[nodiscard]] bool is_loopback_host(std::string_view host);
