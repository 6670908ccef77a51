#pragma once

// ---------------------------------------------------------------------------
// presets.hpp
//
// 기본 제공 보안 정책 3종.
//
// [독립 생성]
// 세 함수는 서로를 호출하지 않는다. restrictive 를 수정해도 moderate /
// permissive 가 따라 바뀌지 않는다. 부분 수정이 필요하면 PolicyLoader 의
// "preset + override" 방식을 사용한다.
// ---------------------------------------------------------------------------

#include <optional>
#include <string_view>

#include "rule.hpp"

// 신뢰할 수 없는 서버용. 파일시스템 읽기 전용(.txt/.json/.md), 명령 실행 없음,
// HTTPS 만 허용.
[[nodiscard]] SecurityPolicy make_restrictive_policy();

// 쓰기 허용, 소수의 안전한 명령 허용, HTTP/HTTPS 허용.
[[nodiscard]] SecurityPolicy make_moderate_policy();

// 완전히 신뢰하는 배포 전용. 최소한의 하드 blocklist 만 적용한다.
[[nodiscard]] SecurityPolicy make_permissive_policy();

// 이름으로 preset 을 찾는다 ("restrictive" | "moderate" | "permissive").
// 대소문자 무관. 알 수 없는 이름이면 std::nullopt.
[[nodiscard]] std::optional<SecurityPolicy> preset_by_name(std::string_view name);
