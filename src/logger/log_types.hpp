#pragma once

// ---------------------------------------------------------------------------
// log_types.hpp
//
// 로거 서브시스템 공용 타입.
//
// [순환 의존성 방지 설계]
// - spdlog 헤더를 include 하지 않는다. spdlog 레벨 변환은 audit_sink.cpp 에서 한다.
// - 설정 파일/환경변수의 문자열 레벨은 parse_log_level 로만 변환한다.
// ---------------------------------------------------------------------------

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

// ---------------------------------------------------------------------------
// LogLevel
//   로거의 최소 출력 레벨. config 에서 주입.
// ---------------------------------------------------------------------------
enum class LogLevel : std::uint8_t {
    kDebug = 0,
    kInfo  = 1,
    kWarn  = 2,
    kError = 3,
};

// parse_log_level
//   "debug" | "info" | "warn" | "warning" | "error" (대소문자 무관).
//   알 수 없는 값이면 std::nullopt.
[[nodiscard]] inline std::optional<LogLevel> parse_log_level(std::string_view text) {
    std::string lowered(text);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowered == "debug") {
        return LogLevel::kDebug;
    }
    if (lowered == "info") {
        return LogLevel::kInfo;
    }
    if (lowered == "warn" || lowered == "warning") {
        return LogLevel::kWarn;
    }
    if (lowered == "error") {
        return LogLevel::kError;
    }
    return std::nullopt;
}
