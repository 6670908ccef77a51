#pragma once

// ---------------------------------------------------------------------------
// line_protocol.hpp
//
// toolgate CLI 의 줄 단위 JSON 프로토콜 (stdin 요청 한 줄 → stdout 응답 한 줄).
//
// [요청]
//   {"id": <any>, "server_id": "fs", "tool": "read_file",
//    "arguments": {...}, "user": "alice", "operation_id": "op-1"}
//   {"id": <any>, "server_id": "shell", "method": "sanitize_environment",
//    "env": {"PATH": "/usr/bin", ...}}
//   {"id": <any>, "method": "stats"}
//   method 생략 시 "validate_tool_call". id 는 응답에 그대로 복사된다.
//
// [응답]
//   {"id": ..., "allowed": true,  "arguments": {...}}
//   {"id": ..., "allowed": false, "error": {"kind": "PathBlocked",
//                                           "injection": null, "message": "..."}}
//   {"id": ..., "env": {...}}
//   {"id": ..., "stats": {...}}
//   {"id": ..., "error": {"kind": "BadRequest", "message": "..."}}
//
// [크기 제한]
// 요청 한 줄은 kMaxRequestBytes 이하. 넘는 줄은 개행까지 버리고
// id 가 null 인 BadRequest 로 답한다.
//
// [순서]
// 요청은 동시에 처리되므로 응답 순서는 요청 순서와 다를 수 있다.
// 호출자는 id 로 대응시킨다.
// ---------------------------------------------------------------------------

#include <cstddef>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "common/types.hpp"
#include "sanitizer/env_sanitizer.hpp"
#include "stats/validation_stats.hpp"

inline constexpr std::size_t kMaxRequestBytes = 1024 * 1024;

enum class GateMethod : std::uint8_t {
    kValidateToolCall    = 0,
    kSanitizeEnvironment = 1,
    kStats               = 2,
};

struct GateRequest {
    nlohmann::json             id{};
    GateMethod                 method{GateMethod::kValidateToolCall};
    std::string                server_id{};
    std::string                tool{};
    nlohmann::json             arguments = nlohmann::json::object();
    std::optional<std::string> user{};
    std::optional<std::string> operation_id{};
    EnvMap                     env{};
};

// 요청 형식 오류. id 는 파싱 가능했던 경우에만 채워진다 (아니면 null).
struct GateProtocolError {
    nlohmann::json id{};
    std::string    message{};
};

[[nodiscard]] std::expected<GateRequest, GateProtocolError> parse_request(std::string_view line);

// kMaxRequestBytes 를 넘는 요청 줄에 대한 오류 (id 는 null)
[[nodiscard]] GateProtocolError make_oversized_request_error();

[[nodiscard]] nlohmann::json
make_validation_response(const nlohmann::json&                               id,
                         const std::expected<nlohmann::json, SecurityError>& result);

[[nodiscard]] nlohmann::json make_environment_response(const nlohmann::json& id, const EnvMap& env);

[[nodiscard]] nlohmann::json make_stats_response(const nlohmann::json&          id,
                                                 const ValidationStatsSnapshot& stats);

[[nodiscard]] nlohmann::json make_bad_request_response(const GateProtocolError& error);

// 개행 없는 한 줄 JSON. 잘못된 UTF-8 은 U+FFFD 로 대체한다.
[[nodiscard]] std::string serialize_response(const nlohmann::json& response);
