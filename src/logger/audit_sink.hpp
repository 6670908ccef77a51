#pragma once

// ---------------------------------------------------------------------------
// audit_sink.hpp
//
// 감사 로그 전용 spdlog 로거 생성.
//
// [설계 원칙]
// - 싱글턴 금지: 반환된 로거를 AuditLogger / ValidatorRegistry 에 생성자
//   주입한다. spdlog 전역 registry 에 등록하지 않는다.
// - 싱크 구성: stderr + (경로가 주어지면) rotating file.
//   stdout 은 CLI 응답 채널이므로 감사 로그를 쓰지 않는다.
// ---------------------------------------------------------------------------

#include <filesystem>
#include <memory>
#include <optional>

#include "log_types.hpp"

namespace spdlog {
class logger;
}

inline constexpr const char* kAuditLoggerName = "toolgate-audit";

// make_audit_sink
//   min_level : 이 레벨 미만의 로그는 기록하지 않는다.
//   log_path  : 감사 로그 파일 경로. nullopt 이면 stderr 만 사용한다.
//
//   파일 싱크 생성 실패 (디렉터리 생성 불가, 권한 없음) 시
//   std::runtime_error 를 던진다. 감사 로그 없이 기동하지 않는다.
[[nodiscard]] std::shared_ptr<spdlog::logger>
make_audit_sink(LogLevel min_level, const std::optional<std::filesystem::path>& log_path);

// spdlog 전역 기본 로거(진단용)의 레벨을 설정한다.
void set_diagnostic_level(LogLevel level);
