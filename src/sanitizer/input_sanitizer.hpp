#pragma once

// ---------------------------------------------------------------------------
// input_sanitizer.hpp
//
// 정규식 기반 도구 인자 인젝션 탐지기.
// 탐지 규칙은 InputContext 별로 고정되어 있으며 생성 시 한 번 컴파일된다.
//
// [컨텍스트별 탐지 대상]
// - kSqlQuery : SQL 키워드 (SELECT/INSERT/.../GRANT/REVOKE), 주석(--, /* */),
//               확장 프로시저 접두사(xp_, sp_)                → Sql
// - kCommand  : 셸 메타문자 ; & | ` $ ( ) < > { } [ ] \       → Command
// - kFilePath : ../  ..\  ~/  %2e%2e  %252e  ..%2f  ..%5c, NUL → Path
// - kWebUrl   : <script, javascript:, on*=, eval(, setTimeout,
//               setInterval, Function(                         → Script
//               http:// 또는 https:// 로 시작하지 않으면 kInvalidUrl
// - kGeneric  : 10,000 바이트 초과 시 kInputTooLong
//
// [길이 상한]
// Generic 외 컨텍스트는 정규식을 돌리기 전에 8,192 바이트 초과 입력을
// kInputTooLong 으로 거부한다. libstdc++ std::regex 는 반복마다 재귀하므로
// 상한 없는 입력은 스택을 넘칠 수 있다. 같은 이유로 고정 패턴의 반복은
// 모두 상한이 있는 형태 ({1,32}, {0,8}) 로 쓴다.
//
// [정규화]
// 모든 컨텍스트에서 검사를 통과한 문자열은 공백이 아닌 제어 문자를
// 제거한 형태로 반환된다. 그 외 변형은 하지 않는다.
// Generic 컨텍스트는 이 정규화가 유일한 처리이며 거부 대신 조용히 정리한다.
//
// [오탐/미탐 트레이드오프]
// - SQL 키워드 규칙은 단어 경계 기준이므로 "select a file" 같은 자연어도
//   차단된다 (false positive). sql/query 계열 도구 전용 규칙이다.
// - Command 규칙은 백슬래시를 포함하므로 Windows 경로 인자가 차단된다.
// - on\w{1,32}= 규칙은 "condition_x=" 같은 쿼리 파라미터도 잡는다.
// - 유니코드 동형 문자, 이중 인코딩(%25252e) 은 탐지하지 못한다.
// ---------------------------------------------------------------------------

#include <cstddef>
#include <expected>
#include <memory>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "common/types.hpp"

inline constexpr std::size_t kMaxGenericInputLength = 10000;
inline constexpr std::size_t kMaxContextInputLength = 8192;
inline constexpr std::size_t kMaxJsonKeyLength      = 100;

class InputSanitizer {
public:
    InputSanitizer();
    ~InputSanitizer();

    // 복사 금지 (컴파일된 regex 재사용), 이동 허용
    InputSanitizer(const InputSanitizer&)            = delete;
    InputSanitizer& operator=(const InputSanitizer&) = delete;
    InputSanitizer(InputSanitizer&&) noexcept;
    InputSanitizer& operator=(InputSanitizer&&) noexcept;

    // sanitize_string
    //   성공: 제어 문자가 제거된 문자열
    //   실패: kInjectionDetected{kind} / kInvalidUrl / kInputTooLong
    [[nodiscard]] std::expected<std::string, SecurityError>
    sanitize_string(std::string_view input, InputContext context) const;

    // sanitize_json
    //   문자열 → sanitize_string, 객체 → 키 검증 후 값 재귀,
    //   배열 → 원소별 재귀, 숫자/불리언/null → 그대로.
    //   이미 정제된 입력에 다시 적용하면 같은 결과를 반환한다 (멱등).
    [[nodiscard]] std::expected<nlohmann::json, SecurityError>
    sanitize_json(const nlohmann::json& value, InputContext context) const;

private:
    struct Patterns;
    std::unique_ptr<Patterns> patterns_;
};

// strip_control_characters
//   C0 제어 문자(TAB/LF/VT/FF/CR 제외), DEL, UTF-8 로 인코딩된 C1 제어 문자
//   (NEL 제외) 를 제거한다. 나머지 바이트는 그대로 둔다.
[[nodiscard]] std::string strip_control_characters(std::string_view input);
