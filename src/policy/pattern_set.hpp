#pragma once

// ---------------------------------------------------------------------------
// pattern_set.hpp
//
// 정책에 포함된 정규식 목록(blocked_urls, allowed_args_patterns 등)을
// validator 생성 시점에 한 번만 컴파일해 보관한다.
// 런타임 캐시가 없으므로 동시 검증 간 공유 가변 상태도 없다.
//
// [잘못된 패턴 처리]
// - 잘못된 패턴은 로그 후 건너뛴다. 나머지 유효 패턴은 계속 적용된다.
// - has_invalid() 로 건너뛴 패턴이 있는지 확인할 수 있다.
//   block 목록에서 이 값이 true 이면 호출자는 해당 카테고리를 fail-close
//   처리해야 한다 (차단 규칙 일부가 빠진 상태로 허용하지 않는다).
// - allow 목록에서 패턴이 빠지면 허용 범위가 좁아질 뿐이므로 추가 조치는 없다.
// ---------------------------------------------------------------------------

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

class PatternSet {
public:
    // patterns: ECMAScript 정규식 목록
    // label   : 로그에 표시할 목록 이름 (예: "network.blocked_urls")
    PatternSet(const std::vector<std::string>& patterns, std::string_view label);

    ~PatternSet();

    // 복사 금지 (컴파일된 regex 재사용), 이동 허용
    PatternSet(const PatternSet&)            = delete;
    PatternSet& operator=(const PatternSet&) = delete;
    PatternSet(PatternSet&&) noexcept;
    PatternSet& operator=(PatternSet&&) noexcept;

    // 입력의 일부가 어느 패턴과 일치하면 해당 패턴의 원문을 반환한다.
    [[nodiscard]] std::optional<std::string> first_match(std::string_view input) const;

    [[nodiscard]] bool matches_any(std::string_view input) const {
        return first_match(input).has_value();
    }

    // 유효하게 컴파일된 패턴이 하나도 없으면 true
    [[nodiscard]] bool empty() const noexcept;

    // 컴파일 실패로 건너뛴 패턴이 있으면 true
    [[nodiscard]] bool has_invalid() const noexcept { return invalid_count_ > 0; }

private:
    struct CompiledPattern;
    std::vector<CompiledPattern> compiled_patterns_;
    std::size_t                  invalid_count_{0};
};
