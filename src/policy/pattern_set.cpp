// ---------------------------------------------------------------------------
// pattern_set.cpp
//
// 정책 정규식 목록의 사전 컴파일 구현.
//
// [매칭 의미]
// regex_search 를 사용한다. 패턴이 입력 전체가 아니라 일부와만 일치해도
// 매칭으로 본다. 전체 일치가 필요하면 패턴에 ^...$ 를 명시한다.
//
// [대소문자]
// 정책 패턴은 운영자가 작성하므로 작성한 그대로 (case-sensitive) 적용한다.
// 대소문자 무관 매칭이 필요하면 문자 클래스로 표현한다.
// ---------------------------------------------------------------------------

#include "policy/pattern_set.hpp"

#include <regex>
#include <utility>

#include <spdlog/spdlog.h>

struct PatternSet::CompiledPattern {
    std::string source_pattern;  // 원본 패턴 문자열 (감사 로그용)
    std::regex  compiled;
};

PatternSet::PatternSet(const std::vector<std::string>& patterns, std::string_view label) {
    compiled_patterns_.reserve(patterns.size());

    for (const auto& p : patterns) {
        try {
            compiled_patterns_.push_back(CompiledPattern{
                p, std::regex(p, std::regex_constants::ECMAScript)
            });
        } catch (const std::regex_error& e) {
            ++invalid_count_;
            spdlog::warn("pattern_set: invalid regex '{}' in {}, skipping: {}", p, label, e.what());
        }
    }
}

PatternSet::~PatternSet() = default;

PatternSet::PatternSet(PatternSet&&) noexcept            = default;
PatternSet& PatternSet::operator=(PatternSet&&) noexcept = default;

std::optional<std::string> PatternSet::first_match(std::string_view input) const {
    for (const auto& cp : compiled_patterns_) {
        if (std::regex_search(input.begin(), input.end(), cp.compiled)) {
            return cp.source_pattern;
        }
    }
    return std::nullopt;
}

bool PatternSet::empty() const noexcept {
    return compiled_patterns_.empty();
}
