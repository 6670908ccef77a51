#pragma once

// ---------------------------------------------------------------------------
// validation_stats.hpp
//
// 검증 결과 통계 수집기. 헤더 전용 (atomic inline 구현).
//
// [스레드 안전성]
// - on_validation: 검증 경로에서 concurrent 호출 안전 (relaxed atomic).
// - snapshot: 조회 경로. 갱신 경로와 mutex 없이 분리된다.
//
// [격리 원칙]
// 통계 갱신 실패가 검증 결과로 전파되지 않도록 모든 메서드는 noexcept 이다.
// ---------------------------------------------------------------------------

#include <array>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>

#include "common/types.hpp"

// ---------------------------------------------------------------------------
// ValidationStatsSnapshot
//   reject_rate: rejected / total (total == 0 이면 0.0)
// ---------------------------------------------------------------------------
struct ValidationStatsSnapshot {
    std::uint64_t                         total_validations{0};
    std::uint64_t                         rejected_validations{0};
    std::uint64_t                         injection_rejections{0};
    std::uint64_t                         filesystem_calls{0};
    std::uint64_t                         process_calls{0};
    std::uint64_t                         network_calls{0};
    std::uint64_t                         unclassified_calls{0};
    double                                reject_rate{0.0};
    std::chrono::system_clock::time_point captured_at{};
};

class ValidationStats {
public:
    ValidationStats() noexcept = default;
    ~ValidationStats()         = default;

    // 복사/이동 금지 (atomic 은 복사 불가)
    ValidationStats(const ValidationStats&)            = delete;
    ValidationStats& operator=(const ValidationStats&) = delete;
    ValidationStats(ValidationStats&&)                 = delete;
    ValidationStats& operator=(ValidationStats&&)      = delete;

    // on_validation
    //   validate_tool_call 종료 시 호출.
    //   error: 거부 시 오류 코드, 승인 시 nullptr
    void on_validation(ToolCategory category, const SecurityError* error) noexcept {
        total_.fetch_add(1, std::memory_order_relaxed);
        per_category_[static_cast<std::size_t>(category)].fetch_add(1, std::memory_order_relaxed);
        if (error != nullptr) {
            rejected_.fetch_add(1, std::memory_order_relaxed);
            if (error->code == SecurityErrorCode::kInjectionDetected) {
                injections_.fetch_add(1, std::memory_order_relaxed);
            }
        }
    }

    [[nodiscard]] ValidationStatsSnapshot snapshot() const noexcept {
        const auto total    = total_.load(std::memory_order_relaxed);
        const auto rejected = rejected_.load(std::memory_order_relaxed);

        double reject_rate = 0.0;
        if (total > 0) {
            reject_rate = static_cast<double>(rejected) / static_cast<double>(total);
        }

        return ValidationStatsSnapshot{
            .total_validations    = total,
            .rejected_validations = rejected,
            .injection_rejections = injections_.load(std::memory_order_relaxed),
            .filesystem_calls     = load_category(ToolCategory::kFilesystem),
            .process_calls        = load_category(ToolCategory::kProcess),
            .network_calls        = load_category(ToolCategory::kNetwork),
            .unclassified_calls   = load_category(ToolCategory::kUnclassified),
            .reject_rate          = reject_rate,
            .captured_at          = std::chrono::system_clock::now(),
        };
    }

private:
    [[nodiscard]] std::uint64_t load_category(ToolCategory category) const noexcept {
        return per_category_[static_cast<std::size_t>(category)].load(std::memory_order_relaxed);
    }

    std::atomic<std::uint64_t>                total_{0};
    std::atomic<std::uint64_t>                rejected_{0};
    std::atomic<std::uint64_t>                injections_{0};
    std::array<std::atomic<std::uint64_t>, 4> per_category_{};
};
