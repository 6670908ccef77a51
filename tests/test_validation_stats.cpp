// ---------------------------------------------------------------------------
// test_validation_stats.cpp
//
// ValidationStats 단위 테스트.
//
// [테스트 범위]
// - 초기 상태 검증 (all-zero)
// - on_validation: 승인/거부/인젝션 카운터, 카테고리별 카운터
// - snapshot(): reject_rate 계산, total == 0 시 0.0
// - ConcurrentAccess: 멀티스레드 동시성 (data race 미발생 확인)
//
// [알려진 한계]
// - reject_rate 부동소수점 비교는 EXPECT_NEAR 으로 허용 오차 1e-9 이내.
// ---------------------------------------------------------------------------

#include "stats/validation_stats.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <cstdint>
#include <thread>
#include <vector>

TEST(ValidationStats, InitialState_AllZero) {
    ValidationStats stats;
    const auto snap = stats.snapshot();

    EXPECT_EQ(snap.total_validations, 0u) << "total_validations must be 0 at init";
    EXPECT_EQ(snap.rejected_validations, 0u) << "rejected_validations must be 0 at init";
    EXPECT_EQ(snap.injection_rejections, 0u) << "injection_rejections must be 0 at init";
    EXPECT_NEAR(snap.reject_rate, 0.0, 1e-9) << "reject_rate must be 0.0 when total == 0";
}

TEST(ValidationStats, OnValidation_CountsOutcomes) {
    ValidationStats stats;

    const SecurityError blocked{SecurityErrorCode::kPathBlocked, InjectionKind::kNone, "blocked"};
    const SecurityError injection{SecurityErrorCode::kInjectionDetected, InjectionKind::kSql, "sql"};

    stats.on_validation(ToolCategory::kFilesystem, nullptr);
    stats.on_validation(ToolCategory::kFilesystem, &blocked);
    stats.on_validation(ToolCategory::kUnclassified, &injection);
    stats.on_validation(ToolCategory::kNetwork, nullptr);

    const auto snap = stats.snapshot();
    EXPECT_EQ(snap.total_validations, 4u);
    EXPECT_EQ(snap.rejected_validations, 2u);
    EXPECT_EQ(snap.injection_rejections, 1u);
    EXPECT_EQ(snap.filesystem_calls, 2u);
    EXPECT_EQ(snap.process_calls, 0u);
    EXPECT_EQ(snap.network_calls, 1u);
    EXPECT_EQ(snap.unclassified_calls, 1u);
    EXPECT_NEAR(snap.reject_rate, 0.5, 1e-9);
}

TEST(ValidationStats, Snapshot_HasCaptureTime) {
    ValidationStats stats;
    const auto before = std::chrono::system_clock::now();
    const auto snap   = stats.snapshot();
    EXPECT_GE(snap.captured_at, before);
}

// ---------------------------------------------------------------------------
// ConcurrentAccess
//   4 스레드 × 10000 회 on_validation 후 카운터 합이 정확해야 한다.
// ---------------------------------------------------------------------------
TEST(ValidationStats, ConcurrentAccess) {
    ValidationStats stats;
    constexpr int kThreads    = 4;
    constexpr int kIterations = 10000;

    const SecurityError error{SecurityErrorCode::kCommandBlocked, InjectionKind::kNone, "x"};

    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&stats, &error] {
            for (int i = 0; i < kIterations; ++i) {
                stats.on_validation(ToolCategory::kProcess, (i % 2 == 0) ? &error : nullptr);
                (void)stats.snapshot();
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }

    const auto snap = stats.snapshot();
    EXPECT_EQ(snap.total_validations, static_cast<std::uint64_t>(kThreads * kIterations));
    EXPECT_EQ(snap.rejected_validations, static_cast<std::uint64_t>(kThreads * kIterations / 2));
    EXPECT_EQ(snap.process_calls, static_cast<std::uint64_t>(kThreads * kIterations));
    EXPECT_NEAR(snap.reject_rate, 0.5, 1e-9);
}
