// ---------------------------------------------------------------------------
// test_presets.cpp
//
// 기본 제공 정책 preset 테스트.
//
// [테스트 범위]
// - preset 별 핵심 값 (읽기 전용 / 쓰기 허용 / 완화)
// - preset 간 독립성: 한 preset 을 바꿔도 다른 preset 에 전파되지 않음
// - preset_by_name: 대소문자 무관, 알 수 없는 이름은 nullopt
// ---------------------------------------------------------------------------

#include "policy/presets.hpp"

#include <algorithm>
#include <gtest/gtest.h>

namespace {

bool contains(const std::vector<std::string>& list, const std::string& value) {
    return std::find(list.begin(), list.end(), value) != list.end();
}

}  // namespace

TEST(Presets, Restrictive_ReadOnlyHttpsOnly) {
    const auto policy = make_restrictive_policy();

    EXPECT_EQ(policy.id, "restrictive");
    EXPECT_FALSE(policy.filesystem.allow_write);
    EXPECT_FALSE(policy.filesystem.allow_delete);
    EXPECT_FALSE(policy.filesystem.allow_hidden);
    EXPECT_FALSE(policy.filesystem.allow_symlinks);
    ASSERT_TRUE(policy.filesystem.allowed_extensions.has_value());
    EXPECT_EQ(policy.filesystem.allowed_extensions->size(), 3u);
    EXPECT_EQ(policy.filesystem.max_file_size.value(), 10ULL * 1024 * 1024);

    EXPECT_TRUE(policy.process.allowed_commands.empty());
    EXPECT_FALSE(policy.process.allow_shell);
    EXPECT_TRUE(contains(policy.process.blocked_commands, "sudo"));

    EXPECT_EQ(policy.network.allowed_protocols, std::vector<std::string>{"https"});
    EXPECT_TRUE(policy.network.block_private_ips);
    EXPECT_TRUE(policy.network.block_loopback);

    EXPECT_FALSE(policy.environment.allow_passthrough);
    EXPECT_TRUE(contains(policy.environment.blocked_vars, "LD_PRELOAD"));
    EXPECT_TRUE(policy.strict_mode);
}

TEST(Presets, Moderate_WriteAndSafeCommands) {
    const auto policy = make_moderate_policy();

    EXPECT_EQ(policy.id, "moderate");
    EXPECT_TRUE(policy.filesystem.allow_write);
    EXPECT_FALSE(policy.filesystem.allow_delete);
    EXPECT_EQ(policy.filesystem.max_file_size.value(), 100ULL * 1024 * 1024);
    EXPECT_TRUE(contains(policy.process.allowed_commands, "ls"));
    EXPECT_TRUE(contains(policy.process.allowed_commands, "grep"));
    EXPECT_TRUE(contains(policy.network.allowed_protocols, "http"));
    EXPECT_EQ(policy.rate_limits.max_requests_per_minute.value(), 300u);
}

TEST(Presets, Permissive_MinimalBlocklist) {
    const auto policy = make_permissive_policy();

    EXPECT_EQ(policy.id, "permissive");
    EXPECT_TRUE(policy.filesystem.allow_delete);
    EXPECT_TRUE(policy.filesystem.allow_symlinks);
    EXPECT_FALSE(policy.filesystem.allowed_extensions.has_value());
    EXPECT_FALSE(policy.filesystem.max_file_size.has_value());
    EXPECT_TRUE(policy.process.allow_shell);
    EXPECT_TRUE(policy.network.allowed_protocols.empty());
    EXPECT_FALSE(policy.network.block_private_ips);
    EXPECT_TRUE(policy.environment.allow_passthrough);
    EXPECT_FALSE(policy.strict_mode);
    // 자격 증명 파일은 permissive 에서도 차단
    EXPECT_FALSE(policy.filesystem.blocked_paths.empty());
}

// ---------------------------------------------------------------------------
// Independence
//   각 생성 함수는 매번 새 값을 만든다. 반환값을 수정해도
//   다음 호출이나 다른 preset 에 영향이 없어야 한다.
// ---------------------------------------------------------------------------
TEST(Presets, Independence_MutationDoesNotLeak) {
    auto restrictive = make_restrictive_policy();
    restrictive.filesystem.allow_write = true;
    restrictive.process.blocked_commands.clear();

    const auto fresh    = make_restrictive_policy();
    const auto moderate = make_moderate_policy();

    EXPECT_FALSE(fresh.filesystem.allow_write);
    EXPECT_FALSE(fresh.process.blocked_commands.empty());
    EXPECT_FALSE(moderate.process.blocked_commands.empty());
}

TEST(Presets, ByName_CaseInsensitive) {
    const auto a = preset_by_name("Restrictive");
    ASSERT_TRUE(a.has_value());
    EXPECT_EQ(a->id, "restrictive");

    const auto b = preset_by_name("MODERATE");
    ASSERT_TRUE(b.has_value());
    EXPECT_EQ(b->id, "moderate");

    const auto c = preset_by_name("permissive");
    ASSERT_TRUE(c.has_value());
    EXPECT_EQ(c->id, "permissive");
}

TEST(Presets, ByName_UnknownIsNullopt) {
    EXPECT_FALSE(preset_by_name("paranoid").has_value());
    EXPECT_FALSE(preset_by_name("").has_value());
}
