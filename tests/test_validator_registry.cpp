// ---------------------------------------------------------------------------
// test_validator_registry.cpp
//
// ValidatorRegistry 단위 테스트.
//
// [테스트 범위]
// - 정책이 하나도 없으면 모든 호출을 kPolicyUnavailable 로 거부 (fail-close)
// - 서버별 정책 우선, 없으면 default
// - reload: 서버별 정책 전체 교체
// - Hot swap: 교체 전에 얻은 validator 는 이전 정책으로 계속 동작
// - 통계는 validator 교체와 무관하게 누적
// - 동시 검증 중 정책 교체 (data race 미발생 확인)
// ---------------------------------------------------------------------------

#include "validator/validator_registry.hpp"

#include "policy/presets.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <gtest/gtest.h>
#include <string>
#include <thread>
#include <vector>

using nlohmann::json;

namespace {

SecurityContext make_context(const std::string& server_id, const std::string& tool) {
    SecurityContext ctx{};
    ctx.server_id    = server_id;
    ctx.tool_name    = tool;
    ctx.operation_id = "op-registry";
    ctx.timestamp    = std::chrono::system_clock::now();
    return ctx;
}

std::expected<json, SecurityError> fetch(const ValidatorRegistry& registry,
                                         const std::string&       server_id,
                                         const std::string&       url) {
    return registry.validate_tool_call("http_fetch", {{"url", url}},
                                       make_context(server_id, "http_fetch"));
}

}  // namespace

// ---------------------------------------------------------------------------
// Fail-close
// ---------------------------------------------------------------------------
TEST(ValidatorRegistry, NoPolicy_RejectsEverything) {
    ValidatorRegistry registry;
    EXPECT_FALSE(registry.has_default_policy());
    EXPECT_EQ(registry.validator_for("any"), nullptr);

    const auto result = registry.validate_tool_call("get_weather", {{"city", "Seoul"}},
                                                    make_context("any", "get_weather"));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, SecurityErrorCode::kPolicyUnavailable);
    EXPECT_EQ(result.error().message, "No security policy available for server 'any'");
}

TEST(ValidatorRegistry, NoPolicy_EnvironmentIsEmpty) {
    ValidatorRegistry registry;
    EXPECT_TRUE(registry.sanitize_environment("any", {{"PATH", "/usr/bin"}}).empty());
}

// ---------------------------------------------------------------------------
// 서버별 선택
// ---------------------------------------------------------------------------
TEST(ValidatorRegistry, ServerPolicyOverridesDefault) {
    ValidatorRegistry registry;
    registry.set_default_policy(make_restrictive_policy());
    registry.set_server_policy("trusted", make_permissive_policy());

    EXPECT_FALSE(fetch(registry, "other", "http://example.com/").has_value());
    EXPECT_TRUE(fetch(registry, "trusted", "http://example.com/").has_value());

    EXPECT_EQ(registry.validator_for("trusted")->policy().id, "permissive");
    EXPECT_EQ(registry.validator_for("other")->policy().id, "restrictive");
}

TEST(ValidatorRegistry, ServerOnly_UnknownServerStillRejected) {
    ValidatorRegistry registry;
    registry.set_server_policy("trusted", make_permissive_policy());

    EXPECT_TRUE(fetch(registry, "trusted", "https://example.com/").has_value());

    const auto result = fetch(registry, "stranger", "https://example.com/");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, SecurityErrorCode::kPolicyUnavailable);
}

TEST(ValidatorRegistry, RemoveServerPolicy_FallsBackToDefault) {
    ValidatorRegistry registry;
    registry.set_default_policy(make_restrictive_policy());
    registry.set_server_policy("trusted", make_permissive_policy());

    EXPECT_TRUE(registry.remove_server_policy("trusted"));
    EXPECT_FALSE(registry.remove_server_policy("trusted"));
    EXPECT_EQ(registry.validator_for("trusted")->policy().id, "restrictive");
}

TEST(ValidatorRegistry, SanitizeEnvironmentPerServer) {
    ValidatorRegistry registry;
    registry.set_default_policy(make_restrictive_policy());
    registry.set_server_policy("trusted", make_permissive_policy());

    const EnvMap env{{"PATH", "/usr/bin"}, {"EDITOR", "vim"}};
    EXPECT_EQ(registry.sanitize_environment("other", env).size(), 1u);
    EXPECT_EQ(registry.sanitize_environment("trusted", env).size(), 2u);
}

// ---------------------------------------------------------------------------
// reload / hot swap
// ---------------------------------------------------------------------------
TEST(ValidatorRegistry, Reload_ReplacesAllServerPolicies) {
    ValidatorRegistry registry;
    registry.set_server_policy("old", make_permissive_policy());

    GateConfig cfg{};
    cfg.default_policy = make_moderate_policy();
    cfg.server_policies.emplace("new", make_permissive_policy());
    registry.reload(cfg);

    EXPECT_TRUE(registry.has_default_policy());
    EXPECT_EQ(registry.validator_for("old")->policy().id, "moderate");
    EXPECT_EQ(registry.validator_for("new")->policy().id, "permissive");
}

TEST(ValidatorRegistry, HotSwap_InFlightValidatorKeepsOldPolicy) {
    ValidatorRegistry registry;
    registry.set_default_policy(make_permissive_policy());

    // 교체 전에 얻은 validator (진행 중인 검증에 해당)
    const auto in_flight = registry.validator_for("srv");
    ASSERT_NE(in_flight, nullptr);

    registry.set_default_policy(make_restrictive_policy());

    const auto ctx = make_context("srv", "http_fetch");
    const json args = {{"url", "http://example.com/"}};
    EXPECT_TRUE(in_flight->validate_tool_call("http_fetch", args, ctx).has_value());
    EXPECT_FALSE(registry.validate_tool_call("http_fetch", args, ctx).has_value());
    EXPECT_EQ(in_flight->policy().id, "permissive");
}

TEST(ValidatorRegistry, StatsSurviveReload) {
    ValidatorRegistry registry;
    registry.set_default_policy(make_restrictive_policy());
    (void)fetch(registry, "a", "http://example.com/");

    registry.set_default_policy(make_permissive_policy());
    (void)fetch(registry, "a", "http://example.com/");

    const auto snap = registry.stats();
    EXPECT_EQ(snap.total_validations, 2u);
    EXPECT_EQ(snap.rejected_validations, 1u);
    EXPECT_EQ(snap.network_calls, 2u);
}

// ---------------------------------------------------------------------------
// ConcurrentSwap
//   검증 스레드 여러 개와 교체 스레드 하나가 동시에 동작해도
//   모든 호출은 교체 전 또는 교체 후 정책 중 하나로 일관되게 판정된다.
// ---------------------------------------------------------------------------
TEST(ValidatorRegistry, ConcurrentSwap_NoTornState) {
    ValidatorRegistry registry;
    registry.set_default_policy(make_permissive_policy());

    std::atomic<bool>          stop{false};
    std::atomic<std::uint64_t> completed{0};

    std::vector<std::thread> workers;
    for (int i = 0; i < 4; ++i) {
        workers.emplace_back([&] {
            while (!stop.load()) {
                // default 정책이 항상 있으므로 nullptr 가 아니다
                const auto validator = registry.validator_for("srv");
                const auto result = validator->validate_tool_call(
                    "http_fetch", {{"url", "http://example.com/"}},
                    make_context("srv", "http_fetch"));
                // permissive 이면 허용, restrictive 이면 프로토콜 거부
                if (validator->policy().id == "permissive") {
                    EXPECT_TRUE(result.has_value());
                } else {
                    EXPECT_FALSE(result.has_value());
                    if (!result.has_value()) {
                        EXPECT_EQ(result.error().code, SecurityErrorCode::kProtocolNotAllowed);
                    }
                }
                completed.fetch_add(1);
            }
        });
    }

    for (int i = 0; i < 50; ++i) {
        registry.set_default_policy(i % 2 == 0 ? make_restrictive_policy()
                                               : make_permissive_policy());
    }
    while (completed.load() < 100) {
        std::this_thread::yield();
    }
    stop.store(true);
    for (auto& t : workers) {
        t.join();
    }

    EXPECT_GT(completed.load(), 0u);
    EXPECT_EQ(registry.stats().total_validations, completed.load());
}
