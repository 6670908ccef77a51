// ---------------------------------------------------------------------------
// test_security_validator.cpp
//
// SecurityValidator 통합 테스트 (분류 → 정제 → 카테고리 검사 → 감사/통계).
//
// [테스트 범위]
// - classify_tool: 부분 문자열 기반 분류, 대소문자 무관
// - 파일시스템: 인젝션 선검사, 후보 키 전체 검사, Write 판정과 민감 접근 기록
// - 프로세스: blocklist / allowlist / 셸 / args 제한 / 잘못된 패턴 fail-close
// - 네트워크: 프로토콜 / 사설망 / 루프백 / blocked_urls / allowed_urls
// - 미분류 도구: strict_mode 여도 허용
// - ValidationStats 집계, 생성자 인자 검증
// ---------------------------------------------------------------------------

#include "validator/security_validator.hpp"

#include "policy/presets.hpp"
#include "stats/validation_stats.hpp"

#include <chrono>
#include <filesystem>
#include <gtest/gtest.h>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

#include <spdlog/sinks/ostream_sink.h>
#include <spdlog/spdlog.h>

namespace fs = std::filesystem;
using nlohmann::json;

namespace {

SecurityContext make_context(std::string tool) {
    SecurityContext ctx{};
    ctx.server_id    = "test-server";
    ctx.tool_name    = std::move(tool);
    ctx.operation_id = "op-test";
    ctx.timestamp    = std::chrono::system_clock::now();
    return ctx;
}

std::shared_ptr<const SecurityPolicy> share(SecurityPolicy policy) {
    return std::make_shared<SecurityPolicy>(std::move(policy));
}

// 명령/인자 검사만 보기 위한 최소 프로세스 정책
SecurityPolicy process_policy() {
    SecurityPolicy policy{};
    policy.id = "process-test";
    return policy;
}

std::expected<json, SecurityError> run(const SecurityValidator& validator,
                                       const std::string&       tool,
                                       const json&              args) {
    return validator.validate_tool_call(tool, args, make_context(tool));
}

}  // namespace

// ---------------------------------------------------------------------------
// classify_tool
// ---------------------------------------------------------------------------
TEST(ClassifyTool, ContextAndCategory) {
    auto c = classify_tool("read_file");
    EXPECT_EQ(c.input_context, InputContext::kFilePath);
    EXPECT_EQ(c.category, ToolCategory::kFilesystem);

    c = classify_tool("execute_command");
    EXPECT_EQ(c.input_context, InputContext::kCommand);
    EXPECT_EQ(c.category, ToolCategory::kProcess);

    c = classify_tool("http_fetch");
    EXPECT_EQ(c.input_context, InputContext::kWebUrl);
    EXPECT_EQ(c.category, ToolCategory::kNetwork);

    c = classify_tool("sql_query");
    EXPECT_EQ(c.input_context, InputContext::kSqlQuery);
    EXPECT_EQ(c.category, ToolCategory::kUnclassified);

    c = classify_tool("run_query");
    EXPECT_EQ(c.input_context, InputContext::kSqlQuery);
    EXPECT_EQ(c.category, ToolCategory::kProcess);

    c = classify_tool("get_weather");
    EXPECT_EQ(c.input_context, InputContext::kGeneric);
    EXPECT_EQ(c.category, ToolCategory::kUnclassified);
}

TEST(ClassifyTool, CaseInsensitive) {
    const auto c = classify_tool("Read_FILE");
    EXPECT_EQ(c.input_context, InputContext::kFilePath);
    EXPECT_EQ(c.category, ToolCategory::kFilesystem);
}

TEST(SecurityValidator, NullPolicy_Throws) {
    EXPECT_THROW(SecurityValidator(nullptr), std::invalid_argument);
}

// ---------------------------------------------------------------------------
// 파일시스템
// ---------------------------------------------------------------------------
TEST(SecurityValidator, Filesystem_TraversalCaughtAsInjection) {
    SecurityValidator validator(share(make_restrictive_policy()));

    const auto result = run(validator, "read_file", {{"path", "/tmp/../etc/passwd"}});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, SecurityErrorCode::kInjectionDetected);
    EXPECT_EQ(result.error().injection, InjectionKind::kPath);
}

TEST(SecurityValidator, Filesystem_EveryCandidateKeyChecked) {
    SecurityValidator validator(share(make_restrictive_policy()));

    // 문자열이 아닌 path 값 뒤에 숨긴 file 키도 검사되어야 한다
    const auto result = run(validator, "read_file", {{"path", 1}, {"file", "/etc/passwd"}});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, SecurityErrorCode::kPathBlocked);
}

TEST(SecurityValidator, Filesystem_NoPathArgumentPasses) {
    SecurityValidator validator(share(make_restrictive_policy()));
    EXPECT_TRUE(run(validator, "read_file", {{"encoding", "utf-8"}}).has_value());
}

class SecurityValidatorFsTest : public ::testing::Test {
protected:
    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        base_dir_ = fs::temp_directory_path() / "toolgate_validator_tests" /
                    (std::string(info->test_suite_name()) + "_" + info->name());
        fs::remove_all(base_dir_);
        fs::create_directories(base_dir_);
        root_ = fs::canonical(base_dir_);

        auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(audit_stream_);
        audit_sink_ = std::make_shared<spdlog::logger>("validator-test-audit", sink);
        audit_sink_->set_pattern("%l %v");
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(base_dir_, ec);
    }

    std::string audit_text() {
        audit_sink_->flush();
        return audit_stream_.str();
    }

    fs::path                        base_dir_;
    fs::path                        root_;
    std::ostringstream              audit_stream_;
    std::shared_ptr<spdlog::logger> audit_sink_;
};

TEST_F(SecurityValidatorFsTest, Write_DeniedByReadOnlyPolicy) {
    auto policy = make_restrictive_policy();
    policy.filesystem.allowed_paths = {root_};
    SecurityValidator validator(share(policy), audit_sink_);

    const auto target = (root_ / "out.txt").string();
    const auto result = run(validator, "write_file", {{"path", target}, {"content", "hello"}});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, SecurityErrorCode::kOperationNotPermitted);

    // 실패는 기본 정책에서 warn 으로 기록된다
    EXPECT_NE(audit_text().find("status=FAILED"), std::string::npos);
}

TEST_F(SecurityValidatorFsTest, Write_ApprovedAndSensitiveAccessLogged) {
    auto policy = make_moderate_policy();
    policy.filesystem.allowed_paths = {root_};
    SecurityValidator validator(share(policy), audit_sink_);

    const auto target = (root_ / "out.txt").string();
    const auto result = run(validator, "write_file", {{"path", target}, {"content", "hello"}});
    ASSERT_TRUE(result.has_value()) << result.error().message;
    EXPECT_EQ(result.value()["content"], "hello");

    const auto text = audit_text();
    EXPECT_NE(text.find("sensitive_access=WRITE path=" + target), std::string::npos) << text;
}

TEST_F(SecurityValidatorFsTest, Read_OutsideAllowlistRejected) {
    fs::create_directories(root_ / "inside");
    auto policy = make_moderate_policy();
    policy.filesystem.allowed_paths = {root_ / "inside"};
    SecurityValidator validator(share(policy));

    const auto result = run(validator, "read_file", {{"path", root_.string()}});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, SecurityErrorCode::kPathNotAllowlisted);
}

// ---------------------------------------------------------------------------
// 프로세스
// ---------------------------------------------------------------------------
TEST(SecurityValidator, Process_ShellDeniedEvenWhenAllowlisted) {
    auto policy = process_policy();
    policy.process.allowed_commands = {"bash"};
    SecurityValidator validator(share(policy));

    const auto result = run(validator, "execute_command", {{"command", "bash -c ls"}});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, SecurityErrorCode::kShellExecutionDenied);

    policy.process.allow_shell = true;
    SecurityValidator relaxed(share(policy));
    EXPECT_TRUE(run(relaxed, "execute_command", {{"command", "bash -c ls"}}).has_value());
}

TEST(SecurityValidator, Process_BlocklistBeforeAllowlist) {
    auto policy = process_policy();
    policy.process.allowed_commands = {"sudo"};
    policy.process.blocked_commands = {"sudo"};
    SecurityValidator validator(share(policy));

    const auto result = run(validator, "execute_command", {{"command", "sudo ls"}});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, SecurityErrorCode::kCommandBlocked);
    EXPECT_EQ(result.error().message, "Blocked command detected: sudo ls");
}

TEST(SecurityValidator, Process_AllowlistMatchesWholeCommandWord) {
    auto policy = process_policy();
    policy.process.allowed_commands = {"ls"};
    SecurityValidator validator(share(policy));

    EXPECT_TRUE(run(validator, "execute_command", {{"command", "ls"}}).has_value());
    EXPECT_TRUE(run(validator, "execute_command", {{"command", "ls -la"}}).has_value());

    const auto result = run(validator, "execute_command", {{"command", "lsblk"}});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, SecurityErrorCode::kCommandNotAllowlisted);
}

// 빈 allowed_commands 는 제한 없음. blocklist 와 셸 검사만 남는다.
TEST(SecurityValidator, Process_EmptyAllowlistLeavesBlocklistAndShell) {
    SecurityValidator validator(share(make_restrictive_policy()));

    EXPECT_TRUE(run(validator, "execute_command", {{"command", "echo hello"}}).has_value());

    const auto blocked = run(validator, "execute_command", {{"command", "chmod 777 x"}});
    ASSERT_FALSE(blocked.has_value());
    EXPECT_EQ(blocked.error().code, SecurityErrorCode::kCommandBlocked);

    const auto shell = run(validator, "execute_command", {{"command", "zsh"}});
    ASSERT_FALSE(shell.has_value());
    EXPECT_EQ(shell.error().code, SecurityErrorCode::kShellExecutionDenied);
}

TEST(SecurityValidator, Process_MetacharacterCaughtAsInjection) {
    SecurityValidator validator(share(make_permissive_policy()));

    const auto result = run(validator, "execute_command", {{"command", "ls; rm -rf /"}});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, SecurityErrorCode::kInjectionDetected);
    EXPECT_EQ(result.error().injection, InjectionKind::kCommand);
}

TEST(SecurityValidator, Process_ArgumentLimits) {
    auto policy = process_policy();
    policy.process.max_args       = 2;
    policy.process.max_arg_length = 5;
    SecurityValidator validator(share(policy));

    const auto too_many = run(validator, "run_command", {{"args", {"a", "b", "c"}}});
    ASSERT_FALSE(too_many.has_value());
    EXPECT_EQ(too_many.error().code, SecurityErrorCode::kTooManyArguments);

    const auto too_long = run(validator, "run_command", {{"args", {"abcdef"}}});
    ASSERT_FALSE(too_long.has_value());
    EXPECT_EQ(too_long.error().code, SecurityErrorCode::kArgumentTooLong);

    EXPECT_TRUE(run(validator, "run_command", {{"args", {"a", "bc"}}}).has_value());
}

TEST(SecurityValidator, Process_ArgumentPatterns) {
    auto policy = process_policy();
    policy.process.blocked_args_patterns = {R"(^--exec)"};
    policy.process.allowed_args_patterns = {R"(^-[a-z]$)", R"(^[A-Za-z0-9_./]+$)"};
    SecurityValidator validator(share(policy));

    const auto blocked = run(validator, "run_command", {{"args", {"--execute"}}});
    ASSERT_FALSE(blocked.has_value());
    EXPECT_EQ(blocked.error().code, SecurityErrorCode::kArgumentBlocked);

    const auto not_allowed = run(validator, "run_command", {{"args", {"--verbose"}}});
    ASSERT_FALSE(not_allowed.has_value());
    EXPECT_EQ(not_allowed.error().code, SecurityErrorCode::kArgumentNotAllowlisted);

    EXPECT_TRUE(run(validator, "run_command", {{"args", {"-l", "src/main.cpp"}}}).has_value());
}

TEST(SecurityValidator, Process_InvalidBlockedArgPatternFailsClosed) {
    auto policy = process_policy();
    policy.process.blocked_args_patterns = {"("};
    SecurityValidator validator(share(policy));

    const auto result = run(validator, "run_command", {{"args", {"harmless"}}});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, SecurityErrorCode::kArgumentBlocked);

    // args 가 없는 호출은 영향 없음
    EXPECT_TRUE(run(validator, "run_command", {{"command", "ls"}}).has_value());
}

// ---------------------------------------------------------------------------
// 네트워크
// ---------------------------------------------------------------------------
TEST(SecurityValidator, Network_PrivateAddressDependsOnPolicy) {
    SecurityValidator moderate(share(make_moderate_policy()));
    const auto blocked = run(moderate, "http_fetch", {{"url", "http://192.168.1.5/x"}});
    ASSERT_FALSE(blocked.has_value());
    EXPECT_EQ(blocked.error().code, SecurityErrorCode::kPrivateNetworkBlocked);
    EXPECT_EQ(blocked.error().message, "Access to private IP addresses is blocked");

    SecurityValidator permissive(share(make_permissive_policy()));
    EXPECT_TRUE(run(permissive, "http_fetch", {{"url", "http://192.168.1.5/x"}}).has_value());
}

TEST(SecurityValidator, Network_ProtocolNotAllowed) {
    SecurityValidator validator(share(make_restrictive_policy()));

    const auto result = run(validator, "http_fetch", {{"url", "http://example.com/"}});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, SecurityErrorCode::kProtocolNotAllowed);
    EXPECT_EQ(result.error().message, "Protocol 'http' not allowed");

    EXPECT_TRUE(run(validator, "http_fetch", {{"url", "https://example.com/"}}).has_value());
}

TEST(SecurityValidator, Network_LoopbackBlocked) {
    auto policy = make_permissive_policy();
    policy.network.block_loopback = true;
    SecurityValidator validator(share(policy));

    const auto result = run(validator, "http_fetch", {{"url", "http://[::1]:8080/"}});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, SecurityErrorCode::kLoopbackBlocked);
}

// ---------------------------------------------------------------------------
// 루프백 / 사설망 주소의 다른 표기도 같은 판정을 받아야 한다.
// ---------------------------------------------------------------------------
TEST(SecurityValidator, Network_AlternateAddressEncodingsBlocked) {
    SecurityValidator validator(share(make_restrictive_policy()));

    for (const char* url : {"https://2130706433/", "https://0x7f000001/", "https://0177.0.0.1/",
                            "https://127.1/", "https://0.0.0.0/", "https://[::ffff:127.0.0.1]/",
                            "https://167772161/", "https://localhost./"}) {
        const auto result = validator.validate_network_tool({{"url", url}});
        ASSERT_FALSE(result.has_value()) << url << " must be rejected";
        const auto code = result.error().code;
        EXPECT_TRUE(code == SecurityErrorCode::kPrivateNetworkBlocked ||
                    code == SecurityErrorCode::kLoopbackBlocked)
            << url << " rejected as " << to_string(code);
    }

    EXPECT_TRUE(validator.validate_network_tool({{"url", "https://example.com/"}}).has_value());
}

// 한 인자가 매우 길어도 프로세스가 죽지 않고 길이 초과로 거부된다.
TEST(SecurityValidator, Network_HugeUrlRejectedAsTooLong) {
    SecurityValidator validator(share(make_moderate_policy()));

    const std::string url = "https://example.com/?on" + std::string(1024 * 1024, 'a');
    const auto result = run(validator, "http_fetch", {{"url", url}});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, SecurityErrorCode::kInputTooLong);
}

TEST(SecurityValidator, Network_UrlPatterns) {
    auto policy = make_permissive_policy();
    policy.network.blocked_urls = {R"(^https://api\.example\.com/admin)"};
    policy.network.allowed_urls = {R"(^https://api\.example\.com/)"};
    SecurityValidator validator(share(policy));

    const auto blocked = run(validator, "fetch_url", {{"url", "https://api.example.com/admin/x"}});
    ASSERT_FALSE(blocked.has_value());
    EXPECT_EQ(blocked.error().code, SecurityErrorCode::kUrlBlocked);

    const auto outside = run(validator, "fetch_url", {{"url", "https://other.example.org/"}});
    ASSERT_FALSE(outside.has_value());
    EXPECT_EQ(outside.error().code, SecurityErrorCode::kUrlNotAllowlisted);

    EXPECT_TRUE(run(validator, "fetch_url", {{"url", "https://api.example.com/v1"}}).has_value());
}

TEST(SecurityValidator, Network_InvalidBlockedUrlPatternFailsClosed) {
    auto policy = make_permissive_policy();
    policy.network.blocked_urls = {"[unclosed"};
    SecurityValidator validator(share(policy));

    const auto result = run(validator, "http_fetch", {{"url", "https://example.com/"}});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, SecurityErrorCode::kUrlBlocked);
}

TEST(SecurityValidator, Network_ScriptInUrlCaughtAsInjection) {
    SecurityValidator validator(share(make_permissive_policy()));

    const auto result = run(validator, "http_fetch", {{"url", "javascript:alert(1)"}});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().injection, InjectionKind::kScript);
}

// ---------------------------------------------------------------------------
// 미분류 / 반환값 / 통계
// ---------------------------------------------------------------------------
TEST(SecurityValidator, Unclassified_AllowedInStrictMode) {
    SecurityValidator validator(share(make_restrictive_policy()));
    ASSERT_TRUE(validator.policy().strict_mode);

    const auto result = run(validator, "get_weather", {{"city", "Seoul"}});
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result.value()["city"], "Seoul");
}

TEST(SecurityValidator, ReturnsSanitizedArguments) {
    SecurityValidator validator(share(make_permissive_policy()));

    const auto result = run(validator, "get_weather", {{"city", "Seo\x01ul"}, {"days", 3}});
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result.value()["city"], "Seoul");
    EXPECT_EQ(result.value()["days"], 3);
}

TEST(SecurityValidator, SqlToolKeywordsRejected) {
    SecurityValidator validator(share(make_permissive_policy()));

    const auto result = run(validator, "sql_query", {{"sql", "SELECT * FROM users"}});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().injection, InjectionKind::kSql);
}

TEST(SecurityValidator, StatsCountEveryOutcome) {
    auto stats = std::make_shared<ValidationStats>();
    SecurityValidator validator(share(make_restrictive_policy()), nullptr, stats);

    (void)run(validator, "read_file", {{"path", "/tmp/../etc/passwd"}});  // injection
    (void)run(validator, "http_fetch", {{"url", "http://example.com"}});  // protocol
    (void)run(validator, "get_weather", {{"city", "Busan"}});             // 승인

    const auto snap = stats->snapshot();
    EXPECT_EQ(snap.total_validations, 3u);
    EXPECT_EQ(snap.rejected_validations, 2u);
    EXPECT_EQ(snap.injection_rejections, 1u);
    EXPECT_EQ(snap.filesystem_calls, 1u);
    EXPECT_EQ(snap.network_calls, 1u);
    EXPECT_EQ(snap.unclassified_calls, 1u);
}

TEST(SecurityValidator, SanitizeEnvironmentUsesPolicy) {
    SecurityValidator validator(share(make_restrictive_policy()));

    const auto env = validator.sanitize_environment({
        {"PATH", "/usr/bin"},
        {"LD_PRELOAD", "x.so"},
        {"OPENAI_API_KEY", "sk"},
    });
    ASSERT_EQ(env.size(), 1u);
    EXPECT_EQ(env.at("PATH"), "/usr/bin");
}

TEST(SecurityValidator, FileSizeDelegatesToPolicy) {
    SecurityValidator validator(share(make_restrictive_policy()));
    EXPECT_TRUE(validator.validate_file_size(1024).has_value());
    EXPECT_FALSE(validator.validate_file_size(11ULL * 1024 * 1024).has_value());
}
