// ---------------------------------------------------------------------------
// test_types.cpp
//
// 공용 열거형 문자열 변환 테스트.
// 응답 JSON 의 "kind" 와 감사 로그에 쓰이는 문자열이 고정되어 있는지 확인한다.
// ---------------------------------------------------------------------------

#include "common/types.hpp"

#include <gtest/gtest.h>

TEST(Types, SecurityErrorCode_ToString) {
    EXPECT_EQ(to_string(SecurityErrorCode::kPathTraversal), "PathTraversal");
    EXPECT_EQ(to_string(SecurityErrorCode::kCanonicalizationFailed), "CanonicalizationFailed");
    EXPECT_EQ(to_string(SecurityErrorCode::kInjectionDetected), "InjectionDetected");
    EXPECT_EQ(to_string(SecurityErrorCode::kShellExecutionDenied), "ShellExecutionDenied");
    EXPECT_EQ(to_string(SecurityErrorCode::kPrivateNetworkBlocked), "PrivateNetworkBlocked");
    EXPECT_EQ(to_string(SecurityErrorCode::kUrlNotAllowlisted), "UrlNotAllowlisted");
    EXPECT_EQ(to_string(SecurityErrorCode::kPolicyUnavailable), "PolicyUnavailable");
}

TEST(Types, InjectionKind_ToString) {
    EXPECT_EQ(to_string(InjectionKind::kNone), "None");
    EXPECT_EQ(to_string(InjectionKind::kSql), "Sql");
    EXPECT_EQ(to_string(InjectionKind::kCommand), "Command");
    EXPECT_EQ(to_string(InjectionKind::kPath), "Path");
    EXPECT_EQ(to_string(InjectionKind::kScript), "Script");
}

TEST(Types, FileOperation_ToString) {
    EXPECT_EQ(to_string(FileOperation::kRead), "READ");
    EXPECT_EQ(to_string(FileOperation::kWrite), "WRITE");
    EXPECT_EQ(to_string(FileOperation::kDelete), "DELETE");
    EXPECT_EQ(to_string(FileOperation::kList), "LIST");
}

TEST(Types, CategoryAndContext_ToString) {
    EXPECT_EQ(to_string(ToolCategory::kFilesystem), "filesystem");
    EXPECT_EQ(to_string(ToolCategory::kUnclassified), "unclassified");
    EXPECT_EQ(to_string(InputContext::kSqlQuery), "sql_query");
    EXPECT_EQ(to_string(InputContext::kGeneric), "generic");
}

// 기본 생성된 SecurityError 는 허용으로 오인되지 않도록 fail-close 코드를 가진다.
TEST(Types, DefaultSecurityError_IsPolicyUnavailable) {
    const SecurityError error{};
    EXPECT_EQ(error.code, SecurityErrorCode::kPolicyUnavailable);
    EXPECT_EQ(error.injection, InjectionKind::kNone);
    EXPECT_TRUE(error.message.empty());
}
