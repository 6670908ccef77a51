// ---------------------------------------------------------------------------
// types.cpp
//
// 공용 열거형의 문자열 변환.
// 감사 로그와 CLI 응답의 "kind" 필드에 그대로 사용되므로 값을 바꾸면
// 하위 소비자(로그 파서, 클라이언트)와의 호환성이 깨진다.
// ---------------------------------------------------------------------------

#include "common/types.hpp"

std::string_view to_string(SecurityErrorCode code) noexcept {
    switch (code) {
        case SecurityErrorCode::kPathTraversal:           return "PathTraversal";
        case SecurityErrorCode::kPathNotAbsolute:         return "PathNotAbsolute";
        case SecurityErrorCode::kPathBlocked:             return "PathBlocked";
        case SecurityErrorCode::kPathNotAllowlisted:      return "PathNotAllowlisted";
        case SecurityErrorCode::kExtensionBlocked:        return "ExtensionBlocked";
        case SecurityErrorCode::kExtensionNotAllowlisted: return "ExtensionNotAllowlisted";
        case SecurityErrorCode::kHiddenFileDenied:        return "HiddenFileDenied";
        case SecurityErrorCode::kSymlinkDenied:           return "SymlinkDenied";
        case SecurityErrorCode::kOperationNotPermitted:   return "OperationNotPermitted";
        case SecurityErrorCode::kFileTooLarge:            return "FileTooLarge";
        case SecurityErrorCode::kCanonicalizationFailed:  return "CanonicalizationFailed";
        case SecurityErrorCode::kInjectionDetected:       return "InjectionDetected";
        case SecurityErrorCode::kInvalidJsonKey:          return "InvalidJsonKey";
        case SecurityErrorCode::kInputTooLong:            return "InputTooLong";
        case SecurityErrorCode::kCommandBlocked:          return "CommandBlocked";
        case SecurityErrorCode::kCommandNotAllowlisted:   return "CommandNotAllowlisted";
        case SecurityErrorCode::kShellExecutionDenied:    return "ShellExecutionDenied";
        case SecurityErrorCode::kTooManyArguments:        return "TooManyArguments";
        case SecurityErrorCode::kArgumentTooLong:         return "ArgumentTooLong";
        case SecurityErrorCode::kArgumentBlocked:         return "ArgumentBlocked";
        case SecurityErrorCode::kArgumentNotAllowlisted:  return "ArgumentNotAllowlisted";
        case SecurityErrorCode::kInvalidUrl:              return "InvalidUrl";
        case SecurityErrorCode::kProtocolNotAllowed:      return "ProtocolNotAllowed";
        case SecurityErrorCode::kPrivateNetworkBlocked:   return "PrivateNetworkBlocked";
        case SecurityErrorCode::kLoopbackBlocked:         return "LoopbackBlocked";
        case SecurityErrorCode::kUrlBlocked:              return "UrlBlocked";
        case SecurityErrorCode::kUrlNotAllowlisted:       return "UrlNotAllowlisted";
        case SecurityErrorCode::kPolicyUnavailable:       return "PolicyUnavailable";
    }
    return "Unknown";
}

std::string_view to_string(InjectionKind kind) noexcept {
    switch (kind) {
        case InjectionKind::kNone:    return "None";
        case InjectionKind::kSql:     return "Sql";
        case InjectionKind::kCommand: return "Command";
        case InjectionKind::kPath:    return "Path";
        case InjectionKind::kScript:  return "Script";
    }
    return "None";
}

std::string_view to_string(FileOperation op) noexcept {
    switch (op) {
        case FileOperation::kRead:   return "READ";
        case FileOperation::kWrite:  return "WRITE";
        case FileOperation::kDelete: return "DELETE";
        case FileOperation::kList:   return "LIST";
    }
    return "READ";
}

std::string_view to_string(InputContext ctx) noexcept {
    switch (ctx) {
        case InputContext::kFilePath: return "file_path";
        case InputContext::kCommand:  return "command";
        case InputContext::kSqlQuery: return "sql_query";
        case InputContext::kWebUrl:   return "web_url";
        case InputContext::kGeneric:  return "generic";
    }
    return "generic";
}

std::string_view to_string(ToolCategory category) noexcept {
    switch (category) {
        case ToolCategory::kFilesystem:   return "filesystem";
        case ToolCategory::kProcess:      return "process";
        case ToolCategory::kNetwork:      return "network";
        case ToolCategory::kUnclassified: return "unclassified";
    }
    return "unclassified";
}
