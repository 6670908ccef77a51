// ---------------------------------------------------------------------------
// path_validator.cpp
//
// 파일시스템 경로 검증 구현.
//
// [Fail-close 원칙]
// - 정규화 실패 (존재하지 않는 경로, 권한 없음) → 거부
// - Write 의 부모 디렉터리 정규화 실패 → 거부
// - Write fallback 은 대상이 없을 때 (ENOENT) 만. 끊어진 심볼릭 링크는
//   링크 대상 위치를 기준으로 검사한다.
// - 판정 불가 상태에서 허용을 반환하는 분기는 없다.
//
// [prefix 비교]
// 문자열 prefix 가 아니라 경로 컴포넌트 단위로 비교한다.
// 정책 경로는 생성 시 lexically_normal 형태와 (존재하면) canonical 형태를
// 모두 보관한다. 예를 들어 allowlist 에 심볼릭 링크 디렉터리를 적었을 때
// 검증 대상은 이미 링크가 해제된 canonical 경로이므로, 정책 쪽도 해제된
// 형태로 비교해야 일치한다.
//
// [알려진 한계]
// - 심볼릭 링크 검사는 원본 경로의 마지막 컴포넌트만 본다. 중간 디렉터리가
//   링크인 경우는 canonical 결과가 prefix 검사에서 걸러지는 것에 의존한다.
// - 확장자가 없는 파일은 확장자 검사를 건너뛴다.
// - 검사와 실제 파일 접근 사이의 TOCTOU 경쟁은 도구 구현 레이어 소관.
// ---------------------------------------------------------------------------

#include "validator/path_validator.hpp"

#include <algorithm>
#include <cctype>
#include <string>
#include <system_error>
#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace {

constexpr int kMaxSymlinkHops = 40;  // Linux SYMLOOP 한도

bool iequals(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) {
        return false;
    }
    return std::equal(a.begin(), a.end(), b.begin(), [](unsigned char ac, unsigned char bc) {
        return std::tolower(ac) == std::tolower(bc);
    });
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

SecurityError make_error(SecurityErrorCode code, std::string message) {
    return SecurityError{code, InjectionKind::kNone, std::move(message)};
}

// 끊어진 심볼릭 링크를 따라가 실제로 생성될 경로를 돌려준다.
// 심볼릭 링크가 아니면 인자를 그대로 돌려준다.
std::expected<fs::path, SecurityError> resolve_dangling_symlink(const fs::path& original) {
    fs::path target = original;
    for (int hops = 0;; ++hops) {
        std::error_code ec;
        const auto status = fs::symlink_status(target, ec);
        if (ec || !fs::is_symlink(status)) {
            return target;
        }
        if (hops >= kMaxSymlinkHops) {
            return std::unexpected(make_error(
                SecurityErrorCode::kCanonicalizationFailed,
                fmt::format("Too many levels of symbolic links: {}", original.string())));
        }
        const fs::path next = fs::read_symlink(target, ec);
        if (ec) {
            return std::unexpected(make_error(
                SecurityErrorCode::kCanonicalizationFailed,
                fmt::format("Failed to read symbolic link '{}': {}", target.string(), ec.message())));
        }
        target = next.is_absolute() ? next : target.parent_path() / next;
    }
}

// 정책 경로 목록을 비교용 형태로 펼친다.
std::vector<fs::path> expand_roots(const std::vector<fs::path>& entries) {
    std::vector<fs::path> roots;
    roots.reserve(entries.size() * 2);

    for (const auto& entry : entries) {
        if (entry.empty()) {
            continue;
        }
        const fs::path normal = entry.lexically_normal();
        roots.push_back(normal);

        std::error_code ec;
        const fs::path resolved = fs::canonical(entry, ec);
        if (!ec && resolved != normal) {
            roots.push_back(resolved);
        }
    }
    return roots;
}

}  // namespace

bool path_has_prefix(const fs::path& path, const fs::path& prefix) {
    auto p_it  = path.begin();
    auto pr_it = prefix.begin();

    for (; pr_it != prefix.end(); ++pr_it) {
        if (pr_it->empty()) {
            // "/tmp/" 의 마지막 빈 컴포넌트
            continue;
        }
        if (p_it == path.end() || *p_it != *pr_it) {
            return false;
        }
        ++p_it;
    }
    return true;
}

PathValidator::PathValidator(FilesystemPolicy policy)
    : policy_(std::move(policy))
    , allowed_roots_(expand_roots(policy_.allowed_paths))
    , blocked_roots_(expand_roots(policy_.blocked_paths)) {
    spdlog::debug("path_validator: initialized with {} allowed roots, {} blocked roots",
                  allowed_roots_.size(), blocked_roots_.size());
}

std::expected<fs::path, SecurityError>
PathValidator::validate_path(std::string_view path, FileOperation op) const {
    // Step 1: 어휘적 거부 — 어떤 syscall 보다 먼저
    if (path.find("..") != std::string_view::npos || path.find('~') != std::string_view::npos) {
        spdlog::debug("path_validator: traversal sequence in '{}'", path);
        return std::unexpected(make_error(
            SecurityErrorCode::kPathTraversal,
            fmt::format("Path traversal attempt detected: {}", path)));
    }

    const fs::path original{std::string(path)};

    // Step 2: canonical 정규화
    std::error_code ec;
    fs::path canonical = fs::canonical(original, ec);
    if (ec) {
        // 대상이 없는 Write 만 fallback 대상. EACCES, ELOOP 등은 그대로 실패.
        if (op != FileOperation::kWrite || ec != std::errc::no_such_file_or_directory) {
            return std::unexpected(make_error(
                SecurityErrorCode::kCanonicalizationFailed,
                fmt::format("Failed to canonicalize path '{}': {}", path, ec.message())));
        }

        auto target = resolve_dangling_symlink(original);
        if (!target) {
            return std::unexpected(std::move(target.error()));
        }

        // Write: 대상이 아직 없을 수 있으므로 부모 디렉터리를 정규화한다.
        // 끊어진 심볼릭 링크는 링크가 가리키는 실제 생성 위치를 기준으로 한다.
        const fs::path parent    = target->parent_path();
        const fs::path file_name = target->filename();
        if (parent.empty() || file_name.empty()) {
            return std::unexpected(make_error(
                SecurityErrorCode::kCanonicalizationFailed,
                fmt::format("Invalid path: no parent directory or file name: {}", path)));
        }

        std::error_code parent_ec;
        const fs::path parent_canonical = fs::canonical(parent, parent_ec);
        if (parent_ec) {
            return std::unexpected(make_error(
                SecurityErrorCode::kCanonicalizationFailed,
                fmt::format("Parent directory does not exist or is inaccessible: {}: {}",
                            parent.string(), parent_ec.message())));
        }
        canonical = parent_canonical / file_name;
    }

    // Step 3~9: 두 분기 공통
    if (auto checked = check_canonical(canonical, original, op); !checked) {
        return std::unexpected(std::move(checked.error()));
    }
    return canonical;
}

std::expected<void, SecurityError>
PathValidator::check_canonical(const fs::path& canonical,
                               const fs::path& original,
                               FileOperation   op) const {
    // Step 3: 절대 경로
    if (!canonical.is_absolute()) {
        return std::unexpected(make_error(
            SecurityErrorCode::kPathNotAbsolute,
            fmt::format("Only absolute paths are allowed: {}", canonical.string())));
    }

    // Step 4: blocklist (allowlist 보다 먼저)
    for (const auto& blocked : blocked_roots_) {
        if (path_has_prefix(canonical, blocked)) {
            return std::unexpected(make_error(
                SecurityErrorCode::kPathBlocked,
                fmt::format("Access denied: path is explicitly blocked: {}", canonical.string())));
        }
    }

    // Step 5: allowlist (비어 있으면 제한 없음)
    if (!allowed_roots_.empty()) {
        const bool is_allowed = std::any_of(
            allowed_roots_.begin(), allowed_roots_.end(),
            [&canonical](const fs::path& root) { return path_has_prefix(canonical, root); });
        if (!is_allowed) {
            return std::unexpected(make_error(
                SecurityErrorCode::kPathNotAllowlisted,
                fmt::format("Access denied: path is not in allowed directories: {}",
                            canonical.string())));
        }
    }

    // Step 6: 확장자
    const std::string extension = to_lower(canonical.extension().string());
    if (!extension.empty()) {
        const auto& blocked_exts = policy_.blocked_extensions;
        const bool  is_blocked   = std::any_of(
            blocked_exts.begin(), blocked_exts.end(),
            [&extension](const std::string& e) { return iequals(e, extension); });
        if (is_blocked) {
            return std::unexpected(make_error(
                SecurityErrorCode::kExtensionBlocked,
                fmt::format("Access denied: file extension '{}' is blocked", extension)));
        }

        if (policy_.allowed_extensions.has_value()) {
            const auto& allowed_exts = policy_.allowed_extensions.value();
            const bool  is_allowed   = std::any_of(
                allowed_exts.begin(), allowed_exts.end(),
                [&extension](const std::string& e) { return iequals(e, extension); });
            if (!is_allowed) {
                return std::unexpected(make_error(
                    SecurityErrorCode::kExtensionNotAllowlisted,
                    fmt::format("Access denied: file extension '{}' is not allowed", extension)));
            }
        }
    }

    // Step 7: 숨김 파일
    const std::string name = canonical.filename().string();
    if (!name.empty() && name.front() == '.' && !policy_.allow_hidden) {
        return std::unexpected(make_error(
            SecurityErrorCode::kHiddenFileDenied,
            "Access denied: hidden files are not allowed"));
    }

    // Step 8: 심볼릭 링크 (정규화 전 원본 경로 기준)
    if (!policy_.allow_symlinks) {
        std::error_code ec;
        const auto status = fs::symlink_status(original, ec);
        if (!ec && fs::is_symlink(status)) {
            return std::unexpected(make_error(
                SecurityErrorCode::kSymlinkDenied,
                "Access denied: symbolic links are not allowed"));
        }
    }

    // Step 9: 오퍼레이션 권한
    switch (op) {
        case FileOperation::kRead:
        case FileOperation::kList:
            break;
        case FileOperation::kWrite:
            if (!policy_.allow_write) {
                return std::unexpected(make_error(
                    SecurityErrorCode::kOperationNotPermitted,
                    "Access denied: write operations are not allowed"));
            }
            break;
        case FileOperation::kDelete:
            if (!policy_.allow_delete) {
                return std::unexpected(make_error(
                    SecurityErrorCode::kOperationNotPermitted,
                    "Access denied: delete operations are not allowed"));
            }
            break;
    }

    return {};
}

std::expected<void, SecurityError> PathValidator::validate_file_size(std::uint64_t size) const {
    if (policy_.max_file_size.has_value() && size > policy_.max_file_size.value()) {
        return std::unexpected(make_error(
            SecurityErrorCode::kFileTooLarge,
            fmt::format("File size {} exceeds maximum allowed size {}",
                        size, policy_.max_file_size.value())));
    }
    return {};
}
