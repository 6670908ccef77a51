#pragma once

// ---------------------------------------------------------------------------
// path_validator.hpp
//
// 파일시스템 경로를 정규화하고 FilesystemPolicy 에 따라 허용/거부한다.
//
// [검사 순서 — 변경 금지]
// 1. 원문에 ".." 또는 "~" 포함 → kPathTraversal (파일시스템 호출 전)
// 2. canonical 정규화 (Write 이고 대상이 없으면 부모 디렉터리 정규화 후 결합)
// 3. 절대 경로 확인
// 4. blocked_paths prefix → kPathBlocked (allowlist 보다 먼저)
// 5. allowed_paths 가 비어 있지 않고 prefix 불일치 → kPathNotAllowlisted
// 6. 확장자 (blocked → allowed 순)
// 7. 숨김 파일
// 8. 원본 경로의 심볼릭 링크 여부
// 9. 오퍼레이션 권한 (Write / Delete)
//
// [Write fallback 동치성]
// 2단계에서 어느 분기로 정규화되든 3~9단계는 같은 함수가 같은 순서로
// 수행한다. 대상 파일이 없다는 이유로 생략되는 검사는 없다.
//
// [스레드 안전성]
// 생성 후 상태를 변경하지 않으므로 concurrent 호출에 안전하다.
// validate_path 는 blocking syscall (realpath, lstat) 을 수행한다.
// 비동기 컨텍스트에서는 AsyncValidator 의 thread_pool 에서 호출할 것.
// ---------------------------------------------------------------------------

#include <cstdint>
#include <expected>
#include <filesystem>
#include <string_view>
#include <vector>

#include "common/types.hpp"
#include "policy/rule.hpp"

class PathValidator {
public:
    // 정책의 allowed/blocked 경로를 미리 정규화해 둔다.
    // 디스크에 존재하는 항목은 canonical 형태도 함께 비교 대상에 넣는다.
    explicit PathValidator(FilesystemPolicy policy);

    ~PathValidator() = default;

    PathValidator(const PathValidator&)            = delete;
    PathValidator& operator=(const PathValidator&) = delete;
    PathValidator(PathValidator&&)                 = default;
    PathValidator& operator=(PathValidator&&)      = default;

    // validate_path
    //   성공 시 정규화된 절대 경로를 반환한다.
    [[nodiscard]] std::expected<std::filesystem::path, SecurityError>
    validate_path(std::string_view path, FileOperation op) const;

    // validate_file_size
    //   max_file_size 가 설정된 경우 size 가 이를 넘으면 kFileTooLarge.
    [[nodiscard]] std::expected<void, SecurityError>
    validate_file_size(std::uint64_t size) const;

    [[nodiscard]] const FilesystemPolicy& policy() const noexcept { return policy_; }

private:
    // canonical 정규화 이후의 검사 (3~9단계)
    [[nodiscard]] std::expected<void, SecurityError>
    check_canonical(const std::filesystem::path& canonical,
                    const std::filesystem::path& original,
                    FileOperation                op) const;

    FilesystemPolicy                   policy_;
    std::vector<std::filesystem::path> allowed_roots_;
    std::vector<std::filesystem::path> blocked_roots_;
};

// path_has_prefix
//   path 의 컴포넌트가 prefix 의 컴포넌트로 시작하면 true.
//   "/etc" 는 "/etc/passwd" 의 prefix 이지만 "/etcfoo" 의 prefix 는 아니다.
//   prefix 끝의 빈 컴포넌트("/tmp/" 의 마지막)는 무시한다.
[[nodiscard]] bool path_has_prefix(const std::filesystem::path& path,
                                   const std::filesystem::path& prefix);
