// ---------------------------------------------------------------------------
// presets.cpp
//
// 기본 제공 보안 정책 3종 구현.
//
// [유지보수 주의]
// 각 함수는 모든 필드를 직접 채운다. 공통 값이 같아 보여도 다른 preset 을
// 복제한 뒤 수정하는 방식으로 바꾸지 말 것. 한 preset 의 변경이 다른 preset 에
// 조용히 전파되는 결합이 생긴다.
//
// [Windows 경로]
// 정책 파일은 플랫폼 간 공유되므로 Windows 경로도 함께 둔다.
// Linux 에서는 절대 경로가 아니므로 어떤 정규화 경로와도 일치하지 않는다.
// ---------------------------------------------------------------------------

#include "policy/presets.hpp"

#include <algorithm>
#include <cctype>
#include <string>

SecurityPolicy make_restrictive_policy() {
    SecurityPolicy policy{};
    policy.id          = "restrictive";
    policy.description = "Highly restrictive policy for untrusted servers";

    // 파일시스템: allowlist 없음, 시스템 디렉터리 차단, 읽기 전용
    policy.filesystem.allowed_paths = {};
    policy.filesystem.blocked_paths = {
        "/etc", "/sys", "/proc", "C:\\Windows", "C:\\Program Files",
    };
    policy.filesystem.allowed_extensions = std::vector<std::string>{".txt", ".json", ".md"};
    policy.filesystem.blocked_extensions = {
        ".exe", ".dll", ".so", ".dylib", ".sh", ".ps1", ".bat", ".cmd",
    };
    policy.filesystem.max_file_size  = 10ULL * 1024 * 1024;  // 10MB
    policy.filesystem.allow_hidden   = false;
    policy.filesystem.allow_symlinks = false;
    policy.filesystem.allow_write    = false;
    policy.filesystem.allow_delete   = false;

    // 프로세스: allowlist 비어 있음 + 셸 금지
    policy.process.allowed_commands      = {};
    policy.process.blocked_commands      = {"rm", "del", "format", "sudo", "su", "chmod", "chown"};
    policy.process.allowed_args_patterns = {};
    policy.process.blocked_args_patterns = {R"(.*[;&|`$].*)", R"(.*\.\..*)"};
    policy.process.max_args              = 10;
    policy.process.max_arg_length        = 1000;
    policy.process.allow_shell           = false;

    // 네트워크: HTTPS 만
    policy.network.allowed_urls      = {};
    policy.network.blocked_urls      = {};
    policy.network.allowed_protocols = {"https"};
    policy.network.allowed_ports     = std::vector<std::uint16_t>{443, 8443};
    policy.network.block_private_ips = true;
    policy.network.block_loopback    = true;

    // 환경변수: 최소 allowlist + 로더 하이재킹 변수 차단
    policy.environment.allowed_vars      = {"PATH", "HOME", "USER", "LANG", "TZ"};
    policy.environment.blocked_vars      = {"LD_PRELOAD", "LD_LIBRARY_PATH", "DYLD_INSERT_LIBRARIES"};
    policy.environment.sanitize_vars     = {};
    policy.environment.allow_passthrough = false;

    policy.rate_limits.max_requests_per_minute = 60;
    policy.rate_limits.max_concurrent          = 5;
    policy.rate_limits.max_total_operations    = 1000;

    policy.audit.log_all_operations   = false;
    policy.audit.log_failures         = true;
    policy.audit.log_sensitive_access = true;
    policy.audit.include_arguments    = false;

    policy.strict_mode = true;
    return policy;
}

SecurityPolicy make_moderate_policy() {
    SecurityPolicy policy{};
    policy.id          = "moderate";
    policy.description = "Moderate security policy with reasonable restrictions";

    // 파일시스템: 쓰기 허용, 삭제는 여전히 금지
    policy.filesystem.allowed_paths = {};
    policy.filesystem.blocked_paths = {
        "/etc", "/sys", "/proc", "C:\\Windows", "C:\\Program Files",
    };
    policy.filesystem.allowed_extensions = std::vector<std::string>{".txt", ".json", ".md"};
    policy.filesystem.blocked_extensions = {
        ".exe", ".dll", ".so", ".dylib", ".sh", ".ps1", ".bat", ".cmd",
    };
    policy.filesystem.max_file_size  = 100ULL * 1024 * 1024;  // 100MB
    policy.filesystem.allow_hidden   = false;
    policy.filesystem.allow_symlinks = false;
    policy.filesystem.allow_write    = true;
    policy.filesystem.allow_delete   = false;

    // 프로세스: 읽기 계열 명령만 허용
    policy.process.allowed_commands      = {"echo", "cat", "ls", "dir", "grep", "find"};
    policy.process.blocked_commands      = {"rm", "del", "format", "sudo", "su", "chmod", "chown"};
    policy.process.allowed_args_patterns = {};
    policy.process.blocked_args_patterns = {R"(.*[;&|`$].*)", R"(.*\.\..*)"};
    policy.process.max_args              = 10;
    policy.process.max_arg_length        = 1000;
    policy.process.allow_shell           = false;

    // 네트워크: HTTP 추가
    policy.network.allowed_urls      = {};
    policy.network.blocked_urls      = {};
    policy.network.allowed_protocols = {"https", "http"};
    policy.network.allowed_ports     = std::vector<std::uint16_t>{80, 443, 8080, 8443};
    policy.network.block_private_ips = true;
    policy.network.block_loopback    = true;

    policy.environment.allowed_vars      = {"PATH", "HOME", "USER", "LANG", "TZ"};
    policy.environment.blocked_vars      = {"LD_PRELOAD", "LD_LIBRARY_PATH", "DYLD_INSERT_LIBRARIES"};
    policy.environment.sanitize_vars     = {};
    policy.environment.allow_passthrough = false;

    policy.rate_limits.max_requests_per_minute = 300;
    policy.rate_limits.max_concurrent          = 10;
    policy.rate_limits.max_total_operations    = 1000;

    policy.audit.log_all_operations   = false;
    policy.audit.log_failures         = true;
    policy.audit.log_sensitive_access = true;
    policy.audit.include_arguments    = false;

    policy.strict_mode = true;
    return policy;
}

SecurityPolicy make_permissive_policy() {
    SecurityPolicy policy{};
    policy.id          = "permissive";
    policy.description = "Permissive policy for trusted servers";

    // 파일시스템: 자격 증명 파일만 차단
    policy.filesystem.allowed_paths = {};
    policy.filesystem.blocked_paths = {
        "/etc/shadow", "/etc/passwd", "C:\\Windows\\System32\\config",
    };
    policy.filesystem.allowed_extensions = std::nullopt;
    policy.filesystem.blocked_extensions = {};
    policy.filesystem.max_file_size      = std::nullopt;
    policy.filesystem.allow_hidden       = true;
    policy.filesystem.allow_symlinks     = true;
    policy.filesystem.allow_write        = true;
    policy.filesystem.allow_delete       = true;

    policy.process.allowed_commands      = {};
    policy.process.blocked_commands      = {"rm -rf /", "format c:"};
    policy.process.allowed_args_patterns = {};
    policy.process.blocked_args_patterns = {};
    policy.process.max_args              = std::nullopt;
    policy.process.max_arg_length        = std::nullopt;
    policy.process.allow_shell           = true;

    policy.network.allowed_urls      = {};
    policy.network.blocked_urls      = {};
    policy.network.allowed_protocols = {};
    policy.network.allowed_ports     = std::nullopt;
    policy.network.block_private_ips = false;
    policy.network.block_loopback    = false;

    policy.environment.allowed_vars      = {};
    policy.environment.blocked_vars      = {"LD_PRELOAD"};
    policy.environment.sanitize_vars     = {};
    policy.environment.allow_passthrough = true;

    policy.rate_limits.max_requests_per_minute = std::nullopt;
    policy.rate_limits.max_concurrent          = 50;
    policy.rate_limits.max_total_operations    = std::nullopt;

    policy.audit.log_all_operations   = false;
    policy.audit.log_failures         = true;
    policy.audit.log_sensitive_access = false;
    policy.audit.include_arguments    = false;

    policy.strict_mode = false;
    return policy;
}

std::optional<SecurityPolicy> preset_by_name(std::string_view name) {
    std::string lowered(name);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowered == "restrictive") {
        return make_restrictive_policy();
    }
    if (lowered == "moderate") {
        return make_moderate_policy();
    }
    if (lowered == "permissive") {
        return make_permissive_policy();
    }
    return std::nullopt;
}
