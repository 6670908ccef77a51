#pragma once

// ---------------------------------------------------------------------------
// validator_registry.hpp
//
// 서버별 SecurityValidator 를 보관하고 정책을 원자적으로 교체한다.
//
// [Hot Swap 설계]
// - default validator 와 서버별 validator 를 하나의 불변 Snapshot 에 담는다.
// - Snapshot 은 std::atomic<std::shared_ptr<const Snapshot>> 로 보관한다.
//   검증 경로는 load 한 번으로 일관된 스냅샷을 얻고, 진행 중인 검증은
//   교체 이후에도 자신이 얻은 스냅샷(validator)으로 끝까지 수행된다.
// - 쓰기 경로 (reload / set / remove) 는 writer_mutex_ 로 직렬화한다.
//   read-copy-update 이므로 동시 쓰기 간 갱신 유실이 없어야 하기 때문이다.
//
// [Fail-close]
// default validator 가 없는 레지스트리 (기본 생성, 또는 로드 실패로 한 번도
// reload 되지 않음) 는 등록되지 않은 서버의 모든 호출을 kPolicyUnavailable 로 거부한다.
// 환경변수 정제는 빈 맵을 반환한다.
// ---------------------------------------------------------------------------

#include <atomic>
#include <expected>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "common/types.hpp"
#include "policy/policy_loader.hpp"
#include "policy/rule.hpp"
#include "sanitizer/env_sanitizer.hpp"
#include "stats/validation_stats.hpp"
#include "validator/security_validator.hpp"

namespace spdlog {
class logger;
}

class ValidatorRegistry {
public:
    // audit_sink: 모든 validator 가 공유하는 감사 로그 대상 (nullptr = spdlog 기본)
    explicit ValidatorRegistry(std::shared_ptr<spdlog::logger> audit_sink = nullptr);

    ~ValidatorRegistry() = default;

    ValidatorRegistry(const ValidatorRegistry&)            = delete;
    ValidatorRegistry& operator=(const ValidatorRegistry&) = delete;
    ValidatorRegistry(ValidatorRegistry&&)                 = delete;
    ValidatorRegistry& operator=(ValidatorRegistry&&)      = delete;

    // reload
    //   GateConfig 전체로 스냅샷을 새로 만든다. 기존 서버별 정책은 모두 대체된다.
    void reload(const GateConfig& config);

    void set_default_policy(SecurityPolicy policy);
    void set_server_policy(const std::string& server_id, SecurityPolicy policy);

    // 등록되어 있지 않으면 false
    bool remove_server_policy(const std::string& server_id);

    // validator_for
    //   서버별 validator 가 없으면 default validator.
    //   둘 다 없으면 nullptr (호출자는 거부해야 한다).
    [[nodiscard]] std::shared_ptr<const SecurityValidator>
    validator_for(std::string_view server_id) const;

    // context.server_id 로 validator 를 선택해 검증한다.
    [[nodiscard]] std::expected<nlohmann::json, SecurityError>
    validate_tool_call(std::string_view       tool_name,
                       const nlohmann::json&  arguments,
                       const SecurityContext& context) const;

    [[nodiscard]] EnvMap sanitize_environment(std::string_view server_id, const EnvMap& env) const;

    [[nodiscard]] bool has_default_policy() const;

    [[nodiscard]] ValidationStatsSnapshot stats() const noexcept { return stats_->snapshot(); }

    [[nodiscard]] const std::shared_ptr<ValidationStats>& shared_stats() const noexcept {
        return stats_;
    }

private:
    struct Snapshot {
        std::shared_ptr<const SecurityValidator>                                  default_validator;
        std::map<std::string, std::shared_ptr<const SecurityValidator>, std::less<>> servers;
    };

    [[nodiscard]] std::shared_ptr<const SecurityValidator> make_validator(SecurityPolicy policy) const;

    std::shared_ptr<spdlog::logger>                audit_sink_;
    std::shared_ptr<ValidationStats>               stats_;
    std::atomic<std::shared_ptr<const Snapshot>>   snapshot_;
    std::mutex                                     writer_mutex_;
};
