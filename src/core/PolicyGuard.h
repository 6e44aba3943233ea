#pragma once
#include "Indicator.h"
#include <string>
#include <vector>
#include <functional>

namespace ioc_sweep {

class ProcessTable;
enum class Capability;

struct PolicyDecision {
    bool allowed = true;
    std::string reason;
    static PolicyDecision allow() { return PolicyDecision{}; }
    static PolicyDecision veto(std::string why) { return PolicyDecision{false, std::move(why)}; }
};

// Host-level restrictions on remediation actions. Target is a PID for Kill and a path for
// everything else (the domain file for ResetPreference).
class PolicyGuard {
public:
    virtual ~PolicyGuard() = default;
    virtual PolicyDecision check(RemediationKind action, const std::string& target) const = 0;
};

class AllowAllPolicyGuard : public PolicyGuard {
public:
    PolicyDecision check(RemediationKind, const std::string&) const override { return PolicyDecision::allow(); }
};

// Vetoes path actions under protected prefixes, killing PID 1 / ourselves / other users'
// processes without CAP_KILL, and locking without CAP_LINUX_IMMUTABLE.
class HostPolicyGuard : public PolicyGuard {
public:
    using CapabilityProbe = std::function<bool(Capability)>;
    HostPolicyGuard(std::vector<std::string> protected_paths, const ProcessTable& processes);
    HostPolicyGuard(std::vector<std::string> protected_paths, const ProcessTable& processes, CapabilityProbe probe);
    PolicyDecision check(RemediationKind action, const std::string& target) const override;
private:
    bool is_protected(const std::string& path) const;
    std::vector<std::string> protected_paths_;
    const ProcessTable& processes_;
    CapabilityProbe probe_;
};

}
