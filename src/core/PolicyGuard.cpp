#include "PolicyGuard.h"
#include "Privilege.h"
#include "Utils.h"
#include "../providers/ProcessTable.h"
#include <unistd.h>

namespace ioc_sweep {

HostPolicyGuard::HostPolicyGuard(std::vector<std::string> protected_paths, const ProcessTable& processes)
    : HostPolicyGuard(std::move(protected_paths), processes, [](Capability c){ return has_capability(c); }) {}

HostPolicyGuard::HostPolicyGuard(std::vector<std::string> protected_paths, const ProcessTable& processes, CapabilityProbe probe)
    : protected_paths_(std::move(protected_paths)), processes_(processes), probe_(std::move(probe)) {
    for(auto& p : protected_paths_){
        while(p.size() > 1 && p.back() == '/') p.pop_back();
    }
}

bool HostPolicyGuard::is_protected(const std::string& path) const {
    for(const auto& prefix : protected_paths_){
        if(prefix.empty()) continue;
        if(prefix == "/") return true;
        if(path == prefix) return true;
        if(path.size() > prefix.size() && path.compare(0, prefix.size(), prefix) == 0 && path[prefix.size()] == '/') return true;
    }
    return false;
}

PolicyDecision HostPolicyGuard::check(RemediationKind action, const std::string& target) const {
    switch(action){
        case RemediationKind::None:
            return PolicyDecision::allow();
        case RemediationKind::Kill: {
            int pid = 0;
            if(!utils::is_valid_pid(target.c_str(), &pid)) return PolicyDecision::veto("invalid pid '" + target + "'");
            if(pid == 1) return PolicyDecision::veto("refusing to signal init");
            if(pid == static_cast<int>(getpid())) return PolicyDecision::veto("refusing to signal ourselves");
            auto uid = processes_.owner(pid);
            if(uid && *uid != geteuid() && !probe_(Capability::Kill))
                return PolicyDecision::veto("process " + target + " belongs to uid " + std::to_string(*uid) + " and CAP_KILL is not held");
            return PolicyDecision::allow();
        }
        case RemediationKind::Lock:
            if(is_protected(target)) return PolicyDecision::veto(target + " is under a protected path");
            if(!probe_(Capability::LinuxImmutable)) return PolicyDecision::veto("CAP_LINUX_IMMUTABLE is not held");
            return PolicyDecision::allow();
        case RemediationKind::Delete:
        case RemediationKind::RestorePermissions:
        case RemediationKind::ResetPreference:
            if(is_protected(target)) return PolicyDecision::veto(target + " is under a protected path");
            return PolicyDecision::allow();
    }
    return PolicyDecision::allow();
}

}
