#include "Indicator.h"
#include "Utils.h"
#include <cstdlib>

namespace ioc_sweep {

std::string ProviderArgs::get(const std::string& key, const std::string& def) const {
    auto it = values_.find(key);
    if(it == values_.end() || it->second.empty()) return def;
    return it->second.front();
}

std::vector<std::string> ProviderArgs::get_list(const std::string& key) const {
    auto it = values_.find(key);
    if(it == values_.end()) return {};
    return it->second;
}

bool ProviderArgs::get_bool(const std::string& key, bool def) const {
    if(!has(key)) return def;
    std::string v = utils::to_lower(get(key));
    return v == "true" || v == "1" || v == "yes";
}

long ProviderArgs::get_long(const std::string& key, long def) const {
    if(!has(key)) return def;
    std::string v = get(key);
    char* end = nullptr;
    long out = strtol(v.c_str(), &end, 10);
    if(v.empty() || *end != '\0') return def;
    return out;
}

const char* to_string(ScopeKind k){
    switch(k){
        case ScopeKind::SystemWide: return "system";
        case ScopeKind::PerUser: return "per_user";
    }
    return "unknown";
}

const char* to_string(ProviderKind k){
    switch(k){
        case ProviderKind::ProcessPattern: return "process_pattern";
        case ProviderKind::FileExistence: return "file_existence";
        case ProviderKind::PreferenceKey: return "preference_key";
        case ProviderKind::LogPattern: return "log_pattern";
        case ProviderKind::FileContentPattern: return "file_content_pattern";
    }
    return "unknown";
}

const char* to_string(ExpectationKind k){
    switch(k){
        case ExpectationKind::MustNotExist: return "must_not_exist";
        case ExpectationKind::MustEqual: return "must_equal";
        case ExpectationKind::MustContainAll: return "must_contain_all";
    }
    return "unknown";
}

const char* to_string(RemediationKind k){
    switch(k){
        case RemediationKind::None: return "none";
        case RemediationKind::Kill: return "kill";
        case RemediationKind::Delete: return "delete";
        case RemediationKind::ResetPreference: return "reset_preference";
        case RemediationKind::Lock: return "lock";
        case RemediationKind::RestorePermissions: return "restore_permissions";
    }
    return "unknown";
}

std::optional<ScopeKind> parse_scope_kind(const std::string& s){
    if(s=="system" || s=="system_wide") return ScopeKind::SystemWide;
    if(s=="per_user" || s=="user") return ScopeKind::PerUser;
    return std::nullopt;
}

std::optional<ProviderKind> parse_provider_kind(const std::string& s){
    if(s=="process_pattern") return ProviderKind::ProcessPattern;
    if(s=="file_existence") return ProviderKind::FileExistence;
    if(s=="preference_key") return ProviderKind::PreferenceKey;
    if(s=="log_pattern") return ProviderKind::LogPattern;
    if(s=="file_content_pattern") return ProviderKind::FileContentPattern;
    return std::nullopt;
}

std::optional<ExpectationKind> parse_expectation_kind(const std::string& s){
    if(s=="must_not_exist") return ExpectationKind::MustNotExist;
    if(s=="must_equal") return ExpectationKind::MustEqual;
    if(s=="must_contain_all") return ExpectationKind::MustContainAll;
    return std::nullopt;
}

std::optional<RemediationKind> parse_remediation_kind(const std::string& s){
    if(s=="none") return RemediationKind::None;
    if(s=="kill") return RemediationKind::Kill;
    if(s=="delete") return RemediationKind::Delete;
    if(s=="reset_preference") return RemediationKind::ResetPreference;
    if(s=="lock") return RemediationKind::Lock;
    if(s=="restore_permissions") return RemediationKind::RestorePermissions;
    return std::nullopt;
}

bool remediation_compatible(RemediationKind r, ProviderKind p){
    switch(r){
        case RemediationKind::None: return true;
        case RemediationKind::Kill: return p == ProviderKind::ProcessPattern;
        case RemediationKind::Delete:
        case RemediationKind::Lock:
        case RemediationKind::RestorePermissions:
            return p == ProviderKind::FileExistence || p == ProviderKind::FileContentPattern;
        case RemediationKind::ResetPreference: return p == ProviderKind::PreferenceKey;
    }
    return false;
}

}
