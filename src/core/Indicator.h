#pragma once
#include <string>
#include <vector>
#include <map>
#include <optional>

namespace ioc_sweep {

enum class ScopeKind { SystemWide, PerUser };

enum class ProviderKind { ProcessPattern, FileExistence, PreferenceKey, LogPattern, FileContentPattern };

enum class ExpectationKind { MustNotExist, MustEqual, MustContainAll };

enum class RemediationKind { None, Kill, Delete, ResetPreference, Lock, RestorePermissions };

// Provider-specific parameters. Scalars are stored as one-element lists.
class ProviderArgs {
public:
    void set(const std::string& key, std::string value) { values_[key] = {std::move(value)}; }
    void set_list(const std::string& key, std::vector<std::string> values) { values_[key] = std::move(values); }
    bool has(const std::string& key) const { return values_.count(key) > 0; }
    std::string get(const std::string& key, const std::string& def = "") const;
    std::vector<std::string> get_list(const std::string& key) const;
    bool get_bool(const std::string& key, bool def = false) const;
    long get_long(const std::string& key, long def) const;
    const std::map<std::string, std::vector<std::string>>& all() const { return values_; }
private:
    std::map<std::string, std::vector<std::string>> values_;
};

struct Expectation {
    ExpectationKind kind = ExpectationKind::MustNotExist;
    std::vector<std::string> values;   // MustEqual: one value, or a set compared order-independently
    bool set_equality = false;         // MustEqual declared with "values"
    bool missing_is_violation = true;  // Absent evidence under MustEqual / MustContainAll
};

struct Remediation {
    RemediationKind kind = RemediationKind::None;
    std::vector<std::string> values;   // ResetPreference payload
    bool write_array = false;          // ResetPreference declared with "values"
    unsigned mode = 0;                 // RestorePermissions
    bool recursive = false;            // RestorePermissions / Delete on directories
};

struct IndicatorDefinition {
    std::string id;
    std::string description;
    std::string severity = "medium";
    ScopeKind scope = ScopeKind::SystemWide;
    ProviderKind provider = ProviderKind::FileExistence;
    ProviderArgs args;
    Expectation expectation;
    Remediation remediation;
};

const char* to_string(ScopeKind k);
const char* to_string(ProviderKind k);
const char* to_string(ExpectationKind k);
const char* to_string(RemediationKind k);

std::optional<ScopeKind> parse_scope_kind(const std::string& s);
std::optional<ProviderKind> parse_provider_kind(const std::string& s);
std::optional<ExpectationKind> parse_expectation_kind(const std::string& s);
std::optional<RemediationKind> parse_remediation_kind(const std::string& s);

// True when the remediation can act on the evidence this provider produces.
bool remediation_compatible(RemediationKind r, ProviderKind p);

}
