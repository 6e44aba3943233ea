#pragma once
#include "../core/Scope.h"
#include <string>
#include <vector>

namespace ioc_sweep {

struct PreferenceValue {
    std::vector<std::string> values;
    bool is_array = false;
};

struct PreferenceRead {
    bool ok = true;          // false: domain exists but could not be read or parsed
    bool found = false;
    PreferenceValue value;
    std::string error;
};

class PreferenceStore {
public:
    virtual ~PreferenceStore() = default;
    virtual PreferenceRead read(const ScopeContext& scope, const std::string& domain, const std::string& key) const = 0;
    // Returns false and fills error on failure. Other keys of the domain are preserved.
    virtual bool write(const ScopeContext& scope, const std::string& domain, const std::string& key,
                       const PreferenceValue& value, std::string& error) = 0;
    virtual std::string location(const ScopeContext& scope, const std::string& domain) const = 0;
};

// One JSON object per domain: <system_dir>/<domain>.json, or <home>/<user_subdir>/<domain>.json.
class JsonPreferenceStore : public PreferenceStore {
public:
    JsonPreferenceStore(std::string system_dir, std::string user_subdir)
        : system_dir_(std::move(system_dir)), user_subdir_(std::move(user_subdir)) {}
    PreferenceRead read(const ScopeContext& scope, const std::string& domain, const std::string& key) const override;
    bool write(const ScopeContext& scope, const std::string& domain, const std::string& key,
               const PreferenceValue& value, std::string& error) override;
    std::string location(const ScopeContext& scope, const std::string& domain) const override;
private:
    std::string system_dir_;
    std::string user_subdir_;
};

}
