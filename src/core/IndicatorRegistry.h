#pragma once
#include "Indicator.h"
#include <string>
#include <vector>
#include <unordered_map>
#include <nlohmann/json.hpp>

namespace ioc_sweep {

// Immutable set of indicator definitions. Every entry is validated on load; a bad entry
// aborts the whole load with ConfigError. There is no mutation API, reload instead.
class IndicatorRegistry {
public:
    static IndicatorRegistry load(const std::string& path);
    static IndicatorRegistry load_from_string(const std::string& text, const std::string& origin = "<memory>");

    const IndicatorDefinition& lookup(const std::string& id) const; // throws IndicatorNotFound
    bool contains(const std::string& id) const { return index_.count(id) > 0; }
    const std::vector<IndicatorDefinition>& indicators() const { return indicators_; }
    size_t size() const { return indicators_.size(); }

private:
    IndicatorRegistry() = default;
    void add(IndicatorDefinition def, const std::string& origin);

    std::vector<IndicatorDefinition> indicators_;
    std::unordered_map<std::string, size_t> index_;
};

// Canonical JSON form of a definition, as accepted by load().
nlohmann::json indicator_to_json(const IndicatorDefinition& def);

}
