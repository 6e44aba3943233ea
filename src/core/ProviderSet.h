#pragma once
#include "EvidenceProvider.h"
#include <map>

namespace ioc_sweep {

struct Config;
class ProcessTable;
class PreferenceStore;
class LogSource;

// One provider per ProviderKind. Registering a second provider for a kind replaces the first.
class ProviderSet {
public:
    void register_provider(EvidenceProviderPtr provider);
    // Wires the procfs / filesystem / JSON preference / journal backed providers.
    void register_all_default(const Config& cfg, ProcessTable& processes, PreferenceStore& prefs, LogSource& logs);
    EvidenceProvider* find(ProviderKind kind) const;
    size_t size() const { return providers_.size(); }
private:
    std::map<ProviderKind, EvidenceProviderPtr> providers_;
};

}
