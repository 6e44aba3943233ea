#pragma once
#include "../core/EvidenceProvider.h"
#include "PreferenceStore.h"

namespace ioc_sweep {

class PreferenceKeyProvider : public EvidenceProvider {
public:
    explicit PreferenceKeyProvider(const PreferenceStore& store) : store_(store) {}
    ProviderKind kind() const override { return ProviderKind::PreferenceKey; }
    Evidence query(const IndicatorDefinition& def, const ScopeContext& scope) override;
private:
    const PreferenceStore& store_;
};

}
