#pragma once
#include "../core/EvidenceProvider.h"
#include "ProcessTable.h"

namespace ioc_sweep {

class ProcessPatternProvider : public EvidenceProvider {
public:
    explicit ProcessPatternProvider(const ProcessTable& table) : table_(table) {}
    ProviderKind kind() const override { return ProviderKind::ProcessPattern; }
    Evidence query(const IndicatorDefinition& def, const ScopeContext& scope) override;
private:
    const ProcessTable& table_;
};

}
