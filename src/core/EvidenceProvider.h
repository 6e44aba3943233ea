#pragma once
#include "Indicator.h"
#include "Scope.h"
#include "Evidence.h"
#include <memory>
#include <string>

namespace ioc_sweep {

// Read-only view of one kind of host state. Implementations must not mutate anything.
class EvidenceProvider {
public:
    virtual ~EvidenceProvider() = default;
    virtual ProviderKind kind() const = 0;
    virtual std::string name() const { return to_string(kind()); }
    virtual Evidence query(const IndicatorDefinition& def, const ScopeContext& scope) = 0;
};

using EvidenceProviderPtr = std::unique_ptr<EvidenceProvider>;

}
