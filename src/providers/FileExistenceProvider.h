#pragma once
#include "../core/EvidenceProvider.h"

namespace ioc_sweep {

// Present when the (possibly globbed) path resolves to at least one entry of the requested
// type. args.attribute selects what is observed: path (default), mode, immutable or sha256.
class FileExistenceProvider : public EvidenceProvider {
public:
    ProviderKind kind() const override { return ProviderKind::FileExistence; }
    Evidence query(const IndicatorDefinition& def, const ScopeContext& scope) override;
};

}
