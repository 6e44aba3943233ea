#pragma once
#include "../core/EvidenceProvider.h"

namespace ioc_sweep {

// Searches the files behind args.path for args.pattern. Absent when no file exists or none
// matches; an existing file that cannot be read fails the query.
class FileContentPatternProvider : public EvidenceProvider {
public:
    ProviderKind kind() const override { return ProviderKind::FileContentPattern; }
    Evidence query(const IndicatorDefinition& def, const ScopeContext& scope) override;
};

}
