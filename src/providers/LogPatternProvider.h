#pragma once
#include "../core/EvidenceProvider.h"
#include "LogSource.h"

namespace ioc_sweep {

// Counts log events in a trailing time window matching any of the configured predicates.
// Any failure of the log subsystem degrades to a failed query.
class LogPatternProvider : public EvidenceProvider {
public:
    LogPatternProvider(LogSource& source, int timeout_ms, int sample_limit)
        : source_(source), timeout_ms_(timeout_ms), sample_limit_(sample_limit) {}
    ProviderKind kind() const override { return ProviderKind::LogPattern; }
    Evidence query(const IndicatorDefinition& def, const ScopeContext& scope) override;
private:
    LogSource& source_;
    int timeout_ms_;
    int sample_limit_;
};

}
