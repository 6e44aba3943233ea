#pragma once
#include "Indicator.h"
#include "Scope.h"
#include "Evidence.h"

namespace ioc_sweep {

// Pure combination of evidence with an indicator's expectation. Never touches the host.
class RuleEvaluator {
public:
    Verdict evaluate(const IndicatorDefinition& def, const ScopeContext& scope, const Evidence& evidence) const;
};

}
