#include "RuleEvaluator.h"
#include "Utils.h"
#include <set>

namespace ioc_sweep {
namespace {

Verdict evaluate_must_equal(const Expectation& exp, const Evidence& ev){
    if(!ev.present){
        if(!exp.missing_is_violation) return Verdict::clean();
        return Verdict::violated("", "value missing, expected " + utils::join(exp.values, ","));
    }
    if(exp.set_equality){
        std::set<std::string> want(exp.values.begin(), exp.values.end());
        std::set<std::string> got(ev.values.begin(), ev.values.end());
        if(want == got) return Verdict::clean();
        return Verdict::violated(ev.observed(), "observed set differs from expected set");
    }
    const std::string& want = exp.values.front();
    if(ev.values.empty()) return Verdict::violated("", "no observed value, expected " + want);
    for(const auto& v : ev.values){
        if(v != want) return Verdict::violated(ev.observed(), "expected " + want);
    }
    return Verdict::clean();
}

Verdict evaluate_must_contain_all(const Expectation& exp, const Evidence& ev){
    if(!ev.present){
        if(!exp.missing_is_violation) return Verdict::clean();
        return Verdict::violated("", "value missing, expected to contain " + utils::join(exp.values, ","));
    }
    std::set<std::string> got(ev.values.begin(), ev.values.end());
    std::vector<std::string> missing;
    for(const auto& v : exp.values){
        if(!got.count(v)) missing.push_back(v);
    }
    if(missing.empty()) return Verdict::clean();
    return Verdict::violated(ev.observed(), "missing " + utils::join(missing, ","));
}

}

Verdict RuleEvaluator::evaluate(const IndicatorDefinition& def, const ScopeContext&, const Evidence& evidence) const {
    // Inconclusive evidence never produces a verdict that could trigger or suppress action
    if(evidence.query_failed){
        return Verdict::unknown(evidence.failure_reason.empty() ? "provider query failed" : evidence.failure_reason);
    }
    switch(def.expectation.kind){
        case ExpectationKind::MustNotExist:
            if(evidence.present) return Verdict::violated(evidence.observed(), "indicator present");
            return Verdict::clean();
        case ExpectationKind::MustEqual:
            return evaluate_must_equal(def.expectation, evidence);
        case ExpectationKind::MustContainAll:
            return evaluate_must_contain_all(def.expectation, evidence);
    }
    return Verdict::unknown("unsupported expectation");
}

}
