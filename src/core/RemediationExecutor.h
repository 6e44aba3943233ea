#pragma once
#include "Indicator.h"
#include "Scope.h"
#include "Evidence.h"
#include "PolicyGuard.h"

namespace ioc_sweep {

class ProcessTable;
class PreferenceStore;

// Applies an indicator's fix. Targets are re-resolved at execution time, so a target that is
// already fixed (or gone) is a successful no-op. Every action is checked against the
// PolicyGuard first; a veto is Skipped. Errors become Failed, never exceptions.
class RemediationExecutor {
public:
    RemediationExecutor(const PolicyGuard* guard, ProcessTable& processes, PreferenceStore& prefs, bool dry_run);

    RemediationOutcome remediate(const IndicatorDefinition& def, const ScopeContext& scope, const Verdict& verdict);
    bool dry_run() const { return dry_run_; }

private:
    RemediationOutcome kill(const IndicatorDefinition& def);
    RemediationOutcome file_action(const IndicatorDefinition& def, const ScopeContext& scope);
    RemediationOutcome reset_preference(const IndicatorDefinition& def, const ScopeContext& scope);

    AllowAllPolicyGuard allow_all_;
    const PolicyGuard& guard_;
    ProcessTable& processes_;
    PreferenceStore& prefs_;
    bool dry_run_;
};

}
