#pragma once
#include "Config.h"
#include "Report.h"
#include "Scope.h"
#include <future>
#include <mutex>
#include <string>
#include <vector>

namespace ioc_sweep {

class IndicatorRegistry;
class ProviderSet;
class RemediationExecutor;
class RuleEvaluator;

enum class RunState { Init, EnumeratingScopes, Evaluating, Completed };
const char* to_string(RunState s);

struct RunOptions {
    ScopeFilter scope_filter = ScopeFilter::All;
    std::vector<std::string> users;    // restricts per-user scopes when non-empty
    int provider_timeout_ms = 10000;
    bool parallel = false;             // evidence gathering only
    int parallel_max_threads = 0;

    static RunOptions from_config(const Config& cfg);
};

// One (indicator, scope) pair of the evaluation plan.
struct PlannedCheck {
    const IndicatorDefinition* indicator = nullptr;
    ScopeContext scope;
};

// Drives a single run: discover scopes, then query -> evaluate -> maybe remediate for every
// planned pair, in plan order. A failing indicator only affects its own record.
// An orchestrator runs once; states only move forward.
class RunOrchestrator {
public:
    RunOrchestrator(const IndicatorRegistry& registry, const ProviderSet& providers, const RuleEvaluator& evaluator,
                    RemediationExecutor& executor, const ScopeEnumerator& scopes, RunOptions options);
    // Waits for provider calls that were abandoned after their timeout.
    ~RunOrchestrator();
    RunOrchestrator(const RunOrchestrator&) = delete;
    RunOrchestrator& operator=(const RunOrchestrator&) = delete;

    RunReport run();
    RunState state() const { return state_; }

    // Per-user indicators for every user scope (in user order), then system indicators.
    std::vector<PlannedCheck> plan(const std::vector<ScopeContext>& user_scopes) const;

private:
    struct Gathered {
        Evidence evidence;
        long elapsed_ms = 0;
    };

    void transition(RunState next);
    std::vector<ScopeContext> enumerate_scopes() const;
    Gathered gather(const PlannedCheck& check) const;
    std::vector<Gathered> gather_all(const std::vector<PlannedCheck>& checks) const;
    RunRecord finish(const PlannedCheck& check, Gathered gathered);

    const IndicatorRegistry& registry_;
    const ProviderSet& providers_;
    const RuleEvaluator& evaluator_;
    RemediationExecutor& executor_;
    const ScopeEnumerator& scopes_;
    RunOptions options_;
    RunState state_ = RunState::Init;
    mutable std::mutex abandoned_mu_;
    mutable std::vector<std::future<Evidence>> abandoned_;
};

}
