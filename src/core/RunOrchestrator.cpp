#include "RunOrchestrator.h"
#include "IndicatorRegistry.h"
#include "ProviderSet.h"
#include "RuleEvaluator.h"
#include "RemediationExecutor.h"
#include "Logging.h"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <future>
#include <stdexcept>
#include <thread>

namespace ioc_sweep {

const char* to_string(RunState s){
    switch(s){
        case RunState::Init: return "init";
        case RunState::EnumeratingScopes: return "enumerating_scopes";
        case RunState::Evaluating: return "evaluating";
        case RunState::Completed: return "completed";
    }
    return "unknown";
}

RunOptions RunOptions::from_config(const Config& cfg){
    RunOptions o;
    o.scope_filter = cfg.scope_filter;
    o.users = cfg.users;
    o.provider_timeout_ms = cfg.provider_timeout_ms;
    o.parallel = cfg.parallel;
    o.parallel_max_threads = cfg.parallel_max_threads;
    return o;
}

RunOrchestrator::RunOrchestrator(const IndicatorRegistry& registry, const ProviderSet& providers, const RuleEvaluator& evaluator,
                                 RemediationExecutor& executor, const ScopeEnumerator& scopes, RunOptions options)
    : registry_(registry), providers_(providers), evaluator_(evaluator), executor_(executor), scopes_(scopes), options_(std::move(options)) {}

RunOrchestrator::~RunOrchestrator(){
    std::lock_guard<std::mutex> lock(abandoned_mu_);
    if(!abandoned_.empty()){
        Logger::instance().debug("waiting for " + std::to_string(abandoned_.size()) + " timed out provider call(s)");
    }
    for(auto& f : abandoned_) f.wait();
}

void RunOrchestrator::transition(RunState next){
    if(static_cast<int>(next) <= static_cast<int>(state_)){
        throw std::logic_error(std::string("invalid run state transition ") + to_string(state_) + " -> " + to_string(next));
    }
    Logger::instance().trace(std::string("run state: ") + to_string(next));
    state_ = next;
}

std::vector<ScopeContext> RunOrchestrator::enumerate_scopes() const {
    if(options_.scope_filter == ScopeFilter::SystemOnly) return {};
    auto scopes = scopes_.user_scopes();
    if(!options_.users.empty()){
        scopes.erase(std::remove_if(scopes.begin(), scopes.end(), [&](const ScopeContext& s){
            return std::find(options_.users.begin(), options_.users.end(), s.user) == options_.users.end();
        }), scopes.end());
    }
    return scopes;
}

std::vector<PlannedCheck> RunOrchestrator::plan(const std::vector<ScopeContext>& user_scopes) const {
    std::vector<PlannedCheck> out;
    if(options_.scope_filter != ScopeFilter::SystemOnly){
        for(const auto& scope : user_scopes){
            for(const auto& def : registry_.indicators()){
                if(def.scope == ScopeKind::PerUser) out.push_back(PlannedCheck{&def, scope});
            }
        }
    }
    if(options_.scope_filter != ScopeFilter::UsersOnly){
        auto system = ScopeContext::system();
        for(const auto& def : registry_.indicators()){
            if(def.scope == ScopeKind::SystemWide) out.push_back(PlannedCheck{&def, system});
        }
    }
    return out;
}

RunOrchestrator::Gathered RunOrchestrator::gather(const PlannedCheck& check) const {
    Gathered g;
    const auto& def = *check.indicator;
    EvidenceProvider* provider = providers_.find(def.provider);
    if(!provider){
        g.evidence = Evidence::failed(std::string("no provider registered for ") + to_string(def.provider));
        return g;
    }
    auto started = std::chrono::steady_clock::now();
    auto elapsed = [&]{
        return static_cast<long>(std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started).count());
    };
    const IndicatorDefinition* def_ptr = &def;
    ScopeContext scope = check.scope;
    auto call = [provider, def_ptr, scope]() -> Evidence {
        try {
            return provider->query(*def_ptr, scope);
        } catch(const std::exception& ex){
            return Evidence::failed(std::string("provider error: ") + ex.what());
        } catch(...){
            return Evidence::failed("provider error: non-standard exception");
        }
    };
    if(options_.provider_timeout_ms <= 0){
        g.evidence = call();
        g.elapsed_ms = elapsed();
        return g;
    }
    auto pending = std::async(std::launch::async, call);
    if(pending.wait_for(std::chrono::milliseconds(options_.provider_timeout_ms)) == std::future_status::ready){
        g.evidence = pending.get();
    } else {
        g.evidence = Evidence::failed("provider timed out after " + std::to_string(options_.provider_timeout_ms) + "ms");
        std::lock_guard<std::mutex> lock(abandoned_mu_);
        abandoned_.push_back(std::move(pending));
    }
    g.elapsed_ms = elapsed();
    return g;
}

std::vector<RunOrchestrator::Gathered> RunOrchestrator::gather_all(const std::vector<PlannedCheck>& checks) const {
    std::vector<Gathered> out(checks.size());
    size_t threads = options_.parallel_max_threads > 0 ? static_cast<size_t>(options_.parallel_max_threads)
                                                       : std::max(1u, std::thread::hardware_concurrency());
    threads = std::min(threads, checks.size());
    if(threads <= 1){
        for(size_t i = 0; i < checks.size(); ++i) out[i] = gather(checks[i]);
        return out;
    }
    Logger::instance().debug("gathering evidence with " + std::to_string(threads) + " threads");
    std::atomic<size_t> next{0};
    std::vector<std::thread> workers;
    workers.reserve(threads);
    for(size_t t = 0; t < threads; ++t){
        workers.emplace_back([&]{
            for(size_t i = next++; i < checks.size(); i = next++) out[i] = gather(checks[i]);
        });
    }
    for(auto& w : workers) w.join();
    return out;
}

RunRecord RunOrchestrator::finish(const PlannedCheck& check, Gathered gathered){
    auto& log = Logger::instance();
    const auto& def = *check.indicator;
    auto started = std::chrono::steady_clock::now();

    RunRecord rec;
    rec.indicator_id = def.id;
    rec.severity = def.severity;
    rec.description = def.description;
    rec.scope = check.scope;
    rec.evidence = gathered.evidence.metadata;
    rec.targets = gathered.evidence.targets;

    if(gathered.evidence.query_failed){
        log.warn(def.id + " [" + check.scope.label() + "] query failed: " + gathered.evidence.failure_reason);
    }
    try {
        rec.verdict = evaluator_.evaluate(def, check.scope, gathered.evidence);
    } catch(const std::exception& ex){
        rec.verdict = Verdict::unknown(std::string("evaluation error: ") + ex.what());
    }

    if(rec.verdict.kind == VerdictKind::Violated){
        log.warn(def.id + " [" + check.scope.label() + "] violated: " + rec.verdict.observed);
        if(def.remediation.kind != RemediationKind::None){
            rec.action = executor_.remediate(def, check.scope, rec.verdict);
            std::string line = def.id + " [" + check.scope.label() + "] " + to_string(rec.action->kind) +
                               (rec.action->detail.empty() ? "" : ": " + rec.action->detail);
            if(rec.action->kind == OutcomeKind::Failed) log.warn(line); else log.info(line);
        }
    } else {
        log.debug(def.id + " [" + check.scope.label() + "] " + to_string(rec.verdict.kind));
    }
    rec.duration_ms = gathered.elapsed_ms + static_cast<long>(std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started).count());
    return rec;
}

RunReport RunOrchestrator::run(){
    if(state_ != RunState::Init) throw std::logic_error("run orchestrator already used");
    RunReport report(executor_.dry_run());

    transition(RunState::EnumeratingScopes);
    auto user_scopes = enumerate_scopes();
    Logger::instance().info("discovered " + std::to_string(user_scopes.size()) + " user scope(s)");
    for(const auto& s : user_scopes) Logger::instance().debug("scope " + s.label() + " home=" + s.home);

    transition(RunState::Evaluating);
    auto checks = plan(user_scopes);
    if(options_.parallel && checks.size() > 1){
        // Read-only queries fan out; remediation stays on this thread in plan order.
        auto gathered = gather_all(checks);
        for(size_t i = 0; i < checks.size(); ++i) report.add(finish(checks[i], std::move(gathered[i])));
    } else {
        for(const auto& check : checks) report.add(finish(check, gather(check)));
    }

    transition(RunState::Completed);
    report.seal();
    return report;
}

}
