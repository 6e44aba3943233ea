#include "RemediationExecutor.h"
#include "Logging.h"
#include "Utils.h"
#include "../providers/ProcessTable.h"
#include "../providers/PreferenceStore.h"
#include "../providers/FileTargets.h"
#include "../providers/FileExistenceProvider.h"
#include "../providers/FileContentPatternProvider.h"
#include "../remediation/FileActions.h"
#include <csignal>
#include <set>

namespace ioc_sweep {
namespace {

// Tallies per-target results into one outcome.
struct Tally {
    std::vector<std::string> done;
    std::vector<std::string> would;
    std::vector<std::string> vetoed;
    std::vector<std::string> errors;

    RemediationOutcome outcome(const std::string& verb) const {
        if(!errors.empty()) return RemediationOutcome::failed(utils::join(errors, "; "));
        if(!would.empty()) return RemediationOutcome::would_apply("would " + verb + " " + utils::join(would, ","));
        std::string veto_note = vetoed.empty() ? "" : "; vetoed: " + utils::join(vetoed, "; ");
        if(!done.empty()) return RemediationOutcome::applied(verb + " " + utils::join(done, ",") + veto_note);
        if(!vetoed.empty()) return RemediationOutcome::skipped(utils::join(vetoed, "; "));
        return RemediationOutcome::applied("already remediated");
    }
};

const char* verb_for(RemediationKind k){
    switch(k){
        case RemediationKind::Kill: return "kill";
        case RemediationKind::Delete: return "delete";
        case RemediationKind::Lock: return "lock";
        case RemediationKind::RestorePermissions: return "chmod";
        case RemediationKind::ResetPreference: return "reset";
        case RemediationKind::None: return "none";
    }
    return "act on";
}

}

RemediationExecutor::RemediationExecutor(const PolicyGuard* guard, ProcessTable& processes, PreferenceStore& prefs, bool dry_run)
    : guard_(guard ? *guard : allow_all_), processes_(processes), prefs_(prefs), dry_run_(dry_run) {}

RemediationOutcome RemediationExecutor::remediate(const IndicatorDefinition& def, const ScopeContext& scope, const Verdict& verdict){
    if(verdict.kind != VerdictKind::Violated) return RemediationOutcome::skipped("verdict is not violated");
    try {
        switch(def.remediation.kind){
            case RemediationKind::None:
                return RemediationOutcome::skipped("no remediation configured");
            case RemediationKind::Kill:
                return kill(def);
            case RemediationKind::Delete:
            case RemediationKind::Lock:
            case RemediationKind::RestorePermissions:
                return file_action(def, scope);
            case RemediationKind::ResetPreference:
                return reset_preference(def, scope);
        }
    } catch(const std::exception& ex){
        return RemediationOutcome::failed(std::string("remediation error: ") + ex.what());
    }
    return RemediationOutcome::failed("unsupported remediation");
}

RemediationOutcome RemediationExecutor::kill(const IndicatorDefinition& def){
    auto procs = processes_.snapshot();
    if(!procs) return RemediationOutcome::failed("process list unavailable");
    auto hits = match_processes(*procs, def.args.get("pattern"), def.args.get_bool("regex"));
    Tally t;
    for(const auto& p : hits){
        std::string pid = std::to_string(p.pid);
        auto decision = guard_.check(RemediationKind::Kill, pid);
        if(!decision.allowed){ t.vetoed.push_back(decision.reason); continue; }
        if(dry_run_){ t.would.push_back(pid); continue; }
        std::string err;
        switch(processes_.send_signal(p.pid, SIGKILL, err)){
            case SignalResult::Delivered: t.done.push_back(pid); break;
            case SignalResult::NoSuchProcess: break; // exited on its own
            case SignalResult::PermissionDenied:
            case SignalResult::Error:
                t.errors.push_back("pid " + pid + ": " + err);
                break;
        }
    }
    return t.outcome("kill pid");
}

RemediationOutcome RemediationExecutor::file_action(const IndicatorDefinition& def, const ScopeContext& scope){
    // Current targets come from the same read-only provider that produced the verdict.
    Evidence current;
    if(def.provider == ProviderKind::FileContentPattern){
        FileContentPatternProvider provider;
        current = provider.query(def, scope);
    } else {
        IndicatorDefinition by_path = def;
        by_path.args.set("attribute", "path");
        FileExistenceProvider provider;
        current = provider.query(by_path, scope);
    }
    if(current.query_failed) return RemediationOutcome::failed("cannot resolve targets: " + current.failure_reason);

    const RemediationKind kind = def.remediation.kind;
    Tally t;
    for(const auto& path : current.targets){
        auto decision = guard_.check(kind, path);
        if(!decision.allowed){ t.vetoed.push_back(decision.reason); continue; }
        if(dry_run_){
            bool would = true;
            if(kind == RemediationKind::Lock){
                auto flag = read_immutable_flag(path);
                would = !flag || !*flag;
            } else if(kind == RemediationKind::RestorePermissions){
                would = mode_differs(path, def.remediation.mode, def.remediation.recursive);
            }
            if(would) t.would.push_back(path);
            continue;
        }
        ActionResult r;
        if(kind == RemediationKind::Delete) r = remove_path(path, def.remediation.recursive);
        else if(kind == RemediationKind::Lock) r = set_immutable(path);
        else r = restore_mode(path, def.remediation.mode, def.remediation.recursive);
        if(r.status == ActionStatus::Done) t.done.push_back(path);
        else if(r.status == ActionStatus::Error) t.errors.push_back(r.error);
    }
    std::string verb = verb_for(kind);
    if(kind == RemediationKind::RestorePermissions) verb += " " + utils::format_mode(def.remediation.mode);
    return t.outcome(verb);
}

RemediationOutcome RemediationExecutor::reset_preference(const IndicatorDefinition& def, const ScopeContext& scope){
    const std::string domain = def.args.get("domain");
    const std::string key = def.args.get("key");
    const std::string location = prefs_.location(scope, domain);
    auto decision = guard_.check(RemediationKind::ResetPreference, location);
    if(!decision.allowed) return RemediationOutcome::skipped(decision.reason);

    PreferenceValue want{def.remediation.values, def.remediation.write_array};
    auto current = prefs_.read(scope, domain, key);
    if(current.ok && current.found && current.value.is_array == want.is_array){
        bool same = want.is_array
            ? std::set<std::string>(current.value.values.begin(), current.value.values.end()) ==
              std::set<std::string>(want.values.begin(), want.values.end())
            : current.value.values == want.values;
        if(same) return RemediationOutcome::applied("already remediated");
    }
    std::string rendered = want.is_array ? "[" + utils::join(want.values, ",") + "]" : utils::join(want.values, ",");
    if(dry_run_) return RemediationOutcome::would_apply("would set " + domain + "." + key + " = " + rendered);
    std::string err;
    if(!prefs_.write(scope, domain, key, want, err)) return RemediationOutcome::failed(err);
    return RemediationOutcome::applied("set " + domain + "." + key + " = " + rendered);
}

}
