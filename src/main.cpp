#include "core/ArgumentParser.h"
#include "core/ConfigValidator.h"
#include "core/Config.h"
#include "core/Errors.h"
#include "core/IndicatorRegistry.h"
#include "core/Logging.h"
#include "core/PolicyGuard.h"
#include "core/Privilege.h"
#include "core/ProviderSet.h"
#include "core/RemediationExecutor.h"
#include "core/ReportSink.h"
#include "core/RuleEvaluator.h"
#include "core/RunOrchestrator.h"
#include "core/Scope.h"
#include "providers/LogSource.h"
#include "providers/PreferenceStore.h"
#include "providers/ProcessTable.h"
#include <iostream>
#include <optional>
#include <vector>

using namespace ioc_sweep;

static void list_indicators(const IndicatorRegistry& registry){
    for(const auto& def : registry.indicators()){
        std::cout << def.id << "\t" << to_string(def.scope) << "\t" << to_string(def.provider) << "\t"
                  << to_string(def.expectation.kind) << "\t" << to_string(def.remediation.kind) << "\t"
                  << def.severity << "\t" << def.description << "\n";
    }
}

int main(int argc, char** argv) {
    Logger::instance().set_level(LogLevel::Info);
    Config cfg;
    ArgumentParser parser;
    if(!parser.parse(argc, argv, cfg)){
        if(parser.exit_code() != 0){
            std::cerr << parser.error() << "\n";
            parser.print_help(std::cerr);
        }
        return parser.exit_code();
    }
    ConfigValidator validator;
    if(!validator.validate(cfg)){
        std::cerr << validator.error() << "\n";
        return 2;
    }
    LogLevel lvl = LogLevel::Info;
    if(parse_log_level(cfg.log_level, lvl)) Logger::instance().set_level(lvl);
    set_config(cfg);
    const Config& active = config();

    // Registry load failure is the only fatal error of a run.
    std::optional<IndicatorRegistry> loaded;
    try {
        loaded = IndicatorRegistry::load(active.indicator_file);
    } catch(const ConfigError& ex){
        Logger::instance().error(ex.what());
        return 2;
    }
    const IndicatorRegistry& registry = *loaded;
    Logger::instance().info("loaded " + std::to_string(registry.size()) + " indicator(s) from " + active.indicator_file);

    if(active.validate_only){
        std::cout << "ok: " << registry.size() << " indicator(s)\n";
        return 0;
    }
    if(active.list_only){
        list_indicators(registry);
        return 0;
    }
    if(!active.show_id.empty()){
        try {
            std::cout << indicator_to_json(registry.lookup(active.show_id)).dump(2) << "\n";
        } catch(const IndicatorNotFound& ex){
            std::cerr << ex.what() << "\n";
            return 2;
        }
        return 0;
    }

    if(active.drop_priv){ drop_capabilities(active.keep_cap_dac); }
    if(active.seccomp){
        if(!apply_dry_run_seccomp_profile()){
            Logger::instance().error(std::string("Failed to apply seccomp profile") + (active.seccomp_strict ? "" : " (continuing)"));
            if(active.seccomp_strict) return 4;
        }
    }

    ProcfsProcessTable processes(active.proc_root);
    JsonPreferenceStore prefs(active.system_preferences_dir, active.user_preferences_subdir);
    JournalLogSource logs(active.journal_binary);

    ProviderSet providers;
    providers.register_all_default(active, processes, prefs, logs);

    HostPolicyGuard guard(active.protected_paths, processes);
    RemediationExecutor executor(&guard, processes, prefs, active.dry_run);
    RuleEvaluator evaluator;
    PasswdAccountDirectory accounts;
    ScopeEnumerator scopes(active.home_root, active.skip_accounts, accounts);

    RunOrchestrator orchestrator(registry, providers, evaluator, executor, scopes, RunOptions::from_config(active));
    if(active.dry_run) Logger::instance().info("dry run: no changes will be made");
    RunReport report = orchestrator.run();

    std::vector<ReportSinkPtr> sinks;
    sinks.push_back(std::make_unique<LogReportSink>());
    sinks.push_back(std::make_unique<JsonReportSink>(active.output_file, active.pretty));
    bool delivered = true;
    for(auto& sink : sinks){
        if(!sink->accept(report)){
            Logger::instance().error("report sink '" + sink->name() + "' failed");
            delivered = false;
        }
    }
    int code = report.exit_code();
    if(!delivered && code == 0) code = 1;
    return code;
}
