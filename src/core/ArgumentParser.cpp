#include "ArgumentParser.h"
#include "Utils.h"
#include "BuildInfo.h"
#include <iostream>
#include <stdexcept>

namespace ioc_sweep {
namespace {

ScopeFilter parse_scope_filter(const std::string& v){
    if(v == "all") return ScopeFilter::All;
    if(v == "system") return ScopeFilter::SystemOnly;
    if(v == "user" || v == "users") return ScopeFilter::UsersOnly;
    throw std::invalid_argument("expected all|system|user");
}

int parse_int(const std::string& v){
    size_t used = 0;
    int n = std::stoi(v, &used);
    if(used != v.size()) throw std::invalid_argument("trailing characters");
    return n;
}

}

ArgumentParser::ArgumentParser(){
    using K = ArgKind;
    specs_ = {
        {"--config", K::String, "Indicator definition file (JSON)", [](Config& c, const std::string& v){ c.indicator_file = v; }},
        {"--scope", K::String, "all|system|user", [](Config& c, const std::string& v){ c.scope_filter = parse_scope_filter(v); }},
        {"--users", K::CSV, "Only evaluate these user accounts", [](Config& c, const std::string& v){ c.users = utils::split_csv(v); }},
        {"--dry-run", K::None, "Report what would be remediated without changing anything", [](Config& c, const std::string&){ c.dry_run = true; }},
        {"--output", K::String, "Write JSON report to FILE (default stdout)", [](Config& c, const std::string& v){ c.output_file = v; }},
        {"--pretty", K::None, "Pretty-print JSON", [](Config& c, const std::string&){ c.pretty = true; }},
        {"--home-root", K::String, "Directory holding user homes", [](Config& c, const std::string& v){ c.home_root = v; }},
        {"--skip-accounts", K::CSV, "Home directory names never treated as users", [](Config& c, const std::string& v){ c.skip_accounts = utils::split_csv(v); }},
        {"--proc-root", K::String, "procfs mount point", [](Config& c, const std::string& v){ c.proc_root = v; }},
        {"--system-prefs-dir", K::String, "System preference domain directory", [](Config& c, const std::string& v){ c.system_preferences_dir = v; }},
        {"--user-prefs-subdir", K::String, "Preference directory relative to each home", [](Config& c, const std::string& v){ c.user_preferences_subdir = v; }},
        {"--journal-binary", K::String, "journalctl executable", [](Config& c, const std::string& v){ c.journal_binary = v; }},
        {"--provider-timeout", K::Int, "Per provider query timeout in ms", [](Config& c, const std::string& v){ c.provider_timeout_ms = parse_int(v); }},
        {"--parallel", K::None, "Gather evidence in parallel", [](Config& c, const std::string&){ c.parallel = true; }},
        {"--parallel-threads", K::Int, "Max evidence threads (0 = cores)", [](Config& c, const std::string& v){ c.parallel_max_threads = parse_int(v); }},
        {"--protected-paths", K::CSV, "Path prefixes remediation must never touch", [](Config& c, const std::string& v){ c.protected_paths = utils::split_csv(v); }},
        {"--log-level", K::String, "error|warn|info|debug|trace", [](Config& c, const std::string& v){ c.log_level = v; }},
        {"--verbose", K::None, "Same as --log-level debug", [](Config& c, const std::string&){ c.log_level = "debug"; }},
        {"-v", K::None, "Same as --verbose", [](Config& c, const std::string&){ c.log_level = "debug"; }},
        {"--list", K::None, "List loaded indicators and exit", [](Config& c, const std::string&){ c.list_only = true; }},
        {"--show", K::String, "Print one indicator as JSON and exit", [](Config& c, const std::string& v){ c.show_id = v; }},
        {"--validate", K::None, "Validate the indicator file and exit", [](Config& c, const std::string&){ c.validate_only = true; }},
        {"--allow-insecure-config", K::None, "Accept an indicator file not owned by root or writable by others", [](Config& c, const std::string&){ c.allow_insecure_config = true; }},
        {"--drop-priv", K::None, "Drop Linux capabilities early (dry run only)", [](Config& c, const std::string&){ c.drop_priv = true; }},
        {"--keep-cap-dac", K::None, "Retain CAP_DAC_READ_SEARCH when dropping", [](Config& c, const std::string&){ c.keep_cap_dac = true; }},
        {"--seccomp", K::None, "Deny mutating syscalls (dry run only)", [](Config& c, const std::string&){ c.seccomp = true; }},
        {"--seccomp-strict", K::None, "Fail if seccomp apply fails", [](Config& c, const std::string&){ c.seccomp_strict = true; }},
    };
}

const ArgumentParser::FlagSpec* ArgumentParser::find(const std::string& flag) const {
    for(const auto& s : specs_) if(flag == s.name) return &s;
    return nullptr;
}

bool ArgumentParser::fail(const std::string& message){
    error_ = message;
    exit_code_ = 2;
    return false;
}

bool ArgumentParser::parse(int argc, char** argv, Config& cfg){
    error_.clear();
    exit_code_ = 0;
    for(int i = 1; i < argc; ++i){
        std::string a = argv[i];
        if(a == "--help" || a == "-h"){ print_help(std::cout); return false; }
        if(a == "--version"){ print_version(std::cout); return false; }
        std::string val;
        auto eq = a.find('=');
        bool inline_val = a.rfind("--", 0) == 0 && eq != std::string::npos;
        if(inline_val){ val = a.substr(eq + 1); a = a.substr(0, eq); }
        const FlagSpec* spec = find(a);
        if(!spec) return fail("Unknown arg: " + a);
        if(spec->kind == ArgKind::None){
            if(inline_val) return fail("Flag takes no value: " + a);
        } else if(!inline_val){
            if(i + 1 >= argc) return fail("Missing value for " + a);
            val = argv[++i];
        }
        try {
            spec->apply(cfg, val);
        } catch(const std::exception& ex){
            return fail("Invalid value for " + a + ": '" + val + "' (" + ex.what() + ")");
        }
    }
    return true;
}

void ArgumentParser::print_help(std::ostream& os) const {
    os << "ioc-sweep options:\n";
    for(const auto& s : specs_){
        std::string name = s.name;
        switch(s.kind){
            case ArgKind::String: name += " VALUE"; break;
            case ArgKind::Int: name += " N"; break;
            case ArgKind::CSV: name += " a,b"; break;
            case ArgKind::None: break;
        }
        os << "  " << name;
        for(size_t i = name.size(); i < 30; ++i) os << ' ';
        os << ' ' << s.help << "\n";
    }
    os << "  --version                      Print version & exit\n";
    os << "  --help                         Show this help\n";
}

void ArgumentParser::print_version(std::ostream& os){
    os << "ioc-sweep " << buildinfo::APP_VERSION << " (git=" << buildinfo::GIT_COMMIT << ", compiler="
       << buildinfo::COMPILER_ID << " " << buildinfo::COMPILER_VERSION << ", cxx_std=" << buildinfo::CXX_STANDARD << ")\n";
}

}
