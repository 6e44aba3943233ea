#pragma once
#include <string>
#include <vector>

namespace ioc_sweep {

enum class ScopeFilter { All, SystemOnly, UsersOnly };

struct Config {
    std::string indicator_file;        // --config
    ScopeFilter scope_filter = ScopeFilter::All;
    std::vector<std::string> users;    // if non-empty, only these per-user scopes
    bool dry_run = false;
    std::string output_file;           // JSON report, stdout when empty
    bool pretty = false;
    std::string log_level = "info";
    // Scope discovery
    std::string home_root = "/home";
    std::vector<std::string> skip_accounts = {"Shared", "lost+found", "guest"};
    // Provider backends
    std::string proc_root = "/proc";
    std::string system_preferences_dir = "/etc/ioc-sweep/preferences";
    std::string user_preferences_subdir = ".config/ioc-sweep/preferences";
    std::string journal_binary = "journalctl";
    int provider_timeout_ms = 10000;   // per provider call; exceeded => queryFailed
    int log_sample_limit = 5;
    // Evidence gathering may fan out; remediation always runs on the calling thread
    bool parallel = false;
    int parallel_max_threads = 0;      // 0 = hardware concurrency
    // Host policy
    std::vector<std::string> protected_paths = {"/proc", "/sys", "/dev", "/boot"};
    // Informational / tooling modes
    bool list_only = false;
    std::string show_id;
    bool validate_only = false;
    bool allow_insecure_config = false;
    // Confinement for read-only runs
    bool drop_priv = false;
    bool keep_cap_dac = false;
    bool seccomp = false;
    bool seccomp_strict = false;
};

Config& config();
void set_config(const Config& c);

// info=0 .. critical=4, -1 for unknown names
int severity_rank(const std::string& sev);

}
