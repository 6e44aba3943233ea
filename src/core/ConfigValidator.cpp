#include "ConfigValidator.h"
#include "Logging.h"
#include "Utils.h"
#include <cerrno>
#include <sys/stat.h>

namespace ioc_sweep {

bool ConfigValidator::validate(Config& cfg){
    error_.clear();
    // --seccomp-strict implies --seccomp
    if(cfg.seccomp_strict) cfg.seccomp = true;

    if(cfg.indicator_file.empty()) return fail("--config FILE is required");

    LogLevel lvl;
    if(!parse_log_level(cfg.log_level, lvl)) return fail("Invalid --log-level value: " + cfg.log_level);

    if(cfg.drop_priv && !cfg.dry_run) return fail("--drop-priv requires --dry-run (remediation needs its capabilities)");
    if(cfg.seccomp && !cfg.dry_run) return fail("--seccomp requires --dry-run (the profile denies mutating syscalls)");
    if(cfg.keep_cap_dac && !cfg.drop_priv) Logger::instance().warn("--keep-cap-dac has no effect without --drop-priv");

    if(cfg.provider_timeout_ms <= 0) return fail("--provider-timeout must be positive");
    if(cfg.parallel_max_threads < 0) return fail("--parallel-threads must not be negative");
    if(cfg.log_sample_limit < 0) return fail("log sample limit must not be negative");
    if(cfg.parallel_max_threads > 0 && !cfg.parallel) cfg.parallel = true;

    if(cfg.scope_filter == ScopeFilter::SystemOnly && !cfg.users.empty()) return fail("--users conflicts with --scope system");
    for(const auto& u : cfg.users){
        if(u.empty() || u.find('/') != std::string::npos || u == "." || u == "..") return fail("Invalid user name in --users: '" + u + "'");
    }

    if(cfg.home_root.empty()) return fail("--home-root must not be empty");
    if(cfg.proc_root.empty()) return fail("--proc-root must not be empty");
    if(cfg.journal_binary.empty()) return fail("--journal-binary must not be empty");
    for(const auto& p : cfg.protected_paths){
        if(p.empty() || p[0] != '/') return fail("Protected paths must be absolute: '" + p + "'");
    }

    int tooling = (cfg.list_only ? 1 : 0) + (!cfg.show_id.empty() ? 1 : 0) + (cfg.validate_only ? 1 : 0);
    if(tooling > 1) return fail("--list, --show and --validate are mutually exclusive");

    struct stat st{};
    if(stat(cfg.indicator_file.c_str(), &st) != 0) return fail("Indicator file not accessible: " + cfg.indicator_file + ": " + utils::errno_text(errno));
    if(!S_ISREG(st.st_mode)) return fail("Indicator file is not a regular file: " + cfg.indicator_file);
    std::string why;
    if(!file_is_secure(cfg.indicator_file, why)){
        if(!cfg.allow_insecure_config){
            return fail("Refusing to load indicators from insecure file (" + why + "): " + cfg.indicator_file +
                        " (use --allow-insecure-config to override)");
        }
        Logger::instance().warn("loading insecure indicator file (" + why + "): " + cfg.indicator_file);
    }
    return true;
}

bool ConfigValidator::file_is_secure(const std::string& path, std::string& why, uid_t expected_owner){
    struct stat st{};
    if(stat(path.c_str(), &st) != 0){
        why = "cannot stat: " + utils::errno_text(errno);
        return false;
    }
    if(st.st_uid != expected_owner){
        why = "owned by uid " + std::to_string(st.st_uid);
        return false;
    }
    if(st.st_mode & (S_IWGRP | S_IWOTH)){
        why = "group/other-writable mode " + utils::format_mode(st.st_mode & 07777);
        return false;
    }
    return true;
}

}
