#include "Privilege.h"
#include "Logging.h"
#include "Utils.h"
#include <cerrno>
#include <unistd.h>
#include <sys/capability.h>
#ifdef IOC_SWEEP_HAVE_SECCOMP
#include <seccomp.h>
#endif

namespace ioc_sweep {

static cap_value_t cap_value(Capability cap){
    switch(cap){
        case Capability::Kill: return CAP_KILL;
        case Capability::LinuxImmutable: return CAP_LINUX_IMMUTABLE;
        case Capability::DacReadSearch: return CAP_DAC_READ_SEARCH;
    }
    return CAP_KILL;
}

const char* to_string(Capability cap){
    switch(cap){
        case Capability::Kill: return "CAP_KILL";
        case Capability::LinuxImmutable: return "CAP_LINUX_IMMUTABLE";
        case Capability::DacReadSearch: return "CAP_DAC_READ_SEARCH";
    }
    return "CAP_UNKNOWN";
}

bool has_capability(Capability cap){
    cap_t caps = cap_get_proc();
    if(!caps){
        Logger::instance().warn("Failed to read process capabilities");
        return false;
    }
    cap_flag_value_t value = CAP_CLEAR;
    bool ok = cap_get_flag(caps, cap_value(cap), CAP_EFFECTIVE, &value) == 0;
    cap_free(caps);
    return ok && value == CAP_SET;
}

static void trace_capabilities(const char* when){
    auto& log = Logger::instance();
    if(static_cast<int>(log.level()) < static_cast<int>(LogLevel::Debug)) return;
    cap_t caps = cap_get_proc();
    if(!caps){
        log.warn(std::string("cap_get_proc failed ") + when + " capability drop");
        return;
    }
    char* text = cap_to_text(caps, nullptr);
    log.debug(std::string("capabilities ") + when + " drop: " + (text ? text : "<unprintable>"));
    if(text) cap_free(text);
    cap_free(caps);
}

void drop_capabilities(bool keep_cap_dac){
    auto& log = Logger::instance();
    log.info(keep_cap_dac ? "dropping capabilities except CAP_DAC_READ_SEARCH" : "dropping all capabilities");
    trace_capabilities("before");
    cap_t caps = cap_init();
    if(!caps){
        log.error("cap_init failed: " + utils::errno_text(errno));
        return;
    }
    if(keep_cap_dac){
        cap_value_t keep[] = { cap_value(Capability::DacReadSearch) };
        if(cap_set_flag(caps, CAP_PERMITTED, 1, keep, CAP_SET) != 0 || cap_set_flag(caps, CAP_EFFECTIVE, 1, keep, CAP_SET) != 0)
            log.warn("could not retain CAP_DAC_READ_SEARCH");
    }
    if(cap_set_proc(caps) != 0) log.error("cap_set_proc failed: " + utils::errno_text(errno));
    else trace_capabilities("after");
    cap_free(caps);
}

bool is_seccomp_available(){
#ifdef IOC_SWEEP_HAVE_SECCOMP
    return true;
#else
    return false;
#endif
}

bool apply_dry_run_seccomp_profile(){
#ifdef IOC_SWEEP_HAVE_SECCOMP
    // Mutating syscalls fail with EPERM once loaded; a dry run never needs them.
    static const int mutating_calls[] = {
        SCMP_SYS(unlink), SCMP_SYS(unlinkat), SCMP_SYS(rmdir),
        SCMP_SYS(rename), SCMP_SYS(renameat), SCMP_SYS(renameat2),
        SCMP_SYS(chmod), SCMP_SYS(fchmod), SCMP_SYS(fchmodat),
        SCMP_SYS(chown), SCMP_SYS(fchown), SCMP_SYS(fchownat), SCMP_SYS(lchown),
        SCMP_SYS(truncate), SCMP_SYS(ftruncate)
    };
    static bool loaded = false;
    auto& log = Logger::instance();
    if(loaded) return true;

    scmp_filter_ctx filter = seccomp_init(SCMP_ACT_ALLOW);
    if(!filter){
        log.error("seccomp_init failed");
        return false;
    }
    bool ok = true;
    for(int call : mutating_calls){
        int rc = seccomp_rule_add(filter, SCMP_ACT_ERRNO(EPERM), call, 0);
        if(rc != 0){
            log.error("seccomp rule for syscall " + std::to_string(call) + " rejected: " + utils::errno_text(-rc));
            ok = false;
            break;
        }
    }
    if(ok){
        int rc = seccomp_load(filter);
        if(rc != 0){
            log.error("seccomp_load failed: " + utils::errno_text(-rc));
            ok = false;
        }
    }
    seccomp_release(filter);
    if(ok){
        loaded = true;
        log.info("dry-run seccomp filter loaded (" + std::to_string(sizeof(mutating_calls) / sizeof(mutating_calls[0])) + " syscalls denied)");
    }
    return ok;
#else
    Logger::instance().warn("seccomp support not compiled in; dry-run filter not applied");
    return false;
#endif
}

}
