// Linux privilege & sandbox helpers
#pragma once
#include <string>

namespace ioc_sweep {

enum class Capability { Kill, LinuxImmutable, DacReadSearch };

// Effective-set check through libcap.
bool has_capability(Capability cap);
const char* to_string(Capability cap);

// Confinement for read-only (dry) runs.
void drop_capabilities(bool keep_cap_dac);
// Denies filesystem mutating syscalls (unlink, chmod, rename, ...) with EPERM. Signals stay
// allowed so timed out journal readers can still be reaped. False when the profile
// could not be loaded or seccomp support is not compiled in.
bool apply_dry_run_seccomp_profile();
bool is_seccomp_available();

}
