#pragma once
#include "Config.h"
#include <string>
#include <sys/types.h>

namespace ioc_sweep {

// Post-parse checks and normalisation. validate() returns false with error() set on a
// usage problem; the caller exits with status 2.
class ConfigValidator {
public:
    bool validate(Config& cfg);
    const std::string& error() const { return error_; }

    // The indicator file decides what gets killed and deleted: it must be owned by
    // expected_owner and not writable by group or others.
    static bool file_is_secure(const std::string& path, std::string& why, uid_t expected_owner = 0);

private:
    bool fail(const std::string& message){ error_ = message; return false; }
    std::string error_;
};

}
