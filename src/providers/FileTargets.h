#pragma once
#include "../core/Scope.h"
#include <string>
#include <vector>
#include <optional>

namespace ioc_sweep {

struct TargetResolution {
    std::vector<std::string> paths; // existing entries, sorted
    bool failed = false;
    std::string error;
};

// Expands a path argument against a scope: "~/" and relative paths are anchored at the
// scope's home directory (system scope anchors relative paths at "/"). Glob characters are
// expanded; a missing parent directory simply yields no paths.
TargetResolution resolve_targets(const std::string& pattern, const ScopeContext& scope);

std::string anchor_path(const std::string& pattern, const ScopeContext& scope);

// FS_IMMUTABLE_FL of path; nullopt when the flags cannot be read (unsupported filesystem, permissions).
std::optional<bool> read_immutable_flag(const std::string& path, std::string* error = nullptr);

// Hex SHA-256 of a regular file, empty when it cannot be read or hashing is unavailable.
std::string sha256_file(const std::string& path);
bool sha256_available();

}
