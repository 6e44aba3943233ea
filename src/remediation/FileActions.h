#pragma once
#include <string>

namespace ioc_sweep {

enum class ActionStatus { Done, AlreadyDone, Error };

struct ActionResult {
    ActionStatus status = ActionStatus::Done;
    std::string error;
};

// Removing a missing path is AlreadyDone. Directories need recursive.
ActionResult remove_path(const std::string& path, bool recursive);
// Sets FS_IMMUTABLE_FL; AlreadyDone when it is set.
ActionResult set_immutable(const std::string& path);
// chmod to mode (optionally through a directory tree without following symlinks).
ActionResult restore_mode(const std::string& path, unsigned mode, bool recursive);
// True when restore_mode would change anything.
bool mode_differs(const std::string& path, unsigned mode, bool recursive);

}
