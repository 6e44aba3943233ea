#include "FileActions.h"
#include "../core/Utils.h"
#include <cerrno>
#include <fcntl.h>
#include <filesystem>
#include <linux/fs.h>
#include <sys/ioctl.h>
#include <sys/stat.h>
#include <unistd.h>
#include <vector>

namespace fs = std::filesystem;

namespace ioc_sweep {

ActionResult remove_path(const std::string& path, bool recursive){
    struct stat st{};
    if(lstat(path.c_str(), &st) != 0){
        if(errno == ENOENT) return {ActionStatus::AlreadyDone, ""};
        return {ActionStatus::Error, path + ": " + utils::errno_text(errno)};
    }
    std::error_code ec;
    if(S_ISDIR(st.st_mode)){
        if(!recursive) return {ActionStatus::Error, path + " is a directory and recursive delete is not enabled"};
        fs::remove_all(path, ec);
    } else {
        fs::remove(path, ec);
    }
    if(ec){
        if(ec == std::errc::no_such_file_or_directory) return {ActionStatus::AlreadyDone, ""};
        return {ActionStatus::Error, path + ": " + ec.message()};
    }
    return {ActionStatus::Done, ""};
}

ActionResult set_immutable(const std::string& path){
    int fd = open(path.c_str(), O_RDONLY | O_NONBLOCK | O_CLOEXEC);
    if(fd == -1){
        if(errno == ENOENT) return {ActionStatus::AlreadyDone, ""};
        return {ActionStatus::Error, path + ": " + utils::errno_text(errno)};
    }
    int flags = 0;
    if(ioctl(fd, FS_IOC_GETFLAGS, &flags) == -1){
        int err = errno;
        close(fd);
        return {ActionStatus::Error, path + ": cannot read attributes: " + utils::errno_text(err)};
    }
    if(flags & FS_IMMUTABLE_FL){
        close(fd);
        return {ActionStatus::AlreadyDone, ""};
    }
    flags |= FS_IMMUTABLE_FL;
    int result = ioctl(fd, FS_IOC_SETFLAGS, &flags);
    int err = errno;
    close(fd);
    if(result != 0) return {ActionStatus::Error, path + ": cannot set immutable flag: " + utils::errno_text(err)};
    return {ActionStatus::Done, ""};
}

static bool needs_chmod(const std::string& path, unsigned mode, bool& is_dir, bool& exists){
    struct stat st{};
    exists = lstat(path.c_str(), &st) == 0;
    if(!exists) return false;
    is_dir = S_ISDIR(st.st_mode);
    if(S_ISLNK(st.st_mode)) return false; // permissions of symlinks are meaningless
    return (st.st_mode & 07777) != mode;
}

bool mode_differs(const std::string& path, unsigned mode, bool recursive){
    bool is_dir = false, exists = false;
    if(needs_chmod(path, mode, is_dir, exists)) return true;
    if(!exists || !is_dir || !recursive) return false;
    std::error_code ec;
    for(auto it = fs::recursive_directory_iterator(path, fs::directory_options::skip_permission_denied, ec);
        it != fs::recursive_directory_iterator(); it.increment(ec)){
        if(ec) break;
        bool d = false, e = false;
        if(needs_chmod(it->path().string(), mode, d, e)) return true;
    }
    return false;
}

ActionResult restore_mode(const std::string& path, unsigned mode, bool recursive){
    bool is_dir = false, exists = false;
    bool change_root = needs_chmod(path, mode, is_dir, exists);
    if(!exists) return {ActionStatus::AlreadyDone, ""};
    bool changed = false;
    if(recursive && is_dir){
        // Children first: a restrictive mode on the root would otherwise lock us out of the walk
        std::error_code ec;
        std::vector<std::string> children;
        for(auto it = fs::recursive_directory_iterator(path, fs::directory_options::skip_permission_denied, ec);
            it != fs::recursive_directory_iterator(); it.increment(ec)){
            if(ec) return {ActionStatus::Error, path + ": " + ec.message()};
            children.push_back(it->path().string());
        }
        if(ec) return {ActionStatus::Error, path + ": " + ec.message()};
        for(auto it = children.rbegin(); it != children.rend(); ++it){
            bool d = false, e = false;
            if(!needs_chmod(*it, mode, d, e)) continue;
            if(::chmod(it->c_str(), mode) != 0) return {ActionStatus::Error, *it + ": " + utils::errno_text(errno)};
            changed = true;
        }
    }
    if(change_root){
        if(::chmod(path.c_str(), mode) != 0) return {ActionStatus::Error, path + ": " + utils::errno_text(errno)};
        changed = true;
    }
    return {changed ? ActionStatus::Done : ActionStatus::AlreadyDone, ""};
}

}
