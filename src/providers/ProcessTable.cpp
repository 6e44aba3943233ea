#include "ProcessTable.h"
#include "../core/Utils.h"
#include <cerrno>
#include <csignal>
#include <cstring>
#include <dirent.h>
#include <fcntl.h>
#include <regex>
#include <sys/stat.h>
#include <unistd.h>

namespace ioc_sweep {

// Fast file reading with fixed buffer
static ssize_t read_file_to_buffer(const char* path, char* buffer, size_t buffer_size) {
    int fd = open(path, O_RDONLY | O_CLOEXEC);
    if (fd == -1) return -1;
    ssize_t total_read = 0;
    while (total_read < static_cast<ssize_t>(buffer_size)) {
        ssize_t bytes_read = read(fd, buffer + total_read, buffer_size - total_read);
        if (bytes_read <= 0) break;
        total_read += bytes_read;
    }
    close(fd);
    return total_read;
}

static std::string read_cmdline(const std::string& proc_root, int pid) {
    char buf[4096];
    std::string path = proc_root + "/" + std::to_string(pid) + "/cmdline";
    ssize_t len = read_file_to_buffer(path.c_str(), buf, sizeof(buf));
    if (len <= 0) return "";
    std::string out(buf, static_cast<size_t>(len));
    for (auto& c : out) if (c == '\0') c = ' ';
    while (!out.empty() && out.back() == ' ') out.pop_back();
    return out;
}

std::optional<std::vector<ProcessEntry>> ProcfsProcessTable::snapshot() const {
    DIR* dir = opendir(proc_root_.c_str());
    if (!dir) return std::nullopt;
    std::vector<ProcessEntry> out;
    struct dirent* entry;
    while ((entry = readdir(dir)) != nullptr) {
        if (entry->d_name[0] == '.') continue;
        int pid;
        if (!utils::is_valid_pid(entry->d_name, &pid)) continue;
        ProcessEntry pe;
        pe.pid = pid;
        pe.cmdline = read_cmdline(proc_root_, pid);
        struct stat st{};
        std::string pdir = proc_root_ + "/" + entry->d_name;
        if (stat(pdir.c_str(), &st) == 0) pe.uid = st.st_uid;
        out.push_back(std::move(pe));
    }
    closedir(dir);
    return out;
}

std::optional<uid_t> ProcfsProcessTable::owner(int pid) const {
    struct stat st{};
    std::string pdir = proc_root_ + "/" + std::to_string(pid);
    if (stat(pdir.c_str(), &st) != 0) return std::nullopt;
    return st.st_uid;
}

SignalResult ProcfsProcessTable::send_signal(int pid, int signo, std::string& error) {
    if (::kill(pid, signo) == 0) return SignalResult::Delivered;
    int err = errno;
    error = utils::errno_text(err);
    if (err == ESRCH) return SignalResult::NoSuchProcess;
    if (err == EPERM) return SignalResult::PermissionDenied;
    return SignalResult::Error;
}

std::vector<ProcessEntry> match_processes(const std::vector<ProcessEntry>& procs, const std::string& pattern, bool regex) {
    std::vector<ProcessEntry> hits;
    std::regex re;
    if (regex) re = std::regex(pattern);
    const int self = static_cast<int>(getpid());
    for (const auto& p : procs) {
        if (p.pid == 1 || p.pid == self || p.cmdline.empty()) continue;
        bool match = regex ? std::regex_search(p.cmdline, re) : p.cmdline.find(pattern) != std::string::npos;
        if (match) hits.push_back(p);
    }
    return hits;
}

}
