#pragma once
#include <string>
#include <vector>
#include <optional>
#include <sys/types.h>

namespace ioc_sweep {

struct ProcessEntry {
    int pid = 0;
    uid_t uid = 0;
    std::string cmdline; // argv joined with spaces
};

enum class SignalResult { Delivered, NoSuchProcess, PermissionDenied, Error };

class ProcessTable {
public:
    virtual ~ProcessTable() = default;
    // nullopt when the process list itself cannot be read
    virtual std::optional<std::vector<ProcessEntry>> snapshot() const = 0;
    virtual std::optional<uid_t> owner(int pid) const = 0;
    virtual SignalResult send_signal(int pid, int signo, std::string& error) = 0;
};

class ProcfsProcessTable : public ProcessTable {
public:
    explicit ProcfsProcessTable(std::string proc_root = "/proc") : proc_root_(std::move(proc_root)) {}
    std::optional<std::vector<ProcessEntry>> snapshot() const override;
    std::optional<uid_t> owner(int pid) const override;
    SignalResult send_signal(int pid, int signo, std::string& error) override;
    const std::string& proc_root() const { return proc_root_; }
private:
    std::string proc_root_;
};

// Substring (or ECMAScript regex) match on command lines. Skips PID 1, this process and
// processes without a command line (kernel threads).
std::vector<ProcessEntry> match_processes(const std::vector<ProcessEntry>& procs, const std::string& pattern, bool regex);

}
