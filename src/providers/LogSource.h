#pragma once
#include <string>
#include <vector>
#include <chrono>
#include <cstddef>

namespace ioc_sweep {

struct LogQuery {
    std::vector<std::string> patterns;  // any-of
    bool regex = false;
    long window_seconds = 86400;
    size_t sample_limit = 5;
    std::chrono::milliseconds timeout{10000};
};

struct LogQueryResult {
    bool ok = true;
    std::string error;
    size_t count = 0;
    std::vector<std::string> samples;
};

class LogSource {
public:
    virtual ~LogSource() = default;
    virtual LogQueryResult query(const LogQuery& q) = 0;
};

// Runs the journal reader as a child process and scans its output line by line. The child is
// killed when the query deadline passes, which reports as a failed query.
class JournalLogSource : public LogSource {
public:
    explicit JournalLogSource(std::string binary = "journalctl") : binary_(std::move(binary)) {}
    LogQueryResult query(const LogQuery& q) override;
    std::vector<std::string> build_argv(const LogQuery& q) const;
private:
    std::string binary_;
};

}
