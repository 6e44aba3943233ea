#pragma once
#include "Indicator.h"
#include "Scope.h"
#include "Evidence.h"
#include <chrono>
#include <map>
#include <optional>
#include <stdexcept>
#include <vector>

namespace ioc_sweep {

// One (indicator, scope) evaluation.
struct RunRecord {
    std::string indicator_id;
    std::string severity;
    std::string description;
    ScopeContext scope;
    Verdict verdict;
    std::optional<RemediationOutcome> action;
    std::map<std::string, std::string> evidence;  // provider metadata
    std::vector<std::string> targets;
    long duration_ms = 0;

    bool unresolved() const;
};

struct RunSummary {
    size_t records = 0;
    size_t clean = 0;
    size_t violated = 0;
    size_t unknown = 0;
    size_t applied = 0;
    size_t skipped = 0;
    size_t failed = 0;
    size_t would_apply = 0;
    size_t unresolved = 0;
};

// Ordered record sequence of one run. Records can only be appended until seal().
class RunReport {
public:
    explicit RunReport(bool dry_run = false);

    void add(RunRecord record);
    void seal();
    bool sealed() const { return sealed_; }

    const std::vector<RunRecord>& records() const { return records_; }
    bool dry_run() const { return dry_run_; }
    std::chrono::system_clock::time_point start_time() const { return start_; }
    std::chrono::system_clock::time_point end_time() const { return end_; }

    RunSummary summarize() const;
    int exit_code() const;
private:
    std::vector<RunRecord> records_;
    bool dry_run_;
    bool sealed_ = false;
    std::chrono::system_clock::time_point start_;
    std::chrono::system_clock::time_point end_;
};

}
