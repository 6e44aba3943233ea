#pragma once
#include <string>
#include <vector>
#include <map>

namespace ioc_sweep {

// Answer of one provider query. query_failed distinguishes "could not determine" from "absent".
struct Evidence {
    bool present = false;
    std::vector<std::string> values;             // observed value(s); a set for array-typed state
    bool query_failed = false;
    std::string failure_reason;
    std::vector<std::string> targets;            // paths / pids the observation refers to
    std::map<std::string, std::string> metadata; // sample lines, counts, locations

    static Evidence absent() { return Evidence{}; }
    static Evidence found(std::vector<std::string> observed){
        Evidence e; e.present = true; e.values = std::move(observed); return e;
    }
    static Evidence failed(std::string reason){
        Evidence e; e.query_failed = true; e.failure_reason = std::move(reason); return e;
    }
    std::string observed() const;
};

enum class VerdictKind { Clean, Violated, Unknown };

struct Verdict {
    VerdictKind kind = VerdictKind::Unknown;
    std::string observed;  // Violated
    std::string reason;    // Unknown, or why a violation was raised

    static Verdict clean() { return Verdict{VerdictKind::Clean, "", ""}; }
    static Verdict violated(std::string observed, std::string reason = ""){ return Verdict{VerdictKind::Violated, std::move(observed), std::move(reason)}; }
    static Verdict unknown(std::string reason){ return Verdict{VerdictKind::Unknown, "", std::move(reason)}; }
};

enum class OutcomeKind { Applied, Skipped, Failed, WouldApply };

struct RemediationOutcome {
    OutcomeKind kind = OutcomeKind::Applied;
    std::string detail;

    static RemediationOutcome applied(std::string d = ""){ return {OutcomeKind::Applied, std::move(d)}; }
    static RemediationOutcome skipped(std::string reason){ return {OutcomeKind::Skipped, std::move(reason)}; }
    static RemediationOutcome failed(std::string cause){ return {OutcomeKind::Failed, std::move(cause)}; }
    static RemediationOutcome would_apply(std::string d){ return {OutcomeKind::WouldApply, std::move(d)}; }
};

const char* to_string(VerdictKind k);
const char* to_string(OutcomeKind k);

}
