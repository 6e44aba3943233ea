#include "Evidence.h"
#include "Utils.h"

namespace ioc_sweep {

std::string Evidence::observed() const { return utils::join(values, ","); }

const char* to_string(VerdictKind k){
    switch(k){
        case VerdictKind::Clean: return "clean";
        case VerdictKind::Violated: return "violated";
        case VerdictKind::Unknown: return "unknown";
    }
    return "unknown";
}

const char* to_string(OutcomeKind k){
    switch(k){
        case OutcomeKind::Applied: return "applied";
        case OutcomeKind::Skipped: return "skipped";
        case OutcomeKind::Failed: return "failed";
        case OutcomeKind::WouldApply: return "would_apply";
    }
    return "unknown";
}

}
