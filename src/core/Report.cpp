#include "Report.h"

namespace ioc_sweep {

bool RunRecord::unresolved() const {
    switch(verdict.kind){
        case VerdictKind::Clean: return false;
        case VerdictKind::Unknown: return true;
        case VerdictKind::Violated: break;
    }
    if(!action) return true;
    switch(action->kind){
        case OutcomeKind::Applied:
        case OutcomeKind::Skipped:
            return false;
        case OutcomeKind::Failed:
        case OutcomeKind::WouldApply:
            return true;
    }
    return true;
}

RunReport::RunReport(bool dry_run) : dry_run_(dry_run), start_(std::chrono::system_clock::now()), end_(start_) {}

void RunReport::add(RunRecord record){
    if(sealed_) throw std::logic_error("run report is sealed");
    records_.push_back(std::move(record));
}

void RunReport::seal(){
    if(sealed_) return;
    sealed_ = true;
    end_ = std::chrono::system_clock::now();
}

RunSummary RunReport::summarize() const {
    RunSummary s;
    s.records = records_.size();
    for(const auto& r : records_){
        switch(r.verdict.kind){
            case VerdictKind::Clean: ++s.clean; break;
            case VerdictKind::Violated: ++s.violated; break;
            case VerdictKind::Unknown: ++s.unknown; break;
        }
        if(r.action){
            switch(r.action->kind){
                case OutcomeKind::Applied: ++s.applied; break;
                case OutcomeKind::Skipped: ++s.skipped; break;
                case OutcomeKind::Failed: ++s.failed; break;
                case OutcomeKind::WouldApply: ++s.would_apply; break;
            }
        }
        if(r.unresolved()) ++s.unresolved;
    }
    return s;
}

int RunReport::exit_code() const {
    for(const auto& r : records_) if(r.unresolved()) return 1;
    return 0;
}

}
