#include "ProcessPatternProvider.h"

namespace ioc_sweep {

Evidence ProcessPatternProvider::query(const IndicatorDefinition& def, const ScopeContext&) {
    auto procs = table_.snapshot();
    if(!procs) return Evidence::failed("process list unavailable");
    auto hits = match_processes(*procs, def.args.get("pattern"), def.args.get_bool("regex"));
    if(hits.empty()) return Evidence::absent();
    std::vector<std::string> pids;
    for(const auto& h : hits) pids.push_back(std::to_string(h.pid));
    Evidence ev = Evidence::found(pids);
    ev.targets = std::move(pids);
    ev.metadata["match_count"] = std::to_string(hits.size());
    ev.metadata["command"] = hits.front().cmdline.substr(0, 256);
    return ev;
}

}
