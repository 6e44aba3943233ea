#include "LogPatternProvider.h"

namespace ioc_sweep {

Evidence LogPatternProvider::query(const IndicatorDefinition& def, const ScopeContext&) {
    LogQuery q;
    q.patterns = def.args.get_list("patterns");
    if(q.patterns.empty()) q.patterns.push_back(def.args.get("pattern"));
    q.regex = def.args.get_bool("regex");
    q.window_seconds = def.args.get_long("window", 86400);
    q.sample_limit = static_cast<size_t>(def.args.get_long("sample_limit", sample_limit_));
    q.timeout = std::chrono::milliseconds(timeout_ms_);

    LogQueryResult r = source_.query(q);
    if(!r.ok) return Evidence::failed(r.error.empty() ? "log query failed" : r.error);
    if(r.count == 0) return Evidence::absent();
    Evidence ev = Evidence::found({std::to_string(r.count)});
    ev.metadata["count"] = std::to_string(r.count);
    ev.metadata["window_seconds"] = std::to_string(q.window_seconds);
    for(size_t i = 0; i < r.samples.size(); ++i) ev.metadata["sample_" + std::to_string(i)] = r.samples[i];
    return ev;
}

}
