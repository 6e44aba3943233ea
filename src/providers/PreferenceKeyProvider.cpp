#include "PreferenceKeyProvider.h"

namespace ioc_sweep {

Evidence PreferenceKeyProvider::query(const IndicatorDefinition& def, const ScopeContext& scope) {
    const std::string domain = def.args.get("domain");
    auto r = store_.read(scope, domain, def.args.get("key"));
    if(!r.ok) return Evidence::failed(r.error);
    if(!r.found) return Evidence::absent();
    Evidence ev = Evidence::found(r.value.values);
    ev.targets.push_back(store_.location(scope, domain));
    if(r.value.is_array) ev.metadata["type"] = "array";
    return ev;
}

}
