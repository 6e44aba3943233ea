#include "FileExistenceProvider.h"
#include "FileTargets.h"
#include "../core/Utils.h"
#include <sys/stat.h>

namespace ioc_sweep {

static bool type_matches(const std::string& type, const struct stat& st){
    if(type == "file") return S_ISREG(st.st_mode);
    if(type == "directory") return S_ISDIR(st.st_mode);
    return true;
}

Evidence FileExistenceProvider::query(const IndicatorDefinition& def, const ScopeContext& scope) {
    auto res = resolve_targets(def.args.get("path"), scope);
    if(res.failed) return Evidence::failed(res.error);

    const std::string type = def.args.get("type", "any");
    const std::string attribute = def.args.get("attribute", "path");
    const std::string want_hash = utils::to_lower(def.args.get("sha256"));
    if((!want_hash.empty() || attribute == "sha256") && !sha256_available())
        return Evidence::failed("sha256 requested but hashing support is not compiled in");

    std::vector<std::string> matched;
    std::vector<std::string> observed;
    for(const auto& p : res.paths){
        struct stat st{};
        if(lstat(p.c_str(), &st) != 0) continue; // raced away since resolution
        if(!type_matches(type, st)) continue;
        std::string digest;
        if(!want_hash.empty() || attribute == "sha256"){
            if(!S_ISREG(st.st_mode)) continue;
            digest = sha256_file(p);
            if(digest.empty()) return Evidence::failed("cannot hash " + p);
            if(!want_hash.empty() && digest != want_hash) continue;
        }
        matched.push_back(p);
        if(attribute == "mode") observed.push_back(utils::format_mode(st.st_mode));
        else if(attribute == "sha256") observed.push_back(digest);
        else if(attribute == "immutable"){
            std::string err;
            auto flag = read_immutable_flag(p, &err);
            if(!flag) return Evidence::failed("cannot read attributes of " + p + ": " + err);
            observed.push_back(*flag ? "true" : "false");
        }
        else observed.push_back(p);
    }
    if(matched.empty()) return Evidence::absent();
    Evidence ev = Evidence::found(std::move(observed));
    ev.metadata["match_count"] = std::to_string(matched.size());
    ev.targets = std::move(matched);
    return ev;
}

}
