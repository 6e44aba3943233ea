#include "FileContentPatternProvider.h"
#include "FileTargets.h"
#include "../core/Utils.h"
#include <algorithm>
#include <regex>
#include <sys/stat.h>

namespace ioc_sweep {

static const size_t kSnippetContext = 40;

// Regexes see one line at a time, in windows of this size: the std::regex matcher recurses
// once per consumed character and overflows the stack on long inputs.
static const size_t kRegexWindow = 512;

static bool regex_find(const std::string& text, const std::regex& re, size_t& pos, size_t& len){
    size_t line_start = 0;
    while(line_start < text.size()){
        size_t line_end = text.find('\n', line_start);
        if(line_end == std::string::npos) line_end = text.size();
        for(size_t off = line_start; off < line_end; off += kRegexWindow){
            const char* first = text.data() + off;
            const char* last = text.data() + std::min(line_end, off + kRegexWindow);
            std::cmatch m;
            if(std::regex_search(first, last, m, re)){
                pos = off + static_cast<size_t>(m.position(0));
                len = static_cast<size_t>(m.length(0));
                return true;
            }
        }
        line_start = line_end + 1;
    }
    return false;
}

static std::string snippet_around(const std::string& text, size_t pos, size_t len){
    size_t start = pos > kSnippetContext ? pos - kSnippetContext : 0;
    size_t end = std::min(text.size(), pos + len + kSnippetContext);
    std::string s = text.substr(start, end - start);
    for(auto& c : s) if(c == '\n' || c == '\r' || c == '\0') c = ' ';
    return s;
}

Evidence FileContentPatternProvider::query(const IndicatorDefinition& def, const ScopeContext& scope) {
    auto res = resolve_targets(def.args.get("path"), scope);
    if(res.failed) return Evidence::failed(res.error);

    const std::string pattern = def.args.get("pattern");
    const bool regex = def.args.get_bool("regex");
    const long max_bytes = def.args.get_long("max_bytes", 1 << 20);
    std::regex re;
    if(regex) re = std::regex(pattern);

    std::vector<std::string> snippets;
    std::vector<std::string> hit_paths;
    for(const auto& p : res.paths){
        struct stat st{};
        if(stat(p.c_str(), &st) != 0 || !S_ISREG(st.st_mode)) continue;
        auto text = utils::read_file(p, max_bytes > 0 ? static_cast<size_t>(max_bytes) : 1 << 20);
        if(!text) return Evidence::failed("cannot read " + p);
        if(regex){
            size_t pos = 0, len = 0;
            if(regex_find(*text, re, pos, len)){
                snippets.push_back(snippet_around(*text, pos, len));
                hit_paths.push_back(p);
            }
        } else {
            size_t pos = text->find(pattern);
            if(pos != std::string::npos){
                snippets.push_back(snippet_around(*text, pos, pattern.size()));
                hit_paths.push_back(p);
            }
        }
    }
    if(hit_paths.empty()) return Evidence::absent();
    Evidence ev = Evidence::found(std::move(snippets));
    ev.metadata["match_count"] = std::to_string(hit_paths.size());
    ev.targets = std::move(hit_paths);
    return ev;
}

}
