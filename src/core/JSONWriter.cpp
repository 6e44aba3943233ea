#include "JSONWriter.h"
#include "Utils.h"
#include "BuildInfo.h"
#include <sys/utsname.h>
#include <unistd.h>

namespace ioc_sweep {
namespace {

struct HostMeta {
    std::string hostname;
    std::string kernel;
    std::string arch;
};

HostMeta collect_host_meta(){
    HostMeta h;
    struct utsname u{};
    if(uname(&u) == 0){
        h.hostname = u.nodename;
        h.kernel = u.release;
        h.arch = u.machine;
    }
    return h;
}

nlohmann::json scope_to_json(const ScopeContext& scope){
    nlohmann::json j;
    j["kind"] = to_string(scope.kind);
    if(scope.kind == ScopeKind::PerUser){
        j["user"] = scope.user;
        j["home"] = scope.home;
    }
    return j;
}

}

nlohmann::json record_to_json(const RunRecord& r){
    nlohmann::json j;
    j["indicator"] = r.indicator_id;
    j["severity"] = r.severity;
    if(!r.description.empty()) j["description"] = r.description;
    j["scope"] = scope_to_json(r.scope);
    j["verdict"] = to_string(r.verdict.kind);
    if(!r.verdict.observed.empty()) j["observed"] = r.verdict.observed;
    if(!r.verdict.reason.empty()) j["reason"] = r.verdict.reason;
    if(!r.targets.empty()) j["targets"] = r.targets;
    if(!r.evidence.empty()) j["evidence"] = r.evidence;
    if(r.action){
        j["action"] = {{"outcome", to_string(r.action->kind)}, {"detail", r.action->detail}};
    } else {
        j["action"] = nullptr;
    }
    j["duration_ms"] = r.duration_ms;
    return j;
}

nlohmann::json JSONWriter::to_json(const RunReport& report) const {
    nlohmann::json out;
    auto host = collect_host_meta();
    out["meta"] = {
        {"tool", "ioc-sweep"},
        {"tool_version", buildinfo::APP_VERSION},
        {"git_commit", buildinfo::GIT_COMMIT},
        {"compiler", std::string(buildinfo::COMPILER_ID) + " " + buildinfo::COMPILER_VERSION},
        {"hostname", host.hostname},
        {"kernel", host.kernel},
        {"arch", host.arch},
        {"euid", static_cast<long>(geteuid())},
        {"started_at", utils::time_to_iso(report.start_time())},
        {"finished_at", utils::time_to_iso(report.end_time())},
        {"dry_run", report.dry_run()}
    };
    auto s = report.summarize();
    out["summary"] = {
        {"records", s.records},
        {"clean", s.clean},
        {"violated", s.violated},
        {"unknown", s.unknown},
        {"applied", s.applied},
        {"skipped", s.skipped},
        {"failed", s.failed},
        {"would_apply", s.would_apply},
        {"unresolved", s.unresolved},
        {"exit_code", report.exit_code()}
    };
    auto records = nlohmann::json::array();
    for(const auto& r : report.records()) records.push_back(record_to_json(r));
    out["records"] = std::move(records);
    return out;
}

std::string JSONWriter::write(const RunReport& report, bool pretty) const {
    // process command lines and log samples are not guaranteed to be UTF-8
    return to_json(report).dump(pretty ? 2 : -1, ' ', false, nlohmann::json::error_handler_t::replace) + "\n";
}

}
