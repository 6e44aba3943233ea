#include "ReportSink.h"
#include "JSONWriter.h"
#include "Logging.h"
#include "Utils.h"
#include <cerrno>
#include <fstream>
#include <iostream>

namespace ioc_sweep {

bool JsonReportSink::accept(const RunReport& report){
    JSONWriter writer;
    std::string json = writer.write(report, pretty_);
    if(output_file_.empty()){
        std::cout << json;
        std::cout.flush();
        return static_cast<bool>(std::cout);
    }
    std::ofstream ofs(output_file_, std::ios::trunc);
    if(!ofs){
        Logger::instance().error("cannot open report output " + output_file_ + ": " + utils::errno_text(errno));
        return false;
    }
    ofs << json;
    ofs.close();
    if(!ofs){
        Logger::instance().error("failed writing report output " + output_file_);
        return false;
    }
    return true;
}

bool LogReportSink::accept(const RunReport& report){
    auto& log = Logger::instance();
    for(const auto& r : report.records()){
        if(r.verdict.kind == VerdictKind::Clean) continue;
        std::string line = r.indicator_id + " [" + r.scope.label() + "] " + to_string(r.verdict.kind);
        if(!r.verdict.observed.empty()) line += " observed=" + r.verdict.observed;
        if(!r.verdict.reason.empty()) line += " reason=" + r.verdict.reason;
        if(r.action) line += std::string(" action=") + to_string(r.action->kind) + (r.action->detail.empty() ? "" : " (" + r.action->detail + ")");
        if(r.unresolved()) log.warn(line); else log.info(line);
    }
    auto s = report.summarize();
    log.info("run complete: records=" + std::to_string(s.records) + " clean=" + std::to_string(s.clean) +
             " violated=" + std::to_string(s.violated) + " unknown=" + std::to_string(s.unknown) +
             " applied=" + std::to_string(s.applied) + " skipped=" + std::to_string(s.skipped) +
             " failed=" + std::to_string(s.failed) + " would_apply=" + std::to_string(s.would_apply));
    return true;
}

}
