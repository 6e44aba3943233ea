#pragma once
#include "Report.h"
#include <nlohmann/json.hpp>
#include <string>

namespace ioc_sweep {

// Renders a RunReport as {meta, summary, records}.
class JSONWriter {
public:
    nlohmann::json to_json(const RunReport& report) const;
    std::string write(const RunReport& report, bool pretty) const;
};

nlohmann::json record_to_json(const RunRecord& record);

}
