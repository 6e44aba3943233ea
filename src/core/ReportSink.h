#pragma once
#include "Report.h"
#include <memory>
#include <string>

namespace ioc_sweep {

// Consumer of a completed run report.
class ReportSink {
public:
    virtual ~ReportSink() = default;
    virtual std::string name() const = 0;
    // Returns false when the report could not be delivered.
    virtual bool accept(const RunReport& report) = 0;
};

using ReportSinkPtr = std::unique_ptr<ReportSink>;

// JSON document to a file, or stdout when output_file is empty.
class JsonReportSink : public ReportSink {
public:
    JsonReportSink(std::string output_file, bool pretty) : output_file_(std::move(output_file)), pretty_(pretty) {}
    std::string name() const override { return "json"; }
    bool accept(const RunReport& report) override;
private:
    std::string output_file_;
    bool pretty_;
};

// One log line per record that is not clean, plus a summary line.
class LogReportSink : public ReportSink {
public:
    std::string name() const override { return "log"; }
    bool accept(const RunReport& report) override;
};

}
