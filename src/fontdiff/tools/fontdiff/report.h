#pragma once

#include <fontdiff/value.h>

#include <ostream>
#include <string>

namespace fontdiff::tools {

struct ReportStyle {
    bool succinct = true;  // one-sided leaves print as "value => <absent>"
    bool color = true;     // ANSI colours, old values green, new values red
};

// Human-readable rendering of FontDiffer::run() output
void printReport(std::ostream& out, const Value& diff, const ReportStyle& style);

// One leaf pair line body: "old => new"
std::string formatLeaf(const Value& left, const Value& right, const ReportStyle& style);

} // namespace fontdiff::tools
