#include "report_formatter.h"

#include <absl/strings/str_cat.h>

#include "capture/invocation.h"
#include "compare/line_segmenter.h"

namespace TraceDiff {

namespace {

const char kRule[] = "--------------------\n";
const char kSeparator[] = "~~~~~~~~~~~~~~~~~~~~\n";

std::string TraceName(const TraceReport& report) {
    std::string name = TraceFileName(report.spec.trace);
    return name.substr(0, name.size() - 4);  // drop ".txt"
}

std::string Transcripts(const TraceReport& report, bool with_lengths) {
    std::string actual_header = "actual";
    std::string expected_header = "expected";
    if (with_lengths) {
        absl::StrAppend(&actual_header, " (len = ", SegmentLines(report.candidate_output).size(), ")");
        absl::StrAppend(&expected_header, " (len = ", SegmentLines(report.reference_output).size(), ")");
    }
    return absl::StrCat(actual_header, "\n", kRule, report.candidate_output, "\n", kSeparator,
                        expected_header, "\n", kRule, report.reference_output, "\n");
}

} // namespace

std::string FormatSummaryLine(const TraceReport& report) {
    if (report.passed()) {
        return absl::StrCat("PASS ", TraceName(report));
    }
    if (report.failure && report.failure->program.empty()) {
        return absl::StrCat("FAIL ", TraceName(report), ": comparison failed (",
                            CaptureError::KindName(report.failure->kind), ")");
    }
    if (report.failure) {
        return absl::StrCat("FAIL ", TraceName(report), ": capture of ", report.failure->program,
                            " failed (", CaptureError::KindName(report.failure->kind), ")");
    }
    if (report.verdict) {
        return absl::StrCat("FAIL ", TraceName(report), ": ", report.verdict->ToString());
    }
    return absl::StrCat("FAIL ", TraceName(report), ": not run");
}

std::string FormatDiagnostic(const TraceReport& report) {
    if (report.passed()) return "";

    const std::string header = absl::StrCat(TraceName(report), " (",
                                            CompareModeName(report.spec.compare), ", ",
                                            ExecutionModeName(report.spec.execution), ")\n");
    if (report.failure && report.failure->program.empty()) {
        return absl::StrCat(header, "comparison failed: ", report.failure->message, "\n",
                            Transcripts(report, false));
    }
    if (report.failure) {
        return absl::StrCat(header, "capture of ", report.failure->program, " failed: ",
                            report.failure->message, "\n", Transcripts(report, false));
    }
    if (!report.verdict) {
        return header;
    }

    const Verdict& verdict = *report.verdict;
    switch (verdict.kind) {
        case Verdict::Kind::kLineCountMismatch:
            return absl::StrCat(header, "Unequal number of output lines:\n", Transcripts(report, true));
        case Verdict::Kind::kLineMismatch:
            return absl::StrCat(header, "failed to match in line ", verdict.index, ":\n",
                                "  actual:   ", verdict.actual_line, "\n",
                                "  expected: ", verdict.expected_line, "\n",
                                "of:\n", Transcripts(report, false));
        case Verdict::Kind::kEqual:
            break;
    }
    return header;
}

std::string FormatSuite(const SuiteReport& reports) {
    std::string out;
    size_t passed = 0;
    for (const auto& entry : reports) {
        absl::StrAppend(&out, FormatSummaryLine(entry.second), "\n");
        if (entry.second.passed()) ++passed;
    }
    for (const auto& entry : reports) {
        if (entry.second.passed()) continue;
        absl::StrAppend(&out, "\n", FormatDiagnostic(entry.second));
    }
    absl::StrAppend(&out, "\n", passed, "/", reports.size(), " traces passed\n");
    return out;
}

} // namespace TraceDiff
