#include "verdict.h"

#include <absl/strings/str_cat.h>

namespace TraceDiff {

Verdict Verdict::LineCountMismatch(size_t expected, size_t actual) {
    Verdict verdict;
    verdict.kind = Kind::kLineCountMismatch;
    verdict.expected_lines = expected;
    verdict.actual_lines = actual;
    return verdict;
}

Verdict Verdict::LineMismatch(size_t index, std::string actual, std::string expected) {
    Verdict verdict;
    verdict.kind = Kind::kLineMismatch;
    verdict.index = index;
    verdict.actual_line = std::move(actual);
    verdict.expected_line = std::move(expected);
    return verdict;
}

std::string Verdict::ToString() const {
    switch (kind) {
        case Kind::kEqual:
            return "equal";
        case Kind::kLineCountMismatch:
            return absl::StrCat("line count differs (expected ", expected_lines,
                                ", actual ", actual_lines, ")");
        case Kind::kLineMismatch:
            return absl::StrCat("line ", index, " differs");
    }
    return "unknown";
}

} // namespace TraceDiff
