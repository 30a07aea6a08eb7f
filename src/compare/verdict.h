#pragma once

#include <cstddef>
#include <string>

namespace TraceDiff {

/**
 * Outcome of comparing a candidate transcript (actual) against a reference
 * transcript (expected). Mismatches are values, not errors.
 */
struct Verdict {
    enum class Kind {
        kEqual,
        kLineCountMismatch,
        kLineMismatch
    };

    Kind kind = Kind::kEqual;

    // kLineCountMismatch
    size_t expected_lines = 0;
    size_t actual_lines = 0;

    // kLineMismatch
    size_t index = 0;
    std::string actual_line;
    std::string expected_line;

    static Verdict Equal() { return Verdict(); }
    static Verdict LineCountMismatch(size_t expected, size_t actual);
    static Verdict LineMismatch(size_t index, std::string actual, std::string expected);

    bool ok() const { return kind == Kind::kEqual; }

    // One-line description, e.g. "line 3 differs"
    std::string ToString() const;
};

} // namespace TraceDiff
