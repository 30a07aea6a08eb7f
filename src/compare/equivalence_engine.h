#pragma once

#include <memory>
#include <string>
#include <vector>

#include <absl/strings/string_view.h>

#include "common/trace_spec.h"
#include "line_locator.h"
#include "verdict.h"

namespace TraceDiff {

/**
 * Positional line-by-line comparison of two transcripts.
 *
 * Line counts are checked first; a difference is reported as
 * LineCountMismatch without inspecting any line. Otherwise each pair is
 * compared in order and the first failing index is reported. In
 * kMaskNondeterminism mode a pair where both lines carry a masked field is
 * compared on prefix and suffix only; every other pair, and every pair in
 * kExact mode, must be byte-identical. There is no alignment, so one
 * inserted line shows up as a mismatch at its index.
 */
class EquivalenceEngine {
public:
    EquivalenceEngine();
    explicit EquivalenceEngine(std::shared_ptr<const ILineLocator> locator);

    Verdict Compare(const std::vector<std::string>& candidate_lines,
                    const std::vector<std::string>& reference_lines,
                    CompareMode mode = CompareMode::kMaskNondeterminism) const;

    // Segments both transcripts and compares them.
    Verdict CompareTranscripts(absl::string_view candidate, absl::string_view reference,
                               CompareMode mode = CompareMode::kMaskNondeterminism) const;

    bool LinesMatch(const std::string& candidate_line, const std::string& reference_line,
                    CompareMode mode) const;

private:
    std::shared_ptr<const ILineLocator> locator_;
};

} // namespace TraceDiff
