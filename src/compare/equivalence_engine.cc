#include "equivalence_engine.h"

#include <stdexcept>

#include <glog/logging.h>

#include "line_segmenter.h"
#include "nondeterminism_locator.h"

namespace TraceDiff {

EquivalenceEngine::EquivalenceEngine()
    : locator_(std::make_shared<NondeterminismLocator>()) {}

EquivalenceEngine::EquivalenceEngine(std::shared_ptr<const ILineLocator> locator)
    : locator_(std::move(locator)) {
    if (!locator_) {
        throw std::invalid_argument("EquivalenceEngine requires a line locator");
    }
}

Verdict EquivalenceEngine::Compare(const std::vector<std::string>& candidate_lines,
                                   const std::vector<std::string>& reference_lines,
                                   CompareMode mode) const {
    if (candidate_lines.size() != reference_lines.size()) {
        return Verdict::LineCountMismatch(reference_lines.size(), candidate_lines.size());
    }

    for (size_t i = 0; i < candidate_lines.size(); ++i) {
        if (!LinesMatch(candidate_lines[i], reference_lines[i], mode)) {
            VLOG(1) << "Line " << i << " differs:\n  actual:   " << candidate_lines[i]
                    << "\n  expected: " << reference_lines[i];
            return Verdict::LineMismatch(i, candidate_lines[i], reference_lines[i]);
        }
    }
    return Verdict::Equal();
}

Verdict EquivalenceEngine::CompareTranscripts(absl::string_view candidate, absl::string_view reference,
                                              CompareMode mode) const {
    return Compare(SegmentLines(candidate), SegmentLines(reference), mode);
}

bool EquivalenceEngine::LinesMatch(const std::string& candidate_line, const std::string& reference_line,
                                   CompareMode mode) const {
    if (mode == CompareMode::kExact) {
        return candidate_line == reference_line;
    }

    auto actual = locator_->Locate(candidate_line);
    auto expected = locator_->Locate(reference_line);
    if (actual && expected) {
        // The pid (field) is expected to differ; everything around it is not.
        return actual->prefix == expected->prefix && actual->suffix == expected->suffix;
    }
    return candidate_line == reference_line;
}

} // namespace TraceDiff
