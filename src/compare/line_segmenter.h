#pragma once

#include <string>
#include <vector>

#include <absl/strings/string_view.h>

namespace TraceDiff {

/**
 * Splits a transcript on '\n'.
 * A trailing terminator yields a final empty line, and "" yields {""}, so
 * line counts of two transcripts are directly comparable. Lines are not
 * trimmed; a '\r' stays part of its line.
 */
std::vector<std::string> SegmentLines(absl::string_view text);

} // namespace TraceDiff
