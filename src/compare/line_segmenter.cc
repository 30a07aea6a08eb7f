#include "line_segmenter.h"

#include <absl/strings/str_split.h>

namespace TraceDiff {

std::vector<std::string> SegmentLines(absl::string_view text) {
    return absl::StrSplit(text, '\n');
}

} // namespace TraceDiff
