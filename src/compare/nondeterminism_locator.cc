#include "nondeterminism_locator.h"

#include <algorithm>

#include <absl/strings/ascii.h>
#include <absl/strings/match.h>
#include <absl/strings/string_view.h>
#include <absl/strings/str_join.h>
#include <glog/logging.h>

namespace TraceDiff {

namespace {

// Both heads are bounded; what follows them is taken verbatim.
// Groups: 1 = pid, 2 = start of the terminal annotation
const char kProcessHead[] = R"(([0-9]{1,10})( pts/[0-9]))";
// Groups: 1 = job slot, 2 = pid
const char kJobHead[] = R"(((?:Job )?\[[0-9]{1,10}\]) \(([0-9]{1,10})\))";

bool IsSpace(char c) {
    return absl::ascii_isspace(static_cast<unsigned char>(c));
}

// Position of the first token in text[from..] that is a whole path
// component, npos if none. Tokens are ordered longest first.
size_t FindProgramToken(const std::string& text, size_t from,
                        const std::vector<std::string>& tokens, size_t* length) {
    for (size_t pos = from; pos < text.size(); ++pos) {
        if (pos == 0 || !(text[pos - 1] == '/' || IsSpace(text[pos - 1]))) continue;
        const absl::string_view rest = absl::string_view(text).substr(pos);
        for (const auto& token : tokens) {
            if (!absl::StartsWith(rest, token)) continue;
            if (token.size() == rest.size() || IsSpace(rest[token.size()])) {
                *length = token.size();
                return pos;
            }
        }
    }
    return std::string::npos;
}

} // namespace

const char* LineShapeName(LineShape shape) {
    switch (shape) {
        case LineShape::kProcessListing: return "process-listing";
        case LineShape::kJobAnnotation: return "job-annotation";
        case LineShape::kPlain: return "plain";
    }
    return "unknown";
}

std::vector<std::string> NondeterminismLocator::DefaultProgramTokens() {
    return {"tshref", "tsh"};
}

NondeterminismLocator::NondeterminismLocator()
    : NondeterminismLocator(DefaultProgramTokens()) {}

NondeterminismLocator::NondeterminismLocator(std::vector<std::string> program_tokens)
    : program_tokens_(std::move(program_tokens)),
      process_head_(kProcessHead),
      job_head_(kJobHead) {
    program_tokens_.erase(std::remove(program_tokens_.begin(), program_tokens_.end(), std::string()),
                          program_tokens_.end());
    // At one position the longer token must win ("tshref" over "tsh").
    std::stable_sort(program_tokens_.begin(), program_tokens_.end(),
                     [](const std::string& a, const std::string& b) { return a.size() > b.size(); });
    VLOG(2) << "Locator program tokens: " << absl::StrJoin(program_tokens_, ",");
}

std::optional<MaskedField> NondeterminismLocator::Locate(const std::string& line) const {
    std::smatch match;

    size_t lead = 0;
    while (lead < line.size() && IsSpace(line[lead])) ++lead;
    if (lead > 0 && std::regex_search(line.begin() + lead, line.end(), match, process_head_,
                                      std::regex_constants::match_continuous)) {
        const size_t head_end = lead + static_cast<size_t>(match.length(0));
        MaskedField masked;
        masked.shape = LineShape::kProcessListing;
        masked.field = match[1].str();

        size_t token_length = 0;
        const size_t token = FindProgramToken(line, head_end, program_tokens_, &token_length);
        const size_t prefix_begin = lead + static_cast<size_t>(match.length(1));
        if (token == std::string::npos) {
            masked.prefix = line.substr(prefix_begin);
        } else {
            masked.prefix = line.substr(prefix_begin, token - prefix_begin);
            masked.suffix = line.substr(token + token_length);
        }
        return masked;
    }

    if (std::regex_search(line.begin(), line.end(), match, job_head_,
                          std::regex_constants::match_continuous)) {
        MaskedField masked;
        masked.shape = LineShape::kJobAnnotation;
        masked.prefix = match[1].str();
        masked.field = match[2].str();
        masked.suffix = line.substr(static_cast<size_t>(match.length(0)));
        return masked;
    }

    return std::nullopt;
}

LineShape NondeterminismLocator::Classify(const std::string& line) const {
    auto masked = Locate(line);
    return masked ? masked->shape : LineShape::kPlain;
}

} // namespace TraceDiff
