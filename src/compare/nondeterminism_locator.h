#ifndef TRACEDIFF_SRC_COMPARE_NONDETERMINISM_LOCATOR_H_
#define TRACEDIFF_SRC_COMPARE_NONDETERMINISM_LOCATOR_H_

#include <regex>
#include <string>
#include <vector>

#include "line_locator.h"

namespace TraceDiff {

/**
 * Locator for the two line shapes whose content legitimately includes an
 * OS-assigned process id. Regexes only recognize the bounded head of a line;
 * the rest is taken verbatim, so matching cost does not grow with line length.
 *
 * Process listing (tried first):
 *   <ws><pid>( pts/<n>...)<program>(rest)
 *   prefix = terminal annotation up to the first program token that is a
 *   whole path component (after start, whitespace or '/', before whitespace
 *   or end of line), suffix = everything after it. Without such a token the
 *   prefix runs to the end and the suffix is empty.
 *
 * Job annotation:
 *   ((Job )?[<jid>]) (<pid>)(rest)
 *   prefix = bracketed job slot, suffix = everything after ')'.
 *
 * Anything else, including a line that starts like one of the shapes but
 * does not complete it, is kPlain. Instances are immutable and may be shared
 * between threads.
 */
class NondeterminismLocator : public ILineLocator {
public:
    // Program names of the shells under test, e.g. {"tsh", "tshref"}
    static std::vector<std::string> DefaultProgramTokens();

    NondeterminismLocator();
    explicit NondeterminismLocator(std::vector<std::string> program_tokens);

    std::optional<MaskedField> Locate(const std::string& line) const override;

    LineShape Classify(const std::string& line) const;

    const std::vector<std::string>& program_tokens() const { return program_tokens_; }

private:
    std::vector<std::string> program_tokens_;  // longest first
    std::regex process_head_;
    std::regex job_head_;
};

} // namespace TraceDiff

#endif // TRACEDIFF_SRC_COMPARE_NONDETERMINISM_LOCATOR_H_
