#pragma once

#include <string>

namespace TraceDiff {

// "trace07.txt"; ids above 99 are not truncated.
std::string TraceFileName(int trace);

/**
 * Builds the driver command line for one (trace, program) pair:
 *   <driver> -t trace<NN>.txt -s <program> -a "<flags>"
 * flags are passed through verbatim.
 */
std::string BuildCommand(const std::string& driver, int trace,
                         const std::string& program_path, const std::string& flags);

} // namespace TraceDiff
