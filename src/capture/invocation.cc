#include "invocation.h"

#include <absl/strings/str_cat.h>
#include <absl/strings/str_format.h>

namespace TraceDiff {

std::string TraceFileName(int trace) {
    return absl::StrFormat("trace%02d.txt", trace);
}

std::string BuildCommand(const std::string& driver, int trace,
                         const std::string& program_path, const std::string& flags) {
    return absl::StrCat(driver, " -t ", TraceFileName(trace), " -s ", program_path,
                        " -a \"", flags, "\"");
}

} // namespace TraceDiff
