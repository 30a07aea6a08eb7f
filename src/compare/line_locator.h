#pragma once

#include <optional>
#include <string>

namespace TraceDiff {

enum class LineShape {
    kProcessListing,  // " 1234 pts/0    S   0:00 ./tsh -p"
    kJobAnnotation,   // "[1] (1234) ./myspin 2 &", "Job [1] (1234) stopped by signal 20"
    kPlain
};

const char* LineShapeName(LineShape shape);

/**
 * A nondeterministic field located in one line.
 * prefix and suffix are the stable fragments compared between the two
 * transcripts; field is the run-dependent value and is never compared.
 */
struct MaskedField {
    LineShape shape = LineShape::kPlain;
    std::string prefix;
    std::string field;
    std::string suffix;
};

/**
 * Interface for locating the masked field of a line.
 * nullopt means the line must be compared literally.
 */
class ILineLocator {
public:
    virtual ~ILineLocator() = default;

    virtual std::optional<MaskedField> Locate(const std::string& line) const = 0;
};

} // namespace TraceDiff
