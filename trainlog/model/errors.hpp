#pragma once

#include <stdexcept>
#include <string>

namespace trainlog {

// Base of the errors that reject a single exercise line.
struct LineError : public std::runtime_error {
    explicit LineError(const std::string& message)
        : std::runtime_error(message) {}
};

// Zero-rep or zero-set notation, or a line that documents no set at all.
struct MalformedSetError : public LineError {
    explicit MalformedSetError(const std::string& message)
        : LineError(message) {}
};

// Negative, non-finite or out-of-range numeric literal.
struct NumericRangeError : public LineError {
    explicit NumericRangeError(const std::string& message)
        : LineError(message) {}
};

}  // namespace trainlog
