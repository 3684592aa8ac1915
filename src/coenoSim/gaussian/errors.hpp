#pragma once

#include <stdexcept>
#include <string>

// ---- Error taxonomy ---- //
// Sequences whose lengths must agree do not.
class DimensionMismatch : public std::invalid_argument {
public:
    explicit DimensionMismatch(const std::string& what)
        : std::invalid_argument(what) {}
};

// A scalar or elementwise parameter lies outside its valid range.
class InvalidParameter : public std::invalid_argument {
public:
    explicit InvalidParameter(const std::string& what)
        : std::invalid_argument(what) {}
};
