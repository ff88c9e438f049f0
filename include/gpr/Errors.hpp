#pragma once
#include <stdexcept>

// Frame cannot become a trace (empty column, non-finite coordinate)
class TransformError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Trace does not match the sample count established by the session
class BufferInvariantViolation : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};
