#pragma once

#include <stdexcept>
#include <string>

namespace folio {

// Base for every error Folio raises on purpose
class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Chapter index (or other lookup) out of range
class NotFoundError : public Error {
public:
    using Error::Error;
};

// Archive entry, markup or image that cannot be read
class CorruptedContentError : public Error {
public:
    using Error::Error;
};

// Invalid capacity/budget/threshold; raised at construction and never recovered
class ConfigurationError : public Error {
public:
    using Error::Error;
};

} // namespace folio
