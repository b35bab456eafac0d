#pragma once

#include <stdexcept>
#include <string>

namespace timekeep {

// Bad caller input: blank project name, unparseable timestamp, invalid or
// inverted date range. Raised before any row is touched.
class ValidationError : public std::invalid_argument {
public:
    explicit ValidationError(const std::string &message)
        : std::invalid_argument(message)
    {
    }
};

// SQLite or file I/O failure. Fatal to the operation that raised it.
class StorageError : public std::runtime_error {
public:
    explicit StorageError(const std::string &message)
        : std::runtime_error(message)
    {
    }
};

} // namespace timekeep
