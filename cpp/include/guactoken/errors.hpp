#pragma once

#include <stdexcept>
#include <string>

namespace guactoken {

// Secret key is unusable; raised before any descriptor or cipher work.
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& message) : std::runtime_error(message) {}
};

// A descriptor is missing a required field for its protocol or mode.
class ValidationError : public std::runtime_error {
public:
    explicit ValidationError(const std::string& message) : std::runtime_error(message) {}
};

// A token could not be turned back into a descriptor.
class DecodeError : public std::runtime_error {
public:
    explicit DecodeError(const std::string& message) : std::runtime_error(message) {}
};

}  // namespace guactoken
