
#pragma once
#include <stdexcept>
#include <string>

// Raised for any invalid startup setting. The process must not run with one.
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& message) : std::runtime_error(message) {}
};
