#pragma once

#include <stdexcept>
#include <string>

namespace pfs_redact {

class PfsRedactError : public std::runtime_error {
public:
    explicit PfsRedactError(const std::string& message)
        : std::runtime_error(message) {}
};

class ConfigError : public PfsRedactError {
public:
    explicit ConfigError(const std::string& message)
        : PfsRedactError("Config error: " + message) {}
};

class InputError : public PfsRedactError {
public:
    explicit InputError(const std::string& message)
        : PfsRedactError("Input error: " + message) {}
};

class ConsistencyError : public PfsRedactError {
public:
    explicit ConsistencyError(const std::string& message)
        : PfsRedactError("Consistency error: " + message) {}
};

class IOError : public PfsRedactError {
public:
    explicit IOError(const std::string& message)
        : PfsRedactError("I/O error: " + message) {}
};

class FitsError : public IOError {
public:
    explicit FitsError(const std::string& message)
        : IOError("FITS error: " + message) {}
};

} // namespace pfs_redact
