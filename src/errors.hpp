#pragma once
#include <stdexcept>
#include <string>

namespace lunacore {

// Malformed write arguments. Raised before anything is written.
class InvalidInput : public std::runtime_error {
public:
    explicit InvalidInput(const std::string& what) : std::runtime_error(what) {}
};

// I/O failure, corruption or an unexpected constraint failure in storage.
// Never retried internally.
class StorageError : public std::runtime_error {
public:
    explicit StorageError(const std::string& what) : std::runtime_error(what) {}
};

// Invalid configuration or storage location at startup.
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& what) : std::runtime_error(what) {}
};

} // namespace lunacore
