#pragma once

#include <stdexcept>
#include <string>

// Startup faults: the service refuses to come up.
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& message) : std::runtime_error(message) {}
};

class AssetNotFoundError : public std::runtime_error {
public:
    explicit AssetNotFoundError(const std::string& message) : std::runtime_error(message) {}
};

class AssetFormatError : public std::runtime_error {
public:
    explicit AssetFormatError(const std::string& message) : std::runtime_error(message) {}
};

// Request-time faults, mapped to HTTP 500 and 400 respectively.
class ServerFault : public std::runtime_error {
public:
    explicit ServerFault(const std::string& message) : std::runtime_error(message) {}
};

class QueryError : public std::runtime_error {
public:
    explicit QueryError(const std::string& message) : std::runtime_error(message) {}
};
