#pragma once

#include <stdexcept>
#include <string>

namespace showgrab {
namespace core {

enum class ErrorKind {
    None,
    Parse,
    Fetch,
    Config,
    Range,
    Conflict,
    Network,
    Filesystem,
    Usage
};

std::string toString(ErrorKind kind);

// Base class for every error the core reports
class Error : public std::runtime_error {
public:
    Error(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

// Feed document root could not be located
class ParseError : public Error {
public:
    explicit ParseError(const std::string& message) : Error(ErrorKind::Parse, message) {}
};

class FetchError : public Error {
public:
    explicit FetchError(const std::string& message) : Error(ErrorKind::Fetch, message) {}
};

class ConfigError : public Error {
public:
    explicit ConfigError(const std::string& message) : Error(ErrorKind::Config, message) {}
};

class RangeError : public Error {
public:
    explicit RangeError(const std::string& message) : Error(ErrorKind::Range, message) {}
};

// A download or fetch is already running
class ConflictError : public Error {
public:
    explicit ConflictError(const std::string& message) : Error(ErrorKind::Conflict, message) {}
};

class NetworkError : public Error {
public:
    explicit NetworkError(const std::string& message) : Error(ErrorKind::Network, message) {}
};

class FilesystemError : public Error {
public:
    explicit FilesystemError(const std::string& message) : Error(ErrorKind::Filesystem, message) {}
};

// API called in a state that does not allow it
class UsageError : public Error {
public:
    explicit UsageError(const std::string& message) : Error(ErrorKind::Usage, message) {}
};

} // namespace core
} // namespace showgrab
