#pragma once

#include <stdexcept>
#include <string>

// Base of every failure raised by the data-access core.
class ExplorerError : public std::runtime_error {
public:
    explicit ExplorerError(const std::string& message)
        : std::runtime_error(message) {}
};

// Transport failure, timeout or non-2xx HTTP status.
class NetworkError : public ExplorerError {
public:
    explicit NetworkError(const std::string& message)
        : ExplorerError("Network error: " + message) {}
};

// Malformed address, hash or parameter. Raised before any network call.
class ValidationError : public ExplorerError {
public:
    explicit ValidationError(const std::string& message)
        : ExplorerError("Validation error: " + message) {}
};

// Well-formed request rejected by the backend (JSON-RPC error, API status != 1).
class BlockchainError : public ExplorerError {
public:
    explicit BlockchainError(const std::string& message)
        : ExplorerError("Blockchain error: " + message) {}
};

// Response received but not in the expected shape.
class ParseError : public ExplorerError {
public:
    explicit ParseError(const std::string& message)
        : ExplorerError("Parse error: " + message) {}
};
