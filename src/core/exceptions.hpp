#pragma once

#include <stdexcept>
#include <string>

namespace orion {

class OrionException : public std::runtime_error {
public:
    explicit OrionException(const std::string& message) : std::runtime_error(message) {}
    explicit OrionException(const char* message) : std::runtime_error(message) {}
};

class ConfigurationError : public OrionException {
public:
    explicit ConfigurationError(const std::string& message)
        : OrionException("Configuration Error: " + message) {}
};

class NotAuthorizedError : public OrionException {
public:
    explicit NotAuthorizedError(const std::string& message)
        : OrionException("Not Authorized: " + message) {}
};

// Wrong phase, replayed minibatch or skipped step.
class InvalidStateError : public OrionException {
public:
    explicit InvalidStateError(const std::string& message)
        : OrionException("Invalid State: " + message) {}
};

class SystemNotIdleError : public OrionException {
public:
    explicit SystemNotIdleError(const std::string& message)
        : OrionException("System Not Idle: " + message) {}
};

class InvariantViolationError : public OrionException {
public:
    explicit InvariantViolationError(const std::string& message)
        : OrionException("Invariant Violation: " + message) {}
};

class ExecutionError : public OrionException {
public:
    explicit ExecutionError(const std::string& message)
        : OrionException("Execution Error: " + message) {}
};

class ValidationError : public OrionException {
public:
    explicit ValidationError(const std::string& message)
        : OrionException("Validation Error: " + message) {}
};

class ProtocolPausedError : public OrionException {
public:
    explicit ProtocolPausedError(const std::string& message)
        : OrionException("Protocol Paused: " + message) {}
};

} // namespace orion
