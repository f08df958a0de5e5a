#pragma once

#include <exception>
#include <stdexcept>
#include <string>

namespace mcpperf {

enum class ErrorKind {
    Configuration,  // missing executor/fetcher, invalid option values
    Timeout,        // pool acquire exceeded its deadline
    Transport,      // factory, connection, executor or fetch failure
    Shutdown,       // operation on a component that was shut down
    Cancelled       // queued batch call cancelled before it was flushed
};

// Base exception for every error raised by the toolkit
class McpPerfException : public std::runtime_error {
public:
    McpPerfException(ErrorKind kind, const std::string& message);

    ErrorKind kind() const { return m_kind; }

private:
    ErrorKind m_kind;
};

class ConfigurationError : public McpPerfException {
public:
    explicit ConfigurationError(const std::string& message)
        : McpPerfException(ErrorKind::Configuration, message) {}
};

class AcquireTimeoutError : public McpPerfException {
public:
    explicit AcquireTimeoutError(const std::string& message)
        : McpPerfException(ErrorKind::Timeout, message) {}
};

class TransportError : public McpPerfException {
public:
    explicit TransportError(const std::string& message)
        : McpPerfException(ErrorKind::Transport, message) {}
};

class ShutdownError : public McpPerfException {
public:
    explicit ShutdownError(const std::string& message)
        : McpPerfException(ErrorKind::Shutdown, message) {}
};

class BatchCancelledError : public McpPerfException {
public:
    explicit BatchCancelledError(const std::string& message)
        : McpPerfException(ErrorKind::Cancelled, message) {}
};

class ErrorHandler {
public:
    // Human-readable message for any captured exception
    static std::string describe(std::exception_ptr error);

    // Classify a captured exception; foreign exceptions count as transport errors
    static ErrorKind kindOf(std::exception_ptr error);

    static const char* toString(ErrorKind kind);

    // Wrap a non-toolkit exception so callers always see an McpPerfException
    static std::exception_ptr asTransportError(std::exception_ptr error,
                                               const std::string& context);
};

// RAII wrapper for setting/clearing error context
class ErrorContext {
public:
    ErrorContext(const std::string& context);
    ~ErrorContext();

    static std::string current();

private:
    static thread_local std::string s_currentContext;
    std::string m_previous;
};

}  // namespace mcpperf
