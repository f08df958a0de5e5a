#include "ErrorHandler.hpp"

namespace mcpperf {

thread_local std::string ErrorContext::s_currentContext;

McpPerfException::McpPerfException(ErrorKind kind, const std::string& message)
    : std::runtime_error(message)
    , m_kind(kind) {
}

std::string ErrorHandler::describe(std::exception_ptr error) {
    if (!error) {
        return "No error";
    }
    try {
        std::rethrow_exception(error);
    } catch (const std::exception& e) {
        return e.what();
    } catch (const std::string& s) {
        return s;
    } catch (const char* s) {
        return s ? std::string(s) : std::string("Unknown error");
    } catch (...) {
        return "Unknown error";
    }
}

ErrorKind ErrorHandler::kindOf(std::exception_ptr error) {
    if (!error) {
        return ErrorKind::Transport;
    }
    try {
        std::rethrow_exception(error);
    } catch (const McpPerfException& e) {
        return e.kind();
    } catch (...) {
        return ErrorKind::Transport;
    }
}

const char* ErrorHandler::toString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Configuration:
            return "Configuration";
        case ErrorKind::Timeout:
            return "Timeout";
        case ErrorKind::Transport:
            return "Transport";
        case ErrorKind::Shutdown:
            return "Shutdown";
        case ErrorKind::Cancelled:
            return "Cancelled";
    }
    return "Unknown";
}

std::exception_ptr ErrorHandler::asTransportError(std::exception_ptr error,
                                                  const std::string& context) {
    try {
        std::rethrow_exception(error);
    } catch (const McpPerfException&) {
        return error;
    } catch (...) {
        std::string message = describe(error);
        if (!context.empty()) {
            message = context + ": " + message;
        }
        return std::make_exception_ptr(TransportError(message));
    }
}

ErrorContext::ErrorContext(const std::string& context)
    : m_previous(s_currentContext) {
    if (s_currentContext.empty()) {
        s_currentContext = context;
    } else {
        s_currentContext = s_currentContext + " > " + context;
    }
}

ErrorContext::~ErrorContext() {
    s_currentContext = m_previous;
}

std::string ErrorContext::current() {
    return s_currentContext;
}

}  // namespace mcpperf
