#pragma once

#include "qrouter/common/common.hpp"
#include "qrouter/common/enums/query_type.hpp"

#include <stdexcept>

namespace qrouter {

enum class ExceptionType : uint8_t {
    INVALID = 0,
    INVALID_INPUT,
    PLANNER,
    ENGINE,
    EXECUTION,
    INTERRUPT,
    CONNECTION,
    CONFIGURATION,
    INTERNAL
};

class Exception : public std::runtime_error {
public:
    Exception(ExceptionType exception_type, const string &message);

    ExceptionType type;

public:
    static string ExceptionTypeToString(ExceptionType type);
    const string &RawMessage() const {
        return raw_message;
    }

private:
    string raw_message;
};

//! Planning failed. The heuristic planner never raises it for query text; plan-based routing does
class PlanningException : public Exception {
public:
    explicit PlanningException(const string &message);
};

//! Raised by an engine adapter when its backend rejects or fails a statement
class EngineException : public Exception {
public:
    explicit EngineException(const string &message);
};

//! Router-level wrapper around an engine failure, attributable to one routing decision
class EngineExecutionException : public Exception {
public:
    EngineExecutionException(QueryType query_type, const string &engine_name, const string &cause);

    QueryType query_type;
    string engine_name;
    string cause;
};

//! The client context was cancelled or its deadline passed
class CancellationException : public Exception {
public:
    explicit CancellationException(const string &message);
};

class ConnectionException : public Exception {
public:
    explicit ConnectionException(const string &message);
};

class ConfigurationException : public Exception {
public:
    explicit ConfigurationException(const string &message);
};

class InvalidInputException : public Exception {
public:
    explicit InvalidInputException(const string &message);
};

class InternalException : public Exception {
public:
    explicit InternalException(const string &message);
};

} // namespace qrouter
