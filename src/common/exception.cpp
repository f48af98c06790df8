#include "qrouter/common/exception.hpp"

namespace qrouter {

Exception::Exception(ExceptionType exception_type, const string &message)
    : std::runtime_error(ExceptionTypeToString(exception_type) + " Error: " + message), type(exception_type),
      raw_message(message) {
}

string Exception::ExceptionTypeToString(ExceptionType type) {
    switch (type) {
    case ExceptionType::INVALID_INPUT:
        return "Invalid Input";
    case ExceptionType::PLANNER:
        return "Planning";
    case ExceptionType::ENGINE:
        return "Engine";
    case ExceptionType::EXECUTION:
        return "Execution";
    case ExceptionType::INTERRUPT:
        return "Cancellation";
    case ExceptionType::CONNECTION:
        return "Connection";
    case ExceptionType::CONFIGURATION:
        return "Configuration";
    case ExceptionType::INTERNAL:
        return "INTERNAL";
    default:
        return "Unknown";
    }
}

PlanningException::PlanningException(const string &message) : Exception(ExceptionType::PLANNER, message) {
}

EngineException::EngineException(const string &message) : Exception(ExceptionType::ENGINE, message) {
}

EngineExecutionException::EngineExecutionException(QueryType query_type_p, const string &engine_name_p,
                                                   const string &cause_p)
    : Exception(ExceptionType::EXECUTION, "query classified as " + QueryTypeToString(query_type_p) +
                                              " failed on engine \"" + engine_name_p + "\": " + cause_p),
      query_type(query_type_p), engine_name(engine_name_p), cause(cause_p) {
}

CancellationException::CancellationException(const string &message) : Exception(ExceptionType::INTERRUPT, message) {
}

ConnectionException::ConnectionException(const string &message) : Exception(ExceptionType::CONNECTION, message) {
}

ConfigurationException::ConfigurationException(const string &message)
    : Exception(ExceptionType::CONFIGURATION, message) {
}

InvalidInputException::InvalidInputException(const string &message)
    : Exception(ExceptionType::INVALID_INPUT, message) {
}

InternalException::InternalException(const string &message) : Exception(ExceptionType::INTERNAL, message) {
}

} // namespace qrouter
