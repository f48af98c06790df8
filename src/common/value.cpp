#include "qrouter/common/types/value.hpp"
#include "qrouter/common/exception.hpp"

#include <sstream>

namespace qrouter {

Value::Value() : value_type(ValueType::SQLNULL) {
}

Value::Value(string val) : value_type(ValueType::VARCHAR), str_value(std::move(val)) {
}

Value::Value(const char *val) : Value(val ? string(val) : string()) {
    if (!val) {
        value_type = ValueType::SQLNULL;
    }
}

Value Value::BOOLEAN(bool val) {
    Value result;
    result.value_type = ValueType::BOOLEAN;
    result.bool_value = val;
    return result;
}

Value Value::BIGINT(int64_t val) {
    Value result;
    result.value_type = ValueType::BIGINT;
    result.bigint_value = val;
    return result;
}

Value Value::DOUBLE(double val) {
    Value result;
    result.value_type = ValueType::DOUBLE;
    result.double_value = val;
    return result;
}

bool Value::GetBoolean() const {
    if (value_type != ValueType::BOOLEAN) {
        throw InvalidInputException("value is not a BOOLEAN: " + ToString());
    }
    return bool_value;
}

int64_t Value::GetBigint() const {
    if (value_type != ValueType::BIGINT) {
        throw InvalidInputException("value is not a BIGINT: " + ToString());
    }
    return bigint_value;
}

double Value::GetDouble() const {
    if (value_type == ValueType::BIGINT) {
        return static_cast<double>(bigint_value);
    }
    if (value_type != ValueType::DOUBLE) {
        throw InvalidInputException("value is not numeric: " + ToString());
    }
    return double_value;
}

const string &Value::GetString() const {
    if (value_type != ValueType::VARCHAR) {
        throw InvalidInputException("value is not a VARCHAR: " + ToString());
    }
    return str_value;
}

string Value::ToString() const {
    switch (value_type) {
    case ValueType::SQLNULL:
        return "NULL";
    case ValueType::BOOLEAN:
        return bool_value ? "true" : "false";
    case ValueType::BIGINT:
        return std::to_string(bigint_value);
    case ValueType::DOUBLE: {
        std::ostringstream ss;
        ss.precision(17);
        ss << double_value;
        return ss.str();
    }
    case ValueType::VARCHAR:
        return str_value;
    }
    return string();
}

nlohmann::json Value::ToJSON() const {
    switch (value_type) {
    case ValueType::BOOLEAN:
        return bool_value;
    case ValueType::BIGINT:
        return bigint_value;
    case ValueType::DOUBLE:
        return double_value;
    case ValueType::VARCHAR:
        return str_value;
    default:
        return nullptr;
    }
}

bool Value::operator==(const Value &other) const {
    if (value_type != other.value_type) {
        return false;
    }
    switch (value_type) {
    case ValueType::SQLNULL:
        return true;
    case ValueType::BOOLEAN:
        return bool_value == other.bool_value;
    case ValueType::BIGINT:
        return bigint_value == other.bigint_value;
    case ValueType::DOUBLE:
        return double_value == other.double_value;
    case ValueType::VARCHAR:
        return str_value == other.str_value;
    }
    return false;
}

} // namespace qrouter
