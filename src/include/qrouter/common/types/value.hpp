#pragma once

#include "qrouter/common/common.hpp"

#include <nlohmann/json.hpp>

namespace qrouter {

enum class ValueType : uint8_t { SQLNULL = 0, BOOLEAN, BIGINT, DOUBLE, VARCHAR };

//! A single cell of a result row, or a bound parameter
class Value {
public:
    //! Creates a NULL value
    Value();
    //! Creates a VARCHAR value
    Value(string val); // NOLINT: allow implicit conversion from string
    Value(const char *val); // NOLINT

    static Value BOOLEAN(bool val);
    static Value BIGINT(int64_t val);
    static Value DOUBLE(double val);

    ValueType type() const {
        return value_type;
    }
    bool IsNull() const {
        return value_type == ValueType::SQLNULL;
    }

    bool GetBoolean() const;
    int64_t GetBigint() const;
    double GetDouble() const;
    const string &GetString() const;

    //! Text form used by the tab-separated renderer and for text-protocol parameters ("NULL" for null)
    string ToString() const;
    nlohmann::json ToJSON() const;

    bool operator==(const Value &other) const;
    bool operator!=(const Value &other) const {
        return !(*this == other);
    }

private:
    ValueType value_type;
    bool bool_value = false;
    int64_t bigint_value = 0;
    double double_value = 0.0;
    string str_value;
};

} // namespace qrouter
