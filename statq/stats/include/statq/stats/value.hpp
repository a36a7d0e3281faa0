#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <variant>

namespace statq::stats {

// ============================================================================
// Value - Evaluated result of a stat query
// ============================================================================

class Value {
public:
    enum class Type : uint8_t {
        None,
        Bool,
        Int,
        Float
    };

    Value() : m_type(Type::None) {}
    explicit Value(bool v) : m_type(Type::Bool), m_value(v) {}
    explicit Value(int64_t v) : m_type(Type::Int), m_value(v) {}
    explicit Value(int v) : m_type(Type::Int), m_value(static_cast<int64_t>(v)) {}
    explicit Value(double v) : m_type(Type::Float), m_value(v) {}

    Type type() const { return m_type; }
    bool is_none() const { return m_type == Type::None; }
    bool is_bool() const { return m_type == Type::Bool; }
    bool is_int() const { return m_type == Type::Int; }
    bool is_float() const { return m_type == Type::Float; }
    bool is_numeric() const { return m_type == Type::Int || m_type == Type::Float; }

    // Type-checked getters (throw on type mismatch)
    bool as_bool() const {
        if (m_type != Type::Bool) throw std::runtime_error("Value is not a bool");
        return std::get<bool>(m_value);
    }

    int64_t as_int() const {
        if (m_type != Type::Int) throw std::runtime_error("Value is not an int");
        return std::get<int64_t>(m_value);
    }

    double as_float() const {
        if (m_type == Type::Float) return std::get<double>(m_value);
        if (m_type == Type::Int) return static_cast<double>(std::get<int64_t>(m_value));
        throw std::runtime_error("Value is not numeric");
    }

    // Safe getters with defaults
    bool get_bool(bool def = false) const {
        return m_type == Type::Bool ? std::get<bool>(m_value) : def;
    }

    int64_t get_int(int64_t def = 0) const {
        return m_type == Type::Int ? std::get<int64_t>(m_value) : def;
    }

    double get_float(double def = 0.0) const {
        if (m_type == Type::Float) return std::get<double>(m_value);
        if (m_type == Type::Int) return static_cast<double>(std::get<int64_t>(m_value));
        return def;
    }

    bool operator==(const Value& other) const {
        return m_type == other.m_type && m_value == other.m_value;
    }
    bool operator!=(const Value& other) const { return !(*this == other); }

    std::string to_string() const;

private:
    Type m_type;
    std::variant<std::monostate, bool, int64_t, double> m_value;
};

} // namespace statq::stats
