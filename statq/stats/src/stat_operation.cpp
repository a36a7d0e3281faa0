#include <statq/stats/stat_operation.hpp>
#include <cmath>
#include <format>

namespace statq::stats {

const char* operation_type_name(OperationType type) {
    switch (type) {
        case OperationType::Add: return "add";
        case OperationType::Mul: return "mul";
        case OperationType::Min: return "min";
        case OperationType::Max: return "max";
        case OperationType::Or:  return "or";
    }
    return "unknown";
}

std::optional<OperationType> parse_operation_type(const std::string& name) {
    if (name == "add") return OperationType::Add;
    if (name == "mul") return OperationType::Mul;
    if (name == "min") return OperationType::Min;
    if (name == "max") return OperationType::Max;
    if (name == "or")  return OperationType::Or;
    return std::nullopt;
}

std::string to_string(const StatOperation& op) {
    if (op.type == OperationType::Or) {
        return std::format("or({})", op.flag());
    }
    return std::format("{}({})", operation_type_name(op.type), op.value);
}

bool is_integral_value(double value) {
    // 2^63 is exactly representable, anything at or past it overflows int64
    constexpr double limit = 9223372036854775808.0;
    return std::isfinite(value) && std::trunc(value) == value && value >= -limit && value < limit;
}

QueryError validate_operation(ValueKind kind, const StatOperation& op) {
    if (kind == ValueKind::Bool) {
        return op.type == OperationType::Or ? QueryError::None : QueryError::TypeMismatch;
    }

    if (op.type == OperationType::Or) return QueryError::TypeMismatch;
    if (std::isnan(op.value)) return QueryError::TypeMismatch;

    if (is_integer_kind(kind) && !is_integral_value(op.value)) {
        return QueryError::TypeMismatch;
    }
    return QueryError::None;
}

} // namespace statq::stats
