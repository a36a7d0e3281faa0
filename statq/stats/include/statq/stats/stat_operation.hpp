#pragma once

#include <statq/stats/qualifier.hpp>
#include <statq/stats/query_error.hpp>
#include <statq/stats/stat_definition.hpp>
#include <cstdint>
#include <optional>
#include <string>

namespace statq::stats {

// ============================================================================
// OperationType - The five unordered operations
// ============================================================================

enum class OperationType : uint8_t {
    Add,    // Running sum, identity 0
    Mul,    // Running product (or summed multiplier for additive kinds), identity 1
    Min,    // Raises the lower clamp bound
    Max,    // Lowers the upper clamp bound
    Or      // Logical or, Bool stats only
};

const char* operation_type_name(OperationType type);

// Accepts "add", "mul", "min", "max", "or"
std::optional<OperationType> parse_operation_type(const std::string& name);

// ============================================================================
// StatOperation - One operation with its operand
// ============================================================================

// Operands are carried as double. Integer kinds require an integral operand,
// Or stores 1.0 for true and 0.0 for false.
struct StatOperation {
    OperationType type = OperationType::Add;
    double value = 0.0;

    static StatOperation add(double v) { return {OperationType::Add, v}; }
    static StatOperation mul(double v) { return {OperationType::Mul, v}; }
    static StatOperation min(double v) { return {OperationType::Min, v}; }
    static StatOperation max(double v) { return {OperationType::Max, v}; }
    static StatOperation bit_or(bool v) { return {OperationType::Or, v ? 1.0 : 0.0}; }

    bool flag() const { return value != 0.0; }

    bool operator==(const StatOperation& other) const {
        return type == other.type && value == other.value;
    }
    bool operator!=(const StatOperation& other) const { return !(*this == other); }
};

std::string to_string(const StatOperation& op);

// Or only on Bool; Add/Mul/Min/Max only on numeric kinds; integer kinds
// need integral operands. Returns TypeMismatch when the pair does not fit.
QueryError validate_operation(ValueKind kind, const StatOperation& op);

// True for finite values without a fractional part that fit in int64
bool is_integral_value(double value);

// ============================================================================
// Modifier - A qualifier-tagged operation on one stat
// ============================================================================

struct Modifier {
    Qualifier qualifier;
    StatId stat;
    StatOperation operation;
    std::string source_id;      // "preset:warrior", "item:iron_sword"
};

} // namespace statq::stats
