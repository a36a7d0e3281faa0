#pragma once

#include <cstdint>

namespace statq::stats {

// ============================================================================
// QueryError - Why an evaluation or registration was refused
// ============================================================================

enum class QueryError : uint8_t {
    None = 0,
    CycleDetected,      // A stat's evaluation transitively required itself
    TypeMismatch,       // Operation does not fit the stat's value kind
    StatNotFound,       // Unregistered stat, or nothing to evaluate and no inherent zero
    InvalidEntity       // Entity is not alive in the world
};

inline const char* query_error_name(QueryError error) {
    switch (error) {
        case QueryError::None:          return "None";
        case QueryError::CycleDetected: return "CycleDetected";
        case QueryError::TypeMismatch:  return "TypeMismatch";
        case QueryError::StatNotFound:  return "StatNotFound";
        case QueryError::InvalidEntity: return "InvalidEntity";
    }
    return "Unknown";
}

} // namespace statq::stats
