#pragma once

#include <statq/stats/query_error.hpp>
#include <statq/stats/stat_defaults.hpp>
#include <statq/stats/stat_definition.hpp>
#include <statq/stats/stat_operation.hpp>
#include <statq/stats/value.hpp>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace statq::stats {

// ============================================================================
// StatValue - Commutative accumulator for one stat evaluation
// ============================================================================

// Bounds and or-flags merge as they are folded. Add and Mul operands are
// kept and reduced in sorted order by evaluate(), so the result depends only
// on the multiset of folded operations, bit for bit, for every kind.
//
// evaluate() combines them per kind (see ValueKind), applying the upper
// bound and then the lower bound. Integer kinds saturate at the int64 range.
class StatValue {
public:
    StatValue() = default;
    explicit StatValue(ValueKind kind);

    // Fresh accumulator carrying the registered base value and bounds, if any
    static StatValue seeded(ValueKind kind, const StatDefault* defaults);

    // TypeMismatch leaves the accumulator untouched
    QueryError fold(const StatOperation& op);

    // Merges the operations folded into other. A base is only taken when this
    // accumulator has none. TypeMismatch when the kinds differ.
    QueryError join(const StatValue& other);

    Value evaluate() const;

    ValueKind kind() const { return m_kind; }

    // Nothing seeded and nothing folded
    bool empty() const { return !m_seeded && m_fold_count == 0; }
    size_t fold_count() const { return m_fold_count; }

    std::optional<double> lower_bound() const { return m_lower; }
    std::optional<double> upper_bound() const { return m_upper; }

private:
    Value evaluate_float() const;
    Value evaluate_int() const;

    ValueKind m_kind = ValueKind::Float;
    bool m_seeded = false;

    std::optional<double> m_base;

    std::vector<double> m_adds;
    std::vector<double> m_muls;

    std::optional<double> m_lower;
    std::optional<double> m_upper;

    bool m_or = false;

    size_t m_fold_count = 0;
};

} // namespace statq::stats
