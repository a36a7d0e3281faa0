#include <statq/stats/stat_value.hpp>
#include <algorithm>
#include <limits>

namespace statq::stats {

namespace {

constexpr int64_t IntMax = std::numeric_limits<int64_t>::max();
constexpr int64_t IntMin = std::numeric_limits<int64_t>::min();

void merge_lower(std::optional<double>& lower, double x) {
    lower = lower ? std::max(*lower, x) : x;
}

void merge_upper(std::optional<double>& upper, double x) {
    upper = upper ? std::min(*upper, x) : x;
}

int64_t saturating_add(int64_t a, int64_t b) {
    int64_t result;
    if (__builtin_add_overflow(a, b, &result)) {
        return b > 0 ? IntMax : IntMin;
    }
    return result;
}

int64_t saturating_mul(int64_t a, int64_t b) {
    int64_t result;
    if (__builtin_mul_overflow(a, b, &result)) {
        return (a < 0) != (b < 0) ? IntMin : IntMax;
    }
    return result;
}

// trunc(value * percent / 100) without forming value * percent
int64_t apply_percent(int64_t value, int64_t percent) {
    int64_t whole = saturating_mul(value / 100, percent);
    int64_t part = saturating_mul(value % 100, percent) / 100;
    return saturating_add(whole, part);
}

// Operands are reduced in ascending order so any fold order gives the same bits
std::vector<double> sorted(const std::vector<double>& operands) {
    std::vector<double> result = operands;
    std::sort(result.begin(), result.end());
    return result;
}

double sum_of(const std::vector<double>& operands) {
    double sum = 0.0;
    for (double x : sorted(operands)) sum += x;
    return sum;
}

int64_t int_sum_of(int64_t start, const std::vector<double>& operands) {
    int64_t sum = start;
    for (double x : sorted(operands)) sum = saturating_add(sum, static_cast<int64_t>(x));
    return sum;
}

} // anonymous namespace

StatValue::StatValue(ValueKind kind)
    : m_kind(kind) {
}

StatValue StatValue::seeded(ValueKind kind, const StatDefault* defaults) {
    StatValue value(kind);
    if (!defaults) return value;

    value.m_seeded = true;
    value.m_base = defaults->base;
    value.m_lower = defaults->lower;
    value.m_upper = defaults->upper;
    return value;
}

QueryError StatValue::fold(const StatOperation& op) {
    if (validate_operation(m_kind, op) != QueryError::None) {
        return QueryError::TypeMismatch;
    }

    switch (op.type) {
        case OperationType::Add:
            m_adds.push_back(op.value);
            break;
        case OperationType::Mul:
            m_muls.push_back(op.value);
            break;
        case OperationType::Min:
            merge_lower(m_lower, op.value);
            break;
        case OperationType::Max:
            merge_upper(m_upper, op.value);
            break;
        case OperationType::Or:
            m_or = m_or || op.flag();
            break;
    }

    ++m_fold_count;
    return QueryError::None;
}

QueryError StatValue::join(const StatValue& other) {
    if (other.m_kind != m_kind) {
        return QueryError::TypeMismatch;
    }

    if (!m_base) m_base = other.m_base;
    m_seeded = m_seeded || other.m_seeded;

    m_adds.insert(m_adds.end(), other.m_adds.begin(), other.m_adds.end());
    m_muls.insert(m_muls.end(), other.m_muls.begin(), other.m_muls.end());

    if (other.m_lower) merge_lower(m_lower, *other.m_lower);
    if (other.m_upper) merge_upper(m_upper, *other.m_upper);
    m_or = m_or || other.m_or;
    m_fold_count += other.m_fold_count;
    return QueryError::None;
}

Value StatValue::evaluate() const {
    switch (m_kind) {
        case ValueKind::Float:
        case ValueKind::FloatAdditive:
            return evaluate_float();
        case ValueKind::Int:
        case ValueKind::IntPercent:
            return evaluate_int();
        case ValueKind::Bool:
            return Value(m_or || m_base.value_or(0.0) != 0.0);
    }
    return Value();
}

Value StatValue::evaluate_float() const {
    double multiplier = 1.0;
    if (m_kind == ValueKind::FloatAdditive) {
        multiplier += sum_of(m_muls);
    } else {
        for (double x : sorted(m_muls)) multiplier *= x;
    }

    double result = (m_base.value_or(0.0) + sum_of(m_adds)) * multiplier;
    if (m_upper) result = std::min(result, *m_upper);
    if (m_lower) result = std::max(result, *m_lower);
    return Value(result);
}

Value StatValue::evaluate_int() const {
    int64_t result = int_sum_of(static_cast<int64_t>(m_base.value_or(0.0)), m_adds);
    if (m_kind == ValueKind::IntPercent) {
        // Percentage points add up; integer division truncates toward zero
        result = apply_percent(result, int_sum_of(100, m_muls));
    } else {
        for (double x : sorted(m_muls)) result = saturating_mul(result, static_cast<int64_t>(x));
    }

    if (m_upper) result = std::min(result, static_cast<int64_t>(*m_upper));
    if (m_lower) result = std::max(result, static_cast<int64_t>(*m_lower));
    return Value(result);
}

} // namespace statq::stats
