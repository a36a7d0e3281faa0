#pragma once

#include <statq/core/string_hash.hpp>
#include <statq/stats/qualifier.hpp>
#include <array>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace statq::stats {

// ============================================================================
// StatId - Identity of a measured quantity
// ============================================================================

// Hash of the stat's unique name. Equality and hashing never look at the
// value kind, which lives in the StatDefinition.
class StatId {
public:
    constexpr StatId() = default;
    constexpr explicit StatId(core::StringHash hash) : m_hash(hash) {}

    static constexpr StatId from_name(std::string_view name) {
        return StatId(core::StringHash(name));
    }

    constexpr uint64_t value() const { return m_hash.value(); }
    constexpr bool valid() const { return !m_hash.empty(); }

    constexpr bool operator==(StatId other) const { return m_hash == other.m_hash; }
    constexpr bool operator!=(StatId other) const { return m_hash != other.m_hash; }
    constexpr bool operator<(StatId other) const { return m_hash < other.m_hash; }

private:
    core::StringHash m_hash;
};

/// Usage: auto damage = "Damage"_stat;
constexpr StatId operator""_stat(const char* str, size_t len) {
    return StatId::from_name(std::string_view(str, len));
}

} // namespace statq::stats

namespace std {
    template<>
    struct hash<statq::stats::StatId> {
        size_t operator()(statq::stats::StatId id) const noexcept {
            return static_cast<size_t>(id.value());
        }
    };
} // namespace std

namespace statq::stats {

// ============================================================================
// ValueKind - How a stat folds its operations
// ============================================================================

enum class ValueKind : uint8_t {
    Float,          // clamp((base + sum(add)) * prod(mul), min, max)
    FloatAdditive,  // clamp((base + sum(add)) * (1 + sum(mul)), min, max)
    Int,            // clamp((base + sum(add)) * prod(mul), min, max), integer arithmetic
    IntPercent,     // clamp((base + sum(add)) * (100 + sum(mul)) / 100, min, max), truncated
    Bool            // base || any(or)
};

const char* value_kind_name(ValueKind kind);

// Accepts "float", "float_additive", "int", "int_percent", "bool"
std::optional<ValueKind> parse_value_kind(const std::string& name);

constexpr bool is_integer_kind(ValueKind kind) {
    return kind == ValueKind::Int || kind == ValueKind::IntPercent;
}

// ============================================================================
// StatDefinition - Registered metadata for a stat
// ============================================================================

struct StatDefinition {
    StatId id;
    std::string name;
    ValueKind kind = ValueKind::Float;

    // When false, a query with no default and no matching modifier fails
    // with StatNotFound instead of yielding zero
    bool has_zero = true;

    std::string description;

    static StatDefinition make(const std::string& name, ValueKind kind,
                               bool has_zero = true, const std::string& description = "") {
        return StatDefinition{StatId::from_name(name), name, kind, has_zero, description};
    }
};

// ============================================================================
// StatRegistry - Stat definitions and qualifier flag names
// ============================================================================

// Plain value type: build one at setup time and hand it to QuerierBuilder.
class StatRegistry {
public:
    // Rejects (returns false) a name already registered with a different kind or
    // zero policy. Registering an identical definition again is a no-op.
    bool register_stat(const StatDefinition& def);

    const StatDefinition* find(StatId id) const;
    const StatDefinition* find(const std::string& name) const;
    bool is_registered(StatId id) const;

    // Sorted by name
    std::vector<StatDefinition> all_stats() const;
    size_t stat_count() const { return m_definitions.size(); }

    // Name used in diagnostics, falls back to the hex id for unknown stats
    std::string stat_name(StatId id) const;

    // Qualifier adjectives. A name maps to one bit and a bit to one name.
    bool register_qualifier(const std::string& name, unsigned bit);
    std::optional<unsigned> qualifier_bit(const std::string& name) const;
    std::optional<QualifierFlags> qualifier_flag(const std::string& name) const;
    const std::string& qualifier_name(unsigned bit) const;
    size_t qualifier_count() const { return m_qualifier_bits.size(); }

    // OR of the named flags; names that are not registered are appended to unknown
    QualifierFlags parse_qualifier_flags(const std::vector<std::string>& names,
                                         std::vector<std::string>& unknown) const;

    // "Fire|Magic", unnamed bits as "bit7"
    std::string describe_flags(QualifierFlags flags) const;

private:
    std::unordered_map<StatId, StatDefinition> m_definitions;
    std::unordered_map<std::string, StatId> m_name_to_id;
    std::unordered_map<std::string, unsigned> m_qualifier_bits;
    std::array<std::string, MaxQualifierBits> m_qualifier_names;
};

} // namespace statq::stats
