#pragma once

#include <statq/core/string_hash.hpp>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>

namespace statq::stats {

// One bit per adjective ("Fire", "Magic", "Sword"...), names live in StatRegistry
using QualifierFlags = uint64_t;

constexpr size_t MaxQualifierBits = 64;

constexpr QualifierFlags qualifier_bit_flag(unsigned bit) {
    return bit < MaxQualifierBits ? (QualifierFlags{1} << bit) : QualifierFlags{0};
}

struct QualifierQuery;

// ============================================================================
// Qualifier - What a stored modifier applies to
// ============================================================================

// all_of: every bit must be present in the query.
// any_of: a single group, at least one bit must be present (0 = no group).
struct Qualifier {
    QualifierFlags all_of = 0;
    QualifierFlags any_of = 0;

    static constexpr Qualifier none() { return {}; }
    static constexpr Qualifier all(QualifierFlags flags) { return {flags, 0}; }
    static constexpr Qualifier any(QualifierFlags flags) { return {0, flags}; }

    constexpr Qualifier and_all(QualifierFlags flags) const { return {all_of | flags, any_of}; }
    constexpr Qualifier and_any(QualifierFlags flags) const { return {all_of, any_of | flags}; }

    constexpr bool is_none() const { return all_of == 0 && any_of == 0; }

    bool qualifies_as(const QualifierQuery& query) const;

    constexpr bool operator==(const Qualifier& other) const {
        return all_of == other.all_of && any_of == other.any_of;
    }
    constexpr bool operator!=(const Qualifier& other) const { return !(*this == other); }
    constexpr bool operator<(const Qualifier& other) const {
        return all_of != other.all_of ? all_of < other.all_of : any_of < other.any_of;
    }
};

// ============================================================================
// QualifierQuery - What a caller asks for
// ============================================================================

enum class QueryMode : uint8_t {
    Aggregate,  // Every stored qualifier equal to or more general than the flags
    Exact       // Only stored qualifiers with identical all_of/any_of
};

struct QualifierQuery {
    QueryMode mode = QueryMode::Aggregate;
    QualifierFlags all_of = 0;
    QualifierFlags any_of = 0;

    static constexpr QualifierQuery aggregate(QualifierFlags flags) {
        return {QueryMode::Aggregate, flags, 0};
    }
    static constexpr QualifierQuery exact(QualifierFlags all_of, QualifierFlags any_of = 0) {
        return {QueryMode::Exact, all_of, any_of};
    }
    static constexpr QualifierQuery exact(const Qualifier& qualifier) {
        return {QueryMode::Exact, qualifier.all_of, qualifier.any_of};
    }
    static constexpr QualifierQuery none() { return aggregate(0); }

    constexpr bool operator==(const QualifierQuery& other) const {
        return mode == other.mode && all_of == other.all_of && any_of == other.any_of;
    }
    constexpr bool operator!=(const QualifierQuery& other) const { return !(*this == other); }
};

// Aggregate(q): stored.all_of is a subset of q and, if stored has an any_of
// group, it intersects q. Exact: bitwise equality of both sets.
bool matches(const QualifierQuery& query, const Qualifier& stored);

std::string to_string(const Qualifier& qualifier);
std::string to_string(const QualifierQuery& query);

} // namespace statq::stats

namespace std {
    template<>
    struct hash<statq::stats::QualifierQuery> {
        size_t operator()(const statq::stats::QualifierQuery& q) const noexcept {
            uint64_t h = statq::core::detail::hash_combine(static_cast<uint64_t>(q.mode), q.all_of);
            return static_cast<size_t>(statq::core::detail::hash_combine(h, q.any_of));
        }
    };
} // namespace std
