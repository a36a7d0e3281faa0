#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

namespace statq::core {

// FNV-1a hash constants for 64-bit
namespace detail {
    constexpr uint64_t FNV_OFFSET_BASIS = 14695981039346656037ULL;
    constexpr uint64_t FNV_PRIME = 1099511628211ULL;

    constexpr uint64_t fnv1a_hash(const char* str, size_t len) {
        uint64_t hash = FNV_OFFSET_BASIS;
        for (size_t i = 0; i < len; ++i) {
            hash ^= static_cast<uint64_t>(static_cast<unsigned char>(str[i]));
            hash *= FNV_PRIME;
        }
        return hash;
    }

    // Mixes an extra 64-bit value into an existing hash (used for composite keys)
    constexpr uint64_t hash_combine(uint64_t seed, uint64_t value) {
        return seed ^ (value + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2));
    }
} // namespace detail

/**
 * @brief 64-bit string hash for fast identity comparisons
 *
 * Hashes are computed with FNV-1a, at compile time for literals. The empty
 * hash (value 0) is reserved as "invalid".
 *
 * @code
 * constexpr auto strength = "Strength"_sh;
 * StringHash dynamic(name_from_config);
 * if (dynamic == strength) { ... }
 * @endcode
 */
class StringHash {
public:
    using HashType = uint64_t;

    constexpr StringHash() noexcept = default;

    constexpr StringHash(std::string_view str) noexcept
        : m_hash(str.empty() ? 0 : detail::fnv1a_hash(str.data(), str.size())) {}

    explicit StringHash(const std::string& str) noexcept
        : StringHash(std::string_view(str)) {}

    /// Construct from raw hash value (for deserialization)
    static constexpr StringHash from_hash(HashType hash) noexcept {
        StringHash result;
        result.m_hash = hash;
        return result;
    }

    [[nodiscard]] constexpr HashType value() const noexcept { return m_hash; }
    [[nodiscard]] constexpr bool empty() const noexcept { return m_hash == 0; }
    [[nodiscard]] constexpr explicit operator bool() const noexcept { return m_hash != 0; }

    [[nodiscard]] constexpr bool operator==(StringHash other) const noexcept { return m_hash == other.m_hash; }
    [[nodiscard]] constexpr bool operator!=(StringHash other) const noexcept { return m_hash != other.m_hash; }
    [[nodiscard]] constexpr bool operator<(StringHash other) const noexcept { return m_hash < other.m_hash; }

private:
    HashType m_hash = 0;
};

[[nodiscard]] constexpr uint64_t hash_string(std::string_view str) noexcept {
    return detail::fnv1a_hash(str.data(), str.size());
}

/// Usage: auto hash = "Player"_sh;
[[nodiscard]] constexpr StringHash operator""_sh(const char* str, size_t len) noexcept {
    return StringHash(std::string_view(str, len));
}

} // namespace statq::core

namespace std {
    template<>
    struct hash<statq::core::StringHash> {
        [[nodiscard]] size_t operator()(statq::core::StringHash sh) const noexcept {
            return static_cast<size_t>(sh.value());
        }
    };
} // namespace std
