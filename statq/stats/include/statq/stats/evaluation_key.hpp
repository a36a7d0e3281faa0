#pragma once

#include <statq/core/string_hash.hpp>
#include <statq/scene/entity.hpp>
#include <statq/stats/qualifier.hpp>
#include <statq/stats/stat_definition.hpp>
#include <functional>
#include <string>

namespace statq::stats {

// ============================================================================
// EvaluationKey - (entity, query, stat), the cache key and cycle token
// ============================================================================

struct EvaluationKey {
    scene::Entity entity = scene::NullEntity;
    QualifierQuery query;
    StatId stat;

    bool operator==(const EvaluationKey& other) const {
        return entity == other.entity && query == other.query && stat == other.stat;
    }
    bool operator!=(const EvaluationKey& other) const { return !(*this == other); }

    // "entity 3 Aggregate(0x5) stat#..." without registry names
    std::string to_string() const;
};

} // namespace statq::stats

namespace std {
    template<>
    struct hash<statq::stats::EvaluationKey> {
        size_t operator()(const statq::stats::EvaluationKey& key) const noexcept {
            uint64_t h = static_cast<uint64_t>(entt::to_integral(key.entity));
            h = statq::core::detail::hash_combine(h, std::hash<statq::stats::QualifierQuery>{}(key.query));
            return static_cast<size_t>(statq::core::detail::hash_combine(h, key.stat.value()));
        }
    };
} // namespace std
