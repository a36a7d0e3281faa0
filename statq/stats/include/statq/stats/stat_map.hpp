#pragma once

#include <statq/stats/qualifier.hpp>
#include <statq/stats/stat_defaults.hpp>
#include <statq/stats/stat_definition.hpp>
#include <statq/stats/stat_operation.hpp>
#include <statq/stats/value.hpp>
#include <algorithm>
#include <cstddef>
#include <string>
#include <vector>

namespace statq::stats {

// ============================================================================
// StatMap - ECS component holding an entity's own modifiers
// ============================================================================

// Modifiers are kept sorted by stat so lookups are a binary search. Operations
// are validated against the stat's kind on insertion, so a map never holds a
// modifier its stat cannot fold.
class StatMap {
public:
    // Returns false (and logs) when the operation does not fit def.kind
    bool add(const StatDefinition& def, const Qualifier& qualifier,
             const StatOperation& op, const std::string& source_id = "");

    // Returns number of modifiers removed
    size_t remove_by_source(const std::string& source_id);
    size_t remove_all(StatId stat);
    void clear() { m_modifiers.clear(); }

    size_t size() const { return m_modifiers.size(); }
    bool empty() const { return m_modifiers.empty(); }
    size_t count(StatId stat) const;
    bool has_source(const std::string& source_id) const;

    // Calls fn(const Modifier&) for every modifier on stat
    template<typename Fn>
    void for_each(StatId stat, Fn&& fn) const {
        auto [first, last] = std::equal_range(m_modifiers.begin(), m_modifiers.end(), stat, StatOrder{});
        for (auto it = first; it != last; ++it) {
            fn(*it);
        }
    }

    const std::vector<Modifier>& modifiers() const { return m_modifiers; }

    // Evaluates this map on its own: defaults (optional) plus every stored
    // modifier matching query. Mismatched modifiers cannot be stored, so
    // this never fails.
    Value query_stat(const StatDefinition& def, const QualifierQuery& query,
                     const StatDefault* defaults = nullptr) const;

private:
    struct StatOrder {
        bool operator()(const Modifier& m, StatId s) const { return m.stat < s; }
        bool operator()(StatId s, const Modifier& m) const { return s < m.stat; }
    };

    std::vector<Modifier> m_modifiers;
};

// ============================================================================
// StatPreset - Named bundle of modifiers
// ============================================================================

struct StatPreset {
    std::string preset_id;
    std::string display_name;
    std::vector<Modifier> modifiers;
};

// Adds every modifier of preset to map with source_id "preset:<id>".
// Modifiers on stats missing from registry are skipped with a warning.
// Returns number of modifiers added.
size_t apply_preset(StatMap& map, const StatRegistry& registry, const StatPreset& preset);

// "preset:<id>", the source_id apply_preset tags modifiers with
std::string preset_source_id(const std::string& preset_id);

} // namespace statq::stats
