#include <statq/stats/stat_map.hpp>
#include <statq/stats/stat_value.hpp>
#include <statq/core/log.hpp>

namespace statq::stats {

// ============================================================================
// StatMap Implementation
// ============================================================================

bool StatMap::add(const StatDefinition& def, const Qualifier& qualifier,
                  const StatOperation& op, const std::string& source_id) {
    if (validate_operation(def.kind, op) != QueryError::None) {
        core::log(core::LogLevel::Warn, "[Stats] Rejected {} on {} stat '{}'",
                  to_string(op), value_kind_name(def.kind), def.name);
        return false;
    }

    // Insert after existing modifiers of the same stat
    auto pos = std::upper_bound(m_modifiers.begin(), m_modifiers.end(), def.id, StatOrder{});
    m_modifiers.insert(pos, Modifier{qualifier, def.id, op, source_id});
    return true;
}

size_t StatMap::remove_by_source(const std::string& source_id) {
    auto it = std::remove_if(m_modifiers.begin(), m_modifiers.end(),
        [&source_id](const Modifier& m) { return m.source_id == source_id; });
    size_t removed = static_cast<size_t>(std::distance(it, m_modifiers.end()));
    m_modifiers.erase(it, m_modifiers.end());
    return removed;
}

size_t StatMap::remove_all(StatId stat) {
    auto [first, last] = std::equal_range(m_modifiers.begin(), m_modifiers.end(), stat, StatOrder{});
    size_t removed = static_cast<size_t>(std::distance(first, last));
    m_modifiers.erase(first, last);
    return removed;
}

size_t StatMap::count(StatId stat) const {
    auto [first, last] = std::equal_range(m_modifiers.begin(), m_modifiers.end(), stat, StatOrder{});
    return static_cast<size_t>(std::distance(first, last));
}

bool StatMap::has_source(const std::string& source_id) const {
    return std::any_of(m_modifiers.begin(), m_modifiers.end(),
        [&source_id](const Modifier& m) { return m.source_id == source_id; });
}

Value StatMap::query_stat(const StatDefinition& def, const QualifierQuery& query,
                          const StatDefault* defaults) const {
    StatValue accumulator = StatValue::seeded(def.kind, defaults);
    for_each(def.id, [&](const Modifier& m) {
        if (matches(query, m.qualifier)) {
            // Validated on insertion
            static_cast<void>(accumulator.fold(m.operation));
        }
    });
    return accumulator.evaluate();
}

// ============================================================================
// Presets
// ============================================================================

std::string preset_source_id(const std::string& preset_id) {
    return "preset:" + preset_id;
}

size_t apply_preset(StatMap& map, const StatRegistry& registry, const StatPreset& preset) {
    const std::string source_id = preset_source_id(preset.preset_id);
    size_t applied = 0;

    for (const auto& modifier : preset.modifiers) {
        const StatDefinition* def = registry.find(modifier.stat);
        if (!def) {
            core::log(core::LogLevel::Warn, "[Stats] Preset '{}' references unregistered {}",
                      preset.preset_id, registry.stat_name(modifier.stat));
            continue;
        }
        if (map.add(*def, modifier.qualifier, modifier.operation, source_id)) {
            ++applied;
        }
    }

    return applied;
}

} // namespace statq::stats
