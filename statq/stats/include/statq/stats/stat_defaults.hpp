#pragma once

#include <statq/stats/stat_definition.hpp>
#include <cstddef>
#include <optional>
#include <unordered_map>

namespace statq::stats {

// ============================================================================
// StatDefault - Base value and clamp bounds seeded into every evaluation
// ============================================================================

struct StatDefault {
    std::optional<double> base;
    std::optional<double> lower;    // clamp minimum
    std::optional<double> upper;    // clamp maximum
};

// ============================================================================
// StatDefaults - Global defaults keyed by stat
// ============================================================================

// Every setter validates the value against the definition's kind: integral
// values for Int/IntPercent, 0/1 base and no bounds for Bool. A rejected
// call leaves the stored default unchanged.
class StatDefaults {
public:
    // Replaces the whole entry
    bool set(const StatDefinition& def, const StatDefault& value);

    // Patch a single field, keeping the others
    bool set_base(const StatDefinition& def, double base);
    bool set_min(const StatDefinition& def, double lower);
    bool set_max(const StatDefinition& def, double upper);

    const StatDefault* find(StatId stat) const;
    bool remove(StatId stat);
    void clear() { m_defaults.clear(); }

    size_t size() const { return m_defaults.size(); }
    bool empty() const { return m_defaults.empty(); }

private:
    bool validate(const StatDefinition& def, const StatDefault& value) const;

    std::unordered_map<StatId, StatDefault> m_defaults;
};

} // namespace statq::stats
