#pragma once

#include <statq/stats/stat_defaults.hpp>
#include <statq/stats/stat_definition.hpp>
#include <statq/stats/stat_map.hpp>
#include <nlohmann/json.hpp>
#include <cstddef>
#include <string>
#include <vector>

namespace statq::stats {

// ============================================================================
// StatConfig - Registry, defaults and presets loaded from JSON
// ============================================================================

struct StatConfig {
    StatRegistry registry;
    StatDefaults defaults;
    std::vector<StatPreset> presets;

    const StatPreset* find_preset(const std::string& preset_id) const;
};

struct StatConfigResult {
    StatConfig config;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;

    size_t qualifiers_loaded = 0;
    size_t stats_loaded = 0;
    size_t presets_loaded = 0;

    bool success() const { return errors.empty(); }
    explicit operator bool() const { return success(); }
};

// Document layout:
// {
//   "qualifiers": [ {"name": "Fire", "bit": 0} ],
//   "stats": [ {"name": "Strength", "kind": "int", "has_zero": true,
//               "base": 42, "min": 1, "max": 99, "description": "..."} ],
//   "presets": [ {"preset_id": "warrior", "display_name": "Warrior",
//                 "modifiers": [ {"stat": "Strength", "op": "add", "value": 4,
//                                 "all_of": ["Fire"], "any_of": []} ] } ]
// }
// Every section is optional. Malformed entries, unknown kinds and name or
// bit conflicts are errors. Preset modifiers that cannot be resolved (unknown
// stat, operation or qualifier name) are warnings. Either way the offending
// entry is skipped and the rest still loads.
StatConfigResult load_stat_config(const nlohmann::json& root);

StatConfigResult load_stat_config_file(const std::string& path);

} // namespace statq::stats
