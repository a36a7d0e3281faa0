#include <statq/stats/stat_config.hpp>
#include <statq/data/json_loader.hpp>
#include <statq/core/log.hpp>
#include <optional>
#include <utility>

namespace statq::stats {

namespace json_helpers = data::json_helpers;

namespace {

struct QualifierEntry {
    std::string name;
    unsigned bit = 0;
};

struct StatEntry {
    StatDefinition definition;
    StatDefault defaults;
    bool has_defaults = false;
};

std::optional<QualifierEntry> parse_qualifier(const nlohmann::json& j, std::string& out_error) {
    if (!json_helpers::require_string(j, "name", out_error)) return std::nullopt;
    if (!json_helpers::require_int(j, "bit", out_error)) return std::nullopt;

    int bit = json_helpers::get_int(j, "bit");
    if (bit < 0 || bit >= static_cast<int>(MaxQualifierBits)) {
        out_error = "Qualifier bit " + std::to_string(bit) + " out of range";
        return std::nullopt;
    }
    return QualifierEntry{json_helpers::get_string(j, "name"), static_cast<unsigned>(bit)};
}

std::optional<StatEntry> parse_stat(const nlohmann::json& j, std::string& out_error) {
    if (!json_helpers::require_string(j, "name", out_error)) return std::nullopt;
    if (!json_helpers::require_string(j, "kind", out_error)) return std::nullopt;

    std::string name = json_helpers::get_string(j, "name");
    std::string kind_name = json_helpers::get_string(j, "kind");
    auto kind = parse_value_kind(kind_name);
    if (!kind) {
        out_error = "Stat '" + name + "' has unknown kind '" + kind_name + "'";
        return std::nullopt;
    }

    StatEntry entry;
    entry.definition = StatDefinition::make(name, *kind,
                                            json_helpers::get_bool(j, "has_zero", true),
                                            json_helpers::get_string(j, "description"));
    entry.defaults.base = json_helpers::get_optional_number(j, "base");
    entry.defaults.lower = json_helpers::get_optional_number(j, "min");
    entry.defaults.upper = json_helpers::get_optional_number(j, "max");
    entry.has_defaults = entry.defaults.base || entry.defaults.lower || entry.defaults.upper;
    return entry;
}

// Presets resolve names through the registry loaded just before them
class PresetParser {
public:
    PresetParser(const StatRegistry& registry, std::vector<std::string>& warnings)
        : m_registry(registry), m_warnings(warnings) {}

    std::optional<StatPreset> operator()(const nlohmann::json& j, std::string& out_error) const {
        if (!json_helpers::require_string(j, "preset_id", out_error)) return std::nullopt;

        StatPreset preset;
        preset.preset_id = json_helpers::get_string(j, "preset_id");
        preset.display_name = json_helpers::get_string(j, "display_name", preset.preset_id);

        auto modifiers = data::load_json_array<Modifier>(
            j, [this, &preset](const nlohmann::json& m, std::string& err) {
                return parse_modifier(preset.preset_id, m, err);
            },
            "modifiers", false);

        for (auto& err : modifiers.errors) {
            m_warnings.push_back("Preset '" + preset.preset_id + "': " + err);
        }
        for (auto& warn : modifiers.warnings) {
            m_warnings.push_back("Preset '" + preset.preset_id + "': " + warn);
        }

        preset.modifiers = std::move(modifiers.items);
        return preset;
    }

private:
    std::optional<Modifier> parse_modifier(const std::string& preset_id, const nlohmann::json& j,
                                           std::string& out_error) const {
        if (!json_helpers::require_string(j, "stat", out_error)) return std::nullopt;
        if (!json_helpers::require_string(j, "op", out_error)) return std::nullopt;

        std::string stat_name = json_helpers::get_string(j, "stat");
        const StatDefinition* def = m_registry.find(stat_name);
        if (!def) {
            out_error = "unknown stat '" + stat_name + "'";
            return std::nullopt;
        }

        std::string op_name = json_helpers::get_string(j, "op");
        auto type = parse_operation_type(op_name);
        if (!type) {
            out_error = "unknown operation '" + op_name + "'";
            return std::nullopt;
        }

        auto value = json_helpers::get_optional_number(j, "value");
        if (!value) {
            out_error = "modifier on '" + stat_name + "' has no numeric value";
            return std::nullopt;
        }

        StatOperation op{*type, *value};
        if (validate_operation(def->kind, op) != QueryError::None) {
            out_error = to_string(op) + " does not fit " + value_kind_name(def->kind) + " stat '" + stat_name + "'";
            return std::nullopt;
        }

        std::vector<std::string> unknown;
        Qualifier qualifier;
        qualifier.all_of = m_registry.parse_qualifier_flags(json_helpers::get_string_array(j, "all_of"), unknown);
        qualifier.any_of = m_registry.parse_qualifier_flags(json_helpers::get_string_array(j, "any_of"), unknown);
        if (!unknown.empty()) {
            out_error = "unknown qualifier '" + unknown.front() + "'";
            return std::nullopt;
        }

        return Modifier{qualifier, def->id, op, preset_source_id(preset_id)};
    }

    const StatRegistry& m_registry;
    std::vector<std::string>& m_warnings;
};

template<typename T>
void collect_messages(const data::LoadResult<T>& section, const std::string& what, StatConfigResult& result) {
    for (const auto& err : section.errors) {
        result.errors.push_back(what + ": " + err);
    }
    for (const auto& warn : section.warnings) {
        result.warnings.push_back(what + ": " + warn);
    }
}

} // anonymous namespace

const StatPreset* StatConfig::find_preset(const std::string& preset_id) const {
    for (const auto& preset : presets) {
        if (preset.preset_id == preset_id) return &preset;
    }
    return nullptr;
}

StatConfigResult load_stat_config(const nlohmann::json& root) {
    StatConfigResult result;
    if (!root.is_object()) {
        result.errors.push_back("Expected root to be an object");
        core::log(core::LogLevel::Warn, "[StatLoader] Expected root to be an object");
        return result;
    }

    // Qualifiers first so presets can resolve their names
    auto qualifiers = data::load_json_array<QualifierEntry>(root, parse_qualifier, "qualifiers", false);
    collect_messages(qualifiers, "qualifiers", result);
    for (const auto& entry : qualifiers.items) {
        if (result.config.registry.register_qualifier(entry.name, entry.bit)) {
            ++result.qualifiers_loaded;
        } else {
            result.errors.push_back("qualifiers: '" + entry.name + "' conflicts with an earlier entry");
        }
    }

    auto stats = data::load_json_array<StatEntry>(root, parse_stat, "stats", false);
    collect_messages(stats, "stats", result);
    for (const auto& entry : stats.items) {
        if (!result.config.registry.register_stat(entry.definition)) {
            result.errors.push_back("stats: '" + entry.definition.name + "' conflicts with an earlier entry");
            continue;
        }
        if (entry.has_defaults && !result.config.defaults.set(entry.definition, entry.defaults)) {
            result.errors.push_back("stats: defaults of '" + entry.definition.name + "' do not fit its kind");
        }
        ++result.stats_loaded;
    }

    auto presets = data::load_json_array<StatPreset>(
        root, PresetParser(result.config.registry, result.warnings), "presets", false);
    collect_messages(presets, "presets", result);
    for (auto& preset : presets.items) {
        if (result.config.find_preset(preset.preset_id)) {
            result.errors.push_back("presets: duplicate preset '" + preset.preset_id + "'");
            continue;
        }
        result.config.presets.push_back(std::move(preset));
        ++result.presets_loaded;
    }

    for (const auto& warn : result.warnings) {
        core::log(core::LogLevel::Warn, "[StatLoader] {}", warn);
    }
    for (const auto& err : result.errors) {
        core::log(core::LogLevel::Warn, "[StatLoader] {}", err);
    }
    core::log(core::LogLevel::Info, "[StatLoader] Loaded {} qualifiers, {} stats, {} presets ({} errors, {} warnings)",
              result.qualifiers_loaded, result.stats_loaded, result.presets_loaded,
              result.errors.size(), result.warnings.size());

    return result;
}

StatConfigResult load_stat_config_file(const std::string& path) {
    auto root = data::load_json_file(path);
    if (!root) {
        StatConfigResult result;
        result.errors.push_back("Failed to load or parse file: " + path);
        return result;
    }
    return load_stat_config(*root);
}

} // namespace statq::stats
