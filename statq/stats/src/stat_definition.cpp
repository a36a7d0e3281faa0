#include <statq/stats/stat_definition.hpp>
#include <statq/core/log.hpp>
#include <algorithm>
#include <cctype>
#include <format>

namespace statq::stats {

const char* value_kind_name(ValueKind kind) {
    switch (kind) {
        case ValueKind::Float:         return "float";
        case ValueKind::FloatAdditive: return "float_additive";
        case ValueKind::Int:           return "int";
        case ValueKind::IntPercent:    return "int_percent";
        case ValueKind::Bool:          return "bool";
    }
    return "unknown";
}

std::optional<ValueKind> parse_value_kind(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "float")          return ValueKind::Float;
    if (lower == "float_additive") return ValueKind::FloatAdditive;
    if (lower == "int")            return ValueKind::Int;
    if (lower == "int_percent")    return ValueKind::IntPercent;
    if (lower == "bool")           return ValueKind::Bool;
    return std::nullopt;
}

// ============================================================================
// Stat definitions
// ============================================================================

bool StatRegistry::register_stat(const StatDefinition& def) {
    if (def.name.empty() || !def.id.valid()) {
        core::log(core::LogLevel::Warn, "[Stats] Rejected stat with empty name");
        return false;
    }
    if (def.id != StatId::from_name(def.name)) {
        core::log(core::LogLevel::Warn, "[Stats] Rejected stat '{}': id does not match its name", def.name);
        return false;
    }

    auto it = m_definitions.find(def.id);
    if (it != m_definitions.end()) {
        const StatDefinition& existing = it->second;
        if (existing.name != def.name) {
            core::log(core::LogLevel::Warn, "[Stats] Rejected stat '{}': id collides with '{}'",
                      def.name, existing.name);
            return false;
        }
        if (existing.kind != def.kind || existing.has_zero != def.has_zero) {
            core::log(core::LogLevel::Warn, "[Stats] Rejected stat '{}': already registered as {}",
                      def.name, value_kind_name(existing.kind));
            return false;
        }
        return true;
    }

    m_definitions.emplace(def.id, def);
    m_name_to_id[def.name] = def.id;
    return true;
}

const StatDefinition* StatRegistry::find(StatId id) const {
    auto it = m_definitions.find(id);
    return it != m_definitions.end() ? &it->second : nullptr;
}

const StatDefinition* StatRegistry::find(const std::string& name) const {
    auto it = m_name_to_id.find(name);
    return it != m_name_to_id.end() ? find(it->second) : nullptr;
}

bool StatRegistry::is_registered(StatId id) const {
    return m_definitions.count(id) > 0;
}

std::vector<StatDefinition> StatRegistry::all_stats() const {
    std::vector<StatDefinition> result;
    result.reserve(m_definitions.size());
    for (const auto& [id, def] : m_definitions) {
        result.push_back(def);
    }
    std::sort(result.begin(), result.end(),
              [](const StatDefinition& a, const StatDefinition& b) { return a.name < b.name; });
    return result;
}

std::string StatRegistry::stat_name(StatId id) const {
    if (const auto* def = find(id)) {
        return def->name;
    }
    return std::format("stat#{:016x}", id.value());
}

// ============================================================================
// Qualifier names
// ============================================================================

bool StatRegistry::register_qualifier(const std::string& name, unsigned bit) {
    if (name.empty() || bit >= MaxQualifierBits) {
        core::log(core::LogLevel::Warn, "[Stats] Rejected qualifier '{}' with bit {}", name, bit);
        return false;
    }

    auto it = m_qualifier_bits.find(name);
    if (it != m_qualifier_bits.end()) {
        if (it->second == bit) return true;
        core::log(core::LogLevel::Warn, "[Stats] Rejected qualifier '{}': already uses bit {}", name, it->second);
        return false;
    }
    if (!m_qualifier_names[bit].empty()) {
        core::log(core::LogLevel::Warn, "[Stats] Rejected qualifier '{}': bit {} belongs to '{}'",
                  name, bit, m_qualifier_names[bit]);
        return false;
    }

    m_qualifier_bits.emplace(name, bit);
    m_qualifier_names[bit] = name;
    return true;
}

std::optional<unsigned> StatRegistry::qualifier_bit(const std::string& name) const {
    auto it = m_qualifier_bits.find(name);
    if (it == m_qualifier_bits.end()) return std::nullopt;
    return it->second;
}

std::optional<QualifierFlags> StatRegistry::qualifier_flag(const std::string& name) const {
    auto bit = qualifier_bit(name);
    if (!bit) return std::nullopt;
    return qualifier_bit_flag(*bit);
}

const std::string& StatRegistry::qualifier_name(unsigned bit) const {
    static const std::string s_empty;
    return bit < MaxQualifierBits ? m_qualifier_names[bit] : s_empty;
}

QualifierFlags StatRegistry::parse_qualifier_flags(const std::vector<std::string>& names,
                                                   std::vector<std::string>& unknown) const {
    QualifierFlags flags = 0;
    for (const auto& name : names) {
        if (auto flag = qualifier_flag(name)) {
            flags |= *flag;
        } else {
            unknown.push_back(name);
        }
    }
    return flags;
}

std::string StatRegistry::describe_flags(QualifierFlags flags) const {
    if (flags == 0) return "()";

    std::string result;
    for (unsigned bit = 0; bit < MaxQualifierBits; ++bit) {
        if ((flags & qualifier_bit_flag(bit)) == 0) continue;
        if (!result.empty()) result += '|';
        result += m_qualifier_names[bit].empty() ? std::format("bit{}", bit) : m_qualifier_names[bit];
    }
    return result;
}

} // namespace statq::stats
