#include <statq/stats/stat_defaults.hpp>
#include <statq/stats/stat_operation.hpp>
#include <statq/core/log.hpp>
#include <cmath>

namespace statq::stats {

namespace {

bool valid_number(ValueKind kind, const std::optional<double>& v) {
    if (!v) return true;
    if (std::isnan(*v)) return false;
    return !is_integer_kind(kind) || is_integral_value(*v);
}

} // anonymous namespace

bool StatDefaults::validate(const StatDefinition& def, const StatDefault& value) const {
    bool ok = true;
    if (def.kind == ValueKind::Bool) {
        ok = !value.lower && !value.upper && (!value.base || *value.base == 0.0 || *value.base == 1.0);
    } else {
        ok = valid_number(def.kind, value.base) &&
             valid_number(def.kind, value.lower) &&
             valid_number(def.kind, value.upper);
    }

    if (!ok) {
        core::log(core::LogLevel::Warn, "[Stats] Rejected default for '{}': does not fit a {} stat",
                  def.name, value_kind_name(def.kind));
    }
    return ok;
}

bool StatDefaults::set(const StatDefinition& def, const StatDefault& value) {
    if (!validate(def, value)) return false;
    m_defaults[def.id] = value;
    return true;
}

bool StatDefaults::set_base(const StatDefinition& def, double base) {
    StatDefault patched = m_defaults.count(def.id) ? m_defaults.at(def.id) : StatDefault{};
    patched.base = base;
    return set(def, patched);
}

bool StatDefaults::set_min(const StatDefinition& def, double lower) {
    StatDefault patched = m_defaults.count(def.id) ? m_defaults.at(def.id) : StatDefault{};
    patched.lower = lower;
    return set(def, patched);
}

bool StatDefaults::set_max(const StatDefinition& def, double upper) {
    StatDefault patched = m_defaults.count(def.id) ? m_defaults.at(def.id) : StatDefault{};
    patched.upper = upper;
    return set(def, patched);
}

const StatDefault* StatDefaults::find(StatId stat) const {
    auto it = m_defaults.find(stat);
    return it != m_defaults.end() ? &it->second : nullptr;
}

bool StatDefaults::remove(StatId stat) {
    return m_defaults.erase(stat) > 0;
}

} // namespace statq::stats
