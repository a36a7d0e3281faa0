#include <statq/stats/stat_source.hpp>
#include <statq/stats/stat_map.hpp>
#include <statq/scene/hierarchy.hpp>
#include <format>

namespace statq::stats {

// ============================================================================
// ModifierSink
// ============================================================================

bool ModifierSink::push(const Qualifier& qualifier, const StatOperation& op) {
    if (!matches(m_query, qualifier)) {
        return false;
    }

    if (m_accumulator.fold(op) != QueryError::None) {
        m_context.fail(QueryError::TypeMismatch,
                       std::format("{} does not apply to {} stat '{}'",
                                   to_string(op), value_kind_name(m_stat.kind), m_stat.name));
        return false;
    }

    ++m_matched;
    return true;
}

// ============================================================================
// Modifier sources
// ============================================================================

void StatMapSource::contribute(EvaluationContext& context, scene::Entity entity,
                               const StatDefinition& stat, ModifierSink& sink) const {
    const auto* map = context.world().try_get<StatMap>(entity);
    if (!map) return;

    map->for_each(stat.id, [&sink](const Modifier& m) {
        sink.push(m.qualifier, m.operation);
    });
}

void FunctionSource::contribute(EvaluationContext& context, scene::Entity entity,
                                const StatDefinition& stat, ModifierSink& sink) const {
    if (m_callback) {
        m_callback(context, entity, stat, sink);
    }
}

// ============================================================================
// Relation sources
// ============================================================================

void ChildRelation::collect(const scene::World& world, scene::Entity entity,
                            std::vector<scene::Entity>& out) const {
    scene::collect_children(world, entity, out);
}

void FunctionRelation::collect(const scene::World& world, scene::Entity entity,
                               std::vector<scene::Entity>& out) const {
    if (m_callback) {
        m_callback(world, entity, out);
    }
}

} // namespace statq::stats
