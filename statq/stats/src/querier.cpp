#include <statq/stats/querier.hpp>
#include <statq/core/log.hpp>
#include <algorithm>
#include <format>
#include <utility>

namespace statq::stats {

namespace {

// Recoverable failures go back to the caller without touching the context
QueryResult recoverable(QueryError error, std::string message) {
    QueryResult result;
    result.error = error;
    result.message = std::move(message);
    return result;
}

} // anonymous namespace

// ============================================================================
// Querier - Evaluation
// ============================================================================

QueryResult Querier::evaluate(scene::Entity entity, const QualifierQuery& query, StatId stat) const {
    EvaluationContext context(*this);
    QueryResult result = evaluate_in(context, EvaluationKey{entity, query, stat});

    switch (result.error) {
        case QueryError::None:
            break;
        case QueryError::CycleDetected:
        case QueryError::TypeMismatch:
            // Both mean the stat setup is wrong
            core::log(core::LogLevel::Error, "[Stats] {}: {}", query_error_name(result.error), result.message);
            break;
        case QueryError::StatNotFound:
        case QueryError::InvalidEntity:
            core::log(core::LogLevel::Debug, "[Stats] {}: {}", query_error_name(result.error), result.message);
            break;
    }

    return result;
}

QueryResult Querier::evaluate(scene::Entity entity, StatId stat) const {
    return evaluate(entity, QualifierQuery::none(), stat);
}

QueryResult Querier::evaluate_in(EvaluationContext& context, const EvaluationKey& key) const {
    if (context.failed()) {
        return context.failure();
    }

    if (!m_world->valid(key.entity)) {
        return recoverable(QueryError::InvalidEntity,
                           std::format("entity {} does not exist", entt::to_integral(key.entity)));
    }

    const StatDefinition* def = m_registry.find(key.stat);
    if (!def) {
        return recoverable(QueryError::StatNotFound,
                           std::format("{} is not registered", m_registry.stat_name(key.stat)));
    }

    if (m_cache) {
        if (auto cached = m_cache->get(key)) {
            QueryResult hit;
            hit.value = *cached;
            return hit;
        }
    }

    if (context.in_flight(key)) {
        std::vector<EvaluationKey> path = context.stack();
        path.push_back(key);
        context.fail(QueryError::CycleDetected, "cycle " + describe_path(path), std::move(path));
        return context.failure();
    }

    context.push(key);

    StatValue accumulator = StatValue::seeded(def->kind, m_defaults.find(key.stat));
    ModifierSink sink(context, key.query, *def, accumulator);

    for (const auto& entry : m_sources) {
        if (context.failed()) break;
        if (entry.scope == SourceScope::Related) continue;
        entry.source->contribute(context, key.entity, *def, sink);
    }

    if (!context.failed() && !m_relations.empty()) {
        std::vector<scene::Entity> related;
        collect_related(key.entity, related);

        for (scene::Entity other : related) {
            for (const auto& entry : m_sources) {
                if (context.failed()) break;
                if (entry.scope == SourceScope::Owner) continue;
                entry.source->contribute(context, other, *def, sink);
            }
        }
    }

    for (const auto& global : m_globals) {
        if (context.failed()) break;
        global->contribute(context, key.entity, *def, sink);
    }

    context.pop();

    // No partial results: a cycle or mismatch below fails this key too
    if (context.failed()) {
        return context.failure();
    }

    if (accumulator.empty() && !def->has_zero) {
        return recoverable(QueryError::StatNotFound,
                           std::format("no default or modifier for {}", describe(key)));
    }

    QueryResult result;
    result.value = accumulator.evaluate();

    if (m_cache) {
        m_cache->store(key, result.value);
    }
    return result;
}

void Querier::collect_related(scene::Entity entity, std::vector<scene::Entity>& out) const {
    std::vector<scene::Entity> collected;
    for (const auto& relation : m_relations) {
        relation->collect(*m_world, entity, collected);
    }

    // Each related entity contributes once, whichever relations yield it
    for (scene::Entity other : collected) {
        if (other == entity || !m_world->valid(other)) continue;
        if (std::find(out.begin(), out.end(), other) != out.end()) continue;
        out.push_back(other);
    }
}

// ============================================================================
// Querier - Diagnostics
// ============================================================================

std::string Querier::describe(const EvaluationKey& key) const {
    std::string entity = m_world->name_of(key.entity);
    if (entity.empty()) {
        entity = std::format("entity {}", entt::to_integral(key.entity));
    }

    std::string query;
    if (key.query.mode == QueryMode::Aggregate) {
        query = std::format("Aggregate({})", m_registry.describe_flags(key.query.all_of));
    } else {
        query = std::format("Exact({}, {})", m_registry.describe_flags(key.query.all_of),
                            m_registry.describe_flags(key.query.any_of));
    }

    return std::format("{} {} {}", entity, query, m_registry.stat_name(key.stat));
}

std::string Querier::describe_path(const std::vector<EvaluationKey>& path) const {
    std::string result;
    for (const auto& key : path) {
        if (!result.empty()) result += " -> ";
        result += "[" + describe(key) + "]";
    }
    return result;
}

// ============================================================================
// QuerierBuilder
// ============================================================================

QuerierBuilder& QuerierBuilder::with_registry(StatRegistry registry) {
    m_registry = std::move(registry);
    return *this;
}

QuerierBuilder& QuerierBuilder::with_defaults(StatDefaults defaults) {
    m_defaults = std::move(defaults);
    return *this;
}

QuerierBuilder& QuerierBuilder::add_source(std::shared_ptr<const IModifierSource> source, SourceScope scope) {
    if (source) {
        m_sources.push_back({std::move(source), scope});
    }
    return *this;
}

QuerierBuilder& QuerierBuilder::add_relation(std::shared_ptr<const IRelationSource> relation) {
    if (relation) {
        m_relations.push_back(std::move(relation));
    }
    return *this;
}

QuerierBuilder& QuerierBuilder::add_global(std::shared_ptr<const IModifierSource> source) {
    if (source) {
        m_globals.push_back(std::move(source));
    }
    return *this;
}

QuerierBuilder& QuerierBuilder::add_global(FunctionSource::Callback callback) {
    return add_global(std::make_shared<FunctionSource>(std::move(callback)));
}

QuerierBuilder& QuerierBuilder::with_cache(std::shared_ptr<StatCache> cache) {
    m_cache = std::move(cache);
    return *this;
}

Querier QuerierBuilder::build(const scene::World& world) const {
    Querier querier(world);
    querier.m_registry = m_registry;
    querier.m_defaults = m_defaults;
    querier.m_sources = m_sources;
    querier.m_relations = m_relations;
    querier.m_globals = m_globals;
    querier.m_cache = m_cache;

    core::log(core::LogLevel::Debug, "[Stats] Built querier: {} stats, {} sources, {} relations, {} globals{}",
              m_registry.stat_count(), m_sources.size(), m_relations.size(), m_globals.size(),
              m_cache ? ", cached" : "");
    return querier;
}

} // namespace statq::stats
