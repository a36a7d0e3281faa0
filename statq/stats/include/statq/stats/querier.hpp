#pragma once

#include <statq/scene/entity.hpp>
#include <statq/scene/world.hpp>
#include <statq/stats/evaluation_context.hpp>
#include <statq/stats/evaluation_key.hpp>
#include <statq/stats/stat_cache.hpp>
#include <statq/stats/stat_defaults.hpp>
#include <statq/stats/stat_definition.hpp>
#include <statq/stats/stat_source.hpp>
#include <memory>
#include <string>
#include <vector>

namespace statq::stats {

// ============================================================================
// Querier - Evaluates stats over a world
// ============================================================================

// For a key (entity, query, stat) the querier:
//   1. returns the cached value if a cache is attached and holds one
//   2. fails with CycleDetected if the key is already being evaluated
//   3. seeds an accumulator from StatDefaults
//   4. asks owner sources about the entity, then scoped sources about every
//      related entity, then the global sources, folding matching modifiers
//   5. evaluates, stores in the cache and returns
//
// evaluate() is const and reads the world only; several threads may evaluate
// at once as long as nobody mutates the world meanwhile.
class Querier {
public:
    QueryResult evaluate(scene::Entity entity, const QualifierQuery& query, StatId stat) const;

    // Empty aggregate query: only unqualified modifiers apply
    QueryResult evaluate(scene::Entity entity, StatId stat) const;

    // Null when built without a cache
    StatCache* cache() const { return m_cache.get(); }

    const scene::World& world() const { return *m_world; }
    const StatRegistry& registry() const { return m_registry; }
    const StatDefaults& defaults() const { return m_defaults; }

    // Human-readable key using registered stat and qualifier names
    std::string describe(const EvaluationKey& key) const;
    std::string describe_path(const std::vector<EvaluationKey>& path) const;

private:
    friend class QuerierBuilder;
    friend class EvaluationContext;

    struct ScopedSource {
        std::shared_ptr<const IModifierSource> source;
        SourceScope scope = SourceScope::Owner;
    };

    explicit Querier(const scene::World& world) : m_world(&world) {}

    // Evaluation step shared by the top-level call and nested sub-queries
    QueryResult evaluate_in(EvaluationContext& context, const EvaluationKey& key) const;

    void collect_related(scene::Entity entity, std::vector<scene::Entity>& out) const;

    const scene::World* m_world;
    StatRegistry m_registry;
    StatDefaults m_defaults;
    std::vector<ScopedSource> m_sources;
    std::vector<std::shared_ptr<const IRelationSource>> m_relations;
    std::vector<std::shared_ptr<const IModifierSource>> m_globals;
    std::shared_ptr<StatCache> m_cache;
};

// ============================================================================
// QuerierBuilder - Explicit composition of a Querier
// ============================================================================

// @code
// auto querier = QuerierBuilder()
//     .with_registry(registry)
//     .with_defaults(defaults)
//     .add_source(std::make_shared<StatMapSource>(), SourceScope::OwnerAndRelated)
//     .add_relation(std::make_shared<ChildRelation>())
//     .with_cache()
//     .build(world);
// @endcode
class QuerierBuilder {
public:
    QuerierBuilder& with_registry(StatRegistry registry);
    QuerierBuilder& with_defaults(StatDefaults defaults);

    QuerierBuilder& add_source(std::shared_ptr<const IModifierSource> source,
                               SourceScope scope = SourceScope::Owner);
    QuerierBuilder& add_relation(std::shared_ptr<const IRelationSource> relation);

    QuerierBuilder& add_global(std::shared_ptr<const IModifierSource> source);
    QuerierBuilder& add_global(FunctionSource::Callback callback);

    // Share one cache between queriers by passing the same pointer
    QuerierBuilder& with_cache(std::shared_ptr<StatCache> cache = std::make_shared<StatCache>());

    // The world must outlive the querier
    Querier build(const scene::World& world) const;

private:
    StatRegistry m_registry;
    StatDefaults m_defaults;
    std::vector<Querier::ScopedSource> m_sources;
    std::vector<std::shared_ptr<const IRelationSource>> m_relations;
    std::vector<std::shared_ptr<const IModifierSource>> m_globals;
    std::shared_ptr<StatCache> m_cache;
};

} // namespace statq::stats
