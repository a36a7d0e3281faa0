#pragma once

#include <statq/scene/entity.hpp>
#include <statq/scene/world.hpp>
#include <statq/stats/evaluation_context.hpp>
#include <statq/stats/qualifier.hpp>
#include <statq/stats/stat_definition.hpp>
#include <statq/stats/stat_operation.hpp>
#include <statq/stats/stat_value.hpp>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <utility>
#include <vector>

namespace statq::stats {

// ============================================================================
// ModifierSink - Where sources push their (qualifier, operation) pairs
// ============================================================================

// Filters every pushed pair through the active query and folds the matches.
// An operation that does not fit the stat's kind fails the evaluation with
// TypeMismatch.
class ModifierSink {
public:
    ModifierSink(EvaluationContext& context, const QualifierQuery& query,
                 const StatDefinition& stat, StatValue& accumulator)
        : m_context(context), m_query(query), m_stat(stat), m_accumulator(accumulator) {}

    ModifierSink(const ModifierSink&) = delete;
    ModifierSink& operator=(const ModifierSink&) = delete;

    // Returns true when the pair matched and was folded
    bool push(const Qualifier& qualifier, const StatOperation& op);

    const QualifierQuery& query() const { return m_query; }
    const StatDefinition& stat() const { return m_stat; }
    size_t matched() const { return m_matched; }

private:
    EvaluationContext& m_context;
    const QualifierQuery& m_query;
    const StatDefinition& m_stat;
    StatValue& m_accumulator;
    size_t m_matched = 0;
};

// ============================================================================
// IModifierSource - Anything that holds modifiers for an entity
// ============================================================================

// contribute() pushes every modifier it holds for stat on entity. Sources may
// query other stats through context (that is how cross-stat dependencies are
// expressed) but must not mutate the world.
class IModifierSource {
public:
    virtual ~IModifierSource() = default;

    virtual void contribute(EvaluationContext& context, scene::Entity entity,
                            const StatDefinition& stat, ModifierSink& sink) const = 0;
};

// Which entities a registered modifier source is asked about
enum class SourceScope : uint8_t {
    Owner,              // Only the queried entity
    Related,            // Only entities yielded by relation sources
    OwnerAndRelated
};

// Reads the StatMap component
class StatMapSource : public IModifierSource {
public:
    void contribute(EvaluationContext& context, scene::Entity entity,
                    const StatDefinition& stat, ModifierSink& sink) const override;
};

// Adapts a component type T exposing
//   void contribute(EvaluationContext&, scene::Entity, const StatDefinition&, ModifierSink&) const
template<typename T>
class ComponentSource : public IModifierSource {
public:
    void contribute(EvaluationContext& context, scene::Entity entity,
                    const StatDefinition& stat, ModifierSink& sink) const override {
        if (const T* component = context.world().template try_get<T>(entity)) {
            component->contribute(context, entity, stat, sink);
        }
    }
};

// Wraps a callable. Registered as a global it expresses relations such as
// "Damage += 50% of MagicDamage" that apply to every entity.
class FunctionSource : public IModifierSource {
public:
    using Callback = std::function<void(EvaluationContext&, scene::Entity, const StatDefinition&, ModifierSink&)>;

    explicit FunctionSource(Callback callback) : m_callback(std::move(callback)) {}

    void contribute(EvaluationContext& context, scene::Entity entity,
                    const StatDefinition& stat, ModifierSink& sink) const override;

private:
    Callback m_callback;
};

// ============================================================================
// IRelationSource - Structural links to other entities
// ============================================================================

class IRelationSource {
public:
    virtual ~IRelationSource() = default;

    // Appends the entities related to entity
    virtual void collect(const scene::World& world, scene::Entity entity,
                         std::vector<scene::Entity>& out) const = 0;
};

// Direct hierarchy children, not grandchildren
class ChildRelation : public IRelationSource {
public:
    void collect(const scene::World& world, scene::Entity entity,
                 std::vector<scene::Entity>& out) const override;
};

class FunctionRelation : public IRelationSource {
public:
    using Callback = std::function<void(const scene::World&, scene::Entity, std::vector<scene::Entity>&)>;

    explicit FunctionRelation(Callback callback) : m_callback(std::move(callback)) {}

    void collect(const scene::World& world, scene::Entity entity,
                 std::vector<scene::Entity>& out) const override;

private:
    Callback m_callback;
};

} // namespace statq::stats
