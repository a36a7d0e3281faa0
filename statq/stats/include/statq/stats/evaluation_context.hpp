#pragma once

#include <statq/scene/entity.hpp>
#include <statq/stats/evaluation_key.hpp>
#include <statq/stats/qualifier.hpp>
#include <statq/stats/query_error.hpp>
#include <statq/stats/stat_definition.hpp>
#include <statq/stats/value.hpp>
#include <cstddef>
#include <string>
#include <vector>

namespace statq::scene {
class World;
}

namespace statq::stats {

class Querier;
class ModifierSink;

// ============================================================================
// QueryResult - Outcome of one evaluation
// ============================================================================

struct QueryResult {
    Value value;
    QueryError error = QueryError::None;
    std::string message;

    // For CycleDetected: the in-flight keys followed by the repeated key
    std::vector<EvaluationKey> cycle_path;

    bool ok() const { return error == QueryError::None; }
    explicit operator bool() const { return ok(); }
};

// ============================================================================
// EvaluationContext - State of one top-level evaluate() call
// ============================================================================

// Carries the in-flight key stack so data sources can issue sub-queries that
// share cycle detection. Created by Querier::evaluate, lives on its stack
// frame and is never shared between threads.
//
// CycleDetected and TypeMismatch are sticky: once a sub-query hits one,
// every enclosing evaluation fails with it, whether or not the source checked
// the result. StatNotFound and InvalidEntity only come back in the sub-query's
// QueryResult and the source decides what a missing value means.
class EvaluationContext {
public:
    explicit EvaluationContext(const Querier& querier);

    EvaluationContext(const EvaluationContext&) = delete;
    EvaluationContext& operator=(const EvaluationContext&) = delete;

    // Sub-query on any entity
    QueryResult query(scene::Entity entity, const QualifierQuery& query, StatId stat);

    // Sub-query on the entity currently being evaluated
    QueryResult query(const QualifierQuery& query, StatId stat);

    // Entity of the innermost in-flight key, NullEntity when idle
    scene::Entity current_entity() const;

    const scene::World& world() const;
    const StatRegistry& registry() const;
    const Querier& querier() const { return m_querier; }

    size_t depth() const { return m_stack.size(); }
    const std::vector<EvaluationKey>& stack() const { return m_stack; }

    bool failed() const { return m_error != QueryError::None; }
    QueryError error() const { return m_error; }
    const std::string& error_message() const { return m_message; }
    const std::vector<EvaluationKey>& cycle_path() const { return m_cycle_path; }

    // Failure result carrying the recorded error
    QueryResult failure() const;

private:
    friend class Querier;
    friend class ModifierSink;

    void fail(QueryError error, std::string message, std::vector<EvaluationKey> cycle_path = {});

    bool in_flight(const EvaluationKey& key) const;
    void push(const EvaluationKey& key) { m_stack.push_back(key); }
    void pop() { m_stack.pop_back(); }

    const Querier& m_querier;
    std::vector<EvaluationKey> m_stack;

    QueryError m_error = QueryError::None;
    std::string m_message;
    std::vector<EvaluationKey> m_cycle_path;
};

} // namespace statq::stats
