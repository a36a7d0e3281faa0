#include <statq/stats/evaluation_context.hpp>
#include <statq/stats/querier.hpp>
#include <algorithm>
#include <utility>

namespace statq::stats {

EvaluationContext::EvaluationContext(const Querier& querier)
    : m_querier(querier) {}

QueryResult EvaluationContext::query(scene::Entity entity, const QualifierQuery& query, StatId stat) {
    return m_querier.evaluate_in(*this, EvaluationKey{entity, query, stat});
}

QueryResult EvaluationContext::query(const QualifierQuery& query, StatId stat) {
    return this->query(current_entity(), query, stat);
}

scene::Entity EvaluationContext::current_entity() const {
    return m_stack.empty() ? scene::NullEntity : m_stack.back().entity;
}

const scene::World& EvaluationContext::world() const {
    return m_querier.world();
}

const StatRegistry& EvaluationContext::registry() const {
    return m_querier.registry();
}

QueryResult EvaluationContext::failure() const {
    QueryResult result;
    result.error = m_error;
    result.message = m_message;
    result.cycle_path = m_cycle_path;
    return result;
}

void EvaluationContext::fail(QueryError error, std::string message, std::vector<EvaluationKey> cycle_path) {
    // The first failure wins, enclosing evaluations only propagate it
    if (failed()) return;

    m_error = error;
    m_message = std::move(message);
    m_cycle_path = std::move(cycle_path);
}

bool EvaluationContext::in_flight(const EvaluationKey& key) const {
    return std::find(m_stack.begin(), m_stack.end(), key) != m_stack.end();
}

} // namespace statq::stats
