#include <statq/stats/stat_cache.hpp>
#include <statq/core/log.hpp>
#include <mutex>

namespace statq::stats {

// ============================================================================
// StatCache Implementation
// ============================================================================

std::optional<Value> StatCache::get(const EvaluationKey& key) const {
    std::shared_lock lock(m_mutex);

    auto entity_it = m_entries.find(key.entity);
    if (entity_it != m_entries.end()) {
        auto it = entity_it->second.find(key);
        if (it != entity_it->second.end()) {
            m_hits.fetch_add(1, std::memory_order_relaxed);
            return it->second;
        }
    }

    m_misses.fetch_add(1, std::memory_order_relaxed);
    return std::nullopt;
}

void StatCache::store(const EvaluationKey& key, const Value& value) {
    std::unique_lock lock(m_mutex);

    auto& slot = m_entries[key.entity];
    auto [it, inserted] = slot.insert_or_assign(key, value);
    if (inserted) ++m_size;
}

size_t StatCache::invalidate(scene::Entity entity) {
    size_t dropped = 0;
    {
        std::unique_lock lock(m_mutex);
        auto it = m_entries.find(entity);
        if (it == m_entries.end()) return 0;

        dropped = it->second.size();
        m_size -= dropped;
        m_entries.erase(it);
    }

    core::log(core::LogLevel::Debug, "[StatCache] Invalidated {} entries for entity {}",
              dropped, entt::to_integral(entity));
    return dropped;
}

void StatCache::invalidate_all() {
    {
        std::unique_lock lock(m_mutex);
        m_entries.clear();
        m_size = 0;
    }
    core::log(core::LogLevel::Debug, "[StatCache] Invalidated all entries");
}

size_t StatCache::size() const {
    std::shared_lock lock(m_mutex);
    return m_size;
}

void StatCache::reset_counters() {
    m_hits.store(0, std::memory_order_relaxed);
    m_misses.store(0, std::memory_order_relaxed);
}

} // namespace statq::stats
