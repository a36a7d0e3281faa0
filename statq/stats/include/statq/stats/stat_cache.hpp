#pragma once

#include <statq/stats/evaluation_key.hpp>
#include <statq/stats/value.hpp>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <shared_mutex>
#include <unordered_map>

namespace statq::stats {

// ============================================================================
// StatCache - Memoized evaluation results
// ============================================================================

// Thread Safety Notes:
// - get() takes a shared lock, store()/invalidate() an exclusive one
// - Two threads computing the same key both store; the last write wins
// - Entries never expire; callers invalidate after changing any source.
//   invalidate(entity) only drops that entity's own entries, so a parent
//   whose value depends on a changed child must be invalidated as well.
class StatCache {
public:
    StatCache() = default;

    StatCache(const StatCache&) = delete;
    StatCache& operator=(const StatCache&) = delete;

    std::optional<Value> get(const EvaluationKey& key) const;
    void store(const EvaluationKey& key, const Value& value);

    // Returns number of entries dropped
    size_t invalidate(scene::Entity entity);
    void invalidate_all();

    size_t size() const;
    bool empty() const { return size() == 0; }

    uint64_t hits() const { return m_hits.load(std::memory_order_relaxed); }
    uint64_t misses() const { return m_misses.load(std::memory_order_relaxed); }
    void reset_counters();

private:
    mutable std::shared_mutex m_mutex;
    std::unordered_map<scene::Entity, std::unordered_map<EvaluationKey, Value>> m_entries;
    size_t m_size = 0;

    mutable std::atomic<uint64_t> m_hits{0};
    mutable std::atomic<uint64_t> m_misses{0};
};

} // namespace statq::stats
