#pragma once

#include <statq/scene/entity.hpp>
#include <entt/entt.hpp>
#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>

namespace statq::scene {

// World owns the entities that carry stats, and their components, using EnTT.
// Thread Safety Notes:
// - EnTT registry is NOT thread-safe for concurrent modifications
// - Const access (valid, try_get, view) is safe from several readers at once,
//   which is what concurrent stat queries rely on
// - Entity creation/destruction and component edits must not overlap queries
class World {
public:
    World() = default;
    ~World() = default;

    // Non-copyable but movable
    World(const World&) = delete;
    World& operator=(const World&) = delete;
    World(World&&) = default;
    World& operator=(World&&) = default;

    // Entity management
    Entity create();
    Entity create(const std::string& name);
    void destroy(Entity e);
    bool valid(Entity e) const;

    // Component management
    template<typename T, typename... Args>
    decltype(auto) emplace(Entity e, Args&&... args) {
        return m_registry.emplace_or_replace<T>(e, std::forward<Args>(args)...);
    }

    template<typename T>
    void remove(Entity e) {
        m_registry.remove<T>(e);
    }

    template<typename T>
    T& get(Entity e) {
        return m_registry.get<T>(e);
    }

    template<typename T>
    const T& get(Entity e) const {
        return m_registry.get<T>(e);
    }

    template<typename T>
    T* try_get(Entity e) {
        return m_registry.try_get<T>(e);
    }

    template<typename T>
    const T* try_get(Entity e) const {
        return m_registry.try_get<T>(e);
    }

    template<typename T>
    bool has(Entity e) const {
        return m_registry.all_of<T>(e);
    }

    template<typename... Ts>
    auto view() {
        return m_registry.view<Ts...>();
    }

    template<typename... Ts>
    auto view() const {
        return m_registry.view<Ts...>();
    }

    // Direct registry access for advanced use
    entt::registry& registry() { return m_registry; }
    const entt::registry& registry() const { return m_registry; }

    // Number of live entities created through this world
    size_t size() const { return m_registry.view<EntityInfo>().size(); }
    bool empty() const { return size() == 0; }

    void clear();

    // Find entity by name (linear scan)
    Entity find_by_name(const std::string& name) const;

    // Name given at creation, empty for invalid entities
    std::string name_of(Entity e) const;

private:
    entt::registry m_registry;
    uint64_t m_next_uuid = 1;
};

} // namespace statq::scene
