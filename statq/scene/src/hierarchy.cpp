#include <statq/scene/hierarchy.hpp>
#include <statq/scene/world.hpp>

namespace statq::scene {

void set_parent(World& world, Entity child, Entity parent) {
    auto& registry = world.registry();

    if (!registry.all_of<Hierarchy>(child)) {
        registry.emplace<Hierarchy>(child);
    }

    // If already parented, remove from old parent first
    if (registry.get<Hierarchy>(child).parent != NullEntity) {
        remove_parent(world, child);
    }

    if (parent == NullEntity || parent == child) {
        return;
    }

    // Prevent circular hierarchy
    if (is_ancestor_of(world, child, parent)) {
        return;
    }

    if (!registry.all_of<Hierarchy>(parent)) {
        registry.emplace<Hierarchy>(parent);
    }
    // Re-fetch after the possible emplace, which may relocate storage
    auto& child_h = registry.get<Hierarchy>(child);
    auto& parent_h = registry.get<Hierarchy>(parent);

    child_h.parent = parent;

    // Append at the tail so children keep insertion order
    child_h.next_sibling = NullEntity;
    child_h.prev_sibling = NullEntity;
    if (parent_h.first_child == NullEntity) {
        parent_h.first_child = child;
    } else {
        Entity last = parent_h.first_child;
        while (registry.get<Hierarchy>(last).next_sibling != NullEntity) {
            last = registry.get<Hierarchy>(last).next_sibling;
        }
        registry.get<Hierarchy>(last).next_sibling = child;
        child_h.prev_sibling = last;
    }
}

void remove_parent(World& world, Entity child) {
    auto& registry = world.registry();

    auto* child_h = registry.try_get<Hierarchy>(child);
    if (!child_h || child_h->parent == NullEntity) {
        return;
    }

    auto& parent_h = registry.get<Hierarchy>(child_h->parent);

    if (child_h->prev_sibling != NullEntity) {
        registry.get<Hierarchy>(child_h->prev_sibling).next_sibling = child_h->next_sibling;
    } else {
        parent_h.first_child = child_h->next_sibling;
    }

    if (child_h->next_sibling != NullEntity) {
        registry.get<Hierarchy>(child_h->next_sibling).prev_sibling = child_h->prev_sibling;
    }

    child_h->parent = NullEntity;
    child_h->prev_sibling = NullEntity;
    child_h->next_sibling = NullEntity;
}

void iterate_children(const World& world, Entity parent, const std::function<void(Entity)>& fn) {
    const auto& registry = world.registry();

    const auto* h = registry.try_get<Hierarchy>(parent);
    if (!h) return;

    Entity child = h->first_child;
    while (child != NullEntity) {
        Entity next = registry.get<Hierarchy>(child).next_sibling;
        fn(child);
        child = next;
    }
}

void collect_children(const World& world, Entity parent, std::vector<Entity>& out) {
    iterate_children(world, parent, [&out](Entity child) { out.push_back(child); });
}

bool is_ancestor_of(const World& world, Entity ancestor, Entity descendant) {
    const auto& registry = world.registry();

    Entity current = descendant;
    while (current != NullEntity) {
        const auto* h = registry.try_get<Hierarchy>(current);
        if (!h) break;

        if (h->parent == ancestor) {
            return true;
        }
        current = h->parent;
    }

    return false;
}

} // namespace statq::scene
