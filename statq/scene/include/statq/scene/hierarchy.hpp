#pragma once

#include <statq/scene/entity.hpp>
#include <functional>
#include <vector>

namespace statq::scene {

class World;

// Parent/child links using an intrusive linked list for cheap modification.
// Children of an entity are its "related" entities during stat evaluation.
struct Hierarchy {
    Entity parent = NullEntity;
    Entity first_child = NullEntity;
    Entity next_sibling = NullEntity;
    Entity prev_sibling = NullEntity;
};

// Set parent of an entity, handles all linked list updates.
// Passing NullEntity unparents. Parenting under a descendant is ignored.
void set_parent(World& world, Entity child, Entity parent);

// Remove parent relationship
void remove_parent(World& world, Entity child);

// Read-only traversal, safe for concurrent readers
void iterate_children(const World& world, Entity parent, const std::function<void(Entity)>& fn);

// Appends direct children of parent to out, in link order
void collect_children(const World& world, Entity parent, std::vector<Entity>& out);

bool is_ancestor_of(const World& world, Entity ancestor, Entity descendant);

} // namespace statq::scene
