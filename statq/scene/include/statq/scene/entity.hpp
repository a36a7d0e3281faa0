#pragma once

#include <entt/entt.hpp>
#include <cstdint>
#include <string>

namespace statq::scene {

// Entity is just a type alias for entt::entity
using Entity = entt::entity;

// Null entity constant
constexpr Entity NullEntity = entt::null;

// Name and stable id attached to every entity created through World
struct EntityInfo {
    std::string name;
    uint64_t uuid = 0;
};

} // namespace statq::scene
