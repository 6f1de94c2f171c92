#pragma once

#include <entt/entt.hpp>

// Player, obstacles, pickups and fireflies all share one registry.
using EntityId = entt::entity;
inline constexpr EntityId kInvalidEntity = entt::null;
