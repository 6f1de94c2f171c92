#pragma once

#include <vector>

#include <entt/entt.hpp>

#include "ecs/Components.h"  // IWYU pragma: keep
#include "ecs/Entity.h"

class World {
 public:
  EntityId create();
  void destroy(EntityId);

  // Destroys every entity that has all of the given components.
  template <typename... Component>
  void destroyAll() {
    std::vector<EntityId> doomed;
    for (auto e : registry.view<Component...>()) {
      doomed.push_back(e);
    }
    for (EntityId e : doomed) {
      destroy(e);
    }
  }

  entt::registry registry;

  // external handle: "currently controlled player"
  EntityId player = kInvalidEntity;
};
