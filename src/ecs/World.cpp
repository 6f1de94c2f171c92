#include "ecs/World.h"

EntityId World::create() {
  return registry.create();
}

void World::destroy(EntityId id) {
  if (id == player) {
    player = kInvalidEntity;
  }
  registry.destroy(id);
}
