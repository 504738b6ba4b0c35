#include "swarm/systems/render_sync.hpp"

#include "swarm/components/basic.hpp"
#include "swarm/core/profile.hpp"

namespace Systems {

void RenderSyncSystem::update(entt::registry& registry) {
    SWARM_PROFILE_SCOPE("RenderSyncSystem");

    auto view = registry.view<Components::Renderable, Components::Position, Components::AngularPosition>();
    for (auto [entity, renderable, pos, angPos] : view.each()) {
        renderable.x = pos.x;
        renderable.y = pos.y;
        renderable.rotation = angPos.angle;
    }
}

} // namespace Systems
