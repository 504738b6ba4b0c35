/**
 * @file render_sync.hpp
 * @brief Copies body kinematics into each particle's renderable
 *
 * Required components:
 * - Renderable, Position, AngularPosition
 */

#pragma once

#include <entt/entt.hpp>
#include "swarm/systems/i_system.hpp"

namespace Systems {

class RenderSyncSystem : public ISystem {
public:
    RenderSyncSystem() = default;
    ~RenderSyncSystem() override = default;

    void update(entt::registry& registry) override;
};

} // namespace Systems
