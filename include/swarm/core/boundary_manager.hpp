/**
 * @file boundary_manager.hpp
 * @brief The four static walls enclosing the viewport
 *
 * Walls are axis-aligned static boxes of fixed thickness placed just outside
 * the viewport, so that their inner faces exactly border it:
 * - Top:    centre (0, +halfHeight + t/2), size width x t
 * - Bottom: centre (0, -halfHeight - t/2), size width x t
 * - Left:   centre (-halfWidth - t/2, 0), size t x height
 * - Right:  centre (+halfWidth + t/2, 0), size t x height
 */

#pragma once

#include <array>

#include <entt/entt.hpp>

#include "swarm/core/sim_config.hpp"
#include "swarm/core/world.hpp"

class BoundaryManager {
public:
    /**
     * @brief Registers the boundary material and builds walls around viewport
     */
    BoundaryManager(World& world, const Viewport& viewport);
    ~BoundaryManager();

    BoundaryManager(const BoundaryManager&) = delete;
    BoundaryManager& operator=(const BoundaryManager&) = delete;

    /**
     * @brief Removes every non-particle body and creates four new walls
     *
     * Throws std::invalid_argument unless width and height are finite and > 0.
     */
    void rebuild(double width, double height);

    /** @brief Wall entities in Top, Bottom, Left, Right order */
    const std::array<entt::entity, 4>& boundaries() const { return walls; }

    double thickness() const;
    const Viewport& viewport() const { return current; }
    MaterialId material() const { return boundaryMaterial; }

private:
    void removeBoundaries();

    World& world;
    Viewport current;
    std::array<entt::entity, 4> walls;
    MaterialId boundaryMaterial = NoMaterial;
};

/**
 * @brief The material every wall uses
 */
Material boundaryMaterialDefinition();
