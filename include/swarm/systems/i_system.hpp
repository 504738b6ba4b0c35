/**
 * @file i_system.hpp
 * @brief Interface for all per-frame ECS systems
 */

#pragma once

#include <entt/entt.hpp>

namespace Systems {

/**
 * @class ISystem
 * @brief Base interface for all ECS systems
 *
 * A system reads and writes components in the registry once per call to
 * update(). Per-frame scalars (time step, pointer) are read from the
 * entity carrying Components::SimulatorState.
 */
class ISystem {
public:
    virtual ~ISystem() = default;

    /**
     * @brief Updates the system for one simulation step
     *
     * @param registry EnTT registry containing all entities and components
     */
    virtual void update(entt::registry& registry) = 0;
};

/**
 * @brief Base for systems carrying their own tunables
 *
 * Changes made through setSpecificConfig() are observed by the next update().
 */
template<typename SpecificConfig>
class ConfigurableSystem : public ISystem {
protected:
    SpecificConfig specificConfig;

public:
    /**
     * @brief Sets the system-specific configuration
     *
     * @param config System-specific configuration parameters
     */
    void setSpecificConfig(const SpecificConfig& config) {
        specificConfig = config;
    }

    /**
     * @brief Gets the system-specific configuration
     *
     * @return Current system-specific configuration
     */
    const SpecificConfig& getSpecificConfig() const {
        return specificConfig;
    }
};

} // namespace Systems
