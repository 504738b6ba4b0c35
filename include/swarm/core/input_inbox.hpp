/**
 * @file input_inbox.hpp
 * @brief Pending input events, drained once at the start of each frame
 */

#pragma once

#include <string>
#include <variant>
#include <vector>

#include "swarm/math/vector_math.hpp"
#include "swarm/systems/force_model.hpp"

namespace Input {

/** @brief Pointer position in world coordinates */
struct PointerMoved {
    Position position;
};

struct ViewportResized {
    double width = 0.0;
    double height = 0.0;
};

/**
 * @brief New force tunables and particle count
 *
 * A change of particleCount or forces.particleRadius rebuilds the particles.
 */
struct ParametersChanged {
    int particleCount = 0;
    Systems::ForceConfig forces;
};

/** @brief New base fill colour as #RRGGBB */
struct ColorChanged {
    std::string hex;
};

using Event = std::variant<PointerMoved, ViewportResized, ParametersChanged, ColorChanged>;

class InputInbox {
public:
    /**
     * @brief Queues an event; dropped while the inbox is closed
     * @return true if the event was queued
     */
    bool post(Event event);

    /** @brief Hands over every queued event in arrival order */
    std::vector<Event> drain();

    void open() { accepting = true; }

    /** @brief Drops queued events and refuses new ones */
    void close();

    bool isOpen() const { return accepting; }
    std::size_t size() const { return events.size(); }

private:
    std::vector<Event> events;
    bool accepting = false;
};

} // namespace Input
