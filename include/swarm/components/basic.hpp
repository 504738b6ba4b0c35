#ifndef SWARM_COMPONENTS_BASIC_HPP
#define SWARM_COMPONENTS_BASIC_HPP

#include <cstdint>
#include "swarm/math/vector_math.hpp" // for Position, Vector
#include "swarm/core/materials.hpp"   // for MaterialId
#include "swarm/rendering/color.hpp"  // for Rgba

namespace Components {

    // Use the Position and Vector classes from vector_math.hpp
    using Position = ::Position;
    using Velocity = ::Vector;

    // Accumulated external force, consumed and cleared by each physics step
    struct Force : public ::Vector {
        using ::Vector::Vector;
        Force() = default;
        explicit Force(const ::Vector& v) : ::Vector(v) {}
    };

    // Mass properties. A mass of zero marks an immovable (static) body.
    struct RigidBody {
        double mass = 0.0;
        double invMass = 0.0;
        double inertia = 0.0;
        double invInertia = 0.0;

        bool isStatic() const { return invMass == 0.0; }
    };

    struct CircleShape {
        double radius = 1.0;
    };

    // Axis-aligned rectangle described by its half extents
    struct BoxShape {
        double halfWidth = 1.0;
        double halfHeight = 1.0;
    };

    // Angular components
    struct AngularPosition {
        double angle = 0.0; // radians
    };

    struct AngularVelocity {
        double omega = 0.0; // radians per second
    };

    // Fraction of velocity lost per second, in [0, 1)
    struct Damping {
        double linear = 0.0;
        double angular = 0.0;
    };

    struct MaterialRef {
        MaterialId id = NoMaterial;
    };

    // Marks a body owned by the BodyStore; id is its index-stable identifier
    struct Particle {
        std::uint32_t id = 0;
    };

    enum class BoundarySide {
        Top,
        Bottom,
        Left,
        Right
    };

    struct Boundary {
        BoundarySide side = BoundarySide::Top;
    };

    // What the renderer draws for a particle: a filled circle
    struct Renderable {
        double x = 0.0;
        double y = 0.0;
        double rotation = 0.0;          // radians
        double radius = 1.0;
        double lightnessOffset = 0.0;   // per-particle tint relative to the base colour
        Rendering::Rgba color;
    };

} // namespace Components

#endif
