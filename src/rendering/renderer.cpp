#include "swarm/rendering/renderer.hpp"

#include <iostream>

#include "swarm/components/basic.hpp"
#include "swarm/core/constants.hpp"
#include "swarm/core/profile.hpp"

namespace Rendering {

Position screenToWorld(double px, double py, double width, double height) {
    return Position(px - width / 2.0, height / 2.0 - py);
}

sf::Vector2f worldToScreen(double x, double y, double width, double height) {
    return sf::Vector2f(static_cast<float>(x + width / 2.0),
                        static_cast<float>(height / 2.0 - y));
}

Renderer::Renderer(unsigned int screenWidth, unsigned int screenHeight)
    : window()
    , circle()
    , screenWidth(screenWidth)
    , screenHeight(screenHeight)
{
    circle.setPointCount(24);
}

Renderer::~Renderer() {}

bool Renderer::init() {
    window.create(sf::VideoMode(screenWidth, screenHeight), "Swarm");
    if (!window.isOpen()) {
        std::cerr << "Failed to create " << screenWidth << "x" << screenHeight << " window\n";
        return false;
    }
    window.setVerticalSyncEnabled(true);
    return true;
}

void Renderer::clear() {
    window.clear(sf::Color::Black);
}

void Renderer::present() {
    window.display();
}

void Renderer::resize(unsigned int width, unsigned int height) {
    screenWidth = width;
    screenHeight = height;
    window.setView(sf::View(sf::FloatRect(0.f, 0.f, static_cast<float>(width), static_cast<float>(height))));
}

void Renderer::renderParticles(const entt::registry& registry) {
    SWARM_PROFILE_SCOPE("Renderer::renderParticles");

    auto view = registry.view<const Components::Renderable>();
    for (auto [entity, renderable] : view.each()) {
        float const r = static_cast<float>(renderable.radius);
        circle.setRadius(r);
        circle.setOrigin(r, r);
        circle.setPosition(worldToScreen(renderable.x, renderable.y, screenWidth, screenHeight));
        circle.setRotation(static_cast<float>(-renderable.rotation * 180.0 / SwarmConstants::Pi));
        circle.setFillColor(sf::Color(renderable.color.r, renderable.color.g,
                                      renderable.color.b, renderable.color.a));
        window.draw(circle);
    }
}

} // namespace Rendering
