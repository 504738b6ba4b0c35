/**
 * @file renderer.hpp
 * @brief Draws particle renderables into an SFML window
 *
 * World coordinates have their origin at the window centre with y pointing
 * up; the renderer maps them to pixels with screenToWorld/worldToScreen.
 */

#ifndef SWARM_RENDERER_HPP
#define SWARM_RENDERER_HPP

#include <entt/entt.hpp>
#include <SFML/Graphics.hpp>

#include "swarm/math/vector_math.hpp"

namespace Rendering {

/** @brief Window pixel -> world: x = px - W/2, y = H/2 - py */
Position screenToWorld(double px, double py, double width, double height);

/** @brief World -> window pixel */
sf::Vector2f worldToScreen(double x, double y, double width, double height);

class Renderer {
public:
    Renderer(unsigned int screenWidth, unsigned int screenHeight);
    ~Renderer();

    /**
     * @brief Creates the window
     * @return true if the window is open afterwards
     */
    bool init();

    void clear();
    void present();

    /**
     * @brief Draws every entity with a Components::Renderable as a filled circle
     */
    void renderParticles(const entt::registry& registry);

    /** @brief Follows a window resize; keeps one world unit per pixel */
    void resize(unsigned int width, unsigned int height);

    sf::RenderWindow& getWindow() { return window; }
    unsigned int width() const { return screenWidth; }
    unsigned int height() const { return screenHeight; }

private:
    sf::RenderWindow window;
    sf::CircleShape circle;
    unsigned int screenWidth;
    unsigned int screenHeight;
};

} // namespace Rendering

#endif
