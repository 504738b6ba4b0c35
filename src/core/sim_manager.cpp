/**
 * @file sim_manager.cpp
 * @brief Implementation of SimManager, which connects the SFML window to the simulation.
 */

#include "swarm/core/sim_manager.hpp"

#include <iostream>

#include <SFML/System/Clock.hpp>
#include <SFML/Window/Event.hpp>

#include "swarm/core/constants.hpp"
#include "swarm/core/profile.hpp"

namespace {

const char* const Palette[] = {"#2ACBF3", "#F3742A", "#9B5CF6", "#4ADE80", "#F8FAFC"};
constexpr std::size_t PaletteSize = sizeof(Palette) / sizeof(Palette[0]);

} // namespace

SimManager::SimManager(const SimulationConfig& config)
    : renderer(SwarmConstants::WindowWidth, SwarmConstants::WindowHeight)
    , scheduler()
    , simulation(scheduler, config)
    , controls(config)
{
}

bool SimManager::init() {
    if (!renderer.init()) {
        std::cerr << "Renderer initialization failed." << std::endl;
        return false;
    }
    return simulation.start(renderer.width(), renderer.height());
}

void SimManager::run() {
    sf::Clock clock;

    while (running && renderer.getWindow().isOpen()) {
        if (!handleEvents()) {
            break;
        }

        // One display refresh: fire whatever the simulation requested
        scheduler.runFrame(clock.getElapsedTime().asMicroseconds() / 1000.0);
        render();
    }

    simulation.dispose();
    renderer.getWindow().close();
}

bool SimManager::handleEvents() {
    sf::RenderWindow& window = renderer.getWindow();
    Input::InputInbox& inbox = simulation.inbox();

    sf::Event event;
    while (window.pollEvent(event)) {
        if (event.type == sf::Event::Closed) {
            running = false;
        }
        else if (event.type == sf::Event::Resized) {
            renderer.resize(event.size.width, event.size.height);
            inbox.post(Input::ViewportResized{static_cast<double>(event.size.width),
                                              static_cast<double>(event.size.height)});
        }
        else if (event.type == sf::Event::MouseMoved) {
            Position const p = Rendering::screenToWorld(event.mouseMove.x, event.mouseMove.y,
                                                        renderer.width(), renderer.height());
            inbox.post(Input::PointerMoved{p});
        }
        else if (event.type == sf::Event::KeyPressed) {
            handleKey(event.key.code);
        }
    }
    return running;
}

void SimManager::handleKey(sf::Keyboard::Key key) {
    Control control = Control::AttractionRadius;
    int steps = 1;

    switch (key) {
        case sf::Keyboard::Escape:
            running = false;
            return;
        case sf::Keyboard::C:
            colorIndex = (colorIndex + 1) % PaletteSize;
            simulation.inbox().post(Input::ColorChanged{Palette[colorIndex]});
            return;
        case sf::Keyboard::Up:     control = Control::AttractionRadius; break;
        case sf::Keyboard::Down:   control = Control::AttractionRadius; steps = -1; break;
        case sf::Keyboard::Right:  control = Control::AttractionStrength; break;
        case sf::Keyboard::Left:   control = Control::AttractionStrength; steps = -1; break;
        case sf::Keyboard::W:      control = Control::PushRadius; break;
        case sf::Keyboard::S:      control = Control::PushRadius; steps = -1; break;
        case sf::Keyboard::D:      control = Control::PushStrength; break;
        case sf::Keyboard::A:      control = Control::PushStrength; steps = -1; break;
        case sf::Keyboard::E:      control = Control::ParticleRadius; break;
        case sf::Keyboard::Q:      control = Control::ParticleRadius; steps = -1; break;
        case sf::Keyboard::Equal:  control = Control::ParticleCount; break;
        case sf::Keyboard::Hyphen: control = Control::ParticleCount; steps = -1; break;
        default:
            return;
    }

    Input::ParametersChanged const change = controls.step(control, steps);
    const Systems::ForceConfig& f = change.forces;

    std::cout << "count " << change.particleCount
              << " | radius " << f.particleRadius
              << " | attraction " << f.attractionRadius << " / " << f.attractionStrength
              << " | push " << f.pushRadius << " / " << f.pushStrength << std::endl;
    simulation.inbox().post(change);
}

void SimManager::render() {
    SWARM_PROFILE_SCOPE("SimManager::render");

    renderer.clear();
    if (World* world = simulation.world()) {
        renderer.renderParticles(world->getRegistry());
    }
    renderer.present();
}
