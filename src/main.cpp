// main.cpp

#include <SFML/Graphics.hpp>
#include <iostream>
#include <sstream>
#include <string>

#include "parameter_store.h"
#include "renderer.h"
#include "simulation_context.h"
#include "simulation_parameters.h"
#include "simulation_runner.h"
#include "slider_panel.h"

namespace {

constexpr float kSliderAreaFraction = 0.32f;

sf::FloatRect plotAreaFor(const sf::Vector2u& size) {
    const float w = static_cast<float>(size.x);
    const float h = static_cast<float>(size.y);
    return sf::FloatRect(0.0f, 0.0f, w, h * (1.0f - kSliderAreaFraction));
}

sf::FloatRect sliderAreaFor(const sf::Vector2u& size) {
    const float w = static_cast<float>(size.x);
    const float h = static_cast<float>(size.y);
    return sf::FloatRect(20.0f, h * (1.0f - kSliderAreaFraction) + 10.0f, w - 40.0f, h * kSliderAreaFraction - 20.0f);
}

std::string statusFor(const SimulationRunner& runner) {
    if (!runner.lastError().empty()) {
        return "Error: " + runner.lastError();
    }
    std::ostringstream oss;
    oss << "Model: " << modelKindName(runner.modelKind())
        << "   [Tab/1/2] switch model   [R] reset   [L] verbose log   [Left/Right] nudge   [Esc] quit";
    if (runner.stateLeftUnitInterval()) {
        oss << "   WARNING: share left [0,1], step too coarse";
    }
    return oss.str();
}

} // namespace

int main() {
    SimulationContext ctx;

    ModelKind kind = ModelKind::Club;
    if (!parseModelKind(ctx.config.gui.startModel, kind)) {
        std::cerr << "[Config] Unknown gui.startModel '" << ctx.config.gui.startModel << "', starting with club.\n";
        kind = ModelKind::Club;
    }

    sf::RenderWindow window(sf::VideoMode(static_cast<unsigned int>(ctx.config.gui.width),
                                          static_cast<unsigned int>(ctx.config.gui.height)),
                            "Replicator Dynamics");
    window.setVerticalSyncEnabled(true);

    sf::Font font;
    if (!font.loadFromFile(ctx.config.gui.fontPath)) {
        std::cerr << "Error: Could not load font file." << std::endl;
        return -1;
    }

    SimulationRunner runner(ctx, kind);
    Renderer renderer(window, font);
    SliderPanel sliders(font);
    sliders.layout(runner.store().specs(), sliderAreaFor(window.getSize()));

    auto switchModel = [&](ModelKind next) {
        if (next == runner.modelKind()) return;
        runner.setModelKind(next);
        sliders.layout(runner.store().specs(), sliderAreaFor(window.getSize()));
        renderer.setNeedsUpdate(true);
    };

    while (window.isOpen()) {
        sf::Event event;
        while (window.pollEvent(event)) {
            if (event.type == sf::Event::Closed) {
                window.close();
            }
            else if (event.type == sf::Event::Resized) {
                window.setView(sf::View(sf::FloatRect(0.0f, 0.0f,
                                                      static_cast<float>(event.size.width),
                                                      static_cast<float>(event.size.height))));
                sliders.layout(runner.store().specs(), sliderAreaFor(window.getSize()));
                renderer.setNeedsUpdate(true);
            }
            else if (event.type == sf::Event::KeyPressed) {
                if (event.key.code == sf::Keyboard::Escape) {
                    window.close();
                }
                else if (event.key.code == sf::Keyboard::Tab) {
                    switchModel(runner.modelKind() == ModelKind::Club ? ModelKind::Player : ModelKind::Club);
                }
                else if (event.key.code == sf::Keyboard::Num1) {
                    switchModel(ModelKind::Club);
                }
                else if (event.key.code == sf::Keyboard::Num2) {
                    switchModel(ModelKind::Player);
                }
                else if (event.key.code == sf::Keyboard::R) {
                    runner.store().resetToDefaults();
                }
                else if (event.key.code == sf::Keyboard::L) {
                    SimulationContext::setVerbose(!SimulationContext::isVerbose());
                    std::cout << "[Sim] verbose logging " << (SimulationContext::isVerbose() ? "on" : "off") << "\n";
                }
                else {
                    sliders.handleEvent(event, runner.store());
                }
            }
            else {
                sliders.handleEvent(event, runner.store());
            }
        }

        // Edits made this frame collapse into one recompute.
        if (runner.refresh()) {
            renderer.setNeedsUpdate(true);
        }
        renderer.setStatusText(statusFor(runner), !runner.lastError().empty());

        renderer.render(runner.modelKind(), runner.trajectory(), plotAreaFor(window.getSize()));
        sliders.draw(window, runner.store());
        window.display();
    }

    return 0;
}
