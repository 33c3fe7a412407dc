// slider_panel.h

#pragma once

#include <SFML/Graphics.hpp>
#include <vector>

#include "simulation_parameters.h"

class ParameterStore;

// Horizontal sliders for every ParameterSpec of the active model. Values live
// in the ParameterStore; the panel only maps mouse positions to them.
class SliderPanel {
public:
    explicit SliderPanel(const sf::Font& font);

    void layout(const std::vector<ParameterSpec>& specs, const sf::FloatRect& area);

    // Returns true when the store changed.
    bool handleEvent(const sf::Event& event, ParameterStore& store);
    void draw(sf::RenderTarget& target, const ParameterStore& store) const;

private:
    struct Slider {
        ParameterSpec spec;
        sf::FloatRect track;
    };

    const sf::Font& m_font;
    std::vector<Slider> m_sliders;
    int m_dragging;
    int m_focused;

    int sliderAt(float x, float y) const;
    double valueAt(const Slider& slider, float mouseX) const;
    bool nudge(ParameterStore& store, int direction);
};
