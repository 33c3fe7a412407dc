// slider_panel.cpp

#include "slider_panel.h"

#include "parameter_store.h"

#include <algorithm>
#include <iomanip>
#include <sstream>

namespace {

constexpr float kRowHeight = 34.0f;
constexpr float kLabelWidth = 220.0f;
constexpr float kValueWidth = 80.0f;
constexpr float kTrackHeight = 6.0f;
constexpr float kKnobRadius = 8.0f;
constexpr float kHitSlop = 10.0f;

std::string formatValue(const ParameterSpec& spec, double v) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(spec.step >= 1.0 ? 0 : 2) << v;
    return oss.str();
}

} // namespace

SliderPanel::SliderPanel(const sf::Font& font) :
    m_font(font),
    m_dragging(-1),
    m_focused(-1)
{
}

void SliderPanel::layout(const std::vector<ParameterSpec>& specs, const sf::FloatRect& area) {
    m_sliders.clear();
    m_dragging = -1;
    m_focused = -1;

    // Two columns once the rows no longer fit.
    const int rowsFit = std::max(1, static_cast<int>(area.height / kRowHeight));
    const int columns = (static_cast<int>(specs.size()) > rowsFit) ? 2 : 1;
    const float columnWidth = area.width / static_cast<float>(columns);
    const float trackWidth = std::max(40.0f, columnWidth - kLabelWidth - kValueWidth - 40.0f);

    for (std::size_t i = 0; i < specs.size(); ++i) {
        const int column = static_cast<int>(i) / rowsFit;
        const int row = static_cast<int>(i) % rowsFit;
        Slider s;
        s.spec = specs[i];
        s.track = sf::FloatRect(area.left + static_cast<float>(column) * columnWidth + kLabelWidth,
                                area.top + static_cast<float>(row) * kRowHeight + kRowHeight / 2.0f - kTrackHeight / 2.0f,
                                trackWidth,
                                kTrackHeight);
        m_sliders.push_back(s);
    }
}

int SliderPanel::sliderAt(float x, float y) const {
    for (std::size_t i = 0; i < m_sliders.size(); ++i) {
        const sf::FloatRect& t = m_sliders[i].track;
        if (x >= t.left - kHitSlop && x <= t.left + t.width + kHitSlop &&
            y >= t.top - kHitSlop && y <= t.top + t.height + kHitSlop) {
            return static_cast<int>(i);
        }
    }
    return -1;
}

double SliderPanel::valueAt(const Slider& slider, float mouseX) const {
    const float clamped = std::max(slider.track.left, std::min(mouseX, slider.track.left + slider.track.width));
    const double fraction = (clamped - slider.track.left) / slider.track.width;
    return slider.spec.minValue + fraction * (slider.spec.maxValue - slider.spec.minValue);
}

bool SliderPanel::nudge(ParameterStore& store, int direction) {
    if (m_focused < 0) return false;
    const ParameterSpec& spec = m_sliders[static_cast<std::size_t>(m_focused)].spec;
    const double increment = (spec.step > 0.0) ? spec.step : (spec.maxValue - spec.minValue) / 100.0;
    return store.setValue(spec.name, store.value(spec.name) + direction * increment);
}

bool SliderPanel::handleEvent(const sf::Event& event, ParameterStore& store) {
    if (event.type == sf::Event::MouseButtonPressed && event.mouseButton.button == sf::Mouse::Left) {
        const int hit = sliderAt(static_cast<float>(event.mouseButton.x), static_cast<float>(event.mouseButton.y));
        if (hit < 0) return false;
        m_dragging = hit;
        m_focused = hit;
        const Slider& s = m_sliders[static_cast<std::size_t>(hit)];
        return store.setValue(s.spec.name, valueAt(s, static_cast<float>(event.mouseButton.x)));
    }
    if (event.type == sf::Event::MouseMoved && m_dragging >= 0) {
        const Slider& s = m_sliders[static_cast<std::size_t>(m_dragging)];
        return store.setValue(s.spec.name, valueAt(s, static_cast<float>(event.mouseMove.x)));
    }
    if (event.type == sf::Event::MouseButtonReleased && event.mouseButton.button == sf::Mouse::Left) {
        m_dragging = -1;
        return false;
    }
    if (event.type == sf::Event::KeyPressed) {
        if (event.key.code == sf::Keyboard::Left) return nudge(store, -1);
        if (event.key.code == sf::Keyboard::Right) return nudge(store, 1);
    }
    return false;
}

void SliderPanel::draw(sf::RenderTarget& target, const ParameterStore& store) const {
    for (std::size_t i = 0; i < m_sliders.size(); ++i) {
        const Slider& s = m_sliders[i];
        const bool focused = static_cast<int>(i) == m_focused;

        sf::Text label;
        label.setFont(m_font);
        label.setCharacterSize(15);
        label.setFillColor(sf::Color::Black);
        label.setString(s.spec.label);
        label.setPosition(s.track.left - kLabelWidth + 10.0f, s.track.top - 10.0f);
        target.draw(label);

        sf::RectangleShape track(sf::Vector2f(s.track.width, s.track.height));
        track.setPosition(s.track.left, s.track.top);
        track.setFillColor(sf::Color(200, 200, 200));
        target.draw(track);

        const double v = store.value(s.spec.name);
        const double span = s.spec.maxValue - s.spec.minValue;
        double fraction = (span > 0.0) ? (v - s.spec.minValue) / span : 0.0;
        fraction = std::max(0.0, std::min(fraction, 1.0));

        sf::RectangleShape filled(sf::Vector2f(s.track.width * static_cast<float>(fraction), s.track.height));
        filled.setPosition(s.track.left, s.track.top);
        filled.setFillColor(sf::Color(70, 130, 220));
        target.draw(filled);

        sf::CircleShape knob(kKnobRadius);
        knob.setOrigin(kKnobRadius, kKnobRadius);
        knob.setPosition(s.track.left + s.track.width * static_cast<float>(fraction), s.track.top + s.track.height / 2.0f);
        knob.setFillColor(focused ? sf::Color(30, 80, 200) : sf::Color::White);
        knob.setOutlineColor(sf::Color(70, 70, 70));
        knob.setOutlineThickness(1.5f);
        target.draw(knob);

        sf::Text value;
        value.setFont(m_font);
        value.setCharacterSize(15);
        value.setFillColor(sf::Color::Black);
        value.setString(formatValue(s.spec, v));
        value.setPosition(s.track.left + s.track.width + 20.0f, s.track.top - 10.0f);
        target.draw(value);
    }
}
