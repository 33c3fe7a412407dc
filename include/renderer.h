// renderer.h

#pragma once

#include <SFML/Graphics.hpp>
#include <string>
#include <vector>

#include "simulation_parameters.h"

class Trajectory;

struct PlotLine {
    std::string seriesName;
    std::string label;
    sf::Color color;
    bool complement = false; // plot 1 - series
    bool dashed = false;
};

struct PlotPanel {
    std::string title;
    std::string xLabel;
    std::string yLabel;
    std::vector<PlotLine> lines;
};

// Panel layout per model, matching the columns each engine produces.
std::vector<PlotPanel> plotPanelsFor(ModelKind kind);

class Renderer {
public:
    Renderer(sf::RenderWindow& window, const sf::Font& font);

    // plotArea is the region above the slider panel.
    void render(ModelKind kind, const Trajectory& trajectory, const sf::FloatRect& plotArea);
    void setNeedsUpdate(bool needsUpdate) { m_needsUpdate = needsUpdate; }
    bool needsUpdate() const { return m_needsUpdate; }
    void setStatusText(const std::string& text, bool isError);

private:
    struct PanelGeometry {
        PlotPanel panel;
        sf::FloatRect frame;
        double yMin = 0.0;
        double yMax = 1.0;
        std::vector<sf::VertexArray> lines;
    };

    sf::RenderWindow& m_window;
    const sf::Font& m_font;
    bool m_needsUpdate;
    ModelKind m_cachedKind;
    sf::FloatRect m_cachedArea;
    std::vector<PanelGeometry> m_geometry;
    double m_cachedTEnd;
    sf::Text m_statusText;

    void rebuildGeometry(ModelKind kind, const Trajectory& trajectory, const sf::FloatRect& plotArea);
    void drawPanel(const PanelGeometry& geometry);
    void drawLegend(const PlotPanel& panel, const sf::FloatRect& frame);
    void drawText(const std::string& text, float x, float y, unsigned int size, const sf::Color& color);
};
