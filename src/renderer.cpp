// renderer.cpp

#include "renderer.h"

#include "club_strategy_model.h"
#include "player_motivation_model.h"
#include "trajectory.h"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <limits>
#include <sstream>
#include <utility>

namespace {

const sf::Color kGreen(0, 160, 0);
const sf::Color kMagenta(200, 0, 200);
const sf::Color kBlue(30, 80, 230);
const sf::Color kCyan(0, 190, 210);
const sf::Color kRed(220, 40, 40);
const sf::Color kFrame(90, 90, 90);
const sf::Color kBackground(250, 250, 250);

constexpr float kPanelGap = 40.0f;
constexpr float kTitleHeight = 30.0f;
constexpr float kAxisMargin = 50.0f;
constexpr std::size_t kDashSamples = 12;

std::string formatNumber(double v, int precision = 2) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(precision) << v;
    return oss.str();
}

double lineValue(const PlotLine& line, double v) {
    return line.complement ? 1.0 - v : v;
}

} // namespace

std::vector<PlotPanel> plotPanelsFor(ModelKind kind) {
    if (kind == ModelKind::Club) {
        return {
            {"Saudi Club Strategy Evolution", "Years", "Probability",
             {{ClubSeries::kX, "Saudi Youth Dev", kGreen},
              {ClubSeries::kX, "Saudi Superstars", kMagenta, true}}},
            {"European Club Strategy Evolution", "Years", "Probability",
             {{ClubSeries::kY, "Europe Youth Dev", kBlue},
              {ClubSeries::kY, "Europe Superstars", kCyan, true}}},
            {"Joint Strategy Populations Over Time", "Years", "Share",
             {{ClubSeries::kYouthYouth, "Saudi Youth & Europe Youth", kGreen},
              {ClubSeries::kYouthStar, "Saudi Youth & Europe Star", kMagenta},
              {ClubSeries::kStarYouth, "Saudi Star & Europe Youth", kBlue},
              {ClubSeries::kStarStar, "Saudi Star & Europe Star", kCyan}}},
        };
    }
    return {
        {"Player Distribution Over Time", "Time (Season)", "Population Fraction",
         {{PlayerSeries::kX, "Prestige Players (P)", kBlue},
          {PlayerSeries::kX, "Money Players (M)", kRed, true}}},
        {"Payoff Dynamics", "Time (Season)", "Payoff Value",
         {{PlayerSeries::kFP, "Avg. Prestige Payoff", kBlue},
          {PlayerSeries::kFM, "Avg. Money Payoff", kRed},
          {PlayerSeries::kA, "PvP Payoff", kBlue, false, true},
          {PlayerSeries::kD, "MvM Payoff", kRed, false, true}}},
    };
}

Renderer::Renderer(sf::RenderWindow& window, const sf::Font& font) :
    m_window(window),
    m_font(font),
    m_needsUpdate(true),
    m_cachedKind(ModelKind::Club),
    m_cachedTEnd(0.0)
{
    m_statusText.setFont(m_font);
    m_statusText.setCharacterSize(16);
    m_statusText.setFillColor(sf::Color(60, 60, 60));
}

void Renderer::setStatusText(const std::string& text, bool isError) {
    m_statusText.setString(text);
    m_statusText.setFillColor(isError ? kRed : sf::Color(60, 60, 60));
}

void Renderer::render(ModelKind kind, const Trajectory& trajectory, const sf::FloatRect& plotArea) {
    m_window.clear(kBackground);

    if (m_needsUpdate || kind != m_cachedKind || plotArea != m_cachedArea) {
        rebuildGeometry(kind, trajectory, plotArea);
        m_needsUpdate = false;
    }

    for (const PanelGeometry& geometry : m_geometry) {
        drawPanel(geometry);
    }

    m_statusText.setPosition(plotArea.left + 10.0f, plotArea.top + plotArea.height - 24.0f);
    m_window.draw(m_statusText);
}

void Renderer::rebuildGeometry(ModelKind kind, const Trajectory& trajectory, const sf::FloatRect& plotArea) {
    m_cachedKind = kind;
    m_cachedArea = plotArea;
    m_cachedTEnd = trajectory.tEnd();
    m_geometry.clear();

    const std::vector<PlotPanel> panels = plotPanelsFor(kind);
    if (panels.empty()) return;

    const float panelWidth = (plotArea.width - kPanelGap * static_cast<float>(panels.size() + 1)) /
                             static_cast<float>(panels.size());
    const float panelHeight = plotArea.height - kTitleHeight - kAxisMargin - 30.0f;
    const std::vector<double>& time = trajectory.time();
    const double tEnd = trajectory.tEnd();

    for (std::size_t p = 0; p < panels.size(); ++p) {
        PanelGeometry g;
        g.panel = panels[p];
        g.frame = sf::FloatRect(plotArea.left + kPanelGap + static_cast<float>(p) * (panelWidth + kPanelGap),
                                plotArea.top + kTitleHeight,
                                panelWidth,
                                panelHeight);

        // Autoscale over every finite value in the panel.
        double lo = std::numeric_limits<double>::infinity();
        double hi = -std::numeric_limits<double>::infinity();
        for (const PlotLine& line : g.panel.lines) {
            for (double v : trajectory.series(line.seriesName)) {
                const double y = lineValue(line, v);
                if (!std::isfinite(y)) continue;
                lo = std::min(lo, y);
                hi = std::max(hi, y);
            }
        }
        if (!(lo <= hi)) {
            lo = 0.0;
            hi = 1.0;
        }
        if (hi - lo < 1.0e-9) {
            const double pad = std::max(0.5, std::abs(hi) * 0.1);
            lo -= pad;
            hi += pad;
        }
        const double margin = (hi - lo) * 0.05;
        g.yMin = lo - margin;
        g.yMax = hi + margin;

        for (const PlotLine& line : g.panel.lines) {
            const std::vector<double>& values = trajectory.series(line.seriesName);
            sf::VertexArray vertices(line.dashed ? sf::Lines : sf::LineStrip);
            if (values.empty() || tEnd <= 0.0) {
                g.lines.push_back(vertices);
                continue;
            }
            auto toScreen = [&](std::size_t i) {
                const double y = lineValue(line, values[i]);
                const float sx = g.frame.left + static_cast<float>(time[i] / tEnd) * g.frame.width;
                const float sy = g.frame.top + g.frame.height -
                                 static_cast<float>((y - g.yMin) / (g.yMax - g.yMin)) * g.frame.height;
                return sf::Vertex(sf::Vector2f(sx, sy), line.color);
            };
            for (std::size_t i = 0; i < values.size(); ++i) {
                if (!std::isfinite(values[i])) break;
                if (line.dashed) {
                    // Emit segment pairs only on the "on" half of each dash period.
                    if (i + 1 < values.size() && (i / kDashSamples) % 2 == 0 && std::isfinite(values[i + 1])) {
                        vertices.append(toScreen(i));
                        vertices.append(toScreen(i + 1));
                    }
                } else {
                    vertices.append(toScreen(i));
                }
            }
            g.lines.push_back(vertices);
        }
        m_geometry.push_back(std::move(g));
    }
}

void Renderer::drawPanel(const PanelGeometry& geometry) {
    const sf::FloatRect& f = geometry.frame;

    sf::RectangleShape frame(sf::Vector2f(f.width, f.height));
    frame.setPosition(f.left, f.top);
    frame.setFillColor(sf::Color::White);
    frame.setOutlineColor(kFrame);
    frame.setOutlineThickness(1.0f);
    m_window.draw(frame);

    for (const sf::VertexArray& line : geometry.lines) {
        m_window.draw(line);
    }

    drawText(geometry.panel.title, f.left, f.top - kTitleHeight + 4.0f, 18, sf::Color::Black);
    drawText(formatNumber(geometry.yMax), f.left - 45.0f, f.top - 8.0f, 12, kFrame);
    drawText(formatNumber(geometry.yMin), f.left - 45.0f, f.top + f.height - 8.0f, 12, kFrame);
    drawText("0", f.left, f.top + f.height + 4.0f, 12, kFrame);
    drawText(formatNumber(m_cachedTEnd, 1), f.left + f.width - 24.0f, f.top + f.height + 4.0f, 12, kFrame);
    drawText(geometry.panel.xLabel, f.left + f.width / 2.0f - 30.0f, f.top + f.height + 18.0f, 14, sf::Color::Black);

    sf::Text yLabel;
    yLabel.setFont(m_font);
    yLabel.setCharacterSize(14);
    yLabel.setFillColor(sf::Color::Black);
    yLabel.setString(geometry.panel.yLabel);
    yLabel.setRotation(-90.0f);
    yLabel.setPosition(f.left - 30.0f, f.top + f.height / 2.0f + 40.0f);
    m_window.draw(yLabel);

    drawLegend(geometry.panel, f);
}

void Renderer::drawLegend(const PlotPanel& panel, const sf::FloatRect& frame) {
    float y = frame.top + 8.0f;
    for (const PlotLine& line : panel.lines) {
        sf::RectangleShape swatch(sf::Vector2f(18.0f, line.dashed ? 2.0f : 3.0f));
        swatch.setFillColor(line.color);
        swatch.setPosition(frame.left + frame.width - 230.0f, y + 8.0f);
        m_window.draw(swatch);
        drawText(line.label, frame.left + frame.width - 205.0f, y, 13, sf::Color::Black);
        y += 18.0f;
    }
}

void Renderer::drawText(const std::string& text, float x, float y, unsigned int size, const sf::Color& color) {
    sf::Text t;
    t.setFont(m_font);
    t.setCharacterSize(size);
    t.setFillColor(color);
    t.setString(text);
    t.setPosition(x, y);
    m_window.draw(t);
}
