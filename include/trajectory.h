#pragma once

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <string>
#include <vector>

// Output of one simulate() call: a uniform time grid plus equally long named
// series. Series keep insertion order so renderers and CSV columns are stable.
class Trajectory {
public:
    Trajectory() = default;

    // Builds the grid t_i = i * dt with t_{N-1} pinned to tEnd.
    void resetTimeGrid(double tEnd, std::size_t sampleCount);

    // Adds a zero-filled series of sampleCount() entries; returns its index.
    std::size_t addSeries(const std::string& name);

    std::size_t sampleCount() const { return m_time.size(); }
    double dt() const { return m_dt; }
    double tEnd() const { return m_time.empty() ? 0.0 : m_time.back(); }
    const std::vector<double>& time() const { return m_time; }

    bool hasSeries(const std::string& name) const;
    // Empty vector when the name is unknown.
    const std::vector<double>& series(const std::string& name) const;
    const std::vector<double>& seriesAt(std::size_t index) const { return m_series[index].values; }
    std::vector<double>& mutableSeriesAt(std::size_t index) { return m_series[index].values; }
    const std::string& seriesName(std::size_t index) const { return m_series[index].name; }
    std::size_t seriesCount() const { return m_series.size(); }
    std::vector<std::string> seriesNames() const;

    bool empty() const { return m_time.empty(); }

    void writeCsv(std::ostream& out, int precision = 10) const;

    // FNV-1a over the raw bits of every time sample and series value.
    std::uint64_t fingerprint() const;

private:
    struct Series {
        std::string name;
        std::vector<double> values;
    };

    double m_dt = 0.0;
    std::vector<double> m_time;
    std::vector<Series> m_series;
};
