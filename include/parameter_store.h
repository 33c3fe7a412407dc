#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "simulation_parameters.h"

// Live-editable values behind the sliders. Edits made through setValue() are
// snapped to the ParameterSpec step and clamped to its range, the way a slider
// would; assign() keeps values verbatim so out-of-range configuration still
// reaches the engine's validation. Every effective change bumps revision().
class ParameterStore {
public:
    ParameterStore(const std::vector<ParameterSpec>& specs, const SimulationParameters& initial);

    const std::vector<ParameterSpec>& specs() const { return m_specs; }
    const ParameterSpec* findSpec(const std::string& name) const;

    double value(const std::string& name) const;
    bool setValue(const std::string& name, double value);
    void assign(const SimulationParameters& values);
    void resetToDefaults();

    SimulationParameters snapshot() const;
    std::uint64_t revision() const { return m_revision; }

    static double snapToSpec(const ParameterSpec& spec, double value);

private:
    std::vector<ParameterSpec> m_specs;
    std::map<std::string, double> m_values;
    std::uint64_t m_revision = 1;
};
