#pragma once

#include <cstddef>
#include <initializer_list>
#include <map>
#include <string>
#include <utility>
#include <vector>

// Immutable named set of scalar inputs handed to a model's simulate() call.
// Editing happens in ParameterStore; this is only ever a snapshot.
class SimulationParameters {
public:
    SimulationParameters() = default;
    SimulationParameters(std::initializer_list<std::pair<const std::string, double>> values);
    explicit SimulationParameters(std::map<std::string, double> values);

    bool has(const std::string& name) const;
    double value(const std::string& name, double fallback) const;
    bool tryGetValue(const std::string& name, double& out) const;

    // Copy with one entry added or replaced.
    SimulationParameters withValue(const std::string& name, double value) const;

    std::vector<std::string> names() const;
    const std::map<std::string, double>& values() const { return m_values; }
    std::size_t size() const { return m_values.size(); }

    bool operator==(const SimulationParameters& other) const { return m_values == other.m_values; }
    bool operator!=(const SimulationParameters& other) const { return !(*this == other); }

private:
    std::map<std::string, double> m_values;
};

enum class ModelKind {
    Club,
    Player
};

const char* modelKindName(ModelKind kind);
bool parseModelKind(const std::string& text, ModelKind& out);

// Slider-facing description of one input. step <= 0 means continuous.
struct ParameterSpec {
    std::string name;
    std::string label;
    double minValue = 0.0;
    double maxValue = 1.0;
    double step = 0.0;
    double defaultValue = 0.0;
};

namespace ParameterNames {
    inline const std::string kX0 = "x0";
    inline const std::string kY0 = "y0";
    inline const std::string kTEnd = "t_end";
    inline const std::string kA0 = "a0";
    inline const std::string kD0 = "d0";
    inline const std::string kB = "b";
    inline const std::string kPGrow = "pGrow";
    inline const std::string kMGrow = "mGrow";
} // namespace ParameterNames

const std::vector<ParameterSpec>& clubParameterSpecs();
const std::vector<ParameterSpec>& playerParameterSpecs();
const std::vector<ParameterSpec>& parameterSpecsFor(ModelKind kind);

SimulationParameters defaultParametersFor(ModelKind kind);

// Shared boundary checks used by both engines. Each returns false and fills
// errorMessage (when non-null) on the first violation found.
bool requireFiniteParameters(const SimulationParameters& params,
                             const std::vector<std::string>& required,
                             std::string* errorMessage);
bool requireUnitInterval(const SimulationParameters& params,
                         const std::string& name,
                         std::string* errorMessage);
bool requirePositiveHorizon(const SimulationParameters& params, std::string* errorMessage);
