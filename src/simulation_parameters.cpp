#include "simulation_parameters.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <sstream>

SimulationParameters::SimulationParameters(std::initializer_list<std::pair<const std::string, double>> values)
    : m_values(values) {}

SimulationParameters::SimulationParameters(std::map<std::string, double> values)
    : m_values(std::move(values)) {}

bool SimulationParameters::has(const std::string& name) const {
    return m_values.find(name) != m_values.end();
}

double SimulationParameters::value(const std::string& name, double fallback) const {
    const auto it = m_values.find(name);
    return (it != m_values.end()) ? it->second : fallback;
}

bool SimulationParameters::tryGetValue(const std::string& name, double& out) const {
    const auto it = m_values.find(name);
    if (it == m_values.end()) {
        return false;
    }
    out = it->second;
    return true;
}

SimulationParameters SimulationParameters::withValue(const std::string& name, double value) const {
    std::map<std::string, double> copy = m_values;
    copy[name] = value;
    return SimulationParameters(std::move(copy));
}

std::vector<std::string> SimulationParameters::names() const {
    std::vector<std::string> out;
    out.reserve(m_values.size());
    for (const auto& entry : m_values) {
        out.push_back(entry.first);
    }
    return out;
}

const char* modelKindName(ModelKind kind) {
    switch (kind) {
        case ModelKind::Club: return "club";
        case ModelKind::Player: return "player";
    }
    return "unknown";
}

bool parseModelKind(const std::string& text, ModelKind& out) {
    std::string lower = text;
    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    if (lower == "club" || lower == "clubs") {
        out = ModelKind::Club;
        return true;
    }
    if (lower == "player" || lower == "players") {
        out = ModelKind::Player;
        return true;
    }
    return false;
}

const std::vector<ParameterSpec>& clubParameterSpecs() {
    static const std::vector<ParameterSpec> specs = {
        {ParameterNames::kX0, "Initial Saudi Youth %", 0.0, 1.0, 0.01, 0.5},
        {ParameterNames::kY0, "Initial Europe Youth %", 0.0, 1.0, 0.01, 0.5},
        {ParameterNames::kTEnd, "Time Horizon", 1.0, 40.0, 0.0, 10.0},
    };
    return specs;
}

const std::vector<ParameterSpec>& playerParameterSpecs() {
    static const std::vector<ParameterSpec> specs = {
        {ParameterNames::kA0, "PvP Base Payoff", 0.1, 5.0, 0.05, 2.5},
        {ParameterNames::kD0, "MvM Base Payoff", 0.1, 5.0, 0.05, 2.0},
        {ParameterNames::kB, "Cross-Payoff", 0.1, 5.0, 0.05, 1.4},
        {ParameterNames::kPGrow, "Prestige Growth", 0.1, 10.0, 0.05, 1.0},
        {ParameterNames::kMGrow, "Money Growth", 0.1, 10.0, 0.05, 5.0},
        {ParameterNames::kX0, "Initial Prestige %", 0.0, 1.0, 0.01, 0.6},
        {ParameterNames::kTEnd, "Time Range", 1.0, 50.0, 1.0, 10.0},
    };
    return specs;
}

const std::vector<ParameterSpec>& parameterSpecsFor(ModelKind kind) {
    return (kind == ModelKind::Club) ? clubParameterSpecs() : playerParameterSpecs();
}

SimulationParameters defaultParametersFor(ModelKind kind) {
    std::map<std::string, double> values;
    for (const ParameterSpec& spec : parameterSpecsFor(kind)) {
        values[spec.name] = spec.defaultValue;
    }
    return SimulationParameters(std::move(values));
}

bool requireFiniteParameters(const SimulationParameters& params,
                             const std::vector<std::string>& required,
                             std::string* errorMessage) {
    for (const std::string& name : required) {
        double v = 0.0;
        if (!params.tryGetValue(name, v)) {
            if (errorMessage) {
                *errorMessage = "missing required parameter '" + name + "'";
            }
            return false;
        }
        if (!std::isfinite(v)) {
            if (errorMessage) {
                *errorMessage = "parameter '" + name + "' is not a finite number";
            }
            return false;
        }
    }
    return true;
}

bool requireUnitInterval(const SimulationParameters& params,
                         const std::string& name,
                         std::string* errorMessage) {
    const double v = params.value(name, std::nan(""));
    if (!(v >= 0.0 && v <= 1.0)) {
        if (errorMessage) {
            std::ostringstream oss;
            oss << "parameter '" << name << "'=" << v << " is outside [0,1]";
            *errorMessage = oss.str();
        }
        return false;
    }
    return true;
}

bool requirePositiveHorizon(const SimulationParameters& params, std::string* errorMessage) {
    const double tEnd = params.value(ParameterNames::kTEnd, std::nan(""));
    if (!(std::isfinite(tEnd) && tEnd > 0.0)) {
        if (errorMessage) {
            std::ostringstream oss;
            oss << "invalid horizon: t_end=" << tEnd << " (must be > 0)";
            *errorMessage = oss.str();
        }
        return false;
    }
    return true;
}
