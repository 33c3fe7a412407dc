#include "parameter_store.h"

#include <algorithm>
#include <cmath>

ParameterStore::ParameterStore(const std::vector<ParameterSpec>& specs, const SimulationParameters& initial)
    : m_specs(specs) {
    for (const ParameterSpec& spec : m_specs) {
        m_values[spec.name] = initial.value(spec.name, spec.defaultValue);
    }
}

const ParameterSpec* ParameterStore::findSpec(const std::string& name) const {
    for (const ParameterSpec& spec : m_specs) {
        if (spec.name == name) return &spec;
    }
    return nullptr;
}

double ParameterStore::value(const std::string& name) const {
    const auto it = m_values.find(name);
    return (it != m_values.end()) ? it->second : 0.0;
}

double ParameterStore::snapToSpec(const ParameterSpec& spec, double value) {
    if (!std::isfinite(value)) {
        return spec.defaultValue;
    }
    double v = value;
    if (spec.step > 0.0) {
        v = std::round((v - spec.minValue) / spec.step) * spec.step + spec.minValue;
    }
    return std::max(spec.minValue, std::min(spec.maxValue, v));
}

bool ParameterStore::setValue(const std::string& name, double value) {
    const ParameterSpec* spec = findSpec(name);
    if (!spec) {
        return false;
    }
    const double snapped = snapToSpec(*spec, value);
    double& slot = m_values[name];
    if (slot == snapped) {
        return false;
    }
    slot = snapped;
    ++m_revision;
    return true;
}

void ParameterStore::assign(const SimulationParameters& values) {
    bool changed = false;
    for (const ParameterSpec& spec : m_specs) {
        double v = 0.0;
        if (!values.tryGetValue(spec.name, v)) continue;
        double& slot = m_values[spec.name];
        if (slot != v) {
            slot = v;
            changed = true;
        }
    }
    if (changed) {
        ++m_revision;
    }
}

void ParameterStore::resetToDefaults() {
    bool changed = false;
    for (const ParameterSpec& spec : m_specs) {
        double& slot = m_values[spec.name];
        if (slot != spec.defaultValue) {
            slot = spec.defaultValue;
            changed = true;
        }
    }
    if (changed) {
        ++m_revision;
    }
}

SimulationParameters ParameterStore::snapshot() const {
    return SimulationParameters(m_values);
}
