#include "replicator_stepper.h"

#include "trajectory.h"

#include <algorithm>
#include <cmath>
#include <sstream>

double clamp01(double v) {
    return std::max(0.0, std::min(1.0, v));
}

EulerStepper::EulerStepper(std::size_t sampleCount) : m_sampleCount(sampleCount) {}

bool EulerStepper::integrate(const StepRule& rule,
                             const std::vector<double>& initialState,
                             double tEnd,
                             Trajectory& out,
                             std::string* errorMessage) const {
    if (m_sampleCount < 2 || m_sampleCount > kMaxSampleCount) {
        if (errorMessage) {
            std::ostringstream oss;
            oss << "sample count " << m_sampleCount << " is out of range (need 2.." << kMaxSampleCount << ")";
            *errorMessage = oss.str();
        }
        return false;
    }
    if (!(std::isfinite(tEnd) && tEnd > 0.0)) {
        if (errorMessage) {
            std::ostringstream oss;
            oss << "invalid horizon: t_end=" << tEnd << " (must be > 0)";
            *errorMessage = oss.str();
        }
        return false;
    }

    const std::vector<std::string> stateNames = rule.stateNames();
    const std::vector<std::string> auxNames = rule.auxiliaryNames();
    if (initialState.size() != stateNames.size()) {
        if (errorMessage) {
            std::ostringstream oss;
            oss << "initial state has " << initialState.size() << " components, rule expects "
                << stateNames.size();
            *errorMessage = oss.str();
        }
        return false;
    }

    Trajectory traj;
    traj.resetTimeGrid(tEnd, m_sampleCount);
    std::vector<std::size_t> stateSlots;
    std::vector<std::size_t> auxSlots;
    stateSlots.reserve(stateNames.size());
    auxSlots.reserve(auxNames.size());
    for (const std::string& name : stateNames) {
        stateSlots.push_back(traj.addSeries(name));
    }
    for (const std::string& name : auxNames) {
        auxSlots.push_back(traj.addSeries(name));
    }

    const double dt = traj.dt();
    const bool clamp = rule.boundaryPolicy() == BoundaryPolicy::ClampToUnitInterval;

    std::vector<double> state = initialState;
    std::vector<double> derivative(stateNames.size(), 0.0);
    std::vector<double> auxiliary(auxNames.size(), 0.0);

    auto recordState = [&](std::size_t sample) {
        for (std::size_t k = 0; k < stateSlots.size(); ++k) {
            traj.mutableSeriesAt(stateSlots[k])[sample] = state[k];
        }
    };
    auto recordAuxiliary = [&](std::size_t sample) {
        for (std::size_t k = 0; k < auxSlots.size(); ++k) {
            traj.mutableSeriesAt(auxSlots[k])[sample] = auxiliary[k];
        }
    };

    recordState(0);
    for (std::size_t i = 1; i < m_sampleCount; ++i) {
        rule.evaluate(state, derivative, auxiliary);
        recordAuxiliary(i - 1);
        for (std::size_t k = 0; k < state.size(); ++k) {
            const double next = state[k] + derivative[k] * dt;
            state[k] = clamp ? clamp01(next) : next;
        }
        recordState(i);
    }

    // Terminal sample: auxiliaries come from the final state, not extrapolated.
    rule.evaluate(state, derivative, auxiliary);
    recordAuxiliary(m_sampleCount - 1);

    out = std::move(traj);
    return true;
}
