#include "player_motivation_model.h"

#include "simulation_parameters.h"
#include "trajectory.h"

PlayerMotivationRule::PlayerMotivationRule(const PlayerPayoffCoefficients& coefficients)
    : m_coefficients(coefficients) {}

PlayerMotivationRule::Payoffs PlayerMotivationRule::payoffs(double x) const {
    const PlayerPayoffCoefficients& c = m_coefficients;
    Payoffs p;
    p.a = c.a0 + c.pGrow * x;
    p.d = c.d0 + c.mGrow * (1.0 - x);
    p.fP = p.a * x + c.b * (1.0 - x);
    p.fM = c.b * x + p.d * (1.0 - x);
    p.dx = x * (1.0 - x) * (p.fP - p.fM);
    return p;
}

std::vector<std::string> PlayerMotivationRule::stateNames() const {
    return {PlayerSeries::kX};
}

std::vector<std::string> PlayerMotivationRule::auxiliaryNames() const {
    return {PlayerSeries::kFP, PlayerSeries::kFM, PlayerSeries::kA, PlayerSeries::kD};
}

void PlayerMotivationRule::evaluate(const std::vector<double>& state,
                                    std::vector<double>& derivative,
                                    std::vector<double>& auxiliary) const {
    const Payoffs p = payoffs(state[0]);
    derivative[0] = p.dx;
    auxiliary[0] = p.fP;
    auxiliary[1] = p.fM;
    auxiliary[2] = p.a;
    auxiliary[3] = p.d;
}

PlayerMotivationModel::PlayerMotivationModel(std::size_t sampleCount) : m_stepper(sampleCount) {}

bool PlayerMotivationModel::validate(const SimulationParameters& params, std::string* errorMessage) {
    static const std::vector<std::string> required = {
        ParameterNames::kA0, ParameterNames::kD0, ParameterNames::kB,
        ParameterNames::kPGrow, ParameterNames::kMGrow,
        ParameterNames::kX0, ParameterNames::kTEnd};
    return requireFiniteParameters(params, required, errorMessage) &&
           requirePositiveHorizon(params, errorMessage) &&
           requireUnitInterval(params, ParameterNames::kX0, errorMessage);
}

PlayerPayoffCoefficients PlayerMotivationModel::coefficientsFrom(const SimulationParameters& params) {
    PlayerPayoffCoefficients c;
    c.a0 = params.value(ParameterNames::kA0, c.a0);
    c.d0 = params.value(ParameterNames::kD0, c.d0);
    c.b = params.value(ParameterNames::kB, c.b);
    c.pGrow = params.value(ParameterNames::kPGrow, c.pGrow);
    c.mGrow = params.value(ParameterNames::kMGrow, c.mGrow);
    return c;
}

bool PlayerMotivationModel::simulate(const SimulationParameters& params,
                                     Trajectory& out,
                                     std::string* errorMessage) const {
    if (!validate(params, errorMessage)) {
        return false;
    }
    const PlayerMotivationRule rule(coefficientsFrom(params));
    const std::vector<double> initial = {params.value(ParameterNames::kX0, 0.0)};
    return m_stepper.integrate(rule, initial, params.value(ParameterNames::kTEnd, 0.0), out, errorMessage);
}

bool PlayerMotivationModel::stateLeftUnitInterval(const Trajectory& trajectory) {
    for (double x : trajectory.series(PlayerSeries::kX)) {
        if (!(x >= 0.0 && x <= 1.0)) {
            return true;
        }
    }
    return false;
}
