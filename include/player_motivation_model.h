#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "replicator_stepper.h"

class SimulationParameters;
class Trajectory;

struct PlayerPayoffCoefficients {
    double a0 = 2.5;    // Prestige vs Prestige base payoff
    double d0 = 2.0;    // Money vs Money base payoff
    double b = 1.4;     // cross-strategy payoff
    double pGrow = 1.0; // growth of a with Prestige share
    double mGrow = 5.0; // growth of d with Money share
};

// Single-population replicator rule with mix-dependent diagonal payoffs:
//   a = a0 + pGrow * x,  d = d0 + mGrow * (1 - x)
//   fP = a x + b (1 - x),  fM = b x + d (1 - x)
//   dx = x (1 - x) (fP - fM)
class PlayerMotivationRule : public StepRule {
public:
    struct Payoffs {
        double dx = 0.0;
        double fP = 0.0;
        double fM = 0.0;
        double a = 0.0;
        double d = 0.0;
    };

    explicit PlayerMotivationRule(const PlayerPayoffCoefficients& coefficients);

    Payoffs payoffs(double x) const;
    const PlayerPayoffCoefficients& coefficients() const { return m_coefficients; }

    std::vector<std::string> stateNames() const override;
    std::vector<std::string> auxiliaryNames() const override;
    // No clipping here, unlike the club rule. x can overshoot [0,1] when
    // dt * |dx| is large; that is an Euler accuracy limit, reported not hidden.
    BoundaryPolicy boundaryPolicy() const override { return BoundaryPolicy::Unclamped; }
    void evaluate(const std::vector<double>& state,
                  std::vector<double>& derivative,
                  std::vector<double>& auxiliary) const override;

private:
    PlayerPayoffCoefficients m_coefficients;
};

namespace PlayerSeries {
    inline const std::string kX = "x";
    inline const std::string kFP = "fP";
    inline const std::string kFM = "fM";
    inline const std::string kA = "a";
    inline const std::string kD = "d";
} // namespace PlayerSeries

class PlayerMotivationModel {
public:
    explicit PlayerMotivationModel(std::size_t sampleCount = kDefaultSampleCount);

    bool simulate(const SimulationParameters& params,
                  Trajectory& out,
                  std::string* errorMessage = nullptr) const;

    std::size_t sampleCount() const { return m_stepper.sampleCount(); }

    static bool validate(const SimulationParameters& params, std::string* errorMessage);
    static PlayerPayoffCoefficients coefficientsFrom(const SimulationParameters& params);

    // True when any x sample left [0,1] (or stopped being finite).
    static bool stateLeftUnitInterval(const Trajectory& trajectory);

private:
    EulerStepper m_stepper;
};
