#pragma once

#include <array>
#include <cstddef>
#include <string>
#include <vector>

#include "replicator_stepper.h"

class SimulationParameters;
class Trajectory;

enum class TransferStrategy {
    Youth = 0,
    Star = 1
};

struct PayoffPair {
    double saudi = 0.0;
    double europe = 0.0;
};

// 2x2 bimatrix indexed [Saudi strategy][Europe strategy].
class PayoffTable {
public:
    PayoffTable();
    PayoffTable(PayoffPair youthYouth, PayoffPair youthStar, PayoffPair starYouth, PayoffPair starStar);

    static PayoffTable defaultTable();

    const PayoffPair& at(TransferStrategy saudi, TransferStrategy europe) const;

    // Saudi and Europe trade places: T'[s][e] = (T[e][s].europe, T[e][s].saudi).
    PayoffTable transposed() const;

    bool operator==(const PayoffTable& other) const;

private:
    std::array<std::array<PayoffPair, 2>, 2> m_entries;
};

// Two-population replicator rule. State is (x, y) = P(Saudi Youth), P(Europe Youth).
class ClubStrategyRule : public StepRule {
public:
    struct Rates {
        double dx = 0.0;
        double dy = 0.0;
        double saudiYouthPayoff = 0.0;
        double saudiAvgPayoff = 0.0;
        double europeYouthPayoff = 0.0;
        double europeAvgPayoff = 0.0;
    };

    explicit ClubStrategyRule(const PayoffTable& payoffs);

    Rates rates(double x, double y) const;
    const PayoffTable& payoffs() const { return m_payoffs; }

    std::vector<std::string> stateNames() const override;
    std::vector<std::string> auxiliaryNames() const override;
    BoundaryPolicy boundaryPolicy() const override { return BoundaryPolicy::ClampToUnitInterval; }
    void evaluate(const std::vector<double>& state,
                  std::vector<double>& derivative,
                  std::vector<double>& auxiliary) const override;

private:
    PayoffTable m_payoffs;
};

namespace ClubSeries {
    inline const std::string kX = "x";
    inline const std::string kY = "y";
    inline const std::string kYouthYouth = "youth_youth";
    inline const std::string kYouthStar = "youth_star";
    inline const std::string kStarYouth = "star_youth";
    inline const std::string kStarStar = "star_star";
    inline const std::string kSaudiAvgPayoff = "saudi_avg_payoff";
    inline const std::string kEuropeAvgPayoff = "europe_avg_payoff";
} // namespace ClubSeries

// Club transfer-strategy engine. Inputs x0, y0 in [0,1] and t_end > 0; every
// updated state is clamped back into [0,1].
class ClubStrategyModel {
public:
    explicit ClubStrategyModel(const PayoffTable& payoffs = PayoffTable::defaultTable(),
                               std::size_t sampleCount = kDefaultSampleCount);

    bool simulate(const SimulationParameters& params,
                  Trajectory& out,
                  std::string* errorMessage = nullptr) const;

    const PayoffTable& payoffs() const { return m_rule.payoffs(); }
    std::size_t sampleCount() const { return m_stepper.sampleCount(); }

    static bool validate(const SimulationParameters& params, std::string* errorMessage);

private:
    ClubStrategyRule m_rule;
    EulerStepper m_stepper;
};
