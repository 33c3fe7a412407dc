#include "club_strategy_model.h"

#include "simulation_parameters.h"
#include "trajectory.h"

namespace {

constexpr std::size_t kYouth = static_cast<std::size_t>(TransferStrategy::Youth);
constexpr std::size_t kStar = static_cast<std::size_t>(TransferStrategy::Star);

} // namespace

PayoffTable::PayoffTable() : PayoffTable(defaultTable()) {}

PayoffTable::PayoffTable(PayoffPair youthYouth, PayoffPair youthStar, PayoffPair starYouth, PayoffPair starStar) {
    m_entries[kYouth][kYouth] = youthYouth;
    m_entries[kYouth][kStar] = youthStar;
    m_entries[kStar][kYouth] = starYouth;
    m_entries[kStar][kStar] = starStar;
}

PayoffTable PayoffTable::defaultTable() {
    // (Saudi, Europe)
    return PayoffTable({4.0, 4.0}, {2.0, 5.0}, {5.0, 2.0}, {1.0, 1.0});
}

const PayoffPair& PayoffTable::at(TransferStrategy saudi, TransferStrategy europe) const {
    return m_entries[static_cast<std::size_t>(saudi)][static_cast<std::size_t>(europe)];
}

PayoffTable PayoffTable::transposed() const {
    PayoffTable t = *this;
    for (std::size_t s = 0; s < 2; ++s) {
        for (std::size_t e = 0; e < 2; ++e) {
            const PayoffPair& src = m_entries[e][s];
            t.m_entries[s][e] = {src.europe, src.saudi};
        }
    }
    return t;
}

bool PayoffTable::operator==(const PayoffTable& other) const {
    for (std::size_t s = 0; s < 2; ++s) {
        for (std::size_t e = 0; e < 2; ++e) {
            if (m_entries[s][e].saudi != other.m_entries[s][e].saudi ||
                m_entries[s][e].europe != other.m_entries[s][e].europe) {
                return false;
            }
        }
    }
    return true;
}

ClubStrategyRule::ClubStrategyRule(const PayoffTable& payoffs) : m_payoffs(payoffs) {}

ClubStrategyRule::Rates ClubStrategyRule::rates(double x, double y) const {
    const PayoffPair& yy = m_payoffs.at(TransferStrategy::Youth, TransferStrategy::Youth);
    const PayoffPair& ys = m_payoffs.at(TransferStrategy::Youth, TransferStrategy::Star);
    const PayoffPair& sy = m_payoffs.at(TransferStrategy::Star, TransferStrategy::Youth);
    const PayoffPair& ss = m_payoffs.at(TransferStrategy::Star, TransferStrategy::Star);

    Rates r;

    // Saudi side: opponent mix is y.
    r.saudiYouthPayoff = y * yy.saudi + (1.0 - y) * ys.saudi;
    const double saudiStar = y * sy.saudi + (1.0 - y) * ss.saudi;
    r.saudiAvgPayoff = x * r.saudiYouthPayoff + (1.0 - x) * saudiStar;

    // Europe side: opponent mix is x.
    r.europeYouthPayoff = x * yy.europe + (1.0 - x) * sy.europe;
    const double europeStar = x * ys.europe + (1.0 - x) * ss.europe;
    r.europeAvgPayoff = y * r.europeYouthPayoff + (1.0 - y) * europeStar;

    r.dx = x * (1.0 - x) * (r.saudiYouthPayoff - r.saudiAvgPayoff);
    r.dy = y * (1.0 - y) * (r.europeYouthPayoff - r.europeAvgPayoff);
    return r;
}

std::vector<std::string> ClubStrategyRule::stateNames() const {
    return {ClubSeries::kX, ClubSeries::kY};
}

std::vector<std::string> ClubStrategyRule::auxiliaryNames() const {
    return {ClubSeries::kYouthYouth, ClubSeries::kYouthStar, ClubSeries::kStarYouth, ClubSeries::kStarStar,
            ClubSeries::kSaudiAvgPayoff, ClubSeries::kEuropeAvgPayoff};
}

void ClubStrategyRule::evaluate(const std::vector<double>& state,
                                std::vector<double>& derivative,
                                std::vector<double>& auxiliary) const {
    const double x = state[0];
    const double y = state[1];
    const Rates r = rates(x, y);
    derivative[0] = r.dx;
    derivative[1] = r.dy;

    // Joint mass over the four strategy pairs, assuming independent populations.
    auxiliary[0] = x * y;
    auxiliary[1] = x * (1.0 - y);
    auxiliary[2] = (1.0 - x) * y;
    auxiliary[3] = (1.0 - x) * (1.0 - y);
    auxiliary[4] = r.saudiAvgPayoff;
    auxiliary[5] = r.europeAvgPayoff;
}

ClubStrategyModel::ClubStrategyModel(const PayoffTable& payoffs, std::size_t sampleCount)
    : m_rule(payoffs), m_stepper(sampleCount) {}

bool ClubStrategyModel::validate(const SimulationParameters& params, std::string* errorMessage) {
    static const std::vector<std::string> required = {
        ParameterNames::kX0, ParameterNames::kY0, ParameterNames::kTEnd};
    return requireFiniteParameters(params, required, errorMessage) &&
           requirePositiveHorizon(params, errorMessage) &&
           requireUnitInterval(params, ParameterNames::kX0, errorMessage) &&
           requireUnitInterval(params, ParameterNames::kY0, errorMessage);
}

bool ClubStrategyModel::simulate(const SimulationParameters& params,
                                 Trajectory& out,
                                 std::string* errorMessage) const {
    if (!validate(params, errorMessage)) {
        return false;
    }
    const std::vector<double> initial = {
        params.value(ParameterNames::kX0, 0.0),
        params.value(ParameterNames::kY0, 0.0)};
    return m_stepper.integrate(m_rule, initial, params.value(ParameterNames::kTEnd, 0.0), out, errorMessage);
}
