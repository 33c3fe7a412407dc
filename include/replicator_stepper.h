#pragma once

#include <cstddef>
#include <string>
#include <vector>

class Trajectory;

constexpr std::size_t kDefaultSampleCount = 1000;
// Upper bound on samples per run; keeps one trajectory under ~100 MB.
constexpr std::size_t kMaxSampleCount = 1000000;

// What the stepper does with the state after each Euler update.
enum class BoundaryPolicy {
    ClampToUnitInterval, // every component is clipped to [0,1]
    Unclamped            // state may leave [0,1] when dt * |dx| is large
};

// Derivative rule plugged into EulerStepper. Implementations are stateless
// with respect to the integration; evaluate() may be called any number of times.
class StepRule {
public:
    virtual ~StepRule() = default;

    virtual std::vector<std::string> stateNames() const = 0;
    virtual std::vector<std::string> auxiliaryNames() const { return {}; }
    virtual BoundaryPolicy boundaryPolicy() const = 0;

    // derivative and auxiliary arrive sized to stateNames()/auxiliaryNames().
    virtual void evaluate(const std::vector<double>& state,
                          std::vector<double>& derivative,
                          std::vector<double>& auxiliary) const = 0;
};

// Fixed-step explicit Euler over [0, tEnd] with sampleCount samples.
// Auxiliary outputs for sample i are evaluated at state i, including the
// terminal sample (one extra evaluation after the last update).
class EulerStepper {
public:
    explicit EulerStepper(std::size_t sampleCount = kDefaultSampleCount);

    std::size_t sampleCount() const { return m_sampleCount; }

    bool integrate(const StepRule& rule,
                   const std::vector<double>& initialState,
                   double tEnd,
                   Trajectory& out,
                   std::string* errorMessage = nullptr) const;

private:
    std::size_t m_sampleCount;
};

double clamp01(double v);
