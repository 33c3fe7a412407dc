#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

#include "parameter_store.h"
#include "simulation_parameters.h"
#include "trajectory.h"

struct SimulationContext;

// Authoritative simulate step used by GUI and CLI: dispatches to the model
// engine for `kind` with the configured sample count.
bool runModel(ModelKind kind,
              const SimulationParameters& params,
              std::size_t sampleCount,
              Trajectory& out,
              std::string* errorMessage = nullptr);

// One interactive session: a parameter store per model plus the most recent
// trajectory. refresh() recomputes the whole trajectory from t = 0 when the
// active store moved past the last simulated revision. Several edits between
// refreshes collapse into one run of the latest snapshot.
class SimulationRunner {
public:
    SimulationRunner(const SimulationContext& ctx, ModelKind initialKind);

    ModelKind modelKind() const { return m_kind; }
    void setModelKind(ModelKind kind);

    ParameterStore& store() { return storeFor(m_kind); }
    const ParameterStore& store() const { return storeFor(m_kind); }
    ParameterStore& storeFor(ModelKind kind);
    const ParameterStore& storeFor(ModelKind kind) const;

    // Returns true when a new trajectory (or a new error) was published.
    bool refresh();
    void invalidate() { m_publishedRevision = 0; }

    bool hasTrajectory() const { return !m_trajectory.empty(); }
    const Trajectory& trajectory() const { return m_trajectory; }
    const std::string& lastError() const { return m_lastError; }
    bool stateLeftUnitInterval() const { return m_stateLeftUnitInterval; }
    std::uint64_t publishedRevision() const { return m_publishedRevision; }
    int recomputeCount() const { return m_recomputeCount; }

private:
    std::size_t m_sampleCount;
    ModelKind m_kind;
    ParameterStore m_clubStore;
    ParameterStore m_playerStore;

    Trajectory m_trajectory;
    std::string m_lastError;
    bool m_stateLeftUnitInterval = false;
    std::uint64_t m_publishedRevision = 0;
    int m_recomputeCount = 0;
};
