#include "simulation_runner.h"

#include "club_strategy_model.h"
#include "player_motivation_model.h"
#include "simulation_context.h"

#include <iomanip>
#include <iostream>
#include <sstream>

namespace {

void maybeTraceDeterminism(ModelKind kind, std::uint64_t revision, const Trajectory& traj) {
    if (!SimulationContext::determinismTraceEnabled()) {
        return;
    }
    std::cout << "[det-trace] model=" << modelKindName(kind)
              << " rev=" << revision
              << " samples=" << traj.sampleCount()
              << " fingerprint=" << std::hex << traj.fingerprint() << std::dec << std::endl;
}

void logRecompute(ModelKind kind, std::uint64_t revision, const Trajectory& traj) {
    if (!SimulationContext::isVerbose() || traj.empty()) {
        return;
    }
    const std::size_t last = traj.sampleCount() - 1;
    std::ostringstream line;
    line << "[Sim] " << modelKindName(kind) << " rev=" << revision
         << " t_end=" << traj.tEnd()
         << " dt=" << traj.dt()
         << std::setprecision(6)
         << " x_end=" << traj.series(kind == ModelKind::Club ? ClubSeries::kX : PlayerSeries::kX)[last];
    if (kind == ModelKind::Club) {
        line << " y_end=" << traj.series(ClubSeries::kY)[last];
    }
    std::cout << line.str() << "\n";
}

} // namespace

bool runModel(ModelKind kind,
              const SimulationParameters& params,
              std::size_t sampleCount,
              Trajectory& out,
              std::string* errorMessage) {
    if (kind == ModelKind::Club) {
        const ClubStrategyModel model(PayoffTable::defaultTable(), sampleCount);
        return model.simulate(params, out, errorMessage);
    }
    const PlayerMotivationModel model(sampleCount);
    return model.simulate(params, out, errorMessage);
}

SimulationRunner::SimulationRunner(const SimulationContext& ctx, ModelKind initialKind)
    : m_sampleCount(ctx.sampleCount()),
      m_kind(initialKind),
      m_clubStore(clubParameterSpecs(), ctx.parametersFor(ModelKind::Club)),
      m_playerStore(playerParameterSpecs(), ctx.parametersFor(ModelKind::Player)) {}

void SimulationRunner::setModelKind(ModelKind kind) {
    if (kind == m_kind) {
        return;
    }
    m_kind = kind;
    m_trajectory = Trajectory();
    m_lastError.clear();
    m_stateLeftUnitInterval = false;
    invalidate();
}

ParameterStore& SimulationRunner::storeFor(ModelKind kind) {
    return (kind == ModelKind::Club) ? m_clubStore : m_playerStore;
}

const ParameterStore& SimulationRunner::storeFor(ModelKind kind) const {
    return (kind == ModelKind::Club) ? m_clubStore : m_playerStore;
}

bool SimulationRunner::refresh() {
    const ParameterStore& active = store();
    const std::uint64_t revision = active.revision();
    if (revision == m_publishedRevision) {
        return false;
    }

    const SimulationParameters snapshot = active.snapshot();
    Trajectory next;
    std::string err;
    const bool ok = runModel(m_kind, snapshot, m_sampleCount, next, &err);
    ++m_recomputeCount;
    m_publishedRevision = revision;

    if (!ok) {
        m_lastError = err;
        std::cerr << "[Sim] " << modelKindName(m_kind) << ": " << err << "\n";
        return true;
    }

    m_lastError.clear();
    m_trajectory = std::move(next);
    m_stateLeftUnitInterval =
        (m_kind == ModelKind::Player) && PlayerMotivationModel::stateLeftUnitInterval(m_trajectory);
    if (m_stateLeftUnitInterval) {
        std::cerr << "[Sim] warning: player share left [0,1]; dt=" << m_trajectory.dt()
                  << " is too coarse for these payoffs.\n";
    }

    logRecompute(m_kind, revision, m_trajectory);
    maybeTraceDeterminism(m_kind, revision, m_trajectory);
    return true;
}
