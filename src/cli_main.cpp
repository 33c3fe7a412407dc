#include <cmath>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <limits>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include "club_strategy_model.h"
#include "player_motivation_model.h"
#include "simulation_context.h"
#include "simulation_parameters.h"
#include "simulation_runner.h"
#include "trajectory.h"

namespace {

struct RunOptions {
    std::string configPath = "data/replisim_config.toml";
    std::string model;       // empty means [gui] startModel from config
    std::string outPath;     // empty means out/<model>_trajectory.csv, "-" means stdout
    int samples = -1;        // -1 means "use config value"
    int precision = -1;      // -1 means "use config value"
    bool summary = true;
    std::vector<std::pair<std::string, double>> overrides;
};

bool parseInt(const std::string& s, int& out) {
    try {
        size_t pos = 0;
        const auto v = std::stoll(s, &pos);
        if (pos != s.size()) return false;
        if (v < static_cast<long long>(std::numeric_limits<int>::min()) ||
            v > static_cast<long long>(std::numeric_limits<int>::max())) {
            return false;
        }
        out = static_cast<int>(v);
        return true;
    } catch (...) {
        return false;
    }
}

bool parseDouble(const std::string& s, double& out) {
    try {
        size_t pos = 0;
        const double v = std::stod(s, &pos);
        if (pos != s.size()) return false;
        out = v;
        return true;
    } catch (...) {
        return false;
    }
}

bool parseBool01(const std::string& s, bool& out) {
    if (s == "1" || s == "true" || s == "TRUE") {
        out = true;
        return true;
    }
    if (s == "0" || s == "false" || s == "FALSE") {
        out = false;
        return true;
    }
    return false;
}

// Same range loadConfig clamps [output] csvPrecision to.
bool validPrecision(int precision) {
    return precision >= 1 && precision <= 17;
}

// "name=value"
bool parseAssignment(const std::string& s, std::pair<std::string, double>& out) {
    const size_t eq = s.find('=');
    if (eq == std::string::npos || eq == 0) return false;
    double v = 0.0;
    if (!parseDouble(s.substr(eq + 1), v)) return false;
    out = {s.substr(0, eq), v};
    return true;
}

void printUsage(const char* argv0) {
    std::cout << "Usage: " << (argv0 ? argv0 : "replisim_cli")
              << " [--model club|player] [--config path]\n"
              << "       [--set name=value] (repeatable) [--samples N]\n"
              << "       [--out path|-] [--precision 1..17] [--summary 0|1]\n"
              << "Club parameters:   x0 y0 t_end\n"
              << "Player parameters: a0 d0 b pGrow mGrow x0 t_end\n";
}

bool parseArgs(int argc, char** argv, RunOptions& opt) {
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i] ? std::string(argv[i]) : std::string();
        auto requireValue = [&](std::string& out) -> bool {
            if (i + 1 >= argc) return false;
            out = argv[++i] ? std::string(argv[i]) : std::string();
            return true;
        };

        if (arg == "--help" || arg == "-h") {
            return false;
        } else if (arg == "--model") {
            if (!requireValue(opt.model)) return false;
        } else if (arg.rfind("--model=", 0) == 0) {
            opt.model = arg.substr(8);
        } else if (arg == "--config") {
            if (!requireValue(opt.configPath)) return false;
        } else if (arg.rfind("--config=", 0) == 0) {
            opt.configPath = arg.substr(9);
        } else if (arg == "--set") {
            std::string v;
            std::pair<std::string, double> assignment;
            if (!requireValue(v) || !parseAssignment(v, assignment)) return false;
            opt.overrides.push_back(assignment);
        } else if (arg.rfind("--set=", 0) == 0) {
            std::pair<std::string, double> assignment;
            if (!parseAssignment(arg.substr(6), assignment)) return false;
            opt.overrides.push_back(assignment);
        } else if (arg == "--samples") {
            std::string v;
            if (!requireValue(v) || !parseInt(v, opt.samples) || opt.samples < 0) return false;
        } else if (arg.rfind("--samples=", 0) == 0) {
            if (!parseInt(arg.substr(10), opt.samples) || opt.samples < 0) return false;
        } else if (arg == "--out") {
            if (!requireValue(opt.outPath)) return false;
        } else if (arg.rfind("--out=", 0) == 0) {
            opt.outPath = arg.substr(6);
        } else if (arg == "--precision") {
            std::string v;
            if (!requireValue(v) || !parseInt(v, opt.precision) || !validPrecision(opt.precision)) return false;
        } else if (arg.rfind("--precision=", 0) == 0) {
            if (!parseInt(arg.substr(12), opt.precision) || !validPrecision(opt.precision)) return false;
        } else if (arg == "--summary") {
            std::string v;
            if (!requireValue(v) || !parseBool01(v, opt.summary)) return false;
        } else if (arg.rfind("--summary=", 0) == 0) {
            if (!parseBool01(arg.substr(10), opt.summary)) return false;
        } else {
            std::cerr << "Unknown flag: " << arg << "\n";
            return false;
        }
    }
    return true;
}

void printSummary(std::ostream& os, ModelKind kind, const Trajectory& traj) {
    const std::size_t last = traj.sampleCount() - 1;
    os << std::fixed << std::setprecision(6);
    if (kind == ModelKind::Club) {
        const auto& x = traj.series(ClubSeries::kX);
        const auto& y = traj.series(ClubSeries::kY);
        os << "  saudi youth:  " << x.front() << " -> " << x[last] << "\n"
           << "  europe youth: " << y.front() << " -> " << y[last] << "\n"
           << "  joint (YY,YS,SY,SS) at t_end: "
           << traj.series(ClubSeries::kYouthYouth)[last] << ", "
           << traj.series(ClubSeries::kYouthStar)[last] << ", "
           << traj.series(ClubSeries::kStarYouth)[last] << ", "
           << traj.series(ClubSeries::kStarStar)[last] << "\n";
    } else {
        const auto& x = traj.series(PlayerSeries::kX);
        os << "  prestige share: " << x.front() << " -> " << x[last] << "\n"
           << "  fP, fM at t_end: " << traj.series(PlayerSeries::kFP)[last] << ", "
           << traj.series(PlayerSeries::kFM)[last] << "\n"
           << "  a, d at t_end:   " << traj.series(PlayerSeries::kA)[last] << ", "
           << traj.series(PlayerSeries::kD)[last] << "\n";
    }
    os.unsetf(std::ios_base::floatfield);
}

} // namespace

int main(int argc, char** argv) {
    RunOptions opt;
    if (!parseArgs(argc, argv, opt)) {
        printUsage((argc > 0) ? argv[0] : nullptr);
        return 2;
    }

    SimulationContext ctx(opt.configPath);

    const std::string modelName = opt.model.empty() ? ctx.config.gui.startModel : opt.model;
    ModelKind kind = ModelKind::Club;
    if (!parseModelKind(modelName, kind)) {
        std::cerr << "Unknown model: " << modelName << " (expected club or player)\n";
        return 2;
    }

    SimulationParameters params = ctx.parametersFor(kind);
    for (const auto& entry : opt.overrides) {
        if (!params.has(entry.first)) {
            std::cerr << "Unknown parameter '" << entry.first << "' for model " << modelKindName(kind) << "\n";
            return 2;
        }
        params = params.withValue(entry.first, entry.second);
    }

    const std::size_t samples = (opt.samples >= 0) ? static_cast<std::size_t>(opt.samples) : ctx.sampleCount();
    const int precision = (opt.precision > 0) ? opt.precision : ctx.config.output.csvPrecision;

    Trajectory traj;
    std::string err;
    if (!runModel(kind, params, samples, traj, &err)) {
        std::cerr << "[Sim] Error: " << err << "\n";
        return 1;
    }

    const bool toStdout = (opt.outPath == "-");
    if (toStdout) {
        traj.writeCsv(std::cout, precision);
    } else {
        std::string outPath = opt.outPath;
        if (outPath.empty()) {
            std::ostringstream oss;
            oss << "out/" << modelKindName(kind) << "_trajectory.csv";
            outPath = oss.str();
        }
        const std::filesystem::path path(outPath);
        if (path.has_parent_path()) {
            std::error_code ec;
            std::filesystem::create_directories(path.parent_path(), ec);
        }
        std::ofstream out(path);
        if (!out) {
            std::cerr << "Could not open output: " << path.string() << "\n";
            return 2;
        }
        traj.writeCsv(out, precision);
        if (opt.summary) {
            std::cout << "replisim_cli model=" << modelKindName(kind)
                      << " config=" << ctx.configPath
                      << " hash=" << ctx.configHash
                      << " samples=" << traj.sampleCount()
                      << " t_end=" << traj.tEnd()
                      << " out=" << path.string()
                      << "\n";
        }
    }

    if (kind == ModelKind::Player && PlayerMotivationModel::stateLeftUnitInterval(traj)) {
        std::cerr << "[Sim] warning: player share left [0,1]; dt=" << traj.dt()
                  << " is too coarse for these payoffs.\n";
    }
    if (opt.summary && !toStdout) {
        printSummary(std::cout, kind, traj);
    }
    if (SimulationContext::determinismTraceEnabled()) {
        std::cerr << "[det-trace] model=" << modelKindName(kind)
                  << " fingerprint=" << std::hex << traj.fingerprint() << std::dec << "\n";
    }
    return 0;
}
