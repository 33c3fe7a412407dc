#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include "club_strategy_model.h"
#include "simulation_context.h"
#include "simulation_parameters.h"
#include "simulation_runner.h"
#include "trajectory.h"

namespace {

// Always-on requirement: never compiled out in Release.
#define REQUIRE(cond, msg)                                                      \
    do {                                                                        \
        if (!(cond)) {                                                          \
            std::cerr << "[FAIL] " << __FILE__ << ":" << __LINE__ << " " << msg \
                      << "\n";                                                  \
            std::exit(1);                                                       \
        }                                                                       \
    } while (0)

static std::string writeTempFile(const std::string& name, const std::string& contents) {
    const std::filesystem::path path = std::filesystem::temp_directory_path() / name;
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    REQUIRE(out.good(), "could not create " << path.string());
    out << contents;
    return path.string();
}

static std::vector<std::string> splitLines(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        lines.push_back(line);
    }
    return lines;
}

static void runFullConfigFile() {
    const std::string path = writeTempFile("replisim_test_full.toml",
        "[integrator]\n"
        "sampleCount = 500\n"
        "[club]\n"
        "x0 = 0.3\n"
        "y0 = 0.6\n"
        "t_end = 20\n"
        "[player]\n"
        "a0 = 3.0\n"
        "mGrow = 4.5\n"
        "x0 = 0.4\n"
        "[output]\n"
        "csvPrecision = 6\n"
        "[gui]\n"
        "startModel = \"player\"\n"
        "fontPath = \"fonts/DejaVuSans.ttf\"\n");

    SimulationContext ctx("");
    std::string err;
    REQUIRE(ctx.loadConfig(path, &err), "full config should load: " << err);
    REQUIRE(ctx.sampleCount() == 500, "sampleCount from [integrator]");
    REQUIRE(ctx.config.club.x0 == 0.3 && ctx.config.club.y0 == 0.6, "club initial shares");
    REQUIRE(ctx.config.club.tEnd == 20.0, "integer t_end must be read as a double");
    REQUIRE(ctx.config.player.a0 == 3.0 && ctx.config.player.mGrow == 4.5, "player coefficients");
    REQUIRE(ctx.config.player.d0 == 2.0, "unset player key keeps its default");
    REQUIRE(ctx.config.output.csvPrecision == 6, "csvPrecision");
    REQUIRE(ctx.config.gui.startModel == "player", "startModel");
    REQUIRE(ctx.config.gui.fontPath == "fonts/DejaVuSans.ttf", "fontPath");
    REQUIRE(ctx.configHash == SimulationContext::hashFileFNV1a(path), "hash of the loaded file");
    REQUIRE(ctx.configHash != "defaults" && ctx.configHash != "missing", "hash must be computed");

    const SimulationParameters club = ctx.parametersFor(ModelKind::Club);
    REQUIRE(club.size() == 3, "club snapshot size");
    REQUIRE(club.value(ParameterNames::kTEnd, -1.0) == 20.0, "club snapshot t_end");
    const SimulationParameters player = ctx.parametersFor(ModelKind::Player);
    REQUIRE(player.size() == 7, "player snapshot size");
    REQUIRE(player.value(ParameterNames::kX0, -1.0) == 0.4, "player snapshot x0");

    std::filesystem::remove(path);
}

static void runPartialConfigFile() {
    const std::string path = writeTempFile("replisim_test_partial.toml",
        "[club]\n"
        "x0 = 0.25\n");
    SimulationContext ctx(path);
    REQUIRE(ctx.config.club.x0 == 0.25, "partial file sets x0");
    REQUIRE(ctx.config.club.y0 == 0.5, "partial file keeps y0 default");
    REQUIRE(ctx.sampleCount() == kDefaultSampleCount, "partial file keeps the sample count");
    REQUIRE(ctx.config.player.b == 1.4, "partial file keeps player defaults");
    REQUIRE(ctx.config.gui.startModel == "club", "partial file keeps startModel");
    std::filesystem::remove(path);
}

static void runConfigErrors() {
    const std::string broken = writeTempFile("replisim_test_broken.toml",
        "[club\n"
        "x0 = \n");
    SimulationContext ctx("");
    std::string err;
    REQUIRE(!ctx.loadConfig(broken, &err), "parse error must be reported");
    REQUIRE(!err.empty(), "parse error needs a message");
    REQUIRE(ctx.config.club.x0 == 0.5, "parse error falls back to defaults");
    REQUIRE(ctx.configHash == "defaults", "parse error leaves no hash");
    std::filesystem::remove(broken);

    const std::string tiny = writeTempFile("replisim_test_tiny.toml",
        "[integrator]\n"
        "sampleCount = 1\n"
        "[club]\n"
        "x0 = 0.9\n");
    err.clear();
    REQUIRE(!ctx.loadConfig(tiny, &err), "sampleCount < 2 must be rejected");
    REQUIRE(err.find("sampleCount") != std::string::npos, "error should name sampleCount: " << err);
    REQUIRE(ctx.config.club.x0 == 0.5, "rejected file must not leak partial values");
    std::filesystem::remove(tiny);

    const std::string huge = writeTempFile("replisim_test_huge.toml",
        "[integrator]\n"
        "sampleCount = 2000000000\n");
    err.clear();
    REQUIRE(!ctx.loadConfig(huge, &err), "sampleCount above the cap must be rejected");
    REQUIRE(err.find("sampleCount") != std::string::npos, "error should name sampleCount: " << err);
    REQUIRE(ctx.sampleCount() == kDefaultSampleCount, "rejected file falls back to the default count");
    std::filesystem::remove(huge);

    const std::string wrapping = writeTempFile("replisim_test_wrapping.toml",
        "[integrator]\n"
        "sampleCount = 4294968296\n");
    err.clear();
    REQUIRE(!ctx.loadConfig(wrapping, &err), "values beyond int range must not wrap into a valid count");
    std::filesystem::remove(wrapping);

    err.clear();
    const std::string missing = (std::filesystem::temp_directory_path() / "replisim_no_such_file.toml").string();
    REQUIRE(!ctx.loadConfig(missing, &err), "missing file must be reported");
    REQUIRE(SimulationContext::hashFileFNV1a(missing) == "missing", "hash of a missing file");

    const std::string wide = writeTempFile("replisim_test_precision.toml",
        "[output]\n"
        "csvPrecision = 40\n");
    REQUIRE(ctx.loadConfig(wide, &err), "precision file should load");
    REQUIRE(ctx.config.output.csvPrecision == 17, "csvPrecision clamps to 17");
    std::filesystem::remove(wide);
}

static void runVerboseFlagFromConfig() {
    const std::string path = writeTempFile("replisim_test_verbose.toml",
        "[log]\n"
        "verbose = true\n");
    SimulationContext::setVerbose(false);
    const SimulationContext ctx(path);
    REQUIRE(SimulationContext::isVerbose(), "[log] verbose must switch on verbose logging");
    SimulationContext::setVerbose(false);
    std::filesystem::remove(path);
}

static void runCsvExport() {
    Trajectory traj;
    std::string err;
    REQUIRE(runModel(ModelKind::Club, defaultParametersFor(ModelKind::Club), 3, traj, &err), err);

    std::ostringstream out;
    traj.writeCsv(out, 8);
    const std::vector<std::string> lines = splitLines(out.str());
    REQUIRE(lines.size() == 4, "header plus three rows, got " << lines.size());
    REQUIRE(lines[0] == "t,x,y,youth_youth,youth_star,star_youth,star_star,saudi_avg_payoff,europe_avg_payoff",
            "unexpected header: " << lines[0]);
    REQUIRE(lines[1] == "0,0.5,0.5,0.25,0.25,0.25,0.25,3,3", "unexpected first row: " << lines[1]);
    REQUIRE(lines[3].rfind("10,", 0) == 0, "last row must start at t_end: " << lines[3]);

    // Stream formatting is restored afterwards.
    std::ostringstream narrow;
    narrow.precision(3);
    traj.writeCsv(narrow, 12);
    REQUIRE(narrow.precision() == 3, "writeCsv must restore the stream precision");
}

} // namespace

int main() {
    runFullConfigFile();
    runPartialConfigFile();
    runConfigErrors();
    runVerboseFlagFromConfig();
    runCsvExport();

    std::cout << "[PASS] test_config\n";
    return 0;
}
