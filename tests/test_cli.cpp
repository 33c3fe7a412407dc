#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#ifndef _WIN32
#include <sys/wait.h>
#endif

#ifndef REPLISIM_CLI_PATH
#error "REPLISIM_CLI_PATH must point at the replisim_cli executable"
#endif
#ifndef REPLISIM_CONFIG_PATH
#error "REPLISIM_CONFIG_PATH must point at data/replisim_config.toml"
#endif

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

struct CliResult {
    int exitCode = -1;
    std::string out;
    std::string err;
};

static std::string readFile(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    std::ostringstream oss;
    oss << in.rdbuf();
    return oss.str();
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

static int exitCodeOf(int status) {
#ifdef _WIN32
    return status;
#else
    return WIFEXITED(status) ? WEXITSTATUS(status) : -1;
#endif
}

static CliResult runCli(const std::string& args, const std::string& tag) {
    const std::filesystem::path dir = std::filesystem::temp_directory_path();
    const std::filesystem::path outPath = dir / ("replisim_cli_" + tag + ".out");
    const std::filesystem::path errPath = dir / ("replisim_cli_" + tag + ".err");

    const std::string command = std::string("\"") + REPLISIM_CLI_PATH + "\" --config \"" + REPLISIM_CONFIG_PATH +
                                "\" " + args + " > \"" + outPath.string() + "\" 2> \"" + errPath.string() + "\"";
    CliResult result;
    result.exitCode = exitCodeOf(std::system(command.c_str()));
    result.out = readFile(outPath);
    result.err = readFile(errPath);
    std::filesystem::remove(outPath);
    std::filesystem::remove(errPath);
    return result;
}

static bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

static void runClubCsvOnStdout() {
    const CliResult r = runCli("--model club --samples 3 --out -", "club_stdout");
    REQUIRE(r.exitCode == 0, "club run should succeed, exit " << r.exitCode << " stderr: " << r.err);
    const std::vector<std::string> lines = splitLines(r.out);
    REQUIRE(lines.size() == 4, "header plus three rows on stdout, got " << lines.size());
    REQUIRE(lines[0] == "t,x,y,youth_youth,youth_star,star_youth,star_star,saudi_avg_payoff,europe_avg_payoff",
            "unexpected club header: " << lines[0]);
    REQUIRE(lines[1].rfind("0,0.5,0.5,", 0) == 0, "first row starts at the configured state: " << lines[1]);
}

static void runCsvToFileWithSummary() {
    const std::filesystem::path csv = std::filesystem::temp_directory_path() / "replisim_cli_club.csv";
    std::filesystem::remove(csv);
    const CliResult r = runCli("--samples 5 --out \"" + csv.string() + "\"", "club_file");
    REQUIRE(r.exitCode == 0, "file run should succeed, stderr: " << r.err);
    REQUIRE(contains(r.out, "replisim_cli model=club"), "summary line expected: " << r.out);
    REQUIRE(contains(r.out, "samples=5"), "summary reports the sample count: " << r.out);
    const std::vector<std::string> lines = splitLines(readFile(csv));
    REQUIRE(lines.size() == 6, "header plus five rows in the file, got " << lines.size());
    REQUIRE(lines[0].rfind("t,x,y,", 0) == 0, "file header: " << lines[0]);
    std::filesystem::remove(csv);
}

static void runPlayerOvershootWarning() {
    const CliResult r = runCli("--model player --set a0=5 --set d0=0.1 --set b=0.1 --set pGrow=10 "
                               "--set mGrow=0.1 --set x0=0.5 --set t_end=50 --samples 3 --out -",
                               "player_overshoot");
    REQUIRE(r.exitCode == 0, "overshoot is a warning, not an error; stderr: " << r.err);
    const std::vector<std::string> lines = splitLines(r.out);
    REQUIRE(!lines.empty() && lines[0] == "t,x,fP,fM,a,d", "player header on stdout");
    REQUIRE(contains(r.err, "[Sim] warning: player share left [0,1]"), "overshoot warning on stderr: " << r.err);
}

static void runSimulationErrorsExitOne() {
    const CliResult outOfRange = runCli("--set x0=1.5 --out -", "x0_range");
    REQUIRE(outOfRange.exitCode == 1, "x0=1.5 must exit 1, got " << outOfRange.exitCode);
    REQUIRE(contains(outOfRange.err, "[Sim] Error:") && contains(outOfRange.err, "x0"),
            "x0 error on stderr: " << outOfRange.err);
    REQUIRE(outOfRange.out.empty(), "no CSV on a failed run");

    const CliResult tooFew = runCli("--samples 1 --out -", "samples_one");
    REQUIRE(tooFew.exitCode == 1, "--samples 1 must exit 1, got " << tooFew.exitCode);

    const CliResult tooMany = runCli("--samples 2000000000 --out -", "samples_huge");
    REQUIRE(tooMany.exitCode == 1, "--samples above the cap must exit 1, got " << tooMany.exitCode);
    REQUIRE(contains(tooMany.err, "sample count"), "cap error on stderr: " << tooMany.err);

    const CliResult horizon = runCli("--set t_end=0 --out -", "t_end_zero");
    REQUIRE(horizon.exitCode == 1, "t_end=0 must exit 1, got " << horizon.exitCode);
}

static void runBadArgumentsExitTwo() {
    const CliResult unknownParam = runCli("--set z=1 --out -", "unknown_param");
    REQUIRE(unknownParam.exitCode == 2, "unknown parameter must exit 2, got " << unknownParam.exitCode);
    REQUIRE(contains(unknownParam.err, "Unknown parameter 'z'"), "message names z: " << unknownParam.err);

    REQUIRE(runCli("--model league --out -", "unknown_model").exitCode == 2, "unknown model must exit 2");
    REQUIRE(runCli("--bogus", "unknown_flag").exitCode == 2, "unknown flag must exit 2");
    REQUIRE(runCli("--set x0", "bad_assignment").exitCode == 2, "--set without '=' must exit 2");
    REQUIRE(runCli("--samples -4 --out -", "negative_samples").exitCode == 2, "negative samples must exit 2");
    REQUIRE(runCli("--precision 0 --out -", "precision_zero").exitCode == 2, "--precision 0 must exit 2");
    REQUIRE(runCli("--precision 18 --out -", "precision_wide").exitCode == 2, "--precision 18 must exit 2");
    REQUIRE(runCli("--help", "help").exitCode == 2, "--help prints usage and exits 2");
    REQUIRE(runCli("--precision=17 --samples 3 --out -", "precision_max").exitCode == 0,
            "--precision=17 is the widest accepted value");
}

} // namespace

int main() {
    runClubCsvOnStdout();
    runCsvToFileWithSummary();
    runPlayerOvershootWarning();
    runSimulationErrorsExitOne();
    runBadArgumentsExitTwo();

    std::cout << "[PASS] test_cli\n";
    return 0;
}
