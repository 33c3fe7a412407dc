#pragma once

#include <cstddef>
#include <string>

#include "replicator_stepper.h"
#include "simulation_parameters.h"

struct SimulationConfig {
    struct Integrator {
        int sampleCount = static_cast<int>(kDefaultSampleCount);
    } integrator{};

    struct Club {
        double x0 = 0.5;
        double y0 = 0.5;
        double tEnd = 10.0;
    } club{};

    struct Player {
        double a0 = 2.5;
        double d0 = 2.0;
        double b = 1.4;
        double pGrow = 1.0;
        double mGrow = 5.0;
        double x0 = 0.6;
        double tEnd = 10.0;
    } player{};

    struct Output {
        int csvPrecision = 10;
    } output{};

    struct Gui {
        int width = 1600;
        int height = 900;
        std::string fontPath = "arial.ttf";
        std::string startModel = "club";
    } gui{};

    struct Log {
        bool verbose = false;
    } log{};
};

struct SimulationContext {
    SimulationConfig config;
    std::string configPath;
    std::string configHash;

    explicit SimulationContext(const std::string& runtimeConfigPath = "data/replisim_config.toml");

    bool loadConfig(const std::string& path, std::string* errorMessage = nullptr);
    static std::string hashFileFNV1a(const std::string& path);

    // Initial parameter snapshot for a model, taken from [club] / [player].
    SimulationParameters parametersFor(ModelKind kind) const;
    std::size_t sampleCount() const;

    // Process-wide switch for per-recompute [Sim] log lines.
    static void setVerbose(bool enabled) { s_verbose = enabled; }
    static bool isVerbose() { return s_verbose; }

    // REPLISIM_TRACE=1 enables [det-trace] fingerprint lines.
    static bool determinismTraceEnabled();

private:
    static bool s_verbose;
};
