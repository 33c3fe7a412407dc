#include "simulation_context.h"

#include <algorithm>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <limits>
#include <sstream>
#include <string_view>
#include <type_traits>

#include <toml++/toml.hpp>

bool SimulationContext::s_verbose = false;

namespace {

template <typename T>
void readTomlValue(const toml::table& root,
                   std::string_view section,
                   std::string_view key,
                   T& target) {
    const toml::node_view<const toml::node> view = root[section][key];
    if constexpr (std::is_same_v<T, int>) {
        if (const auto v = view.value<std::int64_t>()) {
            // Saturate so out-of-range values fail validation instead of wrapping.
            const std::int64_t lo = std::numeric_limits<int>::min();
            const std::int64_t hi = std::numeric_limits<int>::max();
            target = static_cast<int>(std::max(lo, std::min(hi, *v)));
        }
    } else if constexpr (std::is_same_v<T, double>) {
        if (const auto v = view.value<double>()) {
            target = *v;
        } else if (const auto vi = view.value<std::int64_t>()) {
            target = static_cast<double>(*vi);
        }
    } else if constexpr (std::is_same_v<T, bool>) {
        if (const auto v = view.value<bool>()) {
            target = *v;
        }
    } else if constexpr (std::is_same_v<T, std::string>) {
        if (const auto v = view.value<std::string>()) {
            target = *v;
        }
    }
}

} // namespace

SimulationContext::SimulationContext(const std::string& runtimeConfigPath)
    : config(), configPath(runtimeConfigPath), configHash("defaults") {
    if (!runtimeConfigPath.empty()) {
        std::string err;
        if (!loadConfig(runtimeConfigPath, &err)) {
            std::cerr << "[Config] " << err << " Using built-in defaults.\n";
        }
    }
    setVerbose(config.log.verbose);
}

bool SimulationContext::loadConfig(const std::string& path, std::string* errorMessage) {
    config = SimulationConfig{};
    configPath = path;
    configHash = "defaults";

    if (path.empty()) {
        return true;
    }

    try {
        toml::table root = toml::parse_file(path);

        readTomlValue(root, "integrator", "sampleCount", config.integrator.sampleCount);

        readTomlValue(root, "club", "x0", config.club.x0);
        readTomlValue(root, "club", "y0", config.club.y0);
        readTomlValue(root, "club", "t_end", config.club.tEnd);

        readTomlValue(root, "player", "a0", config.player.a0);
        readTomlValue(root, "player", "d0", config.player.d0);
        readTomlValue(root, "player", "b", config.player.b);
        readTomlValue(root, "player", "pGrow", config.player.pGrow);
        readTomlValue(root, "player", "mGrow", config.player.mGrow);
        readTomlValue(root, "player", "x0", config.player.x0);
        readTomlValue(root, "player", "t_end", config.player.tEnd);

        readTomlValue(root, "output", "csvPrecision", config.output.csvPrecision);

        readTomlValue(root, "gui", "width", config.gui.width);
        readTomlValue(root, "gui", "height", config.gui.height);
        readTomlValue(root, "gui", "fontPath", config.gui.fontPath);
        readTomlValue(root, "gui", "startModel", config.gui.startModel);

        readTomlValue(root, "log", "verbose", config.log.verbose);

        if (config.integrator.sampleCount < 2 ||
            static_cast<std::size_t>(config.integrator.sampleCount) > kMaxSampleCount) {
            if (errorMessage) {
                std::ostringstream oss;
                oss << "Invalid config '" << path << "': integrator.sampleCount="
                    << config.integrator.sampleCount << " (must be in 2.." << kMaxSampleCount << ").";
                *errorMessage = oss.str();
            }
            config = SimulationConfig{};
            return false;
        }
        if (config.output.csvPrecision < 1) config.output.csvPrecision = 1;
        if (config.output.csvPrecision > 17) config.output.csvPrecision = 17;

        configHash = hashFileFNV1a(path);
        return true;
    } catch (const toml::parse_error& err) {
        if (errorMessage) {
            std::ostringstream oss;
            oss << "Failed to parse config '" << path << "': " << err.description();
            *errorMessage = oss.str();
        }
    } catch (const std::exception& err) {
        if (errorMessage) {
            std::ostringstream oss;
            oss << "Failed to load config '" << path << "': " << err.what();
            *errorMessage = oss.str();
        }
    }

    config = SimulationConfig{};
    return false;
}

std::string SimulationContext::hashFileFNV1a(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return "missing";
    }
    std::uint64_t h = 1469598103934665603ull;
    constexpr std::uint64_t prime = 1099511628211ull;
    char buffer[4096];
    while (in.good()) {
        in.read(buffer, static_cast<std::streamsize>(sizeof(buffer)));
        const std::streamsize n = in.gcount();
        for (std::streamsize i = 0; i < n; ++i) {
            h ^= static_cast<std::uint8_t>(buffer[i]);
            h *= prime;
        }
    }
    std::ostringstream oss;
    oss << std::hex << h;
    return oss.str();
}

SimulationParameters SimulationContext::parametersFor(ModelKind kind) const {
    if (kind == ModelKind::Club) {
        return SimulationParameters{
            {ParameterNames::kX0, config.club.x0},
            {ParameterNames::kY0, config.club.y0},
            {ParameterNames::kTEnd, config.club.tEnd},
        };
    }
    return SimulationParameters{
        {ParameterNames::kA0, config.player.a0},
        {ParameterNames::kD0, config.player.d0},
        {ParameterNames::kB, config.player.b},
        {ParameterNames::kPGrow, config.player.pGrow},
        {ParameterNames::kMGrow, config.player.mGrow},
        {ParameterNames::kX0, config.player.x0},
        {ParameterNames::kTEnd, config.player.tEnd},
    };
}

std::size_t SimulationContext::sampleCount() const {
    return static_cast<std::size_t>(config.integrator.sampleCount);
}

bool SimulationContext::determinismTraceEnabled() {
    static const bool enabled = []() {
        const char* v = std::getenv("REPLISIM_TRACE");
        return v && *v && std::string(v) != "0";
    }();
    return enabled;
}
