#include "trajectory.h"

#include <cstring>
#include <iomanip>
#include <ostream>

namespace {

constexpr std::uint64_t kFnvOffset = 1469598103934665603ull;
constexpr std::uint64_t kFnvPrime = 1099511628211ull;

std::uint64_t mixDouble(std::uint64_t h, double v) {
    unsigned char bytes[sizeof(double)];
    std::memcpy(bytes, &v, sizeof(double));
    for (unsigned char byte : bytes) {
        h ^= byte;
        h *= kFnvPrime;
    }
    return h;
}

const std::vector<double>& emptySeries() {
    static const std::vector<double> empty;
    return empty;
}

} // namespace

void Trajectory::resetTimeGrid(double tEnd, std::size_t sampleCount) {
    m_series.clear();
    m_time.assign(sampleCount, 0.0);
    m_dt = (sampleCount > 1) ? tEnd / static_cast<double>(sampleCount - 1) : 0.0;
    for (std::size_t i = 0; i < sampleCount; ++i) {
        m_time[i] = static_cast<double>(i) * m_dt;
    }
    if (sampleCount > 1) {
        m_time.back() = tEnd;
    }
}

std::size_t Trajectory::addSeries(const std::string& name) {
    m_series.push_back({name, std::vector<double>(m_time.size(), 0.0)});
    return m_series.size() - 1;
}

bool Trajectory::hasSeries(const std::string& name) const {
    for (const Series& s : m_series) {
        if (s.name == name) return true;
    }
    return false;
}

const std::vector<double>& Trajectory::series(const std::string& name) const {
    for (const Series& s : m_series) {
        if (s.name == name) return s.values;
    }
    return emptySeries();
}

std::vector<std::string> Trajectory::seriesNames() const {
    std::vector<std::string> names;
    names.reserve(m_series.size());
    for (const Series& s : m_series) {
        names.push_back(s.name);
    }
    return names;
}

void Trajectory::writeCsv(std::ostream& out, int precision) const {
    out << "t";
    for (const Series& s : m_series) {
        out << ',' << s.name;
    }
    out << '\n';

    const std::ios_base::fmtflags oldFlags = out.flags();
    const std::streamsize oldPrecision = out.precision();
    out << std::setprecision(precision);
    for (std::size_t i = 0; i < m_time.size(); ++i) {
        out << m_time[i];
        for (const Series& s : m_series) {
            out << ',' << s.values[i];
        }
        out << '\n';
    }
    out.flags(oldFlags);
    out.precision(oldPrecision);
}

std::uint64_t Trajectory::fingerprint() const {
    std::uint64_t h = kFnvOffset;
    for (double t : m_time) {
        h = mixDouble(h, t);
    }
    for (const Series& s : m_series) {
        for (char ch : s.name) {
            h ^= static_cast<std::uint8_t>(ch);
            h *= kFnvPrime;
        }
        for (double v : s.values) {
            h = mixDouble(h, v);
        }
    }
    return h;
}
