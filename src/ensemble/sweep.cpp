// filename: sweep.cpp
// part of Gray-Scott Ensemble Orchestrator
// MIT License

#include "ensemble/sweep.hpp"

#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <string>
#include <stdexcept>

namespace ensemble {

namespace {

// printf rounds the exact binary value, ties to even. Directory names and
// the values written to each run depend on this exact rounding.
std::string fixedText(double value, int decimals) {
    if (!std::isfinite(value)) {
        throw std::invalid_argument("non-finite grid value");
    }
    char buffer[512];
    const int written = std::snprintf(buffer, sizeof(buffer), "%.*f", decimals, value);
    if (written < 0 || static_cast<std::size_t>(written) >= sizeof(buffer)) {
        throw std::invalid_argument("grid value out of range");
    }
    return std::string(buffer);
}

}  // namespace

double SweepAxis::valueAt(std::size_t index) const {
    return roundToDecimals(base + static_cast<double>(index) * step);
}

double roundToDecimals(double value, int decimals) {
    return std::strtod(fixedText(value, decimals).c_str(), nullptr);
}

std::string formatSweepValue(double value) {
    std::string text = fixedText(value, kSweepDecimals);

    const std::size_t dot = text.find('.');
    if (dot == std::string::npos) {
        return text + ".0";
    }
    std::size_t last = text.find_last_not_of('0');
    if (last == dot) {
        ++last;
    }
    text.erase(last + 1);
    return text;
}

std::string runDirectoryName(double f, double k) {
    return "F_" + formatSweepValue(f) + "-k_" + formatSweepValue(k);
}

GridPoint gridPointAt(const SweepSpec& spec, const std::filesystem::path& ensembleRoot,
                      std::size_t fIndex, std::size_t kIndex) {
    GridPoint point{};
    point.fIndex = fIndex;
    point.kIndex = kIndex;
    point.f = spec.F.valueAt(fIndex);
    point.k = spec.k.valueAt(kIndex);
    point.directory = ensembleRoot / runDirectoryName(point.f, point.k);
    return point;
}

}  // namespace ensemble
