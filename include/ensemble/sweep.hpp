// filename: sweep.hpp
// part of Gray-Scott Ensemble Orchestrator
// MIT License

#pragma once

#include <cstddef>
#include <filesystem>
#include <string>

namespace ensemble {

// Grid values are rounded to this many decimals before they are used, both in
// the run configuration and in the run directory name.
constexpr int kSweepDecimals = 3;

struct SweepAxis {
    double base{0.0};
    double step{0.0};
    std::size_t count{0};

    [[nodiscard]] double valueAt(std::size_t index) const;
};

struct SweepSpec {
    SweepAxis F{0.01, 0.01, 10};
    SweepAxis k{0.05, 0.05, 10};

    [[nodiscard]] std::size_t pointCount() const { return F.count * k.count; }
};

double roundToDecimals(double value, int decimals = kSweepDecimals);

/**
 * @brief Shortest decimal text of a rounded grid value, always keeping one
 *        fractional digit: 0.1, 0.05, 1.0.
 */
std::string formatSweepValue(double value);

std::string runDirectoryName(double f, double k);

struct GridPoint {
    std::size_t fIndex{0};
    std::size_t kIndex{0};
    double f{0.0};
    double k{0.0};
    std::filesystem::path directory;
};

GridPoint gridPointAt(const SweepSpec& spec, const std::filesystem::path& ensembleRoot,
                      std::size_t fIndex, std::size_t kIndex);

}  // namespace ensemble
