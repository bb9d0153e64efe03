#include "Statistics.h"

#include <algorithm>
#include <cmath>
#include <numeric>

namespace {
constexpr double kConstantVarianceFloor = 1e-24;

// Welford accumulation keeps the pooled variance stable for large matrices.
struct RunningMoments {
    size_t count = 0;
    double mean = 0.0;
    double m2 = 0.0;

    void push(double value) {
        ++count;
        const double delta = value - mean;
        mean += delta / static_cast<double>(count);
        const double delta2 = value - mean;
        m2 += delta * delta2;
    }

    ColumnStats finish() const {
        ColumnStats stats{0.0, 0.0, 0.0, count};
        if (count == 0) return stats;
        stats.mean = mean;
        stats.variance = (count > 1) ? (m2 / static_cast<double>(count - 1)) : 0.0;
        stats.stddev = std::sqrt(stats.variance);
        return stats;
    }
};
} // namespace

ColumnStats Statistics::calculateStats(const std::vector<double>& values) {
    RunningMoments moments;
    for (double value : values) {
        if (std::isfinite(value)) moments.push(value);
    }
    return moments.finish();
}

ColumnStats Statistics::calculateMatrixStats(const std::vector<std::vector<double>>& rows) {
    RunningMoments moments;
    for (const auto& row : rows) {
        for (double value : row) {
            if (std::isfinite(value)) moments.push(value);
        }
    }
    return moments.finish();
}

std::vector<double> Statistics::averageRanks(const std::vector<double>& values) {
    std::vector<size_t> idx(values.size());
    std::iota(idx.begin(), idx.end(), 0);
    std::sort(idx.begin(), idx.end(), [&](size_t a, size_t b) {
        if (values[a] == values[b]) return a < b;
        return values[a] < values[b];
    });

    std::vector<double> ranks(values.size(), 0.0);
    size_t i = 0;
    while (i < idx.size()) {
        size_t j = i + 1;
        while (j < idx.size() && values[idx[j]] == values[idx[i]]) ++j;
        const double rank = (static_cast<double>(i + 1) + static_cast<double>(j)) * 0.5;
        for (size_t k = i; k < j; ++k) ranks[idx[k]] = rank;
        i = j;
    }
    return ranks;
}

std::vector<double> Statistics::zScore(const std::vector<double>& values) {
    const ColumnStats stats = calculateStats(values);
    if (stats.count < 2 || stats.variance <= kConstantVarianceFloor) return {};

    std::vector<double> out(values.size(), 0.0);
    for (size_t i = 0; i < values.size(); ++i) {
        out[i] = (values[i] - stats.mean) / stats.stddev;
    }
    return out;
}
