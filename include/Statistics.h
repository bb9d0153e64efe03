#pragma once

#include <cstddef>
#include <vector>

struct ColumnStats {
    double mean;
    double variance;
    double stddev;
    size_t count;
};

namespace Statistics {
/**
 * @brief Mean, unbiased variance and standard deviation of the finite entries.
 * @post Returns zero-initialized stats for empty input.
 */
ColumnStats calculateStats(const std::vector<double>& values);

/**
 * @brief Stats over every entry of a row-major sample matrix (all rows pooled).
 */
ColumnStats calculateMatrixStats(const std::vector<std::vector<double>>& rows);

// Average ranks (1-based), ties share the mean of their positions.
std::vector<double> averageRanks(const std::vector<double>& values);

/**
 * @brief Standardizes values to zero mean and unit sample variance.
 * @post Returns an empty vector when the input has fewer than 2 values or is constant.
 */
std::vector<double> zScore(const std::vector<double>& values);
}
