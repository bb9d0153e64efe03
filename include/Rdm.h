#pragma once
#include <cstddef>
#include <string>
#include <vector>

using RdmMatrix = std::vector<std::vector<double>>;

namespace RdmUtils {
RdmMatrix filled(size_t n, double value);

bool isSquare(const RdmMatrix& matrix);

/**
 * @brief Upper triangle without the diagonal, row-major: (0,1), (0,2), ..., (n-2,n-1).
 * @pre matrix is square.
 */
std::vector<double> upperTriangle(const RdmMatrix& matrix);

/**
 * @brief Inverse of upperTriangle(): symmetric matrix with zero diagonal.
 * @throws Geometra::DimensionMismatchException when the length is not n*(n-1)/2.
 */
RdmMatrix fromUpperTriangle(const std::vector<double>& values, size_t n);
}
