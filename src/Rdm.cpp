#include "Rdm.h"

#include "GeometraExceptions.h"

RdmMatrix RdmUtils::filled(size_t n, double value) {
    return RdmMatrix(n, std::vector<double>(n, value));
}

bool RdmUtils::isSquare(const RdmMatrix& matrix) {
    for (const auto& row : matrix) {
        if (row.size() != matrix.size()) return false;
    }
    return true;
}

std::vector<double> RdmUtils::upperTriangle(const RdmMatrix& matrix) {
    const size_t n = matrix.size();
    std::vector<double> out;
    out.reserve(n > 1 ? n * (n - 1) / 2 : 0);
    for (size_t i = 0; i < n; ++i) {
        for (size_t j = i + 1; j < n; ++j) out.push_back(matrix[i][j]);
    }
    return out;
}

RdmMatrix RdmUtils::fromUpperTriangle(const std::vector<double>& values, size_t n) {
    const size_t expected = n > 1 ? n * (n - 1) / 2 : 0;
    if (values.size() != expected) {
        throw Geometra::DimensionMismatchException("flat RDM has " + std::to_string(values.size()) +
                                                   " entries, expected " + std::to_string(expected) +
                                                   " for " + std::to_string(n) + " conditions");
    }
    RdmMatrix out = filled(n, 0.0);
    size_t k = 0;
    for (size_t i = 0; i < n; ++i) {
        for (size_t j = i + 1; j < n; ++j) {
            out[i][j] = values[k];
            out[j][i] = values[k];
            ++k;
        }
    }
    return out;
}
