#include "MathUtils.h"
#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#ifdef USE_OPENMP
#include <omp.h>
#endif

namespace {
constexpr double kVeryLargeTStatisticCutoff = 1e10;
constexpr int kBetaMaxIterations = 500;
constexpr double kBetaTolerance = 3e-14;
constexpr double kBetaFloor = 1e-300;

double& numericEpsilon() {
    thread_local double eps = 1e-12;
    return eps;
}

// Lentz evaluation of the continued fraction for I_x(a, b).
double betaContinuedFraction(double a, double b, double x) {
    const double qab = a + b;
    const double qap = a + 1.0;
    const double qam = a - 1.0;

    double c = 1.0;
    double d = 1.0 - qab * x / qap;
    if (std::abs(d) < kBetaFloor) d = kBetaFloor;
    d = 1.0 / d;
    double h = d;

    for (int m = 1; m <= kBetaMaxIterations; ++m) {
        const double m2 = 2.0 * m;

        double aa = m * (b - m) * x / ((qam + m2) * (a + m2));
        d = 1.0 + aa * d;
        if (std::abs(d) < kBetaFloor) d = kBetaFloor;
        c = 1.0 + aa / c;
        if (std::abs(c) < kBetaFloor) c = kBetaFloor;
        d = 1.0 / d;
        h *= d * c;

        aa = -(a + m) * (qab + m) * x / ((a + m2) * (qap + m2));
        d = 1.0 + aa * d;
        if (std::abs(d) < kBetaFloor) d = kBetaFloor;
        c = 1.0 + aa / c;
        if (std::abs(c) < kBetaFloor) c = kBetaFloor;
        d = 1.0 / d;
        const double del = d * c;
        h *= del;
        if (std::abs(del - 1.0) <= kBetaTolerance) break;
    }
    return h;
}

// Regularized incomplete beta function I_x(a, b).
double betainc(double a, double b, double x) {
    if (!std::isfinite(x) || a <= 0.0 || b <= 0.0) return std::numeric_limits<double>::quiet_NaN();
    if (x <= 0.0) return 0.0;
    if (x >= 1.0) return 1.0;

    const double lnFront = std::lgamma(a + b) - std::lgamma(a) - std::lgamma(b) +
                           a * std::log(x) + b * std::log(1.0 - x);
    const double front = std::exp(lnFront);
    if (x < (a + 1.0) / (a + b + 2.0)) {
        return std::clamp(front * betaContinuedFraction(a, b, x) / a, 0.0, 1.0);
    }
    return std::clamp(1.0 - front * betaContinuedFraction(b, a, 1.0 - x) / b, 0.0, 1.0);
}

bool solveUpperTriangular(const MathUtils::Matrix& R,
                          const std::vector<double>& b,
                          std::vector<double>& x) {
    const size_t n = b.size();
    x.assign(n, 0.0);
    for (size_t i = n; i-- > 0;) {
        double rhs = b[i];
        for (size_t j = i + 1; j < n; ++j) rhs -= R.at(i, j) * x[j];
        const double diag = R.at(i, i);
        if (std::abs(diag) <= numericEpsilon()) return false;
        x[i] = rhs / diag;
    }
    return true;
}

// Solves R^T x = b using the upper triangle of R.
bool solveUpperTransposed(const MathUtils::Matrix& R,
                          const std::vector<double>& b,
                          std::vector<double>& x) {
    const size_t n = b.size();
    x.assign(n, 0.0);
    for (size_t i = 0; i < n; ++i) {
        double rhs = b[i];
        for (size_t j = 0; j < i; ++j) rhs -= R.at(j, i) * x[j];
        const double diag = R.at(i, i);
        if (std::abs(diag) <= numericEpsilon()) return false;
        x[i] = rhs / diag;
    }
    return true;
}

bool isRankDeficient(const MathUtils::Matrix& R, size_t p) {
    double maxDiag = 0.0;
    double minDiag = std::numeric_limits<double>::max();
    for (size_t i = 0; i < p; ++i) {
        const double v = std::abs(R.at(i, i));
        maxDiag = std::max(maxDiag, v);
        minDiag = std::min(minDiag, v);
    }
    const double rankTol = std::max(numericEpsilon(),
                                    std::numeric_limits<double>::epsilon() * std::max(1.0, maxDiag) * static_cast<double>(p) * 100.0);
    return minDiag <= rankTol;
}
} // namespace

void MathUtils::setNumericEpsilon(double eps) {
    if (eps > 0.0 && std::isfinite(eps)) numericEpsilon() = eps;
}

double MathUtils::getNumericEpsilon() {
    return numericEpsilon();
}

std::optional<double> MathUtils::calculatePearson(const std::vector<double>& x, const std::vector<double>& y) {
    if (x.size() != y.size() || x.size() < 2) return std::nullopt;

    const double n = static_cast<double>(x.size());
    double meanX = 0.0;
    double meanY = 0.0;
    for (size_t i = 0; i < x.size(); ++i) {
        meanX += x[i];
        meanY += y[i];
    }
    meanX /= n;
    meanY /= n;

    double sxy = 0.0;
    double sxx = 0.0;
    double syy = 0.0;
    for (size_t i = 0; i < x.size(); ++i) {
        const double dx = x[i] - meanX;
        const double dy = y[i] - meanY;
        sxy += dx * dy;
        sxx += dx * dx;
        syy += dy * dy;
    }
    if (sxx <= numericEpsilon() || syy <= numericEpsilon()) return std::nullopt;

    const double r = sxy / std::sqrt(sxx * syy);
    return std::clamp(r, -1.0, 1.0);
}

double MathUtils::getPValueFromT(double t, size_t df) {
    if (df == 0) return 1.0;
    const double tAbs = std::abs(t);
    if (!std::isfinite(tAbs) || tAbs > kVeryLargeTStatisticCutoff) return 0.0;
    const double nu = static_cast<double>(df);
    return betainc(nu / 2.0, 0.5, nu / (nu + tAbs * tAbs));
}

MathUtils::Matrix MathUtils::Matrix::identity(size_t n) {
    Matrix res(n, n);
    for (size_t i = 0; i < n; ++i) res.at(i, i) = 1.0;
    return res;
}

MathUtils::Matrix MathUtils::Matrix::transpose() const {
    Matrix result(cols, rows);
    for (size_t r = 0; r < rows; ++r) {
        for (size_t c = 0; c < cols; ++c) {
            result.at(c, r) = at(r, c);
        }
    }
    return result;
}

MathUtils::Matrix MathUtils::Matrix::multiply(const Matrix& other) const {
    if (cols != other.rows) throw std::invalid_argument("Matrix dimensions mismatch for multiplication.");
    Matrix result(rows, other.cols);
    const Matrix otherT = other.transpose();

    #ifdef USE_OPENMP
    #pragma omp parallel for schedule(static)
    #endif
    for (long long r = 0; r < static_cast<long long>(rows); ++r) {
        const auto& leftRow = data[static_cast<size_t>(r)];
        auto& outRow = result.data[static_cast<size_t>(r)];
        for (size_t c = 0; c < other.cols; ++c) {
            const auto& rightRow = otherT.data[c];
            double sum = 0.0;
            for (size_t k = 0; k < cols; ++k) sum += leftRow[k] * rightRow[k];
            outRow[c] = sum;
        }
    }
    return result;
}

std::optional<MathUtils::Matrix> MathUtils::Matrix::inverse() const {
    if (rows != cols) throw std::invalid_argument("Only square matrices can be inverted.");
    const size_t n = rows;
    Matrix work = *this;
    Matrix inv = Matrix::identity(n);

    double scale = 0.0;
    for (const auto& row : work.data) {
        for (double v : row) scale = std::max(scale, std::abs(v));
    }
    const double eps = numericEpsilon();
    if (scale <= eps) return std::nullopt;
    const double pivotTolerance = std::max(eps, std::numeric_limits<double>::epsilon() * scale * static_cast<double>(n));

    for (size_t i = 0; i < n; ++i) {
        size_t pivotRow = i;
        double pivotAbs = std::abs(work.at(i, i));
        for (size_t r = i + 1; r < n; ++r) {
            const double v = std::abs(work.at(r, i));
            if (v > pivotAbs) {
                pivotAbs = v;
                pivotRow = r;
            }
        }
        if (pivotAbs <= pivotTolerance) return std::nullopt;
        if (pivotRow != i) {
            std::swap(work.data[i], work.data[pivotRow]);
            std::swap(inv.data[i], inv.data[pivotRow]);
        }

        const double pivot = work.at(i, i);
        for (size_t c = 0; c < n; ++c) {
            work.at(i, c) /= pivot;
            inv.at(i, c) /= pivot;
        }

        for (size_t r = 0; r < n; ++r) {
            if (r == i) continue;
            const double factor = work.at(r, i);
            if (factor == 0.0) continue;
            for (size_t c = 0; c < n; ++c) {
                work.at(r, c) -= factor * work.at(i, c);
                inv.at(r, c) -= factor * inv.at(i, c);
            }
        }
    }
    return inv;
}

/**
 * Householder QR. Each reflector zeroes column k below the diagonal; the
 * reflectors are accumulated into Q so that A = Q * R.
 */
void MathUtils::Matrix::qrDecomposition(Matrix& Q, Matrix& R) const {
    const size_t m = rows;
    const size_t n = cols;
    const double eps = numericEpsilon();
    Q = Matrix::identity(m);
    R = *this;
    if (m == 0) return;

    for (size_t k = 0; k < n && k + 1 < m; ++k) {
        std::vector<double> u(m - k);
        double normX = 0.0;
        for (size_t i = k; i < m; ++i) {
            u[i - k] = R.at(i, k);
            normX += u[i - k] * u[i - k];
        }
        normX = std::sqrt(normX);
        if (normX <= eps) continue;

        // Sign choice avoids cancellation in u[0].
        const double alpha = (R.at(k, k) > 0.0 ? -1.0 : 1.0) * normX;
        u[0] -= alpha;

        double normU = 0.0;
        for (double v : u) normU += v * v;
        normU = std::sqrt(normU);
        if (normU <= eps) continue;
        for (double& v : u) v /= normU;

        for (size_t j = k; j < n; ++j) {
            double dot = 0.0;
            for (size_t i = k; i < m; ++i) dot += u[i - k] * R.at(i, j);
            for (size_t i = k; i < m; ++i) R.at(i, j) -= 2.0 * u[i - k] * dot;
        }

        for (size_t i = 0; i < m; ++i) {
            double dot = 0.0;
            for (size_t j = k; j < m; ++j) dot += Q.at(i, j) * u[j - k];
            for (size_t j = k; j < m; ++j) Q.at(i, j) -= 2.0 * dot * u[j - k];
        }
    }
}

namespace {
// Least squares through one QR factorization; R is kept for the coefficient covariance.
std::vector<double> qrLeastSquares(const MathUtils::Matrix& X, const MathUtils::Matrix& Y, MathUtils::Matrix& R) {
    MathUtils::Matrix Q(0, 0);
    X.qrDecomposition(Q, R);
    if (isRankDeficient(R, X.cols)) return {};

    // Only the first p entries of Q^T * y enter R * beta = Q^T * y.
    std::vector<double> rhs(X.cols, 0.0);
    for (size_t i = 0; i < X.cols; ++i) {
        for (size_t r = 0; r < X.rows; ++r) rhs[i] += Q.at(r, i) * Y.at(r, 0);
    }

    std::vector<double> beta;
    if (!solveUpperTriangular(R, rhs, beta)) return {};
    return beta;
}
} // namespace

std::vector<double> MathUtils::multipleLinearRegression(const Matrix& X, const Matrix& Y) {
    if (X.rows != Y.rows) throw std::invalid_argument("X and Y row dimensions must match for MLR.");
    if (X.cols == 0 || X.rows < X.cols || Y.cols != 1) return {};

    Matrix R(0, 0);
    return qrLeastSquares(X, Y, R);
}

MLRDiagnostics MathUtils::performMLRWithDiagnostics(const Matrix& X, const Matrix& Y) {
    MLRDiagnostics diag;
    if (X.rows != Y.rows || X.rows <= X.cols || X.cols == 0 || Y.cols != 1) return diag;

    Matrix R(0, 0);
    const std::vector<double> beta = qrLeastSquares(X, Y, R);
    if (beta.empty()) return diag;
    diag.coefficients = beta;

    const size_t n = X.rows;
    const size_t p = X.cols;

    double rss = 0.0;
    double ySum = 0.0;
    for (size_t i = 0; i < n; ++i) {
        double predicted = 0.0;
        for (size_t j = 0; j < p; ++j) predicted += X.at(i, j) * beta[j];
        const double residual = Y.at(i, 0) - predicted;
        rss += residual * residual;
        ySum += Y.at(i, 0);
    }
    const double yMean = ySum / static_cast<double>(n);
    double tss = 0.0;
    for (size_t i = 0; i < n; ++i) {
        const double d = Y.at(i, 0) - yMean;
        tss += d * d;
    }

    const size_t dfResidual = n - p;
    diag.rSquared = (tss > 0.0) ? (1.0 - rss / tss) : 0.0;
    diag.adjustedRSquared = 1.0 - (1.0 - diag.rSquared) * (static_cast<double>(n - 1) / static_cast<double>(dfResidual));

    // Var(beta) = s^2 * diag((X^T X)^-1) and (X^T X)^-1 = R^-1 R^-T.
    const double s2 = rss / static_cast<double>(dfResidual);
    diag.stdErrors.assign(p, 0.0);
    diag.tStats.assign(p, 0.0);
    diag.pValues.assign(p, 1.0);

    std::vector<double> e(p, 0.0);
    std::vector<double> z;
    std::vector<double> col;
    for (size_t j = 0; j < p; ++j) {
        std::fill(e.begin(), e.end(), 0.0);
        e[j] = 1.0;
        if (!solveUpperTransposed(R, e, z)) return diag;
        if (!solveUpperTriangular(R, z, col)) return diag;

        const double variance = std::max(0.0, s2 * col[j]);
        diag.stdErrors[j] = std::sqrt(variance);
        if (diag.stdErrors[j] > 0.0) {
            diag.tStats[j] = beta[j] / diag.stdErrors[j];
            diag.pValues[j] = getPValueFromT(diag.tStats[j], dfResidual);
        } else {
            diag.tStats[j] = (beta[j] == 0.0) ? 0.0 : std::copysign(std::numeric_limits<double>::infinity(), beta[j]);
            diag.pValues[j] = (beta[j] == 0.0) ? 1.0 : 0.0;
        }
    }

    diag.success = true;
    return diag;
}
