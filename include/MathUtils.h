#pragma once
#include <cstddef>
#include <optional>
#include <vector>

struct MLRDiagnostics {
    std::vector<double> coefficients; // [intercept, b1, b2, ...]
    std::vector<double> stdErrors;
    std::vector<double> tStats;
    std::vector<double> pValues;
    double rSquared = 0.0;
    double adjustedRSquared = 0.0;
    bool success = false;
};

class MathUtils {
public:
    /**
     * @brief Overrides the pivot / rank tolerance used by the matrix routines.
     * @pre numericEpsilon > 0, otherwise the call is ignored.
     */
    static void setNumericEpsilon(double numericEpsilon);
    static double getNumericEpsilon();

    /**
     * @brief Pearson correlation of two equally sized vectors.
     * @post Returns std::nullopt when sizes differ, n < 2, or either side is constant.
     */
    static std::optional<double> calculatePearson(const std::vector<double>& x, const std::vector<double>& y);

    /**
     * @brief Two-tailed p-value of a t statistic with df degrees of freedom.
     */
    static double getPValueFromT(double t, size_t df);

    struct Matrix {
        size_t rows;
        size_t cols;
        std::vector<std::vector<double>> data;

        Matrix(size_t r, size_t c) : rows(r), cols(c), data(r, std::vector<double>(c, 0.0)) {}

        double& at(size_t r, size_t c) { return data[r][c]; }
        double at(size_t r, size_t c) const { return data[r][c]; }

        static Matrix identity(size_t n);
        Matrix transpose() const;

        /**
         * @brief Matrix product this * other.
         * @throws std::invalid_argument on shape mismatch.
         */
        Matrix multiply(const Matrix& other) const;

        /**
         * @brief Gauss-Jordan inverse with partial pivoting.
         * @post Returns std::nullopt for singular or near-singular input.
         * @throws std::invalid_argument when the matrix is not square.
         */
        std::optional<Matrix> inverse() const;

        /**
         * @brief Householder QR, A = Q * R. Q is rows x rows, R is rows x cols.
         */
        void qrDecomposition(Matrix& Q, Matrix& R) const;
    };

    /**
     * @brief Least-squares coefficients of Y (n x 1) on design X (n x p).
     * @post Returns an empty vector for underdetermined or rank-deficient designs.
     * @throws std::invalid_argument when row counts differ.
     */
    static std::vector<double> multipleLinearRegression(const Matrix& X, const Matrix& Y);

    /**
     * @brief Least squares plus fit diagnostics. Column 0 of X must be the intercept.
     * @post success=false when the design cannot be solved robustly.
     */
    static MLRDiagnostics performMLRWithDiagnostics(const Matrix& X, const Matrix& Y);
};
