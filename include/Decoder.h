#pragma once
#include "Dataset.h"
#include <cstddef>
#include <vector>

struct DecodingOptions {
    // Ridge added to the pooled covariance, scaled by its mean diagonal.
    double ldaRegularization = 0.01;
};

struct DecodingResult {
    std::vector<int> predicted;  // per observation, dataset order
    double accuracy = 0.0;
    double chanceLevel = 0.0;
    size_t folds = 0;
    std::vector<std::vector<size_t>> confusion; // [true - 1][predicted - 1]
};

class LdaClassifier {
public:
    explicit LdaClassifier(double regularization) : regularization_(regularization) {}

    /**
     * @brief Fits class means and the shared inverse covariance.
     * @throws Geometra::DatasetException on empty input or a singular covariance.
     */
    void train(const std::vector<std::vector<double>>& samples, const std::vector<int>& targets);

    int predict(const std::vector<double>& sample) const;

private:
    double regularization_;
    std::vector<int> classes_;
    std::vector<std::vector<double>> weights_;
    std::vector<double> offsets_;
};

class Decoder {
public:
    /**
     * @brief Leave-one-chunk-out LDA decoding of the target labels.
     * @throws Geometra::ConfigurationException when fewer than two chunks exist.
     */
    static DecodingResult crossValidate(const Dataset& dataset, const DecodingOptions& options = DecodingOptions());
};
