#include "Decoder.h"

#include "GeometraExceptions.h"
#include "MathUtils.h"

#include <algorithm>
#include <limits>

void LdaClassifier::train(const std::vector<std::vector<double>>& samples, const std::vector<int>& targets) {
    if (samples.empty() || samples.size() != targets.size()) {
        throw Geometra::DatasetException("LDA training needs a non-empty sample set with one target per row");
    }
    const size_t features = samples.front().size();

    classes_.assign(targets.begin(), targets.end());
    std::sort(classes_.begin(), classes_.end());
    classes_.erase(std::unique(classes_.begin(), classes_.end()), classes_.end());
    const size_t k = classes_.size();

    std::vector<std::vector<double>> means(k, std::vector<double>(features, 0.0));
    std::vector<size_t> counts(k, 0);
    std::vector<size_t> classOf(samples.size(), 0);
    for (size_t i = 0; i < samples.size(); ++i) {
        const size_t c = static_cast<size_t>(std::lower_bound(classes_.begin(), classes_.end(), targets[i]) - classes_.begin());
        classOf[i] = c;
        for (size_t f = 0; f < features; ++f) means[c][f] += samples[i][f];
        ++counts[c];
    }
    for (size_t c = 0; c < k; ++c) {
        for (double& v : means[c]) v /= static_cast<double>(counts[c]);
    }

    // Pooled within-class covariance.
    MathUtils::Matrix cov(features, features);
    for (size_t i = 0; i < samples.size(); ++i) {
        const auto& mu = means[classOf[i]];
        for (size_t a = 0; a < features; ++a) {
            const double da = samples[i][a] - mu[a];
            for (size_t b = a; b < features; ++b) {
                cov.at(a, b) += da * (samples[i][b] - mu[b]);
            }
        }
    }
    const double dof = static_cast<double>(samples.size() > k ? samples.size() - k : samples.size());
    double meanDiag = 0.0;
    for (size_t a = 0; a < features; ++a) {
        for (size_t b = a; b < features; ++b) {
            cov.at(a, b) /= dof;
            cov.at(b, a) = cov.at(a, b);
        }
        meanDiag += cov.at(a, a);
    }
    meanDiag /= static_cast<double>(features);

    const double ridge = regularization_ * (meanDiag > 0.0 ? meanDiag : 1.0);
    for (size_t a = 0; a < features; ++a) cov.at(a, a) += ridge;

    const auto inv = cov.inverse();
    if (!inv) throw Geometra::DatasetException("LDA covariance is singular; increase lda_regularization");

    weights_.assign(k, std::vector<double>(features, 0.0));
    offsets_.assign(k, 0.0);
    for (size_t c = 0; c < k; ++c) {
        for (size_t a = 0; a < features; ++a) {
            double w = 0.0;
            for (size_t b = 0; b < features; ++b) w += inv->at(a, b) * means[c][b];
            weights_[c][a] = w;
        }
        double muW = 0.0;
        for (size_t a = 0; a < features; ++a) muW += means[c][a] * weights_[c][a];
        offsets_[c] = -0.5 * muW;
    }
}

int LdaClassifier::predict(const std::vector<double>& sample) const {
    int best = classes_.empty() ? 0 : classes_.front();
    double bestScore = -std::numeric_limits<double>::infinity();
    for (size_t c = 0; c < classes_.size(); ++c) {
        double score = offsets_[c];
        for (size_t f = 0; f < sample.size(); ++f) score += weights_[c][f] * sample[f];
        if (score > bestScore) {
            bestScore = score;
            best = classes_[c];
        }
    }
    return best;
}

DecodingResult Decoder::crossValidate(const Dataset& dataset, const DecodingOptions& options) {
    const std::vector<int> chunks = dataset.uniqueChunks();
    if (chunks.size() < 2) {
        throw Geometra::ConfigurationException("cross-validated decoding needs at least 2 runs, dataset has " +
                                               std::to_string(chunks.size()));
    }

    const auto& samples = dataset.samples();
    const auto& targets = dataset.targets();
    const auto& rowChunks = dataset.chunks();
    const size_t categories = dataset.categoryCount();

    DecodingResult result;
    result.predicted.assign(samples.size(), 0);
    result.chanceLevel = 1.0 / static_cast<double>(categories);
    result.confusion.assign(categories, std::vector<size_t>(categories, 0));

    for (int testChunk : chunks) {
        std::vector<std::vector<double>> trainSamples;
        std::vector<int> trainTargets;
        std::vector<size_t> testRows;
        for (size_t i = 0; i < samples.size(); ++i) {
            if (rowChunks[i] == testChunk) {
                testRows.push_back(i);
            } else {
                trainSamples.push_back(samples[i]);
                trainTargets.push_back(targets[i]);
            }
        }

        LdaClassifier classifier(options.ldaRegularization);
        classifier.train(trainSamples, trainTargets);
        for (size_t row : testRows) result.predicted[row] = classifier.predict(samples[row]);
        ++result.folds;
    }

    size_t correct = 0;
    for (size_t i = 0; i < samples.size(); ++i) {
        const int truth = targets[i];
        const int guess = result.predicted[i];
        if (truth == guess) ++correct;
        ++result.confusion[static_cast<size_t>(truth - 1)][static_cast<size_t>(guess - 1)];
    }
    result.accuracy = samples.empty() ? 0.0 : static_cast<double>(correct) / static_cast<double>(samples.size());
    return result;
}
