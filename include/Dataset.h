#pragma once
#include <cstddef>
#include <map>
#include <string>
#include <vector>
#include "GeometraExceptions.h"

// Immutable target id -> human-readable category label dictionary.
using TargetLabelMap = std::map<int, std::string>;

/**
 * In-memory sample table: one row per observation with a fixed-width feature
 * vector, a target (category) id in [1, categoryCount], a chunk (run) id and a
 * subject id. Labels are empty until attachLabels() runs.
 */
class Dataset {
public:
    Dataset(size_t featureCount, size_t categoryCount);

    /**
     * @brief Appends one observation.
     * @throws Geometra::DatasetException on width mismatch or target outside [1, categoryCount].
     */
    void addObservation(std::vector<double> features, int target, int chunk, int subject = 1);

    size_t featureCount() const { return featureCount_; }
    size_t categoryCount() const { return categoryCount_; }
    size_t observationCount() const { return samples_.size(); }

    const std::vector<std::vector<double>>& samples() const { return samples_; }
    std::vector<std::vector<double>>& mutableSamples() { return samples_; }
    const std::vector<int>& targets() const { return targets_; }
    const std::vector<int>& chunks() const { return chunks_; }
    const std::vector<int>& subjects() const { return subjects_; }
    const std::vector<std::string>& labels() const { return labels_; }

    bool isLabeled() const { return !labels_.empty() && labels_.size() == samples_.size(); }

    // Row indices whose target is contained in `targets`.
    std::vector<size_t> indicesForTargets(const std::vector<int>& targets) const;

    // Distinct chunk ids in ascending order.
    std::vector<int> uniqueChunks() const;

    /**
     * @brief Maps every target id through `labelMap` and stores the labels.
     * @throws Geometra::UnknownTargetIdException naming the first unmapped target.
     */
    void attachLabels(const TargetLabelMap& labelMap);

    /**
     * @brief Label of a category, or "target N" before labeling / for absent targets.
     */
    std::string labelForTarget(int target) const;

private:
    size_t featureCount_;
    size_t categoryCount_;
    std::vector<std::vector<double>> samples_;
    std::vector<int> targets_;
    std::vector<int> chunks_;
    std::vector<int> subjects_;
    std::vector<std::string> labels_;
};
