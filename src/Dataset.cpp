#include "Dataset.h"

#include <algorithm>
#include <set>

Dataset::Dataset(size_t featureCount, size_t categoryCount)
    : featureCount_(featureCount), categoryCount_(categoryCount) {
    if (featureCount_ == 0) throw Geometra::DatasetException("feature count must be > 0");
    if (categoryCount_ == 0) throw Geometra::DatasetException("category count must be > 0");
}

void Dataset::addObservation(std::vector<double> features, int target, int chunk, int subject) {
    if (features.size() != featureCount_) {
        throw Geometra::DatasetException("observation has " + std::to_string(features.size()) +
                                         " features, expected " + std::to_string(featureCount_));
    }
    if (target < 1 || static_cast<size_t>(target) > categoryCount_) {
        throw Geometra::DatasetException("target " + std::to_string(target) + " outside [1, " +
                                         std::to_string(categoryCount_) + "]");
    }
    samples_.push_back(std::move(features));
    targets_.push_back(target);
    chunks_.push_back(chunk);
    subjects_.push_back(subject);
    // A new row invalidates labels attached earlier.
    labels_.clear();
}

std::vector<size_t> Dataset::indicesForTargets(const std::vector<int>& targets) const {
    const std::set<int> wanted(targets.begin(), targets.end());
    std::vector<size_t> out;
    for (size_t i = 0; i < targets_.size(); ++i) {
        if (wanted.count(targets_[i]) > 0) out.push_back(i);
    }
    return out;
}

std::vector<int> Dataset::uniqueChunks() const {
    std::vector<int> out(chunks_.begin(), chunks_.end());
    std::sort(out.begin(), out.end());
    out.erase(std::unique(out.begin(), out.end()), out.end());
    return out;
}

void Dataset::attachLabels(const TargetLabelMap& labelMap) {
    std::vector<std::string> labels;
    labels.reserve(targets_.size());
    for (int target : targets_) {
        auto it = labelMap.find(target);
        if (it == labelMap.end()) {
            throw Geometra::UnknownTargetIdException(target, "label attachment");
        }
        labels.push_back(it->second);
    }
    labels_ = std::move(labels);
}

std::string Dataset::labelForTarget(int target) const {
    if (!labels_.empty()) {
        for (size_t i = 0; i < targets_.size(); ++i) {
            if (targets_[i] == target) return labels_[i];
        }
    }
    return "target " + std::to_string(target);
}
