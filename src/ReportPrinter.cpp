#include "ReportPrinter.h"
#include "CommonUtils.h"
#include <algorithm>
#include <iomanip>
#include <set>

namespace {
const std::string kRule(100, '=');

std::string shortLabel(const std::string& label, size_t width) {
    if (label.size() <= width) return label;
    return label.substr(0, width - 1) + ".";
}
}

void ReportPrinter::printClusters(std::ostream& os, const std::vector<ClusterSpec>& clusters) {
    os << "\nGenerated dataset with the following clusters:\n";
    if (clusters.empty()) {
        os << "  (none, conditions differ by independent noise only)\n";
        return;
    }
    for (size_t i = 0; i < clusters.size(); ++i) {
        os << "Cluster " << (i + 1) << ": " << clusters[i].description << "\n"
           << "  Targets: [" << CommonUtils::joinTargets(clusters[i].targets) << "]\n"
           << "  Sigma Level: " << std::fixed << std::setprecision(2) << clusters[i].sigmaLevel << "\n\n";
    }
}

void ReportPrinter::printLabelTable(std::ostream& os, const Dataset& dataset) {
    os << "\nTarget to Label Mapping:\n";
    os << std::left << std::setw(10) << "Target" << "Label\n";
    os << std::string(30, '-') << "\n";
    std::set<int> seen;
    for (int target : dataset.targets()) {
        if (!seen.insert(target).second) continue;
        os << std::left << std::setw(10) << target << dataset.labelForTarget(target) << "\n";
    }
    os << std::right;
}

void ReportPrinter::printDecoding(std::ostream& os, const DecodingResult& decoding, const std::vector<std::string>& labels) {
    os << "\n" << kRule << "\n";
    os << "Classification accuracy: " << std::fixed << std::setprecision(2) << decoding.accuracy * 100.0
       << "% (chance level: " << decoding.chanceLevel * 100.0 << "%, " << decoding.folds << " folds)\n";
    os << "Confusion matrix (rows: true, columns: predicted)\n";

    const size_t n = decoding.confusion.size();
    os << std::setw(18) << " ";
    for (size_t j = 0; j < n; ++j) os << std::setw(6) << (j + 1);
    os << "\n";
    for (size_t i = 0; i < n; ++i) {
        const std::string name = i < labels.size() ? labels[i] : std::to_string(i + 1);
        os << std::left << std::setw(18) << shortLabel(name, 17) << std::right;
        for (size_t j = 0; j < n; ++j) os << std::setw(6) << decoding.confusion[i][j];
        os << "\n";
    }
}

void ReportPrinter::printRdm(std::ostream& os, const std::string& title, const RdmMatrix& matrix, const std::vector<std::string>& labels) {
    os << "\n" << kRule << "\n" << title << "\n" << std::string(title.size(), '-') << "\n";
    os << std::setw(18) << " ";
    for (size_t j = 0; j < matrix.size(); ++j) os << std::setw(8) << (j + 1);
    os << "\n";
    for (size_t i = 0; i < matrix.size(); ++i) {
        const std::string name = i < labels.size() ? labels[i] : std::to_string(i + 1);
        os << std::left << std::setw(18) << shortLabel(name, 17) << std::right;
        for (double v : matrix[i]) os << std::setw(8) << std::fixed << std::setprecision(3) << v;
        os << "\n";
    }
}

void ReportPrinter::printCoefficients(std::ostream& os, const RsaRegressionResult& regression) {
    size_t width = 12;
    for (const auto& d : regression.descriptions) width = std::max(width, d.size() + 2);

    os << "\n" << kRule << "\n";
    os << "RSA regression coefficients (" << regression.pairCount << " condition pairs)\n";
    os << std::left << std::setw(static_cast<int>(width)) << "Model" << std::right
       << std::setw(12) << "beta" << std::setw(10) << "t" << std::setw(10) << "p" << "\n";
    os << std::string(width + 32, '-') << "\n";
    for (size_t i = 0; i < regression.descriptions.size(); ++i) {
        const bool dropped = std::find(regression.droppedModelIndices.begin(), regression.droppedModelIndices.end(),
                                       i) != regression.droppedModelIndices.end();
        os << std::left << std::setw(static_cast<int>(width)) << regression.descriptions[i] << std::right
           << std::fixed << std::setprecision(4) << std::setw(12) << regression.coefficients[i];
        if (dropped) {
            os << "   (constant model, excluded)\n";
            continue;
        }
        os << std::setprecision(2) << std::setw(10) << regression.tStats[i]
           << std::setprecision(4) << std::setw(10) << regression.pValues[i]
           << (regression.pValues[i] < 0.05 ? " (*)" : "") << "\n";
    }
    os << "Intercept: " << std::setprecision(4) << regression.intercept
       << " | R^2: " << regression.rSquared
       << " | adj. R^2: " << regression.adjustedRSquared << "\n";
}
