#include "SimulationPipeline.h"

#include "ReportPrinter.h"
#include "RoiProfiles.h"
#include "SyntheticGenerator.h"

#include <iomanip>
#include <random>
#include <utility>

SimulationOutcome SimulationPipeline::execute(const AnalysisConfig& config, std::ostream& status) {
    config.validate();
    const RoiProfile roi = RoiProfiles::parse(config.roi);
    const ClusteringScheme scheme = RoiProfiles::clusteringScheme(roi);
    const std::vector<ClusteringScheme> modelSchemes = RoiProfiles::defaultModelSchemes();

    RdmOptions rdmOptions;
    rdmOptions.metric = ObservedRdmBuilder::parseMetric(config.metric);
    rdmOptions.centerData = config.centerData;

    RsaRegressionOptions regressionOptions;
    regressionOptions.mode = RsaRegression::parseMode(config.regression);
    regressionOptions.standardize = config.standardize;

    SyntheticOptions synthetic;
    synthetic.categories = config.categories;
    synthetic.subjects = config.subjects;
    synthetic.runs = config.runs;
    synthetic.repetitions = config.repetitions;
    synthetic.features = SyntheticGenerator::featuresForPreset(config.size);
    synthetic.noiseSigma = config.noiseSigma;

    std::mt19937 rng(config.seed);
    Dataset base = SyntheticGenerator::generate(synthetic, rng);
    if (config.verbose) {
        status << "[Geometra] Base dataset: " << base.observationCount() << " observations x "
                  << base.featureCount() << " features, " << base.categoryCount() << " categories, seed "
                  << config.seed << "\n";
    }

    ClusteredDatasetResult clustered =
        ClusteredDatasetBuilder::build(std::move(base), scheme, RoiProfiles::defaultTargetLabels(), rng);
    if (config.verbose) {
        for (size_t i = 0; i < clustered.injections.size(); ++i) {
            const InjectionRecord& rec = clustered.injections[i];
            status << "[Geometra] Injected '" << clustered.appliedClusters[i].description << "': "
                      << rec.selectedFeatures.size() << " features over " << rec.affectedObservations
                      << " observations\n";
        }
    }

    std::optional<DecodingResult> decoding;
    if (config.decoding) {
        DecodingOptions decodingOptions;
        decodingOptions.ldaRegularization = config.ldaRegularization;
        decoding = Decoder::crossValidate(clustered.dataset, decodingOptions);
        if (config.verbose) {
            status << "[Geometra] Decoding finished over " << decoding->folds << " folds\n";
        }
    }

    ObservedRdm observed = ObservedRdmBuilder::build(clustered.dataset, rdmOptions);
    std::vector<ModelRdm> models = ModelRdmGenerator::generateAll(config.categories, modelSchemes);
    RsaRegressionResult regression = RsaRegression::fit(observed, models, regressionOptions);
    if (config.verbose) {
        status << "[Geometra] RSA regression (" << RsaRegression::modeName(regressionOptions.mode)
                  << ", " << ObservedRdmBuilder::metricName(rdmOptions.metric) << " distance) R^2="
                  << std::fixed << std::setprecision(4) << regression.rSquared << "\n";
    }

    return SimulationOutcome{std::move(clustered), std::move(decoding), std::move(observed),
                             std::move(models), std::move(regression)};
}

int SimulationPipeline::run(const AnalysisConfig& config, std::ostream& out) {
    out << "[Geometra] Simulating ROI " << config.roi << " with " << config.categories << " categories, "
        << config.runs << " runs, seed " << config.seed << "\n";

    const SimulationOutcome outcome = execute(config, out);

    ReportPrinter::printClusters(out, outcome.clustered.appliedClusters);
    ReportPrinter::printLabelTable(out, outcome.clustered.dataset);
    if (outcome.decoding) {
        ReportPrinter::printDecoding(out, *outcome.decoding, outcome.observed.labels);
    }
    ReportPrinter::printRdm(out, "Observed RDM (" + config.metric + " distance)", outcome.observed.matrix, outcome.observed.labels);
    for (const ModelRdm& model : outcome.models) {
        ReportPrinter::printRdm(out, "Model RDM: " + model.description, model.matrix, outcome.observed.labels);
    }
    ReportPrinter::printCoefficients(out, outcome.regression);
    out << "\n[Geometra] Analysis complete.\n";
    return 0;
}
