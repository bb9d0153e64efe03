#pragma once

#include "AnalysisConfig.h"
#include "ClusteredDatasetBuilder.h"
#include "Decoder.h"
#include "ModelRdmGenerator.h"
#include "ObservedRdmBuilder.h"
#include "RsaRegression.h"

#include <iostream>
#include <optional>
#include <ostream>
#include <vector>

struct SimulationOutcome {
    ClusteredDatasetResult clustered;
    std::optional<DecodingResult> decoding;
    ObservedRdm observed;
    std::vector<ModelRdm> models;
    RsaRegressionResult regression;
};

class SimulationPipeline final {
public:
    /**
     * @brief generate -> cluster -> label -> decode -> observed RDM -> model RDMs -> regression.
     *
     * The generator is seeded once from config.seed and consumed in that order,
     * so a fixed config reproduces the same outcome exactly. Verbose progress lines
     * go to `status`.
     * @throws Geometra::GeometraException subclasses from any stage; nothing is skipped or imputed.
     */
    static SimulationOutcome execute(const AnalysisConfig& config, std::ostream& status = std::cout);

    // execute() plus the terminal report. Returns the process exit code.
    int run(const AnalysisConfig& config, std::ostream& out);
};
