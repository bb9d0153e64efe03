#include "AnalysisConfig.h"
#include "GeometraExceptions.h"
#include "SimulationPipeline.h"
#include <iostream>

int main(int argc, char* argv[]) {
    AnalysisConfig config;
    try {
        config = AnalysisConfig::fromArgs(argc, argv);
    } catch (const Geometra::GeometraException& e) {
        std::cerr << "[Geometra Error] " << e.what() << "\n";
        std::cerr << AnalysisConfig::usage(argv[0]);
        return 1;
    }

    if (config.showHelp) {
        std::cout << AnalysisConfig::usage(argv[0]);
        return 0;
    }

    try {
        SimulationPipeline pipeline;
        return pipeline.run(config, std::cout);
    } catch (const Geometra::GeometraException& e) {
        std::cerr << "[Geometra Error] " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "[Geometra Exception] " << e.what() << "\n";
        return 1;
    }
}
