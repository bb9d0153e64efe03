#pragma once
#include "ClusterInjector.h"
#include "Dataset.h"
#include "Decoder.h"
#include "ModelRdmGenerator.h"
#include "ObservedRdmBuilder.h"
#include "RsaRegression.h"
#include <ostream>
#include <string>
#include <vector>

class ReportPrinter {
public:
    static void printClusters(std::ostream& os, const std::vector<ClusterSpec>& clusters);
    static void printLabelTable(std::ostream& os, const Dataset& dataset);
    static void printDecoding(std::ostream& os, const DecodingResult& decoding, const std::vector<std::string>& labels);
    static void printRdm(std::ostream& os, const std::string& title, const RdmMatrix& matrix, const std::vector<std::string>& labels);
    static void printCoefficients(std::ostream& os, const RsaRegressionResult& regression);
};
