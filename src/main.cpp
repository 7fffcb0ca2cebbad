#include "DepInferExceptions.h"
#include "DependencyPipeline.h"
#include "MatrixIO.h"
#include "PipelineConfig.h"
#include "TerminalUI.h"
#include <iostream>
#include <string>

int main(int argc, char* argv[]) {
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            std::cout << PipelineConfig::usage() << "\n";
            return 0;
        }
    }

    try {
        const PipelineConfig config = PipelineConfig::fromArgs(argc, argv);
        config.requireInputs();

        const NamedMatrix affinity = MatrixIO::readNamedMatrix(config.affinityPath, config.delimiter);
        const NamedMatrix response = MatrixIO::alignRows(affinity,
                                                         MatrixIO::readNamedMatrix(config.responsePath, config.delimiter));
        TerminalUI::printInputSummary(affinity, response);

        const PipelineResult result = DependencyPipeline::run(affinity, response, config);

        if (config.dedupe) {
            TerminalUI::printSimilarityGroups(result.groups, affinity.colCount(), result.wardClusterCount);
        }
        TerminalUI::printEnsembleDiagnostics(result.aggregate);
        TerminalUI::printTopDependencies(result.aggregate, config.topK);
    } catch (const DepInfer::DepInferException& e) {
        std::cerr << "[DepInfer Error] " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "[DepInfer Exception] " << e.what() << "\n";
        return 1;
    }

    return 0;
}
