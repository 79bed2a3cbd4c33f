#include "app/mapgen_app.hpp"

#include <exception>
#include <iostream>
#include <stdexcept>
#include <vector>

#include "core/node_permutations.hpp"
#include "utils/mapgen_logger.hpp"
#include "utils/npy_file.hpp"

namespace app {

Options parseArguments(int argc, char* argv[]) {
    Options opts;
    bool optionsDone = false;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        if (optionsDone) {
            if (opts.outputPath.empty()) opts.outputPath = arg;
        } else if (arg == "--") {
            optionsDone = true;
        } else if (arg == "-verbose") {
            opts.verbose = true;
        } else if (arg == "-print") {
            opts.printNodes = true;
        } else if (arg == "-help" || arg == "--help") {
            opts.showHelp = true;
        } else if (!arg.empty() && arg[0] == '-') {
            continue;
        } else if (opts.outputPath.empty()) {
            opts.outputPath = arg;
        }
    }

    return opts;
}

void printUsage() {
    std::cout << "Usage: mapgen output-file" << std::endl;
}

void printHelp() {
    printUsage();
    std::cout << "\nWrites every distinct map node as a (N, 3, 3, 3) boolean .npy array.\n\n";
    std::cout << "Options:\n";
    std::cout << "  -verbose    Log seeds, expansion and write statistics\n";
    std::cout << "  -print      Print each node as a 27 character pattern after writing\n";
    std::cout << "  -help       Show this help message\n";
    std::cout << "  --          Treat the next argument as the output file, even if it starts with '-'\n";
}

int run(int argc, char* argv[]) {
    Options opts = parseArguments(argc, argv);

    auto& logger = utils::MapgenLogger::getInstance();
    logger.setVerbose(opts.verbose);
    logger.startRun();

    if (opts.showHelp) {
        printHelp();
        return 0;
    }

    try {
        if (opts.outputPath.empty()) {
            throw std::invalid_argument("No output file given");
        }

        core::NodeSet unique = core::buildNodeSet();
        std::vector<core::VoxelNode> nodes(unique.begin(), unique.end());

        utils::NpyFile::write(opts.outputPath, nodes);

        if (opts.printNodes) {
            for (const auto& node : nodes) {
                std::cout << node.toString() << "\n";
            }
        }
    } catch (const std::exception& e) {
        logger.logError(e.what());
        printUsage();
        return 0;
    }

    logger.endRun();
    return 0;
}

} // namespace app
