#pragma once

#include <string>

namespace app {

// Program options
struct Options {
    std::string outputPath;   // Empty when no path was given
    bool verbose = false;
    bool printNodes = false;
    bool showHelp = false;
};

Options parseArguments(int argc, char* argv[]);

void printUsage();
void printHelp();

// Generate the node set and write it to the output path.
// Always returns 0; a missing or unwritable path prints the usage line.
int run(int argc, char* argv[]);

} // namespace app
