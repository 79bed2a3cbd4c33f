#pragma once
#include <cstddef>
#include <iostream>
#include <string>

namespace utils {

// Simple logging for node generation runs. Silent unless verbose is set,
// so the tool's stdout stays clean for scripts.
class MapgenLogger {
public:
    struct RunSummary {
        size_t seeds = 0;
        size_t generated = 0;
        size_t unique = 0;
        size_t bytesWritten = 0;
    };

    static MapgenLogger& getInstance() {
        static MapgenLogger instance;
        return instance;
    }

    void setVerbose(bool verbose) { logVerbose = verbose; }
    bool isVerbose() const { return logVerbose; }

    void startRun() {
        summary = RunSummary();
    }

    void logSeed(size_t index, const std::string& pattern, size_t filledCells) {
        summary.seeds++;
        if (logVerbose) {
            std::cout << "[SEED] #" << index << " " << pattern
                      << " filled:" << filledCells << "\n";
        }
    }

    void logOrbit(size_t seedIndex, size_t variants, size_t newNodes) {
        summary.generated += variants;
        if (logVerbose) {
            std::cout << "[EXPAND] Seed " << seedIndex << " Variants:" << variants
                      << " New:" << newNodes << "\n";
        }
    }

    void logDedup(size_t generated, size_t unique) {
        summary.unique = unique;
        if (logVerbose) {
            std::cout << "[DEDUP] " << generated << " -> " << unique << " unique nodes\n";
        }
    }

    void logWrite(const std::string& path, size_t nodeCount, size_t bytes) {
        summary.bytesWritten = bytes;
        if (logVerbose) {
            std::cout << "[WRITE] " << path << " Nodes:" << nodeCount
                      << " Bytes:" << bytes << "\n";
        }
    }

    void logError(const std::string& message) {
        if (logVerbose) {
            std::cerr << "[ERROR] " << message << "\n";
        }
    }

    void endRun() {
        if (!logVerbose) return;

        std::cout << "\n=== MAPGEN SUMMARY ===\n";
        std::cout << "Seeds: " << summary.seeds << "\n";
        std::cout << "Generated: " << summary.generated << "\n";
        std::cout << "Unique: " << summary.unique << "\n";
        std::cout << "Bytes written: " << summary.bytesWritten << "\n";
        std::cout << "======================\n";
    }

    const RunSummary& getSummary() const { return summary; }

private:
    MapgenLogger() = default;
    MapgenLogger(const MapgenLogger&) = delete;
    MapgenLogger& operator=(const MapgenLogger&) = delete;

    bool logVerbose = false;
    RunSummary summary;
};

} // namespace utils
