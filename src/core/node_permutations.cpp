#include "core/node_permutations.hpp"
#include "core/node_templates.hpp"
#include "utils/mapgen_logger.hpp"

namespace core {

const std::vector<ExpansionStep>& defaultExpansionSteps() {
    static const std::vector<ExpansionStep> steps = {
        [](const VoxelNode& node) {
            return std::vector<VoxelNode>{node, node.flipLeftRight()};
        },
        [](const VoxelNode& node) {
            return std::vector<VoxelNode>{node, node.flipUpDown()};
        },
        [](const VoxelNode& node) {
            return std::vector<VoxelNode>{node, node.swapAxes(1, 2)};
        },
        [](const VoxelNode& node) {
            return std::vector<VoxelNode>{node, node.swapAxes(0, 1), node.swapAxes(0, 2)};
        }
    };
    return steps;
}

std::vector<VoxelNode> orbit(const VoxelNode& seed, const std::vector<ExpansionStep>& steps) {
    std::vector<VoxelNode> current{seed};

    for (const auto& step : steps) {
        std::vector<VoxelNode> next;
        next.reserve(current.size() * 3);
        for (const auto& node : current) {
            std::vector<VoxelNode> variants = step(node);
            next.insert(next.end(), variants.begin(), variants.end());
        }
        current.swap(next);
    }

    return current;
}

NodeSet expand(const std::vector<VoxelNode>& seeds, const std::vector<ExpansionStep>& steps,
               ExpansionStats* stats) {
    auto& logger = utils::MapgenLogger::getInstance();
    NodeSet unique;
    size_t generated = 0;

    for (size_t i = 0; i < seeds.size(); i++) {
        std::vector<VoxelNode> variants = orbit(seeds[i], steps);
        size_t before = unique.size();
        unique.insert(variants.begin(), variants.end());
        generated += variants.size();
        logger.logOrbit(i, variants.size(), unique.size() - before);
    }

    if (stats) {
        stats->seedCount = seeds.size();
        stats->generatedCount = generated;
        stats->uniqueCount = unique.size();
    }
    logger.logDedup(generated, unique.size());

    return unique;
}

std::vector<VoxelNode> parsePatterns(const std::vector<std::string>& patterns) {
    auto& logger = utils::MapgenLogger::getInstance();
    std::vector<VoxelNode> nodes;
    nodes.reserve(patterns.size());

    for (const auto& pattern : patterns) {
        nodes.push_back(VoxelNode::fromString(pattern));
        logger.logSeed(nodes.size() - 1, pattern, nodes.back().filledCount());
    }
    return nodes;
}

std::vector<VoxelNode> templateNodes() {
    return parsePatterns(std::vector<std::string>(NODE_TEMPLATES.begin(), NODE_TEMPLATES.end()));
}

NodeSet buildNodeSet(ExpansionStats* stats) {
    return expand(templateNodes(), defaultExpansionSteps(), stats);
}

} // namespace core
