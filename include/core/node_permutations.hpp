#pragma once

#include <functional>
#include <string>
#include <unordered_set>
#include <vector>

#include "core/voxel_node.hpp"

namespace core {

// One expansion step maps a node to all of its variants (identity included)
using ExpansionStep = std::function<std::vector<VoxelNode>(const VoxelNode&)>;

using NodeSet = std::unordered_set<VoxelNode, VoxelNodeHash>;

// The fixed step sequence used for map nodes:
//   1. identity, left-right mirror
//   2. identity, up-down mirror
//   3. identity, swap axes 1 and 2
//   4. identity, swap axes 0 and 1, swap axes 0 and 2
// This is not the full rotation group of the cube and must stay that way,
// existing maps depend on exactly this set.
const std::vector<ExpansionStep>& defaultExpansionSteps();

// Apply each step to every node produced by the previous one.
// Result size is the product of the branching factors; duplicates are kept.
std::vector<VoxelNode> orbit(const VoxelNode& seed, const std::vector<ExpansionStep>& steps);

struct ExpansionStats {
    size_t seedCount = 0;
    size_t generatedCount = 0;  // Before deduplication
    size_t uniqueCount = 0;
};

// Orbits of all seeds collected into one set
NodeSet expand(const std::vector<VoxelNode>& seeds, const std::vector<ExpansionStep>& steps,
               ExpansionStats* stats = nullptr);

// Throws std::invalid_argument on the first malformed pattern
std::vector<VoxelNode> parsePatterns(const std::vector<std::string>& patterns);
std::vector<VoxelNode> templateNodes();

// Full pipeline over the built-in templates
NodeSet buildNodeSet(ExpansionStats* stats = nullptr);

} // namespace core
