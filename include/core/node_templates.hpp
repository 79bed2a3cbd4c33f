#pragma once

#include <array>

namespace core {

// Hand-authored map nodes, flattened row-major (axis 0 is height).
// Every other node in the map set is derived from these by mirroring
// and axis swapping.
constexpr std::array<const char*, 6> NODE_TEMPLATES = {
    "000111000000111000000000000",  // Straight corridor
    "000111000000111000000111000",  // Corridor with raised ceiling
    "000110000000110000000000000",  // Dead end
    "000111010000111010000000000",  // T-junction
    "010111010010111010000000000",  // Crossing
    "000010000000010000000010000"   // Vertical shaft
};

} // namespace core
