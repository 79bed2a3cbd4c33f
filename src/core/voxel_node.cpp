#include "core/voxel_node.hpp"

#include <stdexcept>
#include <utility>

namespace core {

VoxelNode VoxelNode::fromString(const std::string& pattern) {
    if (pattern.size() != CELL_COUNT) {
        throw std::invalid_argument("Voxel pattern must have " + std::to_string(CELL_COUNT) +
                                    " characters, got " + std::to_string(pattern.size()));
    }

    Cells cells{};
    for (size_t i = 0; i < CELL_COUNT; i++) {
        char c = pattern[i];
        if (c != '0' && c != '1') {
            throw std::invalid_argument("Invalid character '" + std::string(1, c) +
                                        "' in voxel pattern at position " + std::to_string(i));
        }
        cells[i] = (c == '1') ? 1 : 0;
    }
    return VoxelNode(cells);
}

std::string VoxelNode::toString() const {
    std::string result(CELL_COUNT, '0');
    for (size_t i = 0; i < CELL_COUNT; i++) {
        if (cells[i]) result[i] = '1';
    }
    return result;
}

size_t VoxelNode::filledCount() const {
    size_t count = 0;
    for (uint8_t cell : cells) {
        count += cell ? 1 : 0;
    }
    return count;
}

VoxelNode VoxelNode::flipLeftRight() const {
    VoxelNode result;
    for (int i = 0; i < SIZE; i++) {
        for (int j = 0; j < SIZE; j++) {
            for (int k = 0; k < SIZE; k++) {
                result.set(glm::ivec3(i, j, k), at(glm::ivec3(i, SIZE - 1 - j, k)));
            }
        }
    }
    return result;
}

VoxelNode VoxelNode::flipUpDown() const {
    VoxelNode result;
    for (int i = 0; i < SIZE; i++) {
        for (int j = 0; j < SIZE; j++) {
            for (int k = 0; k < SIZE; k++) {
                result.set(glm::ivec3(i, j, k), at(glm::ivec3(SIZE - 1 - i, j, k)));
            }
        }
    }
    return result;
}

VoxelNode VoxelNode::swapAxes(int axisA, int axisB) const {
    if (axisA < 0 || axisA > 2 || axisB < 0 || axisB > 2) {
        throw std::invalid_argument("Axis out of range for 3D voxel node");
    }

    VoxelNode result;
    for (int i = 0; i < SIZE; i++) {
        for (int j = 0; j < SIZE; j++) {
            for (int k = 0; k < SIZE; k++) {
                glm::ivec3 dst(i, j, k);
                glm::ivec3 src = dst;
                std::swap(src[axisA], src[axisB]);
                result.set(dst, at(src));
            }
        }
    }
    return result;
}

} // namespace core
