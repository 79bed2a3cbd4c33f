#pragma once

#include <glm/glm.hpp>
#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <stdexcept>
#include <string>

namespace core {

// 3x3x3 block of boolean occupancy used as a building block for maps.
// Cells are stored row-major: index = (i * 3 + j) * 3 + k for axes (0, 1, 2).
class VoxelNode {
public:
    static constexpr int SIZE = 3;
    static constexpr size_t CELL_COUNT = SIZE * SIZE * SIZE;

    using Cells = std::array<uint8_t, CELL_COUNT>;

    VoxelNode() : cells{} {}
    explicit VoxelNode(const Cells& cells) : cells(cells) {}

    // Parse a 27 character string of '0' and '1'.
    // Throws std::invalid_argument on bad length or characters.
    static VoxelNode fromString(const std::string& pattern);

    // Inverse of fromString
    std::string toString() const;

    // === Cell Access ===

    // Both throw std::out_of_range outside [0, SIZE) on any axis
    bool at(const glm::ivec3& pos) const { return cells[checkedIndex(pos)] != 0; }
    void set(const glm::ivec3& pos, bool filled) { cells[checkedIndex(pos)] = filled ? 1 : 0; }

    static bool contains(const glm::ivec3& pos) {
        return pos.x >= 0 && pos.x < SIZE && pos.y >= 0 && pos.y < SIZE &&
               pos.z >= 0 && pos.z < SIZE;
    }

    size_t filledCount() const;

    // Raw bytes, one per cell, 0 or 1
    const Cells& data() const { return cells; }

    // === Transforms (each returns a new node) ===

    // Reverse axis 1 (left-right mirror)
    VoxelNode flipLeftRight() const;

    // Reverse axis 0 (up-down mirror)
    VoxelNode flipUpDown() const;

    // Exchange two axes, e.g. swapAxes(0, 2) transposes the first and last axis
    VoxelNode swapAxes(int axisA, int axisB) const;

    bool operator==(const VoxelNode& other) const { return cells == other.cells; }
    bool operator!=(const VoxelNode& other) const { return cells != other.cells; }
    bool operator<(const VoxelNode& other) const { return cells < other.cells; }

    static size_t index(const glm::ivec3& pos) {
        return static_cast<size_t>((pos.x * SIZE + pos.y) * SIZE + pos.z);
    }

private:
    static size_t checkedIndex(const glm::ivec3& pos) {
        if (!contains(pos)) {
            throw std::out_of_range("Voxel node cell out of range");
        }
        return index(pos);
    }

    Cells cells;
};

// Hash over the 27 raw cell bytes
struct VoxelNodeHash {
    size_t operator()(const VoxelNode& node) const {
        size_t h = 0;
        for (uint8_t cell : node.data()) {
            h ^= std::hash<uint8_t>{}(cell) + 0x9e3779b9 + (h << 6) + (h >> 2);
        }
        return h;
    }
};

} // namespace core
