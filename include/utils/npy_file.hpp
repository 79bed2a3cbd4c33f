#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "core/voxel_node.hpp"

namespace utils {

// Reads and writes stacks of voxel nodes as NumPy .npy (format 1.0) files.
// The array has shape (N, 3, 3, 3) and dtype '|b1', one byte per cell.
class NpyFile {
public:
    // Write nodes to path, replacing any existing file.
    // Returns the number of bytes written.
    // Throws std::runtime_error if the file cannot be opened or written;
    // a partially written file is removed first.
    static size_t write(const std::string& path, const std::vector<core::VoxelNode>& nodes);

    // Load nodes from a file written by write() or by numpy.save.
    // Throws std::runtime_error on I/O errors or an unsupported layout.
    static std::vector<core::VoxelNode> read(const std::string& path);

    // Complete header (magic, version, length, dict and padding)
    static std::string buildHeader(size_t nodeCount);

    // Decode an in-memory .npy image
    static std::vector<core::VoxelNode> parse(const std::string& bytes);

    static constexpr const char* MAGIC = "\x93NUMPY";
    static constexpr size_t MAGIC_SIZE = 6;
    static constexpr size_t PREAMBLE_SIZE = 10;  // magic + version + header length
    static constexpr size_t HEADER_ALIGNMENT = 64;

private:
    static std::vector<size_t> parseShape(const std::string& dict);
    static std::string dictValue(const std::string& dict, const std::string& key);
};

} // namespace utils
