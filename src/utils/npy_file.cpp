#include "utils/npy_file.hpp"
#include "utils/mapgen_logger.hpp"

#include <cstdio>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <sstream>
#include <stdexcept>

namespace utils {

std::string NpyFile::buildHeader(size_t nodeCount) {
    const int n = core::VoxelNode::SIZE;

    std::stringstream dict;
    dict << "{'descr': '|b1', 'fortran_order': False, 'shape': ("
         << nodeCount << ", " << n << ", " << n << ", " << n << "), }";

    std::string text = dict.str();

    // Pad with spaces so the data starts on an aligned offset, newline last
    size_t unpadded = PREAMBLE_SIZE + text.size() + 1;
    size_t padding = (HEADER_ALIGNMENT - unpadded % HEADER_ALIGNMENT) % HEADER_ALIGNMENT;
    text.append(padding, ' ');
    text.push_back('\n');

    std::string header(MAGIC, MAGIC_SIZE);
    header.push_back(static_cast<char>(1));  // major version
    header.push_back(static_cast<char>(0));  // minor version

    // Header length is little-endian uint16
    uint16_t length = static_cast<uint16_t>(text.size());
    header.push_back(static_cast<char>(length & 0xFF));
    header.push_back(static_cast<char>((length >> 8) & 0xFF));

    return header + text;
}

size_t NpyFile::write(const std::string& path, const std::vector<core::VoxelNode>& nodes) {
    std::string header = buildHeader(nodes.size());

    std::string payload;
    payload.reserve(nodes.size() * core::VoxelNode::CELL_COUNT);
    for (const auto& node : nodes) {
        for (uint8_t cell : node.data()) {
            payload.push_back(static_cast<char>(cell));
        }
    }

    // Only a regular file we created or replaced may be removed on failure.
    // Device nodes, pipes and symlinks are left alone.
    std::error_code ec;
    std::filesystem::file_status before = std::filesystem::symlink_status(path, ec);
    bool removable = std::filesystem::is_regular_file(before) ||
                     before.type() == std::filesystem::file_type::not_found;

    {
        std::ofstream file(path, std::ios::binary | std::ios::trunc);
        if (!file.is_open()) {
            throw std::runtime_error("Cannot open " + path + " for writing");
        }

        file.write(header.data(), static_cast<std::streamsize>(header.size()));
        file.write(payload.data(), static_cast<std::streamsize>(payload.size()));
        file.flush();

        if (file.good()) {
            size_t total = header.size() + payload.size();
            MapgenLogger::getInstance().logWrite(path, nodes.size(), total);
            return total;
        }
    }

    // Stream is closed here; don't leave a truncated array behind
    if (removable) {
        std::remove(path.c_str());
    }
    throw std::runtime_error("Failed while writing " + path);
}

std::vector<core::VoxelNode> NpyFile::read(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open " + path + " for reading");
    }

    std::string bytes((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    if (file.bad()) {
        throw std::runtime_error("Failed while reading " + path);
    }

    return parse(bytes);
}

std::string NpyFile::dictValue(const std::string& dict, const std::string& key) {
    std::string quoted = "'" + key + "'";
    size_t keyPos = dict.find(quoted);
    if (keyPos == std::string::npos) {
        throw std::runtime_error("Missing '" + key + "' in .npy header");
    }

    size_t colon = dict.find(':', keyPos + quoted.size());
    if (colon == std::string::npos) {
        throw std::runtime_error("Malformed .npy header near '" + key + "'");
    }

    size_t start = dict.find_first_not_of(' ', colon + 1);
    if (start == std::string::npos) {
        throw std::runtime_error("Malformed .npy header near '" + key + "'");
    }

    size_t end;
    if (dict[start] == '\'') {
        end = dict.find('\'', start + 1);
        if (end == std::string::npos) {
            throw std::runtime_error("Unterminated string in .npy header");
        }
        return dict.substr(start + 1, end - start - 1);
    }
    if (dict[start] == '(') {
        end = dict.find(')', start);
        if (end == std::string::npos) {
            throw std::runtime_error("Unterminated tuple in .npy header");
        }
        return dict.substr(start, end - start + 1);
    }

    end = dict.find_first_of(",}", start);
    if (end == std::string::npos || end == start) {
        throw std::runtime_error("Malformed .npy header near '" + key + "'");
    }
    size_t last = dict.find_last_not_of(' ', end - 1);
    return dict.substr(start, last - start + 1);
}

std::vector<size_t> NpyFile::parseShape(const std::string& dict) {
    std::string tuple = dictValue(dict, "shape");
    if (tuple.size() < 2 || tuple.front() != '(') {
        throw std::runtime_error("Malformed shape in .npy header");
    }

    std::vector<size_t> shape;
    std::string inner = tuple.substr(1, tuple.size() - 2);
    std::stringstream ss(inner);
    std::string token;
    while (std::getline(ss, token, ',')) {
        size_t first = token.find_first_not_of(' ');
        if (first == std::string::npos) continue;  // trailing comma
        size_t last = token.find_last_not_of(' ');
        std::string digits = token.substr(first, last - first + 1);
        if (digits.find_first_not_of("0123456789") != std::string::npos) {
            throw std::runtime_error("Invalid dimension '" + digits + "' in .npy shape");
        }
        try {
            shape.push_back(static_cast<size_t>(std::stoull(digits)));
        } catch (const std::out_of_range&) {
            throw std::runtime_error("Dimension '" + digits + "' in .npy shape is too large");
        }
    }
    return shape;
}

std::vector<core::VoxelNode> NpyFile::parse(const std::string& bytes) {
    if (bytes.size() < PREAMBLE_SIZE || bytes.compare(0, MAGIC_SIZE, MAGIC, MAGIC_SIZE) != 0) {
        throw std::runtime_error("Not a .npy file");
    }

    uint8_t major = static_cast<uint8_t>(bytes[6]);
    uint8_t minor = static_cast<uint8_t>(bytes[7]);
    if (major != 1 || minor != 0) {
        throw std::runtime_error("Unsupported .npy version " + std::to_string(major) + "." +
                                 std::to_string(minor));
    }

    size_t headerLength = static_cast<uint8_t>(bytes[8]) |
                          (static_cast<size_t>(static_cast<uint8_t>(bytes[9])) << 8);
    if (bytes.size() < PREAMBLE_SIZE + headerLength) {
        throw std::runtime_error("Truncated .npy header");
    }
    std::string dict = bytes.substr(PREAMBLE_SIZE, headerLength);

    if (dictValue(dict, "descr") != "|b1") {
        throw std::runtime_error("Expected boolean dtype '|b1' in .npy file");
    }
    if (dictValue(dict, "fortran_order") != "False") {
        throw std::runtime_error("Fortran ordered .npy files are not supported");
    }

    const size_t n = static_cast<size_t>(core::VoxelNode::SIZE);
    std::vector<size_t> shape = parseShape(dict);
    if (shape.size() != 4 || shape[1] != n || shape[2] != n || shape[3] != n) {
        throw std::runtime_error("Expected shape (N, 3, 3, 3) in .npy file");
    }

    size_t count = shape[0];
    size_t dataOffset = PREAMBLE_SIZE + headerLength;
    size_t payloadSize = bytes.size() - dataOffset;
    if (count > payloadSize / core::VoxelNode::CELL_COUNT ||
        payloadSize != count * core::VoxelNode::CELL_COUNT) {
        throw std::runtime_error("Payload size does not match .npy shape");
    }

    std::vector<core::VoxelNode> nodes;
    nodes.reserve(count);
    for (size_t i = 0; i < count; i++) {
        core::VoxelNode::Cells cells{};
        for (size_t c = 0; c < core::VoxelNode::CELL_COUNT; c++) {
            uint8_t value = static_cast<uint8_t>(bytes[dataOffset + i * core::VoxelNode::CELL_COUNT + c]);
            if (value > 1) {
                throw std::runtime_error("Non-boolean value in .npy payload");
            }
            cells[c] = value;
        }
        nodes.emplace_back(cells);
    }
    return nodes;
}

} // namespace utils
