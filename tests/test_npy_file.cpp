#include <gtest/gtest.h>
#include "utils/npy_file.hpp"
#include "core/node_permutations.hpp"

#include <csignal>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <stdexcept>

#ifndef _WIN32
    #include <sys/resource.h>
    #include <sys/stat.h>
    #include <sys/sysmacros.h>
#endif

using namespace utils;
using core::VoxelNode;

class NpyFileTest : public ::testing::Test {
protected:
    void SetUp() override {
        path = ::testing::TempDir() + "npy_file_test.npy";
        nodes = {
            VoxelNode::fromString("000111000000111000000000000"),
            VoxelNode::fromString("000110000000110000000000000"),
            VoxelNode::fromString("010111010010111010000000000")
        };
    }

    void TearDown() override {
        std::remove(path.c_str());
    }

    std::string readBytes() const {
        std::ifstream file(path, std::ios::binary);
        return std::string((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    }

    // Build an image around an arbitrary header dict
    static std::string makeImage(const std::string& dict, const std::string& payload) {
        std::string text = dict + "\n";
        std::string image(NpyFile::MAGIC, NpyFile::MAGIC_SIZE);
        image.push_back(1);
        image.push_back(0);
        image.push_back(static_cast<char>(text.size() & 0xFF));
        image.push_back(static_cast<char>((text.size() >> 8) & 0xFF));
        return image + text + payload;
    }

    std::string path;
    std::vector<VoxelNode> nodes;
};

// ==================== Header Tests ====================

TEST_F(NpyFileTest, HeaderIsAlignedAndTerminated) {
    std::string header = NpyFile::buildHeader(57);

    EXPECT_EQ(header.size() % NpyFile::HEADER_ALIGNMENT, 0u);
    EXPECT_EQ(header.compare(0, NpyFile::MAGIC_SIZE, NpyFile::MAGIC, NpyFile::MAGIC_SIZE), 0);
    EXPECT_EQ(header[6], 1);
    EXPECT_EQ(header[7], 0);
    EXPECT_EQ(header.back(), '\n');

    size_t length = static_cast<uint8_t>(header[8]) | (static_cast<uint8_t>(header[9]) << 8);
    EXPECT_EQ(length + NpyFile::PREAMBLE_SIZE, header.size());

    EXPECT_NE(header.find("'descr': '|b1'"), std::string::npos);
    EXPECT_NE(header.find("'fortran_order': False"), std::string::npos);
    EXPECT_NE(header.find("'shape': (57, 3, 3, 3)"), std::string::npos);
}

TEST_F(NpyFileTest, WriteProducesHeaderPlusPayload) {
    size_t written = NpyFile::write(path, nodes);
    std::string bytes = readBytes();

    EXPECT_EQ(written, bytes.size());
    EXPECT_EQ(bytes.size(), NpyFile::buildHeader(nodes.size()).size() + nodes.size() * 27);

    // First payload byte belongs to cell (0,0,0) of the first node
    size_t offset = NpyFile::buildHeader(nodes.size()).size();
    std::string first = nodes[0].toString();
    for (size_t i = 0; i < 27; i++) {
        EXPECT_EQ(bytes[offset + i], first[i] == '1' ? 1 : 0) << "Cell " << i;
    }
}

// ==================== Round Trip ====================

TEST_F(NpyFileTest, ReadBackMatchesWrittenNodes) {
    NpyFile::write(path, nodes);
    std::vector<VoxelNode> loaded = NpyFile::read(path);
    EXPECT_EQ(loaded, nodes);
}

TEST_F(NpyFileTest, FullNodeSetRoundTrip) {
    core::NodeSet unique = core::buildNodeSet();
    std::vector<VoxelNode> stacked(unique.begin(), unique.end());

    NpyFile::write(path, stacked);
    std::vector<VoxelNode> loaded = NpyFile::read(path);

    ASSERT_EQ(loaded.size(), stacked.size());
    for (size_t i = 0; i < loaded.size(); i++) {
        EXPECT_EQ(loaded[i], stacked[i]) << "Node " << i;
    }
}

TEST_F(NpyFileTest, EmptyStackRoundTrip) {
    NpyFile::write(path, {});
    EXPECT_NE(readBytes().find("'shape': (0, 3, 3, 3)"), std::string::npos);
    EXPECT_TRUE(NpyFile::read(path).empty());
}

TEST_F(NpyFileTest, OverwritesExistingFile) {
    NpyFile::write(path, nodes);
    NpyFile::write(path, {nodes[0]});
    EXPECT_EQ(NpyFile::read(path).size(), 1u);
}

// ==================== Error Handling ====================

TEST_F(NpyFileTest, WriteToMissingDirectoryThrows) {
    std::string badPath = ::testing::TempDir() + "no_such_dir/sub/nodes.npy";
    EXPECT_THROW(NpyFile::write(badPath, nodes), std::runtime_error);
}

#ifndef _WIN32
TEST_F(NpyFileTest, FailedWriteRemovesPartialFile) {
    // Cap file size so the open succeeds but the flush cannot complete
    struct rlimit previous;
    ASSERT_EQ(getrlimit(RLIMIT_FSIZE, &previous), 0);
    struct rlimit limited = previous;
    limited.rlim_cur = 64;
    if (setrlimit(RLIMIT_FSIZE, &limited) != 0) {
        GTEST_SKIP() << "Cannot lower RLIMIT_FSIZE";
    }
    auto previousHandler = std::signal(SIGXFSZ, SIG_IGN);

    bool threw = false;
    try {
        NpyFile::write(path, nodes);
    } catch (const std::runtime_error&) {
        threw = true;
    }

    setrlimit(RLIMIT_FSIZE, &previous);
    std::signal(SIGXFSZ, previousHandler);

    EXPECT_TRUE(threw);
    EXPECT_FALSE(std::filesystem::exists(path));
}

TEST_F(NpyFileTest, FailedWriteKeepsDeviceNode) {
    // Same device numbers as /dev/full: opens fine, every write fails
    std::string device = ::testing::TempDir() + "npy_file_test_full";
    std::remove(device.c_str());
    if (mknod(device.c_str(), S_IFCHR | 0666, makedev(1, 7)) != 0) {
        GTEST_SKIP() << "Cannot create device node";
    }

    EXPECT_THROW(NpyFile::write(device, nodes), std::runtime_error);
    EXPECT_TRUE(std::filesystem::is_character_file(device));

    std::remove(device.c_str());
}
#endif

TEST_F(NpyFileTest, ReadMissingFileThrows) {
    EXPECT_THROW(NpyFile::read(::testing::TempDir() + "does_not_exist.npy"), std::runtime_error);
}

TEST_F(NpyFileTest, ParseRejectsBadMagic) {
    EXPECT_THROW(NpyFile::parse("not numpy at all"), std::runtime_error);
    EXPECT_THROW(NpyFile::parse(""), std::runtime_error);
}

TEST_F(NpyFileTest, ParseRejectsWrongDtype) {
    std::string header = NpyFile::buildHeader(1);
    size_t pos = header.find("|b1");
    header.replace(pos, 3, "<i1");
    EXPECT_THROW(NpyFile::parse(header + std::string(27, '\0')), std::runtime_error);
}

TEST_F(NpyFileTest, ParseRejectsFortranOrder) {
    std::string header = NpyFile::buildHeader(1);
    size_t pos = header.find("False");
    header.replace(pos, 5, "True ");
    EXPECT_THROW(NpyFile::parse(header + std::string(27, '\0')), std::runtime_error);
}

TEST_F(NpyFileTest, ParseRejectsTruncatedPayload) {
    std::string image = NpyFile::buildHeader(2) + std::string(27, '\1');
    EXPECT_THROW(NpyFile::parse(image), std::runtime_error);
}

TEST_F(NpyFileTest, ParseRejectsNonBooleanValues) {
    std::string image = NpyFile::buildHeader(1) + std::string(27, '\0');
    image[image.size() - 1] = 2;
    EXPECT_THROW(NpyFile::parse(image), std::runtime_error);
}

TEST_F(NpyFileTest, ParseRejectsWrongShape) {
    std::string header = NpyFile::buildHeader(1);
    size_t pos = header.find("(1, 3, 3, 3)");
    header.replace(pos, 12, "(1, 3, 9)   ");
    EXPECT_THROW(NpyFile::parse(header + std::string(27, '\0')), std::runtime_error);
}

TEST_F(NpyFileTest, ParseRejectsCountThatWrapsPayloadSize) {
    // 683212743470724134 * 27 wraps to 2 in 64 bits
    std::string image = NpyFile::buildHeader(683212743470724134ull) + std::string(2, '\0');
    EXPECT_THROW(NpyFile::parse(image), std::runtime_error);
}

TEST_F(NpyFileTest, ParseRejectsOversizedDimension) {
    std::string image = makeImage(
        "{'descr': '|b1', 'fortran_order': False, 'shape': (99999999999999999999999, 3, 3, 3), }",
        std::string(27, '\0'));
    EXPECT_THROW(NpyFile::parse(image), std::runtime_error);
}

TEST_F(NpyFileTest, ParseAcceptsUnpaddedHeader) {
    std::string image = makeImage(
        "{'descr': '|b1', 'fortran_order': False, 'shape': (1, 3, 3, 3), }",
        std::string(27, '\1'));
    std::vector<VoxelNode> loaded = NpyFile::parse(image);
    ASSERT_EQ(loaded.size(), 1u);
    EXPECT_EQ(loaded[0].filledCount(), 27u);
}
