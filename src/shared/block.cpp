#include <iostream>
#include <sstream>
#include <string>
#include <random>
#include <functional>
#include <stdexcept>

#include "block.hpp"
#include "crypto.hpp"
#include "errors.hpp"
#include "utils.hpp"
#include "test_utils.hpp"

////////////////////////////////////////////
// Block methods
////////////////////////////////////////////

/**
 * Default constructor
 */
Block::Block()
    : index(0),
      dataSize(0)
{
}

/**
 * Parameterised constructor
 */
Block::Block(
    uint32_t index,
    std::vector<unsigned char>::const_iterator dataStart,
    std::vector<unsigned char>::const_iterator dataEnd,
    std::string hash
)
    : index(index),
      dataSize(static_cast<uint32_t>(std::distance(dataStart, dataEnd))),
      hash(hash),
      dataStart(dataStart),
      dataEnd(dataEnd)
{
}

std::vector<unsigned char> Block::payload() const
{
    return std::vector<unsigned char>(dataStart, dataEnd);
}

bool Block::verify() const
{
    const unsigned char* data = dataSize > 0 ? &(*dataStart) : nullptr;
    return Crypto::sha256Hex(data, dataSize) == hash;
}

/**
 * Returns the string represenation of a Block.
 * 
 * NOTE: 
 * 
 * By default, we only show block meta data (i.e. index, size and hash).
 * On showData == true, raw block data is also shown.
 */
std::string Block::toString(bool showData) const
{
    std::ostringstream oss;
    oss << "block " << index << " (" << dataSize << " bytes, " << hash.substr(0, 12) << ")";

    if (showData) 
    {
        oss << ": ";
        for (auto it = dataStart; it != dataEnd; ++it) 
        {
            // NOTE: display data bytes as 'char' for now
            oss << static_cast<char>(*it);
        }
    }

    return oss.str();
}

////////////////////////////////////////////
// BlockCodec
////////////////////////////////////////////
namespace BlockCodec
{
    uint64_t blockCount(uint64_t fileSize, uint32_t blockSize)
    {
        return MathUtils::ceilDiv(fileSize, blockSize);
    }

    std::vector<Block> split(const std::vector<unsigned char> &data, uint32_t blockSize)
    {
        if (blockSize == 0)
            throw std::invalid_argument("split() - block size must be positive");

        std::vector<Block> blocks;
        blocks.reserve(blockCount(data.size(), blockSize));

        uint64_t size = data.size();
        uint32_t index = 0;

        for (uint64_t pos = 0; pos < size; pos += blockSize)
        {
            auto blockStart = data.begin() + pos;
            auto blockEnd = data.begin() + std::min<uint64_t>(pos + blockSize, size);

            std::string hash = Crypto::sha256Hex(&(*blockStart), std::distance(blockStart, blockEnd));
            blocks.emplace_back(index++, blockStart, blockEnd, hash);
        }

        return blocks;
    }

    std::vector<Block> splitFile(
        const fs::path &path,
        uint32_t blockSize,
        std::vector<unsigned char> &buffer
    )
    {
        std::error_code ec;
        uintmax_t expectedSize = fs::file_size(path, ec);
        if (ec)
            throw IOError("splitFile() - cannot stat " + path.string() + ": " + ec.message());

        buffer = FileSystemUtils::readFile(path);

        if (buffer.size() != expectedSize)
        {
            throw IOError(
                "splitFile() - short read of " + path.string() + ": got " +
                std::to_string(buffer.size()) + " of " + std::to_string(expectedSize) + " bytes"
            );
        }

        return split(buffer, blockSize);
    }

    std::vector<unsigned char> join(const std::vector<Block> &blocks)
    {
        uint64_t totalSize = 0;
        for (uint32_t i = 0; i < blocks.size(); i++)
        {
            const Block &block = blocks[i];

            if (block.index != i)
            {
                throw IntegrityError(
                    "join() - expected block " + std::to_string(i) +
                    " but found block " + std::to_string(block.index)
                );
            }

            if (!block.verify())
                throw IntegrityError("join() - hash mismatch on block " + std::to_string(block.index));

            totalSize += block.dataSize;
        }

        std::vector<unsigned char> data;
        data.reserve(totalSize);
        for (auto &block : blocks)
            data.insert(data.end(), block.dataStart, block.dataEnd);

        return data;
    }

    bool verify(const std::string &originalHash, const std::vector<unsigned char> &data)
    {
        return Crypto::sha256Hex(data) == originalHash;
    }
}

////////////////////////////////////////////
// Block utils
////////////////////////////////////////////
namespace BlockUtils
{
    std::vector<unsigned char> generateRandomData(uint64_t numBytes)
    {
        // create random data - upper case letters
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<> dis(65, 90);

        std::vector<unsigned char> data(numBytes);
        for (auto &byte : data)
            byte = static_cast<unsigned char>(dis(gen));

        return data;
    }
}

////////////////////////////////////////////
// BlockCodec tests
////////////////////////////////////////////
namespace BlockCodecTests
{
    void testSplitJoinRoundTrip()
    {
        uint32_t blockSize = 512;
        std::vector<uint64_t> sizes = {0, 1, blockSize, blockSize + 1, 10 * blockSize + 40};

        for (uint64_t size : sizes)
        {
            std::vector<unsigned char> data = BlockUtils::generateRandomData(size);
            std::vector<Block> blocks = BlockCodec::split(data, blockSize);

            ASSERT_THAT(blocks.size() == BlockCodec::blockCount(size, blockSize));
            ASSERT_THAT(BlockCodec::join(blocks) == data);
        }
    }

    void testSplitIsDeterministic()
    {
        std::vector<unsigned char> data = BlockUtils::generateRandomData(5000);

        std::vector<Block> first = BlockCodec::split(data, 1024);
        std::vector<Block> second = BlockCodec::split(data, 1024);

        ASSERT_THAT(first.size() == second.size());
        for (size_t i = 0; i < first.size(); i++)
        {
            ASSERT_THAT(first[i].index == second[i].index);
            ASSERT_THAT(first[i].dataSize == second[i].dataSize);
            ASSERT_THAT(first[i].hash == second[i].hash);
        }
    }

    void testFinalBlockMayBeShorter()
    {
        std::vector<unsigned char> data = BlockUtils::generateRandomData(2500);
        std::vector<Block> blocks = BlockCodec::split(data, 1000);

        ASSERT_THAT(blocks.size() == 3);
        ASSERT_THAT(blocks[0].dataSize == 1000);
        ASSERT_THAT(blocks[1].dataSize == 1000);
        ASSERT_THAT(blocks[2].dataSize == 500);
    }

    void testJoinDetectsCorruptedBlock()
    {
        std::vector<unsigned char> data = BlockUtils::generateRandomData(3000);
        std::vector<Block> blocks = BlockCodec::split(data, 1000);

        // flip one byte of the middle block after hashing
        data[1500] ^= 0xff;

        ASSERT_THROWS(BlockCodec::join(blocks), IntegrityError);
    }

    void testJoinDetectsIndexGap()
    {
        std::vector<unsigned char> data = BlockUtils::generateRandomData(3000);
        std::vector<Block> blocks = BlockCodec::split(data, 1000);

        std::vector<Block> withGap = {blocks[0], blocks[2]};
        ASSERT_THROWS(BlockCodec::join(withGap), IntegrityError);

        std::vector<Block> reordered = {blocks[1], blocks[0], blocks[2]};
        ASSERT_THROWS(BlockCodec::join(reordered), IntegrityError);
    }

    void testVerifyWholeFile()
    {
        std::vector<unsigned char> data = BlockUtils::generateRandomData(4096);
        std::string hash = Crypto::sha256Hex(data);

        ASSERT_THAT(BlockCodec::verify(hash, data));

        data[0] ^= 0x01;
        ASSERT_THAT(!BlockCodec::verify(hash, data));
    }

    void testSplitFileMissingSource()
    {
        std::vector<unsigned char> buffer;
        ASSERT_THROWS(
            BlockCodec::splitFile("/nonexistent/blockpool/input.bin", 1024, buffer),
            IOError
        );
    }

    void runAll()
    {
        TestUtils::printSuiteHeader("BlockCodec Tests");

        std::vector<std::pair<std::string, std::function<void()>>> tests = {
            TEST(testSplitJoinRoundTrip),
            TEST(testSplitIsDeterministic),
            TEST(testFinalBlockMayBeShorter),
            TEST(testJoinDetectsCorruptedBlock),
            TEST(testJoinDetectsIndexGap),
            TEST(testVerifyWholeFile),
            TEST(testSplitFileMissingSource)
        };

        for (auto &[name, func] : tests)
        {
            TestUtils::runTest(name, func);
        }
    }
}
