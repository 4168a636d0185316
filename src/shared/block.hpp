#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace fs = std::filesystem;

/**
 * Represents one fixed-size slice of a file.
 * 
 * A file is carried through the cluster as an ordered list of
 * Block objects; `index` is the block's position within its file.
 * 
 * NOTE:
 * 
 * Block objects are lightweight objects that ONLY store
 * pointers to underlying data, NOT the data itself. The buffer
 * the pointers reference must outlive the Block.
 */
class Block {
public:
    /* position of the block within its file (0, 1, 2, ...) */
    uint32_t index;

    /* size of data stored (in bytes) */
    uint32_t dataSize;

    /* SHA256 of the data, as lower-case hex */
    std::string hash;

    /* start/end pointers to underlying data buffer */
    std::vector<unsigned char>::const_iterator dataStart;
    std::vector<unsigned char>::const_iterator dataEnd;

    /**
     * Default constructor
     */
    Block();

    /**
     * Parameterised constructor
     */
    Block(
        uint32_t index,
        std::vector<unsigned char>::const_iterator dataStart,
        std::vector<unsigned char>::const_iterator dataEnd,
        std::string hash
    );

    /**
     * Returns a copy of the block's data.
     */
    std::vector<unsigned char> payload() const;

    /**
     * Returns true if the data still hashes to `hash`.
     */
    bool verify() const;

    /**
     * Returns a one-line string represenation of a Block.
     * 
     * NOTE: 
     * 
     * By default, we only show block meta data (i.e. index, size and hash prefix).
     * On showData == true, raw block data is also shown.
     */
    std::string toString(bool showData = false) const;
};

/**
 * Splits files into blocks and joins blocks back into files.
 */
namespace BlockCodec
{
    /**
     * Default block size: 1 MiB.
     */
    const uint32_t DEFAULT_BLOCK_SIZE = 1u << 20;

    /**
     * Number of blocks a file of `fileSize` bytes splits into,
     * i.e. ceil(fileSize / blockSize).
     */
    uint64_t blockCount(uint64_t fileSize, uint32_t blockSize);

    /**
     * Splits `data` into ceil(size / blockSize) blocks, each pointing
     * into `data`. Only the final block may be shorter than `blockSize`.
     * 
     * Deterministic: the same input always gives the same boundaries and hashes.
     * 
     * Throws:
     *      std::invalid_argument - if blockSize == 0
     */
    std::vector<Block> split(const std::vector<unsigned char> &data, uint32_t blockSize);

    /**
     * Reads the file at `path` into `buffer` and splits it (see split()).
     * 
     * Throws:
     *      IOError - if the file cannot be fully read
     */
    std::vector<Block> splitFile(
        const fs::path &path,
        uint32_t blockSize,
        std::vector<unsigned char> &buffer
    );

    /**
     * Concatenates `blocks` back into the original bytes.
     * 
     * Blocks must be given in index order 0, 1, 2, ... with no gaps.
     * 
     * Throws:
     *      IntegrityError - on an index gap/misorder or a block whose
     *                       data no longer matches its hash
     */
    std::vector<unsigned char> join(const std::vector<Block> &blocks);

    /**
     * Final integrity gate: true if `data` hashes to `originalHash`.
     */
    bool verify(const std::string &originalHash, const std::vector<unsigned char> &data);
}

////////////////////////////////////////////
// Block utils
////////////////////////////////////////////
namespace BlockUtils
{
    /**
     * Generate `numBytes` bytes of random upper case letters.
     * 
     * NOTE: used to write tests for Block and other modules.
     */
    std::vector<unsigned char> generateRandomData(uint64_t numBytes);
}

namespace BlockCodecTests
{
    void testSplitJoinRoundTrip();
    void testSplitIsDeterministic();
    void testFinalBlockMayBeShorter();
    void testJoinDetectsCorruptedBlock();
    void testJoinDetectsIndexGap();
    void testVerifyWholeFile();
    void testSplitFileMissingSource();
    void runAll();
}
