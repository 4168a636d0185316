#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "payloads.hpp"

namespace fs = std::filesystem;

/**
 * Represents the header at the start of every block file.
 */
struct __attribute__((packed)) BlockFileHeader
{
    uint32_t magicNumber;
    uint64_t blockId;
    uint64_t payloadSize;

    /* SHA256 of the payload, as lower-case hex */
    char hash[64];

    BlockFileHeader();

    BlockFileHeader(
        uint32_t magicNumber,
        uint64_t blockId,
        uint64_t payloadSize,
        const std::string &hash
    );

    std::string hashString() const;
    std::string toString() const;
};

/**
 * A block payload read back from the store.
 */
struct StoredBlock
{
    std::string hash;
    std::vector<unsigned char> data;
};

/**
 * Represents a node's on-disk block storage.
 * 
 * Every block lives in its own file:
 * 
 *      <storeDirPath>/node_<id>/blk_<block id>.dat
 * 
 * holding a BlockFileHeader followed by the raw payload. Writes go
 * through a temporary file renamed into place, so a crash never
 * leaves a half-written block behind.
 */
class BlockStore
{
public:
    static const uint32_t MAGIC_NUMBER = 0xB10CB10C;

    /**
     * Param constructor
     * 
     * An existing store directory is scanned and its index and usage
     * rebuilt, unless `removeExistingStore` is set, in which case it
     * is wiped first.
     */
    BlockStore(
        std::string storeDirPath,
        int32_t nodeId,
        uint64_t capacityBytes,
        bool removeExistingStore = false
    );

    /**
     * Persists `payload` under `blockId`.
     * 
     * Re-putting identical bytes under the same id is a no-op; different
     * bytes replace the old payload (usage is adjusted).
     * 
     * Throws:
     *      CapacityError - if the write would exceed the declared capacity
     *      IOError       - on any write failure
     */
    void put(uint64_t blockId, const std::vector<unsigned char> &payload);

    /**
     * Throws:
     *      NotFoundError  - if no block `blockId` is stored here
     *      IntegrityError - if the payload on disk no longer matches its hash
     *      IOError        - on any read failure
     */
    StoredBlock get(uint64_t blockId);

    bool contains(uint64_t blockId);

    /**
     * Deletes block `blockId` and frees its space. Returns false if it
     * wasn't stored here.
     * 
     * Throws:
     *      IOError - if the block file can't be removed
     */
    bool remove(uint64_t blockId);

    /* All stored block ids, ascending */
    std::vector<uint64_t> blockIds();

    uint32_t numBlocks();

    /* {sum of stored payload sizes, declared capacity} */
    Payloads::SizeInfo usage();

    /* Path of the file block `blockId` is (or would be) stored in */
    fs::path blockPath(uint64_t blockId) const;

private:
    struct IndexEntry
    {
        uint64_t payloadSize;
        std::string hash;
    };

    std::mutex mtx;

    fs::path storeDirPath;
    uint64_t capacityBytes;
    uint64_t usedBytes;

    /* {block id -> entry} */
    std::map<uint64_t, IndexEntry> index;

    /**
     * Rebuilds `index` and `usedBytes` from the block files on disk.
     * 
     * NOTE: leftover temporary files and files with an invalid header
     *       are removed.
     */
    void populateIndexFromDisk();

    /**
     * Reads and validates the header of the given block file.
     * 
     * Throws:
     *      IOError - if the file is unreadable, truncated or not a block file
     */
    BlockFileHeader readHeader(const fs::path &path);
};

////////////////////////////////////////////
// BlockStore tests
////////////////////////////////////////////
namespace BlockStoreTests
{
    void setup();
    void teardown();

    void testCanPutAndGetBlocks();
    void testOverwriteIsIdempotent();
    void testCapacityEnforced();
    void testCorruptedPayloadDetected();
    void testIndexRebuiltFromExistingStore();
    void testRemoveExistingStore();
    void testMissingBlock();
    void testRemoveFreesSpace();

    void runAll();
}
