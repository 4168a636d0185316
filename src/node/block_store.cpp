#include <algorithm>
#include <cstring>
#include <fstream>
#include <functional>
#include <sstream>

#include "block_store.hpp"

#include "block.hpp"
#include "crypto.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include "test_utils.hpp"
#include "utils.hpp"

namespace fs = std::filesystem;

namespace
{
    const std::string BLOCK_FILE_PREFIX = "blk_";
    const std::string BLOCK_FILE_SUFFIX = ".dat";

    ComponentLogger storeLog("block-store");
}

////////////////////////////////////////////
// BlockFileHeader methods
////////////////////////////////////////////

BlockFileHeader::BlockFileHeader()
    : magicNumber(0),
      blockId(0),
      payloadSize(0)
{
    std::memset(hash, 0, sizeof(hash));
}

BlockFileHeader::BlockFileHeader(
    uint32_t magicNumber,
    uint64_t blockId,
    uint64_t payloadSize,
    const std::string &hash
)
    : magicNumber(magicNumber),
      blockId(blockId),
      payloadSize(payloadSize)
{
    std::memset(this->hash, 0, sizeof(this->hash));
    std::memcpy(this->hash, hash.data(), std::min(hash.size(), sizeof(this->hash)));
}

std::string BlockFileHeader::hashString() const
{
    return std::string(hash, strnlen(hash, sizeof(hash)));
}

std::string BlockFileHeader::toString() const
{
    std::stringstream ss;
    ss << "BlockFileHeader:\n"
        << "  Magic Number: " << magicNumber << "\n"
        << "  Block Id: " << blockId << "\n"
        << "  Payload Size: " << payloadSize << "\n"
        << "  Hash: " << hashString();
    return ss.str();
}

////////////////////////////////////////////
// BlockStore - public methods
////////////////////////////////////////////

BlockStore::BlockStore(
    std::string storeDirPath,
    int32_t nodeId,
    uint64_t capacityBytes,
    bool removeExistingStore
)
    : storeDirPath(FileSystemUtils::expandHome(storeDirPath) / ("node_" + std::to_string(nodeId))),
      capacityBytes(capacityBytes),
      usedBytes(0)
{
    if (removeExistingStore)
        FileSystemUtils::removeDirectory(this->storeDirPath);

    std::error_code ec;
    fs::create_directories(this->storeDirPath, ec);
    if (ec)
        throw IOError("couldn't create store directory " + this->storeDirPath.string() + ": " + ec.message());

    // initialise from existing store
    populateIndexFromDisk();

    storeLog.info("store at " + this->storeDirPath.string() + ": "
        + std::to_string(index.size()) + " blocks, "
        + PrintUtils::formatNumBytes(usedBytes) + " / " + PrintUtils::formatNumBytes(capacityBytes) + " used");
}

void BlockStore::put(uint64_t blockId, const std::vector<unsigned char> &payload)
{
    std::string hash = Crypto::sha256Hex(payload);

    std::lock_guard<std::mutex> lock(mtx);

    uint64_t existingSize = 0;
    auto it = index.find(blockId);
    if (it != index.end())
    {
        if (it->second.hash == hash && it->second.payloadSize == payload.size())
            return;
        existingSize = it->second.payloadSize;
    }

    uint64_t newUsed = usedBytes - existingSize + payload.size();
    if (newUsed > capacityBytes)
    {
        throw CapacityError(
            payload.size(),
            1,
            capacityBytes,
            usedBytes,
            capacityBytes - usedBytes,
            "node is full; free space on it or place the block elsewhere"
        );
    }

    BlockFileHeader header(MAGIC_NUMBER, blockId, payload.size(), hash);

    std::vector<unsigned char> fileData(sizeof(header) + payload.size());
    std::memcpy(fileData.data(), &header, sizeof(header));
    std::copy(payload.begin(), payload.end(), fileData.begin() + sizeof(header));

    FileSystemUtils::writeFileAtomically(blockPath(blockId), fileData);

    index[blockId] = {payload.size(), hash};
    usedBytes = newUsed;
}

StoredBlock BlockStore::get(uint64_t blockId)
{
    fs::path path;
    IndexEntry entry;
    {
        std::lock_guard<std::mutex> lock(mtx);

        auto it = index.find(blockId);
        if (it == index.end())
            throw NotFoundError("block " + std::to_string(blockId) + " is not stored on this node");

        entry = it->second;
        path = blockPath(blockId);
    }

    std::vector<unsigned char> fileData = FileSystemUtils::readFile(path);
    if (fileData.size() != sizeof(BlockFileHeader) + entry.payloadSize)
    {
        throw IntegrityError("block " + std::to_string(blockId) + " file has size "
            + std::to_string(fileData.size()) + ", expected "
            + std::to_string(sizeof(BlockFileHeader) + entry.payloadSize));
    }

    StoredBlock block;
    block.hash = entry.hash;
    block.data.assign(fileData.begin() + sizeof(BlockFileHeader), fileData.end());

    if (Crypto::sha256Hex(block.data) != entry.hash)
        throw IntegrityError("block " + std::to_string(blockId) + " no longer matches its hash");

    return block;
}

bool BlockStore::contains(uint64_t blockId)
{
    std::lock_guard<std::mutex> lock(mtx);
    return index.find(blockId) != index.end();
}

bool BlockStore::remove(uint64_t blockId)
{
    std::lock_guard<std::mutex> lock(mtx);

    auto it = index.find(blockId);
    if (it == index.end())
        return false;

    std::error_code ec;
    fs::remove(blockPath(blockId), ec);
    if (ec)
        throw IOError("couldn't remove block " + std::to_string(blockId) + ": " + ec.message());

    usedBytes -= it->second.payloadSize;
    index.erase(it);
    return true;
}

std::vector<uint64_t> BlockStore::blockIds()
{
    std::lock_guard<std::mutex> lock(mtx);

    std::vector<uint64_t> ids;
    for (const auto &p : index)
        ids.push_back(p.first);
    return ids;
}

uint32_t BlockStore::numBlocks()
{
    std::lock_guard<std::mutex> lock(mtx);
    return index.size();
}

Payloads::SizeInfo BlockStore::usage()
{
    std::lock_guard<std::mutex> lock(mtx);
    return Payloads::SizeInfo(usedBytes, capacityBytes);
}

fs::path BlockStore::blockPath(uint64_t blockId) const
{
    return storeDirPath / (BLOCK_FILE_PREFIX + std::to_string(blockId) + BLOCK_FILE_SUFFIX);
}

////////////////////////////////////////////
// BlockStore - private methods
////////////////////////////////////////////

void BlockStore::populateIndexFromDisk()
{
    index.clear();
    usedBytes = 0;

    std::vector<fs::path> staleFiles;

    for (const auto &dirEntry : fs::directory_iterator(storeDirPath))
    {
        if (!dirEntry.is_regular_file())
            continue;

        fs::path path = dirEntry.path();
        std::string name = path.filename().string();

        bool isBlockFile = name.rfind(BLOCK_FILE_PREFIX, 0) == 0
            && name.size() > BLOCK_FILE_SUFFIX.size()
            && name.compare(name.size() - BLOCK_FILE_SUFFIX.size(), BLOCK_FILE_SUFFIX.size(), BLOCK_FILE_SUFFIX) == 0;

        if (!isBlockFile)
        {
            // interrupted write
            if (path.extension() == ".part")
                staleFiles.push_back(path);
            continue;
        }

        try
        {
            BlockFileHeader header = readHeader(path);

            if (path != blockPath(header.blockId))
                throw IOError("header names block " + std::to_string(header.blockId));

            index[header.blockId] = {header.payloadSize, header.hashString()};
            usedBytes += header.payloadSize;
        }
        catch (const IOError &e)
        {
            storeLog.warn("discarding " + path.string() + ": " + e.what());
            staleFiles.push_back(path);
        }
    }

    for (const auto &path : staleFiles)
    {
        std::error_code ec;
        fs::remove(path, ec);
    }
}

BlockFileHeader BlockStore::readHeader(const fs::path &path)
{
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open())
        throw IOError("couldn't open " + path.string());

    BlockFileHeader header;
    file.read(reinterpret_cast<char*>(&header), sizeof(header));
    if (file.gcount() != static_cast<std::streamsize>(sizeof(header)))
        throw IOError("truncated header");

    if (header.magicNumber != MAGIC_NUMBER)
        throw IOError("bad magic number");

    std::error_code ec;
    uint64_t fileSize = fs::file_size(path, ec);
    if (ec || fileSize != sizeof(header) + header.payloadSize)
        throw IOError("truncated payload");

    return header;
}

////////////////////////////////////////////
// BlockStore tests
////////////////////////////////////////////
namespace BlockStoreTests
{
    const std::string TEST_STORE_DIR = (fs::temp_directory_path() / "blockpool_store_test").string();

    void setup()
    {
        FileSystemUtils::removeDirectory(TEST_STORE_DIR);
    }

    void teardown()
    {
        FileSystemUtils::removeDirectory(TEST_STORE_DIR);
    }

    void testCanPutAndGetBlocks()
    {
        setup();

        BlockStore store(TEST_STORE_DIR, 1, 1u << 20);

        std::vector<unsigned char> a = BlockUtils::generateRandomData(1000);
        std::vector<unsigned char> b = BlockUtils::generateRandomData(24);
        store.put(7, a);
        store.put(3, b);

        ASSERT_THAT(store.get(7).data == a);
        ASSERT_THAT(store.get(3).data == b);
        ASSERT_THAT(store.get(3).hash == Crypto::sha256Hex(b));
        ASSERT_THAT(store.contains(7));
        ASSERT_THAT(!store.contains(8));
        ASSERT_THAT(store.blockIds() == std::vector<uint64_t>({3, 7}));
        ASSERT_THAT(store.usage().dataUsedSize == 1024);
        ASSERT_THAT(store.usage().dataTotalSize == (1u << 20));
        ASSERT_THAT(fs::exists(store.blockPath(7)));

        teardown();
    }

    void testOverwriteIsIdempotent()
    {
        setup();

        BlockStore store(TEST_STORE_DIR, 1, 10000);

        std::vector<unsigned char> a = BlockUtils::generateRandomData(600);
        store.put(1, a);
        store.put(1, a);
        ASSERT_THAT(store.usage().dataUsedSize == 600);
        ASSERT_THAT(store.numBlocks() == 1);

        // different bytes replace the old payload
        std::vector<unsigned char> b = BlockUtils::generateRandomData(200);
        store.put(1, b);
        ASSERT_THAT(store.usage().dataUsedSize == 200);
        ASSERT_THAT(store.get(1).data == b);

        teardown();
    }

    void testCapacityEnforced()
    {
        setup();

        BlockStore store(TEST_STORE_DIR, 1, 1000);
        store.put(1, BlockUtils::generateRandomData(600));

        bool caught = false;
        try
        {
            store.put(2, BlockUtils::generateRandomData(500));
        }
        catch (const CapacityError &e)
        {
            caught = true;
            ASSERT_THAT(e.usedBytes == 600);
            ASSERT_THAT(e.freeBytes == 400);
            ASSERT_THAT(e.totalBytes == 1000);
        }
        ASSERT_THAT(caught);
        ASSERT_THAT(!store.contains(2));
        ASSERT_THAT(!fs::exists(store.blockPath(2)));

        // replacing a block frees its old space first
        store.put(1, BlockUtils::generateRandomData(1000));
        ASSERT_THAT(store.usage().dataUsedSize == 1000);

        teardown();
    }

    void testCorruptedPayloadDetected()
    {
        setup();

        BlockStore store(TEST_STORE_DIR, 1, 1u << 20);
        std::vector<unsigned char> data = BlockUtils::generateRandomData(512);
        store.put(9, data);

        // flip one payload byte on disk
        {
            std::fstream file(store.blockPath(9), std::ios::in | std::ios::out | std::ios::binary);
            file.seekg(sizeof(BlockFileHeader) + 100);
            char c;
            file.get(c);
            file.seekp(sizeof(BlockFileHeader) + 100);
            file.put(static_cast<char>(c ^ 0x01));
        }

        ASSERT_THROWS(store.get(9), IntegrityError);

        teardown();
    }

    void testIndexRebuiltFromExistingStore()
    {
        setup();

        std::vector<unsigned char> a = BlockUtils::generateRandomData(300);
        std::vector<unsigned char> b = BlockUtils::generateRandomData(700);
        {
            BlockStore store(TEST_STORE_DIR, 2, 5000);
            store.put(11, a);
            store.put(12, b);
        }

        // stray leftovers from an interrupted write
        fs::path nodeDir = fs::path(TEST_STORE_DIR) / "node_2";
        std::ofstream(nodeDir / "blk_13.dat.part") << "partial";
        std::ofstream(nodeDir / "blk_14.dat") << "garbage";

        // create a new BlockStore object - to force an initialisation from disk
        BlockStore reopened(TEST_STORE_DIR, 2, 5000);

        ASSERT_THAT(reopened.blockIds() == std::vector<uint64_t>({11, 12}));
        ASSERT_THAT(reopened.usage().dataUsedSize == 1000);
        ASSERT_THAT(reopened.get(12).data == b);
        ASSERT_THAT(!fs::exists(nodeDir / "blk_13.dat.part"));
        ASSERT_THAT(!fs::exists(nodeDir / "blk_14.dat"));

        teardown();
    }

    void testRemoveExistingStore()
    {
        setup();

        {
            BlockStore store(TEST_STORE_DIR, 3, 5000);
            store.put(1, BlockUtils::generateRandomData(100));
        }

        BlockStore wiped(TEST_STORE_DIR, 3, 5000, true);
        ASSERT_THAT(wiped.numBlocks() == 0);
        ASSERT_THAT(wiped.usage().dataUsedSize == 0);

        teardown();
    }

    void testMissingBlock()
    {
        setup();

        BlockStore store(TEST_STORE_DIR, 1, 5000);
        ASSERT_THROWS(store.get(42), NotFoundError);

        teardown();
    }

    void testRemoveFreesSpace()
    {
        setup();

        BlockStore store(TEST_STORE_DIR, 1, 1000);
        store.put(1, BlockUtils::generateRandomData(600));
        store.put(2, BlockUtils::generateRandomData(300));

        ASSERT_THAT(store.remove(1));
        ASSERT_THAT(!store.contains(1));
        ASSERT_THAT(!fs::exists(store.blockPath(1)));
        ASSERT_THAT(store.usage().dataUsedSize == 300);
        ASSERT_THAT(!store.remove(1));

        // freed space is usable again
        store.put(3, BlockUtils::generateRandomData(700));
        ASSERT_THAT(store.blockIds() == std::vector<uint64_t>({2, 3}));

        // and the removal survives a reopen
        BlockStore reopened(TEST_STORE_DIR, 1, 1000);
        ASSERT_THAT(reopened.blockIds() == std::vector<uint64_t>({2, 3}));
        ASSERT_THAT(reopened.usage().dataUsedSize == 1000);

        teardown();
    }

    void runAll()
    {
        TestUtils::printSuiteHeader("BlockStore Tests");

        std::vector<std::pair<std::string, std::function<void()>>> tests = {
            TEST(testCanPutAndGetBlocks),
            TEST(testOverwriteIsIdempotent),
            TEST(testCapacityEnforced),
            TEST(testCorruptedPayloadDetected),
            TEST(testIndexRebuiltFromExistingStore),
            TEST(testRemoveExistingStore),
            TEST(testMissingBlock),
            TEST(testRemoveFreesSpace)
        };

        for (auto &[name, func] : tests)
        {
            TestUtils::runTest(name, func);
        }
    }
}
