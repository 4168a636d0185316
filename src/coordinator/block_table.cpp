#include <fcntl.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <functional>
#include <mutex>

#include "block_table.hpp"

#include "errors.hpp"
#include "logger.hpp"
#include "test_utils.hpp"
#include "utils.hpp"

namespace
{
    ComponentLogger tableLog("block-table");

    const std::string JOURNAL_FILE_NAME = "block_table.journal";

    /**
     * Writes all of `data` to `fd`.
     * 
     * Throws:
     *      IOError - on any write failure
     */
    void writeAll(int fd, const std::string &data, const std::string &what)
    {
        size_t written = 0;
        while (written < data.size())
        {
            ssize_t n = ::write(fd, data.data() + written, data.size() - written);
            if (n < 0)
            {
                if (errno == EINTR)
                    continue;
                throw IOError("write to " + what + " failed: " + std::strerror(errno));
            }
            written += n;
        }
    }
}

////////////////////////////////////////////
// BlockPlacement / FileEntry methods
////////////////////////////////////////////

bool BlockPlacement::degraded() const
{
    return replica == NO_REPLICA;
}

json::value BlockPlacement::toJson() const
{
    json::value value = json::value::object();
    value[U("index")] = json::value::number(index);
    value[U("blockId")] = json::value::number(blockId);
    value[U("size")] = json::value::number(size);
    value[U("hash")] = json::value::string(U(hash));
    value[U("primary")] = json::value::number(primary);
    value[U("replica")] = json::value::number(replica);
    return value;
}

BlockPlacement BlockPlacement::fromJson(const json::value &value)
{
    BlockPlacement placement;
    placement.index = value.at(U("index")).as_number().to_uint32();
    placement.blockId = value.at(U("blockId")).as_number().to_uint64();
    placement.size = value.at(U("size")).as_number().to_uint32();
    placement.hash = value.at(U("hash")).as_string();
    placement.primary = value.at(U("primary")).as_integer();
    placement.replica = value.at(U("replica")).as_integer();
    return placement;
}

uint32_t FileEntry::degradedBlocks() const
{
    uint32_t count = 0;
    for (const auto &block : blocks)
        if (block.degraded())
            count++;
    return count;
}

json::value FileEntry::toJson(bool withPlacements) const
{
    json::value value = json::value::object();
    value[U("fileId")] = json::value::number(fileId);
    value[U("name")] = json::value::string(U(name));
    value[U("size")] = json::value::number(size);
    value[U("blockCount")] = json::value::number(static_cast<uint64_t>(blocks.size()));
    value[U("uploadedAt")] = json::value::number(uploadedAt);
    value[U("hash")] = json::value::string(U(hash));
    value[U("degraded")] = json::value::boolean(degradedBlocks() > 0);
    value[U("degradedBlocks")] = json::value::number(degradedBlocks());

    if (withPlacements)
    {
        json::value placements = json::value::array(blocks.size());
        for (size_t i = 0; i < blocks.size(); i++)
            placements[i] = blocks[i].toJson();
        value[U("blocks")] = placements;
    }
    return value;
}

////////////////////////////////////////////
// BlockTable - public methods
////////////////////////////////////////////

BlockTable::BlockTable(const std::string &metadataDir)
    : metadataDir(FileSystemUtils::expandHome(metadataDir)),
      journalFd(-1),
      nextFileId(1),
      nextBlockId(1)
{
    this->journalFilePath = this->metadataDir / JOURNAL_FILE_NAME;

    std::error_code ec;
    fs::create_directories(this->metadataDir, ec);
    if (ec)
        throw IOError("couldn't create metadata directory " + this->metadataDir.string() + ": " + ec.message());

    replay();
    compact();
    openJournal();

    tableLog.info("loaded " + std::to_string(files.size()) + " files from " + journalFilePath.string());
}

BlockTable::~BlockTable()
{
    closeJournal();
}

uint64_t BlockTable::beginFile(const std::string &name, uint64_t size, const std::string &hash, int64_t uploadedAt)
{
    std::unique_lock<std::shared_mutex> lock(mtx);

    if (nameIndex.find(name) != nameIndex.end())
        throw FileExistsError("file '" + name + "' already exists");

    uint64_t fileId = nextFileId;

    json::value record = json::value::object();
    record[U("type")] = json::value::string(U("file"));
    record[U("fileId")] = json::value::number(fileId);
    record[U("name")] = json::value::string(U(name));
    record[U("size")] = json::value::number(size);
    record[U("hash")] = json::value::string(U(hash));
    record[U("uploadedAt")] = json::value::number(uploadedAt);
    appendRecord(record);

    FileEntry entry;
    entry.fileId = fileId;
    entry.name = name;
    entry.size = size;
    entry.uploadedAt = uploadedAt;
    entry.hash = hash;
    entry.committed = false;

    files[fileId] = entry;
    nameIndex[name] = fileId;
    nextFileId++;

    return fileId;
}

uint64_t BlockTable::allocateBlockId()
{
    std::unique_lock<std::shared_mutex> lock(mtx);
    return nextBlockId++;
}

uint64_t BlockTable::highestAllocatedBlockId()
{
    std::shared_lock<std::shared_mutex> lock(mtx);
    return nextBlockId - 1;
}

void BlockTable::addBlock(uint64_t fileId, const BlockPlacement &placement)
{
    std::unique_lock<std::shared_mutex> lock(mtx);

    FileEntry &entry = pendingFile(fileId);
    if (placement.index != entry.blocks.size())
    {
        throw IntegrityError("block " + std::to_string(placement.index) + " of '" + entry.name
            + "' recorded out of order (expected " + std::to_string(entry.blocks.size()) + ")");
    }

    json::value record = placement.toJson();
    record[U("type")] = json::value::string(U("block"));
    record[U("fileId")] = json::value::number(fileId);
    appendRecord(record);

    entry.blocks.push_back(placement);
}

void BlockTable::commitFile(uint64_t fileId)
{
    std::unique_lock<std::shared_mutex> lock(mtx);

    FileEntry &entry = pendingFile(fileId);

    json::value record = json::value::object();
    record[U("type")] = json::value::string(U("commit"));
    record[U("fileId")] = json::value::number(fileId);
    appendRecord(record);

    entry.committed = true;
}

void BlockTable::abortFile(uint64_t fileId)
{
    std::unique_lock<std::shared_mutex> lock(mtx);

    FileEntry &entry = pendingFile(fileId);

    json::value record = json::value::object();
    record[U("type")] = json::value::string(U("abort"));
    record[U("fileId")] = json::value::number(fileId);
    appendRecord(record);

    nameIndex.erase(entry.name);
    files.erase(fileId);
}

std::optional<FileEntry> BlockTable::findFile(const std::string &name)
{
    std::shared_lock<std::shared_mutex> lock(mtx);

    auto it = nameIndex.find(name);
    if (it == nameIndex.end())
        return std::nullopt;

    const FileEntry &entry = files.at(it->second);
    if (!entry.committed)
        return std::nullopt;
    return entry;
}

FileEntry BlockTable::getFile(const std::string &name)
{
    std::optional<FileEntry> entry = findFile(name);
    if (!entry)
        throw NotFoundError("no file named '" + name + "'");
    return *entry;
}

std::vector<FileEntry> BlockTable::listFiles()
{
    std::shared_lock<std::shared_mutex> lock(mtx);

    std::vector<FileEntry> result;
    for (const auto &[name, fileId] : nameIndex)
    {
        const FileEntry &entry = files.at(fileId);
        if (entry.committed)
            result.push_back(entry);
    }
    return result;
}

std::map<int32_t, uint32_t> BlockTable::blocksPerNode()
{
    std::shared_lock<std::shared_mutex> lock(mtx);

    std::map<int32_t, uint32_t> counts;
    for (const auto &[fileId, entry] : files)
    {
        if (!entry.committed)
            continue;
        for (const auto &block : entry.blocks)
        {
            counts[block.primary]++;
            if (!block.degraded())
                counts[block.replica]++;
        }
    }
    return counts;
}

std::map<int32_t, std::set<uint64_t>> BlockTable::blockIdsPerNode()
{
    std::shared_lock<std::shared_mutex> lock(mtx);

    std::map<int32_t, std::set<uint64_t>> ids;
    for (const auto &[fileId, entry] : files)
    {
        if (!entry.committed)
            continue;
        for (const auto &block : entry.blocks)
        {
            ids[block.primary].insert(block.blockId);
            if (!block.degraded())
                ids[block.replica].insert(block.blockId);
        }
    }
    return ids;
}

uint32_t BlockTable::numFiles()
{
    std::shared_lock<std::shared_mutex> lock(mtx);

    uint32_t count = 0;
    for (const auto &[fileId, entry] : files)
        if (entry.committed)
            count++;
    return count;
}

uint32_t BlockTable::degradedBlockCount()
{
    std::shared_lock<std::shared_mutex> lock(mtx);

    uint32_t count = 0;
    for (const auto &[fileId, entry] : files)
        if (entry.committed)
            count += entry.degradedBlocks();
    return count;
}

uint64_t BlockTable::storedBytes()
{
    std::shared_lock<std::shared_mutex> lock(mtx);

    uint64_t total = 0;
    for (const auto &[fileId, entry] : files)
        if (entry.committed)
            total += entry.size;
    return total;
}

fs::path BlockTable::journalPath() const
{
    return journalFilePath;
}

////////////////////////////////////////////
// BlockTable - private methods
////////////////////////////////////////////

void BlockTable::appendRecord(const json::value &record)
{
    std::string line = record.serialize() + "\n";

    off_t offset = ::lseek(journalFd, 0, SEEK_END);
    try
    {
        writeAll(journalFd, line, journalFilePath.string());
    }
    catch (const IOError &)
    {
        // drop the partial line so later records stay parseable
        if (offset >= 0 && ::ftruncate(journalFd, offset) != 0)
            tableLog.error("couldn't truncate partial journal record: " + std::string(std::strerror(errno)));
        throw;
    }

    if (::fsync(journalFd) != 0)
        throw IOError("fsync of " + journalFilePath.string() + " failed: " + std::strerror(errno));
}

void BlockTable::openJournal()
{
    journalFd = ::open(journalFilePath.c_str(), O_WRONLY | O_APPEND | O_CREAT | O_CLOEXEC, 0644);
    if (journalFd < 0)
        throw IOError("couldn't open journal " + journalFilePath.string() + ": " + std::strerror(errno));
}

void BlockTable::closeJournal()
{
    if (journalFd >= 0)
    {
        ::close(journalFd);
        journalFd = -1;
    }
}

void BlockTable::replay()
{
    files.clear();
    nameIndex.clear();

    if (!fs::exists(journalFilePath))
        return;

    std::vector<unsigned char> raw = FileSystemUtils::readFile(journalFilePath);
    std::string contents(raw.begin(), raw.end());

    size_t lineStart = 0;
    uint64_t records = 0;
    while (lineStart < contents.size())
    {
        size_t lineEnd = contents.find('\n', lineStart);
        if (lineEnd == std::string::npos)
        {
            tableLog.warn("ignoring torn trailing journal record");
            break;
        }

        std::string line = contents.substr(lineStart, lineEnd - lineStart);
        lineStart = lineEnd + 1;
        if (line.empty())
            continue;

        try
        {
            applyRecord(json::value::parse(line));
            records++;
        }
        catch (const json::json_exception &e)
        {
            tableLog.warn("bad journal record " + std::to_string(records) + " (" + e.what() + "); stopping replay");
            break;
        }
    }

    // uploads that never committed are dropped
    uint32_t dropped = 0;
    for (auto it = files.begin(); it != files.end();)
    {
        if (!it->second.committed)
        {
            nameIndex.erase(it->second.name);
            it = files.erase(it);
            dropped++;
        }
        else
        {
            ++it;
        }
    }

    tableLog.info("journal replay: " + std::to_string(records) + " records, "
        + std::to_string(dropped) + " uncommitted uploads dropped");
}

void BlockTable::applyRecord(const json::value &record)
{
    std::string type = record.at(U("type")).as_string();

    if (type == "counters")
    {
        nextFileId = std::max(nextFileId, record.at(U("nextFileId")).as_number().to_uint64());
        nextBlockId = std::max(nextBlockId, record.at(U("nextBlockId")).as_number().to_uint64());
        return;
    }

    uint64_t fileId = record.at(U("fileId")).as_number().to_uint64();

    if (type == "file")
    {
        FileEntry entry;
        entry.fileId = fileId;
        entry.name = record.at(U("name")).as_string();
        entry.size = record.at(U("size")).as_number().to_uint64();
        entry.hash = record.at(U("hash")).as_string();
        entry.uploadedAt = record.at(U("uploadedAt")).as_number().to_int64();
        entry.committed = false;

        files[fileId] = entry;
        nameIndex[entry.name] = fileId;
        nextFileId = std::max(nextFileId, fileId + 1);
        return;
    }

    auto it = files.find(fileId);
    if (it == files.end())
    {
        tableLog.warn("journal " + type + " record for unknown file " + std::to_string(fileId));
        return;
    }

    if (type == "block")
    {
        BlockPlacement placement = BlockPlacement::fromJson(record);
        it->second.blocks.push_back(placement);
        nextBlockId = std::max(nextBlockId, placement.blockId + 1);
    }
    else if (type == "commit")
    {
        it->second.committed = true;
    }
    else if (type == "abort")
    {
        nameIndex.erase(it->second.name);
        files.erase(it);
    }
    else
    {
        tableLog.warn("unknown journal record type '" + type + "'");
    }
}

void BlockTable::compact()
{
    fs::path tmpPath = journalFilePath;
    tmpPath += ".tmp";

    std::string contents;

    json::value counters = json::value::object();
    counters[U("type")] = json::value::string(U("counters"));
    counters[U("nextFileId")] = json::value::number(nextFileId);
    counters[U("nextBlockId")] = json::value::number(nextBlockId);
    contents += counters.serialize() + "\n";

    for (const auto &[fileId, entry] : files)
    {
        json::value fileRecord = json::value::object();
        fileRecord[U("type")] = json::value::string(U("file"));
        fileRecord[U("fileId")] = json::value::number(fileId);
        fileRecord[U("name")] = json::value::string(U(entry.name));
        fileRecord[U("size")] = json::value::number(entry.size);
        fileRecord[U("hash")] = json::value::string(U(entry.hash));
        fileRecord[U("uploadedAt")] = json::value::number(entry.uploadedAt);
        contents += fileRecord.serialize() + "\n";

        for (const auto &block : entry.blocks)
        {
            json::value blockRecord = block.toJson();
            blockRecord[U("type")] = json::value::string(U("block"));
            blockRecord[U("fileId")] = json::value::number(fileId);
            contents += blockRecord.serialize() + "\n";
        }

        json::value commitRecord = json::value::object();
        commitRecord[U("type")] = json::value::string(U("commit"));
        commitRecord[U("fileId")] = json::value::number(fileId);
        contents += commitRecord.serialize() + "\n";
    }

    int fd = ::open(tmpPath.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0)
        throw IOError("couldn't create " + tmpPath.string() + ": " + std::strerror(errno));

    try
    {
        writeAll(fd, contents, tmpPath.string());
        if (::fsync(fd) != 0)
            throw IOError("fsync of " + tmpPath.string() + " failed: " + std::strerror(errno));
    }
    catch (const IOError &)
    {
        ::close(fd);
        std::error_code ec;
        fs::remove(tmpPath, ec);
        throw;
    }
    ::close(fd);

    std::error_code ec;
    fs::rename(tmpPath, journalFilePath, ec);
    if (ec)
        throw IOError("couldn't replace journal " + journalFilePath.string() + ": " + ec.message());
}

FileEntry& BlockTable::pendingFile(uint64_t fileId)
{
    auto it = files.find(fileId);
    if (it == files.end() || it->second.committed)
        throw NotFoundError("no upload in progress with file id " + std::to_string(fileId));
    return it->second;
}

////////////////////////////////////////////
// BlockTable tests
////////////////////////////////////////////
namespace BlockTableTests
{
    const std::string TEST_METADATA_DIR = (fs::temp_directory_path() / "blockpool_table_test").string();

    BlockPlacement placement(BlockTable &table, uint32_t index, int32_t primary, int32_t replica)
    {
        BlockPlacement p;
        p.index = index;
        p.blockId = table.allocateBlockId();
        p.size = 1024;
        p.hash = "h" + std::to_string(index);
        p.primary = primary;
        p.replica = replica;
        return p;
    }

    /* Records a committed two-block file */
    void storeFile(BlockTable &table, const std::string &name)
    {
        uint64_t fileId = table.beginFile(name, 2048, "filehash", 1700000000);
        table.addBlock(fileId, placement(table, 0, 1, 2));
        table.addBlock(fileId, placement(table, 1, 2, BlockPlacement::NO_REPLICA));
        table.commitFile(fileId);
    }

    void testCommittedFilesVisible()
    {
        FileSystemUtils::removeDirectory(TEST_METADATA_DIR);
        BlockTable table(TEST_METADATA_DIR);

        uint64_t fileId = table.beginFile("a.txt", 2048, "filehash", 1700000000);
        table.addBlock(fileId, placement(table, 0, 1, 2));

        // in-progress uploads are invisible
        ASSERT_THAT(!table.findFile("a.txt").has_value());
        ASSERT_THAT(table.listFiles().empty());
        ASSERT_THROWS(table.getFile("a.txt"), NotFoundError);

        table.addBlock(fileId, placement(table, 1, 2, 1));
        table.commitFile(fileId);

        FileEntry entry = table.getFile("a.txt");
        ASSERT_THAT(entry.blocks.size() == 2);
        ASSERT_THAT(entry.blocks[1].primary == 2);
        ASSERT_THAT(table.numFiles() == 1);
        ASSERT_THAT(table.storedBytes() == 2048);
        ASSERT_THAT(table.blocksPerNode()[1] == 2);
        ASSERT_THAT(table.blocksPerNode()[2] == 2);

        std::set<uint64_t> both = {entry.blocks[0].blockId, entry.blocks[1].blockId};
        ASSERT_THAT(table.blockIdsPerNode()[1] == both);
        ASSERT_THAT(table.blockIdsPerNode()[2] == both);

        FileSystemUtils::removeDirectory(TEST_METADATA_DIR);
    }

    void testDuplicateNameRejected()
    {
        FileSystemUtils::removeDirectory(TEST_METADATA_DIR);
        BlockTable table(TEST_METADATA_DIR);

        storeFile(table, "a.txt");
        ASSERT_THROWS(table.beginFile("a.txt", 1, "x", 0), FileExistsError);

        // a name being uploaded is taken too, until aborted
        uint64_t fileId = table.beginFile("b.txt", 1, "x", 0);
        ASSERT_THROWS(table.beginFile("b.txt", 1, "x", 0), FileExistsError);
        table.abortFile(fileId);
        table.beginFile("b.txt", 1, "x", 0);

        FileSystemUtils::removeDirectory(TEST_METADATA_DIR);
    }

    void testSurvivesRestart()
    {
        FileSystemUtils::removeDirectory(TEST_METADATA_DIR);

        uint64_t lastBlockId;
        {
            BlockTable table(TEST_METADATA_DIR);
            storeFile(table, "a.txt");
            storeFile(table, "b.txt");
            lastBlockId = table.getFile("b.txt").blocks[1].blockId;
        }

        BlockTable reopened(TEST_METADATA_DIR);
        ASSERT_THAT(reopened.numFiles() == 2);

        FileEntry entry = reopened.getFile("b.txt");
        ASSERT_THAT(entry.size == 2048);
        ASSERT_THAT(entry.hash == "filehash");
        ASSERT_THAT(entry.blocks.size() == 2);
        ASSERT_THAT(entry.blocks[1].degraded());
        ASSERT_THAT(reopened.degradedBlockCount() == 2);

        // ids never repeat across restarts
        ASSERT_THAT(reopened.allocateBlockId() > lastBlockId);
        ASSERT_THAT(reopened.beginFile("c.txt", 1, "x", 0) > entry.fileId);

        FileSystemUtils::removeDirectory(TEST_METADATA_DIR);
    }

    void testUncommittedDroppedOnReplay()
    {
        FileSystemUtils::removeDirectory(TEST_METADATA_DIR);

        {
            BlockTable table(TEST_METADATA_DIR);
            storeFile(table, "kept.txt");

            // upload interrupted before commit
            uint64_t fileId = table.beginFile("lost.txt", 2048, "x", 0);
            table.addBlock(fileId, placement(table, 0, 1, 2));
        }

        BlockTable reopened(TEST_METADATA_DIR);
        ASSERT_THAT(reopened.findFile("kept.txt").has_value());
        ASSERT_THAT(!reopened.findFile("lost.txt").has_value());
        ASSERT_THAT(reopened.numFiles() == 1);

        // the name is free again
        reopened.beginFile("lost.txt", 1, "x", 0);

        FileSystemUtils::removeDirectory(TEST_METADATA_DIR);
    }

    void testTornTrailingLineIgnored()
    {
        FileSystemUtils::removeDirectory(TEST_METADATA_DIR);

        fs::path journal;
        {
            BlockTable table(TEST_METADATA_DIR);
            storeFile(table, "a.txt");
            journal = table.journalPath();
        }

        // crash mid-append
        {
            std::ofstream out(journal, std::ios::app);
            out << "{\"type\":\"file\",\"fileId\":99,\"na";
        }

        BlockTable reopened(TEST_METADATA_DIR);
        ASSERT_THAT(reopened.numFiles() == 1);
        ASSERT_THAT(reopened.getFile("a.txt").blocks.size() == 2);

        FileSystemUtils::removeDirectory(TEST_METADATA_DIR);
    }

    void testBlocksRecordedInOrder()
    {
        FileSystemUtils::removeDirectory(TEST_METADATA_DIR);
        BlockTable table(TEST_METADATA_DIR);

        uint64_t fileId = table.beginFile("a.txt", 3072, "x", 0);
        table.addBlock(fileId, placement(table, 0, 1, 2));
        ASSERT_THROWS(table.addBlock(fileId, placement(table, 2, 1, 2)), IntegrityError);
        ASSERT_THROWS(table.addBlock(424242, placement(table, 0, 1, 2)), NotFoundError);

        FileSystemUtils::removeDirectory(TEST_METADATA_DIR);
    }

    void runAll()
    {
        TestUtils::printSuiteHeader("BlockTable Tests");

        std::vector<std::pair<std::string, std::function<void()>>> tests = {
            TEST(testCommittedFilesVisible),
            TEST(testDuplicateNameRejected),
            TEST(testSurvivesRestart),
            TEST(testUncommittedDroppedOnReplay),
            TEST(testTornTrailingLineIgnored),
            TEST(testBlocksRecordedInOrder)
        };

        for (auto &[name, func] : tests)
        {
            TestUtils::runTest(name, func);
        }
    }
}
