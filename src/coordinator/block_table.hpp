#pragma once

#include <cpprest/json.h>

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <set>
#include <shared_mutex>
#include <string>
#include <vector>

using namespace web;

namespace fs = std::filesystem;

/**
 * Where one block of a file lives.
 * 
 * NOTE: replica == NO_REPLICA marks degraded replication (the replica
 *       push failed at upload time).
 */
struct BlockPlacement
{
    static const int32_t NO_REPLICA = -1;

    uint32_t index;
    uint64_t blockId;
    uint32_t size;
    std::string hash;
    int32_t primary;
    int32_t replica;

    bool degraded() const;
    json::value toJson() const;
    static BlockPlacement fromJson(const json::value &value);
};

/**
 * One stored file: metadata plus its ordered block placements.
 */
struct FileEntry
{
    uint64_t fileId;
    std::string name;
    uint64_t size;
    int64_t uploadedAt;
    std::string hash;
    std::vector<BlockPlacement> blocks;
    bool committed;

    uint32_t degradedBlocks() const;

    /**
     * {"name", "size", "blocks", "uploadedAt", "degraded", ...}; with
     * `withPlacements` also the full block list.
     */
    json::value toJson(bool withPlacements) const;
};

/**
 * The authoritative mapping: file -> ordered blocks -> {primary, replica}.
 * 
 * Durable through an append-only JSON-lines journal in `metadataDir`;
 * every record is written and fsync'ed before the in-memory table
 * changes. Records:
 * 
 *      {"type": "file",   "fileId", "name", "size", "hash", "uploadedAt"}
 *      {"type": "block",  "fileId", "index", "blockId", "size", "hash", "primary", "replica"}
 *      {"type": "commit", "fileId"}
 *      {"type": "abort",  "fileId"}
 *      {"type": "counters", "nextFileId", "nextBlockId"}
 * 
 * Only committed files are visible to readers. On open the journal is
 * replayed (a torn trailing line is ignored, uncommitted files are dropped)
 * and compacted into a fresh journal holding committed state only.
 * 
 * Thread safe: mutations take the exclusive side of a shared_mutex,
 * reads the shared side.
 */
class BlockTable
{
public:
    explicit BlockTable(const std::string &metadataDir);
    ~BlockTable();

    BlockTable(const BlockTable&) = delete;
    BlockTable& operator=(const BlockTable&) = delete;

    /**
     * Starts recording an upload; returns the new file id.
     * 
     * Throws:
     *      FileExistsError - if `name` is stored or being uploaded
     *      IOError         - if the journal write fails
     */
    uint64_t beginFile(const std::string &name, uint64_t size, const std::string &hash, int64_t uploadedAt);

    /* Cluster-unique id for the next block to store */
    uint64_t allocateBlockId();

    /* Largest block id handed out so far (0 if none) */
    uint64_t highestAllocatedBlockId();

    /**
     * Records a block placement of an in-progress upload.
     * 
     * Throws:
     *      IntegrityError - if `placement.index` isn't the next index
     *      NotFoundError  - if `fileId` isn't an in-progress upload
     *      IOError        - if the journal write fails
     */
    void addBlock(uint64_t fileId, const BlockPlacement &placement);

    /* Makes the file visible to readers */
    void commitFile(uint64_t fileId);

    /* Drops an in-progress upload, freeing its name */
    void abortFile(uint64_t fileId);

    std::optional<FileEntry> findFile(const std::string &name);

    /**
     * Throws:
     *      NotFoundError - if no committed file is called `name`
     */
    FileEntry getFile(const std::string &name);

    /* Committed files, ordered by name */
    std::vector<FileEntry> listFiles();

    /* {node id -> number of block copies it holds} over committed files */
    std::map<int32_t, uint32_t> blocksPerNode();

    /* {node id -> ids of the block copies it should hold} over committed files */
    std::map<int32_t, std::set<uint64_t>> blockIdsPerNode();

    uint32_t numFiles();
    uint32_t degradedBlockCount();

    /* Sum of committed file sizes */
    uint64_t storedBytes();

    fs::path journalPath() const;

private:
    std::shared_mutex mtx;

    fs::path metadataDir;
    fs::path journalFilePath;
    int journalFd;

    /* {file id -> entry}, committed and in-progress */
    std::map<uint64_t, FileEntry> files;

    /* {file name -> file id} */
    std::map<std::string, uint64_t> nameIndex;

    uint64_t nextFileId;
    uint64_t nextBlockId;

    /* Writes one record + '\n' and fsyncs. Throws IOError. */
    void appendRecord(const json::value &record);

    void openJournal();
    void closeJournal();

    /* Rebuilds the table from the journal */
    void replay();
    void applyRecord(const json::value &record);

    /* Rewrites the journal with committed state only (tmp file + rename) */
    void compact();

    FileEntry& pendingFile(uint64_t fileId);
};

////////////////////////////////////////////
// BlockTable tests
////////////////////////////////////////////
namespace BlockTableTests
{
    void testCommittedFilesVisible();
    void testDuplicateNameRejected();
    void testSurvivesRestart();
    void testUncommittedDroppedOnReplay();
    void testTornTrailingLineIgnored();
    void testBlocksRecordedInOrder();
    void runAll();
}
