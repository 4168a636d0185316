#pragma once

#include <cpprest/json.h>

#include <chrono>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <shared_mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "block_table.hpp"
#include "cluster_node.hpp"
#include "coordinator_config.hpp"
#include "logger.hpp"
#include "payloads.hpp"
#include "transport.hpp"

using namespace web;

/**
 * Aggregate capacity of the `up` nodes, against one file.
 */
struct CapacityReport
{
    bool accepted;
    uint64_t fileSize;
    uint64_t blocksRequired;
    uint64_t totalBytes;
    uint64_t usedBytes;
    uint64_t freeBytes;

    json::value toJson() const;
};

/**
 * {primary node id, replica node id} for one block.
 */
struct PlacementPair
{
    int32_t primary;
    int32_t replica;
};

/**
 * How one node's block inventory differs from the Block Table.
 */
struct BlockDiscrepancy
{
    /* in the table for this node, absent from the node */
    std::vector<uint64_t> missingBlocks;

    /* on the node, unknown to the table for this node */
    std::vector<uint64_t> unexpectedBlocks;
};

/**
 * Result of Coordinator::reconcile().
 */
struct ReconcileReport
{
    /* {node id -> discrepancy} for nodes that disagree with the table */
    std::map<int32_t, BlockDiscrepancy> mismatchedNodes;

    /* live nodes that couldn't be queried */
    std::vector<int32_t> unreachableNodes;

    /* blocks with no replica */
    uint32_t degradedBlocks;

    bool clean() const;
    json::value toJson() const;
};

/**
 * The single control-plane instance.
 * 
 * Owns the Block Table and the membership view of every node; runs
 * admission control and placement, orchestrates uploads and downloads
 * and tracks node liveness from heartbeats.
 * 
 * NOTE:
 * 
 * If given a `localAgent`, node requests (PING, STORE_BLOCK, GET_BLOCK,
 * GET_STATUS, DELETE_BLOCK, LIST_BLOCKS) reaching the coordinator are
 * forwarded to it, so the coordinator's machine can store blocks too.
 * Without one they are rejected with ProtocolError; a PING then fails
 * like any other unreachable node.
 */
class Coordinator : public RequestHandler
{
public:
    using Clock = std::chrono::steady_clock;

    Coordinator(const CoordinatorConfig &config, Transport &transport, RequestHandler *localAgent = nullptr);
    ~Coordinator();

    Coordinator(const Coordinator&) = delete;
    Coordinator& operator=(const Coordinator&) = delete;

    /* Starts / stops the liveness thread */
    void start();
    void stop();

    Response handle(const Request &request) override;

    ////////////////////////////////////////////
    // Admission control & placement
    ////////////////////////////////////////////

    /**
     * Aggregate free capacity of `up` nodes against a file of `fileSize` bytes.
     */
    CapacityReport capacityReport(uint64_t fileSize);

    /**
     * Returns true if a file of `fileSize` bytes fits in the free capacity
     * of the `up` nodes (and under totalSharedCapacity, if configured).
     * 
     * Throws:
     *      CapacityError - otherwise, with the numbers behind the decision
     */
    bool canAccept(uint64_t fileSize);

    /**
     * Picks {primary, replica} for one block of `blockSize` bytes without
     * reserving anything.
     * 
     * Throws:
     *      NoCapacityError - if fewer than two distinct `up` nodes have room
     */
    PlacementPair assign(uint32_t blockSize);

    ////////////////////////////////////////////
    // File operations
    ////////////////////////////////////////////

    /**
     * Splits `data` into blocks, places and stores each on two nodes and
     * commits the file to the Block Table.
     * 
     * Throws:
     *      FileExistsError      - if `name` is already stored
     *      CapacityError        - if the file doesn't fit (nothing moved)
     *      NoCapacityError      - if placement can't be planned (nothing moved)
     *      NodeUnreachableError - if a block's primary fails twice (file not committed;
     *                             copies already pushed are deleted best-effort)
     */
    FileEntry uploadFile(const std::string &name, const std::vector<unsigned char> &data);

    /**
     * Reassembles and verifies file `name`.
     * 
     * Throws:
     *      NotFoundError         - if no such file
     *      BlockUnavailableError - if both copies of a block fail (later blocks are not requested)
     *      IntegrityError        - if the reassembled bytes don't match the file hash
     */
    std::vector<unsigned char> downloadFile(const std::string &name);

    std::vector<FileEntry> listFiles();
    FileEntry fileInfo(const std::string &name);

    ////////////////////////////////////////////
    // Liveness
    ////////////////////////////////////////////

    /**
     * Records a heartbeat; a `down` node comes back `up`.
     * 
     * Throws:
     *      ProtocolError - if the heartbeat names an unknown node
     */
    void recordHeartbeat(const Payloads::Heartbeat &heartbeat, Clock::time_point now = Clock::now());

    /**
     * Marks `down` every `up` node silent for longer than
     * heartbeatInterval x missedHeartbeatThreshold.
     */
    void checkLiveness(Clock::time_point now = Clock::now());

    /**
     * Pings the node directly; a successful ping marks it `up`.
     */
    bool pingNode(int32_t nodeId);

    bool isUp(int32_t nodeId);

    /* Copy of the coordinator's view of a node */
    ClusterNode nodeSnapshot(int32_t nodeId);

    /**
     * Compares the Block Table against the block ids each live node
     * reports holding, per node. Blocks of uploads still in flight are
     * not counted as unexpected.
     * Only reports; nothing is moved, deleted or re-replicated.
     */
    ReconcileReport reconcile();

    ////////////////////////////////////////////
    // Status views
    ////////////////////////////////////////////

    json::value clusterStatus();

    /* clusterStatus() as a terminal-printable table */
    std::string clusterStatusTable();

    BlockTable& blockTable();

private:
    uint32_t blockSize;
    uint64_t totalSharedCapacity;
    std::chrono::milliseconds heartbeatInterval;
    uint32_t missedHeartbeatThreshold;

    Transport &transport;
    RequestHandler *localAgent;

    std::unique_ptr<BlockTable> table;

    /**
     * Stores our nodes, which are represented as ClusterNode
     * objects (see cluster_node.hpp).
     * 
     * Mapping is of the form: { node id -> ClusterNode object }.
     */
    std::map<int32_t, ClusterNode> nodes;
    std::shared_mutex nodesMutex;

    /* logical bytes of uploads in flight (for totalSharedCapacity) */
    uint64_t pendingLogicalBytes;

    /* block ids allocated to uploads not yet committed or rolled back; guarded by nodesMutex */
    std::set<uint64_t> inflightBlockIds;

    /* A block copy an upload sent to a node */
    struct PushedCopy
    {
        int32_t nodeId;
        uint64_t blockId;
        uint32_t size;

        /* the node acknowledged the store */
        bool confirmed;
    };

    std::thread livenessThread;
    std::mutex stopMutex;
    std::condition_variable stopCondition;
    bool stopRequested;

    ComponentLogger log;

    void livenessLoop();

    /* capacityReport() body; nodesMutex must be held */
    CapacityReport capacityReportLocked(uint64_t fileSize);

    /* Throws CapacityError if the report or the shared quota rejects the file; nodesMutex must be held */
    void admitLocked(uint64_t fileSize);

    /**
     * Greedy placement of every block over a copy of the free space;
     * nodesMutex must be held. Throws NoCapacityError.
     */
    std::vector<PlacementPair> planLocked(const std::vector<uint32_t> &blockSizes);

    /**
     * Admits the file and reserves capacity for its whole placement plan
     * in one critical section.
     */
    std::vector<PlacementPair> reserve(uint64_t fileSize, const std::vector<uint32_t> &blockSizes);

    void releaseReservation(int32_t nodeId, uint64_t numBytes);

    /**
     * Pushes one block, retrying once. On success updates the node's
     * usage from the reply and releases the block's reservation.
     * 
     * Throws:
     *      BlockPoolError - the error of the second attempt
     */
    void pushBlock(int32_t nodeId, const Payloads::StoreBlockRequest &request);

    /* Allocates a block id and marks it in flight */
    uint64_t allocateInflightBlockId();

    void clearInflight(const std::vector<uint64_t> &blockIds);

    /**
     * Deletes the copies an aborted upload left on nodes. A confirmed copy
     * that can't be deleted is counted in its node's dataBytesOrphaned.
     */
    void rollbackCopies(const std::string &name, const std::vector<PushedCopy> &copies);

    /* Fetches and checks one block from its primary, then its replica */
    std::vector<unsigned char> fetchBlock(const FileEntry &entry, const BlockPlacement &placement);

    /* Logs how a file's blocks are spread across the nodes */
    void logBlockDistribution(const FileEntry &entry);

    std::string addressOf(int32_t nodeId);

    Response handleHeartbeat(const Request &request);
    Response handleUploadFile(const Request &request);
    Response handleDownloadFile(const Request &request);
    Response handleListFiles();
    Response handleFileInfo(const Request &request);
    Response handleCanAccept(const Request &request);
    Response handleClusterStatus();
};

////////////////////////////////////////////
// Coordinator tests
////////////////////////////////////////////
namespace CoordinatorTests
{
    void testCanAcceptReportsCapacity();
    void testSharedCapacityQuota();
    void testPlacementNeverOverflows();
    void testFiveMiBOnTwoNodesRejectedBeforeTransfer();
    void testThreeMiBOnTwoNodesFitsExactly();
    void testThreeNodesDistinctPairs();
    void testUploadDownloadRoundTrip();
    void testDownloadFallsBackToReplica();
    void testDownloadFailsWhenBothCopiesUnreachable();
    void testReplicaFailureDegrades();
    void testPrimaryFailureAbortsUpload();
    void testAbortedUploadRemovesPushedBlocks();
    void testUndeletableCopiesReportedOrphaned();
    void testConcurrentUploadsShareCapacity();
    void testConcurrentUploadsStayConsistent();
    void testDuplicateUploadRejected();
    void testLivenessTimeout();
    void testPingNodeMarksUp();
    void testLivenessThreadMarksSilentNodesDown();
    void testBlockTableSurvivesRestart();
    void testReconcileReportsMismatch();
    void testReconcileSeesSwappedBlocks();
    void testClusterStatusViews();
    void runAll();
}
