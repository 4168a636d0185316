#include <algorithm>
#include <atomic>
#include <chrono>
#include <functional>
#include <limits>
#include <sstream>
#include <thread>

#include "coordinator.hpp"

#include "block.hpp"
#include "crypto.hpp"
#include "errors.hpp"
#include "node_agent.hpp"
#include "node_api.hpp"
#include "node_config.hpp"
#include "test_utils.hpp"
#include "utils.hpp"

////////////////////////////////////////////
// CapacityReport / ReconcileReport methods
////////////////////////////////////////////

json::value CapacityReport::toJson() const
{
    json::value value = json::value::object();
    value[U("accepted")] = json::value::boolean(accepted);
    value[U("fileSize")] = json::value::number(fileSize);
    value[U("blocksRequired")] = json::value::number(blocksRequired);
    value[U("totalBytes")] = json::value::number(totalBytes);
    value[U("usedBytes")] = json::value::number(usedBytes);
    value[U("freeBytes")] = json::value::number(freeBytes);
    return value;
}

bool ReconcileReport::clean() const
{
    return mismatchedNodes.empty() && unreachableNodes.empty() && degradedBlocks == 0;
}

namespace
{
    json::value idArray(const std::vector<uint64_t> &ids)
    {
        json::value array = json::value::array(ids.size());
        for (size_t i = 0; i < ids.size(); i++)
            array[i] = json::value::number(ids[i]);
        return array;
    }
}

json::value ReconcileReport::toJson() const
{
    json::value mismatched = json::value::array(mismatchedNodes.size());
    size_t i = 0;
    for (const auto &[nodeId, discrepancy] : mismatchedNodes)
    {
        json::value entry = json::value::object();
        entry[U("node")] = json::value::number(nodeId);
        entry[U("missingBlocks")] = idArray(discrepancy.missingBlocks);
        entry[U("unexpectedBlocks")] = idArray(discrepancy.unexpectedBlocks);
        mismatched[i++] = entry;
    }

    json::value unreachable = json::value::array(unreachableNodes.size());
    for (size_t j = 0; j < unreachableNodes.size(); j++)
        unreachable[j] = json::value::number(unreachableNodes[j]);

    json::value value = json::value::object();
    value[U("mismatchedNodes")] = mismatched;
    value[U("unreachableNodes")] = unreachable;
    value[U("degradedBlocks")] = json::value::number(degradedBlocks);
    return value;
}

////////////////////////////////////////////
// Coordinator - public methods
////////////////////////////////////////////

Coordinator::Coordinator(const CoordinatorConfig &config, Transport &transport, RequestHandler *localAgent)
    : blockSize(config.blockSize),
      totalSharedCapacity(config.totalSharedCapacity),
      heartbeatInterval(config.heartbeatIntervalMs),
      missedHeartbeatThreshold(config.missedHeartbeatThreshold),
      transport(transport),
      localAgent(localAgent),
      pendingLogicalBytes(0),
      stopRequested(false),
      log("coordinator")
{
    table = std::make_unique<BlockTable>(config.metadataDir);

    // nodes start `down` until their first heartbeat
    for (const auto &info : config.nodes)
        nodes.emplace(info.id, ClusterNode(info));
}

Coordinator::~Coordinator()
{
    stop();
}

void Coordinator::start()
{
    livenessThread = std::thread(&Coordinator::livenessLoop, this);
}

void Coordinator::stop()
{
    {
        std::lock_guard<std::mutex> lock(stopMutex);
        stopRequested = true;
    }
    stopCondition.notify_all();

    if (livenessThread.joinable())
        livenessThread.join();
}

Response Coordinator::handle(const Request &request)
{
    switch (request.kind)
    {
        case MessageKind::HEARTBEAT:
            return handleHeartbeat(request);

        case MessageKind::PING:
        case MessageKind::STORE_BLOCK:
        case MessageKind::GET_BLOCK:
        case MessageKind::GET_STATUS:
        case MessageKind::DELETE_BLOCK:
        case MessageKind::LIST_BLOCKS:
        {
            if (localAgent)
                return localAgent->handle(request);
            throw ProtocolError("coordinator stores no blocks; " + MessageKinds::toString(request.kind) + " rejected");
        }

        default:
            break;
    }

    std::string description = MessageKinds::toString(request.kind)
        + (request.param.empty() ? "" : " '" + request.param + "'");
    log.info(description + " received");

    try
    {
        Response response = Response::failure(ErrorCode::PROTOCOL_ERROR, "unknown message kind");
        switch (request.kind)
        {
            case MessageKind::UPLOAD_FILE:    response = handleUploadFile(request); break;
            case MessageKind::DOWNLOAD_FILE:  response = handleDownloadFile(request); break;
            case MessageKind::LIST_FILES:     response = handleListFiles(); break;
            case MessageKind::FILE_INFO:      response = handleFileInfo(request); break;
            case MessageKind::CAN_ACCEPT:     response = handleCanAccept(request); break;
            case MessageKind::CLUSTER_STATUS: response = handleClusterStatus(); break;
            default: break;
        }

        log.info(description + ": " + (response.ok ? "ok" : response.errorMessage));
        return response;
    }
    catch (const BlockPoolError &e)
    {
        log.warn(description + ": failed - " + e.what());
        throw;
    }
}

////////////////////////////////////////////
// Admission control & placement
////////////////////////////////////////////

CapacityReport Coordinator::capacityReport(uint64_t fileSize)
{
    std::shared_lock<std::shared_mutex> lock(nodesMutex);
    return capacityReportLocked(fileSize);
}

bool Coordinator::canAccept(uint64_t fileSize)
{
    std::shared_lock<std::shared_mutex> lock(nodesMutex);
    admitLocked(fileSize);
    return true;
}

PlacementPair Coordinator::assign(uint32_t blockSize)
{
    std::shared_lock<std::shared_mutex> lock(nodesMutex);
    return planLocked({blockSize}).front();
}

////////////////////////////////////////////
// File operations
////////////////////////////////////////////

FileEntry Coordinator::uploadFile(const std::string &name, const std::vector<unsigned char> &data)
{
    // timing point: start
    auto start = std::chrono::high_resolution_clock::now();

    if (name.empty())
        throw ProtocolError("file name is empty");
    if (table->findFile(name))
        throw FileExistsError("file '" + name + "' already exists");

    std::vector<Block> blocks = BlockCodec::split(data, blockSize);

    std::vector<uint32_t> blockSizes;
    for (const auto &block : blocks)
        blockSizes.push_back(block.dataSize);

    // throws CapacityError / NoCapacityError before any block moves
    std::vector<PlacementPair> plan = reserve(data.size(), blockSizes);

    /**
     * Reservations not yet consumed by a push are given back on failure,
     * and copies already pushed are deleted.
     */
    std::vector<PushedCopy> pushed;
    std::vector<uint64_t> allocatedIds;
    size_t current = 0;
    bool primaryPending = true;
    bool replicaPending = true;
    auto releaseOutstanding = [&]() {
        for (size_t i = current; i < plan.size(); i++)
        {
            bool releasePrimary = i > current || primaryPending;
            bool releaseReplica = i > current || replicaPending;
            if (releasePrimary)
                releaseReservation(plan[i].primary, blockSizes[i]);
            if (releaseReplica)
                releaseReservation(plan[i].replica, blockSizes[i]);
        }
        std::unique_lock<std::shared_mutex> lock(nodesMutex);
        pendingLogicalBytes -= data.size();
    };

    uint64_t fileId;
    try
    {
        fileId = table->beginFile(name, data.size(), Crypto::sha256Hex(data), TimeUtils::nowSeconds());
    }
    catch (const BlockPoolError &)
    {
        releaseOutstanding();
        throw;
    }

    try
    {
        for (current = 0; current < blocks.size(); current++)
        {
            primaryPending = true;
            replicaPending = true;

            const Block &block = blocks[current];
            const PlacementPair &pair = plan[current];
            log.debug("placing " + block.toString() + " on {" + std::to_string(pair.primary)
                + ", " + std::to_string(pair.replica) + "}");

            uint64_t blockId = allocateInflightBlockId();
            allocatedIds.push_back(blockId);

            Payloads::StoreBlockRequest request(blockId, fileId, block.index, block.hash, block.payload());

            try
            {
                pushBlock(pair.primary, request);
                primaryPending = false;
                pushed.push_back({pair.primary, blockId, block.dataSize, true});
            }
            catch (const BlockPoolError &e)
            {
                // a timed-out store may still have landed
                pushed.push_back({pair.primary, blockId, block.dataSize, false});
                throw NodeUnreachableError("primary node " + std::to_string(pair.primary)
                    + " failed block " + std::to_string(block.index) + " of '" + name + "': " + e.what());
            }

            BlockPlacement placement;
            placement.index = block.index;
            placement.blockId = request.blockId;
            placement.size = block.dataSize;
            placement.hash = block.hash;
            placement.primary = pair.primary;
            placement.replica = pair.replica;

            try
            {
                pushBlock(pair.replica, request);
                pushed.push_back({pair.replica, blockId, block.dataSize, true});
            }
            catch (const BlockPoolError &e)
            {
                log.warn("replica node " + std::to_string(pair.replica) + " failed block "
                    + std::to_string(block.index) + " of '" + name + "' (" + e.what() + "); replication degraded");
                releaseReservation(pair.replica, block.dataSize);
                placement.replica = BlockPlacement::NO_REPLICA;
            }
            replicaPending = false;

            table->addBlock(fileId, placement);
        }

        table->commitFile(fileId);
    }
    catch (const BlockPoolError &e)
    {
        releaseOutstanding();
        try
        {
            table->abortFile(fileId);
        }
        catch (const BlockPoolError &abortError)
        {
            log.error("couldn't abort upload of '" + name + "': " + abortError.what());
        }
        log.warn("upload of '" + name + "' failed (" + e.what() + "); rolling back "
            + std::to_string(pushed.size()) + " block copies");
        rollbackCopies(name, pushed);
        clearInflight(allocatedIds);
        throw;
    }

    clearInflight(allocatedIds);
    {
        std::unique_lock<std::shared_mutex> lock(nodesMutex);
        pendingLogicalBytes -= data.size();
    }

    FileEntry entry = table->getFile(name);
    logBlockDistribution(entry);

    // timing point: end
    auto end = std::chrono::high_resolution_clock::now();
    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(end - start);
    log.info("stored '" + name + "' (" + PrintUtils::formatNumBytes(data.size()) + ", "
        + std::to_string(blocks.size()) + " blocks) in " + std::to_string(duration.count()) + " ms");

    return entry;
}

std::vector<unsigned char> Coordinator::downloadFile(const std::string &name)
{
    FileEntry entry = table->getFile(name);

    /**
     * Fetch blocks in index order.
     * 
     * NOTE: each Block's data pointers point into `payloads`.
     */
    std::vector<std::vector<unsigned char>> payloads;
    payloads.reserve(entry.blocks.size());
    for (const auto &placement : entry.blocks)
        payloads.push_back(fetchBlock(entry, placement));

    std::vector<Block> blocks;
    for (size_t i = 0; i < entry.blocks.size(); i++)
    {
        blocks.emplace_back(
            entry.blocks[i].index,
            payloads[i].cbegin(),
            payloads[i].cend(),
            entry.blocks[i].hash
        );
    }

    std::vector<unsigned char> data = BlockCodec::join(blocks);

    if (data.size() != entry.size || !BlockCodec::verify(entry.hash, data))
        throw IntegrityError("reassembled '" + name + "' does not match its hash");

    return data;
}

std::vector<FileEntry> Coordinator::listFiles()
{
    return table->listFiles();
}

FileEntry Coordinator::fileInfo(const std::string &name)
{
    return table->getFile(name);
}

////////////////////////////////////////////
// Liveness
////////////////////////////////////////////

void Coordinator::recordHeartbeat(const Payloads::Heartbeat &heartbeat, Clock::time_point now)
{
    std::unique_lock<std::shared_mutex> lock(nodesMutex);

    auto it = nodes.find(heartbeat.nodeId);
    if (it == nodes.end())
        throw ProtocolError("heartbeat from unknown node " + std::to_string(heartbeat.nodeId));

    ClusterNode &node = it->second;
    node.lastHeartbeat = now;
    node.heardFrom = true;
    node.stats.dataBytesUsed = heartbeat.sizeInfo.dataUsedSize;

    if (!node.isUp)
    {
        node.isUp = true;
        log.info(node.toString() + ": heartbeat received, marked up");
    }
}

void Coordinator::checkLiveness(Clock::time_point now)
{
    auto timeout = heartbeatInterval * missedHeartbeatThreshold;

    std::unique_lock<std::shared_mutex> lock(nodesMutex);
    for (auto &[nodeId, node] : nodes)
    {
        if (!node.isUp)
            continue;

        if (!node.heardFrom || now - node.lastHeartbeat > timeout)
        {
            node.isUp = false;
            log.warn(node.toString() + ": no heartbeat for " + std::to_string(timeout.count()) + " ms, marked down");
        }
    }
}

bool Coordinator::pingNode(int32_t nodeId)
{
    std::string address = addressOf(nodeId);

    try
    {
        if (!NodeApi::ping(transport, address))
            return false;
    }
    catch (const BlockPoolError &e)
    {
        log.warn("ping of node " + std::to_string(nodeId) + " failed: " + e.what());
        return false;
    }

    std::unique_lock<std::shared_mutex> lock(nodesMutex);
    ClusterNode &node = nodes.at(nodeId);
    node.heardFrom = true;
    node.lastHeartbeat = Clock::now();
    if (!node.isUp)
    {
        node.isUp = true;
        log.info(node.toString() + ": answered ping, marked up");
    }
    return true;
}

bool Coordinator::isUp(int32_t nodeId)
{
    std::shared_lock<std::shared_mutex> lock(nodesMutex);
    auto it = nodes.find(nodeId);
    return it != nodes.end() && it->second.isUp;
}

ClusterNode Coordinator::nodeSnapshot(int32_t nodeId)
{
    std::shared_lock<std::shared_mutex> lock(nodesMutex);
    auto it = nodes.find(nodeId);
    if (it == nodes.end())
        throw NotFoundError("no node " + std::to_string(nodeId));
    return it->second;
}

ReconcileReport Coordinator::reconcile()
{
    ReconcileReport report;

    /**
     * Ids above `horizon` were allocated after this point and ids in
     * `inflight` belong to uploads not yet settled; neither is judged.
     * Both are read before the table so no committed block slips between.
     */
    std::set<uint64_t> inflight;
    uint64_t horizon;
    std::vector<std::pair<int32_t, std::string>> liveNodes;
    {
        std::shared_lock<std::shared_mutex> lock(nodesMutex);
        inflight = inflightBlockIds;
        horizon = table->highestAllocatedBlockId();
        for (const auto &[nodeId, node] : nodes)
            if (node.isUp)
                liveNodes.push_back({nodeId, node.address});
    }

    std::map<int32_t, std::set<uint64_t>> expected = table->blockIdsPerNode();
    report.degradedBlocks = table->degradedBlockCount();

    for (const auto &[nodeId, address] : liveNodes)
    {
        try
        {
            Payloads::BlockInventory inventory = NodeApi::listBlocks(transport, address);
            std::set<uint64_t> held(inventory.blockIds.begin(), inventory.blockIds.end());
            const std::set<uint64_t> &wanted = expected[nodeId];

            BlockDiscrepancy discrepancy;
            for (uint64_t blockId : wanted)
                if (!held.count(blockId))
                    discrepancy.missingBlocks.push_back(blockId);
            for (uint64_t blockId : held)
                if (!wanted.count(blockId) && blockId <= horizon && !inflight.count(blockId))
                    discrepancy.unexpectedBlocks.push_back(blockId);

            if (!discrepancy.missingBlocks.empty() || !discrepancy.unexpectedBlocks.empty())
                report.mismatchedNodes[nodeId] = discrepancy;
        }
        catch (const BlockPoolError &e)
        {
            log.warn("reconcile: node " + std::to_string(nodeId) + " unreachable: " + e.what());
            report.unreachableNodes.push_back(nodeId);
        }
    }

    log.info("reconcile: " + report.toJson().serialize());
    return report;
}

////////////////////////////////////////////
// Status views
////////////////////////////////////////////

json::value Coordinator::clusterStatus()
{
    std::map<int32_t, uint32_t> blockCounts = table->blocksPerNode();
    auto now = Clock::now();

    json::value nodeList;
    uint64_t totalBytes = 0;
    uint64_t usedBytes = 0;
    uint64_t freeBytes = 0;
    uint64_t orphanedBytes = 0;
    {
        std::shared_lock<std::shared_mutex> lock(nodesMutex);

        nodeList = json::value::array(nodes.size());
        size_t i = 0;
        for (const auto &[nodeId, node] : nodes)
        {
            json::value entry = json::value::object();
            entry[U("id")] = json::value::number(nodeId);
            entry[U("address")] = json::value::string(node.address);
            entry[U("up")] = json::value::boolean(node.isUp);
            entry[U("isCoordinator")] = json::value::boolean(node.isCoordinator);
            entry[U("blocksStored")] = json::value::number(blockCounts.count(nodeId) ? blockCounts[nodeId] : 0);
            entry[U("usedBytes")] = json::value::number(node.stats.dataBytesUsed);
            entry[U("reservedBytes")] = json::value::number(node.stats.dataBytesReserved);
            entry[U("freeBytes")] = json::value::number(node.freeBytes());
            entry[U("totalBytes")] = json::value::number(node.stats.dataBytesTotal);
            entry[U("orphanedBytes")] = json::value::number(node.stats.dataBytesOrphaned);

            int64_t secondsSince = -1;
            if (node.heardFrom)
                secondsSince = std::chrono::duration_cast<std::chrono::seconds>(now - node.lastHeartbeat).count();
            entry[U("secondsSinceHeartbeat")] = json::value::number(secondsSince);

            nodeList[i++] = entry;

            totalBytes += node.stats.dataBytesTotal;
            usedBytes += node.stats.dataBytesUsed;
            freeBytes += node.freeBytes();
            orphanedBytes += node.stats.dataBytesOrphaned;
        }
    }

    json::value totals = json::value::object();
    totals[U("totalBytes")] = json::value::number(totalBytes);
    totals[U("usedBytes")] = json::value::number(usedBytes);
    totals[U("freeBytes")] = json::value::number(freeBytes);
    totals[U("orphanedBytes")] = json::value::number(orphanedBytes);

    json::value status = json::value::object();
    status[U("nodes")] = nodeList;
    status[U("totals")] = totals;
    status[U("files")] = json::value::number(table->numFiles());
    status[U("storedBytes")] = json::value::number(table->storedBytes());
    status[U("degradedBlocks")] = json::value::number(table->degradedBlockCount());
    return status;
}

std::string Coordinator::clusterStatusTable()
{
    json::value status = clusterStatus();

    std::vector<std::vector<std::string>> rows;
    for (const auto &entry : status.at(U("nodes")).as_array())
    {
        int64_t secondsSince = entry.at(U("secondsSinceHeartbeat")).as_number().to_int64();

        rows.push_back({
            std::to_string(entry.at(U("id")).as_integer()) + (entry.at(U("isCoordinator")).as_bool() ? "*" : ""),
            entry.at(U("up")).as_bool() ? "up" : "down",
            std::to_string(entry.at(U("blocksStored")).as_integer()),
            PrintUtils::formatNumBytes(entry.at(U("usedBytes")).as_number().to_uint64()),
            PrintUtils::formatNumBytes(entry.at(U("freeBytes")).as_number().to_uint64()),
            PrintUtils::formatNumBytes(entry.at(U("totalBytes")).as_number().to_uint64()),
            secondsSince < 0 ? "never" : std::to_string(secondsSince) + "s ago"
        });
    }

    std::ostringstream oss;
    oss << PrintUtils::formatTable({"node", "status", "#blocks", "used", "free", "total", "heartbeat"}, rows);
    oss << "files: " << status.at(U("files")).as_integer()
        << ", stored: " << PrintUtils::formatNumBytes(status.at(U("storedBytes")).as_number().to_uint64())
        << ", degraded blocks: " << status.at(U("degradedBlocks")).as_integer();

    uint64_t orphaned = status.at(U("totals")).at(U("orphanedBytes")).as_number().to_uint64();
    if (orphaned > 0)
        oss << ", orphaned: " << PrintUtils::formatNumBytes(orphaned);
    oss << "\n";
    return oss.str();
}

BlockTable& Coordinator::blockTable()
{
    return *table;
}

////////////////////////////////////////////
// Coordinator - private methods
////////////////////////////////////////////

/**
 * Thread function used to periodically mark silent nodes down.
 */
void Coordinator::livenessLoop()
{
    auto period = std::max(heartbeatInterval / 2, std::chrono::milliseconds(1));

    std::unique_lock<std::mutex> lock(stopMutex);
    while (!stopCondition.wait_for(lock, period, [this] { return stopRequested; }))
    {
        lock.unlock();
        checkLiveness();
        lock.lock();
    }
}

CapacityReport Coordinator::capacityReportLocked(uint64_t fileSize)
{
    CapacityReport report;
    report.fileSize = fileSize;
    report.blocksRequired = BlockCodec::blockCount(fileSize, blockSize);
    report.totalBytes = 0;
    report.freeBytes = 0;

    for (const auto &[nodeId, node] : nodes)
    {
        if (!node.isUp)
            continue;
        report.totalBytes += node.stats.dataBytesTotal;
        report.freeBytes += node.freeBytes();
    }

    report.usedBytes = report.totalBytes - report.freeBytes;
    report.accepted = fileSize <= report.freeBytes;
    return report;
}

void Coordinator::admitLocked(uint64_t fileSize)
{
    CapacityReport report = capacityReportLocked(fileSize);

    if (!report.accepted)
    {
        std::string hint = report.totalBytes == 0
            ? "no nodes are up; start node agents"
            : "free at least " + PrintUtils::formatNumBytes(fileSize - report.freeBytes) + " or add nodes";

        throw CapacityError(
            report.fileSize,
            report.blocksRequired,
            report.totalBytes,
            report.usedBytes,
            report.freeBytes,
            hint
        );
    }

    if (totalSharedCapacity > 0)
    {
        uint64_t stored = table->storedBytes() + pendingLogicalBytes;
        if (stored + fileSize > totalSharedCapacity)
        {
            throw CapacityError(
                fileSize,
                report.blocksRequired,
                totalSharedCapacity,
                stored,
                stored >= totalSharedCapacity ? 0 : totalSharedCapacity - stored,
                "shared capacity of " + PrintUtils::formatNumBytes(totalSharedCapacity)
                    + " reached; free space or raise totalSharedCapacity"
            );
        }
    }
}

std::vector<PlacementPair> Coordinator::planLocked(const std::vector<uint32_t> &blockSizes)
{
    // simulated free space of each `up` node
    std::map<int32_t, uint64_t> freeBytes;
    for (const auto &[nodeId, node] : nodes)
        if (node.isUp)
            freeBytes[nodeId] = node.freeBytes();

    auto fraction = [&](int32_t nodeId) {
        return static_cast<long double>(freeBytes[nodeId])
            / static_cast<long double>(nodes.at(nodeId).stats.dataBytesTotal);
    };

    /**
     * Largest free fraction with room for `size`; ties go to the lower
     * id (map order + strict comparison).
     */
    auto pick = [&](uint32_t size, int32_t exclude) {
        int32_t best = -1;
        for (const auto &[nodeId, free] : freeBytes)
        {
            if (nodeId == exclude || free < size)
                continue;
            if (best == -1 || fraction(nodeId) > fraction(best))
                best = nodeId;
        }
        return best;
    };

    std::vector<PlacementPair> plan;
    for (size_t i = 0; i < blockSizes.size(); i++)
    {
        uint32_t size = blockSizes[i];

        int32_t primary = pick(size, -1);
        if (primary != -1)
            freeBytes[primary] -= size;

        int32_t replica = primary == -1 ? -1 : pick(size, primary);
        if (replica == -1)
        {
            throw NoCapacityError("no two distinct live nodes have room for block " + std::to_string(i)
                + " (" + PrintUtils::formatNumBytes(size) + "); " + std::to_string(freeBytes.size())
                + " nodes up");
        }
        freeBytes[replica] -= size;

        plan.push_back({primary, replica});
    }
    return plan;
}

std::vector<PlacementPair> Coordinator::reserve(uint64_t fileSize, const std::vector<uint32_t> &blockSizes)
{
    std::unique_lock<std::shared_mutex> lock(nodesMutex);

    admitLocked(fileSize);
    std::vector<PlacementPair> plan = planLocked(blockSizes);

    for (size_t i = 0; i < plan.size(); i++)
    {
        nodes.at(plan[i].primary).stats.dataBytesReserved += blockSizes[i];
        nodes.at(plan[i].replica).stats.dataBytesReserved += blockSizes[i];
    }
    pendingLogicalBytes += fileSize;

    return plan;
}

void Coordinator::releaseReservation(int32_t nodeId, uint64_t numBytes)
{
    std::unique_lock<std::shared_mutex> lock(nodesMutex);
    ClusterNodeStats &stats = nodes.at(nodeId).stats;
    stats.dataBytesReserved -= std::min(stats.dataBytesReserved, numBytes);
}

void Coordinator::pushBlock(int32_t nodeId, const Payloads::StoreBlockRequest &request)
{
    std::string address = addressOf(nodeId);

    for (int attempt = 1; ; attempt++)
    {
        try
        {
            Payloads::StoreBlockResult result = NodeApi::storeBlock(transport, address, request);
            if (!result.stored)
                throw IOError("node " + std::to_string(nodeId) + " did not store block " + std::to_string(request.blockId));

            // node's usage after the write replaces the reservation
            std::unique_lock<std::shared_mutex> lock(nodesMutex);
            ClusterNodeStats &stats = nodes.at(nodeId).stats;
            stats.dataBytesUsed = result.sizeInfo.dataUsedSize;
            stats.dataBytesReserved -= std::min<uint64_t>(stats.dataBytesReserved, request.data.size());
            return;
        }
        catch (const BlockPoolError &e)
        {
            if (attempt >= 2)
                throw;
            log.warn("push of block " + std::to_string(request.blockId) + " to node "
                + std::to_string(nodeId) + " failed (" + e.what() + "); retrying");
        }
    }
}

uint64_t Coordinator::allocateInflightBlockId()
{
    std::unique_lock<std::shared_mutex> lock(nodesMutex);
    uint64_t blockId = table->allocateBlockId();
    inflightBlockIds.insert(blockId);
    return blockId;
}

void Coordinator::clearInflight(const std::vector<uint64_t> &blockIds)
{
    std::unique_lock<std::shared_mutex> lock(nodesMutex);
    for (uint64_t blockId : blockIds)
        inflightBlockIds.erase(blockId);
}

void Coordinator::rollbackCopies(const std::string &name, const std::vector<PushedCopy> &copies)
{
    uint32_t removed = 0;
    uint64_t orphaned = 0;

    for (const auto &copy : copies)
    {
        try
        {
            Payloads::DeleteBlockResult result = NodeApi::deleteBlock(transport, addressOf(copy.nodeId), copy.blockId);
            if (result.removed)
                removed++;

            std::unique_lock<std::shared_mutex> lock(nodesMutex);
            nodes.at(copy.nodeId).stats.dataBytesUsed = result.sizeInfo.dataUsedSize;
        }
        catch (const BlockPoolError &e)
        {
            if (!copy.confirmed)
                continue;

            log.warn("couldn't delete block " + std::to_string(copy.blockId) + " of '" + name
                + "' from node " + std::to_string(copy.nodeId) + ": " + e.what());

            std::unique_lock<std::shared_mutex> lock(nodesMutex);
            nodes.at(copy.nodeId).stats.dataBytesOrphaned += copy.size;
            orphaned += copy.size;
        }
    }

    log.info("rolled back '" + name + "': " + std::to_string(removed) + " copies deleted"
        + (orphaned > 0 ? ", " + PrintUtils::formatNumBytes(orphaned) + " left orphaned" : ""));
}

std::vector<unsigned char> Coordinator::fetchBlock(const FileEntry &entry, const BlockPlacement &placement)
{
    std::vector<int32_t> sources = {placement.primary};
    if (!placement.degraded())
        sources.push_back(placement.replica);

    std::string reasons;
    for (int32_t nodeId : sources)
    {
        if (!reasons.empty())
            reasons += "; ";

        if (!isUp(nodeId))
        {
            reasons += "node " + std::to_string(nodeId) + " is down";
            continue;
        }

        try
        {
            Payloads::BlockData block = NodeApi::getBlock(transport, addressOf(nodeId), placement.blockId);
            if (block.data.size() == placement.size && BlockCodec::verify(placement.hash, block.data))
                return block.data;

            reasons += "node " + std::to_string(nodeId) + " returned a corrupt copy";
        }
        catch (const BlockPoolError &e)
        {
            reasons += "node " + std::to_string(nodeId) + ": " + e.what();
        }

        log.warn("block " + std::to_string(placement.index) + " of '" + entry.name + "': " + reasons);
    }

    throw BlockUnavailableError(entry.name, placement.index, reasons);
}

/**
 * Calculates and displays the distribution of the given file's blocks
 * across the nodes.
 */
void Coordinator::logBlockDistribution(const FileEntry &entry)
{
    std::map<int32_t, uint32_t> nodeBlockCounts;
    uint32_t totalCopies = 0;

    for (const auto &block : entry.blocks)
    {
        nodeBlockCounts[block.primary]++;
        totalCopies++;
        if (!block.degraded())
        {
            nodeBlockCounts[block.replica]++;
            totalCopies++;
        }
    }

    std::ostringstream oss;
    oss << "'" << entry.name << "': " << entry.blocks.size() << " blocks, "
        << totalCopies << " copies; distribution {";
    bool first = true;
    for (const auto &[nodeId, blockCount] : nodeBlockCounts)
    {
        oss << (first ? "" : ", ") << nodeId << ": " << blockCount;
        first = false;
    }
    oss << "}";

    log.info(oss.str());
}

std::string Coordinator::addressOf(int32_t nodeId)
{
    std::shared_lock<std::shared_mutex> lock(nodesMutex);
    auto it = nodes.find(nodeId);
    if (it == nodes.end())
        throw NotFoundError("no node " + std::to_string(nodeId));
    return it->second.address;
}

/**
 * HEARTBEAT /heartbeat
 */
Response Coordinator::handleHeartbeat(const Request &request)
{
    Payloads::Heartbeat heartbeat = Payloads::Heartbeat::deserialize(request.body);
    log.debug("heartbeat from node " + std::to_string(heartbeat.nodeId));

    recordHeartbeat(heartbeat);

    std::vector<unsigned char> payload;
    Payloads::Flag(true).serialize(payload);
    return Response::success(payload);
}

/**
 * UPLOAD_FILE /files/{name}
 * ---
 * Body is the raw file; replies with the stored file's info.
 */
Response Coordinator::handleUploadFile(const Request &request)
{
    FileEntry entry = uploadFile(request.param, request.body);
    return Response::success(entry.toJson(true));
}

/**
 * DOWNLOAD_FILE /files/{name}
 * ---
 * Replies with the raw, verified file.
 */
Response Coordinator::handleDownloadFile(const Request &request)
{
    return Response::success(downloadFile(request.param));
}

/**
 * LIST_FILES /files
 */
Response Coordinator::handleListFiles()
{
    std::vector<FileEntry> files = listFiles();

    json::value list = json::value::array(files.size());
    for (size_t i = 0; i < files.size(); i++)
        list[i] = files[i].toJson(false);
    return Response::success(list);
}

/**
 * FILE_INFO /info/{name}
 */
Response Coordinator::handleFileInfo(const Request &request)
{
    return Response::success(fileInfo(request.param).toJson(true));
}

/**
 * CAN_ACCEPT /capacity/{size}
 */
Response Coordinator::handleCanAccept(const Request &request)
{
    uint64_t fileSize;
    try
    {
        size_t consumed = 0;
        fileSize = std::stoull(request.param, &consumed);
        if (consumed != request.param.size())
            throw ProtocolError("bad file size: " + request.param);
    }
    catch (const std::logic_error &)
    {
        throw ProtocolError("bad file size: " + request.param);
    }

    canAccept(fileSize);
    return Response::success(capacityReport(fileSize).toJson());
}

/**
 * CLUSTER_STATUS /stats
 * ---
 * Node table as JSON, plus the same rendered as a text table.
 */
Response Coordinator::handleClusterStatus()
{
    json::value status = clusterStatus();
    status[U("table")] = json::value::string(clusterStatusTable());
    return Response::success(status);
}

////////////////////////////////////////////
// Coordinator tests
////////////////////////////////////////////
namespace CoordinatorTests
{
    const std::string TEST_DIR = (fs::temp_directory_path() / "blockpool_coord_test").string();
    const uint64_t MiB = 1u << 20;

    /**
     * A coordinator plus one node agent per configured node, all wired
     * through a LoopbackTransport. Node 1 is the coordinator's own
     * machine; its agent is embedded in the coordinator.
     */
    class TestCluster
    {
    public:
        LoopbackTransport transport;
        json::value configJson;
        std::unique_ptr<CoordinatorConfig> config;
        std::map<int32_t, std::unique_ptr<NodeAgent>> agents;
        std::unique_ptr<Coordinator> coordinator;

        TestCluster(int numNodes, uint64_t capacity, uint32_t blockSize, uint64_t sharedCapacity = 0)
        {
            FileSystemUtils::removeDirectory(TEST_DIR);

            configJson = ConfigTests::sampleConfig(capacity, blockSize, numNodes);
            configJson[U("storage")][U("totalSharedCapacity")] = json::value::number(sharedCapacity);

            json::value coordinatorSection = json::value::object();
            coordinatorSection[U("metadataDir")] = json::value::string((fs::path(TEST_DIR) / "metadata").string());
            configJson[U("coordinator")] = coordinatorSection;

            json::value nodeSection = json::value::object();
            nodeSection[U("storeDirPath")] = json::value::string((fs::path(TEST_DIR) / "nodes").string());
            nodeSection[U("removeExistingStore")] = json::value::boolean(true);
            configJson[U("node")] = nodeSection;

            config = std::make_unique<CoordinatorConfig>(configJson);

            for (const auto &info : config->nodes)
            {
                agents[info.id] = std::make_unique<NodeAgent>(NodeConfig(configJson, info.id), transport);
                if (!info.isCoordinator)
                    transport.bind(info.endpoint(), agents[info.id].get());
            }

            startCoordinator();
        }

        ~TestCluster()
        {
            coordinator.reset();
            agents.clear();
            FileSystemUtils::removeDirectory(TEST_DIR);
        }

        /* Replaces the coordinator with a fresh one over the same metadata */
        void startCoordinator()
        {
            const NodeInfo &self = config->coordinatorNode();

            coordinator.reset();
            coordinator = std::make_unique<Coordinator>(*config, transport, agents[self.id].get());
            transport.bind(self.endpoint(), coordinator.get());
        }

        void heartbeatAll()
        {
            for (auto &[nodeId, agent] : agents)
                agent->sendHeartbeat();
        }

        std::string endpoint(int32_t nodeId)
        {
            return config->node(nodeId).endpoint();
        }

        int countCalls(MessageKind kind, const std::string &address = "")
        {
            int count = 0;
            for (const auto &call : transport.calls())
                if (call.kind == kind && (address.empty() || call.address == address))
                    count++;
            return count;
        }
    };

    void testCanAcceptReportsCapacity()
    {
        TestCluster cluster(2, 3 * MiB, MiB);

        // no heartbeats yet: nothing is `up`
        ASSERT_THROWS(cluster.coordinator->canAccept(1), CapacityError);

        cluster.heartbeatAll();

        CapacityReport report = cluster.coordinator->capacityReport(MiB + 1);
        ASSERT_THAT(report.accepted);
        ASSERT_THAT(report.blocksRequired == 2);
        ASSERT_THAT(report.totalBytes == 6 * MiB);
        ASSERT_THAT(report.freeBytes == 6 * MiB);
        ASSERT_THAT(report.usedBytes == 0);
        ASSERT_THAT(cluster.coordinator->canAccept(6 * MiB));

        bool caught = false;
        try
        {
            cluster.coordinator->canAccept(7 * MiB);
        }
        catch (const CapacityError &e)
        {
            caught = true;
            ASSERT_THAT(e.fileSize == 7 * MiB);
            ASSERT_THAT(e.blocksRequired == 7);
            ASSERT_THAT(e.totalBytes == 6 * MiB);
            ASSERT_THAT(e.freeBytes == 6 * MiB);
            ASSERT_THAT(!e.hint.empty());
        }
        ASSERT_THAT(caught);

        // the largest size still gets exact numbers
        const uint64_t maxSize = std::numeric_limits<uint64_t>::max();
        caught = false;
        try
        {
            cluster.coordinator->canAccept(maxSize);
        }
        catch (const CapacityError &e)
        {
            caught = true;
            ASSERT_THAT(e.fileSize == maxSize);
            ASSERT_THAT(e.blocksRequired == (maxSize >> 20) + 1);
        }
        ASSERT_THAT(caught);
    }

    void testSharedCapacityQuota()
    {
        TestCluster cluster(3, 3 * MiB, MiB, 2 * MiB);
        cluster.heartbeatAll();

        cluster.coordinator->uploadFile("a.bin", BlockUtils::generateRandomData(3 * MiB / 2));

        ASSERT_THAT(cluster.coordinator->canAccept(MiB / 2));
        ASSERT_THROWS(cluster.coordinator->canAccept(MiB), CapacityError);
        ASSERT_THROWS(cluster.coordinator->uploadFile("b.bin", BlockUtils::generateRandomData(MiB)), CapacityError);
        ASSERT_THAT(!cluster.coordinator->blockTable().findFile("b.bin"));
    }

    void testPlacementNeverOverflows()
    {
        TestCluster cluster(2, 3 * MiB, MiB);
        cluster.heartbeatAll();

        PlacementPair pair = cluster.coordinator->assign(MiB);
        ASSERT_THAT(pair.primary == 1);
        ASSERT_THAT(pair.replica == 2);

        cluster.coordinator->uploadFile("a.bin", BlockUtils::generateRandomData(2 * MiB));
        cluster.coordinator->uploadFile("b.bin", BlockUtils::generateRandomData(MiB));

        for (int32_t nodeId : {1, 2})
        {
            ClusterNode node = cluster.coordinator->nodeSnapshot(nodeId);
            ASSERT_THAT(node.stats.dataBytesUsed <= node.stats.dataBytesTotal);
            ASSERT_THAT(node.stats.dataBytesReserved == 0);
            ASSERT_THAT(cluster.agents[nodeId]->store().usage().dataUsedSize <= 3 * MiB);
        }

        ASSERT_THROWS(cluster.coordinator->assign(1), NoCapacityError);
    }

    void testFiveMiBOnTwoNodesRejectedBeforeTransfer()
    {
        TestCluster cluster(2, 3 * MiB, MiB);
        cluster.heartbeatAll();

        // aggregate free space (6 MiB) admits the file...
        ASSERT_THAT(cluster.coordinator->canAccept(5 * MiB));

        // ...but 5 blocks x 2 copies can't be placed on 2 nodes of 3 MiB
        cluster.transport.clearCalls();
        ASSERT_THROWS(
            cluster.coordinator->uploadFile("big.bin", BlockUtils::generateRandomData(5 * MiB)),
            NoCapacityError
        );

        ASSERT_THAT(cluster.countCalls(MessageKind::STORE_BLOCK) == 0);
        ASSERT_THAT(!cluster.coordinator->blockTable().findFile("big.bin"));
        ASSERT_THAT(cluster.coordinator->nodeSnapshot(1).stats.dataBytesReserved == 0);
        ASSERT_THAT(cluster.coordinator->nodeSnapshot(2).stats.dataBytesReserved == 0);
        ASSERT_THAT(cluster.coordinator->canAccept(5 * MiB));
    }

    void testThreeMiBOnTwoNodesFitsExactly()
    {
        TestCluster cluster(2, 3 * MiB, MiB);
        cluster.heartbeatAll();

        std::vector<unsigned char> data = BlockUtils::generateRandomData(3 * MiB);
        FileEntry entry = cluster.coordinator->uploadFile("exact.bin", data);

        ASSERT_THAT(entry.blocks.size() == 3);
        ASSERT_THAT(entry.degradedBlocks() == 0);
        ASSERT_THAT(cluster.coordinator->nodeSnapshot(1).stats.dataBytesUsed == 3 * MiB);
        ASSERT_THAT(cluster.coordinator->nodeSnapshot(2).stats.dataBytesUsed == 3 * MiB);
        ASSERT_THAT(cluster.coordinator->downloadFile("exact.bin") == data);
        ASSERT_THROWS(cluster.coordinator->canAccept(1), CapacityError);
    }

    void testThreeNodesDistinctPairs()
    {
        TestCluster cluster(3, 4 * MiB, MiB);
        cluster.heartbeatAll();

        FileEntry entry = cluster.coordinator->uploadFile("four.bin", BlockUtils::generateRandomData(4 * MiB));
        ASSERT_THAT(entry.blocks.size() == 4);

        std::vector<std::pair<int32_t, int32_t>> expected = {{1, 2}, {3, 1}, {2, 3}, {1, 2}};
        for (size_t i = 0; i < entry.blocks.size(); i++)
        {
            const BlockPlacement &placement = entry.blocks[i];
            ASSERT_THAT(placement.index == i);
            ASSERT_THAT(placement.primary != placement.replica);
            ASSERT_THAT(placement.primary == expected[i].first);
            ASSERT_THAT(placement.replica == expected[i].second);
        }

        // each node holds exactly the bytes placed on it
        std::map<int32_t, uint64_t> placedBytes;
        for (const auto &placement : entry.blocks)
        {
            placedBytes[placement.primary] += placement.size;
            placedBytes[placement.replica] += placement.size;
        }
        for (auto &[nodeId, agent] : cluster.agents)
            ASSERT_THAT(agent->store().usage().dataUsedSize == placedBytes[nodeId]);
    }

    void testUploadDownloadRoundTrip()
    {
        TestCluster cluster(2, MiB, 1024);
        cluster.heartbeatAll();

        std::vector<unsigned char> data = BlockUtils::generateRandomData(5000);
        FileEntry entry = cluster.coordinator->uploadFile("notes.txt", data);

        ASSERT_THAT(entry.size == 5000);
        ASSERT_THAT(entry.blocks.size() == 5);
        ASSERT_THAT(entry.blocks.back().size == 5000 - 4 * 1024);
        ASSERT_THAT(entry.hash == Crypto::sha256Hex(data));
        ASSERT_THAT(cluster.agents[1]->store().numBlocks() == 5);
        ASSERT_THAT(cluster.agents[2]->store().numBlocks() == 5);

        ASSERT_THAT(cluster.coordinator->downloadFile("notes.txt") == data);
        ASSERT_THAT(cluster.coordinator->listFiles().size() == 1);
        ASSERT_THAT(cluster.coordinator->fileInfo("notes.txt").fileId == entry.fileId);
        ASSERT_THROWS(cluster.coordinator->downloadFile("missing.txt"), NotFoundError);

        // an empty file is a file with no blocks
        std::vector<unsigned char> empty;
        FileEntry emptyEntry = cluster.coordinator->uploadFile("empty.txt", empty);
        ASSERT_THAT(emptyEntry.blocks.empty());
        ASSERT_THAT(cluster.coordinator->downloadFile("empty.txt").empty());
    }

    void testDownloadFallsBackToReplica()
    {
        TestCluster cluster(2, MiB, 1024);
        cluster.heartbeatAll();

        std::vector<unsigned char> data = BlockUtils::generateRandomData(4096);
        cluster.coordinator->uploadFile("doc.pdf", data);

        cluster.transport.setReachable(cluster.endpoint(1), false);
        cluster.transport.clearCalls();

        ASSERT_THAT(cluster.coordinator->downloadFile("doc.pdf") == data);
        ASSERT_THAT(cluster.countCalls(MessageKind::GET_BLOCK, cluster.endpoint(1)) > 0);
        ASSERT_THAT(cluster.countCalls(MessageKind::GET_BLOCK, cluster.endpoint(2)) == 4);
    }

    void testDownloadFailsWhenBothCopiesUnreachable()
    {
        TestCluster cluster(2, MiB, 1024);
        cluster.heartbeatAll();

        cluster.coordinator->uploadFile("doc.pdf", BlockUtils::generateRandomData(4096));

        cluster.transport.setReachable(cluster.endpoint(1), false);
        cluster.transport.setReachable(cluster.endpoint(2), false);
        cluster.transport.clearCalls();

        bool caught = false;
        try
        {
            cluster.coordinator->downloadFile("doc.pdf");
        }
        catch (const BlockUnavailableError &e)
        {
            caught = true;
            ASSERT_THAT(e.fileName == "doc.pdf");
            ASSERT_THAT(e.blockIndex == 0);
        }
        ASSERT_THAT(caught);

        // later blocks are never requested
        ASSERT_THAT(cluster.countCalls(MessageKind::GET_BLOCK) == 2);
    }

    void testReplicaFailureDegrades()
    {
        TestCluster cluster(2, MiB, 1024);
        cluster.heartbeatAll();
        cluster.transport.setReachable(cluster.endpoint(2), false);

        std::vector<unsigned char> data = BlockUtils::generateRandomData(1000);
        FileEntry entry = cluster.coordinator->uploadFile("one.bin", data);

        ASSERT_THAT(entry.blocks.size() == 1);
        ASSERT_THAT(entry.blocks[0].primary == 1);
        ASSERT_THAT(entry.blocks[0].replica == BlockPlacement::NO_REPLICA);
        ASSERT_THAT(entry.degradedBlocks() == 1);
        ASSERT_THAT(cluster.coordinator->blockTable().degradedBlockCount() == 1);
        ASSERT_THAT(cluster.coordinator->nodeSnapshot(2).stats.dataBytesReserved == 0);

        // one retry, then the replica is given up
        ASSERT_THAT(cluster.countCalls(MessageKind::STORE_BLOCK, cluster.endpoint(2)) == 2);
        ASSERT_THAT(cluster.coordinator->downloadFile("one.bin") == data);
    }

    void testPrimaryFailureAbortsUpload()
    {
        TestCluster cluster(2, MiB, 1024);
        cluster.heartbeatAll();
        cluster.transport.setReachable(cluster.endpoint(1), false);

        std::vector<unsigned char> data = BlockUtils::generateRandomData(3000);
        ASSERT_THROWS(cluster.coordinator->uploadFile("fail.bin", data), NodeUnreachableError);

        ASSERT_THAT(cluster.countCalls(MessageKind::STORE_BLOCK, cluster.endpoint(1)) == 2);
        ASSERT_THAT(!cluster.coordinator->blockTable().findFile("fail.bin"));
        ASSERT_THAT(cluster.coordinator->listFiles().empty());
        ASSERT_THAT(cluster.coordinator->nodeSnapshot(1).stats.dataBytesReserved == 0);
        ASSERT_THAT(cluster.coordinator->nodeSnapshot(2).stats.dataBytesReserved == 0);

        // the name is free again once the node is back
        cluster.transport.setReachable(cluster.endpoint(1), true);
        cluster.coordinator->uploadFile("fail.bin", data);
        ASSERT_THAT(cluster.coordinator->downloadFile("fail.bin") == data);
    }

    /**
     * Forwards to a node agent, but fails every STORE_BLOCK once
     * `storesBeforeFailing` stores went through; optionally fails deletes.
     */
    class FlakyNode : public RequestHandler
    {
    public:
        FlakyNode(RequestHandler &agent, int storesBeforeFailing)
            : agent(agent),
              storesLeft(storesBeforeFailing)
        {
        }

        bool failDeletes = false;

        Response handle(const Request &request) override
        {
            if (request.kind == MessageKind::STORE_BLOCK && storesLeft-- <= 0)
                throw IOError("write failed: device full");
            if (request.kind == MessageKind::DELETE_BLOCK && failDeletes)
                throw IOError("delete failed: read-only filesystem");
            return agent.handle(request);
        }

    private:
        RequestHandler &agent;
        int storesLeft;
    };

    void testAbortedUploadRemovesPushedBlocks()
    {
        // placements: {1, 2}, {3, 1}, {2, 3}, ...
        TestCluster cluster(3, MiB, 1024);
        cluster.heartbeatAll();

        FlakyNode flaky(*cluster.agents[2], 1);
        cluster.transport.bind(cluster.endpoint(2), &flaky);

        std::vector<unsigned char> data = BlockUtils::generateRandomData(4096);
        ASSERT_THROWS(cluster.coordinator->uploadFile("half.bin", data), NodeUnreachableError);

        // blocks 0 and 1 had both copies stored before block 2's primary failed
        ASSERT_THAT(cluster.countCalls(MessageKind::DELETE_BLOCK) == 5);
        for (auto &[nodeId, agent] : cluster.agents)
        {
            ASSERT_THAT(agent->store().numBlocks() == 0);
            ClusterNode node = cluster.coordinator->nodeSnapshot(nodeId);
            ASSERT_THAT(node.stats.dataBytesUsed == 0);
            ASSERT_THAT(node.stats.dataBytesReserved == 0);
            ASSERT_THAT(node.stats.dataBytesOrphaned == 0);
        }
        ASSERT_THAT(!cluster.coordinator->blockTable().findFile("half.bin"));
        ASSERT_THAT(cluster.coordinator->reconcile().clean());
        ASSERT_THAT(cluster.coordinator->canAccept(3 * MiB));
    }

    void testUndeletableCopiesReportedOrphaned()
    {
        TestCluster cluster(3, MiB, 1024);
        cluster.heartbeatAll();

        FlakyNode flaky(*cluster.agents[2], 1);
        flaky.failDeletes = true;
        cluster.transport.bind(cluster.endpoint(2), &flaky);

        ASSERT_THROWS(
            cluster.coordinator->uploadFile("half.bin", BlockUtils::generateRandomData(4096)),
            NodeUnreachableError
        );

        // node 2 keeps the replica of block 0; the others were cleaned up
        ASSERT_THAT(cluster.agents[1]->store().numBlocks() == 0);
        ASSERT_THAT(cluster.agents[3]->store().numBlocks() == 0);
        std::vector<uint64_t> leftover = cluster.agents[2]->store().blockIds();
        ASSERT_THAT(leftover.size() == 1);

        ASSERT_THAT(cluster.coordinator->nodeSnapshot(2).stats.dataBytesOrphaned == 1024);
        ASSERT_THAT(cluster.coordinator->nodeSnapshot(1).stats.dataBytesOrphaned == 0);

        json::value status = cluster.coordinator->clusterStatus();
        ASSERT_THAT(status.at(U("nodes")).at(1).at(U("orphanedBytes")).as_integer() == 1024);
        ASSERT_THAT(status.at(U("totals")).at(U("orphanedBytes")).as_integer() == 1024);
        ASSERT_THAT(cluster.coordinator->clusterStatusTable().find("orphaned") != std::string::npos);

        ReconcileReport report = cluster.coordinator->reconcile();
        ASSERT_THAT(report.mismatchedNodes.size() == 1);
        ASSERT_THAT(report.mismatchedNodes[2].unexpectedBlocks == leftover);
        ASSERT_THAT(report.mismatchedNodes[2].missingBlocks.empty());
    }

    void testConcurrentUploadsShareCapacity()
    {
        // room for one 2 MiB file (2 blocks x 2 copies), not two
        TestCluster cluster(2, 3 * MiB, MiB);
        cluster.heartbeatAll();

        std::atomic<int> stored{0};
        std::atomic<int> rejected{0};
        std::atomic<int> otherFailures{0};

        auto upload = [&](const std::string &name) {
            try
            {
                cluster.coordinator->uploadFile(name, BlockUtils::generateRandomData(2 * MiB));
                stored++;
            }
            catch (const NoCapacityError &)
            {
                rejected++;
            }
            catch (const CapacityError &)
            {
                rejected++;
            }
            catch (const std::exception &)
            {
                otherFailures++;
            }
        };

        std::thread first(upload, "first.bin");
        std::thread second(upload, "second.bin");
        first.join();
        second.join();

        ASSERT_THAT(stored == 1);
        ASSERT_THAT(rejected == 1);
        ASSERT_THAT(otherFailures == 0);
        ASSERT_THAT(cluster.coordinator->listFiles().size() == 1);

        for (int32_t nodeId : {1, 2})
        {
            ClusterNode node = cluster.coordinator->nodeSnapshot(nodeId);
            ASSERT_THAT(node.stats.dataBytesReserved == 0);
            ASSERT_THAT(node.stats.dataBytesUsed == 2 * MiB);
            ASSERT_THAT(cluster.agents[nodeId]->store().usage().dataUsedSize == 2 * MiB);
        }
    }

    void testConcurrentUploadsStayConsistent()
    {
        TestCluster cluster(3, MiB, 1024);
        cluster.heartbeatAll();

        const int numThreads = 6;
        const int filesPerThread = 4;

        std::map<std::string, std::vector<unsigned char>> contents;
        for (int t = 0; t < numThreads; t++)
            for (int f = 0; f < filesPerThread; f++)
                contents["t" + std::to_string(t) + "_f" + std::to_string(f)] = BlockUtils::generateRandomData(2500 + t * 100 + f);

        std::atomic<int> failures{0};
        std::vector<std::thread> threads;
        for (int t = 0; t < numThreads; t++)
        {
            threads.emplace_back([&, t]() {
                for (int f = 0; f < filesPerThread; f++)
                {
                    std::string name = "t" + std::to_string(t) + "_f" + std::to_string(f);
                    try
                    {
                        cluster.coordinator->uploadFile(name, contents.at(name));
                        cluster.coordinator->downloadFile("t" + std::to_string(t) + "_f0");
                    }
                    catch (const std::exception &)
                    {
                        failures++;
                    }
                }
            });
        }
        for (auto &thread : threads)
            thread.join();

        ASSERT_THAT(failures == 0);
        ASSERT_THAT(cluster.coordinator->listFiles().size() == contents.size());

        // block ids are unique across all uploads
        std::set<uint64_t> blockIds;
        size_t numBlocks = 0;
        for (const auto &[name, data] : contents)
        {
            ASSERT_THAT(cluster.coordinator->downloadFile(name) == data);
            for (const auto &placement : cluster.coordinator->fileInfo(name).blocks)
            {
                blockIds.insert(placement.blockId);
                numBlocks++;
            }
        }
        ASSERT_THAT(blockIds.size() == numBlocks);

        // store replies may land out of order; the next heartbeat settles usage
        cluster.heartbeatAll();
        for (auto &[nodeId, agent] : cluster.agents)
        {
            ClusterNode node = cluster.coordinator->nodeSnapshot(nodeId);
            ASSERT_THAT(node.stats.dataBytesReserved == 0);
            ASSERT_THAT(node.stats.dataBytesUsed == agent->store().usage().dataUsedSize);
        }
        ASSERT_THAT(cluster.coordinator->reconcile().clean());
    }

    void testDuplicateUploadRejected()
    {
        TestCluster cluster(2, MiB, 1024);
        cluster.heartbeatAll();

        cluster.coordinator->uploadFile("same.txt", BlockUtils::generateRandomData(100));
        ASSERT_THROWS(
            cluster.coordinator->uploadFile("same.txt", BlockUtils::generateRandomData(100)),
            FileExistsError
        );
        ASSERT_THAT(cluster.coordinator->listFiles().size() == 1);
    }

    void testLivenessTimeout()
    {
        TestCluster cluster(2, MiB, 1024);
        Coordinator &coordinator = *cluster.coordinator;

        Payloads::SizeInfo sizeInfo(0, MiB);
        Coordinator::Clock::time_point t0 = Coordinator::Clock::now();

        coordinator.recordHeartbeat(Payloads::Heartbeat(2, sizeInfo, true), t0);
        ASSERT_THAT(coordinator.isUp(2));
        ASSERT_THAT(!coordinator.isUp(1));

        // interval 100 ms x threshold 2
        coordinator.checkLiveness(t0 + std::chrono::milliseconds(150));
        ASSERT_THAT(coordinator.isUp(2));

        coordinator.checkLiveness(t0 + std::chrono::milliseconds(201));
        ASSERT_THAT(!coordinator.isUp(2));

        coordinator.recordHeartbeat(Payloads::Heartbeat(2, sizeInfo, true), t0 + std::chrono::milliseconds(300));
        ASSERT_THAT(coordinator.isUp(2));

        ASSERT_THROWS(coordinator.recordHeartbeat(Payloads::Heartbeat(7, sizeInfo, true)), ProtocolError);
    }

    void testPingNodeMarksUp()
    {
        TestCluster cluster(2, MiB, 1024);

        ASSERT_THAT(!cluster.coordinator->isUp(2));
        ASSERT_THAT(cluster.coordinator->pingNode(2));
        ASSERT_THAT(cluster.coordinator->isUp(2));
        ASSERT_THAT(cluster.coordinator->nodeSnapshot(2).heardFrom);

        cluster.transport.setReachable(cluster.endpoint(2), false);
        ASSERT_THAT(!cluster.coordinator->pingNode(2));
    }

    void testLivenessThreadMarksSilentNodesDown()
    {
        TestCluster cluster(2, MiB, 1024);

        // node 2 heartbeats every 100 ms on its own thread; node 1 only once
        cluster.agents[1]->sendHeartbeat();
        cluster.agents[2]->start();
        ASSERT_THAT(cluster.coordinator->isUp(1));
        ASSERT_THAT(cluster.coordinator->isUp(2));

        cluster.coordinator->start();
        std::this_thread::sleep_for(std::chrono::milliseconds(500));

        ASSERT_THAT(!cluster.coordinator->isUp(1));
        ASSERT_THAT(cluster.coordinator->isUp(2));

        // a late heartbeat brings node 1 back while the thread runs
        cluster.agents[1]->sendHeartbeat();
        ASSERT_THAT(cluster.coordinator->isUp(1));

        cluster.agents[2]->stop();
        std::this_thread::sleep_for(std::chrono::milliseconds(500));
        ASSERT_THAT(!cluster.coordinator->isUp(2));

        auto stopStart = std::chrono::steady_clock::now();
        cluster.coordinator->stop();
        ASSERT_THAT(std::chrono::steady_clock::now() - stopStart < std::chrono::milliseconds(200));
    }

    void testBlockTableSurvivesRestart()
    {
        TestCluster cluster(2, MiB, 1024);
        cluster.heartbeatAll();

        std::vector<unsigned char> data = BlockUtils::generateRandomData(2500);
        cluster.coordinator->uploadFile("keep.bin", data);

        cluster.startCoordinator();
        cluster.heartbeatAll();

        ASSERT_THAT(cluster.coordinator->listFiles().size() == 1);
        ASSERT_THAT(cluster.coordinator->fileInfo("keep.bin").blocks.size() == 3);
        ASSERT_THAT(cluster.coordinator->downloadFile("keep.bin") == data);
        ASSERT_THROWS(cluster.coordinator->uploadFile("keep.bin", data), FileExistsError);

        // block ids keep growing across restarts
        FileEntry second = cluster.coordinator->uploadFile("next.bin", BlockUtils::generateRandomData(10));
        ASSERT_THAT(second.blocks[0].blockId > cluster.coordinator->fileInfo("keep.bin").blocks.back().blockId);
    }

    void testReconcileReportsMismatch()
    {
        TestCluster cluster(2, MiB, 1024);
        cluster.heartbeatAll();

        cluster.coordinator->uploadFile("r.bin", BlockUtils::generateRandomData(2048));
        ReconcileReport report = cluster.coordinator->reconcile();
        ASSERT_THAT(report.clean());

        // a block the table doesn't know about
        uint64_t strayId = cluster.coordinator->blockTable().allocateBlockId();
        cluster.agents[2]->store().put(strayId, BlockUtils::generateRandomData(10));
        report = cluster.coordinator->reconcile();
        ASSERT_THAT(!report.clean());
        ASSERT_THAT(report.mismatchedNodes.count(2) == 1);
        ASSERT_THAT(report.mismatchedNodes[2].unexpectedBlocks == std::vector<uint64_t>({strayId}));
        ASSERT_THAT(report.mismatchedNodes[2].missingBlocks.empty());
        ASSERT_THAT(report.mismatchedNodes.count(1) == 0);

        json::value reportJson = report.toJson();
        ASSERT_THAT(reportJson.at(U("mismatchedNodes")).at(0).at(U("unexpectedBlocks")).at(0).as_number().to_uint64() == strayId);

        cluster.transport.setReachable(cluster.endpoint(2), false);
        report = cluster.coordinator->reconcile();
        ASSERT_THAT(report.unreachableNodes.size() == 1);
        ASSERT_THAT(report.unreachableNodes[0] == 2);
    }

    void testReconcileSeesSwappedBlocks()
    {
        TestCluster cluster(2, MiB, 1024);
        cluster.heartbeatAll();

        FileEntry entry = cluster.coordinator->uploadFile("swap.bin", BlockUtils::generateRandomData(3072));
        uint64_t lostId = entry.blocks[1].blockId;

        // node 2 loses one block and gains a stray one: same count, different ids
        uint64_t strayId = cluster.coordinator->blockTable().allocateBlockId();
        ASSERT_THAT(cluster.agents[2]->store().remove(lostId));
        cluster.agents[2]->store().put(strayId, BlockUtils::generateRandomData(1024));
        ASSERT_THAT(cluster.agents[2]->store().numBlocks() == 3);

        ReconcileReport report = cluster.coordinator->reconcile();
        ASSERT_THAT(!report.clean());
        ASSERT_THAT(report.mismatchedNodes.size() == 1);
        ASSERT_THAT(report.mismatchedNodes[2].missingBlocks == std::vector<uint64_t>({lostId}));
        ASSERT_THAT(report.mismatchedNodes[2].unexpectedBlocks == std::vector<uint64_t>({strayId}));

        // ids handed out after the check started aren't judged
        cluster.agents[1]->store().put(strayId + 1000, BlockUtils::generateRandomData(10));
        report = cluster.coordinator->reconcile();
        ASSERT_THAT(report.mismatchedNodes.count(1) == 0);
    }

    void testClusterStatusViews()
    {
        TestCluster cluster(2, MiB, 1024);
        cluster.heartbeatAll();
        cluster.coordinator->uploadFile("s.bin", BlockUtils::generateRandomData(3000));

        json::value status = cluster.coordinator->clusterStatus();
        ASSERT_THAT(status.at(U("nodes")).as_array().size() == 2);
        ASSERT_THAT(status.at(U("files")).as_integer() == 1);
        ASSERT_THAT(status.at(U("storedBytes")).as_integer() == 3000);
        ASSERT_THAT(status.at(U("nodes")).at(0).at(U("blocksStored")).as_integer() == 3);
        ASSERT_THAT(status.at(U("nodes")).at(0).at(U("up")).as_bool());

        std::string table = cluster.coordinator->clusterStatusTable();
        ASSERT_THAT(table.find("node") != std::string::npos);
        ASSERT_THAT(table.find("up") != std::string::npos);

        // the same views, through the transport
        std::string address = cluster.endpoint(1);
        Response response = cluster.transport.call(address, Request(MessageKind::CLUSTER_STATUS));
        ASSERT_THAT(response.ok);
        ASSERT_THAT(response.bodyAsJson().has_field(U("table")));

        response = cluster.transport.call(address, Request(MessageKind::LIST_FILES));
        ASSERT_THAT(response.bodyAsJson().as_array().size() == 1);

        response = cluster.transport.call(address, Request(MessageKind::CAN_ACCEPT, "12abc"));
        ASSERT_THAT(!response.ok);
        ASSERT_THAT(response.errorCode == ErrorCode::PROTOCOL_ERROR);

        response = cluster.transport.call(address, Request(MessageKind::CAN_ACCEPT, "10000000"));
        ASSERT_THAT(response.errorCode == ErrorCode::CAPACITY_ERROR);
    }

    void runAll()
    {
        TestUtils::printSuiteHeader("Coordinator Tests");

        std::vector<std::pair<std::string, std::function<void()>>> tests = {
            TEST(testCanAcceptReportsCapacity),
            TEST(testSharedCapacityQuota),
            TEST(testPlacementNeverOverflows),
            TEST(testFiveMiBOnTwoNodesRejectedBeforeTransfer),
            TEST(testThreeMiBOnTwoNodesFitsExactly),
            TEST(testThreeNodesDistinctPairs),
            TEST(testUploadDownloadRoundTrip),
            TEST(testDownloadFallsBackToReplica),
            TEST(testDownloadFailsWhenBothCopiesUnreachable),
            TEST(testReplicaFailureDegrades),
            TEST(testPrimaryFailureAbortsUpload),
            TEST(testAbortedUploadRemovesPushedBlocks),
            TEST(testUndeletableCopiesReportedOrphaned),
            TEST(testConcurrentUploadsShareCapacity),
            TEST(testConcurrentUploadsStayConsistent),
            TEST(testDuplicateUploadRejected),
            TEST(testLivenessTimeout),
            TEST(testPingNodeMarksUp),
            TEST(testLivenessThreadMarksSilentNodesDown),
            TEST(testBlockTableSurvivesRestart),
            TEST(testReconcileReportsMismatch),
            TEST(testReconcileSeesSwappedBlocks),
            TEST(testClusterStatusViews)
        };

        for (auto &[name, func] : tests)
            TestUtils::runTest(name, func);
    }
}
