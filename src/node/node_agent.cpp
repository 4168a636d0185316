#include <chrono>
#include <functional>

#include "node_agent.hpp"

#include "block.hpp"
#include "crypto.hpp"
#include "errors.hpp"
#include "node_api.hpp"
#include "payloads.hpp"
#include "test_utils.hpp"
#include "utils.hpp"

namespace
{
    uint64_t parseBlockId(const std::string &param)
    {
        try
        {
            size_t consumed = 0;
            uint64_t id = std::stoull(param, &consumed);
            if (consumed != param.size())
                throw ProtocolError("bad block id: " + param);
            return id;
        }
        catch (const std::logic_error &)
        {
            throw ProtocolError("bad block id: " + param);
        }
    }
}

////////////////////////////////////////////
// NodeAgent - public methods
////////////////////////////////////////////

NodeAgent::NodeAgent(const NodeConfig &config, Transport &transport)
    : nodeId(config.nodeId),
      coordinatorAddress(config.coordinatorNode().endpoint()),
      heartbeatIntervalMs(config.heartbeatIntervalMs),
      registerRetries(config.registerRetries),
      registerBackoffMs(config.registerBackoffMs),
      transport(transport),
      currentState(AgentState::STARTING),
      stopRequested(false),
      log("node-" + std::to_string(config.nodeId))
{
    blockStore = std::make_unique<BlockStore>(
        config.storeDirPath,
        config.nodeId,
        config.self().capacityBytes,
        config.removeExistingStore
    );
}

NodeAgent::~NodeAgent()
{
    stop();
}

void NodeAgent::start()
{
    setState(AgentState::REGISTERING);

    bool registered = false;
    uint32_t backoffMs = registerBackoffMs;

    for (uint32_t attempt = 0; attempt <= registerRetries; attempt++)
    {
        if (attempt > 0)
        {
            log.info("retrying registration in " + std::to_string(backoffMs) + " ms");
            if (!waitFor(backoffMs))
                return;
            backoffMs *= 2;
        }

        if (sendHeartbeat())
        {
            registered = true;
            break;
        }
    }

    if (!registered)
    {
        log.warn("coordinator " + coordinatorAddress + " unreachable; serving uncoordinated");
        setState(AgentState::DISCONNECTED);
    }

    heartbeatThread = std::thread(&NodeAgent::heartbeatLoop, this);
}

void NodeAgent::stop()
{
    {
        std::lock_guard<std::mutex> lock(stopMutex);
        stopRequested = true;
    }
    stopCondition.notify_all();

    if (heartbeatThread.joinable())
        heartbeatThread.join();

    if (currentState != AgentState::STOPPED)
        setState(AgentState::STOPPED);
}

Response NodeAgent::handle(const Request &request)
{
    switch (request.kind)
    {
        case MessageKind::PING:
            return handlePing();
        case MessageKind::STORE_BLOCK:
            return handleStoreBlock(request);
        case MessageKind::GET_BLOCK:
            return handleGetBlock(request);
        case MessageKind::GET_STATUS:
            return handleGetStatus();
        case MessageKind::DELETE_BLOCK:
            return handleDeleteBlock(request);
        case MessageKind::LIST_BLOCKS:
            return handleListBlocks();
        default:
            throw ProtocolError("node agent does not handle " + MessageKinds::toString(request.kind));
    }
}

bool NodeAgent::sendHeartbeat()
{
    Payloads::Heartbeat heartbeat(nodeId, blockStore->usage(), true);

    try
    {
        bool ack = NodeApi::sendHeartbeat(transport, coordinatorAddress, heartbeat);
        if (ack && currentState != AgentState::SERVING && currentState != AgentState::STOPPED)
            setState(AgentState::SERVING);
        return ack;
    }
    catch (const BlockPoolError &e)
    {
        if (currentState != AgentState::DISCONNECTED && currentState != AgentState::REGISTERING)
            log.warn(std::string("heartbeat failed: ") + e.what());
        if (currentState == AgentState::SERVING)
            setState(AgentState::DISCONNECTED);
        return false;
    }
}

AgentState NodeAgent::state() const
{
    return currentState;
}

int32_t NodeAgent::id() const
{
    return nodeId;
}

BlockStore& NodeAgent::store()
{
    return *blockStore;
}

std::string NodeAgent::stateName(AgentState state)
{
    switch (state)
    {
        case AgentState::STARTING:     return "starting";
        case AgentState::REGISTERING:  return "registering";
        case AgentState::SERVING:      return "serving";
        case AgentState::DISCONNECTED: return "disconnected";
        case AgentState::STOPPED:      return "stopped";
    }
    return "unknown";
}

////////////////////////////////////////////
// NodeAgent - private methods
////////////////////////////////////////////

bool NodeAgent::waitFor(uint32_t ms)
{
    std::unique_lock<std::mutex> lock(stopMutex);
    return !stopCondition.wait_for(lock, std::chrono::milliseconds(ms), [this] { return stopRequested; });
}

void NodeAgent::heartbeatLoop()
{
    while (waitFor(heartbeatIntervalMs))
        sendHeartbeat();
}

void NodeAgent::setState(AgentState state)
{
    AgentState previous = currentState.exchange(state);
    if (previous != state)
        log.info(stateName(previous) + " -> " + stateName(state));
}

/**
 * PING
 * ---
 * Liveness check.
 */
Response NodeAgent::handlePing()
{
    std::vector<unsigned char> payload;
    Payloads::Flag(true).serialize(payload);
    return Response::success(payload);
}

/**
 * STORE_BLOCK /block/{id}
 * ---
 * Verifies the payload against its hash and writes it to the store.
 */
Response NodeAgent::handleStoreBlock(const Request &request)
{
    Payloads::StoreBlockRequest storeRequest = Payloads::StoreBlockRequest::deserialize(request.body);

    if (!request.param.empty() && parseBlockId(request.param) != storeRequest.blockId)
        throw ProtocolError("block id in path does not match payload");

    if (!BlockCodec::verify(storeRequest.hash, storeRequest.data))
    {
        throw IntegrityError("payload of block " + std::to_string(storeRequest.blockId)
            + " does not match its hash");
    }

    blockStore->put(storeRequest.blockId, storeRequest.data);

    log.debug("stored block " + std::to_string(storeRequest.blockId)
        + " (file " + std::to_string(storeRequest.fileId)
        + ", index " + std::to_string(storeRequest.index)
        + ", " + std::to_string(storeRequest.data.size()) + " bytes)");

    std::vector<unsigned char> payload;
    Payloads::StoreBlockResult(true, blockStore->usage()).serialize(payload);
    return Response::success(payload);
}

/**
 * GET_BLOCK /block/{id}
 */
Response NodeAgent::handleGetBlock(const Request &request)
{
    uint64_t blockId = parseBlockId(request.param);

    StoredBlock block = blockStore->get(blockId);

    std::vector<unsigned char> payload;
    Payloads::BlockData(block.hash, std::move(block.data)).serialize(payload);
    return Response::success(payload);
}

/**
 * GET_STATUS /status
 */
Response NodeAgent::handleGetStatus()
{
    bool up = currentState == AgentState::SERVING || currentState == AgentState::DISCONNECTED;

    std::vector<unsigned char> payload;
    Payloads::NodeStatus(nodeId, blockStore->usage(), up, blockStore->numBlocks()).serialize(payload);
    return Response::success(payload);
}

/**
 * DELETE_BLOCK /block/{id}
 * ---
 * Deleting an absent block succeeds with removed = false.
 */
Response NodeAgent::handleDeleteBlock(const Request &request)
{
    uint64_t blockId = parseBlockId(request.param);

    bool removed = blockStore->remove(blockId);
    if (removed)
        log.debug("deleted block " + std::to_string(blockId));

    std::vector<unsigned char> payload;
    Payloads::DeleteBlockResult(removed, blockStore->usage()).serialize(payload);
    return Response::success(payload);
}

/**
 * LIST_BLOCKS /blocks
 */
Response NodeAgent::handleListBlocks()
{
    std::vector<unsigned char> payload;
    Payloads::BlockInventory(nodeId, blockStore->blockIds()).serialize(payload);
    return Response::success(payload);
}

////////////////////////////////////////////
// NodeAgent tests
////////////////////////////////////////////
namespace NodeAgentTests
{
    const std::string TEST_STORE_DIR = (fs::temp_directory_path() / "blockpool_agent_test").string();

    /* Acknowledges every heartbeat and remembers the last one */
    class FakeCoordinator : public RequestHandler
    {
    public:
        std::atomic<int> heartbeats{0};
        std::atomic<int32_t> lastNodeId{-1};
        std::atomic<uint64_t> lastUsed{0};

        Response handle(const Request &request) override
        {
            if (request.kind != MessageKind::HEARTBEAT)
                throw ProtocolError("unexpected");

            Payloads::Heartbeat heartbeat = Payloads::Heartbeat::deserialize(request.body);
            heartbeats++;
            lastNodeId = heartbeat.nodeId;
            lastUsed = heartbeat.sizeInfo.dataUsedSize;

            std::vector<unsigned char> payload;
            Payloads::Flag(true).serialize(payload);
            return Response::success(payload);
        }
    };

    NodeConfig testConfig(int32_t nodeId)
    {
        json::value value = ConfigTests::sampleConfig(1u << 20, 1024);
        json::value nodeSection = json::value::object();
        nodeSection[U("storeDirPath")] = json::value::string(U(TEST_STORE_DIR));
        nodeSection[U("removeExistingStore")] = json::value::boolean(true);
        value[U("node")] = nodeSection;
        return NodeConfig(value, nodeId);
    }

    void testServesStoreAndGet()
    {
        LoopbackTransport transport;
        NodeConfig config = testConfig(2);
        NodeAgent agent(config, transport);
        transport.bind(config.self().endpoint(), &agent);

        std::vector<unsigned char> data = BlockUtils::generateRandomData(700);
        Payloads::StoreBlockRequest request(5, 1, 0, Crypto::sha256Hex(data), data);

        Payloads::StoreBlockResult result = NodeApi::storeBlock(transport, config.self().endpoint(), request);
        ASSERT_THAT(result.stored);
        ASSERT_THAT(result.sizeInfo.dataUsedSize == 700);
        ASSERT_THAT(result.sizeInfo.dataTotalSize == (1u << 20));

        Payloads::BlockData block = NodeApi::getBlock(transport, config.self().endpoint(), 5);
        ASSERT_THAT(block.data == data);
        ASSERT_THAT(block.hash == Crypto::sha256Hex(data));

        ASSERT_THROWS(NodeApi::getBlock(transport, config.self().endpoint(), 6), NotFoundError);
        ASSERT_THAT(NodeApi::ping(transport, config.self().endpoint()));

        FileSystemUtils::removeDirectory(TEST_STORE_DIR);
    }

    void testStoreRejectsCorruptedPayload()
    {
        LoopbackTransport transport;
        NodeConfig config = testConfig(2);
        NodeAgent agent(config, transport);
        transport.bind(config.self().endpoint(), &agent);

        std::vector<unsigned char> data = BlockUtils::generateRandomData(100);
        std::string hash = Crypto::sha256Hex(data);
        data[10] ^= 0xff;

        Payloads::StoreBlockRequest request(5, 1, 0, hash, data);
        ASSERT_THROWS(NodeApi::storeBlock(transport, config.self().endpoint(), request), IntegrityError);
        ASSERT_THAT(!agent.store().contains(5));

        FileSystemUtils::removeDirectory(TEST_STORE_DIR);
    }

    void testStatusReportsUsage()
    {
        LoopbackTransport transport;
        NodeConfig config = testConfig(2);
        NodeAgent agent(config, transport);
        transport.bind(config.self().endpoint(), &agent);

        agent.store().put(1, BlockUtils::generateRandomData(10));
        agent.store().put(2, BlockUtils::generateRandomData(20));

        Payloads::NodeStatus status = NodeApi::getStatus(transport, config.self().endpoint());
        ASSERT_THAT(status.nodeId == 2);
        ASSERT_THAT(status.blocksStored == 2);
        ASSERT_THAT(status.sizeInfo.dataUsedSize == 30);

        FileSystemUtils::removeDirectory(TEST_STORE_DIR);
    }

    void testDeleteAndListBlocks()
    {
        LoopbackTransport transport;
        NodeConfig config = testConfig(2);
        NodeAgent agent(config, transport);
        std::string address = config.self().endpoint();
        transport.bind(address, &agent);

        agent.store().put(4, BlockUtils::generateRandomData(10));
        agent.store().put(9, BlockUtils::generateRandomData(20));

        Payloads::BlockInventory inventory = NodeApi::listBlocks(transport, address);
        ASSERT_THAT(inventory.nodeId == 2);
        ASSERT_THAT(inventory.blockIds == std::vector<uint64_t>({4, 9}));

        Payloads::DeleteBlockResult deleted = NodeApi::deleteBlock(transport, address, 4);
        ASSERT_THAT(deleted.removed);
        ASSERT_THAT(deleted.sizeInfo.dataUsedSize == 20);
        ASSERT_THAT(!agent.store().contains(4));

        // deleting again is harmless
        ASSERT_THAT(!NodeApi::deleteBlock(transport, address, 4).removed);
        ASSERT_THAT(NodeApi::listBlocks(transport, address).blockIds == std::vector<uint64_t>({9}));

        ASSERT_THROWS(
            transport.call(address, Request(MessageKind::DELETE_BLOCK, "nine")).throwIfError(),
            ProtocolError
        );

        FileSystemUtils::removeDirectory(TEST_STORE_DIR);
    }

    void testRegistersWithCoordinator()
    {
        LoopbackTransport transport;
        FakeCoordinator coordinator;
        NodeConfig config = testConfig(2);
        transport.bind(config.coordinatorNode().endpoint(), &coordinator);

        NodeAgent agent(config, transport);
        ASSERT_THAT(agent.state() == AgentState::STARTING);

        agent.start();
        ASSERT_THAT(agent.state() == AgentState::SERVING);
        ASSERT_THAT(coordinator.heartbeats >= 1);
        ASSERT_THAT(coordinator.lastNodeId == 2);

        agent.stop();
        ASSERT_THAT(agent.state() == AgentState::STOPPED);

        FileSystemUtils::removeDirectory(TEST_STORE_DIR);
    }

    void testDisconnectedUntilCoordinatorReachable()
    {
        LoopbackTransport transport;
        FakeCoordinator coordinator;
        NodeConfig config = testConfig(2);

        NodeAgent agent(config, transport);
        agent.start();
        ASSERT_THAT(agent.state() == AgentState::DISCONNECTED);

        transport.bind(config.coordinatorNode().endpoint(), &coordinator);
        ASSERT_THAT(agent.sendHeartbeat());
        ASSERT_THAT(agent.state() == AgentState::SERVING);

        transport.setReachable(config.coordinatorNode().endpoint(), false);
        ASSERT_THAT(!agent.sendHeartbeat());
        ASSERT_THAT(agent.state() == AgentState::DISCONNECTED);

        agent.stop();
        FileSystemUtils::removeDirectory(TEST_STORE_DIR);
    }

    void runAll()
    {
        TestUtils::printSuiteHeader("NodeAgent Tests");

        std::vector<std::pair<std::string, std::function<void()>>> tests = {
            TEST(testServesStoreAndGet),
            TEST(testStoreRejectsCorruptedPayload),
            TEST(testStatusReportsUsage),
            TEST(testDeleteAndListBlocks),
            TEST(testRegistersWithCoordinator),
            TEST(testDisconnectedUntilCoordinatorReachable)
        };

        for (auto &[name, func] : tests)
        {
            TestUtils::runTest(name, func);
        }
    }
}
