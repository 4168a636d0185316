#pragma once

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "block_store.hpp"
#include "logger.hpp"
#include "node_config.hpp"
#include "transport.hpp"

/**
 * Lifecycle of a node agent:
 * 
 *      STARTING -> REGISTERING -> SERVING <-> DISCONNECTED -> STOPPED
 */
enum class AgentState
{
    STARTING,
    REGISTERING,
    SERVING,
    DISCONNECTED,
    STOPPED
};

/**
 * Runs on every participating machine.
 * 
 * Owns the machine's BlockStore, answers PING, block store/fetch/delete,
 * GET_STATUS and LIST_BLOCKS, and pushes a HEARTBEAT to the coordinator every
 * heartbeat interval.
 */
class NodeAgent : public RequestHandler
{
public:
    NodeAgent(const NodeConfig &config, Transport &transport);
    ~NodeAgent();

    NodeAgent(const NodeAgent&) = delete;
    NodeAgent& operator=(const NodeAgent&) = delete;

    /**
     * Announces the node to the coordinator, retrying with exponential
     * backoff, then starts the heartbeat thread.
     * 
     * NOTE: if every attempt fails the agent serves anyway, in the
     *       DISCONNECTED state.
     */
    void start();

    /* Ends the heartbeat loop; the agent moves to STOPPED */
    void stop();

    Response handle(const Request &request) override;

    /**
     * Sends a single heartbeat, moving between SERVING and DISCONNECTED
     * on success / failure. Returns true if acknowledged.
     */
    bool sendHeartbeat();

    AgentState state() const;
    int32_t id() const;
    BlockStore& store();

    static std::string stateName(AgentState state);

private:
    int32_t nodeId;
    std::string coordinatorAddress;

    uint32_t heartbeatIntervalMs;
    uint32_t registerRetries;
    uint32_t registerBackoffMs;

    std::unique_ptr<BlockStore> blockStore;
    Transport &transport;

    std::atomic<AgentState> currentState;

    std::thread heartbeatThread;
    std::mutex stopMutex;
    std::condition_variable stopCondition;
    bool stopRequested;

    ComponentLogger log;

    /* Returns false if stop() was called while waiting */
    bool waitFor(uint32_t ms);

    void heartbeatLoop();
    void setState(AgentState state);

    Response handlePing();
    Response handleStoreBlock(const Request &request);
    Response handleGetBlock(const Request &request);
    Response handleGetStatus();
    Response handleDeleteBlock(const Request &request);
    Response handleListBlocks();
};

////////////////////////////////////////////
// NodeAgent tests
////////////////////////////////////////////
namespace NodeAgentTests
{
    void testServesStoreAndGet();
    void testStoreRejectsCorruptedPayload();
    void testStatusReportsUsage();
    void testDeleteAndListBlocks();
    void testRegistersWithCoordinator();
    void testDisconnectedUntilCoordinatorReachable();
    void runAll();
}
