#pragma once

#include <cpprest/json.h>
#include <cstdint>
#include <string>
#include <vector>

#include "logger.hpp"

using namespace web;

/**
 * One entry of the `nodes` array in config.json.
 */
struct NodeInfo
{
    int32_t id;
    std::string address;
    uint16_t port;
    uint64_t capacityBytes;
    bool isCoordinator;

    /* Base uri used to reach the node, e.g. "http://127.0.0.1:9002" */
    std::string endpoint() const;
};

/**
 * Represents our config as given by 'config.json'.
 * 
 * The cluster section (nodes, storage, network) is shared by every
 * process role and is parsed and validated here; role-specific
 * sections are parsed by the derived classes.
 */
class Config 
{
protected:
    /* Path to our config.json file (empty if built from a JSON value) */
    std::string configFilePath;

    /* JSON object we read our config.json file into */
    json::value jsonConfig;

    /**
     * Load config file into a `jsonConfig` (i.e. a useable JSON object).
     * 
     * Throws:
     *      ConfigError - if the file can't be read or isn't valid JSON
     */
    void loadConfigFile();

    /**
     * Load and validate the shared cluster variables. Derived classes
     * call this first from their loadVariables().
     * 
     * Throws:
     *      ConfigError - on a missing/mistyped field or a failed check
     */
    void loadClusterVariables();

public:
    /**
     * Load all variables from `jsonConfig` into member
     * variables of the current class.
     * 
     * NOTE:
     * 
     * As derived classes of Config, CoordinatorConfig, NodeConfig and
     * ClientConfig implement their own loadVariables() functions that
     * are called in their respective constructors.
     */
    virtual void loadVariables() = 0;
    virtual ~Config() = default;

    /**
     * Param constructor
     */
    explicit Config(std::string configFilePath);

    /**
     * Builds a config from an already parsed JSON value.
     */
    explicit Config(json::value jsonConfig);

    /* Minimum log level */
    LogLevel logLevel;

    /* Every node in the cluster, in config order */
    std::vector<NodeInfo> nodes;

    /* Size of data (in bytes) each block stores */
    uint32_t blockSize;

    /* Logical cap on bytes stored across the cluster (0 = none) */
    uint64_t totalSharedCapacity;

    /* Number of replicas per block, in addition to the primary */
    uint32_t replicationFactor;

    uint32_t requestTimeoutMs;
    uint32_t heartbeatIntervalMs;

    /* Heartbeat intervals without a heartbeat before a node is marked down */
    uint32_t missedHeartbeatThreshold;

    /* Node registration retries and initial backoff (doubled per retry) */
    uint32_t registerRetries;
    uint32_t registerBackoffMs;

    /* The single node flagged `isCoordinator` */
    const NodeInfo& coordinatorNode() const;

    /**
     * Throws:
     *      ConfigError - if no node has the given id
     */
    const NodeInfo& node(int32_t id) const;
};

namespace ConfigTests
{
    /* Two-node cluster config used by tests across the codebase */
    json::value sampleConfig(uint64_t capacityBytes = 3u << 20, uint32_t blockSize = 1u << 20, int numNodes = 2);

    void testLoadsClusterSection();
    void testDefaultsApplied();
    void testValidationFailures();
    void testOutOfRangeValuesRejected();
    void testMissingFile();
    void runAll();
}
