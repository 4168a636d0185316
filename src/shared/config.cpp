#include <cpprest/json.h>
#include <fstream>
#include <functional>
#include <iostream>
#include <limits>
#include <set>

#include "config.hpp"
#include "errors.hpp"
#include "test_utils.hpp"

using namespace web;

namespace
{
    json::value sectionOrEmpty(const json::value &root, const std::string &name)
    {
        if (root.has_field(U(name)))
            return root.at(U(name));
        return json::value::object();
    }

    /**
     * Reads a non-negative integer no larger than `max`.
     * 
     * Throws:
     *      ConfigError - if the value is negative, fractional or above `max`
     */
    uint64_t unsignedField(const json::value &value, const std::string &name, uint64_t max)
    {
        const json::number &number = value.as_number();
        if (!number.is_uint64() || number.to_uint64() > max)
        {
            throw ConfigError("'" + name + "' must be an integer in [0, " + std::to_string(max)
                + "], got " + value.serialize());
        }
        return number.to_uint64();
    }

    uint64_t numberOr(
        const json::value &section,
        const std::string &name,
        uint64_t fallback,
        uint64_t max = std::numeric_limits<uint32_t>::max()
    )
    {
        if (!section.has_field(U(name)))
            return fallback;
        return unsignedField(section.at(U(name)), name, max);
    }
}

std::string NodeInfo::endpoint() const
{
    return "http://" + address + ":" + std::to_string(port);
}

////////////////////////////////////////////
// Config methods
////////////////////////////////////////////

/**
 * Load config file into a `jsonConfig` (i.e. a useable JSON object).
 */
void Config::loadConfigFile() 
{
    std::ifstream fileStream(this->configFilePath);
    if (!fileStream.is_open()) {
        throw ConfigError("Unable to open configuration file: " + this->configFilePath);
    }

    std::string configContent((std::istreambuf_iterator<char>(fileStream)), std::istreambuf_iterator<char>());
    try
    {
        this->jsonConfig = web::json::value::parse(configContent);
    }
    catch (const json::json_exception &e)
    {
        throw ConfigError("Invalid JSON in " + this->configFilePath + ": " + e.what());
    }
}

void Config::loadClusterVariables()
{
    try
    {
        this->logLevel = Logger::parseLevel(
            jsonConfig.has_field(U("logLevel")) ? jsonConfig.at(U("logLevel")).as_string() : "INFO");

        /**
         * nodes
         */
        this->nodes.clear();
        for (const auto &entry : jsonConfig.at(U("nodes")).as_array())
        {
            NodeInfo info;
            info.id = static_cast<int32_t>(
                unsignedField(entry.at(U("id")), "id", std::numeric_limits<int32_t>::max()));
            info.address = entry.at(U("address")).as_string();
            info.port = static_cast<uint16_t>(
                unsignedField(entry.at(U("port")), "port", std::numeric_limits<uint16_t>::max()));
            info.capacityBytes = unsignedField(
                entry.at(U("capacityBytes")), "capacityBytes", std::numeric_limits<uint64_t>::max());
            info.isCoordinator = entry.has_field(U("isCoordinator")) && entry.at(U("isCoordinator")).as_bool();
            this->nodes.push_back(info);
        }

        /**
         * storage
         */
        json::value storage = sectionOrEmpty(jsonConfig, "storage");
        this->blockSize = numberOr(storage, "blockSize", 1u << 20);
        this->totalSharedCapacity = numberOr(storage, "totalSharedCapacity", 0, std::numeric_limits<uint64_t>::max());
        this->replicationFactor = numberOr(storage, "replicationFactor", 1);

        /**
         * network
         */
        json::value network = sectionOrEmpty(jsonConfig, "network");
        this->requestTimeoutMs = numberOr(network, "requestTimeoutMs", 5000);
        this->heartbeatIntervalMs = numberOr(network, "heartbeatIntervalMs", 10000);
        this->missedHeartbeatThreshold = numberOr(network, "missedHeartbeatThreshold", 2);
        this->registerRetries = numberOr(network, "registerRetries", 5);
        this->registerBackoffMs = numberOr(network, "registerBackoffMs", 500);
    }
    catch (const json::json_exception &e)
    {
        throw ConfigError(std::string("Invalid cluster config: ") + e.what());
    }

    /**
     * validation
     */
    if (nodes.size() < 2)
        throw ConfigError("at least two nodes are required (one primary and one replica per block)");

    std::set<int32_t> ids;
    int numCoordinators = 0;
    for (const auto &info : nodes)
    {
        if (!ids.insert(info.id).second)
            throw ConfigError("duplicate node id " + std::to_string(info.id));
        if (info.port == 0)
            throw ConfigError("node " + std::to_string(info.id) + " has port 0");
        if (info.capacityBytes == 0)
            throw ConfigError("node " + std::to_string(info.id) + " has zero capacity");
        if (info.isCoordinator)
            numCoordinators++;
    }
    if (numCoordinators != 1)
        throw ConfigError("exactly one node must be flagged isCoordinator");

    if (blockSize == 0)
        throw ConfigError("blockSize must be positive");
    if (replicationFactor != 1)
        throw ConfigError("replicationFactor must be 1 (one replica per block)");
    if (requestTimeoutMs == 0 || heartbeatIntervalMs == 0)
        throw ConfigError("requestTimeoutMs and heartbeatIntervalMs must be positive");
    if (missedHeartbeatThreshold < 1)
        throw ConfigError("missedHeartbeatThreshold must be at least 1");
}

const NodeInfo& Config::coordinatorNode() const
{
    for (const auto &info : nodes)
        if (info.isCoordinator)
            return info;
    throw ConfigError("no coordinator node configured");
}

const NodeInfo& Config::node(int32_t id) const
{
    for (const auto &info : nodes)
        if (info.id == id)
            return info;
    throw ConfigError("no node with id " + std::to_string(id));
}

/* Default constructor */
Config::Config(std::string configFilePath)
    : configFilePath(configFilePath)
{
    loadConfigFile();
}

Config::Config(json::value jsonConfig)
    : jsonConfig(std::move(jsonConfig))
{
}

////////////////////////////////////////////
// Config tests
////////////////////////////////////////////
namespace ConfigTests
{
    /* Config with only the shared cluster section */
    class ClusterOnlyConfig : public Config
    {
    public:
        explicit ClusterOnlyConfig(json::value value)
            : Config(std::move(value))
        {
            loadVariables();
        }

        void loadVariables() override
        {
            loadClusterVariables();
        }
    };

    json::value sampleConfig(uint64_t capacityBytes, uint32_t blockSize, int numNodes)
    {
        json::value root = json::value::object();
        root[U("logLevel")] = json::value::string(U("WARN"));

        json::value nodes = json::value::array(numNodes);
        for (int i = 0; i < numNodes; i++)
        {
            json::value n = json::value::object();
            n[U("id")] = json::value::number(i + 1);
            n[U("address")] = json::value::string(U("127.0.0.1"));
            n[U("port")] = json::value::number(19001 + i);
            n[U("capacityBytes")] = json::value::number(capacityBytes);
            n[U("isCoordinator")] = json::value::boolean(i == 0);
            nodes[i] = n;
        }
        root[U("nodes")] = nodes;

        json::value storage = json::value::object();
        storage[U("blockSize")] = json::value::number(blockSize);
        storage[U("totalSharedCapacity")] = json::value::number(0);
        storage[U("replicationFactor")] = json::value::number(1);
        root[U("storage")] = storage;

        json::value network = json::value::object();
        network[U("requestTimeoutMs")] = json::value::number(2000);
        network[U("heartbeatIntervalMs")] = json::value::number(100);
        network[U("missedHeartbeatThreshold")] = json::value::number(2);
        network[U("registerRetries")] = json::value::number(1);
        network[U("registerBackoffMs")] = json::value::number(10);
        root[U("network")] = network;

        return root;
    }

    void testLoadsClusterSection()
    {
        ClusterOnlyConfig config(sampleConfig(3u << 20, 1u << 20, 3));

        ASSERT_THAT(config.nodes.size() == 3);
        ASSERT_THAT(config.coordinatorNode().id == 1);
        ASSERT_THAT(config.node(3).port == 19003);
        ASSERT_THAT(config.node(2).capacityBytes == (3u << 20));
        ASSERT_THAT(config.node(2).endpoint() == "http://127.0.0.1:19002");
        ASSERT_THAT(config.blockSize == (1u << 20));
        ASSERT_THAT(config.heartbeatIntervalMs == 100);
        ASSERT_THAT(config.logLevel == LogLevel::WARN);
        ASSERT_THROWS(config.node(9), ConfigError);
    }

    void testDefaultsApplied()
    {
        json::value value = sampleConfig();
        value.erase(U("network"));
        value.erase(U("storage"));
        value.erase(U("logLevel"));

        ClusterOnlyConfig config(value);
        ASSERT_THAT(config.blockSize == (1u << 20));
        ASSERT_THAT(config.heartbeatIntervalMs == 10000);
        ASSERT_THAT(config.missedHeartbeatThreshold == 2);
        ASSERT_THAT(config.totalSharedCapacity == 0);
        ASSERT_THAT(config.logLevel == LogLevel::INFO);
    }

    void testValidationFailures()
    {
        ASSERT_THROWS(ClusterOnlyConfig(sampleConfig(3u << 20, 1u << 20, 1)), ConfigError);

        json::value duplicateIds = sampleConfig();
        duplicateIds[U("nodes")][1][U("id")] = json::value::number(1);
        ASSERT_THROWS(ClusterOnlyConfig{duplicateIds}, ConfigError);

        json::value twoCoordinators = sampleConfig();
        twoCoordinators[U("nodes")][1][U("isCoordinator")] = json::value::boolean(true);
        ASSERT_THROWS(ClusterOnlyConfig{twoCoordinators}, ConfigError);

        json::value zeroBlock = sampleConfig();
        zeroBlock[U("storage")][U("blockSize")] = json::value::number(0);
        ASSERT_THROWS(ClusterOnlyConfig{zeroBlock}, ConfigError);

        json::value threeCopies = sampleConfig();
        threeCopies[U("storage")][U("replicationFactor")] = json::value::number(2);
        ASSERT_THROWS(ClusterOnlyConfig{threeCopies}, ConfigError);

        json::value missingPort = sampleConfig();
        missingPort[U("nodes")][0].erase(U("port"));
        ASSERT_THROWS(ClusterOnlyConfig{missingPort}, ConfigError);
    }

    void testOutOfRangeValuesRejected()
    {
        // 2^32 + 1 would wrap to a block size of 1
        json::value hugeBlock = sampleConfig();
        hugeBlock[U("storage")][U("blockSize")] = json::value::number(static_cast<uint64_t>(4294967297ull));
        ASSERT_THROWS(ClusterOnlyConfig{hugeBlock}, ConfigError);

        json::value hugePort = sampleConfig();
        hugePort[U("nodes")][1][U("port")] = json::value::number(65536 + 9002);
        ASSERT_THROWS(ClusterOnlyConfig{hugePort}, ConfigError);

        json::value negativePort = sampleConfig();
        negativePort[U("nodes")][1][U("port")] = json::value::number(-1);
        ASSERT_THROWS(ClusterOnlyConfig{negativePort}, ConfigError);

        json::value negativeId = sampleConfig();
        negativeId[U("nodes")][1][U("id")] = json::value::number(-2);
        ASSERT_THROWS(ClusterOnlyConfig{negativeId}, ConfigError);

        json::value fractionalTimeout = sampleConfig();
        fractionalTimeout[U("network")][U("requestTimeoutMs")] = json::value::number(2.5);
        ASSERT_THROWS(ClusterOnlyConfig{fractionalTimeout}, ConfigError);

        json::value hugeInterval = sampleConfig();
        hugeInterval[U("network")][U("heartbeatIntervalMs")] = json::value::number(static_cast<uint64_t>(1ull << 33));
        ASSERT_THROWS(ClusterOnlyConfig{hugeInterval}, ConfigError);

        // the largest values that fit are kept as-is
        json::value maxPort = sampleConfig();
        maxPort[U("nodes")][1][U("port")] = json::value::number(65535);
        ASSERT_THAT(ClusterOnlyConfig(maxPort).node(2).port == 65535);
    }

    void testMissingFile()
    {
        class FileConfig : public Config
        {
        public:
            explicit FileConfig(std::string path) : Config(path) { loadVariables(); }
            void loadVariables() override { loadClusterVariables(); }
        };

        ASSERT_THROWS(FileConfig("/nonexistent/blockpool/config.json"), ConfigError);
    }

    void runAll()
    {
        TestUtils::printSuiteHeader("Config Tests");

        std::vector<std::pair<std::string, std::function<void()>>> tests = {
            TEST(testLoadsClusterSection),
            TEST(testDefaultsApplied),
            TEST(testValidationFailures),
            TEST(testOutOfRangeValuesRejected),
            TEST(testMissingFile)
        };

        for (auto &[name, func] : tests)
        {
            TestUtils::runTest(name, func);
        }
    }
}
