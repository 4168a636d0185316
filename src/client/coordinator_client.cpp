#include <functional>
#include <map>
#include <memory>
#include <thread>

#include "coordinator_client.hpp"

#include "block.hpp"
#include "client_config.hpp"
#include "config.hpp"
#include "coordinator.hpp"
#include "coordinator_config.hpp"
#include "errors.hpp"
#include "node_agent.hpp"
#include "node_config.hpp"
#include "test_utils.hpp"
#include "utils.hpp"

namespace
{
    /* Store attempts the coordinator may make per block: 2 copies x 2 attempts */
    const uint64_t UPLOAD_CALLS_PER_BLOCK = 4;

    /* Fetch attempts per block: primary, then replica */
    const uint64_t DOWNLOAD_CALLS_PER_BLOCK = 2;
}

CoordinatorClient::CoordinatorClient(Transport &transport, const ClientConfig &config)
    : transport(transport),
      coordinatorAddress(config.coordinatorAddress()),
      requestTimeout(config.requestTimeoutMs),
      blockSize(config.blockSize),
      log("client")
{
}

json::value CoordinatorClient::upload(const fs::path &path, std::string name)
{
    if (name.empty())
        name = path.filename().string();

    std::vector<unsigned char> data = FileSystemUtils::readFile(path);

    // fail fast, before shipping the file
    canAccept(data.size());

    log.info("uploading " + path.string() + " as '" + name + "' (" + PrintUtils::formatNumBytes(data.size()) + ")");

    Request request(MessageKind::UPLOAD_FILE, name, std::move(data));
    request.timeout = uploadTimeout(BlockCodec::blockCount(request.body.size(), blockSize));
    return call(request).bodyAsJson();
}

void CoordinatorClient::download(const std::string &name, const fs::path &destination)
{
    uint64_t numBlocks = info(name).at(U("blockCount")).as_number().to_uint64();

    Request request(MessageKind::DOWNLOAD_FILE, name);
    request.timeout = downloadTimeout(numBlocks);
    Response response = call(request);

    FileSystemUtils::writeFileAtomically(destination, response.body);
    log.info("downloaded '" + name + "' to " + destination.string()
        + " (" + PrintUtils::formatNumBytes(response.body.size()) + ")");
}

json::value CoordinatorClient::list()
{
    return call(Request(MessageKind::LIST_FILES)).bodyAsJson();
}

json::value CoordinatorClient::info(const std::string &name)
{
    return call(Request(MessageKind::FILE_INFO, name)).bodyAsJson();
}

json::value CoordinatorClient::stats()
{
    return call(Request(MessageKind::CLUSTER_STATUS)).bodyAsJson();
}

json::value CoordinatorClient::canAccept(uint64_t fileSize)
{
    return call(Request(MessageKind::CAN_ACCEPT, std::to_string(fileSize))).bodyAsJson();
}

std::chrono::milliseconds CoordinatorClient::uploadTimeout(uint64_t numBlocks) const
{
    return requestTimeout * (numBlocks * UPLOAD_CALLS_PER_BLOCK + 1);
}

std::chrono::milliseconds CoordinatorClient::downloadTimeout(uint64_t numBlocks) const
{
    return requestTimeout * (numBlocks * DOWNLOAD_CALLS_PER_BLOCK + 1);
}

Response CoordinatorClient::call(const Request &request)
{
    Response response = transport.call(coordinatorAddress, request);
    response.throwIfError();
    return response;
}

////////////////////////////////////////////
// CoordinatorClient tests
////////////////////////////////////////////
namespace CoordinatorClientTests
{
    const fs::path TEST_DIR = fs::temp_directory_path() / "blockpool_client_test";
    const uint64_t KiB = 1024;

    /**
     * Three configured nodes. The coordinator (node 1) runs without an
     * embedded agent, so blocks land on nodes 2 and 3 only.
     */
    class ClientCluster
    {
    public:
        LoopbackTransport transport;
        json::value configJson;
        std::unique_ptr<CoordinatorConfig> config;
        std::map<int32_t, std::unique_ptr<NodeAgent>> agents;
        std::unique_ptr<Coordinator> coordinator;
        std::unique_ptr<CoordinatorClient> client;

        ClientCluster()
        {
            FileSystemUtils::removeDirectory(TEST_DIR);
            fs::create_directories(TEST_DIR);

            configJson = ConfigTests::sampleConfig(64 * KiB, 1024, 3);

            json::value coordinatorSection = json::value::object();
            coordinatorSection[U("metadataDir")] = json::value::string((TEST_DIR / "metadata").string());
            configJson[U("coordinator")] = coordinatorSection;

            json::value nodeSection = json::value::object();
            nodeSection[U("storeDirPath")] = json::value::string((TEST_DIR / "nodes").string());
            nodeSection[U("removeExistingStore")] = json::value::boolean(true);
            configJson[U("node")] = nodeSection;

            config = std::make_unique<CoordinatorConfig>(configJson);
            coordinator = std::make_unique<Coordinator>(*config, transport);
            transport.bind(config->listenAddress(), coordinator.get());

            for (int32_t nodeId : {2, 3})
            {
                agents[nodeId] = std::make_unique<NodeAgent>(NodeConfig(configJson, nodeId), transport);
                transport.bind(config->node(nodeId).endpoint(), agents[nodeId].get());
                agents[nodeId]->sendHeartbeat();
            }

            client = std::make_unique<CoordinatorClient>(transport, ClientConfig(configJson));
        }

        ~ClientCluster()
        {
            client.reset();
            coordinator.reset();
            agents.clear();
            FileSystemUtils::removeDirectory(TEST_DIR);
        }

        fs::path writeSource(const std::string &fileName, uint64_t numBytes)
        {
            fs::path path = TEST_DIR / fileName;
            FileSystemUtils::writeFileAtomically(path, BlockUtils::generateRandomData(numBytes));
            return path;
        }
    };

    void testPutGetRoundTrip()
    {
        ClientCluster cluster;
        fs::path source = cluster.writeSource("report.csv", 5 * KiB + 17);

        json::value stored = cluster.client->upload(source);
        ASSERT_THAT(stored.at(U("name")).as_string() == "report.csv");
        ASSERT_THAT(stored.at(U("blockCount")).as_integer() == 6);

        fs::path destination = TEST_DIR / "report.out";
        cluster.client->download("report.csv", destination);

        ASSERT_THAT(FileSystemUtils::readFile(destination) == FileSystemUtils::readFile(source));
        ASSERT_THAT(!fs::exists(TEST_DIR / "report.out.part"));

        // names with spaces survive the trip
        cluster.client->upload(source, "my report.csv");
        cluster.client->download("my report.csv", TEST_DIR / "second.out");
        ASSERT_THAT(FileSystemUtils::readFile(TEST_DIR / "second.out") == FileSystemUtils::readFile(source));
    }

    void testFailedDownloadLeavesNoFile()
    {
        ClientCluster cluster;
        fs::path source = cluster.writeSource("photo.jpg", 3 * KiB);
        cluster.client->upload(source);

        cluster.transport.setReachable(cluster.config->node(2).endpoint(), false);
        cluster.transport.setReachable(cluster.config->node(3).endpoint(), false);

        fs::path destination = TEST_DIR / "photo.out";
        bool caught = false;
        try
        {
            cluster.client->download("photo.jpg", destination);
        }
        catch (const BlockUnavailableError &e)
        {
            caught = true;
            ASSERT_THAT(e.fileName == "photo.jpg");
            ASSERT_THAT(e.blockIndex == 0);
        }
        ASSERT_THAT(caught);

        ASSERT_THAT(!fs::exists(destination));
        ASSERT_THAT(!fs::exists(TEST_DIR / "photo.out.part"));

        ASSERT_THROWS(cluster.client->download("nothing.txt", destination), NotFoundError);
        ASSERT_THAT(!fs::exists(destination));
    }

    void testCapacityErrorReachesClient()
    {
        ClientCluster cluster;

        // nodes 2 and 3 are up, 64 KiB each
        json::value report = cluster.client->canAccept(10 * KiB);
        ASSERT_THAT(report.at(U("accepted")).as_bool());
        ASSERT_THAT(report.at(U("freeBytes")).as_number().to_uint64() == 128 * KiB);

        bool caught = false;
        try
        {
            cluster.client->canAccept(200 * KiB);
        }
        catch (const CapacityError &e)
        {
            caught = true;
            ASSERT_THAT(e.fileSize == 200 * KiB);
            ASSERT_THAT(e.blocksRequired == 200);
            ASSERT_THAT(e.totalBytes == 128 * KiB);
            ASSERT_THAT(e.usedBytes == 0);
            ASSERT_THAT(e.freeBytes == 128 * KiB);
        }
        ASSERT_THAT(caught);

        // rejected before the file is sent
        fs::path source = cluster.writeSource("huge.bin", 200 * KiB);
        cluster.transport.clearCalls();
        ASSERT_THROWS(cluster.client->upload(source), CapacityError);
        for (const auto &call : cluster.transport.calls())
            ASSERT_THAT(call.kind != MessageKind::UPLOAD_FILE);
    }

    void testListInfoStats()
    {
        ClientCluster cluster;
        cluster.client->upload(cluster.writeSource("a.txt", 100));
        cluster.client->upload(cluster.writeSource("b.txt", 2 * KiB));

        json::value files = cluster.client->list();
        ASSERT_THAT(files.as_array().size() == 2);

        json::value info = cluster.client->info("b.txt");
        ASSERT_THAT(info.at(U("blocks")).as_array().size() == 2);
        for (const auto &block : info.at(U("blocks")).as_array())
        {
            int32_t primary = block.at(U("primary")).as_integer();
            int32_t replica = block.at(U("replica")).as_integer();
            ASSERT_THAT(primary != replica);
            ASSERT_THAT(primary != 1 && replica != 1);
        }

        json::value stats = cluster.client->stats();
        ASSERT_THAT(stats.at(U("nodes")).as_array().size() == 3);
        ASSERT_THAT(stats.at(U("files")).as_integer() == 2);
        ASSERT_THAT(!stats.at(U("table")).as_string().empty());

        ASSERT_THROWS(cluster.client->info("c.txt"), NotFoundError);
    }

    /* Forwards to a node agent after a fixed delay on every block call */
    class SlowNode : public RequestHandler
    {
    public:
        SlowNode(RequestHandler &agent, std::chrono::milliseconds delay)
            : agent(agent),
              delay(delay)
        {
        }

        Response handle(const Request &request) override
        {
            if (request.kind == MessageKind::STORE_BLOCK || request.kind == MessageKind::GET_BLOCK)
                std::this_thread::sleep_for(delay);
            return agent.handle(request);
        }

    private:
        RequestHandler &agent;
        std::chrono::milliseconds delay;
    };

    void testLongTransfersOutlastRequestTimeout()
    {
        ClientCluster cluster;

        // every node call fits in 100 ms, a whole 8-block file doesn't
        cluster.configJson[U("network")][U("requestTimeoutMs")] = json::value::number(100);
        cluster.transport.setTimeout(std::chrono::milliseconds(100));
        CoordinatorClient client(cluster.transport, ClientConfig(cluster.configJson));

        SlowNode slow2(*cluster.agents[2], std::chrono::milliseconds(25));
        SlowNode slow3(*cluster.agents[3], std::chrono::milliseconds(25));
        cluster.transport.bind(cluster.config->node(2).endpoint(), &slow2);
        cluster.transport.bind(cluster.config->node(3).endpoint(), &slow3);

        ASSERT_THAT(client.uploadTimeout(8) == std::chrono::milliseconds(3300));
        ASSERT_THAT(client.downloadTimeout(8) == std::chrono::milliseconds(1700));

        fs::path source = cluster.writeSource("slow.bin", 8 * KiB);
        json::value stored = client.upload(source);
        ASSERT_THAT(stored.at(U("blockCount")).as_integer() == 8);

        fs::path destination = TEST_DIR / "slow.out";
        client.download("slow.bin", destination);
        ASSERT_THAT(FileSystemUtils::readFile(destination) == FileSystemUtils::readFile(source));

        // the same upload held to a single request's budget gives up early
        Request flat(MessageKind::UPLOAD_FILE, "flat.bin", FileSystemUtils::readFile(source));
        ASSERT_THROWS(cluster.transport.call(cluster.config->listenAddress(), flat), NodeUnreachableError);
    }

    void testCoordinatorWithoutAgentAnswersNoPing()
    {
        ClientCluster cluster;

        Response response = cluster.transport.call(cluster.config->listenAddress(), Request(MessageKind::PING));
        ASSERT_THAT(!response.ok);
        ASSERT_THAT(response.errorCode == ErrorCode::PROTOCOL_ERROR);

        // node 1 stores nothing, so a ping can't vouch for it
        ASSERT_THAT(!cluster.coordinator->pingNode(1));
        ASSERT_THAT(!cluster.coordinator->isUp(1));
        ASSERT_THAT(cluster.coordinator->pingNode(2));

        response = cluster.transport.call(cluster.config->listenAddress(), Request(MessageKind::LIST_BLOCKS));
        ASSERT_THAT(response.errorCode == ErrorCode::PROTOCOL_ERROR);
    }

    void runAll()
    {
        TestUtils::printSuiteHeader("CoordinatorClient Tests");

        std::vector<std::pair<std::string, std::function<void()>>> tests = {
            TEST(testPutGetRoundTrip),
            TEST(testFailedDownloadLeavesNoFile),
            TEST(testCapacityErrorReachesClient),
            TEST(testListInfoStats),
            TEST(testLongTransfersOutlastRequestTimeout),
            TEST(testCoordinatorWithoutAgentAnswersNoPing)
        };

        for (auto &[name, func] : tests)
            TestUtils::runTest(name, func);
    }
}
