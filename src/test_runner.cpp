#include <iostream>

#include "block.hpp"
#include "block_store.hpp"
#include "block_table.hpp"
#include "config.hpp"
#include "coordinator.hpp"
#include "coordinator_client.hpp"
#include "crypto.hpp"
#include "errors.hpp"
#include "http_transport.hpp"
#include "logger.hpp"
#include "node_agent.hpp"
#include "payloads.hpp"
#include "test_utils.hpp"
#include "transport.hpp"
#include "utils.hpp"

int main()
{
    // keep the expected-failure logging out of the test output
    Logger::instance().setLevel(LogLevel::ERROR);

    ErrorsTests::runAll();
    UtilsTests::runAll();
    CryptoTests::runAll();
    BlockCodecTests::runAll();
    PayloadsTests::runAll();
    ConfigTests::runAll();
    TransportTests::runAll();
    HttpTransportTests::runAll();
    BlockStoreTests::runAll();
    NodeAgentTests::runAll();
    BlockTableTests::runAll();
    CoordinatorTests::runAll();
    CoordinatorClientTests::runAll();

    std::cout << "\n" << TestUtils::testsRun() - TestUtils::testsFailed() << "/"
              << TestUtils::testsRun() << " tests passed" << std::endl;

    return TestUtils::testsFailed() > 0 ? 1 : 0;
}
