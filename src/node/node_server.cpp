#include <pthread.h>

#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <string>

#include "errors.hpp"
#include "http_transport.hpp"
#include "logger.hpp"
#include "node_agent.hpp"
#include "node_config.hpp"

namespace
{
    /**
     * Retreives node's unique id from argv[2], or else the
     * environment variable `NODE_ID`.
     */
    int32_t getNodeId(int argc, char *argv[])
    {
        if (argc > 2)
            return std::stoi(argv[2]);

        const char* envNodeID = std::getenv("NODE_ID");
        if (!envNodeID)
            throw ConfigError("no node id given (pass it as an argument or set NODE_ID)");
        return std::stoi(envNodeID);
    }

    /* Blocks until SIGINT or SIGTERM arrives */
    void waitForShutdownSignal(const sigset_t &signals)
    {
        int signal = 0;
        sigwait(&signals, &signal);
    }
}

int main(int argc, char *argv[])
{
    if (argc < 2)
    {
        std::cerr << "usage: blockpool_node <config.json> [node_id]" << std::endl;
        return 2;
    }

    // block shutdown signals in every thread; main waits for them with sigwait()
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &signals, nullptr);

    ComponentLogger log("node");

    try
    {
        NodeConfig config(argv[1], getNodeId(argc, argv));
        Logger::instance().setLevel(config.logLevel);

        HttpTransport transport(std::chrono::milliseconds(config.requestTimeoutMs));
        NodeAgent agent(config, transport);

        HttpServer server(
            "http://" + config.self().address + ":" + std::to_string(config.self().port),
            agent,
            "node-" + std::to_string(config.nodeId)
        );
        server.open();
        agent.start();

        waitForShutdownSignal(signals);

        log.info("shutting down");
        agent.stop();
        server.close();
    }
    catch (const ConfigError &e)
    {
        log.error(std::string("config error: ") + e.what());
        return 2;
    }
    catch (const std::exception &e)
    {
        log.error(e.what());
        return 1;
    }

    return 0;
}
