#include <pthread.h>

#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>

#include "coordinator.hpp"
#include "coordinator_config.hpp"
#include "errors.hpp"
#include "http_transport.hpp"
#include "logger.hpp"
#include "node_agent.hpp"
#include "node_config.hpp"

namespace
{
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
        std::cerr << "usage: blockpool_coordinator <config.json>" << std::endl;
        return 2;
    }

    // block shutdown signals in every thread; main waits for them with sigwait()
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &signals, nullptr);

    ComponentLogger log("coordinator");

    try
    {
        CoordinatorConfig config(argv[1]);
        Logger::instance().setLevel(config.logLevel);

        HttpTransport transport(std::chrono::milliseconds(config.requestTimeoutMs));

        /**
         * The coordinator's machine stores blocks too when its node
         * entry declares capacity; its agent shares our listener.
         */
        const NodeInfo &self = config.coordinatorNode();
        std::unique_ptr<NodeAgent> localAgent;
        if (self.capacityBytes > 0)
            localAgent = std::make_unique<NodeAgent>(NodeConfig(argv[1], self.id), transport);

        Coordinator coordinator(config, transport, localAgent.get());

        HttpServer server(config.listenAddress(), coordinator, "coordinator-http");
        server.open();
        coordinator.start();

        log.info("listening on " + config.listenAddress() + " with "
            + std::to_string(config.nodes.size()) + " configured nodes");

        if (localAgent)
            localAgent->start();

        waitForShutdownSignal(signals);

        log.info("shutting down");
        if (localAgent)
            localAgent->stop();
        coordinator.stop();
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
