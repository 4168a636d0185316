#pragma once

#include <chrono>
#include <cstdint>
#include <string>

#include "config.hpp"

/**
 * Represents statistics of a single cluster node.
 */
struct ClusterNodeStats
{
    /* bytes stored on the node, as last reported by it */
    uint64_t dataBytesUsed;

    /* bytes promised to uploads in flight */
    uint64_t dataBytesReserved;

    /* declared capacity */
    uint64_t dataBytesTotal;

    /* bytes of aborted uploads the node still holds (delete failed) */
    uint64_t dataBytesOrphaned;

    /* Default constructor */
    ClusterNodeStats()
        : dataBytesUsed(0),
          dataBytesReserved(0),
          dataBytesTotal(0),
          dataBytesOrphaned(0)
    {
    }
};

/**
 * Represents a node as seen by the coordinator.
 */
class ClusterNode {
public:
    /**
     * Unique id given to the node in config.json
     */
    int32_t id;

    /**
     * Base uri of the node's agent (e.g. "http://10.0.0.2:9002")
     */
    std::string address;

    bool isCoordinator;

    /**
     * Denotes whether our node is `up`, as per the heartbeats it sent
     * (see Coordinator::checkLiveness())
     */
    bool isUp;

    /* True once any heartbeat (or successful ping) was received */
    bool heardFrom;
    std::chrono::steady_clock::time_point lastHeartbeat;

    /* Node statistics */
    ClusterNodeStats stats;

    /* Param constructor */
    explicit ClusterNode(const NodeInfo &info);

    /* capacity - used - reserved (0 if over-committed) */
    uint64_t freeBytes() const;

    /* Returns human-readable representation of the node */
    std::string toString() const;
};
