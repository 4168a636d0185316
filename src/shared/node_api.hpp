#pragma once

#include <cstdint>
#include <string>

#include "payloads.hpp"
#include "transport.hpp"

/**
 * Typed calls to a node agent's endpoints (and the node -> coordinator
 * heartbeat), over any Transport.
 * 
 * Each call throws the exception type carried by an error response
 * (e.g. NotFoundError for an absent block), or NodeUnreachableError if
 * the remote can't be reached.
 */
namespace NodeApi
{
    /* PING -> alive */
    bool ping(Transport &transport, const std::string &address);

    /* HEARTBEAT -> ack */
    bool sendHeartbeat(Transport &transport, const std::string &coordinatorAddress, const Payloads::Heartbeat &heartbeat);

    Payloads::StoreBlockResult storeBlock(
        Transport &transport,
        const std::string &address,
        const Payloads::StoreBlockRequest &request
    );

    Payloads::BlockData getBlock(Transport &transport, const std::string &address, uint64_t blockId);

    Payloads::NodeStatus getStatus(Transport &transport, const std::string &address);

    Payloads::DeleteBlockResult deleteBlock(Transport &transport, const std::string &address, uint64_t blockId);

    Payloads::BlockInventory listBlocks(Transport &transport, const std::string &address);
}
