#include "node_api.hpp"

namespace NodeApi
{
    bool ping(Transport &transport, const std::string &address)
    {
        Response response = transport.call(address, Request(MessageKind::PING));
        response.throwIfError();
        return Payloads::Flag::deserialize(response.body).value;
    }

    bool sendHeartbeat(Transport &transport, const std::string &coordinatorAddress, const Payloads::Heartbeat &heartbeat)
    {
        std::vector<unsigned char> payload;
        heartbeat.serialize(payload);

        Response response = transport.call(coordinatorAddress, Request(MessageKind::HEARTBEAT, "", std::move(payload)));
        response.throwIfError();
        return Payloads::Flag::deserialize(response.body).value;
    }

    Payloads::StoreBlockResult storeBlock(
        Transport &transport,
        const std::string &address,
        const Payloads::StoreBlockRequest &request
    )
    {
        std::vector<unsigned char> payload;
        request.serialize(payload);

        Response response = transport.call(
            address,
            Request(MessageKind::STORE_BLOCK, std::to_string(request.blockId), std::move(payload))
        );
        response.throwIfError();
        return Payloads::StoreBlockResult::deserialize(response.body);
    }

    Payloads::BlockData getBlock(Transport &transport, const std::string &address, uint64_t blockId)
    {
        Response response = transport.call(address, Request(MessageKind::GET_BLOCK, std::to_string(blockId)));
        response.throwIfError();
        return Payloads::BlockData::deserialize(response.body);
    }

    Payloads::NodeStatus getStatus(Transport &transport, const std::string &address)
    {
        Response response = transport.call(address, Request(MessageKind::GET_STATUS));
        response.throwIfError();
        return Payloads::NodeStatus::deserialize(response.body);
    }

    Payloads::DeleteBlockResult deleteBlock(Transport &transport, const std::string &address, uint64_t blockId)
    {
        Response response = transport.call(address, Request(MessageKind::DELETE_BLOCK, std::to_string(blockId)));
        response.throwIfError();
        return Payloads::DeleteBlockResult::deserialize(response.body);
    }

    Payloads::BlockInventory listBlocks(Transport &transport, const std::string &address)
    {
        Response response = transport.call(address, Request(MessageKind::LIST_BLOCKS));
        response.throwIfError();
        return Payloads::BlockInventory::deserialize(response.body);
    }
}
