#pragma once

#include <cstdint>
#include <cstdlib>
#include <vector>
#include <string>

/**
 * Container for all payload types sent between the coordinator
 * and node agents.
 * 
 * Encoding is little-endian binary. Variable-length fields
 * (strings, block data) are prefixed with their 4-byte length,
 * which lets blocks of any size cross a streaming connection.
 */
namespace Payloads
{
    /**
     * Appends fixed-width integers and length-prefixed fields to a buffer.
     */
    class BufferWriter
    {
    public:
        explicit BufferWriter(std::vector<unsigned char> &buffer);

        void writeU8(uint8_t value);
        void writeU32(uint32_t value);
        void writeU64(uint64_t value);
        void writeI32(int32_t value);
        void writeBool(bool value);
        void writeString(const std::string &value);
        void writeBytes(const std::vector<unsigned char> &value);

    private:
        std::vector<unsigned char> &buffer;
    };

    /**
     * Reads back what BufferWriter wrote.
     * 
     * Throws:
     *      ProtocolError - on reading past the end of the buffer
     */
    class BufferReader
    {
    public:
        explicit BufferReader(const std::vector<unsigned char> &buffer);

        uint8_t readU8();
        uint32_t readU32();
        uint64_t readU64();
        int32_t readI32();
        bool readBool();
        std::string readString();
        std::vector<unsigned char> readBytes();

        /* Throws ProtocolError unless the whole buffer was consumed */
        void expectEnd();

    private:
        const std::vector<unsigned char> &buffer;
        size_t pos;

        void require(size_t numBytes);
    };

    /**
     * Used/total data bytes of a node's block store.
     */
    struct SizeInfo 
    {
        uint64_t dataUsedSize;
        uint64_t dataTotalSize;

        SizeInfo();
        SizeInfo(
            uint64_t dataUsedSize, 
            uint64_t dataTotalSize
        );

        void serialize(BufferWriter &writer) const;
        static SizeInfo deserialize(BufferReader &reader);
        bool equals(const SizeInfo &other) const;
        std::string toString() const;
    };

    /**
     * Single boolean result: PING {alive}, HEARTBEAT {ack}.
     */
    struct Flag
    {
        bool value;

        explicit Flag(bool value);

        void serialize(std::vector<unsigned char> &buffer) const;
        static Flag deserialize(const std::vector<unsigned char> &buffer);
    };

    /**
     * HEARTBEAT request: a node's periodic status push.
     */
    struct Heartbeat
    {
        int32_t nodeId;
        SizeInfo sizeInfo;
        bool up;

        Heartbeat(int32_t nodeId, SizeInfo sizeInfo, bool up);

        void serialize(std::vector<unsigned char> &buffer) const;
        static Heartbeat deserialize(const std::vector<unsigned char> &buffer);
        bool equals(const Heartbeat &other) const;
    };

    /**
     * STORE_BLOCK request.
     */
    struct StoreBlockRequest
    {
        uint64_t blockId;
        uint64_t fileId;
        uint32_t index;
        std::string hash;
        std::vector<unsigned char> data;

        StoreBlockRequest(
            uint64_t blockId,
            uint64_t fileId,
            uint32_t index,
            std::string hash,
            std::vector<unsigned char> data
        );

        void serialize(std::vector<unsigned char> &buffer) const;
        static StoreBlockRequest deserialize(const std::vector<unsigned char> &buffer);
        bool equals(const StoreBlockRequest &other) const;
    };

    /**
     * STORE_BLOCK result: {stored} plus the node's usage after the write.
     */
    struct StoreBlockResult
    {
        bool stored;
        SizeInfo sizeInfo;

        StoreBlockResult(bool stored, SizeInfo sizeInfo);

        void serialize(std::vector<unsigned char> &buffer) const;
        static StoreBlockResult deserialize(const std::vector<unsigned char> &buffer);
    };

    /**
     * DELETE_BLOCK result: {removed} plus the node's usage after the delete.
     */
    struct DeleteBlockResult
    {
        bool removed;
        SizeInfo sizeInfo;

        DeleteBlockResult(bool removed, SizeInfo sizeInfo);

        void serialize(std::vector<unsigned char> &buffer) const;
        static DeleteBlockResult deserialize(const std::vector<unsigned char> &buffer);
    };

    /**
     * LIST_BLOCKS result: every block id a node holds, ascending.
     */
    struct BlockInventory
    {
        int32_t nodeId;
        std::vector<uint64_t> blockIds;

        BlockInventory(int32_t nodeId, std::vector<uint64_t> blockIds);

        void serialize(std::vector<unsigned char> &buffer) const;
        static BlockInventory deserialize(const std::vector<unsigned char> &buffer);
        bool equals(const BlockInventory &other) const;
    };

    /**
     * GET_BLOCK result: {payload_bytes, hash}.
     */
    struct BlockData
    {
        std::string hash;
        std::vector<unsigned char> data;

        BlockData(std::string hash, std::vector<unsigned char> data);

        void serialize(std::vector<unsigned char> &buffer) const;
        static BlockData deserialize(const std::vector<unsigned char> &buffer);
    };

    /**
     * GET_STATUS result.
     */
    struct NodeStatus
    {
        int32_t nodeId;
        SizeInfo sizeInfo;
        bool up;
        uint32_t blocksStored;

        NodeStatus(int32_t nodeId, SizeInfo sizeInfo, bool up, uint32_t blocksStored);

        void serialize(std::vector<unsigned char> &buffer) const;
        static NodeStatus deserialize(const std::vector<unsigned char> &buffer);
        bool equals(const NodeStatus &other) const;
    };
};

namespace PayloadsTests
{
    void runAll();

    void testStoreBlockRequest();
    void testHeartbeat();
    void testNodeStatus();
    void testBlockInventory();
    void testTruncatedPayloadRejected();
    void testTrailingBytesRejected();
}
