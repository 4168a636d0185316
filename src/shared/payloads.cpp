#include <iostream>
#include <sstream>
#include <functional>

#include "payloads.hpp"
#include "errors.hpp"
#include "test_utils.hpp"
#include "utils.hpp"

/**
 * Container for all payload types sent between the coordinator
 * and node agents.
 */
namespace Payloads
{
    ////////////////////////////////////////////
    // BufferWriter methods
    ////////////////////////////////////////////

    BufferWriter::BufferWriter(std::vector<unsigned char> &buffer)
        : buffer(buffer)
    {
    }

    void BufferWriter::writeU8(uint8_t value)
    {
        buffer.push_back(value);
    }

    void BufferWriter::writeU32(uint32_t value)
    {
        for (int i = 0; i < 4; i++)
            buffer.push_back(static_cast<unsigned char>((value >> (8 * i)) & 0xff));
    }

    void BufferWriter::writeU64(uint64_t value)
    {
        for (int i = 0; i < 8; i++)
            buffer.push_back(static_cast<unsigned char>((value >> (8 * i)) & 0xff));
    }

    void BufferWriter::writeI32(int32_t value)
    {
        writeU32(static_cast<uint32_t>(value));
    }

    void BufferWriter::writeBool(bool value)
    {
        writeU8(value ? 1 : 0);
    }

    void BufferWriter::writeString(const std::string &value)
    {
        writeU32(static_cast<uint32_t>(value.size()));
        buffer.insert(buffer.end(), value.begin(), value.end());
    }

    void BufferWriter::writeBytes(const std::vector<unsigned char> &value)
    {
        writeU32(static_cast<uint32_t>(value.size()));
        buffer.insert(buffer.end(), value.begin(), value.end());
    }

    ////////////////////////////////////////////
    // BufferReader methods
    ////////////////////////////////////////////

    BufferReader::BufferReader(const std::vector<unsigned char> &buffer)
        : buffer(buffer),
          pos(0)
    {
    }

    void BufferReader::require(size_t numBytes)
    {
        if (buffer.size() - pos < numBytes)
        {
            throw ProtocolError(
                "payload truncated: need " + std::to_string(numBytes) + " bytes at offset " +
                std::to_string(pos) + " of " + std::to_string(buffer.size())
            );
        }
    }

    uint8_t BufferReader::readU8()
    {
        require(1);
        return buffer[pos++];
    }

    uint32_t BufferReader::readU32()
    {
        require(4);
        uint32_t value = 0;
        for (int i = 0; i < 4; i++)
            value |= static_cast<uint32_t>(buffer[pos++]) << (8 * i);
        return value;
    }

    uint64_t BufferReader::readU64()
    {
        require(8);
        uint64_t value = 0;
        for (int i = 0; i < 8; i++)
            value |= static_cast<uint64_t>(buffer[pos++]) << (8 * i);
        return value;
    }

    int32_t BufferReader::readI32()
    {
        return static_cast<int32_t>(readU32());
    }

    bool BufferReader::readBool()
    {
        return readU8() != 0;
    }

    std::string BufferReader::readString()
    {
        uint32_t size = readU32();
        require(size);
        std::string value(buffer.begin() + pos, buffer.begin() + pos + size);
        pos += size;
        return value;
    }

    std::vector<unsigned char> BufferReader::readBytes()
    {
        uint32_t size = readU32();
        require(size);
        std::vector<unsigned char> value(buffer.begin() + pos, buffer.begin() + pos + size);
        pos += size;
        return value;
    }

    void BufferReader::expectEnd()
    {
        if (pos != buffer.size())
        {
            throw ProtocolError(
                "payload has " + std::to_string(buffer.size() - pos) + " unexpected trailing bytes"
            );
        }
    }

    ////////////////////////////////////////////
    // SizeInfo methods
    ////////////////////////////////////////////

    SizeInfo::SizeInfo()
        : dataUsedSize(0),
          dataTotalSize(0)
    {
    }

    SizeInfo::SizeInfo(
        uint64_t dataUsedSize,
        uint64_t dataTotalSize
    ) 
        : dataUsedSize(dataUsedSize),
          dataTotalSize(dataTotalSize)
    {
    }

    void SizeInfo::serialize(BufferWriter &writer) const
    {
        writer.writeU64(dataUsedSize);
        writer.writeU64(dataTotalSize);
    }

    SizeInfo SizeInfo::deserialize(BufferReader &reader)
    {
        uint64_t dataUsedSize = reader.readU64();
        uint64_t dataTotalSize = reader.readU64();
        return SizeInfo(dataUsedSize, dataTotalSize);
    }

    bool SizeInfo::equals(const SizeInfo &other) const
    {
        return (
            dataUsedSize == other.dataUsedSize &&
            dataTotalSize == other.dataTotalSize
        );
    }

    std::string SizeInfo::toString() const
    {
        std::ostringstream oss;
        oss << "used: " << PrintUtils::formatNumBytes(dataUsedSize)
            << ", total: " << PrintUtils::formatNumBytes(dataTotalSize);
        return oss.str();
    }

    ////////////////////////////////////////////
    // Flag methods
    ////////////////////////////////////////////

    Flag::Flag(bool value)
        : value(value)
    {
    }

    void Flag::serialize(std::vector<unsigned char> &buffer) const
    {
        BufferWriter writer(buffer);
        writer.writeBool(value);
    }

    Flag Flag::deserialize(const std::vector<unsigned char> &buffer)
    {
        BufferReader reader(buffer);
        bool value = reader.readBool();
        reader.expectEnd();
        return Flag(value);
    }

    ////////////////////////////////////////////
    // Heartbeat methods
    ////////////////////////////////////////////

    Heartbeat::Heartbeat(int32_t nodeId, SizeInfo sizeInfo, bool up)
        : nodeId(nodeId),
          sizeInfo(sizeInfo),
          up(up)
    {
    }

    void Heartbeat::serialize(std::vector<unsigned char> &buffer) const
    {
        BufferWriter writer(buffer);
        writer.writeI32(nodeId);
        sizeInfo.serialize(writer);
        writer.writeBool(up);
    }

    Heartbeat Heartbeat::deserialize(const std::vector<unsigned char> &buffer)
    {
        BufferReader reader(buffer);
        int32_t nodeId = reader.readI32();
        SizeInfo sizeInfo = SizeInfo::deserialize(reader);
        bool up = reader.readBool();
        reader.expectEnd();
        return Heartbeat(nodeId, sizeInfo, up);
    }

    bool Heartbeat::equals(const Heartbeat &other) const
    {
        return (
            nodeId == other.nodeId &&
            sizeInfo.equals(other.sizeInfo) &&
            up == other.up
        );
    }

    ////////////////////////////////////////////
    // StoreBlockRequest methods
    ////////////////////////////////////////////

    StoreBlockRequest::StoreBlockRequest(
        uint64_t blockId,
        uint64_t fileId,
        uint32_t index,
        std::string hash,
        std::vector<unsigned char> data
    )
        : blockId(blockId),
          fileId(fileId),
          index(index),
          hash(std::move(hash)),
          data(std::move(data))
    {
    }

    void StoreBlockRequest::serialize(std::vector<unsigned char> &buffer) const
    {
        buffer.reserve(buffer.size() + data.size() + hash.size() + 32);

        BufferWriter writer(buffer);
        writer.writeU64(blockId);
        writer.writeU64(fileId);
        writer.writeU32(index);
        writer.writeString(hash);
        writer.writeBytes(data);
    }

    StoreBlockRequest StoreBlockRequest::deserialize(const std::vector<unsigned char> &buffer)
    {
        BufferReader reader(buffer);
        uint64_t blockId = reader.readU64();
        uint64_t fileId = reader.readU64();
        uint32_t index = reader.readU32();
        std::string hash = reader.readString();
        std::vector<unsigned char> data = reader.readBytes();
        reader.expectEnd();

        return StoreBlockRequest(blockId, fileId, index, std::move(hash), std::move(data));
    }

    bool StoreBlockRequest::equals(const StoreBlockRequest &other) const
    {
        return (
            blockId == other.blockId &&
            fileId == other.fileId &&
            index == other.index &&
            hash == other.hash &&
            data == other.data
        );
    }

    ////////////////////////////////////////////
    // StoreBlockResult methods
    ////////////////////////////////////////////

    StoreBlockResult::StoreBlockResult(bool stored, SizeInfo sizeInfo)
        : stored(stored),
          sizeInfo(sizeInfo)
    {
    }

    void StoreBlockResult::serialize(std::vector<unsigned char> &buffer) const
    {
        BufferWriter writer(buffer);
        writer.writeBool(stored);
        sizeInfo.serialize(writer);
    }

    StoreBlockResult StoreBlockResult::deserialize(const std::vector<unsigned char> &buffer)
    {
        BufferReader reader(buffer);
        bool stored = reader.readBool();
        SizeInfo sizeInfo = SizeInfo::deserialize(reader);
        reader.expectEnd();
        return StoreBlockResult(stored, sizeInfo);
    }

    ////////////////////////////////////////////
    // DeleteBlockResult methods
    ////////////////////////////////////////////

    DeleteBlockResult::DeleteBlockResult(bool removed, SizeInfo sizeInfo)
        : removed(removed),
          sizeInfo(sizeInfo)
    {
    }

    void DeleteBlockResult::serialize(std::vector<unsigned char> &buffer) const
    {
        BufferWriter writer(buffer);
        writer.writeBool(removed);
        sizeInfo.serialize(writer);
    }

    DeleteBlockResult DeleteBlockResult::deserialize(const std::vector<unsigned char> &buffer)
    {
        BufferReader reader(buffer);
        bool removed = reader.readBool();
        SizeInfo sizeInfo = SizeInfo::deserialize(reader);
        reader.expectEnd();
        return DeleteBlockResult(removed, sizeInfo);
    }

    ////////////////////////////////////////////
    // BlockInventory methods
    ////////////////////////////////////////////

    BlockInventory::BlockInventory(int32_t nodeId, std::vector<uint64_t> blockIds)
        : nodeId(nodeId),
          blockIds(std::move(blockIds))
    {
    }

    void BlockInventory::serialize(std::vector<unsigned char> &buffer) const
    {
        buffer.reserve(buffer.size() + 8 + blockIds.size() * sizeof(uint64_t));

        BufferWriter writer(buffer);
        writer.writeI32(nodeId);
        writer.writeU32(blockIds.size());
        for (uint64_t id : blockIds)
            writer.writeU64(id);
    }

    BlockInventory BlockInventory::deserialize(const std::vector<unsigned char> &buffer)
    {
        BufferReader reader(buffer);
        int32_t nodeId = reader.readI32();
        uint32_t count = reader.readU32();

        // each id takes 8 bytes; a bogus count fails on the first short read
        std::vector<uint64_t> blockIds;
        for (uint32_t i = 0; i < count; i++)
            blockIds.push_back(reader.readU64());

        reader.expectEnd();
        return BlockInventory(nodeId, std::move(blockIds));
    }

    bool BlockInventory::equals(const BlockInventory &other) const
    {
        return nodeId == other.nodeId && blockIds == other.blockIds;
    }

    ////////////////////////////////////////////
    // BlockData methods
    ////////////////////////////////////////////

    BlockData::BlockData(std::string hash, std::vector<unsigned char> data)
        : hash(std::move(hash)),
          data(std::move(data))
    {
    }

    void BlockData::serialize(std::vector<unsigned char> &buffer) const
    {
        buffer.reserve(buffer.size() + data.size() + hash.size() + 8);

        BufferWriter writer(buffer);
        writer.writeString(hash);
        writer.writeBytes(data);
    }

    BlockData BlockData::deserialize(const std::vector<unsigned char> &buffer)
    {
        BufferReader reader(buffer);
        std::string hash = reader.readString();
        std::vector<unsigned char> data = reader.readBytes();
        reader.expectEnd();
        return BlockData(std::move(hash), std::move(data));
    }

    ////////////////////////////////////////////
    // NodeStatus methods
    ////////////////////////////////////////////

    NodeStatus::NodeStatus(int32_t nodeId, SizeInfo sizeInfo, bool up, uint32_t blocksStored)
        : nodeId(nodeId),
          sizeInfo(sizeInfo),
          up(up),
          blocksStored(blocksStored)
    {
    }

    void NodeStatus::serialize(std::vector<unsigned char> &buffer) const
    {
        BufferWriter writer(buffer);
        writer.writeI32(nodeId);
        sizeInfo.serialize(writer);
        writer.writeBool(up);
        writer.writeU32(blocksStored);
    }

    NodeStatus NodeStatus::deserialize(const std::vector<unsigned char> &buffer)
    {
        BufferReader reader(buffer);
        int32_t nodeId = reader.readI32();
        SizeInfo sizeInfo = SizeInfo::deserialize(reader);
        bool up = reader.readBool();
        uint32_t blocksStored = reader.readU32();
        reader.expectEnd();
        return NodeStatus(nodeId, sizeInfo, up, blocksStored);
    }

    bool NodeStatus::equals(const NodeStatus &other) const
    {
        return (
            nodeId == other.nodeId &&
            sizeInfo.equals(other.sizeInfo) &&
            up == other.up &&
            blocksStored == other.blocksStored
        );
    }
};

namespace PayloadsTests
{
    void testStoreBlockRequest()
    {
        std::vector<unsigned char> data = {0, 1, 2, 255, 254, 'x'};
        Payloads::StoreBlockRequest original(42, 7, 3, "abcd", data);

        std::vector<unsigned char> buffer;
        original.serialize(buffer);

        // 8 + 8 + 4 + (4 + 4) + (4 + 6)
        ASSERT_THAT(buffer.size() == 38);

        Payloads::StoreBlockRequest deserialized = Payloads::StoreBlockRequest::deserialize(buffer);
        ASSERT_THAT(original.equals(deserialized));
    }

    void testHeartbeat()
    {
        Payloads::Heartbeat original(3, Payloads::SizeInfo(5ull << 30, 10ull << 30), true);

        std::vector<unsigned char> buffer;
        original.serialize(buffer);

        Payloads::Heartbeat deserialized = Payloads::Heartbeat::deserialize(buffer);
        ASSERT_THAT(original.equals(deserialized));
        ASSERT_THAT(deserialized.sizeInfo.dataTotalSize == (10ull << 30));
    }

    void testNodeStatus()
    {
        Payloads::NodeStatus original(-1, Payloads::SizeInfo(100, 500), false, 12);

        std::vector<unsigned char> buffer;
        original.serialize(buffer);

        Payloads::NodeStatus deserialized = Payloads::NodeStatus::deserialize(buffer);
        ASSERT_THAT(original.equals(deserialized));
    }

    void testBlockInventory()
    {
        Payloads::BlockInventory original(2, {1, 7, 1ull << 40});

        std::vector<unsigned char> buffer;
        original.serialize(buffer);

        // 4 + 4 + 3 * 8
        ASSERT_THAT(buffer.size() == 32);
        ASSERT_THAT(original.equals(Payloads::BlockInventory::deserialize(buffer)));

        // count claims more ids than the buffer holds
        buffer.resize(buffer.size() - 8);
        ASSERT_THROWS(Payloads::BlockInventory::deserialize(buffer), ProtocolError);

        Payloads::BlockInventory empty(3, {});
        std::vector<unsigned char> emptyBuffer;
        empty.serialize(emptyBuffer);
        ASSERT_THAT(Payloads::BlockInventory::deserialize(emptyBuffer).blockIds.empty());
    }

    void testTruncatedPayloadRejected()
    {
        Payloads::StoreBlockRequest original(1, 1, 0, "hash", std::vector<unsigned char>(100, 'a'));

        std::vector<unsigned char> buffer;
        original.serialize(buffer);
        buffer.resize(buffer.size() - 1);

        ASSERT_THROWS(Payloads::StoreBlockRequest::deserialize(buffer), ProtocolError);

        std::vector<unsigned char> empty;
        ASSERT_THROWS(Payloads::Flag::deserialize(empty), ProtocolError);
    }

    void testTrailingBytesRejected()
    {
        std::vector<unsigned char> buffer;
        Payloads::Flag(true).serialize(buffer);
        buffer.push_back(0);

        ASSERT_THROWS(Payloads::Flag::deserialize(buffer), ProtocolError);
    }

    void runAll()
    {
        TestUtils::printSuiteHeader("Payloads Tests");

        std::vector<std::pair<std::string, std::function<void()>>> tests = {
            TEST(testStoreBlockRequest),
            TEST(testHeartbeat),
            TEST(testNodeStatus),
            TEST(testBlockInventory),
            TEST(testTruncatedPayloadRejected),
            TEST(testTrailingBytesRejected)
        };

        for (auto &[name, func] : tests)
        {
            TestUtils::runTest(name, func);
        }
    }
}
