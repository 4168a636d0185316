#include <sstream>
#include <iostream>
#include <vector>

#include "errors.hpp"
#include "utils.hpp"
#include "test_utils.hpp"

////////////////////////////////////////////
// BlockPoolError methods
////////////////////////////////////////////

BlockPoolError::BlockPoolError(ErrorCode code, const std::string &message)
    : std::runtime_error(message),
      errorCode(code)
{
}

ErrorCode BlockPoolError::code() const
{
    return errorCode;
}

json::value BlockPoolError::details() const
{
    return json::value::object();
}

IOError::IOError(const std::string &message)
    : BlockPoolError(ErrorCode::IO_ERROR, message)
{
}

IntegrityError::IntegrityError(const std::string &message)
    : BlockPoolError(ErrorCode::INTEGRITY_ERROR, message)
{
}

NoCapacityError::NoCapacityError(const std::string &message)
    : BlockPoolError(ErrorCode::NO_CAPACITY, message)
{
}

NodeUnreachableError::NodeUnreachableError(const std::string &message)
    : BlockPoolError(ErrorCode::NODE_UNREACHABLE, message)
{
}

NotFoundError::NotFoundError(const std::string &message)
    : BlockPoolError(ErrorCode::NOT_FOUND, message)
{
}

FileExistsError::FileExistsError(const std::string &message)
    : BlockPoolError(ErrorCode::FILE_EXISTS, message)
{
}

ProtocolError::ProtocolError(const std::string &message)
    : BlockPoolError(ErrorCode::PROTOCOL_ERROR, message)
{
}

ConfigError::ConfigError(const std::string &message)
    : std::runtime_error(message)
{
}

////////////////////////////////////////////
// CapacityError methods
////////////////////////////////////////////

CapacityError::CapacityError(
    uint64_t fileSize,
    uint64_t blocksRequired,
    uint64_t totalBytes,
    uint64_t usedBytes,
    uint64_t freeBytes,
    std::string hint
)
    : BlockPoolError(
        ErrorCode::CAPACITY_ERROR,
        buildMessage(fileSize, blocksRequired, totalBytes, usedBytes, freeBytes, hint)
      ),
      fileSize(fileSize),
      blocksRequired(blocksRequired),
      totalBytes(totalBytes),
      usedBytes(usedBytes),
      freeBytes(freeBytes),
      hint(hint)
{
}

std::string CapacityError::buildMessage(
    uint64_t fileSize,
    uint64_t blocksRequired,
    uint64_t totalBytes,
    uint64_t usedBytes,
    uint64_t freeBytes,
    const std::string &hint
)
{
    std::ostringstream oss;
    oss << "insufficient capacity: need " << fileSize << " bytes ("
        << blocksRequired << " blocks), "
        << "total " << totalBytes << " bytes, "
        << "used " << usedBytes << " bytes, "
        << "free " << freeBytes << " bytes";
    if (!hint.empty())
        oss << " - " << hint;
    return oss.str();
}

json::value CapacityError::details() const
{
    json::value d = json::value::object();
    d[U("fileSize")] = json::value::number(fileSize);
    d[U("blocksRequired")] = json::value::number(blocksRequired);
    d[U("totalBytes")] = json::value::number(totalBytes);
    d[U("usedBytes")] = json::value::number(usedBytes);
    d[U("freeBytes")] = json::value::number(freeBytes);
    d[U("hint")] = json::value::string(hint);
    return d;
}

CapacityError CapacityError::fromDetails(const json::value &details)
{
    auto field = [&details](const char *name) -> uint64_t {
        if (!details.has_field(U(name)))
            return 0;
        return details.at(U(name)).as_number().to_uint64();
    };

    std::string hint = details.has_field(U("hint")) ? details.at(U("hint")).as_string() : "";

    return CapacityError(
        field("fileSize"),
        field("blocksRequired"),
        field("totalBytes"),
        field("usedBytes"),
        field("freeBytes"),
        hint
    );
}

////////////////////////////////////////////
// BlockUnavailableError methods
////////////////////////////////////////////

BlockUnavailableError::BlockUnavailableError(std::string fileName, uint32_t blockIndex, const std::string &reason)
    : BlockPoolError(
        ErrorCode::BLOCK_UNAVAILABLE,
        "block " + std::to_string(blockIndex) + " of '" + fileName + "' is unavailable: " + reason
      ),
      fileName(fileName),
      blockIndex(blockIndex),
      reason(reason)
{
}

json::value BlockUnavailableError::details() const
{
    json::value d = json::value::object();
    d[U("fileName")] = json::value::string(fileName);
    d[U("blockIndex")] = json::value::number(blockIndex);
    d[U("reason")] = json::value::string(reason);
    return d;
}

////////////////////////////////////////////
// ErrorCodes
////////////////////////////////////////////

namespace ErrorCodes
{
    namespace
    {
        const std::vector<std::pair<ErrorCode, std::string>> codeNames = {
            {ErrorCode::IO_ERROR, "IO_ERROR"},
            {ErrorCode::INTEGRITY_ERROR, "INTEGRITY_ERROR"},
            {ErrorCode::CAPACITY_ERROR, "CAPACITY_ERROR"},
            {ErrorCode::NO_CAPACITY, "NO_CAPACITY"},
            {ErrorCode::BLOCK_UNAVAILABLE, "BLOCK_UNAVAILABLE"},
            {ErrorCode::NODE_UNREACHABLE, "NODE_UNREACHABLE"},
            {ErrorCode::NOT_FOUND, "NOT_FOUND"},
            {ErrorCode::FILE_EXISTS, "FILE_EXISTS"},
            {ErrorCode::PROTOCOL_ERROR, "PROTOCOL_ERROR"},
            {ErrorCode::INTERNAL_ERROR, "INTERNAL_ERROR"}
        };
    }

    std::string toString(ErrorCode code)
    {
        for (auto &[c, name] : codeNames)
        {
            if (c == code)
                return name;
        }
        return "INTERNAL_ERROR";
    }

    ErrorCode fromString(const std::string &name)
    {
        for (auto &[c, n] : codeNames)
        {
            if (n == name)
                return c;
        }
        return ErrorCode::INTERNAL_ERROR;
    }

    uint16_t httpStatus(ErrorCode code)
    {
        switch (code)
        {
            case ErrorCode::NOT_FOUND:          return 404;
            case ErrorCode::FILE_EXISTS:        return 409;
            case ErrorCode::PROTOCOL_ERROR:     return 400;
            case ErrorCode::INTEGRITY_ERROR:    return 422;
            case ErrorCode::CAPACITY_ERROR:     return 507;
            case ErrorCode::NO_CAPACITY:        return 507;
            case ErrorCode::BLOCK_UNAVAILABLE:  return 503;
            case ErrorCode::NODE_UNREACHABLE:   return 504;
            default:                            return 500;
        }
    }

    void throwError(ErrorCode code, const std::string &message, const json::value &details)
    {
        switch (code)
        {
            case ErrorCode::IO_ERROR:
                throw IOError(message);
            case ErrorCode::INTEGRITY_ERROR:
                throw IntegrityError(message);
            case ErrorCode::CAPACITY_ERROR:
                throw CapacityError::fromDetails(details);
            case ErrorCode::NO_CAPACITY:
                throw NoCapacityError(message);
            case ErrorCode::BLOCK_UNAVAILABLE:
            {
                if (details.has_field(U("fileName")) && details.has_field(U("blockIndex")) && details.has_field(U("reason")))
                {
                    throw BlockUnavailableError(
                        details.at(U("fileName")).as_string(),
                        details.at(U("blockIndex")).as_number().to_uint32(),
                        details.at(U("reason")).as_string()
                    );
                }
                throw BlockUnavailableError("", 0, message);
            }
            case ErrorCode::NODE_UNREACHABLE:
                throw NodeUnreachableError(message);
            case ErrorCode::NOT_FOUND:
                throw NotFoundError(message);
            case ErrorCode::FILE_EXISTS:
                throw FileExistsError(message);
            case ErrorCode::PROTOCOL_ERROR:
                throw ProtocolError(message);
            default:
                throw BlockPoolError(ErrorCode::INTERNAL_ERROR, message);
        }
    }
};

////////////////////////////////////////////
// Errors tests
////////////////////////////////////////////
namespace ErrorsTests
{
    void testCapacityErrorCarriesNumbers()
    {
        CapacityError e(5u << 20, 5, 6u << 20, 2u << 20, 4u << 20, "add nodes");

        ASSERT_THAT(e.code() == ErrorCode::CAPACITY_ERROR);
        ASSERT_THAT(e.blocksRequired == 5);
        ASSERT_THAT(e.freeBytes == (4u << 20));

        std::string message = e.what();
        ASSERT_THAT(message.find("5 blocks") != std::string::npos);
        ASSERT_THAT(message.find("add nodes") != std::string::npos);

        CapacityError rebuilt = CapacityError::fromDetails(e.details());
        ASSERT_THAT(rebuilt.fileSize == e.fileSize);
        ASSERT_THAT(rebuilt.totalBytes == e.totalBytes);
        ASSERT_THAT(rebuilt.usedBytes == e.usedBytes);
        ASSERT_THAT(rebuilt.hint == e.hint);
    }

    void testErrorCodeNamesRoundTrip()
    {
        std::vector<ErrorCode> codes = {
            ErrorCode::IO_ERROR, ErrorCode::INTEGRITY_ERROR, ErrorCode::CAPACITY_ERROR,
            ErrorCode::NO_CAPACITY, ErrorCode::BLOCK_UNAVAILABLE, ErrorCode::NODE_UNREACHABLE,
            ErrorCode::NOT_FOUND, ErrorCode::FILE_EXISTS, ErrorCode::PROTOCOL_ERROR
        };

        for (auto code : codes)
            ASSERT_THAT(ErrorCodes::fromString(ErrorCodes::toString(code)) == code);

        ASSERT_THAT(ErrorCodes::fromString("bogus") == ErrorCode::INTERNAL_ERROR);
        ASSERT_THAT(ErrorCodes::httpStatus(ErrorCode::NOT_FOUND) == 404);
    }

    void testThrowErrorRebuildsType()
    {
        BlockUnavailableError original("video.mp4", 3, "primary and replica down");

        bool caught = false;
        try
        {
            ErrorCodes::throwError(original.code(), original.what(), original.details());
        }
        catch (const BlockUnavailableError &e)
        {
            caught = true;
            ASSERT_THAT(e.fileName == "video.mp4");
            ASSERT_THAT(e.blockIndex == 3);
            ASSERT_THAT(e.reason == "primary and replica down");
        }
        ASSERT_THAT(caught);

        ASSERT_THROWS(
            ErrorCodes::throwError(ErrorCode::NOT_FOUND, "no block 7", json::value::object()),
            NotFoundError
        );
    }

    void runAll()
    {
        TestUtils::printSuiteHeader("Errors Tests");

        std::vector<std::pair<std::string, std::function<void()>>> tests = {
            TEST(testCapacityErrorCarriesNumbers),
            TEST(testErrorCodeNamesRoundTrip),
            TEST(testThrowErrorRebuildsType)
        };

        for (auto &[name, func] : tests)
        {
            TestUtils::runTest(name, func);
        }
    }
};
