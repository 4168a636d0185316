#pragma once

#include <cpprest/json.h>
#include <cstdint>
#include <stdexcept>
#include <string>

using namespace web;

/**
 * Error codes carried on the wire in error responses.
 * 
 * Each code maps 1:1 onto one of the exception types below, so an
 * error raised on a remote process can be re-thrown locally as the
 * same type (see ErrorCodes::throwError()).
 */
enum class ErrorCode
{
    IO_ERROR,
    INTEGRITY_ERROR,
    CAPACITY_ERROR,
    NO_CAPACITY,
    BLOCK_UNAVAILABLE,
    NODE_UNREACHABLE,
    NOT_FOUND,
    FILE_EXISTS,
    PROTOCOL_ERROR,
    INTERNAL_ERROR
};

/**
 * Base of all blockpool errors.
 */
class BlockPoolError : public std::runtime_error
{
public:
    BlockPoolError(ErrorCode code, const std::string &message);

    ErrorCode code() const;

    /**
     * Structured fields sent alongside the error message.
     * 
     * NOTE: empty object unless overridden.
     */
    virtual json::value details() const;

private:
    ErrorCode errorCode;
};

/* Local read/write failure */
class IOError : public BlockPoolError
{
public:
    explicit IOError(const std::string &message);
};

/* Hash mismatch, or a gap in block indices, on reconstruction */
class IntegrityError : public BlockPoolError
{
public:
    explicit IntegrityError(const std::string &message);
};

/**
 * Insufficient free space for a file (or, on a node, for a block).
 * 
 * Carries exact numbers so the caller can decide to free space
 * or add nodes.
 */
class CapacityError : public BlockPoolError
{
public:
    uint64_t fileSize;
    uint64_t blocksRequired;
    uint64_t totalBytes;
    uint64_t usedBytes;
    uint64_t freeBytes;
    std::string hint;

    CapacityError(
        uint64_t fileSize,
        uint64_t blocksRequired,
        uint64_t totalBytes,
        uint64_t usedBytes,
        uint64_t freeBytes,
        std::string hint
    );

    json::value details() const override;

    static CapacityError fromDetails(const json::value &details);

private:
    static std::string buildMessage(
        uint64_t fileSize,
        uint64_t blocksRequired,
        uint64_t totalBytes,
        uint64_t usedBytes,
        uint64_t freeBytes,
        const std::string &hint
    );
};

/* Placement cannot find two distinct live nodes with room */
class NoCapacityError : public BlockPoolError
{
public:
    explicit NoCapacityError(const std::string &message);
};

/* Both the primary and replica of a block are unreachable */
class BlockUnavailableError : public BlockPoolError
{
public:
    std::string fileName;
    uint32_t blockIndex;
    std::string reason;

    BlockUnavailableError(std::string fileName, uint32_t blockIndex, const std::string &reason);

    json::value details() const override;
};

/* Transport timeout or connection refused */
class NodeUnreachableError : public BlockPoolError
{
public:
    explicit NodeUnreachableError(const std::string &message);
};

/* Requested block (or file) is absent */
class NotFoundError : public BlockPoolError
{
public:
    explicit NotFoundError(const std::string &message);
};

/* Upload of a file name that is already stored */
class FileExistsError : public BlockPoolError
{
public:
    explicit FileExistsError(const std::string &message);
};

/* Malformed payload or unknown message kind */
class ProtocolError : public BlockPoolError
{
public:
    explicit ProtocolError(const std::string &message);
};

/**
 * Invalid or unreadable config.json.
 * 
 * NOTE: never sent over the wire.
 */
class ConfigError : public std::runtime_error
{
public:
    explicit ConfigError(const std::string &message);
};

namespace ErrorCodes
{
    /* e.g. ErrorCode::NOT_FOUND -> "NOT_FOUND" */
    std::string toString(ErrorCode code);

    /* Inverse of toString(); unknown names map to INTERNAL_ERROR */
    ErrorCode fromString(const std::string &name);

    /* HTTP status used when sending an error of the given code */
    uint16_t httpStatus(ErrorCode code);

    /**
     * Throws the exception type matching `code`, rebuilt from the
     * message and structured `details` of an error response.
     */
    void throwError(ErrorCode code, const std::string &message, const json::value &details);
};

namespace ErrorsTests
{
    void testCapacityErrorCarriesNumbers();
    void testErrorCodeNamesRoundTrip();
    void testThrowErrorRebuildsType();
    void runAll();
};
