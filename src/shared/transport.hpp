#pragma once

#include <cpprest/json.h>

#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <vector>

#include "errors.hpp"

using namespace web;

/**
 * Every message kind understood by a node agent or the coordinator.
 */
enum class MessageKind
{
    // node agent
    PING,
    HEARTBEAT,
    STORE_BLOCK,
    GET_BLOCK,
    GET_STATUS,
    DELETE_BLOCK,
    LIST_BLOCKS,

    // coordinator client API
    UPLOAD_FILE,
    DOWNLOAD_FILE,
    LIST_FILES,
    FILE_INFO,
    CAN_ACCEPT,
    CLUSTER_STATUS
};

/**
 * A request: {kind, payload}.
 * 
 * `param` carries the single path parameter some kinds take
 * (block id, file name or file size); `body` carries the payload.
 * 
 * `timeout` overrides the transport's default deadline for this call
 * when non-zero.
 */
struct Request
{
    MessageKind kind;
    std::string param;
    std::vector<unsigned char> body;
    std::chrono::milliseconds timeout{0};

    Request(MessageKind kind, std::string param = "", std::vector<unsigned char> body = {});
};

/**
 * A response: {status: ok|error, result|error_detail}.
 */
struct Response
{
    bool ok;

    /* result payload (ok responses only) */
    std::vector<unsigned char> body;

    /* error detail (error responses only) */
    ErrorCode errorCode;
    std::string errorMessage;
    json::value errorFields;

    static Response success(std::vector<unsigned char> body = {});
    static Response success(const json::value &result);
    static Response failure(const BlockPoolError &error);
    static Response failure(ErrorCode code, const std::string &message);

    /**
     * Re-throws the error carried by this response as its matching
     * exception type (see ErrorCodes::throwError()); no-op when ok.
     */
    void throwIfError() const;

    /* Parses `body` as JSON; throws ProtocolError if it isn't */
    json::value bodyAsJson() const;

private:
    Response();
};

/**
 * Server side of the transport: anything that answers requests.
 */
class RequestHandler
{
public:
    virtual ~RequestHandler() = default;

    /**
     * Answers `request`.
     * 
     * NOTE: may throw; callers go through RequestDispatch::dispatch(),
     *       which turns exceptions into error responses.
     */
    virtual Response handle(const Request &request) = 0;
};

/**
 * Client side of the transport.
 * 
 * Each call opens its own connection and closes it afterwards;
 * nothing is pooled or kept alive between calls.
 */
class Transport
{
public:
    virtual ~Transport() = default;

    /**
     * Sends `request` to the process at `address` (e.g. "http://10.0.0.2:9002")
     * and waits for its response, up to request.timeout (or the
     * transport's own timeout when that is zero).
     * 
     * Throws:
     *      NodeUnreachableError - on timeout or connection refusal; the caller
     *                             treats the remote as unreachable for this
     *                             call only
     */
    virtual Response call(const std::string &address, const Request &request) = 0;
};

/**
 * In-process transport: routes calls straight to bound handlers.
 * 
 * Used to run several node agents and a coordinator inside a single
 * process (tests), with the ability to make individual addresses
 * unreachable.
 * 
 * A call whose handler takes longer than its deadline fails with
 * NodeUnreachableError once the handler returns, as a remote caller
 * would see it; the handler's work is not undone.
 */
class LoopbackTransport : public Transport
{
public:
    /* A call seen by the transport, in order */
    struct CallRecord
    {
        std::string address;
        MessageKind kind;
        std::string param;
    };

    void bind(const std::string &address, RequestHandler *handler);
    void unbind(const std::string &address);

    /* An unreachable address fails every call with NodeUnreachableError */
    void setReachable(const std::string &address, bool reachable);

    /* Deadline for requests that carry none; zero (default) means no deadline */
    void setTimeout(std::chrono::milliseconds timeout);

    Response call(const std::string &address, const Request &request) override;

    std::vector<CallRecord> calls();
    void clearCalls();

private:
    std::mutex mtx;
    std::map<std::string, RequestHandler*> handlers;
    std::set<std::string> unreachable;
    std::vector<CallRecord> callLog;
    std::chrono::milliseconds defaultTimeout{0};
};

namespace MessageKinds
{
    /* e.g. MessageKind::STORE_BLOCK -> "STORE_BLOCK" */
    std::string toString(MessageKind kind);
}

namespace RequestDispatch
{
    /**
     * Calls handler.handle(request), converting any exception it throws
     * into an error response.
     */
    Response dispatch(RequestHandler &handler, const Request &request);
}

/**
 * Mapping between message kinds and HTTP method + path.
 * 
 *      PING            GET  /ping
 *      HEARTBEAT       POST /heartbeat
 *      STORE_BLOCK     PUT  /block/{id}
 *      GET_BLOCK       GET  /block/{id}
 *      GET_STATUS      GET  /status
 *      DELETE_BLOCK    DELETE /block/{id}
 *      LIST_BLOCKS     GET  /blocks
 *      UPLOAD_FILE     PUT  /files/{name}
 *      DOWNLOAD_FILE   GET  /files/{name}
 *      LIST_FILES      GET  /files
 *      FILE_INFO       GET  /info/{name}
 *      CAN_ACCEPT      GET  /capacity/{size}
 *      CLUSTER_STATUS  GET  /stats
 */
namespace Routes
{
    struct Route
    {
        std::string method;
        std::string path;
    };

    Route toHttp(const Request &request);

    /**
     * Inverse of toHttp(); returns the request kind and its parameter.
     * 
     * Throws:
     *      ProtocolError - if no message kind matches
     */
    std::pair<MessageKind, std::string> fromHttp(const std::string &method, const std::string &relativeUri);
}

namespace TransportTests
{
    void testRoutesRoundTrip();
    void testUnknownRouteRejected();
    void testDispatchConvertsExceptions();
    void testLoopbackUnreachable();
    void testLoopbackDeadline();
    void testErrorResponseRethrowsType();
    void runAll();
}
