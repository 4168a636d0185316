#include <functional>
#include <iostream>
#include <thread>

#include "transport.hpp"
#include "test_utils.hpp"
#include "utils.hpp"

////////////////////////////////////////////
// Request / Response methods
////////////////////////////////////////////

Request::Request(MessageKind kind, std::string param, std::vector<unsigned char> body)
    : kind(kind),
      param(std::move(param)),
      body(std::move(body))
{
}

Response::Response()
    : ok(true),
      errorCode(ErrorCode::INTERNAL_ERROR),
      errorFields(json::value::object())
{
}

Response Response::success(std::vector<unsigned char> body)
{
    Response response;
    response.body = std::move(body);
    return response;
}

Response Response::success(const json::value &result)
{
    std::string serialized = result.serialize();
    return success(std::vector<unsigned char>(serialized.begin(), serialized.end()));
}

Response Response::failure(const BlockPoolError &error)
{
    Response response;
    response.ok = false;
    response.errorCode = error.code();
    response.errorMessage = error.what();
    response.errorFields = error.details();
    return response;
}

Response Response::failure(ErrorCode code, const std::string &message)
{
    Response response;
    response.ok = false;
    response.errorCode = code;
    response.errorMessage = message;
    return response;
}

void Response::throwIfError() const
{
    if (ok)
        return;
    ErrorCodes::throwError(errorCode, errorMessage, errorFields);
}

json::value Response::bodyAsJson() const
{
    try
    {
        return json::value::parse(std::string(body.begin(), body.end()));
    }
    catch (const json::json_exception &e)
    {
        throw ProtocolError(std::string("response body is not JSON: ") + e.what());
    }
}

////////////////////////////////////////////
// LoopbackTransport methods
////////////////////////////////////////////

void LoopbackTransport::bind(const std::string &address, RequestHandler *handler)
{
    std::lock_guard<std::mutex> lock(mtx);
    handlers[address] = handler;
}

void LoopbackTransport::unbind(const std::string &address)
{
    std::lock_guard<std::mutex> lock(mtx);
    handlers.erase(address);
}

void LoopbackTransport::setTimeout(std::chrono::milliseconds timeout)
{
    std::lock_guard<std::mutex> lock(mtx);
    defaultTimeout = timeout;
}

void LoopbackTransport::setReachable(const std::string &address, bool reachable)
{
    std::lock_guard<std::mutex> lock(mtx);
    if (reachable)
        unreachable.erase(address);
    else
        unreachable.insert(address);
}

Response LoopbackTransport::call(const std::string &address, const Request &request)
{
    RequestHandler *handler = nullptr;
    std::chrono::milliseconds deadline = request.timeout;
    {
        std::lock_guard<std::mutex> lock(mtx);
        callLog.push_back({address, request.kind, request.param});

        auto it = handlers.find(address);
        if (it == handlers.end() || unreachable.count(address))
            throw NodeUnreachableError("connection refused: " + address);
        handler = it->second;
        if (deadline.count() == 0)
            deadline = defaultTimeout;
    }

    auto start = std::chrono::steady_clock::now();

    // handlers may call back into the transport, so the lock is not held here
    Response response = RequestDispatch::dispatch(*handler, request);

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
    if (deadline.count() > 0 && elapsed > deadline)
    {
        throw NodeUnreachableError(address + ": no reply within " + std::to_string(deadline.count()) + " ms");
    }
    return response;
}

std::vector<LoopbackTransport::CallRecord> LoopbackTransport::calls()
{
    std::lock_guard<std::mutex> lock(mtx);
    return callLog;
}

void LoopbackTransport::clearCalls()
{
    std::lock_guard<std::mutex> lock(mtx);
    callLog.clear();
}

////////////////////////////////////////////
// MessageKinds / RequestDispatch
////////////////////////////////////////////

namespace MessageKinds
{
    std::string toString(MessageKind kind)
    {
        switch (kind)
        {
            case MessageKind::PING:           return "PING";
            case MessageKind::HEARTBEAT:      return "HEARTBEAT";
            case MessageKind::STORE_BLOCK:    return "STORE_BLOCK";
            case MessageKind::GET_BLOCK:      return "GET_BLOCK";
            case MessageKind::GET_STATUS:     return "GET_STATUS";
            case MessageKind::DELETE_BLOCK:   return "DELETE_BLOCK";
            case MessageKind::LIST_BLOCKS:    return "LIST_BLOCKS";
            case MessageKind::UPLOAD_FILE:    return "UPLOAD_FILE";
            case MessageKind::DOWNLOAD_FILE:  return "DOWNLOAD_FILE";
            case MessageKind::LIST_FILES:     return "LIST_FILES";
            case MessageKind::FILE_INFO:      return "FILE_INFO";
            case MessageKind::CAN_ACCEPT:     return "CAN_ACCEPT";
            case MessageKind::CLUSTER_STATUS: return "CLUSTER_STATUS";
        }
        return "UNKNOWN";
    }
}

namespace RequestDispatch
{
    Response dispatch(RequestHandler &handler, const Request &request)
    {
        try
        {
            return handler.handle(request);
        }
        catch (const BlockPoolError &e)
        {
            return Response::failure(e);
        }
        catch (const json::json_exception &e)
        {
            return Response::failure(ErrorCode::PROTOCOL_ERROR, e.what());
        }
        catch (const std::exception &e)
        {
            return Response::failure(ErrorCode::INTERNAL_ERROR, e.what());
        }
    }
}

////////////////////////////////////////////
// Routes
////////////////////////////////////////////

namespace Routes
{
    Route toHttp(const Request &request)
    {
        std::string param = ApiUtils::encodeSegment(request.param);

        switch (request.kind)
        {
            case MessageKind::PING:           return {"GET", "/ping"};
            case MessageKind::HEARTBEAT:      return {"POST", "/heartbeat"};
            case MessageKind::STORE_BLOCK:    return {"PUT", "/block/" + param};
            case MessageKind::GET_BLOCK:      return {"GET", "/block/" + param};
            case MessageKind::GET_STATUS:     return {"GET", "/status"};
            case MessageKind::DELETE_BLOCK:   return {"DELETE", "/block/" + param};
            case MessageKind::LIST_BLOCKS:    return {"GET", "/blocks"};
            case MessageKind::UPLOAD_FILE:    return {"PUT", "/files/" + param};
            case MessageKind::DOWNLOAD_FILE:  return {"GET", "/files/" + param};
            case MessageKind::LIST_FILES:     return {"GET", "/files"};
            case MessageKind::FILE_INFO:      return {"GET", "/info/" + param};
            case MessageKind::CAN_ACCEPT:     return {"GET", "/capacity/" + param};
            case MessageKind::CLUSTER_STATUS: return {"GET", "/stats"};
        }
        throw ProtocolError("unknown message kind");
    }

    std::pair<MessageKind, std::string> fromHttp(const std::string &method, const std::string &relativeUri)
    {
        auto [endpoint, param] = ApiUtils::parsePath(relativeUri);

        if (method == "GET" && endpoint == "/ping" && param.empty())
            return {MessageKind::PING, ""};
        if (method == "POST" && endpoint == "/heartbeat" && param.empty())
            return {MessageKind::HEARTBEAT, ""};
        if (method == "PUT" && endpoint == "/block" && !param.empty())
            return {MessageKind::STORE_BLOCK, param};
        if (method == "GET" && endpoint == "/block" && !param.empty())
            return {MessageKind::GET_BLOCK, param};
        if (method == "GET" && endpoint == "/status" && param.empty())
            return {MessageKind::GET_STATUS, ""};
        if (method == "DELETE" && endpoint == "/block" && !param.empty())
            return {MessageKind::DELETE_BLOCK, param};
        if (method == "GET" && endpoint == "/blocks" && param.empty())
            return {MessageKind::LIST_BLOCKS, ""};
        if (method == "PUT" && endpoint == "/files" && !param.empty())
            return {MessageKind::UPLOAD_FILE, param};
        if (method == "GET" && endpoint == "/files")
            return param.empty()
                ? std::make_pair(MessageKind::LIST_FILES, std::string())
                : std::make_pair(MessageKind::DOWNLOAD_FILE, param);
        if (method == "GET" && endpoint == "/info" && !param.empty())
            return {MessageKind::FILE_INFO, param};
        if (method == "GET" && endpoint == "/capacity" && !param.empty())
            return {MessageKind::CAN_ACCEPT, param};
        if (method == "GET" && endpoint == "/stats" && param.empty())
            return {MessageKind::CLUSTER_STATUS, ""};

        throw ProtocolError("no such endpoint: " + method + " " + relativeUri);
    }
}

////////////////////////////////////////////
// Transport tests
////////////////////////////////////////////
namespace TransportTests
{
    class EchoHandler : public RequestHandler
    {
    public:
        Response handle(const Request &request) override
        {
            if (request.kind == MessageKind::GET_BLOCK)
                throw NotFoundError("block " + request.param + " not stored");
            if (request.kind == MessageKind::GET_STATUS)
                throw std::runtime_error("disk on fire");
            return Response::success(request.body);
        }
    };

    void testRoutesRoundTrip()
    {
        std::vector<Request> requests = {
            Request(MessageKind::PING),
            Request(MessageKind::HEARTBEAT),
            Request(MessageKind::STORE_BLOCK, "42"),
            Request(MessageKind::GET_BLOCK, "42"),
            Request(MessageKind::GET_STATUS),
            Request(MessageKind::DELETE_BLOCK, "42"),
            Request(MessageKind::LIST_BLOCKS),
            Request(MessageKind::UPLOAD_FILE, "my report.pdf"),
            Request(MessageKind::DOWNLOAD_FILE, "my report.pdf"),
            Request(MessageKind::LIST_FILES),
            Request(MessageKind::FILE_INFO, "a/b.txt"),
            Request(MessageKind::CAN_ACCEPT, "5242880"),
            Request(MessageKind::CLUSTER_STATUS)
        };

        for (auto &request : requests)
        {
            Routes::Route route = Routes::toHttp(request);
            auto [kind, param] = Routes::fromHttp(route.method, route.path);
            ASSERT_THAT(kind == request.kind);
            ASSERT_THAT(param == request.param);
        }
    }

    void testUnknownRouteRejected()
    {
        ASSERT_THROWS(Routes::fromHttp("DELETE", "/files/a.txt"), ProtocolError);
        ASSERT_THROWS(Routes::fromHttp("GET", "/nonsense"), ProtocolError);
        ASSERT_THROWS(Routes::fromHttp("PUT", "/block/"), ProtocolError);
    }

    void testDispatchConvertsExceptions()
    {
        EchoHandler handler;

        Response notFound = RequestDispatch::dispatch(handler, Request(MessageKind::GET_BLOCK, "7"));
        ASSERT_THAT(!notFound.ok);
        ASSERT_THAT(notFound.errorCode == ErrorCode::NOT_FOUND);

        Response internal = RequestDispatch::dispatch(handler, Request(MessageKind::GET_STATUS));
        ASSERT_THAT(!internal.ok);
        ASSERT_THAT(internal.errorCode == ErrorCode::INTERNAL_ERROR);
        ASSERT_THAT(internal.errorMessage == "disk on fire");

        Response echoed = RequestDispatch::dispatch(handler, Request(MessageKind::PING, "", {1, 2, 3}));
        ASSERT_THAT(echoed.ok);
        ASSERT_THAT(echoed.body == std::vector<unsigned char>({1, 2, 3}));
    }

    void testLoopbackUnreachable()
    {
        EchoHandler handler;
        LoopbackTransport transport;
        transport.bind("node-1", &handler);

        ASSERT_THAT(transport.call("node-1", Request(MessageKind::PING)).ok);

        transport.setReachable("node-1", false);
        ASSERT_THROWS(transport.call("node-1", Request(MessageKind::PING)), NodeUnreachableError);
        ASSERT_THROWS(transport.call("node-9", Request(MessageKind::PING)), NodeUnreachableError);

        transport.setReachable("node-1", true);
        ASSERT_THAT(transport.call("node-1", Request(MessageKind::PING)).ok);
        ASSERT_THAT(transport.calls().size() == 4);
    }

    class SleepyHandler : public RequestHandler
    {
    public:
        explicit SleepyHandler(std::chrono::milliseconds delay) : delay(delay) {}

        Response handle(const Request &request) override
        {
            std::this_thread::sleep_for(delay);
            handled++;
            return Response::success(request.body);
        }

        std::chrono::milliseconds delay;
        int handled = 0;
    };

    void testLoopbackDeadline()
    {
        SleepyHandler handler(std::chrono::milliseconds(40));
        LoopbackTransport transport;
        transport.bind("node-1", &handler);

        // no deadline by default
        ASSERT_THAT(transport.call("node-1", Request(MessageKind::PING)).ok);

        transport.setTimeout(std::chrono::milliseconds(10));
        ASSERT_THROWS(transport.call("node-1", Request(MessageKind::PING)), NodeUnreachableError);
        ASSERT_THAT(handler.handled == 2);

        // a per-request deadline overrides the default
        Request patient(MessageKind::PING);
        patient.timeout = std::chrono::milliseconds(2000);
        ASSERT_THAT(transport.call("node-1", patient).ok);
    }

    void testErrorResponseRethrowsType()
    {
        CapacityError original(10, 1, 100, 95, 5, "add nodes");
        Response response = Response::failure(original);

        bool caught = false;
        try
        {
            response.throwIfError();
        }
        catch (const CapacityError &e)
        {
            caught = true;
            ASSERT_THAT(e.freeBytes == 5);
            ASSERT_THAT(e.usedBytes == 95);
        }
        ASSERT_THAT(caught);

        Response::success().throwIfError();
    }

    void runAll()
    {
        TestUtils::printSuiteHeader("Transport Tests");

        std::vector<std::pair<std::string, std::function<void()>>> tests = {
            TEST(testRoutesRoundTrip),
            TEST(testUnknownRouteRejected),
            TEST(testDispatchConvertsExceptions),
            TEST(testLoopbackUnreachable),
            TEST(testLoopbackDeadline),
            TEST(testErrorResponseRethrowsType)
        };

        for (auto &[name, func] : tests)
        {
            TestUtils::runTest(name, func);
        }
    }
}
