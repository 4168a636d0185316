#include <functional>
#include <iostream>
#include <thread>

#include "http_transport.hpp"
#include "errors.hpp"
#include "test_utils.hpp"

////////////////////////////////////////////
// HttpTransport methods
////////////////////////////////////////////

HttpTransport::HttpTransport(std::chrono::milliseconds timeout)
    : timeout(timeout)
{
}

Response HttpTransport::call(const std::string &address, const Request &request)
{
    Routes::Route route = Routes::toHttp(request);

    http_client_config clientConfig;
    clientConfig.set_timeout(request.timeout.count() > 0 ? request.timeout : timeout);

    try
    {
        http_client client(U(address), clientConfig);

        http_request req(route.method);
        req.set_request_uri(U(route.path));
        if (!request.body.empty())
            req.set_body(request.body);

        http_response response = client.request(req).get();
        std::vector<unsigned char> body = response.extract_vector().get();

        if (response.status_code() == status_codes::OK)
            return Response::success(std::move(body));

        /**
         * Error response: rebuild {code, detail, fields} from the JSON body.
         */
        json::value error;
        try
        {
            error = json::value::parse(std::string(body.begin(), body.end()));
        }
        catch (const json::json_exception &)
        {
            return Response::failure(
                ErrorCode::INTERNAL_ERROR,
                address + " replied with status " + std::to_string(response.status_code()));
        }

        if (!error.is_object() || !error.has_field(U("error")))
        {
            return Response::failure(
                ErrorCode::INTERNAL_ERROR,
                address + " replied with status " + std::to_string(response.status_code()));
        }

        Response failure = Response::failure(
            ErrorCodes::fromString(error.at(U("error")).as_string()),
            error.has_field(U("detail")) ? error.at(U("detail")).as_string() : "");
        if (error.has_field(U("fields")))
            failure.errorFields = error.at(U("fields"));
        return failure;
    }
    catch (const http_exception &e)
    {
        throw NodeUnreachableError(address + ": " + e.what());
    }
    catch (const pplx::task_canceled &)
    {
        throw NodeUnreachableError(address + ": request cancelled");
    }
    catch (const uri_exception &e)
    {
        throw NodeUnreachableError("bad address " + address + ": " + e.what());
    }
}

////////////////////////////////////////////
// HttpServer methods
////////////////////////////////////////////

HttpServer::HttpServer(const std::string &listenAddress, RequestHandler &handler, std::string component)
    : listenAddress(listenAddress),
      listener(U(listenAddress)),
      handler(handler),
      log(std::move(component))
{
    listener.support([this](http_request request) {
        this->router(request);
    });
}

void HttpServer::open()
{
    try
    {
        listener.open().wait();
    }
    catch (const std::exception &e)
    {
        throw IOError("unable to listen on " + listenAddress + ": " + e.what());
    }
    log.info("listening on " + listenAddress);
}

void HttpServer::close()
{
    try
    {
        listener.close().wait();
    }
    catch (const std::exception &e)
    {
        log.warn(std::string("error closing listener: ") + e.what());
    }
}

void HttpServer::router(http_request request)
{
    std::string method = request.method();
    std::string relativeUri = request.relative_uri().to_string();

    Response response = Response::failure(ErrorCode::INTERNAL_ERROR, "unhandled");
    try
    {
        auto [kind, param] = Routes::fromHttp(method, relativeUri);
        std::vector<unsigned char> body = request.extract_vector().get();

        log.debug(method + " " + relativeUri + " received (" + std::to_string(body.size()) + " bytes)");
        response = RequestDispatch::dispatch(handler, Request(kind, param, std::move(body)));
    }
    catch (const BlockPoolError &e)
    {
        response = Response::failure(e);
    }
    catch (const std::exception &e)
    {
        response = Response::failure(ErrorCode::PROTOCOL_ERROR, e.what());
    }

    try
    {
        if (response.ok)
        {
            http_response reply(status_codes::OK);
            reply.set_body(response.body);
            request.reply(reply).wait();
            return;
        }

        log.warn(method + " " + relativeUri + " failed: "
            + ErrorCodes::toString(response.errorCode) + " " + response.errorMessage);

        json::value error = json::value::object();
        error[U("error")] = json::value::string(U(ErrorCodes::toString(response.errorCode)));
        error[U("detail")] = json::value::string(U(response.errorMessage));
        error[U("fields")] = response.errorFields;

        request.reply(ErrorCodes::httpStatus(response.errorCode), error).wait();
    }
    catch (const std::exception &e)
    {
        log.warn(std::string("failed to send reply: ") + e.what());
    }
}

////////////////////////////////////////////
// HttpTransport tests
////////////////////////////////////////////
namespace HttpTransportTests
{
    const std::string TEST_ADDRESS = "http://127.0.0.1:19780";

    class BlockEchoHandler : public RequestHandler
    {
    public:
        Response handle(const Request &request) override
        {
            if (request.kind == MessageKind::FILE_INFO)
                throw BlockUnavailableError(request.param, 2, "both copies down");
            if (request.kind == MessageKind::GET_STATUS)
            {
                std::this_thread::sleep_for(std::chrono::milliseconds(400));
                return Response::success(std::vector<unsigned char>{1});
            }
            if (request.kind == MessageKind::STORE_BLOCK)
            {
                std::vector<unsigned char> body = request.body;
                body.insert(body.end(), request.param.begin(), request.param.end());
                return Response::success(body);
            }
            return Response::success(std::vector<unsigned char>());
        }
    };

    void testRoundTripOverLocalhost()
    {
        BlockEchoHandler handler;
        HttpServer server(TEST_ADDRESS, handler, "http-test");
        server.open();

        HttpTransport transport(std::chrono::milliseconds(2000));

        std::vector<unsigned char> payload(300000, 0xab);
        Response response = transport.call(TEST_ADDRESS, Request(MessageKind::STORE_BLOCK, "17", payload));

        server.close();

        ASSERT_THAT(response.ok);
        ASSERT_THAT(response.body.size() == payload.size() + 2);
        ASSERT_THAT(response.body[0] == 0xab);
        ASSERT_THAT(response.body[payload.size()] == '1');
    }

    void testErrorRebuiltOnClient()
    {
        BlockEchoHandler handler;
        HttpServer server(TEST_ADDRESS, handler, "http-test");
        server.open();

        HttpTransport transport(std::chrono::milliseconds(2000));
        Response response = transport.call(TEST_ADDRESS, Request(MessageKind::FILE_INFO, "movie.mkv"));

        server.close();

        ASSERT_THAT(!response.ok);
        ASSERT_THAT(response.errorCode == ErrorCode::BLOCK_UNAVAILABLE);

        bool caught = false;
        try
        {
            response.throwIfError();
        }
        catch (const BlockUnavailableError &e)
        {
            caught = true;
            ASSERT_THAT(e.fileName == "movie.mkv");
            ASSERT_THAT(e.blockIndex == 2);
        }
        ASSERT_THAT(caught);
    }

    void testRefusedConnectionIsUnreachable()
    {
        HttpTransport transport(std::chrono::milliseconds(500));
        ASSERT_THROWS(
            transport.call("http://127.0.0.1:19781", Request(MessageKind::PING)),
            NodeUnreachableError
        );
    }

    void testRequestTimeoutOverridesDefault()
    {
        BlockEchoHandler handler;
        HttpServer server(TEST_ADDRESS, handler, "http-test");
        server.open();

        HttpTransport transport(std::chrono::milliseconds(100));

        Request patient(MessageKind::GET_STATUS);
        patient.timeout = std::chrono::milliseconds(3000);
        Response response = transport.call(TEST_ADDRESS, patient);
        ASSERT_THAT(response.ok);

        ASSERT_THROWS(transport.call(TEST_ADDRESS, Request(MessageKind::GET_STATUS)), NodeUnreachableError);

        server.close();
    }

    void runAll()
    {
        TestUtils::printSuiteHeader("HTTP Transport Tests");

        std::vector<std::pair<std::string, std::function<void()>>> tests = {
            TEST(testRoundTripOverLocalhost),
            TEST(testErrorRebuiltOnClient),
            TEST(testRefusedConnectionIsUnreachable),
            TEST(testRequestTimeoutOverridesDefault)
        };

        for (auto &[name, func] : tests)
        {
            TestUtils::runTest(name, func);
        }
    }
}
