#pragma once

#include <cpprest/http_client.h>
#include <cpprest/http_listener.h>

#include <chrono>
#include <string>

#include "logger.hpp"
#include "transport.hpp"

using namespace web;
using namespace web::http;
using namespace web::http::client;
using namespace web::http::experimental::listener;

/**
 * Transport over HTTP/1.1, using cpprestsdk's http_client.
 * 
 * A fresh http_client is created for every call (no pooling). Each
 * call waits up to request.timeout, or the constructor's timeout when
 * the request carries none.
 */
class HttpTransport : public Transport
{
public:
    explicit HttpTransport(std::chrono::milliseconds timeout);

    Response call(const std::string &address, const Request &request) override;

private:
    std::chrono::milliseconds timeout;
};

/**
 * HTTP front of a RequestHandler, using cpprestsdk's http_listener.
 * 
 * Maps method + path onto a message kind (see Routes), hands the
 * request to the handler and replies with its response. Error responses
 * are sent with a non-2xx status and a JSON body:
 * 
 *      {"error": "NOT_FOUND", "detail": "...", "fields": {...}}
 */
class HttpServer
{
public:
    HttpServer(const std::string &listenAddress, RequestHandler &handler, std::string component);

    /**
     * Starts accepting requests.
     * 
     * Throws:
     *      IOError - if the listener can't be opened
     */
    void open();
    void close();

private:
    std::string listenAddress;
    http_listener listener;
    RequestHandler &handler;
    ComponentLogger log;

    void router(http_request request);
};

namespace HttpTransportTests
{
    void testRoundTripOverLocalhost();
    void testErrorRebuiltOnClient();
    void testRefusedConnectionIsUnreachable();
    void testRequestTimeoutOverridesDefault();
    void runAll();
}
