#pragma once

#include <cpprest/json.h>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>

#include "client_config.hpp"
#include "logger.hpp"
#include "transport.hpp"

using namespace web;

namespace fs = std::filesystem;

/**
 * Client side of the coordinator's file API.
 * 
 * Every call goes through a Transport; an error response is re-thrown
 * as the exception type the coordinator raised (e.g. a CapacityError
 * with the coordinator's numbers).
 * 
 * Small calls wait up to requestTimeoutMs. Uploads and downloads wait
 * for the coordinator's worst case instead: every block's node calls
 * (two attempts per copy on upload, primary then replica on download)
 * each running to requestTimeoutMs, plus one more for the request itself.
 */
class CoordinatorClient
{
public:
    CoordinatorClient(Transport &transport, const ClientConfig &config);

    /**
     * Uploads the file at `path` as `name` (its filename if empty) and
     * returns the stored file's info.
     * 
     * The coordinator is asked whether the file fits before any file
     * bytes are sent.
     * 
     * Throws:
     *      IOError       - if `path` can't be read
     *      CapacityError - if the cluster can't take the file
     *      (any other error raised by the coordinator)
     */
    json::value upload(const fs::path &path, std::string name = "");

    /**
     * Downloads file `name` to `destination`.
     * 
     * The file is written beside `destination` and renamed into place
     * only once the whole, verified file arrived; on failure no
     * output file is left behind.
     */
    void download(const std::string &name, const fs::path &destination);

    /* Summaries of every stored file */
    json::value list();

    /* A file's info, including its block placements */
    json::value info(const std::string &name);

    /* Node table and totals; `table` holds the printable rendering */
    json::value stats();

    /**
     * Capacity report for a file of `fileSize` bytes.
     * 
     * Throws:
     *      CapacityError - if the file wouldn't fit
     */
    json::value canAccept(uint64_t fileSize);

    /* Deadline of an UPLOAD_FILE / DOWNLOAD_FILE moving `numBlocks` blocks */
    std::chrono::milliseconds uploadTimeout(uint64_t numBlocks) const;
    std::chrono::milliseconds downloadTimeout(uint64_t numBlocks) const;

private:
    Transport &transport;
    std::string coordinatorAddress;
    std::chrono::milliseconds requestTimeout;
    uint32_t blockSize;
    ComponentLogger log;

    Response call(const Request &request);
};

////////////////////////////////////////////
// CoordinatorClient tests
////////////////////////////////////////////
namespace CoordinatorClientTests
{
    void testPutGetRoundTrip();
    void testFailedDownloadLeavesNoFile();
    void testCapacityErrorReachesClient();
    void testListInfoStats();
    void testLongTransfersOutlastRequestTimeout();
    void testCoordinatorWithoutAgentAnswersNoPing();
    void runAll();
}
