#include <chrono>
#include <cstdlib>
#include <ctime>
#include <iostream>
#include <string>
#include <vector>

#include "client_config.hpp"
#include "coordinator_client.hpp"
#include "errors.hpp"
#include "http_transport.hpp"
#include "logger.hpp"
#include "utils.hpp"

namespace
{
    void printUsage()
    {
        std::cerr
            << "usage: blockpool_client <config.json> <command>\n"
            << "\n"
            << "commands:\n"
            << "    put <path> [name]     store a local file\n"
            << "    get <name> <path>     fetch a stored file to <path>\n"
            << "    ls                    list stored files\n"
            << "    info <name>           show a file's block placements\n"
            << "    stats                 show the node table\n"
            << "    check <bytes>         ask whether a file of <bytes> would fit\n";
    }

    std::string formatTime(int64_t secondsSinceEpoch)
    {
        std::time_t time = static_cast<std::time_t>(secondsSinceEpoch);
        char buffer[32];
        std::strftime(buffer, sizeof(buffer), "%Y-%m-%d %H:%M:%S", std::localtime(&time));
        return buffer;
    }

    void printFileInfo(const json::value &info)
    {
        std::cout << "name:     " << info.at(U("name")).as_string() << "\n"
                  << "size:     " << PrintUtils::formatNumBytes(info.at(U("size")).as_number().to_uint64()) << "\n"
                  << "blocks:   " << info.at(U("blockCount")).as_integer() << "\n"
                  << "uploaded: " << formatTime(info.at(U("uploadedAt")).as_number().to_int64()) << "\n"
                  << "sha256:   " << info.at(U("hash")).as_string() << "\n";

        if (!info.has_field(U("blocks")))
            return;

        std::vector<std::vector<std::string>> rows;
        for (const auto &block : info.at(U("blocks")).as_array())
        {
            int32_t replica = block.at(U("replica")).as_integer();
            rows.push_back({
                std::to_string(block.at(U("index")).as_integer()),
                std::to_string(block.at(U("blockId")).as_number().to_uint64()),
                PrintUtils::formatNumBytes(block.at(U("size")).as_number().to_uint64()),
                std::to_string(block.at(U("primary")).as_integer()),
                replica < 0 ? "none" : std::to_string(replica)
            });
        }
        std::cout << "\n" << PrintUtils::formatTable({"index", "block id", "size", "primary", "replica"}, rows);
    }

    void printFileList(const json::value &files)
    {
        std::vector<std::vector<std::string>> rows;
        for (const auto &file : files.as_array())
        {
            rows.push_back({
                file.at(U("name")).as_string(),
                PrintUtils::formatNumBytes(file.at(U("size")).as_number().to_uint64()),
                std::to_string(file.at(U("blockCount")).as_integer()),
                formatTime(file.at(U("uploadedAt")).as_number().to_int64()),
                file.at(U("degraded")).as_bool() ? "degraded" : "ok"
            });
        }
        std::cout << PrintUtils::formatTable({"name", "size", "#blocks", "uploaded", "replication"}, rows, 22);
    }

    void printCapacityReport(const json::value &report)
    {
        std::cout << "fits: "
                  << PrintUtils::formatNumBytes(report.at(U("fileSize")).as_number().to_uint64()) << " in "
                  << report.at(U("blocksRequired")).as_number().to_uint64() << " blocks; "
                  << PrintUtils::formatNumBytes(report.at(U("freeBytes")).as_number().to_uint64()) << " free of "
                  << PrintUtils::formatNumBytes(report.at(U("totalBytes")).as_number().to_uint64()) << "\n";
    }

    /* Returns the process exit code */
    int runCommand(CoordinatorClient &client, const std::vector<std::string> &args)
    {
        const std::string &command = args[0];

        if (command == "put" && (args.size() == 2 || args.size() == 3))
        {
            printFileInfo(client.upload(args[1], args.size() == 3 ? args[2] : ""));
        }
        else if (command == "get" && args.size() == 3)
        {
            client.download(args[1], args[2]);
            std::cout << "saved '" << args[1] << "' to " << args[2] << "\n";
        }
        else if (command == "ls" && args.size() == 1)
        {
            printFileList(client.list());
        }
        else if (command == "info" && args.size() == 2)
        {
            printFileInfo(client.info(args[1]));
        }
        else if (command == "stats" && args.size() == 1)
        {
            std::cout << client.stats().at(U("table")).as_string();
        }
        else if (command == "check" && args.size() == 2)
        {
            uint64_t fileSize;
            try
            {
                fileSize = std::stoull(args[1]);
            }
            catch (const std::logic_error &)
            {
                std::cerr << "not a byte count: " << args[1] << std::endl;
                return 2;
            }
            printCapacityReport(client.canAccept(fileSize));
        }
        else
        {
            printUsage();
            return 2;
        }

        return 0;
    }
}

int main(int argc, char *argv[])
{
    if (argc < 3)
    {
        printUsage();
        return 2;
    }

    ComponentLogger log("client");

    try
    {
        ClientConfig config(argv[1]);
        Logger::instance().setLevel(config.logLevel);

        HttpTransport transport(std::chrono::milliseconds(config.requestTimeoutMs));
        CoordinatorClient client(transport, config);

        return runCommand(client, std::vector<std::string>(argv + 2, argv + argc));
    }
    catch (const ConfigError &e)
    {
        log.error(std::string("config error: ") + e.what());
        return 2;
    }
    catch (const CapacityError &e)
    {
        std::cerr << e.what() << std::endl;
        return 1;
    }
    catch (const BlockPoolError &e)
    {
        std::cerr << ErrorCodes::toString(e.code()) << ": " << e.what() << std::endl;
        return 1;
    }
    catch (const std::exception &e)
    {
        log.error(e.what());
        return 1;
    }
}
