#include <iostream>
#include <string>
#include <iomanip>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <chrono>
#include <cctype>
#include <limits>

#include "utils.hpp"
#include "errors.hpp"
#include "test_utils.hpp"

namespace ApiUtils {

    /**
     * Utility function to parse the given uri into a {path, param} pair.
     * 
     * E.g.
     * 
     * "/files/archive.zip" OR "/files/archive.zip/" -> {"/files", "archive.zip"}
     * 
     * E.g.
     * 
     * "/stats" OR "/stats/" -> {"/stats", ""}
     */
    std::pair<std::string, std::string> parsePath(const std::string &uri) 
    {
        std::string cleanUri = uri;

        // drop any query string
        size_t queryPos = cleanUri.find('?');
        if (queryPos != std::string::npos)
            cleanUri = cleanUri.substr(0, queryPos);

        if (cleanUri.empty())
            return {"/", ""};

        // remove ending '/', if present
        if (cleanUri.size() > 1 && cleanUri[cleanUri.size() - 1] == '/')
            cleanUri = cleanUri.substr(0, cleanUri.size() - 1);

        size_t lastSlashPos = cleanUri.find_last_of('/');

        if (lastSlashPos == std::string::npos)
            return {cleanUri, ""};
        
        if (lastSlashPos == 0)
            return {cleanUri, ""};

        std::string prefix = cleanUri.substr(0, lastSlashPos);
        std::string param = cleanUri.substr(lastSlashPos + 1);

        return {prefix.empty() ? cleanUri : prefix, decodeSegment(param)};
    } 

    std::string decodeSegment(const std::string &segment)
    {
        std::string out;
        out.reserve(segment.size());

        for (size_t i = 0; i < segment.size(); i++)
        {
            if (segment[i] == '%' && i + 2 < segment.size()
                && std::isxdigit(static_cast<unsigned char>(segment[i + 1]))
                && std::isxdigit(static_cast<unsigned char>(segment[i + 2])))
            {
                out.push_back(static_cast<char>(std::stoi(segment.substr(i + 1, 2), nullptr, 16)));
                i += 2;
            }
            else
                out.push_back(segment[i]);
        }
        return out;
    }

    std::string encodeSegment(const std::string &segment)
    {
        std::ostringstream oss;
        for (unsigned char c : segment)
        {
            if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~')
                oss << c;
            else
                oss << '%' << std::uppercase << std::hex << std::setw(2) << std::setfill('0')
                    << static_cast<int>(c) << std::nouppercase << std::dec;
        }
        return oss.str();
    }
};

namespace PrintUtils {

    /**
     * Pads `text` such that it sits in the center of a 
     * new text string of width `width`.
     */
    std::string centerText(std::string text, int width) 
    {
        size_t size = text.size(); 

        if (size > static_cast<size_t>(width)) 
            return text.substr(0, width);

        int padding = (width - size) / 2;
        int extra = (width - size) % 2; // handle odd padding
        return std::string(padding, ' ') + text + std::string(padding + extra, ' ');
    }

    /**
     * Returns compact string representation of the number of
     * bytes `bytes`, using traditional suffixes KB/MB/GB/TB etc.
     */
    std::string formatNumBytes(uint64_t bytes)
    {
        const char* suffixes[] = {"bytes", "KB", "MB", "GB", "TB", "PB"};
        int suffixIndex = 0;
        double size = static_cast<double>(bytes);

        while (size >= 1024 && suffixIndex < 5)
        {
            size /= 1024;
            suffixIndex++;
        }

        std::ostringstream oss;
        oss << std::fixed << std::setprecision(2) << size << " " << suffixes[suffixIndex];
        return oss.str();
    }

    std::string formatTable(
        const std::vector<std::string> &headers,
        const std::vector<std::vector<std::string>> &rows,
        int columnWidth
    )
    {
        std::ostringstream oss;

        const int numColumns = headers.size();
        std::string divider(columnWidth, '-');

        // top divider
        for (int i = 0; i < numColumns; i++)
        {
            oss << divider << "-";
            if (i == numColumns - 1)
                oss << "-";
        }
        oss << "\n";

        // header row
        for (auto &header : headers)
            oss << "|" << centerText(header, columnWidth);
        oss << "|\n";

        // middle divider 
        for (int i = 0; i < numColumns; i++)
        {
            oss << "|" << divider;
            if (i == numColumns - 1)
                oss << "|";
        }
        oss << "\n";

        for (auto &row : rows)
        {
            for (auto &cell : row)
                oss << "|" << centerText(cell, columnWidth);
            oss << "|\n";
        }

        // bottom divider
        for (int i = 0; i < numColumns; i++)
        {
            oss << divider << "-";
            if (i == numColumns - 1)
                oss << "-";
        }
        oss << "\n";

        return oss.str();
    }
}

namespace MathUtils
{
    /**
     * Returns ceiling of integer division of `numerator` and `denominator`.
     * 
     * e.g. 7 / 3 => 3
     */
    uint64_t ceilDiv(uint64_t numerator, uint64_t denominator)
    {
        return numerator / denominator + (numerator % denominator != 0 ? 1 : 0);
    }
}

namespace TimeUtils
{
    int64_t nowSeconds()
    {
        return std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::system_clock::now().time_since_epoch()
        ).count();
    }
}

namespace FileSystemUtils
{
    /**
     * Remove all contents of given directory, and the 
     * directory itself.
     */
    void removeDirectory(fs::path dirPath)
    {
        if (fs::exists(dirPath))
            fs::remove_all(dirPath);
    }

    fs::path expandHome(const fs::path &path)
    {
        std::string p = path.string();
        if (p.empty() || p[0] != '~')
            return path;

        const char* homeDir = std::getenv("HOME");
        if (homeDir == nullptr)
            return path;

        if (p.size() == 1)
            return fs::path(homeDir);
        return fs::path(homeDir) / p.substr(2);
    }

    std::vector<unsigned char> readFile(const fs::path &path)
    {
        std::ifstream in(path, std::ios::binary);
        if (!in.is_open())
            throw IOError("unable to open file for reading: " + path.string());

        std::vector<unsigned char> data(
            (std::istreambuf_iterator<char>(in)),
            std::istreambuf_iterator<char>()
        );

        if (in.bad())
            throw IOError("bad read of file: " + path.string());

        return data;
    }

    void writeFileAtomically(const fs::path &path, const std::vector<unsigned char> &data)
    {
        fs::path tmpPath = path;
        tmpPath += ".part";

        std::ofstream out(tmpPath, std::ios::binary | std::ios::trunc);
        if (!out.is_open())
            throw IOError("unable to open file for writing: " + tmpPath.string());

        out.write(reinterpret_cast<const char*>(data.data()), data.size());
        out.close();

        if (out.fail())
        {
            std::error_code ec;
            fs::remove(tmpPath, ec);
            throw IOError("bad write of file: " + tmpPath.string());
        }

        std::error_code ec;
        fs::rename(tmpPath, path, ec);
        if (ec)
        {
            std::error_code ignored;
            fs::remove(tmpPath, ignored);
            throw IOError("unable to move " + tmpPath.string() + " into place: " + ec.message());
        }
    }
}

////////////////////////////////////////////
// Utils tests
////////////////////////////////////////////
namespace UtilsTests
{
    void testParsePath()
    {
        std::vector<std::string> paths = {
            "/files/archive.zip",
            "/files/archive.zip/",
            "/files/my%20notes.txt",

            "/stats",
            "/stats/",
            "/capacity/1024?x=1"
        };

        std::vector<std::pair<std::string, std::string>> expectedParsedPaths = {
            {"/files", "archive.zip"},
            {"/files", "archive.zip"},
            {"/files", "my notes.txt"},

            {"/stats", ""},
            {"/stats", ""},
            {"/capacity", "1024"}
        };

        for (size_t i = 0; i < paths.size(); i++)
        {
            auto p = ApiUtils::parsePath(paths[i]);
            ASSERT_THAT(p == expectedParsedPaths[i]);
        }
    }

    void testSegmentEncoding()
    {
        std::string name = "reports/2024 Q1.pdf";
        std::string encoded = ApiUtils::encodeSegment(name);

        ASSERT_THAT(encoded.find('/') == std::string::npos);
        ASSERT_THAT(encoded.find(' ') == std::string::npos);
        ASSERT_THAT(ApiUtils::decodeSegment(encoded) == name);
    }

    void testCeilDiv()
    {
        ASSERT_THAT(MathUtils::ceilDiv(0, 4) == 0);
        ASSERT_THAT(MathUtils::ceilDiv(1, 4) == 1);
        ASSERT_THAT(MathUtils::ceilDiv(4, 4) == 1);
        ASSERT_THAT(MathUtils::ceilDiv(5, 4) == 2);
        ASSERT_THAT(MathUtils::ceilDiv(5ull << 20, 1u << 20) == 5);

        const uint64_t maxSize = std::numeric_limits<uint64_t>::max();
        ASSERT_THAT(MathUtils::ceilDiv(maxSize, 1u << 20) == (maxSize >> 20) + 1);
        ASSERT_THAT(MathUtils::ceilDiv(maxSize, maxSize) == 1);
        ASSERT_THAT(MathUtils::ceilDiv(maxSize - 1, maxSize) == 1);
        ASSERT_THAT(MathUtils::ceilDiv(maxSize, 1) == maxSize);
    }

    void testWriteFileAtomically()
    {
        fs::path dir = fs::temp_directory_path() / "blockpool_utils_test";
        FileSystemUtils::removeDirectory(dir);
        fs::create_directories(dir);

        fs::path target = dir / "out.bin";
        std::vector<unsigned char> data = {'a', 'b', 'c', 0, 'd'};

        FileSystemUtils::writeFileAtomically(target, data);

        ASSERT_THAT(fs::exists(target));
        ASSERT_THAT(!fs::exists(dir / "out.bin.part"));
        ASSERT_THAT(FileSystemUtils::readFile(target) == data);

        ASSERT_THROWS(FileSystemUtils::readFile(dir / "missing.bin"), IOError);

        FileSystemUtils::removeDirectory(dir);
    }

    void runAll()
    {
        TestUtils::printSuiteHeader("Utils Tests");

        std::vector<std::pair<std::string, std::function<void()>>> tests = {
            TEST(testParsePath),
            TEST(testSegmentEncoding),
            TEST(testCeilDiv),
            TEST(testWriteFileAtomically)
        };

        for (auto &[name, func] : tests)
        {
            TestUtils::runTest(name, func);
        }
    }
};
