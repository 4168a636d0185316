#pragma once

#include <cpprest/json.h>

#include <iostream>
#include <cstdint>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

using namespace web;

namespace fs = std::filesystem;

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
    std::pair<std::string, std::string> parsePath(const std::string &uri);

    /**
     * Percent-decodes a single path segment (e.g. "my%20file.txt" -> "my file.txt").
     */
    std::string decodeSegment(const std::string &segment);

    /**
     * Percent-encodes a single path segment, so file names with spaces
     * or slashes survive the trip through a uri.
     */
    std::string encodeSegment(const std::string &segment);
};
    
namespace PrintUtils {

    /**
     * Pads `text` such that it sits in the center of a 
     * new text string of width `width`.
     */
    std::string centerText(std::string text, int width);

    /**
     * Returns compact string representation of the number of
     * bytes `bytes`, using traditional suffixes KB/MB/GB/TB etc.
     */
    std::string formatNumBytes(uint64_t bytes);

    /**
     * Returns a fixed-width, terminal-printable table.
     * 
     * Every row must have headers.size() columns.
     */
    std::string formatTable(
        const std::vector<std::string> &headers,
        const std::vector<std::vector<std::string>> &rows,
        int columnWidth = 15
    );
};

namespace MathUtils
{
    /**
     * Returns ceiling of integer division of `numerator` and `denominator`.
     * 
     * e.g. 7 / 3 => 3
     */
    uint64_t ceilDiv(uint64_t numerator, uint64_t denominator);
}

namespace TimeUtils
{
    /* Seconds since the unix epoch */
    int64_t nowSeconds();
}

namespace FileSystemUtils
{
    /**
     * Remove all contents of given directory, and the 
     * directory itself.
     */
    void removeDirectory(fs::path dirPath);

    /**
     * Expands a leading '~' to $HOME.
     */
    fs::path expandHome(const fs::path &path);

    /**
     * Reads the whole file at `path`.
     * 
     * Throws:
     *      IOError - if the file can't be opened or fully read
     */
    std::vector<unsigned char> readFile(const fs::path &path);

    /**
     * Writes `data` to `path` via a temporary file in the same directory
     * that is renamed into place, so `path` either holds all of `data`
     * or is left untouched.
     * 
     * Throws:
     *      IOError - on any write/rename failure (the temporary file is removed)
     */
    void writeFileAtomically(const fs::path &path, const std::vector<unsigned char> &data);
}

////////////////////////////////////////////
// Utils tests
////////////////////////////////////////////
namespace UtilsTests
{
    void testParsePath();
    void testSegmentEncoding();
    void testCeilDiv();
    void testWriteFileAtomically();
    void runAll();
}
