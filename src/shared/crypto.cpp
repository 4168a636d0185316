#include <openssl/sha.h>
#include <string>
#include <iostream>
#include <functional>

#include "crypto.hpp"
#include "test_utils.hpp"

namespace Crypto {

    #pragma GCC diagnostic ignored "-Wdeprecated-declarations"

    namespace
    {
        std::string toHex(const unsigned char* digest, size_t size)
        {
            static const char* hexChars = "0123456789abcdef";

            std::string out;
            out.reserve(size * 2);
            for (size_t i = 0; i < size; i++)
            {
                out.push_back(hexChars[digest[i] >> 4]);
                out.push_back(hexChars[digest[i] & 0x0f]);
            }
            return out;
        }
    }

    std::string sha256Hex(const unsigned char* data, size_t size)
    {
        Sha256 sha;
        sha.update(data, size);
        return sha.finalHex();
    }

    std::string sha256Hex(const std::vector<unsigned char>& data)
    {
        return sha256Hex(data.data(), data.size());
    }

    ////////////////////////////////////////////
    // Sha256 methods
    ////////////////////////////////////////////

    Sha256::Sha256()
    {
        SHA256_Init(&ctx);
    }

    void Sha256::update(const unsigned char* data, size_t size)
    {
        if (size > 0)
            SHA256_Update(&ctx, data, size);
    }

    std::string Sha256::finalHex()
    {
        unsigned char digest[SHA256_DIGEST_LENGTH];
        SHA256_Final(digest, &ctx);
        return toHex(digest, SHA256_DIGEST_LENGTH);
    }
}

////////////////////////////////////////////
// Crypto tests
////////////////////////////////////////////
namespace CryptoTests
{
    void testSha256KnownVectors()
    {
        std::vector<unsigned char> empty;
        ASSERT_THAT(Crypto::sha256Hex(empty) ==
            "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");

        std::string abc = "abc";
        std::vector<unsigned char> abcBytes(abc.begin(), abc.end());
        ASSERT_THAT(Crypto::sha256Hex(abcBytes) ==
            "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");

    }

    void testIncrementalMatchesOneShot()
    {
        std::vector<unsigned char> data(10000);
        for (size_t i = 0; i < data.size(); i++)
            data[i] = static_cast<unsigned char>(i * 31);

        Crypto::Sha256 sha;
        sha.update(data.data(), 4096);
        sha.update(data.data() + 4096, data.size() - 4096);

        ASSERT_THAT(sha.finalHex() == Crypto::sha256Hex(data));
    }

    void runAll()
    {
        TestUtils::printSuiteHeader("Crypto Tests");

        std::vector<std::pair<std::string, std::function<void()>>> tests = {
            TEST(testSha256KnownVectors),
            TEST(testIncrementalMatchesOneShot)
        };

        for (auto &[name, func] : tests)
        {
            TestUtils::runTest(name, func);
        }
    }
}
