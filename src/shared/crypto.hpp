#pragma once

#include <openssl/sha.h>
#include <cstdint>
#include <string>
#include <vector>

namespace Crypto {

    /**
     * Computes the SHA256 hash of the byte range [data, data + size),
     * as 64 lower-case hex characters.
     */
    std::string sha256Hex(const unsigned char* data, size_t size);

    std::string sha256Hex(const std::vector<unsigned char>& data);

    /**
     * Incremental SHA256, for hashing a file block-by-block without
     * holding a second copy of it.
     */
    class Sha256
    {
    public:
        Sha256();
        void update(const unsigned char* data, size_t size);

        /* Returns the hex digest; the object must not be updated afterwards */
        std::string finalHex();

    private:
        SHA256_CTX ctx;
    };
}

namespace CryptoTests
{
    void testSha256KnownVectors();
    void testIncrementalMatchesOneShot();
    void runAll();
}
