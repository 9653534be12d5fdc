#pragma once

#include "util/IHasher.hpp"
#include <cstdint>

namespace evidhash {

/**
 * @brief MD5 digest (128-bit, RFC 1321)
 *
 * Still requested by many forensic intake forms alongside SHA-256.
 */
class Md5Hasher : public IHasher {
public:
    Md5Hasher();

    void reset() override;
    void update(const uint8_t* data, size_t len) override;
    void update(const std::string& data) override;
    std::vector<uint8_t> digest() override;
    const char* name() const override { return "md5"; }
    size_t digestSize() const override { return 16; }

private:
    void transform(const uint8_t* chunk);

    uint32_t state[4];      // A, B, C, D
    uint64_t byteCount;     // Total bytes absorbed
    uint8_t buffer[64];     // Pending block buffer
    size_t bufferLen;       // Current buffer fill
};

}
