#pragma once

#include "util/IHasher.hpp"
#include <cstdint>

namespace evidhash {

/**
 * @brief SHA-256 digest (256-bit), the default evidence algorithm
 *
 * Streaming: call update() any number of times with arbitrary chunk
 * sizes; the result is identical to hashing the concatenation.
 *
 * Usage:
 *   Sha256Hasher h;
 *   h.update("hello world!");
 *   std::string hex = IHasher::toHex(h.digest());
 */
class Sha256Hasher : public IHasher {
public:
    Sha256Hasher();

    void reset() override;
    void update(const uint8_t* data, size_t len) override;
    void update(const std::string& data) override;
    std::vector<uint8_t> digest() override;
    const char* name() const override { return "sha256"; }
    size_t digestSize() const override { return 32; }

private:
    void transform(const uint8_t* chunk);
    uint32_t state[8];      // Current hash state
    uint64_t byteCount;     // Total bytes absorbed
    uint8_t buffer[64];     // Pending block buffer
    size_t bufferLen;       // Current buffer fill
};

}
