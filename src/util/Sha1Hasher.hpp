#pragma once

#include "util/IHasher.hpp"
#include <cstdint>

namespace evidhash {

/**
 * @brief SHA-1 digest (160-bit)
 *
 * Kept for catalogues that must match legacy evidence manifests.
 * Not collision resistant; prefer SHA-256 for new cases.
 */
class Sha1Hasher : public IHasher {
public:
    Sha1Hasher();

    void reset() override;
    void update(const uint8_t* data, size_t len) override;
    void update(const std::string& data) override;
    std::vector<uint8_t> digest() override;
    const char* name() const override { return "sha1"; }
    size_t digestSize() const override { return 20; }

private:
    void transform(const uint8_t* chunk);

    uint32_t state[5];      // Hash state (A, B, C, D, E)
    uint64_t byteCount;     // Total bytes absorbed
    uint8_t buffer[64];     // Pending block buffer
    size_t bufferLen;       // Current buffer fill
};

}
