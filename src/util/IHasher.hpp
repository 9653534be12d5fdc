#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace evidhash {

/// Supported digest algorithms
enum class HashAlgorithm { Sha256 = 0, Sha1, Md5 };

/// Lowercase name ("sha256", "sha1", "md5")
const char* toString(HashAlgorithm algorithm);

/// Parse a name, case-insensitive; accepts "sha-256" style spellings too
std::optional<HashAlgorithm> parseHashAlgorithm(const std::string& name);

/**
 * @brief Strategy interface for hash algorithms
 *
 * Every digest the engine produces goes through this interface, so the
 * streaming loop never needs to know which algorithm it is feeding.
 */
class IHasher {
public:
    virtual ~IHasher() = default;

    /// Reset hasher to initial state
    virtual void reset() = 0;

    /// Update hash with raw bytes
    virtual void update(const uint8_t* data, size_t len) = 0;

    /// Update hash with string
    virtual void update(const std::string& data) = 0;

    /// Finalize and return digest bytes (resets state after)
    virtual std::vector<uint8_t> digest() = 0;

    /// Get hash algorithm name (e.g., "sha1", "sha256")
    virtual const char* name() const = 0;

    /// Get digest size in bytes (16 for MD5, 20 for SHA-1, 32 for SHA-256)
    virtual size_t digestSize() const = 0;

    /// Convert binary hash to lowercase hex string
    static std::string toHex(const std::vector<uint8_t>& bytes);
};

/**
 * @brief Factory for creating hasher instances
 *
 * Backed by a constructor table indexed by HashAlgorithm.
 */
class HasherFactory {
public:
    /// Create default hasher (SHA-256)
    static std::unique_ptr<IHasher> createDefault();

    /// Create the hasher for an algorithm
    static std::unique_ptr<IHasher> create(HashAlgorithm algorithm);
};

}
