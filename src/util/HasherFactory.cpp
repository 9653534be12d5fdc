#include "util/IHasher.hpp"
#include "util/Md5Hasher.hpp"
#include "util/Sha1Hasher.hpp"
#include "util/Sha256Hasher.hpp"

#include <algorithm>
#include <array>
#include <cctype>

namespace evidhash {

namespace {
using Constructor = std::unique_ptr<IHasher> (*)();

template <typename H>
std::unique_ptr<IHasher> construct() { return std::make_unique<H>(); }

// Indexed by HashAlgorithm; order must match the enum
constexpr std::array<Constructor, 3> kConstructors = {
    &construct<Sha256Hasher>,
    &construct<Sha1Hasher>,
    &construct<Md5Hasher>,
};

constexpr std::array<const char*, 3> kNames = {"sha256", "sha1", "md5"};
}

const char* toString(HashAlgorithm algorithm) {
    return kNames[static_cast<size_t>(algorithm)];
}

std::optional<HashAlgorithm> parseHashAlgorithm(const std::string& name) {
    std::string v;
    v.reserve(name.size());
    for (char c : name) {
        if (c == '-' || c == '_') continue;
        v.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    for (size_t i = 0; i < kNames.size(); ++i) {
        if (v == kNames[i]) return static_cast<HashAlgorithm>(i);
    }
    return std::nullopt;
}

// IHasher static methods
std::string IHasher::toHex(const std::vector<uint8_t>& bytes) {
    static const char* hex = "0123456789abcdef";
    std::string out;
    out.resize(bytes.size() * 2);
    for (size_t i = 0; i < bytes.size(); ++i) {
        out[2*i] = hex[(bytes[i] >> 4) & 0xF];
        out[2*i+1] = hex[bytes[i] & 0xF];
    }
    return out;
}

// HasherFactory implementation
std::unique_ptr<IHasher> HasherFactory::createDefault() {
    return create(HashAlgorithm::Sha256);
}

std::unique_ptr<IHasher> HasherFactory::create(HashAlgorithm algorithm) {
    return kConstructors[static_cast<size_t>(algorithm)]();
}

}
