#pragma once

#include <string>
#include <vector>
#include <array>
#include <cstdint>
#include <cstddef>

namespace substrate {
namespace crypto {

constexpr size_t SHA256_SIZE = 32;

using Hash256 = std::array<uint8_t, SHA256_SIZE>;

// Incremental SHA-256. finish() returns the digest and resets the hasher.
class Sha256 {
public:
    Sha256();

    void reset();
    Sha256& update(const uint8_t* data, size_t len);
    Sha256& update(const std::vector<uint8_t>& data);
    Sha256& update(const std::string& data);
    Sha256& update(const Hash256& hash);
    Hash256 finish();

private:
    uint32_t state_[8];
    uint8_t buffer_[64];
    size_t bufferLen_;
    uint64_t totalLen_;
};

Hash256 sha256(const uint8_t* data, size_t len);
Hash256 sha256(const std::vector<uint8_t>& data);
Hash256 sha256(const std::string& data);
std::string sha256Hex(const std::string& data);

bool isZero(const Hash256& hash);

std::string toHex(const uint8_t* data, size_t len);
std::string toHex(const std::vector<uint8_t>& data);
template<size_t N>
std::string toHex(const std::array<uint8_t, N>& data) {
    return toHex(data.data(), N);
}
std::vector<uint8_t> fromHex(const std::string& hex);

}
}
