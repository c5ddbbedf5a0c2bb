#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <string>

namespace psguard::hash {

// Incremental SHA-256. Used for the audit hash chain, where the input is
// chain_prev followed by the canonical record.
class Sha256 {
public:
    Sha256();

    void update(const uint8_t* data, size_t n);
    void update(const std::string& s) {
        update(reinterpret_cast<const uint8_t*>(s.data()), s.size());
    }

    // Finalizes; the object must not be updated afterwards.
    std::array<uint8_t, 32> digest();
    std::string hex_digest();

private:
    void compress(const uint8_t block[64]);

    uint32_t h_[8];
    uint8_t buf_[64];
    size_t buf_len_{0};
    uint64_t total_len_{0};
};

std::string sha256_hex(const std::string& s);

// 64 zeros: chain_prev of the first record in a fresh log.
inline std::string zero_hash_hex() { return std::string(64, '0'); }

} // namespace psguard::hash
