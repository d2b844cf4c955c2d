#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <sodium.h>

namespace security {

// Initialize libsodium once per process. Throws std::runtime_error on failure.
void ensure_initialized();

// Standard base64 (with padding) of raw bytes, for embedding in text frames.
std::string base64_encode(const std::vector<uint8_t>& bytes);

// Returns std::nullopt when `text` is not valid base64.
std::optional<std::vector<uint8_t>> base64_decode(const std::string& text);

// Incremental BLAKE2b-256 digest of transferred content.
class ContentDigest {
public:
    ContentDigest();

    void update(const uint8_t* data, size_t size);
    void update(const std::vector<uint8_t>& bytes) { update(bytes.data(), bytes.size()); }

    // Hex string of the digest. The object must not be updated afterwards.
    std::string finish();

private:
    crypto_generichash_state state_;
    bool finished_ = false;
};

// Hex string of `bytes` random bytes, e.g. for unique temporary names.
std::string random_hex(size_t bytes);

// One-shot hex digest of a byte buffer.
std::string hash_bytes(const std::vector<uint8_t>& bytes);

} // namespace security
