#include "security.hpp"
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace security {

namespace {

constexpr int kBase64Variant = sodium_base64_VARIANT_ORIGINAL;

std::string to_hex(const unsigned char* data, size_t size) {
    std::ostringstream oss;
    for (size_t i = 0; i < size; ++i) {
        oss << std::hex << std::setfill('0') << std::setw(2) << static_cast<int>(data[i]);
    }
    return oss.str();
}

} // namespace

void ensure_initialized() {
    // sodium_init() is idempotent and thread-safe; 1 means already initialized.
    if (sodium_init() < 0) {
        throw std::runtime_error("libsodium initialization failed");
    }
}

std::string base64_encode(const std::vector<uint8_t>& bytes) {
    ensure_initialized();
    const size_t encoded_len = sodium_base64_ENCODED_LEN(bytes.size(), kBase64Variant);
    std::string out(encoded_len, '\0');
    sodium_bin2base64(&out[0], encoded_len, bytes.data(), bytes.size(), kBase64Variant);
    // encoded_len includes the trailing NUL
    out.resize(encoded_len - 1);
    return out;
}

std::optional<std::vector<uint8_t>> base64_decode(const std::string& text) {
    ensure_initialized();
    std::vector<uint8_t> out(text.size() / 4 * 3 + 3);
    size_t bin_len = 0;
    const char* end = nullptr;
    if (sodium_base642bin(out.data(), out.size(), text.data(), text.size(),
                          nullptr, &bin_len, &end, kBase64Variant) != 0) {
        return std::nullopt;
    }
    if (end != text.data() + text.size()) {
        return std::nullopt;
    }
    out.resize(bin_len);
    return out;
}

ContentDigest::ContentDigest() {
    ensure_initialized();
    crypto_generichash_init(&state_, nullptr, 0, crypto_generichash_BYTES);
}

void ContentDigest::update(const uint8_t* data, size_t size) {
    if (finished_) {
        throw std::logic_error("ContentDigest updated after finish()");
    }
    crypto_generichash_update(&state_, data, size);
}

std::string ContentDigest::finish() {
    if (finished_) {
        throw std::logic_error("ContentDigest finished twice");
    }
    finished_ = true;
    unsigned char hash[crypto_generichash_BYTES]; // 32 bytes
    crypto_generichash_final(&state_, hash, sizeof(hash));
    return to_hex(hash, sizeof(hash));
}

std::string random_hex(size_t bytes) {
    ensure_initialized();
    std::vector<unsigned char> buf(bytes);
    randombytes_buf(buf.data(), buf.size());
    return to_hex(buf.data(), buf.size());
}

std::string hash_bytes(const std::vector<uint8_t>& bytes) {
    ContentDigest digest;
    digest.update(bytes);
    return digest.finish();
}

} // namespace security
