#include "routing/session_hasher.hpp"
#include "core/error.hpp"

#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <stdexcept>

namespace readrouter {

std::vector<uint8_t> SessionHasher::digest(std::string_view key) const {
    std::vector<uint8_t> result(EVP_MAX_MD_SIZE);
    unsigned int len = 0;

    if (keyed()) {
        if (!HMAC(EVP_sha256(),
                  hash_key_.data(), static_cast<int>(hash_key_.size()),
                  reinterpret_cast<const uint8_t*>(key.data()), key.size(),
                  result.data(), &len)) {
            throw std::runtime_error("HMAC failed");
        }
    } else {
        if (EVP_Digest(key.data(), key.size(), result.data(), &len, EVP_md5(), nullptr) != 1) {
            throw std::runtime_error("EVP_Digest failed");
        }
    }

    result.resize(len);
    return result;
}

size_t SessionHasher::bucket(std::string_view key, size_t buckets) const {
    if (buckets == 0) {
        throw ConfigurationError("Cannot assign a session to an empty replica set");
    }

    // Horner's rule over base-256 digits keeps every intermediate below 256 * buckets
    uint64_t remainder = 0;
    for (const uint8_t byte : digest(key)) {
        remainder = (remainder * 256 + byte) % buckets;
    }
    return static_cast<size_t>(remainder);
}

uint64_t SessionHasher::point(std::string_view key) const {
    const auto bytes = digest(key);
    uint64_t value = 0;
    for (size_t i = 0; i < 8 && i < bytes.size(); ++i) {
        value = (value << 8) | bytes[i];
    }
    return value;
}

} // namespace readrouter
