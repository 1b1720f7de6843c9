#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace readrouter {

/**
 * @brief Stable hash of session keys for replica assignment
 *
 * Unkeyed: MD5 of the key. Keyed (non-empty secret): HMAC-SHA256, so clients
 * cannot choose keys that pile onto one replica. Both are stable across
 * processes and platforms, unlike std::hash.
 */
class SessionHasher {
public:
    SessionHasher() = default;
    explicit SessionHasher(std::string hash_key) : hash_key_(std::move(hash_key)) {}

    [[nodiscard]] bool keyed() const { return !hash_key_.empty(); }

    /// Raw digest bytes (16 for MD5, 32 for HMAC-SHA256)
    [[nodiscard]] std::vector<uint8_t> digest(std::string_view key) const;

    /**
     * @brief Digest read as a big-endian integer, reduced modulo `buckets`
     *
     * Exact over the whole digest, no truncation to a machine word.
     * @throws ConfigurationError when buckets == 0
     */
    [[nodiscard]] size_t bucket(std::string_view key, size_t buckets) const;

    /// First 8 digest bytes, big-endian; a position on the hash ring
    [[nodiscard]] uint64_t point(std::string_view key) const;

private:
    std::string hash_key_;
};

} // namespace readrouter
