#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <string_view>

namespace warden::crypto
{

    using SHA256Hash = std::array<uint8_t, 32>;

    /**
     * SHA-256 hashing (libsodium crypto_hash_sha256)
     */
    class SHA256
    {
    public:
        static SHA256Hash hash(std::string_view data);

        /**
         * Hash the concatenation of two byte strings without materializing it.
         * Used for chain links: digest(previous ++ payload).
         */
        static SHA256Hash hash_concat(std::string_view first, std::string_view second);

        /** Lowercase hex, 64 characters */
        static std::string to_hex(const SHA256Hash &hash);
    };

    /** Random RFC 4122 version 4 UUID in canonical 8-4-4-4-12 form */
    std::string uuid_v4();

    /** Constant-time comparison of two hex digests */
    bool digest_equals(std::string_view a, std::string_view b);

} // namespace warden::crypto
