#include "warden/crypto.hpp"
#include <sodium.h>
#include <format>
#include <stdexcept>

namespace warden::crypto
{

    // Initialize libsodium on library load
    static struct SodiumInitializer
    {
        SodiumInitializer()
        {
            if (sodium_init() < 0)
            {
                throw std::runtime_error("Failed to initialize libsodium");
            }
        }
    } sodium_initializer;

    SHA256Hash SHA256::hash(std::string_view data)
    {
        SHA256Hash output;
        crypto_hash_sha256(output.data(),
                           reinterpret_cast<const uint8_t *>(data.data()),
                           data.size());
        return output;
    }

    SHA256Hash SHA256::hash_concat(std::string_view first, std::string_view second)
    {
        crypto_hash_sha256_state state;
        crypto_hash_sha256_init(&state);
        crypto_hash_sha256_update(&state,
                                  reinterpret_cast<const uint8_t *>(first.data()),
                                  first.size());
        crypto_hash_sha256_update(&state,
                                  reinterpret_cast<const uint8_t *>(second.data()),
                                  second.size());
        SHA256Hash output;
        crypto_hash_sha256_final(&state, output.data());
        return output;
    }

    std::string SHA256::to_hex(const SHA256Hash &hash)
    {
        std::string hex(hash.size() * 2 + 1, '\0');
        sodium_bin2hex(hex.data(), hex.size(), hash.data(), hash.size());
        hex.pop_back();
        return hex;
    }

    std::string uuid_v4()
    {
        std::array<uint8_t, 16> b{};
        randombytes_buf(b.data(), b.size());
        b[6] = static_cast<uint8_t>((b[6] & 0x0F) | 0x40);
        b[8] = static_cast<uint8_t>((b[8] & 0x3F) | 0x80);

        return std::format("{:02x}{:02x}{:02x}{:02x}-{:02x}{:02x}-{:02x}{:02x}-{:02x}{:02x}-"
                           "{:02x}{:02x}{:02x}{:02x}{:02x}{:02x}",
                           b[0], b[1], b[2], b[3], b[4], b[5], b[6], b[7],
                           b[8], b[9], b[10], b[11], b[12], b[13], b[14], b[15]);
    }

    bool digest_equals(std::string_view a, std::string_view b)
    {
        if (a.size() != b.size())
            return false;
        if (a.empty())
            return true;
        return sodium_memcmp(a.data(), b.data(), a.size()) == 0;
    }

} // namespace warden::crypto
