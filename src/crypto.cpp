#include "warden/crypto.hpp"
#include <sodium.h>
#include <algorithm>
#include <cctype>
#include <format>

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

    namespace
    {
        std::string hex_encode(const uint8_t *data, std::size_t len)
        {
            std::string hex;
            hex.reserve(len * 2);
            for (std::size_t i = 0; i < len; ++i)
            {
                hex += std::format("{:02x}", data[i]);
            }
            return hex;
        }
    } // namespace

    // ============================================================================
    // SHA256 Implementation
    // ============================================================================

    SHA256Hash SHA256::hash(const Bytes &data)
    {
        SHA256Hash output;
        crypto_hash_sha256(output.data(), data.data(), data.size());
        return output;
    }

    SHA256Hash SHA256::hash(std::string_view data)
    {
        SHA256Hash output;
        crypto_hash_sha256(output.data(),
                           reinterpret_cast<const uint8_t *>(data.data()),
                           data.size());
        return output;
    }

    std::string SHA256::to_hex(const SHA256Hash &hash)
    {
        return hex_encode(hash.data(), hash.size());
    }

    // ============================================================================
    // HMAC-SHA-256 Implementation
    // ============================================================================

    SHA256Hash HmacSHA256::mac(std::string_view key, std::string_view message)
    {
        crypto_auth_hmacsha256_state state;
        crypto_auth_hmacsha256_init(&state,
                                    reinterpret_cast<const uint8_t *>(key.data()),
                                    key.size());
        crypto_auth_hmacsha256_update(&state,
                                      reinterpret_cast<const uint8_t *>(message.data()),
                                      message.size());
        SHA256Hash output;
        crypto_auth_hmacsha256_final(&state, output.data());
        sodium_memzero(&state, sizeof(state));
        return output;
    }

    // ============================================================================
    // IdentityHasher Implementation
    // ============================================================================

    Result<IdentityHasher> IdentityHasher::create(std::string salt)
    {
        if (salt.empty())
        {
            return std::unexpected(WardenError::configuration("Hash salt must not be empty"));
        }
        return IdentityHasher(std::move(salt));
    }

    std::string IdentityHasher::hash_network(std::string_view address) const
    {
        return digest(address.empty() ? std::string_view{"unknown"} : address, kNetworkDigestChars);
    }

    std::string IdentityHasher::hash_account(std::string_view email) const
    {
        std::string lowered(email);
        std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        auto out = digest(lowered, kAccountDigestChars);
        sodium_memzero(lowered.data(), lowered.size());
        return out;
    }

    std::string IdentityHasher::hash_account_id(std::string_view account_id) const
    {
        return digest(std::string("account-id:").append(account_id), kAccountDigestChars);
    }

    std::string IdentityHasher::digest(std::string_view input, std::size_t chars) const
    {
        auto mac = HmacSHA256::mac(salt_, input);
        return hex_encode(mac.data(), mac.size()).substr(0, chars);
    }

    // ============================================================================
    // SecureRandom Implementation
    // ============================================================================

    Bytes SecureRandom::generate_bytes(size_t n)
    {
        Bytes buffer(n);
        randombytes_buf(buffer.data(), n);
        return buffer;
    }

    std::string SecureRandom::generate_id(std::string_view prefix)
    {
        auto bytes = generate_bytes(8);
        return std::format("{}_{}", prefix, hex_encode(bytes.data(), bytes.size()));
    }

} // namespace warden::crypto
