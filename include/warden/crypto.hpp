#pragma once

#include "types.hpp"
#include <array>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace warden::crypto
{

    // Type aliases for clarity
    using Bytes = std::vector<uint8_t>;
    using SHA256Hash = std::array<uint8_t, 32>;

    /**
     * SHA-256 hashing
     */
    class SHA256
    {
    public:
        /**
         * Compute SHA-256 hash of data
         */
        static SHA256Hash hash(const Bytes &data);

        /**
         * Compute SHA-256 hash of string
         */
        static SHA256Hash hash(std::string_view data);

        /**
         * Convert hash to hex string
         */
        static std::string to_hex(const SHA256Hash &hash);
    };

    /**
     * HMAC-SHA-256 with an arbitrary length key
     */
    class HmacSHA256
    {
    public:
        static SHA256Hash mac(std::string_view key, std::string_view message);
    };

    /**
     * Salted one-way hashing of actor identifiers. The raw identifier never
     * leaves enrich(); only the truncated hex digest is stored.
     */
    class IdentityHasher
    {
    public:
        static constexpr std::size_t kNetworkDigestChars = 12;
        static constexpr std::size_t kAccountDigestChars = 16;

        /** Salt must be non-empty */
        static Result<IdentityHasher> create(std::string salt);

        /** Hash a network address ("unknown" when empty) */
        std::string hash_network(std::string_view address) const;

        /** Hash an account email; case-insensitive */
        std::string hash_account(std::string_view email) const;

        /** Hash an application account id; kept apart from email hashes */
        std::string hash_account_id(std::string_view account_id) const;

    private:
        explicit IdentityHasher(std::string salt) : salt_(std::move(salt)) {}

        std::string digest(std::string_view input, std::size_t chars) const;

        std::string salt_;
    };

    /**
     * Secure random generation
     */
    class SecureRandom
    {
    public:
        static Bytes generate_bytes(size_t n);

        /** `<prefix>_<16 hex chars>` */
        static std::string generate_id(std::string_view prefix);
    };

} // namespace warden::crypto
