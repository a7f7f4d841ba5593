#pragma once

#include "types.hpp"
#include <string>
#include <string_view>
#include <vector>
#include <array>
#include <cstdint>

namespace tiergate::crypto
{

    using Bytes = std::vector<uint8_t>;
    using Ed25519PublicKey = std::array<uint8_t, 32>;
    using Ed25519SecretKey = std::array<uint8_t, 64>;
    using Ed25519Signature = std::array<uint8_t, 64>;
    using SHA256Hash = std::array<uint8_t, 32>;
    using HmacTag = std::array<uint8_t, 32>;

    /**
     * Ed25519 key pair for signing and verification (libsodium)
     */
    class Ed25519KeyPair
    {
    public:
        Ed25519PublicKey public_key;
        Ed25519SecretKey secret_key;

        /**
         * Generate a new random key pair
         */
        static Result<Ed25519KeyPair> generate();

        /**
         * Sign a message, returns 64-byte detached signature
         */
        Ed25519Signature sign(const Bytes &message) const;

        /**
         * Verify a detached signature against message
         */
        static bool verify(
            const Bytes &message,
            const Ed25519Signature &signature,
            const Ed25519PublicKey &public_key);

        /**
         * Parse a standard-base64 public key (32 bytes decoded)
         */
        static Result<Ed25519PublicKey> public_key_from_b64(const std::string &b64);
    };

    /**
     * HMAC-SHA-256. Development-only token signing mode.
     */
    class HmacSha256
    {
    public:
        static HmacTag compute(std::string_view key, const Bytes &message);

        /** Constant-time comparison of the computed tag with `tag`. */
        static bool verify(std::string_view key, const Bytes &message, const Bytes &tag);
    };

    /**
     * SHA-256 hashing
     */
    class SHA256
    {
    public:
        static SHA256Hash hash(const Bytes &data);

        static SHA256Hash hash(std::string_view data);

        static std::string to_hex(const SHA256Hash &hash);

        /** Hex SHA-256 of a UTF-8 string */
        static std::string hex_digest(std::string_view data);
    };

    /**
     * Base64 encoding/decoding
     */
    class Base64
    {
    public:
        /**
         * Encode bytes to base64 string (standard alphabet)
         */
        static std::string encode(const Bytes &data);

        /**
         * Decode base64 string to bytes
         */
        static Result<Bytes> decode(const std::string &encoded);

        /**
         * Encode to URL-safe base64 (no padding)
         */
        static std::string encode_url_safe(const Bytes &data);

        /**
         * Decode URL-safe base64 (no padding)
         */
        static Result<Bytes> decode_url_safe(const std::string &encoded);
    };

    inline Bytes to_bytes(std::string_view s)
    {
        return Bytes(s.begin(), s.end());
    }

} // namespace tiergate::crypto
