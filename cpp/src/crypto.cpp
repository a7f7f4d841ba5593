#include "tiergate/crypto.hpp"
#include <sodium.h>
#include <format>
#include <cstring>

namespace tiergate::crypto
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

    // ============================================================================
    // Ed25519KeyPair Implementation
    // ============================================================================

    Result<Ed25519KeyPair> Ed25519KeyPair::generate()
    {
        Ed25519KeyPair keypair;

        if (crypto_sign_keypair(keypair.public_key.data(), keypair.secret_key.data()) != 0)
        {
            return std::unexpected(TiergateError::crypto("Failed to generate Ed25519 keypair"));
        }

        return keypair;
    }

    Ed25519Signature Ed25519KeyPair::sign(const Bytes &message) const
    {
        Ed25519Signature signature;
        unsigned long long sig_len;

        crypto_sign_detached(
            signature.data(),
            &sig_len,
            message.data(),
            message.size(),
            secret_key.data());

        return signature;
    }

    bool Ed25519KeyPair::verify(
        const Bytes &message,
        const Ed25519Signature &signature,
        const Ed25519PublicKey &public_key)
    {
        return crypto_sign_verify_detached(
                   signature.data(),
                   message.data(),
                   message.size(),
                   public_key.data()) == 0;
    }

    Result<Ed25519PublicKey> Ed25519KeyPair::public_key_from_b64(const std::string &b64)
    {
        auto decoded = Base64::decode(b64);
        if (!decoded)
            return std::unexpected(decoded.error());
        if (decoded->size() != crypto_sign_PUBLICKEYBYTES)
        {
            return std::unexpected(TiergateError::crypto(
                std::format("Invalid Ed25519 public key length: {}", decoded->size())));
        }
        Ed25519PublicKey key;
        std::copy(decoded->begin(), decoded->end(), key.begin());
        return key;
    }

    // ============================================================================
    // HmacSha256 Implementation
    // ============================================================================

    HmacTag HmacSha256::compute(std::string_view key, const Bytes &message)
    {
        HmacTag tag;
        crypto_auth_hmacsha256_state state;
        crypto_auth_hmacsha256_init(&state,
                                    reinterpret_cast<const uint8_t *>(key.data()),
                                    key.size());
        crypto_auth_hmacsha256_update(&state, message.data(), message.size());
        crypto_auth_hmacsha256_final(&state, tag.data());
        sodium_memzero(&state, sizeof(state));
        return tag;
    }

    bool HmacSha256::verify(std::string_view key, const Bytes &message, const Bytes &tag)
    {
        if (tag.size() != crypto_auth_hmacsha256_BYTES)
            return false;
        auto expected = compute(key, message);
        return sodium_memcmp(expected.data(), tag.data(), expected.size()) == 0;
    }

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
        std::string hex;
        hex.reserve(64);
        for (uint8_t byte : hash)
        {
            hex += std::format("{:02x}", byte);
        }
        return hex;
    }

    std::string SHA256::hex_digest(std::string_view data)
    {
        return to_hex(hash(data));
    }

    // ============================================================================
    // Base64 Implementation
    // ============================================================================

    std::string Base64::encode(const Bytes &data)
    {
        size_t b64_len = sodium_base64_encoded_len(data.size(), sodium_base64_VARIANT_ORIGINAL);
        std::string encoded(b64_len, '\0');

        sodium_bin2base64(
            encoded.data(),
            b64_len,
            data.data(),
            data.size(),
            sodium_base64_VARIANT_ORIGINAL);

        // Remove null terminator
        encoded.resize(std::strlen(encoded.c_str()));
        return encoded;
    }

    Result<Bytes> Base64::decode(const std::string &encoded)
    {
        Bytes decoded(encoded.size() + 1);
        size_t decoded_len;

        if (sodium_base642bin(
                decoded.data(),
                decoded.size(),
                encoded.c_str(),
                encoded.size(),
                nullptr,
                &decoded_len,
                nullptr,
                sodium_base64_VARIANT_ORIGINAL) != 0)
        {
            return std::unexpected(TiergateError::crypto("Invalid base64 encoding"));
        }

        decoded.resize(decoded_len);
        return decoded;
    }

    std::string Base64::encode_url_safe(const Bytes &data)
    {
        size_t b64_len = sodium_base64_encoded_len(data.size(), sodium_base64_VARIANT_URLSAFE_NO_PADDING);
        std::string encoded(b64_len, '\0');

        sodium_bin2base64(
            encoded.data(),
            b64_len,
            data.data(),
            data.size(),
            sodium_base64_VARIANT_URLSAFE_NO_PADDING);

        encoded.resize(std::strlen(encoded.c_str()));
        return encoded;
    }

    Result<Bytes> Base64::decode_url_safe(const std::string &encoded)
    {
        Bytes decoded(encoded.size() + 1);
        size_t decoded_len;
        const char *end = nullptr;

        if (sodium_base642bin(
                decoded.data(),
                decoded.size(),
                encoded.c_str(),
                encoded.size(),
                nullptr,
                &decoded_len,
                &end,
                sodium_base64_VARIANT_URLSAFE_NO_PADDING) != 0)
        {
            return std::unexpected(TiergateError::crypto("Invalid base64url encoding"));
        }
        // Trailing garbage is not a valid segment
        if (end != encoded.c_str() + encoded.size())
        {
            return std::unexpected(TiergateError::crypto("Invalid base64url encoding"));
        }

        decoded.resize(decoded_len);
        return decoded;
    }

} // namespace tiergate::crypto
