#pragma once

#include <datapod/datapod.hpp>
#include <keylock/keylock.hpp>
#include <string>
#include <vector>

namespace nftmart {

    /// Ed25519 keypair identity for the marketplace operator
    /// Header-only implementation using keylock for crypto operations
    class Key {
      public:
        static constexpr std::size_t PUBLIC_KEY_SIZE = 32;
        static constexpr std::size_t SIGNATURE_SIZE = 64;

        /// Generate new Ed25519 keypair
        inline static dp::Result<Key, dp::Error> generate() {
            keylock::keylock crypto(keylock::Algorithm::Ed25519);
            auto keypair = crypto.generate_keypair();

            if (keypair.private_key.empty()) {
                return dp::Result<Key, dp::Error>::err(dp::Error::io_error("Failed to generate keypair"));
            }

            return dp::Result<Key, dp::Error>::ok(Key(keypair));
        }

        /// Create from keylock::KeyPair directly
        inline explicit Key(const keylock::KeyPair &keypair) : keypair_(keypair) {}

        /// Load from keypair bytes (private key can be 32 or 64 bytes for Ed25519)
        inline static dp::Result<Key, dp::Error> fromKeypair(const std::vector<uint8_t> &public_key,
                                                             const std::vector<uint8_t> &private_key) {
            if (public_key.size() != PUBLIC_KEY_SIZE) {
                return dp::Result<Key, dp::Error>::err(
                    dp::Error::invalid_argument("Ed25519 public key must be 32 bytes"));
            }
            if (private_key.size() != 32 && private_key.size() != 64) {
                return dp::Result<Key, dp::Error>::err(
                    dp::Error::invalid_argument("Ed25519 private key must be 32 or 64 bytes"));
            }

            keylock::KeyPair keypair;
            keypair.public_key = public_key;
            keypair.private_key = private_key;
            return dp::Result<Key, dp::Error>::ok(Key(keypair));
        }

        /// Load from public key only (for verification)
        inline static dp::Result<Key, dp::Error> fromPublicKey(const std::vector<uint8_t> &public_key) {
            if (public_key.size() != PUBLIC_KEY_SIZE) {
                return dp::Result<Key, dp::Error>::err(
                    dp::Error::invalid_argument("Ed25519 public key must be 32 bytes"));
            }

            keylock::KeyPair keypair;
            keypair.public_key = public_key;
            return dp::Result<Key, dp::Error>::ok(Key(keypair));
        }

        inline dp::Result<std::vector<uint8_t>, dp::Error> sign(const std::vector<uint8_t> &data) const {
            if (keypair_.private_key.empty()) {
                return dp::Result<std::vector<uint8_t>, dp::Error>::err(
                    dp::Error::io_error("No private key available"));
            }

            keylock::keylock crypto(keylock::Algorithm::Ed25519);
            auto result = crypto.sign(data, keypair_.private_key);

            if (!result.success) {
                return dp::Result<std::vector<uint8_t>, dp::Error>::err(
                    dp::Error::io_error(dp::String(result.error_message.c_str())));
            }

            return dp::Result<std::vector<uint8_t>, dp::Error>::ok(result.data);
        }

        /// Verify signature. A well-formed but wrong signature yields ok(false).
        inline dp::Result<bool, dp::Error> verify(const std::vector<uint8_t> &data,
                                                  const std::vector<uint8_t> &signature) const {
            if (keypair_.public_key.empty()) {
                return dp::Result<bool, dp::Error>::err(dp::Error::invalid_argument("No public key available"));
            }
            if (signature.size() != SIGNATURE_SIZE) {
                return dp::Result<bool, dp::Error>::err(
                    dp::Error::invalid_argument("Ed25519 signature must be 64 bytes"));
            }

            keylock::keylock crypto(keylock::Algorithm::Ed25519);
            auto result = crypto.verify(data, signature, keypair_.public_key);

            return dp::Result<bool, dp::Error>::ok(result.success);
        }

        inline const std::vector<uint8_t> &getPublicKey() const { return keypair_.public_key; }

        inline bool hasPrivateKey() const { return !keypair_.private_key.empty(); }

        /// Identity of the key: SHA-256 of the public key, hex encoded
        inline std::string getId() const { return idFromPublicKey(keypair_.public_key); }

        inline static std::string idFromPublicKey(const std::vector<uint8_t> &public_key) {
            if (public_key.empty()) {
                return "";
            }

            keylock::keylock crypto(keylock::Algorithm::XChaCha20_Poly1305, keylock::HashAlgorithm::SHA256);
            auto hash_result = crypto.hash(public_key);

            if (!hash_result.success) {
                return "";
            }

            return keylock::keylock::to_hex(hash_result.data);
        }

        /// Equality operator (compares public keys)
        inline bool operator==(const Key &other) const { return keypair_.public_key == other.keypair_.public_key; }

        inline bool operator!=(const Key &other) const { return !(*this == other); }

      private:
        keylock::KeyPair keypair_;
    };

} // namespace nftmart
