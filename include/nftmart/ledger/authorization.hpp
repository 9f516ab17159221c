#pragma once

#include <datapod/datapod.hpp>
#include <keylock/keylock.hpp>
#include <string>
#include <vector>

#include "nftmart/common/types.hpp"
#include "nftmart/ledger/key.hpp"
#include "nftmart/ledger/serializer.hpp"

namespace nftmart::ledger {

    constexpr const char *FEE_AUTHORIZATION_DOMAIN = "nftmart.fee-authorization.v1";

    /// Signature envelope: Ed25519 public key (32 bytes) followed by the signature (64 bytes)
    using Authorization = std::vector<uint8_t>;

    /// Packed fields behind the fee authorization digest: domain tag, collection owner,
    /// collection fee (u16) and counterpart
    inline std::vector<uint8_t> feeAuthorizationPreimage(const Identity &collection_owner,
                                                         BasisPoints collection_fee_bps, const Identity &counterpart) {
        std::vector<uint8_t> packed;
        BinarySerializer::writeString(packed, FEE_AUTHORIZATION_DOMAIN);
        BinarySerializer::writeString(packed, collection_owner);
        BinarySerializer::writeUint16(packed, collection_fee_bps);
        BinarySerializer::writeString(packed, counterpart);
        return packed;
    }

    /// Digest the operator signs to sanction a collection fee for one counterpart.
    /// The counterpart is whoever invokes the purchase or accept call.
    inline std::vector<uint8_t> feeAuthorizationMessage(const Identity &collection_owner, BasisPoints collection_fee_bps,
                                                        const Identity &counterpart) {
        keylock::keylock crypto(keylock::Algorithm::XChaCha20_Poly1305, keylock::HashAlgorithm::SHA256);
        auto hash_result = crypto.hash(feeAuthorizationPreimage(collection_owner, collection_fee_bps, counterpart));
        if (!hash_result.success) {
            return {};
        }
        return hash_result.data;
    }

    /// Recovers the identity that produced a signature over a message
    class SignatureOracle {
      public:
        virtual ~SignatureOracle() = default;

        /// Returns the null identity when no signer can be recovered
        virtual Identity recoverSigner(const std::vector<uint8_t> &message, const Authorization &signature) const = 0;
    };

    /// Ed25519 recovery over keylock: verify with the embedded public key and report its identity
    class Ed25519SignatureOracle : public SignatureOracle {
      public:
        inline Identity recoverSigner(const std::vector<uint8_t> &message,
                                      const Authorization &signature) const override {
            if (message.empty() || signature.size() != Key::PUBLIC_KEY_SIZE + Key::SIGNATURE_SIZE) {
                return "";
            }

            std::vector<uint8_t> public_key(signature.begin(), signature.begin() + Key::PUBLIC_KEY_SIZE);
            std::vector<uint8_t> sig(signature.begin() + Key::PUBLIC_KEY_SIZE, signature.end());

            auto key = Key::fromPublicKey(public_key);
            if (!key.is_ok()) {
                return "";
            }

            auto verified = key.value().verify(message, sig);
            if (!verified.is_ok() || !verified.value()) {
                return "";
            }
            return key.value().getId();
        }
    };

    /// Produce the envelope the operator hands to a buyer or accepting owner off-chain
    inline dp::Result<Authorization, dp::Error> signFeeAuthorization(const Key &operator_key,
                                                                     const Identity &collection_owner,
                                                                     BasisPoints collection_fee_bps,
                                                                     const Identity &counterpart) {
        auto message = feeAuthorizationMessage(collection_owner, collection_fee_bps, counterpart);
        if (message.empty()) {
            return dp::Result<Authorization, dp::Error>::err(dp::Error::io_error("Failed to hash fee authorization"));
        }

        auto sign_result = operator_key.sign(message);
        if (!sign_result.is_ok()) {
            return dp::Result<Authorization, dp::Error>::err(sign_result.error());
        }

        Authorization envelope = operator_key.getPublicKey();
        envelope.insert(envelope.end(), sign_result.value().begin(), sign_result.value().end());
        return dp::Result<Authorization, dp::Error>::ok(envelope);
    }

} // namespace nftmart::ledger
