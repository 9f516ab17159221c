#pragma once

#include <datapod/datapod.hpp>
#include <string>

namespace nftmart {

    // ===========================================
    // Marketplace error codes (100+)
    // ===========================================

    // Preconditions
    constexpr dp::u32 ERR_NOT_OWNER = 100;
    constexpr dp::u32 ERR_CAN_NOT_BE_OWNER = 101;
    constexpr dp::u32 ERR_ALREADY_LISTED = 102;
    constexpr dp::u32 ERR_NOT_LISTED = 103;
    constexpr dp::u32 ERR_PRICE_MUST_BE_ABOVE_ZERO = 104;
    constexpr dp::u32 ERR_NOT_APPROVED_FOR_MARKETPLACE = 105;
    constexpr dp::u32 ERR_ALREADY_OFFERED = 106;
    constexpr dp::u32 ERR_NO_OFFERED = 107;

    // Economic mismatch
    constexpr dp::u32 ERR_PRICE_NOT_MET = 110;
    constexpr dp::u32 ERR_OFFER_PRICE_NOT_MET = 111;
    constexpr dp::u32 ERR_INSUFFICIENT_FUNDS = 112;
    constexpr dp::u32 ERR_FEES_EXCEED_PRICE = 113;
    constexpr dp::u32 ERR_FEE_OUT_OF_RANGE = 114;

    // Authorization
    constexpr dp::u32 ERR_NOT_SIGNED_BY_MARKETPLACE_OWNER = 120;
    constexpr dp::u32 ERR_NOT_MARKETPLACE_OWNER = 121;

    // Downstream transfers
    constexpr dp::u32 ERR_MARKETPLACE_PROCEEDS_TRANSFER_FAILED = 130;
    constexpr dp::u32 ERR_COLLECTION_OWNER_PROCEEDS_TRANSFER_FAILED = 131;
    constexpr dp::u32 ERR_SELLER_PROCEEDS_TRANSFER_FAILED = 132;
    constexpr dp::u32 ERR_CANCEL_OFFER_PROCEEDS_TRANSFER_FAILED = 133;

    // Execution
    constexpr dp::u32 ERR_REENTRANT_CALL = 140;
    constexpr dp::u32 ERR_UNKNOWN_COLLECTION = 141;
    constexpr dp::u32 ERR_SERIALIZATION_FAILED = 142;
    constexpr dp::u32 ERR_DESERIALIZATION_FAILED = 143;

    // ===========================================
    // Error factory functions
    // ===========================================

    inline dp::String describe(const std::string &name, const std::string &args) {
        return dp::String((name + "(" + args + ")").c_str());
    }

    inline std::string tokenArgs(const std::string &asset, dp::u64 token) {
        return "\"" + asset + "\", " + std::to_string(token);
    }

    inline dp::Error not_owner() { return dp::Error{ERR_NOT_OWNER, "NotOwner"}; }

    inline dp::Error can_not_be_owner() { return dp::Error{ERR_CAN_NOT_BE_OWNER, "CanNotBeOwner"}; }

    inline dp::Error already_listed(const std::string &asset, dp::u64 token) {
        return dp::Error{ERR_ALREADY_LISTED, describe("AlreadyListed", tokenArgs(asset, token))};
    }

    inline dp::Error not_listed(const std::string &asset, dp::u64 token) {
        return dp::Error{ERR_NOT_LISTED, describe("NotListed", tokenArgs(asset, token))};
    }

    inline dp::Error price_must_be_above_zero() {
        return dp::Error{ERR_PRICE_MUST_BE_ABOVE_ZERO, "PriceMustBeAboveZero"};
    }

    inline dp::Error not_approved_for_marketplace() {
        return dp::Error{ERR_NOT_APPROVED_FOR_MARKETPLACE, "NotApprovedForMarketplace"};
    }

    inline dp::Error already_offered(const std::string &asset, dp::u64 token, const std::string &offerer) {
        return dp::Error{ERR_ALREADY_OFFERED,
                         describe("AlreadyOffered", tokenArgs(asset, token) + ", \"" + offerer + "\"")};
    }

    inline dp::Error no_offered(const std::string &asset, dp::u64 token, const std::string &offerer) {
        return dp::Error{ERR_NO_OFFERED, describe("NoOffered", tokenArgs(asset, token) + ", \"" + offerer + "\"")};
    }

    inline dp::Error price_not_met(const std::string &asset, dp::u64 token, dp::u64 price) {
        return dp::Error{ERR_PRICE_NOT_MET,
                         describe("PriceNotMet", tokenArgs(asset, token) + ", " + std::to_string(price))};
    }

    inline dp::Error offer_price_not_met(const std::string &asset, dp::u64 token, dp::u64 price) {
        return dp::Error{ERR_OFFER_PRICE_NOT_MET,
                         describe("OfferPriceNotMet", tokenArgs(asset, token) + ", " + std::to_string(price))};
    }

    inline dp::Error insufficient_funds(const std::string &payer, dp::u64 amount) {
        return dp::Error{ERR_INSUFFICIENT_FUNDS,
                         describe("InsufficientFunds", "\"" + payer + "\", " + std::to_string(amount))};
    }

    inline dp::Error fees_exceed_price(dp::u32 marketplace_fee_bps, dp::u32 collection_fee_bps) {
        return dp::Error{ERR_FEES_EXCEED_PRICE,
                         describe("FeesExceedPrice",
                                  std::to_string(marketplace_fee_bps) + ", " + std::to_string(collection_fee_bps))};
    }

    inline dp::Error fee_out_of_range(dp::u32 fee_bps) {
        return dp::Error{ERR_FEE_OUT_OF_RANGE, describe("FeeOutOfRange", std::to_string(fee_bps))};
    }

    inline dp::Error not_signed_by_marketplace_owner() {
        return dp::Error{ERR_NOT_SIGNED_BY_MARKETPLACE_OWNER, "NotSignedByMarketplaceOwner"};
    }

    inline dp::Error not_marketplace_owner() { return dp::Error{ERR_NOT_MARKETPLACE_OWNER, "NotMarketplaceOwner"}; }

    inline dp::Error marketplace_proceeds_transfer_failed() {
        return dp::Error{ERR_MARKETPLACE_PROCEEDS_TRANSFER_FAILED, "MarketplaceProceedsTransferFailed"};
    }

    inline dp::Error collection_owner_proceeds_transfer_failed() {
        return dp::Error{ERR_COLLECTION_OWNER_PROCEEDS_TRANSFER_FAILED, "CollectionOwnerProceedsTransferFailed"};
    }

    inline dp::Error seller_proceeds_transfer_failed() {
        return dp::Error{ERR_SELLER_PROCEEDS_TRANSFER_FAILED, "SellerProceedsTransferFailed"};
    }

    inline dp::Error cancel_offer_proceeds_transfer_failed() {
        return dp::Error{ERR_CANCEL_OFFER_PROCEEDS_TRANSFER_FAILED, "CancelOfferProceedsTransferFailed"};
    }

    inline dp::Error reentrant_call(const dp::String &msg = "ReentrantCall") {
        return dp::Error{ERR_REENTRANT_CALL, msg};
    }

    inline dp::Error unknown_collection(const std::string &asset) {
        return dp::Error{ERR_UNKNOWN_COLLECTION, describe("UnknownCollection", "\"" + asset + "\"")};
    }

    inline dp::Error serialization_failed(const dp::String &msg = "Serialization failed") {
        return dp::Error{ERR_SERIALIZATION_FAILED, msg};
    }

    inline dp::Error deserialization_failed(const dp::String &msg = "Deserialization failed") {
        return dp::Error{ERR_DESERIALIZATION_FAILED, msg};
    }

} // namespace nftmart
