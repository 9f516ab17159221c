#include <nftmart/market/offer_ledger.hpp>

namespace nftmart {

    dp::Result<void, dp::Error> OfferLedger::makeOffer(const AssetId &asset, TokenId token, Amount offer_price,
                                                       Amount staked, const Identity &caller) {
        auto registry = ctx_.collections.resolve(asset);
        if (!registry.is_ok()) {
            return dp::Result<void, dp::Error>::err(registry.error());
        }

        auto owner = registry.value()->ownerOf(token);
        if (!owner.is_ok()) {
            return dp::Result<void, dp::Error>::err(owner.error());
        }
        if (owner.value() == caller) {
            return dp::Result<void, dp::Error>::err(can_not_be_owner());
        }
        if (ctx_.store.getOffer(asset, token, caller) > 0) {
            return dp::Result<void, dp::Error>::err(already_offered(asset, token, caller));
        }
        if (staked < offer_price) {
            return dp::Result<void, dp::Error>::err(offer_price_not_met(asset, token, offer_price));
        }
        if (offer_price == 0) {
            return dp::Result<void, dp::Error>::err(price_must_be_above_zero());
        }

        ctx_.store.putOffer(asset, token, caller, offer_price);
        ctx_.store.addRetainedSurplus(staked - offer_price);

        if (!ctx_.value.transfer(caller, ctx_.config.account, staked)) {
            return dp::Result<void, dp::Error>::err(insufficient_funds(caller, staked));
        }

        ctx_.events.emit(ledger::ItemOffered{caller, asset, token, offer_price});
        ctx_.log("Offer on " + asset + "#" + std::to_string(token) + " by " + caller + " for " +
                 std::to_string(offer_price));
        return dp::Result<void, dp::Error>::ok();
    }

    dp::Result<void, dp::Error> OfferLedger::cancelOffer(const AssetId &asset, TokenId token, const Identity &caller) {
        auto registry = ctx_.collections.resolve(asset);
        if (!registry.is_ok()) {
            return dp::Result<void, dp::Error>::err(registry.error());
        }

        Amount amount = ctx_.store.getOffer(asset, token, caller);
        if (amount == 0) {
            return dp::Result<void, dp::Error>::err(no_offered(asset, token, caller));
        }
        auto owner = registry.value()->ownerOf(token);
        if (!owner.is_ok()) {
            return dp::Result<void, dp::Error>::err(owner.error());
        }
        if (owner.value() == caller) {
            return dp::Result<void, dp::Error>::err(can_not_be_owner());
        }

        // Zeroed before the refund hands control to the offerer
        ctx_.store.eraseOffer(asset, token, caller);
        if (!ctx_.value.transfer(ctx_.config.account, caller, amount)) {
            return dp::Result<void, dp::Error>::err(cancel_offer_proceeds_transfer_failed());
        }

        ctx_.events.emit(ledger::ItemOfferCanceled{caller, asset, token});
        ctx_.log("Offer canceled on " + asset + "#" + std::to_string(token) + " by " + caller);
        return dp::Result<void, dp::Error>::ok();
    }

    dp::Result<SettlementRecord, dp::Error>
    OfferLedger::acceptOffer(const AssetId &asset, TokenId token, const ledger::Authorization &authorization,
                             const Identity &collection_owner, BasisPoints collection_fee_bps, const Identity &offerer,
                             const Identity &caller) {
        using R = dp::Result<SettlementRecord, dp::Error>;

        auto registry = ctx_.collections.resolve(asset);
        if (!registry.is_ok()) {
            return R::err(registry.error());
        }

        auto owner = registry.value()->ownerOf(token);
        if (!owner.is_ok()) {
            return R::err(owner.error());
        }
        if (owner.value() != caller) {
            return R::err(not_owner());
        }
        Amount amount = ctx_.store.getOffer(asset, token, offerer);
        if (amount == 0) {
            return R::err(no_offered(asset, token, offerer));
        }

        // Zeroed before the token moves so the same offer cannot be accepted twice
        ctx_.store.eraseOffer(asset, token, offerer);

        auto moved = registry.value()->safeTransferFrom(ctx_.config.account, caller, offerer, token);
        if (!moved.is_ok()) {
            return R::err(moved.error());
        }

        SettlementRequest request;
        request.total_price = amount;
        request.authorization = authorization;
        request.collection_owner = collection_owner;
        request.collection_fee_bps = collection_fee_bps;
        request.payee = caller;
        request.counterpart = caller;

        auto settled = ctx_.settlement.settle(request, ctx_.fees);
        if (!settled.is_ok()) {
            return settled;
        }

        ctx_.events.emit(ledger::ItemOfferAccepted{caller, offerer, asset, token, amount});
        ctx_.log("Offer accepted on " + asset + "#" + std::to_string(token) + ": " + offerer + " pays " +
                 std::to_string(amount));
        return settled;
    }

} // namespace nftmart
