#include <nftmart/market/listing_ledger.hpp>

namespace nftmart {

    dp::Result<void, dp::Error> ListingLedger::requireOwner(ledger::TokenRegistry &registry, TokenId token,
                                                            const Identity &caller) const {
        auto owner = registry.ownerOf(token);
        if (!owner.is_ok()) {
            return dp::Result<void, dp::Error>::err(owner.error());
        }
        if (owner.value() != caller) {
            return dp::Result<void, dp::Error>::err(not_owner());
        }
        return dp::Result<void, dp::Error>::ok();
    }

    dp::Result<void, dp::Error> ListingLedger::listItem(const AssetId &asset, TokenId token, Amount price,
                                                        const Identity &caller) {
        auto registry = ctx_.collections.resolve(asset);
        if (!registry.is_ok()) {
            return dp::Result<void, dp::Error>::err(registry.error());
        }

        if (ctx_.store.getListing(asset, token).isListed()) {
            return dp::Result<void, dp::Error>::err(already_listed(asset, token));
        }
        auto owned = requireOwner(*registry.value(), token, caller);
        if (!owned.is_ok()) {
            return owned;
        }
        if (price == 0) {
            return dp::Result<void, dp::Error>::err(price_must_be_above_zero());
        }
        auto approved = registry.value()->getApproved(token);
        if (!approved.is_ok()) {
            return dp::Result<void, dp::Error>::err(approved.error());
        }
        if (approved.value() != ctx_.config.account) {
            return dp::Result<void, dp::Error>::err(not_approved_for_marketplace());
        }

        ctx_.store.putListing(asset, token, Listing{price, caller});
        ctx_.events.emit(ledger::ItemListed{caller, asset, token, price});
        ctx_.log("Listed " + asset + "#" + std::to_string(token) + " by " + caller + " at " + std::to_string(price));
        return dp::Result<void, dp::Error>::ok();
    }

    dp::Result<void, dp::Error> ListingLedger::updateListing(const AssetId &asset, TokenId token, Amount new_price,
                                                             const Identity &caller) {
        auto registry = ctx_.collections.resolve(asset);
        if (!registry.is_ok()) {
            return dp::Result<void, dp::Error>::err(registry.error());
        }

        auto owned = requireOwner(*registry.value(), token, caller);
        if (!owned.is_ok()) {
            return owned;
        }
        Listing listing = ctx_.store.getListing(asset, token);
        if (!listing.isListed()) {
            return dp::Result<void, dp::Error>::err(not_listed(asset, token));
        }
        // A zero price would silently turn the listing into the "not listed" sentinel
        if (new_price == 0) {
            return dp::Result<void, dp::Error>::err(price_must_be_above_zero());
        }

        listing.price = new_price;
        ctx_.store.putListing(asset, token, listing);
        ctx_.events.emit(ledger::ItemListed{caller, asset, token, new_price});
        ctx_.log("Updated " + asset + "#" + std::to_string(token) + " to " + std::to_string(new_price));
        return dp::Result<void, dp::Error>::ok();
    }

    dp::Result<void, dp::Error> ListingLedger::cancelListing(const AssetId &asset, TokenId token,
                                                             const Identity &caller) {
        auto registry = ctx_.collections.resolve(asset);
        if (!registry.is_ok()) {
            return dp::Result<void, dp::Error>::err(registry.error());
        }

        auto owned = requireOwner(*registry.value(), token, caller);
        if (!owned.is_ok()) {
            return owned;
        }
        if (!ctx_.store.getListing(asset, token).isListed()) {
            return dp::Result<void, dp::Error>::err(not_listed(asset, token));
        }

        ctx_.store.eraseListing(asset, token);
        ctx_.events.emit(ledger::ItemCanceled{caller, asset, token});
        ctx_.log("Canceled listing " + asset + "#" + std::to_string(token));
        return dp::Result<void, dp::Error>::ok();
    }

    dp::Result<SettlementRecord, dp::Error>
    ListingLedger::buyItem(const AssetId &asset, TokenId token, Amount paid, const ledger::Authorization &authorization,
                           const Identity &collection_owner, BasisPoints collection_fee_bps, const Identity &caller) {
        using R = dp::Result<SettlementRecord, dp::Error>;

        auto registry = ctx_.collections.resolve(asset);
        if (!registry.is_ok()) {
            return R::err(registry.error());
        }

        Listing listing = ctx_.store.getListing(asset, token);
        if (!listing.isListed()) {
            return R::err(not_listed(asset, token));
        }
        if (paid < listing.price) {
            return R::err(price_not_met(asset, token, listing.price));
        }

        // Effects before interactions: the listing is gone before the token or any value moves
        ctx_.store.eraseListing(asset, token);

        if (!ctx_.value.transfer(caller, ctx_.config.account, paid)) {
            return R::err(insufficient_funds(caller, paid));
        }

        auto moved = registry.value()->safeTransferFrom(ctx_.config.account, listing.seller, caller, token);
        if (!moved.is_ok()) {
            return R::err(moved.error());
        }

        SettlementRequest request;
        request.total_price = listing.price;
        request.authorization = authorization;
        request.collection_owner = collection_owner;
        request.collection_fee_bps = collection_fee_bps;
        request.payee = listing.seller;
        request.counterpart = caller;

        auto settled = ctx_.settlement.settle(request, ctx_.fees);
        if (!settled.is_ok()) {
            return settled;
        }

        ctx_.events.emit(ledger::ItemBought{caller, asset, token, listing.price});
        ctx_.log("Sold " + asset + "#" + std::to_string(token) + " to " + caller + " for " +
                 std::to_string(listing.price));
        return settled;
    }

} // namespace nftmart
