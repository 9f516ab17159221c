#pragma once

#include <datapod/datapod.hpp>

#include "nftmart/common/types.hpp"
#include "nftmart/ledger/authorization.hpp"
#include "nftmart/market/context.hpp"

namespace nftmart {

    /// Fixed-price listing lifecycle: list, update, cancel, consume on purchase.
    /// Callers run each operation inside a call frame; a failed operation may leave partial
    /// changes that only the frame's rollback removes.
    class ListingLedger {
      public:
        inline explicit ListingLedger(MarketContext &ctx) : ctx_(ctx) {}

        dp::Result<void, dp::Error> listItem(const AssetId &asset, TokenId token, Amount price, const Identity &caller);

        dp::Result<void, dp::Error> updateListing(const AssetId &asset, TokenId token, Amount new_price,
                                                  const Identity &caller);

        dp::Result<void, dp::Error> cancelListing(const AssetId &asset, TokenId token, const Identity &caller);

        /// Any amount paid above the listing price stays with the marketplace
        dp::Result<SettlementRecord, dp::Error> buyItem(const AssetId &asset, TokenId token, Amount paid,
                                                        const ledger::Authorization &authorization,
                                                        const Identity &collection_owner,
                                                        BasisPoints collection_fee_bps, const Identity &caller);

        inline Listing getListing(const AssetId &asset, TokenId token) const {
            return ctx_.store.getListing(asset, token);
        }

      private:
        dp::Result<void, dp::Error> requireOwner(ledger::TokenRegistry &registry, TokenId token,
                                                 const Identity &caller) const;

        MarketContext &ctx_;
    };

} // namespace nftmart
