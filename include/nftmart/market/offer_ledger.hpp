#pragma once

#include <datapod/datapod.hpp>
#include <utility>
#include <vector>

#include "nftmart/common/types.hpp"
#include "nftmart/ledger/authorization.hpp"
#include "nftmart/market/context.hpp"

namespace nftmart {

    /// Standing offers, one per (asset, token, offerer), backed by value escrowed in the marketplace account
    class OfferLedger {
      public:
        inline explicit OfferLedger(MarketContext &ctx) : ctx_(ctx) {}

        /// Records offer_price; any stake above it is retained by the marketplace without refund
        dp::Result<void, dp::Error> makeOffer(const AssetId &asset, TokenId token, Amount offer_price, Amount staked,
                                              const Identity &caller);

        /// Refunds the full recorded offer to the caller
        dp::Result<void, dp::Error> cancelOffer(const AssetId &asset, TokenId token, const Identity &caller);

        /// Token owner takes an offer; the escrowed amount is settled with the owner as payee
        dp::Result<SettlementRecord, dp::Error> acceptOffer(const AssetId &asset, TokenId token,
                                                            const ledger::Authorization &authorization,
                                                            const Identity &collection_owner,
                                                            BasisPoints collection_fee_bps, const Identity &offerer,
                                                            const Identity &caller);

        inline Amount getOffer(const AssetId &asset, TokenId token, const Identity &offerer) const {
            return ctx_.store.getOffer(asset, token, offerer);
        }

        inline std::vector<std::pair<Identity, Amount>> getOffers(const AssetId &asset, TokenId token) const {
            return ctx_.store.offersFor(asset, token);
        }

      private:
        MarketContext &ctx_;
    };

} // namespace nftmart
