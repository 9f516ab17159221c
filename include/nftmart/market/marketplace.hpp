#pragma once

#include <datapod/datapod.hpp>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "nftmart/common/error.hpp"
#include "nftmart/common/types.hpp"
#include "nftmart/ledger/authorization.hpp"
#include "nftmart/ledger/events.hpp"
#include "nftmart/ledger/journal.hpp"
#include "nftmart/ledger/registry.hpp"
#include "nftmart/ledger/value.hpp"
#include "nftmart/market/collections.hpp"
#include "nftmart/market/config.hpp"
#include "nftmart/market/context.hpp"
#include "nftmart/market/fee_schedule.hpp"
#include "nftmart/market/listing_ledger.hpp"
#include "nftmart/market/offer_ledger.hpp"
#include "nftmart/market/settlement.hpp"
#include "nftmart/market/store.hpp"

namespace nftmart {

    // ===========================================
    // Marketplace - public surface over both ledgers
    // ===========================================

    /// Every mutating call holds the reentrancy guard and runs in a call frame: it either
    /// completes or leaves the store, the event log, the value ledger and every registered
    /// registry exactly as it found them.
    class Marketplace {
      public:
        /// Throws std::invalid_argument when value or oracle is null
        Marketplace(MarketplaceConfig config, std::shared_ptr<ledger::ValueTransfer> value,
                    std::shared_ptr<ledger::SignatureOracle> oracle = std::make_shared<ledger::Ed25519SignatureOracle>());

        /// Non-throwing construction; fails with invalid_argument when a collaborator is missing
        static dp::Result<std::shared_ptr<Marketplace>, dp::Error>
        create(MarketplaceConfig config, std::shared_ptr<ledger::ValueTransfer> value,
               std::shared_ptr<ledger::SignatureOracle> oracle = std::make_shared<ledger::Ed25519SignatureOracle>());

        Marketplace(const Marketplace &) = delete;
        Marketplace &operator=(const Marketplace &) = delete;

        dp::Result<void, dp::Error> registerCollection(const AssetId &asset,
                                                       std::shared_ptr<ledger::TokenRegistry> registry);

        // === Listing Ledger ===

        dp::Result<void, dp::Error> listItem(const AssetId &asset, TokenId token, Amount price, const Identity &caller);

        dp::Result<void, dp::Error> updateListing(const AssetId &asset, TokenId token, Amount new_price,
                                                  const Identity &caller);

        dp::Result<void, dp::Error> cancelListing(const AssetId &asset, TokenId token, const Identity &caller);

        dp::Result<SettlementRecord, dp::Error> buyItem(const AssetId &asset, TokenId token, Amount paid,
                                                        const ledger::Authorization &authorization,
                                                        const Identity &collection_owner,
                                                        BasisPoints collection_fee_bps, const Identity &caller);

        // === Offer Ledger ===

        dp::Result<void, dp::Error> makeOffer(const AssetId &asset, TokenId token, Amount offer_price, Amount staked,
                                              const Identity &caller);

        dp::Result<void, dp::Error> cancelOffer(const AssetId &asset, TokenId token, const Identity &caller);

        dp::Result<SettlementRecord, dp::Error> acceptOffer(const AssetId &asset, TokenId token,
                                                            const ledger::Authorization &authorization,
                                                            const Identity &collection_owner,
                                                            BasisPoints collection_fee_bps, const Identity &offerer,
                                                            const Identity &caller);

        // === Fee configuration (operator only) ===

        dp::Result<void, dp::Error> setMarketplaceFee(const Identity &caller, dp::u32 fee_bps);
        dp::Result<void, dp::Error> transferOperator(const Identity &caller, const Identity &new_operator);

        // === Views (safe to call from hooks during a call) ===

        Listing getListing(const AssetId &asset, TokenId token) const;
        Amount getOffer(const AssetId &asset, TokenId token, const Identity &offerer) const;
        std::vector<std::pair<Identity, Amount>> getOffers(const AssetId &asset, TokenId token) const;
        BasisPoints getMarketplaceFee() const;
        Identity getOperator() const;
        Amount getEscrowedAmount() const;
        Amount getRetainedSurplus() const;
        const Identity &getAccount() const { return config_.account; }

        ledger::EventLog &events() { return events_; }
        const ledger::EventLog &events() const { return events_; }

        // === Persistence ===

        dp::Result<dp::ByteBuf, dp::Error> serialize() const;
        dp::Result<void, dp::Error> restore(const dp::ByteBuf &data);
        dp::Result<void, dp::Error> saveToFile(const std::string &filename) const;
        dp::Result<void, dp::Error> loadFromFile(const std::string &filename);

        void printSummary() const;

      private:
        template <typename T, typename Op> dp::Result<T, dp::Error> execute(const char *operation, Op &&op);

        std::vector<ledger::Journaled *> participants();

        // Rejects records that would break the "present means non-zero" invariants
        dp::Result<void, dp::Error> validateSnapshot(const MarketSnapshot &snapshot) const;

        MarketplaceConfig config_;
        std::shared_ptr<ledger::ValueTransfer> value_;
        std::shared_ptr<ledger::SignatureOracle> oracle_;
        MarketStore store_;
        CollectionDirectory collections_;
        FeeSchedule fees_;
        ledger::EventLog events_;
        SettlementEngine settlement_;
        MarketContext ctx_;
        ListingLedger listings_;
        OfferLedger offers_;
        ledger::ReentrancyGuard guard_;
    };

} // namespace nftmart
