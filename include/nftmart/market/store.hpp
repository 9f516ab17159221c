#pragma once

#include <datapod/datapod.hpp>
#include <functional>
#include <map>
#include <shared_mutex>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

#include "nftmart/common/types.hpp"
#include "nftmart/ledger/journal.hpp"

namespace nftmart {

    /// Fixed-price ask. price == 0 with a null seller is the "not listed" sentinel.
    struct Listing {
        Amount price = 0;
        Identity seller;

        inline bool isListed() const { return price > 0; }
    };

    // ===========================================
    // Snapshot records - POD structs with members()
    // ===========================================

    struct ListingRecord {
        dp::String asset;
        dp::u64 token = 0;
        dp::u64 price = 0;
        dp::String seller;

        auto members() { return std::tie(asset, token, price, seller); }
        auto members() const { return std::tie(asset, token, price, seller); }
    };

    struct OfferRecord {
        dp::String asset;
        dp::u64 token = 0;
        dp::String offerer;
        dp::u64 amount = 0;

        auto members() { return std::tie(asset, token, offerer, amount); }
        auto members() const { return std::tie(asset, token, offerer, amount); }
    };

    struct MarketSnapshot {
        dp::Vector<ListingRecord> listings;
        dp::Vector<OfferRecord> offers;
        dp::u64 retained_surplus = 0;
        dp::String operator_id;
        dp::u16 marketplace_fee_bps = 0;

        auto members() { return std::tie(listings, offers, retained_surplus, operator_id, marketplace_fee_bps); }
        auto members() const { return std::tie(listings, offers, retained_surplus, operator_id, marketplace_fee_bps); }
    };

    // ===========================================
    // MarketStore - listing and offer state shared by both ledgers
    // ===========================================

    class MarketStore : public ledger::Journaled {
      public:
        MarketStore() = default;
        MarketStore(const MarketStore &) = delete;
        MarketStore &operator=(const MarketStore &) = delete;

        // === Listings ===

        /// Returns the sentinel (price 0, null seller) when not listed
        Listing getListing(const AssetId &asset, TokenId token) const;
        void putListing(const AssetId &asset, TokenId token, const Listing &listing);
        void eraseListing(const AssetId &asset, TokenId token);
        size_t listingCount() const;

        // === Offers ===

        /// Returns 0 when the offerer has no standing offer
        Amount getOffer(const AssetId &asset, TokenId token, const Identity &offerer) const;
        void putOffer(const AssetId &asset, TokenId token, const Identity &offerer, Amount amount);
        void eraseOffer(const AssetId &asset, TokenId token, const Identity &offerer);
        size_t offerCount() const;

        /// Offers standing on one token, keyed by offerer
        std::vector<std::pair<Identity, Amount>> offersFor(const AssetId &asset, TokenId token) const;

        // === Escrow ===

        /// Value held on behalf of standing offers (sum of all offer amounts)
        Amount escrowedAmount() const;

        /// Staked value above declared offer prices, kept without refund
        Amount retainedSurplus() const;
        void addRetainedSurplus(Amount amount);

        // === Snapshot ===

        MarketSnapshot exportSnapshot() const;
        void importSnapshot(const MarketSnapshot &snapshot);

        void printSummary() const;

        // === Journaled ===

        dp::u64 checkpoint() override;
        void rollback(dp::u64 checkpoint) override;
        void release(dp::u64 checkpoint) override;

      private:
        using ListingKey = std::pair<AssetId, TokenId>;
        using OfferKey = std::tuple<AssetId, TokenId, Identity>;

        // Caller holds the unique lock
        void recordUndo(std::function<void()> undo);

        std::map<ListingKey, Listing> listings_;
        std::map<OfferKey, Amount> offers_;
        Amount escrow_ = 0;
        Amount retained_surplus_ = 0;

        std::vector<std::function<void()>> undo_log_;
        dp::u32 depth_ = 0;
        mutable std::shared_mutex mutex_;
    };

} // namespace nftmart
