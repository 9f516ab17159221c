#include <iostream>
#include <mutex>
#include <nftmart/market/store.hpp>

namespace nftmart {

    Listing MarketStore::getListing(const AssetId &asset, TokenId token) const {
        std::shared_lock lock(mutex_);
        auto it = listings_.find({asset, token});
        return (it != listings_.end()) ? it->second : Listing{};
    }

    void MarketStore::putListing(const AssetId &asset, TokenId token, const Listing &listing) {
        std::unique_lock lock(mutex_);
        ListingKey key{asset, token};
        auto it = listings_.find(key);
        if (it == listings_.end()) {
            recordUndo([this, key]() { listings_.erase(key); });
        } else {
            Listing previous = it->second;
            recordUndo([this, key, previous]() { listings_[key] = previous; });
        }
        listings_[key] = listing;
    }

    void MarketStore::eraseListing(const AssetId &asset, TokenId token) {
        std::unique_lock lock(mutex_);
        ListingKey key{asset, token};
        auto it = listings_.find(key);
        if (it == listings_.end())
            return;
        Listing previous = it->second;
        recordUndo([this, key, previous]() { listings_[key] = previous; });
        listings_.erase(it);
    }

    size_t MarketStore::listingCount() const {
        std::shared_lock lock(mutex_);
        return listings_.size();
    }

    Amount MarketStore::getOffer(const AssetId &asset, TokenId token, const Identity &offerer) const {
        std::shared_lock lock(mutex_);
        auto it = offers_.find(OfferKey{asset, token, offerer});
        return (it != offers_.end()) ? it->second : 0;
    }

    void MarketStore::putOffer(const AssetId &asset, TokenId token, const Identity &offerer, Amount amount) {
        std::unique_lock lock(mutex_);
        OfferKey key{asset, token, offerer};
        Amount previous = 0;
        auto it = offers_.find(key);
        if (it != offers_.end())
            previous = it->second;

        Amount previous_escrow = escrow_;
        recordUndo([this, key, previous, previous_escrow]() {
            if (previous == 0)
                offers_.erase(key);
            else
                offers_[key] = previous;
            escrow_ = previous_escrow;
        });
        offers_[key] = amount;
        escrow_ = escrow_ - previous + amount;
    }

    void MarketStore::eraseOffer(const AssetId &asset, TokenId token, const Identity &offerer) {
        std::unique_lock lock(mutex_);
        OfferKey key{asset, token, offerer};
        auto it = offers_.find(key);
        if (it == offers_.end())
            return;
        Amount previous = it->second;
        Amount previous_escrow = escrow_;
        recordUndo([this, key, previous, previous_escrow]() {
            offers_[key] = previous;
            escrow_ = previous_escrow;
        });
        escrow_ -= previous;
        offers_.erase(it);
    }

    size_t MarketStore::offerCount() const {
        std::shared_lock lock(mutex_);
        return offers_.size();
    }

    std::vector<std::pair<Identity, Amount>> MarketStore::offersFor(const AssetId &asset, TokenId token) const {
        std::shared_lock lock(mutex_);
        std::vector<std::pair<Identity, Amount>> result;
        auto it = offers_.lower_bound(OfferKey{asset, token, Identity{}});
        for (; it != offers_.end(); ++it) {
            if (std::get<0>(it->first) != asset || std::get<1>(it->first) != token)
                break;
            result.emplace_back(std::get<2>(it->first), it->second);
        }
        return result;
    }

    Amount MarketStore::escrowedAmount() const {
        std::shared_lock lock(mutex_);
        return escrow_;
    }

    Amount MarketStore::retainedSurplus() const {
        std::shared_lock lock(mutex_);
        return retained_surplus_;
    }

    void MarketStore::addRetainedSurplus(Amount amount) {
        if (amount == 0)
            return;
        std::unique_lock lock(mutex_);
        Amount previous = retained_surplus_;
        recordUndo([this, previous]() { retained_surplus_ = previous; });
        retained_surplus_ += amount;
    }

    MarketSnapshot MarketStore::exportSnapshot() const {
        std::shared_lock lock(mutex_);
        MarketSnapshot snapshot;
        for (const auto &[key, listing] : listings_) {
            ListingRecord record;
            record.asset = dp::String(key.first.c_str());
            record.token = key.second;
            record.price = listing.price;
            record.seller = dp::String(listing.seller.c_str());
            snapshot.listings.push_back(record);
        }
        for (const auto &[key, amount] : offers_) {
            OfferRecord record;
            record.asset = dp::String(std::get<0>(key).c_str());
            record.token = std::get<1>(key);
            record.offerer = dp::String(std::get<2>(key).c_str());
            record.amount = amount;
            snapshot.offers.push_back(record);
        }
        snapshot.retained_surplus = retained_surplus_;
        return snapshot;
    }

    void MarketStore::importSnapshot(const MarketSnapshot &snapshot) {
        std::unique_lock lock(mutex_);
        listings_.clear();
        offers_.clear();
        escrow_ = 0;
        undo_log_.clear();
        for (const auto &record : snapshot.listings) {
            listings_[{std::string(record.asset.c_str()), record.token}] =
                Listing{record.price, std::string(record.seller.c_str())};
        }
        for (const auto &record : snapshot.offers) {
            offers_[OfferKey{std::string(record.asset.c_str()), record.token, std::string(record.offerer.c_str())}] =
                record.amount;
            escrow_ += record.amount;
        }
        retained_surplus_ = snapshot.retained_surplus;
    }

    void MarketStore::printSummary() const {
        std::shared_lock lock(mutex_);
        std::cout << "Listings (" << listings_.size() << "):" << std::endl;
        for (const auto &[key, listing] : listings_) {
            std::cout << "  " << key.first << "#" << key.second << " price=" << listing.price
                      << " seller=" << listing.seller << std::endl;
        }
        std::cout << "Offers (" << offers_.size() << "):" << std::endl;
        for (const auto &[key, amount] : offers_) {
            std::cout << "  " << std::get<0>(key) << "#" << std::get<1>(key) << " offerer=" << std::get<2>(key)
                      << " amount=" << amount << std::endl;
        }
        std::cout << "Escrowed: " << escrow_ << std::endl;
        std::cout << "Retained surplus: " << retained_surplus_ << std::endl;
    }

    dp::u64 MarketStore::checkpoint() {
        std::unique_lock lock(mutex_);
        ++depth_;
        return undo_log_.size();
    }

    void MarketStore::rollback(dp::u64 checkpoint) {
        std::unique_lock lock(mutex_);
        while (undo_log_.size() > checkpoint) {
            undo_log_.back()();
            undo_log_.pop_back();
        }
        if (depth_ > 0)
            --depth_;
        if (depth_ == 0)
            undo_log_.clear();
    }

    void MarketStore::release(dp::u64) {
        std::unique_lock lock(mutex_);
        if (depth_ > 0)
            --depth_;
        if (depth_ == 0)
            undo_log_.clear();
    }

    void MarketStore::recordUndo(std::function<void()> undo) {
        if (depth_ > 0)
            undo_log_.push_back(std::move(undo));
    }

} // namespace nftmart
