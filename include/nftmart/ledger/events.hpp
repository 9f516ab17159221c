#pragma once

#include <datapod/datapod.hpp>
#include <exception>
#include <functional>
#include <iostream>
#include <mutex>
#include <string>
#include <variant>
#include <vector>

#include "nftmart/common/types.hpp"
#include "nftmart/ledger/journal.hpp"

namespace nftmart::ledger {

    /// Emitted for both a new listing and a price update
    struct ItemListed {
        Identity seller;
        AssetId asset;
        TokenId token = 0;
        Amount price = 0;
    };

    struct ItemCanceled {
        Identity seller;
        AssetId asset;
        TokenId token = 0;
    };

    struct ItemBought {
        Identity buyer;
        AssetId asset;
        TokenId token = 0;
        Amount price = 0;
    };

    struct ProceedsTransferred {
        Identity payee;
        Amount price = 0;
        BasisPoints marketplace_fee_bps = 0;
        BasisPoints collection_fee_bps = 0;
    };

    struct ItemOffered {
        Identity offerer;
        AssetId asset;
        TokenId token = 0;
        Amount price = 0;
    };

    struct ItemOfferCanceled {
        Identity offerer;
        AssetId asset;
        TokenId token = 0;
    };

    struct ItemOfferAccepted {
        Identity owner;
        Identity offerer;
        AssetId asset;
        TokenId token = 0;
        Amount price = 0;
    };

    using MarketEvent = std::variant<ItemListed, ItemCanceled, ItemBought, ProceedsTransferred, ItemOffered,
                                     ItemOfferCanceled, ItemOfferAccepted>;

    inline std::string eventName(const MarketEvent &event) {
        switch (event.index()) {
        case 0:
            return "ItemListed";
        case 1:
            return "ItemCanceled";
        case 2:
            return "ItemBought";
        case 3:
            return "ProceedsTransferred";
        case 4:
            return "ItemOffered";
        case 5:
            return "ItemOfferCanceled";
        case 6:
            return "ItemOfferAccepted";
        default:
            return "unknown";
        }
    }

    // ===========================================
    // EventLog - call-scoped event records for observers
    // ===========================================

    class EventLog : public Journaled {
      public:
        using Listener = std::function<void(const MarketEvent &)>;

        EventLog() = default;
        EventLog(const EventLog &) = delete;
        EventLog &operator=(const EventLog &) = delete;

        /// Outside a call frame the event is delivered at once; inside one it waits for publish()
        inline void emit(MarketEvent event) {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                events_.push_back(std::move(event));
            }
            publish();
        }

        /// Listeners only ever see events of committed calls
        inline void subscribe(Listener listener) {
            std::lock_guard<std::mutex> lock(mutex_);
            listeners_.push_back(std::move(listener));
        }

        /// Deliver committed events nobody has seen yet. A no-op while a call frame is open.
        /// A throwing listener is logged and skipped; the events stay committed.
        inline void publish() {
            std::vector<MarketEvent> pending;
            std::vector<Listener> listeners;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (depth_ != 0 || published_ >= events_.size()) {
                    return;
                }
                pending.assign(events_.begin() + static_cast<std::ptrdiff_t>(published_), events_.end());
                published_ = events_.size();
                listeners = listeners_;
            }
            for (const auto &event : pending) {
                for (const auto &listener : listeners) {
                    try {
                        listener(event);
                    } catch (const std::exception &e) {
                        std::cerr << "Listener failed on " << eventName(event) << ": " << e.what() << std::endl;
                    }
                }
            }
        }

        inline std::vector<MarketEvent> getEvents() const {
            std::lock_guard<std::mutex> lock(mutex_);
            return events_;
        }

        inline size_t size() const {
            std::lock_guard<std::mutex> lock(mutex_);
            return events_.size();
        }

        /// Count events of one kind, e.g. count<ItemBought>()
        template <typename E> inline size_t count() const {
            std::lock_guard<std::mutex> lock(mutex_);
            size_t n = 0;
            for (const auto &event : events_) {
                if (std::holds_alternative<E>(event))
                    ++n;
            }
            return n;
        }

        // Checkpoint, rollback and release never call out to listeners
        inline dp::u64 checkpoint() override {
            std::lock_guard<std::mutex> lock(mutex_);
            ++depth_;
            return events_.size();
        }

        inline void rollback(dp::u64 checkpoint) override {
            std::lock_guard<std::mutex> lock(mutex_);
            if (events_.size() > checkpoint) {
                events_.resize(checkpoint);
            }
            if (published_ > events_.size()) {
                published_ = events_.size();
            }
            if (depth_ > 0) {
                --depth_;
            }
        }

        inline void release(dp::u64) override {
            std::lock_guard<std::mutex> lock(mutex_);
            if (depth_ > 0) {
                --depth_;
            }
        }

      private:
        std::vector<MarketEvent> events_;
        std::vector<Listener> listeners_;
        size_t published_ = 0;
        dp::u32 depth_ = 0;
        mutable std::mutex mutex_;
    };

} // namespace nftmart::ledger
