#pragma once

#include <iostream>
#include <memory>
#include <string>

#include "nftmart/ledger/events.hpp"
#include "nftmart/ledger/value.hpp"
#include "nftmart/market/collections.hpp"
#include "nftmart/market/config.hpp"
#include "nftmart/market/fee_schedule.hpp"
#include "nftmart/market/settlement.hpp"
#include "nftmart/market/store.hpp"

namespace nftmart {

    /// Everything a ledger operation touches. Owned by Marketplace; ledgers borrow it.
    struct MarketContext {
        const MarketplaceConfig &config;
        MarketStore &store;
        CollectionDirectory &collections;
        FeeSchedule &fees;
        SettlementEngine &settlement;
        ledger::ValueTransfer &value;
        ledger::EventLog &events;

        inline void log(const std::string &line) const {
            if (config.log_operations) {
                std::cout << line << std::endl;
            }
        }
    };

} // namespace nftmart
