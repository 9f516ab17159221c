#pragma once

#include <datapod/datapod.hpp>
#include <memory>

#include "nftmart/common/error.hpp"
#include "nftmart/common/types.hpp"
#include "nftmart/ledger/authorization.hpp"
#include "nftmart/ledger/events.hpp"
#include "nftmart/ledger/value.hpp"
#include "nftmart/market/fee_schedule.hpp"

namespace nftmart {

    /// Three-way split of one sale. The payee share is the remainder, so the shares always sum to total_price.
    struct SettlementRecord {
        Amount total_price = 0;
        Amount marketplace_share = 0;
        Amount collection_share = 0;
        Amount payee_share = 0;
        BasisPoints marketplace_fee_bps = 0;
        BasisPoints collection_fee_bps = 0;
        Identity payee;
    };

    struct SettlementRequest {
        Amount total_price = 0;
        ledger::Authorization authorization;
        Identity collection_owner;
        BasisPoints collection_fee_bps = 0;
        // Seller (purchase) or accepting owner (offer acceptance)
        Identity payee;
        // Whoever invoked the enclosing call; the authorization must be bound to it
        Identity counterpart;
    };

    /// Pays out a sale from the marketplace account: operator fee, collection royalty, then the payee.
    /// A failed payout returns an error; the enclosing call frame is responsible for undoing earlier payouts.
    class SettlementEngine {
      public:
        SettlementEngine(std::shared_ptr<ledger::ValueTransfer> value, std::shared_ptr<ledger::SignatureOracle> oracle,
                         ledger::EventLog &events, Identity account);

        /// Pure fee arithmetic; fails when the combined fee exceeds max_fee_bps
        static dp::Result<SettlementRecord, dp::Error> computeShares(Amount total_price, dp::u32 marketplace_fee_bps,
                                                                     dp::u32 collection_fee_bps,
                                                                     dp::u32 max_fee_bps = BPS_DENOMINATOR);

        /// The operator must have signed {collection owner, collection fee, counterpart}
        dp::Result<void, dp::Error> verifyAuthorization(const SettlementRequest &request,
                                                        const FeeSchedule &fees) const;

        dp::Result<SettlementRecord, dp::Error> settle(const SettlementRequest &request, const FeeSchedule &fees);

      private:
        std::shared_ptr<ledger::ValueTransfer> value_;
        std::shared_ptr<ledger::SignatureOracle> oracle_;
        ledger::EventLog &events_;
        Identity account_;
    };

} // namespace nftmart
