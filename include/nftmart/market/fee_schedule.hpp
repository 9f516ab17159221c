#pragma once

#include <algorithm>
#include <datapod/datapod.hpp>
#include <shared_mutex>

#include "nftmart/common/error.hpp"
#include "nftmart/common/types.hpp"
#include "nftmart/market/config.hpp"

namespace nftmart {

    /// Operator-scoped marketplace fee configuration.
    /// Only the operator may change it; every settlement reads it.
    class FeeSchedule {
      public:
        inline explicit FeeSchedule(const MarketplaceConfig &config)
            : operator_id_(config.operator_id), fee_bps_(config.marketplace_fee_bps),
              max_fee_bps_(std::min(config.max_fee_bps, BPS_DENOMINATOR)) {}

        inline BasisPoints getMarketplaceFee() const {
            std::shared_lock lock(mutex_);
            return fee_bps_;
        }

        inline Identity getOperator() const {
            std::shared_lock lock(mutex_);
            return operator_id_;
        }

        inline dp::u32 getMaxFee() const { return max_fee_bps_; }

        inline bool isOperator(const Identity &caller) const {
            std::shared_lock lock(mutex_);
            return !isNull(caller) && caller == operator_id_;
        }

        inline dp::Result<void, dp::Error> setMarketplaceFee(const Identity &caller, dp::u32 fee_bps) {
            std::unique_lock lock(mutex_);
            if (isNull(caller) || caller != operator_id_) {
                return dp::Result<void, dp::Error>::err(not_marketplace_owner());
            }
            if (fee_bps > max_fee_bps_) {
                return dp::Result<void, dp::Error>::err(fee_out_of_range(fee_bps));
            }
            fee_bps_ = static_cast<BasisPoints>(fee_bps);
            return dp::Result<void, dp::Error>::ok();
        }

        inline dp::Result<void, dp::Error> transferOperator(const Identity &caller, const Identity &new_operator) {
            std::unique_lock lock(mutex_);
            if (isNull(caller) || caller != operator_id_) {
                return dp::Result<void, dp::Error>::err(not_marketplace_owner());
            }
            if (isNull(new_operator)) {
                return dp::Result<void, dp::Error>::err(dp::Error::invalid_argument("New operator is the null identity"));
            }
            operator_id_ = new_operator;
            return dp::Result<void, dp::Error>::ok();
        }

        /// Used when restoring a persisted marketplace
        inline void restore(const Identity &operator_id, BasisPoints fee_bps) {
            std::unique_lock lock(mutex_);
            operator_id_ = operator_id;
            fee_bps_ = fee_bps;
        }

      private:
        Identity operator_id_;
        BasisPoints fee_bps_;
        dp::u32 max_fee_bps_;
        mutable std::shared_mutex mutex_;
    };

} // namespace nftmart
