#pragma once

#include <datapod/datapod.hpp>
#include <string>

#include "nftmart/common/types.hpp"

namespace nftmart {

    /// Marketplace configuration
    struct MarketplaceConfig {
        // Identity allowed to change fees and sign fee authorizations
        Identity operator_id;

        // The marketplace's own account: holds escrow and receives token approvals
        Identity account = "nftmart";

        // Fee charged on every settlement (2.5%)
        BasisPoints marketplace_fee_bps = DEFAULT_MARKETPLACE_FEE_BPS;

        // Upper bound for any single fee and for the combined split (clamped to 10000)
        dp::u32 max_fee_bps = BPS_DENOMINATOR;

        // Print accepted and rejected operations to stdout
        bool log_operations = true;
    };

} // namespace nftmart
