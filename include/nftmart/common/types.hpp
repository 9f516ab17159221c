#pragma once

#include <datapod/datapod.hpp>
#include <string>

namespace nftmart {

    /// Opaque account identity. The empty string is the null identity.
    using Identity = std::string;

    /// Asset contract (collection) identifier
    using AssetId = std::string;

    using TokenId = dp::u64;
    using Amount = dp::u64;

    /// Fee rate in basis points (1/100 of a percent)
    using BasisPoints = dp::u16;

    constexpr dp::u32 BPS_DENOMINATOR = 10000;
    constexpr BasisPoints DEFAULT_MARKETPLACE_FEE_BPS = 250;

    inline bool isNull(const Identity &id) { return id.empty(); }

    /// floor(amount * bps / 10000) without overflowing for any 64-bit amount
    inline Amount applyBps(Amount amount, dp::u32 bps) {
        Amount whole = amount / BPS_DENOMINATOR;
        Amount rest = amount % BPS_DENOMINATOR;
        return whole * bps + (rest * bps) / BPS_DENOMINATOR;
    }

} // namespace nftmart
