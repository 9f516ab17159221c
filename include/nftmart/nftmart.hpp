#pragma once

// NFT marketplace facade
// Composes the ledger primitives and the market modules

#include "nftmart/common/error.hpp"
#include "nftmart/common/types.hpp"
#include "nftmart/ledger/authorization.hpp"
#include "nftmart/ledger/events.hpp"
#include "nftmart/ledger/journal.hpp"
#include "nftmart/ledger/key.hpp"
#include "nftmart/ledger/registry.hpp"
#include "nftmart/ledger/serializer.hpp"
#include "nftmart/ledger/value.hpp"
#include "nftmart/market/marketplace.hpp"
