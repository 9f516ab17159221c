#pragma once

#include <memory>
#include <nftmart/nftmart.hpp>
#include <string>

using namespace nftmart;

/// Marketplace with one "punks" collection. alice owns token 0 and token 1; bob, carol and eve hold value.
struct MarketFixture {
    Key operator_key = Key::generate().value();
    MarketplaceConfig config;
    std::shared_ptr<ledger::ValueLedger> value = std::make_shared<ledger::ValueLedger>();
    std::shared_ptr<ledger::MemoryRegistry> punks = std::make_shared<ledger::MemoryRegistry>("punks");
    std::unique_ptr<Marketplace> market;

    TokenId token = 0;
    TokenId other_token = 0;

    static constexpr Amount STARTING_BALANCE = 100000;
    static constexpr BasisPoints COLLECTION_FEE = 500;

    MarketFixture() {
        config.operator_id = operator_key.getId();
        config.log_operations = false;
        market = std::make_unique<Marketplace>(config, value);
        (void)market->registerCollection("punks", punks);

        token = punks->mint("alice");
        other_token = punks->mint("alice");

        for (const char *account : {"alice", "bob", "carol", "eve"}) {
            value->credit(account, STARTING_BALANCE);
        }
    }

    /// Operator authorization for "dave" at COLLECTION_FEE, bound to the given counterpart
    ledger::Authorization authFor(const Identity &counterpart, const Identity &collection_owner = "dave",
                                  BasisPoints fee = COLLECTION_FEE) const {
        return ledger::signFeeAuthorization(operator_key, collection_owner, fee, counterpart).value();
    }

    void approveAndList(TokenId id, Amount price) {
        (void)punks->approve("alice", market->getAccount(), id);
        (void)market->listItem("punks", id, price, "alice");
    }

    Identity ownerOf(TokenId id) const { return punks->ownerOf(id).value(); }

    Amount balance(const Identity &account) const { return value->balanceOf(account); }
};
