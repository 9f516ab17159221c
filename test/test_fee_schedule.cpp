#include "market_fixture.hpp"
#include <doctest/doctest.h>

TEST_SUITE("Fee Schedule Tests") {
    TEST_CASE("Defaults come from the configuration") {
        MarketplaceConfig config;
        config.operator_id = "op";
        FeeSchedule fees(config);

        CHECK(fees.getMarketplaceFee() == DEFAULT_MARKETPLACE_FEE_BPS);
        CHECK(fees.getOperator() == "op");
        CHECK(fees.getMaxFee() == BPS_DENOMINATOR);
        CHECK(fees.isOperator("op"));
        CHECK_FALSE(fees.isOperator("bob"));
        CHECK_FALSE(fees.isOperator(""));
    }

    TEST_CASE("Only the operator changes the fee") {
        MarketFixture f;

        auto stranger = f.market->setMarketplaceFee("bob", 100);
        REQUIRE_FALSE(stranger.is_ok());
        CHECK(stranger.error().code == ERR_NOT_MARKETPLACE_OWNER);
        CHECK(f.market->getMarketplaceFee() == 250);

        REQUIRE(f.market->setMarketplaceFee(f.config.operator_id, 100).is_ok());
        CHECK(f.market->getMarketplaceFee() == 100);
    }

    TEST_CASE("Fee must stay within range") {
        MarketFixture f;

        auto too_high = f.market->setMarketplaceFee(f.config.operator_id, 10001);
        REQUIRE_FALSE(too_high.is_ok());
        CHECK(too_high.error().code == ERR_FEE_OUT_OF_RANGE);

        auto wraps = f.market->setMarketplaceFee(f.config.operator_id, 65536 + 100);
        CHECK_FALSE(wraps.is_ok());
        CHECK(f.market->getMarketplaceFee() == 250);

        CHECK(f.market->setMarketplaceFee(f.config.operator_id, 10000).is_ok());
    }

    TEST_CASE("New fee applies to the next settlement") {
        MarketFixture f;
        REQUIRE(f.market->setMarketplaceFee(f.config.operator_id, 1000).is_ok());
        f.approveAndList(f.token, 10000);

        auto result = f.market->buyItem("punks", f.token, 10000, f.authFor("bob"), "dave", 500, "bob");
        REQUIRE(result.is_ok());
        CHECK(result.value().marketplace_share == 1000);
        CHECK(result.value().marketplace_fee_bps == 1000);
        CHECK(f.balance(f.config.operator_id) == 1000);
    }

    TEST_CASE("Transferring the operator role") {
        MarketFixture f;
        auto successor = Key::generate().value();

        auto stranger = f.market->transferOperator("bob", successor.getId());
        REQUIRE_FALSE(stranger.is_ok());
        CHECK(stranger.error().code == ERR_NOT_MARKETPLACE_OWNER);

        CHECK_FALSE(f.market->transferOperator(f.config.operator_id, "").is_ok());

        REQUIRE(f.market->transferOperator(f.config.operator_id, successor.getId()).is_ok());
        CHECK(f.market->getOperator() == successor.getId());
        CHECK_FALSE(f.market->setMarketplaceFee(f.config.operator_id, 0).is_ok());

        // Authorizations from the previous operator no longer settle
        f.approveAndList(f.token, 1000);
        auto stale = f.market->buyItem("punks", f.token, 1000, f.authFor("bob"), "dave", 500, "bob");
        REQUIRE_FALSE(stale.is_ok());
        CHECK(stale.error().code == ERR_NOT_SIGNED_BY_MARKETPLACE_OWNER);

        auto fresh = ledger::signFeeAuthorization(successor, "dave", 500, "bob").value();
        REQUIRE(f.market->buyItem("punks", f.token, 1000, fresh, "dave", 500, "bob").is_ok());
        CHECK(f.balance(successor.getId()) == 25);
    }

    TEST_CASE("Create reports missing collaborators instead of throwing") {
        MarketplaceConfig config;
        config.operator_id = "op";
        config.log_operations = false;

        auto missing_value = Marketplace::create(config, nullptr);
        CHECK_FALSE(missing_value.is_ok());

        auto missing_oracle = Marketplace::create(config, std::make_shared<ledger::ValueLedger>(), nullptr);
        CHECK_FALSE(missing_oracle.is_ok());

        auto created = Marketplace::create(config, std::make_shared<ledger::ValueLedger>());
        REQUIRE(created.is_ok());
        CHECK(created.value()->getOperator() == "op");
        CHECK(created.value()->getMarketplaceFee() == DEFAULT_MARKETPLACE_FEE_BPS);
    }
}
