#include "market_fixture.hpp"
#include <doctest/doctest.h>

TEST_SUITE("Listing Ledger Tests") {
    TEST_CASE("List an approved token") {
        MarketFixture f;
        REQUIRE(f.punks->approve("alice", f.market->getAccount(), f.token).is_ok());

        auto result = f.market->listItem("punks", f.token, 1000, "alice");
        REQUIRE(result.is_ok());

        auto listing = f.market->getListing("punks", f.token);
        CHECK(listing.isListed());
        CHECK(listing.price == 1000);
        CHECK(listing.seller == "alice");
        // Listing does not move the token
        CHECK(f.ownerOf(f.token) == "alice");
        CHECK(f.market->events().count<ledger::ItemListed>() == 1);
    }

    TEST_CASE("Unlisted token reads as the sentinel") {
        MarketFixture f;
        auto listing = f.market->getListing("punks", f.token);
        CHECK_FALSE(listing.isListed());
        CHECK(listing.price == 0);
        CHECK(listing.seller.empty());

        auto unknown = f.market->getListing("kitties", 42);
        CHECK(unknown.price == 0);
    }

    TEST_CASE("List rejections") {
        MarketFixture f;

        SUBCASE("Unknown collection") {
            auto result = f.market->listItem("kitties", 0, 10, "alice");
            REQUIRE_FALSE(result.is_ok());
            CHECK(result.error().code == ERR_UNKNOWN_COLLECTION);
        }

        SUBCASE("Caller is not the owner") {
            (void)f.punks->approve("alice", f.market->getAccount(), f.token);
            auto result = f.market->listItem("punks", f.token, 10, "bob");
            REQUIRE_FALSE(result.is_ok());
            CHECK(result.error().code == ERR_NOT_OWNER);
        }

        SUBCASE("Zero price") {
            (void)f.punks->approve("alice", f.market->getAccount(), f.token);
            auto result = f.market->listItem("punks", f.token, 0, "alice");
            REQUIRE_FALSE(result.is_ok());
            CHECK(result.error().code == ERR_PRICE_MUST_BE_ABOVE_ZERO);
        }

        SUBCASE("Marketplace not approved") {
            auto result = f.market->listItem("punks", f.token, 10, "alice");
            REQUIRE_FALSE(result.is_ok());
            CHECK(result.error().code == ERR_NOT_APPROVED_FOR_MARKETPLACE);
        }

        SUBCASE("Someone else approved") {
            (void)f.punks->approve("alice", "eve", f.token);
            auto result = f.market->listItem("punks", f.token, 10, "alice");
            REQUIRE_FALSE(result.is_ok());
            CHECK(result.error().code == ERR_NOT_APPROVED_FOR_MARKETPLACE);
        }

        CHECK_FALSE(f.market->getListing("punks", f.token).isListed());
        CHECK(f.market->events().size() == 0);
    }

    TEST_CASE("Already listed is checked before ownership and price") {
        MarketFixture f;
        f.approveAndList(f.token, 500);

        auto by_owner = f.market->listItem("punks", f.token, 700, "alice");
        REQUIRE_FALSE(by_owner.is_ok());
        CHECK(by_owner.error().code == ERR_ALREADY_LISTED);
        CHECK(std::string(by_owner.error().message.c_str()) == "AlreadyListed(\"punks\", 0)");

        auto by_stranger = f.market->listItem("punks", f.token, 0, "bob");
        REQUIRE_FALSE(by_stranger.is_ok());
        CHECK(by_stranger.error().code == ERR_ALREADY_LISTED);

        CHECK(f.market->getListing("punks", f.token).price == 500);
    }

    TEST_CASE("Update listing price") {
        MarketFixture f;
        f.approveAndList(f.token, 500);

        REQUIRE(f.market->updateListing("punks", f.token, 900, "alice").is_ok());
        CHECK(f.market->getListing("punks", f.token).price == 900);
        CHECK(f.market->getListing("punks", f.token).seller == "alice");
        CHECK(f.market->events().count<ledger::ItemListed>() == 2);
    }

    TEST_CASE("Update rejections") {
        MarketFixture f;

        SUBCASE("Ownership is checked before the listing") {
            auto result = f.market->updateListing("punks", f.token, 900, "bob");
            REQUIRE_FALSE(result.is_ok());
            CHECK(result.error().code == ERR_NOT_OWNER);
        }

        SUBCASE("Not listed") {
            auto result = f.market->updateListing("punks", f.token, 900, "alice");
            REQUIRE_FALSE(result.is_ok());
            CHECK(result.error().code == ERR_NOT_LISTED);
        }

        SUBCASE("Zero price would erase the listing") {
            f.approveAndList(f.token, 500);
            auto result = f.market->updateListing("punks", f.token, 0, "alice");
            REQUIRE_FALSE(result.is_ok());
            CHECK(result.error().code == ERR_PRICE_MUST_BE_ABOVE_ZERO);
            CHECK(f.market->getListing("punks", f.token).price == 500);
        }
    }

    TEST_CASE("Cancel listing restores the sentinel") {
        MarketFixture f;
        f.approveAndList(f.token, 500);

        auto stranger = f.market->cancelListing("punks", f.token, "bob");
        REQUIRE_FALSE(stranger.is_ok());
        CHECK(stranger.error().code == ERR_NOT_OWNER);

        REQUIRE(f.market->cancelListing("punks", f.token, "alice").is_ok());
        auto listing = f.market->getListing("punks", f.token);
        CHECK(listing.price == 0);
        CHECK(listing.seller.empty());
        CHECK(f.market->events().count<ledger::ItemCanceled>() == 1);

        auto again = f.market->cancelListing("punks", f.token, "alice");
        REQUIRE_FALSE(again.is_ok());
        CHECK(again.error().code == ERR_NOT_LISTED);

        // The approval survives cancellation, so the token can be relisted
        CHECK(f.market->listItem("punks", f.token, 300, "alice").is_ok());
    }

    TEST_CASE("Buy pays every party") {
        MarketFixture f;
        f.approveAndList(f.token, 10000);

        auto result = f.market->buyItem("punks", f.token, 10000, f.authFor("bob"), "dave", 500, "bob");
        REQUIRE(result.is_ok());

        const auto &record = result.value();
        CHECK(record.total_price == 10000);
        CHECK(record.marketplace_share == 250);
        CHECK(record.collection_share == 500);
        CHECK(record.payee_share == 9250);
        CHECK(record.payee == "alice");

        CHECK(f.ownerOf(f.token) == "bob");
        CHECK_FALSE(f.market->getListing("punks", f.token).isListed());

        CHECK(f.balance("bob") == MarketFixture::STARTING_BALANCE - 10000);
        CHECK(f.balance("alice") == MarketFixture::STARTING_BALANCE + 9250);
        CHECK(f.balance("dave") == 500);
        CHECK(f.balance(f.config.operator_id) == 250);
        CHECK(f.balance(f.market->getAccount()) == 0);

        CHECK(f.market->events().count<ledger::ItemBought>() == 1);
        CHECK(f.market->events().count<ledger::ProceedsTransferred>() == 1);
    }

    TEST_CASE("Overpayment stays with the marketplace") {
        MarketFixture f;
        f.approveAndList(f.token, 1000);

        REQUIRE(f.market->buyItem("punks", f.token, 1200, f.authFor("bob"), "dave", 500, "bob").is_ok());
        CHECK(f.balance("bob") == MarketFixture::STARTING_BALANCE - 1200);
        CHECK(f.balance(f.market->getAccount()) == 200);
    }

    TEST_CASE("Buy rejections leave state untouched") {
        MarketFixture f;
        f.approveAndList(f.token, 1000);
        size_t events_before = f.market->events().size();

        SUBCASE("Not listed") {
            auto result = f.market->buyItem("punks", f.other_token, 1000, f.authFor("bob"), "dave", 500, "bob");
            REQUIRE_FALSE(result.is_ok());
            CHECK(result.error().code == ERR_NOT_LISTED);
        }

        SUBCASE("Price not met") {
            auto result = f.market->buyItem("punks", f.token, 999, f.authFor("bob"), "dave", 500, "bob");
            REQUIRE_FALSE(result.is_ok());
            CHECK(result.error().code == ERR_PRICE_NOT_MET);
            CHECK(std::string(result.error().message.c_str()) == "PriceNotMet(\"punks\", 0, 1000)");
        }

        SUBCASE("Buyer cannot pay") {
            auto result = f.market->buyItem("punks", f.token, MarketFixture::STARTING_BALANCE + 1, f.authFor("bob"),
                                            "dave", 500, "bob");
            REQUIRE_FALSE(result.is_ok());
            CHECK(result.error().code == ERR_INSUFFICIENT_FUNDS);
        }

        SUBCASE("Marketplace approval withdrawn after listing") {
            (void)f.punks->approve("alice", "eve", f.token);
            auto result = f.market->buyItem("punks", f.token, 1000, f.authFor("bob"), "dave", 500, "bob");
            REQUIRE_FALSE(result.is_ok());
        }

        SUBCASE("Combined fees above the price") {
            auto result =
                f.market->buyItem("punks", f.token, 1000, f.authFor("bob", "dave", 9800), "dave", 9800, "bob");
            REQUIRE_FALSE(result.is_ok());
            CHECK(result.error().code == ERR_FEES_EXCEED_PRICE);
        }

        CHECK(f.market->getListing("punks", f.token).price == 1000);
        CHECK(f.ownerOf(f.token) == "alice");
        CHECK(f.balance("bob") == MarketFixture::STARTING_BALANCE);
        CHECK(f.balance("alice") == MarketFixture::STARTING_BALANCE);
        CHECK(f.balance(f.market->getAccount()) == 0);
        CHECK(f.market->events().size() == events_before);
    }

    TEST_CASE("Seller may buy their own listing") {
        MarketFixture f;
        f.approveAndList(f.token, 1000);

        REQUIRE(f.market->buyItem("punks", f.token, 1000, f.authFor("alice"), "dave", 500, "alice").is_ok());
        CHECK(f.ownerOf(f.token) == "alice");
        CHECK(f.balance("alice") == MarketFixture::STARTING_BALANCE - 1000 + 925);
    }
}
