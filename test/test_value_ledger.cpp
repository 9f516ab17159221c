#include <doctest/doctest.h>
#include <nftmart/nftmart.hpp>
#include <stdexcept>

using namespace nftmart;

TEST_SUITE("Value Ledger Tests") {
    TEST_CASE("Credit and transfer") {
        ledger::ValueLedger value;
        value.credit("alice", 100);

        CHECK(value.transfer("alice", "bob", 40));
        CHECK(value.balanceOf("alice") == 60);
        CHECK(value.balanceOf("bob") == 40);
        CHECK(value.balanceOf("nobody") == 0);
    }

    TEST_CASE("Transfer failures move nothing") {
        ledger::ValueLedger value;
        value.credit("alice", 100);

        CHECK_FALSE(value.transfer("alice", "bob", 101));
        CHECK_FALSE(value.transfer("alice", "", 10));
        CHECK_FALSE(value.transfer("ghost", "bob", 1));
        CHECK(value.balanceOf("alice") == 100);
        CHECK(value.balanceOf("bob") == 0);

        // Zero amounts are valid transfers
        CHECK(value.transfer("ghost", "bob", 0));
    }

    TEST_CASE("Receive hook can refuse a payment") {
        ledger::ValueLedger value;
        value.credit("alice", 100);
        value.setReceiveHook("bob", [](const Identity &, Amount amount) { return amount < 50; });

        CHECK(value.transfer("alice", "bob", 10));
        CHECK_FALSE(value.transfer("alice", "bob", 60));
        CHECK(value.balanceOf("alice") == 90);
        CHECK(value.balanceOf("bob") == 10);

        value.clearReceiveHook("bob");
        CHECK(value.transfer("alice", "bob", 60));
    }

    TEST_CASE("Hook sees the credited balance and may pay onward") {
        ledger::ValueLedger value;
        value.credit("alice", 100);
        Amount seen = 0;
        value.setReceiveHook("bob", [&](const Identity &, Amount amount) {
            seen = value.balanceOf("bob");
            return value.transfer("bob", "carol", amount / 2);
        });

        CHECK(value.transfer("alice", "bob", 80));
        CHECK(seen == 80);
        CHECK(value.balanceOf("bob") == 40);
        CHECK(value.balanceOf("carol") == 40);
    }

    TEST_CASE("Refused payment also undoes what the hook did") {
        ledger::ValueLedger value;
        value.credit("alice", 100);
        value.setReceiveHook("bob", [&](const Identity &, Amount amount) {
            (void)value.transfer("bob", "carol", amount);
            return false;
        });

        CHECK_FALSE(value.transfer("alice", "bob", 30));
        CHECK(value.balanceOf("alice") == 100);
        CHECK(value.balanceOf("bob") == 0);
        CHECK(value.balanceOf("carol") == 0);
    }

    TEST_CASE("Rollback restores balances") {
        ledger::ValueLedger value;
        value.credit("alice", 100);

        auto mark = value.checkpoint();
        REQUIRE(value.transfer("alice", "bob", 70));
        value.credit("carol", 5);
        value.rollback(mark);

        CHECK(value.balanceOf("alice") == 100);
        CHECK(value.balanceOf("bob") == 0);
        CHECK(value.balanceOf("carol") == 0);
    }

    TEST_CASE("Throwing hook refuses the payment and keeps the journal usable") {
        ledger::ValueLedger value;
        value.credit("alice", 100);
        value.setReceiveHook("bob", [](const Identity &, Amount) -> bool { throw std::runtime_error("wallet crashed"); });

        bool moved = true;
        CHECK_NOTHROW(moved = value.transfer("alice", "bob", 30));
        CHECK_FALSE(moved);
        CHECK(value.balanceOf("alice") == 100);
        CHECK(value.balanceOf("bob") == 0);

        value.clearReceiveHook("bob");
        auto mark = value.checkpoint();
        REQUIRE(value.transfer("alice", "bob", 30));
        value.rollback(mark);
        CHECK(value.balanceOf("alice") == 100);

        value.credit("carol", 5);
        auto outer = value.checkpoint();
        value.release(outer);
        CHECK(value.balanceOf("carol") == 5);
    }
}
