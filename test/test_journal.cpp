#include <atomic>
#include <chrono>
#include <doctest/doctest.h>
#include <nftmart/nftmart.hpp>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace nftmart;

namespace {
    /// Counter with an explicit history for exercising call frames
    class Counter : public ledger::Journaled {
      public:
        int value = 0;
        int released = 0;

        void add(int delta) {
            history_.push_back(value);
            value += delta;
        }

        dp::u64 checkpoint() override { return history_.size(); }

        void rollback(dp::u64 checkpoint) override {
            while (history_.size() > checkpoint) {
                value = history_.back();
                history_.pop_back();
            }
        }

        void release(dp::u64) override { ++released; }

      private:
        std::vector<int> history_;
    };
} // namespace

TEST_SUITE("Call Frame Tests") {
    TEST_CASE("Commit keeps every change") {
        Counter a, b;
        {
            ledger::CallFrame frame({&a, &b});
            a.add(1);
            b.add(2);
            frame.commit();
        }
        CHECK(a.value == 1);
        CHECK(b.value == 2);
        CHECK(a.released == 1);
        CHECK(b.released == 1);
    }

    TEST_CASE("Leaving scope without commit rolls back") {
        Counter a, b;
        a.add(5);
        {
            ledger::CallFrame frame({&a, &b});
            a.add(1);
            b.add(2);
        }
        CHECK(a.value == 5);
        CHECK(b.value == 0);
        CHECK(a.released == 0);
    }

    TEST_CASE("Explicit rollback runs once") {
        Counter a;
        ledger::CallFrame frame({&a});
        a.add(3);
        frame.rollback();
        CHECK(a.value == 0);
        frame.commit();
        CHECK(a.released == 0);
    }

    TEST_CASE("Event log truncates on rollback") {
        ledger::EventLog log;
        log.emit(ledger::ItemCanceled{"alice", "punks", 0});
        {
            ledger::CallFrame frame({&log});
            log.emit(ledger::ItemListed{"alice", "punks", 1, 10});
            CHECK(log.size() == 2);
        }
        CHECK(log.size() == 1);
        CHECK(log.count<ledger::ItemListed>() == 0);
    }

    TEST_CASE("Listeners wait for an explicit publish after commit") {
        ledger::EventLog log;
        int calls = 0;
        log.subscribe([&](const ledger::MarketEvent &) {
            ++calls;
            throw std::runtime_error("observer failed");
        });

        {
            ledger::CallFrame frame({&log});
            log.emit(ledger::ItemListed{"alice", "punks", 1, 10});
            CHECK_NOTHROW(frame.commit());
        }
        CHECK(calls == 0);
        CHECK(log.size() == 1);

        CHECK_NOTHROW(log.publish());
        CHECK(calls == 1);

        // Already delivered
        log.publish();
        CHECK(calls == 1);

        // Outside a frame delivery is immediate
        CHECK_NOTHROW(log.emit(ledger::ItemCanceled{"alice", "punks", 1}));
        CHECK(calls == 2);
    }
}

TEST_SUITE("Reentrancy Guard Tests") {
    TEST_CASE("Same thread cannot enter twice") {
        ledger::ReentrancyGuard guard;
        REQUIRE(guard.enter().is_ok());
        {
            ledger::ReentrancyGuard::Lock lock(guard);
            CHECK(guard.isEntered());

            auto again = guard.enter();
            REQUIRE_FALSE(again.is_ok());
            CHECK(again.error().code == ERR_REENTRANT_CALL);
        }
        CHECK_FALSE(guard.isEntered());
        CHECK(guard.enter().is_ok());
        ledger::ReentrancyGuard::Lock lock(guard);
    }

    TEST_CASE("Other threads wait for the holder") {
        ledger::ReentrancyGuard guard;
        std::atomic<bool> other_entered{false};

        REQUIRE(guard.enter().is_ok());
        std::thread other;
        {
            ledger::ReentrancyGuard::Lock lock(guard);
            other = std::thread([&]() {
                if (guard.enter().is_ok()) {
                    ledger::ReentrancyGuard::Lock inner(guard);
                    other_entered = true;
                }
            });
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
            CHECK_FALSE(other_entered.load());
        }
        other.join();
        CHECK(other_entered.load());
    }
}
