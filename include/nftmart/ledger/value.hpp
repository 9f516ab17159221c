#pragma once

#include <datapod/datapod.hpp>
#include <exception>
#include <functional>
#include <iostream>
#include <mutex>
#include <unordered_map>
#include <vector>

#include "nftmart/common/types.hpp"
#include "nftmart/ledger/journal.hpp"

namespace nftmart::ledger {

    /// Native value-transfer primitive. A transfer may hand control to the recipient.
    class ValueTransfer : public Journaled {
      public:
        /// Never throws; reports failure so callers can raise a typed error
        virtual bool transfer(const Identity &from, const Identity &to, Amount amount) = 0;

        virtual Amount balanceOf(const Identity &account) const = 0;
    };

    // ===========================================
    // ValueLedger - in-memory balances with receive hooks
    // ===========================================

    class ValueLedger : public ValueTransfer {
      public:
        /// Runs after value arrives; may re-enter other components. Returning false refuses the payment.
        using ReceiveHook = std::function<bool(const Identity &from, Amount amount)>;

        ValueLedger() = default;
        ValueLedger(const ValueLedger &) = delete;
        ValueLedger &operator=(const ValueLedger &) = delete;

        /// Fund an account out of thin air (genesis / faucet)
        inline void credit(const Identity &account, Amount amount) {
            std::lock_guard<std::mutex> lock(mutex_);
            record(account);
            balances_[account] += amount;
            trimJournal();
        }

        inline void setReceiveHook(const Identity &account, ReceiveHook hook) {
            std::lock_guard<std::mutex> lock(mutex_);
            hooks_[account] = std::move(hook);
        }

        inline void clearReceiveHook(const Identity &account) {
            std::lock_guard<std::mutex> lock(mutex_);
            hooks_.erase(account);
        }

        inline bool transfer(const Identity &from, const Identity &to, Amount amount) override {
            ReceiveHook hook;
            dp::u64 mark = 0;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (isNull(to)) {
                    return false;
                }
                auto from_it = balances_.find(from);
                Amount available = (from_it == balances_.end()) ? 0 : from_it->second;
                if (available < amount) {
                    return false;
                }

                ++depth_;
                mark = journal_.size();
                record(from);
                record(to);
                balances_[from] -= amount;
                balances_[to] += amount;

                auto hook_it = hooks_.find(to);
                if (hook_it != hooks_.end()) {
                    hook = hook_it->second;
                }
            }

            // A throwing hook refuses the transfer
            bool accepted = true;
            if (hook) {
                try {
                    accepted = hook(from, amount);
                } catch (const std::exception &e) {
                    std::cerr << "Receive hook for " << to << " failed: " << e.what() << std::endl;
                    accepted = false;
                }
            }

            std::lock_guard<std::mutex> lock(mutex_);
            if (!accepted) {
                undoTo(mark);
            }
            if (depth_ > 0) {
                --depth_;
            }
            trimJournal();
            return accepted;
        }

        inline Amount balanceOf(const Identity &account) const override {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = balances_.find(account);
            return (it == balances_.end()) ? 0 : it->second;
        }

        inline dp::u64 checkpoint() override {
            std::lock_guard<std::mutex> lock(mutex_);
            ++depth_;
            return journal_.size();
        }

        inline void rollback(dp::u64 checkpoint) override {
            std::lock_guard<std::mutex> lock(mutex_);
            undoTo(checkpoint);
            if (depth_ > 0) {
                --depth_;
            }
            trimJournal();
        }

        inline void release(dp::u64) override {
            std::lock_guard<std::mutex> lock(mutex_);
            if (depth_ > 0) {
                --depth_;
            }
            trimJournal();
        }

      private:
        struct JournalEntry {
            Identity account;
            Amount balance;
        };

        // Caller holds mutex_
        inline void record(const Identity &account) {
            auto it = balances_.find(account);
            journal_.push_back({account, (it == balances_.end()) ? 0 : it->second});
        }

        // Caller holds mutex_
        inline void undoTo(dp::u64 mark) {
            while (journal_.size() > mark) {
                balances_[journal_.back().account] = journal_.back().balance;
                journal_.pop_back();
            }
        }

        // Caller holds mutex_
        inline void trimJournal() {
            if (depth_ == 0) {
                journal_.clear();
            }
        }

        std::unordered_map<Identity, Amount> balances_;
        std::unordered_map<Identity, ReceiveHook> hooks_;
        std::vector<JournalEntry> journal_;
        dp::u32 depth_ = 0;
        mutable std::mutex mutex_;
    };

} // namespace nftmart::ledger
