#pragma once

#include <datapod/datapod.hpp>
#include <mutex>
#include <thread>
#include <vector>

#include "nftmart/common/error.hpp"

namespace nftmart::ledger {

    /// State that can take part in an all-or-nothing marketplace call
    class Journaled {
      public:
        virtual ~Journaled() = default;

        /// Mark the current state; returns a handle for rollback/release
        virtual dp::u64 checkpoint() = 0;

        /// Undo every change made since the checkpoint
        virtual void rollback(dp::u64 checkpoint) = 0;

        /// Keep every change made since the checkpoint
        virtual void release(dp::u64 checkpoint) = 0;
    };

    // ===========================================
    // CallFrame - RAII rollback over all participants
    // ===========================================

    class CallFrame {
      public:
        inline explicit CallFrame(const std::vector<Journaled *> &participants) : committed_(false) {
            entries_.reserve(participants.size());
            for (auto *participant : participants) {
                entries_.push_back({participant, participant->checkpoint()});
            }
        }

        inline ~CallFrame() {
            if (!committed_) {
                rollback();
            }
        }

        CallFrame(const CallFrame &) = delete;
        CallFrame &operator=(const CallFrame &) = delete;

        inline void commit() {
            if (committed_)
                return;
            committed_ = true;
            for (auto &entry : entries_) {
                entry.participant->release(entry.checkpoint);
            }
        }

        inline void rollback() {
            if (committed_)
                return;
            // Newest participant first
            for (auto it = entries_.rbegin(); it != entries_.rend(); ++it) {
                it->participant->rollback(it->checkpoint);
            }
            committed_ = true;
        }

      private:
        struct Entry {
            Journaled *participant;
            dp::u64 checkpoint;
        };

        std::vector<Entry> entries_;
        bool committed_;
    };

    // ===========================================
    // ReentrancyGuard - exclusive per-call lock
    // ===========================================

    /// Serializes mutating calls across threads and rejects re-entry from the thread that holds it
    class ReentrancyGuard {
      public:
        /// Releases an entered guard on scope exit
        class Lock {
          public:
            inline explicit Lock(ReentrancyGuard &guard) : guard_(guard) {}
            inline ~Lock() { guard_.leave(); }

            Lock(const Lock &) = delete;
            Lock &operator=(const Lock &) = delete;

          private:
            ReentrancyGuard &guard_;
        };

        ReentrancyGuard() = default;
        ReentrancyGuard(const ReentrancyGuard &) = delete;
        ReentrancyGuard &operator=(const ReentrancyGuard &) = delete;

        /// On success the caller owns the guard and must hand it to a Lock
        inline dp::Result<void, dp::Error> enter() {
            {
                std::lock_guard<std::mutex> state_lock(state_mutex_);
                if (owner_ == std::this_thread::get_id()) {
                    return dp::Result<void, dp::Error>::err(reentrant_call());
                }
            }
            call_mutex_.lock();
            {
                std::lock_guard<std::mutex> state_lock(state_mutex_);
                owner_ = std::this_thread::get_id();
            }
            return dp::Result<void, dp::Error>::ok();
        }

        inline bool isEntered() const {
            std::lock_guard<std::mutex> state_lock(state_mutex_);
            return owner_ != std::thread::id();
        }

      private:
        inline void leave() {
            {
                std::lock_guard<std::mutex> state_lock(state_mutex_);
                owner_ = std::thread::id();
            }
            call_mutex_.unlock();
        }

        std::mutex call_mutex_;
        mutable std::mutex state_mutex_;
        std::thread::id owner_{};
    };

} // namespace nftmart::ledger
