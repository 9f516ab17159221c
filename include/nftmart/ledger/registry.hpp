#pragma once

#include <datapod/datapod.hpp>
#include <exception>
#include <functional>
#include <iostream>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "nftmart/common/types.hpp"
#include "nftmart/ledger/journal.hpp"

namespace nftmart::ledger {

    /// ERC721-style token ownership registry for one asset contract
    class TokenRegistry : public Journaled {
      public:
        virtual dp::Result<Identity, dp::Error> ownerOf(TokenId token) const = 0;

        /// The single spender approved for the token (null identity when none)
        virtual dp::Result<Identity, dp::Error> getApproved(TokenId token) const = 0;

        /// Move a token; the operator must be the owner or the approved spender
        virtual dp::Result<void, dp::Error> safeTransferFrom(const Identity &operator_id, const Identity &from,
                                                             const Identity &to, TokenId token) = 0;
    };

    // ===========================================
    // MemoryRegistry - in-memory ERC721 collection
    // ===========================================

    class MemoryRegistry : public TokenRegistry {
      public:
        /// Runs after a token arrives; returning false rejects the transfer
        using ReceiverHook = std::function<bool(const Identity &from, TokenId token)>;

        inline explicit MemoryRegistry(std::string name = "collection") : name_(std::move(name)) {}

        inline const std::string &getName() const { return name_; }

        inline TokenId mint(const Identity &to) {
            std::lock_guard<std::mutex> lock(mutex_);
            TokenId token = next_token_++;
            record(token);
            tokens_[token] = TokenState{to, ""};
            trimJournal();
            return token;
        }

        inline dp::Result<void, dp::Error> approve(const Identity &caller, const Identity &spender, TokenId token) {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = tokens_.find(token);
            if (it == tokens_.end()) {
                return dp::Result<void, dp::Error>::err(dp::Error::not_found("Token does not exist"));
            }
            if (it->second.owner != caller) {
                return dp::Result<void, dp::Error>::err(
                    dp::Error::permission_denied("Approve caller is not token owner"));
            }
            record(token);
            it->second.approved = spender;
            trimJournal();
            return dp::Result<void, dp::Error>::ok();
        }

        inline void setReceiverHook(const Identity &receiver, ReceiverHook hook) {
            std::lock_guard<std::mutex> lock(mutex_);
            hooks_[receiver] = std::move(hook);
        }

        inline dp::Result<Identity, dp::Error> ownerOf(TokenId token) const override {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = tokens_.find(token);
            if (it == tokens_.end()) {
                return dp::Result<Identity, dp::Error>::err(dp::Error::not_found("Token does not exist"));
            }
            return dp::Result<Identity, dp::Error>::ok(it->second.owner);
        }

        inline dp::Result<Identity, dp::Error> getApproved(TokenId token) const override {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = tokens_.find(token);
            if (it == tokens_.end()) {
                return dp::Result<Identity, dp::Error>::err(dp::Error::not_found("Token does not exist"));
            }
            return dp::Result<Identity, dp::Error>::ok(it->second.approved);
        }

        inline dp::Result<void, dp::Error> safeTransferFrom(const Identity &operator_id, const Identity &from,
                                                            const Identity &to, TokenId token) override {
            ReceiverHook hook;
            dp::u64 mark = 0;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                auto it = tokens_.find(token);
                if (it == tokens_.end()) {
                    return dp::Result<void, dp::Error>::err(dp::Error::not_found("Token does not exist"));
                }
                if (it->second.owner != from) {
                    return dp::Result<void, dp::Error>::err(
                        dp::Error::invalid_argument("Transfer from incorrect owner"));
                }
                if (isNull(to)) {
                    return dp::Result<void, dp::Error>::err(dp::Error::invalid_argument("Transfer to null identity"));
                }
                if (operator_id != from && operator_id != it->second.approved) {
                    return dp::Result<void, dp::Error>::err(
                        dp::Error::permission_denied("Caller is not token owner or approved"));
                }

                // Hold history open until the receiver hook has answered
                ++depth_;
                mark = journal_.size();
                record(token);
                it->second.owner = to;
                it->second.approved = "";

                auto hook_it = hooks_.find(to);
                if (hook_it != hooks_.end()) {
                    hook = hook_it->second;
                }
            }

            // A throwing hook refuses the transfer
            bool accepted = true;
            if (hook) {
                try {
                    accepted = hook(from, token);
                } catch (const std::exception &e) {
                    std::cerr << "Receiver hook for " << to << " failed: " << e.what() << std::endl;
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
            if (!accepted) {
                return dp::Result<void, dp::Error>::err(
                    dp::Error::permission_denied("Transfer to non ERC721Receiver implementer"));
            }
            return dp::Result<void, dp::Error>::ok();
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
        struct TokenState {
            Identity owner;
            Identity approved;
        };

        struct JournalEntry {
            TokenId token;
            bool existed;
            TokenState state;
        };

        // Caller holds mutex_
        inline void record(TokenId token) {
            auto it = tokens_.find(token);
            if (it == tokens_.end()) {
                journal_.push_back({token, false, TokenState{}});
            } else {
                journal_.push_back({token, true, it->second});
            }
        }

        // Caller holds mutex_
        inline void undoTo(dp::u64 mark) {
            while (journal_.size() > mark) {
                const auto &entry = journal_.back();
                if (entry.existed) {
                    tokens_[entry.token] = entry.state;
                } else {
                    tokens_.erase(entry.token);
                }
                journal_.pop_back();
            }
        }

        // Caller holds mutex_. History is only needed while a call frame is open.
        inline void trimJournal() {
            if (depth_ == 0) {
                journal_.clear();
            }
        }

        std::string name_;
        std::unordered_map<TokenId, TokenState> tokens_;
        std::unordered_map<Identity, ReceiverHook> hooks_;
        std::vector<JournalEntry> journal_;
        TokenId next_token_ = 0;
        dp::u32 depth_ = 0;
        mutable std::mutex mutex_;
    };

} // namespace nftmart::ledger
