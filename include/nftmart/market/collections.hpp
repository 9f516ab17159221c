#pragma once

#include <datapod/datapod.hpp>
#include <map>
#include <memory>
#include <shared_mutex>
#include <vector>

#include "nftmart/common/error.hpp"
#include "nftmart/common/types.hpp"
#include "nftmart/ledger/registry.hpp"

namespace nftmart {

    /// Token registries the marketplace trades, keyed by asset contract identifier
    class CollectionDirectory {
      public:
        inline dp::Result<void, dp::Error> add(const AssetId &asset, std::shared_ptr<ledger::TokenRegistry> registry) {
            if (asset.empty() || !registry) {
                return dp::Result<void, dp::Error>::err(
                    dp::Error::invalid_argument("Collection needs an identifier and a registry"));
            }
            std::unique_lock lock(mutex_);
            if (registries_.find(asset) != registries_.end()) {
                return dp::Result<void, dp::Error>::err(dp::Error::already_exists("Collection already registered"));
            }
            registries_[asset] = std::move(registry);
            return dp::Result<void, dp::Error>::ok();
        }

        inline dp::Result<ledger::TokenRegistry *, dp::Error> resolve(const AssetId &asset) const {
            std::shared_lock lock(mutex_);
            auto it = registries_.find(asset);
            if (it == registries_.end()) {
                return dp::Result<ledger::TokenRegistry *, dp::Error>::err(unknown_collection(asset));
            }
            return dp::Result<ledger::TokenRegistry *, dp::Error>::ok(it->second.get());
        }

        inline std::vector<ledger::Journaled *> participants() const {
            std::shared_lock lock(mutex_);
            std::vector<ledger::Journaled *> result;
            result.reserve(registries_.size());
            for (const auto &[asset, registry] : registries_) {
                result.push_back(registry.get());
            }
            return result;
        }

        inline size_t size() const {
            std::shared_lock lock(mutex_);
            return registries_.size();
        }

      private:
        std::map<AssetId, std::shared_ptr<ledger::TokenRegistry>> registries_;
        mutable std::shared_mutex mutex_;
    };

} // namespace nftmart
