#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <nftmart/market/marketplace.hpp>
#include <stdexcept>

namespace nftmart {

    namespace {
        std::shared_ptr<ledger::ValueTransfer> requireValue(std::shared_ptr<ledger::ValueTransfer> value) {
            if (!value) {
                throw std::invalid_argument("Marketplace needs a value transfer primitive");
            }
            return value;
        }
    } // namespace

    Marketplace::Marketplace(MarketplaceConfig config, std::shared_ptr<ledger::ValueTransfer> value,
                             std::shared_ptr<ledger::SignatureOracle> oracle)
        : config_(std::move(config)), value_(requireValue(std::move(value))), oracle_(std::move(oracle)),
          fees_(config_), settlement_(value_, oracle_, events_, config_.account),
          ctx_{config_, store_, collections_, fees_, settlement_, *value_, events_}, listings_(ctx_), offers_(ctx_) {
        if (!oracle_) {
            throw std::invalid_argument("Marketplace needs a signature oracle");
        }
    }

    dp::Result<std::shared_ptr<Marketplace>, dp::Error>
    Marketplace::create(MarketplaceConfig config, std::shared_ptr<ledger::ValueTransfer> value,
                        std::shared_ptr<ledger::SignatureOracle> oracle) {
        if (!value || !oracle) {
            return dp::Result<std::shared_ptr<Marketplace>, dp::Error>::err(
                dp::Error::invalid_argument("Marketplace needs a value transfer primitive and a signature oracle"));
        }
        return dp::Result<std::shared_ptr<Marketplace>, dp::Error>::ok(
            std::make_shared<Marketplace>(std::move(config), std::move(value), std::move(oracle)));
    }

    template <typename T, typename Op> dp::Result<T, dp::Error> Marketplace::execute(const char *operation, Op &&op) {
        auto entered = guard_.enter();
        if (!entered.is_ok()) {
            ctx_.log(std::string("Rejected reentrant ") + operation);
            return dp::Result<T, dp::Error>::err(entered.error());
        }

        std::optional<dp::Result<T, dp::Error>> result;
        {
            ledger::ReentrancyGuard::Lock lock(guard_);
            ledger::CallFrame frame(participants());
            result.emplace(op());
            if (result->is_ok()) {
                frame.commit();
            } else {
                frame.rollback();
                ctx_.log(std::string(operation) + " reverted: " + result->error().message.c_str());
            }
        }

        // Every participant is settled and the guard is free before observers run
        events_.publish();
        return std::move(*result);
    }

    std::vector<ledger::Journaled *> Marketplace::participants() {
        std::vector<ledger::Journaled *> result{&store_, &events_, value_.get()};
        auto registries = collections_.participants();
        result.insert(result.end(), registries.begin(), registries.end());
        return result;
    }

    dp::Result<void, dp::Error> Marketplace::registerCollection(const AssetId &asset,
                                                                std::shared_ptr<ledger::TokenRegistry> registry) {
        return execute<void>("registerCollection",
                             [&]() { return collections_.add(asset, std::move(registry)); });
    }

    dp::Result<void, dp::Error> Marketplace::listItem(const AssetId &asset, TokenId token, Amount price,
                                                      const Identity &caller) {
        return execute<void>("listItem", [&]() { return listings_.listItem(asset, token, price, caller); });
    }

    dp::Result<void, dp::Error> Marketplace::updateListing(const AssetId &asset, TokenId token, Amount new_price,
                                                           const Identity &caller) {
        return execute<void>("updateListing",
                             [&]() { return listings_.updateListing(asset, token, new_price, caller); });
    }

    dp::Result<void, dp::Error> Marketplace::cancelListing(const AssetId &asset, TokenId token,
                                                           const Identity &caller) {
        return execute<void>("cancelListing", [&]() { return listings_.cancelListing(asset, token, caller); });
    }

    dp::Result<SettlementRecord, dp::Error>
    Marketplace::buyItem(const AssetId &asset, TokenId token, Amount paid, const ledger::Authorization &authorization,
                         const Identity &collection_owner, BasisPoints collection_fee_bps, const Identity &caller) {
        return execute<SettlementRecord>("buyItem", [&]() {
            return listings_.buyItem(asset, token, paid, authorization, collection_owner, collection_fee_bps, caller);
        });
    }

    dp::Result<void, dp::Error> Marketplace::makeOffer(const AssetId &asset, TokenId token, Amount offer_price,
                                                       Amount staked, const Identity &caller) {
        return execute<void>("makeOffer",
                             [&]() { return offers_.makeOffer(asset, token, offer_price, staked, caller); });
    }

    dp::Result<void, dp::Error> Marketplace::cancelOffer(const AssetId &asset, TokenId token, const Identity &caller) {
        return execute<void>("cancelOffer", [&]() { return offers_.cancelOffer(asset, token, caller); });
    }

    dp::Result<SettlementRecord, dp::Error>
    Marketplace::acceptOffer(const AssetId &asset, TokenId token, const ledger::Authorization &authorization,
                             const Identity &collection_owner, BasisPoints collection_fee_bps, const Identity &offerer,
                             const Identity &caller) {
        return execute<SettlementRecord>("acceptOffer", [&]() {
            return offers_.acceptOffer(asset, token, authorization, collection_owner, collection_fee_bps, offerer,
                                       caller);
        });
    }

    dp::Result<void, dp::Error> Marketplace::setMarketplaceFee(const Identity &caller, dp::u32 fee_bps) {
        return execute<void>("setMarketplaceFee", [&]() {
            auto result = fees_.setMarketplaceFee(caller, fee_bps);
            if (result.is_ok()) {
                ctx_.log("Marketplace fee set to " + std::to_string(fee_bps) + " bps");
            }
            return result;
        });
    }

    dp::Result<void, dp::Error> Marketplace::transferOperator(const Identity &caller, const Identity &new_operator) {
        return execute<void>("transferOperator", [&]() {
            auto result = fees_.transferOperator(caller, new_operator);
            if (result.is_ok()) {
                ctx_.log("Marketplace operator is now " + new_operator);
            }
            return result;
        });
    }

    Listing Marketplace::getListing(const AssetId &asset, TokenId token) const {
        return listings_.getListing(asset, token);
    }

    Amount Marketplace::getOffer(const AssetId &asset, TokenId token, const Identity &offerer) const {
        return offers_.getOffer(asset, token, offerer);
    }

    std::vector<std::pair<Identity, Amount>> Marketplace::getOffers(const AssetId &asset, TokenId token) const {
        return offers_.getOffers(asset, token);
    }

    BasisPoints Marketplace::getMarketplaceFee() const { return fees_.getMarketplaceFee(); }

    Identity Marketplace::getOperator() const { return fees_.getOperator(); }

    Amount Marketplace::getEscrowedAmount() const { return store_.escrowedAmount(); }

    Amount Marketplace::getRetainedSurplus() const { return store_.retainedSurplus(); }

    dp::Result<dp::ByteBuf, dp::Error> Marketplace::serialize() const {
        try {
            MarketSnapshot snapshot = store_.exportSnapshot();
            snapshot.operator_id = dp::String(fees_.getOperator().c_str());
            snapshot.marketplace_fee_bps = fees_.getMarketplaceFee();
            return dp::Result<dp::ByteBuf, dp::Error>::ok(dp::serialize<dp::Mode::WITH_VERSION>(snapshot));
        } catch (const std::exception &e) {
            return dp::Result<dp::ByteBuf, dp::Error>::err(serialization_failed(dp::String(e.what())));
        }
    }

    dp::Result<void, dp::Error> Marketplace::restore(const dp::ByteBuf &data) {
        return execute<void>("restore", [&]() {
            MarketSnapshot snapshot;
            try {
                snapshot = dp::deserialize<dp::Mode::WITH_VERSION, MarketSnapshot>(data);
            } catch (const std::exception &e) {
                return dp::Result<void, dp::Error>::err(deserialization_failed(dp::String(e.what())));
            }
            auto valid = validateSnapshot(snapshot);
            if (!valid.is_ok()) {
                return valid;
            }
            store_.importSnapshot(snapshot);
            fees_.restore(std::string(snapshot.operator_id.c_str()), snapshot.marketplace_fee_bps);
            return dp::Result<void, dp::Error>::ok();
        });
    }

    dp::Result<void, dp::Error> Marketplace::validateSnapshot(const MarketSnapshot &snapshot) const {
        if (snapshot.marketplace_fee_bps > fees_.getMaxFee()) {
            return dp::Result<void, dp::Error>::err(fee_out_of_range(snapshot.marketplace_fee_bps));
        }
        if (snapshot.operator_id.size() == 0) {
            return dp::Result<void, dp::Error>::err(deserialization_failed("Snapshot has no operator"));
        }
        for (const auto &record : snapshot.listings) {
            if (record.price == 0 || record.seller.size() == 0) {
                return dp::Result<void, dp::Error>::err(deserialization_failed("Snapshot listing without price or seller"));
            }
            if (!collections_.resolve(std::string(record.asset.c_str())).is_ok()) {
                return dp::Result<void, dp::Error>::err(
                    deserialization_failed("Snapshot listing for an unregistered collection"));
            }
        }
        for (const auto &record : snapshot.offers) {
            if (record.amount == 0 || record.offerer.size() == 0) {
                return dp::Result<void, dp::Error>::err(deserialization_failed("Snapshot offer without amount or offerer"));
            }
            if (!collections_.resolve(std::string(record.asset.c_str())).is_ok()) {
                return dp::Result<void, dp::Error>::err(
                    deserialization_failed("Snapshot offer for an unregistered collection"));
            }
        }
        return dp::Result<void, dp::Error>::ok();
    }

    dp::Result<void, dp::Error> Marketplace::saveToFile(const std::string &filename) const {
        auto data = serialize();
        if (!data.is_ok()) {
            return dp::Result<void, dp::Error>::err(data.error());
        }
        std::ofstream file(filename, std::ios::binary | std::ios::trunc);
        if (!file.is_open()) {
            return dp::Result<void, dp::Error>::err(dp::Error::io_error("Cannot open file for writing"));
        }
        const auto &bytes = data.value();
        file.write(reinterpret_cast<const char *>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
        if (!file.good()) {
            return dp::Result<void, dp::Error>::err(dp::Error::io_error("Failed to write marketplace snapshot"));
        }
        return dp::Result<void, dp::Error>::ok();
    }

    dp::Result<void, dp::Error> Marketplace::loadFromFile(const std::string &filename) {
        std::ifstream file(filename, std::ios::binary);
        if (!file.is_open()) {
            return dp::Result<void, dp::Error>::err(dp::Error::not_found("Marketplace snapshot not found"));
        }
        std::vector<char> raw((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
        dp::ByteBuf data(raw.begin(), raw.end());
        return restore(data);
    }

    void Marketplace::printSummary() const {
        std::cout << "=== Marketplace Summary ===" << std::endl;
        std::cout << "Account: " << config_.account << std::endl;
        std::cout << "Operator: " << fees_.getOperator() << std::endl;
        std::cout << "Marketplace fee: " << fees_.getMarketplaceFee() << " bps" << std::endl;
        std::cout << "Collections: " << collections_.size() << std::endl;
        store_.printSummary();
        std::cout << "Events recorded: " << events_.size() << std::endl;
    }

} // namespace nftmart
