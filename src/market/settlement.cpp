#include <algorithm>
#include <nftmart/market/settlement.hpp>

namespace nftmart {

    SettlementEngine::SettlementEngine(std::shared_ptr<ledger::ValueTransfer> value,
                                       std::shared_ptr<ledger::SignatureOracle> oracle, ledger::EventLog &events,
                                       Identity account)
        : value_(std::move(value)), oracle_(std::move(oracle)), events_(events), account_(std::move(account)) {}

    dp::Result<SettlementRecord, dp::Error> SettlementEngine::computeShares(Amount total_price,
                                                                            dp::u32 marketplace_fee_bps,
                                                                            dp::u32 collection_fee_bps,
                                                                            dp::u32 max_fee_bps) {
        // Never above the whole price, whatever cap the caller configured
        const dp::u32 cap = std::min(max_fee_bps, BPS_DENOMINATOR);
        if (marketplace_fee_bps > cap || collection_fee_bps > cap || marketplace_fee_bps + collection_fee_bps > cap) {
            return dp::Result<SettlementRecord, dp::Error>::err(
                fees_exceed_price(marketplace_fee_bps, collection_fee_bps));
        }

        SettlementRecord record;
        record.total_price = total_price;
        record.marketplace_fee_bps = static_cast<BasisPoints>(marketplace_fee_bps);
        record.collection_fee_bps = static_cast<BasisPoints>(collection_fee_bps);
        record.marketplace_share = applyBps(total_price, marketplace_fee_bps);
        record.collection_share = applyBps(total_price, collection_fee_bps);
        record.payee_share = total_price - record.marketplace_share - record.collection_share;
        return dp::Result<SettlementRecord, dp::Error>::ok(record);
    }

    dp::Result<void, dp::Error> SettlementEngine::verifyAuthorization(const SettlementRequest &request,
                                                                      const FeeSchedule &fees) const {
        auto message =
            ledger::feeAuthorizationMessage(request.collection_owner, request.collection_fee_bps, request.counterpart);
        Identity signer = oracle_->recoverSigner(message, request.authorization);
        if (isNull(signer) || signer != fees.getOperator()) {
            return dp::Result<void, dp::Error>::err(not_signed_by_marketplace_owner());
        }
        return dp::Result<void, dp::Error>::ok();
    }

    dp::Result<SettlementRecord, dp::Error> SettlementEngine::settle(const SettlementRequest &request,
                                                                     const FeeSchedule &fees) {
        auto authorized = verifyAuthorization(request, fees);
        if (!authorized.is_ok()) {
            return dp::Result<SettlementRecord, dp::Error>::err(authorized.error());
        }

        auto shares = computeShares(request.total_price, fees.getMarketplaceFee(), request.collection_fee_bps,
                                    fees.getMaxFee());
        if (!shares.is_ok()) {
            return shares;
        }
        SettlementRecord record = shares.value();
        record.payee = request.payee;

        // Zero shares move nothing
        if (record.marketplace_share > 0 && !value_->transfer(account_, fees.getOperator(), record.marketplace_share)) {
            return dp::Result<SettlementRecord, dp::Error>::err(marketplace_proceeds_transfer_failed());
        }
        if (record.collection_share > 0 &&
            !value_->transfer(account_, request.collection_owner, record.collection_share)) {
            return dp::Result<SettlementRecord, dp::Error>::err(collection_owner_proceeds_transfer_failed());
        }
        if (record.payee_share > 0 && !value_->transfer(account_, request.payee, record.payee_share)) {
            return dp::Result<SettlementRecord, dp::Error>::err(seller_proceeds_transfer_failed());
        }

        events_.emit(ledger::ProceedsTransferred{request.payee, record.total_price, record.marketplace_fee_bps,
                                                 record.collection_fee_bps});
        return dp::Result<SettlementRecord, dp::Error>::ok(record);
    }

} // namespace nftmart
