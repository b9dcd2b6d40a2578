// SPILLWAY - Rebase-Safe Share Wrapper Implementation
// Copyright (c) 2024 SPILLWAY Developers
// MIT License

#include "spillway/assets/share_wrapper.h"
#include "spillway/util/logging.h"

namespace spillway {

ShareWrapper::ShareWrapper(InMemoryAssetLedger& ledger, AssetId underlying,
                           AssetId shareAsset, const Address& vault)
    : ledger_(ledger)
    , underlying_(std::move(underlying))
    , shareAsset_(std::move(shareAsset))
    , vault_(vault) {}

Amount ShareWrapper::SharesForUnderlying(Amount amount) const {
    Amount totalShares = ledger_.TotalSupply(shareAsset_);
    Amount balance = ledger_.BalanceOf(underlying_, vault_);
    if (totalShares == 0 || balance == 0) {
        return amount;
    }
    return ToAmount(MulDiv(static_cast<Uint128>(amount),
                           static_cast<Uint128>(totalShares),
                           static_cast<Uint128>(balance)));
}

Amount ShareWrapper::UnderlyingForShares(Amount shares) const {
    Amount totalShares = ledger_.TotalSupply(shareAsset_);
    if (totalShares == 0) {
        return 0;
    }
    Amount balance = ledger_.BalanceOf(underlying_, vault_);
    return ToAmount(MulDiv(static_cast<Uint128>(shares),
                           static_cast<Uint128>(balance),
                           static_cast<Uint128>(totalShares)));
}

std::optional<Amount> ShareWrapper::Enter(const Address& holder, Amount amount) {
    if (amount <= 0) {
        return std::nullopt;
    }

    Amount shares = SharesForUnderlying(amount);
    if (shares <= 0) {
        LOG_WARN(util::LogCategory::LEDGER) << "Deposit of " << amount << " " << underlying_
                                            << " too small to mint a share";
        return std::nullopt;
    }

    ledger_.BeginBatch();
    if (!ledger_.Transfer(underlying_, holder, vault_, amount) ||
        !ledger_.Mint(shareAsset_, holder, shares)) {
        ledger_.RollbackBatch();
        return std::nullopt;
    }
    ledger_.CommitBatch();

    LOG_DEBUG(util::LogCategory::LEDGER) << ShortAddress(holder) << " wrapped " << amount
                                         << " " << underlying_ << " into " << shares
                                         << " " << shareAsset_;
    return shares;
}

std::optional<Amount> ShareWrapper::Leave(const Address& holder, Amount shares) {
    if (shares <= 0 || ledger_.BalanceOf(shareAsset_, holder) < shares) {
        return std::nullopt;
    }

    Amount amount = UnderlyingForShares(shares);

    ledger_.BeginBatch();
    if (!ledger_.Burn(shareAsset_, holder, shares) ||
        !ledger_.Transfer(underlying_, vault_, holder, amount)) {
        ledger_.RollbackBatch();
        return std::nullopt;
    }
    ledger_.CommitBatch();

    LOG_DEBUG(util::LogCategory::LEDGER) << ShortAddress(holder) << " unwrapped " << shares
                                         << " " << shareAsset_ << " into " << amount
                                         << " " << underlying_;
    return amount;
}

} // namespace spillway
