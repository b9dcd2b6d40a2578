// SPILLWAY - Rebase-Safe Share Wrapper
// Copyright (c) 2024 SPILLWAY Developers
// MIT License
//
// Wraps an underlying asset held by a vault into wrapper shares. Shares are
// minted and burned in proportion to the vault's underlying balance, so a
// rebase of that balance changes the value of every share equally.

#ifndef SPILLWAY_ASSETS_SHARE_WRAPPER_H
#define SPILLWAY_ASSETS_SHARE_WRAPPER_H

#include "spillway/assets/ledger.h"
#include "spillway/core/types.h"

#include <optional>

namespace spillway {

class ShareWrapper {
public:
    ShareWrapper(InMemoryAssetLedger& ledger, AssetId underlying,
                 AssetId shareAsset, const Address& vault);

    /**
     * Deposit underlying and mint shares.
     *
     * shares = amount when no shares exist, else
     * amount * totalShares / vaultBalance.
     *
     * @return Shares minted, or nullopt if the transfer failed or the
     *         deposit is too small to mint a share
     */
    std::optional<Amount> Enter(const Address& holder, Amount amount);

    /**
     * Burn shares and return the proportional underlying.
     *
     * amount = shares * vaultBalance / totalShares.
     *
     * @return Underlying returned, or nullopt on insufficient shares
     */
    std::optional<Amount> Leave(const Address& holder, Amount shares);

    /// Underlying currently redeemable for a number of shares
    Amount UnderlyingForShares(Amount shares) const;

    /// Shares currently mintable for an underlying amount
    Amount SharesForUnderlying(Amount amount) const;

    const AssetId& GetUnderlying() const { return underlying_; }
    const AssetId& GetShareAsset() const { return shareAsset_; }

private:
    InMemoryAssetLedger& ledger_;
    AssetId underlying_;
    AssetId shareAsset_;
    Address vault_;
};

} // namespace spillway

#endif // SPILLWAY_ASSETS_SHARE_WRAPPER_H
