// SPILLWAY - Fungible Asset Ledger
// Copyright (c) 2024 SPILLWAY Developers
// MIT License
//
// Balance bookkeeping for the reward asset, the staked assets and wrapper
// shares. The controller moves value exclusively through IAssetLedger and
// reads pool balances from it.

#ifndef SPILLWAY_ASSETS_LEDGER_H
#define SPILLWAY_ASSETS_LEDGER_H

#include "spillway/core/types.h"

#include <functional>
#include <map>
#include <mutex>
#include <utility>
#include <vector>

namespace spillway {

// ============================================================================
// Transfer Record
// ============================================================================

/// Kind of balance change recorded in a ledger journal
enum class LedgerOp {
    Transfer,
    Mint,
    Burn
};

/// One balance change
struct TransferRecord {
    LedgerOp op{LedgerOp::Transfer};
    AssetId asset;
    Address from;   // Null for mints
    Address to;     // Null for burns
    Amount amount{0};
};

// ============================================================================
// Asset Ledger Interface
// ============================================================================

/**
 * Value-transfer primitive and balance oracle.
 *
 * Transfer() fails loudly: it returns false and leaves balances untouched
 * when the sender is short or the transfer is rejected. Transfers issued
 * between BeginBatch() and CommitBatch() are journaled so that
 * RollbackBatch() can undo all of them.
 */
class IAssetLedger {
public:
    virtual ~IAssetLedger() = default;

    /// Balance of an account in an asset
    virtual Amount BalanceOf(const AssetId& asset, const Address& owner) const = 0;

    /// Total supply of an asset
    virtual Amount TotalSupply(const AssetId& asset) const = 0;

    /// Move an amount between two accounts
    virtual bool Transfer(const AssetId& asset, const Address& from,
                          const Address& to, Amount amount) = 0;

    /// Start journaling transfers
    virtual void BeginBatch() = 0;

    /// Keep every journaled transfer and stop journaling
    virtual void CommitBatch() = 0;

    /// Undo every journaled transfer and stop journaling
    virtual void RollbackBatch() = 0;
};

// ============================================================================
// In-Memory Ledger
// ============================================================================

/**
 * In-process ledger used for embedding and tests.
 */
class InMemoryAssetLedger : public IAssetLedger {
public:
    /// Veto hook consulted before every transfer; returning false rejects it
    using TransferFilter = std::function<bool(const TransferRecord&)>;

    InMemoryAssetLedger();
    ~InMemoryAssetLedger() override;

    Amount BalanceOf(const AssetId& asset, const Address& owner) const override;
    Amount TotalSupply(const AssetId& asset) const override;
    bool Transfer(const AssetId& asset, const Address& from,
                  const Address& to, Amount amount) override;

    void BeginBatch() override;
    void CommitBatch() override;
    void RollbackBatch() override;

    /// Create new units of an asset
    bool Mint(const AssetId& asset, const Address& to, Amount amount);

    /// Destroy units of an asset
    bool Burn(const AssetId& asset, const Address& from, Amount amount);

    /// Install a transfer filter (pass nullptr to remove)
    void SetTransferFilter(TransferFilter filter);

    /// Whether a batch is open
    bool InBatch() const;

    /// Number of records in the open batch
    size_t JournalSize() const;

    /// Transfers applied since construction (committed or not rolled back)
    uint64_t GetTransferCount() const;

private:
    using BalanceKey = std::pair<AssetId, Address>;

    /// Apply a record without locking or filtering
    void ApplyLocked(const TransferRecord& record);

    /// Reverse a record without locking
    void RevertLocked(const TransferRecord& record);

    Amount BalanceLocked(const AssetId& asset, const Address& owner) const;

    mutable std::mutex mutex_;
    std::map<BalanceKey, Amount> balances_;
    std::map<AssetId, Amount> supply_;

    TransferFilter filter_;
    bool inBatch_{false};
    std::vector<TransferRecord> journal_;
    uint64_t transferCount_{0};
};

} // namespace spillway

#endif // SPILLWAY_ASSETS_LEDGER_H
