// SPILLWAY - Fungible Asset Ledger Implementation
// Copyright (c) 2024 SPILLWAY Developers
// MIT License

#include "spillway/assets/ledger.h"
#include "spillway/util/logging.h"

namespace spillway {

InMemoryAssetLedger::InMemoryAssetLedger() = default;

InMemoryAssetLedger::~InMemoryAssetLedger() = default;

// ============================================================================
// Queries
// ============================================================================

Amount InMemoryAssetLedger::BalanceLocked(const AssetId& asset, const Address& owner) const {
    auto it = balances_.find({asset, owner});
    return it != balances_.end() ? it->second : 0;
}

Amount InMemoryAssetLedger::BalanceOf(const AssetId& asset, const Address& owner) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return BalanceLocked(asset, owner);
}

Amount InMemoryAssetLedger::TotalSupply(const AssetId& asset) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = supply_.find(asset);
    return it != supply_.end() ? it->second : 0;
}

bool InMemoryAssetLedger::InBatch() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return inBatch_;
}

size_t InMemoryAssetLedger::JournalSize() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return journal_.size();
}

uint64_t InMemoryAssetLedger::GetTransferCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return transferCount_;
}

// ============================================================================
// Balance Changes
// ============================================================================

void InMemoryAssetLedger::ApplyLocked(const TransferRecord& record) {
    switch (record.op) {
        case LedgerOp::Transfer:
            balances_[{record.asset, record.from}] -= record.amount;
            balances_[{record.asset, record.to}] += record.amount;
            ++transferCount_;
            break;
        case LedgerOp::Mint:
            balances_[{record.asset, record.to}] += record.amount;
            supply_[record.asset] += record.amount;
            break;
        case LedgerOp::Burn:
            balances_[{record.asset, record.from}] -= record.amount;
            supply_[record.asset] -= record.amount;
            break;
    }
}

void InMemoryAssetLedger::RevertLocked(const TransferRecord& record) {
    switch (record.op) {
        case LedgerOp::Transfer:
            balances_[{record.asset, record.to}] -= record.amount;
            balances_[{record.asset, record.from}] += record.amount;
            --transferCount_;
            break;
        case LedgerOp::Mint:
            balances_[{record.asset, record.to}] -= record.amount;
            supply_[record.asset] -= record.amount;
            break;
        case LedgerOp::Burn:
            balances_[{record.asset, record.from}] += record.amount;
            supply_[record.asset] += record.amount;
            break;
    }
}

bool InMemoryAssetLedger::Transfer(const AssetId& asset, const Address& from,
                                   const Address& to, Amount amount) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!AmountRange(amount)) {
        LOG_WARN(util::LogCategory::LEDGER) << "Rejected transfer of invalid amount "
                                            << amount << " " << asset;
        return false;
    }
    if (amount == 0) {
        return true;
    }

    TransferRecord record;
    record.op = LedgerOp::Transfer;
    record.asset = asset;
    record.from = from;
    record.to = to;
    record.amount = amount;

    Amount available = BalanceLocked(asset, from);
    if (available < amount) {
        LOG_WARN(util::LogCategory::LEDGER) << "Short transfer of " << amount << " "
                                            << asset << " from " << ShortAddress(from)
                                            << " (balance " << available << ")";
        return false;
    }
    if (from == to) {
        return true;
    }

    if (filter_ && !filter_(record)) {
        LOG_WARN(util::LogCategory::LEDGER) << "Transfer of " << amount << " " << asset
                                            << " to " << ShortAddress(to)
                                            << " rejected by filter";
        return false;
    }

    ApplyLocked(record);
    if (inBatch_) {
        journal_.push_back(record);
    }

    LOG_TRACE(util::LogCategory::LEDGER) << "Transfer " << amount << " " << asset << " "
                                         << ShortAddress(from) << " -> " << ShortAddress(to);
    return true;
}

bool InMemoryAssetLedger::Mint(const AssetId& asset, const Address& to, Amount amount) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (amount <= 0 || !AmountRange(amount)) {
        return false;
    }
    auto it = supply_.find(asset);
    Amount supply = it != supply_.end() ? it->second : 0;
    if (supply > MAX_AMOUNT - amount) {
        LOG_WARN(util::LogCategory::LEDGER) << "Mint of " << amount << " " << asset
                                            << " exceeds maximum supply";
        return false;
    }

    TransferRecord record;
    record.op = LedgerOp::Mint;
    record.asset = asset;
    record.to = to;
    record.amount = amount;

    ApplyLocked(record);
    if (inBatch_) {
        journal_.push_back(record);
    }
    return true;
}

bool InMemoryAssetLedger::Burn(const AssetId& asset, const Address& from, Amount amount) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (amount <= 0 || BalanceLocked(asset, from) < amount) {
        return false;
    }

    TransferRecord record;
    record.op = LedgerOp::Burn;
    record.asset = asset;
    record.from = from;
    record.amount = amount;

    ApplyLocked(record);
    if (inBatch_) {
        journal_.push_back(record);
    }
    return true;
}

void InMemoryAssetLedger::SetTransferFilter(TransferFilter filter) {
    std::lock_guard<std::mutex> lock(mutex_);
    filter_ = std::move(filter);
}

// ============================================================================
// Batches
// ============================================================================

void InMemoryAssetLedger::BeginBatch() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (inBatch_) {
        LOG_WARN(util::LogCategory::LEDGER) << "BeginBatch while a batch is open; "
                                            << "extending the open batch";
        return;
    }
    inBatch_ = true;
    journal_.clear();
}

void InMemoryAssetLedger::CommitBatch() {
    std::lock_guard<std::mutex> lock(mutex_);
    inBatch_ = false;
    journal_.clear();
}

void InMemoryAssetLedger::RollbackBatch() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = journal_.rbegin(); it != journal_.rend(); ++it) {
        RevertLocked(*it);
    }
    if (!journal_.empty()) {
        LOG_DEBUG(util::LogCategory::LEDGER) << "Rolled back " << journal_.size()
                                             << " journaled balance changes";
    }
    inBatch_ = false;
    journal_.clear();
}

} // namespace spillway
