// SPILLWAY - Governance Voting Power Implementation
// Copyright (c) 2024 SPILLWAY Developers
// MIT License

#include "spillway/assets/voting_power.h"

#include <algorithm>

namespace spillway {

VotingPowerTracker::VotingPowerTracker() = default;
VotingPowerTracker::~VotingPowerTracker() = default;

void VotingPowerTracker::SetPower(const Address& holder, Amount power) {
    std::lock_guard<std::mutex> lock(mutex_);
    power = std::min(power, MAX_AMOUNT);

    auto it = power_.find(holder);
    if (it != power_.end()) {
        totalPower_ -= static_cast<Uint128>(it->second);
        if (power <= 0) {
            power_.erase(it);
        } else {
            it->second = power;
            totalPower_ += static_cast<Uint128>(power);
        }
    } else if (power > 0) {
        power_[holder] = power;
        totalPower_ += static_cast<Uint128>(power);
    }
}

Amount VotingPowerTracker::PowerOf(const Address& holder) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = power_.find(holder);
    return it != power_.end() ? it->second : 0;
}

Amount VotingPowerTracker::TotalPower() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ToAmount(totalPower_);
}

size_t VotingPowerTracker::GetHolderCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return power_.size();
}

void VotingPowerTracker::RemoveHolder(const Address& holder) {
    SetPower(holder, 0);
}

void VotingPowerTracker::Clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    power_.clear();
    totalPower_ = 0;
}

} // namespace spillway
