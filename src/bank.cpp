// =============================================================================
// bank.cpp - In-memory transfer primitive
// =============================================================================

#include "lxledger/transfer.hpp"
#include "lxledger/math.hpp"

namespace lxledger {

bool InMemoryBank::settle(const std::vector<AssetTransfer>& transfers) {
    // Stage every leg against a scratch view so a failing leg leaves
    // balances_ untouched
    std::map<Key, U128> staged;
    auto staged_balance = [&](const Key& key) -> U128& {
        auto it = staged.find(key);
        if (it != staged.end()) return it->second;
        return staged[key] = balance_of(key.first, key.second);
    };

    for (const auto& t : transfers) {
        U128& from = staged_balance({t.from, t.asset});
        auto debited = math::checked_sub(from, t.amount);
        if (!debited) return false;
        from = *debited;

        U128& to = staged_balance({t.to, t.asset});
        auto credited = math::checked_add(to, t.amount);
        if (!credited) return false;
        to = *credited;
    }

    for (const auto& [key, value] : staged) {
        balances_[key] = value;
    }
    ++settled_batches_;
    return true;
}

void InMemoryBank::mint(const Address& owner, const Asset& asset, U128 amount) {
    balances_[{owner, asset}] += amount;
}

U128 InMemoryBank::balance_of(const Address& owner, const Asset& asset) const {
    auto it = balances_.find({owner, asset});
    return it != balances_.end() ? it->second : 0;
}

} // namespace lxledger
