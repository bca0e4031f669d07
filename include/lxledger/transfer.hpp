#ifndef LXLEDGER_TRANSFER_HPP
#define LXLEDGER_TRANSFER_HPP

#include <map>
#include <utility>
#include <vector>

#include "types.hpp"

namespace lxledger {

// =============================================================================
// Asset Transfer Leg
// =============================================================================

struct AssetTransfer {
    Asset asset;
    U128 amount;
    Address from;
    Address to;
};

// =============================================================================
// Transfer Primitive Interface
// =============================================================================

// External settlement capability. settle() executes every leg or none.
class ITransferPrimitive {
public:
    virtual ~ITransferPrimitive() = default;

    virtual bool settle(const std::vector<AssetTransfer>& transfers) = 0;

    bool transfer(const Asset& asset, U128 amount, const Address& from, const Address& to) {
        return settle({AssetTransfer{asset, amount, from, to}});
    }
};

// =============================================================================
// InMemoryBank - balance-keeping transfer primitive
// =============================================================================

class InMemoryBank : public ITransferPrimitive {
public:
    InMemoryBank() = default;

    bool settle(const std::vector<AssetTransfer>& transfers) override;

    // Credit `amount` of `asset` to `owner` out of thin air
    void mint(const Address& owner, const Asset& asset, U128 amount);

    U128 balance_of(const Address& owner, const Asset& asset) const;

    uint64_t settled_batches() const { return settled_batches_; }

private:
    using Key = std::pair<Address, Asset>;
    std::map<Key, U128> balances_;
    uint64_t settled_batches_{0};
};

} // namespace lxledger

#endif // LXLEDGER_TRANSFER_HPP
