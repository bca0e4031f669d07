#ifndef LXLEDGER_LEDGER_HPP
#define LXLEDGER_LEDGER_HPP

// =============================================================================
// LXLedger - Lending ledger and AMM pool engine
//
//   LXLend: collateralized lending over one settlement asset
//   LXAmm:  constant-product pools with LP shares and swap history
//
// The two components share configuration, the transfer primitive and the
// event sink, but never call each other.
// =============================================================================

#include <memory>

#include "types.hpp"
#include "config.hpp"
#include "events.hpp"
#include "transfer.hpp"
#include "lend.hpp"
#include "amm.hpp"

namespace lxledger {

class LXLedger {
public:
    LXLedger(const Config& config, ITransferPrimitive& transfers,
             IEventSink* events = nullptr);
    ~LXLedger();

    // Non-copyable
    LXLedger(const LXLedger&) = delete;
    LXLedger& operator=(const LXLedger&) = delete;

    // =========================================================================
    // Component Access
    // =========================================================================

    LXLend& lend() { return *lend_; }
    const LXLend& lend() const { return *lend_; }

    LXAmm& amm() { return *amm_; }
    const LXAmm& amm() const { return *amm_; }

    const Config& config() const { return config_; }

    // =========================================================================
    // Statistics
    // =========================================================================

    struct GlobalStats {
        LXLend::Stats lend_stats;
        LXAmm::Stats amm_stats;
    };
    GlobalStats get_stats() const;

    static constexpr const char* version() { return "1.0.0"; }

private:
    Config config_;
    std::unique_ptr<LXLend> lend_;
    std::unique_ptr<LXAmm> amm_;
};

} // namespace lxledger

#endif // LXLEDGER_LEDGER_HPP
