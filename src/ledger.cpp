// =============================================================================
// ledger.cpp - LXLedger component wiring
// =============================================================================

#include "lxledger/ledger.hpp"
#include "lxledger/log.hpp"

namespace lxledger {

LXLedger::LXLedger(const Config& config, ITransferPrimitive& transfers, IEventSink* events)
    : config_(config),
      lend_(std::make_unique<LXLend>(config.lending, transfers, events)),
      amm_(std::make_unique<LXAmm>(config.amm, transfers, events)) {
    if (!log::set_level(config_.general.log_level)) {
        log::logger()->warn("unknown log level '{}', keeping '{}'",
                            config_.general.log_level,
                            spdlog::level::to_string_view(log::logger()->level()));
    }
    log::logger()->debug("ledger {} ready: lending custodian {}, amm custodian {}",
                         version(),
                         addresses::to_hex(config_.lending.custodian),
                         addresses::to_hex(config_.amm.custodian));
}

LXLedger::~LXLedger() = default;

LXLedger::GlobalStats LXLedger::get_stats() const {
    return GlobalStats{
        lend_->get_protocol_stats(),
        amm_->get_protocol_stats()
    };
}

} // namespace lxledger
