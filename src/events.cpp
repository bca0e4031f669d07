// =============================================================================
// events.cpp - Event records and sinks
// =============================================================================

#include "lxledger/events.hpp"
#include "lxledger/log.hpp"
#include "lxledger/math.hpp"

namespace lxledger {

nlohmann::json Event::to_json() const {
    return nlohmann::json{
        {"event", name},
        {"block", block_height},
        {"fields", fields}
    };
}

void LogEventSink::emit(const Event& event) {
    log::logger()->info("{}", event.to_json().dump());
}

nlohmann::json amount_field(U128 v) {
    return math::to_string(v);
}

nlohmann::json address_field(const Address& addr) {
    return addresses::to_hex(addr);
}

} // namespace lxledger
