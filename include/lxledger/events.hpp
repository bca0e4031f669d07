#ifndef LXLEDGER_EVENTS_HPP
#define LXLEDGER_EVENTS_HPP

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "types.hpp"

namespace lxledger {

// =============================================================================
// Event Record
// =============================================================================

struct Event {
    std::string name;        // e.g. "deposit", "swap"
    uint64_t block_height;
    nlohmann::json fields;   // amounts as decimal strings, identities as hex

    nlohmann::json to_json() const;
};

// =============================================================================
// Event Sink Interface
// =============================================================================

class IEventSink {
public:
    virtual ~IEventSink() = default;
    virtual void emit(const Event& event) = 0;
};

// Writes each event as one JSON line at info level
class LogEventSink : public IEventSink {
public:
    void emit(const Event& event) override;
};

// Keeps events in emission order
class MemoryEventSink : public IEventSink {
public:
    void emit(const Event& event) override { events_.push_back(event); }

    const std::vector<Event>& events() const { return events_; }
    const Event* last() const { return events_.empty() ? nullptr : &events_.back(); }
    void clear() { events_.clear(); }

private:
    std::vector<Event> events_;
};

// Field helpers
nlohmann::json amount_field(U128 v);
nlohmann::json address_field(const Address& addr);

} // namespace lxledger

#endif // LXLEDGER_EVENTS_HPP
