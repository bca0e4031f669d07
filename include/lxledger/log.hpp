#ifndef LXLEDGER_LOG_HPP
#define LXLEDGER_LOG_HPP

#include <memory>
#include <string_view>

#include <spdlog/spdlog.h>

namespace lxledger {
namespace log {

// Library-wide logger named "lxledger" (stderr sink, created on first use)
std::shared_ptr<spdlog::logger> logger();

// trace, debug, info, warn, error, critical, off. Returns false when the
// name is not recognised and leaves the level unchanged.
bool set_level(std::string_view level);

} // namespace log
} // namespace lxledger

#endif // LXLEDGER_LOG_HPP
