// =============================================================================
// log.cpp - spdlog logger for the ledger library
// =============================================================================

#include "lxledger/log.hpp"

#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace lxledger {
namespace log {

namespace {
constexpr const char* LOGGER_NAME = "lxledger";
}

std::shared_ptr<spdlog::logger> logger() {
    auto existing = spdlog::get(LOGGER_NAME);
    if (existing) return existing;

    auto created = spdlog::stderr_color_mt(LOGGER_NAME);
    created->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] %v");
    created->set_level(spdlog::level::info);
    return created;
}

bool set_level(std::string_view level) {
    auto parsed = spdlog::level::from_str(std::string(level));
    // from_str() maps unknown names to off
    if (parsed == spdlog::level::off && level != "off") {
        return false;
    }
    logger()->set_level(parsed);
    return true;
}

} // namespace log
} // namespace lxledger
