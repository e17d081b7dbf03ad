#include "planfix/logging.hpp"

#include <spdlog/cfg/env.h>
#include <spdlog/spdlog.h>

#include <map>

namespace planfix {

namespace {
spdlog::level::level_enum parse_log_level(const std::string& name) {
    static const std::map<std::string, spdlog::level::level_enum> LEVELS = {
        {"trace", spdlog::level::trace}, {"debug", spdlog::level::debug},
        {"info", spdlog::level::info},   {"warn", spdlog::level::warn},
        {"error", spdlog::level::err},   {"critical", spdlog::level::critical},
        {"off", spdlog::level::off}};
    auto it = LEVELS.find(name);
    if (it == LEVELS.end()) {
        spdlog::warn("Unknown log level '{}', fallback to 'info'", name);
        return spdlog::level::info;
    }
    return it->second;
}
}

void set_log_level(const std::string& name) {
    spdlog::set_level(parse_log_level(name));
}

void load_log_levels_from_env() {
    spdlog::cfg::load_env_levels();
}

} // namespace planfix
