#pragma once

#include <string>

namespace planfix {

// trace, debug, info, warn, error, critical or off. Unknown names fall back to info.
void set_log_level(const std::string& name);

// Applies SPDLOG_LEVEL, e.g. SPDLOG_LEVEL=debug.
void load_log_levels_from_env();

} // namespace planfix
