#pragma once
#include <memory>
#include <string>
#include <spdlog/spdlog.h>

namespace migrator {

// Shared "migrator" logger (stderr, colored). Created on first use.
std::shared_ptr<spdlog::logger> logger();

// Accepts spdlog level names: trace, debug, info, warn, error, critical, off.
void set_log_level(const std::string& level);

} // namespace migrator
