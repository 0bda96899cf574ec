#include "logger.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>
#include "lib.hpp"

namespace migrator {

std::shared_ptr<spdlog::logger> logger() {
    static std::shared_ptr<spdlog::logger> log = [] {
        auto l = spdlog::get("migrator");
        if (!l) l = spdlog::stderr_color_mt("migrator");
        l->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
        return l;
    }();
    return log;
}

void set_log_level(const std::string& level) {
    auto lvl = spdlog::level::from_str(level);
    // from_str maps unknown names to "off"
    if (lvl == spdlog::level::off && level != "off") {
        THROW_AS(ConfigError, "Unknown log level: '%s'", level.c_str());
    }
    logger()->set_level(lvl);
}

} // namespace migrator
