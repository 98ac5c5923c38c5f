#include "warden/logging.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace warden
{

    Result<void> init_logging(const LoggingConfig &cfg)
    {
        auto level = spdlog::level::from_str(cfg.level);
        if (level == spdlog::level::off && cfg.level != "off")
            return std::unexpected(WardenError::config("unknown log level: " + cfg.level));

        auto logger = spdlog::get("warden");
        if (!logger)
            logger = spdlog::stderr_color_mt("warden");
        logger->set_pattern("[%Y-%m-%dT%H:%M:%S.%e] [%^%l%$] %v");
        logger->set_level(level);
        spdlog::set_default_logger(std::move(logger));
        return {};
    }

} // namespace warden
