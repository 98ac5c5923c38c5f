#pragma once

#include "config.hpp"
#include "types.hpp"

namespace warden
{

    /**
     * Configure the default spdlog logger: level from config, stderr sink so
     * command output on stdout stays machine-readable.
     */
    Result<void> init_logging(const LoggingConfig &cfg);

} // namespace warden
