#pragma once

#include "event.hpp"
#include "types.hpp"
#include <memory>
#include <nlohmann/json.hpp>
#include <string>

namespace spdlog
{
    class logger;
}

namespace warden
{

    /**
     * Mirrors recorded ledger events as one JSON object per line on a
     * dedicated "audit" spdlog logger. The mirror is a convenience for log
     * shippers; the ledger stays the source of truth.
     */
    class AuditLogger
    {
    public:
        explicit AuditLogger(std::shared_ptr<spdlog::logger> logger);

        /** Append-mode file sink at path; fails with ConfigError if it cannot be opened */
        static Result<std::shared_ptr<AuditLogger>> open_file(const std::string &path);

        void log(const Event &event);

        void flush();

    private:
        void log_json(const nlohmann::json &j);

        std::shared_ptr<spdlog::logger> logger_;
    };

} // namespace warden
