#include "warden/audit_log.hpp"
#include <format>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/spdlog.h>

namespace warden
{

    AuditLogger::AuditLogger(std::shared_ptr<spdlog::logger> logger)
        : logger_(std::move(logger))
    {
    }

    Result<std::shared_ptr<AuditLogger>> AuditLogger::open_file(const std::string &path)
    {
        try
        {
            auto sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(path, false);
            auto logger = std::make_shared<spdlog::logger>("audit", std::move(sink));
            logger->set_pattern("%v");
            logger->set_level(spdlog::level::info);
            logger->flush_on(spdlog::level::info);
            return std::make_shared<AuditLogger>(std::move(logger));
        }
        catch (const spdlog::spdlog_ex &e)
        {
            return std::unexpected(WardenError::config(
                std::format("cannot open audit log {}: {}", path, e.what())));
        }
    }

    void AuditLogger::log(const Event &event)
    {
        log_json(event.to_json());
    }

    void AuditLogger::flush()
    {
        logger_->flush();
    }

    void AuditLogger::log_json(const nlohmann::json &j)
    {
        logger_->info(j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
    }

} // namespace warden
