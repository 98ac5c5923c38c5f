#include "warden/config.hpp"
#include <algorithm>
#include <array>
#include <charconv>
#include <cstdlib>
#include <format>
#include <fstream>
#include <sstream>
#include <toml++/toml.h>

namespace warden
{
    namespace
    {
        constexpr std::array<std::string_view, 7> kLogLevels = {
            "trace", "debug", "info", "warn", "error", "critical", "off"};

        // A century; keeps days-to-milliseconds arithmetic in range
        constexpr std::int64_t kMaxRetentionDays = 36500;

        Result<std::int64_t> parse_int(const char *name, std::string_view text)
        {
            std::int64_t value = 0;
            auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
            if (ec != std::errc() || ptr != text.data() + text.size())
                return std::unexpected(WardenError::config(std::format("{} is not an integer: {}", name, text)));
            return value;
        }

        Result<bool> parse_bool(const char *name, std::string_view text)
        {
            if (text == "1" || text == "true")
                return true;
            if (text == "0" || text == "false")
                return false;
            return std::unexpected(WardenError::config(std::format("{} is not a boolean: {}", name, text)));
        }

        Result<void> parse_toml(const toml::table &tbl, WardenConfig &cfg)
        {
            if (auto storage = tbl["storage"].as_table())
            {
                if (auto path = (*storage)["rocksdb_path"].value<std::string>())
                    cfg.storage.rocksdb_path = *path;
                if (auto timeout = (*storage)["timeout_ms"].value<int64_t>())
                    cfg.storage.timeout = std::chrono::milliseconds(*timeout);
            }

            if (auto ledger = tbl["ledger"].as_table())
            {
                if (auto retries = (*ledger)["max_append_retries"].value<int64_t>())
                {
                    if (*retries < 0)
                        return std::unexpected(WardenError::config("ledger.max_append_retries must not be negative"));
                    cfg.ledger.max_append_retries = static_cast<std::size_t>(*retries);
                }
                if (auto backoff = (*ledger)["retry_backoff_ms"].value<int64_t>())
                    cfg.ledger.retry_backoff = std::chrono::milliseconds(*backoff);
                if (auto batch = (*ledger)["query_batch_size"].value<int64_t>())
                {
                    if (*batch <= 0)
                        return std::unexpected(WardenError::config("ledger.query_batch_size must be positive"));
                    cfg.ledger.query_batch_size = static_cast<std::size_t>(*batch);
                }
            }

            if (auto retention = tbl["retention"].as_table())
            {
                if (auto noise = (*retention)["noise_days"].value<int64_t>())
                    cfg.retention.noise_days = *noise;
                if (auto important = (*retention)["important_days"].value<int64_t>())
                    cfg.retention.important_days = *important;
            }

            if (auto authz = tbl["authz"].as_table())
            {
                if (auto mode = (*authz)["mode"].value<std::string>())
                {
                    auto parsed = authz_mode_from_string(*mode);
                    if (!parsed)
                        return std::unexpected(parsed.error());
                    cfg.authz.mode = *parsed;
                }
                if (auto role = (*authz)["super_admin_role"].value<std::string>())
                    cfg.authz.super_admin_role = *role;
            }

            if (auto logging = tbl["logging"].as_table())
            {
                if (auto level = (*logging)["level"].value<std::string>())
                    cfg.logging.level = *level;
            }

            if (auto audit = tbl["audit"].as_table())
            {
                if (auto mirror = (*audit)["mirror_to_log"].value<bool>())
                    cfg.audit.mirror_to_log = *mirror;
                if (auto path = (*audit)["log_path"].value<std::string>())
                    cfg.audit.log_path = *path;
            }

            return {};
        }

    } // namespace

    LedgerOptions WardenConfig::ledger_options() const
    {
        LedgerOptions options;
        options.max_append_retries = ledger.max_append_retries;
        options.retry_backoff = ledger.retry_backoff;
        options.storage_timeout = storage.timeout;
        options.query_batch_size = ledger.query_batch_size;
        options.retention.noise_window = std::chrono::days(retention.noise_days);
        options.retention.important_window = std::chrono::days(retention.important_days);
        return options;
    }

    ResolverOptions WardenConfig::resolver_options() const
    {
        return ResolverOptions{authz.mode, authz.super_admin_role};
    }

    Result<WardenConfig> ConfigLoader::load(const std::string &path)
    {
        std::ifstream file(path);
        if (!file.is_open())
        {
            return std::unexpected(WardenError::config("Unable to open config file: " + path));
        }
        std::stringstream buffer;
        buffer << file.rdbuf();
        return from_string(buffer.str());
    }

    Result<WardenConfig> ConfigLoader::from_string(const std::string &toml_content)
    {
        WardenConfig cfg{};

        try
        {
            auto tbl = toml::parse(toml_content);
            auto parsed = parse_toml(tbl, cfg);
            if (!parsed)
                return std::unexpected(parsed.error());
        }
        catch (const toml::parse_error &e)
        {
            return std::unexpected(WardenError::config(std::string("Failed to parse TOML: ") + e.what()));
        }

        auto env = apply_env_overrides(cfg);
        if (!env)
            return std::unexpected(env.error());

        auto valid = validate(cfg);
        if (!valid)
            return std::unexpected(valid.error());
        return cfg;
    }

    Result<WardenConfig> ConfigLoader::from_env()
    {
        return from_string("");
    }

    Result<void> ConfigLoader::apply_env_overrides(WardenConfig &cfg)
    {
        if (const char *path = std::getenv("WARDEN_ROCKSDB_PATH"))
            cfg.storage.rocksdb_path = path;

        if (const char *timeout = std::getenv("WARDEN_STORAGE_TIMEOUT_MS"))
        {
            auto value = parse_int("WARDEN_STORAGE_TIMEOUT_MS", timeout);
            if (!value)
                return std::unexpected(value.error());
            cfg.storage.timeout = std::chrono::milliseconds(*value);
        }

        if (const char *retries = std::getenv("WARDEN_MAX_APPEND_RETRIES"))
        {
            auto value = parse_int("WARDEN_MAX_APPEND_RETRIES", retries);
            if (!value)
                return std::unexpected(value.error());
            if (*value < 0)
                return std::unexpected(WardenError::config("WARDEN_MAX_APPEND_RETRIES must not be negative"));
            cfg.ledger.max_append_retries = static_cast<std::size_t>(*value);
        }

        if (const char *noise = std::getenv("WARDEN_NOISE_RETENTION_DAYS"))
        {
            auto value = parse_int("WARDEN_NOISE_RETENTION_DAYS", noise);
            if (!value)
                return std::unexpected(value.error());
            cfg.retention.noise_days = *value;
        }

        if (const char *important = std::getenv("WARDEN_IMPORTANT_RETENTION_DAYS"))
        {
            auto value = parse_int("WARDEN_IMPORTANT_RETENTION_DAYS", important);
            if (!value)
                return std::unexpected(value.error());
            cfg.retention.important_days = *value;
        }

        if (const char *mode = std::getenv("WARDEN_AUTHZ_MODE"))
        {
            auto value = authz_mode_from_string(mode);
            if (!value)
                return std::unexpected(value.error());
            cfg.authz.mode = *value;
        }

        if (const char *role = std::getenv("WARDEN_SUPER_ADMIN_ROLE"))
            cfg.authz.super_admin_role = role;
        if (const char *level = std::getenv("WARDEN_LOG_LEVEL"))
            cfg.logging.level = level;
        if (const char *audit_path = std::getenv("WARDEN_AUDIT_LOG"))
            cfg.audit.log_path = audit_path;

        if (const char *mirror = std::getenv("WARDEN_AUDIT_MIRROR"))
        {
            auto value = parse_bool("WARDEN_AUDIT_MIRROR", mirror);
            if (!value)
                return std::unexpected(value.error());
            cfg.audit.mirror_to_log = *value;
        }

        return {};
    }

    Result<void> ConfigLoader::validate(const WardenConfig &cfg)
    {
        if (cfg.storage.rocksdb_path.empty())
            return std::unexpected(WardenError::config("storage.rocksdb_path must not be empty"));
        if (cfg.storage.timeout.count() <= 0)
            return std::unexpected(WardenError::config("storage.timeout_ms must be positive"));
        if (cfg.ledger.retry_backoff.count() < 0)
            return std::unexpected(WardenError::config("ledger.retry_backoff_ms must not be negative"));
        if (cfg.retention.noise_days <= 0 || cfg.retention.important_days <= 0)
            return std::unexpected(WardenError::config("retention windows must be at least one day"));
        if (cfg.retention.noise_days > kMaxRetentionDays || cfg.retention.important_days > kMaxRetentionDays)
            return std::unexpected(WardenError::config(
                std::format("retention windows must not exceed {} days", kMaxRetentionDays)));
        if (cfg.authz.super_admin_role.empty())
            return std::unexpected(WardenError::config("authz.super_admin_role must not be empty"));
        if (std::find(kLogLevels.begin(), kLogLevels.end(), cfg.logging.level) == kLogLevels.end())
            return std::unexpected(WardenError::config("unknown log level: " + cfg.logging.level));
        if (cfg.audit.mirror_to_log && cfg.audit.log_path.empty())
            return std::unexpected(WardenError::config("audit.log_path is required when mirroring"));
        return {};
    }

    nlohmann::json ConfigLoader::to_json(const WardenConfig &cfg)
    {
        nlohmann::json j;
        j["storage"] = {
            {"rocksdb_path", cfg.storage.rocksdb_path},
            {"timeout_ms", cfg.storage.timeout.count()}};
        j["ledger"] = {
            {"max_append_retries", cfg.ledger.max_append_retries},
            {"retry_backoff_ms", cfg.ledger.retry_backoff.count()},
            {"query_batch_size", cfg.ledger.query_batch_size}};
        j["retention"] = {
            {"noise_days", cfg.retention.noise_days},
            {"important_days", cfg.retention.important_days}};
        j["authz"] = {
            {"mode", to_string(cfg.authz.mode)},
            {"super_admin_role", cfg.authz.super_admin_role}};
        j["logging"] = {{"level", cfg.logging.level}};
        j["audit"] = {{"mirror_to_log", cfg.audit.mirror_to_log}, {"log_path", cfg.audit.log_path}};
        return j;
    }

} // namespace warden
