#pragma once

#include "ledger.hpp"
#include "resolver.hpp"
#include "types.hpp"
#include <chrono>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>

namespace warden
{

    struct StorageConfig
    {
        std::string rocksdb_path{"./data/warden"};
        std::chrono::milliseconds timeout{2000};
    };

    struct LedgerConfig
    {
        std::size_t max_append_retries{5};
        std::chrono::milliseconds retry_backoff{5};
        std::size_t query_batch_size{256};
    };

    struct RetentionConfig
    {
        std::int64_t noise_days{7};
        std::int64_t important_days{90};
    };

    struct AuthzConfig
    {
        AuthzMode mode{AuthzMode::Strict};
        std::string super_admin_role{"super_admin"};
    };

    struct LoggingConfig
    {
        std::string level{"info"};
    };

    struct AuditConfig
    {
        bool mirror_to_log{false};
        std::string log_path{"./logs/audit.log"};
    };

    struct WardenConfig
    {
        StorageConfig storage{};
        LedgerConfig ledger{};
        RetentionConfig retention{};
        AuthzConfig authz{};
        LoggingConfig logging{};
        AuditConfig audit{};

        LedgerOptions ledger_options() const;
        ResolverOptions resolver_options() const;
    };

    /**
     * ConfigLoader loads TOML configs with WARDEN_* environment overrides.
     * Values are validated after overrides are applied.
     */
    class ConfigLoader
    {
    public:
        /** Load config from a TOML file path. Environment overrides take precedence. */
        static Result<WardenConfig> load(const std::string &path);

        /** Parse config from TOML string content. */
        static Result<WardenConfig> from_string(const std::string &toml_content);

        /** Defaults plus environment overrides, for runs without a config file */
        static Result<WardenConfig> from_env();

        /** Effective config as JSON for inspection */
        static nlohmann::json to_json(const WardenConfig &cfg);

    private:
        static Result<void> apply_env_overrides(WardenConfig &cfg);
        static Result<void> validate(const WardenConfig &cfg);
    };

} // namespace warden
