#include <catch2/catch_test_macros.hpp>
#include "warden/config.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>

using namespace warden;

namespace
{
    /** Sets an environment variable for the lifetime of the guard */
    class ScopedEnv
    {
    public:
        ScopedEnv(const char *name, const char *value) : name_(name)
        {
            ::setenv(name, value, 1);
        }

        ~ScopedEnv() { ::unsetenv(name_); }

        ScopedEnv(const ScopedEnv &) = delete;
        ScopedEnv &operator=(const ScopedEnv &) = delete;

    private:
        const char *name_;
    };
}

TEST_CASE("Defaults apply without a config file", "[config]")
{
    auto cfg = ConfigLoader::from_env();
    REQUIRE(cfg.has_value());
    REQUIRE(cfg->storage.rocksdb_path == "./data/warden");
    REQUIRE(cfg->storage.timeout == std::chrono::milliseconds(2000));
    REQUIRE(cfg->ledger.max_append_retries == 5);
    REQUIRE(cfg->retention.noise_days == 7);
    REQUIRE(cfg->retention.important_days == 90);
    REQUIRE(cfg->authz.mode == AuthzMode::Strict);
    REQUIRE(cfg->logging.level == "info");
    REQUIRE_FALSE(cfg->audit.mirror_to_log);
}

TEST_CASE("TOML sections override defaults", "[config]")
{
    auto cfg = ConfigLoader::from_string(R"(
[storage]
rocksdb_path = "/var/lib/warden"
timeout_ms = 500

[ledger]
max_append_retries = 9
retry_backoff_ms = 20
query_batch_size = 64

[retention]
noise_days = 3
important_days = 30

[authz]
mode = "advisory"
super_admin_role = "root"

[logging]
level = "debug"

[audit]
mirror_to_log = true
log_path = "/var/log/warden/audit.log"
)");
    REQUIRE(cfg.has_value());
    REQUIRE(cfg->storage.rocksdb_path == "/var/lib/warden");
    REQUIRE(cfg->audit.mirror_to_log);

    auto ledger = cfg->ledger_options();
    REQUIRE(ledger.max_append_retries == 9);
    REQUIRE(ledger.retry_backoff == std::chrono::milliseconds(20));
    REQUIRE(ledger.storage_timeout == std::chrono::milliseconds(500));
    REQUIRE(ledger.query_batch_size == 64);
    REQUIRE(ledger.retention.noise_window == std::chrono::days(3));
    REQUIRE(ledger.retention.important_window == std::chrono::days(30));

    auto resolver = cfg->resolver_options();
    REQUIRE(resolver.mode == AuthzMode::Advisory);
    REQUIRE(resolver.super_admin_role == "root");

    auto j = ConfigLoader::to_json(*cfg);
    REQUIRE(j["authz"]["mode"] == "advisory");
    REQUIRE(j["storage"]["timeout_ms"] == 500);
}

TEST_CASE("Environment variables take precedence", "[config]")
{
    ScopedEnv path("WARDEN_ROCKSDB_PATH", "/tmp/warden-env");
    ScopedEnv mode("WARDEN_AUTHZ_MODE", "off");
    ScopedEnv noise("WARDEN_NOISE_RETENTION_DAYS", "2");
    ScopedEnv mirror("WARDEN_AUDIT_MIRROR", "1");

    auto cfg = ConfigLoader::from_string(R"(
[storage]
rocksdb_path = "/var/lib/warden"

[authz]
mode = "strict"
)");
    REQUIRE(cfg.has_value());
    REQUIRE(cfg->storage.rocksdb_path == "/tmp/warden-env");
    REQUIRE(cfg->authz.mode == AuthzMode::Off);
    REQUIRE(cfg->retention.noise_days == 2);
    REQUIRE(cfg->audit.mirror_to_log);

    SECTION("Malformed values are config errors")
    {
        ScopedEnv timeout("WARDEN_STORAGE_TIMEOUT_MS", "soon");
        auto bad = ConfigLoader::from_env();
        REQUIRE_FALSE(bad.has_value());
        REQUIRE(bad.error().code == ErrorCode::ConfigError);
    }

    SECTION("Oversized retention windows are config errors")
    {
        ScopedEnv huge("WARDEN_NOISE_RETENTION_DAYS", "200000000000");
        auto bad = ConfigLoader::from_env();
        REQUIRE_FALSE(bad.has_value());
        REQUIRE(bad.error().code == ErrorCode::ConfigError);

        ScopedEnv century("WARDEN_NOISE_RETENTION_DAYS", "36500");
        auto ok = ConfigLoader::from_env();
        REQUIRE(ok.has_value());
        REQUIRE(ok->retention.noise_days == 36500);
    }

    SECTION("Booleans must be spelled out")
    {
        ScopedEnv yes("WARDEN_AUDIT_MIRROR", "yes");
        REQUIRE_FALSE(ConfigLoader::from_env().has_value());
    }
}

TEST_CASE("Invalid configs are rejected", "[config]")
{
    const char *invalid[] = {
        "[storage]\ntimeout_ms = 0\n",
        "[storage]\nrocksdb_path = \"\"\n",
        "[ledger]\nmax_append_retries = -1\n",
        "[ledger]\nquery_batch_size = 0\n",
        "[retention]\nnoise_days = 0\n",
        "[retention]\nnoise_days = 36501\n",
        "[retention]\nimportant_days = 200000000000\n",
        "[authz]\nmode = \"lenient\"\n",
        "[authz]\nsuper_admin_role = \"\"\n",
        "[logging]\nlevel = \"verbose\"\n",
        "[audit]\nmirror_to_log = true\nlog_path = \"\"\n",
        "[storage\nrocksdb_path = 1\n",
    };

    for (const char *text : invalid)
    {
        CAPTURE(text);
        auto cfg = ConfigLoader::from_string(text);
        REQUIRE_FALSE(cfg.has_value());
        REQUIRE(cfg.error().code == ErrorCode::ConfigError);
    }
}

TEST_CASE("Config files are read from disk", "[config]")
{
    auto path = std::filesystem::temp_directory_path() / "warden-config-test.toml";
    {
        std::ofstream out(path);
        out << "[retention]\nimportant_days = 180\n";
    }

    auto cfg = ConfigLoader::load(path.string());
    REQUIRE(cfg.has_value());
    REQUIRE(cfg->retention.important_days == 180);
    std::filesystem::remove(path);

    auto missing = ConfigLoader::load(path.string());
    REQUIRE_FALSE(missing.has_value());
    REQUIRE(missing.error().code == ErrorCode::ConfigError);
}
