#include "warden/severity.hpp"
#include <array>

namespace warden
{

    namespace
    {
        constexpr std::array<std::string_view, 5> kNoiseEvents = {
            "authz.granted",
            "resource.read",
            "auth.token_validated",
            "project.viewed",
            "task.viewed",
        };

        constexpr std::array<std::string_view, 2> kCriticalEvents = {
            "ledger.purged",
            "ledger.integrity_violation",
        };

        constexpr std::string_view kBatchSuffix = ".batch";
    } // namespace

    std::string to_string(Severity severity)
    {
        switch (severity)
        {
        case Severity::Noise:
            return "noise";
        case Severity::Important:
            return "important";
        case Severity::Critical:
            return "critical";
        }
        return "important";
    }

    Result<Severity> severity_from_string(std::string_view s)
    {
        if (s == "noise")
            return Severity::Noise;
        if (s == "important")
            return Severity::Important;
        if (s == "critical")
            return Severity::Critical;
        return std::unexpected(WardenError::invalid_input("Invalid severity: " + std::string(s)));
    }

    std::optional<std::chrono::milliseconds> RetentionPolicy::window(Severity severity) const
    {
        switch (severity)
        {
        case Severity::Noise:
            return noise_window;
        case Severity::Important:
            return important_window;
        case Severity::Critical:
            return std::nullopt;
        }
        return std::nullopt;
    }

    std::optional<Timestamp> RetentionPolicy::stale_cutoff(Severity severity, Timestamp now) const
    {
        auto w = window(severity);
        if (!w)
            return std::nullopt;
        return now - *w;
    }

    bool RetentionPolicy::is_stale(Severity severity, Timestamp occurred_at, Timestamp now) const
    {
        auto cutoff = stale_cutoff(severity, now);
        return cutoff && occurred_at < *cutoff;
    }

    Severity classify(std::string_view event_name)
    {
        if (event_name.ends_with(kBatchSuffix))
            event_name.remove_suffix(kBatchSuffix.size());

        for (auto name : kCriticalEvents)
        {
            if (event_name == name)
                return Severity::Critical;
        }
        for (auto name : kNoiseEvents)
        {
            if (event_name == name)
                return Severity::Noise;
        }
        return Severity::Important;
    }

} // namespace warden
