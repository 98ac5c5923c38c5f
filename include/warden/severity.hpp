#pragma once

#include "clock.hpp"
#include "types.hpp"
#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace warden
{

    /**
     * Severity tier of an event. Drives retention window length.
     */
    enum class Severity
    {
        Noise,
        Important,
        Critical // never purged
    };

    std::string to_string(Severity severity);

    Result<Severity> severity_from_string(std::string_view s);

    /**
     * Retention windows per severity tier.
     */
    struct RetentionPolicy
    {
        std::chrono::days noise_window{7};
        std::chrono::days important_window{90};

        /** Retention window for a tier; empty when the tier is kept forever */
        std::optional<std::chrono::milliseconds> window(Severity severity) const;

        /** Events occurring strictly before the cutoff are stale */
        std::optional<Timestamp> stale_cutoff(Severity severity, Timestamp now) const;

        bool is_stale(Severity severity, Timestamp occurred_at, Timestamp now) const;
    };

    /**
     * Severity for a namespaced event name. Routine reads and access grants are
     * noise, ledger maintenance and integrity alarms are critical, everything
     * else (authentication, authorization mutations, domain writes, unknown
     * names) is important. A trailing ".batch" is ignored.
     */
    Severity classify(std::string_view event_name);

} // namespace warden
