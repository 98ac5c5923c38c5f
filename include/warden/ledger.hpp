#pragma once

#include "clock.hpp"
#include "event.hpp"
#include "ledger_store.hpp"
#include "severity.hpp"
#include "types.hpp"
#include <chrono>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace warden
{

    struct LedgerOptions
    {
        std::size_t max_append_retries{5};
        std::chrono::milliseconds retry_backoff{5}; // doubled per retry
        std::chrono::milliseconds storage_timeout{2000};
        std::size_t query_batch_size{256};
        RetentionPolicy retention{};
    };

    /**
     * Read-only event filter. Every set field must match.
     * since is inclusive, until is exclusive.
     */
    struct EventFilter
    {
        std::optional<std::string> name;
        std::optional<Severity> severity;
        std::optional<std::string> actor_id;
        std::optional<std::string> subject_id;
        std::optional<Timestamp> since;
        std::optional<Timestamp> until;

        bool matches(const Event &event) const;
    };

    /**
     * Lazy, ascending sequence of events. Pages through the store in batches;
     * each page is a separate storage read.
     */
    class EventCursor
    {
    public:
        /** Next matching event, or empty when exhausted */
        Result<std::optional<Event>> next();

        /** Drain the remaining events */
        Result<std::vector<Event>> collect();

    private:
        friend class Ledger;

        EventCursor(std::shared_ptr<LedgerStore> store,
                    EventFilter filter,
                    std::size_t batch_size,
                    std::chrono::milliseconds timeout);

        Result<void> fill();

        std::shared_ptr<LedgerStore> store_;
        EventFilter filter_;
        std::size_t batch_size_;
        std::chrono::milliseconds timeout_;
        std::uint64_t next_sequence_{0};
        bool exhausted_{false};
        std::deque<Event> buffer_;
    };

    struct VerifyOptions
    {
        std::optional<std::string> from_id;
        std::optional<std::string> to_id;

        /** Last-known-good hash the first verified event must link to */
        std::optional<std::string> anchor_hash;
    };

    struct VerifyReport
    {
        std::uint64_t events_checked{0};
        std::optional<std::uint64_t> first_sequence;
        std::optional<std::uint64_t> last_sequence;
        std::optional<std::string> last_hash;
        std::uint64_t gaps_bridged{0};

        nlohmann::json to_json() const;
    };

    /** The two retention views */
    struct RetentionView
    {
        std::vector<Event> stale_noise;
        std::vector<Event> stale_important;
    };

    struct PurgeReport
    {
        std::uint64_t purged_noise{0};
        std::uint64_t purged_important{0};
        std::vector<Checkpoint> checkpoints; // checkpoints written by this purge
        Timestamp executed_at{};

        std::uint64_t purged_total() const { return purged_noise + purged_important; }
        nlohmann::json to_json() const;
    };

    /**
     * Append-only, hash-chained event ledger.
     *
     * The chain tail lives in the store; appends compute the new hash against
     * the tail they read and commit through the store's compare-and-swap,
     * retrying with exponential backoff when another writer got there first.
     */
    class Ledger
    {
    public:
        Ledger(std::shared_ptr<LedgerStore> store,
               std::shared_ptr<const Clock> clock,
               LedgerOptions options = {});

        /**
         * Append an event as the new tail.
         * @param occurred_at explicit occurrence time for replay imports; must
         *        not precede the current tail. Defaults to the clock.
         */
        Result<Event> append(const std::string &name,
                             const std::optional<std::string> &actor_id,
                             const std::optional<std::string> &subject_id,
                             const nlohmann::json &payload,
                             Severity severity,
                             std::optional<Timestamp> occurred_at = std::nullopt);

        /**
         * Recompute every link in the range and fail at the first mismatch
         * with IntegrityViolation naming the offending event. Purged gaps are
         * bridged only through their checkpoints.
         */
        Result<VerifyReport> verify_chain(const VerifyOptions &options = {}) const;

        EventCursor query(const EventFilter &filter) const;

        Result<std::optional<Event>> find(const std::string &id) const;

        Result<ChainTail> tail() const;

        Result<std::vector<Checkpoint>> checkpoints() const;

        /** Every noise and important event past its retention window, tail included */
        Result<RetentionView> stale_events(Timestamp now) const;

        /**
         * Delete stale events. Runs a full verification first and refuses to
         * purge over a broken chain. Only verified events are purged, and the
         * last of them is kept as the chain tail. Purges in one process run
         * one at a time.
         */
        Result<PurgeReport> purge_stale(Timestamp now);

        const LedgerOptions &options() const { return options_; }
        const Clock &clock() const { return *clock_; }

    private:
        Result<std::optional<std::string>> anchor_before(std::uint64_t sequence,
                                                         const std::vector<Checkpoint> &checkpoints) const;

        std::shared_ptr<LedgerStore> store_;
        std::shared_ptr<const Clock> clock_;
        LedgerOptions options_;
        std::mutex purge_mutex_;
    };

} // namespace warden
