#pragma once

#include "event.hpp"
#include "types.hpp"
#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace warden
{

    /**
     * Deletions and checkpoint rewrites applied by one retention purge.
     */
    struct PurgePlan
    {
        std::vector<std::uint64_t> sequences;
        std::vector<Checkpoint> removed_checkpoints;
        std::vector<Checkpoint> added_checkpoints;
    };

    /**
     * Storage backend for the event ledger.
     *
     * The backend owns the chain tail. commit_append is a compare-and-swap on
     * it: the event is written and the tail advanced only if the stored tail
     * still equals the tail the event was computed against. Every call takes
     * a caller-supplied timeout; exceeding it yields StorageUnavailable and
     * leaves no partial write visible.
     */
    class LedgerStore
    {
    public:
        virtual ~LedgerStore() = default;

        virtual Result<ChainTail> read_tail(std::chrono::milliseconds timeout) = 0;

        /**
         * Atomically write the event as the new tail.
         * @return ConflictingAppend if the stored tail no longer equals expected
         */
        virtual Result<void> commit_append(const ChainTail &expected,
                                           const Event &event,
                                           std::chrono::milliseconds timeout) = 0;

        /**
         * Events with sequence >= from_sequence in ascending order, at most limit.
         */
        virtual Result<std::vector<Event>> scan(std::uint64_t from_sequence,
                                                std::size_t limit,
                                                std::chrono::milliseconds timeout) = 0;

        virtual Result<std::optional<Event>> find(std::string_view id,
                                                  std::chrono::milliseconds timeout) = 0;

        /**
         * Delete events and rewrite checkpoints in one atomic step.
         * @return ConflictingAppend if any listed event is already gone
         */
        virtual Result<void> purge(const PurgePlan &plan, std::chrono::milliseconds timeout) = 0;

        /** All checkpoints ordered by first_sequence */
        virtual Result<std::vector<Checkpoint>> checkpoints(std::chrono::milliseconds timeout) = 0;
    };

    /**
     * Process-local ledger store. A timed mutex provides the atomic
     * read-compare-write; it is suitable for tests and single-process
     * deployments.
     */
    class InMemoryLedgerStore : public LedgerStore
    {
    public:
        Result<ChainTail> read_tail(std::chrono::milliseconds timeout) override;

        Result<void> commit_append(const ChainTail &expected,
                                   const Event &event,
                                   std::chrono::milliseconds timeout) override;

        Result<std::vector<Event>> scan(std::uint64_t from_sequence,
                                        std::size_t limit,
                                        std::chrono::milliseconds timeout) override;

        Result<std::optional<Event>> find(std::string_view id,
                                          std::chrono::milliseconds timeout) override;

        Result<void> purge(const PurgePlan &plan, std::chrono::milliseconds timeout) override;

        Result<std::vector<Checkpoint>> checkpoints(std::chrono::milliseconds timeout) override;

    private:
        Result<std::unique_lock<std::timed_mutex>> lock(std::chrono::milliseconds timeout);

        std::timed_mutex mutex_;
        ChainTail tail_;
        std::map<std::uint64_t, Event> events_;
        std::unordered_map<std::string, std::uint64_t> index_;
        std::map<std::uint64_t, Checkpoint> checkpoints_; // keyed by first_sequence
    };

} // namespace warden
