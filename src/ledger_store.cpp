#include "warden/ledger_store.hpp"
#include <format>

namespace warden
{

    Result<std::unique_lock<std::timed_mutex>> InMemoryLedgerStore::lock(std::chrono::milliseconds timeout)
    {
        std::unique_lock<std::timed_mutex> guard(mutex_, timeout);
        if (!guard.owns_lock())
        {
            return std::unexpected(WardenError::storage(
                std::format("ledger store lock not acquired within {}ms", timeout.count())));
        }
        return guard;
    }

    Result<ChainTail> InMemoryLedgerStore::read_tail(std::chrono::milliseconds timeout)
    {
        auto guard = lock(timeout);
        if (!guard)
            return std::unexpected(guard.error());
        return tail_;
    }

    Result<void> InMemoryLedgerStore::commit_append(const ChainTail &expected,
                                                    const Event &event,
                                                    std::chrono::milliseconds timeout)
    {
        auto guard = lock(timeout);
        if (!guard)
            return std::unexpected(guard.error());

        if (!(tail_ == expected))
        {
            return std::unexpected(WardenError::conflict(std::format(
                "chain tail moved (expected sequence {}, found {})",
                expected.next_sequence, tail_.next_sequence)));
        }
        if (event.sequence != tail_.next_sequence)
        {
            return std::unexpected(WardenError::invalid_input("event sequence does not follow the tail"));
        }
        if (index_.contains(event.id))
        {
            return std::unexpected(WardenError::already_exists("event id already present: " + event.id));
        }

        events_.emplace(event.sequence, event);
        index_.emplace(event.id, event.sequence);
        tail_ = ChainTail{event.sequence + 1, event.hash, event.occurred_at};
        return {};
    }

    Result<std::vector<Event>> InMemoryLedgerStore::scan(std::uint64_t from_sequence,
                                                         std::size_t limit,
                                                         std::chrono::milliseconds timeout)
    {
        auto guard = lock(timeout);
        if (!guard)
            return std::unexpected(guard.error());

        std::vector<Event> out;
        for (auto it = events_.lower_bound(from_sequence); it != events_.end() && out.size() < limit; ++it)
        {
            out.push_back(it->second);
        }
        return out;
    }

    Result<std::optional<Event>> InMemoryLedgerStore::find(std::string_view id,
                                                           std::chrono::milliseconds timeout)
    {
        auto guard = lock(timeout);
        if (!guard)
            return std::unexpected(guard.error());

        auto it = index_.find(std::string(id));
        if (it == index_.end())
            return std::optional<Event>{};
        return std::optional<Event>(events_.at(it->second));
    }

    Result<void> InMemoryLedgerStore::purge(const PurgePlan &plan, std::chrono::milliseconds timeout)
    {
        auto guard = lock(timeout);
        if (!guard)
            return std::unexpected(guard.error());

        for (auto seq : plan.sequences)
        {
            if (!events_.contains(seq))
            {
                return std::unexpected(WardenError::conflict(
                    std::format("event {} already purged", seq)));
            }
        }

        for (auto seq : plan.sequences)
        {
            auto it = events_.find(seq);
            index_.erase(it->second.id);
            events_.erase(it);
        }
        for (const auto &cp : plan.removed_checkpoints)
            checkpoints_.erase(cp.first_sequence);
        for (const auto &cp : plan.added_checkpoints)
            checkpoints_[cp.first_sequence] = cp;
        return {};
    }

    Result<std::vector<Checkpoint>> InMemoryLedgerStore::checkpoints(std::chrono::milliseconds timeout)
    {
        auto guard = lock(timeout);
        if (!guard)
            return std::unexpected(guard.error());

        std::vector<Checkpoint> out;
        out.reserve(checkpoints_.size());
        for (const auto &[_, cp] : checkpoints_)
            out.push_back(cp);
        return out;
    }

} // namespace warden
