#include "warden/ledger.hpp"
#include "warden/canonical_json.hpp"
#include "warden/crypto.hpp"
#include <algorithm>
#include <format>
#include <map>
#include <spdlog/spdlog.h>
#include <thread>

namespace warden
{

    using Json = nlohmann::json;

    namespace
    {
        WardenError violation(const std::string &message, const std::string &event_id)
        {
            spdlog::error("ledger integrity violation at event {}: {}", event_id, message);
            return WardenError::integrity(message, event_id);
        }

        Json optional_json(const std::optional<std::string> &value)
        {
            return value ? Json(*value) : Json(nullptr);
        }

        bool same_checkpoint(const Checkpoint &a, const Checkpoint &b)
        {
            return a.first_sequence == b.first_sequence &&
                   a.last_sequence == b.last_sequence &&
                   a.anchor_hash == b.anchor_hash;
        }
    } // namespace

    // ---------------------------------------------------------------------
    // EventFilter / EventCursor
    // ---------------------------------------------------------------------

    bool EventFilter::matches(const Event &event) const
    {
        if (name && event.name != *name)
            return false;
        if (severity && event.severity != *severity)
            return false;
        if (actor_id && event.actor_id != actor_id)
            return false;
        if (subject_id && event.subject_id != subject_id)
            return false;
        if (since && event.occurred_at < *since)
            return false;
        if (until && event.occurred_at >= *until)
            return false;
        return true;
    }

    EventCursor::EventCursor(std::shared_ptr<LedgerStore> store,
                             EventFilter filter,
                             std::size_t batch_size,
                             std::chrono::milliseconds timeout)
        : store_(std::move(store)),
          filter_(std::move(filter)),
          batch_size_(std::max<std::size_t>(batch_size, 1)),
          timeout_(timeout)
    {
    }

    Result<void> EventCursor::fill()
    {
        auto batch = store_->scan(next_sequence_, batch_size_, timeout_);
        if (!batch)
            return std::unexpected(batch.error());

        if (batch->size() < batch_size_)
            exhausted_ = true;

        for (auto &event : *batch)
        {
            next_sequence_ = event.sequence + 1;
            // occurrence order follows sequence order, nothing later can match
            if (filter_.until && event.occurred_at >= *filter_.until)
            {
                exhausted_ = true;
                break;
            }
            if (filter_.matches(event))
                buffer_.push_back(std::move(event));
        }
        return {};
    }

    Result<std::optional<Event>> EventCursor::next()
    {
        while (buffer_.empty() && !exhausted_)
        {
            auto filled = fill();
            if (!filled)
                return std::unexpected(filled.error());
        }
        if (buffer_.empty())
            return std::optional<Event>{};

        Event event = std::move(buffer_.front());
        buffer_.pop_front();
        return std::optional<Event>(std::move(event));
    }

    Result<std::vector<Event>> EventCursor::collect()
    {
        std::vector<Event> out;
        while (true)
        {
            auto event = next();
            if (!event)
                return std::unexpected(event.error());
            if (!*event)
                break;
            out.push_back(std::move(**event));
        }
        return out;
    }

    // ---------------------------------------------------------------------
    // Reports
    // ---------------------------------------------------------------------

    Json VerifyReport::to_json() const
    {
        return Json{
            {"events_checked", events_checked},
            {"first_sequence", first_sequence ? Json(*first_sequence) : Json(nullptr)},
            {"last_sequence", last_sequence ? Json(*last_sequence) : Json(nullptr)},
            {"last_hash", optional_json(last_hash)},
            {"gaps_bridged", gaps_bridged}};
    }

    Json PurgeReport::to_json() const
    {
        Json cps = Json::array();
        for (const auto &cp : checkpoints)
            cps.push_back(cp.to_json());

        return Json{
            {"purged_noise", purged_noise},
            {"purged_important", purged_important},
            {"purged_total", purged_total()},
            {"checkpoints", cps},
            {"executed_at", format_iso8601(executed_at)}};
    }

    // ---------------------------------------------------------------------
    // Ledger
    // ---------------------------------------------------------------------

    Ledger::Ledger(std::shared_ptr<LedgerStore> store,
                   std::shared_ptr<const Clock> clock,
                   LedgerOptions options)
        : store_(std::move(store)), clock_(std::move(clock)), options_(std::move(options))
    {
    }

    Result<Event> Ledger::append(const std::string &name,
                                 const std::optional<std::string> &actor_id,
                                 const std::optional<std::string> &subject_id,
                                 const Json &payload,
                                 Severity severity,
                                 std::optional<Timestamp> occurred_at)
    {
        if (name.empty())
            return std::unexpected(WardenError::invalid_input("event name must not be empty"));
        if (!json::is_valid_utf8(name) ||
            (actor_id && !json::is_valid_utf8(*actor_id)) ||
            (subject_id && !json::is_valid_utf8(*subject_id)))
        {
            return std::unexpected(WardenError::invalid_input("event name and ids must be valid UTF-8"));
        }

        auto canonical = json::Canonicalizer::canonicalize(payload);
        if (!canonical)
            return std::unexpected(canonical.error());

        for (std::size_t attempt = 0;; ++attempt)
        {
            auto tail = store_->read_tail(options_.storage_timeout);
            if (!tail)
                return std::unexpected(tail.error());

            Timestamp now = clock_->now();
            Timestamp occurred = occurred_at.value_or(now);
            if (tail->occurred_at && occurred < *tail->occurred_at)
            {
                if (occurred_at)
                {
                    return std::unexpected(WardenError::invalid_input(std::format(
                        "occurred_at {} precedes the chain tail ({})",
                        format_iso8601(*occurred_at), format_iso8601(*tail->occurred_at))));
                }
                occurred = *tail->occurred_at;
            }

            Event event;
            event.id = crypto::uuid_v4();
            event.sequence = tail->next_sequence;
            event.name = name;
            event.occurred_at = occurred;
            event.actor_id = actor_id;
            event.subject_id = subject_id;
            event.payload = payload;
            event.severity = severity;
            event.previous_hash = tail->hash;
            event.hash = chain_digest(tail->hash, *canonical);
            event.recorded_at = now;

            auto committed = store_->commit_append(*tail, event, options_.storage_timeout);
            if (committed)
            {
                spdlog::debug("ledger append {} seq={} name={}", event.id, event.sequence, event.name);
                return event;
            }

            if (committed.error().code != ErrorCode::ConflictingAppend)
                return std::unexpected(committed.error());

            if (attempt >= options_.max_append_retries)
            {
                spdlog::warn("ledger append of {} gave up after {} retries", name, attempt);
                return std::unexpected(committed.error());
            }

            auto delay = options_.retry_backoff * (1LL << std::min<std::size_t>(attempt, 16));
            spdlog::warn("ledger append conflict on {} (attempt {}), retrying in {}ms",
                         name, attempt + 1, delay.count());
            std::this_thread::sleep_for(delay);
        }
    }

    Result<std::optional<std::string>> Ledger::anchor_before(std::uint64_t sequence,
                                                             const std::vector<Checkpoint> &checkpoints) const
    {
        if (sequence == 0)
            return std::optional<std::string>{};

        auto previous = store_->scan(sequence - 1, 1, options_.storage_timeout);
        if (!previous)
            return std::unexpected(previous.error());
        if (!previous->empty() && previous->front().sequence == sequence - 1)
            return std::optional<std::string>(previous->front().hash);

        for (const auto &cp : checkpoints)
        {
            if (cp.last_sequence == sequence - 1)
                return std::optional<std::string>(cp.anchor_hash);
        }
        return std::unexpected(WardenError::not_found(
            std::format("no trust anchor for sequence {}", sequence)));
    }

    Result<VerifyReport> Ledger::verify_chain(const VerifyOptions &options) const
    {
        if (options.anchor_hash && !options.from_id)
            return std::unexpected(WardenError::invalid_input("an anchor hash requires a starting event"));

        auto tail = store_->read_tail(options_.storage_timeout);
        if (!tail)
            return std::unexpected(tail.error());

        auto checkpoints = store_->checkpoints(options_.storage_timeout);
        if (!checkpoints)
            return std::unexpected(checkpoints.error());
        bool checkpoints_refreshed = false;

        auto locate = [&](const std::string &id) -> Result<Event>
        {
            auto found = store_->find(id, options_.storage_timeout);
            if (!found)
                return std::unexpected(found.error());
            if (!*found)
                return std::unexpected(WardenError::not_found("event not found: " + id));
            return **found;
        };

        std::uint64_t expected_sequence = 0;
        std::optional<std::string> expected_previous;
        if (options.from_id)
        {
            auto from = locate(*options.from_id);
            if (!from)
                return std::unexpected(from.error());
            expected_sequence = from->sequence;

            if (options.anchor_hash)
            {
                expected_previous = options.anchor_hash;
            }
            else
            {
                auto anchor = anchor_before(from->sequence, *checkpoints);
                if (!anchor)
                {
                    if (anchor.error().code == ErrorCode::NotFound)
                        return std::unexpected(violation(anchor.error().what(), from->id));
                    return std::unexpected(anchor.error());
                }
                expected_previous = *anchor;
            }
        }

        VerifyReport report;
        if (tail->empty() && !options.to_id)
            return report;

        std::uint64_t last_sequence = tail->next_sequence - 1;
        if (options.to_id)
        {
            auto to = locate(*options.to_id);
            if (!to)
                return std::unexpected(to.error());
            if (to->sequence < expected_sequence)
                return std::unexpected(WardenError::invalid_input("verification range ends before it starts"));
            last_sequence = to->sequence;
        }

        std::optional<Timestamp> previous_occurred;
        std::string last_id;
        std::uint64_t cursor = expected_sequence;
        bool done = false;
        while (!done && cursor <= last_sequence)
        {
            auto batch = store_->scan(cursor, options_.query_batch_size, options_.storage_timeout);
            if (!batch)
                return std::unexpected(batch.error());
            if (batch->empty())
                break;

            for (const auto &event : *batch)
            {
                if (event.sequence > last_sequence)
                {
                    done = true;
                    break;
                }

                if (event.sequence != expected_sequence)
                {
                    auto bridges = [&](const Checkpoint &cp)
                    {
                        return cp.first_sequence == expected_sequence &&
                               cp.last_sequence == event.sequence - 1;
                    };
                    auto bridge = std::find_if(checkpoints->begin(), checkpoints->end(), bridges);
                    if (bridge == checkpoints->end() && !checkpoints_refreshed)
                    {
                        // A purge may have committed after the checkpoints were read
                        checkpoints = store_->checkpoints(options_.storage_timeout);
                        if (!checkpoints)
                            return std::unexpected(checkpoints.error());
                        checkpoints_refreshed = true;
                        bridge = std::find_if(checkpoints->begin(), checkpoints->end(), bridges);
                    }
                    if (bridge == checkpoints->end())
                    {
                        return std::unexpected(violation(std::format(
                            "sequences {}..{} missing without a checkpoint",
                            expected_sequence, event.sequence - 1), event.id));
                    }
                    expected_previous = bridge->anchor_hash;
                    ++report.gaps_bridged;
                }

                if (event.previous_hash != expected_previous)
                    return std::unexpected(violation("previous hash does not link to its predecessor", event.id));

                if (previous_occurred && event.occurred_at < *previous_occurred)
                    return std::unexpected(violation("occurrence time runs backwards", event.id));

                auto recomputed = compute_chain_hash(expected_previous, event.payload);
                if (!recomputed)
                    return std::unexpected(violation(recomputed.error().what(), event.id));
                if (!crypto::digest_equals(*recomputed, event.hash))
                    return std::unexpected(violation("stored hash does not match payload", event.id));

                if (!report.first_sequence)
                    report.first_sequence = event.sequence;
                report.last_sequence = event.sequence;
                report.last_hash = event.hash;
                ++report.events_checked;
                last_id = event.id;

                expected_previous = event.hash;
                expected_sequence = event.sequence + 1;
                previous_occurred = event.occurred_at;
            }
            cursor = batch->back().sequence + 1;
        }

        if (report.last_sequence != last_sequence)
        {
            return std::unexpected(violation(std::format(
                "chain ends at {} before sequence {}",
                report.last_sequence ? std::to_string(*report.last_sequence) : std::string("genesis"),
                last_sequence), options.to_id.value_or(last_id)));
        }

        if (!options.to_id && report.last_hash != tail->hash)
            return std::unexpected(violation("chain tail does not match the last event", last_id));

        spdlog::debug("ledger verified {} events ({} gaps bridged)", report.events_checked, report.gaps_bridged);
        return report;
    }

    EventCursor Ledger::query(const EventFilter &filter) const
    {
        return EventCursor(store_, filter, options_.query_batch_size, options_.storage_timeout);
    }

    Result<std::optional<Event>> Ledger::find(const std::string &id) const
    {
        return store_->find(id, options_.storage_timeout);
    }

    Result<ChainTail> Ledger::tail() const
    {
        return store_->read_tail(options_.storage_timeout);
    }

    Result<std::vector<Checkpoint>> Ledger::checkpoints() const
    {
        return store_->checkpoints(options_.storage_timeout);
    }

    Result<RetentionView> Ledger::stale_events(Timestamp now) const
    {
        auto tail = store_->read_tail(options_.storage_timeout);
        if (!tail)
            return std::unexpected(tail.error());

        RetentionView view;
        if (tail->empty())
            return view;

        std::optional<Timestamp> horizon;
        for (auto severity : {Severity::Noise, Severity::Important})
        {
            auto cutoff = options_.retention.stale_cutoff(severity, now);
            if (cutoff && (!horizon || *cutoff > *horizon))
                horizon = cutoff;
        }
        if (!horizon)
            return view;

        std::uint64_t tail_sequence = tail->next_sequence - 1;
        std::uint64_t cursor = 0;
        while (true)
        {
            auto batch = store_->scan(cursor, options_.query_batch_size, options_.storage_timeout);
            if (!batch)
                return std::unexpected(batch.error());
            if (batch->empty())
                return view;

            for (auto &event : *batch)
            {
                if (event.sequence > tail_sequence || event.occurred_at >= *horizon)
                    return view;
                if (!options_.retention.is_stale(event.severity, event.occurred_at, now))
                    continue;

                if (event.severity == Severity::Noise)
                    view.stale_noise.push_back(std::move(event));
                else
                    view.stale_important.push_back(std::move(event));
            }
            cursor = batch->back().sequence + 1;
        }
    }

    Result<PurgeReport> Ledger::purge_stale(Timestamp now)
    {
        std::lock_guard purge_lock(purge_mutex_);

        auto verified = verify_chain();
        if (!verified)
        {
            spdlog::error("ledger purge refused: {}", verified.error().what());
            return std::unexpected(verified.error());
        }

        auto view = stale_events(now);
        if (!view)
            return std::unexpected(view.error());

        PurgeReport report;
        report.executed_at = now;
        if (!verified->last_sequence)
            return report;

        // The verified tail stays so new appends keep a link
        std::uint64_t keep_from = *verified->last_sequence;
        std::map<std::uint64_t, std::string> doomed; // sequence -> hash
        for (const auto &event : view->stale_noise)
        {
            if (event.sequence < keep_from && doomed.emplace(event.sequence, event.hash).second)
                ++report.purged_noise;
        }
        for (const auto &event : view->stale_important)
        {
            if (event.sequence < keep_from && doomed.emplace(event.sequence, event.hash).second)
                ++report.purged_important;
        }
        if (report.purged_total() == 0)
            return report;

        auto existing = store_->checkpoints(options_.storage_timeout);
        if (!existing)
            return std::unexpected(existing.error());

        Timestamp created = clock_->now();
        std::vector<Checkpoint> ranges = *existing;
        for (auto it = doomed.begin(); it != doomed.end();)
        {
            Checkpoint run{it->first, it->first, it->second, created};
            ++it;
            while (it != doomed.end() && it->first == run.last_sequence + 1)
            {
                run.last_sequence = it->first;
                run.anchor_hash = it->second;
                ++it;
            }
            ranges.push_back(std::move(run));
        }

        std::sort(ranges.begin(), ranges.end(),
                  [](const Checkpoint &a, const Checkpoint &b)
                  { return a.first_sequence < b.first_sequence; });

        std::vector<Checkpoint> merged;
        for (auto &range : ranges)
        {
            if (!merged.empty() && range.first_sequence <= merged.back().last_sequence + 1)
            {
                auto &current = merged.back();
                if (range.last_sequence > current.last_sequence)
                {
                    current.last_sequence = range.last_sequence;
                    current.anchor_hash = range.anchor_hash;
                }
                current.created_at = created;
                continue;
            }
            merged.push_back(std::move(range));
        }

        PurgePlan plan;
        plan.sequences.reserve(doomed.size());
        for (const auto &[sequence, _] : doomed)
            plan.sequences.push_back(sequence);

        for (const auto &cp : *existing)
        {
            bool kept = std::any_of(merged.begin(), merged.end(),
                                    [&](const Checkpoint &m)
                                    { return same_checkpoint(cp, m); });
            if (!kept)
                plan.removed_checkpoints.push_back(cp);
        }
        for (const auto &cp : merged)
        {
            bool known = std::any_of(existing->begin(), existing->end(),
                                     [&](const Checkpoint &e)
                                     { return same_checkpoint(cp, e); });
            if (!known)
                plan.added_checkpoints.push_back(cp);
        }

        auto purged = store_->purge(plan, options_.storage_timeout);
        if (!purged)
            return std::unexpected(purged.error());

        report.checkpoints = plan.added_checkpoints;
        spdlog::info("ledger purge removed {} noise and {} important events, {} checkpoint(s) written",
                     report.purged_noise, report.purged_important, report.checkpoints.size());
        return report;
    }

} // namespace warden
