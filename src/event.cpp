#include "warden/event.hpp"
#include "warden/canonical_json.hpp"
#include "warden/crypto.hpp"
#include <format>

namespace warden
{

    using Json = nlohmann::json;

    namespace
    {
        Result<Timestamp> timestamp_field(const Json &j, const char *key)
        {
            return parse_iso8601(j.at(key).get<std::string>());
        }

        std::optional<std::string> optional_string(const Json &j, const char *key)
        {
            if (!j.contains(key) || j[key].is_null())
                return std::nullopt;
            return j[key].get<std::string>();
        }
    } // namespace

    Json Event::to_json() const
    {
        Json j = {
            {"id", id},
            {"sequence", sequence},
            {"name", name},
            {"occurred_at", format_iso8601(occurred_at)},
            {"actor_id", actor_id ? Json(*actor_id) : Json(nullptr)},
            {"subject_id", subject_id ? Json(*subject_id) : Json(nullptr)},
            {"payload", payload},
            {"severity", to_string(severity)},
            {"prev_hash", previous_hash ? Json(*previous_hash) : Json(nullptr)},
            {"hash", hash},
            {"recorded_at", format_iso8601(recorded_at)}};
        return j;
    }

    Result<Event> Event::from_json(const Json &j)
    {
        try
        {
            Event ev;
            ev.id = j.at("id").get<std::string>();
            ev.sequence = j.at("sequence").get<std::uint64_t>();
            ev.name = j.at("name").get<std::string>();
            ev.actor_id = optional_string(j, "actor_id");
            ev.subject_id = optional_string(j, "subject_id");
            ev.payload = j.at("payload");
            ev.previous_hash = optional_string(j, "prev_hash");
            ev.hash = j.at("hash").get<std::string>();

            auto occurred = timestamp_field(j, "occurred_at");
            if (!occurred)
                return std::unexpected(occurred.error());
            ev.occurred_at = *occurred;

            auto recorded = timestamp_field(j, "recorded_at");
            if (!recorded)
                return std::unexpected(recorded.error());
            ev.recorded_at = *recorded;

            auto sev = severity_from_string(j.at("severity").get<std::string>());
            if (!sev)
                return std::unexpected(sev.error());
            ev.severity = *sev;

            return ev;
        }
        catch (const Json::exception &e)
        {
            return std::unexpected(WardenError::invalid_input(
                std::format("Failed to parse Event: {}", e.what())));
        }
    }

    Result<std::string> compute_chain_hash(const std::optional<std::string> &previous_hash,
                                           const Json &payload)
    {
        auto canonical = json::Canonicalizer::canonicalize(payload);
        if (!canonical)
            return std::unexpected(canonical.error());

        return chain_digest(previous_hash, *canonical);
    }

    std::string chain_digest(const std::optional<std::string> &previous_hash,
                             std::string_view canonical_payload)
    {
        std::string_view prev = previous_hash ? std::string_view(*previous_hash) : std::string_view{};
        return crypto::SHA256::to_hex(crypto::SHA256::hash_concat(prev, canonical_payload));
    }

    Json ChainTail::to_json() const
    {
        return Json{
            {"next_sequence", next_sequence},
            {"hash", hash ? Json(*hash) : Json(nullptr)},
            {"occurred_at", occurred_at ? Json(format_iso8601(*occurred_at)) : Json(nullptr)}};
    }

    Result<ChainTail> ChainTail::from_json(const Json &j)
    {
        try
        {
            ChainTail tail;
            tail.next_sequence = j.at("next_sequence").get<std::uint64_t>();
            tail.hash = optional_string(j, "hash");
            if (auto ts = optional_string(j, "occurred_at"))
            {
                auto parsed = parse_iso8601(*ts);
                if (!parsed)
                    return std::unexpected(parsed.error());
                tail.occurred_at = *parsed;
            }
            return tail;
        }
        catch (const Json::exception &e)
        {
            return std::unexpected(WardenError::storage(
                std::format("Corrupt chain tail: {}", e.what())));
        }
    }

    Json Checkpoint::to_json() const
    {
        return Json{
            {"first_sequence", first_sequence},
            {"last_sequence", last_sequence},
            {"anchor_hash", anchor_hash},
            {"created_at", format_iso8601(created_at)}};
    }

    Result<Checkpoint> Checkpoint::from_json(const Json &j)
    {
        try
        {
            Checkpoint cp;
            cp.first_sequence = j.at("first_sequence").get<std::uint64_t>();
            cp.last_sequence = j.at("last_sequence").get<std::uint64_t>();
            cp.anchor_hash = j.at("anchor_hash").get<std::string>();
            auto created = timestamp_field(j, "created_at");
            if (!created)
                return std::unexpected(created.error());
            cp.created_at = *created;
            return cp;
        }
        catch (const Json::exception &e)
        {
            return std::unexpected(WardenError::storage(
                std::format("Corrupt checkpoint: {}", e.what())));
        }
    }

} // namespace warden
