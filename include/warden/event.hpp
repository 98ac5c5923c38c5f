#pragma once

#include "clock.hpp"
#include "severity.hpp"
#include "types.hpp"
#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>

namespace warden
{

    /**
     * Immutable ledger entry.
     *
     * hash = hex(SHA-256(previous_hash_ascii ++ canonical(payload))), where the
     * previous hash contributes its 64 hex characters and the genesis event
     * contributes nothing.
     */
    struct Event
    {
        std::string id;           // UUID v4
        std::uint64_t sequence{0}; // insertion order, assigned at append
        std::string name;         // namespaced, e.g. "role.permission_granted"
        Timestamp occurred_at{};
        std::optional<std::string> actor_id;
        std::optional<std::string> subject_id;
        nlohmann::json payload;
        Severity severity{Severity::Important};
        std::optional<std::string> previous_hash; // empty only for genesis
        std::string hash;
        Timestamp recorded_at{};

        nlohmann::json to_json() const;
        static Result<Event> from_json(const nlohmann::json &j);
    };

    /**
     * Digest linking a payload to the chain tail.
     * @return hex digest, or InvalidInput when the payload cannot be canonicalized
     */
    Result<std::string> compute_chain_hash(const std::optional<std::string> &previous_hash,
                                           const nlohmann::json &payload);

    /** Same digest over an already canonicalized payload */
    std::string chain_digest(const std::optional<std::string> &previous_hash,
                             std::string_view canonical_payload);

    /**
     * Pointer to the most recently appended event. An empty chain has
     * next_sequence 0 and no hash.
     */
    struct ChainTail
    {
        std::uint64_t next_sequence{0};
        std::optional<std::string> hash;
        std::optional<Timestamp> occurred_at;

        bool empty() const { return !hash.has_value(); }
        bool operator==(const ChainTail &other) const = default;

        nlohmann::json to_json() const;
        static Result<ChainTail> from_json(const nlohmann::json &j);
    };

    /**
     * Trust anchor for a purged interior range [first_sequence, last_sequence].
     * anchor_hash is the hash of the last purged event, which the first
     * surviving event after the range links to.
     */
    struct Checkpoint
    {
        std::uint64_t first_sequence{0};
        std::uint64_t last_sequence{0};
        std::string anchor_hash;
        Timestamp created_at{};

        nlohmann::json to_json() const;
        static Result<Checkpoint> from_json(const nlohmann::json &j);
    };

} // namespace warden
