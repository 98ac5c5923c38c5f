#pragma once

#include "types.hpp"
#include <map>
#include <nlohmann/json.hpp>
#include <string>

namespace warden
{

    /**
     * Attribute constraint attached to a direct grant, e.g. {"project_id": "p1"}.
     *
     * A grant scope matches a request when every key of the grant is present
     * in the request with an equal value. The empty scope matches everything.
     */
    class Scope
    {
    public:
        Scope() = default;
        explicit Scope(std::map<std::string, std::string> entries);

        /**
         * Parse a scope document. null and {} give the empty scope. Values
         * must be UTF-8 strings; anything else is InvalidScope.
         */
        static Result<Scope> parse(const nlohmann::json &j);

        /** Parse scope JSON text as typed on a command line */
        static Result<Scope> parse_text(const std::string &text);

        bool matches(const Scope &request) const;

        bool empty() const { return entries_.empty(); }
        const std::map<std::string, std::string> &entries() const { return entries_; }

        nlohmann::json to_json() const;

        /** Compact JSON text for messages; malformed UTF-8 becomes U+FFFD */
        std::string to_text() const;

        bool operator==(const Scope &other) const = default;

    private:
        std::map<std::string, std::string> entries_;
    };

} // namespace warden
