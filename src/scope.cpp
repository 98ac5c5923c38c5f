#include "warden/scope.hpp"
#include "warden/canonical_json.hpp"
#include <format>

namespace warden
{

    Scope::Scope(std::map<std::string, std::string> entries)
        : entries_(std::move(entries))
    {
    }

    Result<Scope> Scope::parse(const nlohmann::json &j)
    {
        if (j.is_null())
            return Scope{};
        if (!j.is_object())
            return std::unexpected(WardenError::invalid_scope("scope must be a JSON object"));

        std::map<std::string, std::string> entries;
        for (auto it = j.begin(); it != j.end(); ++it)
        {
            if (it.key().empty())
                return std::unexpected(WardenError::invalid_scope("scope keys must not be empty"));

            if (!json::is_valid_utf8(it.key()))
                return std::unexpected(WardenError::invalid_scope("scope keys must be valid UTF-8"));

            const auto &value = it.value();
            if (!value.is_string())
            {
                return std::unexpected(WardenError::invalid_scope(std::format(
                    "scope value for '{}' must be a string", it.key())));
            }
            const auto &text = value.get_ref<const std::string &>();
            if (!json::is_valid_utf8(text))
            {
                return std::unexpected(WardenError::invalid_scope(std::format(
                    "scope value for '{}' must be valid UTF-8", it.key())));
            }
            entries[it.key()] = text;
        }
        return Scope(std::move(entries));
    }

    Result<Scope> Scope::parse_text(const std::string &text)
    {
        try
        {
            return parse(nlohmann::json::parse(text));
        }
        catch (const nlohmann::json::parse_error &e)
        {
            return std::unexpected(WardenError::invalid_scope(
                std::format("scope is not valid JSON: {}", e.what())));
        }
    }

    bool Scope::matches(const Scope &request) const
    {
        for (const auto &[key, value] : entries_)
        {
            auto it = request.entries_.find(key);
            if (it == request.entries_.end() || it->second != value)
                return false;
        }
        return true;
    }

    nlohmann::json Scope::to_json() const
    {
        nlohmann::json j = nlohmann::json::object();
        for (const auto &[key, value] : entries_)
            j[key] = value;
        return j;
    }

    std::string Scope::to_text() const
    {
        return to_json().dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    }

} // namespace warden
