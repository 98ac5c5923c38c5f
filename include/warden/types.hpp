#pragma once

#include <expected>
#include <optional>
#include <stdexcept>
#include <string>

namespace warden
{

    /**
     * Error taxonomy for the audit and authorization core.
     */
    enum class ErrorCode
    {
        IntegrityViolation,
        ConflictingAppend,
        NotFound,
        InvalidScope,
        StorageUnavailable,
        AlreadyExists,
        InvalidInput,
        Forbidden,
        ConfigError
    };

    std::string error_code_to_string(ErrorCode code);

    /**
     * Warden error with code, message and, for chain failures, the id of the
     * offending event.
     */
    class WardenError : public std::runtime_error
    {
    public:
        ErrorCode code;
        std::optional<std::string> event_id;

        WardenError(ErrorCode code, const std::string &message,
                    std::optional<std::string> event_id = std::nullopt)
            : std::runtime_error(message), code(code), event_id(std::move(event_id)) {}

        /** Conflicting appends and storage outages may succeed on retry */
        bool is_transient() const
        {
            return code == ErrorCode::ConflictingAppend || code == ErrorCode::StorageUnavailable;
        }

        static WardenError integrity(const std::string &msg, std::string event_id)
        {
            return WardenError(ErrorCode::IntegrityViolation, msg, std::move(event_id));
        }

        static WardenError conflict(const std::string &msg)
        {
            return WardenError(ErrorCode::ConflictingAppend, msg);
        }

        static WardenError not_found(const std::string &msg)
        {
            return WardenError(ErrorCode::NotFound, msg);
        }

        static WardenError invalid_scope(const std::string &msg)
        {
            return WardenError(ErrorCode::InvalidScope, msg);
        }

        static WardenError storage(const std::string &msg)
        {
            return WardenError(ErrorCode::StorageUnavailable, msg);
        }

        static WardenError already_exists(const std::string &msg)
        {
            return WardenError(ErrorCode::AlreadyExists, msg);
        }

        static WardenError invalid_input(const std::string &msg)
        {
            return WardenError(ErrorCode::InvalidInput, msg);
        }

        static WardenError forbidden(const std::string &msg)
        {
            return WardenError(ErrorCode::Forbidden, msg);
        }

        static WardenError config(const std::string &msg)
        {
            return WardenError(ErrorCode::ConfigError, msg);
        }
    };

    /**
     * Result type using C++23 std::expected
     */
    template <typename T>
    using Result = std::expected<T, WardenError>;

} // namespace warden
