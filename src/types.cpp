#include "warden/types.hpp"

namespace warden
{

    std::string error_code_to_string(ErrorCode code)
    {
        switch (code)
        {
        case ErrorCode::IntegrityViolation:
            return "IntegrityViolation";
        case ErrorCode::ConflictingAppend:
            return "ConflictingAppend";
        case ErrorCode::NotFound:
            return "NotFound";
        case ErrorCode::InvalidScope:
            return "InvalidScope";
        case ErrorCode::StorageUnavailable:
            return "StorageUnavailable";
        case ErrorCode::AlreadyExists:
            return "AlreadyExists";
        case ErrorCode::InvalidInput:
            return "InvalidInput";
        case ErrorCode::Forbidden:
            return "Forbidden";
        case ErrorCode::ConfigError:
            return "ConfigError";
        }
        return "Unknown";
    }

} // namespace warden
