#pragma once

#include "audit_log.hpp"
#include "event.hpp"
#include "ledger.hpp"
#include "severity.hpp"
#include "types.hpp"
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace warden
{

    /**
     * Auditable operations. Each maps to one fixed event name.
     */
    enum class OperationKind
    {
        // authentication
        Login,
        LoginFailed,
        Logout,
        Registered,
        TokenRefreshed,
        PasswordChanged,
        TokenValidated,

        // catalog mutations
        RoleCreated,
        RoleUpdated,
        RoleDeleted,
        PermissionCreated,
        RolePermissionGranted,
        RolePermissionRevoked,
        UserRoleBound,
        UserRoleUnbound,
        UserPermissionGranted,
        UserPermissionRevoked,
        CatalogSeeded,
        CatalogMutationRolledBack,

        // access decisions
        AccessBypassed,
        AccessDenied,
        AccessGranted,
        ResourceRead,

        // domain writes
        ProjectCreated,
        ProjectUpdated,
        ProjectDeleted,
        ProjectViewed,
        TaskCreated,
        TaskUpdated,
        TaskDeleted,
        TaskViewed,
        ProgressCreated,
        ProgressUpdated,
        ProgressDeleted,

        // ledger maintenance
        LedgerPurged,
        IntegrityViolationDetected
    };

    std::string_view event_name(OperationKind kind);

    /** Severity tier of an operation's event */
    Severity operation_severity(OperationKind kind);

    /**
     * Single entry point for audit emission. Every recorded operation becomes
     * exactly one ledger event whose payload binds the operation name, actor
     * and subject into the hash:
     *
     *   {"operation": name, "actor_id": ..., "subject_id": ..., "details": ...}
     */
    class AuditGateway
    {
    public:
        explicit AuditGateway(std::shared_ptr<Ledger> ledger,
                              std::shared_ptr<AuditLogger> mirror = nullptr);

        Result<Event> record(OperationKind kind,
                             const std::optional<std::string> &actor_id,
                             const std::optional<std::string> &subject_id,
                             const nlohmann::json &details);

        /** One event named "<name>.batch" with details {"items": [...]} */
        Result<Event> record_batch(OperationKind kind,
                                   const std::optional<std::string> &actor_id,
                                   const std::vector<nlohmann::json> &items);

        /**
         * Purge stale events, then record a critical ledger.purged event
         * carrying the purge report.
         */
        Result<PurgeReport> purge_stale(const std::string &actor_id);

        Ledger &ledger() { return *ledger_; }
        const Ledger &ledger() const { return *ledger_; }

    private:
        Result<Event> append(std::string_view name,
                             Severity severity,
                             const std::optional<std::string> &actor_id,
                             const std::optional<std::string> &subject_id,
                             const nlohmann::json &details);

        std::shared_ptr<Ledger> ledger_;
        std::shared_ptr<AuditLogger> mirror_;
    };

} // namespace warden
