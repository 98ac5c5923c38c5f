#include "warden/gateway.hpp"
#include <spdlog/spdlog.h>

namespace warden
{

    using Json = nlohmann::json;

    std::string_view event_name(OperationKind kind)
    {
        switch (kind)
        {
        case OperationKind::Login:
            return "auth.login";
        case OperationKind::LoginFailed:
            return "auth.login_failed";
        case OperationKind::Logout:
            return "auth.logout";
        case OperationKind::Registered:
            return "auth.registered";
        case OperationKind::TokenRefreshed:
            return "auth.token_refreshed";
        case OperationKind::PasswordChanged:
            return "auth.password_changed";
        case OperationKind::TokenValidated:
            return "auth.token_validated";
        case OperationKind::RoleCreated:
            return "role.created";
        case OperationKind::RoleUpdated:
            return "role.updated";
        case OperationKind::RoleDeleted:
            return "role.deleted";
        case OperationKind::PermissionCreated:
            return "permission.created";
        case OperationKind::RolePermissionGranted:
            return "role.permission_granted";
        case OperationKind::RolePermissionRevoked:
            return "role.permission_revoked";
        case OperationKind::UserRoleBound:
            return "user.role_bound";
        case OperationKind::UserRoleUnbound:
            return "user.role_unbound";
        case OperationKind::UserPermissionGranted:
            return "user.permission_granted";
        case OperationKind::UserPermissionRevoked:
            return "user.permission_revoked";
        case OperationKind::CatalogSeeded:
            return "catalog.seeded";
        case OperationKind::CatalogMutationRolledBack:
            return "catalog.mutation_rolled_back";
        case OperationKind::AccessBypassed:
            return "authz.bypassed";
        case OperationKind::AccessDenied:
            return "authz.denied";
        case OperationKind::AccessGranted:
            return "authz.granted";
        case OperationKind::ResourceRead:
            return "resource.read";
        case OperationKind::ProjectCreated:
            return "project.created";
        case OperationKind::ProjectUpdated:
            return "project.updated";
        case OperationKind::ProjectDeleted:
            return "project.deleted";
        case OperationKind::ProjectViewed:
            return "project.viewed";
        case OperationKind::TaskCreated:
            return "task.created";
        case OperationKind::TaskUpdated:
            return "task.updated";
        case OperationKind::TaskDeleted:
            return "task.deleted";
        case OperationKind::TaskViewed:
            return "task.viewed";
        case OperationKind::ProgressCreated:
            return "progress.created";
        case OperationKind::ProgressUpdated:
            return "progress.updated";
        case OperationKind::ProgressDeleted:
            return "progress.deleted";
        case OperationKind::LedgerPurged:
            return "ledger.purged";
        case OperationKind::IntegrityViolationDetected:
            return "ledger.integrity_violation";
        }
        return "unknown";
    }

    Severity operation_severity(OperationKind kind)
    {
        return classify(event_name(kind));
    }

    AuditGateway::AuditGateway(std::shared_ptr<Ledger> ledger, std::shared_ptr<AuditLogger> mirror)
        : ledger_(std::move(ledger)), mirror_(std::move(mirror))
    {
    }

    Result<Event> AuditGateway::append(std::string_view name,
                                       Severity severity,
                                       const std::optional<std::string> &actor_id,
                                       const std::optional<std::string> &subject_id,
                                       const Json &details)
    {
        Json payload = {
            {"operation", std::string(name)},
            {"actor_id", actor_id ? Json(*actor_id) : Json(nullptr)},
            {"subject_id", subject_id ? Json(*subject_id) : Json(nullptr)},
            {"details", details}};

        auto event = ledger_->append(std::string(name), actor_id, subject_id, payload, severity);
        if (!event)
        {
            spdlog::error("audit emission of {} failed: {}", name, event.error().what());
            return event;
        }

        if (mirror_)
            mirror_->log(*event);
        return event;
    }

    Result<Event> AuditGateway::record(OperationKind kind,
                                       const std::optional<std::string> &actor_id,
                                       const std::optional<std::string> &subject_id,
                                       const Json &details)
    {
        return append(event_name(kind), operation_severity(kind), actor_id, subject_id, details);
    }

    Result<Event> AuditGateway::record_batch(OperationKind kind,
                                             const std::optional<std::string> &actor_id,
                                             const std::vector<Json> &items)
    {
        if (items.empty())
            return std::unexpected(WardenError::invalid_input("batch must contain at least one item"));

        std::string name = std::string(event_name(kind)) + ".batch";
        Json details = {{"items", Json(items)}};
        return append(name, classify(name), actor_id, std::nullopt, details);
    }

    Result<PurgeReport> AuditGateway::purge_stale(const std::string &actor_id)
    {
        auto report = ledger_->purge_stale(ledger_->clock().now());
        if (!report)
        {
            const auto &error = report.error();
            if (error.code == ErrorCode::IntegrityViolation)
            {
                Json details = {
                    {"event_id", error.event_id ? Json(*error.event_id) : Json(nullptr)},
                    {"message", error.what()}};
                auto alarm = record(OperationKind::IntegrityViolationDetected, actor_id, error.event_id, details);
                if (!alarm)
                    spdlog::error("failed to record integrity alarm: {}", alarm.error().what());
            }
            return report;
        }

        auto recorded = record(OperationKind::LedgerPurged, actor_id, std::nullopt, report->to_json());
        if (!recorded)
            return std::unexpected(recorded.error());
        return report;
    }

} // namespace warden
