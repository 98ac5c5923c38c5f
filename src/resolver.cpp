#include "warden/resolver.hpp"
#include <algorithm>
#include <format>
#include <spdlog/spdlog.h>
#include <tuple>

namespace warden
{

    using Json = nlohmann::json;

    std::string to_string(AuthzMode mode)
    {
        switch (mode)
        {
        case AuthzMode::Off:
            return "off";
        case AuthzMode::Advisory:
            return "advisory";
        case AuthzMode::Strict:
            return "strict";
        }
        return "strict";
    }

    Result<AuthzMode> authz_mode_from_string(std::string_view s)
    {
        if (s == "off")
            return AuthzMode::Off;
        if (s == "advisory")
            return AuthzMode::Advisory;
        if (s == "strict")
            return AuthzMode::Strict;
        return std::unexpected(WardenError::config(std::format("unknown authz mode: {}", s)));
    }

    std::string to_string(GrantSource source)
    {
        return source == GrantSource::Role ? "role" : "direct";
    }

    namespace
    {
        Json optional_json(const std::optional<std::string> &value)
        {
            return value ? Json(*value) : Json(nullptr);
        }

        struct DecisionJson
        {
            Json operator()(const Bypassed &b) const
            {
                return Json{{"decision", "bypassed"}, {"role_name", b.role_name}};
            }

            Json operator()(const GrantedBy &g) const
            {
                return Json{
                    {"decision", "granted"},
                    {"source", to_string(g.source)},
                    {"role_name", optional_json(g.role_name)},
                    {"grant_id", optional_json(g.grant_id)},
                    {"scope", g.scope ? g.scope->to_json() : Json(nullptr)}};
            }

            Json operator()(const Denied &) const
            {
                return Json{{"decision", "denied"}};
            }
        };
    } // namespace

    Json decision_to_json(const AccessDecision &decision)
    {
        return std::visit(DecisionJson{}, decision);
    }

    Json EffectivePermissions::to_json() const
    {
        Json entries = Json::array();
        for (const auto &p : permissions)
        {
            entries.push_back(Json{
                {"permission", p.permission},
                {"scope", p.scope ? p.scope->to_json() : Json(nullptr)},
                {"source", to_string(p.source)},
                {"role_name", optional_json(p.role_name)},
                {"grant_id", optional_json(p.grant_id)}});
        }
        return Json{
            {"user_id", user_id},
            {"super_admin", super_admin},
            {"roles", roles},
            {"permissions", entries}};
    }

    GrantResolver::GrantResolver(std::shared_ptr<PermissionCatalog> catalog,
                                 std::shared_ptr<AuditGateway> gateway,
                                 std::shared_ptr<const UserDirectory> users,
                                 ResolverOptions options)
        : catalog_(std::move(catalog)),
          gateway_(std::move(gateway)),
          users_(std::move(users)),
          options_(std::move(options))
    {
    }

    // ---------------------------------------------------------------------
    // Decisions
    // ---------------------------------------------------------------------

    AccessDecision GrantResolver::decide(const std::string &user_id,
                                         const std::string &permission,
                                         const Scope &request) const
    {
        auto state = catalog_->snapshot();
        auto roles = state->user_roles(user_id);

        for (const auto &role : roles)
        {
            if (role.name == options_.super_admin_role)
            {
                spdlog::debug("authz {} {}: bypassed via {}", user_id, permission, role.name);
                return Bypassed{role.name};
            }
        }

        for (const auto &role : roles)
        {
            for (const auto &granted : state->role_permissions(role.id))
            {
                if (granted.name == permission)
                {
                    spdlog::debug("authz {} {}: granted by role {}", user_id, permission, role.name);
                    return GrantedBy{GrantSource::Role, role.name, std::nullopt, std::nullopt};
                }
            }
        }

        if (auto target = state->find_permission_by_name(permission))
        {
            for (const auto &grant : state->user_grants(user_id))
            {
                if (grant.permission_id == target->id && grant.scope.matches(request))
                {
                    spdlog::debug("authz {} {}: granted directly by {}", user_id, permission, grant.id);
                    return GrantedBy{GrantSource::Direct, std::nullopt, grant.id, grant.scope};
                }
            }
        }

        spdlog::debug("authz {} {}: denied", user_id, permission);
        return Denied{};
    }

    bool GrantResolver::is_authorized(const std::string &user_id,
                                      const std::string &permission,
                                      const Scope &request) const
    {
        return is_allowed(decide(user_id, permission, request));
    }

    EffectivePermissions GrantResolver::effective_permissions(const std::string &user_id) const
    {
        auto state = catalog_->snapshot();

        EffectivePermissions out;
        out.user_id = user_id;
        for (const auto &role : state->user_roles(user_id))
        {
            out.roles.push_back(role.name);
            if (role.name == options_.super_admin_role)
                out.super_admin = true;
            for (const auto &permission : state->role_permissions(role.id))
                out.permissions.push_back({permission.name, std::nullopt, GrantSource::Role, role.name, std::nullopt});
        }

        for (const auto &grant : state->user_grants(user_id))
        {
            auto permission = state->find_permission(grant.permission_id);
            if (!permission)
                continue;
            out.permissions.push_back({permission->name, grant.scope, GrantSource::Direct, std::nullopt, grant.id});
        }

        std::sort(out.roles.begin(), out.roles.end());
        std::sort(out.permissions.begin(), out.permissions.end(),
                  [](const EffectivePermission &a, const EffectivePermission &b)
                  {
                      return std::tie(a.permission, a.source, a.role_name, a.grant_id) <
                             std::tie(b.permission, b.source, b.role_name, b.grant_id);
                  });
        return out;
    }

    Result<AccessDecision> GrantResolver::enforce(const std::string &user_id,
                                                  const std::string &permission,
                                                  const Scope &request)
    {
        auto decision = decide(user_id, permission, request);

        if (const auto *bypass = std::get_if<Bypassed>(&decision))
        {
            Json details = {
                {"permission", permission},
                {"scope", request.to_json()},
                {"role_name", bypass->role_name}};
            auto recorded = gateway_->record(OperationKind::AccessBypassed, user_id, std::nullopt, details);
            if (!recorded)
                return std::unexpected(recorded.error());
            return decision;
        }

        if (!std::holds_alternative<Denied>(decision))
            return decision;

        switch (options_.mode)
        {
        case AuthzMode::Off:
            return decision;
        case AuthzMode::Advisory:
            spdlog::warn("authz advisory: {} lacks {} for scope {}", user_id, permission, request.to_text());
            return decision;
        case AuthzMode::Strict:
            break;
        }
        return std::unexpected(WardenError::forbidden(std::format("permission denied: {}", permission)));
    }

    // ---------------------------------------------------------------------
    // Mutations
    // ---------------------------------------------------------------------

    Timestamp GrantResolver::now() const
    {
        return gateway_->ledger().clock().now();
    }

    Result<void> GrantResolver::check_user(const std::string &user_id) const
    {
        if (users_ && !users_->exists(user_id))
            return std::unexpected(WardenError::not_found("user not found: " + user_id));
        return {};
    }

    Result<void> GrantResolver::finish(CatalogTransaction &tx,
                                       OperationKind kind,
                                       const std::string &actor_id,
                                       const std::optional<std::string> &subject_id,
                                       const Json &details)
    {
        auto event = gateway_->record(kind, actor_id, subject_id, details);
        if (!event)
            return std::unexpected(event.error());

        auto committed = tx.commit();
        if (committed)
            return {};

        Json compensation = {
            {"original_event_id", event->id},
            {"operation", std::string(event_name(kind))},
            {"reason", committed.error().what()}};
        auto rolled_back = gateway_->record(OperationKind::CatalogMutationRolledBack, actor_id, subject_id, compensation);
        if (!rolled_back)
        {
            spdlog::error("failed to record rollback of event {}: {}", event->id, rolled_back.error().what());
        }
        return std::unexpected(committed.error());
    }

    Result<Role> GrantResolver::create_role(const std::string &actor_id,
                                            const std::string &name,
                                            const std::string &description)
    {
        auto opened = catalog_->begin();
        if (!opened)
            return std::unexpected(opened.error());
        auto &tx = *opened;
        auto role = tx.state().create_role(name, description, now());
        if (!role)
            return std::unexpected(role.error());

        auto done = finish(tx, OperationKind::RoleCreated, actor_id, role->id,
                           Json{{"after", role->to_json()}});
        if (!done)
            return std::unexpected(done.error());
        return role;
    }

    Result<Role> GrantResolver::update_role(const std::string &actor_id,
                                            const std::string &role_id,
                                            const std::optional<std::string> &name,
                                            const std::optional<std::string> &description)
    {
        auto opened = catalog_->begin();
        if (!opened)
            return std::unexpected(opened.error());
        auto &tx = *opened;
        auto before = tx.state().find_role(role_id);
        auto role = tx.state().update_role(role_id, name, description, now());
        if (!role)
            return std::unexpected(role.error());

        auto done = finish(tx, OperationKind::RoleUpdated, actor_id, role->id,
                           Json{{"before", before->to_json()}, {"after", role->to_json()}});
        if (!done)
            return std::unexpected(done.error());
        return role;
    }

    Result<Role> GrantResolver::delete_role(const std::string &actor_id, const std::string &role_id)
    {
        auto opened = catalog_->begin();
        if (!opened)
            return std::unexpected(opened.error());
        auto &tx = *opened;
        auto role = tx.state().delete_role(role_id);
        if (!role)
            return std::unexpected(role.error());

        auto done = finish(tx, OperationKind::RoleDeleted, actor_id, role->id,
                           Json{{"before", role->to_json()}});
        if (!done)
            return std::unexpected(done.error());
        return role;
    }

    Result<Permission> GrantResolver::create_permission(const std::string &actor_id,
                                                        const std::string &name,
                                                        const std::string &description)
    {
        auto opened = catalog_->begin();
        if (!opened)
            return std::unexpected(opened.error());
        auto &tx = *opened;
        auto permission = tx.state().create_permission(name, description, now());
        if (!permission)
            return std::unexpected(permission.error());

        auto done = finish(tx, OperationKind::PermissionCreated, actor_id, permission->id,
                           Json{{"after", permission->to_json()}});
        if (!done)
            return std::unexpected(done.error());
        return permission;
    }

    Result<void> GrantResolver::bind_permission(const std::string &actor_id,
                                                const std::string &role_id,
                                                const std::string &permission_id)
    {
        auto opened = catalog_->begin();
        if (!opened)
            return std::unexpected(opened.error());
        auto &tx = *opened;
        auto bound = tx.state().bind_permission(role_id, permission_id);
        if (!bound)
            return bound;

        return finish(tx, OperationKind::RolePermissionGranted, actor_id, role_id,
                      Json{{"role_id", role_id}, {"permission_id", permission_id}});
    }

    Result<void> GrantResolver::unbind_permission(const std::string &actor_id,
                                                  const std::string &role_id,
                                                  const std::string &permission_id)
    {
        auto opened = catalog_->begin();
        if (!opened)
            return std::unexpected(opened.error());
        auto &tx = *opened;
        auto unbound = tx.state().unbind_permission(role_id, permission_id);
        if (!unbound)
            return unbound;

        return finish(tx, OperationKind::RolePermissionRevoked, actor_id, role_id,
                      Json{{"role_id", role_id}, {"permission_id", permission_id}});
    }

    Result<void> GrantResolver::bind_role(const std::string &actor_id,
                                          const std::string &user_id,
                                          const std::string &role_id)
    {
        auto user = check_user(user_id);
        if (!user)
            return user;

        auto opened = catalog_->begin();
        if (!opened)
            return std::unexpected(opened.error());
        auto &tx = *opened;
        auto bound = tx.state().bind_role(user_id, role_id);
        if (!bound)
            return bound;

        return finish(tx, OperationKind::UserRoleBound, actor_id, user_id,
                      Json{{"user_id", user_id}, {"role_id", role_id}});
    }

    Result<void> GrantResolver::unbind_role(const std::string &actor_id,
                                            const std::string &user_id,
                                            const std::string &role_id)
    {
        auto opened = catalog_->begin();
        if (!opened)
            return std::unexpected(opened.error());
        auto &tx = *opened;
        auto unbound = tx.state().unbind_role(user_id, role_id);
        if (!unbound)
            return unbound;

        return finish(tx, OperationKind::UserRoleUnbound, actor_id, user_id,
                      Json{{"user_id", user_id}, {"role_id", role_id}});
    }

    Result<DirectGrant> GrantResolver::grant_permission(const std::string &actor_id,
                                                        const std::string &user_id,
                                                        const std::string &permission_id,
                                                        const Scope &scope)
    {
        auto user = check_user(user_id);
        if (!user)
            return std::unexpected(user.error());

        auto opened = catalog_->begin();
        if (!opened)
            return std::unexpected(opened.error());
        auto &tx = *opened;
        auto grant = tx.state().grant_permission(user_id, permission_id, scope, now());
        if (!grant)
            return grant;

        auto done = finish(tx, OperationKind::UserPermissionGranted, actor_id, user_id,
                           Json{{"after", grant->to_json()}});
        if (!done)
            return std::unexpected(done.error());
        return grant;
    }

    Result<DirectGrant> GrantResolver::revoke_permission(const std::string &actor_id, const std::string &grant_id)
    {
        auto opened = catalog_->begin();
        if (!opened)
            return std::unexpected(opened.error());
        auto &tx = *opened;
        auto grant = tx.state().revoke_grant(grant_id);
        if (!grant)
            return grant;

        auto done = finish(tx, OperationKind::UserPermissionRevoked, actor_id, grant->user_id,
                           Json{{"before", grant->to_json()}});
        if (!done)
            return std::unexpected(done.error());
        return grant;
    }

    Result<DirectGrant> GrantResolver::revoke_permission(const std::string &actor_id,
                                                         const std::string &user_id,
                                                         const std::string &permission_id,
                                                         const Scope &scope)
    {
        auto opened = catalog_->begin();
        if (!opened)
            return std::unexpected(opened.error());
        auto &tx = *opened;
        auto grant = tx.state().revoke_permission(user_id, permission_id, scope);
        if (!grant)
            return grant;

        auto done = finish(tx, OperationKind::UserPermissionRevoked, actor_id, user_id,
                           Json{{"before", grant->to_json()}});
        if (!done)
            return std::unexpected(done.error());
        return grant;
    }

    Result<std::size_t> GrantResolver::seed_defaults(const std::string &actor_id)
    {
        auto opened = catalog_->begin();
        if (!opened)
            return std::unexpected(opened.error());
        auto &tx = *opened;
        auto created = warden::seed_defaults(tx.state(), now());
        if (!created)
            return created;
        if (*created == 0)
            return created;

        auto done = finish(tx, OperationKind::CatalogSeeded, actor_id, std::nullopt,
                           Json{{"records_created", *created}});
        if (!done)
            return std::unexpected(done.error());
        return created;
    }

} // namespace warden
