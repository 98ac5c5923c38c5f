#pragma once

#include "catalog.hpp"
#include "gateway.hpp"
#include "scope.hpp"
#include "types.hpp"
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace warden
{

    /**
     * How enforce() treats a denial: off allows everything, advisory logs
     * and allows, strict refuses.
     */
    enum class AuthzMode
    {
        Off,
        Advisory,
        Strict
    };

    std::string to_string(AuthzMode mode);
    Result<AuthzMode> authz_mode_from_string(std::string_view s);

    enum class GrantSource
    {
        Role,
        Direct
    };

    std::string to_string(GrantSource source);

    /** Holder of the reserved super-admin role; every check passes */
    struct Bypassed
    {
        std::string role_name;
    };

    struct GrantedBy
    {
        GrantSource source{GrantSource::Role};
        std::optional<std::string> role_name; // role grants
        std::optional<std::string> grant_id;  // direct grants
        std::optional<Scope> scope;           // direct grants
    };

    /** Denial; carries no reason */
    struct Denied
    {
    };

    using AccessDecision = std::variant<Bypassed, GrantedBy, Denied>;

    inline bool is_allowed(const AccessDecision &decision)
    {
        return !std::holds_alternative<Denied>(decision);
    }

    nlohmann::json decision_to_json(const AccessDecision &decision);

    struct EffectivePermission
    {
        std::string permission;
        std::optional<Scope> scope; // empty for role-derived permissions
        GrantSource source{GrantSource::Role};
        std::optional<std::string> role_name;
        std::optional<std::string> grant_id;
    };

    struct EffectivePermissions
    {
        std::string user_id;
        bool super_admin{false};
        std::vector<std::string> roles;
        std::vector<EffectivePermission> permissions;

        nlohmann::json to_json() const;
    };

    struct ResolverOptions
    {
        AuthzMode mode{AuthzMode::Strict};
        std::string super_admin_role{"super_admin"};
    };

    /**
     * Answers access questions against one catalog snapshot per call, and
     * applies audited catalog mutations.
     *
     * Resolution order: super-admin bypass, role-derived permission
     * (unscoped), direct grant whose scope is a subset of the request,
     * otherwise denied.
     */
    class GrantResolver
    {
    public:
        GrantResolver(std::shared_ptr<PermissionCatalog> catalog,
                      std::shared_ptr<AuditGateway> gateway,
                      std::shared_ptr<const UserDirectory> users = nullptr,
                      ResolverOptions options = {});

        AccessDecision decide(const std::string &user_id,
                              const std::string &permission,
                              const Scope &request = {}) const;

        bool is_authorized(const std::string &user_id,
                           const std::string &permission,
                           const Scope &request = {}) const;

        EffectivePermissions effective_permissions(const std::string &user_id) const;

        /**
         * Decide and apply the configured AuthzMode. A value means the caller
         * may proceed; strict denials are Forbidden. Bypasses are recorded
         * as authz.bypassed events.
         */
        Result<AccessDecision> enforce(const std::string &user_id,
                                       const std::string &permission,
                                       const Scope &request = {});

        // Audited catalog mutations. Each records one event and commits.

        Result<Role> create_role(const std::string &actor_id,
                                 const std::string &name,
                                 const std::string &description = {});

        Result<Role> update_role(const std::string &actor_id,
                                 const std::string &role_id,
                                 const std::optional<std::string> &name,
                                 const std::optional<std::string> &description);

        Result<Role> delete_role(const std::string &actor_id, const std::string &role_id);

        Result<Permission> create_permission(const std::string &actor_id,
                                             const std::string &name,
                                             const std::string &description = {});

        Result<void> bind_permission(const std::string &actor_id,
                                     const std::string &role_id,
                                     const std::string &permission_id);

        Result<void> unbind_permission(const std::string &actor_id,
                                       const std::string &role_id,
                                       const std::string &permission_id);

        Result<void> bind_role(const std::string &actor_id,
                               const std::string &user_id,
                               const std::string &role_id);

        Result<void> unbind_role(const std::string &actor_id,
                                 const std::string &user_id,
                                 const std::string &role_id);

        Result<DirectGrant> grant_permission(const std::string &actor_id,
                                             const std::string &user_id,
                                             const std::string &permission_id,
                                             const Scope &scope = {});

        Result<DirectGrant> revoke_permission(const std::string &actor_id, const std::string &grant_id);

        Result<DirectGrant> revoke_permission(const std::string &actor_id,
                                              const std::string &user_id,
                                              const std::string &permission_id,
                                              const Scope &scope);

        /** Seed the default catalog; records one catalog.seeded event if anything was added */
        Result<std::size_t> seed_defaults(const std::string &actor_id);

        const ResolverOptions &options() const { return options_; }

    private:
        Result<void> check_user(const std::string &user_id) const;

        /** Record the mutation event, then commit; compensate if the commit fails */
        Result<void> finish(CatalogTransaction &tx,
                            OperationKind kind,
                            const std::string &actor_id,
                            const std::optional<std::string> &subject_id,
                            const nlohmann::json &details);

        Timestamp now() const;

        std::shared_ptr<PermissionCatalog> catalog_;
        std::shared_ptr<AuditGateway> gateway_;
        std::shared_ptr<const UserDirectory> users_;
        ResolverOptions options_;
    };

} // namespace warden
