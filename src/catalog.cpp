#include "warden/catalog.hpp"
#include "warden/crypto.hpp"
#include <algorithm>
#include <format>
#include <spdlog/spdlog.h>

namespace warden
{

    using Json = nlohmann::json;

    namespace
    {
        Result<Timestamp> read_time(const Json &j, const char *key)
        {
            return parse_iso8601(j.at(key).get<std::string>());
        }

        std::string description_of(const Json &j)
        {
            if (!j.contains("description") || j["description"].is_null())
                return {};
            return j["description"].get<std::string>();
        }

        bool is_segment_char(char c)
        {
            return (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '_';
        }
    } // namespace

    // ---------------------------------------------------------------------
    // Records
    // ---------------------------------------------------------------------

    Json Role::to_json() const
    {
        return Json{
            {"id", id},
            {"name", name},
            {"description", description},
            {"created_at", format_iso8601(created_at)},
            {"updated_at", format_iso8601(updated_at)}};
    }

    Result<Role> Role::from_json(const Json &j)
    {
        try
        {
            Role role;
            role.id = j.at("id").get<std::string>();
            role.name = j.at("name").get<std::string>();
            role.description = description_of(j);
            auto created = read_time(j, "created_at");
            if (!created)
                return std::unexpected(created.error());
            auto updated = read_time(j, "updated_at");
            if (!updated)
                return std::unexpected(updated.error());
            role.created_at = *created;
            role.updated_at = *updated;
            return role;
        }
        catch (const Json::exception &e)
        {
            return std::unexpected(WardenError::invalid_input(
                std::format("Failed to parse Role: {}", e.what())));
        }
    }

    Json Permission::to_json() const
    {
        return Json{
            {"id", id},
            {"name", name},
            {"description", description},
            {"created_at", format_iso8601(created_at)},
            {"updated_at", format_iso8601(updated_at)}};
    }

    Result<Permission> Permission::from_json(const Json &j)
    {
        try
        {
            Permission permission;
            permission.id = j.at("id").get<std::string>();
            permission.name = j.at("name").get<std::string>();
            permission.description = description_of(j);
            auto created = read_time(j, "created_at");
            if (!created)
                return std::unexpected(created.error());
            auto updated = read_time(j, "updated_at");
            if (!updated)
                return std::unexpected(updated.error());
            permission.created_at = *created;
            permission.updated_at = *updated;
            return permission;
        }
        catch (const Json::exception &e)
        {
            return std::unexpected(WardenError::invalid_input(
                std::format("Failed to parse Permission: {}", e.what())));
        }
    }

    Json DirectGrant::to_json() const
    {
        return Json{
            {"id", id},
            {"user_id", user_id},
            {"permission_id", permission_id},
            {"scope", scope.to_json()},
            {"created_at", format_iso8601(created_at)}};
    }

    Result<DirectGrant> DirectGrant::from_json(const Json &j)
    {
        try
        {
            DirectGrant grant;
            grant.id = j.at("id").get<std::string>();
            grant.user_id = j.at("user_id").get<std::string>();
            grant.permission_id = j.at("permission_id").get<std::string>();
            auto scope = Scope::parse(j.contains("scope") ? j["scope"] : Json());
            if (!scope)
                return std::unexpected(scope.error());
            grant.scope = std::move(*scope);
            auto created = read_time(j, "created_at");
            if (!created)
                return std::unexpected(created.error());
            grant.created_at = *created;
            return grant;
        }
        catch (const Json::exception &e)
        {
            return std::unexpected(WardenError::invalid_input(
                std::format("Failed to parse DirectGrant: {}", e.what())));
        }
    }

    bool is_valid_permission_name(std::string_view name)
    {
        std::size_t segments = 0;
        std::size_t start = 0;
        while (true)
        {
            auto dot = name.find('.', start);
            auto segment = name.substr(start, dot == std::string_view::npos ? std::string_view::npos : dot - start);
            if (segment.empty() || !std::all_of(segment.begin(), segment.end(), is_segment_char))
                return false;
            ++segments;
            if (dot == std::string_view::npos)
                break;
            start = dot + 1;
        }
        return segments >= 2;
    }

    // ---------------------------------------------------------------------
    // CatalogState mutators
    // ---------------------------------------------------------------------

    Result<Role> CatalogState::create_role(const std::string &name,
                                           const std::string &description,
                                           Timestamp now,
                                           std::optional<std::string> id)
    {
        if (name.empty())
            return std::unexpected(WardenError::invalid_input("role name must not be empty"));
        if (find_role_by_name(name))
            return std::unexpected(WardenError::already_exists("role already exists: " + name));

        Role role{id.value_or(crypto::uuid_v4()), name, description, now, now};
        if (roles_.contains(role.id))
            return std::unexpected(WardenError::already_exists("role id already in use: " + role.id));

        roles_.emplace(role.id, role);
        return role;
    }

    Result<Role> CatalogState::update_role(const std::string &role_id,
                                           const std::optional<std::string> &name,
                                           const std::optional<std::string> &description,
                                           Timestamp now)
    {
        auto it = roles_.find(role_id);
        if (it == roles_.end())
            return std::unexpected(WardenError::not_found("role not found: " + role_id));

        if (name)
        {
            if (name->empty())
                return std::unexpected(WardenError::invalid_input("role name must not be empty"));
            auto existing = find_role_by_name(*name);
            if (existing && existing->id != role_id)
                return std::unexpected(WardenError::already_exists("role already exists: " + *name));
            it->second.name = *name;
        }
        if (description)
            it->second.description = *description;
        it->second.updated_at = now;
        return it->second;
    }

    Result<Role> CatalogState::delete_role(const std::string &role_id)
    {
        auto it = roles_.find(role_id);
        if (it == roles_.end())
            return std::unexpected(WardenError::not_found("role not found: " + role_id));

        Role removed = it->second;
        roles_.erase(it);
        std::erase_if(role_bindings_, [&](const RoleBinding &b)
                      { return b.role_id == role_id; });
        std::erase_if(permission_bindings_, [&](const PermissionBinding &b)
                      { return b.role_id == role_id; });
        return removed;
    }

    Result<Permission> CatalogState::create_permission(const std::string &name,
                                                       const std::string &description,
                                                       Timestamp now,
                                                       std::optional<std::string> id)
    {
        if (!is_valid_permission_name(name))
        {
            return std::unexpected(WardenError::invalid_input(
                "permission name must follow resource.action: " + name));
        }
        if (find_permission_by_name(name))
            return std::unexpected(WardenError::already_exists("permission already exists: " + name));

        Permission permission{id.value_or(crypto::uuid_v4()), name, description, now, now};
        if (permissions_.contains(permission.id))
            return std::unexpected(WardenError::already_exists("permission id already in use: " + permission.id));

        permissions_.emplace(permission.id, permission);
        return permission;
    }

    Result<void> CatalogState::bind_permission(const std::string &role_id, const std::string &permission_id)
    {
        if (!roles_.contains(role_id))
            return std::unexpected(WardenError::not_found("role not found: " + role_id));
        if (!permissions_.contains(permission_id))
            return std::unexpected(WardenError::not_found("permission not found: " + permission_id));

        if (!permission_bindings_.insert(PermissionBinding{role_id, permission_id}).second)
        {
            return std::unexpected(WardenError::already_exists(std::format(
                "permission {} already bound to role {}", permission_id, role_id)));
        }
        return {};
    }

    Result<void> CatalogState::unbind_permission(const std::string &role_id, const std::string &permission_id)
    {
        if (permission_bindings_.erase(PermissionBinding{role_id, permission_id}) == 0)
        {
            return std::unexpected(WardenError::not_found(std::format(
                "permission {} is not bound to role {}", permission_id, role_id)));
        }
        return {};
    }

    Result<void> CatalogState::bind_role(const std::string &user_id, const std::string &role_id)
    {
        if (user_id.empty())
            return std::unexpected(WardenError::invalid_input("user id must not be empty"));
        if (!roles_.contains(role_id))
            return std::unexpected(WardenError::not_found("role not found: " + role_id));

        if (!role_bindings_.insert(RoleBinding{user_id, role_id}).second)
        {
            return std::unexpected(WardenError::already_exists(std::format(
                "user {} already holds role {}", user_id, role_id)));
        }
        return {};
    }

    Result<void> CatalogState::unbind_role(const std::string &user_id, const std::string &role_id)
    {
        if (role_bindings_.erase(RoleBinding{user_id, role_id}) == 0)
        {
            return std::unexpected(WardenError::not_found(std::format(
                "user {} does not hold role {}", user_id, role_id)));
        }
        return {};
    }

    Result<DirectGrant> CatalogState::grant_permission(const std::string &user_id,
                                                       const std::string &permission_id,
                                                       const Scope &scope,
                                                       Timestamp now,
                                                       std::optional<std::string> id)
    {
        if (user_id.empty())
            return std::unexpected(WardenError::invalid_input("user id must not be empty"));
        if (!permissions_.contains(permission_id))
            return std::unexpected(WardenError::not_found("permission not found: " + permission_id));

        for (const auto &[_, grant] : grants_)
        {
            if (grant.user_id == user_id && grant.permission_id == permission_id && grant.scope == scope)
            {
                return std::unexpected(WardenError::already_exists(std::format(
                    "user {} already holds permission {} with scope {}",
                    user_id, permission_id, scope.to_text())));
            }
        }

        DirectGrant grant{id.value_or(crypto::uuid_v4()), user_id, permission_id, scope, now};
        if (grants_.contains(grant.id))
            return std::unexpected(WardenError::already_exists("grant id already in use: " + grant.id));

        grants_.emplace(grant.id, grant);
        return grant;
    }

    Result<DirectGrant> CatalogState::revoke_grant(const std::string &grant_id)
    {
        auto it = grants_.find(grant_id);
        if (it == grants_.end())
            return std::unexpected(WardenError::not_found("grant not found: " + grant_id));

        DirectGrant removed = it->second;
        grants_.erase(it);
        return removed;
    }

    Result<DirectGrant> CatalogState::revoke_permission(const std::string &user_id,
                                                        const std::string &permission_id,
                                                        const Scope &scope)
    {
        for (auto it = grants_.begin(); it != grants_.end(); ++it)
        {
            const auto &grant = it->second;
            if (grant.user_id == user_id && grant.permission_id == permission_id && grant.scope == scope)
            {
                DirectGrant removed = grant;
                grants_.erase(it);
                return removed;
            }
        }
        return std::unexpected(WardenError::not_found(std::format(
            "user {} holds no grant of {} with scope {}",
            user_id, permission_id, scope.to_text())));
    }

    // ---------------------------------------------------------------------
    // CatalogState lookups
    // ---------------------------------------------------------------------

    std::optional<Role> CatalogState::find_role(std::string_view role_id) const
    {
        auto it = roles_.find(role_id);
        if (it == roles_.end())
            return std::nullopt;
        return it->second;
    }

    std::optional<Role> CatalogState::find_role_by_name(std::string_view name) const
    {
        for (const auto &[_, role] : roles_)
        {
            if (role.name == name)
                return role;
        }
        return std::nullopt;
    }

    std::optional<Permission> CatalogState::find_permission(std::string_view permission_id) const
    {
        auto it = permissions_.find(permission_id);
        if (it == permissions_.end())
            return std::nullopt;
        return it->second;
    }

    std::optional<Permission> CatalogState::find_permission_by_name(std::string_view name) const
    {
        for (const auto &[_, permission] : permissions_)
        {
            if (permission.name == name)
                return permission;
        }
        return std::nullopt;
    }

    std::optional<DirectGrant> CatalogState::find_grant(std::string_view grant_id) const
    {
        auto it = grants_.find(grant_id);
        if (it == grants_.end())
            return std::nullopt;
        return it->second;
    }

    std::vector<Permission> CatalogState::role_permissions(std::string_view role_id) const
    {
        std::vector<Permission> out;
        for (const auto &binding : permission_bindings_)
        {
            if (binding.role_id != role_id)
                continue;
            if (auto it = permissions_.find(binding.permission_id); it != permissions_.end())
                out.push_back(it->second);
        }
        return out;
    }

    std::vector<Role> CatalogState::user_roles(std::string_view user_id) const
    {
        std::vector<Role> out;
        for (const auto &binding : role_bindings_)
        {
            if (binding.user_id != user_id)
                continue;
            if (auto it = roles_.find(binding.role_id); it != roles_.end())
                out.push_back(it->second);
        }
        return out;
    }

    std::vector<DirectGrant> CatalogState::user_grants(std::string_view user_id) const
    {
        std::vector<DirectGrant> out;
        for (const auto &[_, grant] : grants_)
        {
            if (grant.user_id == user_id)
                out.push_back(grant);
        }
        return out;
    }

    std::vector<Role> CatalogState::roles() const
    {
        std::vector<Role> out;
        out.reserve(roles_.size());
        for (const auto &[_, role] : roles_)
            out.push_back(role);
        return out;
    }

    std::vector<Permission> CatalogState::permissions() const
    {
        std::vector<Permission> out;
        out.reserve(permissions_.size());
        for (const auto &[_, permission] : permissions_)
            out.push_back(permission);
        return out;
    }

    bool CatalogState::has_role_binding(std::string_view user_id, std::string_view role_id) const
    {
        return role_bindings_.contains(RoleBinding{std::string(user_id), std::string(role_id)});
    }

    bool CatalogState::has_permission_binding(std::string_view role_id, std::string_view permission_id) const
    {
        return permission_bindings_.contains(PermissionBinding{std::string(role_id), std::string(permission_id)});
    }

    // ---------------------------------------------------------------------
    // CatalogState persistence
    // ---------------------------------------------------------------------

    Json CatalogState::to_json() const
    {
        Json roles = Json::array();
        for (const auto &[_, role] : roles_)
            roles.push_back(role.to_json());

        Json permissions = Json::array();
        for (const auto &[_, permission] : permissions_)
            permissions.push_back(permission.to_json());

        Json role_permissions = Json::array();
        for (const auto &b : permission_bindings_)
            role_permissions.push_back(Json{{"role_id", b.role_id}, {"permission_id", b.permission_id}});

        Json user_roles = Json::array();
        for (const auto &b : role_bindings_)
            user_roles.push_back(Json{{"user_id", b.user_id}, {"role_id", b.role_id}});

        Json user_permissions = Json::array();
        for (const auto &[_, grant] : grants_)
            user_permissions.push_back(grant.to_json());

        return Json{
            {"revision", revision_},
            {"roles", roles},
            {"permissions", permissions},
            {"role_permissions", role_permissions},
            {"user_roles", user_roles},
            {"user_permissions", user_permissions}};
    }

    Result<CatalogState> CatalogState::from_json(const Json &j)
    {
        try
        {
            CatalogState state;
            if (j.contains("revision"))
                state.revision_ = j.at("revision").get<std::uint64_t>();
            for (const auto &item : j.at("roles"))
            {
                auto role = Role::from_json(item);
                if (!role)
                    return std::unexpected(role.error());
                state.roles_.emplace(role->id, std::move(*role));
            }
            for (const auto &item : j.at("permissions"))
            {
                auto permission = Permission::from_json(item);
                if (!permission)
                    return std::unexpected(permission.error());
                state.permissions_.emplace(permission->id, std::move(*permission));
            }
            for (const auto &item : j.at("role_permissions"))
            {
                state.permission_bindings_.insert(PermissionBinding{
                    item.at("role_id").get<std::string>(),
                    item.at("permission_id").get<std::string>()});
            }
            for (const auto &item : j.at("user_roles"))
            {
                state.role_bindings_.insert(RoleBinding{
                    item.at("user_id").get<std::string>(),
                    item.at("role_id").get<std::string>()});
            }
            for (const auto &item : j.at("user_permissions"))
            {
                auto grant = DirectGrant::from_json(item);
                if (!grant)
                    return std::unexpected(grant.error());
                state.grants_.emplace(grant->id, std::move(*grant));
            }
            return state;
        }
        catch (const Json::exception &e)
        {
            return std::unexpected(WardenError::invalid_input(
                std::format("Failed to parse catalog: {}", e.what())));
        }
    }

    // ---------------------------------------------------------------------
    // Seed data
    // ---------------------------------------------------------------------

    namespace
    {
        struct SeedRecord
        {
            const char *id;
            const char *name;
            const char *description;
        };

        constexpr SeedRecord kSeedRoles[] = {
            {"00000000-0000-0000-0000-000000000001", "super_admin", "Full system access, bypasses all permission checks"},
            {"00000000-0000-0000-0000-000000000002", "admin", "Administrative access to manage users, roles, and settings"},
            {"00000000-0000-0000-0000-000000000003", "project_manager", "Can create and manage projects and tasks"},
            {"00000000-0000-0000-0000-000000000004", "member", "Standard user with access to assigned projects"},
            {"00000000-0000-0000-0000-000000000005", "viewer", "Read-only access to assigned projects"},
        };

        constexpr SeedRecord kSeedPermissions[] = {
            {"10000000-0000-0000-0000-000000000001", "project.create", "Create new projects"},
            {"10000000-0000-0000-0000-000000000002", "project.view", "View project details"},
            {"10000000-0000-0000-0000-000000000003", "project.update", "Modify project settings"},
            {"10000000-0000-0000-0000-000000000004", "project.delete", "Delete projects"},
            {"10000000-0000-0000-0000-000000000011", "task.create", "Create tasks in a project"},
            {"10000000-0000-0000-0000-000000000012", "task.view", "View task details"},
            {"10000000-0000-0000-0000-000000000013", "task.update", "Update tasks"},
            {"10000000-0000-0000-0000-000000000014", "task.delete", "Delete tasks"},
            {"10000000-0000-0000-0000-000000000021", "progress.create", "Log progress on tasks"},
            {"10000000-0000-0000-0000-000000000022", "progress.view", "View progress history"},
            {"10000000-0000-0000-0000-000000000031", "user.view", "View user profiles"},
            {"10000000-0000-0000-0000-000000000032", "user.manage", "Manage user accounts"},
            {"10000000-0000-0000-0000-000000000041", "role.view", "View roles"},
            {"10000000-0000-0000-0000-000000000042", "role.manage", "Create/edit/delete roles"},
            {"10000000-0000-0000-0000-000000000043", "permission.view", "View permissions"},
            {"10000000-0000-0000-0000-000000000044", "permission.manage", "Manage permission assignments"},
        };

        struct SeedBinding
        {
            const char *role;
            const char *permission;
        };

        constexpr SeedBinding kSeedBindings[] = {
            // admin: user and RBAC management
            {"admin", "user.view"},
            {"admin", "user.manage"},
            {"admin", "role.view"},
            {"admin", "role.manage"},
            {"admin", "permission.view"},
            {"admin", "permission.manage"},
            // project_manager: full project and task access
            {"project_manager", "project.create"},
            {"project_manager", "project.view"},
            {"project_manager", "project.update"},
            {"project_manager", "project.delete"},
            {"project_manager", "task.create"},
            {"project_manager", "task.view"},
            {"project_manager", "task.update"},
            {"project_manager", "task.delete"},
            {"project_manager", "progress.create"},
            {"project_manager", "progress.view"},
            // member: view and modify, no delete
            {"member", "project.view"},
            {"member", "project.update"},
            {"member", "task.view"},
            {"member", "task.update"},
            {"member", "task.create"},
            {"member", "progress.create"},
            {"member", "progress.view"},
            // viewer: read-only
            {"viewer", "project.view"},
            {"viewer", "task.view"},
            {"viewer", "progress.view"},
        };
    } // namespace

    Result<std::size_t> seed_defaults(CatalogState &state, Timestamp now)
    {
        std::size_t created = 0;

        for (const auto &seed : kSeedRoles)
        {
            if (state.find_role(seed.id) || state.find_role_by_name(seed.name))
                continue;
            auto role = state.create_role(seed.name, seed.description, now, std::string(seed.id));
            if (!role)
                return std::unexpected(role.error());
            ++created;
        }

        for (const auto &seed : kSeedPermissions)
        {
            if (state.find_permission(seed.id) || state.find_permission_by_name(seed.name))
                continue;
            auto permission = state.create_permission(seed.name, seed.description, now, std::string(seed.id));
            if (!permission)
                return std::unexpected(permission.error());
            ++created;
        }

        for (const auto &seed : kSeedBindings)
        {
            auto role = state.find_role_by_name(seed.role);
            auto permission = state.find_permission_by_name(seed.permission);
            if (!role || !permission)
            {
                return std::unexpected(WardenError::not_found(std::format(
                    "seed binding {} -> {} has no target", seed.role, seed.permission)));
            }
            if (state.has_permission_binding(role->id, permission->id))
                continue;
            auto bound = state.bind_permission(role->id, permission->id);
            if (!bound)
                return std::unexpected(bound.error());
            ++created;
        }

        return created;
    }

    // ---------------------------------------------------------------------
    // PermissionCatalog / CatalogTransaction
    // ---------------------------------------------------------------------

    CatalogTransaction::CatalogTransaction(PermissionCatalog &catalog, std::unique_lock<std::mutex> lock)
        : catalog_(&catalog), lock_(std::move(lock)), state_(*catalog.snapshot())
    {
    }

    Result<void> CatalogTransaction::commit()
    {
        if (committed_ || !lock_.owns_lock())
            return std::unexpected(WardenError::invalid_input("catalog transaction is no longer active"));

        std::uint64_t base = state_.revision_;
        state_.revision_ = base + 1;
        if (catalog_->store_)
        {
            auto saved = catalog_->store_->save(state_, base);
            if (!saved)
            {
                state_.revision_ = base;
                spdlog::error("catalog commit failed: {}", saved.error().what());
                return std::unexpected(saved.error());
            }
        }

        catalog_->publish(std::make_shared<const CatalogState>(std::move(state_)));
        committed_ = true;
        lock_.unlock();
        return {};
    }

    PermissionCatalog::PermissionCatalog(std::shared_ptr<CatalogStore> store)
        : store_(std::move(store)), current_(std::make_shared<const CatalogState>())
    {
    }

    std::shared_ptr<const CatalogState> PermissionCatalog::snapshot() const
    {
        std::shared_lock lock(snapshot_mutex_);
        return current_;
    }

    Result<CatalogTransaction> PermissionCatalog::begin()
    {
        std::unique_lock<std::mutex> writer(writer_mutex_);
        if (store_)
        {
            auto loaded = store_->load();
            if (!loaded)
                return std::unexpected(loaded.error());
            if (*loaded && (*loaded)->revision() != snapshot()->revision())
            {
                spdlog::debug("catalog refreshed to revision {}", (*loaded)->revision());
                publish(std::make_shared<const CatalogState>(std::move(**loaded)));
            }
        }
        return CatalogTransaction(*this, std::move(writer));
    }

    Result<void> PermissionCatalog::reload()
    {
        if (!store_)
            return {};

        std::unique_lock writer(writer_mutex_);
        auto loaded = store_->load();
        if (!loaded)
            return std::unexpected(loaded.error());
        if (*loaded)
            publish(std::make_shared<const CatalogState>(std::move(**loaded)));
        return {};
    }

    void PermissionCatalog::publish(std::shared_ptr<const CatalogState> state)
    {
        std::unique_lock lock(snapshot_mutex_);
        current_ = std::move(state);
    }

    // ---------------------------------------------------------------------
    // StaticUserDirectory
    // ---------------------------------------------------------------------

    StaticUserDirectory::StaticUserDirectory(std::unordered_set<std::string> users)
        : users_(std::move(users))
    {
    }

    void StaticUserDirectory::add(std::string user_id)
    {
        std::unique_lock lock(mutex_);
        users_.insert(std::move(user_id));
    }

    bool StaticUserDirectory::exists(std::string_view user_id) const
    {
        std::shared_lock lock(mutex_);
        return users_.contains(std::string(user_id));
    }

} // namespace warden
