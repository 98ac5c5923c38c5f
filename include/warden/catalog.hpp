#pragma once

#include "clock.hpp"
#include "scope.hpp"
#include "types.hpp"
#include <compare>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <set>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace warden
{

    struct Role
    {
        std::string id;
        std::string name;
        std::string description;
        Timestamp created_at{};
        Timestamp updated_at{};

        nlohmann::json to_json() const;
        static Result<Role> from_json(const nlohmann::json &j);
    };

    /** Named capability following the resource.action convention */
    struct Permission
    {
        std::string id;
        std::string name;
        std::string description;
        Timestamp created_at{};
        Timestamp updated_at{};

        nlohmann::json to_json() const;
        static Result<Permission> from_json(const nlohmann::json &j);
    };

    struct RoleBinding
    {
        std::string user_id;
        std::string role_id;

        auto operator<=>(const RoleBinding &) const = default;
    };

    struct PermissionBinding
    {
        std::string role_id;
        std::string permission_id;

        auto operator<=>(const PermissionBinding &) const = default;
    };

    /** Permission granted to a user directly, optionally narrowed by scope */
    struct DirectGrant
    {
        std::string id;
        std::string user_id;
        std::string permission_id;
        Scope scope;
        Timestamp created_at{};

        nlohmann::json to_json() const;
        static Result<DirectGrant> from_json(const nlohmann::json &j);
    };

    /** resource.action: two or more non-empty segments of [a-z0-9_] */
    bool is_valid_permission_name(std::string_view name);

    /**
     * Value snapshot of every RBAC record.
     *
     * Mutators validate uniqueness and references: duplicate names, bindings
     * and grant triples are AlreadyExists, missing records are NotFound.
     * User ids are not checked here; see UserDirectory.
     */
    class CatalogState
    {
    public:
        // Mutators. Explicit ids are only used when seeding fixed records.

        Result<Role> create_role(const std::string &name,
                                 const std::string &description,
                                 Timestamp now,
                                 std::optional<std::string> id = std::nullopt);

        Result<Role> update_role(const std::string &role_id,
                                 const std::optional<std::string> &name,
                                 const std::optional<std::string> &description,
                                 Timestamp now);

        /** Remove a role together with its user and permission bindings */
        Result<Role> delete_role(const std::string &role_id);

        Result<Permission> create_permission(const std::string &name,
                                             const std::string &description,
                                             Timestamp now,
                                             std::optional<std::string> id = std::nullopt);

        Result<void> bind_permission(const std::string &role_id, const std::string &permission_id);
        Result<void> unbind_permission(const std::string &role_id, const std::string &permission_id);

        Result<void> bind_role(const std::string &user_id, const std::string &role_id);
        Result<void> unbind_role(const std::string &user_id, const std::string &role_id);

        Result<DirectGrant> grant_permission(const std::string &user_id,
                                             const std::string &permission_id,
                                             const Scope &scope,
                                             Timestamp now,
                                             std::optional<std::string> id = std::nullopt);

        Result<DirectGrant> revoke_grant(const std::string &grant_id);

        /** Revoke the one grant with exactly this user, permission and scope */
        Result<DirectGrant> revoke_permission(const std::string &user_id,
                                              const std::string &permission_id,
                                              const Scope &scope);

        // Lookups

        std::optional<Role> find_role(std::string_view role_id) const;
        std::optional<Role> find_role_by_name(std::string_view name) const;
        std::optional<Permission> find_permission(std::string_view permission_id) const;
        std::optional<Permission> find_permission_by_name(std::string_view name) const;
        std::optional<DirectGrant> find_grant(std::string_view grant_id) const;

        std::vector<Permission> role_permissions(std::string_view role_id) const;
        std::vector<Role> user_roles(std::string_view user_id) const;
        std::vector<DirectGrant> user_grants(std::string_view user_id) const;

        std::vector<Role> roles() const;
        std::vector<Permission> permissions() const;

        bool has_role_binding(std::string_view user_id, std::string_view role_id) const;
        bool has_permission_binding(std::string_view role_id, std::string_view permission_id) const;

        /** Number of commits that produced this state; 0 before the first */
        std::uint64_t revision() const { return revision_; }

        nlohmann::json to_json() const;
        static Result<CatalogState> from_json(const nlohmann::json &j);

    private:
        friend class CatalogTransaction;

        std::uint64_t revision_{0};
        std::map<std::string, Role, std::less<>> roles_;
        std::map<std::string, Permission, std::less<>> permissions_;
        std::set<PermissionBinding> permission_bindings_;
        std::set<RoleBinding> role_bindings_;
        std::map<std::string, DirectGrant, std::less<>> grants_;
    };

    /**
     * Default roles, permissions and role-permission bindings with their
     * fixed ids. Existing records are left alone, so seeding is idempotent.
     * @return number of records created
     */
    Result<std::size_t> seed_defaults(CatalogState &state, Timestamp now);

    /**
     * Persistence for catalog snapshots. save must be atomic.
     */
    class CatalogStore
    {
    public:
        virtual ~CatalogStore() = default;

        /** Stored catalog, or empty if nothing was saved yet */
        virtual Result<std::optional<CatalogState>> load() = 0;

        /**
         * Replace the stored catalog if its revision is still
         * expected_revision (0 when nothing is stored).
         * @return ConflictingAppend when another writer got there first
         */
        virtual Result<void> save(const CatalogState &state, std::uint64_t expected_revision) = 0;
    };

    class PermissionCatalog;

    /**
     * Exclusive write access to the catalog. Mutates a private copy that
     * becomes visible only on commit; dropping the transaction discards it.
     */
    class CatalogTransaction
    {
    public:
        CatalogTransaction(CatalogTransaction &&) = default;
        CatalogTransaction &operator=(CatalogTransaction &&) = default;

        CatalogState &state() { return state_; }
        const CatalogState &state() const { return state_; }

        /**
         * Persist to the catalog store, then publish the new snapshot. A
         * store that moved on since begin() gives ConflictingAppend and
         * nothing is published.
         */
        Result<void> commit();

    private:
        friend class PermissionCatalog;

        CatalogTransaction(PermissionCatalog &catalog, std::unique_lock<std::mutex> lock);

        PermissionCatalog *catalog_;
        std::unique_lock<std::mutex> lock_;
        CatalogState state_;
        bool committed_{false};
    };

    /**
     * Owner of all RBAC records. Readers take an immutable snapshot; one
     * writer at a time goes through a CatalogTransaction.
     */
    class PermissionCatalog
    {
    public:
        explicit PermissionCatalog(std::shared_ptr<CatalogStore> store = nullptr);

        std::shared_ptr<const CatalogState> snapshot() const;

        /**
         * Take the writer lock and refresh from the store, so the
         * transaction starts from the latest saved catalog.
         */
        Result<CatalogTransaction> begin();

        /** Replace the published snapshot with the stored catalog */
        Result<void> reload();

    private:
        friend class CatalogTransaction;

        void publish(std::shared_ptr<const CatalogState> state);

        std::shared_ptr<CatalogStore> store_;
        std::mutex writer_mutex_;
        mutable std::shared_mutex snapshot_mutex_;
        std::shared_ptr<const CatalogState> current_;
    };

    /**
     * Lookup of known user ids, used for referential checks on bindings
     * and grants.
     */
    class UserDirectory
    {
    public:
        virtual ~UserDirectory() = default;
        virtual bool exists(std::string_view user_id) const = 0;
    };

    class StaticUserDirectory : public UserDirectory
    {
    public:
        StaticUserDirectory() = default;
        explicit StaticUserDirectory(std::unordered_set<std::string> users);

        void add(std::string user_id);
        bool exists(std::string_view user_id) const override;

    private:
        mutable std::shared_mutex mutex_;
        std::unordered_set<std::string> users_;
    };

} // namespace warden
