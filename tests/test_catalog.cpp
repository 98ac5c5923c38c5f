#include <catch2/catch_test_macros.hpp>
#include "test_support.hpp"
#include <atomic>
#include <thread>

using namespace warden;
using namespace warden::testing;

namespace
{
    const Timestamp kNow{std::chrono::milliseconds(1'765'440'000'000)};
}

TEST_CASE("Permission names follow resource.action", "[catalog]")
{
    REQUIRE(is_valid_permission_name("task.view"));
    REQUIRE(is_valid_permission_name("ledger.entry.read"));
    REQUIRE(is_valid_permission_name("user_2fa.reset"));

    REQUIRE_FALSE(is_valid_permission_name("task"));
    REQUIRE_FALSE(is_valid_permission_name("task."));
    REQUIRE_FALSE(is_valid_permission_name(".view"));
    REQUIRE_FALSE(is_valid_permission_name("task..view"));
    REQUIRE_FALSE(is_valid_permission_name("Task.View"));
    REQUIRE_FALSE(is_valid_permission_name("task.view-all"));
    REQUIRE_FALSE(is_valid_permission_name(""));
}

TEST_CASE("Catalog state enforces uniqueness and references", "[catalog]")
{
    CatalogState state;
    auto role = state.create_role("editor", "Edits things", kNow);
    REQUIRE(role.has_value());
    auto permission = state.create_permission("doc.edit", "", kNow);
    REQUIRE(permission.has_value());

    SECTION("Names are unique")
    {
        REQUIRE(state.create_role("editor", "", kNow).error().code == ErrorCode::AlreadyExists);
        REQUIRE(state.create_permission("doc.edit", "", kNow).error().code == ErrorCode::AlreadyExists);
        REQUIRE(state.create_role("", "", kNow).error().code == ErrorCode::InvalidInput);
    }

    SECTION("Renaming onto another role's name is refused")
    {
        REQUIRE(state.create_role("reviewer", "", kNow).has_value());
        auto renamed = state.update_role(role->id, std::string("reviewer"), std::nullopt, kNow);
        REQUIRE(renamed.error().code == ErrorCode::AlreadyExists);

        auto same = state.update_role(role->id, std::string("editor"), std::string("Still edits"), kNow);
        REQUIRE(same.has_value());
        REQUIRE(same->description == "Still edits");
    }

    SECTION("Bindings need existing records")
    {
        REQUIRE(state.bind_permission("missing", permission->id).error().code == ErrorCode::NotFound);
        REQUIRE(state.bind_permission(role->id, "missing").error().code == ErrorCode::NotFound);
        REQUIRE(state.bind_role("u1", "missing").error().code == ErrorCode::NotFound);
        REQUIRE(state.grant_permission("u1", "missing", {}, kNow).error().code == ErrorCode::NotFound);
        REQUIRE(state.unbind_role("u1", role->id).error().code == ErrorCode::NotFound);
    }

    SECTION("Bindings are unique")
    {
        REQUIRE(state.bind_permission(role->id, permission->id).has_value());
        REQUIRE(state.bind_permission(role->id, permission->id).error().code == ErrorCode::AlreadyExists);
        REQUIRE(state.bind_role("u1", role->id).has_value());
        REQUIRE(state.bind_role("u1", role->id).error().code == ErrorCode::AlreadyExists);
    }

    SECTION("Grants with different scopes coexist")
    {
        REQUIRE(state.grant_permission("u1", permission->id, Scope({{"project_id", "p1"}}), kNow).has_value());
        REQUIRE(state.grant_permission("u1", permission->id, Scope({{"project_id", "p2"}}), kNow).has_value());
        REQUIRE(state.grant_permission("u1", permission->id, {}, kNow).has_value());
        REQUIRE(state.user_grants("u1").size() == 3);
        REQUIRE(state.user_grants("u2").empty());
    }

    SECTION("Deleting a role cascades to its bindings")
    {
        REQUIRE(state.bind_permission(role->id, permission->id).has_value());
        REQUIRE(state.bind_role("u1", role->id).has_value());
        REQUIRE(state.delete_role(role->id).has_value());

        REQUIRE_FALSE(state.has_role_binding("u1", role->id));
        REQUIRE_FALSE(state.has_permission_binding(role->id, permission->id));
        REQUIRE(state.find_permission(permission->id).has_value());
        REQUIRE(state.delete_role(role->id).error().code == ErrorCode::NotFound);
    }
}

TEST_CASE("Catalog state survives a JSON round trip", "[catalog]")
{
    CatalogState state;
    REQUIRE(seed_defaults(state, kNow).has_value());
    auto member = state.find_role_by_name("member");
    REQUIRE(member.has_value());
    REQUIRE(state.bind_role("u1", member->id).has_value());
    auto permission = state.find_permission_by_name("task.delete");
    auto grant = state.grant_permission("u1", permission->id, Scope({{"project_id", "p1"}}), kNow);
    REQUIRE(grant.has_value());

    auto restored = CatalogState::from_json(state.to_json());
    REQUIRE(restored.has_value());
    REQUIRE(restored->to_json() == state.to_json());
    REQUIRE(restored->has_role_binding("u1", member->id));
    REQUIRE(restored->find_grant(grant->id)->scope == grant->scope);

    SECTION("Malformed documents are rejected")
    {
        auto broken = state.to_json();
        broken.erase("user_roles");
        auto parsed = CatalogState::from_json(broken);
        REQUIRE_FALSE(parsed.has_value());
        REQUIRE(parsed.error().code == ErrorCode::InvalidInput);
    }
}

TEST_CASE("Seeding creates the default catalog once", "[catalog]")
{
    CatalogState state;
    auto created = seed_defaults(state, kNow);
    REQUIRE(created.has_value());
    // 5 roles, 16 permissions, 26 role-permission bindings
    REQUIRE(*created == 47);

    auto viewer = state.find_role("00000000-0000-0000-0000-000000000005");
    REQUIRE(viewer.has_value());
    REQUIRE(viewer->name == "viewer");
    REQUIRE(state.role_permissions(viewer->id).size() == 3);

    auto super_admin = state.find_role_by_name("super_admin");
    REQUIRE(super_admin.has_value());
    REQUIRE(state.role_permissions(super_admin->id).empty());

    auto again = seed_defaults(state, kNow);
    REQUIRE(again.has_value());
    REQUIRE(*again == 0);

    SECTION("Seeding fills in what is missing")
    {
        REQUIRE(state.delete_role(viewer->id).has_value());
        auto refilled = seed_defaults(state, kNow);
        REQUIRE(refilled.has_value());
        REQUIRE(*refilled == 4);
    }
}

TEST_CASE("Snapshots are isolated from transactions", "[catalog]")
{
    auto store = std::make_shared<FlakyCatalogStore>();
    PermissionCatalog catalog(store);
    auto before = catalog.snapshot();

    {
        auto opened = catalog.begin();
        REQUIRE(opened.has_value());
        auto &tx = *opened;
        REQUIRE(tx.state().create_role("draft", "", kNow).has_value());
        REQUIRE_FALSE(catalog.snapshot()->find_role_by_name("draft").has_value());
    }
    REQUIRE_FALSE(catalog.snapshot()->find_role_by_name("draft").has_value());

    {
        auto opened = catalog.begin();
        REQUIRE(opened.has_value());
        auto &tx = *opened;
        REQUIRE(tx.state().create_role("final", "", kNow).has_value());
        REQUIRE(tx.commit().has_value());
        REQUIRE(tx.commit().error().code == ErrorCode::InvalidInput);
    }
    REQUIRE(catalog.snapshot()->find_role_by_name("final").has_value());
    REQUIRE(catalog.snapshot()->revision() == 1);
    REQUIRE(before->roles().empty());

    SECTION("A failed save publishes nothing")
    {
        store->fail_writes = true;
        auto opened = catalog.begin();
        REQUIRE(opened.has_value());
        auto &tx = *opened;
        REQUIRE(tx.state().create_role("lost", "", kNow).has_value());
        auto committed = tx.commit();
        REQUIRE_FALSE(committed.has_value());
        REQUIRE(committed.error().code == ErrorCode::StorageUnavailable);
        REQUIRE_FALSE(catalog.snapshot()->find_role_by_name("lost").has_value());
    }

    SECTION("A second catalog reloads the saved state")
    {
        PermissionCatalog other(store);
        REQUIRE(other.snapshot()->roles().empty());
        REQUIRE(other.reload().has_value());
        REQUIRE(other.snapshot()->find_role_by_name("final").has_value());
    }

    SECTION("A transaction starts from the stored catalog")
    {
        PermissionCatalog other(store);
        auto opened = other.begin();
        REQUIRE(opened.has_value());
        REQUIRE(opened->state().find_role_by_name("final").has_value());
        REQUIRE(opened->state().create_role("second", "", kNow).has_value());
        REQUIRE(opened->commit().has_value());

        auto stored = store->load();
        REQUIRE(stored.has_value());
        REQUIRE((*stored)->find_role_by_name("final").has_value());
        REQUIRE((*stored)->find_role_by_name("second").has_value());
        REQUIRE((*stored)->revision() == 2);
    }

    SECTION("A stale writer gets a conflict instead of overwriting")
    {
        PermissionCatalog other(store);
        auto first = catalog.begin();
        auto second = other.begin();
        REQUIRE(first.has_value());
        REQUIRE(second.has_value());

        REQUIRE(first->state().create_role("x", "", kNow).has_value());
        REQUIRE(second->state().create_role("y", "", kNow).has_value());
        REQUIRE(first->commit().has_value());

        auto stale = second->commit();
        REQUIRE_FALSE(stale.has_value());
        REQUIRE(stale.error().code == ErrorCode::ConflictingAppend);
        REQUIRE_FALSE(other.snapshot()->find_role_by_name("y").has_value());

        auto stored = store->load();
        REQUIRE((*stored)->find_role_by_name("x").has_value());
        REQUIRE_FALSE((*stored)->find_role_by_name("y").has_value());
    }
}

TEST_CASE("Writers are serialized", "[catalog]")
{
    PermissionCatalog catalog;
    constexpr int kThreads = 8;

    std::atomic<int> committed{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t)
    {
        threads.emplace_back([&catalog, &committed, t]
                             {
                                 auto tx = catalog.begin();
                                 if (!tx)
                                     return;
                                 auto role = tx->state().create_role("role_" + std::to_string(t), "", kNow);
                                 if (role && tx->commit())
                                     ++committed;
                             });
    }
    for (auto &thread : threads)
        thread.join();

    REQUIRE(committed == kThreads);
    REQUIRE(catalog.snapshot()->roles().size() == kThreads);
}

TEST_CASE("Static user directory", "[catalog]")
{
    StaticUserDirectory users({"u1"});
    REQUIRE(users.exists("u1"));
    REQUIRE_FALSE(users.exists("u2"));
    users.add("u2");
    REQUIRE(users.exists("u2"));
}
