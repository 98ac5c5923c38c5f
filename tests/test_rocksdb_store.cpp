#include <catch2/catch_test_macros.hpp>
#include "test_support.hpp"
#include "warden/crypto.hpp"
#include "warden/rocksdb_store.hpp"
#include <filesystem>
#include <fstream>

using namespace warden;
using namespace warden::testing;

namespace
{
    struct TempDir
    {
        TempDir() : path(std::filesystem::temp_directory_path() / ("warden-rocksdb-" + crypto::uuid_v4())) {}
        ~TempDir() { std::filesystem::remove_all(path); }

        StorageConfig config() const
        {
            StorageConfig cfg;
            cfg.rocksdb_path = path.string();
            cfg.timeout = std::chrono::milliseconds(500);
            return cfg;
        }

        std::filesystem::path path;
    };

    std::shared_ptr<RocksDbStore> open_store(const TempDir &dir)
    {
        auto store = RocksDbStore::open(dir.config());
        REQUIRE(store.has_value());
        return *store;
    }
}

TEST_CASE("Events persist across reopening", "[rocksdb]")
{
    TempDir dir;
    auto clock = std::make_shared<ManualClock>();
    std::string last_hash;

    {
        Ledger ledger(open_store(dir), clock);
        for (int i = 0; i < 5; ++i)
        {
            auto event = ledger.append("task.updated", std::string("u1"), std::string("task-" + std::to_string(i)),
                                       {{"i", i}}, Severity::Important);
            REQUIRE(event.has_value());
            last_hash = event->hash;
        }
    }

    Ledger reopened(open_store(dir), clock);
    auto tail = reopened.tail();
    REQUIRE(tail.has_value());
    REQUIRE(tail->next_sequence == 5);
    REQUIRE(tail->hash == last_hash);

    auto report = reopened.verify_chain();
    REQUIRE(report.has_value());
    REQUIRE(report->events_checked == 5);

    auto next = reopened.append("task.deleted", std::string("u1"), std::nullopt, {}, Severity::Important);
    REQUIRE(next.has_value());
    REQUIRE(next->sequence == 5);
    REQUIRE(next->previous_hash == last_hash);
}

TEST_CASE("Appends are a compare-and-swap on the tail", "[rocksdb]")
{
    TempDir dir;
    auto store = open_store(dir);
    Ledger ledger(store, std::make_shared<ManualClock>());

    auto first = ledger.append("role.created", std::string("admin"), std::nullopt, {{"n", 1}}, Severity::Important);
    REQUIRE(first.has_value());

    Event stale = *first;
    stale.id = crypto::uuid_v4();
    auto conflict = store->commit_append(ChainTail{}, stale, std::chrono::milliseconds(500));
    REQUIRE_FALSE(conflict.has_value());
    REQUIRE(conflict.error().code == ErrorCode::ConflictingAppend);

    auto tail = store->read_tail(std::chrono::milliseconds(500));
    REQUIRE(tail.has_value());
    REQUIRE(tail->next_sequence == 1);
    REQUIRE(tail->hash == first->hash);
}

TEST_CASE("Scans and lookups", "[rocksdb]")
{
    TempDir dir;
    auto store = open_store(dir);
    Ledger ledger(store, std::make_shared<ManualClock>());

    std::vector<Event> events;
    for (int i = 0; i < 6; ++i)
    {
        auto event = ledger.append("project.updated", std::string("u1"), std::nullopt, {{"i", i}}, Severity::Important);
        REQUIRE(event.has_value());
        events.push_back(*event);
    }

    auto page = store->scan(2, 3, std::chrono::milliseconds(500));
    REQUIRE(page.has_value());
    REQUIRE(page->size() == 3);
    REQUIRE(page->front().sequence == 2);
    REQUIRE(page->back().sequence == 4);
    REQUIRE(page->front().payload == events[2].payload);

    auto found = store->find(events[4].id, std::chrono::milliseconds(500));
    REQUIRE(found.has_value());
    REQUIRE(found->has_value());
    REQUIRE((*found)->hash == events[4].hash);

    auto missing = store->find("no-such-id", std::chrono::milliseconds(500));
    REQUIRE(missing.has_value());
    REQUIRE_FALSE(missing->has_value());
}

TEST_CASE("Purges delete events behind checkpoints", "[rocksdb]")
{
    TempDir dir;
    auto clock = std::make_shared<ManualClock>();
    auto store = open_store(dir);
    Ledger ledger(store, clock);

    std::vector<Event> events;
    for (int i = 0; i < 4; ++i)
    {
        auto event = ledger.append("resource.read", std::string("u1"), std::nullopt, {{"i", i}}, Severity::Noise);
        REQUIRE(event.has_value());
        events.push_back(*event);
    }
    clock->advance(std::chrono::days(8));
    REQUIRE(ledger.append("task.updated", std::string("u1"), std::nullopt, {}, Severity::Important).has_value());

    auto report = ledger.purge_stale(clock->now());
    REQUIRE(report.has_value());
    REQUIRE(report->purged_noise == 4);
    REQUIRE(report->checkpoints.size() == 1);

    auto checkpoints = store->checkpoints(std::chrono::milliseconds(500));
    REQUIRE(checkpoints.has_value());
    REQUIRE(checkpoints->size() == 1);
    REQUIRE(checkpoints->front().first_sequence == 0);
    REQUIRE(checkpoints->front().last_sequence == 3);
    REQUIRE(checkpoints->front().anchor_hash == events[3].hash);

    REQUIRE_FALSE(store->find(events[1].id, std::chrono::milliseconds(500))->has_value());

    auto verified = ledger.verify_chain();
    REQUIRE(verified.has_value());
    REQUIRE(verified->events_checked == 1);
    REQUIRE(verified->gaps_bridged == 1);

    SECTION("Purging an event that is already gone conflicts")
    {
        PurgePlan plan;
        plan.sequences = {events[0].sequence};
        auto again = store->purge(plan, std::chrono::milliseconds(500));
        REQUIRE_FALSE(again.has_value());
        REQUIRE(again.error().code == ErrorCode::ConflictingAppend);
    }
}

TEST_CASE("The catalog is stored alongside the ledger", "[rocksdb]")
{
    TempDir dir;
    const Timestamp now{std::chrono::milliseconds(1'765'440'000'000)};

    {
        auto store = open_store(dir);
        auto empty = store->load();
        REQUIRE(empty.has_value());
        REQUIRE_FALSE(empty->has_value());

        PermissionCatalog catalog(store);
        auto tx = catalog.begin();
        REQUIRE(tx.has_value());
        REQUIRE(seed_defaults(tx->state(), now).has_value());
        REQUIRE(tx->state().bind_role("u1", "00000000-0000-0000-0000-000000000004").has_value());
        REQUIRE(tx->commit().has_value());
    }

    auto store = open_store(dir);
    PermissionCatalog catalog(store);
    REQUIRE(catalog.reload().has_value());
    auto state = catalog.snapshot();
    REQUIRE(state->roles().size() == 5);
    REQUIRE(state->has_role_binding("u1", "00000000-0000-0000-0000-000000000004"));

    SECTION("Saving over a newer revision is a conflict")
    {
        REQUIRE(state->revision() == 1);
        auto stale = store->save(CatalogState{}, 0);
        REQUIRE_FALSE(stale.has_value());
        REQUIRE(stale.error().code == ErrorCode::ConflictingAppend);

        auto tx = catalog.begin();
        REQUIRE(tx.has_value());
        REQUIRE(tx->state().create_role("auditor", "", now).has_value());
        REQUIRE(tx->commit().has_value());

        auto loaded = store->load();
        REQUIRE(loaded.has_value());
        REQUIRE((*loaded)->revision() == 2);
        REQUIRE((*loaded)->find_role_by_name("auditor").has_value());
        REQUIRE((*loaded)->find_role_by_name("admin").has_value());
    }
}

TEST_CASE("Opening an unusable path fails", "[rocksdb]")
{
    TempDir dir;
    std::filesystem::create_directories(dir.path);
    auto file = dir.path / "not-a-directory";
    {
        std::ofstream out(file);
        out << "x";
    }

    StorageConfig cfg;
    cfg.rocksdb_path = (file / "db").string();
    auto store = RocksDbStore::open(cfg);
    REQUIRE_FALSE(store.has_value());
    REQUIRE(store.error().code == ErrorCode::StorageUnavailable);
}
