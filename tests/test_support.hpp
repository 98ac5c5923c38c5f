#pragma once

#include "warden/catalog.hpp"
#include "warden/clock.hpp"
#include "warden/gateway.hpp"
#include "warden/ledger.hpp"
#include "warden/ledger_store.hpp"
#include "warden/resolver.hpp"
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>

namespace warden::testing
{
    using namespace std::chrono_literals;

    /** Clock that only moves when told to */
    class ManualClock : public Clock
    {
    public:
        explicit ManualClock(Timestamp start = Timestamp(std::chrono::milliseconds(1'765'440'000'000)))
            : now_(start.time_since_epoch().count()) {}

        Timestamp now() const override
        {
            return Timestamp(std::chrono::milliseconds(now_.load()));
        }

        void advance(std::chrono::milliseconds by) { now_ += by.count(); }
        void set(Timestamp ts) { now_ = ts.time_since_epoch().count(); }

    private:
        std::atomic<std::int64_t> now_;
    };

    /**
     * In-memory store that lets a test rewrite stored events behind the
     * ledger's back.
     */
    class TamperableLedgerStore : public InMemoryLedgerStore
    {
    public:
        Result<std::vector<Event>> scan(std::uint64_t from_sequence,
                                        std::size_t limit,
                                        std::chrono::milliseconds timeout) override
        {
            auto events = InMemoryLedgerStore::scan(from_sequence, limit, timeout);
            if (events && tamper_)
            {
                for (auto &event : *events)
                    tamper_(event);
            }
            return events;
        }

        void tamper(std::function<void(Event &)> fn) { tamper_ = std::move(fn); }

    private:
        std::function<void(Event &)> tamper_;
    };

    /** Catalog store whose writes can be made to fail */
    class FlakyCatalogStore : public CatalogStore
    {
    public:
        Result<std::optional<CatalogState>> load() override
        {
            std::lock_guard lock(mutex_);
            return saved_;
        }

        Result<void> save(const CatalogState &state, std::uint64_t expected_revision) override
        {
            std::lock_guard lock(mutex_);
            if (fail_writes)
                return std::unexpected(WardenError::storage("catalog store offline"));
            std::uint64_t stored = saved_ ? saved_->revision() : 0;
            if (stored != expected_revision)
                return std::unexpected(WardenError::conflict("catalog revision moved"));
            saved_ = state;
            return {};
        }

        std::atomic<bool> fail_writes{false};

    private:
        std::mutex mutex_;
        std::optional<CatalogState> saved_;
    };

    /** Ledger, gateway, catalog and resolver wired over in-memory stores */
    struct Harness
    {
        explicit Harness(LedgerOptions options = {}, ResolverOptions resolver_options = {})
            : clock(std::make_shared<ManualClock>()),
              store(std::make_shared<TamperableLedgerStore>()),
              catalog_store(std::make_shared<FlakyCatalogStore>()),
              ledger(std::make_shared<Ledger>(store, clock, options)),
              catalog(std::make_shared<PermissionCatalog>(catalog_store)),
              gateway(std::make_shared<AuditGateway>(ledger)),
              users(std::make_shared<StaticUserDirectory>()),
              resolver(std::make_shared<GrantResolver>(catalog, gateway, users, resolver_options))
        {
        }

        std::shared_ptr<ManualClock> clock;
        std::shared_ptr<TamperableLedgerStore> store;
        std::shared_ptr<FlakyCatalogStore> catalog_store;
        std::shared_ptr<Ledger> ledger;
        std::shared_ptr<PermissionCatalog> catalog;
        std::shared_ptr<AuditGateway> gateway;
        std::shared_ptr<StaticUserDirectory> users;
        std::shared_ptr<GrantResolver> resolver;
    };

} // namespace warden::testing
