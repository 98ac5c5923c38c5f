#pragma once

#include "catalog.hpp"
#include "config.hpp"
#include "ledger_store.hpp"
#include "types.hpp"
#include <memory>

namespace warden
{

    /**
     * RocksDB-backed ledger and catalog storage.
     *
     * Layout (single column family):
     *   evt|<20-digit sequence>   event JSON
     *   idx|id|<event id>         sequence
     *   ckpt|<20-digit first seq> checkpoint JSON
     *   meta|tail                 chain tail JSON
     *   cat|state                 catalog JSON
     *
     * Writes run in pessimistic TransactionDB transactions; the tail key is
     * locked with GetForUpdate, so the lock timeout bounds how long a writer
     * waits and a lost race shows up as a moved tail.
     */
    class RocksDbStore : public LedgerStore, public CatalogStore
    {
    public:
        static Result<std::shared_ptr<RocksDbStore>> open(const StorageConfig &cfg);

        ~RocksDbStore() override;

        Result<ChainTail> read_tail(std::chrono::milliseconds timeout) override;

        Result<void> commit_append(const ChainTail &expected,
                                   const Event &event,
                                   std::chrono::milliseconds timeout) override;

        Result<std::vector<Event>> scan(std::uint64_t from_sequence,
                                        std::size_t limit,
                                        std::chrono::milliseconds timeout) override;

        Result<std::optional<Event>> find(std::string_view id,
                                          std::chrono::milliseconds timeout) override;

        Result<void> purge(const PurgePlan &plan, std::chrono::milliseconds timeout) override;

        Result<std::vector<Checkpoint>> checkpoints(std::chrono::milliseconds timeout) override;

        Result<std::optional<CatalogState>> load() override;

        Result<void> save(const CatalogState &state, std::uint64_t expected_revision) override;

    private:
        class Impl;

        explicit RocksDbStore(std::unique_ptr<Impl> impl);

        std::unique_ptr<Impl> impl_;
    };

} // namespace warden
