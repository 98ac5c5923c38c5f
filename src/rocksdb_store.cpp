#include "warden/rocksdb_store.hpp"
#include <filesystem>
#include <format>
#include <rocksdb/db.h>
#include <rocksdb/options.h>
#include <rocksdb/utilities/transaction.h>
#include <rocksdb/utilities/transaction_db.h>
#include <spdlog/spdlog.h>

namespace warden
{

    namespace
    {
        constexpr std::string_view kEventPrefix = "evt|";
        constexpr std::string_view kCheckpointPrefix = "ckpt|";
        const std::string kTailKey = "meta|tail";
        const std::string kCatalogKey = "cat|state";

        std::string event_key(std::uint64_t sequence)
        {
            return std::format("evt|{:020}", sequence);
        }

        std::string index_key(std::string_view id)
        {
            return std::format("idx|id|{}", id);
        }

        std::string checkpoint_key(std::uint64_t first_sequence)
        {
            return std::format("ckpt|{:020}", first_sequence);
        }

        bool has_prefix(const rocksdb::Slice &key, std::string_view prefix)
        {
            return key.starts_with(rocksdb::Slice(prefix.data(), prefix.size()));
        }

        WardenError status_error(const rocksdb::Status &status, std::string_view operation)
        {
            if (status.IsTimedOut() || status.IsBusy() || status.IsTryAgain())
            {
                return WardenError::storage(std::format("RocksDB {} timed out: {}", operation, status.ToString()));
            }
            spdlog::error("RocksDB {} failed: {}", operation, status.ToString());
            return WardenError::storage(std::format("RocksDB {} failed: {}", operation, status.ToString()));
        }

        Result<nlohmann::json> parse_document(const std::string &raw, std::string_view key)
        {
            try
            {
                return nlohmann::json::parse(raw);
            }
            catch (const nlohmann::json::parse_error &e)
            {
                return std::unexpected(WardenError::storage(
                    std::format("corrupt value at {}: {}", key, e.what())));
            }
        }

        // Strings that are not UTF-8 make nlohmann::json::dump throw
        Result<std::string> encode_document(const nlohmann::json &doc, std::string_view key)
        {
            try
            {
                return doc.dump();
            }
            catch (const nlohmann::json::type_error &e)
            {
                return std::unexpected(WardenError::invalid_input(
                    std::format("cannot encode value for {}: {}", key, e.what())));
            }
        }

        Result<Event> decode_event(const std::string &raw, std::string_view key)
        {
            auto doc = parse_document(raw, key);
            if (!doc)
                return std::unexpected(doc.error());
            return Event::from_json(*doc);
        }
    } // namespace

    class RocksDbStore::Impl
    {
    public:
        explicit Impl(rocksdb::TransactionDB *db) : db(db) {}

        ~Impl()
        {
            delete db;
        }

        std::unique_ptr<rocksdb::Transaction> begin(std::chrono::milliseconds timeout)
        {
            rocksdb::TransactionOptions txn_options;
            txn_options.lock_timeout = timeout.count();
            return std::unique_ptr<rocksdb::Transaction>(
                db->BeginTransaction(rocksdb::WriteOptions(), txn_options));
        }

        Result<ChainTail> decode_tail(const rocksdb::Status &status, const std::string &raw)
        {
            if (status.IsNotFound())
                return ChainTail{};
            if (!status.ok())
                return std::unexpected(status_error(status, "tail read"));
            auto doc = parse_document(raw, kTailKey);
            if (!doc)
                return std::unexpected(doc.error());
            return ChainTail::from_json(*doc);
        }

        rocksdb::TransactionDB *db;
    };

    Result<std::shared_ptr<RocksDbStore>> RocksDbStore::open(const StorageConfig &cfg)
    {
        std::error_code ec;
        std::filesystem::create_directories(cfg.rocksdb_path, ec);
        if (ec)
        {
            return std::unexpected(WardenError::storage(
                std::format("cannot create {}: {}", cfg.rocksdb_path, ec.message())));
        }

        rocksdb::Options options;
        options.create_if_missing = true;
        rocksdb::TransactionDBOptions txn_db_options;
        txn_db_options.transaction_lock_timeout = cfg.timeout.count();

        rocksdb::TransactionDB *db = nullptr;
        auto status = rocksdb::TransactionDB::Open(options, txn_db_options, cfg.rocksdb_path, &db);
        if (!status.ok())
        {
            return std::unexpected(WardenError::storage("RocksDB open failed: " + status.ToString()));
        }
        spdlog::debug("opened RocksDB store at {}", cfg.rocksdb_path);
        return std::shared_ptr<RocksDbStore>(new RocksDbStore(std::make_unique<Impl>(db)));
    }

    RocksDbStore::RocksDbStore(std::unique_ptr<Impl> impl)
        : impl_(std::move(impl))
    {
    }

    RocksDbStore::~RocksDbStore() = default;

    Result<ChainTail> RocksDbStore::read_tail(std::chrono::milliseconds)
    {
        std::string raw;
        auto status = impl_->db->Get(rocksdb::ReadOptions(), kTailKey, &raw);
        return impl_->decode_tail(status, raw);
    }

    Result<void> RocksDbStore::commit_append(const ChainTail &expected,
                                             const Event &event,
                                             std::chrono::milliseconds timeout)
    {
        auto txn = impl_->begin(timeout);

        std::string raw;
        auto status = txn->GetForUpdate(rocksdb::ReadOptions(), kTailKey, &raw);
        auto current = impl_->decode_tail(status, raw);
        if (!current)
            return std::unexpected(current.error());

        if (!(*current == expected))
        {
            return std::unexpected(WardenError::conflict(std::format(
                "chain tail moved (expected sequence {}, found {})",
                expected.next_sequence, current->next_sequence)));
        }
        if (event.sequence != current->next_sequence)
            return std::unexpected(WardenError::invalid_input("event sequence does not follow the tail"));

        std::string existing;
        status = txn->Get(rocksdb::ReadOptions(), index_key(event.id), &existing);
        if (status.ok())
            return std::unexpected(WardenError::already_exists("event id already present: " + event.id));
        if (!status.IsNotFound())
            return std::unexpected(status_error(status, "index read"));

        ChainTail next{event.sequence + 1, event.hash, event.occurred_at};
        auto key = event_key(event.sequence);
        auto encoded_event = encode_document(event.to_json(), key);
        if (!encoded_event)
            return std::unexpected(encoded_event.error());
        auto encoded_tail = encode_document(next.to_json(), kTailKey);
        if (!encoded_tail)
            return std::unexpected(encoded_tail.error());

        for (auto s : {txn->Put(key, *encoded_event),
                       txn->Put(index_key(event.id), std::to_string(event.sequence)),
                       txn->Put(kTailKey, *encoded_tail)})
        {
            if (!s.ok())
                return std::unexpected(status_error(s, "append write"));
        }

        status = txn->Commit();
        if (!status.ok())
            return std::unexpected(status_error(status, "append commit"));
        return {};
    }

    Result<std::vector<Event>> RocksDbStore::scan(std::uint64_t from_sequence,
                                                  std::size_t limit,
                                                  std::chrono::milliseconds)
    {
        std::vector<Event> out;
        std::unique_ptr<rocksdb::Iterator> it(impl_->db->NewIterator(rocksdb::ReadOptions()));
        for (it->Seek(event_key(from_sequence));
             it->Valid() && has_prefix(it->key(), kEventPrefix) && out.size() < limit;
             it->Next())
        {
            auto event = decode_event(it->value().ToString(), it->key().ToString());
            if (!event)
                return std::unexpected(event.error());
            out.push_back(std::move(*event));
        }
        if (!it->status().ok())
            return std::unexpected(status_error(it->status(), "scan"));
        return out;
    }

    Result<std::optional<Event>> RocksDbStore::find(std::string_view id, std::chrono::milliseconds)
    {
        std::string sequence;
        auto status = impl_->db->Get(rocksdb::ReadOptions(), index_key(id), &sequence);
        if (status.IsNotFound())
            return std::optional<Event>{};
        if (!status.ok())
            return std::unexpected(status_error(status, "index read"));

        std::uint64_t seq = 0;
        try
        {
            seq = std::stoull(sequence);
        }
        catch (const std::exception &e)
        {
            return std::unexpected(WardenError::storage(
                std::format("corrupt index entry for {}: {}", id, e.what())));
        }

        auto key = event_key(seq);
        std::string raw;
        status = impl_->db->Get(rocksdb::ReadOptions(), key, &raw);
        if (status.IsNotFound())
            return std::optional<Event>{};
        if (!status.ok())
            return std::unexpected(status_error(status, "event read"));

        auto event = decode_event(raw, key);
        if (!event)
            return std::unexpected(event.error());
        return std::optional<Event>(std::move(*event));
    }

    Result<void> RocksDbStore::purge(const PurgePlan &plan, std::chrono::milliseconds timeout)
    {
        auto txn = impl_->begin(timeout);

        for (auto sequence : plan.sequences)
        {
            auto key = event_key(sequence);
            std::string raw;
            auto status = txn->GetForUpdate(rocksdb::ReadOptions(), key, &raw);
            if (status.IsNotFound())
                return std::unexpected(WardenError::conflict(std::format("event {} already purged", sequence)));
            if (!status.ok())
                return std::unexpected(status_error(status, "purge read"));

            auto event = decode_event(raw, key);
            if (!event)
                return std::unexpected(event.error());

            for (auto s : {txn->Delete(key), txn->Delete(index_key(event->id))})
            {
                if (!s.ok())
                    return std::unexpected(status_error(s, "purge delete"));
            }
        }

        for (const auto &cp : plan.removed_checkpoints)
        {
            auto status = txn->Delete(checkpoint_key(cp.first_sequence));
            if (!status.ok())
                return std::unexpected(status_error(status, "checkpoint delete"));
        }
        for (const auto &cp : plan.added_checkpoints)
        {
            auto key = checkpoint_key(cp.first_sequence);
            auto encoded = encode_document(cp.to_json(), key);
            if (!encoded)
                return std::unexpected(encoded.error());
            auto status = txn->Put(key, *encoded);
            if (!status.ok())
                return std::unexpected(status_error(status, "checkpoint write"));
        }

        auto status = txn->Commit();
        if (!status.ok())
            return std::unexpected(status_error(status, "purge commit"));
        return {};
    }

    Result<std::vector<Checkpoint>> RocksDbStore::checkpoints(std::chrono::milliseconds)
    {
        std::vector<Checkpoint> out;
        std::unique_ptr<rocksdb::Iterator> it(impl_->db->NewIterator(rocksdb::ReadOptions()));
        for (it->Seek(std::string(kCheckpointPrefix));
             it->Valid() && has_prefix(it->key(), kCheckpointPrefix);
             it->Next())
        {
            auto doc = parse_document(it->value().ToString(), it->key().ToString());
            if (!doc)
                return std::unexpected(doc.error());
            auto cp = Checkpoint::from_json(*doc);
            if (!cp)
                return std::unexpected(cp.error());
            out.push_back(std::move(*cp));
        }
        if (!it->status().ok())
            return std::unexpected(status_error(it->status(), "checkpoint scan"));
        return out;
    }

    Result<std::optional<CatalogState>> RocksDbStore::load()
    {
        std::string raw;
        auto status = impl_->db->Get(rocksdb::ReadOptions(), kCatalogKey, &raw);
        if (status.IsNotFound())
            return std::optional<CatalogState>{};
        if (!status.ok())
            return std::unexpected(status_error(status, "catalog read"));

        auto doc = parse_document(raw, kCatalogKey);
        if (!doc)
            return std::unexpected(doc.error());
        auto state = CatalogState::from_json(*doc);
        if (!state)
            return std::unexpected(state.error());
        return std::optional<CatalogState>(std::move(*state));
    }

    Result<void> RocksDbStore::save(const CatalogState &state, std::uint64_t expected_revision)
    {
        auto encoded = encode_document(state.to_json(), kCatalogKey);
        if (!encoded)
            return std::unexpected(encoded.error());

        // Lock timeout falls back to storage.timeout_ms set on the TransactionDB
        std::unique_ptr<rocksdb::Transaction> txn(impl_->db->BeginTransaction(rocksdb::WriteOptions()));

        std::string raw;
        auto status = txn->GetForUpdate(rocksdb::ReadOptions(), kCatalogKey, &raw);
        std::uint64_t stored = 0;
        if (status.ok())
        {
            auto doc = parse_document(raw, kCatalogKey);
            if (!doc)
                return std::unexpected(doc.error());
            auto current = CatalogState::from_json(*doc);
            if (!current)
                return std::unexpected(current.error());
            stored = current->revision();
        }
        else if (!status.IsNotFound())
            return std::unexpected(status_error(status, "catalog read"));

        if (stored != expected_revision)
        {
            return std::unexpected(WardenError::conflict(std::format(
                "catalog moved to revision {} (expected {})", stored, expected_revision)));
        }

        status = txn->Put(kCatalogKey, *encoded);
        if (!status.ok())
            return std::unexpected(status_error(status, "catalog write"));
        status = txn->Commit();
        if (!status.ok())
            return std::unexpected(status_error(status, "catalog commit"));
        return {};
    }

} // namespace warden
