#pragma once

#include <cstdint>
#include <datapod/datapod.hpp>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <chainledger/ledger/record.hpp>
#include <chainledger/ledger/scope.hpp>

// Forward declaration for sqlite3 C API
struct sqlite3;

namespace chainledger::storage {

    // ===========================================
    // Core Types
    // ===========================================

    /// SQLite database configuration
    struct OpenOptions {
        bool enable_wal = true;
        bool enable_foreign_keys = true;
        int32_t busy_timeout_ms = 5000;
        int32_t cache_size_kb = 20000;
        enum class Synchronous { OFF = 0, NORMAL = 1, FULL = 2 };
        Synchronous sync_mode = Synchronous::NORMAL;

        OpenOptions() = default;
    };

    /// Filter for audit trail queries. Unset members do not constrain.
    struct AuditFilter {
        std::optional<std::string> entity_type;
        std::optional<std::string> entity_id;
        std::optional<std::string> action;
        std::optional<std::string> actor_id;
        std::optional<ledger::Timestamp> created_from; // inclusive
        std::optional<ledger::Timestamp> created_to;   // exclusive
        int32_t limit = 0; // <= 0: the caller's default; the store itself then returns every row
        int32_t offset = 0;

        AuditFilter() = default;
    };

    enum class AuditGrouping { Action, EntityType, Actor };

    /// Marks where a retention purge cut a chain. Verification of the remaining
    /// records starts from boundary_hash instead of the empty prev_hash.
    struct RetentionCheckpoint {
        ledger::RecordKind kind = ledger::RecordKind::Audit;
        std::string scope_id;
        int64_t purged_through_sequence = 0;
        std::string boundary_hash;
        ledger::Timestamp cutoff;
        ledger::Timestamp purged_at;
    };

    // ===========================================
    // SqliteStore - persistence for both chains
    // ===========================================

    /// One connection, serialized by a recursive mutex. A TxGuard holds that mutex for
    /// its whole lifetime, so a transaction is never interleaved with another thread's statements.
    class SqliteStore {
      public:
        SqliteStore();
        ~SqliteStore();

        SqliteStore(const SqliteStore &) = delete;
        SqliteStore &operator=(const SqliteStore &) = delete;

        /// Open or create database at given path (":memory:" for a private in-memory database)
        dp::Result<void, dp::Error> open(const std::string &path, const OpenOptions &opts = OpenOptions{});

        void close();

        bool isOpen() const;

        const std::string &path() const { return db_path_; }

        /// Create tables, indexes and immutability triggers, then record the schema version
        dp::Result<void, dp::Error> initializeCoreSchema();

        int32_t schemaVersion();

        /// Version written by initializeCoreSchema
        static constexpr int32_t SCHEMA_VERSION = 1;

        // ===========================================
        // Transaction management (RAII)
        // ===========================================

        /// Immediate takes the database write lock at BEGIN, so no other connection can
        /// slip a write between our read of the chain head and our insert.
        enum class TxMode { Deferred, Immediate };

        class TxGuard {
          public:
            TxGuard(SqliteStore &store, TxMode mode);
            ~TxGuard();

            TxGuard(const TxGuard &) = delete;
            TxGuard &operator=(const TxGuard &) = delete;

            /// False if BEGIN failed
            bool isActive() const { return active_; }

            dp::Result<void, dp::Error> commit();
            void rollback();

          private:
            SqliteStore &store_;
            std::unique_lock<std::recursive_mutex> lock_;
            bool active_;
        };

        std::unique_ptr<TxGuard> beginTransaction(TxMode mode = TxMode::Deferred);

        // ===========================================
        // Chain records
        // ===========================================

        /// Fails with duplicate_record when a project already has a report for that date,
        /// storage_error on any other constraint (sequence or prev_hash fork)
        dp::Result<void, dp::Error> insertRecord(const ledger::ProgressRecord &record);
        dp::Result<void, dp::Error> insertRecord(const ledger::AuditRecord &record);

        /// All records of a scope in sequence order
        template <typename P>
        dp::Result<std::vector<ledger::ChainRecord<P>>, dp::Error> listRecords(const std::string &scope_id);

        /// Highest-sequence record of a scope
        template <typename P>
        dp::Result<std::optional<ledger::ChainRecord<P>>, dp::Error> latestRecord(const std::string &scope_id);

        /// Distinct progress scopes present in the store
        dp::Result<std::vector<std::string>, dp::Error> progressScopes();

        // ===========================================
        // Audit queries
        // ===========================================

        /// Matching audit records, newest first, paged by filter.limit / filter.offset (limit <= 0 returns all)
        dp::Result<std::vector<ledger::AuditRecord>, dp::Error> queryAudit(const AuditFilter &filter);

        /// Number of matching audit records, ignoring paging
        dp::Result<int64_t, dp::Error> countAudit(const AuditFilter &filter);

        /// (key, count) pairs ordered by count descending. Actor grouping skips system records.
        dp::Result<std::vector<std::pair<std::string, int64_t>>, dp::Error>
        countAuditBy(AuditGrouping grouping, const std::optional<ledger::Timestamp> &since,
                     std::optional<int32_t> limit = std::nullopt);

        // ===========================================
        // Retention
        // ===========================================

        dp::Result<std::optional<RetentionCheckpoint>, dp::Error> latestCheckpoint(ledger::RecordKind kind,
                                                                                  const std::string &scope_id);

        dp::Result<void, dp::Error> insertCheckpoint(const RetentionCheckpoint &checkpoint);

        /// Newest audit record created strictly before cutoff
        dp::Result<std::optional<ledger::AuditRecord>, dp::Error> lastAuditBefore(const ledger::Timestamp &cutoff);

        /// Deletes audit records up to and including sequence. Requires a checkpoint covering them.
        dp::Result<int64_t, dp::Error> deleteAuditThrough(int64_t sequence);

        // ===========================================
        // Diagnostics and raw SQL
        // ===========================================

        /// Run SQLite integrity check
        bool quickCheck();

        dp::Result<void, dp::Error> executeSql(const std::string &sql);

        /// Execute prepared statement with text parameters, returns affected rows
        dp::Result<int64_t, dp::Error> executeUpdate(const std::string &sql, const std::vector<std::string> &params);

        /// Query with result callback, NULL columns arrive as empty strings
        dp::Result<void, dp::Error> executeQuery(const std::string &sql,
                                                 std::function<void(const std::vector<std::string> &row)> callback);

      private:
        sqlite3 *db_;
        std::string db_path_;
        bool is_open_;
        mutable std::recursive_mutex mutex_;

        void applyPragmas(const OpenOptions &opts);
        dp::Result<void, dp::Error> createCoreSchemaV1();
        bool tableExists(const std::string &table_name);
        dp::Result<void, dp::Error> setSchemaVersion(int32_t version);
        dp::Error lastError(const std::string &context) const;

        // Core schema SQL definitions
        static constexpr const char *SCHEMA_MIGRATIONS_TABLE = R"(
            CREATE TABLE IF NOT EXISTS schema_migrations (
                version INTEGER PRIMARY KEY,
                applied_at INTEGER NOT NULL
            )
        )";

        static constexpr const char *PROGRESS_TABLE = R"(
            CREATE TABLE IF NOT EXISTS progress_records (
                id TEXT PRIMARY KEY,
                scope_id TEXT NOT NULL,
                sequence INTEGER NOT NULL CHECK (sequence >= 1),
                reported_percent INTEGER NOT NULL CHECK (reported_percent BETWEEN 0 AND 10000),
                report_date TEXT NOT NULL,
                remarks TEXT NOT NULL DEFAULT '',
                actor_id TEXT NOT NULL,
                created_at INTEGER NOT NULL,
                prev_hash TEXT NOT NULL,
                record_hash TEXT NOT NULL,
                UNIQUE (scope_id, report_date),
                UNIQUE (scope_id, sequence),
                UNIQUE (scope_id, prev_hash)
            )
        )";

        static constexpr const char *AUDIT_TABLE = R"(
            CREATE TABLE IF NOT EXISTS audit_records (
                id TEXT PRIMARY KEY,
                scope_id TEXT NOT NULL,
                sequence INTEGER NOT NULL CHECK (sequence >= 1),
                actor_id TEXT NOT NULL DEFAULT '',
                action TEXT NOT NULL,
                entity_type TEXT NOT NULL,
                entity_id TEXT NOT NULL DEFAULT '',
                detail_kind TEXT NOT NULL,
                detail BLOB,
                ip_address TEXT NOT NULL DEFAULT '',
                user_agent TEXT NOT NULL DEFAULT '',
                created_at INTEGER NOT NULL,
                prev_hash TEXT NOT NULL,
                record_hash TEXT NOT NULL,
                UNIQUE (scope_id, sequence),
                UNIQUE (scope_id, prev_hash)
            )
        )";

        static constexpr const char *CHECKPOINTS_TABLE = R"(
            CREATE TABLE IF NOT EXISTS retention_checkpoints (
                record_kind TEXT NOT NULL,
                scope_id TEXT NOT NULL,
                purged_through_sequence INTEGER NOT NULL,
                boundary_hash TEXT NOT NULL,
                cutoff INTEGER NOT NULL,
                purged_at INTEGER NOT NULL,
                PRIMARY KEY (record_kind, scope_id, purged_through_sequence)
            )
        )";

        static constexpr const char *TRG_PROGRESS_NO_UPDATE = R"(
            CREATE TRIGGER IF NOT EXISTS progress_records_no_update
            BEFORE UPDATE ON progress_records
            BEGIN SELECT RAISE(ABORT, 'progress records are immutable'); END
        )";

        static constexpr const char *TRG_PROGRESS_NO_DELETE = R"(
            CREATE TRIGGER IF NOT EXISTS progress_records_no_delete
            BEFORE DELETE ON progress_records
            BEGIN SELECT RAISE(ABORT, 'progress records are immutable'); END
        )";

        static constexpr const char *TRG_AUDIT_NO_UPDATE = R"(
            CREATE TRIGGER IF NOT EXISTS audit_records_no_update
            BEFORE UPDATE ON audit_records
            BEGIN SELECT RAISE(ABORT, 'audit records are immutable'); END
        )";

        static constexpr const char *TRG_AUDIT_RETENTION_ONLY = R"(
            CREATE TRIGGER IF NOT EXISTS audit_records_retention_only
            BEFORE DELETE ON audit_records
            WHEN OLD.sequence > COALESCE((SELECT MAX(purged_through_sequence) FROM retention_checkpoints
                                          WHERE record_kind = 'audit' AND scope_id = OLD.scope_id), 0)
            BEGIN SELECT RAISE(ABORT, 'audit records can only be removed behind a retention checkpoint'); END
        )";

        static constexpr const char *TRG_CHECKPOINT_NO_UPDATE = R"(
            CREATE TRIGGER IF NOT EXISTS retention_checkpoints_no_update
            BEFORE UPDATE ON retention_checkpoints
            BEGIN SELECT RAISE(ABORT, 'retention checkpoints are immutable'); END
        )";

        static constexpr const char *TRG_CHECKPOINT_NO_DELETE = R"(
            CREATE TRIGGER IF NOT EXISTS retention_checkpoints_no_delete
            BEFORE DELETE ON retention_checkpoints
            BEGIN SELECT RAISE(ABORT, 'retention checkpoints are immutable'); END
        )";

        static constexpr const char *IDX_PROGRESS_SCOPE_SEQ =
            "CREATE INDEX IF NOT EXISTS idx_progress_scope_seq ON progress_records(scope_id, sequence)";
        static constexpr const char *IDX_AUDIT_SCOPE_SEQ =
            "CREATE INDEX IF NOT EXISTS idx_audit_scope_seq ON audit_records(scope_id, sequence)";
        static constexpr const char *IDX_AUDIT_CREATED_AT =
            "CREATE INDEX IF NOT EXISTS idx_audit_created_at ON audit_records(created_at)";
        static constexpr const char *IDX_AUDIT_ENTITY =
            "CREATE INDEX IF NOT EXISTS idx_audit_entity ON audit_records(entity_type, entity_id)";
        static constexpr const char *IDX_AUDIT_ACTION =
            "CREATE INDEX IF NOT EXISTS idx_audit_action ON audit_records(action)";
        static constexpr const char *IDX_AUDIT_ACTOR =
            "CREATE INDEX IF NOT EXISTS idx_audit_actor ON audit_records(actor_id)";
    };

    template <>
    dp::Result<std::vector<ledger::ProgressRecord>, dp::Error>
    SqliteStore::listRecords<ledger::ProgressPayload>(const std::string &scope_id);

    template <>
    dp::Result<std::vector<ledger::AuditRecord>, dp::Error>
    SqliteStore::listRecords<ledger::AuditPayload>(const std::string &scope_id);

    template <>
    dp::Result<std::optional<ledger::ProgressRecord>, dp::Error>
    SqliteStore::latestRecord<ledger::ProgressPayload>(const std::string &scope_id);

    template <>
    dp::Result<std::optional<ledger::AuditRecord>, dp::Error>
    SqliteStore::latestRecord<ledger::AuditPayload>(const std::string &scope_id);

    /// "progress" / "audit", as stored in retention_checkpoints.record_kind
    const char *recordKindName(ledger::RecordKind kind);

} // namespace chainledger::storage
