#include <chainledger/common/error.hpp>
#include <chainledger/storage/sqlite_store.hpp>

#include <sqlite3.h>

#include <algorithm>
#include <variant>

namespace chainledger::storage {

    namespace {

        /// Prepared statement, finalized on scope exit
        class Statement {
          public:
            Statement(sqlite3 *db, const std::string &sql) : stmt_(nullptr) {
                rc_ = sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt_, nullptr);
            }
            ~Statement() {
                if (stmt_)
                    sqlite3_finalize(stmt_);
            }

            Statement(const Statement &) = delete;
            Statement &operator=(const Statement &) = delete;

            bool ok() const { return rc_ == SQLITE_OK && stmt_ != nullptr; }

            void bindText(int idx, const std::string &value) {
                sqlite3_bind_text(stmt_, idx, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT);
            }
            void bindInt64(int idx, int64_t value) { sqlite3_bind_int64(stmt_, idx, value); }
            void bindBlob(int idx, const std::vector<uint8_t> &value) {
                if (value.empty())
                    sqlite3_bind_null(stmt_, idx);
                else
                    sqlite3_bind_blob(stmt_, idx, value.data(), static_cast<int>(value.size()), SQLITE_TRANSIENT);
            }

            int step() { return sqlite3_step(stmt_); }

            std::string text(int col) const {
                const unsigned char *value = sqlite3_column_text(stmt_, col);
                if (!value)
                    return std::string();
                return std::string(reinterpret_cast<const char *>(value),
                                   static_cast<size_t>(sqlite3_column_bytes(stmt_, col)));
            }
            int64_t int64(int col) const { return sqlite3_column_int64(stmt_, col); }
            std::vector<uint8_t> blob(int col) const {
                const void *data = sqlite3_column_blob(stmt_, col);
                int size = sqlite3_column_bytes(stmt_, col);
                if (!data || size <= 0)
                    return {};
                const auto *bytes = static_cast<const uint8_t *>(data);
                return std::vector<uint8_t>(bytes, bytes + size);
            }
            int columnCount() const { return sqlite3_column_count(stmt_); }

          private:
            sqlite3_stmt *stmt_;
            int rc_;
        };

        using SqlParam = std::variant<std::string, int64_t>;

        void bindAll(Statement &stmt, const std::vector<SqlParam> &params) {
            int idx = 1;
            for (const auto &param : params) {
                if (const auto *s = std::get_if<std::string>(&param))
                    stmt.bindText(idx, *s);
                else
                    stmt.bindInt64(idx, std::get<int64_t>(param));
                ++idx;
            }
        }

        constexpr const char *PROGRESS_COLUMNS = "id, scope_id, sequence, reported_percent, report_date, remarks, "
                                                 "actor_id, created_at, prev_hash, record_hash";

        constexpr const char *AUDIT_COLUMNS = "id, scope_id, sequence, actor_id, action, entity_type, entity_id, "
                                              "detail_kind, detail, ip_address, user_agent, created_at, prev_hash, "
                                              "record_hash";

        dp::Result<ledger::ProgressRecord, dp::Error> readProgress(const Statement &stmt) {
            ledger::ProgressRecord record;
            record.id = stmt.text(0);
            record.scope_id = stmt.text(1);
            record.sequence = stmt.int64(2);
            record.payload.reported_percent = ledger::Percent::fromHundredths(stmt.int64(3));
            // A row edited behind the store still loads so the verifier can report it
            auto date = ledger::Date::parse(stmt.text(4));
            if (date.is_ok())
                record.payload.report_date = date.value();
            else
                record.decode_error = "Stored report_date '" + stmt.text(4) + "' is malformed";
            record.payload.remarks = stmt.text(5);
            record.actor_id = stmt.text(6);
            record.created_at = ledger::Timestamp(stmt.int64(7));
            record.prev_hash = stmt.text(8);
            record.record_hash = stmt.text(9);
            return dp::Result<ledger::ProgressRecord, dp::Error>::ok(record);
        }

        dp::Result<ledger::AuditRecord, dp::Error> readAudit(const Statement &stmt) {
            ledger::AuditRecord record;
            record.id = stmt.text(0);
            record.scope_id = stmt.text(1);
            record.sequence = stmt.int64(2);
            record.actor_id = stmt.text(3);
            record.payload.action = stmt.text(4);
            record.payload.entity_type = stmt.text(5);
            record.payload.entity_id = stmt.text(6);
            auto detail = ledger::decodeDetail(stmt.text(7), stmt.blob(8));
            if (detail.is_ok())
                record.payload.detail = detail.value();
            else
                record.decode_error = detail.error().message.c_str();
            record.payload.ip_address = stmt.text(9);
            record.payload.user_agent = stmt.text(10);
            record.created_at = ledger::Timestamp(stmt.int64(11));
            record.prev_hash = stmt.text(12);
            record.record_hash = stmt.text(13);
            return dp::Result<ledger::AuditRecord, dp::Error>::ok(record);
        }

        template <typename Record, typename Reader>
        dp::Result<std::vector<Record>, dp::Error> collectRows(Statement &stmt, Reader reader, sqlite3 *db) {
            std::vector<Record> records;
            int rc;
            while ((rc = stmt.step()) == SQLITE_ROW) {
                auto record = reader(stmt);
                if (!record.is_ok())
                    return dp::Result<std::vector<Record>, dp::Error>::err(record.error());
                records.push_back(std::move(record.value()));
            }
            if (rc != SQLITE_DONE) {
                return dp::Result<std::vector<Record>, dp::Error>::err(
                    storage_error(std::string("Row read failed: ") + sqlite3_errmsg(db)));
            }
            return dp::Result<std::vector<Record>, dp::Error>::ok(std::move(records));
        }

        struct WhereClause {
            std::string sql;
            std::vector<SqlParam> params;
        };

        WhereClause auditWhere(const AuditFilter &filter) {
            WhereClause where;
            where.sql = " WHERE scope_id = ?";
            where.params.push_back(ledger::AUDIT_SCOPE_ID);
            if (filter.entity_type) {
                where.sql += " AND entity_type = ?";
                where.params.push_back(*filter.entity_type);
            }
            if (filter.entity_id) {
                where.sql += " AND entity_id = ?";
                where.params.push_back(*filter.entity_id);
            }
            if (filter.action) {
                where.sql += " AND action = ?";
                where.params.push_back(*filter.action);
            }
            if (filter.actor_id) {
                where.sql += " AND actor_id = ?";
                where.params.push_back(*filter.actor_id);
            }
            if (filter.created_from) {
                where.sql += " AND created_at >= ?";
                where.params.push_back(filter.created_from->micros);
            }
            if (filter.created_to) {
                where.sql += " AND created_at < ?";
                where.params.push_back(filter.created_to->micros);
            }
            return where;
        }

        int64_t currentEpochSeconds() { return ledger::Timestamp::now().micros / 1000000; }

    } // namespace

    const char *recordKindName(ledger::RecordKind kind) {
        return kind == ledger::RecordKind::Progress ? "progress" : "audit";
    }

    // ===========================================
    // SqliteStore implementation
    // ===========================================

    SqliteStore::SqliteStore() : db_(nullptr), is_open_(false) {}

    SqliteStore::~SqliteStore() { close(); }

    dp::Result<void, dp::Error> SqliteStore::open(const std::string &path, const OpenOptions &opts) {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        if (db_)
            return dp::Result<void, dp::Error>::err(storage_error("Database already open: " + db_path_));

        int rc = sqlite3_open(path.c_str(), &db_);
        if (rc != SQLITE_OK) {
            std::string msg = db_ ? sqlite3_errmsg(db_) : "out of memory";
            if (db_) {
                sqlite3_close(db_);
                db_ = nullptr;
            }
            is_open_ = false;
            return dp::Result<void, dp::Error>::err(storage_error("Failed to open " + path + ": " + msg));
        }

        sqlite3_extended_result_codes(db_, 1);
        db_path_ = path;
        is_open_ = true;
        applyPragmas(opts);
        return dp::Result<void, dp::Error>::ok();
    }

    void SqliteStore::close() {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        if (db_) {
            sqlite3_close(db_);
            db_ = nullptr;
            is_open_ = false;
        }
    }

    bool SqliteStore::isOpen() const {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        return is_open_;
    }

    dp::Error SqliteStore::lastError(const std::string &context) const {
        return storage_error(context + ": " + (db_ ? sqlite3_errmsg(db_) : "database not open"));
    }

    void SqliteStore::applyPragmas(const OpenOptions &opts) {
        if (!db_)
            return;

        // journal_mode is a no-op for in-memory databases
        if (opts.enable_wal) {
            sqlite3_exec(db_, "PRAGMA journal_mode=WAL;", nullptr, nullptr, nullptr);
        }

        if (opts.enable_foreign_keys) {
            sqlite3_exec(db_, "PRAGMA foreign_keys=ON;", nullptr, nullptr, nullptr);
        }

        std::string busy_timeout = "PRAGMA busy_timeout=" + std::to_string(opts.busy_timeout_ms) + ";";
        sqlite3_exec(db_, busy_timeout.c_str(), nullptr, nullptr, nullptr);

        std::string cache_size = "PRAGMA cache_size=-" + std::to_string(opts.cache_size_kb) + ";";
        sqlite3_exec(db_, cache_size.c_str(), nullptr, nullptr, nullptr);

        std::string sync_mode;
        switch (opts.sync_mode) {
        case OpenOptions::Synchronous::OFF:
            sync_mode = "PRAGMA synchronous=OFF;";
            break;
        case OpenOptions::Synchronous::NORMAL:
            sync_mode = "PRAGMA synchronous=NORMAL;";
            break;
        case OpenOptions::Synchronous::FULL:
            sync_mode = "PRAGMA synchronous=FULL;";
            break;
        }
        sqlite3_exec(db_, sync_mode.c_str(), nullptr, nullptr, nullptr);
    }

    dp::Result<void, dp::Error> SqliteStore::initializeCoreSchema() {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        if (!db_ || !is_open_)
            return dp::Result<void, dp::Error>::err(not_initialized("Database not open"));

        auto tx = beginTransaction(TxMode::Immediate);
        if (!tx->isActive())
            return dp::Result<void, dp::Error>::err(lastError("Failed to begin schema transaction"));

        auto migrations = executeSql(SCHEMA_MIGRATIONS_TABLE);
        if (!migrations.is_ok())
            return migrations;

        if (schemaVersion() < SCHEMA_VERSION) {
            auto created = createCoreSchemaV1();
            if (!created.is_ok())
                return created;
            auto versioned = setSchemaVersion(SCHEMA_VERSION);
            if (!versioned.is_ok())
                return versioned;
        }

        return tx->commit();
    }

    dp::Result<void, dp::Error> SqliteStore::createCoreSchemaV1() {
        for (const char *sql :
             {PROGRESS_TABLE, AUDIT_TABLE, CHECKPOINTS_TABLE, TRG_PROGRESS_NO_UPDATE, TRG_PROGRESS_NO_DELETE,
              TRG_AUDIT_NO_UPDATE, TRG_AUDIT_RETENTION_ONLY, TRG_CHECKPOINT_NO_UPDATE, TRG_CHECKPOINT_NO_DELETE,
              IDX_PROGRESS_SCOPE_SEQ, IDX_AUDIT_SCOPE_SEQ, IDX_AUDIT_CREATED_AT, IDX_AUDIT_ENTITY, IDX_AUDIT_ACTION,
              IDX_AUDIT_ACTOR}) {
            auto result = executeSql(sql);
            if (!result.is_ok())
                return result;
        }
        return dp::Result<void, dp::Error>::ok();
    }

    bool SqliteStore::tableExists(const std::string &table_name) {
        if (!db_)
            return false;

        Statement stmt(db_, "SELECT name FROM sqlite_master WHERE type='table' AND name=?");
        if (!stmt.ok())
            return false;
        stmt.bindText(1, table_name);
        return stmt.step() == SQLITE_ROW;
    }

    int32_t SqliteStore::schemaVersion() {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        if (!tableExists("schema_migrations"))
            return 0;

        Statement stmt(db_, "SELECT MAX(version) FROM schema_migrations");
        if (!stmt.ok())
            return 0;

        int32_t version = 0;
        if (stmt.step() == SQLITE_ROW)
            version = static_cast<int32_t>(stmt.int64(0));
        return version;
    }

    dp::Result<void, dp::Error> SqliteStore::setSchemaVersion(int32_t version) {
        Statement stmt(db_, "INSERT OR REPLACE INTO schema_migrations (version, applied_at) VALUES (?, ?)");
        if (!stmt.ok())
            return dp::Result<void, dp::Error>::err(lastError("Failed to prepare schema version update"));

        stmt.bindInt64(1, version);
        stmt.bindInt64(2, currentEpochSeconds());
        if (stmt.step() != SQLITE_DONE)
            return dp::Result<void, dp::Error>::err(lastError("Failed to record schema version"));
        return dp::Result<void, dp::Error>::ok();
    }

    // ===========================================
    // Transaction Guard
    // ===========================================

    SqliteStore::TxGuard::TxGuard(SqliteStore &store, TxMode mode)
        : store_(store), lock_(store.mutex_), active_(false) {
        if (store_.db_) {
            const char *begin = mode == TxMode::Immediate ? "BEGIN IMMEDIATE" : "BEGIN DEFERRED";
            active_ = (sqlite3_exec(store_.db_, begin, nullptr, nullptr, nullptr) == SQLITE_OK);
        }
    }

    SqliteStore::TxGuard::~TxGuard() { rollback(); }

    dp::Result<void, dp::Error> SqliteStore::TxGuard::commit() {
        if (!active_)
            return dp::Result<void, dp::Error>::err(storage_error("No active transaction to commit"));

        // A failed COMMIT leaves the transaction open; the destructor rolls it back
        if (sqlite3_exec(store_.db_, "COMMIT", nullptr, nullptr, nullptr) != SQLITE_OK)
            return dp::Result<void, dp::Error>::err(store_.lastError("Commit failed"));
        active_ = false;
        return dp::Result<void, dp::Error>::ok();
    }

    void SqliteStore::TxGuard::rollback() {
        if (active_) {
            sqlite3_exec(store_.db_, "ROLLBACK", nullptr, nullptr, nullptr);
            active_ = false;
        }
    }

    std::unique_ptr<SqliteStore::TxGuard> SqliteStore::beginTransaction(TxMode mode) {
        return std::make_unique<TxGuard>(*this, mode);
    }

    // ===========================================
    // Chain records
    // ===========================================

    dp::Result<void, dp::Error> SqliteStore::insertRecord(const ledger::ProgressRecord &record) {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        if (!db_ || !is_open_)
            return dp::Result<void, dp::Error>::err(not_initialized("Database not open"));

        Statement stmt(db_, std::string("INSERT INTO progress_records (") + PROGRESS_COLUMNS +
                                ") VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?)");
        if (!stmt.ok())
            return dp::Result<void, dp::Error>::err(lastError("Failed to prepare progress insert"));

        stmt.bindText(1, record.id);
        stmt.bindText(2, record.scope_id);
        stmt.bindInt64(3, record.sequence);
        stmt.bindInt64(4, record.payload.reported_percent.hundredths());
        stmt.bindText(5, record.payload.report_date.toString());
        stmt.bindText(6, record.payload.remarks);
        stmt.bindText(7, record.actor_id);
        stmt.bindInt64(8, record.created_at.micros);
        stmt.bindText(9, record.prev_hash);
        stmt.bindText(10, record.record_hash);

        int rc = stmt.step();
        if (rc == SQLITE_DONE)
            return dp::Result<void, dp::Error>::ok();

        std::string msg = sqlite3_errmsg(db_);
        if ((rc & 0xFF) == SQLITE_CONSTRAINT && msg.find("report_date") != std::string::npos) {
            return dp::Result<void, dp::Error>::err(
                duplicate_record("Progress already reported for date " + record.payload.report_date.toString() +
                                 " on project " + record.scope_id));
        }
        return dp::Result<void, dp::Error>::err(storage_error("Progress insert failed: " + msg));
    }

    dp::Result<void, dp::Error> SqliteStore::insertRecord(const ledger::AuditRecord &record) {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        if (!db_ || !is_open_)
            return dp::Result<void, dp::Error>::err(not_initialized("Database not open"));

        auto blob = ledger::encodeDetail(record.payload.detail);
        if (!blob.is_ok())
            return dp::Result<void, dp::Error>::err(blob.error());

        Statement stmt(db_, std::string("INSERT INTO audit_records (") + AUDIT_COLUMNS +
                                ") VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)");
        if (!stmt.ok())
            return dp::Result<void, dp::Error>::err(lastError("Failed to prepare audit insert"));

        stmt.bindText(1, record.id);
        stmt.bindText(2, record.scope_id);
        stmt.bindInt64(3, record.sequence);
        stmt.bindText(4, record.actor_id);
        stmt.bindText(5, record.payload.action);
        stmt.bindText(6, record.payload.entity_type);
        stmt.bindText(7, record.payload.entity_id);
        stmt.bindText(8, ledger::detailKind(record.payload.detail));
        stmt.bindBlob(9, blob.value());
        stmt.bindText(10, record.payload.ip_address);
        stmt.bindText(11, record.payload.user_agent);
        stmt.bindInt64(12, record.created_at.micros);
        stmt.bindText(13, record.prev_hash);
        stmt.bindText(14, record.record_hash);

        if (stmt.step() != SQLITE_DONE)
            return dp::Result<void, dp::Error>::err(lastError("Audit insert failed"));
        return dp::Result<void, dp::Error>::ok();
    }

    template <>
    dp::Result<std::vector<ledger::ProgressRecord>, dp::Error>
    SqliteStore::listRecords<ledger::ProgressPayload>(const std::string &scope_id) {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        if (!db_ || !is_open_)
            return dp::Result<std::vector<ledger::ProgressRecord>, dp::Error>::err(
                not_initialized("Database not open"));

        Statement stmt(db_, std::string("SELECT ") + PROGRESS_COLUMNS +
                                " FROM progress_records WHERE scope_id = ? ORDER BY sequence ASC");
        if (!stmt.ok())
            return dp::Result<std::vector<ledger::ProgressRecord>, dp::Error>::err(lastError("Progress list failed"));
        stmt.bindText(1, scope_id);
        return collectRows<ledger::ProgressRecord>(stmt, readProgress, db_);
    }

    template <>
    dp::Result<std::vector<ledger::AuditRecord>, dp::Error>
    SqliteStore::listRecords<ledger::AuditPayload>(const std::string &scope_id) {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        if (!db_ || !is_open_)
            return dp::Result<std::vector<ledger::AuditRecord>, dp::Error>::err(not_initialized("Database not open"));

        Statement stmt(db_, std::string("SELECT ") + AUDIT_COLUMNS +
                                " FROM audit_records WHERE scope_id = ? ORDER BY sequence ASC");
        if (!stmt.ok())
            return dp::Result<std::vector<ledger::AuditRecord>, dp::Error>::err(lastError("Audit list failed"));
        stmt.bindText(1, scope_id);
        return collectRows<ledger::AuditRecord>(stmt, readAudit, db_);
    }

    template <>
    dp::Result<std::optional<ledger::ProgressRecord>, dp::Error>
    SqliteStore::latestRecord<ledger::ProgressPayload>(const std::string &scope_id) {
        using R = dp::Result<std::optional<ledger::ProgressRecord>, dp::Error>;
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        if (!db_ || !is_open_)
            return R::err(not_initialized("Database not open"));

        Statement stmt(db_, std::string("SELECT ") + PROGRESS_COLUMNS +
                                " FROM progress_records WHERE scope_id = ? ORDER BY sequence DESC LIMIT 1");
        if (!stmt.ok())
            return R::err(lastError("Progress head lookup failed"));
        stmt.bindText(1, scope_id);

        auto rows = collectRows<ledger::ProgressRecord>(stmt, readProgress, db_);
        if (!rows.is_ok())
            return R::err(rows.error());
        if (rows.value().empty())
            return R::ok(std::nullopt);
        return R::ok(rows.value().front());
    }

    template <>
    dp::Result<std::optional<ledger::AuditRecord>, dp::Error>
    SqliteStore::latestRecord<ledger::AuditPayload>(const std::string &scope_id) {
        using R = dp::Result<std::optional<ledger::AuditRecord>, dp::Error>;
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        if (!db_ || !is_open_)
            return R::err(not_initialized("Database not open"));

        Statement stmt(db_, std::string("SELECT ") + AUDIT_COLUMNS +
                                " FROM audit_records WHERE scope_id = ? ORDER BY sequence DESC LIMIT 1");
        if (!stmt.ok())
            return R::err(lastError("Audit head lookup failed"));
        stmt.bindText(1, scope_id);

        auto rows = collectRows<ledger::AuditRecord>(stmt, readAudit, db_);
        if (!rows.is_ok())
            return R::err(rows.error());
        if (rows.value().empty())
            return R::ok(std::nullopt);
        return R::ok(rows.value().front());
    }

    dp::Result<std::vector<std::string>, dp::Error> SqliteStore::progressScopes() {
        using R = dp::Result<std::vector<std::string>, dp::Error>;
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        if (!db_ || !is_open_)
            return R::err(not_initialized("Database not open"));

        Statement stmt(db_, "SELECT DISTINCT scope_id FROM progress_records ORDER BY scope_id");
        if (!stmt.ok())
            return R::err(lastError("Scope listing failed"));
        return collectRows<std::string>(
            stmt, [](const Statement &row) { return dp::Result<std::string, dp::Error>::ok(row.text(0)); }, db_);
    }

    // ===========================================
    // Audit queries
    // ===========================================

    dp::Result<std::vector<ledger::AuditRecord>, dp::Error> SqliteStore::queryAudit(const AuditFilter &filter) {
        using R = dp::Result<std::vector<ledger::AuditRecord>, dp::Error>;
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        if (!db_ || !is_open_)
            return R::err(not_initialized("Database not open"));

        auto where = auditWhere(filter);
        // SQLite treats a negative LIMIT as no limit
        where.params.push_back(filter.limit > 0 ? static_cast<int64_t>(filter.limit) : int64_t(-1));
        where.params.push_back(static_cast<int64_t>(std::max<int32_t>(filter.offset, 0)));

        Statement stmt(db_, std::string("SELECT ") + AUDIT_COLUMNS + " FROM audit_records" + where.sql +
                                " ORDER BY sequence DESC LIMIT ? OFFSET ?");
        if (!stmt.ok())
            return R::err(lastError("Audit query failed"));
        bindAll(stmt, where.params);
        return collectRows<ledger::AuditRecord>(stmt, readAudit, db_);
    }

    dp::Result<int64_t, dp::Error> SqliteStore::countAudit(const AuditFilter &filter) {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        if (!db_ || !is_open_)
            return dp::Result<int64_t, dp::Error>::err(not_initialized("Database not open"));

        auto where = auditWhere(filter);
        Statement stmt(db_, "SELECT COUNT(*) FROM audit_records" + where.sql);
        if (!stmt.ok())
            return dp::Result<int64_t, dp::Error>::err(lastError("Audit count failed"));
        bindAll(stmt, where.params);
        if (stmt.step() != SQLITE_ROW)
            return dp::Result<int64_t, dp::Error>::err(lastError("Audit count failed"));
        return dp::Result<int64_t, dp::Error>::ok(stmt.int64(0));
    }

    dp::Result<std::vector<std::pair<std::string, int64_t>>, dp::Error>
    SqliteStore::countAuditBy(AuditGrouping grouping, const std::optional<ledger::Timestamp> &since,
                              std::optional<int32_t> limit) {
        using Row = std::pair<std::string, int64_t>;
        using R = dp::Result<std::vector<Row>, dp::Error>;
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        if (!db_ || !is_open_)
            return R::err(not_initialized("Database not open"));

        std::string column;
        switch (grouping) {
        case AuditGrouping::Action:
            column = "action";
            break;
        case AuditGrouping::EntityType:
            column = "entity_type";
            break;
        case AuditGrouping::Actor:
            column = "actor_id";
            break;
        }

        std::vector<SqlParam> params{ledger::AUDIT_SCOPE_ID};
        std::string sql = "SELECT " + column + ", COUNT(*) AS n FROM audit_records WHERE scope_id = ?";
        if (since) {
            sql += " AND created_at >= ?";
            params.push_back(since->micros);
        }
        if (grouping == AuditGrouping::Actor)
            sql += " AND actor_id <> ''";
        sql += " GROUP BY " + column + " ORDER BY n DESC, " + column + " ASC";
        if (limit) {
            sql += " LIMIT ?";
            params.push_back(static_cast<int64_t>(*limit));
        }

        Statement stmt(db_, sql);
        if (!stmt.ok())
            return R::err(lastError("Audit grouping failed"));
        bindAll(stmt, params);
        return collectRows<Row>(
            stmt, [](const Statement &row) { return dp::Result<Row, dp::Error>::ok(Row{row.text(0), row.int64(1)}); },
            db_);
    }

    // ===========================================
    // Retention
    // ===========================================

    dp::Result<std::optional<RetentionCheckpoint>, dp::Error>
    SqliteStore::latestCheckpoint(ledger::RecordKind kind, const std::string &scope_id) {
        using R = dp::Result<std::optional<RetentionCheckpoint>, dp::Error>;
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        if (!db_ || !is_open_)
            return R::err(not_initialized("Database not open"));

        Statement stmt(db_, "SELECT purged_through_sequence, boundary_hash, cutoff, purged_at "
                            "FROM retention_checkpoints WHERE record_kind = ? AND scope_id = ? "
                            "ORDER BY purged_through_sequence DESC LIMIT 1");
        if (!stmt.ok())
            return R::err(lastError("Checkpoint lookup failed"));
        stmt.bindText(1, recordKindName(kind));
        stmt.bindText(2, scope_id);

        int rc = stmt.step();
        if (rc == SQLITE_DONE)
            return R::ok(std::nullopt);
        if (rc != SQLITE_ROW)
            return R::err(lastError("Checkpoint lookup failed"));

        RetentionCheckpoint checkpoint;
        checkpoint.kind = kind;
        checkpoint.scope_id = scope_id;
        checkpoint.purged_through_sequence = stmt.int64(0);
        checkpoint.boundary_hash = stmt.text(1);
        checkpoint.cutoff = ledger::Timestamp(stmt.int64(2));
        checkpoint.purged_at = ledger::Timestamp(stmt.int64(3));
        return R::ok(checkpoint);
    }

    dp::Result<void, dp::Error> SqliteStore::insertCheckpoint(const RetentionCheckpoint &checkpoint) {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        if (!db_ || !is_open_)
            return dp::Result<void, dp::Error>::err(not_initialized("Database not open"));

        Statement stmt(db_, "INSERT INTO retention_checkpoints (record_kind, scope_id, purged_through_sequence, "
                            "boundary_hash, cutoff, purged_at) VALUES (?, ?, ?, ?, ?, ?)");
        if (!stmt.ok())
            return dp::Result<void, dp::Error>::err(lastError("Failed to prepare checkpoint insert"));

        stmt.bindText(1, recordKindName(checkpoint.kind));
        stmt.bindText(2, checkpoint.scope_id);
        stmt.bindInt64(3, checkpoint.purged_through_sequence);
        stmt.bindText(4, checkpoint.boundary_hash);
        stmt.bindInt64(5, checkpoint.cutoff.micros);
        stmt.bindInt64(6, checkpoint.purged_at.micros);

        if (stmt.step() != SQLITE_DONE)
            return dp::Result<void, dp::Error>::err(lastError("Checkpoint insert failed"));
        return dp::Result<void, dp::Error>::ok();
    }

    dp::Result<std::optional<ledger::AuditRecord>, dp::Error>
    SqliteStore::lastAuditBefore(const ledger::Timestamp &cutoff) {
        using R = dp::Result<std::optional<ledger::AuditRecord>, dp::Error>;
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        if (!db_ || !is_open_)
            return R::err(not_initialized("Database not open"));

        Statement stmt(db_, std::string("SELECT ") + AUDIT_COLUMNS +
                                " FROM audit_records WHERE scope_id = ? AND created_at < ? "
                                "ORDER BY sequence DESC LIMIT 1");
        if (!stmt.ok())
            return R::err(lastError("Retention boundary lookup failed"));
        stmt.bindText(1, ledger::AUDIT_SCOPE_ID);
        stmt.bindInt64(2, cutoff.micros);

        auto rows = collectRows<ledger::AuditRecord>(stmt, readAudit, db_);
        if (!rows.is_ok())
            return R::err(rows.error());
        if (rows.value().empty())
            return R::ok(std::nullopt);
        return R::ok(rows.value().front());
    }

    dp::Result<int64_t, dp::Error> SqliteStore::deleteAuditThrough(int64_t sequence) {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        if (!db_ || !is_open_)
            return dp::Result<int64_t, dp::Error>::err(not_initialized("Database not open"));

        Statement stmt(db_, "DELETE FROM audit_records WHERE scope_id = ? AND sequence <= ?");
        if (!stmt.ok())
            return dp::Result<int64_t, dp::Error>::err(lastError("Failed to prepare audit purge"));
        stmt.bindText(1, ledger::AUDIT_SCOPE_ID);
        stmt.bindInt64(2, sequence);

        if (stmt.step() != SQLITE_DONE)
            return dp::Result<int64_t, dp::Error>::err(lastError("Audit purge failed"));
        return dp::Result<int64_t, dp::Error>::ok(static_cast<int64_t>(sqlite3_changes(db_)));
    }

    // ===========================================
    // Diagnostics and raw SQL
    // ===========================================

    bool SqliteStore::quickCheck() {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        if (!db_ || !is_open_)
            return false;

        Statement stmt(db_, "PRAGMA quick_check");
        if (!stmt.ok())
            return false;
        return stmt.step() == SQLITE_ROW && stmt.text(0) == "ok";
    }

    dp::Result<void, dp::Error> SqliteStore::executeSql(const std::string &sql) {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        if (!db_ || !is_open_)
            return dp::Result<void, dp::Error>::err(not_initialized("Database not open"));

        char *err_msg = nullptr;
        int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err_msg);
        if (rc != SQLITE_OK) {
            std::string msg = err_msg ? err_msg : "unknown error";
            sqlite3_free(err_msg);
            return dp::Result<void, dp::Error>::err(storage_error("SQL execution failed: " + msg));
        }
        return dp::Result<void, dp::Error>::ok();
    }

    dp::Result<int64_t, dp::Error> SqliteStore::executeUpdate(const std::string &sql,
                                                             const std::vector<std::string> &params) {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        if (!db_ || !is_open_)
            return dp::Result<int64_t, dp::Error>::err(not_initialized("Database not open"));

        Statement stmt(db_, sql);
        if (!stmt.ok())
            return dp::Result<int64_t, dp::Error>::err(lastError("Failed to prepare statement"));

        for (size_t i = 0; i < params.size(); ++i)
            stmt.bindText(static_cast<int>(i + 1), params[i]);

        if (stmt.step() != SQLITE_DONE)
            return dp::Result<int64_t, dp::Error>::err(lastError("Statement failed"));
        return dp::Result<int64_t, dp::Error>::ok(static_cast<int64_t>(sqlite3_changes(db_)));
    }

    dp::Result<void, dp::Error>
    SqliteStore::executeQuery(const std::string &sql,
                              std::function<void(const std::vector<std::string> &row)> callback) {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        if (!db_ || !is_open_)
            return dp::Result<void, dp::Error>::err(not_initialized("Database not open"));
        if (!callback)
            return dp::Result<void, dp::Error>::err(dp::Error::invalid_argument("Query callback is empty"));

        Statement stmt(db_, sql);
        if (!stmt.ok())
            return dp::Result<void, dp::Error>::err(lastError("Failed to prepare query"));

        int rc;
        while ((rc = stmt.step()) == SQLITE_ROW) {
            std::vector<std::string> row;
            int col_count = stmt.columnCount();
            for (int i = 0; i < col_count; ++i)
                row.push_back(stmt.text(i));
            callback(row);
        }
        if (rc != SQLITE_DONE)
            return dp::Result<void, dp::Error>::err(lastError("Query failed"));
        return dp::Result<void, dp::Error>::ok();
    }

} // namespace chainledger::storage
