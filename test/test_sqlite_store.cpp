#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <chainledger/storage/sqlite_store.hpp>

#include "test_support.hpp"

using namespace chainledger;
using namespace chainledger::storage;
using chainledger::ledger::AuditRecord;
using chainledger::ledger::ProgressRecord;

// Test helper: cleanup database file
struct TestDB {
    std::string path;
    SqliteStore store;

    explicit TestDB(const std::string &name) : path(name + ".db") { test_support::removeDatabase(path); }

    ~TestDB() {
        store.close();
        test_support::removeDatabase(path);
    }
};

namespace {

    ProgressRecord progressRow(const std::string &scope, int64_t sequence, const std::string &date,
                               const std::string &prev_hash, const std::string &record_hash) {
        ProgressRecord record;
        record.id = ledger::generateRecordId();
        record.scope_id = scope;
        record.sequence = sequence;
        record.payload = test_support::progress("25.5", date, "row " + std::to_string(sequence));
        record.actor_id = "U1";
        record.created_at = test_support::at(date, 12);
        record.prev_hash = prev_hash;
        record.record_hash = record_hash;
        return record;
    }

    AuditRecord auditRow(int64_t sequence, const std::string &action, const std::string &actor,
                         const ledger::Timestamp &created_at, ledger::AuditDetail detail = {}) {
        AuditRecord record;
        record.id = ledger::generateRecordId();
        record.scope_id = ledger::AUDIT_SCOPE_ID;
        record.sequence = sequence;
        record.actor_id = actor;
        record.payload = test_support::action(action, sequence % 2 ? "project" : "user", "E" + std::to_string(sequence),
                                              std::move(detail));
        record.created_at = created_at;
        record.prev_hash = "prev-" + std::to_string(sequence);
        record.record_hash = "hash-" + std::to_string(sequence);
        return record;
    }

} // namespace

// ===========================================
// Core database operations
// ===========================================

TEST_CASE("Database lifecycle") {
    TestDB test_db("test_chainledger_lifecycle");

    SUBCASE("Open and close") {
        CHECK(test_db.store.open(test_db.path).is_ok());
        CHECK(test_db.store.isOpen());
        CHECK(test_db.store.path() == test_db.path);

        test_db.store.close();
        CHECK_FALSE(test_db.store.isOpen());
    }

    SUBCASE("Open with options") {
        OpenOptions opts;
        opts.enable_wal = true;
        opts.enable_foreign_keys = true;
        opts.sync_mode = OpenOptions::Synchronous::FULL;
        opts.busy_timeout_ms = 3000;

        CHECK(test_db.store.open(test_db.path, opts).is_ok());
        CHECK(test_db.store.isOpen());
    }

    SUBCASE("Opening twice is an error") {
        REQUIRE(test_db.store.open(test_db.path).is_ok());
        CHECK_FALSE(test_db.store.open(test_db.path).is_ok());
    }

    SUBCASE("Initialize core schema") {
        REQUIRE(test_db.store.open(test_db.path).is_ok());
        CHECK(test_db.store.initializeCoreSchema().is_ok());
        CHECK(test_db.store.schemaVersion() == SqliteStore::SCHEMA_VERSION);

        // Should be idempotent
        CHECK(test_db.store.initializeCoreSchema().is_ok());
        CHECK(test_db.store.schemaVersion() == SqliteStore::SCHEMA_VERSION);
        CHECK(test_db.store.quickCheck());
    }

    SUBCASE("Records survive reopening") {
        REQUIRE(test_db.store.open(test_db.path).is_ok());
        REQUIRE(test_db.store.initializeCoreSchema().is_ok());
        REQUIRE(test_db.store.insertRecord(progressRow("P", 1, "2024-01-01", "", "h1")).is_ok());
        test_db.store.close();

        REQUIRE(test_db.store.open(test_db.path).is_ok());
        REQUIRE(test_db.store.initializeCoreSchema().is_ok());
        auto rows = test_db.store.listRecords<ledger::ProgressPayload>("P");
        REQUIRE(rows.is_ok());
        CHECK(rows.value().size() == 1);
    }
}

TEST_CASE("Operations on a closed store") {
    SqliteStore store;
    CHECK_FALSE(store.isOpen());

    auto listed = store.listRecords<ledger::ProgressPayload>("P");
    CHECK_FALSE(listed.is_ok());
    CHECK(listed.error().code == ERR_NOT_INITIALIZED);
    CHECK_FALSE(store.initializeCoreSchema().is_ok());
    CHECK_FALSE(store.insertRecord(progressRow("P", 1, "2024-01-01", "", "h1")).is_ok());
    CHECK_FALSE(store.quickCheck());
}

// ===========================================
// Chain records
// ===========================================

TEST_CASE("Progress records") {
    SqliteStore store;
    REQUIRE(store.open(":memory:").is_ok());
    REQUIRE(store.initializeCoreSchema().is_ok());

    auto first = progressRow("P", 1, "2024-01-01", "", "h1");
    auto second = progressRow("P", 2, "2024-01-15", "h1", "h2");
    REQUIRE(store.insertRecord(first).is_ok());
    REQUIRE(store.insertRecord(second).is_ok());

    SUBCASE("List in sequence order with every field restored") {
        auto rows = store.listRecords<ledger::ProgressPayload>("P");
        REQUIRE(rows.is_ok());
        REQUIRE(rows.value().size() == 2);

        const auto &row = rows.value()[0];
        CHECK(row.id == first.id);
        CHECK(row.sequence == 1);
        CHECK(row.payload.reported_percent.hundredths() == 2550);
        CHECK(row.payload.report_date == ledger::Date(2024, 1, 1));
        CHECK(row.payload.remarks == "row 1");
        CHECK(row.actor_id == "U1");
        CHECK(row.created_at == first.created_at);
        CHECK(row.prev_hash == "");
        CHECK(row.record_hash == "h1");
        CHECK(rows.value()[1].sequence == 2);
    }

    SUBCASE("Latest record") {
        auto head = store.latestRecord<ledger::ProgressPayload>("P");
        REQUIRE(head.is_ok());
        REQUIRE(head.value().has_value());
        CHECK(head.value()->record_hash == "h2");

        auto none = store.latestRecord<ledger::ProgressPayload>("missing");
        REQUIRE(none.is_ok());
        CHECK_FALSE(none.value().has_value());
    }

    SUBCASE("One report per project and date") {
        auto again = store.insertRecord(progressRow("P", 3, "2024-01-15", "h2", "h3"));
        CHECK_FALSE(again.is_ok());
        CHECK(again.error().code == ERR_DUPLICATE_RECORD);

        // Same date on another project is fine
        CHECK(store.insertRecord(progressRow("Q", 1, "2024-01-15", "", "q1")).is_ok());
    }

    SUBCASE("Fork guard on sequence and predecessor") {
        auto same_sequence = store.insertRecord(progressRow("P", 2, "2024-01-20", "h1", "x"));
        CHECK_FALSE(same_sequence.is_ok());
        CHECK(same_sequence.error().code == ERR_STORAGE);

        auto same_prev = store.insertRecord(progressRow("P", 3, "2024-01-21", "h1", "y"));
        CHECK_FALSE(same_prev.is_ok());
        CHECK(same_prev.error().code == ERR_STORAGE);
    }

    SUBCASE("Percent outside storage range is refused") {
        auto row = progressRow("P", 3, "2024-01-22", "h2", "h3");
        row.payload.reported_percent = ledger::Percent::fromHundredths(10001);
        CHECK_FALSE(store.insertRecord(row).is_ok());
    }

    SUBCASE("Progress scopes") {
        REQUIRE(store.insertRecord(progressRow("A", 1, "2024-01-01", "", "a1")).is_ok());
        auto scopes = store.progressScopes();
        REQUIRE(scopes.is_ok());
        CHECK(scopes.value() == std::vector<std::string>{"A", "P"});
    }
}

TEST_CASE("Audit records") {
    SqliteStore store;
    REQUIRE(store.open(":memory:").is_ok());
    REQUIRE(store.initializeCoreSchema().is_ok());

    ledger::MediaDetail media;
    media.project_id = dp::String("P");
    media.media_type = dp::String("photo");
    media.storage_key = dp::String("media/P/1.jpg");

    auto record = auditRow(1, "UPLOAD_MEDIA", "U1", test_support::at("2024-01-01", 8), media);
    record.payload.ip_address = "192.0.2.1";
    record.payload.user_agent = "field-app/2.1";
    REQUIRE(store.insertRecord(record).is_ok());
    REQUIRE(store.insertRecord(auditRow(2, "DELETE_USER", "", test_support::at("2024-01-02"), ledger::DeletionDetail{}))
                .is_ok());

    auto rows = store.listRecords<ledger::AuditPayload>(ledger::AUDIT_SCOPE_ID);
    REQUIRE(rows.is_ok());
    REQUIRE(rows.value().size() == 2);

    const auto &row = rows.value()[0];
    CHECK(row.payload.action == "UPLOAD_MEDIA");
    CHECK(row.payload.entity_type == "project");
    CHECK(row.payload.entity_id == "E1");
    CHECK(row.payload.ip_address == "192.0.2.1");
    CHECK(row.payload.user_agent == "field-app/2.1");
    const auto *restored = std::get_if<ledger::MediaDetail>(&row.payload.detail);
    REQUIRE(restored != nullptr);
    CHECK(test_support::str(restored->storage_key) == "media/P/1.jpg");

    CHECK(std::holds_alternative<ledger::DeletionDetail>(rows.value()[1].payload.detail));
    CHECK(rows.value()[1].actor_id.empty());
}

// ===========================================
// Immutability
// ===========================================

TEST_CASE("Stored records are immutable") {
    SqliteStore store;
    REQUIRE(store.open(":memory:").is_ok());
    REQUIRE(store.initializeCoreSchema().is_ok());
    REQUIRE(store.insertRecord(progressRow("P", 1, "2024-01-01", "", "h1")).is_ok());
    REQUIRE(store.insertRecord(auditRow(1, "CREATE", "U1", test_support::at("2024-01-01"))).is_ok());

    CHECK_FALSE(store.executeUpdate("UPDATE progress_records SET remarks = ?", {"edited"}).is_ok());
    CHECK_FALSE(store.executeUpdate("DELETE FROM progress_records WHERE scope_id = ?", {"P"}).is_ok());
    CHECK_FALSE(store.executeUpdate("UPDATE audit_records SET action = ?", {"READ"}).is_ok());
    CHECK_FALSE(store.executeUpdate("DELETE FROM audit_records WHERE sequence = ?", {"1"}).is_ok());

    auto rows = store.listRecords<ledger::ProgressPayload>("P");
    REQUIRE(rows.is_ok());
    CHECK(rows.value()[0].payload.remarks == "row 1");
    CHECK(store.listRecords<ledger::AuditPayload>(ledger::AUDIT_SCOPE_ID).value().size() == 1);
}

// ===========================================
// Transactions
// ===========================================

TEST_CASE("Transaction guard") {
    SqliteStore store;
    REQUIRE(store.open(":memory:").is_ok());
    REQUIRE(store.initializeCoreSchema().is_ok());

    SUBCASE("Commit persists") {
        auto tx = store.beginTransaction(SqliteStore::TxMode::Immediate);
        REQUIRE(tx->isActive());
        REQUIRE(store.insertRecord(progressRow("P", 1, "2024-01-01", "", "h1")).is_ok());
        CHECK(tx->commit().is_ok());
        CHECK_FALSE(tx->isActive());
        CHECK(store.listRecords<ledger::ProgressPayload>("P").value().size() == 1);
    }

    SUBCASE("Explicit rollback discards") {
        auto tx = store.beginTransaction(SqliteStore::TxMode::Immediate);
        REQUIRE(store.insertRecord(progressRow("P", 1, "2024-01-01", "", "h1")).is_ok());
        tx->rollback();
        CHECK(store.listRecords<ledger::ProgressPayload>("P").value().empty());
    }

    SUBCASE("Destruction without commit discards") {
        {
            auto tx = store.beginTransaction();
            REQUIRE(store.insertRecord(progressRow("P", 1, "2024-01-01", "", "h1")).is_ok());
        }
        CHECK(store.listRecords<ledger::ProgressPayload>("P").value().empty());
    }

    SUBCASE("Commit twice is an error") {
        auto tx = store.beginTransaction();
        CHECK(tx->commit().is_ok());
        CHECK_FALSE(tx->commit().is_ok());
    }
}

// ===========================================
// Audit queries
// ===========================================

TEST_CASE("Audit queries") {
    SqliteStore store;
    REQUIRE(store.open(":memory:").is_ok());
    REQUIRE(store.initializeCoreSchema().is_ok());

    // Odd sequences are projects, even are users
    const char *actions[] = {"CREATE", "UPDATE", "UPDATE", "DELETE", "UPDATE", "CREATE"};
    const char *actors[] = {"U1", "U2", "U1", "", "U1", "U3"};
    for (int i = 0; i < 6; ++i) {
        REQUIRE(store.insertRecord(auditRow(i + 1, actions[i], actors[i], test_support::at("2024-01-01", i))).is_ok());
    }

    SUBCASE("No filter, newest first") {
        AuditFilter filter;
        auto rows = store.queryAudit(filter);
        REQUIRE(rows.is_ok());
        REQUIRE(rows.value().size() == 6);
        CHECK(rows.value().front().sequence == 6);
        CHECK(rows.value().back().sequence == 1);
        CHECK(store.countAudit(filter).value() == 6);
    }

    SUBCASE("Filters combine") {
        AuditFilter filter;
        filter.action = "UPDATE";
        filter.actor_id = "U1";
        auto rows = store.queryAudit(filter);
        REQUIRE(rows.is_ok());
        REQUIRE(rows.value().size() == 2);
        CHECK(rows.value()[0].sequence == 5);
        CHECK(rows.value()[1].sequence == 3);
    }

    SUBCASE("Entity filters") {
        AuditFilter filter;
        filter.entity_type = "user";
        CHECK(store.countAudit(filter).value() == 3);

        filter.entity_id = "E4";
        auto rows = store.queryAudit(filter);
        REQUIRE(rows.value().size() == 1);
        CHECK(rows.value()[0].payload.action == "DELETE");
    }

    SUBCASE("Time range is inclusive start, exclusive end") {
        AuditFilter filter;
        filter.created_from = test_support::at("2024-01-01", 2);
        filter.created_to = test_support::at("2024-01-01", 4);
        auto rows = store.queryAudit(filter);
        REQUIRE(rows.value().size() == 2);
        CHECK(rows.value()[0].sequence == 4);
        CHECK(rows.value()[1].sequence == 3);
    }

    SUBCASE("Non-positive limit returns every row") {
        AuditFilter filter;
        filter.limit = -5;
        filter.offset = 2;
        auto rows = store.queryAudit(filter);
        REQUIRE(rows.is_ok());
        REQUIRE(rows.value().size() == 4);
        CHECK(rows.value().front().sequence == 4);
        CHECK(rows.value().back().sequence == 1);
    }

    SUBCASE("Paging") {
        AuditFilter filter;
        filter.limit = 2;
        filter.offset = 1;
        auto rows = store.queryAudit(filter);
        REQUIRE(rows.value().size() == 2);
        CHECK(rows.value()[0].sequence == 5);
        CHECK(rows.value()[1].sequence == 4);
        // Count ignores paging
        CHECK(store.countAudit(filter).value() == 6);
    }

    SUBCASE("Grouped counts") {
        auto by_action = store.countAuditBy(AuditGrouping::Action, std::nullopt);
        REQUIRE(by_action.is_ok());
        REQUIRE(by_action.value().size() == 3);
        CHECK(by_action.value()[0] == std::make_pair(std::string("UPDATE"), int64_t(3)));
        CHECK(by_action.value()[1] == std::make_pair(std::string("CREATE"), int64_t(2)));
        CHECK(by_action.value()[2] == std::make_pair(std::string("DELETE"), int64_t(1)));

        auto actors_top = store.countAuditBy(AuditGrouping::Actor, std::nullopt, 2);
        REQUIRE(actors_top.is_ok());
        REQUIRE(actors_top.value().size() == 2);
        CHECK(actors_top.value()[0].first == "U1");
        CHECK(actors_top.value()[0].second == 3);
        CHECK(actors_top.value()[1].first == "U2");

        auto recent = store.countAuditBy(AuditGrouping::EntityType, test_support::at("2024-01-01", 3));
        REQUIRE(recent.is_ok());
        CHECK(recent.value() == std::vector<std::pair<std::string, int64_t>>{{"user", 2}, {"project", 1}});
    }
}

// ===========================================
// Retention checkpoints
// ===========================================

TEST_CASE("Retention checkpoints") {
    SqliteStore store;
    REQUIRE(store.open(":memory:").is_ok());
    REQUIRE(store.initializeCoreSchema().is_ok());
    for (int i = 1; i <= 4; ++i)
        REQUIRE(store.insertRecord(auditRow(i, "CREATE", "U1", test_support::at("2024-01-0" + std::to_string(i))))
                    .is_ok());

    auto none = store.latestCheckpoint(ledger::RecordKind::Audit, ledger::AUDIT_SCOPE_ID);
    REQUIRE(none.is_ok());
    CHECK_FALSE(none.value().has_value());

    auto boundary = store.lastAuditBefore(test_support::at("2024-01-03"));
    REQUIRE(boundary.is_ok());
    REQUIRE(boundary.value().has_value());
    CHECK(boundary.value()->sequence == 2);

    SUBCASE("Deletion needs a covering checkpoint") {
        CHECK_FALSE(store.deleteAuditThrough(2).is_ok());

        RetentionCheckpoint checkpoint;
        checkpoint.kind = ledger::RecordKind::Audit;
        checkpoint.scope_id = ledger::AUDIT_SCOPE_ID;
        checkpoint.purged_through_sequence = 2;
        checkpoint.boundary_hash = "hash-2";
        checkpoint.cutoff = test_support::at("2024-01-03");
        checkpoint.purged_at = test_support::at("2024-02-01");
        REQUIRE(store.insertCheckpoint(checkpoint).is_ok());

        auto deleted = store.deleteAuditThrough(2);
        REQUIRE(deleted.is_ok());
        CHECK(deleted.value() == 2);
        CHECK(store.listRecords<ledger::AuditPayload>(ledger::AUDIT_SCOPE_ID).value().size() == 2);

        // Records past the checkpoint stay protected
        CHECK_FALSE(store.deleteAuditThrough(3).is_ok());

        auto latest = store.latestCheckpoint(ledger::RecordKind::Audit, ledger::AUDIT_SCOPE_ID);
        REQUIRE(latest.is_ok());
        REQUIRE(latest.value().has_value());
        CHECK(latest.value()->purged_through_sequence == 2);
        CHECK(latest.value()->boundary_hash == "hash-2");
        CHECK(latest.value()->cutoff == test_support::at("2024-01-03"));

        // Checkpoints are immutable too
        CHECK_FALSE(store.executeSql("DELETE FROM retention_checkpoints").is_ok());
        CHECK_FALSE(store.executeUpdate("UPDATE retention_checkpoints SET boundary_hash = ?", {"x"}).is_ok());
    }
}

// ===========================================
// Raw SQL access
// ===========================================

TEST_CASE("Raw SQL helpers") {
    SqliteStore store;
    REQUIRE(store.open(":memory:").is_ok());
    REQUIRE(store.initializeCoreSchema().is_ok());

    CHECK(store.executeSql("CREATE TABLE notes (k TEXT, v TEXT)").is_ok());
    CHECK(store.executeUpdate("INSERT INTO notes VALUES (?, ?)", {"a", "1"}).value() == 1);
    CHECK(store.executeUpdate("INSERT INTO notes VALUES (?, NULL)", {"b"}).value() == 1);

    std::vector<std::vector<std::string>> seen;
    auto queried = store.executeQuery("SELECT k, v FROM notes ORDER BY k",
                                      [&seen](const std::vector<std::string> &row) { seen.push_back(row); });
    REQUIRE(queried.is_ok());
    REQUIRE(seen.size() == 2);
    CHECK(seen[0] == std::vector<std::string>{"a", "1"});
    CHECK(seen[1] == std::vector<std::string>{"b", ""});

    CHECK_FALSE(store.executeSql("NOT SQL AT ALL").is_ok());
    CHECK_FALSE(store.executeQuery("SELECT 1", nullptr).is_ok());
}
