#include <chainledger/ledger/appender.hpp>
#include <chainledger/ledger/verifier.hpp>
#include <doctest/doctest.h>

#include "test_support.hpp"

using namespace chainledger;
using namespace chainledger::ledger;

namespace {

    struct ChainFixture {
        storage::SqliteStore store;
        ScopeLocks locks;
        std::vector<ProgressRecord> written;

        ChainFixture() {
            REQUIRE(store.open(":memory:").is_ok());
            REQUIRE(store.initializeCoreSchema().is_ok());

            AppendCoordinator<ProgressPayload> appender(store, locks,
                                                        test_support::fixedClock(test_support::at("2024-02-01")));
            for (const auto &[percent, date] : std::vector<std::pair<std::string, std::string>>{
                     {"10.0", "2024-01-01"}, {"35.0", "2024-01-15"}, {"60.5", "2024-01-20"}, {"75", "2024-01-25"}}) {
                auto record = appender.append("P", test_support::progress(percent, date), "U1");
                REQUIRE(record.is_ok());
                written.push_back(record.value());
            }
        }

        /// Lifts the immutability guard so a test can play the attacker
        void allowTampering() { REQUIRE(store.executeSql("DROP TRIGGER progress_records_no_update").is_ok()); }
    };

    /// Three audit records carrying field-change details, one second apart
    struct AuditChainFixture {
        storage::SqliteStore store;
        ScopeLocks locks;
        std::vector<AuditRecord> written;

        AuditChainFixture() {
            REQUIRE(store.open(":memory:").is_ok());
            REQUIRE(store.initializeCoreSchema().is_ok());

            AppendCoordinator<AuditPayload> appender(
                store, locks, test_support::steppingClock(test_support::at("2024-02-01", 9), 1000000));
            for (const char *status : {"planned", "active", "done"}) {
                auto payload = test_support::action("UPDATE_PROJECT", "project", "P",
                                                    test_support::changes({{"status", status}}));
                payload.ip_address = "203.0.113.7";
                auto record = appender.append(AUDIT_SCOPE_ID, payload, "U1");
                REQUIRE(record.is_ok());
                written.push_back(record.value());
            }
            REQUIRE(store.executeSql("DROP TRIGGER audit_records_no_update").is_ok());
        }

        void tamper(const std::string &sql) { REQUIRE(store.executeSql(sql).is_ok()); }

        VerificationResult verify() {
            ChainVerifier<AuditPayload> verifier(store);
            auto result = verifier.verify(AUDIT_SCOPE_ID);
            REQUIRE(result.is_ok());
            return result.value();
        }
    };

    std::string hexBlob(const std::vector<uint8_t> &bytes) {
        static const char *digits = "0123456789abcdef";
        std::string out = "X'";
        for (uint8_t b : bytes) {
            out += digits[b >> 4];
            out += digits[b & 0x0F];
        }
        return out + "'";
    }

    void checkSingleHashMismatch(const VerificationResult &result, const AuditRecord &record) {
        CHECK_FALSE(result.is_valid);
        CHECK(result.records_checked == 3);
        REQUIRE(result.findings.size() == 1);
        CHECK(result.findings[0].kind == FindingKind::HashMismatch);
        CHECK(result.findings[0].sequence == record.sequence);
        CHECK(result.findings[0].record_id == record.id);
        CHECK(result.findings[0].actual == record.record_hash);
    }

} // namespace

TEST_SUITE("Chain verifier") {
    TEST_CASE("Empty scope is valid") {
        storage::SqliteStore store;
        REQUIRE(store.open(":memory:").is_ok());
        REQUIRE(store.initializeCoreSchema().is_ok());

        ChainVerifier<ProgressPayload> verifier(store);
        auto result = verifier.verify("nothing-here");
        REQUIRE(result.is_ok());
        CHECK(result.value().is_valid);
        CHECK(result.value().records_checked == 0);
        CHECK(result.value().findings.empty());
        CHECK(result.value().scope_id == "nothing-here");
    }

    TEST_CASE("Untouched chain is valid") {
        ChainFixture fx;
        ChainVerifier<ProgressPayload> verifier(fx.store);

        auto result = verifier.verify("P");
        REQUIRE(result.is_ok());
        CHECK(result.value().is_valid);
        CHECK(result.value().records_checked == 4);
        CHECK(fx.written[0].record_hash == test_support::P_HASH_1);
        CHECK(fx.written[1].record_hash == test_support::P_HASH_2);

        // Repeated verification gives the same answer and changes nothing
        auto again = verifier.verify("P");
        REQUIRE(again.is_ok());
        CHECK(again.value().is_valid);
        CHECK(fx.store.listRecords<ProgressPayload>("P").value().size() == 4);
    }

    TEST_CASE("Edited payload is a hash mismatch at that record") {
        ChainFixture fx;
        fx.allowTampering();
        REQUIRE(fx.store
                    .executeUpdate("UPDATE progress_records SET reported_percent = ? "
                                   "WHERE scope_id = ? AND sequence = ?",
                                   {"9999", "P", "2"})
                    .value() == 1);

        ChainVerifier<ProgressPayload> verifier(fx.store);
        auto result = verifier.verify("P");
        REQUIRE(result.is_ok());
        CHECK_FALSE(result.value().is_valid);
        CHECK(result.value().records_checked == 4);
        REQUIRE(result.value().findings.size() == 1);

        const auto &finding = result.value().findings[0];
        CHECK(finding.kind == FindingKind::HashMismatch);
        CHECK(finding.sequence == 2);
        CHECK(finding.record_id == fx.written[1].id);
        CHECK(finding.actual == test_support::P_HASH_2);
        CHECK(finding.expected != test_support::P_HASH_2);
        CHECK(CanonicalHasher::isDigest(finding.expected));
    }

    TEST_CASE("Edited payload with a recomputed hash breaks the next link") {
        ChainFixture fx;
        fx.allowTampering();

        ProgressRecord forged = fx.written[1];
        forged.payload.reported_percent = Percent::fromHundredths(9999);
        auto forged_hash = recordHash(forged, forged.prev_hash);
        REQUIRE(forged_hash.is_ok());

        REQUIRE(fx.store
                    .executeUpdate("UPDATE progress_records SET reported_percent = ?, record_hash = ? "
                                   "WHERE scope_id = ? AND sequence = ?",
                                   {"9999", forged_hash.value(), "P", "2"})
                    .value() == 1);

        ChainVerifier<ProgressPayload> verifier(fx.store);
        auto result = verifier.verify("P");
        REQUIRE(result.is_ok());
        CHECK_FALSE(result.value().is_valid);
        REQUIRE(result.value().findings.size() == 2);

        bool saw_hash = false;
        bool saw_link = false;
        for (const auto &finding : result.value().findings) {
            CHECK(finding.sequence == 3);
            CHECK(finding.record_id == fx.written[2].id);
            if (finding.kind == FindingKind::HashMismatch)
                saw_hash = true;
            if (finding.kind == FindingKind::LinkMismatch) {
                saw_link = true;
                CHECK(finding.expected == forged_hash.value());
                CHECK(finding.actual == test_support::P_HASH_2);
            }
        }
        CHECK(saw_hash);
        CHECK(saw_link);
    }

    TEST_CASE("Edited prev_hash alone is a link mismatch") {
        ChainFixture fx;
        fx.allowTampering();
        const std::string bogus(64, 'a');
        REQUIRE(fx.store
                    .executeUpdate("UPDATE progress_records SET prev_hash = ? WHERE scope_id = ? AND sequence = ?",
                                   {bogus, "P", "3"})
                    .value() == 1);

        ChainVerifier<ProgressPayload> verifier(fx.store);
        auto result = verifier.verify("P");
        REQUIRE(result.is_ok());
        REQUIRE(result.value().findings.size() == 1);
        CHECK(result.value().findings[0].kind == FindingKind::LinkMismatch);
        CHECK(result.value().findings[0].sequence == 3);
        CHECK(result.value().findings[0].expected == fx.written[1].record_hash);
        CHECK(result.value().findings[0].actual == bogus);
        CHECK(std::string(findingKindName(result.value().findings[0].kind)) == "LinkMismatch");
    }

    TEST_CASE("History annotates records with findings") {
        ChainFixture fx;
        fx.allowTampering();
        REQUIRE(fx.store
                    .executeUpdate("UPDATE progress_records SET report_date = ? WHERE scope_id = ? AND sequence = ?",
                                   {"2024-01-02", "P", "1"})
                    .is_ok());

        ChainVerifier<ProgressPayload> verifier(fx.store);
        auto history = verifier.history("P");
        REQUIRE(history.is_ok());
        REQUIRE(history.value().size() == 4);
        CHECK_FALSE(history.value()[0].hash_valid);
        CHECK(history.value()[0].record.payload.report_date == Date(2024, 1, 2));
        CHECK(history.value()[1].hash_valid);
        CHECK(history.value()[2].hash_valid);
        CHECK(history.value()[3].hash_valid);
    }

    TEST_CASE("Malformed stored report_date is reported, not an error") {
        ChainFixture fx;
        fx.allowTampering();
        REQUIRE(fx.store
                    .executeUpdate("UPDATE progress_records SET report_date = ? WHERE scope_id = ? AND sequence = ?",
                                   {"2024-1-5", "P", "2"})
                    .value() == 1);

        ChainVerifier<ProgressPayload> verifier(fx.store);
        auto result = verifier.verify("P");
        REQUIRE(result.is_ok());
        CHECK_FALSE(result.value().is_valid);
        CHECK(result.value().records_checked == 4);
        REQUIRE(result.value().findings.size() == 1);

        const auto &finding = result.value().findings[0];
        CHECK(finding.kind == FindingKind::HashMismatch);
        CHECK(finding.sequence == 2);
        CHECK(finding.expected == "");
        CHECK(finding.actual == test_support::P_HASH_2);
        CHECK(finding.message.find("2024-1-5") != std::string::npos);

        // The rest of the chain still links through the stored hash
        auto history = verifier.history("P");
        REQUIRE(history.is_ok());
        REQUIRE(history.value().size() == 4);
        CHECK(history.value()[0].hash_valid);
        CHECK_FALSE(history.value()[1].hash_valid);
        CHECK_FALSE(history.value()[1].record.decode_error.empty());
        CHECK(history.value()[2].hash_valid);
        CHECK(history.value()[3].hash_valid);
    }

    TEST_CASE("Audit chain tampering") {
        AuditChainFixture fx;
        CHECK(fx.verify().is_valid);

        SUBCASE("Edited action") {
            fx.tamper("UPDATE audit_records SET action = 'DELETE_PROJECT' WHERE sequence = 2");
            checkSingleHashMismatch(fx.verify(), fx.written[1]);
        }

        SUBCASE("Detail swapped for another valid detail") {
            auto other = encodeDetail(test_support::changes({{"status", "cancelled"}}));
            REQUIRE(other.is_ok());
            fx.tamper("UPDATE audit_records SET detail = " + hexBlob(other.value()) + " WHERE sequence = 2");

            auto result = fx.verify();
            checkSingleHashMismatch(result, fx.written[1]);
            CHECK(CanonicalHasher::isDigest(result.findings[0].expected));
        }

        SUBCASE("Edited created_at") {
            fx.tamper("UPDATE audit_records SET created_at = created_at + 1 WHERE sequence = 3");
            checkSingleHashMismatch(fx.verify(), fx.written[2]);
        }

        SUBCASE("Detail blob that no longer decodes") {
            fx.tamper("UPDATE audit_records SET detail = X'00' WHERE sequence = 2");
            auto result = fx.verify();
            checkSingleHashMismatch(result, fx.written[1]);
            CHECK(result.findings[0].expected == "");
        }

        SUBCASE("Unknown detail kind") {
            fx.tamper("UPDATE audit_records SET detail_kind = 'signature' WHERE sequence = 1");
            auto result = fx.verify();
            checkSingleHashMismatch(result, fx.written[0]);
            CHECK(result.findings[0].expected == "");
            CHECK(result.findings[0].message.find("signature") != std::string::npos);
        }

        SUBCASE("Request metadata is outside the hash") {
            fx.tamper("UPDATE audit_records SET ip_address = '192.0.2.1' WHERE sequence = 2");
            CHECK(fx.verify().is_valid);
        }
    }

    TEST_CASE("Replay over records in memory") {
        ChainFixture fx;

        auto clean = ChainVerifier<ProgressPayload>::replay("P", fx.written, EMPTY_PREV_HASH);
        REQUIRE(clean.is_ok());
        CHECK(clean.value().is_valid);

        SUBCASE("Starting mid-chain needs the boundary hash") {
            std::vector<ProgressRecord> tail(fx.written.begin() + 2, fx.written.end());
            auto seeded = ChainVerifier<ProgressPayload>::replay("P", tail, fx.written[1].record_hash);
            REQUIRE(seeded.is_ok());
            CHECK(seeded.value().is_valid);
            CHECK(seeded.value().records_checked == 2);

            // Without the boundary the first hash cannot be reproduced
            auto unseeded = ChainVerifier<ProgressPayload>::replay("P", tail, EMPTY_PREV_HASH);
            REQUIRE(unseeded.is_ok());
            CHECK_FALSE(unseeded.value().is_valid);
        }

        SUBCASE("Fields that no longer canonicalize are reported") {
            auto broken = fx.written;
            broken[0].actor_id = "bad \xC3";
            auto result = ChainVerifier<ProgressPayload>::replay("P", broken, EMPTY_PREV_HASH);
            REQUIRE(result.is_ok());
            REQUIRE(result.value().findings.size() == 1);
            CHECK(result.value().findings[0].kind == FindingKind::HashMismatch);
            CHECK(result.value().findings[0].sequence == 1);
        }
    }
}
