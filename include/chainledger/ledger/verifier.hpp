#pragma once

#include <datapod/datapod.hpp>
#include <iostream>
#include <set>
#include <string>
#include <vector>

#include <chainledger/common/error.hpp>
#include <chainledger/storage/sqlite_store.hpp>

#include "hasher.hpp"
#include "record.hpp"
#include "scope.hpp"

namespace chainledger::ledger {

    enum class FindingKind { HashMismatch, LinkMismatch };

    inline const char *findingKindName(FindingKind kind) {
        return kind == FindingKind::HashMismatch ? "HashMismatch" : "LinkMismatch";
    }

    /// One point of divergence. For HashMismatch expected/actual are record hashes,
    /// for LinkMismatch they are prev_hash values.
    struct Finding {
        FindingKind kind = FindingKind::HashMismatch;
        std::string record_id;
        int64_t sequence = 0;
        std::string expected;
        std::string actual;
        std::string message;
    };

    struct VerificationResult {
        std::string scope_id;
        int64_t records_checked = 0;
        bool is_valid = true;
        std::vector<Finding> findings;
    };

    /// Record plus whether its own hash and its link both check out
    template <typename P> struct AnnotatedRecord {
        ChainRecord<P> record;
        bool hash_valid = true;
    };

    // ===========================================
    // ChainVerifier - replay and pinpoint divergence
    // ===========================================

    template <typename P> class ChainVerifier {
      public:
        using Record = ChainRecord<P>;
        using Traits = RecordTraits<P>;

        explicit ChainVerifier(storage::SqliteStore &store) : store_(store) {}

        /// Read-only. Findings are data; only a failure to read the chain is an error.
        dp::Result<VerificationResult, dp::Error> verify(const std::string &scope_id) {
            std::vector<Record> records;
            std::string initial_prev;
            auto loaded = load(scope_id, records, initial_prev);
            if (!loaded.is_ok())
                return dp::Result<VerificationResult, dp::Error>::err(loaded.error());

            auto result = replay(scope_id, records, initial_prev);
            if (result.is_ok() && !result.value().is_valid) {
                std::cout << "Integrity check failed for " << Traits::NAME << " chain " << scope_id << ": "
                          << result.value().findings.size() << " finding(s)" << std::endl;
            }
            return result;
        }

        /// Every record in sequence order, annotated for display
        dp::Result<std::vector<AnnotatedRecord<P>>, dp::Error> history(const std::string &scope_id) {
            using R = dp::Result<std::vector<AnnotatedRecord<P>>, dp::Error>;

            std::vector<Record> records;
            std::string initial_prev;
            auto loaded = load(scope_id, records, initial_prev);
            if (!loaded.is_ok())
                return R::err(loaded.error());

            auto result = replay(scope_id, records, initial_prev);
            if (!result.is_ok())
                return R::err(result.error());

            std::set<int64_t> broken;
            for (const auto &finding : result.value().findings)
                broken.insert(finding.sequence);

            std::vector<AnnotatedRecord<P>> annotated;
            annotated.reserve(records.size());
            for (auto &record : records) {
                bool valid = broken.count(record.sequence) == 0;
                annotated.push_back(AnnotatedRecord<P>{std::move(record), valid});
            }
            return R::ok(std::move(annotated));
        }

        /// Pure replay over records already in sequence order, starting from initial_prev
        static dp::Result<VerificationResult, dp::Error> replay(const std::string &scope_id,
                                                                const std::vector<Record> &records,
                                                                const std::string &initial_prev) {
            VerificationResult result;
            result.scope_id = scope_id;

            std::string expected_prev = initial_prev;
            for (const auto &record : records) {
                ++result.records_checked;

                if (!record.decode_error.empty()) {
                    result.findings.push_back(Finding{FindingKind::HashMismatch, record.id, record.sequence, "",
                                                      record.record_hash,
                                                      "Stored fields cannot be decoded: " + record.decode_error});
                } else {
                    auto expected_hash = recordHash(record, expected_prev);
                    if (!expected_hash.is_ok() && expected_hash.error().code != ERR_VALIDATION)
                        return dp::Result<VerificationResult, dp::Error>::err(expected_hash.error());

                    if (!expected_hash.is_ok()) {
                        // Stored fields no longer canonicalize (e.g. bytes rewritten to invalid UTF-8)
                        result.findings.push_back(Finding{FindingKind::HashMismatch, record.id, record.sequence, "",
                                                          record.record_hash,
                                                          std::string("Stored fields cannot be canonicalized: ") +
                                                              expected_hash.error().message.c_str()});
                    } else if (expected_hash.value() != record.record_hash) {
                        result.findings.push_back(Finding{FindingKind::HashMismatch, record.id, record.sequence,
                                                          expected_hash.value(), record.record_hash,
                                                          "Recomputed hash does not match stored record_hash"});
                    }
                }

                if (!expected_prev.empty() && record.prev_hash != expected_prev) {
                    result.findings.push_back(Finding{FindingKind::LinkMismatch, record.id, record.sequence,
                                                      expected_prev, record.prev_hash,
                                                      "prev_hash does not match the preceding record_hash"});
                }

                expected_prev = record.record_hash;
            }

            result.is_valid = result.findings.empty();
            return dp::Result<VerificationResult, dp::Error>::ok(std::move(result));
        }

      private:
        storage::SqliteStore &store_;

        /// Checkpoint and records come from one read transaction (one snapshot)
        dp::Result<void, dp::Error> load(const std::string &scope_id, std::vector<Record> &records,
                                         std::string &initial_prev) {
            auto tx = store_.beginTransaction(storage::SqliteStore::TxMode::Deferred);
            if (!tx->isActive())
                return dp::Result<void, dp::Error>::err(storage_error("Could not begin read transaction"));

            auto checkpoint = store_.latestCheckpoint(Traits::KIND, scope_id);
            if (!checkpoint.is_ok())
                return dp::Result<void, dp::Error>::err(checkpoint.error());
            initial_prev = checkpoint.value() ? checkpoint.value()->boundary_hash : EMPTY_PREV_HASH;

            auto listed = store_.listRecords<P>(scope_id);
            if (!listed.is_ok())
                return dp::Result<void, dp::Error>::err(listed.error());
            records = std::move(listed.value());

            return tx->commit();
        }
    };

} // namespace chainledger::ledger
