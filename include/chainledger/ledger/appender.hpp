#pragma once

#include <datapod/datapod.hpp>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

#include <chainledger/common/error.hpp>
#include <chainledger/storage/sqlite_store.hpp>

#include "hasher.hpp"
#include "record.hpp"
#include "scope.hpp"
#include "scope_lock.hpp"

namespace chainledger::ledger {

    // ===========================================
    // AppendCoordinator - read head, link, persist
    // ===========================================

    /// Appends records of one kind. For a given scope the read of the chain head and the
    /// insert of the new record happen under the scope lock and one immediate transaction,
    /// so concurrent writers can never both link to the same predecessor.
    template <typename P> class AppendCoordinator {
      public:
        using Record = ChainRecord<P>;
        using Traits = RecordTraits<P>;

        AppendCoordinator(storage::SqliteStore &store, ScopeLocks &locks, Clock clock,
                          std::shared_ptr<const ScopeCatalog> catalog = nullptr)
            : store_(store), locks_(locks), clock_(clock ? std::move(clock) : systemClock()),
              catalog_(std::move(catalog)) {}

        /// Exactly one record written on success, nothing on failure. Not idempotent.
        dp::Result<Record, dp::Error> append(const std::string &scope_id, const P &payload,
                                             const std::string &actor_id) {
            auto scope_lock = locks_.acquire(Traits::lockKey(scope_id));
            auto tx = store_.beginTransaction(storage::SqliteStore::TxMode::Immediate);
            if (!tx->isActive())
                return dp::Result<Record, dp::Error>::err(storage_error("Could not begin write transaction"));

            auto record = appendLocked(scope_id, payload, actor_id);
            if (!record.is_ok())
                return record;

            auto committed = tx->commit();
            if (!committed.is_ok())
                return dp::Result<Record, dp::Error>::err(committed.error());
            return record;
        }

        /// Append step for callers that already hold the scope lock and an immediate
        /// transaction (multi-record writes). Does not commit.
        dp::Result<Record, dp::Error> appendLocked(const std::string &scope_id, const P &payload,
                                                   const std::string &actor_id) {
            auto record = buildNext(scope_id, payload, actor_id);
            if (!record.is_ok()) {
                logRejection(scope_id, record.error());
                return record;
            }

            auto inserted = store_.insertRecord(record.value());
            if (!inserted.is_ok()) {
                logRejection(scope_id, inserted.error());
                return dp::Result<Record, dp::Error>::err(inserted.error());
            }
            return record;
        }

        /// Head of the chain, none for an empty scope
        dp::Result<std::optional<Record>, dp::Error> latest(const std::string &scope_id) {
            return store_.latestRecord<P>(scope_id);
        }

      private:
        storage::SqliteStore &store_;
        ScopeLocks &locks_;
        Clock clock_;
        std::shared_ptr<const ScopeCatalog> catalog_;

        static void logRejection(const std::string &scope_id, const dp::Error &error) {
            std::cout << "Rejected " << Traits::NAME << " record for scope " << scope_id << ": "
                      << error.message.c_str() << std::endl;
        }

        dp::Result<Record, dp::Error> buildNext(const std::string &scope_id, const P &payload,
                                                const std::string &actor_id) {
            Timestamp now = clock_();

            auto valid = Traits::validate(scope_id, payload, actor_id, now.date());
            if (!valid.is_ok())
                return dp::Result<Record, dp::Error>::err(valid.error());

            if (!Traits::GLOBAL_SCOPE && catalog_ && !catalog_->contains(scope_id)) {
                return dp::Result<Record, dp::Error>::err(
                    scope_not_found(std::string(Traits::NAME) + " scope not found: " + scope_id));
            }

            auto head = store_.latestRecord<P>(scope_id);
            if (!head.is_ok())
                return dp::Result<Record, dp::Error>::err(head.error());

            Record record;
            record.id = generateRecordId();
            record.scope_id = scope_id;
            record.payload = payload;
            record.actor_id = actor_id;
            record.created_at = now;

            if (head.value()) {
                const Record &prev = *head.value();
                record.sequence = prev.sequence + 1;
                record.prev_hash = prev.record_hash;
                // Within a scope created_at never goes backwards, even if the wall clock does
                if (record.created_at < prev.created_at)
                    record.created_at = prev.created_at;
            } else {
                // An emptied scope continues from its retention checkpoint
                auto checkpoint = store_.latestCheckpoint(Traits::KIND, scope_id);
                if (!checkpoint.is_ok())
                    return dp::Result<Record, dp::Error>::err(checkpoint.error());
                if (checkpoint.value()) {
                    record.sequence = checkpoint.value()->purged_through_sequence + 1;
                    record.prev_hash = checkpoint.value()->boundary_hash;
                } else {
                    record.sequence = 1;
                    record.prev_hash = EMPTY_PREV_HASH;
                }
            }

            auto hash = recordHash(record, record.prev_hash);
            if (!hash.is_ok())
                return dp::Result<Record, dp::Error>::err(hash.error());
            record.record_hash = hash.value();
            return dp::Result<Record, dp::Error>::ok(record);
        }
    };

} // namespace chainledger::ledger
