#pragma once

#include <chainledger/ledger/appender.hpp>
#include <chainledger/ledger/record.hpp>
#include <chainledger/ledger/scope.hpp>
#include <chainledger/ledger/scope_lock.hpp>
#include <chainledger/ledger/verifier.hpp>
#include <chainledger/storage/sqlite_store.hpp>
#include <datapod/datapod.hpp>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <utility>
#include <vector>

namespace chainledger {

    /// Ledger configuration
    struct LedgerOptions {
        storage::OpenOptions open;
        /// Source of created_at for every record; empty means the system clock
        ledger::Clock clock;
        /// Known projects; null accepts any project id
        std::shared_ptr<const ledger::ScopeCatalog> projects;
        int32_t audit_retention_days = 90;
        int32_t default_query_limit = 100;
        int32_t max_query_limit = 1000;
        int32_t entity_history_limit = 1000;
        int32_t max_export_records = 10000;

        LedgerOptions() = default;
    };

    /// Client metadata stored with audit records, not hashed
    struct RequestMeta {
        std::string ip_address;
        std::string user_agent;
    };

    struct ProgressReport {
        ledger::ProgressRecord progress;
        ledger::AuditRecord audit;
    };

    struct AuditPage {
        std::vector<ledger::AuditRecord> records;
        int64_t total = 0;
        int32_t limit = 0;
        int32_t offset = 0;
    };

    struct AuditSummary {
        int64_t total_actions = 0;
        std::vector<std::pair<std::string, int64_t>> by_action;
        std::vector<std::pair<std::string, int64_t>> by_entity_type;
        std::vector<std::pair<std::string, int64_t>> top_actors;
    };

    struct PurgeResult {
        int64_t purged = 0;
        std::optional<storage::RetentionCheckpoint> checkpoint;
    };

    // ===========================================
    // Ledger - progress chains + audit trail over one store
    // ===========================================

    /// High-level API owning the SQLite store, the scope locks and both chain kinds.
    /// Callers are trusted to have authenticated actor_id and authorized the write.
    class Ledger {
      public:
        Ledger() = default;
        ~Ledger() = default;

        Ledger(const Ledger &) = delete;
        Ledger &operator=(const Ledger &) = delete;

        /// Open the database (":memory:" allowed) and create the schema
        dp::Result<void, dp::Error> open(const std::string &db_path, const LedgerOptions &opts = LedgerOptions{});

        void close();
        bool isOpen() const;

        // ===========================================
        // Progress
        // ===========================================

        dp::Result<ledger::ProgressRecord, dp::Error> appendProgress(const std::string &project_id,
                                                                     const ledger::ProgressPayload &payload,
                                                                     const std::string &actor_id);

        /// Progress record plus its LOG_PROGRESS audit entry, both or neither
        dp::Result<ProgressReport, dp::Error> reportProgress(const std::string &project_id,
                                                             const ledger::ProgressPayload &payload,
                                                             const std::string &actor_id,
                                                             const RequestMeta &meta = RequestMeta{});

        dp::Result<std::optional<ledger::ProgressRecord>, dp::Error> latestProgress(const std::string &project_id);

        dp::Result<ledger::VerificationResult, dp::Error> verifyProgress(const std::string &project_id);

        dp::Result<std::vector<ledger::AnnotatedRecord<ledger::ProgressPayload>>, dp::Error>
        progressHistory(const std::string &project_id);

        // ===========================================
        // Audit trail
        // ===========================================

        dp::Result<ledger::AuditRecord, dp::Error> recordAction(const ledger::AuditPayload &payload,
                                                                const std::string &actor_id);

        dp::Result<std::optional<ledger::AuditRecord>, dp::Error> latestAudit();

        dp::Result<ledger::VerificationResult, dp::Error> verifyAudit();

        /// Newest first. limit <= 0 means the default, anything above the maximum is capped.
        dp::Result<AuditPage, dp::Error> queryAudit(const storage::AuditFilter &filter);

        dp::Result<std::vector<ledger::AuditRecord>, dp::Error> entityHistory(const std::string &entity_type,
                                                                             const std::string &entity_id);

        dp::Result<AuditSummary, dp::Error> auditSummary(const std::optional<ledger::Timestamp> &since = std::nullopt);

        /// JSON array of matching records, at most max_export_records
        dp::Result<std::string, dp::Error> exportAudit(const storage::AuditFilter &filter);

        // ===========================================
        // Retention
        // ===========================================

        /// Deletes audit records created before cutoff and leaves a checkpoint for the verifier
        dp::Result<PurgeResult, dp::Error> purgeAuditBefore(const ledger::Timestamp &cutoff);

        /// purgeAuditBefore(now - audit_retention_days)
        dp::Result<PurgeResult, dp::Error> purgeExpiredAudit();

        /// The underlying store; closed before open() and after close()
        storage::SqliteStore &getStorage();

      private:
        storage::SqliteStore store_;
        ledger::ScopeLocks locks_;
        LedgerOptions opts_;
        std::unique_ptr<ledger::AppendCoordinator<ledger::ProgressPayload>> progress_;
        std::unique_ptr<ledger::AppendCoordinator<ledger::AuditPayload>> audit_;
        std::unique_ptr<ledger::ChainVerifier<ledger::ProgressPayload>> progress_verifier_;
        std::unique_ptr<ledger::ChainVerifier<ledger::AuditPayload>> audit_verifier_;
        bool initialized_ = false;

        mutable std::shared_mutex mutex_;

        dp::Result<void, dp::Error> requireProject(const std::string &project_id) const;
        int32_t clampLimit(int32_t requested, int32_t fallback, int32_t maximum) const;
    };

} // namespace chainledger
