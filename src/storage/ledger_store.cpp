#include <chainledger/common/error.hpp>
#include <chainledger/storage/ledger_store.hpp>

#include <algorithm>
#include <iostream>
#include <mutex>

namespace chainledger {

    namespace {

        constexpr int64_t MICROS_PER_DAY = 86400LL * 1000000LL;

        const char *const ACTION_LOG_PROGRESS = "LOG_PROGRESS";
        const char *const ENTITY_PROGRESS_LOG = "progress_log";

        template <typename T> dp::Result<T, dp::Error> notOpen() {
            return dp::Result<T, dp::Error>::err(not_initialized("Ledger not open"));
        }

    } // namespace

    dp::Result<void, dp::Error> Ledger::open(const std::string &db_path, const LedgerOptions &opts) {
        std::unique_lock lock(mutex_);
        if (initialized_)
            return dp::Result<void, dp::Error>::err(storage_error("Ledger already open"));

        auto open_result = store_.open(db_path, opts.open);
        if (!open_result.is_ok())
            return open_result;

        auto schema_result = store_.initializeCoreSchema();
        if (!schema_result.is_ok()) {
            store_.close();
            return schema_result;
        }

        opts_ = opts;
        if (!opts_.clock)
            opts_.clock = ledger::systemClock();

        progress_ = std::make_unique<ledger::AppendCoordinator<ledger::ProgressPayload>>(store_, locks_, opts_.clock,
                                                                                       opts_.projects);
        audit_ = std::make_unique<ledger::AppendCoordinator<ledger::AuditPayload>>(store_, locks_, opts_.clock);
        progress_verifier_ = std::make_unique<ledger::ChainVerifier<ledger::ProgressPayload>>(store_);
        audit_verifier_ = std::make_unique<ledger::ChainVerifier<ledger::AuditPayload>>(store_);

        initialized_ = true;
        return dp::Result<void, dp::Error>::ok();
    }

    void Ledger::close() {
        std::unique_lock lock(mutex_);
        progress_verifier_.reset();
        audit_verifier_.reset();
        progress_.reset();
        audit_.reset();
        store_.close();
        initialized_ = false;
    }

    bool Ledger::isOpen() const {
        std::shared_lock lock(mutex_);
        return initialized_;
    }

    storage::SqliteStore &Ledger::getStorage() { return store_; }

    dp::Result<void, dp::Error> Ledger::requireProject(const std::string &project_id) const {
        if (opts_.projects && !opts_.projects->contains(project_id))
            return dp::Result<void, dp::Error>::err(scope_not_found("progress scope not found: " + project_id));
        return dp::Result<void, dp::Error>::ok();
    }

    int32_t Ledger::clampLimit(int32_t requested, int32_t fallback, int32_t maximum) const {
        if (requested <= 0)
            return std::min(fallback, maximum);
        return std::min(requested, maximum);
    }

    // ===========================================
    // Progress
    // ===========================================

    dp::Result<ledger::ProgressRecord, dp::Error> Ledger::appendProgress(const std::string &project_id,
                                                                         const ledger::ProgressPayload &payload,
                                                                         const std::string &actor_id) {
        std::shared_lock lock(mutex_);
        if (!initialized_)
            return notOpen<ledger::ProgressRecord>();
        return progress_->append(project_id, payload, actor_id);
    }

    dp::Result<ProgressReport, dp::Error> Ledger::reportProgress(const std::string &project_id,
                                                                 const ledger::ProgressPayload &payload,
                                                                 const std::string &actor_id,
                                                                 const RequestMeta &meta) {
        using R = dp::Result<ProgressReport, dp::Error>;
        std::shared_lock lock(mutex_);
        if (!initialized_)
            return notOpen<ProgressReport>();

        // Fixed order: project chain first, then the audit chain
        auto progress_lock =
            locks_.acquire(ledger::RecordTraits<ledger::ProgressPayload>::lockKey(project_id));
        auto audit_lock = locks_.acquire(ledger::RecordTraits<ledger::AuditPayload>::lockKey(ledger::AUDIT_SCOPE_ID));

        auto tx = store_.beginTransaction(storage::SqliteStore::TxMode::Immediate);
        if (!tx->isActive())
            return R::err(storage_error("Could not begin write transaction"));

        auto progress = progress_->appendLocked(project_id, payload, actor_id);
        if (!progress.is_ok())
            return R::err(progress.error());
        const auto &written = progress.value();

        ledger::ProgressDetail detail;
        detail.project_id = dp::String(project_id.c_str());
        detail.reported_percent = written.payload.reported_percent.hundredths();
        detail.report_date = dp::String(written.payload.report_date.toString().c_str());
        detail.prev_hash = dp::String(written.prev_hash.c_str());
        detail.record_hash = dp::String(written.record_hash.c_str());

        ledger::AuditPayload entry;
        entry.action = ACTION_LOG_PROGRESS;
        entry.entity_type = ENTITY_PROGRESS_LOG;
        entry.entity_id = written.id;
        entry.detail = detail;
        entry.ip_address = meta.ip_address;
        entry.user_agent = meta.user_agent;

        auto audit = audit_->appendLocked(ledger::AUDIT_SCOPE_ID, entry, actor_id);
        if (!audit.is_ok())
            return R::err(audit.error());

        auto committed = tx->commit();
        if (!committed.is_ok())
            return R::err(committed.error());

        return R::ok(ProgressReport{written, audit.value()});
    }

    dp::Result<std::optional<ledger::ProgressRecord>, dp::Error>
    Ledger::latestProgress(const std::string &project_id) {
        using R = dp::Result<std::optional<ledger::ProgressRecord>, dp::Error>;
        std::shared_lock lock(mutex_);
        if (!initialized_)
            return notOpen<std::optional<ledger::ProgressRecord>>();
        auto known = requireProject(project_id);
        if (!known.is_ok())
            return R::err(known.error());
        return progress_->latest(project_id);
    }

    dp::Result<ledger::VerificationResult, dp::Error> Ledger::verifyProgress(const std::string &project_id) {
        using R = dp::Result<ledger::VerificationResult, dp::Error>;
        std::shared_lock lock(mutex_);
        if (!initialized_)
            return notOpen<ledger::VerificationResult>();
        auto known = requireProject(project_id);
        if (!known.is_ok())
            return R::err(known.error());
        return progress_verifier_->verify(project_id);
    }

    dp::Result<std::vector<ledger::AnnotatedRecord<ledger::ProgressPayload>>, dp::Error>
    Ledger::progressHistory(const std::string &project_id) {
        using Rows = std::vector<ledger::AnnotatedRecord<ledger::ProgressPayload>>;
        std::shared_lock lock(mutex_);
        if (!initialized_)
            return notOpen<Rows>();
        auto known = requireProject(project_id);
        if (!known.is_ok())
            return dp::Result<Rows, dp::Error>::err(known.error());
        return progress_verifier_->history(project_id);
    }

    // ===========================================
    // Audit trail
    // ===========================================

    dp::Result<ledger::AuditRecord, dp::Error> Ledger::recordAction(const ledger::AuditPayload &payload,
                                                                    const std::string &actor_id) {
        std::shared_lock lock(mutex_);
        if (!initialized_)
            return notOpen<ledger::AuditRecord>();
        return audit_->append(ledger::AUDIT_SCOPE_ID, payload, actor_id);
    }

    dp::Result<std::optional<ledger::AuditRecord>, dp::Error> Ledger::latestAudit() {
        std::shared_lock lock(mutex_);
        if (!initialized_)
            return notOpen<std::optional<ledger::AuditRecord>>();
        return audit_->latest(ledger::AUDIT_SCOPE_ID);
    }

    dp::Result<ledger::VerificationResult, dp::Error> Ledger::verifyAudit() {
        std::shared_lock lock(mutex_);
        if (!initialized_)
            return notOpen<ledger::VerificationResult>();
        return audit_verifier_->verify(ledger::AUDIT_SCOPE_ID);
    }

    dp::Result<AuditPage, dp::Error> Ledger::queryAudit(const storage::AuditFilter &filter) {
        using R = dp::Result<AuditPage, dp::Error>;
        std::shared_lock lock(mutex_);
        if (!initialized_)
            return notOpen<AuditPage>();

        storage::AuditFilter paged = filter;
        paged.limit = clampLimit(filter.limit, opts_.default_query_limit, opts_.max_query_limit);
        paged.offset = std::max(filter.offset, 0);

        // Page and total from the same snapshot
        auto tx = store_.beginTransaction(storage::SqliteStore::TxMode::Deferred);
        if (!tx->isActive())
            return R::err(storage_error("Could not begin read transaction"));

        auto records = store_.queryAudit(paged);
        if (!records.is_ok())
            return R::err(records.error());
        auto total = store_.countAudit(paged);
        if (!total.is_ok())
            return R::err(total.error());

        auto committed = tx->commit();
        if (!committed.is_ok())
            return R::err(committed.error());

        AuditPage page;
        page.records = std::move(records.value());
        page.total = total.value();
        page.limit = paged.limit;
        page.offset = paged.offset;
        return R::ok(std::move(page));
    }

    dp::Result<std::vector<ledger::AuditRecord>, dp::Error> Ledger::entityHistory(const std::string &entity_type,
                                                                                 const std::string &entity_id) {
        std::shared_lock lock(mutex_);
        if (!initialized_)
            return notOpen<std::vector<ledger::AuditRecord>>();

        storage::AuditFilter filter;
        filter.entity_type = entity_type;
        filter.entity_id = entity_id;
        filter.limit = opts_.entity_history_limit;
        return store_.queryAudit(filter);
    }

    dp::Result<AuditSummary, dp::Error> Ledger::auditSummary(const std::optional<ledger::Timestamp> &since) {
        using R = dp::Result<AuditSummary, dp::Error>;
        std::shared_lock lock(mutex_);
        if (!initialized_)
            return notOpen<AuditSummary>();

        auto tx = store_.beginTransaction(storage::SqliteStore::TxMode::Deferred);
        if (!tx->isActive())
            return R::err(storage_error("Could not begin read transaction"));

        storage::AuditFilter filter;
        filter.created_from = since;
        auto total = store_.countAudit(filter);
        if (!total.is_ok())
            return R::err(total.error());
        auto by_action = store_.countAuditBy(storage::AuditGrouping::Action, since);
        if (!by_action.is_ok())
            return R::err(by_action.error());
        auto by_entity_type = store_.countAuditBy(storage::AuditGrouping::EntityType, since);
        if (!by_entity_type.is_ok())
            return R::err(by_entity_type.error());
        auto top_actors = store_.countAuditBy(storage::AuditGrouping::Actor, since, 10);
        if (!top_actors.is_ok())
            return R::err(top_actors.error());

        auto committed = tx->commit();
        if (!committed.is_ok())
            return R::err(committed.error());

        AuditSummary summary;
        summary.total_actions = total.value();
        summary.by_action = by_action.value();
        summary.by_entity_type = by_entity_type.value();
        summary.top_actors = top_actors.value();
        return R::ok(std::move(summary));
    }

    dp::Result<std::string, dp::Error> Ledger::exportAudit(const storage::AuditFilter &filter) {
        using R = dp::Result<std::string, dp::Error>;
        std::shared_lock lock(mutex_);
        if (!initialized_)
            return notOpen<std::string>();

        storage::AuditFilter bounded = filter;
        bounded.limit = clampLimit(filter.limit, opts_.max_export_records, opts_.max_export_records);
        bounded.offset = std::max(filter.offset, 0);

        auto records = store_.queryAudit(bounded);
        if (!records.is_ok())
            return R::err(records.error());
        return ledger::toJsonArray(records.value());
    }

    // ===========================================
    // Retention
    // ===========================================

    dp::Result<PurgeResult, dp::Error> Ledger::purgeAuditBefore(const ledger::Timestamp &cutoff) {
        using R = dp::Result<PurgeResult, dp::Error>;
        std::shared_lock lock(mutex_);
        if (!initialized_)
            return notOpen<PurgeResult>();

        auto audit_lock = locks_.acquire(ledger::RecordTraits<ledger::AuditPayload>::lockKey(ledger::AUDIT_SCOPE_ID));
        auto tx = store_.beginTransaction(storage::SqliteStore::TxMode::Immediate);
        if (!tx->isActive())
            return R::err(storage_error("Could not begin write transaction"));

        auto boundary = store_.lastAuditBefore(cutoff);
        if (!boundary.is_ok())
            return R::err(boundary.error());
        if (!boundary.value())
            return R::ok(PurgeResult{});

        storage::RetentionCheckpoint checkpoint;
        checkpoint.kind = ledger::RecordKind::Audit;
        checkpoint.scope_id = ledger::AUDIT_SCOPE_ID;
        checkpoint.purged_through_sequence = boundary.value()->sequence;
        checkpoint.boundary_hash = boundary.value()->record_hash;
        checkpoint.cutoff = cutoff;
        checkpoint.purged_at = opts_.clock();

        auto inserted = store_.insertCheckpoint(checkpoint);
        if (!inserted.is_ok())
            return R::err(inserted.error());
        auto deleted = store_.deleteAuditThrough(checkpoint.purged_through_sequence);
        if (!deleted.is_ok())
            return R::err(deleted.error());

        auto committed = tx->commit();
        if (!committed.is_ok())
            return R::err(committed.error());

        std::cout << "Purged " << deleted.value() << " audit records through sequence "
                  << checkpoint.purged_through_sequence << " (created before " << cutoff.toIso8601() << ")"
                  << std::endl;

        PurgeResult result;
        result.purged = deleted.value();
        result.checkpoint = checkpoint;
        return R::ok(result);
    }

    dp::Result<PurgeResult, dp::Error> Ledger::purgeExpiredAudit() {
        ledger::Timestamp cutoff;
        {
            std::shared_lock lock(mutex_);
            if (!initialized_)
                return notOpen<PurgeResult>();
            cutoff = ledger::Timestamp(opts_.clock().micros - opts_.audit_retention_days * MICROS_PER_DAY);
        }
        return purgeAuditBefore(cutoff);
    }

} // namespace chainledger
