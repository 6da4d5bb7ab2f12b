#pragma once

#include <datapod/datapod.hpp>
#include <set>
#include <shared_mutex>
#include <string>

#include "hasher.hpp"
#include "record.hpp"

namespace chainledger::ledger {

    /// The audit trail is a single chain
    inline const std::string AUDIT_SCOPE_ID = "global";

    inline constexpr size_t MAX_ACTION_LENGTH = 100;
    inline constexpr size_t MAX_ENTITY_TYPE_LENGTH = 50;

    enum class RecordKind { Progress, Audit };

    // ===========================================
    // Per-kind chain rules
    // ===========================================

    template <typename P> struct RecordTraits;

    /// One chain per project, one record per report date
    template <> struct RecordTraits<ProgressPayload> {
        static constexpr RecordKind KIND = RecordKind::Progress;
        static constexpr const char *NAME = "progress";
        static constexpr bool GLOBAL_SCOPE = false;

        static std::string lockKey(const std::string &scope_id) { return "progress:" + scope_id; }

        /// Rejects out of range percentages, future dates and empty identifiers
        static dp::Result<void, dp::Error> validate(const std::string &scope_id, const ProgressPayload &payload,
                                                    const std::string &actor_id, const Date &today);

        /// {project_id, reported_percent, report_date, reported_by}
        static dp::Result<CanonicalObject, dp::Error> hashFields(const ProgressRecord &record);
    };

    /// Single global chain of administrative actions
    template <> struct RecordTraits<AuditPayload> {
        static constexpr RecordKind KIND = RecordKind::Audit;
        static constexpr const char *NAME = "audit";
        static constexpr bool GLOBAL_SCOPE = true;

        static std::string lockKey(const std::string &) { return "audit:" + AUDIT_SCOPE_ID; }

        static dp::Result<void, dp::Error> validate(const std::string &scope_id, const AuditPayload &payload,
                                                    const std::string &actor_id, const Date &today);

        /// {actor_id, action, entity_type, entity_id, payload, created_at}
        static dp::Result<CanonicalObject, dp::Error> hashFields(const AuditRecord &record);
    };

    /// Hash of record as it would be computed with the given predecessor hash
    template <typename P>
    dp::Result<std::string, dp::Error> recordHash(const ChainRecord<P> &record, const std::string &prev_hash) {
        auto fields = RecordTraits<P>::hashFields(record);
        if (!fields.is_ok())
            return dp::Result<std::string, dp::Error>::err(fields.error());
        return CanonicalHasher::hash(fields.value(), prev_hash);
    }

    // ===========================================
    // Scope catalog
    // ===========================================

    /// Answers whether a progress scope (project) exists. Project CRUD lives elsewhere.
    class ScopeCatalog {
      public:
        virtual ~ScopeCatalog() = default;
        virtual bool contains(const std::string &scope_id) const = 0;
    };

    /// In-memory catalog, thread-safe
    class StaticScopeCatalog : public ScopeCatalog {
      public:
        StaticScopeCatalog() = default;
        explicit StaticScopeCatalog(std::set<std::string> scopes) : scopes_(std::move(scopes)) {}

        void add(const std::string &scope_id);
        void remove(const std::string &scope_id);
        bool contains(const std::string &scope_id) const override;
        size_t size() const;

      private:
        std::set<std::string> scopes_;
        mutable std::shared_mutex mutex_;
    };

} // namespace chainledger::ledger
