#include <chainledger/common/error.hpp>
#include <chainledger/ledger/scope.hpp>

#include <mutex>

namespace chainledger::ledger {

    namespace {

        dp::Result<void, dp::Error> requireUtf8(const std::string &field, const std::string &value) {
            if (!isValidUtf8(value))
                return dp::Result<void, dp::Error>::err(validation_error(field + " is not valid UTF-8"));
            return dp::Result<void, dp::Error>::ok();
        }

    } // namespace

    // ===========================================
    // Progress
    // ===========================================

    dp::Result<void, dp::Error> RecordTraits<ProgressPayload>::validate(const std::string &scope_id,
                                                                        const ProgressPayload &payload,
                                                                        const std::string &actor_id,
                                                                        const Date &today) {
        if (scope_id.empty())
            return dp::Result<void, dp::Error>::err(validation_error("project_id is required"));
        if (actor_id.empty())
            return dp::Result<void, dp::Error>::err(validation_error("reported_by is required"));
        if (!payload.reported_percent.inRange()) {
            return dp::Result<void, dp::Error>::err(
                validation_error("reported_percent must be between 0 and 100, got " +
                                 payload.reported_percent.toCanonical()));
        }
        if (!payload.report_date.isValid())
            return dp::Result<void, dp::Error>::err(validation_error("report_date is not a valid calendar date"));
        if (payload.report_date > today) {
            return dp::Result<void, dp::Error>::err(
                validation_error("report_date " + payload.report_date.toString() + " is in the future"));
        }

        for (const auto &[field, value] :
             {std::pair<std::string, const std::string *>{"project_id", &scope_id},
              std::pair<std::string, const std::string *>{"reported_by", &actor_id},
              std::pair<std::string, const std::string *>{"remarks", &payload.remarks}}) {
            auto utf8 = requireUtf8(field, *value);
            if (!utf8.is_ok())
                return utf8;
        }
        return dp::Result<void, dp::Error>::ok();
    }

    dp::Result<CanonicalObject, dp::Error> RecordTraits<ProgressPayload>::hashFields(const ProgressRecord &record) {
        CanonicalObject fields;
        fields.setString("project_id", record.scope_id);
        fields.setDecimal("reported_percent", record.payload.reported_percent);
        fields.setDate("report_date", record.payload.report_date);
        fields.setString("reported_by", record.actor_id);
        return dp::Result<CanonicalObject, dp::Error>::ok(fields);
    }

    // ===========================================
    // Audit
    // ===========================================

    dp::Result<void, dp::Error> RecordTraits<AuditPayload>::validate(const std::string &scope_id,
                                                                     const AuditPayload &payload,
                                                                     const std::string &actor_id, const Date &) {
        if (scope_id != AUDIT_SCOPE_ID)
            return dp::Result<void, dp::Error>::err(validation_error("Audit records belong to the global scope"));
        if (payload.action.empty() || payload.action.size() > MAX_ACTION_LENGTH) {
            return dp::Result<void, dp::Error>::err(
                validation_error("action must be 1-" + std::to_string(MAX_ACTION_LENGTH) + " characters"));
        }
        if (payload.entity_type.empty() || payload.entity_type.size() > MAX_ENTITY_TYPE_LENGTH) {
            return dp::Result<void, dp::Error>::err(
                validation_error("entity_type must be 1-" + std::to_string(MAX_ENTITY_TYPE_LENGTH) + " characters"));
        }

        for (const auto &[field, value] :
             {std::pair<std::string, const std::string *>{"actor_id", &actor_id},
              std::pair<std::string, const std::string *>{"action", &payload.action},
              std::pair<std::string, const std::string *>{"entity_type", &payload.entity_type},
              std::pair<std::string, const std::string *>{"entity_id", &payload.entity_id},
              std::pair<std::string, const std::string *>{"ip_address", &payload.ip_address},
              std::pair<std::string, const std::string *>{"user_agent", &payload.user_agent}}) {
            auto utf8 = requireUtf8(field, *value);
            if (!utf8.is_ok())
                return utf8;
        }

        // Detail strings are checked when the canonical object is serialized,
        // duplicate field names here
        auto detail = detailFields(payload.detail);
        if (!detail.is_ok())
            return dp::Result<void, dp::Error>::err(detail.error());
        auto detail_text = detail.value().serialize();
        if (!detail_text.is_ok())
            return dp::Result<void, dp::Error>::err(detail_text.error());
        return dp::Result<void, dp::Error>::ok();
    }

    dp::Result<CanonicalObject, dp::Error> RecordTraits<AuditPayload>::hashFields(const AuditRecord &record) {
        auto detail = detailFields(record.payload.detail);
        if (!detail.is_ok())
            return detail;

        CanonicalObject fields;
        fields.setString("actor_id", record.actor_id);
        fields.setString("action", record.payload.action);
        fields.setString("entity_type", record.payload.entity_type);
        fields.setString("entity_id", record.payload.entity_id);
        fields.setObject("payload", detail.value());
        fields.setTimestamp("created_at", record.created_at);
        return dp::Result<CanonicalObject, dp::Error>::ok(fields);
    }

    // ===========================================
    // StaticScopeCatalog
    // ===========================================

    void StaticScopeCatalog::add(const std::string &scope_id) {
        std::unique_lock lock(mutex_);
        scopes_.insert(scope_id);
    }

    void StaticScopeCatalog::remove(const std::string &scope_id) {
        std::unique_lock lock(mutex_);
        scopes_.erase(scope_id);
    }

    bool StaticScopeCatalog::contains(const std::string &scope_id) const {
        std::shared_lock lock(mutex_);
        return scopes_.count(scope_id) > 0;
    }

    size_t StaticScopeCatalog::size() const {
        std::shared_lock lock(mutex_);
        return scopes_.size();
    }

} // namespace chainledger::ledger
