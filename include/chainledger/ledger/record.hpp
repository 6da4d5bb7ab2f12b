#pragma once

#include <cstdint>
#include <datapod/datapod.hpp>
#include <optional>
#include <string>
#include <tuple>
#include <variant>
#include <vector>

#include "canonical.hpp"
#include "types.hpp"

namespace chainledger::ledger {

    // ===========================================
    // Progress payload
    // ===========================================

    struct ProgressPayload {
        Percent reported_percent{};
        Date report_date{};
        std::string remarks{};
    };

    // ===========================================
    // Audit detail - tagged union of known schemas
    // ===========================================

    /// Mirrors a progress record that was just appended (action LOG_PROGRESS)
    struct ProgressDetail {
        dp::String project_id{};
        dp::i64 reported_percent{0}; // hundredths
        dp::String report_date{};
        dp::String prev_hash{};
        dp::String record_hash{};

        auto members() { return std::tie(project_id, reported_percent, report_date, prev_hash, record_hash); }
        auto members() const { return std::tie(project_id, reported_percent, report_date, prev_hash, record_hash); }
    };

    struct MediaDetail {
        dp::String project_id{};
        dp::String media_type{};
        dp::String storage_key{};

        auto members() { return std::tie(project_id, media_type, storage_key); }
        auto members() const { return std::tie(project_id, media_type, storage_key); }
    };

    struct FieldChange {
        dp::String field{};
        dp::String value{};

        auto members() { return std::tie(field, value); }
        auto members() const { return std::tie(field, value); }
    };

    /// Changed fields of an entity update, field names must be unique
    struct FieldChangesDetail {
        dp::Vector<FieldChange> changes{};

        auto members() { return std::tie(changes); }
        auto members() const { return std::tie(changes); }
    };

    struct DeletionDetail {
        bool soft_delete{true};

        auto members() { return std::tie(soft_delete); }
        auto members() const { return std::tie(soft_delete); }
    };

    using AuditDetail = std::variant<std::monostate, ProgressDetail, MediaDetail, FieldChangesDetail, DeletionDetail>;

    /// Stable tag stored next to the detail blob: none, progress, media, field_changes, deletion
    std::string detailKind(const AuditDetail &detail);

    /// Canonical object committed to by the audit record hash (the "payload" member)
    dp::Result<CanonicalObject, dp::Error> detailFields(const AuditDetail &detail);

    /// Binary encoding for storage (datapod, versioned). "none" encodes to zero bytes.
    dp::Result<std::vector<uint8_t>, dp::Error> encodeDetail(const AuditDetail &detail);
    dp::Result<AuditDetail, dp::Error> decodeDetail(const std::string &kind, const std::vector<uint8_t> &bytes);

    struct AuditPayload {
        std::string action{};
        std::string entity_type{};
        std::string entity_id{};
        AuditDetail detail{};
        // Request metadata, stored but not hashed
        std::string ip_address{};
        std::string user_agent{};
    };

    // ===========================================
    // ChainRecord
    // ===========================================

    template <typename P> struct ChainRecord {
        std::string id{};
        std::string scope_id{};
        int64_t sequence{0};
        P payload{};
        std::string actor_id{};
        Timestamp created_at{};
        std::string prev_hash{};
        std::string record_hash{};
        /// Why the stored row could not be decoded; empty for an intact row
        std::string decode_error{};

        /// Boundary representation (API responses, cross-system hash agreement)
        dp::Result<std::string, dp::Error> toJson() const;
    };

    using ProgressRecord = ChainRecord<ProgressPayload>;
    using AuditRecord = ChainRecord<AuditPayload>;

    dp::Result<CanonicalObject, dp::Error> payloadObject(const ProgressPayload &payload);
    dp::Result<CanonicalObject, dp::Error> payloadObject(const AuditPayload &payload);

    template <typename P> dp::Result<std::string, dp::Error> ChainRecord<P>::toJson() const {
        auto payload_obj = payloadObject(payload);
        if (!payload_obj.is_ok())
            return dp::Result<std::string, dp::Error>::err(payload_obj.error());

        CanonicalObject obj;
        obj.setString("id", id);
        obj.setString("scope_id", scope_id);
        obj.setInteger("sequence", sequence);
        obj.setObject("payload", payload_obj.value());
        obj.setString("actor_id", actor_id);
        obj.setTimestamp("created_at", created_at);
        obj.setString("prev_hash", prev_hash);
        obj.setString("record_hash", record_hash);
        return obj.serialize();
    }

    /// JSON array of boundary representations
    template <typename P> dp::Result<std::string, dp::Error> toJsonArray(const std::vector<ChainRecord<P>> &records) {
        std::string out = "[";
        for (size_t i = 0; i < records.size(); ++i) {
            auto json = records[i].toJson();
            if (!json.is_ok())
                return json;
            if (i > 0)
                out += ",";
            out += json.value();
        }
        out += "]";
        return dp::Result<std::string, dp::Error>::ok(out);
    }

} // namespace chainledger::ledger
