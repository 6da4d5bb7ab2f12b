#include <chainledger/common/error.hpp>
#include <chainledger/ledger/record.hpp>

namespace chainledger::ledger {

    namespace {

        std::string str(const dp::String &s) { return std::string(s.c_str()); }

        template <typename T> dp::Result<std::vector<uint8_t>, dp::Error> encodeStruct(const T &value) {
            try {
                T copy = value;
                dp::ByteBuf buf = dp::serialize<dp::Mode::WITH_VERSION>(copy);
                return dp::Result<std::vector<uint8_t>, dp::Error>::ok(std::vector<uint8_t>(buf.begin(), buf.end()));
            } catch (const std::exception &e) {
                return dp::Result<std::vector<uint8_t>, dp::Error>::err(
                    serialization_failed(std::string("Audit detail encoding failed: ") + e.what()));
            }
        }

        template <typename T> dp::Result<AuditDetail, dp::Error> decodeStruct(const std::vector<uint8_t> &bytes) {
            // WITH_VERSION blobs open with a 64-bit type hash
            if (bytes.size() < sizeof(uint64_t)) {
                return dp::Result<AuditDetail, dp::Error>::err(
                    serialization_failed("Audit detail blob is truncated (" + std::to_string(bytes.size()) +
                                         " bytes)"));
            }
            try {
                auto value = dp::deserialize<dp::Mode::WITH_VERSION, T>(bytes.data(), bytes.size());
                return dp::Result<AuditDetail, dp::Error>::ok(AuditDetail{std::move(value)});
            } catch (const std::exception &e) {
                return dp::Result<AuditDetail, dp::Error>::err(
                    serialization_failed(std::string("Audit detail decoding failed: ") + e.what()));
            }
        }

    } // namespace

    std::string detailKind(const AuditDetail &detail) {
        switch (detail.index()) {
        case 1:
            return "progress";
        case 2:
            return "media";
        case 3:
            return "field_changes";
        case 4:
            return "deletion";
        default:
            return "none";
        }
    }

    dp::Result<CanonicalObject, dp::Error> detailFields(const AuditDetail &detail) {
        CanonicalObject obj;
        if (const auto *p = std::get_if<ProgressDetail>(&detail)) {
            obj.setString("project_id", str(p->project_id));
            obj.setDecimal("reported_percent", Percent::fromHundredths(p->reported_percent));
            obj.setString("report_date", str(p->report_date));
            obj.setString("prev_hash", str(p->prev_hash));
            obj.setString("record_hash", str(p->record_hash));
        } else if (const auto *m = std::get_if<MediaDetail>(&detail)) {
            obj.setString("project_id", str(m->project_id));
            obj.setString("media_type", str(m->media_type));
            obj.setString("storage_key", str(m->storage_key));
        } else if (const auto *f = std::get_if<FieldChangesDetail>(&detail)) {
            for (const auto &change : f->changes) {
                std::string field = str(change.field);
                if (field.empty()) {
                    return dp::Result<CanonicalObject, dp::Error>::err(
                        validation_error("Field change with empty field name"));
                }
                if (obj.contains(field)) {
                    return dp::Result<CanonicalObject, dp::Error>::err(
                        validation_error("Field '" + field + "' changed twice in one audit detail"));
                }
                obj.setString(field, str(change.value));
            }
        } else if (const auto *d = std::get_if<DeletionDetail>(&detail)) {
            obj.setBool("soft_delete", d->soft_delete);
        }
        return dp::Result<CanonicalObject, dp::Error>::ok(obj);
    }

    dp::Result<std::vector<uint8_t>, dp::Error> encodeDetail(const AuditDetail &detail) {
        if (const auto *p = std::get_if<ProgressDetail>(&detail))
            return encodeStruct(*p);
        if (const auto *m = std::get_if<MediaDetail>(&detail))
            return encodeStruct(*m);
        if (const auto *f = std::get_if<FieldChangesDetail>(&detail))
            return encodeStruct(*f);
        if (const auto *d = std::get_if<DeletionDetail>(&detail))
            return encodeStruct(*d);
        return dp::Result<std::vector<uint8_t>, dp::Error>::ok(std::vector<uint8_t>{});
    }

    dp::Result<AuditDetail, dp::Error> decodeDetail(const std::string &kind, const std::vector<uint8_t> &bytes) {
        if (kind == "none")
            return dp::Result<AuditDetail, dp::Error>::ok(AuditDetail{});
        if (kind == "progress")
            return decodeStruct<ProgressDetail>(bytes);
        if (kind == "media")
            return decodeStruct<MediaDetail>(bytes);
        if (kind == "field_changes")
            return decodeStruct<FieldChangesDetail>(bytes);
        if (kind == "deletion")
            return decodeStruct<DeletionDetail>(bytes);
        return dp::Result<AuditDetail, dp::Error>::err(serialization_failed("Unknown audit detail kind: " + kind));
    }

    dp::Result<CanonicalObject, dp::Error> payloadObject(const ProgressPayload &payload) {
        CanonicalObject obj;
        obj.setDecimal("reported_percent", payload.reported_percent);
        obj.setDate("report_date", payload.report_date);
        obj.setString("remarks", payload.remarks);
        return dp::Result<CanonicalObject, dp::Error>::ok(obj);
    }

    dp::Result<CanonicalObject, dp::Error> payloadObject(const AuditPayload &payload) {
        auto detail = detailFields(payload.detail);
        if (!detail.is_ok())
            return detail;

        CanonicalObject obj;
        obj.setString("action", payload.action);
        obj.setString("entity_type", payload.entity_type);
        obj.setString("entity_id", payload.entity_id);
        obj.setString("detail_kind", detailKind(payload.detail));
        obj.setObject("detail", detail.value());
        obj.setString("ip_address", payload.ip_address);
        obj.setString("user_agent", payload.user_agent);
        return dp::Result<CanonicalObject, dp::Error>::ok(obj);
    }

} // namespace chainledger::ledger
