#include <chainledger/common/error.hpp>
#include <chainledger/ledger/canonical.hpp>

#include <cstdio>

namespace chainledger::ledger {

    namespace {

        void appendEscapedUnit(std::string &out, uint32_t unit) {
            char buf[8];
            std::snprintf(buf, sizeof(buf), "\\u%04x", unit);
            out += buf;
        }

        dp::Result<void, dp::Error> appendValue(std::string &out, const CanonicalValue &value);

        dp::Result<void, dp::Error> appendObject(std::string &out,
                                                 const std::map<std::string, CanonicalValue> &fields) {
            out += '{';
            bool first = true;
            for (const auto &[key, value] : fields) {
                if (!first)
                    out += ',';
                first = false;
                auto key_result = appendJsonString(out, key);
                if (!key_result.is_ok())
                    return key_result;
                out += ':';
                auto value_result = appendValue(out, value);
                if (!value_result.is_ok())
                    return value_result;
            }
            out += '}';
            return dp::Result<void, dp::Error>::ok();
        }

    } // namespace

    dp::Result<void, dp::Error> appendJsonString(std::string &out, const std::string &text) {
        out += '"';
        size_t i = 0;
        while (i < text.size()) {
            uint32_t cp = 0;
            if (!decodeUtf8(text, i, cp))
                return dp::Result<void, dp::Error>::err(validation_error("String is not valid UTF-8"));

            switch (cp) {
            case '"':
                out += "\\\"";
                break;
            case '\\':
                out += "\\\\";
                break;
            case '\n':
                out += "\\n";
                break;
            case '\r':
                out += "\\r";
                break;
            case '\t':
                out += "\\t";
                break;
            case '\b':
                out += "\\b";
                break;
            case '\f':
                out += "\\f";
                break;
            default:
                if (cp >= 0x10000) {
                    uint32_t v = cp - 0x10000;
                    appendEscapedUnit(out, 0xD800 | (v >> 10));
                    appendEscapedUnit(out, 0xDC00 | (v & 0x3FF));
                } else if (cp < 0x20 || cp >= 0x7F) {
                    appendEscapedUnit(out, cp);
                } else {
                    out += static_cast<char>(cp);
                }
                break;
            }
        }
        out += '"';
        return dp::Result<void, dp::Error>::ok();
    }

    namespace {

        dp::Result<void, dp::Error> appendValue(std::string &out, const CanonicalValue &value) {
            if (std::holds_alternative<std::nullptr_t>(value)) {
                out += "null";
            } else if (const auto *b = std::get_if<bool>(&value)) {
                out += *b ? "true" : "false";
            } else if (const auto *s = std::get_if<std::string>(&value)) {
                return appendJsonString(out, *s);
            } else if (const auto *d = std::get_if<DecimalText>(&value)) {
                out += d->text;
            } else if (const auto *o = std::get_if<std::shared_ptr<const CanonicalObject>>(&value)) {
                if (!*o) {
                    out += "{}";
                } else {
                    auto nested = (*o)->serialize();
                    if (!nested.is_ok())
                        return dp::Result<void, dp::Error>::err(nested.error());
                    out += nested.value();
                }
            }
            return dp::Result<void, dp::Error>::ok();
        }

    } // namespace

    CanonicalObject &CanonicalObject::set(const std::string &key, CanonicalValue value) {
        fields_[key] = std::move(value);
        return *this;
    }

    CanonicalObject &CanonicalObject::setString(const std::string &key, const std::string &value) {
        return set(key, CanonicalValue{value});
    }

    CanonicalObject &CanonicalObject::setDecimal(const std::string &key, const Percent &value) {
        return set(key, CanonicalValue{DecimalText{value.toCanonical()}});
    }

    CanonicalObject &CanonicalObject::setDate(const std::string &key, const Date &value) {
        return set(key, CanonicalValue{value.toString()});
    }

    CanonicalObject &CanonicalObject::setTimestamp(const std::string &key, const Timestamp &value) {
        return set(key, CanonicalValue{value.toIso8601()});
    }

    CanonicalObject &CanonicalObject::setInteger(const std::string &key, int64_t value) {
        return set(key, CanonicalValue{DecimalText{std::to_string(value)}});
    }

    CanonicalObject &CanonicalObject::setBool(const std::string &key, bool value) {
        return set(key, CanonicalValue{value});
    }

    CanonicalObject &CanonicalObject::setNull(const std::string &key) { return set(key, CanonicalValue{nullptr}); }

    CanonicalObject &CanonicalObject::setObject(const std::string &key, CanonicalObject value) {
        return set(key, CanonicalValue{std::make_shared<const CanonicalObject>(std::move(value))});
    }

    dp::Result<std::string, dp::Error> CanonicalObject::serialize() const {
        std::string out;
        auto result = appendObject(out, fields_);
        if (!result.is_ok())
            return dp::Result<std::string, dp::Error>::err(result.error());
        return dp::Result<std::string, dp::Error>::ok(out);
    }

} // namespace chainledger::ledger
