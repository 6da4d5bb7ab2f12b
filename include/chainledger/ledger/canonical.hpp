#pragma once

#include <datapod/datapod.hpp>
#include <map>
#include <memory>
#include <string>
#include <variant>

#include "types.hpp"

namespace chainledger::ledger {

    /// Decimal already rendered to its canonical fixed-point text
    struct DecimalText {
        std::string text;
    };

    class CanonicalObject;

    /// Canonical JSON value. Binary floating point is deliberately not representable.
    using CanonicalValue =
        std::variant<std::nullptr_t, bool, std::string, DecimalText, std::shared_ptr<const CanonicalObject>>;

    /// JSON object whose serialization is byte-for-byte deterministic:
    /// keys sorted by code point, no insignificant whitespace, ASCII-only escaping.
    class CanonicalObject {
      public:
        CanonicalObject() = default;

        /// Setting an existing key replaces its value
        CanonicalObject &set(const std::string &key, CanonicalValue value);

        CanonicalObject &setString(const std::string &key, const std::string &value);
        CanonicalObject &setDecimal(const std::string &key, const Percent &value);
        CanonicalObject &setDate(const std::string &key, const Date &value);
        CanonicalObject &setTimestamp(const std::string &key, const Timestamp &value);
        CanonicalObject &setInteger(const std::string &key, int64_t value);
        CanonicalObject &setBool(const std::string &key, bool value);
        CanonicalObject &setNull(const std::string &key);
        CanonicalObject &setObject(const std::string &key, CanonicalObject value);

        bool contains(const std::string &key) const { return fields_.find(key) != fields_.end(); }
        size_t size() const { return fields_.size(); }
        bool empty() const { return fields_.empty(); }

        /// Fails only on keys or strings that are not valid UTF-8
        dp::Result<std::string, dp::Error> serialize() const;

      private:
        std::map<std::string, CanonicalValue> fields_;
    };

    /// Appends the JSON string literal for text, escaping everything outside printable ASCII
    dp::Result<void, dp::Error> appendJsonString(std::string &out, const std::string &text);

} // namespace chainledger::ledger
