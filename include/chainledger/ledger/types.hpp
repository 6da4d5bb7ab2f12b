#pragma once

#include <cstdint>
#include <datapod/datapod.hpp>
#include <functional>
#include <string>

namespace chainledger::ledger {

    /// Calendar date (proleptic Gregorian), rendered as YYYY-MM-DD
    struct Date {
        int32_t year{1970};
        uint32_t month{1};
        uint32_t day{1};

        Date() = default;
        Date(int32_t y, uint32_t m, uint32_t d) : year(y), month(m), day(d) {}

        bool isValid() const;

        /// Days since 1970-01-01
        int64_t toDays() const;
        static Date fromDays(int64_t days);

        std::string toString() const;
        static dp::Result<Date, dp::Error> parse(const std::string &text);

        bool operator==(const Date &other) const {
            return year == other.year && month == other.month && day == other.day;
        }
        bool operator!=(const Date &other) const { return !(*this == other); }
        bool operator<(const Date &other) const { return toDays() < other.toDays(); }
        bool operator>(const Date &other) const { return other < *this; }
    };

    /// UTC instant with microsecond resolution
    struct Timestamp {
        int64_t micros{0};

        Timestamp() = default;
        explicit Timestamp(int64_t us) : micros(us) {}

        static Timestamp now();
        static Timestamp fromDate(const Date &date, uint32_t hour = 0, uint32_t minute = 0, uint32_t second = 0);

        Date date() const;

        /// Fixed format: YYYY-MM-DDTHH:MM:SS.ffffffZ
        std::string toIso8601() const;
        static dp::Result<Timestamp, dp::Error> parseIso8601(const std::string &text);

        bool operator==(const Timestamp &other) const { return micros == other.micros; }
        bool operator!=(const Timestamp &other) const { return micros != other.micros; }
        bool operator<(const Timestamp &other) const { return micros < other.micros; }
        bool operator<=(const Timestamp &other) const { return micros <= other.micros; }
    };

    /// Percentage stored as fixed-point hundredths (NUMERIC(5,2) semantics)
    class Percent {
      public:
        Percent() = default;

        static Percent fromHundredths(int64_t hundredths) { return Percent(hundredths); }

        /// Parses decimal text like "35", "35.5", "12.25". More than two decimals is an error.
        static dp::Result<Percent, dp::Error> parse(const std::string &text);

        int64_t hundredths() const { return hundredths_; }

        /// Canonical text: trailing zeros trimmed, at least one fractional digit ("10.0", "12.25")
        std::string toCanonical() const;

        bool inRange() const { return hundredths_ >= 0 && hundredths_ <= 10000; }

        bool operator==(const Percent &other) const { return hundredths_ == other.hundredths_; }
        bool operator!=(const Percent &other) const { return hundredths_ != other.hundredths_; }

      private:
        explicit Percent(int64_t hundredths) : hundredths_(hundredths) {}
        int64_t hundredths_{0};
    };

    /// Source of creation timestamps. Tests inject a fixed clock.
    using Clock = std::function<Timestamp()>;

    inline Clock systemClock() {
        return [] { return Timestamp::now(); };
    }

    /// Random RFC 4122 version 4 identifier
    std::string generateRecordId();

    /// Decodes the code point starting at text[pos] and advances pos past it.
    /// False for malformed, truncated, overlong, surrogate or out-of-range sequences; pos is then unchanged.
    bool decodeUtf8(const std::string &text, size_t &pos, uint32_t &code_point);

    /// True if every byte sequence in text is well-formed UTF-8
    bool isValidUtf8(const std::string &text);

} // namespace chainledger::ledger
