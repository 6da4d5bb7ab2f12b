#include <chainledger/common/error.hpp>
#include <chainledger/ledger/types.hpp>

#include <chrono>
#include <cstdio>
#include <iomanip>
#include <random>
#include <sstream>

namespace chainledger::ledger {

    namespace {

        constexpr int64_t MICROS_PER_SECOND = 1000000;
        constexpr int64_t SECONDS_PER_DAY = 86400;

        bool isLeapYear(int32_t y) { return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0; }

        uint32_t daysInMonth(int32_t y, uint32_t m) {
            static const uint32_t days[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
            if (m == 2 && isLeapYear(y))
                return 29;
            return days[m - 1];
        }

        // Floor division for negative epoch offsets
        int64_t floorDiv(int64_t a, int64_t b) { return (a >= 0) ? a / b : -((-a + b - 1) / b); }

        bool parseFixedDigits(const std::string &text, size_t pos, size_t count, int64_t &out) {
            if (pos + count > text.size())
                return false;
            int64_t value = 0;
            for (size_t i = pos; i < pos + count; ++i) {
                if (text[i] < '0' || text[i] > '9')
                    return false;
                value = value * 10 + (text[i] - '0');
            }
            out = value;
            return true;
        }

    } // namespace

    // ===========================================
    // Date
    // ===========================================

    bool Date::isValid() const {
        if (year < 1 || year > 9999)
            return false;
        if (month < 1 || month > 12)
            return false;
        return day >= 1 && day <= daysInMonth(year, month);
    }

    // days_from_civil, H. Hinnant
    int64_t Date::toDays() const {
        int64_t y = static_cast<int64_t>(year) - (month <= 2 ? 1 : 0);
        int64_t era = (y >= 0 ? y : y - 399) / 400;
        int64_t yoe = y - era * 400;
        int64_t mp = (static_cast<int64_t>(month) + 9) % 12;
        int64_t doy = (153 * mp + 2) / 5 + static_cast<int64_t>(day) - 1;
        int64_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
        return era * 146097 + doe - 719468;
    }

    Date Date::fromDays(int64_t days) {
        days += 719468;
        int64_t era = (days >= 0 ? days : days - 146096) / 146097;
        int64_t doe = days - era * 146097;
        int64_t yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
        int64_t y = yoe + era * 400;
        int64_t doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
        int64_t mp = (5 * doy + 2) / 153;
        int64_t d = doy - (153 * mp + 2) / 5 + 1;
        int64_t m = mp < 10 ? mp + 3 : mp - 9;
        return Date(static_cast<int32_t>(y + (m <= 2 ? 1 : 0)), static_cast<uint32_t>(m), static_cast<uint32_t>(d));
    }

    std::string Date::toString() const {
        char buf[16];
        std::snprintf(buf, sizeof(buf), "%04d-%02u-%02u", year, month, day);
        return buf;
    }

    dp::Result<Date, dp::Error> Date::parse(const std::string &text) {
        int64_t y = 0, m = 0, d = 0;
        if (text.size() != 10 || text[4] != '-' || text[7] != '-' || !parseFixedDigits(text, 0, 4, y) ||
            !parseFixedDigits(text, 5, 2, m) || !parseFixedDigits(text, 8, 2, d)) {
            return dp::Result<Date, dp::Error>::err(
                validation_error("Malformed date '" + text + "', expected YYYY-MM-DD"));
        }
        Date date(static_cast<int32_t>(y), static_cast<uint32_t>(m), static_cast<uint32_t>(d));
        if (!date.isValid()) {
            return dp::Result<Date, dp::Error>::err(validation_error("Date does not exist: " + text));
        }
        return dp::Result<Date, dp::Error>::ok(date);
    }

    // ===========================================
    // Timestamp
    // ===========================================

    Timestamp Timestamp::now() {
        using namespace std::chrono;
        return Timestamp(duration_cast<microseconds>(system_clock::now().time_since_epoch()).count());
    }

    Timestamp Timestamp::fromDate(const Date &date, uint32_t hour, uint32_t minute, uint32_t second) {
        int64_t seconds = date.toDays() * SECONDS_PER_DAY + hour * 3600 + minute * 60 + second;
        return Timestamp(seconds * MICROS_PER_SECOND);
    }

    Date Timestamp::date() const { return Date::fromDays(floorDiv(micros, SECONDS_PER_DAY * MICROS_PER_SECOND)); }

    std::string Timestamp::toIso8601() const {
        int64_t days = floorDiv(micros, SECONDS_PER_DAY * MICROS_PER_SECOND);
        int64_t rem = micros - days * SECONDS_PER_DAY * MICROS_PER_SECOND;
        int64_t secs = rem / MICROS_PER_SECOND;
        int64_t frac = rem % MICROS_PER_SECOND;

        Date d = Date::fromDays(days);
        char buf[40];
        std::snprintf(buf, sizeof(buf), "%04d-%02u-%02uT%02d:%02d:%02d.%06dZ", d.year, d.month, d.day,
                      static_cast<int>(secs / 3600), static_cast<int>((secs / 60) % 60), static_cast<int>(secs % 60),
                      static_cast<int>(frac));
        return buf;
    }

    dp::Result<Timestamp, dp::Error> Timestamp::parseIso8601(const std::string &text) {
        // YYYY-MM-DDTHH:MM:SS.ffffffZ
        if (text.size() != 27 || text[10] != 'T' || text[13] != ':' || text[16] != ':' || text[19] != '.' ||
            text[26] != 'Z') {
            return dp::Result<Timestamp, dp::Error>::err(validation_error("Malformed timestamp '" + text + "'"));
        }
        auto date = Date::parse(text.substr(0, 10));
        if (!date.is_ok()) {
            return dp::Result<Timestamp, dp::Error>::err(date.error());
        }
        int64_t hh = 0, mm = 0, ss = 0, frac = 0;
        if (!parseFixedDigits(text, 11, 2, hh) || !parseFixedDigits(text, 14, 2, mm) ||
            !parseFixedDigits(text, 17, 2, ss) || !parseFixedDigits(text, 20, 6, frac) || hh > 23 || mm > 59 ||
            ss > 59) {
            return dp::Result<Timestamp, dp::Error>::err(validation_error("Malformed timestamp '" + text + "'"));
        }
        Timestamp ts = fromDate(date.value(), static_cast<uint32_t>(hh), static_cast<uint32_t>(mm),
                                static_cast<uint32_t>(ss));
        ts.micros += frac;
        return dp::Result<Timestamp, dp::Error>::ok(ts);
    }

    // ===========================================
    // Percent
    // ===========================================

    dp::Result<Percent, dp::Error> Percent::parse(const std::string &text) {
        auto fail = [&text]() {
            return dp::Result<Percent, dp::Error>::err(validation_error("Malformed percentage '" + text + "'"));
        };

        if (text.empty())
            return fail();

        size_t pos = 0;
        bool negative = false;
        if (text[0] == '-' || text[0] == '+') {
            negative = text[0] == '-';
            pos = 1;
        }

        int64_t whole = 0;
        size_t whole_digits = 0;
        while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9') {
            whole = whole * 10 + (text[pos] - '0');
            if (whole > 1000000)
                return fail();
            ++pos;
            ++whole_digits;
        }
        if (whole_digits == 0)
            return fail();

        int64_t frac = 0;
        if (pos < text.size()) {
            if (text[pos] != '.')
                return fail();
            ++pos;
            size_t frac_digits = 0;
            while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9') {
                if (frac_digits >= 2 && text[pos] != '0') {
                    return dp::Result<Percent, dp::Error>::err(
                        validation_error("Percentage '" + text + "' has more than two decimal places"));
                }
                if (frac_digits < 2)
                    frac = frac * 10 + (text[pos] - '0');
                ++pos;
                ++frac_digits;
            }
            if (frac_digits == 0 || pos != text.size())
                return fail();
            if (frac_digits == 1)
                frac *= 10;
        }

        int64_t hundredths = whole * 100 + frac;
        return dp::Result<Percent, dp::Error>::ok(Percent(negative ? -hundredths : hundredths));
    }

    std::string Percent::toCanonical() const {
        int64_t abs_value = hundredths_ < 0 ? -hundredths_ : hundredths_;
        std::ostringstream ss;
        if (hundredths_ < 0)
            ss << '-';
        ss << abs_value / 100 << '.';
        int64_t frac = abs_value % 100;
        if (frac % 10 == 0)
            ss << frac / 10;
        else
            ss << std::setw(2) << std::setfill('0') << frac;
        return ss.str();
    }

    // ===========================================
    // Identifiers and text
    // ===========================================

    std::string generateRecordId() {
        thread_local std::mt19937_64 rng(std::random_device{}());
        std::uniform_int_distribution<uint64_t> dist;
        uint64_t hi = dist(rng);
        uint64_t lo = dist(rng);

        hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL; // version 4
        lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL; // RFC 4122 variant

        char buf[40];
        std::snprintf(buf, sizeof(buf), "%08x-%04x-%04x-%04x-%012llx", static_cast<unsigned>(hi >> 32),
                      static_cast<unsigned>((hi >> 16) & 0xFFFF), static_cast<unsigned>(hi & 0xFFFF),
                      static_cast<unsigned>(lo >> 48), static_cast<unsigned long long>(lo & 0xFFFFFFFFFFFFULL));
        return buf;
    }

    bool decodeUtf8(const std::string &text, size_t &pos, uint32_t &code_point) {
        auto c = static_cast<unsigned char>(text[pos]);
        if (c < 0x80) {
            code_point = c;
            ++pos;
            return true;
        }

        size_t len = 0;
        uint32_t cp = 0;
        if ((c & 0xE0) == 0xC0) {
            len = 2;
            cp = c & 0x1F;
        } else if ((c & 0xF0) == 0xE0) {
            len = 3;
            cp = c & 0x0F;
        } else if ((c & 0xF8) == 0xF0) {
            len = 4;
            cp = c & 0x07;
        } else {
            return false;
        }
        if (pos + len > text.size())
            return false;
        for (size_t k = 1; k < len; ++k) {
            auto cc = static_cast<unsigned char>(text[pos + k]);
            if ((cc & 0xC0) != 0x80)
                return false;
            cp = (cp << 6) | (cc & 0x3F);
        }
        // Overlong forms, surrogates and out-of-range code points
        if ((len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) || (len == 4 && cp < 0x10000) || cp > 0x10FFFF ||
            (cp >= 0xD800 && cp <= 0xDFFF))
            return false;

        code_point = cp;
        pos += len;
        return true;
    }

    bool isValidUtf8(const std::string &text) {
        size_t pos = 0;
        uint32_t cp = 0;
        while (pos < text.size()) {
            if (!decodeUtf8(text, pos, cp))
                return false;
        }
        return true;
    }

} // namespace chainledger::ledger
