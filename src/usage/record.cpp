#include <tku/record.hpp>

#include <cctype>
#include <cstdio>

namespace tku {

bool operator==(const UsageRecord& a, const UsageRecord& b) {
    return a.provider == b.provider &&
           a.session_id == b.session_id &&
           a.timestamp == b.timestamp &&
           a.project == b.project &&
           a.model == b.model &&
           a.message_id == b.message_id &&
           a.request_id == b.request_id &&
           a.input_tokens == b.input_tokens &&
           a.output_tokens == b.output_tokens &&
           a.cache_creation_input_tokens == b.cache_creation_input_tokens &&
           a.cache_read_input_tokens == b.cache_read_input_tokens;
}

bool operator!=(const UsageRecord& a, const UsageRecord& b) {
    return !(a == b);
}

// ---------------------------------------------------------------------------
// Civil calendar conversion (proleptic Gregorian, days since 1970-01-01)
// ---------------------------------------------------------------------------

static int64_t days_from_civil(int64_t y, unsigned m, unsigned d) {
    y -= m <= 2;
    const int64_t era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<int64_t>(doe) - 719468;
}

static void civil_from_days(int64_t z, int64_t& y, unsigned& m, unsigned& d) {
    z += 719468;
    const int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    y = static_cast<int64_t>(yoe) + era * 400;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    d = doy - (153 * mp + 2) / 5 + 1;
    m = mp < 10 ? mp + 3 : mp - 9;
    y += m <= 2;
}

static unsigned days_in_month(int64_t y, unsigned m) {
    static const unsigned table[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (m == 2) {
        bool leap = (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
        return leap ? 29 : 28;
    }
    return table[m - 1];
}

// Reads exactly `n` digits at s[pos]
static bool read_digits(const std::string& s, size_t& pos, size_t n, int& out) {
    if (pos + n > s.size()) return false;
    int v = 0;
    for (size_t i = 0; i < n; ++i) {
        char c = s[pos + i];
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
        v = v * 10 + (c - '0');
    }
    pos += n;
    out = v;
    return true;
}

static bool expect(const std::string& s, size_t& pos, char c) {
    if (pos >= s.size() || s[pos] != c) return false;
    ++pos;
    return true;
}

Result<Timestamp> parse_timestamp(const std::string& text) {
    auto bad = [&text]() {
        return TkuError(TkuError::Parse, "invalid RFC 3339 timestamp: '" + text + "'");
    };

    size_t pos = 0;
    int year, month, day, hour, minute, second;
    if (!read_digits(text, pos, 4, year) || !expect(text, pos, '-') ||
        !read_digits(text, pos, 2, month) || !expect(text, pos, '-') ||
        !read_digits(text, pos, 2, day)) {
        return bad();
    }
    if (pos >= text.size() || (text[pos] != 'T' && text[pos] != 't' && text[pos] != ' ')) {
        return bad();
    }
    ++pos;
    if (!read_digits(text, pos, 2, hour) || !expect(text, pos, ':') ||
        !read_digits(text, pos, 2, minute) || !expect(text, pos, ':') ||
        !read_digits(text, pos, 2, second)) {
        return bad();
    }

    if (month < 1 || month > 12 || day < 1 ||
        static_cast<unsigned>(day) > days_in_month(year, static_cast<unsigned>(month)) ||
        hour > 23 || minute > 59 || second > 60) {
        return bad();
    }

    int64_t millis = 0;
    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        size_t digits = 0;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
            if (digits < 3) millis = millis * 10 + (text[pos] - '0');
            ++digits;
            ++pos;
        }
        if (digits == 0) return bad();
        for (size_t i = digits; i < 3; ++i) millis *= 10;
    }

    int64_t offset_sec = 0;
    if (pos < text.size() && (text[pos] == 'Z' || text[pos] == 'z')) {
        ++pos;
    } else if (pos < text.size() && (text[pos] == '+' || text[pos] == '-')) {
        int sign = text[pos] == '-' ? -1 : 1;
        ++pos;
        int oh, om;
        if (!read_digits(text, pos, 2, oh) || !expect(text, pos, ':') ||
            !read_digits(text, pos, 2, om) || oh > 23 || om > 59) {
            return bad();
        }
        offset_sec = sign * (oh * 3600 + om * 60);
    } else {
        return bad();
    }
    if (pos != text.size()) return bad();

    int64_t days = days_from_civil(year, static_cast<unsigned>(month), static_cast<unsigned>(day));
    int64_t secs = days * 86400 + hour * 3600 + minute * 60 + second - offset_sec;
    return Result<Timestamp>::ok(timestamp_from_millis(secs * 1000 + millis));
}

Timestamp timestamp_from_millis(int64_t millis) {
    return Timestamp(std::chrono::milliseconds(millis));
}

int64_t timestamp_to_millis(Timestamp ts) {
    return ts.time_since_epoch().count();
}

namespace {

struct Civil {
    int64_t year;
    unsigned month, day, hour, minute, second, millis;
};

Civil to_civil(Timestamp ts) {
    int64_t ms = timestamp_to_millis(ts);
    int64_t days = ms >= 0 ? ms / 86400000 : -((-ms + 86399999) / 86400000);
    int64_t rem = ms - days * 86400000;

    Civil c{};
    civil_from_days(days, c.year, c.month, c.day);
    c.hour = static_cast<unsigned>(rem / 3600000);
    c.minute = static_cast<unsigned>((rem / 60000) % 60);
    c.second = static_cast<unsigned>((rem / 1000) % 60);
    c.millis = static_cast<unsigned>(rem % 1000);
    return c;
}

} // namespace

std::string format_timestamp(Timestamp ts) {
    Civil c = to_civil(ts);
    char buf[40];
    std::snprintf(buf, sizeof(buf), "%04lld-%02u-%02uT%02u:%02u:%02u.%03uZ",
                  static_cast<long long>(c.year), c.month, c.day,
                  c.hour, c.minute, c.second, c.millis);
    return buf;
}

std::string format_date(Timestamp ts) {
    Civil c = to_civil(ts);
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04lld-%02u-%02u",
                  static_cast<long long>(c.year), c.month, c.day);
    return buf;
}

std::string format_month(Timestamp ts) {
    Civil c = to_civil(ts);
    char buf[12];
    std::snprintf(buf, sizeof(buf), "%04lld-%02u",
                  static_cast<long long>(c.year), c.month);
    return buf;
}

bool is_valid_date(const std::string& date) {
    if (date.size() != 10) return false;
    size_t pos = 0;
    int y, m, d;
    if (!read_digits(date, pos, 4, y) || !expect(date, pos, '-') ||
        !read_digits(date, pos, 2, m) || !expect(date, pos, '-') ||
        !read_digits(date, pos, 2, d)) {
        return false;
    }
    if (m < 1 || m > 12 || d < 1) return false;
    return static_cast<unsigned>(d) <= days_in_month(y, static_cast<unsigned>(m));
}

} // namespace tku
