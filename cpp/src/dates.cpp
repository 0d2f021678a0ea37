#include "internal.h"
#include "histofy/error.h"

#include <chrono>
#include <cstdio>
#include <iomanip>
#include <random>
#include <sstream>
#include <string>

namespace histofy {
namespace dates {

namespace {

bool all_digits(const std::string& s, size_t pos, size_t len) {
    if (pos + len > s.size()) return false;
    for (size_t i = pos; i < pos + len; ++i) {
        if (s[i] < '0' || s[i] > '9') return false;
    }
    return true;
}

int to_int(const std::string& s, size_t pos, size_t len) {
    return std::stoi(s.substr(pos, len));
}

bool is_leap(int y) {
    return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
}

int days_in_month(int y, int m) {
    static const int table[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (m == 2 && is_leap(y)) return 29;
    return table[m - 1];
}

// Floor division for negative epochs.
int64_t floor_div(int64_t a, int64_t b) {
    int64_t q = a / b;
    if ((a % b != 0) && ((a < 0) != (b < 0))) --q;
    return q;
}

} // anonymous namespace

CivilDate parse_date(const std::string& s) {
    if (s.size() != 10 || s[4] != '-' || s[7] != '-' ||
        !all_digits(s, 0, 4) || !all_digits(s, 5, 2) || !all_digits(s, 8, 2)) {
        throw ValidationError("invalid date '" + s + "'", "date",
                              "use the YYYY-MM-DD format");
    }
    CivilDate d{to_int(s, 0, 4), to_int(s, 5, 2), to_int(s, 8, 2)};
    if (d.year < 1970 || d.month < 1 || d.month > 12 || d.day < 1 ||
        d.day > days_in_month(d.year, d.month)) {
        throw ValidationError("invalid date '" + s + "'", "date",
                              "use a real calendar date on or after 1970-01-01");
    }
    return d;
}

ClockTime parse_time(const std::string& s) {
    if (s.size() != 5 || s[2] != ':' || !all_digits(s, 0, 2) ||
        !all_digits(s, 3, 2)) {
        throw ValidationError("invalid time '" + s + "'", "time",
                              "use the HH:MM 24-hour format");
    }
    ClockTime t{to_int(s, 0, 2), to_int(s, 3, 2)};
    if (t.hour > 23 || t.minute > 59) {
        throw ValidationError("invalid time '" + s + "'", "time",
                              "hours are 00-23 and minutes 00-59");
    }
    return t;
}

// Howard Hinnant's days_from_civil / civil_from_days.
int64_t days_from_civil(const CivilDate& d) {
    int64_t y = d.year - (d.month <= 2 ? 1 : 0);
    int64_t era = floor_div(y, 400);
    int64_t yoe = y - era * 400;
    int64_t mp  = (d.month + 9) % 12;
    int64_t doy = (153 * mp + 2) / 5 + d.day - 1;
    int64_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + doe - 719468;
}

CivilDate civil_from_days(int64_t z) {
    z += 719468;
    int64_t era = floor_div(z, 146097);
    int64_t doe = z - era * 146097;
    int64_t yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    int64_t y   = yoe + era * 400;
    int64_t doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    int64_t mp  = (5 * doy + 2) / 153;
    int64_t d   = doy - (153 * mp + 2) / 5 + 1;
    int64_t m   = mp < 10 ? mp + 3 : mp - 9;
    return CivilDate{static_cast<int>(y + (m <= 2 ? 1 : 0)),
                     static_cast<int>(m), static_cast<int>(d)};
}

int64_t to_epoch(const CivilDate& d, const ClockTime& t, int tz_offset) {
    int64_t local = days_from_civil(d) * 86400 + t.hour * 3600 + t.minute * 60;
    return local - static_cast<int64_t>(tz_offset) * 60;
}

std::string format_date(int64_t epoch, int tz_offset) {
    int64_t local = epoch + static_cast<int64_t>(tz_offset) * 60;
    CivilDate d = civil_from_days(floor_div(local, 86400));
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", d.year, d.month, d.day);
    return buf;
}

std::string format_time(int64_t epoch, int tz_offset) {
    int64_t local = epoch + static_cast<int64_t>(tz_offset) * 60;
    int64_t secs = local - floor_div(local, 86400) * 86400;
    char buf[8];
    std::snprintf(buf, sizeof(buf), "%02d:%02d",
                  static_cast<int>(secs / 3600),
                  static_cast<int>((secs % 3600) / 60));
    return buf;
}

std::string format_datetime(int64_t epoch, int tz_offset) {
    int64_t local = epoch + static_cast<int64_t>(tz_offset) * 60;
    int64_t secs = local - floor_div(local, 86400) * 86400;
    char buf[12];
    std::snprintf(buf, sizeof(buf), ":%02d", static_cast<int>(secs % 60));
    return format_date(epoch, tz_offset) + " " +
           format_time(epoch, tz_offset) + buf;
}

std::string format_iso8601(int64_t epoch) {
    std::string dt = format_datetime(epoch, 0);
    dt[10] = 'T';
    return dt + "Z";
}

std::optional<int64_t> parse_iso8601(const std::string& s) {
    // YYYY-MM-DDTHH:MM:SSZ
    if (s.size() != 20 || s[10] != 'T' || s[13] != ':' || s[16] != ':' ||
        s[19] != 'Z' || !all_digits(s, 17, 2)) {
        return std::nullopt;
    }
    try {
        CivilDate d = parse_date(s.substr(0, 10));
        ClockTime t = parse_time(s.substr(11, 5));
        return to_epoch(d, t, 0) + to_int(s, 17, 2);
    } catch (const ValidationError&) {
        return std::nullopt;
    }
}

int64_t now() {
    using namespace std::chrono;
    return duration_cast<seconds>(system_clock::now().time_since_epoch())
        .count();
}

} // namespace dates

// ---------------------------------------------------------------------------
// ids
// ---------------------------------------------------------------------------

namespace ids {

std::string random_hex(size_t bytes) {
    static thread_local std::mt19937 gen{std::random_device{}()};
    std::uniform_int_distribution<int> dist(0, 255);
    std::ostringstream out;
    out << std::hex << std::setfill('0');
    for (size_t i = 0; i < bytes; ++i) out << std::setw(2) << dist(gen);
    return out.str();
}

std::string operation_id() {
    using namespace std::chrono;
    auto ms = duration_cast<milliseconds>(
                  system_clock::now().time_since_epoch()).count();
    return "op_" + std::to_string(ms) + "_" + random_hex(4);
}

} // namespace ids

} // namespace histofy
