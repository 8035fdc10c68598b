#include "excelpager/utils/TimeUtils.hpp"
#include <charconv>
#include <cmath>

namespace excelpager {
namespace utils {

namespace {

constexpr int64_t kMillisPerDay = 86400000;

// 1899-12-30 与 1904-01-01 相对 1970-01-01 的天数
constexpr int64_t kEpoch1900 = -25569;
constexpr int64_t kEpoch1904 = -24107;

bool parseFixed(std::string_view text, size_t pos, size_t width, int& value) {
    if (pos + width > text.size()) return false;
    const char* first = text.data() + pos;
    const char* last = first + width;
    auto [ptr, ec] = std::from_chars(first, last, value);
    return ec == std::errc() && ptr == last;
}

bool isValidDate(int year, int month, int day) {
    static const int kDaysInMonth[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (year < 1 || year > 9999 || month < 1 || month > 12 || day < 1) return false;
    int limit = kDaysInMonth[month - 1];
    bool leap = (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
    if (month == 2 && leap) limit = 29;
    return day <= limit;
}

// 解析 "HH:MM[:SS[.fff]]"
bool parseTime(std::string_view text, core::DateTime& dt) {
    if (!parseFixed(text, 0, 2, dt.hour) || text.size() < 5 || text[2] != ':' ||
        !parseFixed(text, 3, 2, dt.minute)) {
        return false;
    }
    size_t pos = 5;
    if (pos < text.size() && text[pos] == ':') {
        if (!parseFixed(text, pos + 1, 2, dt.second)) return false;
        pos += 3;
        if (pos < text.size() && text[pos] == '.') {
            size_t begin = pos + 1;
            size_t end = begin;
            while (end < text.size() && text[end] >= '0' && text[end] <= '9') ++end;
            if (end == begin) return false;
            // 只取前三位毫秒
            int millis = 0;
            int digits = 0;
            for (size_t i = begin; i < end && digits < 3; ++i, ++digits) {
                millis = millis * 10 + (text[i] - '0');
            }
            while (digits++ < 3) millis *= 10;
            dt.millisecond = millis;
            pos = end;
        }
    }
    if (pos < text.size() && text[pos] == 'Z') ++pos;
    if (pos != text.size()) return false;
    return dt.hour < 24 && dt.minute < 60 && dt.second < 60;
}

} // namespace

int64_t TimeUtils::daysFromCivil(int year, int month, int day) {
    int64_t y = static_cast<int64_t>(year) - (month <= 2 ? 1 : 0);
    int64_t era = (y >= 0 ? y : y - 399) / 400;
    int64_t yoe = y - era * 400;
    int64_t mp = (month + 9) % 12;
    int64_t doy = (153 * mp + 2) / 5 + day - 1;
    int64_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + doe - 719468;
}

void TimeUtils::civilFromDays(int64_t days, int& year, int& month, int& day) {
    days += 719468;
    int64_t era = (days >= 0 ? days : days - 146096) / 146097;
    int64_t doe = days - era * 146097;
    int64_t yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    int64_t y = yoe + era * 400;
    int64_t doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    int64_t mp = (5 * doy + 2) / 153;
    day = static_cast<int>(doy - (153 * mp + 2) / 5 + 1);
    month = static_cast<int>(mp < 10 ? mp + 3 : mp - 9);
    year = static_cast<int>(y + (month <= 2 ? 1 : 0));
}

std::optional<core::DateTime> TimeUtils::fromExcelSerial(double serial, bool date1904) {
    if (!std::isfinite(serial) || serial < 0 || serial > 2958466.0) {
        return std::nullopt;
    }

    int64_t total_ms = static_cast<int64_t>(std::llround(serial * static_cast<double>(kMillisPerDay)));
    int64_t day_number = total_ms / kMillisPerDay;
    int64_t ms_of_day = total_ms % kMillisPerDay;

    int64_t unix_days;
    if (date1904) {
        unix_days = kEpoch1904 + day_number;
    } else {
        // 1900-03-01 之前的序列号需要补上不存在的1900-02-29
        if (day_number > 0 && day_number < 60) {
            day_number += 1;
        }
        unix_days = kEpoch1900 + day_number;
    }

    core::DateTime dt;
    civilFromDays(unix_days, dt.year, dt.month, dt.day);
    if (dt.year > 9999) {
        return std::nullopt;
    }
    dt.hour = static_cast<int>(ms_of_day / 3600000);
    dt.minute = static_cast<int>((ms_of_day / 60000) % 60);
    dt.second = static_cast<int>((ms_of_day / 1000) % 60);
    dt.millisecond = static_cast<int>(ms_of_day % 1000);
    return dt;
}

std::optional<core::DateTime> TimeUtils::parseIsoDateTime(std::string_view text) {
    core::DateTime dt;

    // 只有时间
    if (text.size() >= 5 && text[2] == ':') {
        dt.year = 1899;
        dt.month = 12;
        dt.day = 30;
        if (!parseTime(text, dt)) return std::nullopt;
        return dt;
    }

    if (text.size() < 10 || text[4] != '-' || text[7] != '-' ||
        !parseFixed(text, 0, 4, dt.year) || !parseFixed(text, 5, 2, dt.month) ||
        !parseFixed(text, 8, 2, dt.day)) {
        return std::nullopt;
    }
    if (!isValidDate(dt.year, dt.month, dt.day)) {
        return std::nullopt;
    }

    if (text.size() == 10) {
        return dt;
    }
    if (text[10] != 'T' && text[10] != ' ') {
        return std::nullopt;
    }
    if (!parseTime(text.substr(11), dt)) {
        return std::nullopt;
    }
    return dt;
}

}} // namespace excelpager::utils
