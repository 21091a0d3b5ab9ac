#include "util/MarketTime.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <iomanip>
#include <sstream>

namespace fcs {

namespace {

constexpr std::int64_t kSecondsPerDay = 86400;
constexpr int kEstOffset = -5 * 3600;
constexpr int kEdtOffset = -4 * 3600;

std::int64_t floorDiv(std::int64_t a, std::int64_t b) {
    std::int64_t q = a / b;
    if ((a % b != 0) && ((a < 0) != (b < 0))) {
        --q;
    }
    return q;
}

// Day of month of the n-th Sunday (n >= 1).
int nthSunday(int year, int month, int n) {
    int firstWeekday = weekdayFromDays(daysFromCivil(year, month, 1));
    int firstSunday = 1 + (7 - firstWeekday) % 7;
    return firstSunday + 7 * (n - 1);
}

// US rule since 2007: second Sunday of March 02:00 EST until first Sunday of November 02:00 EDT.
std::int64_t dstStartUtc(int year) {
    return daysFromCivil(year, 3, nthSunday(year, 3, 2)) * kSecondsPerDay + 7 * 3600;
}

std::int64_t dstEndUtc(int year) {
    return daysFromCivil(year, 11, nthSunday(year, 11, 1)) * kSecondsPerDay + 6 * 3600;
}

bool allDigits(const std::string& text) {
    return !text.empty() && std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isdigit(c) != 0; });
}

bool validDate(int year, int month, int day) {
    if (month < 1 || month > 12 || day < 1 || day > 31) {
        return false;
    }
    return civilFromDays(daysFromCivil(year, month, day)) == SessionDate{year, month, day};
}

}  // namespace

std::int64_t daysFromCivil(int year, int month, int day) {
    std::int64_t y = year - (month <= 2 ? 1 : 0);
    std::int64_t era = (y >= 0 ? y : y - 399) / 400;
    std::int64_t yoe = y - era * 400;
    std::int64_t doy = (153 * (month + (month > 2 ? -3 : 9)) + 2) / 5 + day - 1;
    std::int64_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + doe - 719468;
}

SessionDate civilFromDays(std::int64_t days) {
    days += 719468;
    std::int64_t era = (days >= 0 ? days : days - 146096) / 146097;
    std::int64_t doe = days - era * 146097;
    std::int64_t yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    std::int64_t y = yoe + era * 400;
    std::int64_t doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    std::int64_t mp = (5 * doy + 2) / 153;
    int d = static_cast<int>(doy - (153 * mp + 2) / 5 + 1);
    int m = static_cast<int>(mp < 10 ? mp + 3 : mp - 9);
    return SessionDate{static_cast<int>(y + (m <= 2 ? 1 : 0)), m, d};
}

int weekdayFromDays(std::int64_t days) {
    return static_cast<int>(days >= -4 ? (days + 4) % 7 : (days + 5) % 7 + 6);
}

bool isEasternDaylightTime(std::int64_t utcSeconds) {
    int year = civilFromDays(floorDiv(utcSeconds + kEstOffset, kSecondsPerDay)).year;
    return utcSeconds >= dstStartUtc(year) && utcSeconds < dstEndUtc(year);
}

int easternUtcOffsetSeconds(std::int64_t utcSeconds) {
    return isEasternDaylightTime(utcSeconds) ? kEdtOffset : kEstOffset;
}

LocalDateTime toEasternTime(std::int64_t utcSeconds) {
    std::int64_t local = utcSeconds + easternUtcOffsetSeconds(utcSeconds);
    std::int64_t days = floorDiv(local, kSecondsPerDay);
    std::int64_t secondOfDay = local - days * kSecondsPerDay;
    LocalDateTime out;
    out.date = civilFromDays(days);
    out.hour = static_cast<int>(secondOfDay / 3600);
    out.minute = static_cast<int>((secondOfDay % 3600) / 60);
    out.second = static_cast<int>(secondOfDay % 60);
    out.weekday = weekdayFromDays(days);
    return out;
}

std::int64_t easternToUtc(const SessionDate& date, int hour, int minute, int second) {
    std::int64_t local = daysFromCivil(date.year, date.month, date.day) * kSecondsPerDay + hour * 3600 + minute * 60 + second;
    std::int64_t asDaylight = local - kEdtOffset;
    if (isEasternDaylightTime(asDaylight)) {
        return asDaylight;
    }
    return local - kEstOffset;
}

std::int64_t sessionOpenUtc(const SessionDate& date) {
    return easternToUtc(date, kMarketOpenHour, kMarketOpenMinute);
}

std::int64_t sessionCloseUtc(const SessionDate& date) {
    return easternToUtc(date, kMarketCloseHour, kMarketCloseMinute);
}

std::int64_t firstCandleCloseUtc(const SessionDate& date, int timeframeMinutes) {
    return sessionOpenUtc(date) + static_cast<std::int64_t>(timeframeMinutes) * 60;
}

bool isMarketOpen(std::int64_t utcSeconds) {
    LocalDateTime local = toEasternTime(utcSeconds);
    if (local.weekday == 0 || local.weekday == 6) {
        return false;
    }
    return utcSeconds >= sessionOpenUtc(local.date) && utcSeconds <= sessionCloseUtc(local.date);
}

std::int64_t nowUtc() {
    return std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

std::optional<SessionDate> parseSessionDate(const std::string& text) {
    int year = 0;
    int month = 0;
    int day = 0;
    char trailing = 0;
    if (std::sscanf(text.c_str(), "%4d-%2d-%2d%c", &year, &month, &day, &trailing) != 3) {
        if (std::sscanf(text.c_str(), "%4d%2d%2d%c", &year, &month, &day, &trailing) != 3) {
            return std::nullopt;
        }
    }
    if (!validDate(year, month, day)) {
        return std::nullopt;
    }
    return SessionDate{year, month, day};
}

std::optional<std::int64_t> parseEasternTimestamp(const std::string& text) {
    if (allDigits(text) && text.size() > 8) {
        return std::stoll(text);
    }
    int year = 0;
    int month = 0;
    int day = 0;
    int hour = 0;
    int minute = 0;
    int second = 0;
    int fields = std::sscanf(text.c_str(), "%4d-%2d-%2d %2d:%2d:%2d", &year, &month, &day, &hour, &minute, &second);
    if (fields < 5) {
        // TWS "yyyymmdd  hh:mm:ss"
        fields = std::sscanf(text.c_str(), "%4d%2d%2d %2d:%2d:%2d", &year, &month, &day, &hour, &minute, &second);
    }
    if (fields < 5 || !validDate(year, month, day) || hour > 23 || minute > 59 || second > 59) {
        return std::nullopt;
    }
    return easternToUtc(SessionDate{year, month, day}, hour, minute, fields == 6 ? second : 0);
}

std::string toString(const SessionDate& date) {
    std::ostringstream oss;
    oss << std::setfill('0') << std::setw(4) << date.year << '-' << std::setw(2) << date.month << '-' << std::setw(2) << date.day;
    return oss.str();
}

}  // namespace fcs
