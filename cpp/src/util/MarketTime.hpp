#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace fcs {

// Calendar date in exchange-local (US/Eastern) time.
struct SessionDate {
    int year{1970};
    int month{1};
    int day{1};

    bool operator==(const SessionDate& other) const {
        return year == other.year && month == other.month && day == other.day;
    }
    bool operator!=(const SessionDate& other) const { return !(*this == other); }
};

struct LocalDateTime {
    SessionDate date;
    int hour{0};
    int minute{0};
    int second{0};
    int weekday{0};  // 0 = Sunday
};

constexpr int kMarketOpenHour = 9;
constexpr int kMarketOpenMinute = 30;
constexpr int kMarketCloseHour = 16;
constexpr int kMarketCloseMinute = 0;

std::int64_t daysFromCivil(int year, int month, int day);
SessionDate civilFromDays(std::int64_t days);
int weekdayFromDays(std::int64_t days);

bool isEasternDaylightTime(std::int64_t utcSeconds);
int easternUtcOffsetSeconds(std::int64_t utcSeconds);
LocalDateTime toEasternTime(std::int64_t utcSeconds);
std::int64_t easternToUtc(const SessionDate& date, int hour, int minute, int second = 0);

std::int64_t sessionOpenUtc(const SessionDate& date);
std::int64_t sessionCloseUtc(const SessionDate& date);
std::int64_t firstCandleCloseUtc(const SessionDate& date, int timeframeMinutes);
bool isMarketOpen(std::int64_t utcSeconds);
std::int64_t nowUtc();

std::optional<SessionDate> parseSessionDate(const std::string& text);
// Accepts epoch seconds or "YYYY-MM-DD HH:MM[:SS]" in Eastern time.
std::optional<std::int64_t> parseEasternTimestamp(const std::string& text);
std::string toString(const SessionDate& date);

}  // namespace fcs
