#include "candle/FirstCandle.hpp"

#include <algorithm>

namespace fcs {

std::string toString(CandleStatus status) {
    switch (status) {
        case CandleStatus::Ok:
            return "ok";
        case CandleStatus::NoData:
            return "no data";
        case CandleStatus::Malformed:
            return "malformed";
        case CandleStatus::NoSessionBar:
            return "no session bar";
        case CandleStatus::Incomplete:
            return "incomplete";
    }
    return "ok";
}

std::string validateBars(const std::vector<Bar>& bars) {
    for (std::size_t i = 0; i < bars.size(); ++i) {
        const Bar& bar = bars[i];
        if (bar.open <= 0.0 || bar.high <= 0.0 || bar.low <= 0.0 || bar.close <= 0.0) {
            return "non-positive price at bar " + std::to_string(i);
        }
        if (i > 0 && bar.time <= bars[i - 1].time) {
            return "timestamps not strictly increasing at bar " + std::to_string(i);
        }
    }
    return "";
}

FirstCandle selectFirstCandle(const std::vector<Bar>& bars, int timeframeMinutes, const std::optional<SessionDate>& session,
                              const std::optional<std::int64_t>& asOfUtc) {
    FirstCandle result;
    if (bars.empty()) {
        result.status = CandleStatus::NoData;
        result.reason = "no bars returned";
        return result;
    }
    std::string problem = validateBars(bars);
    if (!problem.empty()) {
        result.status = CandleStatus::Malformed;
        result.reason = problem;
        return result;
    }

    result.session = session ? *session : toEasternTime(bars.back().time).date;
    result.windowStart = sessionOpenUtc(result.session);
    result.windowEnd = firstCandleCloseUtc(result.session, timeframeMinutes);

    if (asOfUtc && *asOfUtc < result.windowEnd) {
        result.status = CandleStatus::Incomplete;
        result.reason = "first candle closes at " + std::to_string(result.windowEnd);
        return result;
    }

    auto first = std::lower_bound(bars.begin(), bars.end(), result.windowStart,
                                  [](const Bar& bar, std::int64_t t) { return bar.time < t; });
    if (first == bars.end() || first->time >= result.windowEnd) {
        result.status = CandleStatus::NoSessionBar;
        result.reason = "no bar between open and " + std::to_string(timeframeMinutes) + "m";
        return result;
    }

    Bar merged = *first;
    merged.time = result.windowStart;
    int count = 1;
    for (auto it = first + 1; it != bars.end() && it->time < result.windowEnd; ++it) {
        merged.high = std::max(merged.high, it->high);
        merged.low = std::min(merged.low, it->low);
        merged.close = it->close;
        merged.volume += it->volume;
        ++count;
    }
    result.status = CandleStatus::Ok;
    result.bar = merged;
    result.mergedBars = count;
    return result;
}

std::vector<Bar> sessionBars(const std::vector<Bar>& bars, const SessionDate& session) {
    std::int64_t open = sessionOpenUtc(session);
    std::int64_t close = sessionCloseUtc(session);
    std::vector<Bar> out;
    for (const auto& bar : bars) {
        if (bar.time >= open && bar.time < close) {
            out.push_back(bar);
        }
    }
    return out;
}

std::optional<double> lastCloseBefore(const std::vector<Bar>& bars, const SessionDate& session) {
    std::int64_t open = sessionOpenUtc(session);
    std::optional<double> close;
    for (const auto& bar : bars) {
        if (bar.time >= open) {
            break;
        }
        close = bar.close;
    }
    return close;
}

}  // namespace fcs
