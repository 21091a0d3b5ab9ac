#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "model/Types.hpp"
#include "util/MarketTime.hpp"

namespace fcs {

enum class CandleStatus { Ok, NoData, Malformed, NoSessionBar, Incomplete };

struct FirstCandle {
    CandleStatus status{CandleStatus::NoData};
    Bar bar;
    SessionDate session;
    std::int64_t windowStart{0};
    std::int64_t windowEnd{0};
    int mergedBars{0};
    std::string reason;
};

std::string toString(CandleStatus status);

// Empty when the bars are strictly ascending in time with positive prices.
std::string validateBars(const std::vector<Bar>& bars);

// Merges every bar starting in [09:30, 09:30 + timeframe) Eastern of `session`
// (default: the Eastern date of the last bar). With `asOfUtc` before the
// window end the candle is reported as Incomplete.
FirstCandle selectFirstCandle(const std::vector<Bar>& bars, int timeframeMinutes,
                              const std::optional<SessionDate>& session = std::nullopt,
                              const std::optional<std::int64_t>& asOfUtc = std::nullopt);

// Regular-hours bars (09:30 to 16:00 Eastern) of one session.
std::vector<Bar> sessionBars(const std::vector<Bar>& bars, const SessionDate& session);

// Close of the last bar that starts before the session open, if any.
std::optional<double> lastCloseBefore(const std::vector<Bar>& bars, const SessionDate& session);

}  // namespace fcs
