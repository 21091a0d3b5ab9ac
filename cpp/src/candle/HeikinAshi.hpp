#pragma once

#include <cstdint>
#include <optional>
#include <vector>

#include "model/Types.hpp"

namespace fcs {

// Without a previous HA bar the candle is seeded with
// HA_Open = (open + close) / 2 and HA_Close = (open + high + low + close) / 4.
HeikinAshiBar computeHeikinAshi(const Bar& bar, const std::optional<HeikinAshiBar>& previous);
std::vector<HeikinAshiBar> computeHeikinAshiSeries(const std::vector<Bar>& bars);

bool isBullishHA(const HeikinAshiBar& ha);
bool isBullishNormal(const Bar& bar);
bool passesVolumeThreshold(const Bar& bar, std::int64_t minVolume);

// The first candle of a session has no prior HA state, so HA is always seeded.
CandleSignals classifyFirstCandle(const Bar& bar);

}  // namespace fcs
