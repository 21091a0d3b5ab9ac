#include "candle/HeikinAshi.hpp"

#include <algorithm>

namespace fcs {

HeikinAshiBar computeHeikinAshi(const Bar& bar, const std::optional<HeikinAshiBar>& previous) {
    HeikinAshiBar ha;
    ha.time = bar.time;
    ha.close = (bar.open + bar.high + bar.low + bar.close) / 4.0;
    if (previous) {
        ha.open = (previous->open + previous->close) / 2.0;
    } else {
        ha.open = (bar.open + bar.close) / 2.0;
    }
    ha.high = std::max({bar.high, ha.open, ha.close});
    ha.low = std::min({bar.low, ha.open, ha.close});
    return ha;
}

std::vector<HeikinAshiBar> computeHeikinAshiSeries(const std::vector<Bar>& bars) {
    std::vector<HeikinAshiBar> series;
    series.reserve(bars.size());
    std::optional<HeikinAshiBar> previous;
    for (const auto& bar : bars) {
        HeikinAshiBar ha = computeHeikinAshi(bar, previous);
        series.push_back(ha);
        previous = ha;
    }
    return series;
}

bool isBullishHA(const HeikinAshiBar& ha) { return ha.close > ha.open; }

bool isBullishNormal(const Bar& bar) { return bar.close > bar.open; }

bool passesVolumeThreshold(const Bar& bar, std::int64_t minVolume) { return bar.volume >= minVolume; }

CandleSignals classifyFirstCandle(const Bar& bar) {
    CandleSignals signals;
    signals.ha = computeHeikinAshi(bar, std::nullopt);
    signals.haBullish = isBullishHA(signals.ha);
    signals.normalBullish = isBullishNormal(bar);
    return signals;
}

}  // namespace fcs
