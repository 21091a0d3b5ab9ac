#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace fcs {

// One OHLCV bar. `time` is the bar start in UTC seconds since the epoch.
struct Bar {
    std::int64_t time{0};
    double open{0.0};
    double high{0.0};
    double low{0.0};
    double close{0.0};
    std::int64_t volume{0};
};

struct HeikinAshiBar {
    std::int64_t time{0};
    double open{0.0};
    double high{0.0};
    double low{0.0};
    double close{0.0};
};

struct CandleSignals {
    HeikinAshiBar ha;
    bool haBullish{false};
    bool normalBullish{false};
};

enum class Exchange { Nasdaq, Nyse, Both };

// What the broker's universe query knows about a symbol before any bars are fetched.
struct SymbolSnapshot {
    std::string symbol;
    std::string primaryExchange;
    std::optional<double> lastPrice;
    std::optional<double> marketCapBillions;
    std::optional<std::int64_t> volume;
    std::optional<double> previousClose;
};

struct Quote {
    double bid{0.0};
    double ask{0.0};
    double last{0.0};
    std::int64_t volume{0};
};

struct ScanResult {
    std::string symbol;
    double lastPrice{0.0};
    double changePercent{0.0};
    double bid{0.0};
    double ask{0.0};
    double marketCapBillions{0.0};
    std::int64_t volume{0};
    bool haBullish{false};
    bool normalBullish{false};
    std::int64_t firstCandleVolume{0};
    std::int64_t scanTime{0};
    std::string parametersUsed;
    Bar firstBar;
    HeikinAshiBar firstHa;
    std::vector<Bar> sessionBars;
};

}  // namespace fcs
