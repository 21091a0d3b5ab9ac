#include <algorithm>
#include <cmath>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "candle/FirstCandle.hpp"
#include "candle/HeikinAshi.hpp"
#include "config/Parser.hpp"
#include "config/Settings.hpp"
#include "scan/Filter.hpp"
#include "util/Format.hpp"
#include "util/MarketTime.hpp"

using namespace fcs;

bool approxEqual(double a, double b, double eps = 1e-6) {
    return std::abs(a - b) < eps;
}

void check(bool condition, const std::string& what, bool& ok) {
    if (!condition) {
        std::cerr << "FAILED: " << what << std::endl;
        ok = false;
    }
}

Bar makeBar(std::int64_t time, double open, double high, double low, double close, std::int64_t volume) {
    Bar bar;
    bar.time = time;
    bar.open = open;
    bar.high = high;
    bar.low = low;
    bar.close = close;
    bar.volume = volume;
    return bar;
}

// 2024-03-15 09:30 EDT
constexpr std::int64_t kOpen = 1710509400;

void testHeikinAshi(bool& ok) {
    Bar first = makeBar(kOpen, 10.00, 10.50, 9.90, 10.30, 120000);
    HeikinAshiBar ha = computeHeikinAshi(first, std::nullopt);
    check(approxEqual(ha.open, 10.15), "seeded HA open is (open+close)/2", ok);
    check(approxEqual(ha.close, 10.175), "seeded HA close is the OHLC average", ok);
    check(approxEqual(ha.high, 10.50) && approxEqual(ha.low, 9.90), "seeded HA high/low", ok);
    check(isBullishHA(ha), "first example HA bullish", ok);
    check(isBullishNormal(first), "first example normal bullish", ok);

    Bar bearish = makeBar(kOpen, 10.00, 10.10, 9.50, 9.60, 80000);
    check(!isBullishNormal(bearish), "close below open is not normal bullish", ok);
    check(isBullishNormal(bearish) == isBullishNormal(bearish), "normal rule is deterministic", ok);

    Bar second = makeBar(kOpen + 60, 10.30, 10.60, 10.20, 10.55, 90000);
    HeikinAshiBar next = computeHeikinAshi(second, ha);
    check(approxEqual(next.open, 10.1625), "chained HA open", ok);
    check(approxEqual(next.close, 10.4125), "chained HA close", ok);
    check(isBullishHA(next), "chained HA bullish", ok);

    auto series = computeHeikinAshiSeries({first, second, bearish});
    check(series.size() == 3, "series length", ok);
    check(approxEqual(series[1].open, next.open), "series matches manual chaining", ok);
    for (std::size_t i = 0; i < series.size(); ++i) {
        const Bar& raw = i == 0 ? first : (i == 1 ? second : bearish);
        check(approxEqual(series[i].high, std::max({raw.high, series[i].open, series[i].close})), "HA high invariant", ok);
        check(approxEqual(series[i].low, std::min({raw.low, series[i].open, series[i].close})), "HA low invariant", ok);
    }

    // HA open above the raw high widens the HA range.
    HeikinAshiBar prev;
    prev.open = 12.0;
    prev.close = 12.4;
    HeikinAshiBar gap = computeHeikinAshi(bearish, prev);
    check(approxEqual(gap.high, 12.2), "HA high takes HA open when above raw high", ok);
    check(!isBullishHA(gap), "gap-down HA bearish", ok);

    Bar thin = makeBar(kOpen, 10.0, 10.2, 9.9, 10.1, 50000);
    check(!passesVolumeThreshold(thin, 100000), "50k below 100k threshold", ok);
    check(passesVolumeThreshold(thin, 50000), "threshold is inclusive", ok);

    CandleSignals signals = classifyFirstCandle(first);
    check(signals.haBullish && signals.normalBullish, "classifier flags", ok);
    check(approxEqual(signals.ha.open, 10.15), "classifier seeds HA", ok);
}

void testFirstCandle(bool& ok) {
    FirstCandle empty = selectFirstCandle({}, 2);
    check(empty.status == CandleStatus::NoData, "empty input is NoData", ok);

    std::vector<Bar> bars{
        makeBar(1710446340, 9.70, 9.85, 9.65, 9.80, 40000),      // 2024-03-14 15:59
        makeBar(kOpen - 60, 9.90, 10.00, 9.85, 9.95, 5000),      // 09:29 pre-market
        makeBar(kOpen, 10.00, 10.50, 9.90, 10.20, 60000),        // 09:30
        makeBar(kOpen + 60, 10.20, 10.60, 10.10, 10.30, 50000),  // 09:31
        makeBar(kOpen + 120, 10.30, 10.40, 10.00, 10.05, 70000)  // 09:32
    };

    FirstCandle merged = selectFirstCandle(bars, 2);
    check(merged.status == CandleStatus::Ok, "two-minute candle found", ok);
    check(merged.session == SessionDate{2024, 3, 15}, "session defaults to the last bar's date", ok);
    check(merged.mergedBars == 2, "two one-minute bars merged", ok);
    check(merged.bar.time == kOpen, "candle time is the session open", ok);
    check(approxEqual(merged.bar.open, 10.00) && approxEqual(merged.bar.close, 10.30), "merged open/close", ok);
    check(approxEqual(merged.bar.high, 10.60) && approxEqual(merged.bar.low, 9.90), "merged high/low", ok);
    check(merged.bar.volume == 110000, "merged volume", ok);

    FirstCandle single = selectFirstCandle(bars, 1);
    check(single.status == CandleStatus::Ok && single.mergedBars == 1 && single.bar.volume == 60000, "one-minute candle", ok);

    FirstCandle forming = selectFirstCandle(bars, 2, std::nullopt, kOpen + 60);
    check(forming.status == CandleStatus::Incomplete, "candle still forming", ok);
    FirstCandle closed = selectFirstCandle(bars, 2, std::nullopt, kOpen + 120);
    check(closed.status == CandleStatus::Ok, "candle complete at window end", ok);

    FirstCandle pinned = selectFirstCandle(bars, 2, SessionDate{2024, 3, 14});
    check(pinned.status == CandleStatus::NoSessionBar, "no bar inside the pinned session window", ok);

    std::vector<Bar> preOnly{bars[1]};
    check(selectFirstCandle(preOnly, 2).status == CandleStatus::NoSessionBar, "pre-market only", ok);

    std::vector<Bar> duplicate{bars[2], bars[2]};
    check(selectFirstCandle(duplicate, 2).status == CandleStatus::Malformed, "duplicate timestamps are malformed", ok);
    std::vector<Bar> reversed{bars[3], bars[2]};
    check(selectFirstCandle(reversed, 2).status == CandleStatus::Malformed, "descending timestamps are malformed", ok);
    std::vector<Bar> negative{makeBar(kOpen, 10.0, 10.5, -1.0, 10.2, 100)};
    check(selectFirstCandle(negative, 2).status == CandleStatus::Malformed, "non-positive price is malformed", ok);
    check(validateBars(bars).empty(), "well-formed bars validate", ok);

    auto regular = sessionBars(bars, SessionDate{2024, 3, 15});
    check(regular.size() == 3 && regular.front().time == kOpen, "session bars skip pre-market", ok);
    auto previous = lastCloseBefore(bars, SessionDate{2024, 3, 15});
    check(previous && approxEqual(*previous, 9.95), "last close before the open", ok);
    check(!lastCloseBefore(regular, SessionDate{2024, 3, 15}), "no close before the open", ok);
}

void testMarketTime(bool& ok) {
    check(easternToUtc(SessionDate{2024, 3, 15}, 9, 30) == kOpen, "EDT open", ok);
    check(easternToUtc(SessionDate{2024, 1, 10}, 9, 30) == 1704897000, "EST open", ok);
    check(sessionOpenUtc(SessionDate{2024, 3, 15}) == kOpen, "session open", ok);
    check(firstCandleCloseUtc(SessionDate{2024, 3, 15}, 5) == kOpen + 300, "first candle close", ok);

    LocalDateTime open = toEasternTime(kOpen);
    check(open.date == SessionDate{2024, 3, 15} && open.hour == 9 && open.minute == 30 && open.weekday == 5, "EDT conversion", ok);
    LocalDateTime winter = toEasternTime(1704897000);
    check(winter.hour == 9 && winter.minute == 30 && winter.weekday == 3, "EST conversion", ok);

    // 2024-03-10 spring forward at 07:00 UTC.
    LocalDateTime beforeSpring = toEasternTime(1710053999);
    check(!isEasternDaylightTime(1710053999) && beforeSpring.hour == 1 && beforeSpring.minute == 59, "before spring forward", ok);
    LocalDateTime afterSpring = toEasternTime(1710054000);
    check(isEasternDaylightTime(1710054000) && afterSpring.hour == 3 && afterSpring.minute == 0, "after spring forward", ok);
    // 2024-11-03 fall back at 06:00 UTC.
    LocalDateTime beforeFall = toEasternTime(1730613599);
    check(isEasternDaylightTime(1730613599) && beforeFall.hour == 1 && beforeFall.minute == 59, "before fall back", ok);
    LocalDateTime afterFall = toEasternTime(1730613600);
    check(!isEasternDaylightTime(1730613600) && afterFall.hour == 1 && afterFall.minute == 0, "after fall back", ok);

    check(isMarketOpen(kOpen), "open at 09:30", ok);
    check(!isMarketOpen(kOpen - 60), "closed at 09:29", ok);
    check(!isMarketOpen(1710601200), "closed on Saturday", ok);

    auto dashed = parseSessionDate("2024-03-15");
    auto compact = parseSessionDate("20240315");
    check(dashed && compact && *dashed == *compact, "session date formats", ok);
    check(!parseSessionDate("2024-02-30"), "invalid day rejected", ok);
    check(parseEasternTimestamp("2024-03-15 09:30") == std::optional<std::int64_t>(kOpen), "Eastern timestamp", ok);
    check(parseEasternTimestamp("20240315 09:30:00") == std::optional<std::int64_t>(kOpen), "TWS timestamp", ok);
    check(parseEasternTimestamp("1710509400") == std::optional<std::int64_t>(kOpen), "epoch timestamp", ok);
    check(!parseEasternTimestamp("yesterday"), "garbage timestamp rejected", ok);
    check(toString(SessionDate{2024, 3, 5}) == "2024-03-05", "date formatting", ok);
}

void testFormat(bool& ok) {
    check(formatVolume(999) == "999", "plain volume", ok);
    check(formatVolume(1500) == "1.50K", "thousands", ok);
    check(formatVolume(2500000) == "2.50M", "millions", ok);
    check(formatVolume(3200000000LL) == "3.20B", "billions", ok);
    check(formatMarketCap(1500.0) == "$1.50T", "trillion cap", ok);
    check(formatMarketCap(2.5) == "$2.50B", "billion cap", ok);
    check(formatMarketCap(0.35) == "$350.00M", "million cap", ok);
    check(formatPrice(10.3) == "$10.30", "price", ok);
    check(formatPercent(1.234) == "+1.23%", "positive percent", ok);
    check(formatPercent(-0.5) == "-0.50%", "negative percent", ok);
    check(formatEasternTime(kOpen) == "2024-03-15 09:30:00 ET", "Eastern clock", ok);
}

void testSettings(bool& ok) {
    ScannerSettings defaults;
    check(validateSettings(defaults).empty(), "defaults are valid", ok);
    check(describeParameters(defaults) == "TF:2m | Vol:100000 | Price:$0-$100", "parameter summary", ok);

    ScannerSettings bad;
    bad.minPrice = 50.0;
    bad.maxPrice = 10.0;
    bad.timeframeMinutes = 4;
    auto errors = validateSettings(bad);
    check(errors.size() == 2, "two validation errors", ok);
    check(!errors.empty() && errors[0] == "Maximum price must be greater than minimum price", "price range message", ok);
    check(errors.size() > 1 && errors[1] == "Timeframe must be one of: 1, 2, 3, 5, 10, 15", "timeframe message", ok);

    ScannerSettings negative;
    negative.minVolume = -1;
    negative.minMarketCap = -1.0;
    check(validateSettings(negative).size() == 2, "negative cap and volume rejected", ok);

    check(scannerLocationCode(Exchange::Nasdaq) == "STK.NASDAQ", "NASDAQ location", ok);
    check(scannerLocationCode(Exchange::Both) == "STK.US.MAJOR", "BOTH location", ok);
    check(parseExchange("nyse") == Exchange::Nyse, "exchange parsing", ok);
}

void testFilter(bool& ok) {
    check(exchangeMatches(Exchange::Nasdaq, "ISLAND"), "ISLAND is NASDAQ", ok);
    check(!exchangeMatches(Exchange::Nyse, "island"), "ISLAND is not NYSE", ok);
    check(exchangeMatches(Exchange::Both, "nyse"), "BOTH accepts NYSE", ok);
    check(!exchangeMatches(Exchange::Both, "ARCA"), "BOTH rejects ARCA", ok);
    check(exchangeMatches(Exchange::Nyse, ""), "unknown exchange accepted", ok);

    ScannerSettings settings;
    settings.minPrice = 5.0;
    settings.maxPrice = 50.0;
    settings.minMarketCap = 1.0;
    settings.maxMarketCap = 20.0;

    SymbolSnapshot sparse;
    sparse.symbol = "ABC";
    check(isEligible(settings, sparse), "missing fields are not checked", ok);

    SymbolSnapshot full = sparse;
    full.primaryExchange = "NASDAQ";
    full.lastPrice = 12.0;
    full.marketCapBillions = 3.0;
    full.volume = 2000000;
    check(isEligible(settings, full), "in range snapshot eligible", ok);
    full.lastPrice = 60.0;
    check(!isEligible(settings, full), "price above range", ok);
    full.lastPrice = 50.0;
    check(isEligible(settings, full), "price range inclusive", ok);
    full.marketCapBillions = 0.5;
    check(!isEligible(settings, full), "cap below range", ok);
    full.marketCapBillions = 3.0;
    full.volume = 10;
    check(!isEligible(settings, full), "volume below minimum", ok);

    CandleSignals haOnly;
    haOnly.haBullish = true;
    CandleSignals normalOnly;
    normalOnly.normalBullish = true;
    CandleSignals neither;

    ScannerSettings both;
    check(matchesSignalSelection(both, haOnly) && matchesSignalSelection(both, normalOnly), "either signal when both enabled", ok);
    check(!matchesSignalSelection(both, neither), "no signal rejected", ok);
    ScannerSettings haSettings;
    haSettings.detectNormal = false;
    check(matchesSignalSelection(haSettings, haOnly) && !matchesSignalSelection(haSettings, normalOnly), "HA only", ok);
    ScannerSettings normalSettings;
    normalSettings.detectHeikinAshi = false;
    check(matchesSignalSelection(normalSettings, normalOnly) && !matchesSignalSelection(normalSettings, haOnly), "normal only", ok);
    ScannerSettings none;
    none.detectHeikinAshi = false;
    none.detectNormal = false;
    check(matchesSignalSelection(none, neither), "no detector accepts everything", ok);
}

void testParser(bool& ok) {
    std::istringstream input(
        "# scanner\n"
        "BROKER replay\n"
        "host 10.0.0.5\n"
        "PORT 7496\n"
        "CLIENT_ID 7\n"
        "REQUEST_TIMEOUT 20\n"
        "SCAN_INTERVAL 45\n"
        "MAX_ROWS 80\n"
        "HISTORY 5\n"
        "EXCHANGE nasdaq\n"
        "TIMEFRAME 5   # minutes\n"
        "PRICE 2.5 40\n"
        "MARKET_CAP 1 25\n"
        "MIN_VOLUME 250000\n"
        "DETECT HA\n"
        "UNIVERSE data/universe.csv\n"
        "BARS_DIR data/bars\n"
        "SETTINGS_FILE my_settings.json\n"
        "LOG_LEVEL DEBUG\n"
        "LOG_FILE -\n"
        "SOMETHING_ELSE 1\n");
    AppConfig config = parseConfigStream(input);
    check(config.broker == "replay", "broker", ok);
    check(config.connection.host == "10.0.0.5" && config.connection.port == 7496 && config.connection.clientId == 7, "connection", ok);
    check(config.connection.requestTimeoutSeconds == 20, "timeout", ok);
    check(config.scanIntervalSeconds == 45, "interval", ok);
    check(config.maxRows == kMaxScannerRows, "rows capped at the scanner limit", ok);
    check(config.historyLimit == 5, "history", ok);
    check(config.scanner.exchange == Exchange::Nasdaq, "exchange", ok);
    check(config.scanner.timeframeMinutes == 5, "timeframe with trailing comment", ok);
    check(approxEqual(config.scanner.minPrice, 2.5) && approxEqual(config.scanner.maxPrice, 40.0), "price", ok);
    check(approxEqual(config.scanner.minMarketCap, 1.0) && approxEqual(config.scanner.maxMarketCap, 25.0), "market cap", ok);
    check(config.scanner.minVolume == 250000, "volume", ok);
    check(config.scanner.detectHeikinAshi && !config.scanner.detectNormal, "detectors", ok);
    check(config.universeFile == "data/universe.csv" && config.barsDir == "data/bars", "replay paths", ok);
    check(config.settingsFile == "my_settings.json", "settings file", ok);
    check(config.logLevel == "debug" && config.logFile == "-", "logging", ok);

    std::istringstream badPort("PORT abc\n");
    bool threw = false;
    try {
        parseConfigStream(badPort);
    } catch (const std::runtime_error& ex) {
        threw = std::string(ex.what()).find("PORT") != std::string::npos;
    }
    check(threw, "bad integer names the key", ok);

    std::istringstream badTimeframe("TIMEFRAME 7\n");
    threw = false;
    try {
        parseConfigStream(badTimeframe);
    } catch (const std::runtime_error&) {
        threw = true;
    }
    check(threw, "unsupported timeframe rejected", ok);

    std::istringstream empty("");
    AppConfig defaults = parseConfigStream(empty);
    check(defaults.broker == "tws" && defaults.connection.port == 7497 && defaults.scanIntervalSeconds == 30, "defaults", ok);

    check(parseBroker("REPLAY") == "replay" && parseBroker("Tws") == "tws", "broker override lowercased", ok);
    threw = false;
    try {
        parseBroker("ib");
    } catch (const std::runtime_error&) {
        threw = true;
    }
    check(threw, "unknown broker override rejected", ok);
}

int main() {
    bool ok = true;
    testHeikinAshi(ok);
    testFirstCandle(ok);
    testMarketTime(ok);
    testFormat(ok);
    testSettings(ok);
    testFilter(ok);
    testParser(ok);
    if (ok) {
        std::cout << "All core tests passed." << std::endl;
    }
    return ok ? 0 : 1;
}
