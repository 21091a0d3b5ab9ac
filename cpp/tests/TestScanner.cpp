#include <atomic>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

#include "io/BarCsv.hpp"
#include "scan/BrokerClient.hpp"
#include "scan/Scanner.hpp"

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

// 2024-03-15 09:30 EDT
constexpr std::int64_t kOpen = 1710509400;
constexpr std::int64_t kPrevClose = 1710446340;  // 2024-03-14 15:59 EDT

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

SymbolSnapshot makeSnapshot(const std::string& symbol, const std::string& exchange) {
    SymbolSnapshot snapshot;
    snapshot.symbol = symbol;
    snapshot.primaryExchange = exchange;
    snapshot.marketCapBillions = 5.0;
    return snapshot;
}

class FakeBroker : public BrokerClient {
  public:
    std::vector<SymbolSnapshot> universe;
    std::map<std::string, std::vector<Bar>> bars;
    std::map<std::string, Quote> quotes;
    std::string throwOnSymbol;
    bool throwConnectivity{false};
    bool failUniverse{false};
    std::string cancelAfterSymbol;
    std::atomic<bool>* cancelFlag{nullptr};
    bool connected{true};
    std::vector<std::string> barRequests;

    bool connect(const ConnectionConfig&) override {
        connected = true;
        return true;
    }
    void disconnect() override { connected = false; }
    bool isConnected() const override { return connected; }

    std::vector<SymbolSnapshot> fetchUniverse(const ScannerSettings&, int) override {
        if (failUniverse) {
            throw BrokerError("scanner subscription lost");
        }
        return universe;
    }

    std::vector<Bar> fetchBars(const SymbolSnapshot& symbol, int, int) override {
        barRequests.push_back(symbol.symbol);
        if (symbol.symbol == throwOnSymbol) {
            if (throwConnectivity) {
                throw BrokerError("Connectivity between IB and TWS has been lost");
            }
            throw std::runtime_error("unexpected payload");
        }
        if (cancelFlag && symbol.symbol == cancelAfterSymbol) {
            cancelFlag->store(true);
        }
        auto it = bars.find(symbol.symbol);
        return it == bars.end() ? std::vector<Bar>{} : it->second;
    }

    std::optional<Quote> fetchQuote(const SymbolSnapshot& symbol) override {
        auto it = quotes.find(symbol.symbol);
        if (it == quotes.end()) {
            return std::nullopt;
        }
        return it->second;
    }
};

Quote makeQuote(double bid, double ask, double last, std::int64_t volume) {
    Quote quote;
    quote.bid = bid;
    quote.ask = ask;
    quote.last = last;
    quote.volume = volume;
    return quote;
}

void populate(FakeBroker& broker) {
    broker.universe = {makeSnapshot("AAA", "NASDAQ"), makeSnapshot("BBB", "NYSE"), makeSnapshot("CCC", "ISLAND"),
                       makeSnapshot("DDD", "NASDAQ"), makeSnapshot("EEE", "ARCA"),  makeSnapshot("FFF", "NYSE"),
                       makeSnapshot("GGG", "NASDAQ")};
    broker.bars["AAA"] = {makeBar(kPrevClose, 9.70, 9.85, 9.65, 9.80, 40000), makeBar(kOpen, 10.00, 10.50, 9.90, 10.20, 60000),
                          makeBar(kOpen + 60, 10.20, 10.60, 10.10, 10.30, 50000),
                          makeBar(kOpen + 120, 10.30, 10.45, 10.25, 10.40, 30000)};
    broker.bars["BBB"] = {makeBar(kOpen, 10.00, 10.10, 9.50, 9.60, 200000)};
    broker.bars["CCC"] = {makeBar(kOpen, 10.00, 10.50, 9.90, 10.30, 50000)};
    broker.bars["FFF"] = {makeBar(kOpen, 10.00, 10.50, 9.90, 10.30, 500000), makeBar(kOpen, 10.30, 10.40, 10.20, 10.35, 1000)};
    broker.throwOnSymbol = "GGG";
    broker.quotes["AAA"] = makeQuote(10.39, 10.41, 10.40, 1500000);
}

ScanRequest makeRequest() {
    ScanRequest request;
    request.asOfUtc = kOpen + 600;
    return request;
}

void testFullCycle(bool& ok) {
    FakeBroker broker;
    populate(broker);
    Scanner scanner(broker);
    CycleReport report = scanner.runCycle(makeRequest());

    check(!report.failed && !report.cancelled, "cycle completes", ok);
    check(report.candidates == 7, "all candidates visited", ok);
    check(report.results.size() == 1, "one match", ok);
    check(report.ineligible == 1, "ARCA symbol ineligible", ok);
    check(report.noSignal == 1, "bearish symbol has no signal", ok);
    check(report.belowVolume == 1, "thin first candle rejected", ok);
    check(report.noData == 1, "empty bars counted as no data", ok);
    check(report.malformed == 1, "duplicate timestamps counted as malformed", ok);
    check(report.errors == 1, "unexpected error counted", ok);
    check(report.parametersUsed == "TF:2m | Vol:100000 | Price:$0-$100", "parameters recorded", ok);
    check(report.startedUtc == kOpen + 600, "start time follows as-of", ok);

    if (!report.results.empty()) {
        const ScanResult& r = report.results.front();
        check(r.symbol == "AAA", "matching symbol", ok);
        check(approxEqual(r.lastPrice, 10.40) && approxEqual(r.bid, 10.39) && approxEqual(r.ask, 10.41), "quote fields", ok);
        check(approxEqual(r.changePercent, (10.40 - 9.80) / 9.80 * 100.0), "change from the previous session close", ok);
        check(approxEqual(r.marketCapBillions, 5.0), "market cap", ok);
        check(r.volume == 1500000, "quote volume", ok);
        check(r.firstCandleVolume == 110000, "first candle volume", ok);
        check(r.haBullish && r.normalBullish, "signals", ok);
        check(r.firstBar.time == kOpen && approxEqual(r.firstBar.close, 10.30), "first candle", ok);
        check(approxEqual(r.firstHa.open, 10.15), "first HA candle seeded", ok);
        check(r.sessionBars.size() == 3, "session bars exclude the previous day", ok);
        check(r.scanTime == kOpen + 600, "scan time", ok);
    }
}

void testSignalSelection(bool& ok) {
    FakeBroker broker;
    populate(broker);
    broker.throwOnSymbol.clear();
    Scanner scanner(broker);
    ScanRequest request = makeRequest();
    request.settings.detectHeikinAshi = false;
    request.settings.detectNormal = false;
    request.settings.minVolume = 0;
    CycleReport report = scanner.runCycle(request);
    // AAA, BBB, CCC pass; DDD has no data, EEE is ineligible, FFF malformed, GGG has no data.
    check(report.results.size() == 3, "no detector keeps every candle above the volume threshold", ok);
}

void testIncomplete(bool& ok) {
    FakeBroker broker;
    populate(broker);
    Scanner scanner(broker);
    ScanRequest request = makeRequest();
    request.asOfUtc = kOpen + 60;
    CycleReport report = scanner.runCycle(request);
    check(report.results.empty(), "no results while the first candle forms", ok);
    check(report.incomplete == 3, "incomplete counted for symbols with valid bars", ok);
}

void testLivePriceRecheck(bool& ok) {
    FakeBroker broker;
    populate(broker);
    broker.quotes["AAA"] = makeQuote(150.0, 150.1, 150.05, 1000000);
    Scanner scanner(broker);
    CycleReport report = scanner.runCycle(makeRequest());
    check(report.results.empty(), "last price outside the range drops the symbol", ok);
    check(report.ineligible == 2, "recheck counted as ineligible", ok);
}

void testCancellation(bool& ok) {
    FakeBroker broker;
    populate(broker);
    std::atomic<bool> cancel{false};
    broker.cancelFlag = &cancel;
    broker.cancelAfterSymbol = "AAA";
    Scanner scanner(broker);
    CycleReport report = scanner.runCycle(makeRequest(), &cancel);
    check(report.cancelled, "cycle cancelled", ok);
    check(!report.failed, "cancel is not a failure", ok);
    check(report.results.size() == 1, "partial results kept", ok);
    check(broker.barRequests.size() == 1, "no bars requested after cancel", ok);

    std::atomic<bool> preset{true};
    FakeBroker idle;
    populate(idle);
    Scanner idleScanner(idle);
    CycleReport none = idleScanner.runCycle(makeRequest(), &preset);
    check(none.cancelled && none.candidates == 0, "cancel before the first symbol", ok);
    check(idle.barRequests.empty(), "preset cancel requests no bars", ok);
}

void testConnectivityFailure(bool& ok) {
    FakeBroker broker;
    populate(broker);
    broker.throwOnSymbol = "BBB";
    broker.throwConnectivity = true;
    Scanner scanner(broker);
    CycleReport report = scanner.runCycle(makeRequest());
    check(report.failed, "connectivity loss fails the cycle", ok);
    check(report.failure.find("lost") != std::string::npos, "failure message kept", ok);
    check(report.results.size() == 1, "results before the failure kept", ok);
    check(broker.barRequests.size() == 2, "cycle stops at the failure", ok);

    FakeBroker universeDown;
    universeDown.failUniverse = true;
    Scanner second(universeDown);
    CycleReport failed = second.runCycle(makeRequest());
    check(failed.failed && failed.candidates == 0, "universe failure fails the cycle", ok);

    FakeBroker offline;
    offline.connected = false;
    Scanner third(offline);
    CycleReport notConnected = third.runCycle(makeRequest());
    check(notConnected.failed && notConnected.failure == "Not connected to broker", "disconnected broker", ok);

    FakeBroker valid;
    Scanner fourth(valid);
    ScanRequest bad = makeRequest();
    bad.settings.timeframeMinutes = 4;
    check(fourth.runCycle(bad).failed, "invalid settings fail the cycle", ok);
}

void testHistory(bool& ok) {
    ScanHistory history(2);
    for (int i = 0; i < 3; ++i) {
        CycleReport report;
        report.startedUtc = kOpen + i;
        history.add(report);
    }
    check(history.size() == 2, "history trimmed", ok);
    check(history.latest() && history.latest()->startedUtc == kOpen + 2, "newest first", ok);
    check(history.at(1).startedUtc == kOpen + 1, "oldest kept entry", ok);
    history.setLimit(1);
    check(history.size() == 1, "shrinking the limit trims", ok);
    history.clear();
    check(history.empty() && history.latest() == nullptr, "history cleared", ok);
    check(ScanHistory().limit() == 20, "default history depth", ok);
}

void testLiveCycleRequest(bool& ok) {
    ScanRequest base;
    base.settings.timeframeMinutes = 5;
    auto duringCandle = liveCycleRequest(base, kOpen + 60);
    check(duringCandle.has_value(), "live cycle during market hours", ok);
    if (duringCandle) {
        check(duringCandle->asOfUtc && *duringCandle->asOfUtc == kOpen + 60, "live cycle stamped with now", ok);
        check(duringCandle->settings.timeframeMinutes == 5, "live cycle keeps settings", ok);
    }
    check(!liveCycleRequest(base, kOpen - 60).has_value(), "no live cycle before the open", ok);
    check(!liveCycleRequest(base, 1710601200).has_value(), "no live cycle on Saturday", ok);

    // A first candle still forming is Incomplete, not classified.
    FakeBroker broker;
    broker.universe = {makeSnapshot("AAA", "NASDAQ")};
    broker.bars["AAA"] = {makeBar(kOpen, 10.00, 10.50, 9.90, 10.20, 600000)};
    Scanner scanner(broker);
    ScanRequest twoMinute;
    CycleReport report = scanner.runCycle(*liveCycleRequest(twoMinute, kOpen + 60));
    check(report.incomplete == 1 && report.results.empty(), "forming first candle skipped", ok);
}

void writeFile(const std::filesystem::path& path, const std::string& contents) {
    std::ofstream file(path);
    file << contents;
}

void testReplayBroker(bool& ok) {
    namespace fs = std::filesystem;
    fs::path dir = fs::temp_directory_path() / "fcs_replay_test";
    fs::remove_all(dir);
    fs::create_directories(dir / "bars");
    writeFile(dir / "universe.csv",
              "symbol,exchange,last,market_cap_b,volume,prev_close,bid,ask\n"
              "AAA,NASDAQ,10.40,5.0,1500000,9.90,10.39,10.41\n"
              "BBB,NYSE,20.00,,,,,\n"
              "ZZZ,ISLAND,15.00,2.0,900000,14.00,14.99,15.01\n");
    writeFile(dir / "bars" / "AAA.csv",
              "time,open,high,low,close,volume\n"
              "2024-03-13 09:30,9.50,9.60,9.40,9.55,10000\n"
              "2024-03-14 15:59,9.70,9.85,9.65,9.80,40000\n"
              "2024-03-15 09:29,9.90,10.00,9.85,9.95,5000\n"
              "2024-03-15 09:30,10.00,10.50,9.90,10.20,60000\n"
              "2024-03-15 09:31,10.20,10.60,10.10,10.30,50000\n"
              "1710509520,10.30,10.45,10.25,10.40,30000\n");
    writeFile(dir / "bars" / "BBB.csv",
              "time,open,high,low,close,volume\n"
              "2024-03-15 09:30,20.00,20.10,19.50,19.60,300000\n"
              "2024-03-15 09:31,19.60,19.70,19.40,19.50,200000\n");

    std::vector<UniverseRow> rows;
    check(readUniverseCsv((dir / "universe.csv").string(), rows) && rows.size() == 3, "universe rows", ok);
    if (rows.size() == 3) {
        check(!rows[1].snapshot.marketCapBillions && !rows[1].snapshot.previousClose, "empty cells stay unset", ok);
        check(rows[0].snapshot.previousClose && approxEqual(*rows[0].snapshot.previousClose, 9.90), "previous close read", ok);
    }

    AppConfig config;
    config.broker = "replay";
    config.universeFile = (dir / "universe.csv").string();
    config.barsDir = (dir / "bars").string();
    auto broker = createBrokerClient(config);
    check(broker != nullptr, "replay broker created", ok);
    if (!broker) {
        return;
    }
    check(!broker->isConnected(), "not connected before connect", ok);
    check(broker->connect(config.connection), "replay connects", ok);

    auto bars = broker->fetchBars(makeSnapshot("AAA", "NASDAQ"), 1, 2);
    check(bars.size() == 4, "two sessions of regular-hours bars", ok);
    check(!bars.empty() && bars.front().time == kPrevClose, "lookback drops older sessions", ok);

    Scanner scanner(*broker);
    ScanRequest request;
    request.session = SessionDate{2024, 3, 15};
    CycleReport report = scanner.runCycle(request);
    check(!report.failed, "replay cycle succeeds", ok);
    check(report.candidates == 3 && report.noData == 1 && report.noSignal == 1, "replay counts", ok);
    check(report.results.size() == 1, "replay match", ok);
    if (!report.results.empty()) {
        const ScanResult& r = report.results.front();
        check(r.symbol == "AAA" && r.firstCandleVolume == 110000, "replay first candle", ok);
        check(approxEqual(r.changePercent, (10.40 - 9.90) / 9.90 * 100.0), "snapshot previous close preferred", ok);
        check(approxEqual(r.bid, 10.39) && r.volume == 1500000, "replay quote", ok);
    }

    broker->disconnect();
    bool threw = false;
    try {
        broker->fetchUniverse(request.settings, 10);
    } catch (const BrokerError&) {
        threw = true;
    }
    check(threw, "disconnected replay broker raises BrokerError", ok);

    // Out-of-order bar file.
    writeFile(dir / "universe_unsorted.csv",
              "symbol,exchange,last,market_cap_b,volume,prev_close,bid,ask\n"
              "CCC,NASDAQ,10.40,5.0,1500000,9.90,10.39,10.41\n");
    writeFile(dir / "bars" / "CCC.csv",
              "time,open,high,low,close,volume\n"
              "2024-03-15 09:32,10.30,10.45,10.25,10.40,30000\n"
              "2024-03-15 09:30,10.00,10.50,9.90,10.20,60000\n"
              "2024-03-15 09:31,10.20,10.60,10.10,10.30,50000\n");
    AppConfig unsortedConfig = config;
    unsortedConfig.universeFile = (dir / "universe_unsorted.csv").string();
    auto unsorted = createBrokerClient(unsortedConfig);
    if (unsorted && unsorted->connect(unsortedConfig.connection)) {
        auto fileOrder = unsorted->fetchBars(makeSnapshot("CCC", "NASDAQ"), 1, 2);
        check(fileOrder.size() == 3 && fileOrder.front().time == kOpen + 120, "replay keeps file order", ok);
        Scanner unsortedScanner(*unsorted);
        CycleReport malformed = unsortedScanner.runCycle(request);
        check(malformed.malformed == 1 && malformed.results.empty(), "out-of-order bars are malformed", ok);
        unsorted->disconnect();
    } else {
        check(false, "replay broker for out-of-order bars", ok);
    }

    AppConfig unknown;
    unknown.broker = "carrier-pigeon";
    check(createBrokerClient(unknown) == nullptr, "unknown broker kind", ok);

    fs::remove_all(dir);
}

int main() {
    bool ok = true;
    testFullCycle(ok);
    testSignalSelection(ok);
    testIncomplete(ok);
    testLivePriceRecheck(ok);
    testCancellation(ok);
    testConnectivityFailure(ok);
    testHistory(ok);
    testLiveCycleRequest(ok);
    testReplayBroker(ok);
    if (ok) {
        std::cout << "All scanner tests passed." << std::endl;
    }
    return ok ? 0 : 1;
}
