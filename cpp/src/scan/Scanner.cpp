#include "scan/Scanner.hpp"

#include <exception>
#include <numeric>
#include <sstream>
#include <utility>

#include "candle/FirstCandle.hpp"
#include "candle/HeikinAshi.hpp"
#include "scan/Filter.hpp"
#include "util/Logging.hpp"
#include "util/Timer.hpp"

namespace fcs {

namespace {

std::int64_t totalVolume(const std::vector<Bar>& bars) {
    return std::accumulate(bars.begin(), bars.end(), std::int64_t{0}, [](std::int64_t sum, const Bar& bar) { return sum + bar.volume; });
}

}  // namespace

std::string CycleReport::summary() const {
    std::ostringstream oss;
    oss << results.size() << " matches of " << candidates << " candidates"
        << " (ineligible " << ineligible << ", no data " << noData << ", malformed " << malformed << ", no session bar " << noSessionBar
        << ", incomplete " << incomplete << ", below volume " << belowVolume << ", no signal " << noSignal << ", errors " << errors << ")";
    if (cancelled) {
        oss << " [cancelled]";
    }
    if (failed) {
        oss << " [failed: " << failure << "]";
    }
    return oss.str();
}

Scanner::Scanner(BrokerClient& broker) : broker_(broker) {}

CycleReport Scanner::runCycle(const ScanRequest& request, const std::atomic<bool>* cancel) {
    Timer timer;
    CycleReport report;
    report.startedUtc = request.asOfUtc ? *request.asOfUtc : nowUtc();
    report.parametersUsed = describeParameters(request.settings);

    auto finish = [&]() {
        report.elapsedMs = timer.elapsedMilliseconds();
        if (report.failed) {
            logError("Scan failed: " + report.failure);
        } else if (report.cancelled) {
            logInfo("Scan cancelled. Kept " + std::to_string(report.results.size()) + " results.");
        } else {
            logInfo("Scan complete. Found " + std::to_string(report.results.size()) + " stocks meeting criteria.");
        }
        logDebug(report.summary());
        return report;
    };

    auto problems = validateSettings(request.settings);
    if (!problems.empty()) {
        report.failed = true;
        report.failure = problems.front();
        return finish();
    }
    if (!broker_.isConnected()) {
        report.failed = true;
        report.failure = "Not connected to broker";
        return finish();
    }

    logInfo("Starting scan with " + report.parametersUsed);
    std::vector<SymbolSnapshot> universe;
    try {
        universe = broker_.fetchUniverse(request.settings, request.maxRows);
    } catch (const BrokerError& ex) {
        report.failed = true;
        report.failure = ex.what();
        return finish();
    }
    if (static_cast<int>(universe.size()) > request.maxRows) {
        universe.resize(static_cast<std::size_t>(request.maxRows));
    }
    logInfo("Scanner returned " + std::to_string(universe.size()) + " symbols");

    for (const auto& snapshot : universe) {
        if (cancel && cancel->load()) {
            report.cancelled = true;
            break;
        }
        ++report.candidates;
        if (!isEligible(request.settings, snapshot)) {
            ++report.ineligible;
            logDebug("Skipping " + snapshot.symbol + ": outside filter range");
            continue;
        }
        try {
            auto result = scanSymbol(request, snapshot, report.startedUtc, report);
            if (result) {
                logInfo("Found signal: " + result->symbol + " - HA:" + std::to_string(result->haBullish ? 1 : 0) +
                        " Normal:" + std::to_string(result->normalBullish ? 1 : 0));
                report.results.push_back(std::move(*result));
            }
        } catch (const BrokerError& ex) {
            report.failed = true;
            report.failure = ex.what();
            break;
        } catch (const std::exception& ex) {
            ++report.errors;
            logWarn("Error processing " + snapshot.symbol + ": " + ex.what());
        }
    }
    return finish();
}

std::optional<ScanResult> Scanner::scanSymbol(const ScanRequest& request, const SymbolSnapshot& snapshot, std::int64_t scanTime,
                                              CycleReport& report) {
    const ScannerSettings& settings = request.settings;
    logDebug("Scanning " + snapshot.symbol);
    std::vector<Bar> bars = broker_.fetchBars(snapshot, settings.timeframeMinutes, request.lookbackDays);

    std::optional<SessionDate> session = request.session;
    if (!session && request.asOfUtc) {
        session = toEasternTime(*request.asOfUtc).date;
    }
    FirstCandle first = selectFirstCandle(bars, settings.timeframeMinutes, session, request.asOfUtc);
    switch (first.status) {
        case CandleStatus::Ok:
            break;
        case CandleStatus::NoData:
            ++report.noData;
            logDebug("No data for " + snapshot.symbol);
            return std::nullopt;
        case CandleStatus::Malformed:
            ++report.malformed;
            logWarn("Malformed bars for " + snapshot.symbol + ": " + first.reason);
            return std::nullopt;
        case CandleStatus::NoSessionBar:
            ++report.noSessionBar;
            logDebug("No first candle for " + snapshot.symbol + " on " + toString(first.session));
            return std::nullopt;
        case CandleStatus::Incomplete:
            ++report.incomplete;
            logDebug("First candle still forming for " + snapshot.symbol);
            return std::nullopt;
    }

    if (!passesVolumeThreshold(first.bar, settings.minVolume)) {
        ++report.belowVolume;
        logDebug(snapshot.symbol + " first candle volume " + std::to_string(first.bar.volume) + " below threshold");
        return std::nullopt;
    }
    CandleSignals signals = classifyFirstCandle(first.bar);
    if (!matchesSignalSelection(settings, signals)) {
        ++report.noSignal;
        return std::nullopt;
    }

    std::vector<Bar> today = sessionBars(bars, first.session);
    Quote quote;
    if (auto live = broker_.fetchQuote(snapshot)) {
        quote = *live;
    }
    if (quote.last <= 0.0) {
        quote.last = snapshot.lastPrice ? *snapshot.lastPrice : today.back().close;
    }
    if (!priceInRange(settings, quote.last)) {
        ++report.ineligible;
        logDebug(snapshot.symbol + " last price moved outside the filter range");
        return std::nullopt;
    }
    if (quote.volume <= 0) {
        quote.volume = snapshot.volume ? *snapshot.volume : totalVolume(today);
    }

    std::optional<double> previousClose = snapshot.previousClose;
    if (!previousClose) {
        previousClose = lastCloseBefore(bars, first.session);
    }

    ScanResult result;
    result.symbol = snapshot.symbol;
    result.lastPrice = quote.last;
    result.changePercent = (previousClose && *previousClose > 0.0) ? (quote.last - *previousClose) / *previousClose * 100.0 : 0.0;
    result.bid = quote.bid;
    result.ask = quote.ask;
    result.marketCapBillions = snapshot.marketCapBillions ? *snapshot.marketCapBillions : 0.0;
    result.volume = quote.volume;
    result.haBullish = signals.haBullish;
    result.normalBullish = signals.normalBullish;
    result.firstCandleVolume = first.bar.volume;
    result.scanTime = scanTime;
    result.parametersUsed = report.parametersUsed;
    result.firstBar = first.bar;
    result.firstHa = signals.ha;
    result.sessionBars = std::move(today);
    return result;
}

std::optional<ScanRequest> liveCycleRequest(const ScanRequest& base, std::int64_t nowUtc) {
    if (!isMarketOpen(nowUtc)) {
        return std::nullopt;
    }
    ScanRequest request = base;
    request.asOfUtc = nowUtc;
    return request;
}

ScanHistory::ScanHistory(std::size_t limit) : limit_(limit) {}

void ScanHistory::add(CycleReport report) {
    if (limit_ == 0) {
        return;
    }
    entries_.push_front(std::move(report));
    while (entries_.size() > limit_) {
        entries_.pop_back();
    }
}

void ScanHistory::clear() { entries_.clear(); }

void ScanHistory::setLimit(std::size_t limit) {
    limit_ = limit;
    while (entries_.size() > limit_) {
        entries_.pop_back();
    }
}

}  // namespace fcs
