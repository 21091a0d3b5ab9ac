#ifdef FCS_WITH_TWSAPI

#include <algorithm>
#include <cerrno>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include <twsapi/Contract.h>
#include <twsapi/Decimal.h>
#include <twsapi/DefaultEWrapper.h>
#include <twsapi/EClientSocket.h>
#include <twsapi/EReader.h>
#include <twsapi/EReaderOSSignal.h>
#include <twsapi/ScannerSubscription.h>

#include "config/Settings.hpp"
#include "scan/BrokerClient.hpp"
#include "util/Logging.hpp"
#include "util/MarketTime.hpp"
#include "util/Timer.hpp"

namespace fcs {

namespace {

constexpr int kSignalWaitMs = 200;

std::string barSizeSetting(int timeframeMinutes) {
    return timeframeMinutes == 1 ? "1 min" : std::to_string(timeframeMinutes) + " mins";
}

bool isConnectivityError(int code) { return code == 502 || code == 504 || code == 1100 || code == 1300; }

// Data farm status and delayed-data notices.
bool isInformational(int code) {
    return code == 2104 || code == 2106 || code == 2107 || code == 2108 || code == 2119 || code == 2158 || code == 10167;
}

Contract stockContract(const SymbolSnapshot& symbol) {
    Contract contract;
    contract.symbol = symbol.symbol;
    contract.secType = "STK";
    contract.exchange = "SMART";
    contract.currency = "USD";
    if (!symbol.primaryExchange.empty()) {
        contract.primaryExchange = symbol.primaryExchange;
    }
    return contract;
}

struct PendingRequest {
    bool done{false};
    std::string error;
    std::vector<Bar> bars;
    std::vector<SymbolSnapshot> snapshots;
    Quote quote;
};

}  // namespace

// All EWrapper callbacks run on the thread that calls waitFor(), never on
// the EReader thread, so the request map needs no locking.
class TwsClient : public BrokerClient, public DefaultEWrapper {
  public:
    explicit TwsClient(int requestTimeoutSeconds)
        : timeoutMs_(requestTimeoutSeconds * 1000.0), signal_(kSignalWaitMs), client_(this, &signal_) {}

    ~TwsClient() override { disconnect(); }

    bool connect(const ConnectionConfig& config) override {
        disconnect();
        lostConnection_.clear();
        nextOrderId_ = -1;
        if (!client_.eConnect(config.host.c_str(), config.port, config.clientId)) {
            logError("Failed to connect to TWS at " + config.host + ":" + std::to_string(config.port));
            return false;
        }
        reader_ = std::make_unique<EReader>(&client_, &signal_);
        reader_->start();
        Timer timer;
        while (nextOrderId_ < 0 && client_.isConnected() && !timer.expired(timeoutMs_)) {
            pump();
        }
        if (nextOrderId_ < 0) {
            logError("TWS did not acknowledge the connection" + (lostConnection_.empty() ? std::string() : ": " + lostConnection_));
            disconnect();
            return false;
        }
        logInfo("Connected to TWS at " + config.host + ":" + std::to_string(config.port) + " as client " +
                std::to_string(config.clientId));
        return true;
    }

    void disconnect() override {
        if (client_.isConnected()) {
            client_.eDisconnect();
            logInfo("Disconnected from TWS");
        }
        reader_.reset();
        pending_.clear();
    }

    bool isConnected() const override { return client_.isConnected(); }

    std::vector<SymbolSnapshot> fetchUniverse(const ScannerSettings& settings, int maxRows) override {
        ScannerSubscription subscription;
        subscription.instrument = "STK";
        subscription.locationCode = scannerLocationCode(settings.exchange);
        subscription.scanCode = "MOST_ACTIVE";
        subscription.numberOfRows = std::min(maxRows, kMaxScannerRows);
        subscription.abovePrice = settings.minPrice;
        subscription.belowPrice = settings.maxPrice;
        subscription.marketCapAbove = settings.minMarketCap * 1e9;
        subscription.marketCapBelow = settings.maxMarketCap * 1e9;
        subscription.aboveVolume = static_cast<int>(std::min<std::int64_t>(settings.minVolume, INT32_MAX));

        int id = beginRequest();
        client_.reqScannerSubscription(id, subscription, TagValueListSPtr(), TagValueListSPtr());
        bool finished = waitFor(id);
        client_.cancelScannerSubscription(id);
        PendingRequest request = takeRequest(id);
        if (!finished) {
            throw BrokerError("Scanner request timed out");
        }
        if (!request.error.empty()) {
            throw BrokerError("Scanner request failed: " + request.error);
        }
        return request.snapshots;
    }

    std::vector<Bar> fetchBars(const SymbolSnapshot& symbol, int timeframeMinutes, int lookbackDays) override {
        int id = beginRequest();
        client_.reqHistoricalData(id, stockContract(symbol), "", std::to_string(lookbackDays) + " D", barSizeSetting(timeframeMinutes),
                                  "TRADES", 1, 2, false, TagValueListSPtr());
        bool finished = waitFor(id);
        PendingRequest request = takeRequest(id);
        if (!finished) {
            client_.cancelHistoricalData(id);
            logWarn("Historical data request timed out for " + symbol.symbol);
            return {};
        }
        if (!request.error.empty()) {
            logDebug("No historical data for " + symbol.symbol + ": " + request.error);
            return {};
        }
        return request.bars;
    }

    std::optional<Quote> fetchQuote(const SymbolSnapshot& symbol) override {
        int id = beginRequest();
        client_.reqMktData(id, stockContract(symbol), "", true, false, TagValueListSPtr());
        bool finished = waitFor(id);
        PendingRequest request = takeRequest(id);
        if (!finished) {
            client_.cancelMktData(id);
            logWarn("Quote request timed out for " + symbol.symbol);
            return std::nullopt;
        }
        if (!request.error.empty()) {
            return std::nullopt;
        }
        return request.quote;
    }

    // EWrapper

    void nextValidId(OrderId orderId) override { nextOrderId_ = orderId; }

    void connectionClosed() override {
        if (lostConnection_.empty()) {
            lostConnection_ = "Connection closed by TWS";
        }
    }

    void error(int id, int errorCode, const std::string& errorString, const std::string&) override {
        if (isInformational(errorCode)) {
            logDebug("TWS " + std::to_string(errorCode) + ": " + errorString);
            return;
        }
        if (isConnectivityError(errorCode)) {
            lostConnection_ = "TWS error " + std::to_string(errorCode) + ": " + errorString;
            logError(lostConnection_);
            return;
        }
        auto it = pending_.find(id);
        if (it != pending_.end()) {
            it->second.error = std::to_string(errorCode) + " " + errorString;
            it->second.done = true;
            return;
        }
        logWarn("TWS error " + std::to_string(errorCode) + " (id " + std::to_string(id) + "): " + errorString);
    }

    void scannerData(int reqId, int, const ContractDetails& details, const std::string&, const std::string&, const std::string&,
                     const std::string&) override {
        auto it = pending_.find(reqId);
        if (it == pending_.end()) {
            return;
        }
        SymbolSnapshot snapshot;
        snapshot.symbol = details.contract.symbol;
        snapshot.primaryExchange = details.contract.primaryExchange;
        it->second.snapshots.push_back(snapshot);
    }

    void scannerDataEnd(int reqId) override { markDone(reqId); }

    void historicalData(TickerId reqId, const ::Bar& bar) override {
        auto it = pending_.find(static_cast<int>(reqId));
        if (it == pending_.end()) {
            return;
        }
        auto time = parseEasternTimestamp(bar.time);
        if (!time) {
            logWarn("Unparseable bar time from TWS: " + bar.time);
            return;
        }
        Bar out;
        out.time = *time;
        out.open = bar.open;
        out.high = bar.high;
        out.low = bar.low;
        out.close = bar.close;
        out.volume = static_cast<std::int64_t>(DecimalFunctions::decimalToDouble(bar.volume));
        it->second.bars.push_back(out);
    }

    void historicalDataEnd(int reqId, const std::string&, const std::string&) override { markDone(reqId); }

    void tickPrice(TickerId tickerId, TickType field, double price, const TickAttrib&) override {
        auto it = pending_.find(static_cast<int>(tickerId));
        if (it == pending_.end() || price <= 0.0) {
            return;
        }
        switch (field) {
            case BID:
            case DELAYED_BID:
                it->second.quote.bid = price;
                break;
            case ASK:
            case DELAYED_ASK:
                it->second.quote.ask = price;
                break;
            case LAST:
            case DELAYED_LAST:
                it->second.quote.last = price;
                break;
            default:
                break;
        }
    }

    void tickSize(TickerId tickerId, TickType field, Decimal size) override {
        auto it = pending_.find(static_cast<int>(tickerId));
        if (it == pending_.end()) {
            return;
        }
        if (field == VOLUME || field == DELAYED_VOLUME) {
            it->second.quote.volume = static_cast<std::int64_t>(DecimalFunctions::decimalToDouble(size));
        }
    }

    void tickSnapshotEnd(int reqId) override { markDone(reqId); }

  private:
    double timeoutMs_;
    EReaderOSSignal signal_;
    EClientSocket client_;
    std::unique_ptr<EReader> reader_;
    std::map<int, PendingRequest> pending_;
    OrderId nextOrderId_{-1};
    int nextRequestId_{1000};
    std::string lostConnection_;

    int beginRequest() {
        if (!client_.isConnected()) {
            throw BrokerError("Not connected to TWS");
        }
        int id = nextRequestId_++;
        pending_[id] = PendingRequest{};
        return id;
    }

    PendingRequest takeRequest(int id) {
        PendingRequest request = std::move(pending_[id]);
        pending_.erase(id);
        return request;
    }

    void markDone(int reqId) {
        auto it = pending_.find(reqId);
        if (it != pending_.end()) {
            it->second.done = true;
        }
    }

    void pump() {
        signal_.waitForSignal();
        errno = 0;
        if (reader_) {
            reader_->processMsgs();
        }
    }

    // False on timeout. Throws BrokerError once the connection is gone.
    bool waitFor(int id) {
        Timer timer;
        while (!pending_[id].done) {
            if (!lostConnection_.empty() || !client_.isConnected()) {
                std::string message = lostConnection_.empty() ? "Lost connection to TWS" : lostConnection_;
                pending_.erase(id);
                throw BrokerError(message);
            }
            if (timer.expired(timeoutMs_)) {
                return false;
            }
            pump();
        }
        return true;
    }
};

std::unique_ptr<BrokerClient> createTwsClient(int requestTimeoutSeconds) {
    return std::make_unique<TwsClient>(requestTimeoutSeconds);
}

}  // namespace fcs

#endif  // FCS_WITH_TWSAPI
