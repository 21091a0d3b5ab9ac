#include <fstream>
#include <iterator>
#include <map>
#include <memory>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

#include "io/BarCsv.hpp"
#include "scan/BrokerClient.hpp"
#include "util/Logging.hpp"
#include "util/MarketTime.hpp"

namespace fcs {

namespace {

std::int64_t dayNumber(const SessionDate& date) { return daysFromCivil(date.year, date.month, date.day); }

}  // namespace

// Serves a universe CSV and per-symbol bar files as if they came from a broker.
class ReplayClient : public BrokerClient {
  public:
    ReplayClient(std::string universeFile, std::string barsDir)
        : universeFile_(std::move(universeFile)), barsDir_(std::move(barsDir)) {}

    bool connect(const ConnectionConfig&) override {
        if (universeFile_.empty()) {
            logError("Replay broker needs a universe file");
            return false;
        }
        std::vector<UniverseRow> rows;
        if (!readUniverseCsv(universeFile_, rows)) {
            return false;
        }
        rows_ = std::move(rows);
        quotes_.clear();
        for (const auto& row : rows_) {
            quotes_[row.snapshot.symbol] = row.quote;
        }
        connected_ = true;
        logInfo("Replay broker loaded " + std::to_string(rows_.size()) + " symbols from " + universeFile_);
        return true;
    }

    void disconnect() override { connected_ = false; }

    bool isConnected() const override { return connected_; }

    std::vector<SymbolSnapshot> fetchUniverse(const ScannerSettings&, int maxRows) override {
        requireConnection();
        std::vector<SymbolSnapshot> out;
        for (const auto& row : rows_) {
            if (static_cast<int>(out.size()) >= maxRows) {
                break;
            }
            out.push_back(row.snapshot);
        }
        return out;
    }

    std::vector<Bar> fetchBars(const SymbolSnapshot& symbol, int, int lookbackDays) override {
        requireConnection();
        std::string path = barsDir_.empty() ? symbol.symbol + ".csv" : barsDir_ + "/" + symbol.symbol + ".csv";
        std::ifstream file(path);
        if (!file) {
            logWarn("No bar file for " + symbol.symbol + ": " + path);
            return {};
        }
        std::vector<Bar> bars;
        if (!readBarsCsv(file, bars, path)) {
            throw std::runtime_error("Failed to read bars for " + symbol.symbol);
        }
        // File order is kept so out-of-order files are reported as Malformed.
        // Regular hours of the last `lookbackDays` sessions present in the file.
        std::set<std::int64_t> days;
        std::vector<Bar> regular;
        for (const auto& bar : bars) {
            SessionDate date = toEasternTime(bar.time).date;
            if (bar.time >= sessionOpenUtc(date) && bar.time < sessionCloseUtc(date)) {
                regular.push_back(bar);
                days.insert(dayNumber(date));
            }
        }
        if (static_cast<int>(days.size()) <= lookbackDays) {
            return regular;
        }
        std::int64_t firstDay = *std::next(days.end(), -lookbackDays);
        std::vector<Bar> out;
        for (const auto& bar : regular) {
            if (dayNumber(toEasternTime(bar.time).date) >= firstDay) {
                out.push_back(bar);
            }
        }
        return out;
    }

    std::optional<Quote> fetchQuote(const SymbolSnapshot& symbol) override {
        requireConnection();
        auto it = quotes_.find(symbol.symbol);
        if (it == quotes_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

  private:
    std::string universeFile_;
    std::string barsDir_;
    std::vector<UniverseRow> rows_;
    std::map<std::string, Quote> quotes_;
    bool connected_{false};

    void requireConnection() const {
        if (!connected_) {
            throw BrokerError("Replay broker not connected");
        }
    }
};

std::unique_ptr<BrokerClient> createReplayClient(const std::string& universeFile, const std::string& barsDir) {
    return std::make_unique<ReplayClient>(universeFile, barsDir);
}

}  // namespace fcs
