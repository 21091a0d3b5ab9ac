#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <optional>
#include <string>
#include <vector>

#include "config/Settings.hpp"
#include "model/Types.hpp"
#include "scan/BrokerClient.hpp"
#include "util/MarketTime.hpp"

namespace fcs {

constexpr int kBarLookbackDays = 2;

// Everything one cycle needs; nothing is read from process-wide state.
struct ScanRequest {
    ScannerSettings settings;
    int maxRows{kMaxScannerRows};
    // "Now" for the cycle. Unset means the wall clock and no Incomplete check.
    std::optional<std::int64_t> asOfUtc;
    // Defaults to the Eastern date of asOfUtc, or of each symbol's last bar.
    std::optional<SessionDate> session;
    int lookbackDays{kBarLookbackDays};
};

// Request for a live cycle at `nowUtc`, stamped as of that instant.
// Empty while the regular session is closed.
std::optional<ScanRequest> liveCycleRequest(const ScanRequest& base, std::int64_t nowUtc);

struct CycleReport {
    std::vector<ScanResult> results;
    int candidates{0};
    int ineligible{0};
    int noData{0};
    int malformed{0};
    int noSessionBar{0};
    int incomplete{0};
    int belowVolume{0};
    int noSignal{0};
    int errors{0};
    bool cancelled{false};
    bool failed{false};
    std::string failure;
    std::int64_t startedUtc{0};
    double elapsedMs{0.0};
    std::string parametersUsed;

    std::string summary() const;
};

class Scanner {
  public:
    explicit Scanner(BrokerClient& broker);

    // Sequential over the universe. `cancel` is polled between symbols;
    // results gathered before a cancel or a connectivity failure are kept.
    CycleReport runCycle(const ScanRequest& request, const std::atomic<bool>* cancel = nullptr);

  private:
    BrokerClient& broker_;

    std::optional<ScanResult> scanSymbol(const ScanRequest& request, const SymbolSnapshot& snapshot, std::int64_t scanTime,
                                         CycleReport& report);
};

// Most recent completed cycles, newest first.
class ScanHistory {
  public:
    explicit ScanHistory(std::size_t limit = 20);

    void add(CycleReport report);
    void clear();
    void setLimit(std::size_t limit);

    std::size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }
    std::size_t limit() const { return limit_; }
    const CycleReport& at(std::size_t index) const { return entries_.at(index); }
    const CycleReport* latest() const { return entries_.empty() ? nullptr : &entries_.front(); }

  private:
    std::size_t limit_;
    std::deque<CycleReport> entries_;
};

}  // namespace fcs
