#pragma once

#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "config/Settings.hpp"
#include "model/Types.hpp"

namespace fcs {

// Connectivity failure; fails the whole scan cycle.
class BrokerError : public std::runtime_error {
  public:
    explicit BrokerError(const std::string& message) : std::runtime_error(message) {}
};

class BrokerClient {
  public:
    virtual ~BrokerClient() = default;

    virtual bool connect(const ConnectionConfig& config) = 0;
    virtual void disconnect() = 0;
    virtual bool isConnected() const = 0;

    virtual std::vector<SymbolSnapshot> fetchUniverse(const ScannerSettings& settings, int maxRows) = 0;
    // Regular-hours bars of the last `lookbackDays` sessions, ascending in time.
    virtual std::vector<Bar> fetchBars(const SymbolSnapshot& symbol, int timeframeMinutes, int lookbackDays) = 0;
    virtual std::optional<Quote> fetchQuote(const SymbolSnapshot& symbol) = 0;
};

// "tws" or "replay"; nullptr for an unknown kind.
std::unique_ptr<BrokerClient> createBrokerClient(const AppConfig& config);

}  // namespace fcs
