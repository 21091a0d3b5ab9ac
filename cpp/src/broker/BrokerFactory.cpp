#include <algorithm>
#include <cctype>
#include <memory>
#include <string>

#include "scan/BrokerClient.hpp"
#include "util/Logging.hpp"

namespace fcs {

namespace {

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

class UnavailableBrokerClient : public BrokerClient {
  public:
    explicit UnavailableBrokerClient(std::string message) : message_(std::move(message)) {}

    bool connect(const ConnectionConfig& config) override {
        logError(message_ + ": " + config.host + ":" + std::to_string(config.port));
        return false;
    }

    void disconnect() override {}

    bool isConnected() const override { return false; }

    std::vector<SymbolSnapshot> fetchUniverse(const ScannerSettings&, int) override { throw BrokerError(message_); }

    std::vector<Bar> fetchBars(const SymbolSnapshot&, int, int) override { throw BrokerError(message_); }

    std::optional<Quote> fetchQuote(const SymbolSnapshot&) override { throw BrokerError(message_); }

  private:
    std::string message_;
};

}  // namespace

std::unique_ptr<BrokerClient> createTwsClient(int requestTimeoutSeconds);
std::unique_ptr<BrokerClient> createReplayClient(const std::string& universeFile, const std::string& barsDir);

std::unique_ptr<BrokerClient> createBrokerClient(const AppConfig& config) {
    std::string kind = toLower(config.broker);
    if (kind == "tws") {
#ifdef FCS_WITH_TWSAPI
        return createTwsClient(config.connection.requestTimeoutSeconds);
#else
        return std::make_unique<UnavailableBrokerClient>("TWS API support disabled at build time");
#endif
    }
    if (kind == "replay") {
        return createReplayClient(config.universeFile, config.barsDir);
    }
    logError("Unsupported broker: " + config.broker);
    return nullptr;
}

}  // namespace fcs
