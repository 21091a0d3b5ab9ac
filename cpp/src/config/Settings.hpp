#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "model/Types.hpp"

namespace fcs {

constexpr int kDefaultScanIntervalSeconds = 30;
constexpr int kMaxScannerRows = 50;

// Filter configuration for one scan cycle.
struct ScannerSettings {
    Exchange exchange{Exchange::Both};
    int timeframeMinutes{2};
    double minPrice{0.0};
    double maxPrice{100.0};
    double minMarketCap{0.0};  // billions
    double maxMarketCap{100.0};  // billions
    std::int64_t minVolume{100000};
    bool detectHeikinAshi{true};
    bool detectNormal{true};
};

struct ConnectionConfig {
    std::string host{"127.0.0.1"};
    int port{7497};
    int clientId{1};
    int requestTimeoutSeconds{15};
};

struct AppConfig {
    std::string broker{"tws"};
    ConnectionConfig connection;
    ScannerSettings scanner;
    int scanIntervalSeconds{kDefaultScanIntervalSeconds};
    int maxRows{kMaxScannerRows};
    int historyLimit{20};
    std::string universeFile;
    std::string barsDir;
    std::string settingsFile{"scanner_settings.json"};
    std::string logLevel{"info"};
    std::string logFile{"scanner.log"};
};

const std::vector<int>& availableTimeframes();

std::string exchangeToString(Exchange exchange);
Exchange parseExchange(const std::string& token);
// TWS scanner location code for the exchange selection.
std::string scannerLocationCode(Exchange exchange);

// Empty when the settings are usable.
std::vector<std::string> validateSettings(const ScannerSettings& settings);

// "TF:2m | Vol:100000 | Price:$0-$100"
std::string describeParameters(const ScannerSettings& settings);

}  // namespace fcs
