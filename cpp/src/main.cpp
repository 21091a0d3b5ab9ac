#include <algorithm>
#include <chrono>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>

#include "config/Parser.hpp"
#include "io/BarCsv.hpp"
#include "scan/BrokerClient.hpp"
#include "scan/Scanner.hpp"
#include "util/Format.hpp"
#include "util/Logging.hpp"
#include "util/MarketTime.hpp"

namespace fcs {

struct CLIOptions {
    std::string config;
    std::string broker;
    std::string universe;
    std::string barsDir;
    std::string date;
    std::string asOf;
    std::string outCsv;
    std::string outJson;
    int cycles{1};
};

void printUsage() {
    std::cout << "Usage: fcs_scan [options]\n"
              << "Options:\n"
              << "  --conf FILE        Scanner configuration (KEY value lines)\n"
              << "  --broker KIND      tws | replay (overrides BROKER)\n"
              << "  --universe FILE    Replay universe CSV\n"
              << "  --bars DIR         Replay bar directory (<SYMBOL>.csv)\n"
              << "  --date YYYY-MM-DD  Session to evaluate (default: latest)\n"
              << "  --as-of TIME       Evaluate as of \"YYYY-MM-DD HH:MM\" Eastern\n"
              << "  --cycles N         Number of scan cycles (default 1)\n"
              << "  --out FILE         CSV output file\n"
              << "  --json FILE        JSON lines output file\n"
              << std::endl;
}

std::optional<std::string> requireValue(int argc, char** argv, int& index) {
    if (index + 1 >= argc) {
        return std::nullopt;
    }
    ++index;
    return std::string(argv[index]);
}

bool parseCLI(int argc, char** argv, CLIOptions& options) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--conf") {
            auto value = requireValue(argc, argv, i);
            if (!value) return false;
            options.config = *value;
        } else if (arg == "--broker") {
            auto value = requireValue(argc, argv, i);
            if (!value) return false;
            options.broker = *value;
        } else if (arg == "--universe") {
            auto value = requireValue(argc, argv, i);
            if (!value) return false;
            options.universe = *value;
        } else if (arg == "--bars") {
            auto value = requireValue(argc, argv, i);
            if (!value) return false;
            options.barsDir = *value;
        } else if (arg == "--date") {
            auto value = requireValue(argc, argv, i);
            if (!value) return false;
            options.date = *value;
        } else if (arg == "--as-of") {
            auto value = requireValue(argc, argv, i);
            if (!value) return false;
            options.asOf = *value;
        } else if (arg == "--cycles") {
            auto value = requireValue(argc, argv, i);
            if (!value) return false;
            options.cycles = std::max(1, std::stoi(*value));
        } else if (arg == "--out") {
            auto value = requireValue(argc, argv, i);
            if (!value) return false;
            options.outCsv = *value;
        } else if (arg == "--json") {
            auto value = requireValue(argc, argv, i);
            if (!value) return false;
            options.outJson = *value;
        } else if (arg == "--help" || arg == "-h") {
            printUsage();
            return false;
        } else {
            std::cerr << "Unknown option: " << arg << std::endl;
            printUsage();
            return false;
        }
    }
    return true;
}

void printResults(std::ostream& os, const CycleReport& report) {
    os << std::left << std::setw(8) << "Ticker" << std::setw(10) << "Last" << std::setw(10) << "Change" << std::setw(10) << "Bid"
       << std::setw(10) << "Ask" << std::setw(12) << "Mkt Cap" << std::setw(10) << "Volume" << std::setw(12) << "1st Vol"
       << std::setw(6) << "HA" << std::setw(8) << "Normal" << "Scan Time" << '\n';
    for (const auto& r : report.results) {
        os << std::setw(8) << r.symbol << std::setw(10) << formatPrice(r.lastPrice) << std::setw(10) << formatPercent(r.changePercent)
           << std::setw(10) << formatPrice(r.bid) << std::setw(10) << formatPrice(r.ask) << std::setw(12)
           << formatMarketCap(r.marketCapBillions) << std::setw(10) << formatVolume(r.volume) << std::setw(12)
           << formatVolume(r.firstCandleVolume) << std::setw(6) << (r.haBullish ? "Yes" : "No") << std::setw(8)
           << (r.normalBullish ? "Yes" : "No") << formatEasternTime(r.scanTime) << '\n';
    }
    os << report.summary() << std::endl;
}

}  // namespace fcs

int main(int argc, char** argv) {
    using namespace fcs;
    CLIOptions options;
    if (!parseCLI(argc, argv, options)) {
        return 1;
    }
    try {
        AppConfig config = options.config.empty() ? AppConfig{} : parseConfigFile(options.config);
        if (!options.broker.empty()) config.broker = parseBroker(options.broker);
        if (!options.universe.empty()) config.universeFile = options.universe;
        if (!options.barsDir.empty()) config.barsDir = options.barsDir;

        Logger::instance().setLevel(parseLogLevel(config.logLevel));
        if (!Logger::instance().setLogFile(config.logFile)) {
            std::cerr << "Failed to open log file: " << config.logFile << std::endl;
        }

        ScanRequest request;
        request.settings = config.scanner;
        request.maxRows = config.maxRows;
        if (!options.date.empty()) {
            request.session = parseSessionDate(options.date);
            if (!request.session) {
                std::cerr << "Invalid --date: " << options.date << std::endl;
                return 1;
            }
        }
        if (!options.asOf.empty()) {
            request.asOfUtc = parseEasternTimestamp(options.asOf);
            if (!request.asOfUtc) {
                std::cerr << "Invalid --as-of: " << options.asOf << std::endl;
                return 1;
            }
        }

        auto broker = createBrokerClient(config);
        if (!broker) {
            std::cerr << "Unsupported broker: " << config.broker << std::endl;
            return 1;
        }
        if (!broker->connect(config.connection)) {
            std::cerr << "Failed to connect to broker '" << config.broker << "'" << std::endl;
            return 1;
        }

        std::ofstream csvFile;
        if (!options.outCsv.empty()) {
            csvFile.open(options.outCsv);
            if (!csvFile) {
                std::cerr << "Failed to open CSV output: " << options.outCsv << std::endl;
                return 1;
            }
            writeResultsCsvHeader(csvFile);
        }
        std::ofstream jsonFile;
        if (!options.outJson.empty()) {
            jsonFile.open(options.outJson);
            if (!jsonFile) {
                std::cerr << "Failed to open JSON output: " << options.outJson << std::endl;
                return 1;
            }
        }

        // A live broker without --as-of scans as of the wall clock, during market hours only.
        bool liveClock = config.broker != "replay" && !request.asOfUtc;
        Scanner scanner(*broker);
        bool failed = false;
        for (int cycle = 0; cycle < options.cycles; ++cycle) {
            if (cycle > 0 && config.broker != "replay") {
                std::this_thread::sleep_for(std::chrono::seconds(config.scanIntervalSeconds));
            }
            ScanRequest cycleRequest = request;
            if (liveClock) {
                auto live = liveCycleRequest(request, nowUtc());
                if (!live) {
                    logInfo("Market is closed. Skipping scan cycle.");
                    continue;
                }
                cycleRequest = *live;
            }
            CycleReport report = scanner.runCycle(cycleRequest);
            printResults(std::cout, report);
            for (const auto& result : report.results) {
                if (csvFile.is_open()) {
                    writeResultCsvRow(csvFile, result);
                }
                if (jsonFile.is_open()) {
                    writeResultJsonRow(jsonFile, result);
                }
            }
            if (report.failed) {
                failed = true;
                break;
            }
        }
        broker->disconnect();
        if (failed) {
            return 1;
        }
    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << std::endl;
        return 1;
    }
    return 0;
}
