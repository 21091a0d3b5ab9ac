#include "config/Parser.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <vector>

#include "util/Logging.hpp"

namespace fcs {

namespace {

std::string trim(const std::string& input) {
    auto begin = input.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return "";
    }
    auto end = input.find_last_not_of(" \t\r\n");
    return input.substr(begin, end - begin + 1);
}

std::vector<std::string> splitWhitespace(const std::string& input) {
    std::istringstream iss(input);
    std::vector<std::string> tokens;
    std::string token;
    while (iss >> token) {
        tokens.push_back(token);
    }
    return tokens;
}

std::vector<std::string> split(const std::string& input, char delim) {
    std::vector<std::string> result;
    std::string token;
    std::istringstream iss(input);
    while (std::getline(iss, token, delim)) {
        token = trim(token);
        if (!token.empty()) {
            result.push_back(token);
        }
    }
    return result;
}

std::string toUpper(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return value;
}

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

const std::string& requireToken(const std::vector<std::string>& tokens, std::size_t index, const std::string& key) {
    if (index >= tokens.size()) {
        throw std::runtime_error("Missing value for " + key);
    }
    return tokens[index];
}

int toInt(const std::string& token, const std::string& key) {
    try {
        std::size_t used = 0;
        int value = std::stoi(token, &used);
        if (used != token.size()) {
            throw std::invalid_argument(token);
        }
        return value;
    } catch (const std::logic_error&) {
        throw std::runtime_error("Invalid integer for " + key + ": " + token);
    }
}

long long toLong(const std::string& token, const std::string& key) {
    try {
        std::size_t used = 0;
        long long value = std::stoll(token, &used);
        if (used != token.size()) {
            throw std::invalid_argument(token);
        }
        return value;
    } catch (const std::logic_error&) {
        throw std::runtime_error("Invalid integer for " + key + ": " + token);
    }
}

double toDouble(const std::string& token, const std::string& key) {
    try {
        std::size_t used = 0;
        double value = std::stod(token, &used);
        if (used != token.size()) {
            throw std::invalid_argument(token);
        }
        return value;
    } catch (const std::logic_error&) {
        throw std::runtime_error("Invalid number for " + key + ": " + token);
    }
}

void parseDetect(const std::string& value, ScannerSettings& settings) {
    settings.detectHeikinAshi = false;
    settings.detectNormal = false;
    for (const auto& part : split(value, ',')) {
        std::string upper = toUpper(part);
        if (upper == "HA" || upper == "HEIKIN_ASHI") {
            settings.detectHeikinAshi = true;
        } else if (upper == "NORMAL") {
            settings.detectNormal = true;
        } else if (upper != "NONE") {
            throw std::runtime_error("Unsupported DETECT entry: " + part);
        }
    }
}

}  // namespace

std::string parseBroker(const std::string& token) {
    std::string lower = toLower(token);
    if (lower != "tws" && lower != "replay") {
        throw std::runtime_error("Unsupported broker: " + token);
    }
    return lower;
}

AppConfig parseConfigStream(std::istream& input, AppConfig config) {
    std::string line;
    int lineNumber = 0;
    while (std::getline(input, line)) {
        ++lineNumber;
        auto commentPos = line.find('#');
        if (commentPos != std::string::npos) {
            line = line.substr(0, commentPos);
        }
        line = trim(line);
        if (line.empty()) {
            continue;
        }
        auto tokens = splitWhitespace(line);
        std::string key = toUpper(tokens[0]);
        tokens.erase(tokens.begin());
        if (key == "BROKER") {
            config.broker = parseBroker(requireToken(tokens, 0, key));
        } else if (key == "HOST") {
            config.connection.host = requireToken(tokens, 0, key);
        } else if (key == "PORT") {
            config.connection.port = toInt(requireToken(tokens, 0, key), key);
        } else if (key == "CLIENT_ID") {
            config.connection.clientId = toInt(requireToken(tokens, 0, key), key);
        } else if (key == "REQUEST_TIMEOUT") {
            config.connection.requestTimeoutSeconds = std::max(1, toInt(requireToken(tokens, 0, key), key));
        } else if (key == "SCAN_INTERVAL") {
            config.scanIntervalSeconds = std::max(1, toInt(requireToken(tokens, 0, key), key));
        } else if (key == "MAX_ROWS") {
            config.maxRows = std::clamp(toInt(requireToken(tokens, 0, key), key), 1, kMaxScannerRows);
        } else if (key == "HISTORY") {
            config.historyLimit = std::max(0, toInt(requireToken(tokens, 0, key), key));
        } else if (key == "EXCHANGE") {
            config.scanner.exchange = parseExchange(requireToken(tokens, 0, key));
        } else if (key == "TIMEFRAME") {
            config.scanner.timeframeMinutes = toInt(requireToken(tokens, 0, key), key);
        } else if (key == "PRICE") {
            config.scanner.minPrice = toDouble(requireToken(tokens, 0, key), key);
            config.scanner.maxPrice = toDouble(requireToken(tokens, 1, key), key);
        } else if (key == "MARKET_CAP") {
            config.scanner.minMarketCap = toDouble(requireToken(tokens, 0, key), key);
            config.scanner.maxMarketCap = toDouble(requireToken(tokens, 1, key), key);
        } else if (key == "MIN_VOLUME") {
            config.scanner.minVolume = toLong(requireToken(tokens, 0, key), key);
        } else if (key == "DETECT") {
            parseDetect(requireToken(tokens, 0, key), config.scanner);
        } else if (key == "UNIVERSE") {
            config.universeFile = requireToken(tokens, 0, key);
        } else if (key == "BARS_DIR") {
            config.barsDir = requireToken(tokens, 0, key);
        } else if (key == "SETTINGS_FILE") {
            config.settingsFile = requireToken(tokens, 0, key);
        } else if (key == "LOG_LEVEL") {
            config.logLevel = toLower(requireToken(tokens, 0, key));
            parseLogLevel(config.logLevel);
        } else if (key == "LOG_FILE") {
            config.logFile = requireToken(tokens, 0, key);
        } else {
            logWarn("Ignoring unknown configuration key on line " + std::to_string(lineNumber) + ": " + key);
        }
    }
    auto errors = validateSettings(config.scanner);
    if (!errors.empty()) {
        throw std::runtime_error("Invalid scanner settings: " + errors.front());
    }
    return config;
}

AppConfig parseConfigStream(std::istream& input) { return parseConfigStream(input, AppConfig{}); }

AppConfig parseConfigFile(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("Failed to open configuration file: " + path);
    }
    return parseConfigStream(file);
}

}  // namespace fcs
