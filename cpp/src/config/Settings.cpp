#include "config/Settings.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <stdexcept>

namespace fcs {

namespace {

std::string toUpper(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return value;
}

std::string compactNumber(double value) {
    std::ostringstream oss;
    oss << value;
    return oss.str();
}

}  // namespace

const std::vector<int>& availableTimeframes() {
    static const std::vector<int> timeframes{1, 2, 3, 5, 10, 15};
    return timeframes;
}

std::string exchangeToString(Exchange exchange) {
    switch (exchange) {
        case Exchange::Nasdaq:
            return "NASDAQ";
        case Exchange::Nyse:
            return "NYSE";
        case Exchange::Both:
            return "BOTH";
    }
    return "BOTH";
}

Exchange parseExchange(const std::string& token) {
    std::string upper = toUpper(token);
    if (upper == "NASDAQ") return Exchange::Nasdaq;
    if (upper == "NYSE") return Exchange::Nyse;
    if (upper == "BOTH") return Exchange::Both;
    throw std::runtime_error("Unsupported exchange: " + token);
}

std::string scannerLocationCode(Exchange exchange) {
    switch (exchange) {
        case Exchange::Nasdaq:
            return "STK.NASDAQ";
        case Exchange::Nyse:
            return "STK.NYSE";
        case Exchange::Both:
            return "STK.US.MAJOR";
    }
    return "STK.US.MAJOR";
}

std::vector<std::string> validateSettings(const ScannerSettings& settings) {
    std::vector<std::string> errors;
    if (settings.minPrice < 0.0) {
        errors.push_back("Minimum price cannot be negative");
    }
    if (settings.maxPrice < settings.minPrice) {
        errors.push_back("Maximum price must be greater than minimum price");
    }
    if (settings.minMarketCap < 0.0) {
        errors.push_back("Minimum market cap cannot be negative");
    }
    if (settings.maxMarketCap < settings.minMarketCap) {
        errors.push_back("Maximum market cap must be greater than minimum");
    }
    if (settings.minVolume < 0) {
        errors.push_back("Minimum volume cannot be negative");
    }
    const auto& timeframes = availableTimeframes();
    if (std::find(timeframes.begin(), timeframes.end(), settings.timeframeMinutes) == timeframes.end()) {
        std::string list;
        for (std::size_t i = 0; i < timeframes.size(); ++i) {
            if (i) list += ", ";
            list += std::to_string(timeframes[i]);
        }
        errors.push_back("Timeframe must be one of: " + list);
    }
    return errors;
}

std::string describeParameters(const ScannerSettings& settings) {
    return "TF:" + std::to_string(settings.timeframeMinutes) + "m | Vol:" + std::to_string(settings.minVolume) + " | Price:$" +
           compactNumber(settings.minPrice) + "-$" + compactNumber(settings.maxPrice);
}

}  // namespace fcs
