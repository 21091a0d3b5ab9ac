#include "scan/Filter.hpp"

#include <algorithm>
#include <cctype>

namespace fcs {

namespace {

std::string toUpper(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return value;
}

bool isNasdaq(const std::string& upper) { return upper == "NASDAQ" || upper == "ISLAND"; }

bool isNyse(const std::string& upper) { return upper == "NYSE"; }

}  // namespace

bool exchangeMatches(Exchange selection, const std::string& primaryExchange) {
    if (primaryExchange.empty()) {
        return true;
    }
    std::string upper = toUpper(primaryExchange);
    switch (selection) {
        case Exchange::Nasdaq:
            return isNasdaq(upper);
        case Exchange::Nyse:
            return isNyse(upper);
        case Exchange::Both:
            return isNasdaq(upper) || isNyse(upper);
    }
    return false;
}

bool priceInRange(const ScannerSettings& settings, double price) {
    return price >= settings.minPrice && price <= settings.maxPrice;
}

bool isEligible(const ScannerSettings& settings, const SymbolSnapshot& snapshot) {
    if (snapshot.symbol.empty()) {
        return false;
    }
    if (!exchangeMatches(settings.exchange, snapshot.primaryExchange)) {
        return false;
    }
    if (snapshot.lastPrice && !priceInRange(settings, *snapshot.lastPrice)) {
        return false;
    }
    if (snapshot.marketCapBillions &&
        (*snapshot.marketCapBillions < settings.minMarketCap || *snapshot.marketCapBillions > settings.maxMarketCap)) {
        return false;
    }
    if (snapshot.volume && *snapshot.volume < settings.minVolume) {
        return false;
    }
    return true;
}

bool matchesSignalSelection(const ScannerSettings& settings, const CandleSignals& signals) {
    if (settings.detectHeikinAshi && settings.detectNormal) {
        return signals.haBullish || signals.normalBullish;
    }
    if (settings.detectHeikinAshi) {
        return signals.haBullish;
    }
    if (settings.detectNormal) {
        return signals.normalBullish;
    }
    return true;
}

}  // namespace fcs
