#include "util/Format.hpp"

#include <iomanip>
#include <sstream>

#include "util/MarketTime.hpp"

namespace fcs {

namespace {

std::string fixed2(double value) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << value;
    return oss.str();
}

}  // namespace

std::string formatVolume(std::int64_t volume) {
    if (volume >= 1000000000) {
        return fixed2(static_cast<double>(volume) / 1e9) + "B";
    }
    if (volume >= 1000000) {
        return fixed2(static_cast<double>(volume) / 1e6) + "M";
    }
    if (volume >= 1000) {
        return fixed2(static_cast<double>(volume) / 1e3) + "K";
    }
    return std::to_string(volume);
}

std::string formatMarketCap(double marketCapBillions) {
    if (marketCapBillions >= 1000.0) {
        return "$" + fixed2(marketCapBillions / 1000.0) + "T";
    }
    if (marketCapBillions >= 1.0) {
        return "$" + fixed2(marketCapBillions) + "B";
    }
    return "$" + fixed2(marketCapBillions * 1000.0) + "M";
}

std::string formatPrice(double price) { return "$" + fixed2(price); }

std::string formatPercent(double percent) {
    if (percent >= 0.0) {
        return "+" + fixed2(percent) + "%";
    }
    return fixed2(percent) + "%";
}

std::string formatEasternTime(std::int64_t utcSeconds) {
    LocalDateTime local = toEasternTime(utcSeconds);
    std::ostringstream oss;
    oss << toString(local.date) << ' ' << std::setfill('0') << std::setw(2) << local.hour << ':' << std::setw(2) << local.minute << ':'
        << std::setw(2) << local.second << " ET";
    return oss.str();
}

}  // namespace fcs
