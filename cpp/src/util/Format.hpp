#pragma once

#include <cstdint>
#include <string>

namespace fcs {

std::string formatVolume(std::int64_t volume);
std::string formatMarketCap(double marketCapBillions);
std::string formatPrice(double price);
std::string formatPercent(double percent);
// "YYYY-MM-DD HH:MM:SS ET"
std::string formatEasternTime(std::int64_t utcSeconds);

}  // namespace fcs
