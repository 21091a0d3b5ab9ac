#pragma once

#include <string>

#include "config/Settings.hpp"
#include "model/Types.hpp"

namespace fcs {

// Case-insensitive. An empty primary exchange is accepted.
bool exchangeMatches(Exchange selection, const std::string& primaryExchange);

// Range and membership checks on the fields the snapshot carries.
bool isEligible(const ScannerSettings& settings, const SymbolSnapshot& snapshot);
bool priceInRange(const ScannerSettings& settings, double price);

bool matchesSignalSelection(const ScannerSettings& settings, const CandleSignals& signals);

}  // namespace fcs
