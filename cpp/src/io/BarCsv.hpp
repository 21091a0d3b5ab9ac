#pragma once

#include <ostream>
#include <string>
#include <vector>

#include "model/Types.hpp"

namespace fcs {

// One row of a replay universe file.
struct UniverseRow {
    SymbolSnapshot snapshot;
    Quote quote;
};

// time,open,high,low,close,volume. `time` is epoch seconds or an Eastern
// "YYYY-MM-DD HH:MM[:SS]". Returns false and logs on the first bad row.
bool readBarsCsv(const std::string& path, std::vector<Bar>& bars);
bool readBarsCsv(std::istream& input, std::vector<Bar>& bars, const std::string& source = "<stream>");

// symbol,exchange,last,market_cap_b,volume,prev_close,bid,ask. Empty cells stay unset.
bool readUniverseCsv(const std::string& path, std::vector<UniverseRow>& rows);
bool readUniverseCsv(std::istream& input, std::vector<UniverseRow>& rows, const std::string& source = "<stream>");

void writeResultsCsvHeader(std::ostream& os);
void writeResultCsvRow(std::ostream& os, const ScanResult& result);
void writeResultJsonRow(std::ostream& os, const ScanResult& result);

void writeBarsCsvHeader(std::ostream& os);
void writeBarCsvRow(std::ostream& os, const Bar& bar);

}  // namespace fcs
