#include "io/BarCsv.hpp"

#include <cctype>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

#include "util/Logging.hpp"
#include "util/MarketTime.hpp"

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

// Keeps empty cells so column positions stay stable.
std::vector<std::string> splitCells(const std::string& line) {
    std::vector<std::string> cells;
    std::string cell;
    std::istringstream iss(line);
    while (std::getline(iss, cell, ',')) {
        cells.push_back(trim(cell));
    }
    if (!line.empty() && line.back() == ',') {
        cells.emplace_back();
    }
    return cells;
}

bool isHeader(const std::vector<std::string>& cells) {
    return !cells.empty() && !cells[0].empty() && std::isalpha(static_cast<unsigned char>(cells[0][0])) &&
           (cells[0] == "time" || cells[0] == "symbol" || cells[0] == "TIME" || cells[0] == "SYMBOL");
}

double toDouble(const std::string& cell) {
    std::size_t used = 0;
    double value = std::stod(cell, &used);
    if (used != cell.size()) {
        throw std::invalid_argument(cell);
    }
    return value;
}

std::int64_t toInt64(const std::string& cell) {
    std::size_t used = 0;
    // Some feeds write volume as a float.
    double value = std::stod(cell, &used);
    if (used != cell.size()) {
        throw std::invalid_argument(cell);
    }
    return static_cast<std::int64_t>(value);
}

std::string jsonEscape(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        if (c == '"' || c == '\\') {
            out += '\\';
        }
        out += c;
    }
    return out;
}

}  // namespace

bool readBarsCsv(std::istream& input, std::vector<Bar>& bars, const std::string& source) {
    bars.clear();
    std::string line;
    int lineNumber = 0;
    while (std::getline(input, line)) {
        ++lineNumber;
        line = trim(line);
        if (line.empty() || line[0] == '#') {
            continue;
        }
        auto cells = splitCells(line);
        if (isHeader(cells)) {
            continue;
        }
        if (cells.size() < 6) {
            logError(source + ":" + std::to_string(lineNumber) + ": expected 6 columns");
            return false;
        }
        auto time = parseEasternTimestamp(cells[0]);
        if (!time) {
            logError(source + ":" + std::to_string(lineNumber) + ": bad time '" + cells[0] + "'");
            return false;
        }
        Bar bar;
        bar.time = *time;
        try {
            bar.open = toDouble(cells[1]);
            bar.high = toDouble(cells[2]);
            bar.low = toDouble(cells[3]);
            bar.close = toDouble(cells[4]);
            bar.volume = toInt64(cells[5]);
        } catch (const std::logic_error&) {
            logError(source + ":" + std::to_string(lineNumber) + ": bad number");
            return false;
        }
        bars.push_back(bar);
    }
    return true;
}

bool readBarsCsv(const std::string& path, std::vector<Bar>& bars) {
    std::ifstream file(path);
    if (!file) {
        logError("Failed to open bar file: " + path);
        return false;
    }
    return readBarsCsv(file, bars, path);
}

bool readUniverseCsv(std::istream& input, std::vector<UniverseRow>& rows, const std::string& source) {
    rows.clear();
    std::string line;
    int lineNumber = 0;
    while (std::getline(input, line)) {
        ++lineNumber;
        line = trim(line);
        if (line.empty() || line[0] == '#') {
            continue;
        }
        auto cells = splitCells(line);
        if (isHeader(cells)) {
            continue;
        }
        cells.resize(8);
        if (cells[0].empty()) {
            logError(source + ":" + std::to_string(lineNumber) + ": missing symbol");
            return false;
        }
        UniverseRow row;
        row.snapshot.symbol = cells[0];
        row.snapshot.primaryExchange = cells[1];
        try {
            if (!cells[2].empty()) row.snapshot.lastPrice = toDouble(cells[2]);
            if (!cells[3].empty()) row.snapshot.marketCapBillions = toDouble(cells[3]);
            if (!cells[4].empty()) row.snapshot.volume = toInt64(cells[4]);
            if (!cells[5].empty()) row.snapshot.previousClose = toDouble(cells[5]);
            if (!cells[6].empty()) row.quote.bid = toDouble(cells[6]);
            if (!cells[7].empty()) row.quote.ask = toDouble(cells[7]);
        } catch (const std::logic_error&) {
            logError(source + ":" + std::to_string(lineNumber) + ": bad number");
            return false;
        }
        row.quote.last = row.snapshot.lastPrice.value_or(0.0);
        row.quote.volume = row.snapshot.volume.value_or(0);
        rows.push_back(row);
    }
    return true;
}

bool readUniverseCsv(const std::string& path, std::vector<UniverseRow>& rows) {
    std::ifstream file(path);
    if (!file) {
        logError("Failed to open universe file: " + path);
        return false;
    }
    return readUniverseCsv(file, rows, path);
}

void writeResultsCsvHeader(std::ostream& os) {
    os << "ticker,last,change_pct,bid,ask,market_cap_b,volume,first_candle_volume,ha_bullish,normal_bullish,scan_time,parameters" << std::endl;
}

void writeResultCsvRow(std::ostream& os, const ScanResult& r) {
    os << r.symbol << ',' << std::fixed << std::setprecision(2) << r.lastPrice << ',' << r.changePercent << ',' << r.bid << ','
       << r.ask << ',' << std::setprecision(3) << r.marketCapBillions << ',' << r.volume << ',' << r.firstCandleVolume << ','
       << (r.haBullish ? 1 : 0) << ',' << (r.normalBullish ? 1 : 0) << ',' << r.scanTime << ",\"" << r.parametersUsed << '"'
       << std::endl;
}

void writeResultJsonRow(std::ostream& os, const ScanResult& r) {
    os << '{'
       << "\"ticker\":\"" << jsonEscape(r.symbol) << "\","
       << "\"last\":" << std::fixed << std::setprecision(2) << r.lastPrice << ','
       << "\"change_pct\":" << r.changePercent << ','
       << "\"bid\":" << r.bid << ','
       << "\"ask\":" << r.ask << ','
       << "\"market_cap_b\":" << std::setprecision(3) << r.marketCapBillions << ','
       << "\"volume\":" << r.volume << ','
       << "\"first_candle_volume\":" << r.firstCandleVolume << ','
       << "\"ha_bullish\":" << (r.haBullish ? "true" : "false") << ','
       << "\"normal_bullish\":" << (r.normalBullish ? "true" : "false") << ','
       << "\"scan_time\":" << r.scanTime << ','
       << "\"parameters\":\"" << jsonEscape(r.parametersUsed) << "\","
       << "\"first_bar\":{\"time\":" << r.firstBar.time << ",\"open\":" << std::setprecision(4) << r.firstBar.open
       << ",\"high\":" << r.firstBar.high << ",\"low\":" << r.firstBar.low << ",\"close\":" << r.firstBar.close
       << ",\"volume\":" << r.firstBar.volume << "},"
       << "\"first_ha\":{\"open\":" << r.firstHa.open << ",\"high\":" << r.firstHa.high << ",\"low\":" << r.firstHa.low
       << ",\"close\":" << r.firstHa.close << "}"
       << '}' << std::endl;
}

void writeBarsCsvHeader(std::ostream& os) { os << "time,open,high,low,close,volume" << std::endl; }

void writeBarCsvRow(std::ostream& os, const Bar& bar) {
    os << bar.time << ',' << std::fixed << std::setprecision(4) << bar.open << ',' << bar.high << ',' << bar.low << ',' << bar.close
       << ',' << bar.volume << std::endl;
}

}  // namespace fcs
