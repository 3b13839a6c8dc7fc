#include "data/CsvBarProvider.h"
#include "common/Errors.h"
#include "common/Logger.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <sstream>

#include <nlohmann/json.hpp>

namespace trendlab {
namespace data {

namespace {
std::string trim(std::string s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) {
        s.erase(s.begin());
    }
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
        s.pop_back();
    }
    return s;
}

std::string normalizeCell(std::string s) {
    s = trim(std::move(s));

    // Strip UTF-8 BOM if present at first cell.
    if (s.size() >= 3 &&
        static_cast<unsigned char>(s[0]) == 0xEF &&
        static_cast<unsigned char>(s[1]) == 0xBB &&
        static_cast<unsigned char>(s[2]) == 0xBF) {
        s = s.substr(3);
    }

    // Accept quoted CSV cells.
    if (s.size() >= 2 && s.front() == '"' && s.back() == '"') {
        s = s.substr(1, s.size() - 2);
    }
    return trim(std::move(s));
}

// Closes are prices: finite and strictly positive
bool isUsableClose(double close) {
    return std::isfinite(close) && close > 0.0;
}

std::string toUpperCopy(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return value;
}
}

CsvBarProvider::CsvBarProvider(std::filesystem::path data_dir)
    : data_dir_(std::move(data_dir)) {}

std::vector<Bar> CsvBarProvider::loadCSV(const std::filesystem::path& file_path) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        throw DataError(DataErrorKind::UPSTREAM, "Failed to open bar file: " + file_path.string());
    }

    std::vector<Bar> bars;
    std::string line;
    while (std::getline(file, line)) {
        std::stringstream ss(line);
        std::string cell;
        std::vector<std::string> row;

        while (std::getline(ss, cell, ',')) {
            row.push_back(normalizeCell(cell));
        }

        if (row.size() < 2) continue;
        if (row[0].empty() || !std::isdigit(static_cast<unsigned char>(row[0][0]))) {
            // Header or malformed row.
            continue;
        }

        try {
            const size_t close_col = (row.size() >= 6) ? 4 : 1;
            const double close = std::stod(row[close_col]);
            if (!isUsableClose(close)) {
                LOG_WARN("Skipping row with unusable close: {}", line);
                continue;
            }
            bars.emplace_back(Date::parse(row[0]), close);
        } catch (const std::exception& e) {
            LOG_WARN("Error parsing row: {} - {}", line, e.what());
        }
    }

    LOG_DEBUG("Loaded {} bars from {}", bars.size(), file_path.string());
    return bars;
}

std::vector<Bar> CsvBarProvider::loadJSON(const std::filesystem::path& file_path) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        throw DataError(DataErrorKind::UPSTREAM, "Failed to open bar file: " + file_path.string());
    }

    std::vector<Bar> bars;
    try {
        nlohmann::json j;
        file >> j;
        for (const auto& item : j) {
            std::string date_text;
            if (item.contains("date")) date_text = item["date"].get<std::string>();
            else if (item.contains("t")) date_text = item["t"].get<std::string>();

            double close = 0.0;
            if (item.contains("close")) close = item["close"].get<double>();
            else if (item.contains("c")) close = item["c"].get<double>();

            if (date_text.empty()) {
                LOG_WARN("Skipping bar without date in {}", file_path.string());
                continue;
            }
            if (!isUsableClose(close)) {
                LOG_WARN("Skipping bar {} with unusable close in {}", date_text, file_path.string());
                continue;
            }
            bars.emplace_back(Date::parse(date_text), close);
        }
    } catch (const std::exception& e) {
        throw DataError(DataErrorKind::UPSTREAM,
                        "Error parsing bar file " + file_path.string() + ": " + e.what());
    }

    LOG_DEBUG("Loaded {} bars from {}", bars.size(), file_path.string());
    return bars;
}

std::vector<Bar> CsvBarProvider::normalize(std::vector<Bar> bars, const Date& start, const Date& end) {
    std::stable_sort(bars.begin(), bars.end(), [](const Bar& a, const Bar& b) {
        return a.date < b.date;
    });
    bars.erase(std::unique(bars.begin(), bars.end(), [](const Bar& a, const Bar& b) {
        return a.date == b.date;
    }), bars.end());
    bars.erase(std::remove_if(bars.begin(), bars.end(), [&](const Bar& bar) {
        return bar.date < start || bar.date > end;
    }), bars.end());
    return bars;
}

std::vector<Bar> CsvBarProvider::getBars(const std::string& symbol,
                                         const Date& start,
                                         const Date& end,
                                         Timeframe timeframe) {
    const std::string upper = toUpperCopy(symbol);
    const std::string stem = upper + "_" + timeframeToString(timeframe);
    const auto csv_path = data_dir_ / (stem + ".csv");
    const auto json_path = data_dir_ / (stem + ".json");

    std::vector<Bar> bars;
    if (std::filesystem::exists(csv_path)) {
        bars = loadCSV(csv_path);
    } else if (std::filesystem::exists(json_path)) {
        bars = loadJSON(json_path);
    }

    bars = normalize(std::move(bars), start, end);
    if (bars.empty()) {
        throw DataError(DataErrorKind::NOT_FOUND,
                        std::string("No ") + timeframeToString(timeframe) +
                        " bar data returned for symbol '" + upper + "'.");
    }
    return bars;
}

} // namespace data
} // namespace trendlab
