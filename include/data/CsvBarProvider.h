#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "data/IBarProvider.h"

namespace trendlab {
namespace data {

// Reads <data_dir>/<SYMBOL>_<weekly|daily>.csv, falling back to .json.
class CsvBarProvider : public IBarProvider {
public:
    explicit CsvBarProvider(std::filesystem::path data_dir);

    std::vector<Bar> getBars(
        const std::string& symbol,
        const Date& start,
        const Date& end,
        Timeframe timeframe
    ) override;

    // Expected format: date,close or date,open,high,low,close,volume (header optional)
    static std::vector<Bar> loadCSV(const std::filesystem::path& file_path);

    // Array of {"date"|"t": ..., "close"|"c": ...}
    static std::vector<Bar> loadJSON(const std::filesystem::path& file_path);

    // Sorts by date, drops repeated dates (first wins) and keeps [start, end]
    static std::vector<Bar> normalize(std::vector<Bar> bars, const Date& start, const Date& end);

    const std::filesystem::path& dataDir() const { return data_dir_; }

private:
    std::filesystem::path data_dir_;
};

} // namespace data
} // namespace trendlab
