#include <augur/adapters/csv_reader.hpp>
#include <augur/utils/logger.hpp>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <sstream>

namespace augur::adapters {

namespace {

std::string trim(const std::string& text) {
    auto begin = text.find_first_not_of(" \t\r\"");
    if (begin == std::string::npos) {
        return "";
    }
    auto end = text.find_last_not_of(" \t\r\"");
    return text.substr(begin, end - begin + 1);
}

std::vector<std::string> split(const std::string& line) {
    std::vector<std::string> cells;
    std::stringstream ss(line);
    std::string cell;
    while (std::getline(ss, cell, ',')) {
        cells.push_back(trim(cell));
    }
    // A trailing comma means one more empty cell
    if (!line.empty() && line.back() == ',') {
        cells.emplace_back();
    }
    return cells;
}

} // namespace

bool CsvReader::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        utils::Logger::error() << "Failed to open CSV file: " << path << utils::Logger::endl;
        return false;
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    parse(buffer.str());
    utils::Logger::debug() << "Read " << rows_.size() << " rows from " << path << utils::Logger::endl;
    return true;
}

void CsvReader::parse(const std::string& text) {
    columns_.clear();
    rows_.clear();

    std::istringstream input(text);
    std::string line;
    bool header = true;
    while (std::getline(input, line)) {
        if (trim(line).empty()) {
            continue;
        }
        auto cells = split(line);
        if (header) {
            for (size_t i = 0; i < cells.size(); ++i) {
                columns_[cells[i]] = i;
            }
            header = false;
        } else {
            rows_.push_back(std::move(cells));
        }
    }
}

std::optional<std::string> CsvReader::text(size_t row, const std::string& column) const {
    auto it = columns_.find(column);
    if (it == columns_.end() || row >= rows_.size() || it->second >= rows_[row].size()) {
        return std::nullopt;
    }
    const std::string& cell = rows_[row][it->second];
    if (cell.empty()) {
        return std::nullopt;
    }
    return cell;
}

std::optional<double> CsvReader::number(size_t row, const std::string& column) const {
    auto cell = text(row, column);
    if (!cell) {
        return std::nullopt;
    }
    try {
        size_t used = 0;
        double value = std::stod(*cell, &used);
        if (used != cell->size() || !std::isfinite(value)) {
            return std::nullopt;
        }
        return value;
    } catch (const std::exception&) {
        utils::Logger::debug() << "Unparseable number '" << *cell << "' in column " << column
                               << utils::Logger::endl;
        return std::nullopt;
    }
}

std::optional<bool> CsvReader::flag(size_t row, const std::string& column) const {
    auto cell = text(row, column);
    if (!cell) {
        return std::nullopt;
    }
    std::string lower = *cell;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "1" || lower == "true" || lower == "yes") {
        return true;
    }
    if (lower == "0" || lower == "false" || lower == "no") {
        return false;
    }
    return std::nullopt;
}

std::optional<utils::Timestamp> CsvReader::timestamp(size_t row, const std::string& column) const {
    auto cell = text(row, column);
    utils::Timestamp ts = 0;
    if (!cell || !utils::parse_timestamp(*cell, ts)) {
        return std::nullopt;
    }
    return ts;
}

} // namespace augur::adapters
