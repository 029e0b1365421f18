#pragma once
#include <augur/utils/time_utils.hpp>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace augur::adapters {

// Comma separated file with a header row. Cells are addressed by column name;
// empty cells read as nullopt.
class CsvReader {
public:
    bool load(const std::string& path);
    void parse(const std::string& text);

    size_t row_count() const { return rows_.size(); }
    bool has_column(const std::string& name) const { return columns_.count(name) > 0; }

    std::optional<std::string> text(size_t row, const std::string& column) const;
    std::optional<double> number(size_t row, const std::string& column) const;
    std::optional<bool> flag(size_t row, const std::string& column) const;
    std::optional<utils::Timestamp> timestamp(size_t row, const std::string& column) const;

private:
    std::unordered_map<std::string, size_t> columns_;
    std::vector<std::vector<std::string>> rows_;
};

} // namespace augur::adapters
