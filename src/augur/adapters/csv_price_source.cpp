#include <augur/adapters/csv_price_source.hpp>
#include <augur/adapters/csv_reader.hpp>
#include <augur/utils/logger.hpp>

namespace augur::adapters {

bool CsvPriceSource::load(const std::string& path) {
    CsvReader csv;
    if (!csv.load(path)) {
        return false;
    }
    size_t skipped = 0;
    for (size_t row = 0; row < csv.row_count(); ++row) {
        auto ts = csv.timestamp(row, "timestamp");
        auto symbol = csv.text(row, "symbol");
        auto price = csv.number(row, "price");
        if (!ts || !symbol || !price || *price <= 0.0) {
            ++skipped;
            continue;
        }
        add_quote(*symbol, *ts, *price);
    }
    if (skipped > 0) {
        utils::Logger::warn() << path << ": skipped " << skipped << " malformed price rows" << utils::Logger::endl;
    }
    return true;
}

void CsvPriceSource::add_quote(const std::string& symbol, utils::Timestamp ts, double price) {
    quotes_[symbol][ts] = price;
}

std::optional<pipeline::PriceQuote> CsvPriceSource::quote_at_or_before(const std::string& symbol,
                                                                       utils::Timestamp ts) {
    auto series = quotes_.find(symbol);
    if (series == quotes_.end()) {
        return std::nullopt;
    }
    auto it = series->second.upper_bound(ts);
    if (it == series->second.begin()) {
        return std::nullopt;
    }
    --it;
    return pipeline::PriceQuote{it->second, it->first};
}

std::optional<pipeline::PriceQuote> CsvPriceSource::quote_at_or_after(const std::string& symbol,
                                                                      utils::Timestamp ts,
                                                                      utils::Timestamp latest) {
    auto series = quotes_.find(symbol);
    if (series == quotes_.end()) {
        return std::nullopt;
    }
    auto it = series->second.lower_bound(ts);
    if (it == series->second.end() || it->first > latest) {
        return std::nullopt;
    }
    return pipeline::PriceQuote{it->second, it->first};
}

} // namespace augur::adapters
