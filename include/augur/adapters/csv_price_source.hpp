#pragma once
#include <augur/pipeline/signal_source.hpp>
#include <map>
#include <string>

namespace augur::adapters {

// PriceSource over a timestamp,symbol,price CSV export.
class CsvPriceSource : public pipeline::PriceSource {
public:
    bool load(const std::string& path);
    void add_quote(const std::string& symbol, utils::Timestamp ts, double price);

    std::optional<pipeline::PriceQuote> quote_at_or_before(const std::string& symbol, utils::Timestamp ts) override;
    std::optional<pipeline::PriceQuote> quote_at_or_after(const std::string& symbol, utils::Timestamp ts,
                                                          utils::Timestamp latest) override;

private:
    std::map<std::string, std::map<utils::Timestamp, double>> quotes_;
};

} // namespace augur::adapters
