#pragma once
#include <augur/core/signal_bundle.hpp>
#include <augur/utils/time_utils.hpp>
#include <chrono>
#include <optional>
#include <string>

namespace augur::pipeline {

using utils::Timestamp;

/**
 * Upstream signal provider, constructed by the caller and injected into each
 * pipeline run. Every fetch returns the newest signal observed at or before
 * as_of, or nullopt when the source has nothing. Implementations must give up
 * after timeout; they may throw on transport errors.
 *
 * Fetches for different symbols run concurrently.
 */
class SignalSource {
public:
    virtual ~SignalSource() = default;

    virtual std::optional<core::SentimentSignal> fetch_sentiment(const std::string& symbol, Timestamp as_of,
                                                                 std::chrono::milliseconds timeout) = 0;
    virtual std::optional<core::TechnicalSignal> fetch_technical(const std::string& symbol, Timestamp as_of,
                                                                 std::chrono::milliseconds timeout) = 0;
    virtual std::optional<core::MarketContextSignal> fetch_market_context(Timestamp as_of,
                                                                          std::chrono::milliseconds timeout) = 0;
};

struct PriceQuote {
    double price = 0.0;
    Timestamp timestamp = 0;
};

// Historical price lookup used by the evening phase.
class PriceSource {
public:
    virtual ~PriceSource() = default;

    // Latest quote at or before ts
    virtual std::optional<PriceQuote> quote_at_or_before(const std::string& symbol, Timestamp ts) = 0;
    // Earliest quote in [ts, latest]
    virtual std::optional<PriceQuote> quote_at_or_after(const std::string& symbol, Timestamp ts,
                                                        Timestamp latest) = 0;
};

} // namespace augur::pipeline
