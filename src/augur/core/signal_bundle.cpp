#include <augur/core/signal_bundle.hpp>

namespace augur::core {

bool TechnicalSignal::has_any_value() const {
    return rsi || macd_line || macd_signal || macd_hist
        || price_vs_sma20 || price_vs_sma50 || price_vs_sma200
        || bollinger_width || atr || volatility_20d || volume_ratio
        || current_price || price_change_1d || price_change_5d;
}

} // namespace augur::core
