#include <augur/core/phase_summary.hpp>
#include <iomanip>
#include <sstream>

namespace augur::core {

namespace {

std::string quoted(const std::string& text) {
    std::ostringstream out;
    out << '"';
    for (char c : text) {
        switch (c) {
            case '"': out << "\\\""; break;
            case '\\': out << "\\\\"; break;
            case '\n': out << "\\n"; break;
            case '\r': out << "\\r"; break;
            case '\t': out << "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    out << "\\u" << std::hex << std::setw(4) << std::setfill('0')
                        << static_cast<int>(static_cast<unsigned char>(c)) << std::dec;
                } else {
                    out << c;
                }
        }
    }
    out << '"';
    return out.str();
}

std::string violations_json(const ViolationReport& report) {
    std::ostringstream out;
    out << "[";
    for (size_t i = 0; i < report.violations.size(); ++i) {
        const auto& v = report.violations[i];
        out << (i ? "," : "") << "{\"check\":" << quoted(v.check)
            << ",\"affected_rows\":" << v.affected_rows
            << ",\"detail\":" << quoted(v.detail) << "}";
    }
    out << "]";
    return out.str();
}

} // namespace

std::string MorningSummary::to_string() const {
    std::ostringstream out;
    out << "{\"phase\":\"MORNING\""
        << ",\"run_timestamp\":\"" << utils::format_iso8601(run_timestamp) << "\""
        << ",\"trade_day\":" << trade_day
        << ",\"symbols_requested\":" << symbols_requested
        << ",\"symbols_analyzed\":" << symbols_analyzed
        << ",\"features_stored\":" << features_stored
        << ",\"predictions_made\":" << predictions_made
        << ",\"duplicates_rejected\":" << duplicates_rejected
        << ",\"incomplete_signals\":" << incomplete_signals
        << ",\"leakage_rejected\":" << leakage_rejected
        << ",\"degraded_signals\":" << degraded_signals
        << ",\"failures\":" << failures
        << ",\"model_available\":" << (model_available ? "true" : "false")
        << ",\"model_version\":" << quoted(model_version)
        << ",\"guard_passed\":" << (guard_passed ? "true" : "false")
        << ",\"violations\":" << violations_json(validation)
        << "}";
    return out.str();
}

std::string EveningSummary::to_string() const {
    std::ostringstream out;
    out << std::fixed << std::setprecision(4);
    out << "{\"phase\":\"EVENING\""
        << ",\"run_timestamp\":\"" << utils::format_iso8601(run_timestamp) << "\""
        << ",\"trade_day\":" << trade_day
        << ",\"outcomes_recorded\":" << outcomes_recorded
        << ",\"outcomes_pending\":" << outcomes_pending
        << ",\"outcomes_completed\":" << outcomes_completed
        << ",\"backfills_applied\":" << backfills_applied
        << ",\"backfills_rejected\":" << backfills_rejected
        << ",\"duplicate_outcomes_rejected\":" << duplicate_outcomes_rejected
        << ",\"failures\":" << failures
        << ",\"guard_passed\":" << (guard_passed ? "true" : "false")
        << ",\"violations\":" << violations_json(validation)
        << ",\"post_commit_violations\":" << violations_json(post_commit_validation)
        << ",\"training_skipped\":" << (training_skipped ? "true" : "false")
        << ",\"training_skip_reason\":" << quoted(training_skip_reason)
        << ",\"training_samples\":" << training_samples
        << ",\"candidate_version\":" << quoted(candidate_version)
        << ",\"model_promoted\":" << (model_promoted ? "true" : "false")
        << ",\"active_version\":" << quoted(active_version)
        << ",\"backtest\":{\"trades\":" << backtest_trades
        << ",\"excluded\":" << backtest_excluded
        << ",\"win_rate\":" << backtest_win_rate
        << ",\"avg_return\":" << backtest_avg_return
        << ",\"sharpe\":" << backtest_sharpe
        << ",\"max_drawdown\":" << backtest_max_drawdown << "}"
        << ",\"anomalies\":[";
    for (size_t i = 0; i < anomalies.size(); ++i) {
        out << (i ? "," : "") << quoted(anomalies[i]);
    }
    out << "]}";
    return out.str();
}

} // namespace augur::core
