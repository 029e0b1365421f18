// applications/augur_app/main.cpp
#include <augur/adapters/csv_price_source.hpp>
#include <augur/adapters/csv_signal_source.hpp>
#include <augur/pipeline/daily_pipeline.hpp>
#include <augur/pipeline/pipeline_config.hpp>
#include <augur/store/feature_store.hpp>
#include <augur/utils/config.hpp>
#include <augur/utils/logger.hpp>
#include <iostream>
#include <string>

namespace {

void usage() {
    std::cerr << "usage: augur_app morning|evening [config_file] [--now YYYY-MM-DDTHH:MM:SSZ]" << std::endl;
}

} // namespace

int main(int argc, char** argv) {
    if (argc < 2) {
        usage();
        return 1;
    }

    const std::string phase = argv[1];
    if (phase != "morning" && phase != "evening") {
        usage();
        return 1;
    }

    std::string config_file = "augur.conf";
    augur::utils::Timestamp now = augur::utils::now_seconds();
    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--now" && i + 1 < argc) {
            if (!augur::utils::parse_timestamp(argv[++i], now)) {
                std::cerr << "Invalid --now value: " << argv[i] << std::endl;
                return 1;
            }
        } else {
            config_file = arg;
        }
    }

    try {
        augur::utils::Config settings;
        if (!settings.load_from_file(config_file)) {
            std::cerr << "Failed to load configuration file " << config_file << ". Using defaults." << std::endl;
        }
        auto config = augur::pipeline::PipelineConfig::from_config(settings);
        if (!augur::utils::Logger::set_level(config.log_level)) {
            std::cerr << "Unknown log_level '" << config.log_level << "'" << std::endl;
        }

        if (config.symbols.empty()) {
            augur::utils::Logger::error() << "No symbols configured" << augur::utils::Logger::endl;
            return 1;
        }

        augur::adapters::CsvSignalSource signals;
        augur::adapters::CsvPriceSource prices;
        if (phase == "morning") {
            if (!signals.load_technical(config.technical_csv)) {
                return 1;
            }
            // Sentiment and context are optional; missing files degrade to defaults
            if (!config.sentiment_csv.empty()) {
                signals.load_sentiment(config.sentiment_csv);
            }
            if (!config.context_csv.empty()) {
                signals.load_context(config.context_csv);
            }
        } else if (!prices.load(config.prices_csv)) {
            return 1;
        }

        augur::store::FeatureStore store(config.database_path, config.features.market_utc_offset_minutes);
        augur::pipeline::DailyPipeline pipeline(config, store, signals, prices);

        if (phase == "morning") {
            auto summary = pipeline.morning(now);
            std::cout << summary.to_string() << std::endl;
            return summary.exit_status();
        }

        auto summary = pipeline.evening(now);
        std::cout << summary.to_string() << std::endl;
        return summary.exit_status();
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
