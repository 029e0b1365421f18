#include <augur/store/feature_store.hpp>
#include <augur/core/errors.hpp>
#include <augur/utils/logger.hpp>
#include <sqlite3.h>
#include <algorithm>
#include <set>
#include <sstream>

namespace augur::store {

using core::StoreError;

namespace {

enum class StepResult {
    ROW,
    DONE,
    CONSTRAINT
};

// Prepared statement that finalizes itself.
class Statement {
public:
    Statement(sqlite3* db, const std::string& sql) : db_(db) {
        if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt_, nullptr) != SQLITE_OK) {
            std::string message = "failed to prepare statement: ";
            message += sqlite3_errmsg(db_);
            sqlite3_finalize(stmt_);
            throw StoreError(message);
        }
    }

    ~Statement() {
        sqlite3_finalize(stmt_);
    }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    void bind_double(int index, double value) {
        check(sqlite3_bind_double(stmt_, index, value));
    }

    void bind_int64(int index, int64_t value) {
        check(sqlite3_bind_int64(stmt_, index, value));
    }

    void bind_text(int index, const std::string& value) {
        check(sqlite3_bind_text(stmt_, index, value.c_str(), -1, SQLITE_TRANSIENT));
    }

    void bind_null(int index) {
        check(sqlite3_bind_null(stmt_, index));
    }

    void bind_opt_double(int index, const std::optional<double>& value) {
        if (value) {
            bind_double(index, *value);
        } else {
            bind_null(index);
        }
    }

    void bind_opt_int64(int index, const std::optional<int64_t>& value) {
        if (value) {
            bind_int64(index, *value);
        } else {
            bind_null(index);
        }
    }

    StepResult step() {
        int rc = sqlite3_step(stmt_);
        if (rc == SQLITE_ROW) {
            return StepResult::ROW;
        }
        if (rc == SQLITE_DONE) {
            return StepResult::DONE;
        }
        int extended = sqlite3_extended_errcode(db_);
        if (extended == SQLITE_CONSTRAINT_UNIQUE || extended == SQLITE_CONSTRAINT_PRIMARYKEY) {
            return StepResult::CONSTRAINT;
        }
        throw StoreError(std::string("statement failed: ") + sqlite3_errmsg(db_));
    }

    // Steps a statement that must finish without hitting any constraint
    void run() {
        if (step() == StepResult::CONSTRAINT) {
            throw StoreError(std::string("constraint violated: ") + sqlite3_errmsg(db_));
        }
    }

    bool next_row() {
        return step() == StepResult::ROW;
    }

    bool is_null(int column) const {
        return sqlite3_column_type(stmt_, column) == SQLITE_NULL;
    }

    double column_double(int column) const {
        return sqlite3_column_double(stmt_, column);
    }

    int64_t column_int64(int column) const {
        return sqlite3_column_int64(stmt_, column);
    }

    std::string column_text(int column) const {
        const unsigned char* text = sqlite3_column_text(stmt_, column);
        return text ? reinterpret_cast<const char*>(text) : "";
    }

    std::optional<double> column_opt_double(int column) const {
        if (is_null(column)) {
            return std::nullopt;
        }
        return column_double(column);
    }

    std::optional<int64_t> column_opt_int64(int column) const {
        if (is_null(column)) {
            return std::nullopt;
        }
        return column_int64(column);
    }

private:
    sqlite3* db_;
    sqlite3_stmt* stmt_ = nullptr;

    void check(int rc) {
        if (rc != SQLITE_OK) {
            throw StoreError(std::string("failed to bind parameter: ") + sqlite3_errmsg(db_));
        }
    }
};

const char* kSchemaSql = R"(
    CREATE TABLE IF NOT EXISTS phase_state (
        id INTEGER PRIMARY KEY AUTOINCREMENT,
        phase TEXT NOT NULL,
        trade_day INTEGER NOT NULL,
        completed_at INTEGER NOT NULL
    );

    CREATE TABLE IF NOT EXISTS enhanced_outcomes (
        id INTEGER PRIMARY KEY AUTOINCREMENT,
        feature_id INTEGER NOT NULL UNIQUE REFERENCES enhanced_features(id),
        symbol TEXT NOT NULL,
        prediction_timestamp INTEGER NOT NULL,
        entry_price REAL,
        exit_price_1h REAL,
        exit_price_4h REAL,
        exit_price_1d REAL,
        exit_timestamp_1h INTEGER,
        exit_timestamp_4h INTEGER,
        exit_timestamp_1d INTEGER,
        return_pct_1h REAL,
        return_pct_4h REAL,
        return_pct_1d REAL,
        price_direction_1h TEXT,
        price_direction_4h TEXT,
        price_direction_1d TEXT,
        return_pct REAL,
        recorded_timestamp INTEGER,
        status TEXT NOT NULL DEFAULT 'PENDING',
        created_at DATETIME DEFAULT CURRENT_TIMESTAMP
    );
    CREATE INDEX IF NOT EXISTS idx_outcomes_status ON enhanced_outcomes(status);

    CREATE TABLE IF NOT EXISTS predictions (
        id INTEGER PRIMARY KEY AUTOINCREMENT,
        feature_id INTEGER NOT NULL REFERENCES enhanced_features(id),
        symbol TEXT NOT NULL,
        trade_day INTEGER NOT NULL,
        created_timestamp INTEGER NOT NULL,
        direction_1h TEXT NOT NULL,
        direction_4h TEXT NOT NULL,
        direction_1d TEXT NOT NULL,
        prob_up_1h REAL, prob_down_1h REAL, prob_flat_1h REAL,
        prob_up_4h REAL, prob_down_4h REAL, prob_flat_4h REAL,
        prob_up_1d REAL, prob_down_1d REAL, prob_flat_1d REAL,
        magnitude_1h REAL NOT NULL,
        magnitude_4h REAL NOT NULL,
        magnitude_1d REAL NOT NULL,
        confidence_1h REAL NOT NULL,
        confidence_4h REAL NOT NULL,
        confidence_1d REAL NOT NULL,
        confidence_avg REAL NOT NULL,
        optimal_action TEXT NOT NULL,
        model_version TEXT,
        created_at DATETIME DEFAULT CURRENT_TIMESTAMP,
        UNIQUE(symbol, trade_day)
    );

    CREATE TABLE IF NOT EXISTS model_performance (
        id INTEGER PRIMARY KEY AUTOINCREMENT,
        version_id TEXT NOT NULL UNIQUE,
        model_type TEXT NOT NULL,
        trained_at INTEGER NOT NULL,
        training_cutoff INTEGER NOT NULL,
        random_seed INTEGER NOT NULL,
        feature_schema_hash TEXT NOT NULL,
        direction_accuracy_1h REAL,
        direction_accuracy_4h REAL,
        direction_accuracy_1d REAL,
        magnitude_mae_1h REAL,
        magnitude_mae_4h REAL,
        magnitude_mae_1d REAL,
        training_samples INTEGER NOT NULL,
        evaluation_samples INTEGER NOT NULL,
        status TEXT NOT NULL,
        created_at DATETIME DEFAULT CURRENT_TIMESTAMP
    );

    CREATE TABLE IF NOT EXISTS model_activation (
        id INTEGER PRIMARY KEY AUTOINCREMENT,
        version_id TEXT NOT NULL REFERENCES model_performance(version_id),
        activated_at INTEGER NOT NULL
    );

    CREATE TABLE IF NOT EXISTS morning_analysis (
        id INTEGER PRIMARY KEY AUTOINCREMENT,
        run_timestamp INTEGER NOT NULL,
        trade_day INTEGER NOT NULL,
        symbols_requested INTEGER,
        symbols_analyzed INTEGER,
        features_stored INTEGER,
        predictions_made INTEGER,
        duplicates_rejected INTEGER,
        incomplete_signals INTEGER,
        leakage_rejected INTEGER,
        degraded_signals INTEGER,
        failures INTEGER,
        model_version TEXT,
        validation_passed INTEGER,
        validation_failed INTEGER,
        violations TEXT,
        created_at DATETIME DEFAULT CURRENT_TIMESTAMP
    );

    CREATE TABLE IF NOT EXISTS evening_analysis (
        id INTEGER PRIMARY KEY AUTOINCREMENT,
        run_timestamp INTEGER NOT NULL,
        trade_day INTEGER NOT NULL,
        outcomes_recorded INTEGER,
        outcomes_pending INTEGER,
        outcomes_completed INTEGER,
        backfills_applied INTEGER,
        backfills_rejected INTEGER,
        failures INTEGER,
        validation_passed INTEGER,
        validation_failed INTEGER,
        violations TEXT,
        training_skipped INTEGER,
        training_skip_reason TEXT,
        training_samples INTEGER,
        candidate_version TEXT,
        model_promoted INTEGER,
        active_version TEXT,
        backtest_trades INTEGER,
        backtest_win_rate REAL,
        backtest_avg_return REAL,
        backtest_sharpe REAL,
        backtest_max_drawdown REAL,
        anomalies TEXT,
        created_at DATETIME DEFAULT CURRENT_TIMESTAMP
    );
)";

std::string features_table_sql() {
    std::ostringstream sql;
    sql << "CREATE TABLE IF NOT EXISTS enhanced_features ("
        << "id INTEGER PRIMARY KEY AUTOINCREMENT, "
        << "symbol TEXT NOT NULL, "
        << "timestamp INTEGER NOT NULL, "
        << "trade_day INTEGER NOT NULL, ";
    for (size_t i = 0; i < core::kFeatureCount; ++i) {
        sql << core::feature_name(i) << " REAL NOT NULL, ";
    }
    sql << "defaulted_mask TEXT NOT NULL, "
        << "quality_score REAL NOT NULL, "
        << "sentiment_timestamp INTEGER NOT NULL, "
        << "technical_timestamp INTEGER NOT NULL, "
        << "context_timestamp INTEGER NOT NULL, "
        << "feature_version TEXT NOT NULL, "
        << "created_at DATETIME DEFAULT CURRENT_TIMESTAMP, "
        << "UNIQUE(symbol, trade_day))";
    return sql.str();
}

// Column list shared by feature INSERT and SELECT, after the id column
std::string feature_columns() {
    std::ostringstream cols;
    cols << "symbol, timestamp, trade_day";
    for (size_t i = 0; i < core::kFeatureCount; ++i) {
        cols << ", " << core::feature_name(i);
    }
    cols << ", defaulted_mask, quality_score, sentiment_timestamp, technical_timestamp, context_timestamp";
    return cols.str();
}

std::string prefixed(const std::string& columns, const std::string& alias) {
    std::ostringstream out;
    std::stringstream ss(columns);
    std::string column;
    bool first = true;
    while (std::getline(ss, column, ',')) {
        column.erase(0, column.find_first_not_of(' '));
        out << (first ? "" : ", ") << alias << "." << column;
        first = false;
    }
    return out.str();
}

// Reads the columns of feature_columns() preceded by id, starting at offset
core::FeatureRecord read_feature(const Statement& stmt, int offset) {
    core::FeatureRecord record;
    int col = offset;
    record.id = stmt.column_int64(col++);
    record.symbol = stmt.column_text(col++);
    record.timestamp = stmt.column_int64(col++);
    ++col; // trade_day
    for (size_t i = 0; i < core::kFeatureCount; ++i) {
        record.values[i] = stmt.column_double(col++);
    }
    std::string mask = stmt.column_text(col++);
    if (mask.size() == core::kFeatureCount) {
        record.defaulted = std::bitset<core::kFeatureCount>(mask);
    }
    record.quality_score = stmt.column_double(col++);
    record.sentiment_timestamp = stmt.column_int64(col++);
    record.technical_timestamp = stmt.column_int64(col++);
    record.context_timestamp = stmt.column_int64(col++);
    return record;
}

// id plus feature_columns()
constexpr int kFeatureColumnCount = 1 + 3 + static_cast<int>(core::kFeatureCount) + 5;

std::string prediction_columns() {
    return "id, feature_id, symbol, created_timestamp, "
           "direction_1h, direction_4h, direction_1d, "
           "prob_up_1h, prob_down_1h, prob_flat_1h, "
           "prob_up_4h, prob_down_4h, prob_flat_4h, "
           "prob_up_1d, prob_down_1d, prob_flat_1d, "
           "magnitude_1h, magnitude_4h, magnitude_1d, "
           "confidence_1h, confidence_4h, confidence_1d, "
           "confidence_avg, optimal_action, model_version";
}

constexpr int kPredictionColumnCount = 25;

core::Prediction read_prediction(const Statement& stmt, int offset) {
    core::Prediction p;
    int col = offset;
    p.id = stmt.column_int64(col++);
    p.feature_id = stmt.column_int64(col++);
    p.symbol = stmt.column_text(col++);
    p.created_timestamp = stmt.column_int64(col++);
    for (size_t h = 0; h < core::kHorizonCount; ++h) {
        p.horizons[h].direction = core::parse_direction(stmt.column_text(col++))
                                      .value_or(core::Direction::FLAT);
    }
    for (size_t h = 0; h < core::kHorizonCount; ++h) {
        p.horizons[h].probabilities[core::direction_index(core::Direction::UP)] = stmt.column_double(col++);
        p.horizons[h].probabilities[core::direction_index(core::Direction::DOWN)] = stmt.column_double(col++);
        p.horizons[h].probabilities[core::direction_index(core::Direction::FLAT)] = stmt.column_double(col++);
    }
    for (size_t h = 0; h < core::kHorizonCount; ++h) {
        p.horizons[h].magnitude_pct = stmt.column_double(col++);
    }
    for (size_t h = 0; h < core::kHorizonCount; ++h) {
        p.horizons[h].confidence = stmt.column_double(col++);
    }
    p.average_confidence = stmt.column_double(col++);
    p.optimal_action = core::parse_action(stmt.column_text(col++)).value_or(core::Action::HOLD);
    p.model_version = stmt.column_text(col++);
    return p;
}

std::string outcome_columns() {
    return "id, feature_id, symbol, prediction_timestamp, entry_price, "
           "exit_price_1h, exit_timestamp_1h, return_pct_1h, price_direction_1h, "
           "exit_price_4h, exit_timestamp_4h, return_pct_4h, price_direction_4h, "
           "exit_price_1d, exit_timestamp_1d, return_pct_1d, price_direction_1d, "
           "recorded_timestamp, status";
}

core::Outcome read_outcome(const Statement& stmt, int offset) {
    core::Outcome o;
    int col = offset;
    o.id = stmt.column_int64(col++);
    o.feature_id = stmt.column_int64(col++);
    o.symbol = stmt.column_text(col++);
    o.feature_timestamp = stmt.column_int64(col++);
    o.entry_price = stmt.column_opt_double(col++);
    for (size_t h = 0; h < core::kHorizonCount; ++h) {
        auto& ho = o.horizons[h];
        ho.exit_price = stmt.column_opt_double(col++);
        ho.exit_timestamp = stmt.column_opt_int64(col++);
        ho.return_pct = stmt.column_opt_double(col++);
        if (stmt.is_null(col)) {
            ho.direction = std::nullopt;
        } else {
            ho.direction = core::parse_direction(stmt.column_text(col));
        }
        ++col;
    }
    o.recorded_timestamp = stmt.column_opt_int64(col++);
    o.status = stmt.column_text(col++) == "COMPLETE" ? core::OutcomeStatus::COMPLETE
                                                    : core::OutcomeStatus::PENDING;
    return o;
}

std::string model_columns() {
    return "version_id, trained_at, training_cutoff, random_seed, feature_schema_hash, "
           "direction_accuracy_1h, direction_accuracy_4h, direction_accuracy_1d, "
           "magnitude_mae_1h, magnitude_mae_4h, magnitude_mae_1d, "
           "training_samples, evaluation_samples, status";
}

core::ModelVersion read_model(const Statement& stmt, int offset) {
    core::ModelVersion v;
    int col = offset;
    v.version_id = stmt.column_text(col++);
    v.trained_at = stmt.column_int64(col++);
    v.training_cutoff = stmt.column_int64(col++);
    v.random_seed = static_cast<uint32_t>(stmt.column_int64(col++));
    v.feature_schema_hash = stmt.column_text(col++);
    for (size_t h = 0; h < core::kHorizonCount; ++h) {
        v.direction_accuracy[h] = stmt.column_double(col++);
    }
    for (size_t h = 0; h < core::kHorizonCount; ++h) {
        v.magnitude_mae[h] = stmt.column_double(col++);
    }
    v.training_sample_count = stmt.column_int64(col++);
    v.evaluation_sample_count = stmt.column_int64(col++);
    v.status = stmt.column_text(col++) == "ACCEPTED" ? core::ModelStatus::ACCEPTED
                                                    : core::ModelStatus::REJECTED;
    return v;
}

} // namespace

FeatureStore::FeatureStore(const std::string& path, int utc_offset_minutes)
    : path_(path), utc_offset_minutes_(utc_offset_minutes) {
    int rc = sqlite3_open_v2(path.c_str(), &db_,
                             SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
                             nullptr);
    if (rc != SQLITE_OK) {
        std::string message = "failed to open SQLite database at " + path + ": "
                            + (db_ ? sqlite3_errmsg(db_) : "out of memory");
        if (db_) {
            sqlite3_close(db_);
            db_ = nullptr;
        }
        throw StoreError(message);
    }

    sqlite3_busy_timeout(db_, 5000);
    try {
        execute("PRAGMA foreign_keys = ON;");
        if (path != ":memory:") {
            execute("PRAGMA journal_mode = WAL;");
        }
        create_schema();
    } catch (...) {
        sqlite3_close(db_);
        db_ = nullptr;
        throw;
    }

    utils::Logger::debug() << "Feature store opened: " << path << utils::Logger::endl;
}

FeatureStore::~FeatureStore() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

void FeatureStore::execute(const std::string& sql) {
    char* err_msg = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err_msg);
    if (rc != SQLITE_OK) {
        std::string message = err_msg ? err_msg : sqlite3_errmsg(db_);
        sqlite3_free(err_msg);
        throw StoreError("failed to execute '" + sql.substr(0, 60) + "': " + message);
    }
}

void FeatureStore::create_schema() {
    execute(features_table_sql());
    execute("CREATE INDEX IF NOT EXISTS idx_features_timestamp ON enhanced_features(timestamp);");
    execute(kSchemaSql);
}

int64_t FeatureStore::trade_day_of(Timestamp ts) const {
    return utils::trade_day(ts, utc_offset_minutes_);
}

int64_t FeatureStore::query_int(const std::string& sql) const {
    Statement stmt(db_, sql);
    if (!stmt.next_row() || stmt.is_null(0)) {
        return 0;
    }
    return stmt.column_int64(0);
}

// ---- Transaction ----------------------------------------------------------

FeatureStore::Transaction::Transaction(FeatureStore& store) : store_(store) {
    store_.execute("BEGIN IMMEDIATE;");
}

FeatureStore::Transaction::~Transaction() {
    if (active_) {
        char* err_msg = nullptr;
        if (sqlite3_exec(store_.db_, "ROLLBACK;", nullptr, nullptr, &err_msg) != SQLITE_OK) {
            utils::Logger::error() << "Rollback failed: " << (err_msg ? err_msg : "unknown")
                                   << utils::Logger::endl;
        }
        sqlite3_free(err_msg);
    }
}

void FeatureStore::Transaction::commit() {
    store_.execute("COMMIT;");
    active_ = false;
}

// ---- Features -------------------------------------------------------------

std::optional<int64_t> FeatureStore::insert_feature(const core::FeatureRecord& record) {
    const std::string columns = feature_columns() + ", feature_version";
    std::ostringstream sql;
    sql << "INSERT INTO enhanced_features (" << columns << ") VALUES (?";
    // feature_version takes the slot of id
    for (int i = 1; i < kFeatureColumnCount; ++i) {
        sql << ", ?";
    }
    sql << ")";

    Statement stmt(db_, sql.str());
    int idx = 1;
    stmt.bind_text(idx++, record.symbol);
    stmt.bind_int64(idx++, record.timestamp);
    stmt.bind_int64(idx++, trade_day_of(record.timestamp));
    for (size_t i = 0; i < core::kFeatureCount; ++i) {
        stmt.bind_double(idx++, record.values[i]);
    }
    stmt.bind_text(idx++, record.defaulted.to_string());
    stmt.bind_double(idx++, record.quality_score);
    stmt.bind_int64(idx++, record.sentiment_timestamp);
    stmt.bind_int64(idx++, record.technical_timestamp);
    stmt.bind_int64(idx++, record.context_timestamp);
    stmt.bind_text(idx++, core::feature_schema_hash());

    if (stmt.step() == StepResult::CONSTRAINT) {
        utils::Logger::warn() << "Feature for " << record.symbol << " on day "
                              << trade_day_of(record.timestamp)
                              << " already stored, insert rejected" << utils::Logger::endl;
        return std::nullopt;
    }
    return sqlite3_last_insert_rowid(db_);
}

std::optional<core::FeatureRecord> FeatureStore::get_feature(int64_t id) const {
    Statement stmt(db_, "SELECT id, " + feature_columns() + " FROM enhanced_features WHERE id = ?");
    stmt.bind_int64(1, id);
    if (!stmt.next_row()) {
        return std::nullopt;
    }
    return read_feature(stmt, 0);
}

std::vector<core::FeatureRecord> FeatureStore::features_for_day(int64_t trade_day) const {
    Statement stmt(db_, "SELECT id, " + feature_columns()
                        + " FROM enhanced_features WHERE trade_day = ? ORDER BY symbol");
    stmt.bind_int64(1, trade_day);
    std::vector<core::FeatureRecord> records;
    while (stmt.next_row()) {
        records.push_back(read_feature(stmt, 0));
    }
    return records;
}

std::vector<core::FeatureRecord> FeatureStore::features_awaiting_outcome(Timestamp cutoff) const {
    Statement stmt(db_, "SELECT f.id, " + prefixed(feature_columns(), "f")
                        + " FROM enhanced_features f"
                          " LEFT JOIN enhanced_outcomes o ON o.feature_id = f.id"
                          " WHERE o.id IS NULL AND f.timestamp + ? <= ?"
                          " ORDER BY f.timestamp, f.id");
    stmt.bind_int64(1, core::horizon_seconds(core::kShortestHorizon));
    stmt.bind_int64(2, cutoff);
    std::vector<core::FeatureRecord> records;
    while (stmt.next_row()) {
        records.push_back(read_feature(stmt, 0));
    }
    return records;
}

int64_t FeatureStore::feature_count() const {
    return query_int("SELECT COUNT(*) FROM enhanced_features");
}

// ---- Predictions ----------------------------------------------------------

std::optional<int64_t> FeatureStore::insert_prediction(const core::Prediction& prediction) {
    Statement stmt(db_,
        "INSERT INTO predictions (feature_id, symbol, trade_day, created_timestamp, "
        "direction_1h, direction_4h, direction_1d, "
        "prob_up_1h, prob_down_1h, prob_flat_1h, "
        "prob_up_4h, prob_down_4h, prob_flat_4h, "
        "prob_up_1d, prob_down_1d, prob_flat_1d, "
        "magnitude_1h, magnitude_4h, magnitude_1d, "
        "confidence_1h, confidence_4h, confidence_1d, "
        "confidence_avg, optimal_action, model_version) "
        "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)");

    int idx = 1;
    stmt.bind_int64(idx++, prediction.feature_id);
    stmt.bind_text(idx++, prediction.symbol);
    stmt.bind_int64(idx++, trade_day_of(prediction.created_timestamp));
    stmt.bind_int64(idx++, prediction.created_timestamp);
    for (const auto& h : prediction.horizons) {
        stmt.bind_text(idx++, core::to_string(h.direction));
    }
    for (const auto& h : prediction.horizons) {
        stmt.bind_double(idx++, h.probabilities[core::direction_index(core::Direction::UP)]);
        stmt.bind_double(idx++, h.probabilities[core::direction_index(core::Direction::DOWN)]);
        stmt.bind_double(idx++, h.probabilities[core::direction_index(core::Direction::FLAT)]);
    }
    for (const auto& h : prediction.horizons) {
        stmt.bind_double(idx++, h.magnitude_pct);
    }
    for (const auto& h : prediction.horizons) {
        stmt.bind_double(idx++, h.confidence);
    }
    stmt.bind_double(idx++, prediction.average_confidence);
    stmt.bind_text(idx++, core::to_string(prediction.optimal_action));
    stmt.bind_text(idx++, prediction.model_version);

    if (stmt.step() == StepResult::CONSTRAINT) {
        utils::Logger::warn() << "Prediction for " << prediction.symbol << " on day "
                              << trade_day_of(prediction.created_timestamp)
                              << " already exists, insert rejected" << utils::Logger::endl;
        return std::nullopt;
    }
    return sqlite3_last_insert_rowid(db_);
}

std::optional<core::Prediction> FeatureStore::prediction_for_feature(int64_t feature_id) const {
    Statement stmt(db_, "SELECT " + prediction_columns() + " FROM predictions WHERE feature_id = ?");
    stmt.bind_int64(1, feature_id);
    if (!stmt.next_row()) {
        return std::nullopt;
    }
    return read_prediction(stmt, 0);
}

std::vector<core::Prediction> FeatureStore::predictions_for_day(int64_t trade_day) const {
    Statement stmt(db_, "SELECT " + prediction_columns()
                        + " FROM predictions WHERE trade_day = ? ORDER BY symbol");
    stmt.bind_int64(1, trade_day);
    std::vector<core::Prediction> predictions;
    while (stmt.next_row()) {
        predictions.push_back(read_prediction(stmt, 0));
    }
    return predictions;
}

int64_t FeatureStore::prediction_count() const {
    return query_int("SELECT COUNT(*) FROM predictions");
}

// ---- Outcomes -------------------------------------------------------------

std::optional<int64_t> FeatureStore::insert_outcome(const core::Outcome& outcome) {
    Statement stmt(db_,
        "INSERT INTO enhanced_outcomes (feature_id, symbol, prediction_timestamp, entry_price, "
        "exit_price_1h, exit_timestamp_1h, return_pct_1h, price_direction_1h, "
        "exit_price_4h, exit_timestamp_4h, return_pct_4h, price_direction_4h, "
        "exit_price_1d, exit_timestamp_1d, return_pct_1d, price_direction_1d, "
        "return_pct, recorded_timestamp, status) "
        "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)");

    int idx = 1;
    stmt.bind_int64(idx++, outcome.feature_id);
    stmt.bind_text(idx++, outcome.symbol);
    stmt.bind_int64(idx++, outcome.feature_timestamp);
    stmt.bind_opt_double(idx++, outcome.entry_price);
    for (const auto& h : outcome.horizons) {
        stmt.bind_opt_double(idx++, h.exit_price);
        stmt.bind_opt_int64(idx++, h.exit_timestamp);
        stmt.bind_opt_double(idx++, h.return_pct);
        if (h.direction) {
            stmt.bind_text(idx++, core::to_string(*h.direction));
        } else {
            stmt.bind_null(idx++);
        }
    }
    stmt.bind_opt_double(idx++, outcome.at(core::kLongestHorizon).return_pct);
    stmt.bind_opt_int64(idx++, outcome.recorded_timestamp);
    stmt.bind_text(idx++, core::to_string(outcome.status));

    if (stmt.step() == StepResult::CONSTRAINT) {
        utils::Logger::warn() << "Outcome for feature " << outcome.feature_id
                              << " already exists, insert rejected" << utils::Logger::endl;
        return std::nullopt;
    }
    return sqlite3_last_insert_rowid(db_);
}

std::optional<core::Outcome> FeatureStore::outcome_for_feature(int64_t feature_id) const {
    Statement stmt(db_, "SELECT " + outcome_columns() + " FROM enhanced_outcomes WHERE feature_id = ?");
    stmt.bind_int64(1, feature_id);
    if (!stmt.next_row()) {
        return std::nullopt;
    }
    return read_outcome(stmt, 0);
}

std::vector<core::Outcome> FeatureStore::pending_outcomes() const {
    Statement stmt(db_, "SELECT " + outcome_columns()
                        + " FROM enhanced_outcomes WHERE status = 'PENDING'"
                          " ORDER BY prediction_timestamp, id");
    std::vector<core::Outcome> outcomes;
    while (stmt.next_row()) {
        outcomes.push_back(read_outcome(stmt, 0));
    }
    return outcomes;
}

int64_t FeatureStore::outcome_count() const {
    return query_int("SELECT COUNT(*) FROM enhanced_outcomes");
}

bool FeatureStore::backfill_entry_price(int64_t outcome_id, double entry_price) {
    Statement stmt(db_, "UPDATE enhanced_outcomes SET entry_price = ?"
                        " WHERE id = ? AND entry_price IS NULL AND status = 'PENDING'");
    stmt.bind_double(1, entry_price);
    stmt.bind_int64(2, outcome_id);
    stmt.run();
    return sqlite3_changes(db_) == 1;
}

bool FeatureStore::backfill_horizon(int64_t outcome_id, core::Horizon horizon,
                                    const core::HorizonOutcome& value) {
    if (!value.exit_price || !value.exit_timestamp || !value.return_pct || !value.direction) {
        throw StoreError("backfill requires exit price, exit timestamp, return and direction");
    }
    const std::string label = core::horizon_label(horizon);
    Statement stmt(db_, "UPDATE enhanced_outcomes SET exit_price_" + label + " = ?, exit_timestamp_"
                        + label + " = ?, return_pct_" + label + " = ?, price_direction_" + label
                        + " = ? WHERE id = ? AND exit_price_" + label
                        + " IS NULL AND status = 'PENDING'");
    stmt.bind_double(1, *value.exit_price);
    stmt.bind_int64(2, *value.exit_timestamp);
    stmt.bind_double(3, *value.return_pct);
    stmt.bind_text(4, core::to_string(*value.direction));
    stmt.bind_int64(5, outcome_id);
    stmt.run();
    return sqlite3_changes(db_) == 1;
}

bool FeatureStore::mark_outcome_complete(int64_t outcome_id, Timestamp recorded_timestamp) {
    Statement stmt(db_, "UPDATE enhanced_outcomes SET status = 'COMPLETE', recorded_timestamp = ?,"
                        " return_pct = return_pct_1d"
                        " WHERE id = ? AND status = 'PENDING' AND entry_price IS NOT NULL"
                        " AND exit_price_1h IS NOT NULL AND exit_price_4h IS NOT NULL"
                        " AND exit_price_1d IS NOT NULL");
    stmt.bind_int64(1, recorded_timestamp);
    stmt.bind_int64(2, outcome_id);
    stmt.run();
    return sqlite3_changes(db_) == 1;
}

std::vector<FeatureOutcomePair> FeatureStore::complete_pairs(Timestamp cutoff) const {
    Statement stmt(db_, "SELECT f.id, " + prefixed(feature_columns(), "f") + ", "
                        + prefixed(outcome_columns(), "o")
                        + " FROM enhanced_features f"
                          " JOIN enhanced_outcomes o ON o.feature_id = f.id"
                          " WHERE o.status = 'COMPLETE' AND o.recorded_timestamp <= ?"
                          " ORDER BY f.timestamp, f.id");
    stmt.bind_int64(1, cutoff);
    std::vector<FeatureOutcomePair> pairs;
    while (stmt.next_row()) {
        FeatureOutcomePair pair;
        pair.feature = read_feature(stmt, 0);
        pair.outcome = read_outcome(stmt, kFeatureColumnCount);
        pairs.push_back(std::move(pair));
    }
    return pairs;
}

std::vector<PredictionOutcomePair> FeatureStore::prediction_outcome_pairs() const {
    Statement stmt(db_, "SELECT " + prefixed(prediction_columns(), "p") + ", "
                        + prefixed(outcome_columns(), "o")
                        + " FROM predictions p"
                          " JOIN enhanced_outcomes o ON o.feature_id = p.feature_id"
                          " WHERE o.status = 'COMPLETE'"
                          " ORDER BY p.created_timestamp, p.id");
    std::vector<PredictionOutcomePair> pairs;
    while (stmt.next_row()) {
        PredictionOutcomePair pair;
        pair.prediction = read_prediction(stmt, 0);
        pair.outcome = read_outcome(stmt, kPredictionColumnCount);
        pairs.push_back(std::move(pair));
    }
    return pairs;
}

// ---- Model versions -------------------------------------------------------

void FeatureStore::insert_model_version(const core::ModelVersion& version) {
    Statement stmt(db_, "INSERT INTO model_performance (model_type, " + model_columns()
                        + ") VALUES ('multi_output_ensemble', ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)");
    int idx = 1;
    stmt.bind_text(idx++, version.version_id);
    stmt.bind_int64(idx++, version.trained_at);
    stmt.bind_int64(idx++, version.training_cutoff);
    stmt.bind_int64(idx++, static_cast<int64_t>(version.random_seed));
    stmt.bind_text(idx++, version.feature_schema_hash);
    for (double accuracy : version.direction_accuracy) {
        stmt.bind_double(idx++, accuracy);
    }
    for (double mae : version.magnitude_mae) {
        stmt.bind_double(idx++, mae);
    }
    stmt.bind_int64(idx++, version.training_sample_count);
    stmt.bind_int64(idx++, version.evaluation_sample_count);
    stmt.bind_text(idx++, core::to_string(version.status));

    if (stmt.step() == StepResult::CONSTRAINT) {
        throw StoreError("model version " + version.version_id + " already recorded");
    }
}

std::optional<core::ModelVersion> FeatureStore::get_model_version(const std::string& version_id) const {
    Statement stmt(db_, "SELECT " + model_columns() + " FROM model_performance WHERE version_id = ?");
    stmt.bind_text(1, version_id);
    if (!stmt.next_row()) {
        return std::nullopt;
    }
    return read_model(stmt, 0);
}

std::vector<core::ModelVersion> FeatureStore::model_history() const {
    Statement stmt(db_, "SELECT " + model_columns() + " FROM model_performance ORDER BY id");
    std::vector<core::ModelVersion> versions;
    while (stmt.next_row()) {
        versions.push_back(read_model(stmt, 0));
    }
    return versions;
}

void FeatureStore::activate_model(const std::string& version_id, Timestamp activated_at) {
    auto version = get_model_version(version_id);
    if (!version) {
        throw StoreError("cannot activate unknown model version " + version_id);
    }
    if (version->status != core::ModelStatus::ACCEPTED) {
        throw StoreError("cannot activate rejected model version " + version_id);
    }
    Statement stmt(db_, "INSERT INTO model_activation (version_id, activated_at) VALUES (?, ?)");
    stmt.bind_text(1, version_id);
    stmt.bind_int64(2, activated_at);
    stmt.run();
}

std::optional<core::ModelVersion> FeatureStore::active_model_version() const {
    Statement stmt(db_, "SELECT version_id FROM model_activation ORDER BY id DESC LIMIT 1");
    if (!stmt.next_row()) {
        return std::nullopt;
    }
    return get_model_version(stmt.column_text(0));
}

// ---- Phase state ----------------------------------------------------------

void FeatureStore::record_phase_completion(const core::PhaseStateRecord& state) {
    Statement stmt(db_, "INSERT INTO phase_state (phase, trade_day, completed_at) VALUES (?, ?, ?)");
    stmt.bind_text(1, core::to_string(state.phase));
    stmt.bind_int64(2, state.trade_day);
    stmt.bind_int64(3, state.completed_at);
    stmt.run();
}

namespace {

std::optional<core::PhaseStateRecord> read_phase(Statement& stmt) {
    if (!stmt.next_row()) {
        return std::nullopt;
    }
    core::PhaseStateRecord state;
    state.phase = core::parse_phase(stmt.column_text(0)).value_or(core::Phase::MORNING);
    state.trade_day = stmt.column_int64(1);
    state.completed_at = stmt.column_int64(2);
    return state;
}

} // namespace

std::optional<core::PhaseStateRecord> FeatureStore::last_completed_phase() const {
    Statement stmt(db_, "SELECT phase, trade_day, completed_at FROM phase_state ORDER BY id DESC LIMIT 1");
    return read_phase(stmt);
}

std::optional<core::PhaseStateRecord> FeatureStore::last_completion_of(core::Phase phase) const {
    Statement stmt(db_, "SELECT phase, trade_day, completed_at FROM phase_state"
                        " WHERE phase = ? ORDER BY id DESC LIMIT 1");
    stmt.bind_text(1, core::to_string(phase));
    return read_phase(stmt);
}

// ---- Run summaries --------------------------------------------------------

void FeatureStore::record_morning_run(const core::MorningSummary& s) {
    Statement stmt(db_,
        "INSERT INTO morning_analysis (run_timestamp, trade_day, symbols_requested, symbols_analyzed, "
        "features_stored, predictions_made, duplicates_rejected, incomplete_signals, leakage_rejected, "
        "degraded_signals, failures, model_version, validation_passed, validation_failed, violations) "
        "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)");
    int idx = 1;
    stmt.bind_int64(idx++, s.run_timestamp);
    stmt.bind_int64(idx++, s.trade_day);
    stmt.bind_int64(idx++, s.symbols_requested);
    stmt.bind_int64(idx++, s.symbols_analyzed);
    stmt.bind_int64(idx++, s.features_stored);
    stmt.bind_int64(idx++, s.predictions_made);
    stmt.bind_int64(idx++, s.duplicates_rejected);
    stmt.bind_int64(idx++, s.incomplete_signals);
    stmt.bind_int64(idx++, s.leakage_rejected);
    stmt.bind_int64(idx++, s.degraded_signals);
    stmt.bind_int64(idx++, s.failures);
    stmt.bind_text(idx++, s.model_version);
    stmt.bind_int64(idx++, static_cast<int64_t>(s.validation.checks_run.size())
                           - static_cast<int64_t>(s.validation.violations.size()));
    stmt.bind_int64(idx++, static_cast<int64_t>(s.validation.violations.size()));
    stmt.bind_text(idx++, s.validation.to_string());
    stmt.run();
}

void FeatureStore::record_evening_run(const core::EveningSummary& s) {
    Statement stmt(db_,
        "INSERT INTO evening_analysis (run_timestamp, trade_day, outcomes_recorded, outcomes_pending, "
        "outcomes_completed, backfills_applied, backfills_rejected, failures, validation_passed, "
        "validation_failed, violations, training_skipped, training_skip_reason, training_samples, "
        "candidate_version, model_promoted, active_version, backtest_trades, backtest_win_rate, "
        "backtest_avg_return, backtest_sharpe, backtest_max_drawdown, anomalies) "
        "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)");

    core::ViolationReport all = s.validation;
    all.merge(s.post_commit_validation);

    std::ostringstream anomalies;
    for (size_t i = 0; i < s.anomalies.size(); ++i) {
        anomalies << (i ? "; " : "") << s.anomalies[i];
    }

    int idx = 1;
    stmt.bind_int64(idx++, s.run_timestamp);
    stmt.bind_int64(idx++, s.trade_day);
    stmt.bind_int64(idx++, s.outcomes_recorded);
    stmt.bind_int64(idx++, s.outcomes_pending);
    stmt.bind_int64(idx++, s.outcomes_completed);
    stmt.bind_int64(idx++, s.backfills_applied);
    stmt.bind_int64(idx++, s.backfills_rejected);
    stmt.bind_int64(idx++, s.failures);
    stmt.bind_int64(idx++, static_cast<int64_t>(all.checks_run.size())
                           - static_cast<int64_t>(all.violations.size()));
    stmt.bind_int64(idx++, static_cast<int64_t>(all.violations.size()));
    stmt.bind_text(idx++, all.to_string());
    stmt.bind_int64(idx++, s.training_skipped ? 1 : 0);
    stmt.bind_text(idx++, s.training_skip_reason);
    stmt.bind_int64(idx++, s.training_samples);
    stmt.bind_text(idx++, s.candidate_version);
    stmt.bind_int64(idx++, s.model_promoted ? 1 : 0);
    stmt.bind_text(idx++, s.active_version);
    stmt.bind_int64(idx++, s.backtest_trades);
    stmt.bind_double(idx++, s.backtest_win_rate);
    stmt.bind_double(idx++, s.backtest_avg_return);
    stmt.bind_double(idx++, s.backtest_sharpe);
    stmt.bind_double(idx++, s.backtest_max_drawdown);
    stmt.bind_text(idx++, anomalies.str());
    stmt.run();
}

// ---- Integrity queries ----------------------------------------------------

int64_t FeatureStore::duplicate_prediction_rows() const {
    return query_int("SELECT COALESCE(SUM(n), 0) FROM (SELECT COUNT(*) AS n FROM predictions"
                     " GROUP BY symbol, trade_day HAVING COUNT(*) > 1)");
}

int64_t FeatureStore::features_missing_outcome(Timestamp cutoff) const {
    Statement stmt(db_, "SELECT COUNT(*) FROM enhanced_features f"
                        " LEFT JOIN enhanced_outcomes o ON o.feature_id = f.id"
                        " WHERE o.id IS NULL AND f.timestamp + ? <= ?");
    stmt.bind_int64(1, core::horizon_seconds(core::kShortestHorizon));
    stmt.bind_int64(2, cutoff);
    return stmt.next_row() ? stmt.column_int64(0) : 0;
}

int64_t FeatureStore::outcomes_without_feature() const {
    return query_int("SELECT COUNT(*) FROM enhanced_outcomes o"
                     " LEFT JOIN enhanced_features f ON f.id = o.feature_id WHERE f.id IS NULL");
}

int64_t FeatureStore::features_with_multiple_outcomes() const {
    return query_int("SELECT COUNT(*) FROM (SELECT feature_id FROM enhanced_outcomes"
                     " GROUP BY feature_id HAVING COUNT(*) > 1)");
}

int64_t FeatureStore::features_with_future_signals() const {
    return query_int("SELECT COUNT(*) FROM enhanced_features"
                     " WHERE sentiment_timestamp > timestamp OR technical_timestamp > timestamp"
                     " OR context_timestamp > timestamp");
}

int64_t FeatureStore::predictions_with_shifted_timestamp() const {
    return query_int("SELECT COUNT(*) FROM predictions p"
                     " JOIN enhanced_features f ON f.id = p.feature_id"
                     " WHERE p.created_timestamp != f.timestamp");
}

int64_t FeatureStore::predictions_without_feature() const {
    return query_int("SELECT COUNT(*) FROM predictions p"
                     " LEFT JOIN enhanced_features f ON f.id = p.feature_id WHERE f.id IS NULL");
}

int64_t FeatureStore::outcomes_exited_before_horizon() const {
    std::ostringstream sql;
    sql << "SELECT COUNT(*) FROM enhanced_outcomes o JOIN enhanced_features f ON f.id = o.feature_id"
        << " WHERE o.prediction_timestamp != f.timestamp";
    for (core::Horizon h : core::kAllHorizons) {
        const std::string label = core::horizon_label(h);
        sql << " OR (o.exit_timestamp_" << label << " IS NOT NULL AND o.exit_timestamp_" << label
            << " < f.timestamp + " << core::horizon_seconds(h) << ")";
    }
    sql << " OR (o.recorded_timestamp IS NOT NULL AND o.recorded_timestamp < f.timestamp + "
        << core::horizon_seconds(core::kLongestHorizon) << ")";
    return query_int(sql.str());
}

std::vector<std::string> FeatureStore::missing_columns(const std::string& table,
                                                       const std::vector<std::string>& columns) const {
    std::set<std::string> present;
    Statement stmt(db_, "PRAGMA table_info(" + table + ")");
    while (stmt.next_row()) {
        present.insert(stmt.column_text(1));
    }

    std::vector<std::string> missing;
    for (const auto& column : columns) {
        if (!present.count(column)) {
            missing.push_back(column);
        }
    }
    return missing;
}

bool FeatureStore::has_unique_index(const std::string& table,
                                    const std::vector<std::string>& columns) const {
    const std::set<std::string> wanted(columns.begin(), columns.end());

    std::vector<std::string> unique_indexes;
    {
        Statement list(db_, "PRAGMA index_list(" + table + ")");
        while (list.next_row()) {
            if (list.column_int64(2) == 1) {
                unique_indexes.push_back(list.column_text(1));
            }
        }
    }

    for (const auto& index : unique_indexes) {
        std::set<std::string> indexed;
        Statement info(db_, "PRAGMA index_info(" + index + ")");
        while (info.next_row()) {
            indexed.insert(info.column_text(2));
        }
        if (indexed == wanted) {
            return true;
        }
    }
    return false;
}

} // namespace augur::store
