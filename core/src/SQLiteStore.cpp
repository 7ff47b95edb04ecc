#include "actiscope/SQLiteStore.h"

#include <sstream>
#include <utility>
#include <string>

#include "actiscope/CoreContract.h"
#include "actiscope/Errors.h"
#include "actiscope/Utility.h"

namespace actiscope {

namespace {

void exec_or_throw(sqlite3* db, const std::string& sql) {
    char* err = nullptr;
    if (sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err) != SQLITE_OK) {
        std::string message = err ? err : "Unknown sqlite error";
        sqlite3_free(err);
        throw StorageError(message);
    }
}

sqlite3_stmt* prepare_or_throw(sqlite3* db, const std::string& sql) {
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        throw StorageError(sqlite3_errmsg(db));
    }
    return stmt;
}

// Finalizes the statement on scope exit so a throwing step does not leak it.
class Statement {
  public:
    Statement(sqlite3* db, const std::string& sql) : db_(db), stmt_(prepare_or_throw(db, sql)) {}
    ~Statement() { sqlite3_finalize(stmt_); }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    sqlite3_stmt* get() const { return stmt_; }

    void step_done() {
        if (sqlite3_step(stmt_) != SQLITE_DONE) {
            throw StorageError(sqlite3_errmsg(db_));
        }
        sqlite3_reset(stmt_);
    }

  private:
    sqlite3* db_;
    sqlite3_stmt* stmt_;
};

std::string join_map(const std::map<std::string, std::string>& values) {
    std::string out;
    for (const auto& [key, value] : values) {
        if (!out.empty()) out += ";";
        out += key + "=" + value;
    }
    return out;
}

std::string join_indices(const std::vector<std::size_t>& indices) {
    std::string out;
    for (std::size_t i = 0; i < indices.size(); ++i) {
        if (i > 0) out += ",";
        out += std::to_string(indices[i]);
    }
    return out;
}

std::vector<std::size_t> split_indices(const std::string& text) {
    std::vector<std::size_t> out;
    std::stringstream ss(text);
    std::string item;
    while (std::getline(ss, item, ',')) {
        if (!item.empty()) out.push_back(static_cast<std::size_t>(std::stoull(item)));
    }
    return out;
}

std::string column_string(sqlite3_stmt* stmt, int col) {
    const unsigned char* text = sqlite3_column_text(stmt, col);
    return text ? reinterpret_cast<const char*>(text) : "";
}

void delete_children(sqlite3* db, const char* table, std::int64_t recognitionId) {
    Statement stmt(db, std::string("DELETE FROM ") + table + " WHERE recognition_id=?;");
    sqlite3_bind_int64(stmt.get(), 1, recognitionId);
    stmt.step_done();
}

}  // namespace

SQLiteStore::SQLiteStore(const std::string& path) {
    if (sqlite3_open(path.c_str(), &db_) != SQLITE_OK) {
        std::string message = "Failed to open SQLite database at " + path;
        if (db_) {
            message += ": ";
            message += sqlite3_errmsg(db_);
            sqlite3_close(db_);
            db_ = nullptr;
        }
        throw StorageError(message);
    }
}

SQLiteStore::~SQLiteStore() {
    if (db_) {
        sqlite3_close(db_);
    }
}

void SQLiteStore::initialize() {
    const char* schema = R"SQL(
        PRAGMA journal_mode=WAL;

        CREATE TABLE IF NOT EXISTS recognitions (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            user_id TEXT NOT NULL,
            batch_id TEXT NOT NULL,
            data_type TEXT,
            device_info TEXT,
            sampling_rate_hz INTEGER,
            start_time REAL,
            sample_count INTEGER,
            status TEXT NOT NULL,
            dominant_activity TEXT NOT NULL,
            contract_version TEXT NOT NULL,
            created_at TEXT DEFAULT CURRENT_TIMESTAMP,
            updated_at TEXT DEFAULT CURRENT_TIMESTAMP,
            UNIQUE(user_id, batch_id)
        );

        CREATE INDEX IF NOT EXISTS idx_recognitions_user ON recognitions(user_id);
        CREATE INDEX IF NOT EXISTS idx_recognitions_updated ON recognitions(updated_at);

        CREATE TABLE IF NOT EXISTS overall_metrics (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            recognition_id INTEGER NOT NULL,
            avg_intensity REAL NOT NULL,
            peak_intensity REAL NOT NULL,
            movement_consistency REAL NOT NULL,
            active_minutes REAL NOT NULL,
            total_duration REAL NOT NULL,
            FOREIGN KEY(recognition_id) REFERENCES recognitions(id) ON DELETE CASCADE
        );

        CREATE TABLE IF NOT EXISTS activity_segments (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            recognition_id INTEGER NOT NULL,
            segment_number INTEGER NOT NULL,
            start_sec REAL NOT NULL,
            end_sec REAL NOT NULL,
            activity_type TEXT NOT NULL,
            confidence REAL NOT NULL,
            avg_intensity REAL NOT NULL,
            peak_intensity REAL NOT NULL,
            movement_consistency REAL NOT NULL,
            active_minutes REAL NOT NULL,
            total_duration REAL NOT NULL,
            FOREIGN KEY(recognition_id) REFERENCES recognitions(id) ON DELETE CASCADE
        );

        CREATE INDEX IF NOT EXISTS idx_segments_recognition ON activity_segments(recognition_id);

        CREATE TABLE IF NOT EXISTS activity_patterns (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            recognition_id INTEGER NOT NULL,
            pattern_number INTEGER NOT NULL,
            pattern_type TEXT NOT NULL,
            description TEXT,
            total_duration_min REAL NOT NULL,
            segment_indices TEXT NOT NULL,
            FOREIGN KEY(recognition_id) REFERENCES recognitions(id) ON DELETE CASCADE
        );

        CREATE INDEX IF NOT EXISTS idx_patterns_recognition ON activity_patterns(recognition_id);
    )SQL";

    exec_or_throw(db_, schema);
}

std::int64_t SQLiteStore::save_recognition(const RecognitionRequest& request, const RecognitionResult& result) {
    const AccelerationBatch& batch = request.batch;
    const std::string batchId = batch.id.value_or("");

    exec_or_throw(db_, "BEGIN TRANSACTION;");
    try {
        std::int64_t recognition_id = -1;
        {
            Statement stmt(db_,
                "INSERT INTO recognitions (user_id, batch_id, data_type, device_info, sampling_rate_hz, start_time, "
                "sample_count, status, dominant_activity, contract_version, updated_at) "
                "VALUES (?,?,?,?,?,?,?,?,?,?, CURRENT_TIMESTAMP) "
                "ON CONFLICT(user_id, batch_id) DO UPDATE SET "
                "data_type=excluded.data_type, device_info=excluded.device_info, "
                "sampling_rate_hz=excluded.sampling_rate_hz, start_time=excluded.start_time, "
                "sample_count=excluded.sample_count, status=excluded.status, "
                "dominant_activity=excluded.dominant_activity, contract_version=excluded.contract_version, "
                "updated_at=CURRENT_TIMESTAMP "
                "RETURNING id;");

            const std::string deviceInfo = join_map(batch.deviceInfo);
            const std::string dominant = activity_type_to_string(result.dominantActivity);

            sqlite3_bind_text(stmt.get(), 1, request.userId.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_text(stmt.get(), 2, batchId.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_text(stmt.get(), 3, batch.dataType.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_text(stmt.get(), 4, deviceInfo.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_int(stmt.get(), 5, batch.samplingRateHz);
            sqlite3_bind_double(stmt.get(), 6, batch.startTime);
            sqlite3_bind_int64(stmt.get(), 7, static_cast<sqlite3_int64>(batch.samples.size()));
            sqlite3_bind_text(stmt.get(), 8, result.status.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_text(stmt.get(), 9, dominant.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_text(stmt.get(), 10, contract::CORE_CONTRACT_VERSION, -1, SQLITE_TRANSIENT);

            if (sqlite3_step(stmt.get()) == SQLITE_ROW) {
                recognition_id = sqlite3_column_int64(stmt.get(), 0);
            }
        }

        if (recognition_id < 0) {
            throw StorageError("Failed to insert/get recognition id");
        }

        delete_children(db_, "overall_metrics", recognition_id);
        delete_children(db_, "activity_segments", recognition_id);
        delete_children(db_, "activity_patterns", recognition_id);

        if (result.overallMetrics) {
            const ActivityMetrics& m = *result.overallMetrics;
            Statement stmt(db_,
                "INSERT INTO overall_metrics (recognition_id, avg_intensity, peak_intensity, movement_consistency, "
                "active_minutes, total_duration) VALUES (?,?,?,?,?,?);");
            sqlite3_bind_int64(stmt.get(), 1, recognition_id);
            sqlite3_bind_double(stmt.get(), 2, m.avgIntensity);
            sqlite3_bind_double(stmt.get(), 3, m.peakIntensity);
            sqlite3_bind_double(stmt.get(), 4, m.movementConsistency);
            sqlite3_bind_double(stmt.get(), 5, m.activeMinutes);
            sqlite3_bind_double(stmt.get(), 6, m.totalDuration);
            stmt.step_done();
        }

        {
            Statement stmt(db_,
                "INSERT INTO activity_segments (recognition_id, segment_number, start_sec, end_sec, activity_type, "
                "confidence, avg_intensity, peak_intensity, movement_consistency, active_minutes, total_duration) "
                "VALUES (?,?,?,?,?,?,?,?,?,?,?);");

            int segment_num = 0;
            for (const auto& seg : result.segments) {
                const std::string type = activity_type_to_string(seg.type);
                sqlite3_bind_int64(stmt.get(), 1, recognition_id);
                sqlite3_bind_int(stmt.get(), 2, segment_num++);
                sqlite3_bind_double(stmt.get(), 3, seg.startTime);
                sqlite3_bind_double(stmt.get(), 4, seg.endTime);
                sqlite3_bind_text(stmt.get(), 5, type.c_str(), -1, SQLITE_TRANSIENT);
                sqlite3_bind_double(stmt.get(), 6, seg.confidence);
                sqlite3_bind_double(stmt.get(), 7, seg.metrics.avgIntensity);
                sqlite3_bind_double(stmt.get(), 8, seg.metrics.peakIntensity);
                sqlite3_bind_double(stmt.get(), 9, seg.metrics.movementConsistency);
                sqlite3_bind_double(stmt.get(), 10, seg.metrics.activeMinutes);
                sqlite3_bind_double(stmt.get(), 11, seg.metrics.totalDuration);
                stmt.step_done();
            }
        }

        {
            Statement stmt(db_,
                "INSERT INTO activity_patterns (recognition_id, pattern_number, pattern_type, description, "
                "total_duration_min, segment_indices) VALUES (?,?,?,?,?,?);");

            int pattern_num = 0;
            for (const auto& pattern : result.patterns) {
                // Members stored as comma-separated segment numbers
                const std::string indices = join_indices(pattern.segmentIndices);
                sqlite3_bind_int64(stmt.get(), 1, recognition_id);
                sqlite3_bind_int(stmt.get(), 2, pattern_num++);
                sqlite3_bind_text(stmt.get(), 3, pattern.patternType.c_str(), -1, SQLITE_TRANSIENT);
                sqlite3_bind_text(stmt.get(), 4, pattern.description.c_str(), -1, SQLITE_TRANSIENT);
                sqlite3_bind_double(stmt.get(), 5, pattern.totalDuration);
                sqlite3_bind_text(stmt.get(), 6, indices.c_str(), -1, SQLITE_TRANSIENT);
                stmt.step_done();
            }
        }

        exec_or_throw(db_, "COMMIT;");
        return recognition_id;
    } catch (...) {
        exec_or_throw(db_, "ROLLBACK;");
        throw;
    }
}

std::vector<ActivitySegment> SQLiteStore::load_segments(const std::string& userId, const std::string& batchId) const {
    Statement stmt(db_,
        "SELECT s.start_sec, s.end_sec, s.activity_type, s.confidence, s.avg_intensity, s.peak_intensity, "
        "s.movement_consistency, s.active_minutes, s.total_duration "
        "FROM activity_segments s JOIN recognitions r ON r.id = s.recognition_id "
        "WHERE r.user_id=? AND r.batch_id=? ORDER BY s.segment_number;");
    sqlite3_bind_text(stmt.get(), 1, userId.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt.get(), 2, batchId.c_str(), -1, SQLITE_TRANSIENT);

    std::vector<ActivitySegment> segments;
    int rc = SQLITE_ROW;
    while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
        ActivitySegment seg;
        seg.startTime = sqlite3_column_double(stmt.get(), 0);
        seg.endTime = sqlite3_column_double(stmt.get(), 1);
        seg.type = activity_type_from_string(column_string(stmt.get(), 2));
        seg.confidence = sqlite3_column_double(stmt.get(), 3);
        seg.metrics.avgIntensity = sqlite3_column_double(stmt.get(), 4);
        seg.metrics.peakIntensity = sqlite3_column_double(stmt.get(), 5);
        seg.metrics.movementConsistency = sqlite3_column_double(stmt.get(), 6);
        seg.metrics.activeMinutes = sqlite3_column_double(stmt.get(), 7);
        seg.metrics.totalDuration = sqlite3_column_double(stmt.get(), 8);
        segments.push_back(seg);
    }
    if (rc != SQLITE_DONE) {
        throw StorageError(sqlite3_errmsg(db_));
    }
    return segments;
}

std::vector<ActivityPattern> SQLiteStore::load_patterns(const std::string& userId, const std::string& batchId) const {
    Statement stmt(db_,
        "SELECT p.pattern_type, p.description, p.total_duration_min, p.segment_indices "
        "FROM activity_patterns p JOIN recognitions r ON r.id = p.recognition_id "
        "WHERE r.user_id=? AND r.batch_id=? ORDER BY p.pattern_number;");
    sqlite3_bind_text(stmt.get(), 1, userId.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt.get(), 2, batchId.c_str(), -1, SQLITE_TRANSIENT);

    std::vector<ActivityPattern> patterns;
    int rc = SQLITE_ROW;
    while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
        ActivityPattern p;
        p.patternType = column_string(stmt.get(), 0);
        p.description = column_string(stmt.get(), 1);
        p.totalDuration = sqlite3_column_double(stmt.get(), 2);
        p.segmentIndices = split_indices(column_string(stmt.get(), 3));
        patterns.push_back(std::move(p));
    }
    if (rc != SQLITE_DONE) {
        throw StorageError(sqlite3_errmsg(db_));
    }
    return patterns;
}

}  // namespace actiscope
