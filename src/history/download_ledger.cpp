#include "download_ledger.h"
#include "../common/logger.h"
#include "../common/path_utils.h"
#include <ctime>
#include <sqlite3.h>

namespace {

const char* const CREATE_SQL =
    "CREATE TABLE IF NOT EXISTS downloads ("
    "  video_id TEXT PRIMARY KEY,"
    "  playlist_id TEXT,"
    "  downloaded_at TIMESTAMP,"
    "  filepath TEXT"
    ");";

// Busy writers on other connections are waited for, not failed
const int BUSY_TIMEOUT_MS = 5000;

// Owns a connection for the duration of one insert
class Connection {
public:
    Connection() : db_(nullptr) {}
    ~Connection() {
        if (db_) sqlite3_close(db_);
    }
    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    sqlite3*& handle() { return db_; }
    sqlite3* get() const { return db_; }

private:
    sqlite3* db_;
};

bool openDatabase(const std::string& db_path, sqlite3*& db) {
    std::string parent = PathUtils::getDirectory(db_path);
    if (!PathUtils::createDirectories(parent)) {
        LOG_ERROR("DownloadLedger", "Cannot create database directory " << parent);
        return false;
    }

    int rc = sqlite3_open(db_path.c_str(), &db);
    if (rc != SQLITE_OK) {
        LOG_ERROR("DownloadLedger", "Failed to open database " << db_path << ": "
                  << (db ? sqlite3_errmsg(db) : "out of memory"));
        return false;
    }
    sqlite3_busy_timeout(db, BUSY_TIMEOUT_MS);

    char* err_msg = nullptr;
    rc = sqlite3_exec(db, "PRAGMA journal_mode=WAL;", nullptr, nullptr, &err_msg);
    if (rc != SQLITE_OK) {
        LOG_WARN("DownloadLedger", "Cannot enable WAL: " << (err_msg ? err_msg : "unknown error"));
        sqlite3_free(err_msg);
        err_msg = nullptr;
    }

    rc = sqlite3_exec(db, CREATE_SQL, nullptr, nullptr, &err_msg);
    if (rc != SQLITE_OK) {
        LOG_ERROR("DownloadLedger", "Failed to create table: " << (err_msg ? err_msg : "unknown error"));
        sqlite3_free(err_msg);
        return false;
    }
    return true;
}

std::string columnText(sqlite3_stmt* stmt, int column) {
    const unsigned char* text = sqlite3_column_text(stmt, column);
    return text ? reinterpret_cast<const char*>(text) : "";
}

} // namespace

DownloadLedger::DownloadLedger(const std::string& db_path)
    : db_path_(db_path)
    , db_(nullptr) {
}

DownloadLedger::~DownloadLedger() {
    close();
}

bool DownloadLedger::open() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (db_) return true;

    if (!openDatabase(db_path_, db_)) {
        if (db_) {
            sqlite3_close(db_);
            db_ = nullptr;
        }
        return false;
    }
    LOG_DEBUG("DownloadLedger", "Opened " << db_path_);
    return true;
}

void DownloadLedger::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

bool DownloadLedger::contains(const std::string& video_id) {
    DownloadRecord record;
    return getRecord(video_id, record);
}

bool DownloadLedger::getRecord(const std::string& video_id, DownloadRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) return false;

    const char* select_sql =
        "SELECT video_id, playlist_id, downloaded_at, filepath FROM downloads WHERE video_id = ?;";

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, select_sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        LOG_ERROR("DownloadLedger", "Failed to query downloads: " << sqlite3_errmsg(db_));
        return false;
    }

    sqlite3_bind_text(stmt, 1, video_id.c_str(), -1, SQLITE_TRANSIENT);

    bool found = false;
    rc = sqlite3_step(stmt);
    if (rc == SQLITE_ROW) {
        record.video_id = columnText(stmt, 0);
        record.playlist_id = columnText(stmt, 1);
        record.downloaded_at = columnText(stmt, 2);
        record.filepath = columnText(stmt, 3);
        found = true;
    } else if (rc != SQLITE_DONE) {
        LOG_ERROR("DownloadLedger", "Lookup of " << video_id << " failed: " << sqlite3_errmsg(db_));
    }

    sqlite3_finalize(stmt);
    return found;
}

size_t DownloadLedger::count() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) return 0;

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, "SELECT COUNT(*) FROM downloads;", -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR("DownloadLedger", "Failed to count downloads: " << sqlite3_errmsg(db_));
        return 0;
    }

    size_t rows = 0;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        rows = static_cast<size_t>(sqlite3_column_int64(stmt, 0));
    }
    sqlite3_finalize(stmt);
    return rows;
}

bool DownloadLedger::insertRecord(const std::string& db_path, const DownloadRecord& record) {
    Connection connection;
    if (!openDatabase(db_path, connection.handle())) {
        return false;
    }

    const char* insert_sql =
        "INSERT INTO downloads (video_id, playlist_id, downloaded_at, filepath) VALUES (?, ?, ?, ?);";

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(connection.get(), insert_sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        LOG_ERROR("DownloadLedger", "Failed to prepare insert: " << sqlite3_errmsg(connection.get()));
        return false;
    }

    std::string downloaded_at = record.downloaded_at.empty() ? currentTimestamp() : record.downloaded_at;
    sqlite3_bind_text(stmt, 1, record.video_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, record.playlist_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 3, downloaded_at.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 4, record.filepath.c_str(), -1, SQLITE_TRANSIENT);

    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        LOG_ERROR("DownloadLedger", "Failed to record " << record.video_id << ": "
                  << sqlite3_errmsg(connection.get()));
        return false;
    }
    return true;
}

std::string DownloadLedger::currentTimestamp() {
    std::time_t now = std::time(nullptr);
    std::tm utc_tm;
    gmtime_r(&now, &utc_tm);
    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%d %H:%M:%S", &utc_tm);
    return buffer;
}
