// ==============================================================================
// database.cpp - SQLite хранилище дел
// ==============================================================================

#include "evidex/database.hpp"

#include "evidex/platform.hpp"

#include <chrono>
#include <sqlite3.h>
#include <thread>

namespace evidex::store {

namespace {

constexpr const char* SCHEMA_SQL = R"SQL(
CREATE TABLE IF NOT EXISTS cases (
    case_id INTEGER PRIMARY KEY AUTOINCREMENT,
    case_number TEXT UNIQUE NOT NULL,
    case_name TEXT NOT NULL,
    investigator_name TEXT,
    agency_name TEXT,
    incident_date TEXT,
    created_date TEXT DEFAULT CURRENT_TIMESTAMP,
    last_modified TEXT DEFAULT CURRENT_TIMESTAMP,
    status TEXT DEFAULT 'open',
    notes TEXT,
    evidence_source_path TEXT,
    total_files INTEGER DEFAULT 0,
    total_flagged INTEGER DEFAULT 0
);

CREATE TABLE IF NOT EXISTS evidence_files (
    file_id INTEGER PRIMARY KEY AUTOINCREMENT,
    case_id INTEGER NOT NULL,
    file_path TEXT NOT NULL,
    file_relative_path TEXT,
    file_name TEXT NOT NULL,
    file_type TEXT NOT NULL,
    file_size INTEGER,
    file_hash TEXT,
    source_archive TEXT,
    date_created TEXT,
    date_modified TEXT,
    date_accessed TEXT,
    date_taken TEXT,
    gps_latitude REAL,
    gps_longitude REAL,
    gps_altitude REAL,
    location_name TEXT,
    camera_make TEXT,
    camera_model TEXT,
    ai_processed INTEGER DEFAULT 0,
    ai_tags TEXT,
    ai_confidence REAL,
    ocr_text TEXT,
    face_count INTEGER DEFAULT 0,
    is_flagged INTEGER DEFAULT 0,
    flag_reason TEXT,
    analyst_notes TEXT,
    imported_date TEXT DEFAULT CURRENT_TIMESTAMP,
    analyzed_date TEXT,
    FOREIGN KEY (case_id) REFERENCES cases(case_id) ON DELETE CASCADE
);

CREATE TABLE IF NOT EXISTS audit_log (
    log_id INTEGER PRIMARY KEY AUTOINCREMENT,
    case_id INTEGER,
    user_name TEXT,
    action TEXT NOT NULL,
    details TEXT,
    timestamp TEXT DEFAULT CURRENT_TIMESTAMP,
    FOREIGN KEY (case_id) REFERENCES cases(case_id) ON DELETE SET NULL
);

CREATE TABLE IF NOT EXISTS settings (
    setting_key TEXT PRIMARY KEY,
    setting_value TEXT,
    last_updated TEXT DEFAULT CURRENT_TIMESTAMP
);

CREATE INDEX IF NOT EXISTS idx_evidence_case ON evidence_files(case_id);
CREATE INDEX IF NOT EXISTS idx_evidence_date ON evidence_files(date_taken);
CREATE INDEX IF NOT EXISTS idx_evidence_flagged ON evidence_files(is_flagged);
CREATE INDEX IF NOT EXISTS idx_audit_case ON audit_log(case_id);
CREATE INDEX IF NOT EXISTS idx_audit_timestamp ON audit_log(timestamp);
)SQL";

/// ROLLBACK, если транзакция открыта. false - соединение в неизвестном
/// состоянии и не должно возвращаться в пул.
bool rollback(Connection& conn) {
    if (sqlite3_get_autocommit(conn.handle()) != 0) {
        return true;
    }
    return sqlite3_exec(conn.handle(), "ROLLBACK", nullptr, nullptr, nullptr) == SQLITE_OK;
}

}  // namespace

// ----------------------------------------------------------------------------
// SqliteError
// ----------------------------------------------------------------------------

bool SqliteError::is_busy() const noexcept {
    return primary_code() == SQLITE_BUSY || primary_code() == SQLITE_LOCKED;
}

bool SqliteError::is_unique_violation() const noexcept {
    return code_ == SQLITE_CONSTRAINT_UNIQUE || code_ == SQLITE_CONSTRAINT_PRIMARYKEY;
}

bool SqliteError::is_foreign_key_violation() const noexcept {
    return code_ == SQLITE_CONSTRAINT_FOREIGNKEY;
}

// ----------------------------------------------------------------------------
// Connection
// ----------------------------------------------------------------------------

Connection::Connection(const std::filesystem::path& path, int busy_timeout_ms) {
    std::string u8 = platform::path_to_utf8(path);
    int rc = sqlite3_open_v2(u8.c_str(), &db_,
                             SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
                             nullptr);
    if (rc != SQLITE_OK) {
        std::string msg = db_ != nullptr ? sqlite3_errmsg(db_) : sqlite3_errstr(rc);
        sqlite3_close(db_);
        db_ = nullptr;
        throw SqliteError(rc, "failed to open database '" + u8 + "' - " + msg);
    }

    sqlite3_extended_result_codes(db_, 1);
    sqlite3_busy_timeout(db_, busy_timeout_ms);

    try {
        exec("PRAGMA journal_mode=WAL;");
        exec("PRAGMA synchronous=NORMAL;");
        exec("PRAGMA foreign_keys=ON;");
    } catch (...) {
        sqlite3_close(db_);
        db_ = nullptr;
        throw;
    }
}

Connection::~Connection() {
    if (db_ != nullptr) {
        sqlite3_close_v2(db_);
    }
}

void Connection::exec(std::string_view sql) {
    std::string text(sql);
    char* err = nullptr;
    int rc = sqlite3_exec(db_, text.c_str(), nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        std::string msg = err != nullptr ? err : sqlite3_errstr(rc);
        sqlite3_free(err);
        throw SqliteError(sqlite3_extended_errcode(db_), "SQLite exec failed - " + msg);
    }
}

std::int64_t Connection::last_insert_rowid() const {
    return sqlite3_last_insert_rowid(db_);
}

int Connection::changes() const {
    return sqlite3_changes(db_);
}

void Connection::check(int rc, std::string_view context) const {
    if (rc == SQLITE_OK || rc == SQLITE_ROW || rc == SQLITE_DONE) {
        return;
    }
    throw SqliteError(sqlite3_extended_errcode(db_),
                      std::string(context) + " - " + sqlite3_errmsg(db_));
}

// ----------------------------------------------------------------------------
// Statement
// ----------------------------------------------------------------------------

Statement::Statement(Connection& conn, std::string_view sql) : conn_(conn) {
    int rc = sqlite3_prepare_v2(conn.handle(), sql.data(), static_cast<int>(sql.size()), &stmt_,
                                nullptr);
    conn_.check(rc, "prepare failed");
}

Statement::~Statement() {
    sqlite3_finalize(stmt_);
}

Statement& Statement::bind_int64(int index, std::int64_t value) {
    conn_.check(sqlite3_bind_int64(stmt_, index, value), "bind failed");
    return *this;
}

Statement& Statement::bind_double(int index, double value) {
    conn_.check(sqlite3_bind_double(stmt_, index, value), "bind failed");
    return *this;
}

Statement& Statement::bind_text(int index, std::string_view value) {
    conn_.check(sqlite3_bind_text(stmt_, index, value.data(), static_cast<int>(value.size()),
                                  SQLITE_TRANSIENT),
                "bind failed");
    return *this;
}

Statement& Statement::bind_null(int index) {
    conn_.check(sqlite3_bind_null(stmt_, index), "bind failed");
    return *this;
}

Statement& Statement::bind_optional_text(int index, const std::optional<std::string>& value) {
    return value ? bind_text(index, *value) : bind_null(index);
}

Statement& Statement::bind_optional_double(int index, const std::optional<double>& value) {
    return value ? bind_double(index, *value) : bind_null(index);
}

bool Statement::step() {
    int rc = sqlite3_step(stmt_);
    if (rc == SQLITE_ROW) {
        return true;
    }
    if (rc == SQLITE_DONE) {
        return false;
    }
    conn_.check(rc, "step failed");
    return false;
}

void Statement::run() {
    while (step()) {
    }
}

void Statement::reset() {
    sqlite3_reset(stmt_);
}

bool Statement::column_is_null(int index) const {
    return sqlite3_column_type(stmt_, index) == SQLITE_NULL;
}

std::int64_t Statement::column_int64(int index) const {
    return sqlite3_column_int64(stmt_, index);
}

double Statement::column_double(int index) const {
    return sqlite3_column_double(stmt_, index);
}

std::string Statement::column_text(int index) const {
    const unsigned char* text = sqlite3_column_text(stmt_, index);
    if (text == nullptr) {
        return {};
    }
    return std::string(reinterpret_cast<const char*>(text),
                       static_cast<std::size_t>(sqlite3_column_bytes(stmt_, index)));
}

std::optional<std::string> Statement::column_optional_text(int index) const {
    if (column_is_null(index)) {
        return std::nullopt;
    }
    return column_text(index);
}

std::optional<double> Statement::column_optional_double(int index) const {
    if (column_is_null(index)) {
        return std::nullopt;
    }
    return column_double(index);
}

// ----------------------------------------------------------------------------
// Database
// ----------------------------------------------------------------------------

/// Соединение, взятое из пула на время одной операции
class Database::Lease {
public:
    explicit Lease(Database& db) : db_(db), conn_(db.acquire()) {}
    ~Lease() {
        if (conn_) {
            db_.release(std::move(conn_));
        }
    }

    Lease(const Lease&) = delete;
    Lease& operator=(const Lease&) = delete;

    Connection& operator*() { return *conn_; }

    /// Закрыть соединение вместо возврата в пул
    void discard() {
        conn_.reset();
        std::lock_guard<std::mutex> lock(db_.mutex_);
        --db_.open_count_;
    }

private:
    Database& db_;
    std::unique_ptr<Connection> conn_;
};

Database::Database(DatabaseOptions options) : options_(std::move(options)) {
    if (options_.path.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(options_.path.parent_path(), ec);
        if (ec) {
            throw Error(ErrorKind::Io, "failed to create database directory '" +
                                           platform::path_to_utf8(options_.path.parent_path()) +
                                           "' - " + ec.message());
        }
    }

    auto conn = acquire();
    apply_schema(*conn);
    release(std::move(conn));
}

Database::~Database() = default;

std::unique_ptr<Connection> Database::acquire() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!idle_.empty()) {
            auto conn = std::move(idle_.back());
            idle_.pop_back();
            return conn;
        }
        ++open_count_;
    }

    try {
        return std::make_unique<Connection>(options_.path, options_.busy_timeout_ms);
    } catch (...) {
        std::lock_guard<std::mutex> lock(mutex_);
        --open_count_;
        throw;
    }
}

void Database::release(std::unique_ptr<Connection> conn) {
    std::lock_guard<std::mutex> lock(mutex_);
    idle_.push_back(std::move(conn));
}

std::size_t Database::connection_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return open_count_;
}

void Database::apply_schema(Connection& conn) {
    conn.exec(SCHEMA_SQL);
    conn.exec("PRAGMA user_version=1;");
}

void Database::transaction(const std::function<void(Connection&)>& fn) {
    const int retries = options_.insert_retries < 0 ? 0 : options_.insert_retries;
    auto backoff = std::chrono::milliseconds(options_.retry_backoff_ms);

    for (int attempt = 0;; ++attempt) {
        Lease lease(*this);
        Connection& conn = *lease;
        try {
            conn.exec("BEGIN IMMEDIATE");
            fn(conn);
            conn.exec("COMMIT");
            return;
        } catch (const SqliteError& e) {
            if (!rollback(conn)) {
                lease.discard();
            }
            if (!e.is_busy() || attempt >= retries) {
                throw;
            }
        } catch (...) {
            if (!rollback(conn)) {
                lease.discard();
            }
            throw;
        }

        std::this_thread::sleep_for(backoff);
        backoff *= 2;
    }
}

void Database::read(const std::function<void(Connection&)>& fn) {
    Lease lease(*this);
    fn(*lease);
}

std::optional<std::string> Database::get_setting(const std::string& key) {
    std::optional<std::string> value;
    read([&](Connection& conn) {
        Statement st(conn, "SELECT setting_value FROM settings WHERE setting_key = ?");
        st.bind_text(1, key);
        if (st.step()) {
            value = st.column_optional_text(0);
        }
    });
    return value;
}

void Database::set_setting(const std::string& key, const std::string& value) {
    transaction([&](Connection& conn) {
        Statement st(conn,
                     "INSERT INTO settings (setting_key, setting_value, last_updated) "
                     "VALUES (?, ?, CURRENT_TIMESTAMP) "
                     "ON CONFLICT(setting_key) DO UPDATE SET "
                     "setting_value = excluded.setting_value, last_updated = CURRENT_TIMESTAMP");
        st.bind_text(1, key).bind_text(2, value);
        st.run();
    });
}

}  // namespace evidex::store
