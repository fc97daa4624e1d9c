// ==============================================================================
// evidex/database.hpp - SQLite хранилище дел
// ==============================================================================
//
// Назначение:
// - Connection / Statement: RAII-обёртки sqlite3* и sqlite3_stmt*
// - Database: пул соединений (одно соединение на одновременного клиента)
// - transaction(): BEGIN IMMEDIATE / COMMIT / ROLLBACK с повтором при SQLITE_BUSY
// - Схема: cases, evidence_files, audit_log, settings и индексы
//
// Каждое соединение открывается с journal_mode=WAL, foreign_keys=ON и
// busy_timeout. Хранилище - ресурс с одним писателем: параллельные вставки
// сериализуются SQLite, повтор транзакции сглаживает конкуренцию за блокировку.
//
// ==============================================================================

#ifndef EVIDEX_DATABASE_HPP
#define EVIDEX_DATABASE_HPP

#include "evidex/errors.hpp"

#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

struct sqlite3;
struct sqlite3_stmt;

namespace evidex::store {

// ----------------------------------------------------------------------------
// SqliteError
// ----------------------------------------------------------------------------

/// Ошибка SQLite с расширенным кодом результата
class SqliteError : public Error {
public:
    SqliteError(int code, const std::string& message)
        : Error(ErrorKind::Database, message), code_(code) {}

    /// Расширенный код (SQLITE_CONSTRAINT_UNIQUE, SQLITE_BUSY_SNAPSHOT, ...)
    int code() const noexcept { return code_; }

    /// Первичный код (code & 0xFF)
    int primary_code() const noexcept { return code_ & 0xFF; }

    /// SQLITE_BUSY / SQLITE_LOCKED: транзакцию можно повторить
    bool is_busy() const noexcept;

    bool is_unique_violation() const noexcept;
    bool is_foreign_key_violation() const noexcept;

private:
    int code_;
};

// ----------------------------------------------------------------------------
// Connection
// ----------------------------------------------------------------------------

class Connection {
public:
    /// @throws SqliteError если файл не открывается
    Connection(const std::filesystem::path& path, int busy_timeout_ms);
    ~Connection();

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    /// Выполнить один или несколько операторов без параметров
    void exec(std::string_view sql);

    std::int64_t last_insert_rowid() const;

    /// Число строк, изменённых последним оператором
    int changes() const;

    sqlite3* handle() const { return db_; }

    /// Бросить SqliteError, если rc не SQLITE_OK/ROW/DONE
    void check(int rc, std::string_view context) const;

private:
    sqlite3* db_ = nullptr;
};

// ----------------------------------------------------------------------------
// Statement
// ----------------------------------------------------------------------------

class Statement {
public:
    Statement(Connection& conn, std::string_view sql);
    ~Statement();

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    // Индексы параметров с 1, как в sqlite3_bind_*
    Statement& bind_int64(int index, std::int64_t value);
    Statement& bind_double(int index, double value);
    Statement& bind_text(int index, std::string_view value);
    Statement& bind_null(int index);
    Statement& bind_optional_text(int index, const std::optional<std::string>& value);
    Statement& bind_optional_double(int index, const std::optional<double>& value);

    /// true - есть строка, false - выполнение завершено
    /// @throws SqliteError
    bool step();

    /// step() для операторов без результата
    void run();

    /// Сбросить для повторного выполнения (привязки сохраняются)
    void reset();

    // Индексы колонок с 0, как в sqlite3_column_*
    bool column_is_null(int index) const;
    std::int64_t column_int64(int index) const;
    double column_double(int index) const;
    std::string column_text(int index) const;
    std::optional<std::string> column_optional_text(int index) const;
    std::optional<double> column_optional_double(int index) const;

private:
    Connection& conn_;
    sqlite3_stmt* stmt_ = nullptr;
};

// ----------------------------------------------------------------------------
// Database
// ----------------------------------------------------------------------------

struct DatabaseOptions {
    std::filesystem::path path = "evidex_cases.db";
    int busy_timeout_ms = 5000;
    int insert_retries = 5;     // повторы транзакции при SQLITE_BUSY
    int retry_backoff_ms = 20;  // начальная пауза, удваивается на каждом повторе
};

class Database {
public:
    /// Открывает первое соединение и применяет схему
    /// @throws SqliteError
    explicit Database(DatabaseOptions options);
    ~Database();

    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;

    /// Выполнить fn в транзакции BEGIN IMMEDIATE на отдельном соединении.
    /// Любое исключение из fn откатывает транзакцию и пробрасывается дальше.
    /// При SQLITE_BUSY вся область повторяется с экспоненциальной паузой.
    void transaction(const std::function<void(Connection&)>& fn);

    /// Выполнить fn (только чтение) на соединении из пула
    void read(const std::function<void(Connection&)>& fn);

    /// Значение из таблицы settings
    std::optional<std::string> get_setting(const std::string& key);
    void set_setting(const std::string& key, const std::string& value);

    const DatabaseOptions& options() const { return options_; }

    /// Открытые соединения (занятые и свободные)
    std::size_t connection_count() const;

private:
    class Lease;

    std::unique_ptr<Connection> acquire();
    void release(std::unique_ptr<Connection> conn);
    void apply_schema(Connection& conn);

    DatabaseOptions options_;
    mutable std::mutex mutex_;
    std::vector<std::unique_ptr<Connection>> idle_;
    std::size_t open_count_ = 0;
};

}  // namespace evidex::store

#endif  // EVIDEX_DATABASE_HPP
