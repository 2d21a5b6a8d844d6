// ==============================================================================
// chatx/sqlite.hpp - RAII обёртка над sqlite3 C API
// ==============================================================================
//
// Назначение:
// - Database: владение sqlite3*, открытие с явными флагами, exec/prepare
// - Statement: владение sqlite3_stmt*, bind/step/column
// - Интроспекция схемы: существование таблиц, набор колонок
// - Чтение колонки в Value (BLOB → Bytes)
//
// Ошибки SQLite бросаются как SqliteError (std::runtime_error).
//
// ==============================================================================

#ifndef CHATX_SQLITE_HPP
#define CHATX_SQLITE_HPP

#include <chatx/value.hpp>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

struct sqlite3;
struct sqlite3_stmt;

namespace chatx::sqlite {

class SqliteError : public std::runtime_error {
public:
    SqliteError(const std::string& what, int code) : std::runtime_error(what), code_(code) {}
    int code() const noexcept { return code_; }

private:
    int code_;
};

enum class OpenMode {
    ReadOnly,        // SQLITE_OPEN_READONLY
    ReadWrite,       // SQLITE_OPEN_READWRITE (нужен для применения WAL)
    ReadWriteCreate  // SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE
};

class Statement;

// ----------------------------------------------------------------------------
// Database
// ----------------------------------------------------------------------------

class Database {
public:
    Database(const std::filesystem::path& path, OpenMode mode);
    ~Database();

    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;
    Database(Database&& other) noexcept;
    Database& operator=(Database&& other) noexcept;

    /// Выполнить SQL без результата (несколько операторов допустимо)
    void exec(const std::string& sql);

    Statement prepare(const std::string& sql);

    /// Есть ли таблица с таким именем (sqlite_master)
    bool table_exists(const std::string& name);

    /// Имена колонок таблицы (PRAGMA table_info); пусто если таблицы нет
    std::vector<std::string> table_columns(const std::string& table);

    /// Первая колонка первой строки как int64 (для COUNT/MAX)
    std::optional<std::int64_t> query_int(const std::string& sql);

    std::int64_t last_insert_rowid() const;

    sqlite3* handle() const { return db_; }
    const std::filesystem::path& path() const { return path_; }

private:
    sqlite3* db_ = nullptr;
    std::filesystem::path path_;
};

// ----------------------------------------------------------------------------
// Statement
// ----------------------------------------------------------------------------

class Statement {
public:
    Statement(sqlite3* db, sqlite3_stmt* stmt) : db_(db), stmt_(stmt) {}
    ~Statement();

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;
    Statement(Statement&& other) noexcept;
    Statement& operator=(Statement&& other) noexcept;

    // Параметры нумеруются с 1
    void bind_int(int index, std::int64_t value);
    void bind_double(int index, double value);
    void bind_text(int index, const std::string& value);
    void bind_blob(int index, const std::vector<std::uint8_t>& value);
    void bind_null(int index);

    /// Следующая строка; false когда строк больше нет
    bool step();

    void reset();

    int column_count() const;
    std::string column_name(int index) const;
    bool column_is_null(int index) const;
    std::int64_t column_int(int index) const;
    double column_double(int index) const;
    std::string column_text(int index) const;
    std::vector<std::uint8_t> column_blob(int index) const;

    /// Колонка в типе хранения: INTEGER → Int64, REAL → Double, TEXT → String,
    /// BLOB → Bytes, NULL → Null
    Value column_value(int index) const;

private:
    sqlite3* db_ = nullptr;
    sqlite3_stmt* stmt_ = nullptr;
};

/// Экранировать идентификатор для SQL ("name" с удвоением кавычек)
std::string quote_identifier(const std::string& name);

}  // namespace chatx::sqlite

#endif  // CHATX_SQLITE_HPP
