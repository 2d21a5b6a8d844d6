// ==============================================================================
// sqlite.cpp - RAII обёртка над sqlite3 C API
// ==============================================================================

#include "chatx/sqlite.hpp"

#include "chatx/platform.hpp"

#include <sqlite3.h>
#include <utility>

namespace chatx::sqlite {

namespace {

void throw_if(int rc, sqlite3* db, const char* what) {
    if (rc != SQLITE_OK) {
        std::string msg = std::string(what) + ": " + (db ? sqlite3_errmsg(db) : sqlite3_errstr(rc));
        throw SqliteError(msg, rc);
    }
}

int open_flags(OpenMode mode) {
    switch (mode) {
    case OpenMode::ReadOnly:
        return SQLITE_OPEN_READONLY;
    case OpenMode::ReadWrite:
        return SQLITE_OPEN_READWRITE;
    case OpenMode::ReadWriteCreate:
        return SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE;
    }
    return SQLITE_OPEN_READONLY;
}

}  // namespace

// ----------------------------------------------------------------------------
// Database
// ----------------------------------------------------------------------------

Database::Database(const std::filesystem::path& path, OpenMode mode) : path_(path) {
    std::string path_str = platform::path_to_utf8(path);
    int rc = sqlite3_open_v2(path_str.c_str(), &db_, open_flags(mode) | SQLITE_OPEN_NOMUTEX,
                             nullptr);
    if (rc != SQLITE_OK) {
        std::string msg = db_ ? sqlite3_errmsg(db_) : "sqlite open failed";
        if (db_) {
            sqlite3_close(db_);
        }
        db_ = nullptr;
        throw SqliteError("sqlite open " + path_str + ": " + msg, rc);
    }

    // ждать блокировку вместо немедленной ошибки
    throw_if(sqlite3_busy_timeout(db_, 5000), db_, "busy_timeout");
}

Database::~Database() {
    if (db_) {
        sqlite3_close(db_);
    }
}

Database::Database(Database&& other) noexcept
    : db_(std::exchange(other.db_, nullptr)), path_(std::move(other.path_)) {}

Database& Database::operator=(Database&& other) noexcept {
    if (this != &other) {
        if (db_) {
            sqlite3_close(db_);
        }
        db_ = std::exchange(other.db_, nullptr);
        path_ = std::move(other.path_);
    }
    return *this;
}

void Database::exec(const std::string& sql) {
    char* err = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        std::string msg = err ? err : "sqlite exec failed";
        sqlite3_free(err);
        throw SqliteError(msg, rc);
    }
}

Statement Database::prepare(const std::string& sql) {
    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
    throw_if(rc, db_, "sqlite prepare");
    return Statement(db_, stmt);
}

bool Database::table_exists(const std::string& name) {
    Statement stmt = prepare("SELECT 1 FROM sqlite_master WHERE type = 'table' AND name = ?1");
    stmt.bind_text(1, name);
    return stmt.step();
}

std::vector<std::string> Database::table_columns(const std::string& table) {
    std::vector<std::string> columns;
    Statement stmt = prepare("PRAGMA table_info(" + quote_identifier(table) + ")");
    while (stmt.step()) {
        // cid, name, type, notnull, dflt_value, pk
        columns.push_back(stmt.column_text(1));
    }
    return columns;
}

std::optional<std::int64_t> Database::query_int(const std::string& sql) {
    Statement stmt = prepare(sql);
    if (!stmt.step() || stmt.column_is_null(0)) {
        return std::nullopt;
    }
    return stmt.column_int(0);
}

std::int64_t Database::last_insert_rowid() const {
    return sqlite3_last_insert_rowid(db_);
}

// ----------------------------------------------------------------------------
// Statement
// ----------------------------------------------------------------------------

Statement::~Statement() {
    if (stmt_) {
        sqlite3_finalize(stmt_);
    }
}

Statement::Statement(Statement&& other) noexcept
    : db_(std::exchange(other.db_, nullptr)), stmt_(std::exchange(other.stmt_, nullptr)) {}

Statement& Statement::operator=(Statement&& other) noexcept {
    if (this != &other) {
        if (stmt_) {
            sqlite3_finalize(stmt_);
        }
        db_ = std::exchange(other.db_, nullptr);
        stmt_ = std::exchange(other.stmt_, nullptr);
    }
    return *this;
}

void Statement::bind_int(int index, std::int64_t value) {
    throw_if(sqlite3_bind_int64(stmt_, index, value), db_, "sqlite bind");
}

void Statement::bind_double(int index, double value) {
    throw_if(sqlite3_bind_double(stmt_, index, value), db_, "sqlite bind");
}

void Statement::bind_text(int index, const std::string& value) {
    throw_if(sqlite3_bind_text(stmt_, index, value.c_str(), static_cast<int>(value.size()),
                               SQLITE_TRANSIENT),
             db_, "sqlite bind");
}

void Statement::bind_blob(int index, const std::vector<std::uint8_t>& value) {
    throw_if(sqlite3_bind_blob(stmt_, index, value.data(), static_cast<int>(value.size()),
                               SQLITE_TRANSIENT),
             db_, "sqlite bind");
}

void Statement::bind_null(int index) {
    throw_if(sqlite3_bind_null(stmt_, index), db_, "sqlite bind");
}

bool Statement::step() {
    int rc = sqlite3_step(stmt_);
    if (rc == SQLITE_ROW) {
        return true;
    }
    if (rc == SQLITE_DONE) {
        return false;
    }
    throw SqliteError(std::string("sqlite step: ") + sqlite3_errmsg(db_), rc);
}

void Statement::reset() {
    sqlite3_reset(stmt_);
    sqlite3_clear_bindings(stmt_);
}

int Statement::column_count() const {
    return sqlite3_column_count(stmt_);
}

std::string Statement::column_name(int index) const {
    const char* name = sqlite3_column_name(stmt_, index);
    return name ? name : "";
}

bool Statement::column_is_null(int index) const {
    return sqlite3_column_type(stmt_, index) == SQLITE_NULL;
}

std::int64_t Statement::column_int(int index) const {
    return sqlite3_column_int64(stmt_, index);
}

double Statement::column_double(int index) const {
    return sqlite3_column_double(stmt_, index);
}

std::string Statement::column_text(int index) const {
    const unsigned char* text = sqlite3_column_text(stmt_, index);
    int size = sqlite3_column_bytes(stmt_, index);
    if (text == nullptr) {
        return {};
    }
    return std::string(reinterpret_cast<const char*>(text), static_cast<size_t>(size));
}

std::vector<std::uint8_t> Statement::column_blob(int index) const {
    const void* data = sqlite3_column_blob(stmt_, index);
    int size = sqlite3_column_bytes(stmt_, index);
    if (data == nullptr || size <= 0) {
        return {};
    }
    const auto* bytes = static_cast<const std::uint8_t*>(data);
    return std::vector<std::uint8_t>(bytes, bytes + size);
}

Value Statement::column_value(int index) const {
    switch (sqlite3_column_type(stmt_, index)) {
    case SQLITE_INTEGER:
        return Value(static_cast<std::int64_t>(column_int(index)));
    case SQLITE_FLOAT:
        return Value(column_double(index));
    case SQLITE_TEXT:
        return Value(column_text(index));
    case SQLITE_BLOB:
        return Value(column_blob(index));
    case SQLITE_NULL:
    default:
        return Value();
    }
}

std::string quote_identifier(const std::string& name) {
    std::string out = "\"";
    for (char c : name) {
        if (c == '"') {
            out += '"';
        }
        out += c;
    }
    out += '"';
    return out;
}

}  // namespace chatx::sqlite
