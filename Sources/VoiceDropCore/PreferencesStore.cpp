#include "PreferencesStore.hpp"

#include "Log.hpp"
#include "Uuid.hpp"

#include <cstdlib>
#include <filesystem>
#include <iomanip>
#include <locale>
#include <sstream>

#include <sqlite3.h>

namespace vd {

// ---------------------------------------------------------------------------
// RAII helper for SQLite transactions
// ---------------------------------------------------------------------------

class Transaction {
public:
    explicit Transaction(sqlite3* db) : db_(db) {
        sqlite3_exec(db_, "BEGIN IMMEDIATE", nullptr, nullptr, nullptr);
    }
    bool commit() {
        if (!committed_) {
            committed_ = sqlite3_exec(db_, "COMMIT", nullptr, nullptr, nullptr) == SQLITE_OK;
        }
        return committed_;
    }
    ~Transaction() {
        if (!committed_) {
            sqlite3_exec(db_, "ROLLBACK", nullptr, nullptr, nullptr);
        }
    }

private:
    sqlite3* db_;
    bool committed_ = false;
};

// ---------------------------------------------------------------------------
// RAII helper for SQLite prepared statements
// ---------------------------------------------------------------------------

class Statement {
public:
    Statement(sqlite3* db, const char* sql) {
        int rc = sqlite3_prepare_v2(db, sql, -1, &stmt_, nullptr);
        if (rc != SQLITE_OK) {
            Logger::error(std::string("preferences: prepare failed: ") + sqlite3_errmsg(db));
            stmt_ = nullptr;
        }
    }
    ~Statement() {
        if (stmt_) sqlite3_finalize(stmt_);
    }
    operator sqlite3_stmt*() const { return stmt_; }
    bool ok() const { return stmt_ != nullptr; }

private:
    sqlite3_stmt* stmt_ = nullptr;
};

// ---------------------------------------------------------------------------
// Construction / destruction
// ---------------------------------------------------------------------------

PreferencesStore::PreferencesStore(const std::string& db_path)
    : db_path_(db_path) {}

PreferencesStore::~PreferencesStore() {
    close();
}

// ---------------------------------------------------------------------------
// open / close / is_open
// ---------------------------------------------------------------------------

bool PreferencesStore::open() {
    std::lock_guard<std::mutex> lock(mu_);

    if (db_) return true;   // already open

    if (db_path_.empty()) return false;

    auto parent = std::filesystem::path(db_path_).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            Logger::error("preferences: cannot create " + parent.string() + ": " + ec.message());
            return false;
        }
    }

    int rc = sqlite3_open(db_path_.c_str(), &db_);
    if (rc != SQLITE_OK) {
        Logger::error("preferences: cannot open " + db_path_);
        if (db_) {
            sqlite3_close(db_);
            db_ = nullptr;
        }
        return false;
    }

    sqlite3_exec(db_, "PRAGMA journal_mode=WAL", nullptr, nullptr, nullptr);

    if (!create_tables()) {
        sqlite3_close(db_);
        db_ = nullptr;
        return false;
    }
    return true;
}

void PreferencesStore::close() {
    std::lock_guard<std::mutex> lock(mu_);
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

bool PreferencesStore::is_open() const {
    std::lock_guard<std::mutex> lock(mu_);
    return db_ != nullptr;
}

// ---------------------------------------------------------------------------
// create_tables
// ---------------------------------------------------------------------------

bool PreferencesStore::create_tables() {
    const char* sql = R"SQL(
        CREATE TABLE IF NOT EXISTS preferences (
            key TEXT PRIMARY KEY,
            value TEXT NOT NULL,
            updated_at INTEGER NOT NULL
        );
    )SQL";

    char* err = nullptr;
    int rc = sqlite3_exec(db_, sql, nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        Logger::error(std::string("preferences: schema failed: ") + (err ? err : "unknown"));
        if (err) sqlite3_free(err);
        return false;
    }
    return true;
}

// ---------------------------------------------------------------------------
// Raw access
// ---------------------------------------------------------------------------

std::optional<std::string> PreferencesStore::get(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mu_);
    if (!db_) return std::nullopt;

    Statement stmt(db_, "SELECT value FROM preferences WHERE key = ?");
    if (!stmt.ok()) return std::nullopt;

    sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);

    if (sqlite3_step(stmt) != SQLITE_ROW) return std::nullopt;

    const char* v = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0));
    return std::string(v ? v : "");
}

bool PreferencesStore::write_locked(const std::string& key, const std::string& value) {
    const char* sql =
        "INSERT INTO preferences (key, value, updated_at) VALUES (?, ?, ?) "
        "ON CONFLICT(key) DO UPDATE SET value = excluded.value, "
        "updated_at = excluded.updated_at";
    Statement stmt(db_, sql);
    if (!stmt.ok()) return false;

    sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, value.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 3, now_unix());

    return sqlite3_step(stmt) == SQLITE_DONE;
}

bool PreferencesStore::set(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(mu_);
    if (!db_) return false;

    Transaction txn(db_);
    if (!write_locked(key, value)) return false;
    return txn.commit();
}

bool PreferencesStore::set_many(const std::map<std::string, std::string>& values) {
    std::lock_guard<std::mutex> lock(mu_);
    if (!db_) return false;

    Transaction txn(db_);
    for (const auto& kv : values) {
        if (!write_locked(kv.first, kv.second)) return false;
    }
    return txn.commit();
}

bool PreferencesStore::remove(const std::string& key) {
    std::lock_guard<std::mutex> lock(mu_);
    if (!db_) return false;

    Transaction txn(db_);

    Statement stmt(db_, "DELETE FROM preferences WHERE key = ?");
    if (!stmt.ok()) return false;
    sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);
    if (sqlite3_step(stmt) != SQLITE_DONE) return false;

    return txn.commit();
}

std::vector<std::string> PreferencesStore::keys() const {
    std::lock_guard<std::mutex> lock(mu_);
    std::vector<std::string> results;
    if (!db_) return results;

    Statement stmt(db_, "SELECT key FROM preferences ORDER BY key ASC");
    if (!stmt.ok()) return results;

    while (sqlite3_step(stmt) == SQLITE_ROW) {
        results.emplace_back(reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0)));
    }
    return results;
}

// ---------------------------------------------------------------------------
// Typed access
// ---------------------------------------------------------------------------

bool PreferencesStore::get_bool(const std::string& key, bool fallback) const {
    auto v = get(key);
    if (!v) return fallback;
    if (*v == "1" || *v == "true")  return true;
    if (*v == "0" || *v == "false") return false;
    return fallback;
}

double PreferencesStore::get_double(const std::string& key, double fallback) const {
    auto v = get(key);
    if (!v || v->empty()) return fallback;

    std::istringstream in(*v);
    in.imbue(std::locale::classic());
    double d = 0.0;
    in >> d;
    if (in.fail() || !in.eof()) return fallback;
    return d;
}

int64_t PreferencesStore::get_int64(const std::string& key, int64_t fallback) const {
    auto v = get(key);
    if (!v || v->empty()) return fallback;

    char* end = nullptr;
    long long n = std::strtoll(v->c_str(), &end, 10);
    if (end == v->c_str() || *end != '\0') return fallback;
    return static_cast<int64_t>(n);
}

std::string PreferencesStore::get_string(const std::string& key,
                                         const std::string& fallback) const {
    auto v = get(key);
    return v ? *v : fallback;
}

bool PreferencesStore::set_bool(const std::string& key, bool value) {
    return set(key, value ? "true" : "false");
}

bool PreferencesStore::set_double(const std::string& key, double value) {
    std::ostringstream out;
    out.imbue(std::locale::classic());
    out << std::setprecision(12) << value;
    return set(key, out.str());
}

bool PreferencesStore::set_int64(const std::string& key, int64_t value) {
    return set(key, std::to_string(value));
}

} // namespace vd
