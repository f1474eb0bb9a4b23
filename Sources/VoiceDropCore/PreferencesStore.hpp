#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

// Forward-declare sqlite3 so we don't leak its header into consumers.
struct sqlite3;

namespace vd {

/// Persistent key-value store for user preferences.
///
/// Values are stored as text and parsed by the typed getters, which fall
/// back to the supplied default when a key is missing or unparsable.
/// Uses SQLite WAL mode; writes run inside explicit transactions.
class PreferencesStore {
public:
    explicit PreferencesStore(const std::string& db_path);
    ~PreferencesStore();

    // Non-copyable.
    PreferencesStore(const PreferencesStore&) = delete;
    PreferencesStore& operator=(const PreferencesStore&) = delete;

    /// Open (or create) the database.  Returns false on failure.
    bool open();

    void close();

    bool is_open() const;

    // ---- Raw access ----

    std::optional<std::string> get(const std::string& key) const;

    bool set(const std::string& key, const std::string& value);

    /// Write several keys in one transaction.
    bool set_many(const std::map<std::string, std::string>& values);

    bool remove(const std::string& key);

    std::vector<std::string> keys() const;

    // ---- Typed access ----

    bool    get_bool(const std::string& key, bool fallback) const;
    double  get_double(const std::string& key, double fallback) const;
    int64_t get_int64(const std::string& key, int64_t fallback) const;
    std::string get_string(const std::string& key, const std::string& fallback) const;

    bool set_bool(const std::string& key, bool value);
    bool set_double(const std::string& key, double value);
    bool set_int64(const std::string& key, int64_t value);

private:
    bool create_tables();

    /// Caller must hold mu_.
    bool write_locked(const std::string& key, const std::string& value);

    std::string        db_path_;
    sqlite3*           db_ = nullptr;
    mutable std::mutex mu_;
};

} // namespace vd
