#include "database/database.h"
#include <sqlite3.h>
#include <mutex>

namespace substrate {
namespace database {

namespace {

const int BUSY_TIMEOUT_MS = 5000;

std::vector<uint8_t> columnBlob(sqlite3_stmt* stmt, int col) {
    const void* blob = sqlite3_column_blob(stmt, col);
    int blobSize = sqlite3_column_bytes(stmt, col);
    if (!blob || blobSize <= 0) return {};
    return std::vector<uint8_t>(static_cast<const uint8_t*>(blob),
                                static_cast<const uint8_t*>(blob) + blobSize);
}

std::string columnText(sqlite3_stmt* stmt, int col) {
    const unsigned char* text = sqlite3_column_text(stmt, col);
    return text ? reinterpret_cast<const char*>(text) : "";
}

}

struct WriteBatch::Impl {
    std::vector<std::pair<std::string, std::vector<uint8_t>>> puts;
    std::vector<std::string> dels;
};

WriteBatch::WriteBatch() : impl_(std::make_unique<Impl>()) {}
WriteBatch::~WriteBatch() = default;

void WriteBatch::put(const std::string& key, const std::vector<uint8_t>& value) {
    impl_->puts.emplace_back(key, value);
}

void WriteBatch::put(const std::string& key, const std::string& value) {
    impl_->puts.emplace_back(key, std::vector<uint8_t>(value.begin(), value.end()));
}

void WriteBatch::del(const std::string& key) {
    impl_->dels.push_back(key);
}

void WriteBatch::clear() {
    impl_->puts.clear();
    impl_->dels.clear();
}

size_t WriteBatch::size() const {
    return impl_->puts.size() + impl_->dels.size();
}

bool WriteBatch::empty() const {
    return impl_->puts.empty() && impl_->dels.empty();
}

struct Database::Impl {
    sqlite3* db = nullptr;
    std::string path;
    std::string lastError;
    mutable std::mutex mtx;
    bool isOpen = false;

    bool exec(const char* sql) {
        char* errMsg = nullptr;
        int rc = sqlite3_exec(db, sql, nullptr, nullptr, &errMsg);
        if (rc != SQLITE_OK) {
            lastError = errMsg ? errMsg : sqlite3_errstr(rc);
            sqlite3_free(errMsg);
            return false;
        }
        return true;
    }

    bool stepPut(const std::string& key, const std::vector<uint8_t>& value) {
        sqlite3_stmt* stmt;
        const char* sql = "INSERT OR REPLACE INTO kv (key, value) VALUES (?, ?);";
        if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            lastError = sqlite3_errmsg(db);
            return false;
        }
        sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_STATIC);
        sqlite3_bind_blob(stmt, 2, value.data(), static_cast<int>(value.size()), SQLITE_STATIC);
        int rc = sqlite3_step(stmt);
        sqlite3_finalize(stmt);
        if (rc != SQLITE_DONE) {
            lastError = sqlite3_errmsg(db);
            return false;
        }
        return true;
    }

    bool stepDel(const std::string& key) {
        sqlite3_stmt* stmt;
        const char* sql = "DELETE FROM kv WHERE key = ?;";
        if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            lastError = sqlite3_errmsg(db);
            return false;
        }
        sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_STATIC);
        int rc = sqlite3_step(stmt);
        sqlite3_finalize(stmt);
        if (rc != SQLITE_DONE) {
            lastError = sqlite3_errmsg(db);
            return false;
        }
        return true;
    }

    bool readValue(const std::string& key, std::vector<uint8_t>& out, bool& found) {
        sqlite3_stmt* stmt;
        const char* sql = "SELECT value FROM kv WHERE key = ?;";
        if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            lastError = sqlite3_errmsg(db);
            return false;
        }
        sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_STATIC);
        int rc = sqlite3_step(stmt);
        found = rc == SQLITE_ROW;
        if (found) out = columnBlob(stmt, 0);
        sqlite3_finalize(stmt);
        if (rc != SQLITE_ROW && rc != SQLITE_DONE) {
            lastError = sqlite3_errmsg(db);
            return false;
        }
        return true;
    }

    bool applyBatch(const WriteBatch::Impl& batch) {
        for (const auto& [key, value] : batch.puts) {
            if (!stepPut(key, value)) return false;
        }
        for (const auto& key : batch.dels) {
            if (!stepDel(key)) return false;
        }
        return true;
    }
};

Database::Database() : impl_(std::make_unique<Impl>()) {}

Database::~Database() { close(); }

bool Database::open(const std::string& path) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    if (impl_->isOpen) return false;

    int rc = sqlite3_open(path.c_str(), &impl_->db);
    if (rc != SQLITE_OK) {
        impl_->lastError = impl_->db ? sqlite3_errmsg(impl_->db) : sqlite3_errstr(rc);
        sqlite3_close(impl_->db);
        impl_->db = nullptr;
        return false;
    }

    const char* createTable =
        "CREATE TABLE IF NOT EXISTS kv ("
        "key TEXT PRIMARY KEY,"
        "value BLOB"
        ");";

    if (!impl_->exec(createTable)) {
        sqlite3_close(impl_->db);
        impl_->db = nullptr;
        return false;
    }

    sqlite3_busy_timeout(impl_->db, BUSY_TIMEOUT_MS);
    impl_->exec("PRAGMA journal_mode=WAL;");
    impl_->exec("PRAGMA synchronous=NORMAL;");

    impl_->path = path;
    impl_->isOpen = true;
    return true;
}

void Database::close() {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    if (impl_->db) {
        sqlite3_close(impl_->db);
        impl_->db = nullptr;
    }
    impl_->isOpen = false;
}

bool Database::isOpen() const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->isOpen;
}

bool Database::put(const std::string& key, const std::vector<uint8_t>& value) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    if (!impl_->db) return false;
    return impl_->stepPut(key, value);
}

bool Database::put(const std::string& key, const std::string& value) {
    return put(key, std::vector<uint8_t>(value.begin(), value.end()));
}

std::vector<uint8_t> Database::get(const std::string& key) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    if (!impl_->db) return {};

    std::vector<uint8_t> result;
    bool found = false;
    if (!impl_->readValue(key, result, found)) return {};
    return result;
}

std::string Database::getString(const std::string& key) const {
    auto data = get(key);
    return std::string(data.begin(), data.end());
}

bool Database::del(const std::string& key) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    if (!impl_->db) return false;
    return impl_->stepDel(key);
}

bool Database::exists(const std::string& key) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    if (!impl_->db) return false;

    std::vector<uint8_t> value;
    bool found = false;
    if (!impl_->readValue(key, value, found)) return false;
    return found;
}

bool Database::write(WriteBatch& batch) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    if (!impl_->db) return false;

    if (!impl_->exec("BEGIN IMMEDIATE;")) return false;

    if (!impl_->applyBatch(*batch.impl_)) {
        impl_->exec("ROLLBACK;");
        return false;
    }

    if (!impl_->exec("COMMIT;")) {
        impl_->exec("ROLLBACK;");
        return false;
    }
    batch.clear();
    return true;
}

WriteStatus Database::writeIf(WriteBatch& batch, const std::string& guardKey,
                              const std::vector<uint8_t>& expected) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    if (!impl_->db) return WriteStatus::FAILED;

    if (!impl_->exec("BEGIN IMMEDIATE;")) return WriteStatus::FAILED;

    std::vector<uint8_t> current;
    bool found = false;
    if (!impl_->readValue(guardKey, current, found)) {
        impl_->exec("ROLLBACK;");
        return WriteStatus::FAILED;
    }
    if (current != expected) {
        impl_->exec("ROLLBACK;");
        return WriteStatus::CONFLICT;
    }

    if (!impl_->applyBatch(*batch.impl_)) {
        impl_->exec("ROLLBACK;");
        return WriteStatus::FAILED;
    }

    if (!impl_->exec("COMMIT;")) {
        impl_->exec("ROLLBACK;");
        return WriteStatus::FAILED;
    }
    batch.clear();
    return WriteStatus::OK;
}

void Database::forEach(const std::string& prefix,
                       std::function<bool(const std::string&, const std::vector<uint8_t>&)> fn) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    if (!impl_->db) return;

    sqlite3_stmt* stmt;
    std::string sql = "SELECT key, value FROM kv";
    if (!prefix.empty()) {
        sql += " WHERE substr(key, 1, ?1) = ?2";
    }
    sql += " ORDER BY key;";

    if (sqlite3_prepare_v2(impl_->db, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        impl_->lastError = sqlite3_errmsg(impl_->db);
        return;
    }

    if (!prefix.empty()) {
        sqlite3_bind_int(stmt, 1, static_cast<int>(prefix.size()));
        sqlite3_bind_text(stmt, 2, prefix.c_str(), -1, SQLITE_STATIC);
    }

    while (sqlite3_step(stmt) == SQLITE_ROW) {
        std::string key = columnText(stmt, 0);
        std::vector<uint8_t> value = columnBlob(stmt, 1);
        if (!fn(key, value)) break;
    }

    sqlite3_finalize(stmt);
}

std::vector<std::string> Database::keys(const std::string& prefix) const {
    std::vector<std::string> result;
    forEach(prefix, [&result](const std::string& key, const std::vector<uint8_t>&) {
        result.push_back(key);
        return true;
    });
    return result;
}

size_t Database::count(const std::string& prefix) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    if (!impl_->db) return 0;

    sqlite3_stmt* stmt;
    std::string sql = "SELECT COUNT(*) FROM kv";
    if (!prefix.empty()) {
        sql += " WHERE substr(key, 1, ?1) = ?2";
    }
    sql += ";";

    if (sqlite3_prepare_v2(impl_->db, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) return 0;

    if (!prefix.empty()) {
        sqlite3_bind_int(stmt, 1, static_cast<int>(prefix.size()));
        sqlite3_bind_text(stmt, 2, prefix.c_str(), -1, SQLITE_STATIC);
    }

    size_t cnt = 0;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        cnt = static_cast<size_t>(sqlite3_column_int64(stmt, 0));
    }

    sqlite3_finalize(stmt);
    return cnt;
}

std::vector<std::pair<std::string, std::vector<uint8_t>>> Database::getRange(
    const std::string& startKey, const std::string& endKey, size_t limit) const {

    std::vector<std::pair<std::string, std::vector<uint8_t>>> results;
    std::lock_guard<std::mutex> lock(impl_->mtx);
    if (!impl_->db) return results;

    sqlite3_stmt* stmt;
    std::string sql = "SELECT key, value FROM kv WHERE key >= ? AND key < ? ORDER BY key";
    if (limit > 0) {
        sql += " LIMIT " + std::to_string(limit);
    }
    sql += ";";

    if (sqlite3_prepare_v2(impl_->db, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        impl_->lastError = sqlite3_errmsg(impl_->db);
        return results;
    }

    sqlite3_bind_text(stmt, 1, startKey.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, 2, endKey.c_str(), -1, SQLITE_STATIC);

    while (sqlite3_step(stmt) == SQLITE_ROW) {
        results.emplace_back(columnText(stmt, 0), columnBlob(stmt, 1));
    }

    sqlite3_finalize(stmt);
    return results;
}

std::string Database::getPath() const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->path;
}

std::string Database::lastError() const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->lastError;
}

bool Database::clear() {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    if (!impl_->db) return false;
    return impl_->exec("DELETE FROM kv;");
}

}
}
