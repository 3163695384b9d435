#pragma once

#include <string>
#include <vector>
#include <memory>
#include <functional>
#include <cstdint>

namespace substrate {
namespace database {

class WriteBatch {
public:
    WriteBatch();
    ~WriteBatch();
    void put(const std::string& key, const std::vector<uint8_t>& value);
    void put(const std::string& key, const std::string& value);
    void del(const std::string& key);
    void clear();
    size_t size() const;
    bool empty() const;
private:
    friend class Database;
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

enum class WriteStatus {
    OK,
    CONFLICT,
    FAILED
};

class Database {
public:
    Database();
    ~Database();

    bool open(const std::string& path);
    void close();
    bool isOpen() const;

    bool put(const std::string& key, const std::vector<uint8_t>& value);
    bool put(const std::string& key, const std::string& value);
    std::vector<uint8_t> get(const std::string& key) const;
    std::string getString(const std::string& key) const;
    bool del(const std::string& key);
    bool exists(const std::string& key) const;

    bool write(WriteBatch& batch);

    // Applies the batch only if guardKey currently holds expected (an absent
    // key reads as empty). The check and the writes share one immediate
    // transaction, so concurrent writers on other connections serialize.
    WriteStatus writeIf(WriteBatch& batch, const std::string& guardKey,
                        const std::vector<uint8_t>& expected);

    void forEach(const std::string& prefix, std::function<bool(const std::string&, const std::vector<uint8_t>&)> fn) const;
    std::vector<std::string> keys(const std::string& prefix = "") const;
    size_t count(const std::string& prefix = "") const;

    std::vector<std::pair<std::string, std::vector<uint8_t>>> getRange(
        const std::string& startKey, const std::string& endKey, size_t limit = 0) const;

    std::string getPath() const;
    std::string lastError() const;
    bool clear();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}
}
