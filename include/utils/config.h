#pragma once

#include <string>
#include <vector>
#include <map>
#include <memory>
#include <functional>
#include <cstdint>

namespace substrate {
namespace utils {

struct LedgerConfig {
    uint32_t maxAppendRetries = 8;
    uint32_t retryBackoffMs = 1;
};

struct BudgetConfig {
    uint64_t velocityWindowMs = 3000;
    uint32_t velocityMaxDebits = 3;
    // Lifetime of an allocation; 0 never expires.
    uint64_t windowMs = 0;
    std::map<std::string, uint64_t> costs;
};

struct ArbiterConfig {
    uint64_t thrashWindowMs = 60000;
    uint32_t thrashLimit = 3;
    std::string minRoleObserve = "agent";
    std::string minRoleAlert = "agent";
    std::string minRoleAct = "operator";
    std::string minRoleDefend = "operator";
};

struct GuardianConfig {
    uint64_t evaluationBudgetMs = 50;
    uint64_t reviewDeadlineMs = 5000;
    uint64_t reviewIntervalMs = 250;
    uint64_t quarantineExpiryMs = 0;
    uint32_t maxModeDenials = 3;
    uint32_t maxBudgetRejections = 5;
    uint32_t maxActionFailures = 3;
    uint32_t workerThreads = 2;
};

struct LogConfig {
    // Empty keeps the level already set on the Logger.
    std::string level;
    std::string file;
    uint64_t maxFileBytes = 10 * 1024 * 1024;
    uint32_t maxFiles = 5;
};

struct KernelConfig {
    std::string dataDir;
    std::string dbFile = "kernel.db";
    LedgerConfig ledger;
    BudgetConfig budget;
    ArbiterConfig arbiter;
    GuardianConfig guardian;
    LogConfig log;
};

class Config {
public:
    static Config& instance();

    bool load(const std::string& path);
    bool save(const std::string& path);
    bool loadDefaults();
    void reset();

    std::string getString(const std::string& key, const std::string& def = "") const;
    int getInt(const std::string& key, int def = 0) const;
    int64_t getInt64(const std::string& key, int64_t def = 0) const;
    double getDouble(const std::string& key, double def = 0.0) const;
    bool getBool(const std::string& key, bool def = false) const;
    std::vector<std::string> getList(const std::string& key) const;

    void set(const std::string& key, const std::string& value);
    void set(const std::string& key, const char* value);
    void set(const std::string& key, int value);
    void set(const std::string& key, int64_t value);
    void set(const std::string& key, double value);
    void set(const std::string& key, bool value);
    void setList(const std::string& key, const std::vector<std::string>& values);

    bool has(const std::string& key) const;
    void remove(const std::string& key);
    std::vector<std::string> keys(const std::string& prefix = "") const;

    LedgerConfig getLedgerConfig() const;
    BudgetConfig getBudgetConfig() const;
    ArbiterConfig getArbiterConfig() const;
    GuardianConfig getGuardianConfig() const;
    LogConfig getLogConfig() const;
    KernelConfig getKernelConfig() const;

    void setLedgerConfig(const LedgerConfig& config);
    void setBudgetConfig(const BudgetConfig& config);
    void setArbiterConfig(const ArbiterConfig& config);
    void setGuardianConfig(const GuardianConfig& config);

    void onChange(std::function<void(const std::string&)> callback);

    std::string getDataDir() const;
    std::string getConfigPath() const;
    void setDataDir(const std::string& path);

    void clear();
    size_t size() const;
    bool empty() const;

private:
    Config();
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}
}
