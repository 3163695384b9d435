#include "utils/config.h"
#include <unordered_map>
#include <fstream>
#include <sstream>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <stdexcept>
#include <mutex>

namespace substrate {
namespace utils {

namespace {

const char* COST_PREFIX = "cost.";

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r");
    return s.substr(start, end - start + 1);
}

}

struct Config::Impl {
    std::unordered_map<std::string, std::string> data;
    std::string configPath;
    std::string dataDir;
    std::function<void(const std::string&)> changeCallback;
    mutable std::mutex mtx;

    void put(const std::string& key, const std::string& value) {
        std::function<void(const std::string&)> cb;
        {
            std::lock_guard<std::mutex> lock(mtx);
            data[key] = value;
            cb = changeCallback;
        }
        if (cb) cb(key);
    }

    bool lookup(const std::string& key, std::string& out) const {
        std::lock_guard<std::mutex> lock(mtx);
        auto it = data.find(key);
        if (it == data.end()) return false;
        out = it->second;
        return true;
    }
};

Config::Config() : impl_(std::make_unique<Impl>()) {
    const char* home = std::getenv("HOME");
    if (home) {
        impl_->dataDir = std::string(home) + "/.echosubstrate";
    } else {
        impl_->dataDir = ".echosubstrate";
    }
    loadDefaults();
}

Config& Config::instance() {
    static Config inst;
    return inst;
}

bool Config::loadDefaults() {
    set("kernel.db_file", "kernel.db");

    set("ledger.max_append_retries", 8);
    set("ledger.retry_backoff_ms", 1);

    set("budget.velocity_window_ms", 3000);
    set("budget.velocity_max_debits", 3);
    set("budget.window_ms", 0);

    set("cost.compute", 1);
    set("cost.api_call", 5);
    set("cost.storage", 2);
    set("cost.reputation", 10);

    set("arbiter.thrash_window_ms", 60000);
    set("arbiter.thrash_limit", 3);
    set("arbiter.min_role.observe", "agent");
    set("arbiter.min_role.alert", "agent");
    set("arbiter.min_role.act", "operator");
    set("arbiter.min_role.defend", "operator");

    set("guardian.evaluation_budget_ms", 50);
    set("guardian.review_deadline_ms", 5000);
    set("guardian.review_interval_ms", 250);
    set("guardian.quarantine_expiry_ms", 0);
    set("guardian.max_mode_denials", 3);
    set("guardian.max_budget_rejections", 5);
    set("guardian.max_action_failures", 3);
    set("guardian.worker_threads", 2);

    set("log.level", "info");
    set("log.file", "");
    set("log.max_file_bytes", static_cast<int64_t>(10 * 1024 * 1024));
    set("log.max_files", 5);

    return true;
}

void Config::reset() {
    {
        std::lock_guard<std::mutex> lock(impl_->mtx);
        impl_->data.clear();
    }
    loadDefaults();
}

bool Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) return false;

    std::lock_guard<std::mutex> lock(impl_->mtx);
    impl_->configPath = path;
    std::string line;

    while (std::getline(file, line)) {
        std::string trimmed = trim(line);
        if (trimmed.empty() || trimmed[0] == '#') continue;

        auto pos = trimmed.find('=');
        if (pos == std::string::npos) continue;

        std::string key = trim(trimmed.substr(0, pos));
        std::string value = trim(trimmed.substr(pos + 1));
        if (key.empty()) continue;
        impl_->data[key] = value;
    }
    return true;
}

bool Config::save(const std::string& path) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    std::string savePath = path.empty() ? impl_->configPath : path;
    if (savePath.empty()) return false;

    std::ofstream file(savePath);
    if (!file.is_open()) return false;

    file << "# EchoSubstrate kernel configuration\n\n";

    std::vector<std::string> sortedKeys;
    for (const auto& [key, value] : impl_->data) {
        sortedKeys.push_back(key);
    }
    std::sort(sortedKeys.begin(), sortedKeys.end());

    std::string lastPrefix;
    for (const auto& key : sortedKeys) {
        auto pos = key.find('.');
        std::string prefix = pos != std::string::npos ? key.substr(0, pos) : "";
        if (prefix != lastPrefix && !lastPrefix.empty()) {
            file << "\n";
        }
        lastPrefix = prefix;
        file << key << "=" << impl_->data[key] << "\n";
    }
    return file.good();
}

std::string Config::getString(const std::string& key, const std::string& def) const {
    std::string value;
    return impl_->lookup(key, value) ? value : def;
}

int Config::getInt(const std::string& key, int def) const {
    std::string value;
    if (!impl_->lookup(key, value)) return def;
    try { return std::stoi(value); }
    catch (const std::exception&) { return def; }
}

int64_t Config::getInt64(const std::string& key, int64_t def) const {
    std::string value;
    if (!impl_->lookup(key, value)) return def;
    try { return std::stoll(value); }
    catch (const std::exception&) { return def; }
}

double Config::getDouble(const std::string& key, double def) const {
    std::string value;
    if (!impl_->lookup(key, value)) return def;
    try { return std::stod(value); }
    catch (const std::exception&) { return def; }
}

bool Config::getBool(const std::string& key, bool def) const {
    std::string val;
    if (!impl_->lookup(key, val)) return def;
    std::transform(val.begin(), val.end(), val.begin(), [](unsigned char c) { return std::tolower(c); });
    return val == "true" || val == "1" || val == "yes" || val == "on";
}

std::vector<std::string> Config::getList(const std::string& key) const {
    std::vector<std::string> result;
    std::string value;
    if (!impl_->lookup(key, value)) return result;

    std::istringstream iss(value);
    std::string item;
    while (std::getline(iss, item, ',')) {
        item = trim(item);
        if (!item.empty()) result.push_back(item);
    }
    return result;
}

void Config::set(const std::string& key, const std::string& value) {
    impl_->put(key, value);
}

void Config::set(const std::string& key, const char* value) {
    impl_->put(key, value ? std::string(value) : std::string());
}

void Config::set(const std::string& key, int value) {
    impl_->put(key, std::to_string(value));
}

void Config::set(const std::string& key, int64_t value) {
    impl_->put(key, std::to_string(value));
}

void Config::set(const std::string& key, double value) {
    impl_->put(key, std::to_string(value));
}

void Config::set(const std::string& key, bool value) {
    impl_->put(key, value ? "true" : "false");
}

void Config::setList(const std::string& key, const std::vector<std::string>& values) {
    std::string joined;
    for (size_t i = 0; i < values.size(); i++) {
        if (i > 0) joined += ",";
        joined += values[i];
    }
    impl_->put(key, joined);
}

bool Config::has(const std::string& key) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->data.find(key) != impl_->data.end();
}

void Config::remove(const std::string& key) {
    std::function<void(const std::string&)> cb;
    {
        std::lock_guard<std::mutex> lock(impl_->mtx);
        impl_->data.erase(key);
        cb = impl_->changeCallback;
    }
    if (cb) cb(key);
}

std::vector<std::string> Config::keys(const std::string& prefix) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    std::vector<std::string> result;
    for (const auto& [key, value] : impl_->data) {
        if (prefix.empty() || key.compare(0, prefix.size(), prefix) == 0) {
            result.push_back(key);
        }
    }
    std::sort(result.begin(), result.end());
    return result;
}

LedgerConfig Config::getLedgerConfig() const {
    LedgerConfig cfg;
    cfg.maxAppendRetries = static_cast<uint32_t>(getInt("ledger.max_append_retries", 8));
    cfg.retryBackoffMs = static_cast<uint32_t>(getInt("ledger.retry_backoff_ms", 1));
    return cfg;
}

BudgetConfig Config::getBudgetConfig() const {
    BudgetConfig cfg;
    cfg.velocityWindowMs = static_cast<uint64_t>(getInt64("budget.velocity_window_ms", 3000));
    cfg.velocityMaxDebits = static_cast<uint32_t>(getInt("budget.velocity_max_debits", 3));
    cfg.windowMs = static_cast<uint64_t>(std::max<int64_t>(0, getInt64("budget.window_ms", 0)));
    std::string prefix = COST_PREFIX;
    for (const auto& key : keys(prefix)) {
        int64_t cost = getInt64(key, -1);
        if (cost < 0) continue;
        cfg.costs[key.substr(prefix.size())] = static_cast<uint64_t>(cost);
    }
    return cfg;
}

ArbiterConfig Config::getArbiterConfig() const {
    ArbiterConfig cfg;
    cfg.thrashWindowMs = static_cast<uint64_t>(getInt64("arbiter.thrash_window_ms", 60000));
    cfg.thrashLimit = static_cast<uint32_t>(getInt("arbiter.thrash_limit", 3));
    cfg.minRoleObserve = getString("arbiter.min_role.observe", "agent");
    cfg.minRoleAlert = getString("arbiter.min_role.alert", "agent");
    cfg.minRoleAct = getString("arbiter.min_role.act", "operator");
    cfg.minRoleDefend = getString("arbiter.min_role.defend", "operator");
    return cfg;
}

GuardianConfig Config::getGuardianConfig() const {
    GuardianConfig cfg;
    cfg.evaluationBudgetMs = static_cast<uint64_t>(getInt64("guardian.evaluation_budget_ms", 50));
    cfg.reviewDeadlineMs = static_cast<uint64_t>(getInt64("guardian.review_deadline_ms", 5000));
    cfg.reviewIntervalMs = static_cast<uint64_t>(getInt64("guardian.review_interval_ms", 250));
    cfg.quarantineExpiryMs = static_cast<uint64_t>(getInt64("guardian.quarantine_expiry_ms", 0));
    cfg.maxModeDenials = static_cast<uint32_t>(getInt("guardian.max_mode_denials", 3));
    cfg.maxBudgetRejections = static_cast<uint32_t>(getInt("guardian.max_budget_rejections", 5));
    cfg.maxActionFailures = static_cast<uint32_t>(getInt("guardian.max_action_failures", 3));
    cfg.workerThreads = static_cast<uint32_t>(getInt("guardian.worker_threads", 2));
    return cfg;
}

LogConfig Config::getLogConfig() const {
    LogConfig cfg;
    cfg.level = getString("log.level", "info");
    cfg.file = getString("log.file", "");
    cfg.maxFileBytes = static_cast<uint64_t>(std::max<int64_t>(0, getInt64("log.max_file_bytes", 10 * 1024 * 1024)));
    cfg.maxFiles = static_cast<uint32_t>(std::max(0, getInt("log.max_files", 5)));
    return cfg;
}

KernelConfig Config::getKernelConfig() const {
    KernelConfig cfg;
    cfg.dataDir = getString("kernel.data_dir", getDataDir());
    cfg.dbFile = getString("kernel.db_file", "kernel.db");
    cfg.ledger = getLedgerConfig();
    cfg.budget = getBudgetConfig();
    cfg.arbiter = getArbiterConfig();
    cfg.guardian = getGuardianConfig();
    cfg.log = getLogConfig();
    return cfg;
}

void Config::setLedgerConfig(const LedgerConfig& cfg) {
    set("ledger.max_append_retries", static_cast<int>(cfg.maxAppendRetries));
    set("ledger.retry_backoff_ms", static_cast<int>(cfg.retryBackoffMs));
}

void Config::setBudgetConfig(const BudgetConfig& cfg) {
    set("budget.velocity_window_ms", static_cast<int64_t>(cfg.velocityWindowMs));
    set("budget.velocity_max_debits", static_cast<int>(cfg.velocityMaxDebits));
    set("budget.window_ms", static_cast<int64_t>(cfg.windowMs));
    for (const auto& [kind, cost] : cfg.costs) {
        set(COST_PREFIX + kind, static_cast<int64_t>(cost));
    }
}

void Config::setArbiterConfig(const ArbiterConfig& cfg) {
    set("arbiter.thrash_window_ms", static_cast<int64_t>(cfg.thrashWindowMs));
    set("arbiter.thrash_limit", static_cast<int>(cfg.thrashLimit));
    set("arbiter.min_role.observe", cfg.minRoleObserve);
    set("arbiter.min_role.alert", cfg.minRoleAlert);
    set("arbiter.min_role.act", cfg.minRoleAct);
    set("arbiter.min_role.defend", cfg.minRoleDefend);
}

void Config::setGuardianConfig(const GuardianConfig& cfg) {
    set("guardian.evaluation_budget_ms", static_cast<int64_t>(cfg.evaluationBudgetMs));
    set("guardian.review_deadline_ms", static_cast<int64_t>(cfg.reviewDeadlineMs));
    set("guardian.review_interval_ms", static_cast<int64_t>(cfg.reviewIntervalMs));
    set("guardian.quarantine_expiry_ms", static_cast<int64_t>(cfg.quarantineExpiryMs));
    set("guardian.max_mode_denials", static_cast<int>(cfg.maxModeDenials));
    set("guardian.max_budget_rejections", static_cast<int>(cfg.maxBudgetRejections));
    set("guardian.max_action_failures", static_cast<int>(cfg.maxActionFailures));
    set("guardian.worker_threads", static_cast<int>(cfg.workerThreads));
}

void Config::onChange(std::function<void(const std::string&)> callback) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    impl_->changeCallback = callback;
}

std::string Config::getDataDir() const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->dataDir;
}

std::string Config::getConfigPath() const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->configPath;
}

void Config::setDataDir(const std::string& path) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    impl_->dataDir = path;
}

void Config::clear() {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    impl_->data.clear();
}

size_t Config::size() const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->data.size();
}

bool Config::empty() const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->data.empty();
}

}
}
