#include "core/ledger.h"
#include "utils/logger.h"
#include "utils/serialize.h"
#include <nlohmann/json.hpp>
#include <mutex>
#include <fstream>
#include <algorithm>
#include <thread>
#include <chrono>
#include <cstdio>
#include <stdexcept>

namespace substrate {
namespace core {

const char* const GENESIS_ACTOR = "kernel";
const char* const GENESIS_KIND = "ledger.genesis";

namespace {

const char* ENTRY_PREFIX = "entry:";
const char* ENTRY_END = "entry;";
const char* TAIL_KEY = "meta:tail";
const uint32_t MAX_BACKOFF_SHIFT = 10;

void logLedger(utils::LogLevel level, const std::string& msg) {
    utils::Logger::log(level, "ledger", msg);
}

}

const char* outcomeToString(Outcome outcome) {
    switch (outcome) {
        case Outcome::INTENT: return "intent";
        case Outcome::COMMITTED: return "committed";
        case Outcome::FAILED: return "failed";
        default: return "unknown";
    }
}

std::string entryKey(uint64_t seq) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%020llu", static_cast<unsigned long long>(seq));
    return std::string(ENTRY_PREFIX) + buf;
}

std::vector<uint8_t> LedgerEntry::serialize() const {
    utils::ByteBuffer buf;
    buf.writeUint64(seq);
    buf.writeUint64(timestamp);
    buf.writeString(actor);
    buf.writeString(kind);
    buf.writeUint8(static_cast<uint8_t>(outcome));
    buf.writeBytes(payload.encode());
    buf.writeFixedBytes(payloadDigest.data(), payloadDigest.size());
    buf.writeFixedBytes(prevHash.data(), prevHash.size());
    buf.writeFixedBytes(hash.data(), hash.size());
    return buf.data();
}

bool LedgerEntry::deserialize(const std::vector<uint8_t>& data, LedgerEntry& out) {
    utils::ByteBuffer buf(data);
    LedgerEntry e;
    try {
        e.seq = buf.readUint64();
        e.timestamp = buf.readUint64();
        e.actor = buf.readString();
        e.kind = buf.readString();
        uint8_t outcome = buf.readUint8();
        if (outcome > static_cast<uint8_t>(Outcome::FAILED)) return false;
        e.outcome = static_cast<Outcome>(outcome);
        if (!Payload::decode(buf.readBytes(), e.payload)) return false;
        buf.readFixedBytes(e.payloadDigest.data(), e.payloadDigest.size());
        buf.readFixedBytes(e.prevHash.data(), e.prevHash.size());
        buf.readFixedBytes(e.hash.data(), e.hash.size());
    } catch (const std::out_of_range&) {
        return false;
    }
    if (!buf.atEnd()) return false;
    out = std::move(e);
    return true;
}

crypto::Hash256 LedgerEntry::computeHash() const {
    utils::ByteBuffer buf;
    buf.writeUint64(seq);
    buf.writeUint64(timestamp);
    buf.writeString(actor);
    buf.writeString(kind);
    buf.writeUint8(static_cast<uint8_t>(outcome));
    buf.writeFixedBytes(payloadDigest.data(), payloadDigest.size());
    buf.writeFixedBytes(prevHash.data(), prevHash.size());
    return crypto::sha256(buf.data());
}

std::string LedgerEntry::toJson() const {
    nlohmann::json fields = nlohmann::json::object();
    for (const auto& [key, value] : payload.fields()) {
        fields[key] = value;
    }

    nlohmann::json j;
    j["seq"] = seq;
    j["timestamp"] = timestamp;
    j["actor"] = actor;
    j["kind"] = kind;
    j["outcome"] = outcomeToString(outcome);
    j["payload"] = fields;
    j["payloadDigest"] = crypto::toHex(payloadDigest);
    j["prevHash"] = crypto::toHex(prevHash);
    j["hash"] = crypto::toHex(hash);
    return j.dump();
}

struct Ledger::Impl {
    database::Database db;
    utils::LedgerConfig config;
    utils::Clock clock;
    std::vector<LedgerEntry> entries;
    std::vector<std::function<void(const LedgerEntry&)>> callbacks;
    mutable std::mutex mtx;
    uint64_t lastTimestamp = 0;
    bool isOpen = false;

    std::vector<uint8_t> tailMarker() const {
        if (entries.empty()) return {};
        utils::ByteBuffer buf;
        buf.writeUint64(entries.back().seq);
        buf.writeFixedBytes(entries.back().hash.data(), entries.back().hash.size());
        return buf.data();
    }

    std::vector<uint8_t> markerFor(const LedgerEntry& e) const {
        utils::ByteBuffer buf;
        buf.writeUint64(e.seq);
        buf.writeFixedBytes(e.hash.data(), e.hash.size());
        return buf.data();
    }

    bool loadFromStore();
    Result<LedgerEntry> commit(const AppendRequest& request, const Mutation& mutation);
};

bool Ledger::Impl::loadFromStore() {
    auto rows = db.getRange(entryKey(entries.size()), ENTRY_END);
    for (const auto& [key, value] : rows) {
        LedgerEntry e;
        if (!LedgerEntry::deserialize(value, e) || e.seq != entries.size() || key != entryKey(e.seq)) {
            logLedger(utils::LogLevel::ERROR, "Unreadable ledger row " + key);
            return false;
        }
        entries.push_back(std::move(e));
    }
    if (!entries.empty()) {
        lastTimestamp = std::max(lastTimestamp, entries.back().timestamp);
    }
    return true;
}

Result<LedgerEntry> Ledger::Impl::commit(const AppendRequest& request, const Mutation& mutation) {
    LedgerEntry e;
    e.seq = entries.empty() ? GENESIS_SEQ : entries.back().seq + 1;
    e.timestamp = std::max(clock(), lastTimestamp);
    e.actor = request.actor;
    e.kind = request.kind;
    e.outcome = request.outcome;
    e.payload = request.payload;
    e.payloadDigest = e.payload.digest();
    if (!entries.empty()) e.prevHash = entries.back().hash;
    e.hash = e.computeHash();

    database::WriteBatch batch;
    batch.put(entryKey(e.seq), e.serialize());
    batch.put(TAIL_KEY, markerFor(e));
    if (mutation.stage) mutation.stage(batch, e);

    database::WriteStatus status = db.writeIf(batch, TAIL_KEY, tailMarker());
    if (status == database::WriteStatus::CONFLICT) {
        return makeError(ErrorCode::CONCURRENT_APPEND_CONFLICT,
                         "Ledger tail advanced in store before seq " + std::to_string(e.seq));
    }
    if (status != database::WriteStatus::OK) {
        std::string msg = "Failed to commit ledger entry " + std::to_string(e.seq) + ": " + db.lastError();
        logLedger(utils::LogLevel::ERROR, msg);
        return makeError(ErrorCode::DATABASE_ERROR, msg);
    }

    entries.push_back(e);
    lastTimestamp = e.timestamp;
    if (mutation.apply) mutation.apply(e);
    return e;
}

Ledger::Ledger(const utils::LedgerConfig& config, utils::Clock clock)
    : impl_(std::make_unique<Impl>()) {
    impl_->config = config;
    impl_->clock = clock ? clock : utils::systemClock();
}

Ledger::~Ledger() {
    close();
}

bool Ledger::open(const std::string& dbPath) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    if (impl_->isOpen) return false;

    if (!impl_->db.open(dbPath)) {
        logLedger(utils::LogLevel::ERROR, "Cannot open ledger store " + dbPath + ": " + impl_->db.lastError());
        return false;
    }

    impl_->entries.clear();
    impl_->lastTimestamp = 0;
    if (!impl_->loadFromStore()) {
        impl_->db.close();
        return false;
    }

    if (impl_->entries.empty()) {
        AppendRequest genesis;
        genesis.actor = GENESIS_ACTOR;
        genesis.kind = GENESIS_KIND;
        genesis.payload.set("version", "1");
        auto r = impl_->commit(genesis, Mutation());
        if (r.failed()) {
            impl_->db.close();
            return false;
        }
        logLedger(utils::LogLevel::INFO, "Genesis entry written to " + dbPath);
    }

    impl_->isOpen = true;
    logLedger(utils::LogLevel::INFO, "Ledger opened at seq " + std::to_string(impl_->entries.back().seq));
    return true;
}

void Ledger::close() {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    if (!impl_->isOpen) return;
    impl_->db.close();
    impl_->entries.clear();
    impl_->isOpen = false;
}

bool Ledger::isOpen() const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->isOpen;
}

Result<LedgerEntry> Ledger::tryAppend(const AppendRequest& request, uint64_t expectedTail,
                                      const Mutation& mutation) {
    if (request.actor.empty() || request.kind.empty()) {
        return makeError(ErrorCode::INVALID_ARGUMENT, "Ledger entry needs an actor and a kind");
    }

    std::vector<std::function<void(const LedgerEntry&)>> callbacks;
    Result<LedgerEntry> result = makeError(ErrorCode::INTERNAL_ERROR, "unreachable");
    {
        std::lock_guard<std::mutex> lock(impl_->mtx);
        if (!impl_->isOpen) {
            return makeError(ErrorCode::DATABASE_ERROR, "Ledger is not open");
        }
        if (expectedTail != LEDGER_END && impl_->entries.back().seq != expectedTail) {
            return makeError(ErrorCode::CONCURRENT_APPEND_CONFLICT,
                             "Expected tail " + std::to_string(expectedTail) +
                             " but tail is " + std::to_string(impl_->entries.back().seq));
        }
        result = impl_->commit(request, mutation);
        if (result.failed()) return result;
        callbacks = impl_->callbacks;
    }

    for (const auto& cb : callbacks) {
        cb(result.value());
    }
    return result;
}

Result<LedgerEntry> Ledger::append(const AppendRequest& request, const Mutation& mutation) {
    for (uint32_t attempt = 0; ; attempt++) {
        // Within this process the ledger mutex already orders writers; only a
        // writer on another connection can move the stored tail.
        auto result = tryAppend(request, LEDGER_END, mutation);
        if (result.ok() || !result.error().retryable()) return result;

        if (attempt >= impl_->config.maxAppendRetries) {
            logLedger(utils::LogLevel::WARN, "Append of " + request.kind + " by " + request.actor +
                      " gave up after " + std::to_string(attempt + 1) + " attempts");
            return result;
        }

        {
            std::lock_guard<std::mutex> lock(impl_->mtx);
            if (impl_->isOpen) impl_->loadFromStore();
        }

        uint32_t shift = std::min(attempt, MAX_BACKOFF_SHIFT);
        uint64_t backoff = static_cast<uint64_t>(impl_->config.retryBackoffMs) << shift;
        if (backoff == 0) {
            std::this_thread::yield();
        } else {
            std::this_thread::sleep_for(std::chrono::milliseconds(backoff));
        }
    }
}

Result<LedgerEntry> Ledger::getEntry(uint64_t seq) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    if (seq >= impl_->entries.size()) {
        return makeError(ErrorCode::NOT_FOUND, "No ledger entry " + std::to_string(seq));
    }
    return impl_->entries[seq];
}

std::vector<LedgerEntry> Ledger::getRange(uint64_t from, uint64_t to) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    std::vector<LedgerEntry> result;
    if (impl_->entries.empty() || from > to || from >= impl_->entries.size()) return result;
    uint64_t last = std::min<uint64_t>(to, impl_->entries.size() - 1);
    result.assign(impl_->entries.begin() + from, impl_->entries.begin() + last + 1);
    return result;
}

std::vector<LedgerEntry> Ledger::getEntriesByActor(const std::string& actor, size_t limit) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    std::vector<LedgerEntry> result;
    for (const auto& e : impl_->entries) {
        if (e.actor != actor) continue;
        result.push_back(e);
        if (limit > 0 && result.size() >= limit) break;
    }
    return result;
}

std::vector<LedgerEntry> Ledger::getEntriesByKind(const std::string& kind, size_t limit) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    std::vector<LedgerEntry> result;
    for (const auto& e : impl_->entries) {
        if (e.kind != kind) continue;
        result.push_back(e);
        if (limit > 0 && result.size() >= limit) break;
    }
    return result;
}

uint64_t Ledger::tailSequence() const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->entries.empty() ? GENESIS_SEQ : impl_->entries.back().seq;
}

crypto::Hash256 Ledger::tailHash() const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->entries.empty() ? crypto::Hash256{} : impl_->entries.back().hash;
}

uint64_t Ledger::entryCount() const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->entries.size();
}

ChainReport Ledger::verifyChain(uint64_t from, uint64_t to) const {
    ChainReport report;
    uint64_t tail = tailSequence();
    if (!isOpen()) {
        report.intact = false;
        report.reason = "ledger not open";
        return report;
    }
    to = std::min(to, tail);
    report.from = from;
    report.to = to;
    if (from > to) return report;

    auto fail = [&report](uint64_t seq, const std::string& reason) {
        report.intact = false;
        report.breakSeq = seq;
        report.reason = reason;
    };

    crypto::Hash256 prev{};
    if (from > GENESIS_SEQ) {
        LedgerEntry before;
        auto raw = impl_->db.get(entryKey(from - 1));
        if (raw.empty() || !LedgerEntry::deserialize(raw, before)) {
            fail(from - 1, "predecessor entry cannot be decoded");
        } else {
            prev = before.hash;
        }
    }

    if (report.intact) {
        auto rows = impl_->db.getRange(entryKey(from), entryKey(to + 1));
        uint64_t expected = from;
        for (const auto& [key, value] : rows) {
            LedgerEntry e;
            if (!LedgerEntry::deserialize(value, e)) {
                fail(expected, "entry cannot be decoded");
                break;
            }
            if (e.seq != expected || key != entryKey(expected)) {
                fail(expected, "sequence gap");
                break;
            }
            if (e.payload.digest() != e.payloadDigest) {
                fail(expected, "payload digest mismatch");
                break;
            }
            if (e.computeHash() != e.hash) {
                fail(expected, "content hash mismatch");
                break;
            }
            bool linked = expected == GENESIS_SEQ ? crypto::isZero(e.prevHash) : e.prevHash == prev;
            if (!linked) {
                fail(expected, "prev-hash link broken");
                break;
            }
            prev = e.hash;
            expected++;
            report.entriesChecked++;
        }
        if (report.intact && expected != to + 1) {
            fail(expected, "missing entry");
        }
    }

    if (!report.intact) {
        std::string msg = "Chain break at seq " + std::to_string(report.breakSeq) + ": " + report.reason;
        logLedger(utils::LogLevel::ERROR, msg);
        Error err = makeError(ErrorCode::CHAIN_VERIFICATION_FAILURE, msg, report.breakSeq);
        err.severity = ErrorSeverity::CRITICAL;
        ErrorHandler::instance().handle(err);
    }
    return report;
}

bool Ledger::exportToFile(const std::string& path) const {
    std::ofstream out(path, std::ios::trunc);
    if (!out.is_open()) {
        logLedger(utils::LogLevel::ERROR, "Cannot export ledger to " + path);
        return false;
    }
    std::lock_guard<std::mutex> lock(impl_->mtx);
    for (const auto& e : impl_->entries) {
        out << e.toJson() << "\n";
    }
    out.flush();
    return out.good();
}

void Ledger::onAppend(std::function<void(const LedgerEntry&)> callback) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    impl_->callbacks.push_back(callback);
}

}
}
