#pragma once

#include "core/payload.h"
#include "crypto/crypto.h"
#include "database/database.h"
#include "infrastructure/error_handling.h"
#include "utils/clock.h"
#include "utils/config.h"
#include <string>
#include <vector>
#include <cstdint>
#include <memory>
#include <functional>
#include <limits>

namespace substrate {
namespace core {

enum class Outcome : uint8_t {
    INTENT = 0,
    COMMITTED = 1,
    FAILED = 2
};

const char* outcomeToString(Outcome outcome);

constexpr uint64_t GENESIS_SEQ = 0;
constexpr uint64_t LEDGER_END = std::numeric_limits<uint64_t>::max();

extern const char* const GENESIS_ACTOR;
extern const char* const GENESIS_KIND;

struct LedgerEntry {
    uint64_t seq = 0;
    uint64_t timestamp = 0;
    std::string actor;
    std::string kind;
    Outcome outcome = Outcome::COMMITTED;
    Payload payload;
    crypto::Hash256 payloadDigest{};
    crypto::Hash256 prevHash{};
    crypto::Hash256 hash{};

    std::vector<uint8_t> serialize() const;
    static bool deserialize(const std::vector<uint8_t>& data, LedgerEntry& out);
    crypto::Hash256 computeHash() const;
    std::string toJson() const;
};

struct AppendRequest {
    std::string actor;
    std::string kind;
    Payload payload;
    Outcome outcome = Outcome::COMMITTED;
};

// State change bound to a ledger entry. stage() adds table rows to the
// same storage transaction as the entry; apply() runs after that
// transaction commits, while the ledger is still held, and is the only
// place in-memory kernel state may change.
struct Mutation {
    std::function<void(database::WriteBatch&, const LedgerEntry&)> stage;
    std::function<void(const LedgerEntry&)> apply;
};

struct ChainReport {
    bool intact = true;
    uint64_t from = 0;
    uint64_t to = 0;
    uint64_t entriesChecked = 0;
    uint64_t breakSeq = 0;
    std::string reason;
};

std::string entryKey(uint64_t seq);

class Ledger {
public:
    explicit Ledger(const utils::LedgerConfig& config = utils::LedgerConfig(),
                    utils::Clock clock = utils::systemClock());
    ~Ledger();

    bool open(const std::string& dbPath);
    void close();
    bool isOpen() const;

    Result<LedgerEntry> append(const AppendRequest& request, const Mutation& mutation = Mutation());
    // Fails with CONCURRENT_APPEND_CONFLICT unless the tail is still
    // expectedTail (LEDGER_END accepts any tail) and the stored tail row
    // matches this ledger's view.
    Result<LedgerEntry> tryAppend(const AppendRequest& request, uint64_t expectedTail,
                                  const Mutation& mutation = Mutation());

    Result<LedgerEntry> getEntry(uint64_t seq) const;
    std::vector<LedgerEntry> getRange(uint64_t from, uint64_t to) const;
    std::vector<LedgerEntry> getEntriesByActor(const std::string& actor, size_t limit = 0) const;
    std::vector<LedgerEntry> getEntriesByKind(const std::string& kind, size_t limit = 0) const;

    uint64_t tailSequence() const;
    crypto::Hash256 tailHash() const;
    uint64_t entryCount() const;

    ChainReport verifyChain(uint64_t from = GENESIS_SEQ, uint64_t to = LEDGER_END) const;
    bool exportToFile(const std::string& path) const;

    void onAppend(std::function<void(const LedgerEntry&)> callback);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}
}
