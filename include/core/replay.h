#pragma once

#include "core/kernel_types.h"
#include "core/ledger.h"
#include <string>
#include <vector>
#include <map>
#include <cstdint>

namespace substrate {
namespace core {

// Budget and mode state folded along the authoritative ledger path.
struct ReplayState {
    std::map<std::string, BudgetAccount> accounts;
    // Committed debit amounts per agent, keyed by action kind ("" for
    // direct debits).
    std::map<std::string, std::map<std::string, uint64_t>> costs;
    ModeState mode;
    std::vector<uint64_t> path;
};

// Everything rollback does not rewrite, rebuilt from the whole ledger.
struct FullReplay {
    std::vector<Agent> agents;
    std::map<std::string, QuarantineRecord> quarantines;
    std::vector<Checkpoint> checkpoints;
    std::vector<ReviewFlag> reviewFlags;
    std::vector<ModeChangeRequest> requests;
    std::vector<ConflictResolution> conflicts;
    std::map<uint64_t, OpenIntent> openIntents;
};

// Entries must be contiguous from genesis. Walking back from the last
// entry, each committed rollback jumps to the sequence of its checkpoint.
std::vector<uint64_t> authoritativePath(const std::vector<LedgerEntry>& entries);

ReplayState replayAuthoritative(const std::vector<LedgerEntry>& entries);
FullReplay replayFull(const std::vector<LedgerEntry>& entries);

}
}
