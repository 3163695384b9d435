#pragma once

#include "core/kernel_types.h"
#include "core/payload.h"
#include "core/ledger.h"
#include "core/agent_registry.h"
#include "core/budget.h"
#include "core/arbiter.h"
#include "core/guardian.h"
#include "infrastructure/error_handling.h"
#include "utils/clock.h"
#include "utils/config.h"
#include <string>
#include <vector>
#include <memory>
#include <functional>

namespace substrate {
namespace core {

struct ActionReceipt {
    std::string actionKind;
    uint64_t intentSeq = 0;
    uint64_t debitSeq = 0;
    uint64_t outcomeSeq = 0;
    uint64_t cost = 0;
    uint64_t remaining = 0;
    bool succeeded = false;
    Payload result;
};

using ActionEffect = std::function<Result<Payload>()>;

class Kernel {
public:
    explicit Kernel(const utils::KernelConfig& config = utils::KernelConfig(),
                    utils::Clock clock = utils::systemClock());
    ~Kernel();

    Kernel(const Kernel&) = delete;
    Kernel& operator=(const Kernel&) = delete;

    // ":memory:" opens a volatile kernel.
    bool open(const std::string& dbPath);
    bool open();
    void close();
    bool isOpen() const;

    // Agent runtime
    Result<Agent> registerAgent(const Caller& caller, const std::string& agentId, AgentType type,
                                uint64_t initialAllocation);
    Result<LedgerEntry> submitIntent(const Caller& caller, const std::string& actionKind,
                                     const Payload& payload);
    Result<DebitResult> debit(const Caller& caller, uint64_t amount);
    // Pays the quoted cost of the caller's open intent. A refused debit
    // closes the intent with a failed outcome.
    Result<DebitResult> debitIntent(const Caller& caller, uint64_t intentSeq);
    // The intent must be the caller's, paid for, and without an outcome.
    Result<LedgerEntry> submitOutcome(const Caller& caller, uint64_t intentSeq, bool success,
                                      const Payload& result);
    Result<ModeChangeRequest> requestModeChange(const Caller& caller, Mode target,
                                                const std::string& justification);
    Result<ActionReceipt> executeAction(const Caller& caller, const std::string& actionKind,
                                        const Payload& payload, ActionEffect effect);

    // Operator and auditor
    Result<BudgetAccount> allocate(const Caller& caller, const std::string& agentId, uint64_t amount);
    Result<ConflictResolution> resolveConflict(const Caller& caller, const std::string& conflictType,
                                               const std::vector<std::string>& agents,
                                               const std::string& resolution);
    Result<Checkpoint> createCheckpoint(const Caller& caller, const std::string& description);
    Result<RollbackResult> rollback(const Caller& caller, const std::string& checkpointId);
    Result<QuarantineRecord> quarantine(const Caller& caller, const std::string& agentId,
                                        const std::string& reason);
    Result<QuarantineRecord> release(const Caller& caller, const std::string& agentId);
    Result<Agent> terminate(const Caller& caller, const std::string& agentId, const std::string& reason);
    Result<ChainReport> verifyChain(const Caller& caller, uint64_t from = GENESIS_SEQ,
                                    uint64_t to = LEDGER_END);
    Result<std::vector<LedgerEntry>> getLedgerRange(const Caller& caller, uint64_t from, uint64_t to);
    Result<BudgetSummary> getBudgetSummary(const Caller& caller);
    Result<uint64_t> getTotalCost(const Caller& caller, const std::string& agentId,
                                  const std::string& actionKind = "");
    Result<void> exportLedger(const Caller& caller, const std::string& path);

    // Read-only views. Every write goes through a Caller-checked call above.
    const Ledger& ledger() const;
    const AgentRegistry& registry() const;
    const BudgetRegister& budget() const;
    const Arbiter& arbiter() const;
    const Guardian& guardian() const;
    const utils::KernelConfig& config() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}
}
