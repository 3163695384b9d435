#pragma once

#include "core/kernel_types.h"
#include "core/ledger.h"
#include "core/agent_registry.h"
#include "infrastructure/error_handling.h"
#include "utils/clock.h"
#include "utils/config.h"
#include <string>
#include <vector>
#include <map>
#include <deque>
#include <mutex>
#include <memory>
#include <functional>

namespace substrate {
namespace core {

struct DebitResult {
    bool accepted = false;
    uint64_t amount = 0;
    uint64_t remaining = 0;
    uint64_t ledgerSeq = 0;
};

struct BudgetSummary {
    std::vector<BudgetAccount> accounts;
    uint64_t totalAllocated = 0;
    uint64_t totalConsumed = 0;
    uint64_t totalRemaining = 0;
};

class BudgetRegister {
public:
    BudgetRegister(Ledger& ledger, const AgentRegistry& registry,
                   const utils::BudgetConfig& config = utils::BudgetConfig(),
                   utils::Clock clock = utils::systemClock());
    ~BudgetRegister();

    Result<uint64_t> quote(const std::string& actionKind) const;

    Result<BudgetAccount> openAccount(const std::string& actor, const std::string& agentId,
                                      uint64_t initialAllocation);
    // A zero amount is accepted only for a quoted action kind. intentSeq,
    // when set, names the intent this debit pays for.
    Result<DebitResult> debit(const std::string& agentId, uint64_t amount,
                              const std::string& actionKind = "", uint64_t intentSeq = 0);
    // Tops up the allocation. An expired window is renewed instead, starting
    // over from `amount` with nothing consumed.
    Result<BudgetAccount> allocate(const std::string& authorizer, const std::string& agentId,
                                   uint64_t amount);

    Result<BudgetAccount> account(const std::string& agentId) const;
    BudgetSummary summary() const;
    // Committed debits on the authoritative ledger path. An empty kind sums
    // every debit, including direct ones.
    Result<uint64_t> totalCost(const std::string& agentId, const std::string& actionKind = "") const;

    void onSignal(std::function<void(const Signal&)> callback);

    // Account opening that commits inside another component's ledger entry,
    // such as an agent registration. The caller holds lockAccounts() until
    // that append returns; `fields` receives the account's payload fields.
    std::unique_lock<std::mutex> lockAccounts();
    Result<Mutation> accountOpening(const std::string& agentId, uint64_t initialAllocation, Payload& fields);

private:
    friend class Guardian;
    friend class Kernel;

    struct Slot {
        std::mutex mtx;
        BudgetAccount account;
        std::deque<uint64_t> attempts;
    };

    std::shared_ptr<Slot> findSlot(const std::string& agentId) const;
    uint32_t recordAttempt(Slot& slot, uint64_t now);
    void emit(const std::vector<Signal>& signals);
    Result<DebitResult> rejectGated(const std::string& agentId, uint64_t amount,
                                    const std::string& actionKind, uint64_t intentSeq, const Error& gate);

    // Locks the account map and every account, in key order. Held by the
    // Guardian across a rollback.
    std::vector<std::unique_lock<std::mutex>> lockAll();
    // Caller must hold lockAll(). Accounts absent from state are zeroed.
    void restoreLocked(const std::map<std::string, BudgetAccount>& state);
    void stageAccounts(database::WriteBatch& batch, const std::map<std::string, BudgetAccount>& state,
                       uint64_t seq) const;

    Ledger& ledger_;
    const AgentRegistry& registry_;
    utils::BudgetConfig config_;
    utils::Clock clock_;
    std::map<std::string, std::shared_ptr<Slot>> accounts_;
    mutable std::mutex mapMutex_;
    std::vector<std::function<void(const Signal&)>> callbacks_;
    mutable std::mutex callbackMutex_;
};

std::string budgetKey(const std::string& agentId);

}
}
