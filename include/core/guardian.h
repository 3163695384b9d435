#pragma once

#include "core/kernel_types.h"
#include "core/ledger.h"
#include "core/agent_registry.h"
#include "core/budget.h"
#include "core/arbiter.h"
#include "core/replay.h"
#include "infrastructure/error_handling.h"
#include "utils/clock.h"
#include "utils/config.h"
#include "utils/threading.h"
#include <string>
#include <vector>
#include <map>
#include <mutex>
#include <memory>
#include <thread>
#include <atomic>
#include <future>
#include <condition_variable>

namespace substrate {
namespace core {

struct RuleResult {
    bool fired = false;
    std::string reason;
};

// Rules are evaluated concurrently on the Guardian's worker pool, so
// implementations must be thread-safe. evaluate() must return in bounded
// time: a slow rule only flags a review, but destroying the Guardian joins
// the pool and waits for every rule still running.
class GuardianRule {
public:
    virtual ~GuardianRule() = default;
    virtual std::string name() const = 0;
    virtual RuleResult evaluate(const Signal& signal) = 0;
    virtual void reset(const std::string& agentId) { (void)agentId; }
};

class BudgetVelocityRule : public GuardianRule {
public:
    std::string name() const override { return "budget_velocity"; }
    RuleResult evaluate(const Signal& signal) override;
};

// Fires after `limit` consecutive `counted` signals for one agent. A
// `resetBy` signal starts the streak over.
class StreakRule : public GuardianRule {
public:
    StreakRule(std::string name, SignalKind counted, SignalKind resetBy, uint32_t limit);

    std::string name() const override { return name_; }
    RuleResult evaluate(const Signal& signal) override;
    void reset(const std::string& agentId) override;

    uint32_t streak(const std::string& agentId) const;

private:
    std::string name_;
    SignalKind counted_;
    SignalKind resetBy_;
    uint32_t limit_;
    std::map<std::string, uint32_t> streaks_;
    mutable std::mutex mtx_;
};

class ModeDenialStreakRule : public StreakRule {
public:
    explicit ModeDenialStreakRule(uint32_t limit);
};

class BudgetRejectionStreakRule : public StreakRule {
public:
    explicit BudgetRejectionStreakRule(uint32_t limit);
};

class ActionFailureStreakRule : public StreakRule {
public:
    explicit ActionFailureStreakRule(uint32_t limit);
};

enum class VerdictAction : uint8_t {
    ALLOW = 0,
    QUARANTINE = 1,
    PROVISIONAL_ALLOW = 2
};

const char* verdictActionToString(VerdictAction action);

struct Verdict {
    VerdictAction action = VerdictAction::ALLOW;
    std::string rule;
    std::string reason;
    uint64_t ledgerSeq = 0;
    std::vector<uint64_t> reviews;
};

struct RollbackResult {
    Checkpoint checkpoint;
    uint64_t ledgerSeq = 0;
    ModeState mode;
    std::vector<BudgetAccount> accounts;
};

struct ReviewCycleReport {
    uint32_t cleared = 0;
    uint32_t escalated = 0;
    uint32_t released = 0;
};

extern const char* const GUARDIAN_ACTOR;

class Guardian {
public:
    Guardian(Ledger& ledger, AgentRegistry& registry, BudgetRegister& budget, Arbiter& arbiter,
             const utils::GuardianConfig& config = utils::GuardianConfig(),
             utils::Clock clock = utils::systemClock());
    ~Guardian();

    Guardian(const Guardian&) = delete;
    Guardian& operator=(const Guardian&) = delete;

    void addRule(std::shared_ptr<GuardianRule> rule);
    void addDefaultRules();
    size_t ruleCount() const;

    Verdict evaluate(const std::string& agentId, const Signal& signal);

    Result<QuarantineRecord> quarantine(const std::string& actor, const std::string& agentId,
                                        const std::string& reason);
    Result<QuarantineRecord> release(const std::string& actor, const std::string& agentId);
    Result<Agent> terminate(const std::string& actor, const std::string& agentId,
                            const std::string& reason);

    Result<Checkpoint> createCheckpoint(const std::string& actor, const std::string& description);
    Result<RollbackResult> rollback(const std::string& actor, const std::string& checkpointId);

    ReviewCycleReport runReviewCycle();
    void start();
    void stop();
    bool isRunning() const;

    std::vector<QuarantineRecord> quarantines() const;
    Result<QuarantineRecord> quarantineRecord(const std::string& agentId) const;
    std::vector<Checkpoint> checkpoints() const;
    std::vector<ReviewFlag> reviewFlags() const;
    size_t pendingReviews() const;

    // Rebuilds Guardian state from a ledger replay when a store is reopened.
    void restore(const FullReplay& replay);

private:
    struct PendingReview {
        uint64_t id = 0;
        std::string agentId;
        std::string rule;
        uint64_t deadline = 0;
        std::shared_future<RuleResult> result;
    };

    Result<QuarantineRecord> quarantineLocked(const std::string& actor, const std::string& agentId,
                                              const std::string& trigger, const std::string& reason,
                                              uint64_t reviewId = 0);
    Result<QuarantineRecord> releaseLocked(const std::string& actor, const std::string& agentId,
                                           const std::string& releasedBy);
    Result<ReviewFlag> flagReviewLocked(const std::string& agentId, const std::string& rule,
                                        std::shared_future<RuleResult> result);
    Result<LedgerEntry> clearReviewLocked(uint64_t reviewId, const std::string& reason);
    void resetRules(const std::string& agentId);
    std::vector<std::shared_ptr<GuardianRule>> rulesSnapshot() const;
    void reviewLoop();

    Ledger& ledger_;
    AgentRegistry& registry_;
    BudgetRegister& budget_;
    Arbiter& arbiter_;
    utils::GuardianConfig config_;
    utils::Clock clock_;
    std::unique_ptr<utils::ThreadPool> pool_;

    std::vector<std::shared_ptr<GuardianRule>> rules_;
    mutable std::mutex rulesMutex_;

    std::map<std::string, QuarantineRecord> quarantines_;
    std::vector<Checkpoint> checkpoints_;
    std::vector<ReviewFlag> reviewFlags_;
    std::map<uint64_t, PendingReview> pending_;
    uint64_t nextCheckpointId_ = 1;
    uint64_t nextReviewId_ = 1;
    mutable std::mutex mtx_;

    std::thread reviewThread_;
    std::atomic<bool> running_{false};
    std::mutex wakeMutex_;
    std::condition_variable wake_;
};

std::string quarantineKey(const std::string& agentId);
std::string checkpointKey(const std::string& checkpointId);

}
}
