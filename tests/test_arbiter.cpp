#include <gtest/gtest.h>
#include "core/arbiter.h"
#include "core/entry_kinds.h"
#include "core/privilege.h"
#include "test_support.h"

using namespace substrate;
using namespace substrate::core;
using substrate::tests::ManualClock;

namespace {

const Mode ALL_MODES[] = {Mode::OBSERVE, Mode::ALERT, Mode::ACT, Mode::DEFEND};

Caller operatorCaller() {
    return Caller{"op-1", Role::OPERATOR};
}

}

class ArbiterTest : public ::testing::Test {
protected:
    void SetUp() override {
        tests::quietLogs();
        ledger = std::make_unique<Ledger>(utils::LedgerConfig(), clock.clock());
        ASSERT_TRUE(ledger->open(":memory:"));
        registry = std::make_unique<AgentRegistry>(*ledger);
        arbiter = std::make_unique<Arbiter>(*ledger, *registry, utils::ArbiterConfig(), clock.clock());
        arbiter->onDecision([this](const Signal& s) { decisions.push_back(s); });
    }

    ManualClock clock;
    std::unique_ptr<Ledger> ledger;
    std::unique_ptr<AgentRegistry> registry;
    std::unique_ptr<Arbiter> arbiter;
    std::vector<Signal> decisions;
};

TEST_F(ArbiterTest, TransitionTableIsTotal) {
    for (Mode from : ALL_MODES) {
        for (Mode to : ALL_MODES) {
            Decision d = arbiter->decide(from, to, Role::SYSTEM, 0);
            EXPECT_EQ(d.approved, Arbiter::isReachable(from, to))
                << modeToString(from) << " -> " << modeToString(to);
            if (!d.approved) {
                EXPECT_EQ(d.code, ErrorCode::INVALID_TRANSITION);
                EXPECT_FALSE(d.reason.empty());
            }
        }
    }
}

TEST_F(ArbiterTest, TableEntries) {
    EXPECT_TRUE(Arbiter::isReachable(Mode::OBSERVE, Mode::ALERT));
    EXPECT_FALSE(Arbiter::isReachable(Mode::OBSERVE, Mode::ACT));
    EXPECT_TRUE(Arbiter::isReachable(Mode::OBSERVE, Mode::DEFEND));
    EXPECT_TRUE(Arbiter::isReachable(Mode::ALERT, Mode::ACT));
    EXPECT_FALSE(Arbiter::isReachable(Mode::ACT, Mode::ALERT));
    EXPECT_TRUE(Arbiter::isReachable(Mode::DEFEND, Mode::OBSERVE));
    EXPECT_FALSE(Arbiter::isReachable(Mode::DEFEND, Mode::ALERT));
    for (Mode m : ALL_MODES) {
        EXPECT_FALSE(Arbiter::isReachable(m, m));
    }
}

TEST_F(ArbiterTest, DecisionIsPure) {
    Decision a = arbiter->decide(Mode::ALERT, Mode::ACT, Role::AGENT, 1);
    Decision b = arbiter->decide(Mode::ALERT, Mode::ACT, Role::AGENT, 1);
    EXPECT_EQ(a.approved, b.approved);
    EXPECT_EQ(a.code, b.code);
    EXPECT_EQ(a.reason, b.reason);
    EXPECT_EQ(arbiter->currentMode(), Mode::OBSERVE);
}

TEST_F(ArbiterTest, PrivilegePerTarget) {
    EXPECT_TRUE(arbiter->decide(Mode::OBSERVE, Mode::ALERT, Role::AGENT, 0).approved);

    Decision act = arbiter->decide(Mode::ALERT, Mode::ACT, Role::AGENT, 0);
    EXPECT_FALSE(act.approved);
    EXPECT_EQ(act.code, ErrorCode::ARBITRATION_DENIED);
    EXPECT_TRUE(arbiter->decide(Mode::ALERT, Mode::ACT, Role::OPERATOR, 0).approved);

    EXPECT_FALSE(arbiter->decide(Mode::OBSERVE, Mode::DEFEND, Role::AGENT, 0).approved);
    EXPECT_FALSE(arbiter->decide(Mode::OBSERVE, Mode::ALERT, Role::AUDITOR, 0).approved);
}

TEST_F(ArbiterTest, LeavingDefendNeedsOperator) {
    Decision agent = arbiter->decide(Mode::DEFEND, Mode::OBSERVE, Role::AGENT, 0);
    EXPECT_FALSE(agent.approved);
    EXPECT_EQ(agent.code, ErrorCode::ARBITRATION_DENIED);
    EXPECT_TRUE(arbiter->decide(Mode::DEFEND, Mode::OBSERVE, Role::OPERATOR, 0).approved);
}

TEST_F(ArbiterTest, ThrashWindowOverridesPrivilege) {
    Decision d = arbiter->decide(Mode::ALERT, Mode::ACT, Role::SYSTEM, 3);
    EXPECT_FALSE(d.approved);
    EXPECT_EQ(d.code, ErrorCode::ARBITRATION_DENIED);

    // Defend stays reachable during a thrash lockout.
    EXPECT_TRUE(arbiter->decide(Mode::ALERT, Mode::DEFEND, Role::OPERATOR, 3).approved);
}

TEST_F(ArbiterTest, FourthRequestInWindowDenied) {
    ASSERT_TRUE(arbiter->requestModeChange(operatorCaller(), Mode::ALERT, "sensor anomaly").ok());
    clock.advance(10000);
    ASSERT_TRUE(arbiter->requestModeChange(operatorCaller(), Mode::OBSERVE, "false alarm").ok());
    clock.advance(10000);
    ASSERT_TRUE(arbiter->requestModeChange(operatorCaller(), Mode::ALERT, "anomaly again").ok());
    clock.advance(5000);

    auto fourth = arbiter->requestModeChange(operatorCaller(), Mode::ACT, "respond");
    ASSERT_TRUE(fourth.failed());
    EXPECT_EQ(fourth.error().code, ErrorCode::ARBITRATION_DENIED);
    ASSERT_TRUE(fourth.error().hasLedgerRef);
    EXPECT_EQ(arbiter->currentMode(), Mode::ALERT);

    auto entry = ledger->getEntry(fourth.error().ledgerSeq);
    ASSERT_TRUE(entry.ok());
    EXPECT_EQ(entry.value().kind, KIND_MODE_DENIED);
    EXPECT_EQ(entry.value().outcome, Outcome::FAILED);
    EXPECT_EQ(entry.value().payload.get("to"), "act");

    // Once the first three requests leave the trailing minute, Act is reachable.
    clock.set(21000 + 60000);
    auto later = arbiter->requestModeChange(operatorCaller(), Mode::ACT, "respond");
    ASSERT_TRUE(later.ok()) << later.error().message;
    EXPECT_EQ(arbiter->currentMode(), Mode::ACT);
}

TEST_F(ArbiterTest, DeniedRequestsCountTowardWindow) {
    for (int i = 0; i < 3; i++) {
        auto r = arbiter->requestModeChange(operatorCaller(), Mode::ACT, "not reachable from observe");
        ASSERT_TRUE(r.failed());
        EXPECT_EQ(r.error().code, ErrorCode::INVALID_TRANSITION);
    }
    EXPECT_EQ(arbiter->requestsInWindow(), 3u);

    auto r = arbiter->requestModeChange(operatorCaller(), Mode::ALERT, "legitimate");
    ASSERT_TRUE(r.failed());
    EXPECT_EQ(r.error().code, ErrorCode::ARBITRATION_DENIED);
}

TEST_F(ArbiterTest, ApprovedTransitionIsRecorded) {
    auto r = arbiter->requestModeChange(operatorCaller(), Mode::ALERT, "drill");
    ASSERT_TRUE(r.ok());
    EXPECT_EQ(r.value().resolution, Resolution::APPROVED);
    EXPECT_EQ(r.value().fromMode, Mode::OBSERVE);

    auto entry = ledger->getEntry(r.value().ledgerSeq);
    ASSERT_TRUE(entry.ok());
    EXPECT_EQ(entry.value().kind, KIND_MODE_TRANSITION);
    EXPECT_EQ(entry.value().payload.get("justification"), "drill");

    ModeState state = arbiter->modeState();
    EXPECT_EQ(state.mode, Mode::ALERT);
    EXPECT_EQ(state.enteredSeq, r.value().ledgerSeq);
    EXPECT_EQ(state.transitionsInWindow, 1u);

    ASSERT_EQ(decisions.size(), 1u);
    EXPECT_EQ(decisions[0].kind, SignalKind::MODE_APPROVED);
    EXPECT_EQ(arbiter->history().size(), 1u);
}

TEST_F(ArbiterTest, UnknownAgentRequesterLeavesNoEntry) {
    uint64_t before = ledger->entryCount();
    auto r = arbiter->requestModeChange(Caller{"ghost", Role::AGENT}, Mode::ALERT, "");
    ASSERT_TRUE(r.failed());
    EXPECT_EQ(r.error().code, ErrorCode::UNKNOWN_AGENT);
    EXPECT_EQ(ledger->entryCount(), before);
    EXPECT_TRUE(decisions.empty());
}

TEST_F(ArbiterTest, RegisteredAgentDeniedSignal) {
    ASSERT_TRUE(registry->registerAgent("op-1", "a-1", AgentType::REFLEX).ok());
    auto r = arbiter->requestModeChange(Caller{"a-1", Role::AGENT}, Mode::DEFEND, "panic");
    ASSERT_TRUE(r.failed());
    EXPECT_EQ(r.error().code, ErrorCode::ARBITRATION_DENIED);

    ASSERT_EQ(decisions.size(), 1u);
    EXPECT_EQ(decisions[0].kind, SignalKind::MODE_DENIED);
    EXPECT_EQ(decisions[0].agentId, "a-1");

    auto history = arbiter->history();
    ASSERT_EQ(history.size(), 1u);
    EXPECT_EQ(history[0].resolution, Resolution::DENIED);
    EXPECT_EQ(history[0].denialCode, ErrorCode::ARBITRATION_DENIED);
}

TEST_F(ArbiterTest, ConfiguredMinimumRoles) {
    utils::ArbiterConfig config;
    config.minRoleAlert = "operator";
    config.minRoleAct = "not-a-role";
    Arbiter strict(*ledger, *registry, config, clock.clock());

    EXPECT_EQ(strict.minimumRole(Mode::ALERT), Role::OPERATOR);
    // Invalid values fall back to the default.
    EXPECT_EQ(strict.minimumRole(Mode::ACT), Role::OPERATOR);
    EXPECT_FALSE(strict.decide(Mode::OBSERVE, Mode::ALERT, Role::AGENT, 0).approved);
}

TEST_F(ArbiterTest, ConflictResolutionValidatesAgents) {
    ASSERT_TRUE(registry->registerAgent("op-1", "a-1", AgentType::TASK).ok());
    ASSERT_TRUE(registry->registerAgent("op-1", "a-2", AgentType::REFLEX).ok());
    uint64_t tail = ledger->tailSequence();

    EXPECT_EQ(arbiter->resolveConflict("op-1", "", {"a-1"}, "x").error().code, ErrorCode::INVALID_ARGUMENT);
    EXPECT_EQ(arbiter->resolveConflict("op-1", "resource", {"a-1"}, "").error().code, ErrorCode::INVALID_ARGUMENT);
    EXPECT_EQ(arbiter->resolveConflict("op-1", "resource", {"a,1"}, "x").error().code, ErrorCode::INVALID_ARGUMENT);
    EXPECT_EQ(arbiter->resolveConflict("op-1", "resource", {"ghost"}, "x").error().code, ErrorCode::UNKNOWN_AGENT);
    EXPECT_EQ(ledger->tailSequence(), tail);

    auto first = arbiter->resolveConflict("op-1", "resource", {"a-1", "a-2"}, "a-2 yields");
    ASSERT_TRUE(first.ok());
    auto second = arbiter->resolveConflict("op-1", "priority", {"a-2"}, "deferred");
    ASSERT_TRUE(second.ok());
    EXPECT_EQ(first.value().id, 1u);
    EXPECT_EQ(second.value().id, 2u);
    EXPECT_EQ(second.value().ledgerSeq, ledger->tailSequence());

    auto recorded = arbiter->conflicts();
    ASSERT_EQ(recorded.size(), 2u);
    EXPECT_EQ(recorded[0].resolution, "a-2 yields");
    EXPECT_EQ(arbiter->currentMode(), Mode::OBSERVE);
}

TEST(PrivilegeTest, RoleSatisfaction) {
    EXPECT_TRUE(satisfies(Role::SYSTEM, Role::OPERATOR));
    EXPECT_TRUE(satisfies(Role::OPERATOR, Role::AGENT));
    EXPECT_FALSE(satisfies(Role::AGENT, Role::OPERATOR));
    EXPECT_FALSE(satisfies(Role::AUDITOR, Role::AGENT));
    EXPECT_TRUE(satisfies(Role::AUDITOR, Role::AUDITOR));
}

TEST(PrivilegeTest, OperationTable) {
    EXPECT_TRUE(isPermitted(Role::AGENT, Operation::DEBIT));
    EXPECT_FALSE(isPermitted(Role::OPERATOR, Operation::DEBIT));
    EXPECT_FALSE(isPermitted(Role::AGENT, Operation::ALLOCATE));
    EXPECT_TRUE(isPermitted(Role::OPERATOR, Operation::ROLLBACK));
    EXPECT_FALSE(isPermitted(Role::AUDITOR, Operation::ROLLBACK));
    EXPECT_TRUE(isPermitted(Role::AUDITOR, Operation::VERIFY_CHAIN));
    EXPECT_FALSE(isPermitted(Role::AGENT, Operation::VERIFY_CHAIN));
    EXPECT_FALSE(isPermitted(Role::AUDITOR, Operation::REQUEST_MODE_CHANGE));
    EXPECT_TRUE(isPermitted(Role::SYSTEM, Operation::TERMINATE));
}
