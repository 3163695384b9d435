#include <gtest/gtest.h>
#include "core/kernel.h"
#include "core/entry_kinds.h"
#include "test_support.h"
#include <atomic>
#include <chrono>
#include <fstream>
#include <functional>
#include <future>
#include <iterator>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <utility>

using namespace substrate;
using namespace substrate::core;
using substrate::tests::ManualClock;
using substrate::tests::TempDir;

class KernelTest : public ::testing::Test {
protected:
    void SetUp() override {
        tests::quietLogs();
        config.budget.velocityWindowMs = 3000;
        config.budget.velocityMaxDebits = 2;
        config.budget.costs["compute"] = 1;
        config.budget.costs["api_call"] = 5;
        config.guardian.evaluationBudgetMs = 1000;
        kernel = std::make_unique<Kernel>(config, clock.clock());
        ASSERT_TRUE(kernel->open(":memory:"));
    }

    void TearDown() override {
        kernel.reset();
    }

    void addAgent(const std::string& id, uint64_t allocation) {
        ASSERT_TRUE(kernel->registerAgent(op, id, AgentType::TASK, allocation).ok());
    }

    // Every entry after `from` has a distinct, ledger-visible cause.
    uint64_t entriesSince(uint64_t from) {
        return kernel->ledger().tailSequence() - from;
    }

    ManualClock clock;
    utils::KernelConfig config;
    std::unique_ptr<Kernel> kernel;
    Caller op{"op-1", Role::OPERATOR};
    Caller auditor{"audit-1", Role::AUDITOR};
    Caller agent{"a-1", Role::AGENT};
};

TEST_F(KernelTest, BudgetVelocityQuarantine) {
    addAgent("a-1", 100);

    auto first = kernel->debit(agent, 40);
    ASSERT_TRUE(first.ok());
    EXPECT_EQ(first.value().remaining, 60u);

    auto over = kernel->debit(agent, 70);
    ASSERT_TRUE(over.failed());
    EXPECT_EQ(over.error().code, ErrorCode::INSUFFICIENT_BUDGET);
    EXPECT_EQ(kernel->budget().account("a-1").value().remaining(), 60u);

    clock.advance(5000);
    ASSERT_TRUE(kernel->debit(agent, 1).ok());
    clock.advance(500);
    ASSERT_TRUE(kernel->debit(agent, 1).ok());
    EXPECT_EQ(kernel->registry().get("a-1").value().status, AgentStatus::ACTIVE);
    clock.advance(500);
    ASSERT_TRUE(kernel->debit(agent, 1).ok());
    EXPECT_EQ(kernel->registry().get("a-1").value().status, AgentStatus::QUARANTINED);

    auto blocked = kernel->debit(agent, 1);
    ASSERT_TRUE(blocked.failed());
    EXPECT_EQ(blocked.error().code, ErrorCode::AGENT_QUARANTINED);
    ASSERT_TRUE(blocked.error().hasLedgerRef);
    EXPECT_EQ(kernel->budget().account("a-1").value().remaining(), 57u);

    auto mode = kernel->requestModeChange(agent, Mode::ALERT, "");
    EXPECT_EQ(mode.error().code, ErrorCode::AGENT_QUARANTINED);
}

TEST_F(KernelTest, PermissionDenialsAreLogged) {
    addAgent("a-1", 10);
    uint64_t tail = kernel->ledger().tailSequence();

    auto r = kernel->allocate(agent, "a-1", 1000);
    ASSERT_TRUE(r.failed());
    EXPECT_EQ(r.error().code, ErrorCode::PERMISSION_DENIED);
    ASSERT_TRUE(r.error().hasLedgerRef);
    EXPECT_EQ(entriesSince(tail), 1u);

    auto entry = kernel->ledger().getEntry(r.error().ledgerSeq);
    ASSERT_TRUE(entry.ok());
    EXPECT_EQ(entry.value().kind, KIND_PERMISSION_DENIED);
    EXPECT_EQ(entry.value().outcome, Outcome::FAILED);
    EXPECT_EQ(entry.value().actor, "a-1");
    EXPECT_EQ(entry.value().payload.get("operation"), "allocate");

    EXPECT_EQ(kernel->rollback(auditor, "cp-1").error().code, ErrorCode::PERMISSION_DENIED);
    EXPECT_EQ(kernel->debit(op, 1).error().code, ErrorCode::PERMISSION_DENIED);
    EXPECT_EQ(kernel->requestModeChange(auditor, Mode::ALERT, "").error().code, ErrorCode::PERMISSION_DENIED);
    EXPECT_EQ(kernel->verifyChain(agent).error().code, ErrorCode::PERMISSION_DENIED);
    EXPECT_EQ(kernel->budget().account("a-1").value().allocated, 10u);
}

TEST_F(KernelTest, AuditorReadsLedger) {
    addAgent("a-1", 10);
    auto report = kernel->verifyChain(auditor);
    ASSERT_TRUE(report.ok());
    EXPECT_TRUE(report.value().intact);

    auto range = kernel->getLedgerRange(auditor, GENESIS_SEQ, LEDGER_END);
    ASSERT_TRUE(range.ok());
    EXPECT_EQ(range.value().size(), kernel->ledger().entryCount());
    EXPECT_EQ(kernel->getLedgerRange(auditor, 5, 2).error().code, ErrorCode::INVALID_ARGUMENT);

    auto summary = kernel->getBudgetSummary(auditor);
    ASSERT_TRUE(summary.ok());
    EXPECT_EQ(summary.value().totalAllocated, 10u);
}

TEST_F(KernelTest, ComponentViewsAreReadOnly) {
    static_assert(std::is_const<std::remove_reference<decltype(std::declval<Kernel&>().ledger())>::type>::value,
                  "ledger view is writable");
    static_assert(std::is_const<std::remove_reference<decltype(std::declval<Kernel&>().registry())>::type>::value,
                  "registry view is writable");
    static_assert(std::is_const<std::remove_reference<decltype(std::declval<Kernel&>().budget())>::type>::value,
                  "budget view is writable");
    static_assert(std::is_const<std::remove_reference<decltype(std::declval<Kernel&>().arbiter())>::type>::value,
                  "arbiter view is writable");
    static_assert(std::is_const<std::remove_reference<decltype(std::declval<Kernel&>().guardian())>::type>::value,
                  "guardian view is writable");

    addAgent("a-1", 10);
    uint64_t before = kernel->ledger().entryCount();
    EXPECT_EQ(kernel->allocate(agent, "a-1", 5).error().code, ErrorCode::PERMISSION_DENIED);
    EXPECT_EQ(kernel->budget().account("a-1").value().allocated, 10u);
    EXPECT_GT(kernel->ledger().entryCount(), before);
}

TEST_F(KernelTest, ExecuteActionRecordsIntentDebitOutcome) {
    addAgent("a-1", 20);
    Payload args;
    args.set("endpoint", "/status");

    auto receipt = kernel->executeAction(agent, "api_call", args, []() -> Result<Payload> {
        Payload out;
        out.set("status", "200");
        return out;
    });
    ASSERT_TRUE(receipt.ok()) << receipt.error().message;
    EXPECT_TRUE(receipt.value().succeeded);
    EXPECT_EQ(receipt.value().cost, 5u);
    EXPECT_EQ(receipt.value().remaining, 15u);
    EXPECT_LT(receipt.value().intentSeq, receipt.value().debitSeq);
    EXPECT_LT(receipt.value().debitSeq, receipt.value().outcomeSeq);

    auto intent = kernel->ledger().getEntry(receipt.value().intentSeq).value();
    EXPECT_EQ(intent.kind, KIND_ACTION_INTENT);
    EXPECT_EQ(intent.outcome, Outcome::INTENT);
    EXPECT_EQ(intent.payload.get("arg.endpoint"), "/status");

    auto outcome = kernel->ledger().getEntry(receipt.value().outcomeSeq).value();
    EXPECT_EQ(outcome.kind, KIND_ACTION_OUTCOME);
    EXPECT_EQ(outcome.outcome, Outcome::COMMITTED);
    EXPECT_EQ(outcome.payload.getUint("intent"), receipt.value().intentSeq);
    EXPECT_EQ(outcome.payload.get("result.status"), "200");
}

TEST_F(KernelTest, FailingEffectIsRecorded) {
    addAgent("a-1", 20);
    auto receipt = kernel->executeAction(agent, "compute", Payload(), []() -> Result<Payload> {
        throw std::runtime_error("disk full");
    });
    ASSERT_TRUE(receipt.ok());
    EXPECT_FALSE(receipt.value().succeeded);
    EXPECT_EQ(receipt.value().remaining, 19u);

    auto outcome = kernel->ledger().getEntry(receipt.value().outcomeSeq).value();
    EXPECT_EQ(outcome.outcome, Outcome::FAILED);
    EXPECT_NE(outcome.payload.get("result.error").find("disk full"), std::string::npos);
}

TEST_F(KernelTest, UnaffordableActionSkipsEffect) {
    addAgent("a-1", 3);
    bool ran = false;
    auto receipt = kernel->executeAction(agent, "api_call", Payload(), [&ran]() -> Result<Payload> {
        ran = true;
        return Payload();
    });
    ASSERT_TRUE(receipt.failed());
    EXPECT_EQ(receipt.error().code, ErrorCode::INSUFFICIENT_BUDGET);
    EXPECT_FALSE(ran);

    auto outcomes = kernel->ledger().getEntriesByKind(KIND_ACTION_OUTCOME);
    ASSERT_EQ(outcomes.size(), 1u);
    EXPECT_EQ(outcomes[0].outcome, Outcome::FAILED);
    EXPECT_EQ(outcomes[0].payload.get("reason"), errorToString(ErrorCode::INSUFFICIENT_BUDGET));
}

TEST_F(KernelTest, UnknownActionKindWritesNothing) {
    addAgent("a-1", 20);
    uint64_t tail = kernel->ledger().tailSequence();
    auto receipt = kernel->executeAction(agent, "teleport", Payload(), []() -> Result<Payload> {
        return Payload();
    });
    ASSERT_TRUE(receipt.failed());
    EXPECT_EQ(receipt.error().code, ErrorCode::UNKNOWN_ACTION_KIND);
    EXPECT_EQ(entriesSince(tail), 0u);

    auto teleport = kernel->submitIntent(agent, "teleport", Payload());
    ASSERT_TRUE(teleport.ok());
    EXPECT_EQ(kernel->debitIntent(agent, teleport.value().seq).error().code, ErrorCode::UNKNOWN_ACTION_KIND);

    auto call = kernel->submitIntent(agent, "api_call", Payload());
    ASSERT_TRUE(call.ok());
    auto paid = kernel->debitIntent(agent, call.value().seq);
    ASSERT_TRUE(paid.ok());
    EXPECT_EQ(paid.value().remaining, 15u);
    EXPECT_EQ(kernel->ledger().getEntry(paid.value().ledgerSeq).value().payload.getUint("intent"),
              call.value().seq);
}

TEST_F(KernelTest, ZeroCostActionRuns) {
    config.budget.costs["heartbeat"] = 0;
    kernel = std::make_unique<Kernel>(config, clock.clock());
    ASSERT_TRUE(kernel->open(":memory:"));
    addAgent("a-1", 0);

    bool ran = false;
    auto receipt = kernel->executeAction(agent, "heartbeat", Payload(), [&ran]() -> Result<Payload> {
        ran = true;
        return Payload();
    });
    ASSERT_TRUE(receipt.ok()) << receipt.error().message;
    EXPECT_TRUE(ran);
    EXPECT_TRUE(receipt.value().succeeded);
    EXPECT_EQ(receipt.value().cost, 0u);

    auto debit = kernel->ledger().getEntry(receipt.value().debitSeq).value();
    EXPECT_EQ(debit.outcome, Outcome::COMMITTED);
    EXPECT_EQ(debit.payload.getUint("amount"), 0u);
    EXPECT_EQ(kernel->debit(agent, 0).error().code, ErrorCode::INVALID_ARGUMENT);
}

TEST_F(KernelTest, OutcomeMustMatchOpenIntent) {
    addAgent("a-1", 20);
    addAgent("a-2", 20);

    auto intent = kernel->submitIntent(agent, "compute", Payload());
    ASSERT_TRUE(intent.ok());

    auto stranger = kernel->submitOutcome(Caller{"a-2", Role::AGENT}, intent.value().seq, true, Payload());
    EXPECT_EQ(stranger.error().code, ErrorCode::INVALID_ARGUMENT);

    auto notIntent = kernel->submitOutcome(agent, GENESIS_SEQ, true, Payload());
    EXPECT_EQ(notIntent.error().code, ErrorCode::INVALID_ARGUMENT);

    auto missing = kernel->submitOutcome(agent, 9999, true, Payload());
    EXPECT_TRUE(missing.failed());

    ASSERT_TRUE(kernel->debitIntent(agent, intent.value().seq).ok());
    auto done = kernel->submitOutcome(agent, intent.value().seq, false, Payload());
    ASSERT_TRUE(done.ok());
    EXPECT_EQ(done.value().outcome, Outcome::FAILED);
    EXPECT_EQ(done.value().payload.get("success"), "false");
}

TEST_F(KernelTest, OutcomeIsRecordedOnce) {
    addAgent("a-1", 20);
    auto intent = kernel->submitIntent(agent, "compute", Payload());
    ASSERT_TRUE(intent.ok());
    ASSERT_TRUE(kernel->debitIntent(agent, intent.value().seq).ok());
    ASSERT_TRUE(kernel->submitOutcome(agent, intent.value().seq, true, Payload()).ok());

    uint64_t tail = kernel->ledger().tailSequence();
    auto again = kernel->submitOutcome(agent, intent.value().seq, false, Payload());
    ASSERT_TRUE(again.failed());
    EXPECT_EQ(again.error().code, ErrorCode::INVALID_ARGUMENT);
    EXPECT_EQ(kernel->debitIntent(agent, intent.value().seq).error().code, ErrorCode::INVALID_ARGUMENT);
    EXPECT_EQ(entriesSince(tail), 0u);
    EXPECT_EQ(kernel->ledger().getEntriesByKind(KIND_ACTION_OUTCOME).size(), 1u);
    EXPECT_EQ(kernel->budget().account("a-1").value().consumed, 1u);
}

TEST_F(KernelTest, UnpaidIntentTakesNoOutcome) {
    addAgent("a-1", 20);
    auto intent = kernel->submitIntent(agent, "api_call", Payload());
    ASSERT_TRUE(intent.ok());

    uint64_t tail = kernel->ledger().tailSequence();
    auto r = kernel->submitOutcome(agent, intent.value().seq, true, Payload());
    ASSERT_TRUE(r.failed());
    EXPECT_EQ(r.error().code, ErrorCode::INVALID_ARGUMENT);
    EXPECT_EQ(entriesSince(tail), 0u);

    ASSERT_TRUE(kernel->debitIntent(agent, intent.value().seq).ok());
    EXPECT_EQ(kernel->debitIntent(agent, intent.value().seq).error().code, ErrorCode::INVALID_ARGUMENT);
    EXPECT_EQ(kernel->budget().account("a-1").value().remaining(), 15u);
    EXPECT_TRUE(kernel->submitOutcome(agent, intent.value().seq, true, Payload()).ok());
}

TEST_F(KernelTest, RefusedPaymentClosesIntent) {
    addAgent("a-1", 3);
    auto intent = kernel->submitIntent(agent, "api_call", Payload());
    ASSERT_TRUE(intent.ok());

    auto paid = kernel->debitIntent(agent, intent.value().seq);
    ASSERT_TRUE(paid.failed());
    EXPECT_EQ(paid.error().code, ErrorCode::INSUFFICIENT_BUDGET);

    auto outcomes = kernel->ledger().getEntriesByKind(KIND_ACTION_OUTCOME);
    ASSERT_EQ(outcomes.size(), 1u);
    EXPECT_EQ(outcomes[0].payload.getUint("intent"), intent.value().seq);
    EXPECT_EQ(kernel->submitOutcome(agent, intent.value().seq, true, Payload()).error().code,
              ErrorCode::INVALID_ARGUMENT);
}

TEST_F(KernelTest, RepeatedActionFailuresQuarantine) {
    config.guardian.maxActionFailures = 2;
    kernel = std::make_unique<Kernel>(config, clock.clock());
    ASSERT_TRUE(kernel->open(":memory:"));
    addAgent("a-1", 100);

    for (int i = 0; i < 2; i++) {
        clock.advance(5000);
        auto intent = kernel->submitIntent(agent, "compute", Payload());
        ASSERT_TRUE(intent.ok());
        ASSERT_TRUE(kernel->debitIntent(agent, intent.value().seq).ok());
        ASSERT_TRUE(kernel->submitOutcome(agent, intent.value().seq, false, Payload()).ok());
    }
    EXPECT_EQ(kernel->registry().get("a-1").value().status, AgentStatus::QUARANTINED);
    EXPECT_EQ(kernel->guardian().quarantineRecord("a-1").value().trigger, "action_failure_streak");

    auto intent = kernel->submitIntent(agent, "compute", Payload());
    ASSERT_TRUE(intent.failed());
    EXPECT_EQ(intent.error().code, ErrorCode::AGENT_QUARANTINED);
    ASSERT_TRUE(intent.error().hasLedgerRef);
    EXPECT_EQ(kernel->ledger().getEntry(intent.error().ledgerSeq).value().outcome, Outcome::FAILED);
}

TEST_F(KernelTest, OperatorLifecycle) {
    addAgent("a-1", 50);
    ASSERT_TRUE(kernel->quarantine(op, "a-1", "manual review").ok());
    EXPECT_EQ(kernel->debit(agent, 1).error().code, ErrorCode::AGENT_QUARANTINED);
    ASSERT_TRUE(kernel->release(op, "a-1").ok());
    ASSERT_TRUE(kernel->debit(agent, 1).ok());

    auto topped = kernel->allocate(op, "a-1", 25);
    ASSERT_TRUE(topped.ok());
    EXPECT_EQ(topped.value().remaining(), 74u);

    ASSERT_TRUE(kernel->terminate(op, "a-1", "retired").ok());
    EXPECT_EQ(kernel->debit(agent, 1).error().code, ErrorCode::AGENT_TERMINATED);

    EXPECT_EQ(kernel->registerAgent(op, "a-1", AgentType::TASK, 5).error().code, ErrorCode::ALREADY_EXISTS);
    EXPECT_EQ(kernel->debit(Caller{"ghost", Role::AGENT}, 1).error().code, ErrorCode::UNKNOWN_AGENT);
}

TEST_F(KernelTest, CheckpointAndRollbackThroughKernel) {
    addAgent("a-1", 100);
    auto cp = kernel->createCheckpoint(op, "baseline");
    ASSERT_TRUE(cp.ok());

    ASSERT_TRUE(kernel->debit(agent, 30).ok());
    ASSERT_TRUE(kernel->requestModeChange(op, Mode::ALERT, "incident").ok());

    auto rb = kernel->rollback(op, cp.value().id);
    ASSERT_TRUE(rb.ok());
    EXPECT_EQ(kernel->budget().account("a-1").value().remaining(), 100u);
    EXPECT_EQ(kernel->arbiter().currentMode(), Mode::OBSERVE);
    EXPECT_TRUE(kernel->verifyChain(auditor).value().intact);
}

TEST_F(KernelTest, ClosedKernelRefusesCalls) {
    kernel->close();
    EXPECT_FALSE(kernel->isOpen());
    EXPECT_EQ(kernel->debit(agent, 1).error().code, ErrorCode::DATABASE_ERROR);
    EXPECT_EQ(kernel->verifyChain(auditor).error().code, ErrorCode::DATABASE_ERROR);
}

TEST_F(KernelTest, RegistrationOpensAccountInOneEntry) {
    uint64_t tail = kernel->ledger().tailSequence();
    addAgent("a-1", 40);
    EXPECT_EQ(entriesSince(tail), 1u);

    auto entry = kernel->ledger().getEntry(kernel->ledger().tailSequence()).value();
    EXPECT_EQ(entry.kind, KIND_AGENT_REGISTERED);
    EXPECT_EQ(entry.payload.getUint("allocated"), 40u);
    EXPECT_EQ(kernel->budget().account("a-1").value().allocated, 40u);

    tail = kernel->ledger().tailSequence();
    EXPECT_EQ(kernel->registerAgent(op, "a-1", AgentType::TASK, 99).error().code, ErrorCode::ALREADY_EXISTS);
    EXPECT_EQ(entriesSince(tail), 0u);
    EXPECT_EQ(kernel->budget().account("a-1").value().allocated, 40u);
}

TEST_F(KernelTest, ConflictResolutionIsRecorded) {
    addAgent("a-1", 10);
    addAgent("a-2", 10);

    auto r = kernel->resolveConflict(op, "resource", {"a-1", "a-2"}, "a-1 keeps the lock");
    ASSERT_TRUE(r.ok()) << r.error().message;
    EXPECT_EQ(r.value().resolvedBy, "op-1");
    ASSERT_EQ(r.value().agents.size(), 2u);

    auto entry = kernel->ledger().getEntry(r.value().ledgerSeq).value();
    EXPECT_EQ(entry.kind, KIND_CONFLICT_RESOLVED);
    EXPECT_EQ(entry.payload.get("agents"), "a-1,a-2");
    EXPECT_EQ(entry.payload.get("resolution"), "a-1 keeps the lock");

    EXPECT_EQ(kernel->resolveConflict(agent, "resource", {"a-1"}, "mine").error().code,
              ErrorCode::PERMISSION_DENIED);
    EXPECT_EQ(kernel->resolveConflict(op, "resource", {"a-1", "ghost"}, "x").error().code,
              ErrorCode::UNKNOWN_AGENT);
    EXPECT_EQ(kernel->resolveConflict(op, "resource", {}, "x").error().code, ErrorCode::INVALID_ARGUMENT);
    EXPECT_EQ(kernel->arbiter().conflicts().size(), 1u);
}

TEST_F(KernelTest, TotalCostByActionKind) {
    addAgent("a-1", 100);
    auto effect = []() -> Result<Payload> { return Payload(); };

    auto cp = kernel->createCheckpoint(op, "before");
    ASSERT_TRUE(cp.ok());
    clock.advance(5000);
    ASSERT_TRUE(kernel->executeAction(agent, "api_call", Payload(), effect).ok());
    clock.advance(5000);
    ASSERT_TRUE(kernel->executeAction(agent, "compute", Payload(), effect).ok());
    clock.advance(5000);
    ASSERT_TRUE(kernel->debit(agent, 7).ok());

    EXPECT_EQ(kernel->getTotalCost(auditor, "a-1").value(), 13u);
    EXPECT_EQ(kernel->getTotalCost(auditor, "a-1", "api_call").value(), 5u);
    EXPECT_EQ(kernel->getTotalCost(auditor, "a-1", "compute").value(), 1u);
    EXPECT_EQ(kernel->getTotalCost(agent, "a-1").error().code, ErrorCode::PERMISSION_DENIED);

    ASSERT_TRUE(kernel->rollback(op, cp.value().id).ok());
    EXPECT_EQ(kernel->getTotalCost(auditor, "a-1").value(), 0u);
}

TEST_F(KernelTest, ExpiredWindowRefusesUntilRenewed) {
    config.budget.windowMs = 10000;
    kernel = std::make_unique<Kernel>(config, clock.clock());
    ASSERT_TRUE(kernel->open(":memory:"));
    addAgent("a-1", 50);
    ASSERT_TRUE(kernel->debit(agent, 20).ok());

    clock.advance(10001);
    auto late = kernel->debit(agent, 1);
    ASSERT_TRUE(late.failed());
    EXPECT_EQ(late.error().code, ErrorCode::INSUFFICIENT_BUDGET);
    EXPECT_EQ(kernel->ledger().getEntry(late.error().ledgerSeq).value().payload.get("window"), "expired");
    EXPECT_EQ(kernel->getBudgetSummary(auditor).value().totalRemaining, 0u);

    auto renewed = kernel->allocate(op, "a-1", 30);
    ASSERT_TRUE(renewed.ok());
    EXPECT_EQ(renewed.value().allocated, 30u);
    EXPECT_EQ(renewed.value().consumed, 0u);
    EXPECT_GT(renewed.value().windowEnd, clock.now());
    EXPECT_TRUE(kernel->debit(agent, 1).ok());
}

TEST_F(KernelTest, AnonymousCallerRejected) {
    auto r = kernel->debit(Caller{"", Role::AGENT}, 1);
    ASSERT_TRUE(r.failed());
    EXPECT_EQ(r.error().code, ErrorCode::INVALID_ARGUMENT);
}

TEST(KernelFileTest, ExportAndOpenFromConfig) {
    tests::quietLogs();
    TempDir dir("kernel_file");
    utils::KernelConfig config;
    config.dataDir = dir.file("data");
    config.dbFile = "substrate.db";

    Kernel kernel(config);
    ASSERT_TRUE(kernel.open());
    Caller op{"op-1", Role::OPERATOR};
    ASSERT_TRUE(kernel.registerAgent(op, "a-1", AgentType::PERCEPTION, 10).ok());

    std::string out = dir.file("ledger.jsonl");
    ASSERT_TRUE(kernel.exportLedger(Caller{"audit-1", Role::AUDITOR}, out).ok());
    EXPECT_EQ(kernel.exportLedger(Caller{"a-1", Role::AGENT}, out).error().code, ErrorCode::PERMISSION_DENIED);

    std::ifstream in(out);
    std::string line;
    size_t lines = 0;
    while (std::getline(in, line)) lines++;
    // genesis, registration with its account
    EXPECT_EQ(lines, 2u);
}

TEST(KernelFileTest, ReopenKeepsIntentsAndConflicts) {
    tests::quietLogs();
    TempDir dir("kernel_reopen");
    std::string db = dir.file("substrate.db");
    Caller op{"op-1", Role::OPERATOR};
    Caller agent{"a-1", Role::AGENT};
    utils::KernelConfig config;
    config.budget.costs["compute"] = 1;
    uint64_t paidSeq = 0;
    uint64_t resolvedSeq = 0;
    {
        Kernel kernel(config);
        ASSERT_TRUE(kernel.open(db));
        ASSERT_TRUE(kernel.registerAgent(op, "a-1", AgentType::TASK, 10).ok());
        ASSERT_TRUE(kernel.registerAgent(op, "a-2", AgentType::TASK, 10).ok());
        auto intent = kernel.submitIntent(agent, "compute", Payload());
        ASSERT_TRUE(intent.ok());
        ASSERT_TRUE(kernel.debitIntent(agent, intent.value().seq).ok());
        paidSeq = intent.value().seq;
        auto done = kernel.submitIntent(agent, "compute", Payload());
        ASSERT_TRUE(done.ok());
        ASSERT_TRUE(kernel.debitIntent(agent, done.value().seq).ok());
        ASSERT_TRUE(kernel.submitOutcome(agent, done.value().seq, true, Payload()).ok());
        resolvedSeq = done.value().seq;
        ASSERT_TRUE(kernel.resolveConflict(op, "priority", {"a-1", "a-2"}, "a-2 first").ok());
    }

    Kernel kernel(config);
    ASSERT_TRUE(kernel.open(db));
    EXPECT_EQ(kernel.submitOutcome(agent, resolvedSeq, true, Payload()).error().code,
              ErrorCode::INVALID_ARGUMENT);
    EXPECT_EQ(kernel.debitIntent(agent, paidSeq).error().code, ErrorCode::INVALID_ARGUMENT);
    EXPECT_TRUE(kernel.submitOutcome(agent, paidSeq, true, Payload()).ok());

    auto conflicts = kernel.arbiter().conflicts();
    ASSERT_EQ(conflicts.size(), 1u);
    EXPECT_EQ(conflicts[0].conflictType, "priority");
    EXPECT_EQ(conflicts[0].resolution, "a-2 first");
    EXPECT_EQ(kernel.getBudgetSummary(op).value().totalConsumed, 2u);
}

TEST(KernelFileTest, LogConfigWritesFile) {
    tests::quietLogs();
    TempDir dir("kernel_log");
    utils::KernelConfig config;
    config.dataDir = dir.path();
    config.log.level = "info";
    config.log.file = "logs/substrate.log";
    {
        Kernel kernel(config);
        ASSERT_TRUE(kernel.open(":memory:"));
    }
    tests::quietLogs();

    std::ifstream in(dir.file("logs/substrate.log"));
    ASSERT_TRUE(in.is_open());
    std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    EXPECT_NE(text.find("[kernel] Kernel opened"), std::string::npos);
    EXPECT_NE(text.find("[kernel] Kernel closed"), std::string::npos);
}

// Clock that runs a hook once, on the thread that built it, at the n-th
// reading after arm(). The hook lets another thread race the call in progress.
class HookedClock {
public:
    explicit HookedClock(const ManualClock& base) : base_(base), owner_(std::this_thread::get_id()) {}

    utils::Clock clock() {
        return [this]() {
            if (std::this_thread::get_id() == owner_ && countdown_ > 0 && --countdown_ == 0 && hook_) hook_();
            return base_.now();
        };
    }

    void arm(int reading, std::function<void()> hook) {
        hook_ = std::move(hook);
        countdown_ = reading;
    }

private:
    ManualClock base_;
    const std::thread::id owner_;
    std::atomic<int> countdown_{0};
    std::function<void()> hook_;
};

class KernelRaceTest : public ::testing::Test {
protected:
    void SetUp() override {
        tests::quietLogs();
        kernel = std::make_unique<Kernel>(utils::KernelConfig(), hooked.clock());
        ASSERT_TRUE(kernel->open(":memory:"));
        ASSERT_TRUE(kernel->registerAgent(op, "a-1", AgentType::TASK, 100).ok());
    }

    void TearDown() override {
        if (pending.valid()) pending.wait();
        kernel.reset();
    }

    // Starts a quarantine of a-1 on another thread and gives it time to land.
    void quarantineMidCall() {
        Kernel* k = kernel.get();
        Caller oper = op;
        pending = std::async(std::launch::async, [k, oper]() {
            return k->quarantine(oper, "a-1", "manual review");
        });
        pending.wait_for(std::chrono::milliseconds(200));
    }

    uint64_t quarantineSeq() {
        auto r = pending.get();
        EXPECT_TRUE(r.ok());
        return r.ok() ? r.value().ledgerSeq : 0;
    }

    ManualClock base;
    HookedClock hooked{base};
    std::unique_ptr<Kernel> kernel;
    std::future<Result<QuarantineRecord>> pending;
    Caller op{"op-1", Role::OPERATOR};
    Caller agent{"a-1", Role::AGENT};
};

TEST_F(KernelRaceTest, QuarantineDuringDebitLandsAfterIt) {
    hooked.arm(1, [this]() { quarantineMidCall(); });
    auto paid = kernel->debit(agent, 10);
    ASSERT_TRUE(pending.valid());
    uint64_t quarantined = quarantineSeq();

    if (paid.ok()) {
        EXPECT_LT(paid.value().ledgerSeq, quarantined);
    } else {
        EXPECT_EQ(paid.error().code, ErrorCode::AGENT_QUARANTINED);
    }
    for (const auto& e : kernel->ledger().getEntriesByKind(KIND_BUDGET_DEBIT)) {
        if (e.outcome == Outcome::COMMITTED) EXPECT_LT(e.seq, quarantined);
    }
    EXPECT_EQ(kernel->debit(agent, 1).error().code, ErrorCode::AGENT_QUARANTINED);
}

TEST_F(KernelRaceTest, QuarantineDuringModeRequestLandsAfterIt) {
    hooked.arm(2, [this]() { quarantineMidCall(); });
    auto request = kernel->requestModeChange(agent, Mode::ALERT, "anomaly");
    ASSERT_TRUE(pending.valid());
    uint64_t quarantined = quarantineSeq();

    if (request.ok()) {
        EXPECT_LT(request.value().ledgerSeq, quarantined);
    } else {
        EXPECT_EQ(request.error().code, ErrorCode::AGENT_QUARANTINED);
    }
    for (const auto& e : kernel->ledger().getEntriesByKind(KIND_MODE_TRANSITION)) {
        EXPECT_LT(e.seq, quarantined);
    }
}
