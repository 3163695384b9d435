#include "core/kernel.h"
#include "core/entry_kinds.h"
#include "core/privilege.h"
#include "core/replay.h"
#include "utils/logger.h"
#include <filesystem>
#include <map>
#include <set>
#include <mutex>

namespace substrate {
namespace core {

namespace {

void logKernel(utils::LogLevel level, const std::string& msg) {
    utils::Logger::log(level, "kernel", msg);
}

}

struct Kernel::Impl {
    utils::KernelConfig config;
    utils::Clock clock;
    Ledger ledger;
    AgentRegistry registry;
    BudgetRegister budget;
    Arbiter arbiter;
    Guardian guardian;

    // Intents without an outcome, keyed by seq. intentMutex is taken before
    // any component lock.
    std::map<uint64_t, OpenIntent> intents;
    std::set<uint64_t> paying;
    std::mutex intentMutex;
    bool ownsLogFile = false;

    Impl(const utils::KernelConfig& cfg, utils::Clock c)
        : config(cfg),
          clock(c ? c : utils::systemClock()),
          ledger(config.ledger, clock),
          registry(ledger),
          budget(ledger, registry, config.budget, clock),
          arbiter(ledger, registry, config.arbiter, clock),
          guardian(ledger, registry, budget, arbiter, config.guardian, clock) {}

    Result<void> authorize(const Caller& caller, Operation op);
    Result<LedgerEntry> appendIntent(const std::string& agentId, const std::string& actionKind,
                                     const Payload& payload);
    Result<DebitResult> payIntent(const std::string& agentId, uint64_t intentSeq);
    // gate: refuse the outcome of a quarantined or terminated agent.
    Result<LedgerEntry> closeIntent(const std::string& agentId, uint64_t intentSeq, bool success,
                                    const Payload& result, const std::string& reason, bool gate);
    // Caller holds intentMutex.
    Result<LedgerEntry> appendOutcomeLocked(const OpenIntent& intent, bool success, const Payload& result,
                                            const std::string& reason);
    void applyLogConfig();
    void observe(SignalKind kind, const std::string& agentId, const LedgerEntry& entry);
};

Result<void> Kernel::Impl::authorize(const Caller& caller, Operation op) {
    if (!ledger.isOpen()) {
        return makeError(ErrorCode::DATABASE_ERROR, "Kernel is not open");
    }
    if (caller.id.empty()) {
        return makeError(ErrorCode::INVALID_ARGUMENT, "Caller must be identified");
    }
    if (isPermitted(caller.role, op)) return Result<void>();

    AppendRequest req;
    req.actor = caller.id;
    req.kind = KIND_PERMISSION_DENIED;
    req.outcome = Outcome::FAILED;
    req.payload.set("operation", operationToString(op)).set("role", roleToString(caller.role));

    auto r = ledger.append(req);
    if (r.failed()) return r.error();

    std::string msg = std::string(roleToString(caller.role)) + " " + caller.id + " may not " + operationToString(op);
    logKernel(utils::LogLevel::WARN, msg);
    return makeError(ErrorCode::PERMISSION_DENIED, msg, r.value().seq);
}

Result<LedgerEntry> Kernel::Impl::appendIntent(const std::string& agentId, const std::string& actionKind,
                                               const Payload& payload) {
    if (actionKind.empty()) {
        return makeError(ErrorCode::INVALID_ARGUMENT, "Intent needs an action kind");
    }

    AppendRequest req;
    req.actor = agentId;
    req.kind = KIND_ACTION_INTENT;
    req.payload.merge(payload, "arg.");
    req.payload.set("action", actionKind);

    std::lock_guard<std::mutex> intentLock(intentMutex);
    auto statusLock = registry.lockStatus();
    auto gate = registry.admitLocked(agentId);
    if (gate.failed()) {
        if (gate.error().code == ErrorCode::UNKNOWN_AGENT) return gate.error();
        req.outcome = Outcome::FAILED;
        req.payload.set("reason", errorToString(gate.error().code));
        auto r = ledger.append(req);
        if (r.failed()) return r.error();
        logKernel(utils::LogLevel::WARN, "Intent " + actionKind + " refused for " + agentId + ": " +
                  gate.error().message);
        return makeError(gate.error().code, gate.error().message, r.value().seq);
    }

    req.outcome = Outcome::INTENT;
    Mutation m;
    m.apply = [this, agentId, actionKind](const LedgerEntry& e) {
        OpenIntent intent;
        intent.seq = e.seq;
        intent.agentId = agentId;
        intent.actionKind = actionKind;
        intents[e.seq] = intent;
    };
    return ledger.append(req, m);
}

Result<DebitResult> Kernel::Impl::payIntent(const std::string& agentId, uint64_t intentSeq) {
    std::string actionKind;
    {
        std::lock_guard<std::mutex> lock(intentMutex);
        auto it = intents.find(intentSeq);
        if (it == intents.end() || it->second.agentId != agentId) {
            return makeError(ErrorCode::INVALID_ARGUMENT, "Intent " + std::to_string(intentSeq) +
                             " is not open for " + agentId);
        }
        if (it->second.debitSeq != 0 || paying.count(intentSeq)) {
            return makeError(ErrorCode::INVALID_ARGUMENT, "Intent " + std::to_string(intentSeq) +
                             " is already paid for");
        }
        actionKind = it->second.actionKind;
        paying.insert(intentSeq);
    }

    auto cost = budget.quote(actionKind);
    if (cost.failed()) {
        std::lock_guard<std::mutex> lock(intentMutex);
        paying.erase(intentSeq);
        return cost.error();
    }

    auto paid = budget.debit(agentId, cost.value(), actionKind, intentSeq);

    std::lock_guard<std::mutex> lock(intentMutex);
    paying.erase(intentSeq);
    auto it = intents.find(intentSeq);
    if (paid.ok()) {
        if (it != intents.end()) it->second.debitSeq = paid.value().ledgerSeq;
        return paid;
    }
    if (it != intents.end()) {
        auto out = appendOutcomeLocked(it->second, false, Payload(), errorToString(paid.error().code));
        if (out.failed()) {
            logKernel(utils::LogLevel::ERROR, "Cannot record outcome of intent " + std::to_string(intentSeq) +
                      ": " + out.error().message);
        }
    }
    return paid.error();
}

Result<LedgerEntry> Kernel::Impl::closeIntent(const std::string& agentId, uint64_t intentSeq, bool success,
                                              const Payload& result, const std::string& reason, bool gate) {
    std::lock_guard<std::mutex> lock(intentMutex);
    auto it = intents.find(intentSeq);
    if (it == intents.end() || it->second.agentId != agentId) {
        return makeError(ErrorCode::INVALID_ARGUMENT, "Intent " + std::to_string(intentSeq) +
                         " is not open for " + agentId);
    }
    if (it->second.debitSeq == 0 || paying.count(intentSeq)) {
        return makeError(ErrorCode::INVALID_ARGUMENT, "Intent " + std::to_string(intentSeq) +
                         " has not been paid for");
    }
    OpenIntent intent = it->second;
    if (!gate) return appendOutcomeLocked(intent, success, result, reason);

    auto statusLock = registry.lockStatus();
    auto admitted = registry.admitLocked(agentId);
    if (admitted.failed()) {
        if (admitted.error().code == ErrorCode::UNKNOWN_AGENT) return admitted.error();
        auto r = appendOutcomeLocked(intent, false, result, errorToString(admitted.error().code));
        if (r.failed()) return r.error();
        return makeError(admitted.error().code, admitted.error().message, r.value().seq);
    }
    return appendOutcomeLocked(intent, success, result, reason);
}

Result<LedgerEntry> Kernel::Impl::appendOutcomeLocked(const OpenIntent& intent, bool success,
                                                      const Payload& result, const std::string& reason) {
    AppendRequest req;
    req.actor = intent.agentId;
    req.kind = KIND_ACTION_OUTCOME;
    req.outcome = success ? Outcome::COMMITTED : Outcome::FAILED;
    req.payload.merge(result, "result.");
    req.payload.setUint("intent", intent.seq)
               .set("action", intent.actionKind)
               .set("success", success ? "true" : "false");
    if (!reason.empty()) req.payload.set("reason", reason);

    Mutation m;
    uint64_t seq = intent.seq;
    m.apply = [this, seq](const LedgerEntry&) { intents.erase(seq); };
    return ledger.append(req, m);
}

void Kernel::Impl::applyLogConfig() {
    const utils::LogConfig& log = config.log;
    if (!log.level.empty()) {
        utils::Logger::setLevel(utils::Logger::parseLevel(log.level));
    }
    utils::Logger::setMaxFileSize(log.maxFileBytes);
    utils::Logger::setMaxFiles(log.maxFiles);
    if (log.file.empty() || ownsLogFile) return;

    std::filesystem::path path(log.file);
    if (path.is_relative() && !config.dataDir.empty()) {
        path = std::filesystem::path(config.dataDir) / path;
    }
    if (!utils::Logger::init(path.string())) {
        logKernel(utils::LogLevel::WARN, "Cannot open log file " + path.string());
        return;
    }
    ownsLogFile = true;
}

void Kernel::Impl::observe(SignalKind kind, const std::string& agentId, const LedgerEntry& entry) {
    Signal s;
    s.kind = kind;
    s.agentId = agentId;
    s.timestamp = entry.timestamp;
    s.ledgerSeq = entry.seq;
    s.detail = entry.payload.get("action");
    guardian.evaluate(agentId, s);
}

Kernel::Kernel(const utils::KernelConfig& config, utils::Clock clock)
    : impl_(std::make_unique<Impl>(config, clock)) {
    impl_->guardian.addDefaultRules();

    Impl* impl = impl_.get();
    impl_->budget.onSignal([impl](const Signal& s) { impl->guardian.evaluate(s.agentId, s); });
    impl_->arbiter.onDecision([impl](const Signal& s) { impl->guardian.evaluate(s.agentId, s); });
}

Kernel::~Kernel() {
    close();
}

bool Kernel::open(const std::string& dbPath) {
    SUBSTRATE_CONTEXT("kernel.open");
    impl_->applyLogConfig();
    if (!impl_->ledger.open(dbPath)) {
        logKernel(utils::LogLevel::ERROR, "Cannot open kernel store " + dbPath);
        return false;
    }

    auto entries = impl_->ledger.getRange(GENESIS_SEQ, LEDGER_END);
    FullReplay full = replayFull(entries);
    ReplayState state = replayAuthoritative(entries);

    impl_->registry.restore(full.agents);

    std::map<std::string, BudgetAccount> accounts = state.accounts;
    for (const auto& agent : full.agents) {
        if (accounts.count(agent.id)) continue;
        BudgetAccount zero;
        zero.agentId = agent.id;
        accounts[agent.id] = zero;
    }
    {
        auto locks = impl_->budget.lockAll();
        impl_->budget.restoreLocked(accounts);
    }

    impl_->arbiter.restoreHistory(full.requests);
    impl_->arbiter.restoreConflicts(full.conflicts);
    {
        auto lock = impl_->arbiter.lockExclusive();
        impl_->arbiter.restoreLocked(state.mode);
    }

    {
        std::lock_guard<std::mutex> lock(impl_->intentMutex);
        impl_->intents = full.openIntents;
        impl_->paying.clear();
    }

    impl_->guardian.restore(full);
    impl_->guardian.start();

    logKernel(utils::LogLevel::INFO, "Kernel opened at seq " + std::to_string(impl_->ledger.tailSequence()) +
              " with " + std::to_string(full.agents.size()) + " agents, mode " + modeToString(state.mode.mode));
    return true;
}

bool Kernel::open() {
    std::string dir = impl_->config.dataDir.empty() ? utils::Config::instance().getDataDir()
                                                    : impl_->config.dataDir;
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        logKernel(utils::LogLevel::ERROR, "Cannot create data directory " + dir + ": " + ec.message());
        return false;
    }
    return open((std::filesystem::path(dir) / impl_->config.dbFile).string());
}

void Kernel::close() {
    impl_->guardian.stop();
    if (impl_->ledger.isOpen()) {
        impl_->ledger.close();
        logKernel(utils::LogLevel::INFO, "Kernel closed");
    }
    if (impl_->ownsLogFile) {
        utils::Logger::shutdown();
        impl_->ownsLogFile = false;
    }
}

bool Kernel::isOpen() const {
    return impl_->ledger.isOpen();
}

Result<Agent> Kernel::registerAgent(const Caller& caller, const std::string& agentId, AgentType type,
                                    uint64_t initialAllocation) {
    SUBSTRATE_CONTEXT("kernel.registerAgent");
    auto auth = impl_->authorize(caller, Operation::REGISTER_AGENT);
    if (auth.failed()) return auth.error();

    auto accountsLock = impl_->budget.lockAccounts();
    Payload fields;
    auto opening = impl_->budget.accountOpening(agentId, initialAllocation, fields);
    if (opening.failed()) return opening.error();

    return impl_->registry.registerAgent(caller.id, agentId, type, opening.value(), fields);
}

Result<LedgerEntry> Kernel::submitIntent(const Caller& caller, const std::string& actionKind,
                                         const Payload& payload) {
    auto auth = impl_->authorize(caller, Operation::SUBMIT_INTENT);
    if (auth.failed()) return auth.error();
    return impl_->appendIntent(caller.id, actionKind, payload);
}

Result<DebitResult> Kernel::debit(const Caller& caller, uint64_t amount) {
    SUBSTRATE_CONTEXT("kernel.debit");
    auto auth = impl_->authorize(caller, Operation::DEBIT);
    if (auth.failed()) return auth.error();
    return impl_->budget.debit(caller.id, amount);
}

Result<DebitResult> Kernel::debitIntent(const Caller& caller, uint64_t intentSeq) {
    SUBSTRATE_CONTEXT("kernel.debit");
    auto auth = impl_->authorize(caller, Operation::DEBIT);
    if (auth.failed()) return auth.error();
    return impl_->payIntent(caller.id, intentSeq);
}

Result<LedgerEntry> Kernel::submitOutcome(const Caller& caller, uint64_t intentSeq, bool success,
                                          const Payload& result) {
    auto auth = impl_->authorize(caller, Operation::SUBMIT_OUTCOME);
    if (auth.failed()) return auth.error();

    auto intent = impl_->ledger.getEntry(intentSeq);
    if (intent.failed()) return intent.error();
    if (intent.value().kind != KIND_ACTION_INTENT || intent.value().outcome != Outcome::INTENT) {
        return makeError(ErrorCode::INVALID_ARGUMENT, "Entry " + std::to_string(intentSeq) + " is not an open intent");
    }
    if (intent.value().actor != caller.id) {
        return makeError(ErrorCode::INVALID_ARGUMENT, "Intent " + std::to_string(intentSeq) +
                         " was submitted by " + intent.value().actor);
    }

    auto r = impl_->closeIntent(caller.id, intentSeq, success, result, "", true);
    if (r.failed()) return r.error();

    impl_->observe(success ? SignalKind::ACTION_SUCCEEDED : SignalKind::ACTION_FAILED, caller.id, r.value());
    return r;
}

Result<ModeChangeRequest> Kernel::requestModeChange(const Caller& caller, Mode target,
                                                    const std::string& justification) {
    SUBSTRATE_CONTEXT("kernel.requestModeChange");
    auto auth = impl_->authorize(caller, Operation::REQUEST_MODE_CHANGE);
    if (auth.failed()) return auth.error();
    return impl_->arbiter.requestModeChange(caller, target, justification);
}

Result<ActionReceipt> Kernel::executeAction(const Caller& caller, const std::string& actionKind,
                                            const Payload& payload, ActionEffect effect) {
    SUBSTRATE_CONTEXT("kernel.executeAction");
    auto auth = impl_->authorize(caller, Operation::EXECUTE_ACTION);
    if (auth.failed()) return auth.error();
    if (!effect) {
        return makeError(ErrorCode::INVALID_ARGUMENT, "Action " + actionKind + " has no effect");
    }

    auto cost = impl_->budget.quote(actionKind);
    if (cost.failed()) return cost.error();

    auto intent = impl_->appendIntent(caller.id, actionKind, payload);
    if (intent.failed()) return intent.error();

    ActionReceipt receipt;
    receipt.actionKind = actionKind;
    receipt.intentSeq = intent.value().seq;
    receipt.cost = cost.value();

    auto paid = impl_->payIntent(caller.id, receipt.intentSeq);
    if (paid.failed()) return paid.error();
    receipt.debitSeq = paid.value().ledgerSeq;
    receipt.remaining = paid.value().remaining;

    Result<Payload> effectResult = makeError(ErrorCode::INTERNAL_ERROR, "Action effect did not run");
    try {
        effectResult = effect();
    } catch (const std::exception& e) {
        effectResult = makeError(ErrorCode::INTERNAL_ERROR, std::string("Action effect threw: ") + e.what());
    }

    receipt.succeeded = effectResult.ok();
    Payload result;
    std::string reason;
    if (receipt.succeeded) {
        result = effectResult.value();
    } else {
        result.set("error", effectResult.error().message);
        reason = errorToString(effectResult.error().code);
    }

    auto out = impl_->closeIntent(caller.id, receipt.intentSeq, receipt.succeeded, result, reason, false);
    if (out.failed()) return out.error();
    receipt.outcomeSeq = out.value().seq;
    receipt.result = result;

    logKernel(receipt.succeeded ? utils::LogLevel::INFO : utils::LogLevel::WARN,
              "Action " + actionKind + " by " + caller.id + (receipt.succeeded ? " succeeded" : " failed") +
              ", cost " + std::to_string(receipt.cost));

    impl_->observe(receipt.succeeded ? SignalKind::ACTION_SUCCEEDED : SignalKind::ACTION_FAILED,
                   caller.id, out.value());
    return receipt;
}

Result<BudgetAccount> Kernel::allocate(const Caller& caller, const std::string& agentId, uint64_t amount) {
    SUBSTRATE_CONTEXT("kernel.allocate");
    auto auth = impl_->authorize(caller, Operation::ALLOCATE);
    if (auth.failed()) return auth.error();
    return impl_->budget.allocate(caller.id, agentId, amount);
}

Result<ConflictResolution> Kernel::resolveConflict(const Caller& caller, const std::string& conflictType,
                                                   const std::vector<std::string>& agents,
                                                   const std::string& resolution) {
    auto auth = impl_->authorize(caller, Operation::RESOLVE_CONFLICT);
    if (auth.failed()) return auth.error();
    return impl_->arbiter.resolveConflict(caller.id, conflictType, agents, resolution);
}

Result<Checkpoint> Kernel::createCheckpoint(const Caller& caller, const std::string& description) {
    auto auth = impl_->authorize(caller, Operation::CREATE_CHECKPOINT);
    if (auth.failed()) return auth.error();
    return impl_->guardian.createCheckpoint(caller.id, description);
}

Result<RollbackResult> Kernel::rollback(const Caller& caller, const std::string& checkpointId) {
    SUBSTRATE_CONTEXT("kernel.rollback");
    auto auth = impl_->authorize(caller, Operation::ROLLBACK);
    if (auth.failed()) return auth.error();
    return impl_->guardian.rollback(caller.id, checkpointId);
}

Result<QuarantineRecord> Kernel::quarantine(const Caller& caller, const std::string& agentId,
                                            const std::string& reason) {
    auto auth = impl_->authorize(caller, Operation::QUARANTINE);
    if (auth.failed()) return auth.error();
    return impl_->guardian.quarantine(caller.id, agentId, reason);
}

Result<QuarantineRecord> Kernel::release(const Caller& caller, const std::string& agentId) {
    auto auth = impl_->authorize(caller, Operation::RELEASE);
    if (auth.failed()) return auth.error();
    return impl_->guardian.release(caller.id, agentId);
}

Result<Agent> Kernel::terminate(const Caller& caller, const std::string& agentId, const std::string& reason) {
    auto auth = impl_->authorize(caller, Operation::TERMINATE);
    if (auth.failed()) return auth.error();
    return impl_->guardian.terminate(caller.id, agentId, reason);
}

Result<ChainReport> Kernel::verifyChain(const Caller& caller, uint64_t from, uint64_t to) {
    SUBSTRATE_CONTEXT("kernel.verifyChain");
    auto auth = impl_->authorize(caller, Operation::VERIFY_CHAIN);
    if (auth.failed()) return auth.error();
    return impl_->ledger.verifyChain(from, to);
}

Result<std::vector<LedgerEntry>> Kernel::getLedgerRange(const Caller& caller, uint64_t from, uint64_t to) {
    auto auth = impl_->authorize(caller, Operation::READ_LEDGER);
    if (auth.failed()) return auth.error();
    if (from > to) {
        return makeError(ErrorCode::INVALID_ARGUMENT, "Range start is after its end");
    }
    return impl_->ledger.getRange(from, to);
}

Result<BudgetSummary> Kernel::getBudgetSummary(const Caller& caller) {
    auto auth = impl_->authorize(caller, Operation::READ_BUDGET);
    if (auth.failed()) return auth.error();
    return impl_->budget.summary();
}

Result<uint64_t> Kernel::getTotalCost(const Caller& caller, const std::string& agentId,
                                      const std::string& actionKind) {
    auto auth = impl_->authorize(caller, Operation::READ_BUDGET);
    if (auth.failed()) return auth.error();
    return impl_->budget.totalCost(agentId, actionKind);
}

Result<void> Kernel::exportLedger(const Caller& caller, const std::string& path) {
    auto auth = impl_->authorize(caller, Operation::EXPORT_LEDGER);
    if (auth.failed()) return auth.error();
    if (!impl_->ledger.exportToFile(path)) {
        return makeError(ErrorCode::DATABASE_ERROR, "Cannot export ledger to " + path);
    }
    return Result<void>();
}

const Ledger& Kernel::ledger() const {
    return impl_->ledger;
}

const AgentRegistry& Kernel::registry() const {
    return impl_->registry;
}

const BudgetRegister& Kernel::budget() const {
    return impl_->budget;
}

const Arbiter& Kernel::arbiter() const {
    return impl_->arbiter;
}

const Guardian& Kernel::guardian() const {
    return impl_->guardian;
}

const utils::KernelConfig& Kernel::config() const {
    return impl_->config;
}

}
}
