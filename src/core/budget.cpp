#include "core/budget.h"
#include "core/entry_kinds.h"
#include "core/replay.h"
#include "utils/logger.h"
#include <limits>

namespace substrate {
namespace core {

namespace {

void logBudget(utils::LogLevel level, const std::string& msg) {
    utils::Logger::log(level, "budget", msg);
}

uint64_t windowEndFrom(uint64_t now, uint64_t windowMs) {
    if (windowMs == 0) return 0;
    if (now > std::numeric_limits<uint64_t>::max() - windowMs) return std::numeric_limits<uint64_t>::max();
    return now + windowMs;
}

}

std::string budgetKey(const std::string& agentId) {
    return "budget:" + agentId;
}

BudgetRegister::BudgetRegister(Ledger& ledger, const AgentRegistry& registry,
                               const utils::BudgetConfig& config, utils::Clock clock)
    : ledger_(ledger), registry_(registry), config_(config),
      clock_(clock ? clock : utils::systemClock()) {}

BudgetRegister::~BudgetRegister() = default;

Result<uint64_t> BudgetRegister::quote(const std::string& actionKind) const {
    auto it = config_.costs.find(actionKind);
    if (it == config_.costs.end()) {
        return makeError(ErrorCode::UNKNOWN_ACTION_KIND, "No cost configured for action kind '" + actionKind + "'");
    }
    return it->second;
}

std::shared_ptr<BudgetRegister::Slot> BudgetRegister::findSlot(const std::string& agentId) const {
    std::lock_guard<std::mutex> lock(mapMutex_);
    auto it = accounts_.find(agentId);
    return it != accounts_.end() ? it->second : nullptr;
}

std::unique_lock<std::mutex> BudgetRegister::lockAccounts() {
    return std::unique_lock<std::mutex>(mapMutex_);
}

Result<Mutation> BudgetRegister::accountOpening(const std::string& agentId, uint64_t initialAllocation,
                                                Payload& fields) {
    if (accounts_.count(agentId)) {
        return makeError(ErrorCode::ALREADY_EXISTS, "Budget account for " + agentId + " already exists");
    }

    BudgetAccount acc;
    acc.agentId = agentId;
    acc.allocated = initialAllocation;
    acc.windowMs = config_.windowMs;
    if (acc.windowMs > 0) acc.windowEnd = windowEndFrom(clock_(), acc.windowMs);

    fields.set("agent", agentId).setUint("allocated", acc.allocated).setUint("consumed", 0);
    if (acc.windowMs > 0) {
        fields.setUint("window_ms", acc.windowMs).setUint("window_end", acc.windowEnd);
    }

    Mutation m;
    m.stage = [acc](database::WriteBatch& batch, const LedgerEntry& e) {
        BudgetAccount row = acc;
        row.lastSeq = e.seq;
        batch.put(budgetKey(row.agentId), row.serialize());
    };
    m.apply = [this, acc](const LedgerEntry& e) {
        auto slot = std::make_shared<Slot>();
        slot->account = acc;
        slot->account.lastSeq = e.seq;
        accounts_[acc.agentId] = slot;
    };
    return m;
}

Result<BudgetAccount> BudgetRegister::openAccount(const std::string& actor, const std::string& agentId,
                                                  uint64_t initialAllocation) {
    if (!registry_.exists(agentId)) {
        return makeError(ErrorCode::UNKNOWN_AGENT, "Unknown agent " + agentId);
    }

    auto lock = lockAccounts();
    AppendRequest req;
    req.actor = actor;
    req.kind = KIND_BUDGET_OPENED;

    auto opening = accountOpening(agentId, initialAllocation, req.payload);
    if (opening.failed()) return opening.error();

    auto r = ledger_.append(req, opening.value());
    if (r.failed()) return r.error();

    logBudget(utils::LogLevel::INFO, "Opened account " + agentId + " with " + std::to_string(initialAllocation));
    return accounts_[agentId]->account;
}

uint32_t BudgetRegister::recordAttempt(Slot& slot, uint64_t now) {
    slot.attempts.push_back(now);
    while (!slot.attempts.empty() && now - slot.attempts.front() >= config_.velocityWindowMs) {
        slot.attempts.pop_front();
    }
    return static_cast<uint32_t>(slot.attempts.size());
}

Result<DebitResult> BudgetRegister::rejectGated(const std::string& agentId, uint64_t amount,
                                                const std::string& actionKind, uint64_t intentSeq,
                                                const Error& gate) {
    AppendRequest req;
    req.actor = agentId;
    req.kind = KIND_BUDGET_DEBIT;
    req.outcome = Outcome::FAILED;
    req.payload.set("agent", agentId)
               .setUint("amount", amount)
               .set("reason", errorToString(gate.code));
    if (!actionKind.empty()) req.payload.set("action", actionKind);
    if (intentSeq != 0) req.payload.setUint("intent", intentSeq);

    auto r = ledger_.append(req);
    if (r.failed()) return r.error();

    logBudget(utils::LogLevel::WARN, "Debit of " + std::to_string(amount) + " by " + agentId +
              " refused: " + gate.message);
    return makeError(gate.code, gate.message, r.value().seq);
}

Result<DebitResult> BudgetRegister::debit(const std::string& agentId, uint64_t amount,
                                          const std::string& actionKind, uint64_t intentSeq) {
    if (amount == 0 && actionKind.empty()) {
        return makeError(ErrorCode::INVALID_ARGUMENT, "Debit amount must be positive");
    }

    auto slot = findSlot(agentId);
    std::vector<Signal> signals;
    Result<DebitResult> out = makeError(ErrorCode::INTERNAL_ERROR, "unreachable");
    {
        std::unique_lock<std::mutex> slotLock;
        if (slot) slotLock = std::unique_lock<std::mutex>(slot->mtx);

        // Held until the entry commits, so a quarantine lands before or after
        // this debit and never between the check and the append.
        auto statusLock = registry_.lockStatus();
        auto gate = registry_.admitLocked(agentId);
        if (gate.failed()) {
            if (gate.error().code == ErrorCode::UNKNOWN_AGENT) return gate.error();
            return rejectGated(agentId, amount, actionKind, intentSeq, gate.error());
        }
        if (!slot) {
            return makeError(ErrorCode::NOT_FOUND, "No budget account for " + agentId);
        }

        uint64_t now = clock_();
        uint32_t attempts = recordAttempt(*slot, now);
        BudgetAccount current = slot->account;

        AppendRequest req;
        req.actor = agentId;
        req.kind = KIND_BUDGET_DEBIT;
        req.payload.set("agent", agentId).setUint("amount", amount);
        if (!actionKind.empty()) req.payload.set("action", actionKind);
        if (intentSeq != 0) req.payload.setUint("intent", intentSeq);

        if (current.expired(now) || current.remaining() < amount) {
            req.outcome = Outcome::FAILED;
            req.payload.setUint("remaining", current.available(now))
                       .set("reason", errorToString(ErrorCode::INSUFFICIENT_BUDGET));
            if (current.expired(now)) req.payload.set("window", "expired");

            auto r = ledger_.append(req);
            if (r.failed()) return r.error();

            std::string msg = current.expired(now)
                ? "Budget window for " + agentId + " expired at " + std::to_string(current.windowEnd)
                : "Debit of " + std::to_string(amount) + " exceeds remaining " +
                  std::to_string(current.remaining()) + " for " + agentId;
            logBudget(utils::LogLevel::WARN, msg);
            out = makeError(ErrorCode::INSUFFICIENT_BUDGET, msg, r.value().seq);

            Signal s;
            s.kind = SignalKind::BUDGET_REJECTED;
            s.agentId = agentId;
            s.timestamp = r.value().timestamp;
            s.ledgerSeq = r.value().seq;
            signals.push_back(s);
        } else {
            BudgetAccount next = current;
            next.consumed += amount;
            req.outcome = Outcome::COMMITTED;
            req.payload.setUint("allocated", next.allocated)
                       .setUint("consumed", next.consumed)
                       .setUint("remaining", next.remaining());

            Slot* target = slot.get();
            Mutation m;
            m.stage = [&next](database::WriteBatch& batch, const LedgerEntry& e) {
                BudgetAccount row = next;
                row.lastSeq = e.seq;
                batch.put(budgetKey(row.agentId), row.serialize());
            };
            m.apply = [target, &next](const LedgerEntry& e) {
                next.lastSeq = e.seq;
                target->account = next;
            };

            auto r = ledger_.append(req, m);
            if (r.failed()) return r.error();

            DebitResult result;
            result.accepted = true;
            result.amount = amount;
            result.remaining = next.remaining();
            result.ledgerSeq = r.value().seq;
            out = result;

            Signal s;
            s.kind = SignalKind::BUDGET_ACCEPTED;
            s.agentId = agentId;
            s.timestamp = r.value().timestamp;
            s.ledgerSeq = r.value().seq;
            signals.push_back(s);
        }

        if (attempts > config_.velocityMaxDebits) {
            Signal s;
            s.kind = SignalKind::BUDGET_VELOCITY;
            s.agentId = agentId;
            s.timestamp = now;
            s.ledgerSeq = signals.back().ledgerSeq;
            s.detail = std::to_string(attempts) + " debits within " +
                       std::to_string(config_.velocityWindowMs) + "ms";
            signals.push_back(s);
            logBudget(utils::LogLevel::WARN, "Velocity threshold exceeded by " + agentId + ": " + s.detail);
        }
    }

    emit(signals);
    return out;
}

Result<BudgetAccount> BudgetRegister::allocate(const std::string& authorizer, const std::string& agentId,
                                               uint64_t amount) {
    if (amount == 0) {
        return makeError(ErrorCode::INVALID_ARGUMENT, "Allocation amount must be positive");
    }

    auto slot = findSlot(agentId);
    if (!slot) {
        return makeError(ErrorCode::NOT_FOUND, "No budget account for " + agentId);
    }

    std::lock_guard<std::mutex> lock(slot->mtx);
    uint64_t now = clock_();
    BudgetAccount next = slot->account;
    bool renewed = next.expired(now);
    if (renewed) {
        next.allocated = amount;
        next.consumed = 0;
        next.windowEnd = windowEndFrom(now, next.windowMs);
    } else {
        if (next.allocated > std::numeric_limits<uint64_t>::max() - amount) {
            return makeError(ErrorCode::INVALID_ARGUMENT, "Allocation overflows account " + agentId);
        }
        next.allocated += amount;
    }

    AppendRequest req;
    req.actor = authorizer;
    req.kind = KIND_BUDGET_ALLOCATED;
    req.payload.set("agent", agentId)
               .setUint("amount", amount)
               .setUint("allocated", next.allocated)
               .setUint("consumed", next.consumed)
               .setUint("remaining", next.remaining())
               .set("authorized_by", authorizer);
    if (next.windowMs > 0) {
        req.payload.setUint("window_ms", next.windowMs).setUint("window_end", next.windowEnd);
    }
    if (renewed) req.payload.set("window", "renewed");

    Slot* target = slot.get();
    Mutation m;
    m.stage = [&next](database::WriteBatch& batch, const LedgerEntry& e) {
        BudgetAccount row = next;
        row.lastSeq = e.seq;
        batch.put(budgetKey(row.agentId), row.serialize());
    };
    m.apply = [target, &next](const LedgerEntry& e) {
        next.lastSeq = e.seq;
        target->account = next;
    };

    auto r = ledger_.append(req, m);
    if (r.failed()) return r.error();

    logBudget(utils::LogLevel::INFO, authorizer + (renewed ? " renewed " : " allocated ") +
              std::to_string(amount) + " to " + agentId);
    return next;
}

Result<BudgetAccount> BudgetRegister::account(const std::string& agentId) const {
    auto slot = findSlot(agentId);
    if (!slot) {
        return makeError(ErrorCode::NOT_FOUND, "No budget account for " + agentId);
    }
    std::lock_guard<std::mutex> lock(slot->mtx);
    return slot->account;
}

BudgetSummary BudgetRegister::summary() const {
    BudgetSummary out;
    uint64_t now = clock_();
    std::lock_guard<std::mutex> lock(mapMutex_);
    for (const auto& [id, slot] : accounts_) {
        std::lock_guard<std::mutex> slotLock(slot->mtx);
        out.accounts.push_back(slot->account);
        out.totalAllocated += slot->account.allocated;
        out.totalConsumed += slot->account.consumed;
        out.totalRemaining += slot->account.available(now);
    }
    return out;
}

Result<uint64_t> BudgetRegister::totalCost(const std::string& agentId, const std::string& actionKind) const {
    if (!findSlot(agentId)) {
        return makeError(ErrorCode::NOT_FOUND, "No budget account for " + agentId);
    }

    ReplayState state = replayAuthoritative(ledger_.getRange(GENESIS_SEQ, LEDGER_END));
    uint64_t total = 0;
    auto it = state.costs.find(agentId);
    if (it == state.costs.end()) return total;
    for (const auto& [kind, amount] : it->second) {
        if (actionKind.empty() || kind == actionKind) total += amount;
    }
    return total;
}

void BudgetRegister::onSignal(std::function<void(const Signal&)> callback) {
    std::lock_guard<std::mutex> lock(callbackMutex_);
    callbacks_.push_back(callback);
}

void BudgetRegister::emit(const std::vector<Signal>& signals) {
    std::vector<std::function<void(const Signal&)>> callbacks;
    {
        std::lock_guard<std::mutex> lock(callbackMutex_);
        callbacks = callbacks_;
    }
    for (const auto& s : signals) {
        for (const auto& cb : callbacks) {
            cb(s);
        }
    }
}

std::vector<std::unique_lock<std::mutex>> BudgetRegister::lockAll() {
    std::vector<std::unique_lock<std::mutex>> locks;
    locks.emplace_back(mapMutex_);
    for (auto& [id, slot] : accounts_) {
        locks.emplace_back(slot->mtx);
    }
    return locks;
}

void BudgetRegister::restoreLocked(const std::map<std::string, BudgetAccount>& state) {
    for (auto& [id, slot] : accounts_) {
        auto it = state.find(id);
        if (it != state.end()) {
            slot->account = it->second;
        } else {
            BudgetAccount zero;
            zero.agentId = id;
            zero.lastSeq = slot->account.lastSeq;
            slot->account = zero;
        }
    }
    for (const auto& [id, acc] : state) {
        if (accounts_.count(id)) continue;
        auto slot = std::make_shared<Slot>();
        slot->account = acc;
        accounts_[id] = slot;
    }
}

void BudgetRegister::stageAccounts(database::WriteBatch& batch, const std::map<std::string, BudgetAccount>& state,
                                   uint64_t seq) const {
    for (const auto& [id, slot] : accounts_) {
        BudgetAccount row;
        auto it = state.find(id);
        if (it != state.end()) {
            row = it->second;
        } else {
            row.agentId = id;
        }
        row.lastSeq = seq;
        batch.put(budgetKey(id), row.serialize());
    }
    for (const auto& [id, acc] : state) {
        if (accounts_.count(id)) continue;
        BudgetAccount row = acc;
        row.lastSeq = seq;
        batch.put(budgetKey(id), row.serialize());
    }
}

}
}
