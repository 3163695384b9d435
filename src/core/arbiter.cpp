#include "core/arbiter.h"
#include "core/entry_kinds.h"
#include "core/privilege.h"
#include "utils/logger.h"
#include <algorithm>

namespace substrate {
namespace core {

const char* const MODE_STATE_KEY = "mode:state";

namespace {

// Rows are the current mode, columns the requested mode.
const bool TRANSITIONS[MODE_COUNT][MODE_COUNT] = {
    //            observe alert  act    defend
    /* observe */ {false, true,  false, true},
    /* alert   */ {true,  false, true,  true},
    /* act     */ {true,  false, false, true},
    /* defend  */ {true,  false, false, false},
};

void logArbiter(utils::LogLevel level, const std::string& msg) {
    utils::Logger::log(level, "arbiter", msg);
}

Role roleFromConfig(const std::string& value, Role def, const char* mode) {
    Role role;
    if (parseRole(value, role)) return role;
    logArbiter(utils::LogLevel::WARN, "Invalid minimum role '" + value + "' for " + mode +
               ", using " + roleToString(def));
    return def;
}

}

Arbiter::Arbiter(Ledger& ledger, const AgentRegistry& registry,
                 const utils::ArbiterConfig& config, utils::Clock clock)
    : ledger_(ledger), registry_(registry), config_(config),
      clock_(clock ? clock : utils::systemClock()) {
    minRoles_[static_cast<size_t>(Mode::OBSERVE)] = roleFromConfig(config_.minRoleObserve, Role::AGENT, "observe");
    minRoles_[static_cast<size_t>(Mode::ALERT)] = roleFromConfig(config_.minRoleAlert, Role::AGENT, "alert");
    minRoles_[static_cast<size_t>(Mode::ACT)] = roleFromConfig(config_.minRoleAct, Role::OPERATOR, "act");
    minRoles_[static_cast<size_t>(Mode::DEFEND)] = roleFromConfig(config_.minRoleDefend, Role::OPERATOR, "defend");
}

bool Arbiter::isReachable(Mode from, Mode to) {
    size_t f = static_cast<size_t>(from);
    size_t t = static_cast<size_t>(to);
    if (f >= MODE_COUNT || t >= MODE_COUNT) return false;
    return TRANSITIONS[f][t];
}

Role Arbiter::minimumRole(Mode target) const {
    return minRoles_[static_cast<size_t>(target)];
}

Decision Arbiter::decide(Mode current, Mode target, Role role, size_t requestsInWindow) const {
    Decision d;

    if (target != Mode::DEFEND && config_.thrashLimit > 0 && requestsInWindow >= config_.thrashLimit) {
        d.code = ErrorCode::ARBITRATION_DENIED;
        d.reason = std::to_string(requestsInWindow) + " mode requests within " +
                   std::to_string(config_.thrashWindowMs) + "ms, limit is " +
                   std::to_string(config_.thrashLimit);
        return d;
    }

    if (!isReachable(current, target)) {
        d.code = ErrorCode::INVALID_TRANSITION;
        d.reason = std::string("No transition from ") + modeToString(current) + " to " + modeToString(target);
        return d;
    }

    if (current == Mode::DEFEND && !satisfies(role, Role::OPERATOR)) {
        d.code = ErrorCode::ARBITRATION_DENIED;
        d.reason = "Leaving defend requires operator confirmation";
        return d;
    }

    Role required = minimumRole(target);
    if (!satisfies(role, required)) {
        d.code = ErrorCode::ARBITRATION_DENIED;
        d.reason = std::string("Entering ") + modeToString(target) + " requires role " + roleToString(required) +
                   ", requester is " + roleToString(role);
        return d;
    }

    d.approved = true;
    return d;
}

void Arbiter::pruneLocked(uint64_t now) const {
    while (!requestTimes_.empty() && now - requestTimes_.front() >= config_.thrashWindowMs) {
        requestTimes_.pop_front();
    }
    while (!transitionTimes_.empty() && now - transitionTimes_.front() >= config_.thrashWindowMs) {
        transitionTimes_.pop_front();
    }
}

Result<ModeChangeRequest> Arbiter::requestModeChange(const Caller& requester, Mode target,
                                                     const std::string& justification) {
    if (requester.id.empty()) {
        return makeError(ErrorCode::INVALID_ARGUMENT, "Mode change requester must be identified");
    }
    if (static_cast<size_t>(target) >= MODE_COUNT) {
        return makeError(ErrorCode::INVALID_ARGUMENT, "Unknown target mode");
    }

    Signal signal;
    Result<ModeChangeRequest> result = makeError(ErrorCode::INTERNAL_ERROR, "unreachable");
    bool notify = false;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        uint64_t now = clock_();

        ModeChangeRequest req;
        req.id = nextRequestId_++;
        req.requester = requester.id;
        req.requesterRole = requester.role;
        req.requested = target;
        req.fromMode = state_.mode;
        req.justification = justification;
        req.submittedAt = now;

        // An agent's status stays fixed until its request is recorded.
        std::unique_lock<std::mutex> statusLock;
        if (requester.role == Role::AGENT) {
            statusLock = registry_.lockStatus();
            auto gate = registry_.admitLocked(requester.id);
            if (gate.failed()) {
                if (gate.error().code == ErrorCode::UNKNOWN_AGENT) return gate.error();
                Decision gated;
                gated.code = gate.error().code;
                gated.reason = gate.error().message;
                return resolveLocked(req, gated);
            }
        }

        pruneLocked(now);
        Decision d = decide(state_.mode, target, requester.role, requestTimes_.size());
        result = resolveLocked(req, d);

        bool recorded = result.ok() || result.error().hasLedgerRef;
        if (recorded) {
            requestTimes_.push_back(now);
            notify = true;
            signal.kind = d.approved ? SignalKind::MODE_APPROVED : SignalKind::MODE_DENIED;
            signal.agentId = requester.id;
            signal.timestamp = now;
            signal.ledgerSeq = result.ok() ? result.value().ledgerSeq : result.error().ledgerSeq;
            signal.detail = d.reason;
        }
    }

    if (notify) emit(signal);
    return result;
}

Result<ModeChangeRequest> Arbiter::resolveLocked(ModeChangeRequest request, const Decision& decision) {
    AppendRequest entry;
    entry.actor = request.requester;
    entry.payload.setUint("request", request.id)
                 .set("from", modeToString(request.fromMode))
                 .set("to", modeToString(request.requested))
                 .set("role", roleToString(request.requesterRole))
                 .set("justification", request.justification);

    if (decision.approved) {
        entry.kind = KIND_MODE_TRANSITION;
        entry.outcome = Outcome::COMMITTED;

        ModeState next;
        next.mode = request.requested;
        next.transitionsInWindow = static_cast<uint32_t>(transitionTimes_.size() + 1);

        Mutation m;
        m.stage = [&next](database::WriteBatch& batch, const LedgerEntry& e) {
            ModeState row = next;
            row.enteredAt = e.timestamp;
            row.enteredSeq = e.seq;
            batch.put(MODE_STATE_KEY, row.serialize());
        };
        m.apply = [this, &next, &request](const LedgerEntry& e) {
            next.enteredAt = e.timestamp;
            next.enteredSeq = e.seq;
            state_ = next;
            transitionTimes_.push_back(e.timestamp);
            request.resolution = Resolution::APPROVED;
            request.resolver = "arbiter";
            request.ledgerSeq = e.seq;
            history_.push_back(request);
        };

        auto r = ledger_.append(entry, m);
        if (r.failed()) return r.error();

        logArbiter(utils::LogLevel::INFO, std::string("Mode ") + modeToString(request.fromMode) + " -> " +
                   modeToString(request.requested) + " approved for " + request.requester);
        return request;
    }

    entry.kind = KIND_MODE_DENIED;
    entry.outcome = Outcome::FAILED;
    entry.payload.setUint("code", static_cast<uint64_t>(decision.code))
                 .set("error", errorToString(decision.code))
                 .set("reason", decision.reason);

    Mutation m;
    m.apply = [this, &request, &decision](const LedgerEntry& e) {
        request.resolution = Resolution::DENIED;
        request.resolver = "arbiter";
        request.denialCode = decision.code;
        request.denialReason = decision.reason;
        request.ledgerSeq = e.seq;
        history_.push_back(request);
    };

    auto r = ledger_.append(entry, m);
    if (r.failed()) return r.error();

    logArbiter(utils::LogLevel::WARN, std::string("Mode ") + modeToString(request.fromMode) + " -> " +
               modeToString(request.requested) + " denied for " + request.requester + ": " + decision.reason);
    return makeError(decision.code, decision.reason, r.value().seq);
}

Result<ConflictResolution> Arbiter::resolveConflict(const std::string& resolver, const std::string& conflictType,
                                                    const std::vector<std::string>& agents,
                                                    const std::string& resolution) {
    if (conflictType.empty() || resolution.empty()) {
        return makeError(ErrorCode::INVALID_ARGUMENT, "Conflict needs a type and a resolution");
    }
    if (agents.empty()) {
        return makeError(ErrorCode::INVALID_ARGUMENT, "Conflict names no agents");
    }

    std::string joined;
    for (const auto& agent : agents) {
        if (agent.empty() || agent.find(',') != std::string::npos) {
            return makeError(ErrorCode::INVALID_ARGUMENT, "Invalid agent id '" + agent + "' in conflict");
        }
        if (!registry_.exists(agent)) {
            return makeError(ErrorCode::UNKNOWN_AGENT, "Unknown agent " + agent);
        }
        if (!joined.empty()) joined += ",";
        joined += agent;
    }

    std::lock_guard<std::mutex> lock(mtx_);
    ConflictResolution conflict;
    conflict.id = nextConflictId_;
    conflict.conflictType = conflictType;
    conflict.agents = agents;
    conflict.resolution = resolution;
    conflict.resolvedBy = resolver;

    AppendRequest entry;
    entry.actor = resolver;
    entry.kind = KIND_CONFLICT_RESOLVED;
    entry.payload.setUint("conflict", conflict.id)
                 .set("conflict_type", conflictType)
                 .set("agents", joined)
                 .set("resolution", resolution);

    Mutation m;
    m.apply = [this, &conflict](const LedgerEntry& e) {
        conflict.timestamp = e.timestamp;
        conflict.ledgerSeq = e.seq;
        conflicts_.push_back(conflict);
        nextConflictId_ = conflict.id + 1;
    };

    auto r = ledger_.append(entry, m);
    if (r.failed()) return r.error();

    logArbiter(utils::LogLevel::INFO, "Conflict " + std::to_string(conflict.id) + " (" + conflictType +
               ") between " + joined + " resolved by " + resolver);
    return conflict;
}

std::vector<ConflictResolution> Arbiter::conflicts() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return conflicts_;
}

Mode Arbiter::currentMode() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return state_.mode;
}

ModeState Arbiter::modeState() const {
    std::lock_guard<std::mutex> lock(mtx_);
    pruneLocked(clock_());
    ModeState st = state_;
    st.transitionsInWindow = static_cast<uint32_t>(transitionTimes_.size());
    return st;
}

std::vector<ModeChangeRequest> Arbiter::history(size_t limit) const {
    std::lock_guard<std::mutex> lock(mtx_);
    if (limit == 0 || limit >= history_.size()) return history_;
    return std::vector<ModeChangeRequest>(history_.end() - limit, history_.end());
}

size_t Arbiter::requestsInWindow() const {
    std::lock_guard<std::mutex> lock(mtx_);
    pruneLocked(clock_());
    return requestTimes_.size();
}

void Arbiter::onDecision(std::function<void(const Signal&)> callback) {
    std::lock_guard<std::mutex> lock(callbackMutex_);
    callbacks_.push_back(callback);
}

void Arbiter::emit(const Signal& signal) {
    std::vector<std::function<void(const Signal&)>> callbacks;
    {
        std::lock_guard<std::mutex> lock(callbackMutex_);
        callbacks = callbacks_;
    }
    for (const auto& cb : callbacks) {
        cb(signal);
    }
}

std::unique_lock<std::mutex> Arbiter::lockExclusive() {
    return std::unique_lock<std::mutex>(mtx_);
}

void Arbiter::restoreLocked(const ModeState& state) {
    state_ = state;
}

void Arbiter::restoreHistory(const std::vector<ModeChangeRequest>& history) {
    std::lock_guard<std::mutex> lock(mtx_);
    history_ = history;
    requestTimes_.clear();
    transitionTimes_.clear();
    nextRequestId_ = 1;
    for (const auto& req : history_) {
        nextRequestId_ = std::max(nextRequestId_, req.id + 1);
        if (req.denialCode == ErrorCode::AGENT_QUARANTINED || req.denialCode == ErrorCode::AGENT_TERMINATED) {
            continue;
        }
        requestTimes_.push_back(req.submittedAt);
        if (req.resolution == Resolution::APPROVED) transitionTimes_.push_back(req.submittedAt);
    }
}

void Arbiter::restoreConflicts(const std::vector<ConflictResolution>& conflicts) {
    std::lock_guard<std::mutex> lock(mtx_);
    conflicts_ = conflicts;
    nextConflictId_ = 1;
    for (const auto& c : conflicts_) {
        nextConflictId_ = std::max(nextConflictId_, c.id + 1);
    }
}

}
}
