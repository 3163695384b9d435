#include "core/replay.h"
#include "core/entry_kinds.h"
#include "utils/logger.h"
#include <algorithm>

namespace substrate {
namespace core {

namespace {

size_t contiguousPrefix(const std::vector<LedgerEntry>& entries) {
    for (size_t i = 0; i < entries.size(); i++) {
        if (entries[i].seq != i) {
            utils::Logger::log(utils::LogLevel::ERROR, "replay",
                               "Ledger entries not contiguous at index " + std::to_string(i));
            return i;
        }
    }
    return entries.size();
}

void applyAccountFields(BudgetAccount& acc, const LedgerEntry& e) {
    acc.agentId = e.payload.get("agent");
    acc.allocated = e.payload.getUint("allocated", acc.allocated);
    acc.consumed = e.payload.getUint("consumed", acc.consumed);
    acc.windowMs = e.payload.getUint("window_ms", acc.windowMs);
    acc.windowEnd = e.payload.getUint("window_end", acc.windowEnd);
    acc.lastSeq = e.seq;
}

std::vector<std::string> splitAgents(const std::string& list) {
    std::vector<std::string> out;
    size_t start = 0;
    while (start <= list.size()) {
        size_t comma = list.find(',', start);
        if (comma == std::string::npos) comma = list.size();
        if (comma > start) out.push_back(list.substr(start, comma - start));
        start = comma + 1;
    }
    return out;
}

}

std::vector<uint64_t> authoritativePath(const std::vector<LedgerEntry>& entries) {
    std::vector<uint64_t> path;
    size_t n = contiguousPrefix(entries);
    if (n == 0) return path;

    uint64_t cur = n - 1;
    while (true) {
        path.push_back(cur);
        if (cur == GENESIS_SEQ) break;

        const LedgerEntry& e = entries[cur];
        uint64_t next = cur - 1;
        if (e.kind == KIND_ROLLBACK && e.outcome == Outcome::COMMITTED) {
            uint64_t target = e.payload.getUint("checkpoint_seq", cur);
            if (target < cur) next = target;
        }
        cur = next;
    }
    std::reverse(path.begin(), path.end());
    return path;
}

ReplayState replayAuthoritative(const std::vector<LedgerEntry>& entries) {
    ReplayState state;
    state.path = authoritativePath(entries);

    for (uint64_t seq : state.path) {
        const LedgerEntry& e = entries[seq];
        if (e.outcome != Outcome::COMMITTED) continue;

        bool opening = e.kind == KIND_BUDGET_OPENED ||
                       (e.kind == KIND_AGENT_REGISTERED && e.payload.has("allocated"));
        if (opening || e.kind == KIND_BUDGET_DEBIT || e.kind == KIND_BUDGET_ALLOCATED) {
            std::string agent = e.payload.get("agent");
            if (agent.empty()) continue;
            BudgetAccount& acc = state.accounts[agent];
            if (opening) acc = BudgetAccount();
            applyAccountFields(acc, e);
            if (e.kind == KIND_BUDGET_DEBIT) {
                state.costs[agent][e.payload.get("action")] += e.payload.getUint("amount");
            }
        } else if (e.kind == KIND_MODE_TRANSITION) {
            Mode mode;
            if (!parseMode(e.payload.get("to"), mode)) continue;
            state.mode.mode = mode;
            state.mode.enteredAt = e.timestamp;
            state.mode.enteredSeq = e.seq;
        }
    }
    return state;
}

FullReplay replayFull(const std::vector<LedgerEntry>& entries) {
    FullReplay out;
    std::map<std::string, size_t> agentIndex;
    size_t n = contiguousPrefix(entries);

    auto setStatus = [&out, &agentIndex](const std::string& id, AgentStatus status) {
        auto it = agentIndex.find(id);
        if (it != agentIndex.end()) out.agents[it->second].status = status;
    };
    auto resolveFlag = [&out](uint64_t reviewId, ReviewResolution resolution) {
        for (auto& flag : out.reviewFlags) {
            if (flag.id == reviewId) flag.resolution = resolution;
        }
    };

    for (size_t i = 0; i < n; i++) {
        const LedgerEntry& e = entries[i];
        const Payload& p = e.payload;

        if (e.kind == KIND_AGENT_REGISTERED && e.outcome == Outcome::COMMITTED) {
            Agent a;
            a.id = p.get("agent");
            if (!parseAgentType(p.get("type"), a.type)) a.type = AgentType::TASK;
            a.registeredAt = e.timestamp;
            a.registeredSeq = e.seq;
            agentIndex[a.id] = out.agents.size();
            out.agents.push_back(a);
        } else if (e.kind == KIND_QUARANTINED && e.outcome == Outcome::COMMITTED) {
            QuarantineRecord rec;
            rec.agentId = p.get("agent");
            rec.trigger = p.get("trigger");
            rec.reason = p.get("reason");
            rec.timestamp = e.timestamp;
            rec.ledgerSeq = e.seq;
            out.quarantines[rec.agentId] = rec;
            setStatus(rec.agentId, AgentStatus::QUARANTINED);
            if (p.has("review")) resolveFlag(p.getUint("review"), ReviewResolution::ESCALATED);
        } else if (e.kind == KIND_RELEASED && e.outcome == Outcome::COMMITTED) {
            std::string agent = p.get("agent");
            auto it = out.quarantines.find(agent);
            if (it != out.quarantines.end()) {
                it->second.status = QuarantineStatus::RELEASED;
                it->second.resolvedBy = p.get("released_by", e.actor);
                it->second.resolvedAt = e.timestamp;
                it->second.resolvedSeq = e.seq;
            }
            setStatus(agent, AgentStatus::ACTIVE);
        } else if (e.kind == KIND_TERMINATED && e.outcome == Outcome::COMMITTED) {
            std::string agent = p.get("agent");
            auto it = out.quarantines.find(agent);
            if (it != out.quarantines.end() && it->second.status == QuarantineStatus::ACTIVE) {
                it->second.status = QuarantineStatus::ESCALATED;
                it->second.resolvedBy = e.actor;
                it->second.resolvedAt = e.timestamp;
                it->second.resolvedSeq = e.seq;
            }
            setStatus(agent, AgentStatus::TERMINATED);
        } else if (e.kind == KIND_CHECKPOINT && e.outcome == Outcome::COMMITTED) {
            Checkpoint cp;
            cp.id = p.get("checkpoint");
            cp.ledgerSeq = e.seq;
            cp.createdBy = e.actor;
            cp.timestamp = e.timestamp;
            cp.description = p.get("description");
            out.checkpoints.push_back(cp);
        } else if (e.kind == KIND_REVIEW_FLAGGED) {
            ReviewFlag flag;
            flag.id = p.getUint("review");
            flag.agentId = p.get("agent");
            flag.rule = p.get("rule");
            flag.flaggedAt = e.timestamp;
            flag.deadline = p.getUint("deadline", e.timestamp);
            flag.ledgerSeq = e.seq;
            out.reviewFlags.push_back(flag);
        } else if (e.kind == KIND_REVIEW_CLEARED) {
            resolveFlag(p.getUint("review"), ReviewResolution::CLEARED);
        } else if (e.kind == KIND_MODE_TRANSITION || e.kind == KIND_MODE_DENIED) {
            ModeChangeRequest req;
            req.id = p.getUint("request");
            req.requester = e.actor;
            if (!parseRole(p.get("role"), req.requesterRole)) req.requesterRole = Role::AGENT;
            if (!parseMode(p.get("from"), req.fromMode)) continue;
            if (!parseMode(p.get("to"), req.requested)) continue;
            req.justification = p.get("justification");
            req.submittedAt = e.timestamp;
            req.resolver = "arbiter";
            req.ledgerSeq = e.seq;
            if (e.kind == KIND_MODE_TRANSITION) {
                req.resolution = Resolution::APPROVED;
            } else {
                req.resolution = Resolution::DENIED;
                req.denialCode = static_cast<ErrorCode>(p.getUint("code", static_cast<uint64_t>(ErrorCode::UNKNOWN)));
                req.denialReason = p.get("reason");
            }
            out.requests.push_back(req);
        } else if (e.kind == KIND_CONFLICT_RESOLVED && e.outcome == Outcome::COMMITTED) {
            ConflictResolution c;
            c.id = p.getUint("conflict");
            c.conflictType = p.get("conflict_type");
            c.agents = splitAgents(p.get("agents"));
            c.resolution = p.get("resolution");
            c.resolvedBy = e.actor;
            c.timestamp = e.timestamp;
            c.ledgerSeq = e.seq;
            out.conflicts.push_back(c);
        } else if (e.kind == KIND_ACTION_INTENT && e.outcome == Outcome::INTENT) {
            OpenIntent intent;
            intent.seq = e.seq;
            intent.agentId = e.actor;
            intent.actionKind = p.get("action");
            out.openIntents[e.seq] = intent;
        } else if (e.kind == KIND_BUDGET_DEBIT && e.outcome == Outcome::COMMITTED && p.has("intent")) {
            auto it = out.openIntents.find(p.getUint("intent"));
            if (it != out.openIntents.end()) it->second.debitSeq = e.seq;
        } else if (e.kind == KIND_ACTION_OUTCOME) {
            out.openIntents.erase(p.getUint("intent"));
        }
    }
    return out;
}

}
}
