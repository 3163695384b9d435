#include "core/agent_registry.h"
#include "core/entry_kinds.h"
#include "utils/logger.h"

namespace substrate {
namespace core {

std::string agentKey(const std::string& agentId) {
    return "agent:" + agentId;
}

AgentRegistry::AgentRegistry(Ledger& ledger) : ledger_(ledger) {}

Result<Agent> AgentRegistry::registerAgent(const std::string& actor, const std::string& agentId, AgentType type,
                                           const Mutation& extra, const Payload& fields) {
    if (agentId.empty()) {
        return makeError(ErrorCode::INVALID_ARGUMENT, "Agent id must not be empty");
    }

    std::lock_guard<std::mutex> lock(mtx_);
    if (agents_.count(agentId)) {
        return makeError(ErrorCode::ALREADY_EXISTS, "Agent " + agentId + " is already registered");
    }

    AppendRequest req;
    req.actor = actor;
    req.kind = KIND_AGENT_REGISTERED;
    req.payload.merge(fields, "");
    req.payload.set("agent", agentId).set("type", agentTypeToString(type));

    Agent agent;
    agent.id = agentId;
    agent.type = type;
    agent.status = AgentStatus::ACTIVE;

    Mutation m;
    m.stage = [&agent, &extra](database::WriteBatch& batch, const LedgerEntry& e) {
        Agent row = agent;
        row.registeredAt = e.timestamp;
        row.registeredSeq = e.seq;
        batch.put(agentKey(row.id), row.serialize());
        if (extra.stage) extra.stage(batch, e);
    };
    m.apply = [this, &agent, &extra](const LedgerEntry& e) {
        agent.registeredAt = e.timestamp;
        agent.registeredSeq = e.seq;
        agents_[agent.id] = agent;
        if (extra.apply) extra.apply(e);
    };

    auto r = ledger_.append(req, m);
    if (r.failed()) return r.error();

    utils::Logger::log(utils::LogLevel::INFO, "registry",
                       "Registered " + std::string(agentTypeToString(type)) + " agent " + agentId);
    return agent;
}

Result<void> AgentRegistry::admit(const std::string& agentId) const {
    std::lock_guard<std::mutex> lock(mtx_);
    return admitLocked(agentId);
}

std::unique_lock<std::mutex> AgentRegistry::lockStatus() const {
    return std::unique_lock<std::mutex>(mtx_);
}

Result<void> AgentRegistry::admitLocked(const std::string& agentId) const {
    auto it = agents_.find(agentId);
    if (it == agents_.end()) {
        return makeError(ErrorCode::UNKNOWN_AGENT, "Unknown agent " + agentId);
    }
    switch (it->second.status) {
        case AgentStatus::QUARANTINED:
            return makeError(ErrorCode::AGENT_QUARANTINED, "Agent " + agentId + " is quarantined");
        case AgentStatus::TERMINATED:
            return makeError(ErrorCode::AGENT_TERMINATED, "Agent " + agentId + " is terminated");
        default:
            return Result<void>();
    }
}

Result<Agent> AgentRegistry::get(const std::string& agentId) const {
    std::lock_guard<std::mutex> lock(mtx_);
    auto it = agents_.find(agentId);
    if (it == agents_.end()) {
        return makeError(ErrorCode::UNKNOWN_AGENT, "Unknown agent " + agentId);
    }
    return it->second;
}

bool AgentRegistry::exists(const std::string& agentId) const {
    std::lock_guard<std::mutex> lock(mtx_);
    return agents_.count(agentId) > 0;
}

std::vector<Agent> AgentRegistry::list() const {
    std::lock_guard<std::mutex> lock(mtx_);
    std::vector<Agent> result;
    result.reserve(agents_.size());
    for (const auto& [id, agent] : agents_) {
        result.push_back(agent);
    }
    return result;
}

size_t AgentRegistry::count() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return agents_.size();
}

Result<LedgerEntry> AgentRegistry::setStatus(const std::string& agentId, AgentStatus status,
                                             const AppendRequest& request, const Mutation& extra) {
    std::lock_guard<std::mutex> lock(mtx_);
    auto it = agents_.find(agentId);
    if (it == agents_.end()) {
        return makeError(ErrorCode::UNKNOWN_AGENT, "Unknown agent " + agentId);
    }
    if (it->second.status == AgentStatus::TERMINATED) {
        return makeError(ErrorCode::AGENT_TERMINATED, "Agent " + agentId + " is terminated");
    }

    Agent updated = it->second;
    updated.status = status;

    Mutation m;
    m.stage = [&updated, &extra](database::WriteBatch& batch, const LedgerEntry& e) {
        batch.put(agentKey(updated.id), updated.serialize());
        if (extra.stage) extra.stage(batch, e);
    };
    m.apply = [this, &updated, &extra](const LedgerEntry& e) {
        agents_[updated.id] = updated;
        if (extra.apply) extra.apply(e);
    };

    auto r = ledger_.append(request, m);
    if (r.ok()) {
        utils::Logger::log(utils::LogLevel::INFO, "registry",
                           "Agent " + agentId + " is now " + agentStatusToString(status));
    }
    return r;
}

void AgentRegistry::restore(const std::vector<Agent>& agents) {
    std::lock_guard<std::mutex> lock(mtx_);
    agents_.clear();
    for (const auto& a : agents) {
        agents_[a.id] = a;
    }
}

}
}
