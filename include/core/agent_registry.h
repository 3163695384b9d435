#pragma once

#include "core/kernel_types.h"
#include "core/ledger.h"
#include "infrastructure/error_handling.h"
#include <string>
#include <vector>
#include <map>
#include <mutex>

namespace substrate {
namespace core {

class AgentRegistry {
public:
    explicit AgentRegistry(Ledger& ledger);

    // `extra` commits in the same ledger entry as the registration, and
    // `fields` are added to that entry's payload.
    Result<Agent> registerAgent(const std::string& actor, const std::string& agentId, AgentType type,
                                const Mutation& extra = Mutation(), const Payload& fields = Payload());

    // Gate consulted before any cost or mode logic runs for an agent.
    Result<void> admit(const std::string& agentId) const;

    Result<Agent> get(const std::string& agentId) const;
    bool exists(const std::string& agentId) const;
    std::vector<Agent> list() const;
    size_t count() const;

private:
    friend class Guardian;
    friend class Kernel;
    friend class BudgetRegister;
    friend class Arbiter;

    // Agent status cannot change while the returned lock is held. Gated
    // writers keep it from admitLocked() until their append returns.
    std::unique_lock<std::mutex> lockStatus() const;
    Result<void> admitLocked(const std::string& agentId) const;
    Result<LedgerEntry> setStatus(const std::string& agentId, AgentStatus status,
                                  const AppendRequest& request, const Mutation& extra = Mutation());
    void restore(const std::vector<Agent>& agents);

    Ledger& ledger_;
    std::map<std::string, Agent> agents_;
    mutable std::mutex mtx_;
};

std::string agentKey(const std::string& agentId);

}
}
