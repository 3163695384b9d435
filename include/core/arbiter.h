#pragma once

#include "core/kernel_types.h"
#include "core/ledger.h"
#include "core/agent_registry.h"
#include "infrastructure/error_handling.h"
#include "utils/clock.h"
#include "utils/config.h"
#include <string>
#include <vector>
#include <deque>
#include <mutex>
#include <functional>

namespace substrate {
namespace core {

struct Decision {
    bool approved = false;
    ErrorCode code = ErrorCode::OK;
    std::string reason;
};

extern const char* const MODE_STATE_KEY;

class Arbiter {
public:
    Arbiter(Ledger& ledger, const AgentRegistry& registry,
            const utils::ArbiterConfig& config = utils::ArbiterConfig(),
            utils::Clock clock = utils::systemClock());

    static bool isReachable(Mode from, Mode to);

    // Pure function of its arguments and the configured policy.
    Decision decide(Mode current, Mode target, Role role, size_t requestsInWindow) const;

    Result<ModeChangeRequest> requestModeChange(const Caller& requester, Mode target,
                                                const std::string& justification);

    // Records how an operator settled a conflict between agents. Agent ids
    // must be registered and may not contain ','.
    Result<ConflictResolution> resolveConflict(const std::string& resolver, const std::string& conflictType,
                                               const std::vector<std::string>& agents,
                                               const std::string& resolution);

    Mode currentMode() const;
    ModeState modeState() const;
    std::vector<ModeChangeRequest> history(size_t limit = 0) const;
    std::vector<ConflictResolution> conflicts() const;
    size_t requestsInWindow() const;
    Role minimumRole(Mode target) const;

    void onDecision(std::function<void(const Signal&)> callback);

private:
    friend class Guardian;
    friend class Kernel;

    void pruneLocked(uint64_t now) const;
    Result<ModeChangeRequest> resolveLocked(ModeChangeRequest request, const Decision& decision);
    void emit(const Signal& signal);

    std::unique_lock<std::mutex> lockExclusive();
    void restoreLocked(const ModeState& state);
    void restoreHistory(const std::vector<ModeChangeRequest>& history);
    void restoreConflicts(const std::vector<ConflictResolution>& conflicts);

    Ledger& ledger_;
    const AgentRegistry& registry_;
    utils::ArbiterConfig config_;
    utils::Clock clock_;
    Role minRoles_[MODE_COUNT];

    ModeState state_;
    mutable std::deque<uint64_t> requestTimes_;
    mutable std::deque<uint64_t> transitionTimes_;
    std::vector<ModeChangeRequest> history_;
    uint64_t nextRequestId_ = 1;
    std::vector<ConflictResolution> conflicts_;
    uint64_t nextConflictId_ = 1;
    mutable std::mutex mtx_;

    std::vector<std::function<void(const Signal&)>> callbacks_;
    std::mutex callbackMutex_;
};

}
}
