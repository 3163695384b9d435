#include "core/guardian.h"

namespace substrate {
namespace core {

RuleResult BudgetVelocityRule::evaluate(const Signal& signal) {
    RuleResult r;
    if (signal.kind != SignalKind::BUDGET_VELOCITY) return r;
    r.fired = true;
    r.reason = signal.detail.empty() ? "Debit velocity exceeded" : "Debit velocity exceeded: " + signal.detail;
    return r;
}

StreakRule::StreakRule(std::string name, SignalKind counted, SignalKind resetBy, uint32_t limit)
    : name_(std::move(name)), counted_(counted), resetBy_(resetBy), limit_(limit) {}

RuleResult StreakRule::evaluate(const Signal& signal) {
    RuleResult r;
    std::lock_guard<std::mutex> lock(mtx_);
    if (signal.kind == resetBy_) {
        streaks_.erase(signal.agentId);
        return r;
    }
    if (signal.kind != counted_ || limit_ == 0) return r;

    uint32_t count = ++streaks_[signal.agentId];
    if (count >= limit_) {
        r.fired = true;
        r.reason = std::to_string(count) + " consecutive " + signalKindToString(counted_) + " signals";
        streaks_.erase(signal.agentId);
    }
    return r;
}

void StreakRule::reset(const std::string& agentId) {
    std::lock_guard<std::mutex> lock(mtx_);
    streaks_.erase(agentId);
}

uint32_t StreakRule::streak(const std::string& agentId) const {
    std::lock_guard<std::mutex> lock(mtx_);
    auto it = streaks_.find(agentId);
    return it != streaks_.end() ? it->second : 0;
}

ModeDenialStreakRule::ModeDenialStreakRule(uint32_t limit)
    : StreakRule("mode_denial_streak", SignalKind::MODE_DENIED, SignalKind::MODE_APPROVED, limit) {}

BudgetRejectionStreakRule::BudgetRejectionStreakRule(uint32_t limit)
    : StreakRule("budget_rejection_streak", SignalKind::BUDGET_REJECTED, SignalKind::BUDGET_ACCEPTED, limit) {}

ActionFailureStreakRule::ActionFailureStreakRule(uint32_t limit)
    : StreakRule("action_failure_streak", SignalKind::ACTION_FAILED, SignalKind::ACTION_SUCCEEDED, limit) {}

}
}
