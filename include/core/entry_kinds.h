#pragma once

namespace substrate {
namespace core {

constexpr const char* KIND_AGENT_REGISTERED = "agent.registered";

constexpr const char* KIND_BUDGET_OPENED = "budget.account_opened";
constexpr const char* KIND_BUDGET_DEBIT = "budget.debit";
constexpr const char* KIND_BUDGET_ALLOCATED = "budget.allocated";

constexpr const char* KIND_MODE_TRANSITION = "mode.transition";
constexpr const char* KIND_MODE_DENIED = "mode.request_denied";
constexpr const char* KIND_CONFLICT_RESOLVED = "arbiter.conflict_resolved";

constexpr const char* KIND_QUARANTINED = "guardian.quarantined";
constexpr const char* KIND_RELEASED = "guardian.released";
constexpr const char* KIND_TERMINATED = "guardian.terminated";
constexpr const char* KIND_CHECKPOINT = "guardian.checkpoint";
constexpr const char* KIND_ROLLBACK = "guardian.rollback";
constexpr const char* KIND_REVIEW_FLAGGED = "guardian.review_flagged";
constexpr const char* KIND_REVIEW_CLEARED = "guardian.review_cleared";

constexpr const char* KIND_ACTION_INTENT = "action.intent";
constexpr const char* KIND_ACTION_OUTCOME = "action.outcome";
constexpr const char* KIND_PERMISSION_DENIED = "kernel.permission_denied";

}
}
