#include "core/privilege.h"

namespace substrate {
namespace core {

const char* operationToString(Operation op) {
    switch (op) {
        case Operation::REGISTER_AGENT: return "register_agent";
        case Operation::SUBMIT_INTENT: return "submit_intent";
        case Operation::DEBIT: return "debit";
        case Operation::SUBMIT_OUTCOME: return "submit_outcome";
        case Operation::EXECUTE_ACTION: return "execute_action";
        case Operation::REQUEST_MODE_CHANGE: return "request_mode_change";
        case Operation::ALLOCATE: return "allocate";
        case Operation::RESOLVE_CONFLICT: return "resolve_conflict";
        case Operation::CREATE_CHECKPOINT: return "create_checkpoint";
        case Operation::ROLLBACK: return "rollback";
        case Operation::QUARANTINE: return "quarantine";
        case Operation::RELEASE: return "release";
        case Operation::TERMINATE: return "terminate";
        case Operation::VERIFY_CHAIN: return "verify_chain";
        case Operation::READ_LEDGER: return "read_ledger";
        case Operation::READ_BUDGET: return "read_budget";
        case Operation::EXPORT_LEDGER: return "export_ledger";
        default: return "unknown";
    }
}

bool satisfies(Role role, Role required) {
    if (role == Role::SYSTEM) return true;
    switch (required) {
        case Role::AGENT: return role == Role::AGENT || role == Role::OPERATOR;
        case Role::OPERATOR: return role == Role::OPERATOR;
        case Role::AUDITOR: return role == Role::AUDITOR;
        case Role::SYSTEM: return false;
        default: return false;
    }
}

bool isPermitted(Role role, Operation op) {
    switch (op) {
        case Operation::SUBMIT_INTENT:
        case Operation::DEBIT:
        case Operation::SUBMIT_OUTCOME:
        case Operation::EXECUTE_ACTION:
            return role == Role::AGENT || role == Role::SYSTEM;
        case Operation::REQUEST_MODE_CHANGE:
            return role != Role::AUDITOR;
        case Operation::REGISTER_AGENT:
        case Operation::ALLOCATE:
        case Operation::RESOLVE_CONFLICT:
        case Operation::CREATE_CHECKPOINT:
        case Operation::ROLLBACK:
        case Operation::QUARANTINE:
        case Operation::RELEASE:
        case Operation::TERMINATE:
            return satisfies(role, Role::OPERATOR);
        case Operation::VERIFY_CHAIN:
        case Operation::READ_LEDGER:
        case Operation::READ_BUDGET:
        case Operation::EXPORT_LEDGER:
            return role == Role::AUDITOR || satisfies(role, Role::OPERATOR);
        default:
            return false;
    }
}

}
}
