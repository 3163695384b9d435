#pragma once

#include "core/kernel_types.h"
#include <string>

namespace substrate {
namespace core {

enum class Operation {
    REGISTER_AGENT,
    SUBMIT_INTENT,
    DEBIT,
    SUBMIT_OUTCOME,
    EXECUTE_ACTION,
    REQUEST_MODE_CHANGE,
    ALLOCATE,
    RESOLVE_CONFLICT,
    CREATE_CHECKPOINT,
    ROLLBACK,
    QUARANTINE,
    RELEASE,
    TERMINATE,
    VERIFY_CHAIN,
    READ_LEDGER,
    READ_BUDGET,
    EXPORT_LEDGER
};

const char* operationToString(Operation op);

// True when a caller holding `role` satisfies a requirement of `required`.
// System satisfies everything; Auditor satisfies only Auditor.
bool satisfies(Role role, Role required);

bool isPermitted(Role role, Operation op);

}
}
