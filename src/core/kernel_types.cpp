#include "core/kernel_types.h"
#include "utils/serialize.h"
#include <stdexcept>

namespace substrate {
namespace core {

const char* modeToString(Mode mode) {
    switch (mode) {
        case Mode::OBSERVE: return "observe";
        case Mode::ALERT: return "alert";
        case Mode::ACT: return "act";
        case Mode::DEFEND: return "defend";
        default: return "unknown";
    }
}

bool parseMode(const std::string& name, Mode& out) {
    if (name == "observe") { out = Mode::OBSERVE; return true; }
    if (name == "alert") { out = Mode::ALERT; return true; }
    if (name == "act") { out = Mode::ACT; return true; }
    if (name == "defend") { out = Mode::DEFEND; return true; }
    return false;
}

const char* roleToString(Role role) {
    switch (role) {
        case Role::AGENT: return "agent";
        case Role::OPERATOR: return "operator";
        case Role::AUDITOR: return "auditor";
        case Role::SYSTEM: return "system";
        default: return "unknown";
    }
}

bool parseRole(const std::string& name, Role& out) {
    if (name == "agent") { out = Role::AGENT; return true; }
    if (name == "operator") { out = Role::OPERATOR; return true; }
    if (name == "auditor") { out = Role::AUDITOR; return true; }
    if (name == "system") { out = Role::SYSTEM; return true; }
    return false;
}

const char* agentTypeToString(AgentType type) {
    switch (type) {
        case AgentType::PERCEPTION: return "perception";
        case AgentType::TASK: return "task";
        case AgentType::REFLEX: return "reflex";
        case AgentType::ADAPTATION: return "adaptation";
        default: return "unknown";
    }
}

bool parseAgentType(const std::string& name, AgentType& out) {
    if (name == "perception") { out = AgentType::PERCEPTION; return true; }
    if (name == "task") { out = AgentType::TASK; return true; }
    if (name == "reflex") { out = AgentType::REFLEX; return true; }
    if (name == "adaptation") { out = AgentType::ADAPTATION; return true; }
    return false;
}

const char* agentStatusToString(AgentStatus status) {
    switch (status) {
        case AgentStatus::ACTIVE: return "active";
        case AgentStatus::QUARANTINED: return "quarantined";
        case AgentStatus::TERMINATED: return "terminated";
        default: return "unknown";
    }
}

const char* resolutionToString(Resolution resolution) {
    switch (resolution) {
        case Resolution::PENDING: return "pending";
        case Resolution::APPROVED: return "approved";
        case Resolution::DENIED: return "denied";
        default: return "unknown";
    }
}

const char* quarantineStatusToString(QuarantineStatus status) {
    switch (status) {
        case QuarantineStatus::ACTIVE: return "active";
        case QuarantineStatus::RELEASED: return "released";
        case QuarantineStatus::ESCALATED: return "escalated";
        default: return "unknown";
    }
}

const char* reviewResolutionToString(ReviewResolution resolution) {
    switch (resolution) {
        case ReviewResolution::PENDING: return "pending";
        case ReviewResolution::CLEARED: return "cleared";
        case ReviewResolution::ESCALATED: return "escalated";
        default: return "unknown";
    }
}

const char* signalKindToString(SignalKind kind) {
    switch (kind) {
        case SignalKind::BUDGET_VELOCITY: return "budget_velocity";
        case SignalKind::BUDGET_REJECTED: return "budget_rejected";
        case SignalKind::BUDGET_ACCEPTED: return "budget_accepted";
        case SignalKind::MODE_DENIED: return "mode_denied";
        case SignalKind::MODE_APPROVED: return "mode_approved";
        case SignalKind::ACTION_FAILED: return "action_failed";
        case SignalKind::ACTION_SUCCEEDED: return "action_succeeded";
        default: return "unknown";
    }
}

std::vector<uint8_t> Agent::serialize() const {
    utils::ByteBuffer buf;
    buf.writeString(id);
    buf.writeUint8(static_cast<uint8_t>(type));
    buf.writeUint8(static_cast<uint8_t>(status));
    buf.writeUint64(registeredAt);
    buf.writeUint64(registeredSeq);
    return buf.data();
}

bool Agent::deserialize(const std::vector<uint8_t>& data, Agent& out) {
    utils::ByteBuffer buf(data);
    try {
        Agent a;
        a.id = buf.readString();
        uint8_t type = buf.readUint8();
        uint8_t status = buf.readUint8();
        if (type > static_cast<uint8_t>(AgentType::ADAPTATION)) return false;
        if (status > static_cast<uint8_t>(AgentStatus::TERMINATED)) return false;
        a.type = static_cast<AgentType>(type);
        a.status = static_cast<AgentStatus>(status);
        a.registeredAt = buf.readUint64();
        a.registeredSeq = buf.readUint64();
        out = a;
        return true;
    } catch (const std::out_of_range&) {
        return false;
    }
}

std::vector<uint8_t> BudgetAccount::serialize() const {
    utils::ByteBuffer buf;
    buf.writeString(agentId);
    buf.writeUint64(allocated);
    buf.writeUint64(consumed);
    buf.writeUint64(lastSeq);
    buf.writeUint64(windowMs);
    buf.writeUint64(windowEnd);
    return buf.data();
}

bool BudgetAccount::deserialize(const std::vector<uint8_t>& data, BudgetAccount& out) {
    utils::ByteBuffer buf(data);
    try {
        BudgetAccount acc;
        acc.agentId = buf.readString();
        acc.allocated = buf.readUint64();
        acc.consumed = buf.readUint64();
        acc.lastSeq = buf.readUint64();
        acc.windowMs = buf.readUint64();
        acc.windowEnd = buf.readUint64();
        if (acc.consumed > acc.allocated) return false;
        out = acc;
        return true;
    } catch (const std::out_of_range&) {
        return false;
    }
}

std::vector<uint8_t> ModeState::serialize() const {
    utils::ByteBuffer buf;
    buf.writeUint8(static_cast<uint8_t>(mode));
    buf.writeUint64(enteredAt);
    buf.writeUint64(enteredSeq);
    buf.writeUint32(transitionsInWindow);
    return buf.data();
}

bool ModeState::deserialize(const std::vector<uint8_t>& data, ModeState& out) {
    utils::ByteBuffer buf(data);
    try {
        ModeState st;
        uint8_t mode = buf.readUint8();
        if (mode >= MODE_COUNT) return false;
        st.mode = static_cast<Mode>(mode);
        st.enteredAt = buf.readUint64();
        st.enteredSeq = buf.readUint64();
        st.transitionsInWindow = buf.readUint32();
        out = st;
        return true;
    } catch (const std::out_of_range&) {
        return false;
    }
}

std::vector<uint8_t> QuarantineRecord::serialize() const {
    utils::ByteBuffer buf;
    buf.writeString(agentId);
    buf.writeString(trigger);
    buf.writeString(reason);
    buf.writeUint64(timestamp);
    buf.writeUint8(static_cast<uint8_t>(status));
    buf.writeString(resolvedBy);
    buf.writeUint64(resolvedAt);
    buf.writeUint64(ledgerSeq);
    buf.writeUint64(resolvedSeq);
    return buf.data();
}

bool QuarantineRecord::deserialize(const std::vector<uint8_t>& data, QuarantineRecord& out) {
    utils::ByteBuffer buf(data);
    try {
        QuarantineRecord rec;
        rec.agentId = buf.readString();
        rec.trigger = buf.readString();
        rec.reason = buf.readString();
        rec.timestamp = buf.readUint64();
        uint8_t status = buf.readUint8();
        if (status > static_cast<uint8_t>(QuarantineStatus::ESCALATED)) return false;
        rec.status = static_cast<QuarantineStatus>(status);
        rec.resolvedBy = buf.readString();
        rec.resolvedAt = buf.readUint64();
        rec.ledgerSeq = buf.readUint64();
        rec.resolvedSeq = buf.readUint64();
        out = rec;
        return true;
    } catch (const std::out_of_range&) {
        return false;
    }
}

std::vector<uint8_t> Checkpoint::serialize() const {
    utils::ByteBuffer buf;
    buf.writeString(id);
    buf.writeUint64(ledgerSeq);
    buf.writeString(createdBy);
    buf.writeUint64(timestamp);
    buf.writeString(description);
    return buf.data();
}

bool Checkpoint::deserialize(const std::vector<uint8_t>& data, Checkpoint& out) {
    utils::ByteBuffer buf(data);
    try {
        Checkpoint cp;
        cp.id = buf.readString();
        cp.ledgerSeq = buf.readUint64();
        cp.createdBy = buf.readString();
        cp.timestamp = buf.readUint64();
        cp.description = buf.readString();
        out = cp;
        return true;
    } catch (const std::out_of_range&) {
        return false;
    }
}

}
}
