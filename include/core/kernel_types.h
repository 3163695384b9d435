#pragma once

#include "infrastructure/error_handling.h"
#include <string>
#include <vector>
#include <cstdint>

namespace substrate {
namespace core {

enum class Mode : uint8_t {
    OBSERVE = 0,
    ALERT = 1,
    ACT = 2,
    DEFEND = 3
};

constexpr size_t MODE_COUNT = 4;

enum class Role : uint8_t {
    AGENT = 0,
    OPERATOR = 1,
    AUDITOR = 2,
    SYSTEM = 3
};

struct Caller {
    std::string id;
    Role role = Role::AGENT;
};

enum class AgentType : uint8_t {
    PERCEPTION = 0,
    TASK = 1,
    REFLEX = 2,
    ADAPTATION = 3
};

enum class AgentStatus : uint8_t {
    ACTIVE = 0,
    QUARANTINED = 1,
    TERMINATED = 2
};

struct Agent {
    std::string id;
    AgentType type = AgentType::TASK;
    AgentStatus status = AgentStatus::ACTIVE;
    uint64_t registeredAt = 0;
    uint64_t registeredSeq = 0;

    std::vector<uint8_t> serialize() const;
    static bool deserialize(const std::vector<uint8_t>& data, Agent& out);
};

// windowEnd 0 means the allocation never expires.
struct BudgetAccount {
    std::string agentId;
    uint64_t allocated = 0;
    uint64_t consumed = 0;
    uint64_t lastSeq = 0;
    uint64_t windowMs = 0;
    uint64_t windowEnd = 0;

    uint64_t remaining() const { return allocated - consumed; }
    bool expired(uint64_t now) const { return windowEnd != 0 && now > windowEnd; }
    uint64_t available(uint64_t now) const { return expired(now) ? 0 : remaining(); }

    std::vector<uint8_t> serialize() const;
    static bool deserialize(const std::vector<uint8_t>& data, BudgetAccount& out);
};

struct ModeState {
    Mode mode = Mode::OBSERVE;
    uint64_t enteredAt = 0;
    uint64_t enteredSeq = 0;
    uint32_t transitionsInWindow = 0;

    std::vector<uint8_t> serialize() const;
    static bool deserialize(const std::vector<uint8_t>& data, ModeState& out);
};

enum class Resolution : uint8_t {
    PENDING = 0,
    APPROVED = 1,
    DENIED = 2
};

struct ModeChangeRequest {
    uint64_t id = 0;
    std::string requester;
    Role requesterRole = Role::AGENT;
    Mode requested = Mode::OBSERVE;
    Mode fromMode = Mode::OBSERVE;
    std::string justification;
    uint64_t submittedAt = 0;
    Resolution resolution = Resolution::PENDING;
    std::string resolver;
    ErrorCode denialCode = ErrorCode::OK;
    std::string denialReason;
    uint64_t ledgerSeq = 0;
};

struct ConflictResolution {
    uint64_t id = 0;
    std::string conflictType;
    std::vector<std::string> agents;
    std::string resolution;
    std::string resolvedBy;
    uint64_t timestamp = 0;
    uint64_t ledgerSeq = 0;
};

// Intent that has no outcome yet. debitSeq is 0 until a debit pays for it.
struct OpenIntent {
    uint64_t seq = 0;
    std::string agentId;
    std::string actionKind;
    uint64_t debitSeq = 0;
};

enum class QuarantineStatus : uint8_t {
    ACTIVE = 0,
    RELEASED = 1,
    ESCALATED = 2
};

struct QuarantineRecord {
    std::string agentId;
    std::string trigger;
    std::string reason;
    uint64_t timestamp = 0;
    QuarantineStatus status = QuarantineStatus::ACTIVE;
    std::string resolvedBy;
    uint64_t resolvedAt = 0;
    uint64_t ledgerSeq = 0;
    uint64_t resolvedSeq = 0;

    std::vector<uint8_t> serialize() const;
    static bool deserialize(const std::vector<uint8_t>& data, QuarantineRecord& out);
};

struct Checkpoint {
    std::string id;
    uint64_t ledgerSeq = 0;
    std::string createdBy;
    uint64_t timestamp = 0;
    std::string description;

    std::vector<uint8_t> serialize() const;
    static bool deserialize(const std::vector<uint8_t>& data, Checkpoint& out);
};

enum class ReviewResolution : uint8_t {
    PENDING = 0,
    CLEARED = 1,
    ESCALATED = 2
};

struct ReviewFlag {
    uint64_t id = 0;
    std::string agentId;
    std::string rule;
    uint64_t flaggedAt = 0;
    uint64_t deadline = 0;
    uint64_t ledgerSeq = 0;
    ReviewResolution resolution = ReviewResolution::PENDING;
};

enum class SignalKind : uint8_t {
    BUDGET_VELOCITY,
    BUDGET_REJECTED,
    BUDGET_ACCEPTED,
    MODE_DENIED,
    MODE_APPROVED,
    ACTION_FAILED,
    ACTION_SUCCEEDED
};

// Observation handed to the Guardian. Signals are advisory: emitting one
// never changes state by itself.
struct Signal {
    SignalKind kind = SignalKind::BUDGET_ACCEPTED;
    std::string agentId;
    uint64_t timestamp = 0;
    uint64_t ledgerSeq = 0;
    std::string detail;
};

const char* modeToString(Mode mode);
bool parseMode(const std::string& name, Mode& out);
const char* roleToString(Role role);
bool parseRole(const std::string& name, Role& out);
const char* agentTypeToString(AgentType type);
bool parseAgentType(const std::string& name, AgentType& out);
const char* agentStatusToString(AgentStatus status);
const char* resolutionToString(Resolution resolution);
const char* quarantineStatusToString(QuarantineStatus status);
const char* reviewResolutionToString(ReviewResolution resolution);
const char* signalKindToString(SignalKind kind);

}
}
