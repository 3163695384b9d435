#include "core/guardian.h"
#include "core/entry_kinds.h"
#include "utils/logger.h"
#include <algorithm>
#include <chrono>
#include <cstdlib>

namespace substrate {
namespace core {

const char* const GUARDIAN_ACTOR = "guardian";

namespace {

const char* const EXPIRY_RELEASER = "guardian.expiry";

void logGuardian(utils::LogLevel level, const std::string& msg) {
    utils::Logger::log(level, "guardian", msg);
}

}

std::string quarantineKey(const std::string& agentId) {
    return "quarantine:" + agentId;
}

std::string checkpointKey(const std::string& checkpointId) {
    return "checkpoint:" + checkpointId;
}

const char* verdictActionToString(VerdictAction action) {
    switch (action) {
        case VerdictAction::ALLOW: return "allow";
        case VerdictAction::QUARANTINE: return "quarantine";
        case VerdictAction::PROVISIONAL_ALLOW: return "provisional_allow";
        default: return "unknown";
    }
}

Guardian::Guardian(Ledger& ledger, AgentRegistry& registry, BudgetRegister& budget, Arbiter& arbiter,
                   const utils::GuardianConfig& config, utils::Clock clock)
    : ledger_(ledger), registry_(registry), budget_(budget), arbiter_(arbiter), config_(config),
      clock_(clock ? clock : utils::systemClock()),
      pool_(std::make_unique<utils::ThreadPool>(std::max<size_t>(1, config.workerThreads))) {}

Guardian::~Guardian() {
    stop();
    pool_->shutdown();
}

void Guardian::addRule(std::shared_ptr<GuardianRule> rule) {
    if (!rule) return;
    std::lock_guard<std::mutex> lock(rulesMutex_);
    logGuardian(utils::LogLevel::DEBUG, "Added rule " + rule->name());
    rules_.push_back(std::move(rule));
}

void Guardian::addDefaultRules() {
    addRule(std::make_shared<BudgetVelocityRule>());
    addRule(std::make_shared<ModeDenialStreakRule>(config_.maxModeDenials));
    addRule(std::make_shared<BudgetRejectionStreakRule>(config_.maxBudgetRejections));
    addRule(std::make_shared<ActionFailureStreakRule>(config_.maxActionFailures));
}

size_t Guardian::ruleCount() const {
    std::lock_guard<std::mutex> lock(rulesMutex_);
    return rules_.size();
}

std::vector<std::shared_ptr<GuardianRule>> Guardian::rulesSnapshot() const {
    std::lock_guard<std::mutex> lock(rulesMutex_);
    return rules_;
}

void Guardian::resetRules(const std::string& agentId) {
    for (const auto& rule : rulesSnapshot()) {
        rule->reset(agentId);
    }
}

Verdict Guardian::evaluate(const std::string& agentId, const Signal& signal) {
    Verdict verdict;
    auto agent = registry_.get(agentId);
    if (agent.failed() || agent.value().status != AgentStatus::ACTIVE) return verdict;

    auto rules = rulesSnapshot();
    std::vector<std::shared_future<RuleResult>> futures;
    futures.reserve(rules.size());
    for (const auto& rule : rules) {
        try {
            futures.push_back(pool_->enqueue([rule, signal]() { return rule->evaluate(signal); }).share());
        } catch (const std::exception& e) {
            logGuardian(utils::LogLevel::ERROR, "Cannot schedule rule " + rule->name() + ": " + e.what());
            futures.push_back(std::shared_future<RuleResult>());
        }
    }

    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(config_.evaluationBudgetMs);
    std::string firedRule;
    std::string firedReason;
    std::vector<size_t> timedOut;

    for (size_t i = 0; i < rules.size(); i++) {
        if (!futures[i].valid()) continue;
        if (futures[i].wait_until(deadline) != std::future_status::ready) {
            timedOut.push_back(i);
            continue;
        }
        RuleResult r;
        try {
            r = futures[i].get();
        } catch (const std::exception& e) {
            logGuardian(utils::LogLevel::WARN, "Rule " + rules[i]->name() + " failed: " + e.what());
            continue;
        }
        if (r.fired && firedRule.empty()) {
            firedRule = rules[i]->name();
            firedReason = r.reason;
        }
    }

    std::lock_guard<std::mutex> lock(mtx_);
    if (!firedRule.empty()) {
        auto q = quarantineLocked(GUARDIAN_ACTOR, agentId, firedRule, firedReason);
        if (q.ok()) {
            verdict.action = VerdictAction::QUARANTINE;
            verdict.rule = firedRule;
            verdict.reason = firedReason;
            verdict.ledgerSeq = q.value().ledgerSeq;
        } else if (q.error().code != ErrorCode::ALREADY_EXISTS && q.error().code != ErrorCode::AGENT_TERMINATED) {
            logGuardian(utils::LogLevel::ERROR, "Quarantine of " + agentId + " failed: " + q.error().message);
        }
        return verdict;
    }

    for (size_t i : timedOut) {
        auto flag = flagReviewLocked(agentId, rules[i]->name(), futures[i]);
        if (flag.failed()) {
            logGuardian(utils::LogLevel::ERROR, "Cannot flag review for " + agentId + ": " + flag.error().message);
            continue;
        }
        verdict.action = VerdictAction::PROVISIONAL_ALLOW;
        verdict.rule = rules[i]->name();
        verdict.reason = "Rule exceeded evaluation budget of " + std::to_string(config_.evaluationBudgetMs) + "ms";
        verdict.ledgerSeq = flag.value().ledgerSeq;
        verdict.reviews.push_back(flag.value().id);
    }
    return verdict;
}

Result<QuarantineRecord> Guardian::quarantine(const std::string& actor, const std::string& agentId,
                                              const std::string& reason) {
    std::lock_guard<std::mutex> lock(mtx_);
    return quarantineLocked(actor, agentId, "manual", reason);
}

Result<QuarantineRecord> Guardian::quarantineLocked(const std::string& actor, const std::string& agentId,
                                                    const std::string& trigger, const std::string& reason,
                                                    uint64_t reviewId) {
    auto agent = registry_.get(agentId);
    if (agent.failed()) return agent.error();
    if (agent.value().status == AgentStatus::QUARANTINED) {
        return makeError(ErrorCode::ALREADY_EXISTS, "Agent " + agentId + " is already quarantined");
    }
    if (agent.value().status == AgentStatus::TERMINATED) {
        return makeError(ErrorCode::AGENT_TERMINATED, "Agent " + agentId + " is terminated");
    }

    QuarantineRecord rec;
    rec.agentId = agentId;
    rec.trigger = trigger;
    rec.reason = reason;
    rec.status = QuarantineStatus::ACTIVE;

    AppendRequest req;
    req.actor = actor;
    req.kind = KIND_QUARANTINED;
    req.payload.set("agent", agentId).set("trigger", trigger).set("reason", reason);
    if (reviewId != 0) req.payload.setUint("review", reviewId);

    Mutation extra;
    extra.stage = [&rec](database::WriteBatch& batch, const LedgerEntry& e) {
        QuarantineRecord row = rec;
        row.timestamp = e.timestamp;
        row.ledgerSeq = e.seq;
        batch.put(quarantineKey(row.agentId), row.serialize());
    };
    extra.apply = [this, &rec, reviewId](const LedgerEntry& e) {
        rec.timestamp = e.timestamp;
        rec.ledgerSeq = e.seq;
        quarantines_[rec.agentId] = rec;
        if (reviewId != 0) {
            for (auto& flag : reviewFlags_) {
                if (flag.id == reviewId) flag.resolution = ReviewResolution::ESCALATED;
            }
            pending_.erase(reviewId);
        }
    };

    auto r = registry_.setStatus(agentId, AgentStatus::QUARANTINED, req, extra);
    if (r.failed()) return r.error();

    logGuardian(utils::LogLevel::WARN, "Quarantined " + agentId + " (" + trigger + "): " + reason);
    return rec;
}

Result<QuarantineRecord> Guardian::release(const std::string& actor, const std::string& agentId) {
    std::lock_guard<std::mutex> lock(mtx_);
    return releaseLocked(actor, agentId, actor);
}

Result<QuarantineRecord> Guardian::releaseLocked(const std::string& actor, const std::string& agentId,
                                                 const std::string& releasedBy) {
    auto it = quarantines_.find(agentId);
    if (it == quarantines_.end() || it->second.status != QuarantineStatus::ACTIVE) {
        return makeError(ErrorCode::NOT_FOUND, "Agent " + agentId + " is not quarantined");
    }

    QuarantineRecord rec = it->second;
    rec.status = QuarantineStatus::RELEASED;
    rec.resolvedBy = releasedBy;

    AppendRequest req;
    req.actor = actor;
    req.kind = KIND_RELEASED;
    req.payload.set("agent", agentId).set("released_by", releasedBy).set("trigger", rec.trigger);

    Mutation extra;
    extra.stage = [&rec](database::WriteBatch& batch, const LedgerEntry& e) {
        QuarantineRecord row = rec;
        row.resolvedAt = e.timestamp;
        row.resolvedSeq = e.seq;
        batch.put(quarantineKey(row.agentId), row.serialize());
    };
    extra.apply = [this, &rec](const LedgerEntry& e) {
        rec.resolvedAt = e.timestamp;
        rec.resolvedSeq = e.seq;
        quarantines_[rec.agentId] = rec;
    };

    auto r = registry_.setStatus(agentId, AgentStatus::ACTIVE, req, extra);
    if (r.failed()) return r.error();

    resetRules(agentId);
    logGuardian(utils::LogLevel::INFO, "Released " + agentId + " from quarantine by " + releasedBy);
    return rec;
}

Result<Agent> Guardian::terminate(const std::string& actor, const std::string& agentId,
                                  const std::string& reason) {
    std::lock_guard<std::mutex> lock(mtx_);
    auto agent = registry_.get(agentId);
    if (agent.failed()) return agent.error();
    if (agent.value().status == AgentStatus::TERMINATED) {
        return makeError(ErrorCode::AGENT_TERMINATED, "Agent " + agentId + " is already terminated");
    }

    auto it = quarantines_.find(agentId);
    bool escalate = it != quarantines_.end() && it->second.status == QuarantineStatus::ACTIVE;
    QuarantineRecord rec;
    if (escalate) {
        rec = it->second;
        rec.status = QuarantineStatus::ESCALATED;
        rec.resolvedBy = actor;
    }

    AppendRequest req;
    req.actor = actor;
    req.kind = KIND_TERMINATED;
    req.payload.set("agent", agentId).set("reason", reason).set("terminated_by", actor);

    Mutation extra;
    extra.stage = [&rec, escalate](database::WriteBatch& batch, const LedgerEntry& e) {
        if (!escalate) return;
        QuarantineRecord row = rec;
        row.resolvedAt = e.timestamp;
        row.resolvedSeq = e.seq;
        batch.put(quarantineKey(row.agentId), row.serialize());
    };
    extra.apply = [this, &rec, escalate](const LedgerEntry& e) {
        if (!escalate) return;
        rec.resolvedAt = e.timestamp;
        rec.resolvedSeq = e.seq;
        quarantines_[rec.agentId] = rec;
    };

    auto r = registry_.setStatus(agentId, AgentStatus::TERMINATED, req, extra);
    if (r.failed()) return r.error();

    logGuardian(utils::LogLevel::WARN, "Terminated " + agentId + " by " + actor + ": " + reason);
    Agent out = agent.value();
    out.status = AgentStatus::TERMINATED;
    return out;
}

Result<Checkpoint> Guardian::createCheckpoint(const std::string& actor, const std::string& description) {
    std::lock_guard<std::mutex> lock(mtx_);

    Checkpoint cp;
    cp.id = "cp-" + std::to_string(nextCheckpointId_);
    cp.createdBy = actor;
    cp.description = description;

    AppendRequest req;
    req.actor = actor;
    req.kind = KIND_CHECKPOINT;
    req.payload.set("checkpoint", cp.id).set("description", description);

    Mutation m;
    m.stage = [&cp](database::WriteBatch& batch, const LedgerEntry& e) {
        Checkpoint row = cp;
        row.ledgerSeq = e.seq;
        row.timestamp = e.timestamp;
        batch.put(checkpointKey(row.id), row.serialize());
    };
    m.apply = [this, &cp](const LedgerEntry& e) {
        cp.ledgerSeq = e.seq;
        cp.timestamp = e.timestamp;
        checkpoints_.push_back(cp);
        nextCheckpointId_++;
    };

    auto r = ledger_.append(req, m);
    if (r.failed()) return r.error();

    logGuardian(utils::LogLevel::INFO, "Checkpoint " + cp.id + " at seq " + std::to_string(cp.ledgerSeq));
    return cp;
}

Result<RollbackResult> Guardian::rollback(const std::string& actor, const std::string& checkpointId) {
    std::lock_guard<std::mutex> lock(mtx_);

    auto it = std::find_if(checkpoints_.begin(), checkpoints_.end(),
                           [&checkpointId](const Checkpoint& cp) { return cp.id == checkpointId; });
    if (it == checkpoints_.end()) {
        return makeError(ErrorCode::NOT_FOUND, "Unknown checkpoint " + checkpointId);
    }
    Checkpoint cp = *it;

    auto modeLock = arbiter_.lockExclusive();
    auto accountLocks = budget_.lockAll();

    ReplayState state = replayAuthoritative(ledger_.getRange(GENESIS_SEQ, cp.ledgerSeq));
    if (state.path.empty() || state.path.back() != cp.ledgerSeq) {
        return makeError(ErrorCode::INTERNAL_ERROR, "Ledger prefix up to checkpoint " + checkpointId +
                         " is incomplete");
    }

    AppendRequest req;
    req.actor = actor;
    req.kind = KIND_ROLLBACK;
    req.payload.set("checkpoint", cp.id)
               .setUint("checkpoint_seq", cp.ledgerSeq)
               .set("rolled_back_by", actor)
               .set("mode", modeToString(state.mode.mode));

    Mutation m;
    m.stage = [this, &state](database::WriteBatch& batch, const LedgerEntry& e) {
        budget_.stageAccounts(batch, state.accounts, e.seq);
        batch.put(MODE_STATE_KEY, state.mode.serialize());
    };
    m.apply = [this, &state](const LedgerEntry& e) {
        for (auto& [id, acc] : state.accounts) {
            acc.lastSeq = e.seq;
        }
        budget_.restoreLocked(state.accounts);
        arbiter_.restoreLocked(state.mode);
    };

    auto r = ledger_.append(req, m);
    if (r.failed()) return r.error();

    RollbackResult out;
    out.checkpoint = cp;
    out.ledgerSeq = r.value().seq;
    out.mode = state.mode;
    for (const auto& [id, acc] : state.accounts) {
        out.accounts.push_back(acc);
    }

    logGuardian(utils::LogLevel::WARN, "Rolled back to " + cp.id + " (seq " + std::to_string(cp.ledgerSeq) +
                ") by " + actor + ", mode " + modeToString(state.mode.mode));
    return out;
}

Result<ReviewFlag> Guardian::flagReviewLocked(const std::string& agentId, const std::string& rule,
                                              std::shared_future<RuleResult> result) {
    ReviewFlag flag;
    flag.id = nextReviewId_;
    flag.agentId = agentId;
    flag.rule = rule;
    flag.deadline = clock_() + config_.reviewDeadlineMs;

    AppendRequest req;
    req.actor = GUARDIAN_ACTOR;
    req.kind = KIND_REVIEW_FLAGGED;
    req.payload.setUint("review", flag.id)
               .set("agent", agentId)
               .set("rule", rule)
               .setUint("deadline", flag.deadline);

    Mutation m;
    m.apply = [this, &flag, &result](const LedgerEntry& e) {
        flag.flaggedAt = e.timestamp;
        flag.ledgerSeq = e.seq;
        reviewFlags_.push_back(flag);

        PendingReview review;
        review.id = flag.id;
        review.agentId = flag.agentId;
        review.rule = flag.rule;
        review.deadline = flag.deadline;
        review.result = result;
        pending_[flag.id] = review;
        nextReviewId_ = flag.id + 1;
    };

    auto r = ledger_.append(req, m);
    if (r.failed()) return r.error();

    logGuardian(utils::LogLevel::WARN, "Rule " + rule + " exceeded its budget for " + agentId +
                ", review " + std::to_string(flag.id) + " flagged");
    return flag;
}

Result<LedgerEntry> Guardian::clearReviewLocked(uint64_t reviewId, const std::string& reason) {
    auto it = pending_.find(reviewId);
    if (it == pending_.end()) {
        return makeError(ErrorCode::NOT_FOUND, "No pending review " + std::to_string(reviewId));
    }

    AppendRequest req;
    req.actor = GUARDIAN_ACTOR;
    req.kind = KIND_REVIEW_CLEARED;
    req.payload.setUint("review", reviewId)
               .set("agent", it->second.agentId)
               .set("rule", it->second.rule)
               .set("reason", reason);

    Mutation m;
    m.apply = [this, reviewId](const LedgerEntry&) {
        for (auto& flag : reviewFlags_) {
            if (flag.id == reviewId) flag.resolution = ReviewResolution::CLEARED;
        }
        pending_.erase(reviewId);
    };

    auto r = ledger_.append(req, m);
    if (r.ok()) {
        logGuardian(utils::LogLevel::INFO, "Review " + std::to_string(reviewId) + " cleared: " + reason);
    }
    return r;
}

ReviewCycleReport Guardian::runReviewCycle() {
    ReviewCycleReport report;
    std::lock_guard<std::mutex> lock(mtx_);
    uint64_t now = clock_();

    auto escalate = [this, &report](const PendingReview& review, const std::string& trigger,
                                    const std::string& reason) {
        auto q = quarantineLocked(GUARDIAN_ACTOR, review.agentId, trigger, reason, review.id);
        if (q.ok()) {
            report.escalated++;
            return;
        }
        if (q.error().code == ErrorCode::ALREADY_EXISTS || q.error().code == ErrorCode::AGENT_TERMINATED ||
            q.error().code == ErrorCode::UNKNOWN_AGENT) {
            if (clearReviewLocked(review.id, "agent no longer active").ok()) report.cleared++;
            return;
        }
        logGuardian(utils::LogLevel::ERROR, "Escalation of review " + std::to_string(review.id) +
                    " failed: " + q.error().message);
    };

    std::vector<uint64_t> ids;
    for (const auto& [id, review] : pending_) {
        ids.push_back(id);
    }

    for (uint64_t id : ids) {
        auto it = pending_.find(id);
        if (it == pending_.end()) continue;
        PendingReview review = it->second;

        bool ready = review.result.valid() &&
                     review.result.wait_for(std::chrono::milliseconds(0)) == std::future_status::ready;
        if (ready) {
            RuleResult r;
            try {
                r = review.result.get();
            } catch (const std::exception& e) {
                logGuardian(utils::LogLevel::WARN, "Rule " + review.rule + " failed during review: " + e.what());
            }
            if (r.fired) {
                escalate(review, review.rule, r.reason);
            } else if (clearReviewLocked(id, "rule completed without firing").ok()) {
                report.cleared++;
            }
        } else if (now >= review.deadline) {
            escalate(review, "review_deadline:" + review.rule,
                     "Review of " + review.rule + " not resolved before deadline");
        }
    }

    if (config_.quarantineExpiryMs > 0) {
        std::vector<std::string> expired;
        for (const auto& [id, rec] : quarantines_) {
            if (rec.status == QuarantineStatus::ACTIVE && now >= rec.timestamp &&
                now - rec.timestamp >= config_.quarantineExpiryMs) {
                expired.push_back(id);
            }
        }
        for (const auto& id : expired) {
            auto r = releaseLocked(GUARDIAN_ACTOR, id, EXPIRY_RELEASER);
            if (r.ok()) {
                report.released++;
            } else {
                logGuardian(utils::LogLevel::ERROR, "Expiry release of " + id + " failed: " + r.error().message);
            }
        }
    }

    return report;
}

void Guardian::start() {
    bool expected = false;
    if (!running_.compare_exchange_strong(expected, true)) return;
    reviewThread_ = std::thread(&Guardian::reviewLoop, this);
    logGuardian(utils::LogLevel::DEBUG, "Review thread started");
}

void Guardian::stop() {
    {
        std::lock_guard<std::mutex> lock(wakeMutex_);
        running_ = false;
    }
    wake_.notify_all();
    if (reviewThread_.joinable()) {
        reviewThread_.join();
        logGuardian(utils::LogLevel::DEBUG, "Review thread stopped");
    }
}

bool Guardian::isRunning() const {
    return running_;
}

void Guardian::reviewLoop() {
    auto interval = std::chrono::milliseconds(std::max<uint64_t>(1, config_.reviewIntervalMs));
    while (running_) {
        {
            std::unique_lock<std::mutex> lock(wakeMutex_);
            wake_.wait_for(lock, interval, [this] { return !running_; });
        }
        if (!running_) break;
        runReviewCycle();
    }
}

std::vector<QuarantineRecord> Guardian::quarantines() const {
    std::lock_guard<std::mutex> lock(mtx_);
    std::vector<QuarantineRecord> out;
    for (const auto& [id, rec] : quarantines_) {
        out.push_back(rec);
    }
    return out;
}

Result<QuarantineRecord> Guardian::quarantineRecord(const std::string& agentId) const {
    std::lock_guard<std::mutex> lock(mtx_);
    auto it = quarantines_.find(agentId);
    if (it == quarantines_.end()) {
        return makeError(ErrorCode::NOT_FOUND, "No quarantine record for " + agentId);
    }
    return it->second;
}

std::vector<Checkpoint> Guardian::checkpoints() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return checkpoints_;
}

std::vector<ReviewFlag> Guardian::reviewFlags() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return reviewFlags_;
}

size_t Guardian::pendingReviews() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return pending_.size();
}

void Guardian::restore(const FullReplay& replay) {
    std::lock_guard<std::mutex> lock(mtx_);
    quarantines_ = replay.quarantines;
    checkpoints_ = replay.checkpoints;
    reviewFlags_ = replay.reviewFlags;
    pending_.clear();

    nextCheckpointId_ = 1;
    for (const auto& cp : checkpoints_) {
        if (cp.id.compare(0, 3, "cp-") != 0) continue;
        uint64_t n = std::strtoull(cp.id.c_str() + 3, nullptr, 10);
        nextCheckpointId_ = std::max(nextCheckpointId_, n + 1);
    }

    nextReviewId_ = 1;
    for (const auto& flag : reviewFlags_) {
        nextReviewId_ = std::max(nextReviewId_, flag.id + 1);
        if (flag.resolution != ReviewResolution::PENDING) continue;
        // The rule future did not survive the restart; the flag can only
        // be resolved by its deadline.
        PendingReview review;
        review.id = flag.id;
        review.agentId = flag.agentId;
        review.rule = flag.rule;
        review.deadline = flag.deadline;
        pending_[flag.id] = review;
    }

    logGuardian(utils::LogLevel::INFO, "Restored " + std::to_string(quarantines_.size()) + " quarantine records, " +
                std::to_string(checkpoints_.size()) + " checkpoints, " + std::to_string(pending_.size()) +
                " pending reviews");
}

}
}
