#pragma once

#include <string>
#include <functional>
#include <vector>
#include <memory>
#include <cstdint>

namespace substrate {

enum class ErrorCode {
    OK = 0,
    CONCURRENT_APPEND_CONFLICT,
    INSUFFICIENT_BUDGET,
    INVALID_TRANSITION,
    ARBITRATION_DENIED,
    AGENT_QUARANTINED,
    AGENT_TERMINATED,
    CHAIN_VERIFICATION_FAILURE,
    UNKNOWN_ACTION_KIND,
    UNKNOWN_AGENT,
    PERMISSION_DENIED,
    ALREADY_EXISTS,
    NOT_FOUND,
    INVALID_ARGUMENT,
    DATABASE_ERROR,
    INTERNAL_ERROR,
    UNKNOWN
};

enum class ErrorSeverity {
    INFO,
    WARNING,
    ERROR,
    CRITICAL
};

struct Error {
    ErrorCode code;
    ErrorSeverity severity;
    std::string message;
    std::string context;
    uint64_t ledgerSeq;
    bool hasLedgerRef;
    uint64_t timestamp;

    Error() : code(ErrorCode::OK), severity(ErrorSeverity::INFO), ledgerSeq(0), hasLedgerRef(false), timestamp(0) {}
    Error(ErrorCode c, const std::string& msg)
        : code(c), severity(ErrorSeverity::ERROR), message(msg), ledgerSeq(0), hasLedgerRef(false), timestamp(0) {}

    // Only ledger contention is worth retrying; every other code is a decision.
    bool retryable() const { return code == ErrorCode::CONCURRENT_APPEND_CONFLICT; }
};

template<typename T>
class Result {
public:
    Result(T value) : value_(std::move(value)), error_(), hasValue_(true) {}
    Result(Error error) : value_(), error_(std::move(error)), hasValue_(false) {}

    bool ok() const { return hasValue_; }
    bool failed() const { return !hasValue_; }

    const T& value() const { return value_; }
    T& value() { return value_; }
    const Error& error() const { return error_; }

    T valueOr(const T& defaultValue) const { return hasValue_ ? value_ : defaultValue; }

private:
    T value_;
    Error error_;
    bool hasValue_;
};

template<>
class Result<void> {
public:
    Result() : error_(), hasValue_(true) {}
    Result(Error error) : error_(std::move(error)), hasValue_(false) {}

    bool ok() const { return hasValue_; }
    bool failed() const { return !hasValue_; }
    const Error& error() const { return error_; }

private:
    Error error_;
    bool hasValue_;
};

class ErrorHandler {
public:
    static ErrorHandler& instance();

    void setHandler(std::function<void(const Error&)> handler);
    void handle(const Error& error);
    void handle(ErrorCode code, const std::string& message);

    void pushContext(const std::string& context);
    void popContext();
    std::string getContext() const;

    std::vector<Error> getRecentErrors(size_t count = 10) const;
    void clearErrors();

    uint64_t getErrorCount() const;
    uint64_t getErrorCount(ErrorCode code) const;

    Error getLastError() const;
    bool hasErrors() const;
    bool hasCriticalErrors() const;

private:
    ErrorHandler();
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

class ScopedContext {
public:
    explicit ScopedContext(const std::string& ctx);
    ~ScopedContext();
    ScopedContext(const ScopedContext&) = delete;
    ScopedContext& operator=(const ScopedContext&) = delete;
};

const char* errorToString(ErrorCode code);
const char* severityToString(ErrorSeverity severity);

Error makeError(ErrorCode code, const std::string& message);
Error makeError(ErrorCode code, const std::string& message, uint64_t ledgerSeq);
Error withContext(Error error, const std::string& context);

#define SUBSTRATE_CONCAT_INNER(a, b) a##b
#define SUBSTRATE_CONCAT(a, b) SUBSTRATE_CONCAT_INNER(a, b)
#define SUBSTRATE_CONTEXT(name) substrate::ScopedContext SUBSTRATE_CONCAT(_ctx_, __LINE__)(name)

}
