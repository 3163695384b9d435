#include "error_handling.h"
#include <mutex>
#include <deque>
#include <unordered_map>
#include <ctime>

namespace substrate {

const char* errorToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::OK: return "OK";
        case ErrorCode::CONCURRENT_APPEND_CONFLICT: return "Concurrent append conflict";
        case ErrorCode::INSUFFICIENT_BUDGET: return "Insufficient budget";
        case ErrorCode::INVALID_TRANSITION: return "Invalid transition";
        case ErrorCode::ARBITRATION_DENIED: return "Arbitration denied";
        case ErrorCode::AGENT_QUARANTINED: return "Agent quarantined";
        case ErrorCode::AGENT_TERMINATED: return "Agent terminated";
        case ErrorCode::CHAIN_VERIFICATION_FAILURE: return "Chain verification failure";
        case ErrorCode::UNKNOWN_ACTION_KIND: return "Unknown action kind";
        case ErrorCode::UNKNOWN_AGENT: return "Unknown agent";
        case ErrorCode::PERMISSION_DENIED: return "Permission denied";
        case ErrorCode::ALREADY_EXISTS: return "Already exists";
        case ErrorCode::NOT_FOUND: return "Not found";
        case ErrorCode::INVALID_ARGUMENT: return "Invalid argument";
        case ErrorCode::DATABASE_ERROR: return "Database error";
        case ErrorCode::INTERNAL_ERROR: return "Internal error";
        default: return "Unknown error";
    }
}

const char* severityToString(ErrorSeverity severity) {
    switch (severity) {
        case ErrorSeverity::INFO: return "INFO";
        case ErrorSeverity::WARNING: return "WARNING";
        case ErrorSeverity::ERROR: return "ERROR";
        case ErrorSeverity::CRITICAL: return "CRITICAL";
        default: return "UNKNOWN";
    }
}

Error makeError(ErrorCode code, const std::string& message) {
    Error err;
    err.code = code;
    err.severity = ErrorSeverity::ERROR;
    err.message = message;
    err.timestamp = static_cast<uint64_t>(std::time(nullptr));
    return err;
}

Error makeError(ErrorCode code, const std::string& message, uint64_t ledgerSeq) {
    Error err = makeError(code, message);
    err.ledgerSeq = ledgerSeq;
    err.hasLedgerRef = true;
    return err;
}

Error withContext(Error error, const std::string& context) {
    if (error.context.empty()) {
        error.context = context;
    } else {
        error.context = context + " > " + error.context;
    }
    return error;
}

struct ErrorHandler::Impl {
    std::function<void(const Error&)> handler;
    std::deque<Error> recentErrors;
    std::vector<std::string> contextStack;
    std::unordered_map<int, uint64_t> errorCounts;
    uint64_t totalErrors = 0;
    mutable std::mutex mtx;
    static constexpr size_t MAX_RECENT_ERRORS = 100;

    std::string joinedContext() const {
        std::string ctx;
        for (const auto& c : contextStack) {
            if (!ctx.empty()) ctx += " > ";
            ctx += c;
        }
        return ctx;
    }
};

ErrorHandler::ErrorHandler() : impl_(std::make_unique<Impl>()) {}

ErrorHandler& ErrorHandler::instance() {
    static ErrorHandler inst;
    return inst;
}

void ErrorHandler::setHandler(std::function<void(const Error&)> handler) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    impl_->handler = handler;
}

void ErrorHandler::handle(const Error& error) {
    std::function<void(const Error&)> handler;
    Error err = error;
    {
        std::lock_guard<std::mutex> lock(impl_->mtx);

        if (err.timestamp == 0) err.timestamp = static_cast<uint64_t>(std::time(nullptr));
        if (err.context.empty()) err.context = impl_->joinedContext();

        impl_->recentErrors.push_back(err);
        if (impl_->recentErrors.size() > Impl::MAX_RECENT_ERRORS) {
            impl_->recentErrors.pop_front();
        }

        impl_->totalErrors++;
        impl_->errorCounts[static_cast<int>(err.code)]++;
        handler = impl_->handler;
    }

    if (handler) handler(err);
}

void ErrorHandler::handle(ErrorCode code, const std::string& message) {
    handle(makeError(code, message));
}

void ErrorHandler::pushContext(const std::string& context) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    impl_->contextStack.push_back(context);
}

void ErrorHandler::popContext() {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    if (!impl_->contextStack.empty()) {
        impl_->contextStack.pop_back();
    }
}

std::string ErrorHandler::getContext() const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->joinedContext();
}

std::vector<Error> ErrorHandler::getRecentErrors(size_t count) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    std::vector<Error> result;
    size_t start = impl_->recentErrors.size() > count ?
                   impl_->recentErrors.size() - count : 0;
    for (size_t i = impl_->recentErrors.size(); i > start; i--) {
        result.push_back(impl_->recentErrors[i - 1]);
    }
    return result;
}

void ErrorHandler::clearErrors() {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    impl_->recentErrors.clear();
    impl_->errorCounts.clear();
    impl_->totalErrors = 0;
}

uint64_t ErrorHandler::getErrorCount() const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->totalErrors;
}

uint64_t ErrorHandler::getErrorCount(ErrorCode code) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    auto it = impl_->errorCounts.find(static_cast<int>(code));
    return it != impl_->errorCounts.end() ? it->second : 0;
}

Error ErrorHandler::getLastError() const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    if (impl_->recentErrors.empty()) {
        return Error{};
    }
    return impl_->recentErrors.back();
}

bool ErrorHandler::hasErrors() const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return !impl_->recentErrors.empty();
}

bool ErrorHandler::hasCriticalErrors() const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    for (const auto& err : impl_->recentErrors) {
        if (err.severity == ErrorSeverity::CRITICAL) {
            return true;
        }
    }
    return false;
}

ScopedContext::ScopedContext(const std::string& ctx) {
    ErrorHandler::instance().pushContext(ctx);
}

ScopedContext::~ScopedContext() {
    ErrorHandler::instance().popContext();
}

}
