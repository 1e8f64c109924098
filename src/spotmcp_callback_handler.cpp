#include "spotmcp_callback_handler.hpp"
#include "spotmcp_tracing.hpp"

namespace spotmcp {

CallbackHandler::CallbackHandler() : resolved_(false), future_(promise_.get_future().share()) {
}

bool CallbackHandler::HandleCallback(const std::string& code, const std::string& state) {
    SPOTMCP_TRACE_INFO("CALLBACK_HANDLER", "Received callback with code=" + SpotmcpTracer::Redact(code) + " state=" + state);
    return Resolve(CallbackResult::Success(code, state));
}

bool CallbackHandler::HandleError(const std::string& error, const std::string& error_description) {
    SPOTMCP_TRACE_WARN("CALLBACK_HANDLER", "Received error: " + error +
                       (error_description.empty() ? std::string() : " - " + error_description));
    auto reported = error.empty() ? std::string("unknown_error") : error;
    auto message = error_description.empty() ? reported : reported + ": " + error_description;
    return Resolve(CallbackResult::Failure(message));
}

bool CallbackHandler::HandleMissingParameters() {
    SPOTMCP_TRACE_WARN("CALLBACK_HANDLER", "Callback request without code or state");
    return Resolve(CallbackResult::Failure("Missing code or state"));
}

bool CallbackHandler::Resolve(CallbackResult result) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (resolved_) {
        SPOTMCP_TRACE_DEBUG("CALLBACK_HANDLER", "Result already set, ignoring later callback");
        return false;
    }
    resolved_ = true;
    promise_.set_value(std::move(result));
    return true;
}

bool CallbackHandler::IsResolved() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return resolved_;
}

std::optional<CallbackResult> CallbackHandler::WaitForResult(std::chrono::seconds timeout) const {
    if (timeout.count() <= 0) {
        return future_.get();
    }
    if (future_.wait_for(timeout) != std::future_status::ready) {
        return std::nullopt;
    }
    return future_.get();
}

} // namespace spotmcp
