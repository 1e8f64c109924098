#pragma once

#include "spotmcp_auth_types.hpp"
#include <chrono>
#include <future>
#include <mutex>
#include <optional>
#include <string>

namespace spotmcp {

// One-shot hand-off of the redirect outcome from the listener's worker thread
// to the waiting coordinator. Only the first terminal request is recorded.
class CallbackHandler {
public:
    CallbackHandler();
    ~CallbackHandler() = default;

    // Non-copyable, non-movable
    CallbackHandler(const CallbackHandler&) = delete;
    CallbackHandler& operator=(const CallbackHandler&) = delete;
    CallbackHandler(CallbackHandler&&) = delete;
    CallbackHandler& operator=(CallbackHandler&&) = delete;

    // Each returns true if this call produced the result, false if one was already set
    bool HandleCallback(const std::string& code, const std::string& state);
    bool HandleError(const std::string& error, const std::string& error_description);
    bool HandleMissingParameters();

    bool IsResolved() const;

    // Blocks until resolved. A zero timeout waits without bound; nullopt on timeout.
    std::optional<CallbackResult> WaitForResult(std::chrono::seconds timeout) const;

private:
    mutable std::mutex mutex_;
    bool resolved_;
    std::promise<CallbackResult> promise_;
    std::shared_future<CallbackResult> future_;

    bool Resolve(CallbackResult result);
};

} // namespace spotmcp
