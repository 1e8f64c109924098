#pragma once

#include "spotmcp_auth_types.hpp"
#include "spotmcp_callback_handler.hpp"
#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <thread>

namespace httplib {
class Server;
}

namespace spotmcp {

// Loopback HTTP listener for the OAuth2 redirect. Serves GET /callback until
// the first terminal request, everything else is a 404.
class CallbackListener {
public:
    explicit CallbackListener(int port, std::string host = "127.0.0.1");
    ~CallbackListener();

    CallbackListener(const CallbackListener&) = delete;
    CallbackListener& operator=(const CallbackListener&) = delete;

    // Binds synchronously and starts the accept loop on a worker thread.
    // Throws AuthException(ListenerFailed) if the port cannot be bound.
    void Start();

    // Blocks for the redirect, then stops the listener. A zero timeout waits
    // without bound; expiry throws AuthException(CallbackTimeout).
    CallbackResult WaitForResult(std::chrono::seconds timeout);

    // Idempotent
    void Stop();

    bool IsRunning() const { return running_.load(); }
    int Port() const { return port_; }
    const std::string& Host() const { return host_; }

    // Start + WaitForResult + Stop
    static CallbackResult AwaitCallback(int port, std::chrono::seconds timeout);

    static std::string SuccessPage();
    static std::string ErrorPage(const std::string& message);
    static std::string HtmlEscape(const std::string& text);

private:
    std::string host_;
    int port_;
    std::unique_ptr<httplib::Server> server_;
    std::unique_ptr<CallbackHandler> handler_;
    std::thread server_thread_;
    std::atomic<bool> running_;
    std::atomic<bool> listen_failed_;
    std::atomic<bool> thread_done_;

    void RegisterRoutes();
};

} // namespace spotmcp
