#include "spotmcp_callback_server.hpp"
#include "spotmcp_auth_errors.hpp"
#include "spotmcp_tracing.hpp"

#ifndef CPPHTTPLIB_OPENSSL_SUPPORT
#define CPPHTTPLIB_OPENSSL_SUPPORT
#endif
#include <httplib.h>

namespace spotmcp {

namespace {

const char* PAGE_STYLE =
    "body { font-family: -apple-system, BlinkMacSystemFont, 'Segoe UI', Roboto, sans-serif; margin: 0; padding: 0; min-height: 100vh; display: flex; align-items: center; justify-content: center; background: #121212; }"
    ".container { background: white; border-radius: 20px; box-shadow: 0 20px 40px rgba(0,0,0,0.3); padding: 40px; text-align: center; max-width: 500px; margin: 20px; }"
    "h1 { margin-bottom: 20px; font-size: 28px; }"
    ".message { color: #4a5568; font-size: 16px; line-height: 1.6; }";

const auto STARTUP_WAIT = std::chrono::seconds(5);

} // anonymous namespace

CallbackListener::CallbackListener(int port, std::string host)
    : host_(std::move(host)), port_(port), running_(false), listen_failed_(false), thread_done_(false) {
}

CallbackListener::~CallbackListener() {
    Stop();
}

void CallbackListener::Start() {
    if (running_.load()) {
        throw AuthException(AuthErrorType::ListenerFailed, "Callback listener is already running");
    }

    handler_ = std::make_unique<CallbackHandler>();
    server_ = std::make_unique<httplib::Server>();
    // httplib defaults to SO_REUSEPORT, which would let a second login share the port
    server_->set_socket_options([](auto sock) {
        int yes = 1;
        setsockopt(sock, SOL_SOCKET, SO_REUSEADDR, reinterpret_cast<const char*>(&yes), sizeof(yes));
    });
    RegisterRoutes();

    // Port 0 asks the OS for a free port
    if (port_ == 0) {
        auto bound = server_->bind_to_any_port(host_);
        if (bound < 0) {
            server_.reset();
            throw AuthException(AuthErrorType::ListenerFailed, "Could not bind callback listener on " + host_);
        }
        port_ = bound;
    } else if (!server_->bind_to_port(host_, port_)) {
        server_.reset();
        SPOTMCP_TRACE_ERROR("CALLBACK_SERVER", "Failed to bind " + host_ + ":" + std::to_string(port_));
        throw AuthException(AuthErrorType::ListenerFailed,
                            "Could not bind callback listener on " + host_ + ":" + std::to_string(port_) +
                            " (is another login in progress?)");
    }

    listen_failed_.store(false);
    thread_done_.store(false);
    running_.store(true);
    server_thread_ = std::thread([this]() {
        if (!server_->listen_after_bind()) {
            SPOTMCP_TRACE_ERROR("CALLBACK_SERVER", "Accept loop ended with an error on port " + std::to_string(port_));
            listen_failed_.store(true);
        }
        thread_done_.store(true);
    });

    // stop() is a no-op until the accept loop is running
    auto deadline = std::chrono::steady_clock::now() + STARTUP_WAIT;
    while (!server_->is_running() && !listen_failed_.load() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    if (!server_->is_running()) {
        Stop();
        throw AuthException(AuthErrorType::ListenerFailed, "Callback listener failed to start on port " + std::to_string(port_));
    }

    SPOTMCP_TRACE_INFO("CALLBACK_SERVER", "OAuth callback server listening on http://" + host_ + ":" +
                       std::to_string(port_) + "/callback");
}

void CallbackListener::RegisterRoutes() {
    server_->Get("/callback", [this](const httplib::Request& req, httplib::Response& res) {
        SPOTMCP_TRACE_DEBUG("CALLBACK_SERVER", "Received HTTP request: " + req.path);

        // An empty error value is treated like an ordinary callback
        if (!req.get_param_value("error").empty()) {
            auto error = req.get_param_value("error");
            auto error_description = req.get_param_value("error_description");
            handler_->HandleError(error, error_description);

            res.status = 400;
            res.set_content(ErrorPage("Error: " + error +
                                      (error_description.empty() ? std::string() : " (" + error_description + ")")),
                            "text/html");
            return;
        }

        auto code = req.get_param_value("code");
        auto state = req.get_param_value("state");
        if (code.empty() || state.empty()) {
            handler_->HandleMissingParameters();

            res.status = 400;
            res.set_content(ErrorPage("Missing code or state parameter."), "text/html");
            return;
        }

        handler_->HandleCallback(code, state);
        res.status = 200;
        res.set_content(SuccessPage(), "text/html");
    });

    server_->set_error_handler([](const httplib::Request& req, httplib::Response& res) {
        if (res.status == 404) {
            SPOTMCP_TRACE_DEBUG("CALLBACK_SERVER", "No route for " + req.path);
            res.set_content("Not found", "text/plain");
        }
    });
}

CallbackResult CallbackListener::WaitForResult(std::chrono::seconds timeout) {
    if (!handler_) {
        throw AuthException(AuthErrorType::ListenerFailed, "Callback listener was not started");
    }

    SPOTMCP_TRACE_INFO("CALLBACK_SERVER", timeout.count() > 0
                       ? "Waiting for OAuth callback (timeout: " + std::to_string(timeout.count()) + " seconds)"
                       : std::string("Waiting for OAuth callback"));

    auto result = handler_->WaitForResult(timeout);
    Stop();

    if (!result) {
        SPOTMCP_TRACE_WARN("CALLBACK_SERVER", "Timed out waiting for OAuth callback");
        throw AuthException(AuthErrorType::CallbackTimeout,
                            "No OAuth callback received within " + std::to_string(timeout.count()) + " seconds");
    }
    return *result;
}

void CallbackListener::Stop() {
    if (server_thread_.joinable()) {
        // stop() must only be called once, after the accept loop is up
        while (!server_->is_running() && !thread_done_.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        server_->stop();
        server_thread_.join();
        SPOTMCP_TRACE_DEBUG("CALLBACK_SERVER", "Server thread finished, port " + std::to_string(port_) + " released");
    }
    server_.reset();
    running_.store(false);
}

CallbackResult CallbackListener::AwaitCallback(int port, std::chrono::seconds timeout) {
    CallbackListener listener(port);
    listener.Start();
    return listener.WaitForResult(timeout);
}

std::string CallbackListener::HtmlEscape(const std::string& text) {
    std::string escaped;
    escaped.reserve(text.size());
    for (char c : text) {
        switch (c) {
        case '&': escaped += "&amp;"; break;
        case '<': escaped += "&lt;"; break;
        case '>': escaped += "&gt;"; break;
        case '"': escaped += "&quot;"; break;
        case '\'': escaped += "&#39;"; break;
        default: escaped += c; break;
        }
    }
    return escaped;
}

std::string CallbackListener::SuccessPage() {
    return std::string(
        "<!DOCTYPE html>"
        "<html>"
        "<head>"
        "<title>Authentication Successful</title>"
        "<meta charset='utf-8'>"
        "<style>") + PAGE_STYLE + "h1 { color: #1db954; }"
        "</style>"
        "</head>"
        "<body>"
        "<div class='container'>"
        "<h1>Authentication Successful!</h1>"
        "<div class='message'>"
        "<p>You have successfully authenticated with Spotify.</p>"
        "<p>You can close this window and return to your application.</p>"
        "</div>"
        "</div>"
        "<script>window.close();</script>"
        "</body>"
        "</html>";
}

std::string CallbackListener::ErrorPage(const std::string& message) {
    return std::string(
        "<!DOCTYPE html>"
        "<html>"
        "<head>"
        "<title>Authentication Failed</title>"
        "<meta charset='utf-8'>"
        "<style>") + PAGE_STYLE + "h1 { color: #c53030; }"
        "</style>"
        "</head>"
        "<body>"
        "<div class='container'>"
        "<h1>Authentication Failed</h1>"
        "<div class='message'>"
        "<p>" + HtmlEscape(message) + "</p>"
        "<p>You can close this window.</p>"
        "</div>"
        "</div>"
        "</body>"
        "</html>";
}

} // namespace spotmcp
