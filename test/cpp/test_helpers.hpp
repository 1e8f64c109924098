#pragma once

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <mutex>
#include <random>
#include <string>
#include <thread>
#include <vector>

#ifndef CPPHTTPLIB_OPENSSL_SUPPORT
#define CPPHTTPLIB_OPENSSL_SUPPORT
#endif
#include <httplib.h>

#ifndef _WIN32
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>
#endif

#include "spotmcp_auth_config.hpp"
#include "spotmcp_http_client.hpp"

namespace spotmcp {
namespace test {

// Unique scratch directory, removed on destruction
class TempDir {
public:
    TempDir() {
        std::random_device rd;
        auto name = "spotmcp_test_" + std::to_string(rd()) + "_" + std::to_string(rd());
        path_ = std::filesystem::temp_directory_path() / name;
        std::filesystem::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    const std::filesystem::path& Path() const { return path_; }
    std::string Str() const { return path_.string(); }

private:
    std::filesystem::path path_;
};

// Sets an environment variable for the lifetime of the object
class ScopedEnv {
public:
    ScopedEnv(const std::string& name, const std::string& value) : name_(name) {
        const char* previous = std::getenv(name.c_str());
        if (previous) {
            had_previous_ = true;
            previous_ = previous;
        }
        Set(name_, value);
    }

    ~ScopedEnv() {
        if (had_previous_) {
            Set(name_, previous_);
        } else {
            Unset(name_);
        }
    }

    static void Set(const std::string& name, const std::string& value) {
#ifdef _WIN32
        _putenv_s(name.c_str(), value.c_str());
#else
        setenv(name.c_str(), value.c_str(), 1);
#endif
    }

    static void Unset(const std::string& name) {
#ifdef _WIN32
        _putenv_s(name.c_str(), "");
#else
        unsetenv(name.c_str());
#endif
    }

private:
    std::string name_;
    std::string previous_;
    bool had_previous_ = false;
};

// Asks the OS for a currently unused loopback port
inline int FindFreePort() {
#ifndef _WIN32
    int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) {
        throw std::runtime_error("socket() failed");
    }
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = 0;
    if (::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0) {
        ::close(fd);
        throw std::runtime_error("bind() failed");
    }
    socklen_t len = sizeof(addr);
    ::getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len);
    int port = ntohs(addr.sin_port);
    ::close(fd);
    return port;
#else
    return 18888;
#endif
}

// Local stand-in for the accounts service token endpoint
class MockTokenServer {
public:
    MockTokenServer() : status_(200), body_(DefaultTokenBody()) {
        server_.Post("/api/token", [this](const httplib::Request& req, httplib::Response& res) {
            auto form = ParseQueryString(req.body);
            auto grant_type = FindQueryParam(form, "grant_type");
            if (grant_type == "refresh_token") {
                refresh_calls_++;
            } else if (grant_type == "authorization_code") {
                code_calls_++;
            }

            std::lock_guard<std::mutex> lock(mutex_);
            last_form_ = form;
            content_type_ = req.get_header_value("Content-Type");
            if (grant_type == "refresh_token" && refresh_status_ != 0) {
                res.status = refresh_status_;
                res.set_content(refresh_body_, "application/json");
                return;
            }
            res.status = status_;
            res.set_content(body_, "application/json");
        });

        port_ = server_.bind_to_any_port("127.0.0.1");
        thread_ = std::thread([this]() { server_.listen_after_bind(); });
        auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
        while (!server_.is_running() && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
    }

    ~MockTokenServer() {
        server_.stop();
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    static std::string DefaultTokenBody() {
        return R"({"access_token":"mock-access-token-0123456789","token_type":"Bearer","expires_in":3600,)"
               R"("refresh_token":"mock-refresh-token-0123456789","scope":"user-read-email"})";
    }

    void Respond(int status, const std::string& body) {
        std::lock_guard<std::mutex> lock(mutex_);
        status_ = status;
        body_ = body;
    }

    // Overrides the response for refresh grants only
    void RespondToRefresh(int status, const std::string& body) {
        std::lock_guard<std::mutex> lock(mutex_);
        refresh_status_ = status;
        refresh_body_ = body;
    }

    std::string TokenUrl() const { return "http://127.0.0.1:" + std::to_string(port_) + "/api/token"; }
    int Port() const { return port_; }

    int RefreshCalls() const { return refresh_calls_.load(); }
    int CodeCalls() const { return code_calls_.load(); }
    int TotalCalls() const { return refresh_calls_.load() + code_calls_.load(); }

    QueryParams LastForm() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return last_form_;
    }

    std::string LastContentType() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return content_type_;
    }

private:
    httplib::Server server_;
    std::thread thread_;
    int port_ = -1;

    mutable std::mutex mutex_;
    int status_;
    std::string body_;
    int refresh_status_ = 0;
    std::string refresh_body_;
    QueryParams last_form_;
    std::string content_type_;

    std::atomic<int> refresh_calls_{0};
    std::atomic<int> code_calls_{0};
};

// Config pointing at local endpoints, never at Spotify
inline AuthConfig MakeTestConfig(const std::string& cache_dir, const std::string& token_url, int callback_port) {
    AuthConfig config;
    config.client_id = "abc123";
    config.scopes = {"user-read-email"};
    config.callback_port = callback_port;
    config.cache_dir = cache_dir;
    config.authorize_url = "https://accounts.example.test/authorize";
    config.token_url = token_url;
    config.callback_timeout = std::chrono::seconds(10);
    config.http_timeout = std::chrono::milliseconds(2000);
    config.open_browser = true;
    return config;
}

// Plain GET against the loopback listener, as a browser following the redirect would
inline httplib::Result BrowserGet(int port, const std::string& path_and_query) {
    httplib::Client client("127.0.0.1", port);
    client.set_connection_timeout(std::chrono::seconds(2));
    client.set_read_timeout(std::chrono::seconds(5));
    return client.Get(path_and_query);
}

} // namespace test
} // namespace spotmcp
