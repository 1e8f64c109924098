#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#ifndef CPPHTTPLIB_OPENSSL_SUPPORT
#define CPPHTTPLIB_OPENSSL_SUPPORT
#endif
#include <httplib.h>

namespace spotmcp
{

struct CaseInsensitiveLess {
    bool operator()(const std::string& a, const std::string& b) const;
};

using HeaderMap = std::map<std::string, std::string, CaseInsensitiveLess>;
using QueryParams = std::vector<std::pair<std::string, std::string>>;

// Percent-encoding for query strings and form bodies; space becomes '+'
std::string UrlEncode(const std::string& value);
std::string UrlDecode(const std::string& value);

// key=value pairs joined with '&', both sides URL encoded
std::string BuildQueryString(const QueryParams& params);

// Inverse of BuildQueryString; accepts a leading '?'
QueryParams ParseQueryString(const std::string& query);

// First value for key, empty if absent
std::string FindQueryParam(const QueryParams& params, const std::string& key);

// ----------------------------------------------------------------------

class HttpUrl {
public:
    HttpUrl(const std::string& url);
    std::string ToSchemeHostAndPort() const;
    std::string ToPathQuery() const;

    std::string Path() const;
    std::string Query() const;

private:
    std::string scheme;
    std::string host;
    std::string port;
    std::string path;
    std::string query;

    void ParseUrl(const std::string& url);
};

// ----------------------------------------------------------------------

struct HttpParams {

    static constexpr uint64_t DEFAULT_TIMEOUT = 30000; // 30 sec
    static constexpr uint64_t DEFAULT_RETRIES = 1;
    static constexpr uint64_t DEFAULT_RETRY_WAIT_MS = 100;
    static constexpr float DEFAULT_RETRY_BACKOFF = 4;
    static constexpr bool DEFAULT_KEEP_ALIVE = false;

    HttpParams();

    uint64_t timeout;
    uint64_t retries;
    uint64_t retry_wait_ms;
    float retry_backoff;
    bool keep_alive;
};

// ----------------------------------------------------------------------

class HttpException : public std::runtime_error {
public:
    HttpException(int status, const std::string& message)
        : std::runtime_error(message), status_(status) {}

    // 0 for transport failures without an HTTP status
    int Status() const { return status_; }

private:
    int status_;
};

// ----------------------------------------------------------------------

class HttpMethod
{
public:
    enum Variants : uint8_t
    {
        UNDEFINED,
        GET,
        POST
    };

    HttpMethod() = default;
    constexpr HttpMethod(Variants ret_type) : variant(ret_type) { }
    constexpr bool operator==(HttpMethod a) const { return variant == a.variant; }
    constexpr bool operator!=(HttpMethod a) const { return variant != a.variant; }

    std::string ToString() const;

private:
    Variants variant = UNDEFINED;
};

// ----------------------------------------------------------------------

class HttpRequest
{
friend class HttpClient;

public:
    HttpRequest(HttpMethod method, const std::string &url, std::string content_type, std::string content);
    HttpRequest(HttpMethod method, const std::string &url);

public:
    HttpMethod method;
    HttpUrl url;

    HeaderMap headers;
    std::string content_type;
    std::string content;

private:
    httplib::Headers HttplibHeaders() const;
    httplib::Result Execute(httplib::Client &client) const;
};

// ----------------------------------------------------------------------

class HttpResponse
{
friend class HttpClient;

public:
    HttpResponse(HttpMethod method, HttpUrl url, int code, std::string content_type, std::string content);
    HttpResponse(HttpMethod method, HttpUrl url, int code);

    int Code() const;
    std::string ContentType() const;
    std::string Content() const;

public:
    HttpMethod method;
    HttpUrl url;

    int code;
    HeaderMap headers;
    std::string content_type;
    std::string content;

private:
    static std::unique_ptr<HttpResponse> FromHttpLibResponse(const HttpMethod &method,
                                                             const HttpUrl &url,
                                                             const httplib::Response &response);
};

// ----------------------------------------------------------------------

class HttpClient
{
public:
    HttpClient();
    HttpClient(const HttpParams &http_params);

public:
    std::unique_ptr<HttpResponse> SendRequest(const HttpRequest &request);

private:
    HttpParams http_params;

private:
    std::unique_ptr<httplib::Client> CreateHttplibClient(const std::string &scheme_host_and_port) const;

    uint64_t CalculateSleepTime(uint64_t n_tries) const;
};

} // namespace spotmcp
