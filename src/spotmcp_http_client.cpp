#include <algorithm>
#include <cctype>
#include <cmath>
#include <iomanip>
#include <regex>
#include <sstream>
#include <thread>

#include "spotmcp_http_client.hpp"
#include "spotmcp_tracing.hpp"

namespace spotmcp
{

bool CaseInsensitiveLess::operator()(const std::string& a, const std::string& b) const {
    return std::lexicographical_compare(a.begin(), a.end(), b.begin(), b.end(),
                                        [](unsigned char x, unsigned char y) {
                                            return std::tolower(x) < std::tolower(y);
                                        });
}

std::string UrlEncode(const std::string& value) {
    std::ostringstream escaped;
    escaped.fill('0');
    escaped << std::hex << std::uppercase;

    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            escaped << c;
        } else if (c == ' ') {
            escaped << '+';
        } else {
            escaped << '%' << std::setw(2) << static_cast<int>(c);
        }
    }

    return escaped.str();
}

namespace {

int HexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // anonymous namespace

std::string UrlDecode(const std::string& value) {
    std::string decoded;
    decoded.reserve(value.size());
    for (size_t i = 0; i < value.size(); ++i) {
        char c = value[i];
        if (c == '+') {
            decoded += ' ';
        } else if (c == '%' && i + 2 < value.size()) {
            int hi = HexValue(value[i + 1]);
            int lo = HexValue(value[i + 2]);
            if (hi < 0 || lo < 0) {
                decoded += c;
                continue;
            }
            decoded += static_cast<char>((hi << 4) | lo);
            i += 2;
        } else {
            decoded += c;
        }
    }
    return decoded;
}

std::string BuildQueryString(const QueryParams& params) {
    std::ostringstream query;
    bool first = true;
    for (const auto& param : params) {
        if (!first) {
            query << '&';
        }
        first = false;
        query << UrlEncode(param.first) << '=' << UrlEncode(param.second);
    }
    return query.str();
}

QueryParams ParseQueryString(const std::string& query) {
    QueryParams params;
    size_t pos = (!query.empty() && query[0] == '?') ? 1 : 0;
    while (pos < query.size()) {
        auto amp = query.find('&', pos);
        if (amp == std::string::npos) {
            amp = query.size();
        }
        auto pair = query.substr(pos, amp - pos);
        if (!pair.empty()) {
            auto eq = pair.find('=');
            if (eq == std::string::npos) {
                params.emplace_back(UrlDecode(pair), std::string());
            } else {
                params.emplace_back(UrlDecode(pair.substr(0, eq)), UrlDecode(pair.substr(eq + 1)));
            }
        }
        pos = amp + 1;
    }
    return params;
}

std::string FindQueryParam(const QueryParams& params, const std::string& key) {
    for (const auto& param : params) {
        if (param.first == key) {
            return param.second;
        }
    }
    return std::string();
}

// ----------------------------------------------------------------------

HttpUrl::HttpUrl(const std::string& url) {
    ParseUrl(url);
}

void HttpUrl::ParseUrl(const std::string& url) {
    const static std::regex re(R"(^(?:(https?):)?(?://([^:/?#]+)(?::(\d+))?)?([^?#]*)(\?[^#]*)?(#.*)?)");
    std::smatch m;
    if (!std::regex_match(url, m, re)) {
        throw std::runtime_error("Invalid URL, cannot be parsed");
    }

    scheme = m[1].str();
    host = m[2].str();
    port = m[3].str();
    path = m[4].str();
    query = m[5].str();
}

std::string HttpUrl::ToSchemeHostAndPort() const {
    std::ostringstream ss;
    ss << scheme << "://" << host;
    if (!port.empty()) {
        ss << ":" << port;
    }
    return ss.str();
}

std::string HttpUrl::ToPathQuery() const {
    std::ostringstream ss;
    ss << (path.empty() ? "/" : path) << query;
    return ss.str();
}

std::string HttpUrl::Path() const { return path; }
std::string HttpUrl::Query() const { return query; }

// ----------------------------------------------------------------------

HttpParams::HttpParams()
    : timeout(DEFAULT_TIMEOUT),
      retries(DEFAULT_RETRIES),
      retry_wait_ms(DEFAULT_RETRY_WAIT_MS),
      retry_backoff(DEFAULT_RETRY_BACKOFF),
      keep_alive(DEFAULT_KEEP_ALIVE)
{ }

// ----------------------------------------------------------------------

std::string HttpMethod::ToString() const
{
    switch (variant)
    {
    case GET:
        return "GET";
    case POST:
        return "POST";
    default:
        return "UNDEFINED";
    }
}

// ----------------------------------------------------------------------

HttpRequest::HttpRequest(HttpMethod method, const std::string &url, std::string content_type, std::string content)
    : method(method), url(HttpUrl(url)), content_type(std::move(content_type)), content(std::move(content))
{ }

HttpRequest::HttpRequest(HttpMethod method, const std::string &url)
    : HttpRequest(method, url, std::string("application/json"), std::string())
{ }

httplib::Headers HttpRequest::HttplibHeaders() const
{
    httplib::Headers ret;
    for (const auto &header : headers)
    {
        ret.emplace(header.first, header.second);
    }
    return ret;
}

httplib::Result HttpRequest::Execute(httplib::Client &client) const
{
    auto path_str = url.ToPathQuery();
    auto headers = HttplibHeaders();

    SPOTMCP_TRACE_INFO("HTTP_REQUEST", "Executing " + method.ToString() + " request to: " + url.ToSchemeHostAndPort() + url.Path());
    for (const auto& header : headers) {
        auto value = header.first == "Authorization" ? SpotmcpTracer::Redact(header.second) : header.second;
        SPOTMCP_TRACE_DEBUG("HTTP_REQUEST", "  " + header.first + ": " + value);
    }
    if (!content.empty()) {
        // Form bodies carry codes and refresh tokens; only the size is logged
        SPOTMCP_TRACE_DEBUG("HTTP_REQUEST", "Request content: " + std::to_string(content.length()) + " bytes of " + content_type);
    }

    if (method == HttpMethod::GET)
    {
        auto result = client.Get(path_str, headers);
        if (result) {
            SPOTMCP_TRACE_INFO("HTTP_RESPONSE", "Response status: " + std::to_string(result->status));
        } else {
            SPOTMCP_TRACE_ERROR("HTTP_RESPONSE", "Request failed: " + httplib::to_string(result.error()));
        }
        return result;
    }
    else if (method == HttpMethod::POST)
    {
        auto result = client.Post(path_str, headers, content, content_type);
        if (result) {
            SPOTMCP_TRACE_INFO("HTTP_RESPONSE", "Response status: " + std::to_string(result->status));
        } else {
            SPOTMCP_TRACE_ERROR("HTTP_RESPONSE", "Request failed: " + httplib::to_string(result.error()));
        }
        return result;
    }

    throw std::runtime_error("Invalid HTTP method");
}

// ----------------------------------------------------------------------

HttpResponse::HttpResponse(HttpMethod method, HttpUrl url, int code, std::string content_type, std::string content)
    : method(method), url(std::move(url)), code(code), content_type(std::move(content_type)), content(std::move(content))
{ }

HttpResponse::HttpResponse(HttpMethod method, HttpUrl url, int code)
    : HttpResponse(method, std::move(url), code, std::string(), std::string())
{ }

std::unique_ptr<HttpResponse> HttpResponse::FromHttpLibResponse(const HttpMethod &method,
                                                                const HttpUrl &url,
                                                                const httplib::Response &response)
{
    auto content_type = response.get_header_value("Content-Type");
    auto ret = std::make_unique<HttpResponse>(method, url, response.status, content_type, response.body);
    for (const auto &header : response.headers)
    {
        ret->headers.emplace(header.first, header.second);
    }

    return ret;
}

int HttpResponse::Code() const {
    return code;
}

std::string HttpResponse::ContentType() const {
    return content_type;
}

std::string HttpResponse::Content() const {
    return content;
}

// ----------------------------------------------------------------------

HttpClient::HttpClient(const HttpParams &http_params)
    : http_params(http_params)
{ }

HttpClient::HttpClient()
    : HttpClient(HttpParams())
{ }

std::unique_ptr<HttpResponse> HttpClient::SendRequest(const HttpRequest &request)
{
    uint64_t n_tries = 0;
    while (true)
    {
        auto client = CreateHttplibClient(request.url.ToSchemeHostAndPort());
        auto res = request.Execute(*client);
        auto err = res.error();
        int status = 0;

        if (err == httplib::Error::Success)
        {
            status = res->status;
            switch (status) {
                case 408: // Request Timeout
                case 418: // Server is pretending to be a teapot
                case 429: // Rate limiter hit
                case 503: // Server has error
                case 504: // Server has error
                    break;
                default:
                    return HttpResponse::FromHttpLibResponse(request.method, request.url, res.value());
            }
        }

        n_tries += 1;
        if (n_tries >= http_params.retries)
        {
            auto target = request.url.ToSchemeHostAndPort() + request.url.Path();
            if (err == httplib::Error::Success) {
                // Out of retries on a retryable status: hand the last response back to the caller
                SPOTMCP_TRACE_WARN("HTTP_CLIENT", "Giving up after " + std::to_string(n_tries) +
                                   " attempts, last status " + std::to_string(status) + " from " + target);
                return HttpResponse::FromHttpLibResponse(request.method, request.url, res.value());
            }
            throw HttpException(0, httplib::to_string(err) + " error for HTTP " + request.method.ToString() +
                                   " to '" + target + "'");
        }
        else {
            if (n_tries > 1) {
                auto sleep_amount = CalculateSleepTime(n_tries);
                std::this_thread::sleep_for(std::chrono::milliseconds(sleep_amount));
            }
        }
    }
}

uint64_t HttpClient::CalculateSleepTime(uint64_t n_tries) const
{
    auto ret = ((float)http_params.retry_wait_ms * std::pow(http_params.retry_backoff, n_tries - 2));
    return (uint64_t)ret;
}

std::unique_ptr<httplib::Client> HttpClient::CreateHttplibClient(const std::string &scheme_host_and_port) const
{
    auto timeout = std::chrono::milliseconds(http_params.timeout);

    auto c = std::make_unique<httplib::Client>(scheme_host_and_port);
    c->set_follow_location(false);
    c->set_keep_alive(http_params.keep_alive);
    c->enable_server_certificate_verification(true);
    c->set_write_timeout(timeout);
    c->set_read_timeout(timeout);
    c->set_connection_timeout(timeout);
    return c;
}

} // namespace spotmcp
