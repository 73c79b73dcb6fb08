/**
 * @file http_client.h
 * @brief HTTP transport seam and its libcurl implementation.
 */

#pragma once

#include <string>
#include <vector>
#include <utility>

namespace tradegate::nethttp {

struct Header { std::string name; std::string value; };

struct HttpOptions {
    long connect_timeout_ms{3000};
    long total_timeout_ms{10000};
    std::string user_agent{"tradegate/1.0"};
};

/**
 * @class IHttpClient
 * @brief Blocking request/response transport.
 *
 * Implementations must be safe to share across concurrent executions.
 * Throws TransportError when no response was received and HttpStatusError
 * for status >= 400.
 */
class IHttpClient {
public:
    virtual ~IHttpClient() = default;

    virtual std::string request(const std::string& method,
                                const std::string& url,
                                const std::vector<Header>& headers,
                                const std::string& body) const = 0;

    std::string get(const std::string& url, const std::vector<Header>& headers = {}) const {
        return request("GET", url, headers, {});
    }

    std::string post_json(const std::string& url, const std::string& body,
                          std::vector<Header> headers = {}) const {
        headers.push_back({"Content-Type", "application/json"});
        return request("POST", url, headers, body);
    }
};

class HttpClient final : public IHttpClient {
public:
    explicit HttpClient(HttpOptions options = {});

    // One curl easy handle per call; no state is shared between calls.
    std::string request(const std::string& method,
                        const std::string& url,
                        const std::vector<Header>& headers,
                        const std::string& body) const override;

    const HttpOptions& options() const { return options_; }

private:
    HttpOptions options_;
};

// "k1=v1&k2=v2" with values percent-encoded.
std::string build_query(const std::vector<std::pair<std::string, std::string>>& params);

} // namespace tradegate::nethttp
