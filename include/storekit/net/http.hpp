#pragma once

#include "storekit/core/secure_string.hpp"

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace storekit::net {

// HTTP methods used against the object store
enum class HttpMethod {
    GET,
    PUT
};

const char* http_method_to_string(HttpMethod method);

bool is_success_status(int status);

// HTTP headers (case-insensitive)
class HttpHeaders {
public:
    void set(const std::string& name, const std::string& value);
    void add(const std::string& name, const std::string& value);
    void remove(const std::string& name);
    void clear() { headers_.clear(); }

    std::optional<std::string> get(const std::string& name) const;
    bool has(const std::string& name) const;

    // Iteration, names lowercased and sorted
    using HeaderPair = std::pair<std::string, std::string>;
    std::vector<HeaderPair> all() const;


private:
    // Headers stored as lowercase name -> values
    std::map<std::string, std::vector<std::string>> headers_;

    static std::string normalize_name(const std::string& name);
};

// HTTP request
struct HttpRequest {
    HttpMethod method = HttpMethod::GET;
    std::string url;
    HttpHeaders headers;
    std::vector<uint8_t> body;

    // Zero means the client's default
    std::chrono::milliseconds connect_timeout{0};
    std::chrono::milliseconds total_timeout{0};

    static HttpRequest get(const std::string& url);
    static HttpRequest put(const std::string& url, std::vector<uint8_t> body);
};

// Fully buffered HTTP response
struct HttpResponse {
    int status_code = 0;
    HttpHeaders headers;
    std::vector<uint8_t> body;

    bool ok() const { return is_success_status(status_code); }
    std::string body_string() const;

    // Error info (for failed requests)
    std::string error;
    bool is_network_error = false;  // True if error was network-level, not HTTP status
};

// Response whose body is pulled from the connection as the caller reads.
// Status and headers are available as soon as open() returns.
class HttpResponseStream {
public:
    virtual ~HttpResponseStream() = default;

    virtual int status_code() const = 0;
    virtual const HttpHeaders& headers() const = 0;

    // Reads up to len bytes of body. Returns 0 at end of body or on failure;
    // a failure leaves error() non-empty.
    virtual size_t read(uint8_t* buffer, size_t len) = 0;
    virtual const std::string& error() const = 0;

    // Abandons the rest of the body and releases the connection.
    virtual void close() = 0;
};

struct HttpStreamResult {
    std::unique_ptr<HttpResponseStream> stream;
    std::string error;  // Transport failure before a status line arrived
};

// The seam between the storage backends and the network.
class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    // Sends the request and buffers the whole response body.
    virtual HttpResponse execute(HttpRequest request) = 0;

    // Sends the request and returns once the response headers are in.
    virtual HttpStreamResult open(HttpRequest request) = 0;
};

// HTTP client configuration
struct HttpClientConfig {
    std::chrono::milliseconds default_connect_timeout{30000};
    std::chrono::milliseconds default_total_timeout{0};  // 0 = no limit

    // Cap for execute(); streamed bodies are never capped. 0 = unlimited
    size_t max_response_size = 100 * 1024 * 1024;

    bool verify_ssl = true;
    std::string ca_bundle_path;  // Empty = system default

    std::string user_agent = "storekit/1.0";

    // Verbose libcurl tracing (for debugging)
    bool verbose = false;
};

// libcurl transport. Every request runs on its own easy handle and its own
// connection; connections are never reused between requests.
class HttpClient : public HttpTransport {
public:
    explicit HttpClient(const HttpClientConfig& config = {});
    ~HttpClient() override;

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    HttpResponse execute(HttpRequest request) override;
    HttpStreamResult open(HttpRequest request) override;

private:
    HttpClientConfig config_;
};

// AWS SigV4 signing routine (used for S3)
class AwsSigV4Signer {
public:
    AwsSigV4Signer(const std::string& access_key_id,
                   const SecureString& secret_access_key,
                   const std::string& region,
                   const std::string& service);

    // Sign a request with the current time
    bool sign(HttpRequest& request) const;

    // Sign a request as of the given time. Returns false when the URL
    // cannot be parsed.
    bool sign(HttpRequest& request, std::chrono::system_clock::time_point now) const;

private:
    std::string access_key_id_;
    SecureString secret_access_key_;
    std::string region_;
    std::string service_;

    std::string get_canonical_request(const HttpRequest& request,
                                      const std::string& signed_headers,
                                      const std::string& payload_hash) const;
    std::string get_string_to_sign(const std::string& datetime,
                                   const std::string& date,
                                   const std::string& canonical_request) const;
    std::string calculate_signature(const std::string& date,
                                    const std::string& string_to_sign) const;
};

// URL parsing helper
struct ParsedUrl {
    std::string scheme;   // http, https
    std::string host;
    int port = 0;         // 0 = default for scheme
    std::string path;
    std::string query;

    static std::optional<ParsedUrl> parse(const std::string& url);
};

// Percent-encoding. url_encode escapes everything but unreserved characters;
// url_encode_path additionally keeps '/'.
std::string url_encode(const std::string& str);
std::string url_encode_path(const std::string& str);
std::string url_decode(const std::string& str);

} // namespace storekit::net
