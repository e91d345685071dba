#include "storekit/net/http.hpp"
#include <curl/curl.h>
#include <openssl/crypto.h>
#include <openssl/hmac.h>
#include <openssl/sha.h>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstring>
#include <ctime>
#include <iomanip>
#include <mutex>
#include <set>
#include <sstream>

namespace storekit::net {

// ============================================================================
// Utility functions
// ============================================================================

const char* http_method_to_string(HttpMethod method) {
    switch (method) {
        case HttpMethod::GET: return "GET";
        case HttpMethod::PUT: return "PUT";
    }
    return "GET";
}

bool is_success_status(int status) {
    return status >= 200 && status < 300;
}

static bool is_unreserved(unsigned char c) {
    return std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~';
}

static std::string percent_encode(const std::string& str, bool keep_slash) {
    std::ostringstream encoded;
    encoded << std::hex << std::uppercase;

    for (unsigned char c : str) {
        if (is_unreserved(c) || (keep_slash && c == '/')) {
            encoded << c;
        } else {
            encoded << '%' << std::setw(2) << std::setfill('0') << static_cast<int>(c);
        }
    }

    return encoded.str();
}

std::string url_encode(const std::string& str) {
    return percent_encode(str, false);
}

std::string url_encode_path(const std::string& str) {
    return percent_encode(str, true);
}

static int hex_digit(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    return -1;
}

std::string url_decode(const std::string& str) {
    std::string decoded;
    decoded.reserve(str.size());

    for (size_t i = 0; i < str.size(); ++i) {
        if (str[i] == '%' && i + 2 < str.size()) {
            int h1 = hex_digit(str[i + 1]);
            int h2 = hex_digit(str[i + 2]);
            if (h1 >= 0 && h2 >= 0) {
                decoded += static_cast<char>((h1 << 4) | h2);
                i += 2;
                continue;
            }
        } else if (str[i] == '+') {
            decoded += ' ';
            continue;
        }
        decoded += str[i];
    }

    return decoded;
}

// ============================================================================
// HttpHeaders
// ============================================================================

std::string HttpHeaders::normalize_name(const std::string& name) {
    std::string result = name;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return result;
}

void HttpHeaders::set(const std::string& name, const std::string& value) {
    headers_[normalize_name(name)] = {value};
}

void HttpHeaders::add(const std::string& name, const std::string& value) {
    headers_[normalize_name(name)].push_back(value);
}

void HttpHeaders::remove(const std::string& name) {
    headers_.erase(normalize_name(name));
}

std::optional<std::string> HttpHeaders::get(const std::string& name) const {
    auto it = headers_.find(normalize_name(name));
    if (it != headers_.end() && !it->second.empty()) {
        return it->second[0];
    }
    return std::nullopt;
}

bool HttpHeaders::has(const std::string& name) const {
    return headers_.find(normalize_name(name)) != headers_.end();
}

std::vector<HttpHeaders::HeaderPair> HttpHeaders::all() const {
    std::vector<HeaderPair> result;
    for (const auto& [name, values] : headers_) {
        for (const auto& value : values) {
            result.emplace_back(name, value);
        }
    }
    return result;
}

// ============================================================================
// HttpRequest / HttpResponse
// ============================================================================

HttpRequest HttpRequest::get(const std::string& url) {
    HttpRequest req;
    req.method = HttpMethod::GET;
    req.url = url;
    return req;
}

HttpRequest HttpRequest::put(const std::string& url, std::vector<uint8_t> body) {
    HttpRequest req;
    req.method = HttpMethod::PUT;
    req.url = url;
    req.body = std::move(body);
    return req;
}

std::string HttpResponse::body_string() const {
    return std::string(body.begin(), body.end());
}

// ============================================================================
// ParsedUrl
// ============================================================================

std::optional<ParsedUrl> ParsedUrl::parse(const std::string& url) {
    ParsedUrl result;

    size_t scheme_end = url.find("://");
    if (scheme_end == std::string::npos || scheme_end == 0) {
        return std::nullopt;
    }
    result.scheme = url.substr(0, scheme_end);
    std::transform(result.scheme.begin(), result.scheme.end(), result.scheme.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    size_t pos = scheme_end + 3;

    // Userinfo is accepted but dropped
    size_t at_pos = url.find('@', pos);
    size_t slash_pos = url.find('/', pos);
    if (at_pos != std::string::npos && (slash_pos == std::string::npos || at_pos < slash_pos)) {
        pos = at_pos + 1;
    }

    size_t host_end = url.find_first_of("/?#", pos);
    if (host_end == std::string::npos) {
        host_end = url.size();
    }

    std::string host_port = url.substr(pos, host_end - pos);
    if (host_port.empty()) {
        return std::nullopt;
    }

    if (host_port.front() == '[') {
        size_t bracket_end = host_port.find(']');
        if (bracket_end == std::string::npos) {
            return std::nullopt;
        }
        result.host = host_port.substr(0, bracket_end + 1);
        if (bracket_end + 1 < host_port.size() && host_port[bracket_end + 1] == ':') {
            try {
                result.port = std::stoi(host_port.substr(bracket_end + 2));
            } catch (const std::exception&) {
                return std::nullopt;
            }
        }
    } else if (size_t colon_pos = host_port.rfind(':'); colon_pos != std::string::npos) {
        result.host = host_port.substr(0, colon_pos);
        try {
            result.port = std::stoi(host_port.substr(colon_pos + 1));
        } catch (const std::exception&) {
            return std::nullopt;
        }
    } else {
        result.host = host_port;
    }

    if (result.host.empty()) {
        return std::nullopt;
    }

    pos = host_end;

    if (pos < url.size() && url[pos] == '/') {
        size_t path_end = url.find_first_of("?#", pos);
        if (path_end == std::string::npos) {
            path_end = url.size();
        }
        result.path = url.substr(pos, path_end - pos);
        pos = path_end;
    }

    if (pos < url.size() && url[pos] == '?') {
        size_t query_end = url.find('#', pos);
        if (query_end == std::string::npos) {
            query_end = url.size();
        }
        result.query = url.substr(pos + 1, query_end - pos - 1);
    }

    return result;
}

// ============================================================================
// CurlResponseStream
// ============================================================================

namespace {

// Unread body bytes held before the transfer is paused
constexpr size_t MAX_PENDING_BODY = 1024 * 1024;

class CurlResponseStream : public HttpResponseStream {
public:
    CurlResponseStream(HttpRequest request, const HttpClientConfig& config)
        : request_(std::move(request))
        , config_(config) {}

    ~CurlResponseStream() override {
        close();
    }

    CurlResponseStream(const CurlResponseStream&) = delete;
    CurlResponseStream& operator=(const CurlResponseStream&) = delete;

    // Configure handles and register with the multi handle.
    // Returns error message or empty string on success.
    std::string start() {
        static std::once_flag curl_init_flag;
        std::call_once(curl_init_flag, []() {
            curl_global_init(CURL_GLOBAL_ALL);
        });

        easy_ = curl_easy_init();
        if (!easy_) {
            return "Failed to create CURL handle";
        }

        curl_easy_setopt(easy_, CURLOPT_URL, request_.url.c_str());
        curl_easy_setopt(easy_, CURLOPT_NOSIGNAL, 1L);

        switch (request_.method) {
            case HttpMethod::GET:
                curl_easy_setopt(easy_, CURLOPT_HTTPGET, 1L);
                break;
            case HttpMethod::PUT:
                curl_easy_setopt(easy_, CURLOPT_UPLOAD, 1L);
                curl_easy_setopt(easy_, CURLOPT_READFUNCTION, &CurlResponseStream::on_upload);
                curl_easy_setopt(easy_, CURLOPT_READDATA, this);
                // Explicit length, also for empty bodies (avoids HTTP 411)
                curl_easy_setopt(easy_, CURLOPT_INFILESIZE_LARGE,
                                 static_cast<curl_off_t>(request_.body.size()));
                break;
        }

        for (const auto& [name, value] : request_.headers.all()) {
            std::string header = name + ": " + value;
            header_list_ = curl_slist_append(header_list_, header.c_str());
        }
        if (request_.method == HttpMethod::PUT) {
            // Send the body straight away instead of waiting on 100-continue
            header_list_ = curl_slist_append(header_list_, "Expect:");
        }
        if (header_list_) {
            curl_easy_setopt(easy_, CURLOPT_HTTPHEADER, header_list_);
        }

        if (!config_.user_agent.empty()) {
            curl_easy_setopt(easy_, CURLOPT_USERAGENT, config_.user_agent.c_str());
        }

        curl_easy_setopt(easy_, CURLOPT_WRITEFUNCTION, &CurlResponseStream::on_body);
        curl_easy_setopt(easy_, CURLOPT_WRITEDATA, this);
        curl_easy_setopt(easy_, CURLOPT_HEADERFUNCTION, &CurlResponseStream::on_header);
        curl_easy_setopt(easy_, CURLOPT_HEADERDATA, this);

        curl_easy_setopt(easy_, CURLOPT_CONNECTTIMEOUT_MS,
                         static_cast<long>(request_.connect_timeout.count()));
        if (request_.total_timeout.count() > 0) {
            curl_easy_setopt(easy_, CURLOPT_TIMEOUT_MS,
                             static_cast<long>(request_.total_timeout.count()));
        }

        // The object store corrupts subsequent reads on a reused connection
        curl_easy_setopt(easy_, CURLOPT_FORBID_REUSE, 1L);
        curl_easy_setopt(easy_, CURLOPT_FRESH_CONNECT, 1L);

        if (config_.verify_ssl) {
            curl_easy_setopt(easy_, CURLOPT_SSL_VERIFYPEER, 1L);
            curl_easy_setopt(easy_, CURLOPT_SSL_VERIFYHOST, 2L);
        } else {
            curl_easy_setopt(easy_, CURLOPT_SSL_VERIFYPEER, 0L);
            curl_easy_setopt(easy_, CURLOPT_SSL_VERIFYHOST, 0L);
        }
        if (!config_.ca_bundle_path.empty()) {
            curl_easy_setopt(easy_, CURLOPT_CAINFO, config_.ca_bundle_path.c_str());
        }

        if (config_.verbose) {
            curl_easy_setopt(easy_, CURLOPT_VERBOSE, 1L);
        }

        multi_ = curl_multi_init();
        if (!multi_) {
            return "Failed to create CURL multi handle";
        }
        CURLMcode mc = curl_multi_add_handle(multi_, easy_);
        if (mc != CURLM_OK) {
            return curl_multi_strerror(mc);
        }
        return {};
    }

    // Drive the transfer until the final status line and headers are in.
    std::string wait_for_headers() {
        while (!headers_done_ && pump()) {
        }
        if (headers_done_) {
            return {};
        }
        if (!error_.empty()) {
            return error_;
        }
        return "Connection closed before response headers were received";
    }

    int status_code() const override { return status_code_; }
    const HttpHeaders& headers() const override { return headers_; }
    const std::string& error() const override { return error_; }

    size_t read(uint8_t* buffer, size_t len) override {
        if (len == 0) return 0;

        while (pending_pos_ == pending_.size()) {
            pending_.clear();
            pending_pos_ = 0;
            if (!easy_) {
                return 0;
            }
            if (paused_) {
                // Unpausing may deliver the held chunk synchronously
                paused_ = false;
                curl_easy_pause(easy_, CURLPAUSE_CONT);
                continue;
            }
            if (finished_) {
                return 0;
            }
            pump();
        }

        size_t n = std::min(len, pending_.size() - pending_pos_);
        std::memcpy(buffer, pending_.data() + pending_pos_, n);
        pending_pos_ += n;
        return n;
    }

    void close() override {
        if (multi_ && easy_) {
            curl_multi_remove_handle(multi_, easy_);
        }
        if (easy_) {
            curl_easy_cleanup(easy_);
            easy_ = nullptr;
        }
        if (multi_) {
            curl_multi_cleanup(multi_);
            multi_ = nullptr;
        }
        if (header_list_) {
            curl_slist_free_all(header_list_);
            header_list_ = nullptr;
        }
        finished_ = true;
        pending_.clear();
        pending_pos_ = 0;
    }

private:
    // Advance the transfer one step. Returns false once it has finished.
    bool pump() {
        if (finished_ || !multi_) return false;

        int running = 0;
        CURLMcode mc = curl_multi_perform(multi_, &running);
        if (mc != CURLM_OK) {
            error_ = curl_multi_strerror(mc);
            finished_ = true;
            return false;
        }

        if (running == 0) {
            CURLMsg* msg;
            int msgs_left;
            while ((msg = curl_multi_info_read(multi_, &msgs_left))) {
                if (msg->msg == CURLMSG_DONE && msg->data.result != CURLE_OK) {
                    error_ = curl_easy_strerror(msg->data.result);
                }
            }
            finished_ = true;
            return false;
        }

        int numfds = 0;
        mc = curl_multi_wait(multi_, nullptr, 0, 1000, &numfds);
        if (mc != CURLM_OK) {
            error_ = curl_multi_strerror(mc);
            finished_ = true;
            return false;
        }
        return true;
    }

    static size_t on_header(char* buffer, size_t size, size_t nitems, void* userdata) {
        auto* self = static_cast<CurlResponseStream*>(userdata);
        size_t bytes = size * nitems;

        std::string line(buffer, bytes);
        while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) {
            line.pop_back();
        }

        if (line.starts_with("HTTP/")) {
            // New status line: 1xx interim responses precede the final one
            self->headers_.clear();
            self->status_code_ = 0;
            size_t space = line.find(' ');
            if (space != std::string::npos) {
                try {
                    self->status_code_ = std::stoi(line.substr(space + 1, 3));
                } catch (const std::exception&) {
                    self->status_code_ = 0;
                }
            }
            return bytes;
        }

        if (line.empty()) {
            if (self->status_code_ >= 200) {
                self->headers_done_ = true;
            }
            return bytes;
        }

        size_t colon = line.find(':');
        if (colon != std::string::npos) {
            std::string name = line.substr(0, colon);
            std::string value = line.substr(colon + 1);
            size_t start = value.find_first_not_of(" \t");
            value = start == std::string::npos ? "" : value.substr(start);
            self->headers_.add(name, value);
        }
        return bytes;
    }

    static size_t on_body(char* ptr, size_t size, size_t nmemb, void* userdata) {
        auto* self = static_cast<CurlResponseStream*>(userdata);
        size_t bytes = size * nmemb;

        if (self->pending_.size() - self->pending_pos_ >= MAX_PENDING_BODY) {
            self->paused_ = true;
            return CURL_WRITEFUNC_PAUSE;
        }

        if (self->pending_pos_ > 0 && self->pending_pos_ == self->pending_.size()) {
            self->pending_.clear();
            self->pending_pos_ = 0;
        }
        self->pending_.insert(self->pending_.end(), ptr, ptr + bytes);
        return bytes;
    }

    static size_t on_upload(char* buffer, size_t size, size_t nitems, void* userdata) {
        auto* self = static_cast<CurlResponseStream*>(userdata);
        size_t max_bytes = size * nitems;
        size_t remaining = self->request_.body.size() - self->upload_pos_;
        size_t to_copy = std::min(max_bytes, remaining);

        if (to_copy > 0) {
            std::memcpy(buffer, self->request_.body.data() + self->upload_pos_, to_copy);
            self->upload_pos_ += to_copy;
        }
        return to_copy;
    }

    HttpRequest request_;
    HttpClientConfig config_;

    CURL* easy_ = nullptr;
    CURLM* multi_ = nullptr;
    struct curl_slist* header_list_ = nullptr;
    size_t upload_pos_ = 0;

    int status_code_ = 0;
    HttpHeaders headers_;
    bool headers_done_ = false;

    std::vector<uint8_t> pending_;
    size_t pending_pos_ = 0;
    bool paused_ = false;
    bool finished_ = false;
    std::string error_;
};

} // namespace

// ============================================================================
// HttpClient
// ============================================================================

HttpClient::HttpClient(const HttpClientConfig& config)
    : config_(config) {}

HttpClient::~HttpClient() = default;

HttpStreamResult HttpClient::open(HttpRequest request) {
    HttpStreamResult result;

    if (request.connect_timeout.count() == 0) {
        request.connect_timeout = config_.default_connect_timeout;
    }
    if (request.total_timeout.count() == 0) {
        request.total_timeout = config_.default_total_timeout;
    }

    auto stream = std::make_unique<CurlResponseStream>(std::move(request), config_);
    std::string err = stream->start();
    if (err.empty()) {
        err = stream->wait_for_headers();
    }
    if (!err.empty()) {
        result.error = err;
        return result;
    }

    result.stream = std::move(stream);
    return result;
}

HttpResponse HttpClient::execute(HttpRequest request) {
    HttpResponse response;

    auto opened = open(std::move(request));
    if (!opened.stream) {
        response.error = opened.error;
        response.is_network_error = true;
        return response;
    }

    auto& stream = *opened.stream;
    response.status_code = stream.status_code();
    response.headers = stream.headers();

    uint8_t chunk[16 * 1024];
    while (size_t n = stream.read(chunk, sizeof(chunk))) {
        if (config_.max_response_size > 0 &&
            response.body.size() + n > config_.max_response_size) {
            response.error = "Response body exceeded maximum size limit of " +
                             std::to_string(config_.max_response_size) + " bytes";
            response.status_code = 413;  // Payload Too Large
            stream.close();
            return response;
        }
        response.body.insert(response.body.end(), chunk, chunk + n);
    }

    if (!stream.error().empty()) {
        response.error = stream.error();
        response.is_network_error = true;
    }
    stream.close();
    return response;
}

// ============================================================================
// AwsSigV4Signer
// ============================================================================

AwsSigV4Signer::AwsSigV4Signer(const std::string& access_key_id,
                               const SecureString& secret_access_key,
                               const std::string& region,
                               const std::string& service)
    : access_key_id_(access_key_id)
    , secret_access_key_(secret_access_key)
    , region_(region)
    , service_(service) {}

static std::string to_hex(const unsigned char* data, size_t len) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (size_t i = 0; i < len; ++i) {
        oss << std::setw(2) << static_cast<int>(data[i]);
    }
    return oss.str();
}

static std::string sha256_hex(const unsigned char* data, size_t len) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(data, len, hash);
    return to_hex(hash, SHA256_DIGEST_LENGTH);
}

static std::string sha256_hex(const std::string& data) {
    return sha256_hex(reinterpret_cast<const unsigned char*>(data.data()), data.size());
}

static std::vector<uint8_t> hmac_sha256(const std::vector<uint8_t>& key,
                                        const std::string& data) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    unsigned int hash_len = 0;

    HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()),
         reinterpret_cast<const unsigned char*>(data.data()), data.size(),
         hash, &hash_len);

    std::vector<uint8_t> result(hash, hash + hash_len);
    OPENSSL_cleanse(hash, sizeof(hash));
    return result;
}

static void cleanse(std::vector<uint8_t>& key) {
    OPENSSL_cleanse(key.data(), key.size());
}

static std::string format_utc(std::chrono::system_clock::time_point tp, const char* fmt) {
    auto time = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    gmtime_r(&time, &tm);

    std::ostringstream oss;
    oss << std::put_time(&tm, fmt);
    return oss.str();
}

// Query params are already URL-encoded in the URL, so they only need sorting,
// with valueless params written as "key="
static std::string build_canonical_query_string(const std::string& query) {
    if (query.empty()) {
        return "";
    }

    std::map<std::string, std::string> params;
    size_t pos = 0;
    while (pos < query.size()) {
        size_t amp = query.find('&', pos);
        if (amp == std::string::npos) amp = query.size();

        std::string param = query.substr(pos, amp - pos);
        size_t eq = param.find('=');
        if (eq != std::string::npos) {
            params[param.substr(0, eq)] = param.substr(eq + 1);
        } else if (!param.empty()) {
            params[param] = "";
        }
        pos = amp + 1;
    }

    std::ostringstream oss;
    bool first = true;
    for (const auto& [key, value] : params) {
        if (!first) oss << "&";
        oss << key << "=" << value;
        first = false;
    }
    return oss.str();
}

std::string AwsSigV4Signer::get_canonical_request(const HttpRequest& request,
                                                  const std::string& signed_headers,
                                                  const std::string& payload_hash) const {
    auto url = ParsedUrl::parse(request.url);
    if (!url) return "";

    std::ostringstream oss;

    oss << http_method_to_string(request.method) << "\n";
    oss << (url->path.empty() ? "/" : url->path) << "\n";
    oss << build_canonical_query_string(url->query) << "\n";

    // all() yields lowercase names in sorted order
    for (const auto& [name, value] : request.headers.all()) {
        oss << name << ":" << value << "\n";
    }
    oss << "\n";

    oss << signed_headers << "\n";
    oss << payload_hash;

    return oss.str();
}

std::string AwsSigV4Signer::get_string_to_sign(const std::string& datetime,
                                               const std::string& date,
                                               const std::string& canonical_request) const {
    std::ostringstream oss;
    oss << "AWS4-HMAC-SHA256\n";
    oss << datetime << "\n";
    oss << date << "/" << region_ << "/" << service_ << "/aws4_request\n";
    oss << sha256_hex(canonical_request);
    return oss.str();
}

std::string AwsSigV4Signer::calculate_signature(const std::string& date,
                                                const std::string& string_to_sign) const {
    // Every intermediate key is derived from the secret and wiped after use
    std::string_view secret = secret_access_key_.view();
    std::vector<uint8_t> k_secret;
    k_secret.reserve(4 + secret.size());
    k_secret.insert(k_secret.end(), {'A', 'W', 'S', '4'});
    k_secret.insert(k_secret.end(), secret.begin(), secret.end());

    auto k_date = hmac_sha256(k_secret, date);
    cleanse(k_secret);
    auto k_region = hmac_sha256(k_date, region_);
    cleanse(k_date);
    auto k_service = hmac_sha256(k_region, service_);
    cleanse(k_region);
    auto k_signing = hmac_sha256(k_service, "aws4_request");
    cleanse(k_service);

    auto signature = hmac_sha256(k_signing, string_to_sign);
    cleanse(k_signing);
    return to_hex(signature.data(), signature.size());
}

bool AwsSigV4Signer::sign(HttpRequest& request) const {
    return sign(request, std::chrono::system_clock::now());
}

bool AwsSigV4Signer::sign(HttpRequest& request,
                          std::chrono::system_clock::time_point now) const {
    auto url = ParsedUrl::parse(request.url);
    if (!url) return false;

    std::string datetime = format_utc(now, "%Y%m%dT%H%M%SZ");
    std::string date = format_utc(now, "%Y%m%d");

    std::string host = url->host;
    if (url->port != 0) {
        host += ":" + std::to_string(url->port);
    }
    request.headers.remove("Authorization");
    request.headers.set("Host", host);
    request.headers.set("X-Amz-Date", datetime);

    std::string payload_hash = sha256_hex(request.body.data(), request.body.size());
    request.headers.set("X-Amz-Content-Sha256", payload_hash);

    std::string signed_headers;
    std::string previous;
    for (const auto& [name, value] : request.headers.all()) {
        if (name == previous) continue;
        if (!signed_headers.empty()) signed_headers += ";";
        signed_headers += name;
        previous = name;
    }

    std::string canonical_request = get_canonical_request(request, signed_headers, payload_hash);
    std::string string_to_sign = get_string_to_sign(datetime, date, canonical_request);
    std::string signature = calculate_signature(date, string_to_sign);

    std::ostringstream auth;
    auth << "AWS4-HMAC-SHA256 ";
    auth << "Credential=" << access_key_id_ << "/" << date << "/" << region_ << "/"
         << service_ << "/aws4_request, ";
    auth << "SignedHeaders=" << signed_headers << ", ";
    auth << "Signature=" << signature;

    request.headers.set("Authorization", auth.str());
    return true;
}

} // namespace storekit::net
