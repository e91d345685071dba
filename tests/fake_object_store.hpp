// In-memory object store speaking just enough of the S3 REST protocol for
// the backend tests: PUT and GET of objects under one bucket, and a single
// page of ListBucketResult. Every request is recorded.

#pragma once

#include "storekit/core/constants.hpp"
#include "storekit/net/http.hpp"

#include <algorithm>
#include <cstring>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace storekit::testing {

class FakeObjectStore : public net::HttpTransport {
public:
    // bucket_path is the path segment of the bucket endpoint, e.g. "/bucket"
    explicit FakeObjectStore(std::string bucket_path)
        : bucket_path_(std::move(bucket_path)) {}

    net::HttpResponse execute(net::HttpRequest request) override {
        requests.push_back(request);

        net::HttpResponse response;
        if (fail_transport) {
            response.error = "Couldn't connect to server";
            response.is_network_error = true;
            return response;
        }

        auto url = net::ParsedUrl::parse(request.url);
        if (!url) {
            response.status_code = 400;
            return response;
        }

        if (request.method == net::HttpMethod::PUT) {
            if (put_status != 200) {
                response.status_code = put_status;
                set_body(response, error_xml(put_status == 403 ? "AccessDenied" : "InternalError"));
                return response;
            }
            objects[key_from_path(url->path)] = std::string(request.body.begin(), request.body.end());
            response.status_code = 200;
            return response;
        }

        if (request.method == net::HttpMethod::GET && is_listing(url->query)) {
            if (list_status != 200) {
                response.status_code = list_status;
                set_body(response, error_xml("InternalError"));
                return response;
            }
            response.status_code = 200;
            set_body(response, list_body_override.empty() ? listing(url->query) : list_body_override);
            return response;
        }

        if (request.method == net::HttpMethod::GET) {
            auto it = objects.find(key_from_path(url->path));
            if (it == objects.end()) {
                response.status_code = 404;
                set_body(response, error_xml("NoSuchKey"));
                return response;
            }
            response.status_code = 200;
            set_body(response, it->second);
            return response;
        }

        response.status_code = 405;
        return response;
    }

    net::HttpStreamResult open(net::HttpRequest request) override {
        net::HttpStreamResult result;
        auto response = execute(std::move(request));
        if (response.is_network_error) {
            result.error = response.error;
            return result;
        }
        result.stream = std::make_unique<Stream>(std::move(response), streams_closed);
        return result;
    }

    // Store an object without going through a request
    void put_object(const std::string& key, const std::string& data) {
        objects[key] = data;
    }

    size_t count(net::HttpMethod method) const {
        return static_cast<size_t>(std::count_if(requests.begin(), requests.end(),
            [method](const net::HttpRequest& r) { return r.method == method; }));
    }

    std::map<std::string, std::string> objects;
    std::vector<net::HttpRequest> requests;
    std::shared_ptr<int> streams_closed = std::make_shared<int>(0);

    // Failure injection
    bool fail_transport = false;
    int put_status = 200;
    int list_status = 200;
    std::string list_body_override;

private:
    // Serves the body in small pieces so callers must loop
    class Stream : public net::HttpResponseStream {
    public:
        Stream(net::HttpResponse response, std::shared_ptr<int> closed_counter)
            : response_(std::move(response))
            , closed_counter_(std::move(closed_counter)) {}

        int status_code() const override { return response_.status_code; }
        const net::HttpHeaders& headers() const override { return response_.headers; }
        const std::string& error() const override { return error_; }

        size_t read(uint8_t* buffer, size_t len) override {
            if (closed_) return 0;
            size_t n = std::min({len, size_t{2}, response_.body.size() - pos_});
            std::memcpy(buffer, response_.body.data() + pos_, n);
            pos_ += n;
            return n;
        }

        void close() override {
            if (!closed_) {
                closed_ = true;
                ++*closed_counter_;
            }
        }

    private:
        net::HttpResponse response_;
        std::shared_ptr<int> closed_counter_;
        std::string error_;
        size_t pos_ = 0;
        bool closed_ = false;
    };

    static void set_body(net::HttpResponse& response, const std::string& body) {
        response.body.assign(body.begin(), body.end());
        response.headers.set("Content-Length", std::to_string(body.size()));
    }

    static bool is_listing(const std::string& query) {
        return query == "prefix" || query.starts_with("prefix=");
    }

    static std::string escape(const std::string& s) {
        std::string out;
        for (char c : s) {
            switch (c) {
                case '&': out += "&amp;"; break;
                case '<': out += "&lt;"; break;
                case '>': out += "&gt;"; break;
                default: out += c;
            }
        }
        return out;
    }

    static std::string error_xml(const std::string& code) {
        return "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n<Error><Code>" + code +
               "</Code><Message>" + code + "</Message></Error>";
    }

    std::string key_from_path(const std::string& path) const {
        std::string rest = path.substr(std::min(path.size(), bucket_path_.size()));
        if (!rest.empty() && rest.front() == '/') rest.erase(0, 1);
        return net::url_decode(rest);
    }

    std::string listing(const std::string& query) const {
        std::string prefix;
        if (query.size() > 7) prefix = net::url_decode(query.substr(7));

        std::vector<std::pair<std::string, std::string>> matched;
        bool truncated = false;
        for (const auto& [key, data] : objects) {
            if (!key.starts_with(prefix)) continue;
            if (matched.size() == constants::LIST_MAX_KEYS) {
                truncated = true;
                break;
            }
            matched.emplace_back(key, data);
        }

        std::string xml = "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
                          "<ListBucketResult xmlns=\"http://s3.amazonaws.com/doc/2006-03-01/\">"
                          "<Name>bucket</Name><Prefix>" + escape(prefix) + "</Prefix>"
                          "<MaxKeys>1000</MaxKeys><IsTruncated>" +
                          std::string(truncated ? "true" : "false") + "</IsTruncated>";
        for (const auto& [key, data] : matched) {
            xml += "<Contents><Key>" + escape(key) + "</Key>"
                   "<LastModified>2024-01-15T10:30:00.000Z</LastModified>"
                   "<ETag>&quot;0&quot;</ETag><Size>" + std::to_string(data.size()) + "</Size>"
                   "<StorageClass>STANDARD</StorageClass></Contents>";
        }
        xml += "</ListBucketResult>";
        return xml;
    }

    std::string bucket_path_;
};

}  // namespace storekit::testing
