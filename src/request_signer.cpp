#include "storekit/storage/request_signer.hpp"
#include "storekit/core/constants.hpp"

#include <stdexcept>
#include <string_view>
#include <utility>
#include <vector>

namespace storekit {

std::string join_object_url(const std::string& bucket_endpoint, const std::string& object_path) {
    std::string encoded = net::url_encode_path(object_path);
    if (encoded.empty()) {
        return bucket_endpoint;
    }
    if (!bucket_endpoint.empty() && bucket_endpoint.back() != '/' && encoded.front() != '/') {
        return bucket_endpoint + "/" + encoded;
    }
    return bucket_endpoint + encoded;
}

std::string region_from_host(const std::string& host) {
    constexpr std::string_view aws_suffix = ".amazonaws.com";
    if (host.size() <= aws_suffix.size() || !host.ends_with(aws_suffix)) {
        return constants::DEFAULT_REGION;
    }

    std::vector<std::string> labels;
    size_t pos = 0;
    std::string name = host.substr(0, host.size() - aws_suffix.size());
    while (pos <= name.size()) {
        size_t dot = name.find('.', pos);
        if (dot == std::string::npos) dot = name.size();
        labels.push_back(name.substr(pos, dot - pos));
        pos = dot + 1;
    }

    for (size_t i = 0; i < labels.size(); ++i) {
        const std::string& label = labels[i];
        if (label.starts_with("s3-")) {
            // s3-external-1 is the legacy name of us-east-1
            if (label == "s3-external-1") break;
            return label.substr(3);
        }
        if (label == "s3") {
            size_t j = i + 1;
            if (j < labels.size() && labels[j] == "dualstack") ++j;
            if (j < labels.size() && !labels[j].empty()) {
                return labels[j];
            }
            break;
        }
    }
    return constants::DEFAULT_REGION;
}

RequestSigner::RequestSigner(std::shared_ptr<const CredentialSource> credentials,
                             std::string region)
    : credentials_(std::move(credentials))
    , region_(std::move(region)) {
    if (!credentials_) {
        throw std::invalid_argument("RequestSigner requires a credential source");
    }
}

StorageError RequestSigner::check_credentials() const {
    return credentials_->lookup().error;
}

SignResult RequestSigner::sign(net::HttpMethod method,
                               const std::string& bucket_endpoint,
                               const std::string& object_path,
                               std::vector<uint8_t> body) const {
    SignResult result;
    result.request.method = method;
    result.request.url = join_object_url(bucket_endpoint, object_path);
    result.request.body = std::move(body);
    result.error = sign(result.request);
    return result;
}

StorageError RequestSigner::sign(net::HttpRequest& request) const {
    auto lookup = credentials_->lookup();
    if (lookup.error) {
        return lookup.error;
    }

    auto url = net::ParsedUrl::parse(request.url);
    if (!url) {
        return StorageError::request_construction("Invalid URL: " + request.url);
    }
    if (url->scheme != "http" && url->scheme != "https") {
        return StorageError::request_construction("Unsupported URL scheme: " + url->scheme);
    }

    std::string region = region_.empty() ? region_from_host(url->host) : region_;
    auto now = clock_ ? clock_() : std::chrono::system_clock::now();

    std::lock_guard lock(sign_mutex_);
    net::AwsSigV4Signer signer(lookup.credentials.access_key_id,
                               lookup.credentials.secret_access_key,
                               region,
                               constants::SIGNING_SERVICE);
    if (!signer.sign(request, now)) {
        return StorageError::request_construction("Failed to sign request for " + request.url);
    }
    return {};
}

}  // namespace storekit
