#pragma once

#include "storekit/net/http.hpp"
#include "storekit/storage/credentials.hpp"
#include "storekit/storage/error.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace storekit {

struct SignResult {
    net::HttpRequest request;
    StorageError error;
};

// Join a bucket endpoint and an object path with exactly one '/' between
// them. The path is percent-encoded with '/' kept; an empty path yields the
// endpoint itself.
std::string join_object_url(const std::string& bucket_endpoint, const std::string& object_path);

// Signing region implied by an AWS endpoint host (s3.<region>.amazonaws.com,
// s3-<region>.amazonaws.com, <bucket>.s3.<region>.amazonaws.com). Falls back
// to us-east-1.
std::string region_from_host(const std::string& host);

// Builds signed object-store requests. Credentials are looked up on every
// call. The underlying signing routine is not safe for concurrent use, so it
// runs under a mutex owned by the signer; the network round trip happens
// outside of it.
class RequestSigner {
public:
    using Clock = std::function<std::chrono::system_clock::time_point()>;

    // An empty region is derived from each request's host
    explicit RequestSigner(std::shared_ptr<const CredentialSource> credentials,
                           std::string region = "");

    RequestSigner(const RequestSigner&) = delete;
    RequestSigner& operator=(const RequestSigner&) = delete;

    // Configuration error when the access key id or secret is missing
    StorageError check_credentials() const;

    // Build and sign a request for bucket_endpoint + object_path
    SignResult sign(net::HttpMethod method,
                    const std::string& bucket_endpoint,
                    const std::string& object_path,
                    std::vector<uint8_t> body = {}) const;

    // Sign a request the caller has prepared, e.g. one with a query string
    StorageError sign(net::HttpRequest& request) const;

    // Override the signing time source (defaults to the system clock)
    void set_clock(Clock clock) { clock_ = std::move(clock); }

private:
    std::shared_ptr<const CredentialSource> credentials_;
    std::string region_;
    Clock clock_;

    mutable std::mutex sign_mutex_;
};

} // namespace storekit
