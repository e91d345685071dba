#include "storekit/storage/backend.hpp"
#include "storekit/core/constants.hpp"
#include "storekit/core/log.hpp"
#include "storekit/net/http.hpp"
#include "storekit/storage/credentials.hpp"
#include "storekit/storage/filesystem.hpp"
#include "storekit/storage/object_store.hpp"
#include "storekit/storage/request_signer.hpp"

#include <charconv>
#include <stdexcept>
#include <system_error>
#include <vector>

namespace storekit {

StorageError read_all(ObjectReader& reader, std::vector<uint8_t>& out) {
    std::vector<uint8_t> chunk(constants::DEFAULT_COPY_BUFFER_SIZE);
    while (true) {
        auto result = reader.read(chunk);
        if (result.error) {
            return result.error;
        }
        if (result.eof) {
            return {};
        }
        out.insert(out.end(), chunk.begin(), chunk.begin() + static_cast<std::ptrdiff_t>(result.bytes));
    }
}

// ============================================================================
// StorageBackendFactory implementation
// ============================================================================

namespace {

bool parse_bool_param(const std::string& name, const std::string& value) {
    if (value == "true" || value == "1") return true;
    if (value == "false" || value == "0") return false;
    throw std::runtime_error("Invalid boolean for '" + name + "': " + value);
}

uint32_t parse_seconds_param(const std::string& name, const std::string& value) {
    uint32_t result = 0;
    auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), result);
    if (value.empty() || ec != std::errc() || ptr != value.data() + value.size()) {
        throw std::runtime_error("Invalid number of seconds for '" + name + "': " + value);
    }
    return result;
}

}  // namespace

std::unique_ptr<StorageBackend> StorageBackendFactory::create(
    const std::string& type,
    const std::map<std::string, std::string>& config,
    MetricsExporter* metrics) {

    if (type == "filesystem") {
        auto it = config.find("path");
        if (it == config.end() || it->second.empty()) {
            throw std::runtime_error("Filesystem backend requires 'path' config");
        }
        return create_filesystem(it->second);
    }

    if (type == "s3") {
        auto it = config.find("bucket_endpoint");
        if (it == config.end() || it->second.empty()) {
            throw std::runtime_error("S3 backend requires 'bucket_endpoint' config");
        }
        std::string bucket_endpoint = it->second;

        std::string region;
        if ((it = config.find("region")) != config.end()) {
            region = it->second;
        }

        net::HttpClientConfig http_config;
        http_config.default_connect_timeout =
            std::chrono::seconds(constants::DEFAULT_CONNECT_TIMEOUT_SECONDS);
        http_config.default_total_timeout =
            std::chrono::seconds(constants::DEFAULT_REQUEST_TIMEOUT_SECONDS);
        if ((it = config.find("verify_ssl")) != config.end()) {
            http_config.verify_ssl = parse_bool_param("verify_ssl", it->second);
        }
        if ((it = config.find("ca_cert_path")) != config.end()) {
            http_config.ca_bundle_path = it->second;
        }
        if ((it = config.find("connect_timeout")) != config.end()) {
            http_config.default_connect_timeout =
                std::chrono::seconds(parse_seconds_param("connect_timeout", it->second));
        }
        if ((it = config.find("request_timeout")) != config.end()) {
            http_config.default_total_timeout =
                std::chrono::seconds(parse_seconds_param("request_timeout", it->second));
        }
        http_config.verbose = verbose_enabled();

        // Configured keys win; otherwise the environment is read per request
        std::shared_ptr<const CredentialSource> credentials;
        auto access_it = config.find("access_key");
        if (access_it != config.end() && !access_it->second.empty()) {
            std::string_view secret;
            if (auto secret_it = config.find("secret_key"); secret_it != config.end()) {
                secret = secret_it->second;
            }
            credentials = std::make_shared<StaticCredentialSource>(access_it->second, secret);
        } else {
            credentials = std::make_shared<EnvironmentCredentialSource>();
        }

        return create_object_store(bucket_endpoint, std::move(credentials), region,
                                   http_config, metrics);
    }

    throw std::runtime_error("Unknown storage backend type: " + type);
}

std::unique_ptr<StorageBackend> StorageBackendFactory::create_filesystem(
    const std::filesystem::path& root_path) {
    log_debug("Filesystem backend rooted at %s", root_path.c_str());
    return std::make_unique<FilesystemBackend>(root_path);
}

std::unique_ptr<StorageBackend> StorageBackendFactory::create_object_store(
    const std::string& bucket_endpoint,
    std::shared_ptr<const CredentialSource> credentials,
    const std::string& region,
    const net::HttpClientConfig& http_config,
    MetricsExporter* metrics) {

    auto transport = std::make_shared<net::HttpClient>(http_config);
    auto signer = std::make_shared<RequestSigner>(credentials, region);

    log_debug("Object store backend at %s (region %s, %s credentials)",
              bucket_endpoint.c_str(), region.empty() ? "from host" : region.c_str(),
              credentials->describe().c_str());
    return std::make_unique<ObjectStoreBackend>(bucket_endpoint, std::move(signer),
                                                std::move(transport), metrics);
}

}  // namespace storekit
