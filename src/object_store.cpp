#include "storekit/storage/object_store.hpp"
#include "storekit/core/log.hpp"
#include "storekit/metrics.hpp"

#include <optional>
#include <stdexcept>
#include <utility>

namespace storekit {

namespace {

// Reader over a live response body. Nothing is buffered beyond what the
// transport holds between reads.
class HttpObjectReader : public ObjectReader {
public:
    explicit HttpObjectReader(std::unique_ptr<net::HttpResponseStream> stream)
        : stream_(std::move(stream)) {}

    ~HttpObjectReader() override {
        close();
    }

    ReadResult read(std::span<uint8_t> buffer) override {
        ReadResult result;
        if (!stream_) {
            result.eof = true;
            return result;
        }
        if (buffer.empty()) {
            return result;
        }

        result.bytes = stream_->read(buffer.data(), buffer.size());
        if (result.bytes == 0) {
            if (!stream_->error().empty()) {
                result.error = StorageError::transport(stream_->error());
            } else {
                result.eof = true;
            }
        }
        return result;
    }

    void close() override {
        if (stream_) {
            stream_->close();
            stream_.reset();
        }
    }

private:
    std::unique_ptr<net::HttpResponseStream> stream_;
};

void record_operation(MetricsExporter* metrics, const char* op, const StorageError& error) {
    if (metrics) {
        metrics->operations(op, !error).Increment();
    }
}

}  // namespace

// ============================================================================
// BufferedObjectWriter
// ============================================================================

BufferedObjectWriter::BufferedObjectWriter(std::string path,
                                           std::string bucket_endpoint,
                                           std::shared_ptr<const RequestSigner> signer,
                                           std::shared_ptr<net::HttpTransport> transport,
                                           MetricsExporter* metrics)
    : path_(std::move(path))
    , bucket_endpoint_(std::move(bucket_endpoint))
    , signer_(std::move(signer))
    , transport_(std::move(transport))
    , metrics_(metrics) {}

size_t BufferedObjectWriter::write(std::span<const uint8_t> data) {
    if (closed_) {
        return data.size();
    }
    buffer_.insert(buffer_.end(), data.begin(), data.end());
    return data.size();
}

StorageError BufferedObjectWriter::close() {
    if (closed_) {
        return {};
    }
    closed_ = true;

    // Take the buffer so it is released whatever the outcome
    std::vector<uint8_t> payload;
    payload.swap(buffer_);
    size_t payload_size = payload.size();

    std::optional<ScopedTimer> timer;
    if (metrics_) {
        timer.emplace(metrics_->upload_duration());
    }

    auto signed_request = signer_->sign(net::HttpMethod::PUT, bucket_endpoint_, path_,
                                        std::move(payload));
    StorageError error = signed_request.error;
    if (!error) {
        auto response = transport_->execute(std::move(signed_request.request));
        if (response.is_network_error) {
            error = StorageError::transport(response.error);
        } else if (response.status_code != 200) {
            error = StorageError::remote_write(response.status_code, response.body_string());
        }
    }

    record_operation(metrics_, "save", error);
    if (!error) {
        if (metrics_) {
            metrics_->upload_bytes_total().Increment(static_cast<double>(payload_size));
        }
        log_debug("Uploaded %s (%zu bytes)", path_.c_str(), payload_size);
    }
    return error;
}

// ============================================================================
// ObjectStoreBackend
// ============================================================================

std::string normalize_list_prefix(const std::string& prefix) {
    size_t start = prefix.find_first_not_of('/');
    if (start == std::string::npos) {
        return "";
    }
    std::string result = prefix.substr(start);
    while (!result.empty() && result.back() == '/') {
        result.pop_back();
    }
    result += '/';
    return result;
}

ObjectStoreBackend::ObjectStoreBackend(std::string bucket_endpoint,
                                       std::shared_ptr<const RequestSigner> signer,
                                       std::shared_ptr<net::HttpTransport> transport,
                                       MetricsExporter* metrics)
    : bucket_endpoint_(std::move(bucket_endpoint))
    , signer_(std::move(signer))
    , transport_(std::move(transport))
    , metrics_(metrics) {
    if (!signer_ || !transport_) {
        throw std::invalid_argument("ObjectStoreBackend requires a signer and a transport");
    }
}

SaveResult ObjectStoreBackend::save(const std::string& path) {
    SaveResult result;

    result.error = signer_->check_credentials();
    if (result.error) {
        record_operation(metrics_, "save", result.error);
        return result;
    }

    result.writer = std::make_unique<BufferedObjectWriter>(
        path, bucket_endpoint_, signer_, transport_, metrics_);
    return result;
}

FetchResult ObjectStoreBackend::fetch(const std::string& path) {
    FetchResult result;

    auto signed_request = signer_->sign(net::HttpMethod::GET, bucket_endpoint_, path);
    if (signed_request.error) {
        result.error = signed_request.error;
        record_operation(metrics_, "fetch", result.error);
        return result;
    }

    auto opened = transport_->open(std::move(signed_request.request));
    if (!opened.stream) {
        log_error("Fetch of %s failed: %s", path.c_str(), opened.error.c_str());
        result.error = StorageError::transport(opened.error);
    } else if (opened.stream->status_code() != 200) {
        // The body is not read; closing drops the connection
        int status = opened.stream->status_code();
        opened.stream->close();
        result.error = StorageError::remote_read(status);
    } else {
        result.reader = std::make_unique<HttpObjectReader>(std::move(opened.stream));
    }

    record_operation(metrics_, "fetch", result.error);
    return result;
}

ListResult ObjectStoreBackend::list(const std::string& prefix) const {
    ListResult result;

    std::optional<ScopedTimer> timer;
    if (metrics_) {
        timer.emplace(metrics_->list_duration());
    }

    std::string normalized = normalize_list_prefix(prefix);

    net::HttpRequest request;
    request.method = net::HttpMethod::GET;
    request.url = join_object_url(bucket_endpoint_, "") + "?prefix=" + net::url_encode(normalized);

    result.error = signer_->sign(request);
    if (result.error) {
        record_operation(metrics_, "list", result.error);
        return result;
    }

    auto response = transport_->execute(std::move(request));
    if (response.is_network_error) {
        result.error = StorageError::transport(response.error);
    } else if (response.status_code != 200) {
        result.error = StorageError::remote_list(response.status_code, response.body_string());
    } else {
        result = parse_list_response(response.body_string());
    }

    if (!result.error && result.truncated) {
        log_warn("Listing of '%s' was truncated at %zu entries; continuation is not supported",
                 normalized.c_str(), result.entries.size());
    }

    record_operation(metrics_, "list", result.error);
    if (!result.error && metrics_) {
        metrics_->listed_entries_total().Increment(static_cast<double>(result.entries.size()));
    }
    return result;
}

StorageError ObjectStoreBackend::walk(const std::string& prefix, const WalkFn& visit) {
    auto listing = list(prefix);
    if (listing.error) {
        return listing.error;
    }

    for (const auto& entry : listing.entries) {
        visit(entry.key, StorageError{});
    }
    return {};
}

}  // namespace storekit
