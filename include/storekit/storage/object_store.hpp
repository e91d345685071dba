#pragma once

#include "storekit/net/http.hpp"
#include "storekit/storage/backend.hpp"
#include "storekit/storage/request_signer.hpp"

#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <vector>

namespace storekit {

class MetricsExporter;

// Accumulates an object in memory and sends it as one signed PUT on the
// first close. The whole payload is held until then, which gives the store
// a known Content-Length and an all-or-nothing write.
class BufferedObjectWriter : public ObjectWriter {
public:
    BufferedObjectWriter(std::string path,
                         std::string bucket_endpoint,
                         std::shared_ptr<const RequestSigner> signer,
                         std::shared_ptr<net::HttpTransport> transport,
                         MetricsExporter* metrics = nullptr);

    using ObjectWriter::write;

    // Always accepts all bytes. Writes after close are not rejected but are
    // never sent.
    size_t write(std::span<const uint8_t> data) override;

    // First call transmits; later calls return success without I/O. The
    // buffer is released after the first call whatever its outcome.
    StorageError close() override;

    size_t buffered_size() const { return buffer_.size(); }

private:
    std::string path_;
    std::string bucket_endpoint_;
    std::shared_ptr<const RequestSigner> signer_;
    std::shared_ptr<net::HttpTransport> transport_;
    MetricsExporter* metrics_;

    std::vector<uint8_t> buffer_;
    bool closed_ = false;
};

// Object-store backend speaking the S3 REST protocol with SigV4 signing.
// Stateless between calls apart from its shared signer and transport.
class ObjectStoreBackend : public StorageBackend {
public:
    ObjectStoreBackend(std::string bucket_endpoint,
                       std::shared_ptr<const RequestSigner> signer,
                       std::shared_ptr<net::HttpTransport> transport,
                       MetricsExporter* metrics = nullptr);

    std::string type_name() const override { return "s3"; }

    SaveResult save(const std::string& path) override;
    FetchResult fetch(const std::string& path) override;
    StorageError walk(const std::string& prefix, const WalkFn& visit) override;

    // Single listing request for prefix. At most one page (1000 entries) is
    // returned; truncated reports whether the store had more.
    ListResult list(const std::string& prefix) const;

private:
    std::string bucket_endpoint_;
    std::shared_ptr<const RequestSigner> signer_;
    std::shared_ptr<net::HttpTransport> transport_;
    MetricsExporter* metrics_;
};

// Strip leading '/' and end the prefix with exactly one '/'. A prefix that
// is empty after stripping stays empty.
std::string normalize_list_prefix(const std::string& prefix);

// Parse a ListBucketResult document. Entries keep document order. A body
// that is not a ListBucketResult, or a Contents entry without a Key or with
// an unreadable Size or LastModified, yields a Parse error.
ListResult parse_list_response(const std::string& body);

} // namespace storekit
