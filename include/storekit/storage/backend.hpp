#pragma once

#include "storekit/storage/error.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace storekit {

class CredentialSource;
class MetricsExporter;

namespace net {
struct HttpClientConfig;
}

// Result of a single read from an ObjectReader
struct ReadResult {
    size_t bytes = 0;
    bool eof = false;       // No more data; bytes is 0
    StorageError error;
};

// Sink for one object's bytes. Nothing is guaranteed to be stored until
// close() returns success; destroying a writer without closing it discards
// the object.
class ObjectWriter {
public:
    virtual ~ObjectWriter() = default;

    // Append bytes, returns the number accepted
    virtual size_t write(std::span<const uint8_t> data) = 0;

    size_t write(std::string_view data) {
        return write(std::span<const uint8_t>(
            reinterpret_cast<const uint8_t*>(data.data()), data.size()));
    }

    // Commit the object. Calling again after the first close is a no-op
    // that returns success.
    virtual StorageError close() = 0;
};

// Source of one object's bytes. Must be closed to release the underlying
// file or connection.
class ObjectReader {
public:
    virtual ~ObjectReader() = default;

    virtual ReadResult read(std::span<uint8_t> buffer) = 0;
    virtual void close() = 0;
};

// Drain a reader into out. Does not close the reader.
StorageError read_all(ObjectReader& reader, std::vector<uint8_t>& out);

struct SaveResult {
    std::unique_ptr<ObjectWriter> writer;
    StorageError error;

    bool ok() const { return !error && writer != nullptr; }
};

struct FetchResult {
    std::unique_ptr<ObjectReader> reader;
    StorageError error;

    bool ok() const { return !error && reader != nullptr; }
};

// Entry in a listing operation
struct ListEntry {
    std::string key;
    std::chrono::system_clock::time_point last_modified;
    uint64_t size = 0;
};

// Result of a list operation
struct ListResult {
    std::vector<ListEntry> entries;
    bool truncated = false;     // Store reported more entries than returned
    StorageError error;
};

// Called once per object during a walk. A non-empty error reports a
// per-entry failure; the key is still the entry it concerns.
using WalkFn = std::function<void(const std::string& key, const StorageError& error)>;

// Abstract interface for storage backends
class StorageBackend {
public:
    virtual ~StorageBackend() = default;

    // Get the backend type name (for logging/debugging)
    virtual std::string type_name() const = 0;

    // Open a writer for the object at path
    virtual SaveResult save(const std::string& path) = 0;

    // Open a reader for the object at path
    virtual FetchResult fetch(const std::string& path) = 0;

    // Visit every object under prefix
    virtual StorageError walk(const std::string& prefix, const WalkFn& visit) = 0;
};

// Factory for creating storage backends from configuration
class StorageBackendFactory {
public:
    // Create a backend from a configuration map. Throws std::runtime_error
    // when required parameters are missing or the type is unknown.
    static std::unique_ptr<StorageBackend> create(
        const std::string& type,
        const std::map<std::string, std::string>& config,
        MetricsExporter* metrics = nullptr);

    // Create a filesystem backend rooted at root_path
    static std::unique_ptr<StorageBackend> create_filesystem(
        const std::filesystem::path& root_path);

    // Create an object-store backend on a libcurl transport. An empty region
    // is derived from the endpoint host.
    static std::unique_ptr<StorageBackend> create_object_store(
        const std::string& bucket_endpoint,
        std::shared_ptr<const CredentialSource> credentials,
        const std::string& region,
        const net::HttpClientConfig& http_config,
        MetricsExporter* metrics = nullptr);
};

} // namespace storekit
