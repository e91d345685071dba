#pragma once

#include <string>

namespace storekit {

// Failure categories reported by the storage backends
enum class ErrorKind {
    None,
    Configuration,        // Missing credentials or invalid settings
    RequestConstruction,  // URL could not be built or parsed
    Transport,            // Network-level failure, no HTTP status
    RemoteWrite,          // PUT answered with a status other than 200
    RemoteRead,           // GET answered with a status other than 200
    RemoteList,           // Listing answered with a status other than 200
    Parse,                // Listing body is not a valid ListBucketResult
    Filesystem            // Local file I/O failure
};

const char* error_kind_name(ErrorKind kind);

// Error value carried by every storage result. A default-constructed error
// means success.
struct StorageError {
    ErrorKind kind = ErrorKind::None;
    int status_code = 0;     // HTTP status for the Remote* kinds
    std::string body;        // Response body for RemoteWrite and RemoteList
    std::string message;

    explicit operator bool() const { return kind != ErrorKind::None; }
    bool ok() const { return kind == ErrorKind::None; }

    // Human-readable form, including status and body where present
    std::string to_string() const;

    static StorageError configuration(std::string message);
    static StorageError request_construction(std::string message);
    static StorageError transport(std::string message);
    static StorageError remote_write(int status_code, std::string body);
    static StorageError remote_read(int status_code);
    static StorageError remote_list(int status_code, std::string body);
    static StorageError parse(std::string message);
    static StorageError filesystem(std::string message);
};

} // namespace storekit
