#include "storekit/storage/error.hpp"

#include <utility>

namespace storekit {

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None: return "none";
        case ErrorKind::Configuration: return "configuration";
        case ErrorKind::RequestConstruction: return "request construction";
        case ErrorKind::Transport: return "transport";
        case ErrorKind::RemoteWrite: return "remote write";
        case ErrorKind::RemoteRead: return "remote read";
        case ErrorKind::RemoteList: return "remote list";
        case ErrorKind::Parse: return "parse";
        case ErrorKind::Filesystem: return "filesystem";
    }
    return "unknown";
}

std::string StorageError::to_string() const {
    if (kind == ErrorKind::None) return "success";

    std::string result = std::string(error_kind_name(kind)) + " error: " + message;
    if (!body.empty()) {
        result += "\n" + body;
    }
    return result;
}

StorageError StorageError::configuration(std::string message) {
    return {ErrorKind::Configuration, 0, {}, std::move(message)};
}

StorageError StorageError::request_construction(std::string message) {
    return {ErrorKind::RequestConstruction, 0, {}, std::move(message)};
}

StorageError StorageError::transport(std::string message) {
    return {ErrorKind::Transport, 0, {}, std::move(message)};
}

StorageError StorageError::remote_write(int status_code, std::string body) {
    return {ErrorKind::RemoteWrite, status_code, std::move(body),
            "Expected 200 OK, got: (" + std::to_string(status_code) + ")"};
}

StorageError StorageError::remote_read(int status_code) {
    return {ErrorKind::RemoteRead, status_code, {},
            "Expected 200 OK, got: (" + std::to_string(status_code) + ")"};
}

StorageError StorageError::remote_list(int status_code, std::string body) {
    return {ErrorKind::RemoteList, status_code, std::move(body),
            "Expected 200 OK, got: (" + std::to_string(status_code) + ")"};
}

StorageError StorageError::parse(std::string message) {
    return {ErrorKind::Parse, 0, {}, std::move(message)};
}

StorageError StorageError::filesystem(std::string message) {
    return {ErrorKind::Filesystem, 0, {}, std::move(message)};
}

}  // namespace storekit
