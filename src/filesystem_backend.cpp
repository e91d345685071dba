#include "storekit/storage/filesystem.hpp"
#include "storekit/core/log.hpp"

#include <fnmatch.h>

#include <algorithm>
#include <fstream>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>

namespace storekit {

namespace {

constexpr const char* PARTIAL_SUFFIX = ".partial";

// Name of an in-progress write, never reported as an object
bool is_partial_file(const std::filesystem::path& path) {
    std::string name = path.filename().string();
    return name.size() > 1 && name.front() == '.' && name.ends_with(PARTIAL_SUFFIX);
}

// Writes into a hidden sibling of the destination and renames it into place
// on close, so the object only appears once it is complete. A writer that is
// destroyed unclosed, or whose writes failed, removes its partial file.
class FileObjectWriter : public ObjectWriter {
public:
    FileObjectWriter(std::filesystem::path path, std::filesystem::path temp_path,
                     std::ofstream file)
        : path_(std::move(path))
        , temp_path_(std::move(temp_path))
        , file_(std::move(file)) {}

    ~FileObjectWriter() override {
        if (!closed_) {
            discard();
        }
    }

    FileObjectWriter(const FileObjectWriter&) = delete;
    FileObjectWriter& operator=(const FileObjectWriter&) = delete;

    using ObjectWriter::write;

    size_t write(std::span<const uint8_t> data) override {
        if (closed_ || failed_) {
            return 0;
        }
        file_.write(reinterpret_cast<const char*>(data.data()),
                    static_cast<std::streamsize>(data.size()));
        if (!file_) {
            failed_ = true;
            return 0;
        }
        return data.size();
    }

    StorageError close() override {
        if (closed_) {
            return {};
        }
        closed_ = true;

        file_.close();
        if (failed_ || file_.fail()) {
            discard();
            return StorageError::filesystem("Failed to write file: " + path_.string());
        }

        std::error_code ec;
        std::filesystem::rename(temp_path_, path_, ec);
        if (ec) {
            discard();
            return StorageError::filesystem("Failed to move " + temp_path_.string() +
                                            " into place: " + ec.message());
        }
        return {};
    }

private:
    void discard() {
        if (file_.is_open()) {
            file_.close();
        }
        std::error_code ec;
        std::filesystem::remove(temp_path_, ec);
        if (ec) {
            log_warn("Could not remove partial file %s: %s",
                     temp_path_.c_str(), ec.message().c_str());
        }
    }

    std::filesystem::path path_;
    std::filesystem::path temp_path_;
    std::ofstream file_;
    bool closed_ = false;
    bool failed_ = false;
};

class FileObjectReader : public ObjectReader {
public:
    FileObjectReader(std::filesystem::path path, std::ifstream file)
        : path_(std::move(path))
        , file_(std::move(file)) {}

    ReadResult read(std::span<uint8_t> buffer) override {
        ReadResult result;
        if (!file_.is_open()) {
            result.eof = true;
            return result;
        }
        if (buffer.empty()) {
            return result;
        }

        file_.read(reinterpret_cast<char*>(buffer.data()),
                   static_cast<std::streamsize>(buffer.size()));
        result.bytes = static_cast<size_t>(file_.gcount());
        if (result.bytes == 0) {
            if (file_.bad()) {
                result.error = StorageError::filesystem("Failed to read file: " + path_.string());
            } else {
                result.eof = true;
            }
        }
        return result;
    }

    void close() override {
        if (file_.is_open()) {
            file_.close();
        }
    }

private:
    std::filesystem::path path_;
    std::ifstream file_;
};

}  // namespace

FilesystemBackend::FilesystemBackend(const std::filesystem::path& root)
    : root_(std::filesystem::absolute(root).lexically_normal()) {
    std::error_code ec;
    std::filesystem::create_directories(root_, ec);
    if (ec) {
        throw std::runtime_error("Cannot create storage root " + root_.string() + ": " + ec.message());
    }
}

std::optional<std::filesystem::path> FilesystemBackend::key_to_path(const std::string& key) const {
    std::string relative = key;
    relative.erase(0, relative.find_first_not_of('/'));

    if (relative.empty()) {
        return root_;
    }

    auto path = (root_ / relative).lexically_normal();
    if (!path.has_filename()) {
        path = path.parent_path();
    }
    auto rel = path.lexically_relative(root_);
    if (rel.empty() || *rel.begin() == "..") {
        return std::nullopt;
    }
    return path;
}

SaveResult FilesystemBackend::save(const std::string& path) {
    SaveResult result;

    auto file_path = key_to_path(path);
    if (!file_path || *file_path == root_) {
        result.error = StorageError::filesystem("Invalid object path: " + path);
        return result;
    }

    std::error_code ec;
    std::filesystem::create_directories(file_path->parent_path(), ec);
    if (ec) {
        result.error = StorageError::filesystem(
            "Failed to create directory " + file_path->parent_path().string() + ": " + ec.message());
        return result;
    }

    auto temp_path = file_path->parent_path() /
                     ("." + file_path->filename().string() + PARTIAL_SUFFIX);
    std::ofstream file(temp_path, std::ios::binary | std::ios::trunc);
    if (!file) {
        result.error = StorageError::filesystem("Failed to open file for writing: " + temp_path.string());
        return result;
    }

    result.writer = std::make_unique<FileObjectWriter>(*file_path, std::move(temp_path),
                                                       std::move(file));
    return result;
}

FetchResult FilesystemBackend::fetch(const std::string& path) {
    FetchResult result;

    auto file_path = key_to_path(path);
    if (!file_path) {
        result.error = StorageError::filesystem("Invalid object path: " + path);
        return result;
    }

    std::error_code ec;
    if (!std::filesystem::is_regular_file(*file_path, ec)) {
        result.error = StorageError::filesystem("Object not found: " + path);
        return result;
    }

    std::ifstream file(*file_path, std::ios::binary);
    if (!file) {
        result.error = StorageError::filesystem("Failed to open file: " + file_path->string());
        return result;
    }

    result.reader = std::make_unique<FileObjectReader>(*file_path, std::move(file));
    return result;
}

StorageError FilesystemBackend::walk(const std::string& prefix, const WalkFn& visit) {
    auto base = key_to_path(prefix);
    if (!base) {
        return StorageError::filesystem("Invalid prefix: " + prefix);
    }

    std::error_code ec;
    auto status = std::filesystem::status(*base, ec);
    if (ec || !std::filesystem::exists(status)) {
        // Nothing stored under this prefix
        return {};
    }

    std::vector<std::pair<std::string, StorageError>> found;
    auto key_of = [&](const std::filesystem::path& p) {
        return p.lexically_relative(root_).generic_string();
    };

    if (std::filesystem::is_regular_file(status)) {
        found.emplace_back(key_of(*base), StorageError{});
    } else {
        std::filesystem::recursive_directory_iterator it(*base, ec);
        if (ec) {
            return StorageError::filesystem("Cannot read directory " + base->string() + ": " + ec.message());
        }
        for (; it != std::filesystem::recursive_directory_iterator(); it.increment(ec)) {
            if (ec) {
                return StorageError::filesystem("Directory traversal failed under " +
                                                base->string() + ": " + ec.message());
            }
            std::error_code entry_ec;
            bool regular = it->is_regular_file(entry_ec);
            if (entry_ec) {
                found.emplace_back(key_of(it->path()),
                                   StorageError::filesystem("Cannot stat " + it->path().string() +
                                                            ": " + entry_ec.message()));
            } else if (regular && !is_partial_file(it->path())) {
                found.emplace_back(key_of(it->path()), StorageError{});
            }
        }
        if (ec) {
            return StorageError::filesystem("Directory traversal failed under " +
                                            base->string() + ": " + ec.message());
        }
    }

    std::sort(found.begin(), found.end(),
              [](const auto& a, const auto& b) { return a.first < b.first; });
    for (const auto& [key, error] : found) {
        visit(key, error);
    }
    return {};
}

FetchMatchingResult FilesystemBackend::fetch_matching(const std::string& pattern) {
    FetchMatchingResult result;

    std::string relative = pattern;
    relative.erase(0, relative.find_first_not_of('/'));

    std::vector<std::string> keys;
    StorageError walk_error = walk("", [&](const std::string& key, const StorageError& error) {
        if (!error && fnmatch(relative.c_str(), key.c_str(), FNM_PATHNAME) == 0) {
            keys.push_back(key);
        }
    });
    if (walk_error) {
        result.error = walk_error;
        return result;
    }

    for (const auto& key : keys) {
        auto fetched = fetch(key);
        if (fetched.error) {
            result.objects.clear();
            result.error = fetched.error;
            return result;
        }
        result.objects.push_back({key, std::move(fetched.reader)});
    }

    log_debug("Matched %zu objects for pattern %s", result.objects.size(), pattern.c_str());
    return result;
}

}  // namespace storekit
