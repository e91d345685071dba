#pragma once

#include "storekit/storage/backend.hpp"

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace storekit {

struct MatchedObject {
    std::string key;
    std::unique_ptr<ObjectReader> reader;
};

struct FetchMatchingResult {
    std::vector<MatchedObject> objects;
    StorageError error;
};

// Stores objects as files under a root directory; the object path is the
// file path relative to the root. A saved file appears only once its writer
// closes successfully; until then the bytes sit in a hidden ".<name>.partial"
// sibling that walks skip.
class FilesystemBackend : public StorageBackend {
public:
    explicit FilesystemBackend(const std::filesystem::path& root);

    std::string type_name() const override { return "filesystem"; }

    SaveResult save(const std::string& path) override;
    FetchResult fetch(const std::string& path) override;
    StorageError walk(const std::string& prefix, const WalkFn& visit) override;

    // Open every file whose relative path matches the shell pattern, in
    // sorted key order
    FetchMatchingResult fetch_matching(const std::string& pattern);

private:
    // Empty optional when the key would resolve outside the root
    std::optional<std::filesystem::path> key_to_path(const std::string& key) const;

    std::filesystem::path root_;
};

} // namespace storekit
