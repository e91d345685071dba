#pragma once

#include "storekit/core/constants.hpp"

#include <cstddef>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace storekit {

/// Configuration for a single storage backend (s3 or filesystem).
struct BackendConfig {
    std::string type;  // "s3", "filesystem"
    std::map<std::string, std::string> params;  // Passed to StorageBackendFactory

    bool empty() const { return type.empty(); }

    /// Validate required fields for this backend type.
    /// Returns error message or empty string on success.
    std::string validate() const;
};

/// Configuration for the storekit command-line tool.
struct ToolConfig {
    BackendConfig backend;

    // Subcommand ("put", "get", "ls") and its positional operands
    std::string command;
    std::vector<std::string> operands;

    bool verbose = false;
    std::filesystem::path log_file;

    // Prometheus metrics (textfile collector)
    std::filesystem::path metrics_file;
    size_t metrics_interval_secs = constants::DEFAULT_METRICS_INTERVAL_SECONDS;

    /// Parse configuration from command line arguments.
    /// Returns empty optional on error (prints usage to stderr).
    static std::optional<ToolConfig> from_args(int argc, char* argv[]);

    /// Load configuration from a JSON file, overlaying onto current values.
    bool load_json(const std::filesystem::path& path);

    /// Validate backend and command. Returns error message or empty string.
    std::string validate() const;
};

/// Copy of params with secret values replaced by "****", for logging.
std::map<std::string, std::string> masked_params(const std::map<std::string, std::string>& params);

}  // namespace storekit
