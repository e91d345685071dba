#include "storekit/config.hpp"
#include "storekit/core/constants.hpp"
#include "storekit/core/log.hpp"
#include "storekit/metrics.hpp"
#include "storekit/storage/backend.hpp"

#include <chrono>
#include <cstdio>
#include <filesystem>
#include <iostream>
#include <memory>
#include <unistd.h>
#include <vector>

namespace {

int cmd_put(storekit::StorageBackend& backend, const std::vector<std::string>& operands) {
    const std::string& path = operands[0];

    FILE* in = stdin;
    if (operands.size() > 1 && operands[1] != "-") {
        in = fopen(operands[1].c_str(), "rb");
        if (!in) {
            storekit::log_error("Cannot open %s for reading", operands[1].c_str());
            return 1;
        }
    }

    auto saved = backend.save(path);
    if (saved.error) {
        storekit::log_error("save %s: %s", path.c_str(), saved.error.to_string().c_str());
        if (in != stdin) fclose(in);
        return 1;
    }

    std::vector<uint8_t> chunk(storekit::constants::DEFAULT_COPY_BUFFER_SIZE);
    size_t total = 0;
    size_t n;
    // On either failure the writer is dropped unclosed, which discards the
    // partial object instead of committing it
    while ((n = fread(chunk.data(), 1, chunk.size(), in)) > 0) {
        if (saved.writer->write(std::span<const uint8_t>(chunk.data(), n)) != n) {
            storekit::log_error("Write error while storing %s, not stored", path.c_str());
            if (in != stdin) fclose(in);
            return 1;
        }
        total += n;
    }
    bool read_failed = ferror(in) != 0;
    if (in != stdin) fclose(in);

    if (read_failed) {
        storekit::log_error("Read error on input, %s not stored", path.c_str());
        return 1;
    }

    auto err = saved.writer->close();
    if (err) {
        storekit::log_error("save %s: %s", path.c_str(), err.to_string().c_str());
        return 1;
    }
    storekit::log_info("Stored %zu bytes at %s", total, path.c_str());
    return 0;
}

int cmd_get(storekit::StorageBackend& backend, const std::vector<std::string>& operands) {
    const std::string& path = operands[0];

    auto fetched = backend.fetch(path);
    if (fetched.error) {
        storekit::log_error("fetch %s: %s", path.c_str(), fetched.error.to_string().c_str());
        return 1;
    }

    FILE* out = stdout;
    if (operands.size() > 1 && operands[1] != "-") {
        out = fopen(operands[1].c_str(), "wb");
        if (!out) {
            storekit::log_error("Cannot open %s for writing", operands[1].c_str());
            fetched.reader->close();
            return 1;
        }
    }

    int rc = 0;
    size_t total = 0;
    std::vector<uint8_t> chunk(storekit::constants::DEFAULT_COPY_BUFFER_SIZE);
    while (true) {
        auto result = fetched.reader->read(chunk);
        if (result.error) {
            storekit::log_error("fetch %s: %s", path.c_str(), result.error.to_string().c_str());
            rc = 1;
            break;
        }
        if (result.eof) break;
        if (fwrite(chunk.data(), 1, result.bytes, out) != result.bytes) {
            storekit::log_error("Write error while saving %s", path.c_str());
            rc = 1;
            break;
        }
        total += result.bytes;
    }
    fetched.reader->close();

    // stdout carries the object itself, so only a file download is reported
    if (out != stdout) {
        if (fclose(out) != 0 && rc == 0) {
            storekit::log_error("Write error while saving %s", path.c_str());
            rc = 1;
        }
        if (rc == 0) {
            storekit::log_info("Wrote %zu bytes of %s to %s", total, path.c_str(),
                               operands[1].c_str());
        }
    } else if (fflush(out) != 0 && rc == 0) {
        rc = 1;
    }
    return rc;
}

int cmd_ls(storekit::StorageBackend& backend, const std::vector<std::string>& operands) {
    std::string prefix = operands.empty() ? std::string() : operands[0];

    int rc = 0;
    auto err = backend.walk(prefix, [&rc](const std::string& key, const storekit::StorageError& error) {
        if (error) {
            storekit::log_error("%s: %s", key.c_str(), error.to_string().c_str());
            rc = 1;
            return;
        }
        printf("%s\n", key.c_str());
    });
    if (err) {
        storekit::log_error("walk %s: %s", prefix.c_str(), err.to_string().c_str());
        return 1;
    }
    fflush(stdout);
    return rc;
}

}  // namespace

int main(int argc, char* argv[]) {
    auto config_opt = storekit::ToolConfig::from_args(argc, argv);
    if (!config_opt) {
        return 1;
    }
    auto config = std::move(*config_opt);

    auto err = config.validate();
    if (!err.empty()) {
        std::cerr << "Configuration error: " << err << "\n";
        return 1;
    }

    storekit::set_verbose(config.verbose);

    // Redirect diagnostics if log file specified; stdout carries object data
    if (!config.log_file.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(
            std::filesystem::path(config.log_file).parent_path(), ec);
        FILE* log = fopen(config.log_file.c_str(), "a");
        if (!log) {
            std::cerr << "Cannot open log file: " << config.log_file << "\n";
            return 1;
        }
        dup2(fileno(log), STDERR_FILENO);
        fclose(log);
    }

    storekit::log_debug("storekit %s", config.command.c_str());
    storekit::log_debug("  type: %s", config.backend.type.c_str());
    for (const auto& [k, v] : storekit::masked_params(config.backend.params)) {
        storekit::log_debug("  %s: %s", k.c_str(), v.c_str());
    }

    std::unique_ptr<storekit::MetricsExporter> metrics;
    if (!config.metrics_file.empty()) {
        metrics = std::make_unique<storekit::MetricsExporter>(
            config.metrics_file,
            std::chrono::seconds(config.metrics_interval_secs),
            std::map<std::string, std::string>{{"backend", config.backend.type}});
        metrics->start();
    }

    std::unique_ptr<storekit::StorageBackend> backend;
    try {
        backend = storekit::StorageBackendFactory::create(
            config.backend.type, config.backend.params, metrics.get());
    } catch (const std::exception& e) {
        storekit::log_error("Failed to create %s backend: %s",
                            config.backend.type.c_str(), e.what());
        return 1;
    }

    int rc = 1;
    if (config.command == "put") {
        rc = cmd_put(*backend, config.operands);
    } else if (config.command == "get") {
        rc = cmd_get(*backend, config.operands);
    } else if (config.command == "ls") {
        rc = cmd_ls(*backend, config.operands);
    }

    // Backend holds a raw pointer to the exporter
    backend.reset();
    if (metrics) {
        metrics->stop();
    }
    return rc;
}
