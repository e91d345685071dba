#include "storekit/config.hpp"
#include "storekit/net/http.hpp"

#include <charconv>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <string_view>
#include <system_error>
#include <nlohmann/json.hpp>

namespace storekit {

// --- BackendConfig ---

std::string BackendConfig::validate() const {
    if (type.empty()) return "backend type is required";
    if (type == "s3") {
        if (params.count("bucket_endpoint") == 0 || params.at("bucket_endpoint").empty())
            return "s3 backend requires 'bucket_endpoint'";
        auto url = net::ParsedUrl::parse(params.at("bucket_endpoint"));
        if (!url || (url->scheme != "http" && url->scheme != "https"))
            return "s3 bucket_endpoint must be an http or https URL: " + params.at("bucket_endpoint");
    } else if (type == "filesystem") {
        if (params.count("path") == 0 || params.at("path").empty())
            return "filesystem backend requires 'path'";
    } else {
        return "unknown backend type: " + type;
    }
    return {};
}

std::map<std::string, std::string> masked_params(const std::map<std::string, std::string>& params) {
    std::map<std::string, std::string> result;
    for (const auto& [k, v] : params) {
        if (k.find("key") != std::string::npos || k.find("secret") != std::string::npos ||
            k.find("token") != std::string::npos || k.find("credential") != std::string::npos) {
            result[k] = "****";
        } else {
            result[k] = v;
        }
    }
    return result;
}

// --- ToolConfig ---

namespace {

// Map a backend flag to its BackendConfig parameter.
// Returns nullptr if the flag is not a backend flag taking a value.
const char* backend_param_for_flag(const std::string& arg) {
    if (arg == "--endpoint") return "bucket_endpoint";
    if (arg == "--region") return "region";
    if (arg == "--access-key") return "access_key";
    if (arg == "--secret-key") return "secret_key";
    if (arg == "--path") return "path";
    if (arg == "--ca-cert") return "ca_cert_path";
    if (arg == "--connect-timeout") return "connect_timeout";
    if (arg == "--request-timeout") return "request_timeout";
    return nullptr;
}

void print_usage() {
    std::cerr <<
        "Usage: storekit [options] <command> [args]\n"
        "\n"
        "Commands:\n"
        "  put <path> [file]                Store file (or stdin) at path\n"
        "  get <path> [file]                Write object at path to file (or stdout)\n"
        "  ls [prefix]                      List objects under prefix\n"
        "\n"
        "Backend:\n"
        "  --type <s3|filesystem>           Backend type\n"
        "  --endpoint <url>                 Bucket endpoint, e.g. https://s3.amazonaws.com/bucket (s3)\n"
        "  --region <region>                Signing region (s3, default: derived from endpoint)\n"
        "  --access-key <key>               Access key (s3, default: AWS_ACCESS_KEY_ID env)\n"
        "  --secret-key <key>               Secret key (s3, default: AWS_SECRET_ACCESS_KEY env)\n"
        "  --ca-cert <path>                 CA certificate for SSL (s3)\n"
        "  --no-verify-ssl                  Skip SSL verification (s3)\n"
        "  --connect-timeout <secs>         Connect timeout (s3, default: 30)\n"
        "  --request-timeout <secs>         Whole-request timeout (s3, default: none)\n"
        "  --path <dir>                     Root directory (filesystem)\n"
        "\n"
        "Options:\n"
        "  --config <path>                  JSON config file\n"
        "  --verbose                        Verbose output\n"
        "  --log-file <path>                Log file path\n"
        "  --metrics-file <path>            Prometheus .prom file for node_exporter textfile collector\n"
        "  --metrics-interval <secs>        Metrics write interval (default: 15)\n"
        "  --help                           Show this help\n";
}

}  // namespace

std::optional<ToolConfig> ToolConfig::from_args(int argc, char* argv[]) {
    ToolConfig config;

    auto next_arg = [&](int& i, const char* name) -> const char* {
        if (i + 1 >= argc) {
            std::cerr << "Error: " << name << " requires an argument\n";
            return nullptr;
        }
        return argv[++i];
    };

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (const char* param = backend_param_for_flag(arg)) {
            auto* v = next_arg(i, arg.c_str());
            if (!v) return std::nullopt;
            config.backend.params[param] = v;
            continue;
        }

        if (arg == "--type") {
            auto* v = next_arg(i, "--type");
            if (!v) return std::nullopt;
            config.backend.type = v;
        } else if (arg == "--no-verify-ssl") {
            config.backend.params["verify_ssl"] = "false";
        } else if (arg == "--config") {
            auto* v = next_arg(i, "--config");
            if (!v) return std::nullopt;
            if (!config.load_json(v)) return std::nullopt;
        } else if (arg == "--verbose") {
            config.verbose = true;
        } else if (arg == "--log-file") {
            auto* v = next_arg(i, "--log-file");
            if (!v) return std::nullopt;
            config.log_file = v;
        } else if (arg == "--metrics-file") {
            auto* v = next_arg(i, "--metrics-file");
            if (!v) return std::nullopt;
            config.metrics_file = v;
        } else if (arg == "--metrics-interval") {
            auto* v = next_arg(i, "--metrics-interval");
            if (!v) return std::nullopt;
            std::string_view text(v);
            size_t secs = 0;
            auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), secs);
            if (text.empty() || ec != std::errc() || ptr != text.data() + text.size()) {
                std::cerr << "Error: --metrics-interval expects a whole number of seconds, got: "
                          << v << "\n";
                return std::nullopt;
            }
            config.metrics_interval_secs = secs;
        } else if (arg == "--help" || arg == "-h") {
            print_usage();
            return std::nullopt;
        } else if (arg.size() > 1 && arg[0] == '-') {
            std::cerr << "Error: unknown option: " << arg << "\n";
            return std::nullopt;
        } else if (config.command.empty()) {
            config.command = arg;
        } else {
            config.operands.push_back(arg);
        }
    }

    if (config.command.empty()) {
        print_usage();
        return std::nullopt;
    }

    return config;
}

bool ToolConfig::load_json(const std::filesystem::path& path) {
    try {
        std::ifstream ifs(path);
        if (!ifs) {
            std::cerr << "Error: cannot open config file: " << path << "\n";
            return false;
        }
        auto j = nlohmann::json::parse(ifs);

        if (j.contains("verbose")) verbose = j["verbose"].get<bool>();
        if (j.contains("log_file")) log_file = j["log_file"].get<std::string>();
        if (j.contains("metrics_file")) metrics_file = j["metrics_file"].get<std::string>();
        if (j.contains("metrics_interval")) {
            if (!j["metrics_interval"].is_number_unsigned()) {
                std::cerr << "Error: metrics_interval must be a non-negative integer\n";
                return false;
            }
            metrics_interval_secs = j["metrics_interval"].get<size_t>();
        }

        if (j.contains("backend") && j["backend"].is_object()) {
            auto& jb = j["backend"];
            if (jb.contains("type")) backend.type = jb["type"].get<std::string>();
            for (auto& [key, val] : jb.items()) {
                if (key == "type") continue;
                if (val.is_string()) {
                    backend.params[key] = val.get<std::string>();
                } else if (val.is_boolean()) {
                    backend.params[key] = val.get<bool>() ? "true" : "false";
                } else {
                    // Numbers are passed through in their JSON spelling
                    backend.params[key] = val.dump();
                }
            }
        }

        return true;
    } catch (const std::exception& e) {
        std::cerr << "Error parsing config: " << e.what() << "\n";
        return false;
    }
}

std::string ToolConfig::validate() const {
    if (backend.empty()) return "backend type is required (--type)";
    auto err = backend.validate();
    if (!err.empty()) return "backend: " + err;

    if (command == "put" || command == "get") {
        if (operands.empty()) return command + " requires an object path";
        if (operands.size() > 2) return "too many arguments for " + command;
    } else if (command == "ls") {
        if (operands.size() > 1) return "too many arguments for ls";
    } else {
        return "unknown command: " + command;
    }
    if (!metrics_file.empty() && metrics_interval_secs == 0) return "metrics_interval must be > 0";
    return {};
}

}  // namespace storekit
