#include "rus/server/config.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace rus::server {

namespace {

const std::vector<std::string> kLogLevels{"trace", "debug", "info", "warn", "error", "critical", "off"};

Result<std::uint64_t> parse_unsigned(const std::string& name, const std::string& text) {
    const bool digits = !text.empty() &&
        std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isdigit(c) != 0; });
    if (!digits) {
        return fail<std::uint64_t>(ErrorKind::Malformed, "Invalid value for " + name + ": " + text);
    }
    try {
        return Ok<std::uint64_t>(std::stoull(text));
    } catch (const std::out_of_range&) {
        return fail<std::uint64_t>(ErrorKind::Malformed, "Value for " + name + " is out of range: " + text);
    }
}

std::optional<std::string> read_option(int& index, int argc, const char* const argv[]) {
    if (index + 1 >= argc) {
        return std::nullopt;
    }
    ++index;
    return std::string(argv[index]);
}

bool parse_bool(const std::string& text, bool& out) {
    if (text == "true" || text == "1" || text == "yes") {
        out = true;
        return true;
    }
    if (text == "false" || text == "0" || text == "no") {
        out = false;
        return true;
    }
    return false;
}

} // namespace

Result<void> ServerConfig::validate() const {
    if (base_path.size() < 2 || base_path.front() != '/' || base_path.back() == '/') {
        return Err<void>(Error(ErrorKind::Malformed,
            "base_path must start with '/' and must not end with '/': " + base_path));
    }
    if (storage_backend != "file" && storage_backend != "memory") {
        return Err<void>(Error(ErrorKind::Malformed, "storage_backend must be 'file' or 'memory'"));
    }
    if (storage_backend == "file" && data_dir.empty()) {
        return Err<void>(Error(ErrorKind::Malformed, "data_dir is required for the file backend"));
    }
    if (max_request_body == 0) {
        return Err<void>(Error(ErrorKind::Malformed, "max_request_body must be positive"));
    }
    if (upload_expiry.count() < 0) {
        return Err<void>(Error(ErrorKind::Malformed, "upload_expiry must not be negative"));
    }
    if (upload_expiry > kMaxUploadExpiry) {
        return Err<void>(Error(ErrorKind::Malformed,
            "upload_expiry must not exceed " + std::to_string(kMaxUploadExpiry.count()) + " seconds"));
    }
    if (sweep_interval.count() <= 0) {
        return Err<void>(Error(ErrorKind::Malformed, "sweep_interval must be positive"));
    }
    if (storage_retry_attempts < 1) {
        return Err<void>(Error(ErrorKind::Malformed, "storage_retry_attempts must be at least 1"));
    }
    if (storage_retry_backoff.count() < 0) {
        return Err<void>(Error(ErrorKind::Malformed, "storage_retry_backoff must not be negative"));
    }
    if (std::find(kLogLevels.begin(), kLogLevels.end(), log_level) == kLogLevels.end()) {
        return Err<void>(Error(ErrorKind::Malformed, "Unknown log level: " + log_level));
    }
    return Ok();
}

Result<void> load_config_file(const std::filesystem::path& path, ServerConfig& config) {
    std::ifstream in(path);
    if (!in.is_open()) {
        return Err<void>(Error(ErrorKind::NotFound, "Cannot open config file: " + path.string()));
    }

    try {
        const auto json = nlohmann::json::parse(in);
        if (!json.is_object()) {
            return Err<void>(Error(ErrorKind::Malformed, "Config file must contain a JSON object"));
        }

        for (const auto& [key, value] : json.items()) {
            if (key == "address") {
                config.address = value.get<std::string>();
            } else if (key == "port") {
                config.port = value.get<std::uint16_t>();
            } else if (key == "base_path") {
                config.base_path = value.get<std::string>();
            } else if (key == "worker_threads") {
                config.worker_threads = value.get<std::size_t>();
            } else if (key == "storage_backend") {
                config.storage_backend = value.get<std::string>();
            } else if (key == "data_dir") {
                config.data_dir = value.get<std::string>();
            } else if (key == "persist_registry") {
                config.persist_registry = value.get<bool>();
            } else if (key == "max_size") {
                config.max_size = value.get<std::uint64_t>();
            } else if (key == "max_request_body") {
                config.max_request_body = value.get<std::size_t>();
            } else if (key == "upload_expiry") {
                config.upload_expiry = std::chrono::seconds(value.get<std::int64_t>());
            } else if (key == "sweep_interval") {
                config.sweep_interval = std::chrono::seconds(value.get<std::int64_t>());
            } else if (key == "storage_retry_attempts") {
                config.storage_retry_attempts = value.get<int>();
            } else if (key == "storage_retry_backoff") {
                config.storage_retry_backoff = std::chrono::milliseconds(value.get<std::int64_t>());
            } else if (key == "log_level") {
                config.log_level = value.get<std::string>();
            } else if (key == "log_file") {
                config.log_file = std::filesystem::path(value.get<std::string>());
            } else {
                spdlog::warn("Ignoring unknown config key '{}' in {}", key, path.string());
            }
        }
    } catch (const nlohmann::json::exception& e) {
        return Err<void>(Error(ErrorKind::Malformed,
            "Invalid config file " + path.string() + ": " + e.what()));
    }

    return Ok();
}

Result<CommandLine> parse_command_line(int argc, const char* const argv[]) {
    CommandLine cmd;

    // Config file first so flags override it
    for (int i = 1; i < argc; ++i) {
        if (std::string(argv[i]) == "--config") {
            auto value = read_option(i, argc, argv);
            if (!value) {
                return fail<CommandLine>(ErrorKind::Malformed, "Missing value for --config");
            }
            if (auto res = load_config_file(*value, cmd.config); res.is_error()) {
                return Err<CommandLine>(res.error());
            }
        }
    }

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            cmd.show_help = true;
            continue;
        }

        if (arg == "--in-memory") {
            cmd.config.storage_backend = "memory";
            continue;
        }

        auto value = read_option(i, argc, argv);
        if (!value) {
            return fail<CommandLine>(ErrorKind::Malformed, "Missing value for " + arg);
        }

        if (arg == "--config") {
            continue;
        } else if (arg == "-p" || arg == "--port") {
            auto port = parse_unsigned(arg, *value);
            if (port.is_error() || port.value() > 65535) {
                return fail<CommandLine>(ErrorKind::Malformed, "Invalid port: " + *value);
            }
            cmd.config.port = static_cast<std::uint16_t>(port.value());
        } else if (arg == "--address") {
            cmd.config.address = *value;
        } else if (arg == "-d" || arg == "--data") {
            cmd.config.data_dir = std::filesystem::path(*value);
        } else if (arg == "--storage") {
            cmd.config.storage_backend = *value;
        } else if (arg == "--base-path") {
            cmd.config.base_path = *value;
        } else if (arg == "--threads") {
            auto threads = parse_unsigned(arg, *value);
            if (threads.is_error()) {
                return Err<CommandLine>(threads.error());
            }
            cmd.config.worker_threads = static_cast<std::size_t>(threads.value());
        } else if (arg == "--max-size") {
            auto size = parse_unsigned(arg, *value);
            if (size.is_error()) {
                return Err<CommandLine>(size.error());
            }
            cmd.config.max_size = size.value();
        } else if (arg == "--expiry") {
            auto seconds = parse_unsigned(arg, *value);
            if (seconds.is_error()) {
                return Err<CommandLine>(seconds.error());
            }
            cmd.config.upload_expiry = std::chrono::seconds(static_cast<std::int64_t>(seconds.value()));
        } else if (arg == "--persist-registry") {
            if (!parse_bool(*value, cmd.config.persist_registry)) {
                return fail<CommandLine>(ErrorKind::Malformed, "Invalid value for --persist-registry: " + *value);
            }
        } else if (arg == "--log-level") {
            cmd.config.log_level = *value;
        } else if (arg == "--log") {
            cmd.config.log_file = std::filesystem::path(*value);
        } else {
            return fail<CommandLine>(ErrorKind::Malformed, "Unknown argument: " + arg);
        }
    }

    return Ok(std::move(cmd));
}

void print_usage(const char* program_name) {
    std::cout << "Resumable upload server (tus 1.0.0)\n"
              << "Usage: " << program_name << " [options]\n"
              << "  --config <FILE>            JSON config file\n"
              << "  -p, --port <PORT>          Listen port (default 1080)\n"
              << "  --address <ADDRESS>        Bind address (default 0.0.0.0)\n"
              << "  --base-path <PATH>         Upload collection path (default /files)\n"
              << "  -d, --data <DIR>           Data directory (default ./tus_data)\n"
              << "  --storage <file|memory>    Storage backend (default file)\n"
              << "  --in-memory                Same as --storage memory\n"
              << "  --persist-registry <bool>  Keep upload state across restarts (default true)\n"
              << "  --threads <N>              Worker threads (default: hardware concurrency)\n"
              << "  --max-size <BYTES>         Largest accepted upload, 0 = unlimited\n"
              << "  --expiry <SECONDS>         Upload expiry, 0 = never (default 86400)\n"
              << "  --log-level <LEVEL>        trace|debug|info|warn|error\n"
              << "  --log <FILE>               Also log to a rotating file\n"
              << "  -h, --help                 Show this help\n";
}

} // namespace rus::server
