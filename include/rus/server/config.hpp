#pragma once

#include "rus/core/result.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace rus::server {

/**
 * @brief Everything the server process can be configured with
 *
 * Sources, later ones win: the defaults below, an optional JSON file
 * (--config), command line flags.
 */
/// Longest upload expiry accepted (about 100 years)
inline constexpr std::chrono::seconds kMaxUploadExpiry{100LL * 365 * 24 * 3600};

struct ServerConfig {
    std::string address{"0.0.0.0"};
    std::uint16_t port{1080};
    std::string base_path{"/files"};
    std::size_t worker_threads{0};                      ///< 0 = hardware concurrency
    std::string storage_backend{"file"};                ///< "file" or "memory"
    std::filesystem::path data_dir{"tus_data"};
    bool persist_registry{true};
    std::uint64_t max_size{0};                          ///< 0 = unlimited
    std::size_t max_request_body{64 * 1024 * 1024};
    std::chrono::seconds upload_expiry{86400};          ///< 0 = never expire
    std::chrono::seconds sweep_interval{300};
    int storage_retry_attempts{3};
    std::chrono::milliseconds storage_retry_backoff{50};
    std::string log_level{"info"};
    std::optional<std::filesystem::path> log_file;

    /**
     * @brief Reject values the server cannot run with
     */
    Result<void> validate() const;
};

struct CommandLine {
    ServerConfig config;
    bool show_help = false;
};

/**
 * @brief Overlay the keys present in a JSON config file onto `config`
 *
 * Keys use the member names above; unknown keys are ignored with a warning.
 */
Result<void> load_config_file(const std::filesystem::path& path, ServerConfig& config);

/**
 * @brief Build the configuration from argv
 *
 * A --config file is applied first regardless of where it appears, so flags
 * always override file values.
 */
Result<CommandLine> parse_command_line(int argc, const char* const argv[]);

void print_usage(const char* program_name);

} // namespace rus::server
