#pragma once

#include "guestdrop/core/result.hpp"
#include "guestdrop/upload/service.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace guestdrop::server {

struct ServerConfig {
    std::string bind_address{"0.0.0.0"};
    std::uint16_t port{8000};
    std::filesystem::path upload_root{"uploads"};
    std::filesystem::path scratch_root;  ///< empty: <upload_root>/.chunks
    std::uint64_t chunk_size{upload::UploadOptions::kDefaultChunkSize};
    std::uint64_t max_file_size{2ull * 1024 * 1024 * 1024};
    std::uint32_t max_chunks{10000};
    std::chrono::seconds stale_after{3600};
    std::chrono::seconds reaper_interval{60};
    std::size_t worker_threads{0};       ///< 0: hardware concurrency
    std::uint64_t max_request_bytes{0};  ///< 0: chunk_size + 1 MiB
    std::string log_level{"info"};
    std::optional<std::filesystem::path> log_file;

    std::filesystem::path effective_scratch_root() const;
    std::uint64_t effective_max_request_bytes() const;
    std::size_t effective_worker_threads() const;

    upload::UploadOptions upload_options() const;
};

/// Values given on the command line; each one overrides the config file.
struct CommandLine {
    std::optional<std::filesystem::path> config_path;
    std::optional<std::uint16_t> port;
    std::optional<std::filesystem::path> upload_root;
    std::optional<std::size_t> worker_threads;
    std::optional<std::string> log_level;
    bool show_help{false};
};

Result<CommandLine> parse_command_line(int argc, const char* const argv[]);

std::string usage(const std::string& program_name);

/**
 * @brief Read a JSON config file over the defaults
 *
 * Keys are the ServerConfig member names, with durations given in seconds
 * (`stale_after_seconds`, `reaper_interval_seconds`). Unknown keys are
 * rejected so typos do not silently fall back to defaults.
 */
Result<ServerConfig> load_config_file(const std::filesystem::path& path);

/// Same as load_config_file but from already-read JSON text.
Result<ServerConfig> parse_config(const std::string& json_text, ServerConfig base = {});

void apply_overrides(ServerConfig& config, const CommandLine& cli);

Result<void> validate(const ServerConfig& config);

} // namespace guestdrop::server
