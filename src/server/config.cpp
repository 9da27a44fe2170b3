#include "guestdrop/server/config.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/common.h>

#include <charconv>
#include <fstream>
#include <limits>
#include <set>
#include <sstream>
#include <thread>

namespace guestdrop::server {
namespace {

using json = nlohmann::json;

constexpr std::uint64_t kRequestOverhead = 1024 * 1024;

template<typename T>
std::optional<T> parse_number(const std::string& text) {
    T value{};
    const char* first = text.data();
    const char* last = first + text.size();
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc() || ptr != last) {
        return std::nullopt;
    }
    return value;
}

template<typename T>
Result<T> unsigned_field(const json& doc, const char* key, T current) {
    if (!doc.contains(key)) {
        return Ok(current);
    }
    const auto& value = doc.at(key);
    if (!value.is_number_unsigned() && !(value.is_number_integer() && value.get<std::int64_t>() >= 0)) {
        return Err(std::string("'") + key + "' must be a non-negative integer");
    }
    const auto raw = value.get<std::uint64_t>();
    if (raw > std::numeric_limits<T>::max()) {
        return Err(std::string("'") + key + "' is out of range");
    }
    return Ok(static_cast<T>(raw));
}

Result<std::string> string_field(const json& doc, const char* key, std::string current) {
    if (!doc.contains(key)) {
        return Ok(std::move(current));
    }
    const auto& value = doc.at(key);
    if (!value.is_string()) {
        return Err(std::string("'") + key + "' must be a string");
    }
    return Ok(value.get<std::string>());
}

const std::set<std::string>& known_keys() {
    static const std::set<std::string> keys{
        "bind_address", "port", "upload_root", "scratch_root", "chunk_size", "max_file_size",
        "max_chunks", "stale_after_seconds", "reaper_interval_seconds", "worker_threads",
        "max_request_bytes", "log_level", "log_file"};
    return keys;
}

} // namespace

std::filesystem::path ServerConfig::effective_scratch_root() const {
    return scratch_root.empty() ? upload_root / ".chunks" : scratch_root;
}

std::uint64_t ServerConfig::effective_max_request_bytes() const {
    return max_request_bytes != 0 ? max_request_bytes : chunk_size + kRequestOverhead;
}

std::size_t ServerConfig::effective_worker_threads() const {
    if (worker_threads != 0) {
        return worker_threads;
    }
    const auto hw = std::thread::hardware_concurrency();
    return hw != 0 ? hw : 2;
}

upload::UploadOptions ServerConfig::upload_options() const {
    upload::UploadOptions options;
    options.upload_root = upload_root;
    options.scratch_root = effective_scratch_root();
    options.chunk_size = chunk_size;
    options.max_file_size = max_file_size;
    options.max_chunks = max_chunks;
    options.stale_after = stale_after;
    return options;
}

Result<CommandLine> parse_command_line(int argc, const char* const argv[]) {
    CommandLine cli;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            cli.show_help = true;
            continue;
        }

        if (i + 1 >= argc) {
            return Err("Missing value for " + arg);
        }
        const std::string value = argv[++i];

        if (arg == "--config") {
            cli.config_path = std::filesystem::path(value);
        } else if (arg == "--port") {
            auto port = parse_number<std::uint16_t>(value);
            if (!port) {
                return Err("Invalid port: " + value);
            }
            cli.port = *port;
        } else if (arg == "--root") {
            cli.upload_root = std::filesystem::path(value);
        } else if (arg == "--threads") {
            auto threads = parse_number<std::size_t>(value);
            if (!threads) {
                return Err("Invalid thread count: " + value);
            }
            cli.worker_threads = *threads;
        } else if (arg == "--log-level") {
            cli.log_level = value;
        } else {
            return Err("Unknown argument: " + arg);
        }
    }
    return Ok(std::move(cli));
}

std::string usage(const std::string& program_name) {
    std::ostringstream oss;
    oss << "Usage: " << program_name
        << " [--config <FILE>] [--port <PORT>] [--root <UPLOAD_ROOT>] [--threads <N>]"
           " [--log-level <trace|debug|info|warn|error>]\n";
    return oss.str();
}

Result<ServerConfig> load_config_file(const std::filesystem::path& path) {
    std::ifstream input(path);
    if (!input) {
        return Err("Cannot open config file " + path.string());
    }
    std::ostringstream text;
    text << input.rdbuf();
    return parse_config(text.str());
}

Result<ServerConfig> parse_config(const std::string& json_text, ServerConfig base) {
    const json doc = json::parse(json_text, nullptr, false);
    if (doc.is_discarded()) {
        return Err(std::string("Config is not valid JSON"));
    }
    if (!doc.is_object()) {
        return Err(std::string("Config must be a JSON object"));
    }
    for (const auto& item : doc.items()) {
        if (known_keys().count(item.key()) == 0) {
            return Err("Unknown config key '" + item.key() + "'");
        }
    }

    ServerConfig config = std::move(base);

#define GUESTDROP_READ_FIELD(expr, target)      \
    do {                                        \
        auto parsed = (expr);                   \
        if (parsed.is_error()) {                \
            return Err(parsed.error());         \
        }                                       \
        target = parsed.value();                \
    } while (false)

    GUESTDROP_READ_FIELD(string_field(doc, "bind_address", config.bind_address), config.bind_address);
    GUESTDROP_READ_FIELD(unsigned_field<std::uint16_t>(doc, "port", config.port), config.port);
    GUESTDROP_READ_FIELD(unsigned_field<std::uint64_t>(doc, "chunk_size", config.chunk_size), config.chunk_size);
    GUESTDROP_READ_FIELD(unsigned_field<std::uint64_t>(doc, "max_file_size", config.max_file_size),
                         config.max_file_size);
    GUESTDROP_READ_FIELD(unsigned_field<std::uint32_t>(doc, "max_chunks", config.max_chunks), config.max_chunks);
    GUESTDROP_READ_FIELD(unsigned_field<std::size_t>(doc, "worker_threads", config.worker_threads),
                         config.worker_threads);
    GUESTDROP_READ_FIELD(unsigned_field<std::uint64_t>(doc, "max_request_bytes", config.max_request_bytes),
                         config.max_request_bytes);
    GUESTDROP_READ_FIELD(string_field(doc, "log_level", config.log_level), config.log_level);

    std::string upload_root = config.upload_root.string();
    GUESTDROP_READ_FIELD(string_field(doc, "upload_root", upload_root), upload_root);
    config.upload_root = upload_root;

    std::string scratch_root = config.scratch_root.string();
    GUESTDROP_READ_FIELD(string_field(doc, "scratch_root", scratch_root), scratch_root);
    config.scratch_root = scratch_root;

    std::uint64_t stale_after = static_cast<std::uint64_t>(config.stale_after.count());
    GUESTDROP_READ_FIELD(unsigned_field<std::uint64_t>(doc, "stale_after_seconds", stale_after), stale_after);
    config.stale_after = std::chrono::seconds(stale_after);

    std::uint64_t reaper_interval = static_cast<std::uint64_t>(config.reaper_interval.count());
    GUESTDROP_READ_FIELD(unsigned_field<std::uint64_t>(doc, "reaper_interval_seconds", reaper_interval),
                         reaper_interval);
    config.reaper_interval = std::chrono::seconds(reaper_interval);

    if (doc.contains("log_file")) {
        std::string log_file;
        GUESTDROP_READ_FIELD(string_field(doc, "log_file", ""), log_file);
        if (!log_file.empty()) {
            config.log_file = std::filesystem::path(log_file);
        }
    }

#undef GUESTDROP_READ_FIELD

    return Ok(std::move(config));
}

void apply_overrides(ServerConfig& config, const CommandLine& cli) {
    if (cli.port) {
        config.port = *cli.port;
    }
    if (cli.upload_root) {
        config.upload_root = *cli.upload_root;
    }
    if (cli.worker_threads) {
        config.worker_threads = *cli.worker_threads;
    }
    if (cli.log_level) {
        config.log_level = *cli.log_level;
    }
}

Result<void> validate(const ServerConfig& config) {
    if (config.port == 0) {
        return Err(std::string("port must be non-zero"));
    }
    if (config.upload_root.empty()) {
        return Err(std::string("upload_root must not be empty"));
    }
    if (config.chunk_size == 0) {
        return Err(std::string("chunk_size must be positive"));
    }
    if (config.max_file_size == 0) {
        return Err(std::string("max_file_size must be positive"));
    }
    if (config.max_chunks == 0) {
        return Err(std::string("max_chunks must be positive"));
    }
    if (config.reaper_interval.count() == 0) {
        return Err(std::string("reaper_interval_seconds must be positive"));
    }
    if (config.effective_max_request_bytes() < config.chunk_size) {
        return Err(std::string("max_request_bytes is smaller than chunk_size"));
    }
    if (spdlog::level::from_str(config.log_level) == spdlog::level::off && config.log_level != "off") {
        return Err("Unknown log level '" + config.log_level + "'");
    }
    return Ok();
}

} // namespace guestdrop::server
