//===----------------------------------------------------------------------===//
//                         runnerd
//
// config/server_config.hpp
//
// Server configuration
//===----------------------------------------------------------------------===//

#pragma once

#include "common.hpp"
#include "config/config_file.hpp"
#include "config/yaml_config.hpp"
#include <string>
#include <thread>
#include <iostream>
#include <cerrno>
#include <cstdlib>
#include <limits>
#include <algorithm>

namespace runnerd {

struct ServerConfig {
    // Network
    std::string host = "0.0.0.0";
    uint16_t port = 5000;
    uint16_t http_port = 0;  // 0 = disabled, for health/metrics

    // Logging
    std::string log_file;
    std::string log_level = "info";

    // Process
    std::string pid_file;
    std::string config_file;
    std::string user;  // User to run as (privilege dropping)
    bool daemon = false;

    // Threading
    uint32_t io_threads = 0;  // 0 = sized from max_sessions

    // Limits
    uint32_t max_sessions = DEFAULT_MAX_SESSIONS;
    uint32_t max_open_files = 0;  // 0 = sized from max_sessions
    uint32_t max_pending_bytes = DEFAULT_MAX_PENDING_BYTES;  // per client, output not yet sent

    // Sessions
    std::string workspace_root;  // empty = system temp dir
    uint32_t poll_interval_ms = DEFAULT_POLL_INTERVAL_MS;
    uint32_t read_chunk_size = DEFAULT_READ_CHUNK_SIZE;

    // Artifacts
    uint32_t max_image_dimension = DEFAULT_MAX_IMAGE_DIMENSION;

    // Query language
    std::string query_engine = DEFAULT_QUERY_ENGINE;
    std::string prepopulate_script;

    uint32_t GetIoThreadCount() const {
        if (io_threads != 0) {
            return io_threads;
        }
        // One client per session; never more threads than half the cores
        uint32_t wanted = (max_sessions + SESSIONS_PER_IO_THREAD - 1) / SESSIONS_PER_IO_THREAD;
        uint32_t cap = std::max(1u, std::thread::hardware_concurrency() / 2);
        return std::max(1u, std::min(wanted, cap));
    }

    bool Validate(std::string& error) const {
        if (port == 0) {
            error = "Invalid port number";
            return false;
        }
        if (http_port != 0 && http_port == port) {
            error = "HTTP port must differ from the session port";
            return false;
        }
        if (max_sessions == 0) {
            error = "Max sessions must be greater than 0";
            return false;
        }
        if (max_pending_bytes == 0) {
            error = "Max pending bytes must be greater than 0";
            return false;
        }
        if (poll_interval_ms == 0) {
            error = "Poll interval must be greater than 0";
            return false;
        }
        if (read_chunk_size == 0) {
            error = "Read chunk size must be greater than 0";
            return false;
        }
        if (max_image_dimension == 0) {
            error = "Max image dimension must be greater than 0";
            return false;
        }
        if (query_engine.empty()) {
            error = "Query engine must not be empty";
            return false;
        }
        static const char* const kLevels[] = {
            "trace", "debug", "info", "warn", "warning", "error", "fatal", "critical", "off"
        };
        std::string level = log_level;
        std::transform(level.begin(), level.end(), level.begin(), ::tolower);
        if (std::find(std::begin(kLevels), std::end(kLevels), level) == std::end(kLevels)) {
            error = "Invalid log level: " + log_level;
            return false;
        }
        return true;
    }

    // Load from config file (format chosen by extension)
    bool LoadFromFile(const std::string& path, std::string& error) {
        std::string ext;
        auto dot_pos = path.rfind('.');
        if (dot_pos != std::string::npos) {
            ext = path.substr(dot_pos);
            std::transform(ext.begin(), ext.end(), ext.begin(), ::tolower);
        }

        if (ext == ".yaml" || ext == ".yml") {
            return LoadFromYaml(path, error);
        }
        return LoadFromIni(path, error);
    }

    // Load from a flat key=value file
    bool LoadFromIni(const std::string& path, std::string& error) {
        ConfigFile cfg;
        bool ok = cfg.Load(path) &&
            cfg.ReadString("host", host) &&
            cfg.ReadUnsigned("port", port) &&
            cfg.ReadUnsigned("http_port", http_port) &&
            cfg.ReadString("log_file", log_file) &&
            cfg.ReadString("log_level", log_level) &&
            cfg.ReadString("pid_file", pid_file) &&
            cfg.ReadString("user", user) &&
            cfg.ReadBool("daemon", daemon) &&
            cfg.ReadUnsigned("io_threads", io_threads) &&
            cfg.ReadUnsigned("max_sessions", max_sessions) &&
            cfg.ReadUnsigned("max_open_files", max_open_files) &&
            cfg.ReadUnsigned("max_pending_bytes", max_pending_bytes) &&
            cfg.ReadString("workspace_root", workspace_root) &&
            cfg.ReadUnsigned("poll_interval_ms", poll_interval_ms) &&
            cfg.ReadUnsigned("read_chunk_size", read_chunk_size) &&
            cfg.ReadUnsigned("max_image_dimension", max_image_dimension) &&
            cfg.ReadString("query_engine", query_engine) &&
            cfg.ReadString("prepopulate_script", prepopulate_script);

        if (!ok) {
            error = cfg.GetError();
        }
        return ok;
    }

    // Load from YAML config file
    bool LoadFromYaml(const std::string& path, std::string& error) {
        YamlConfig cfg;
        if (!cfg.Load(path)) {
            error = cfg.GetError();
            return false;
        }

        bool ok =
            // Server section
            cfg.Read("server.host", host) &&
            cfg.Read("server.port", port) &&
            cfg.Read("server.http_port", http_port) &&
            // Logging section
            cfg.Read("logging.file", log_file) &&
            cfg.Read("logging.level", log_level) &&
            // Process section
            cfg.Read("process.daemon", daemon) &&
            cfg.Read("process.pid_file", pid_file) &&
            cfg.Read("process.user", user) &&
            // Threads section
            cfg.Read("threads.io", io_threads) &&
            // Limits section
            cfg.Read("limits.max_sessions", max_sessions) &&
            cfg.Read("limits.max_open_files", max_open_files) &&
            cfg.Read("limits.max_pending_bytes", max_pending_bytes) &&
            // Sessions section
            cfg.Read("sessions.workspace_root", workspace_root) &&
            cfg.Read("sessions.poll_interval_ms", poll_interval_ms) &&
            cfg.Read("sessions.read_chunk_size", read_chunk_size) &&
            // Artifacts section
            cfg.Read("artifacts.max_dimension", max_image_dimension) &&
            // Query section
            cfg.Read("query.engine", query_engine) &&
            cfg.Read("query.prepopulate_script", prepopulate_script);

        if (!ok) {
            error = cfg.GetError();
        }
        return ok;
    }
};

inline void PrintUsage(const char* program) {
    std::cout << "Usage: " << program << " [options]\n"
              << "\nOptions:\n"
              << "  -c, --config <path>          Config file path (.yaml/.yml or key=value)\n"
              << "  -h, --host <host>            Host to bind (default: 0.0.0.0)\n"
              << "  -p, --port <port>            Port to bind (default: 5000)\n"
              << "  --daemon                     Run as daemon (background)\n"
              << "  --pid-file <path>            PID file path\n"
              << "  --user <name>                User to run as (drops privileges)\n"
              << "  --log-file <path>            Log file path\n"
              << "  --log-level <level>          Log level (debug, info, warn, error)\n"
              << "  --io-threads <n>             IO thread count (default: from max sessions)\n"
              << "  --max-sessions <n>           Max live sessions (default: 100)\n"
              << "  --http-port <port>           HTTP port for health/metrics (default: disabled)\n"
              << "  --max-open-files <n>         Max open file descriptors\n"
              << "  --max-pending-bytes <n>      Unsent output a client may fall behind (default: 8 MiB)\n"
              << "  --workspace-root <dir>       Parent directory of session workspaces\n"
              << "  --poll-interval <ms>         Output poll interval (default: 100)\n"
              << "  --read-chunk-size <bytes>    Output read size (default: 4096)\n"
              << "  --max-image-dimension <px>   Longest side of sent images (default: 800)\n"
              << "  --query-engine <command>     SQL engine CLI (default: duckdb)\n"
              << "  --prepopulate <path>         SQL script run into every query session's database\n"
              << "  --version                    Show version info\n"
              << "  --help                       Show this help\n";
}

namespace detail {

template<typename T>
T ParseNumberArg(const std::string& flag, const char* value) {
    char* end = nullptr;
    errno = 0;
    unsigned long long number = std::strtoull(value, &end, 10);
    if (value[0] == '\0' || value[0] == '-' || errno != 0 || *end != '\0' ||
        number > static_cast<unsigned long long>(std::numeric_limits<T>::max())) {
        std::cerr << "Invalid value for " << flag << ": " << value << std::endl;
        std::exit(1);
    }
    return static_cast<T>(number);
}

} // namespace detail

inline ServerConfig ParseCommandLine(int argc, char* argv[], bool& show_version) {
    ServerConfig config;
    show_version = false;
    std::string config_file_path;

    // First pass: look for config file
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            config_file_path = argv[++i];
        }
    }

    if (!config_file_path.empty()) {
        std::string error;
        if (!config.LoadFromFile(config_file_path, error)) {
            std::cerr << "Error loading config file: " << error << std::endl;
            std::exit(1);
        }
        config.config_file = config_file_path;
    }

    // Second pass: command line overrides config file
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        bool has_value = i + 1 < argc;

        if (arg == "--help") {
            PrintUsage(argv[0]);
            std::exit(0);
        } else if (arg == "--version") {
            show_version = true;
        } else if ((arg == "-c" || arg == "--config") && has_value) {
            ++i;  // Already processed
        } else if ((arg == "-h" || arg == "--host") && has_value) {
            config.host = argv[++i];
        } else if ((arg == "-p" || arg == "--port") && has_value) {
            config.port = detail::ParseNumberArg<uint16_t>(arg, argv[++i]);
        } else if (arg == "--daemon") {
            config.daemon = true;
        } else if (arg == "--pid-file" && has_value) {
            config.pid_file = argv[++i];
        } else if (arg == "--user" && has_value) {
            config.user = argv[++i];
        } else if (arg == "--log-file" && has_value) {
            config.log_file = argv[++i];
        } else if (arg == "--log-level" && has_value) {
            config.log_level = argv[++i];
        } else if (arg == "--io-threads" && has_value) {
            config.io_threads = detail::ParseNumberArg<uint32_t>(arg, argv[++i]);
        } else if (arg == "--max-sessions" && has_value) {
            config.max_sessions = detail::ParseNumberArg<uint32_t>(arg, argv[++i]);
        } else if (arg == "--http-port" && has_value) {
            config.http_port = detail::ParseNumberArg<uint16_t>(arg, argv[++i]);
        } else if (arg == "--max-open-files" && has_value) {
            config.max_open_files = detail::ParseNumberArg<uint32_t>(arg, argv[++i]);
        } else if (arg == "--max-pending-bytes" && has_value) {
            config.max_pending_bytes = detail::ParseNumberArg<uint32_t>(arg, argv[++i]);
        } else if (arg == "--workspace-root" && has_value) {
            config.workspace_root = argv[++i];
        } else if (arg == "--poll-interval" && has_value) {
            config.poll_interval_ms = detail::ParseNumberArg<uint32_t>(arg, argv[++i]);
        } else if (arg == "--read-chunk-size" && has_value) {
            config.read_chunk_size = detail::ParseNumberArg<uint32_t>(arg, argv[++i]);
        } else if (arg == "--max-image-dimension" && has_value) {
            config.max_image_dimension = detail::ParseNumberArg<uint32_t>(arg, argv[++i]);
        } else if (arg == "--query-engine" && has_value) {
            config.query_engine = argv[++i];
        } else if (arg == "--prepopulate" && has_value) {
            config.prepopulate_script = argv[++i];
        } else {
            std::cerr << "Unknown option: " << arg << std::endl;
            PrintUsage(argv[0]);
            std::exit(1);
        }
    }

    return config;
}

} // namespace runnerd
