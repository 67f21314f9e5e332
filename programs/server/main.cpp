//===----------------------------------------------------------------------===//
//                         runnerd
//
// main.cpp
//
// Server main entry point
//===----------------------------------------------------------------------===//

#include "common.hpp"
#include "config/server_config.hpp"
#include "network/tcp_server.hpp"
#include "session/session_manager.hpp"
#include "query/query_store.hpp"
#include "http/http_server.hpp"
#include "logging/logger.hpp"
#include "version.hpp"

#include <algorithm>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <unistd.h>
#include <sys/stat.h>
#include <sys/resource.h>
#include <fcntl.h>
#include <pwd.h>
#include <grp.h>
#include <execinfo.h>
#include <cxxabi.h>

#ifdef WITH_SYSTEMD
#include <systemd/sd-daemon.h>
#endif

using namespace runnerd;

namespace {

std::shared_ptr<TcpServer> g_server;
std::shared_ptr<HttpServer> g_http_server;
std::string g_pid_file;
ServerConfig g_config;

// Descriptors a session needs besides its pty master: the child's side of
// the terminal while it is being set up, plus slack for workspace files.
constexpr rlim_t FDS_PER_SESSION = 4;
constexpr rlim_t BASE_FDS = 256;

//===----------------------------------------------------------------------===//
// Version Info
//===----------------------------------------------------------------------===//
void PrintVersion() {
    std::cout << "runnerd " << RUNNERD_VERSION << " (" << RUNNERD_GIT_COMMIT << ")\n"
              << "Build type: " << RUNNERD_BUILD_TYPE << "\n"
              << "Build time: " << RUNNERD_BUILD_TIME << "\n"
              << "Languages: ";
    auto languages = SupportedLanguages();
    for (size_t i = 0; i < languages.size(); i++) {
        std::cout << (i ? ", " : "") << languages[i];
    }
    std::cout << "\n";
}

//===----------------------------------------------------------------------===//
// Daemon Mode
//===----------------------------------------------------------------------===//

// Runs before the logger exists, so failures go to `error`
bool Daemonize(std::string& error) {
    for (int round = 0; round < 2; round++) {
        pid_t pid = fork();
        if (pid < 0) {
            error = std::string("fork failed: ") + strerror(errno);
            return false;
        }
        if (pid > 0) {
            _exit(0);
        }
        if (round == 0 && setsid() < 0) {
            error = std::string("setsid failed: ") + strerror(errno);
            return false;
        }
    }

    umask(022);
    if (chdir("/") < 0) {
        error = std::string("chdir failed: ") + strerror(errno);
        return false;
    }

    int null_fd = open("/dev/null", O_RDWR);
    if (null_fd < 0) {
        error = std::string("cannot open /dev/null: ") + strerror(errno);
        return false;
    }
    for (int fd : {STDIN_FILENO, STDOUT_FILENO, STDERR_FILENO}) {
        dup2(null_fd, fd);
    }
    if (null_fd > STDERR_FILENO) {
        close(null_fd);
    }
    return true;
}

//===----------------------------------------------------------------------===//
// PID File
//===----------------------------------------------------------------------===//

// Refuses to overwrite the PID file of a runnerd that is still alive
bool ClaimPidFile(const std::string& path, std::string& error) {
    {
        std::ifstream existing(path);
        pid_t other = 0;
        if (existing >> other && other > 0 && other != getpid() && kill(other, 0) == 0) {
            error = "runnerd already running (pid " + std::to_string(other) + ", " + path + ")";
            return false;
        }
    }

    std::ofstream file(path, std::ios::trunc);
    if (!file) {
        error = "cannot write PID file " + path + ": " + strerror(errno);
        return false;
    }
    file << getpid() << '\n';
    return static_cast<bool>(file);
}

void ReleasePidFile() {
    if (!g_pid_file.empty()) {
        unlink(g_pid_file.c_str());
    }
}

//===----------------------------------------------------------------------===//
// Privileges and Limits
//===----------------------------------------------------------------------===//

// Creates the workspace root and, when running as root with --user, hands
// it to that user so sessions can still create workspaces after the drop.
bool PrepareWorkspaceRoot(const ServerConfig& config, std::string& error) {
    if (config.workspace_root.empty()) {
        return true;
    }

    std::error_code ec;
    std::filesystem::create_directories(config.workspace_root, ec);
    if (ec) {
        error = "cannot create workspace root " + config.workspace_root + ": " + ec.message();
        return false;
    }

    if (config.user.empty() || getuid() != 0) {
        return true;
    }
    struct passwd* pw = getpwnam(config.user.c_str());
    if (!pw) {
        error = "user not found: " + config.user;
        return false;
    }
    if (chown(config.workspace_root.c_str(), pw->pw_uid, pw->pw_gid) < 0) {
        error = "cannot chown " + config.workspace_root + ": " + strerror(errno);
        return false;
    }
    return true;
}

bool DropPrivileges(const std::string& username, std::string& error) {
    if (username.empty()) {
        return true;
    }
    if (getuid() != 0) {
        LOG_WARN("main", "Not running as root, keeping current user instead of " + username);
        return true;
    }

    struct passwd* pw = getpwnam(username.c_str());
    if (!pw) {
        error = "user not found: " + username;
        return false;
    }
    // Group first: setgid is not permitted once the uid is gone
    if (initgroups(username.c_str(), pw->pw_gid) < 0 ||
        setgid(pw->pw_gid) < 0 ||
        setuid(pw->pw_uid) < 0) {
        error = "cannot switch to " + username + ": " + strerror(errno);
        return false;
    }

    LOG_INFO("main", "Running as user " + username + " (uid " + std::to_string(pw->pw_uid) + ")");
    return true;
}

// Without an explicit max_open_files the soft limit is raised far enough
// for max_sessions concurrent ptys, capped at the hard limit.
void SetFileLimit(const ServerConfig& config) {
    struct rlimit rlim;
    if (getrlimit(RLIMIT_NOFILE, &rlim) < 0) {
        LOG_WARN("main", "getrlimit(RLIMIT_NOFILE) failed: " + std::string(strerror(errno)));
        return;
    }

    rlim_t wanted;
    if (config.max_open_files > 0) {
        wanted = config.max_open_files;
        rlim.rlim_max = std::max(rlim.rlim_max, wanted);
    } else {
        wanted = std::min(rlim.rlim_max, BASE_FDS + FDS_PER_SESSION * config.max_sessions);
        if (rlim.rlim_cur >= wanted) {
            return;
        }
    }
    rlim.rlim_cur = wanted;

    if (setrlimit(RLIMIT_NOFILE, &rlim) < 0) {
        LOG_WARN("main", "Cannot set open file limit to " + std::to_string(wanted) + ": " +
                 strerror(errno));
    } else {
        LOG_INFO("main", "Open file limit: " + std::to_string(wanted));
    }
}

//===----------------------------------------------------------------------===//
// Signals
//===----------------------------------------------------------------------===//

// "binary(mangled+0x1f) [0x...]" -> demangled name, or the raw line
std::string DescribeFrame(const char* frame) {
    std::string line(frame);
    size_t open = line.find('(');
    size_t plus = line.find('+', open == std::string::npos ? 0 : open);
    if (open == std::string::npos || plus == std::string::npos || plus <= open + 1) {
        return line;
    }

    std::string mangled = line.substr(open + 1, plus - open - 1);
    int status = 0;
    char* demangled = abi::__cxa_demangle(mangled.c_str(), nullptr, nullptr, &status);
    if (status != 0 || !demangled) {
        return line;
    }
    std::string result = demangled;
    free(demangled);
    return result;
}

void CrashHandler(int signal) {
    std::cerr << "\n!!! runnerd crashed: " << strsignal(signal) << " (" << signal << ")\n";

    void* frames[64];
    int depth = backtrace(frames, 64);
    char** symbols = backtrace_symbols(frames, depth);
    if (symbols) {
        for (int i = 0; i < depth; i++) {
            std::cerr << "  #" << i << " " << DescribeFrame(symbols[i]) << "\n";
        }
        free(symbols);
    }

    ReleasePidFile();

    std::signal(signal, SIG_DFL);
    raise(signal);
}

void InstallCrashHandlers() {
    for (int sig : {SIGSEGV, SIGABRT, SIGFPE, SIGBUS, SIGILL}) {
        std::signal(sig, CrashHandler);
    }
}

// Blocks the control signals in this thread and every thread created
// afterwards; the main loop collects them with sigwait(). Session children
// reset their mask in PtyProcess::Spawn.
sigset_t BlockControlSignals() {
    sigset_t mask;
    sigemptyset(&mask);
    sigaddset(&mask, SIGINT);
    sigaddset(&mask, SIGTERM);
    sigaddset(&mask, SIGHUP);
    pthread_sigmask(SIG_BLOCK, &mask, nullptr);

    // A client that vanishes mid-write must not kill the server
    std::signal(SIGPIPE, SIG_IGN);
    return mask;
}

void ReloadConfig() {
    if (g_config.config_file.empty()) {
        LOG_WARN("main", "SIGHUP ignored: started without a config file");
        return;
    }

    ServerConfig reloaded;
    std::string error;
    if (!reloaded.LoadFromFile(g_config.config_file, error)) {
        LOG_ERROR("main", "Reload of " + g_config.config_file + " failed: " + error);
        return;
    }
    if (!Logger::IsValidLevel(reloaded.log_level)) {
        LOG_ERROR("main", "Reload rejected, invalid log level: " + reloaded.log_level);
        return;
    }

    if (reloaded.log_level != g_config.log_level) {
        Logger::SetLevel(reloaded.log_level);
        g_config.log_level = reloaded.log_level;
        LOG_INFO("main", "Log level is now " + Logger::GetLevel());
    } else {
        LOG_INFO("main", "Reloaded " + g_config.config_file + ", nothing to apply");
    }
}

//===----------------------------------------------------------------------===//
// Service Manager
//===----------------------------------------------------------------------===//
void NotifyServiceManager(const std::string& state) {
#ifdef WITH_SYSTEMD
    sd_notify(0, state.c_str());
#else
    (void)state;
#endif
}

//===----------------------------------------------------------------------===//
// Startup
//===----------------------------------------------------------------------===//

SessionManager::Config MakeSessionConfig(const ServerConfig& config) {
    SessionManager::Config sm_config;
    sm_config.max_sessions = config.max_sessions;
    sm_config.workspace_root = config.workspace_root;
    sm_config.poll_interval = std::chrono::milliseconds(config.poll_interval_ms);
    sm_config.read_chunk_size = config.read_chunk_size;
    sm_config.max_image_dimension = config.max_image_dimension;
    sm_config.query_engine = config.query_engine;
    return sm_config;
}

void LogConfiguration(const ServerConfig& config) {
    RLOG_INFO("main", "Starting runnerd {} ({})", RUNNERD_VERSION, RUNNERD_GIT_COMMIT);
    RLOG_INFO("main", "  Listen: {}:{} ({} io threads)", config.host, config.port,
              config.GetIoThreadCount());
    if (config.http_port > 0) {
        RLOG_INFO("main", "  HTTP: {}:{}", config.host, config.http_port);
    }
    RLOG_INFO("main", "  Sessions: max {}, workspaces in {}", config.max_sessions,
              config.workspace_root.empty() ? std::string("system temp dir") : config.workspace_root);
    RLOG_INFO("main", "  Output: poll {}ms, chunk {} bytes", config.poll_interval_ms,
              config.read_chunk_size);
    RLOG_INFO("main", "  Images: longest side {}px{}", config.max_image_dimension,
              ImageCodecAvailable() ? "" : " (codec not built, sent as-is)");
    RLOG_INFO("main", "  Queries: {}{}", config.query_engine,
              config.prepopulate_script.empty() ? std::string()
                                                : ", prepopulated from " + config.prepopulate_script);
}

int Run(int argc, char* argv[]) {
    bool show_version = false;
    g_config = ParseCommandLine(argc, argv, show_version);
    if (show_version) {
        PrintVersion();
        return 0;
    }

    std::string error;
    if (!g_config.Validate(error)) {
        std::cerr << "Configuration error: " << error << std::endl;
        return 1;
    }

    if (g_config.daemon && !Daemonize(error)) {
        std::cerr << "Cannot daemonize: " << error << std::endl;
        return 1;
    }

    Logger::Initialize(g_config.log_file, g_config.log_level);

    if (!g_config.pid_file.empty()) {
        if (!ClaimPidFile(g_config.pid_file, error)) {
            LOG_FATAL("main", error);
            return 1;
        }
        g_pid_file = g_config.pid_file;
    }

    SetFileLimit(g_config);

    if (!PrepareWorkspaceRoot(g_config, error) || !DropPrivileges(g_config.user, error)) {
        LOG_FATAL("main", error);
        ReleasePidFile();
        return 1;
    }

    sigset_t control_signals = BlockControlSignals();
    InstallCrashHandlers();

    LogConfiguration(g_config);

    // The template database must exist before the first query session
    std::shared_ptr<QueryStore> query_store;
    if (!g_config.prepopulate_script.empty()) {
        query_store = std::make_shared<QueryStore>(g_config.prepopulate_script,
                                                   g_config.workspace_root);
        if (!query_store->Prepare(error)) {
            LOG_FATAL("main", error);
            ReleasePidFile();
            return 1;
        }
    }

    auto session_manager = std::make_shared<SessionManager>(MakeSessionConfig(g_config), query_store);

    g_server = std::make_shared<TcpServer>(g_config, session_manager);
    g_server->Start();

    if (g_config.http_port > 0) {
        g_http_server = std::make_shared<HttpServer>(g_config.host, g_config.http_port, g_server.get());
        g_http_server->Start();
    }

    LOG_INFO("main", "runnerd is ready");
    NotifyServiceManager("READY=1\nSTATUS=Accepting sessions on port " +
                         std::to_string(g_server->GetPort()));

    int sig = 0;
    while (sigwait(&control_signals, &sig) == 0 && sig == SIGHUP) {
        NotifyServiceManager("RELOADING=1");
        ReloadConfig();
        NotifyServiceManager("READY=1");
    }
    LOG_INFO("main", std::string("Received ") + strsignal(sig) + ", shutting down");
    NotifyServiceManager("STOPPING=1");

    if (g_http_server) {
        g_http_server->Stop();
        g_http_server.reset();
    }

    // Dropping the connections closes their sessions
    g_server->Stop();
    g_server.reset();

    size_t leftover = session_manager->CloseAll();
    if (leftover > 0) {
        LOG_INFO("main", "Killed " + std::to_string(leftover) + " sessions without a connection");
    }
    if (!session_manager->WaitForPumps(std::chrono::seconds(5))) {
        LOG_WARN("main", "Output pumps still running after 5s");
    }
    session_manager.reset();
    query_store.reset();

    ReleasePidFile();
    LOG_INFO("main", "runnerd stopped");
    Logger::Shutdown();
    return 0;
}

} // anonymous namespace

//===----------------------------------------------------------------------===//
// Main
//===----------------------------------------------------------------------===//
int main(int argc, char* argv[]) {
    try {
        return Run(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        LOG_FATAL("main", std::string("Fatal error: ") + e.what());
        ReleasePidFile();
        return 1;
    }
}
