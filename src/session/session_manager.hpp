//===----------------------------------------------------------------------===//
//                         runnerd
//
// session/session_manager.hpp
//
// Session table, lifecycle and cleanup coordination
//===----------------------------------------------------------------------===//

#pragma once

#include "common.hpp"
#include "session/session.hpp"
#include "process/process_launcher.hpp"
#include "artifacts/artifact_scanner.hpp"
#include "pump/output_pump.hpp"
#include <parallel_hashmap/phmap.h>

namespace runnerd {

class SessionManager {
public:
    struct Config {
        // Session settings
        size_t max_sessions;
        std::string workspace_root;

        // Output pump settings
        std::chrono::milliseconds poll_interval;
        size_t read_chunk_size;

        // Artifacts
        uint32_t max_image_dimension;

        // Query language
        std::string query_engine;

        Config()
            : max_sessions(DEFAULT_MAX_SESSIONS)
            , poll_interval(DEFAULT_POLL_INTERVAL_MS)
            , read_chunk_size(DEFAULT_READ_CHUNK_SIZE)
            , max_image_dimension(DEFAULT_MAX_IMAGE_DIMENSION)
            , query_engine(DEFAULT_QUERY_ENGINE) {}
    };

    enum class InputResult {
        DELIVERED,
        NO_SESSION,
        SESSION_CLOSED,
        PROCESS_GONE,
        IO_FAILURE
    };

    struct Stats {
        size_t active_sessions = 0;
        size_t active_pumps = 0;
        uint64_t sessions_started = 0;
        uint64_t sessions_closed = 0;
        uint64_t start_failures = 0;
        uint64_t artifacts_sent = 0;
        uint64_t output_bytes = 0;
        uint64_t output_read_errors = 0;
        uint64_t stalled_sessions = 0;
    };

    explicit SessionManager(const Config& config_p = Config{},
                            std::shared_ptr<QueryStore> query_store_p = nullptr);

    // Closes every session and waits for all output pumps to exit
    ~SessionManager();

    // Non-copyable
    SessionManager(const SessionManager&) = delete;
    SessionManager& operator=(const SessionManager&) = delete;

    // Starts `code` for client `session_id`, replacing any session it still
    // has. Failures are reported to `sink`; returns nullptr in that case.
    SessionPtr StartSession(uint64_t session_id,
                            const std::string& language,
                            const std::string& code,
                            const EventSinkPtr& sink);

    // Writes one line to the client's running program
    InputResult SendInput(uint64_t session_id, const std::string& line, const EventSinkPtr& sink);

    // Kill request from the client. Always leaves the client with exactly one
    // process_ended for its current session.
    void Disconnect(uint64_t session_id, const EventSinkPtr& sink);

    // Idempotent teardown. Returns true only for the call that tore the
    // session down.
    bool CloseSession(uint64_t session_id);
    bool CloseSession(const SessionPtr& session);

    // Closes every session. Returns the number torn down.
    size_t CloseAll();

    // Waits until all pump threads have exited
    bool WaitForPumps(std::chrono::milliseconds timeout);

    SessionPtr GetSession(uint64_t session_id);

    // Statistics
    size_t GetActiveSessionCount() const;
    size_t GetMaxSessions() const { return config.max_sessions; }
    Stats GetStats() const;

    const Config& GetConfig() const { return config; }
    const ProcessLauncher& GetLauncher() const { return launcher; }

private:
    // Claims one of max_sessions slots. Teardown gives it back.
    bool ReserveSlot();
    void ReleaseSlot();

    // Closes `session` and returns once its teardown has finished, whoever
    // performs it
    void CloseAndWait(const SessionPtr& session);

    // Inserts `session`, closing whatever the table held for its id
    void Register(const SessionPtr& session);

    void StartPump(const SessionPtr& session, PtyProcessPtr process);
    void RunPump(const SessionPtr& session, PtyProcessPtr process);

    // Release, kill and delete. Caller must have won BeginClose().
    void Teardown(const SessionPtr& session);

private:
    Config config;

    ProcessLauncher launcher;
    ArtifactScanner scanner;
    OutputPump::Config pump_config;

    // At most one live session per client id
    phmap::parallel_flat_hash_map<
        uint64_t,
        SessionPtr,
        phmap::priv::hash_default_hash<uint64_t>,
        phmap::priv::hash_default_eq<uint64_t>,
        phmap::priv::Allocator<phmap::priv::Pair<const uint64_t, SessionPtr>>,
        4,  // 2^4 = 16 submaps
        std::mutex
    > sessions;

    // Slots held by sessions from launch until teardown
    std::atomic<size_t> reserved_slots{0};

    // Statistics
    std::atomic<uint64_t> sessions_started{0};
    std::atomic<uint64_t> sessions_closed{0};
    std::atomic<uint64_t> start_failures{0};
    std::atomic<uint64_t> artifacts_sent{0};
    std::atomic<uint64_t> output_bytes{0};
    std::atomic<uint64_t> output_read_errors{0};
    std::atomic<uint64_t> stalled_sessions{0};

    // Pump threads capture `this`
    mutable std::mutex pump_mutex;
    std::condition_variable pump_cv;
    size_t active_pumps = 0;
};

using InputResult = SessionManager::InputResult;

inline const char* InputResultToString(InputResult result) {
    switch (result) {
        case InputResult::DELIVERED:      return "DELIVERED";
        case InputResult::NO_SESSION:     return "NO_SESSION";
        case InputResult::SESSION_CLOSED: return "SESSION_CLOSED";
        case InputResult::PROCESS_GONE:   return "PROCESS_GONE";
        case InputResult::IO_FAILURE:     return "IO_FAILURE";
        default:                          return "UNKNOWN";
    }
}

} // namespace runnerd
