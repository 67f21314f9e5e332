//===----------------------------------------------------------------------===//
//                         runnerd
//
// session/session_manager.cpp
//
// Session manager implementation
//===----------------------------------------------------------------------===//

#include "session/session_manager.hpp"
#include "process/pty_process.hpp"
#include "process/workspace.hpp"
#include "logging/logger.hpp"

#include <system_error>

namespace runnerd {

namespace {

std::string TrimCode(const std::string& code) {
    auto begin = code.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return "";
    }
    auto end = code.find_last_not_of(" \t\r\n");
    return code.substr(begin, end - begin + 1);
}

void Notify(const EventSinkPtr& sink, const SessionEvent& event) {
    if (sink) {
        sink->Emit(event);
    }
}

ProcessLauncher::Config MakeLauncherConfig(const SessionManager::Config& config) {
    ProcessLauncher::Config launcher_config;
    launcher_config.workspace_root = config.workspace_root;
    launcher_config.query_engine = config.query_engine;
    return launcher_config;
}

// Upper bound for waiting on another thread's teardown of a stale session
constexpr std::chrono::seconds kTeardownWait(10);

ArtifactScanner::Config MakeScannerConfig(const SessionManager::Config& config) {
    ArtifactScanner::Config scanner_config;
    scanner_config.max_dimension = config.max_image_dimension;
    return scanner_config;
}

} // anonymous namespace

SessionManager::SessionManager(const Config& config_p, std::shared_ptr<QueryStore> query_store_p)
    : config(config_p)
    , launcher(MakeLauncherConfig(config_p), std::move(query_store_p))
    , scanner(MakeScannerConfig(config_p)) {

    pump_config.poll_interval = config.poll_interval;
    pump_config.read_chunk_size = config.read_chunk_size;

    LOG_INFO("session_manager", "Session manager initialized (max_sessions=" +
             std::to_string(config.max_sessions) + ", poll_interval=" +
             std::to_string(config.poll_interval.count()) + "ms)");
}

SessionManager::~SessionManager() {
    size_t closed = CloseAll();

    std::unique_lock<std::mutex> lock(pump_mutex);
    pump_cv.wait(lock, [this] { return active_pumps == 0; });

    LOG_INFO("session_manager", "Session manager shutdown (" + std::to_string(closed) +
             " sessions closed)");
}

SessionPtr SessionManager::StartSession(uint64_t session_id,
                                        const std::string& language,
                                        const std::string& code,
                                        const EventSinkPtr& sink) {
    std::string key = NormalizeLanguageKey(language);
    const LanguageSpec* spec = FindLanguage(key);
    if (!spec) {
        start_failures++;
        Notify(sink, SessionEvent::Error(SessionErrorCode::UNSUPPORTED_LANGUAGE,
                                         "Unsupported language '" + key + "'"));
        return nullptr;
    }

    std::string source = TrimCode(code);
    if (source.empty()) {
        start_failures++;
        Notify(sink, SessionEvent::Error(SessionErrorCode::EMPTY_CODE, "No code provided"));
        return nullptr;
    }

    // A client runs one program at a time
    if (SessionPtr stale = GetSession(session_id)) {
        CloseAndWait(stale);
    }

    if (!ReserveSlot()) {
        start_failures++;
        LOG_WARN("session_manager", "Maximum sessions reached: " +
                 std::to_string(config.max_sessions));
        Notify(sink, SessionEvent::Error(SessionErrorCode::SESSION_LIMIT, "Maximum sessions reached"));
        return nullptr;
    }

    ProcessLauncher::Launch launch;
    try {
        launch = launcher.Start(session_id, *spec, source);
    } catch (const std::exception& e) {
        ReleaseSlot();
        start_failures++;
        Notify(sink, SessionEvent::Error(SessionErrorCode::SPAWN_FAILURE,
                                         std::string("Failed to start process: ") + e.what()));
        return nullptr;
    }

    auto session = std::make_shared<Session>(session_id, key, sink);
    session->Attach(launch.process, launch.workspace, launch.store_workspace);

    Register(session);
    sessions_started++;

    LOG_INFO("session_manager", "Session " + std::to_string(session_id) + " started " + key +
             " (pid " + std::to_string(launch.process->GetPid()) + ", active: " +
             std::to_string(sessions.size()) + ")");

    session->Emit(SessionEvent::Started());
    StartPump(session, launch.process);

    return session;
}

bool SessionManager::ReserveSlot() {
    size_t used = reserved_slots.load();
    do {
        if (used >= config.max_sessions) {
            return false;
        }
    } while (!reserved_slots.compare_exchange_weak(used, used + 1));
    return true;
}

void SessionManager::ReleaseSlot() {
    reserved_slots--;
}

void SessionManager::CloseAndWait(const SessionPtr& session) {
    if (CloseSession(session)) {
        return;
    }
    // Somebody else won BeginClose and may still be killing or deleting
    if (!session->WaitTornDown(kTeardownWait)) {
        LOG_WARN("session_manager", "Session " + std::to_string(session->GetSessionId()) +
                 " is still tearing down after " + std::to_string(kTeardownWait.count()) + "s");
    }
}

void SessionManager::Register(const SessionPtr& session) {
    const uint64_t session_id = session->GetSessionId();

    for (;;) {
        SessionPtr displaced;
        bool inserted = sessions.try_emplace_l(
            session_id,
            [&displaced](auto& item) { displaced = item.second; },
            session);
        if (inserted) {
            return;
        }

        // A concurrent START for the same client got in first; its teardown
        // erases it from the table
        CloseAndWait(displaced);
        sessions.erase_if(session_id, [&displaced](auto& item) {
            return item.second == displaced;
        });
    }
}

void SessionManager::StartPump(const SessionPtr& session, PtyProcessPtr process) {
    {
        std::lock_guard<std::mutex> lock(pump_mutex);
        active_pumps++;
    }

    try {
        std::thread pump([this, session, process]() {
            RunPump(session, process);
        });
        session->SetPumpThread(std::move(pump));
    } catch (const std::system_error& e) {
        LOG_ERROR("session_manager", "Session " + std::to_string(session->GetSessionId()) +
                  " cannot start output pump: " + e.what());
        session->Emit(SessionEvent::Error(SessionErrorCode::SPAWN_FAILURE,
                                          std::string("Failed to start output reader: ") + e.what()));
        session->EmitProcessEnded();
        CloseSession(session);

        std::lock_guard<std::mutex> lock(pump_mutex);
        active_pumps--;
        pump_cv.notify_all();
    }
}

void SessionManager::RunPump(const SessionPtr& session, PtyProcessPtr process) {
    const uint64_t session_id = session->GetSessionId();
    try {
        OutputPump pump(session, std::move(process), scanner, pump_config);
        OutputPump::Outcome outcome = pump.Run();

        artifacts_sent += pump.GetArtifactsSent();
        output_bytes += pump.GetBytesForwarded();
        if (outcome == OutputPump::Outcome::IO_ERROR) {
            output_read_errors++;
        } else if (outcome == OutputPump::Outcome::STALLED) {
            stalled_sessions++;
        }

        LOG_DEBUG("pump", "Session " + std::to_string(session_id) + " pump " +
                  OutputPump::OutcomeToString(outcome) + " (" +
                  std::to_string(pump.GetBytesForwarded()) + " bytes, " +
                  std::to_string(pump.GetArtifactsSent()) + " images)");
    } catch (const std::exception& e) {
        LOG_ERROR("pump", "Session " + std::to_string(session_id) + " pump failed: " + e.what());
    }

    try {
        CloseSession(session);
    } catch (const std::exception& e) {
        LOG_ERROR("pump", "Session " + std::to_string(session_id) + " cleanup failed: " + e.what());
    }

    std::lock_guard<std::mutex> lock(pump_mutex);
    active_pumps--;
    pump_cv.notify_all();
}

SessionManager::InputResult SessionManager::SendInput(uint64_t session_id,
                                                      const std::string& line,
                                                      const EventSinkPtr& sink) {
    SessionPtr session = GetSession(session_id);
    if (!session) {
        Notify(sink, SessionEvent::Output(NOTICE_NO_ACTIVE_SESSION));
        Notify(sink, SessionEvent::ProcessEnded());
        return InputResult::NO_SESSION;
    }

    if (session->IsClosing()) {
        Notify(sink, SessionEvent::Output(NOTICE_SESSION_CLOSED));
        session->NotifyProcessEnded();
        CloseSession(session);
        return InputResult::SESSION_CLOSED;
    }

    PtyProcessPtr process = session->GetProcess();
    if (!process || !process->IsAlive()) {
        // Stop the pump before answering so nothing follows the notice
        CloseSession(session);
        Notify(sink, SessionEvent::Output(NOTICE_NO_ACTIVE_SESSION));
        session->NotifyProcessEnded();
        return InputResult::PROCESS_GONE;
    }

    try {
        process->WriteLine(line);
    } catch (const std::exception& e) {
        if (!session->IsClosing()) {
            LOG_WARN("session_manager", "Session " + std::to_string(session_id) +
                     " input failed: " + e.what());
            session->Emit(SessionEvent::Error(SessionErrorCode::IO_FAILURE,
                                              std::string("Failed to send input: ") + e.what()));
        }
        return InputResult::IO_FAILURE;
    }

    return InputResult::DELIVERED;
}

void SessionManager::Disconnect(uint64_t session_id, const EventSinkPtr& sink) {
    SessionPtr session = GetSession(session_id);
    if (!session) {
        // Nothing to kill; the client still expects its session to end
        Notify(sink, SessionEvent::ProcessEnded());
        return;
    }

    if (session->BeginClose()) {
        Notify(session->GetSink(), SessionEvent::Output(NOTICE_SESSION_KILLED));
        Teardown(session);
        LOG_INFO("session_manager", "Session " + std::to_string(session_id) + " killed by user");
    }

    session->NotifyProcessEnded();
}

bool SessionManager::CloseSession(uint64_t session_id) {
    return CloseSession(GetSession(session_id));
}

bool SessionManager::CloseSession(const SessionPtr& session) {
    if (!session || !session->BeginClose()) {
        return false;
    }
    Teardown(session);
    return true;
}

void SessionManager::Teardown(const SessionPtr& session) {
    const uint64_t session_id = session->GetSessionId();
    const size_t images = session->GetSentArtifactCount();
    Session::Resources resources = session->ReleaseResources();

    if (resources.process) {
        resources.process->Kill();
    }
    RemoveWorkspace(resources.workspace);
    RemoveWorkspace(resources.store_workspace);

    sessions.erase_if(session_id, [&session](auto& item) {
        return item.second == session;
    });
    sessions_closed++;
    ReleaseSlot();
    session->MarkTornDown();

    LOG_DEBUG("session_manager", "Closed session " + std::to_string(session_id) + " (" +
              std::to_string(images) + " images sent, active: " +
              std::to_string(sessions.size()) + ")");
}

size_t SessionManager::CloseAll() {
    std::vector<SessionPtr> all;
    sessions.for_each([&all](const auto& item) {
        all.push_back(item.second);
    });

    size_t closed = 0;
    for (const auto& session : all) {
        if (CloseSession(session)) {
            closed++;
        }
    }
    return closed;
}

bool SessionManager::WaitForPumps(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(pump_mutex);
    return pump_cv.wait_for(lock, timeout, [this] { return active_pumps == 0; });
}

SessionPtr SessionManager::GetSession(uint64_t session_id) {
    SessionPtr result = nullptr;
    sessions.if_contains(session_id, [&result](const auto& item) {
        result = item.second;
    });
    return result;
}

size_t SessionManager::GetActiveSessionCount() const {
    return sessions.size();
}

SessionManager::Stats SessionManager::GetStats() const {
    Stats stats;
    stats.active_sessions = sessions.size();
    stats.sessions_started = sessions_started.load();
    stats.sessions_closed = sessions_closed.load();
    stats.start_failures = start_failures.load();
    stats.artifacts_sent = artifacts_sent.load();
    stats.output_bytes = output_bytes.load();
    stats.output_read_errors = output_read_errors.load();
    stats.stalled_sessions = stalled_sessions.load();

    std::lock_guard<std::mutex> lock(pump_mutex);
    stats.active_pumps = active_pumps;
    return stats;
}

} // namespace runnerd
