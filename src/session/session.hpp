//===----------------------------------------------------------------------===//
//                         runnerd
//
// session/session.hpp
//
// Per-client execution session
//===----------------------------------------------------------------------===//

#pragma once

#include "common.hpp"
#include "session/session_event.hpp"
#include <parallel_hashmap/phmap.h>

namespace runnerd {

class Session {
public:
    using Ptr = std::shared_ptr<Session>;

    // Resources handed back by ReleaseResources()
    struct Resources {
        PtyProcessPtr process;
        std::string workspace;
        std::string store_workspace;
    };

    Session(uint64_t session_id_p, std::string language_p, EventSinkPtr sink_p);
    ~Session();

    // Non-copyable
    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    // Getters
    uint64_t GetSessionId() const { return session_id; }
    const std::string& GetLanguage() const { return language; }
    TimePoint GetCreatedAt() const { return created_at; }
    const EventSinkPtr& GetSink() const { return sink; }

    // Process and workspaces, attached once after a successful spawn
    void Attach(PtyProcessPtr process_p, std::string workspace_p, std::string store_workspace_p = "");
    PtyProcessPtr GetProcess() const;
    std::string GetWorkspace() const;
    std::string GetStoreWorkspace() const;
    bool HasResources() const;

    // Output pump thread. Detached right away if the session is already closing.
    void SetPumpThread(std::thread pump);

    // Closing state
    bool IsClosing() const { return closing.load(std::memory_order_acquire); }

    // Flips `closing` false -> true. Returns true only for the caller that
    // performed the flip; everybody else must not tear anything down.
    bool BeginClose();

    // Hands the process and workspaces to the closer and clears all
    // per-session state. Only meaningful after BeginClose() returned true.
    Resources ReleaseResources();

    // Called by the closer once the process is dead and the workspaces are
    // gone. WaitTornDown() returns false if that did not happen in time.
    void MarkTornDown();
    bool WaitTornDown(std::chrono::milliseconds timeout);

    // Events. Emit() drops everything once the session is closing.
    bool Emit(const SessionEvent& event);

    // Emits process_ended while the session is still open, at most once
    bool EmitProcessEnded();

    // Emits process_ended regardless of closing, at most once
    bool NotifyProcessEnded();

    // Artifacts
    bool IsArtifactSent(const std::string& path) const;
    void MarkArtifactSent(const std::string& path);
    size_t GetSentArtifactCount() const;

private:
    // Identity
    uint64_t session_id;
    std::string language;
    TimePoint created_at;

    // Owning client
    EventSinkPtr sink;

    // Guards process, workspaces, pump and artifacts
    mutable std::mutex state_mutex;
    PtyProcessPtr process;
    std::string workspace;
    std::string store_workspace;
    std::thread pump_thread;
    phmap::flat_hash_set<std::string> sent_artifacts;

    // Serialises outbound events against the closing flip
    std::mutex emit_mutex;
    std::atomic<bool> closing{false};
    std::atomic<bool> ended_notified{false};

    std::mutex teardown_mutex;
    std::condition_variable teardown_cv;
    bool torn_down = false;
};

} // namespace runnerd
