//===----------------------------------------------------------------------===//
//                         runnerd
//
// session/session.cpp
//
// Session implementation
//===----------------------------------------------------------------------===//

#include "session/session.hpp"
#include "process/pty_process.hpp"
#include "logging/logger.hpp"

namespace runnerd {

Session::Session(uint64_t session_id_p, std::string language_p, EventSinkPtr sink_p)
    : session_id(session_id_p)
    , language(std::move(language_p))
    , created_at(Clock::now())
    , sink(std::move(sink_p)) {
}

Session::~Session() {
    // A pump that outlives the session keeps its own reference, never join here
    if (pump_thread.joinable()) {
        pump_thread.detach();
    }
}

void Session::Attach(PtyProcessPtr process_p, std::string workspace_p, std::string store_workspace_p) {
    std::lock_guard<std::mutex> lock(state_mutex);
    process = std::move(process_p);
    workspace = std::move(workspace_p);
    store_workspace = std::move(store_workspace_p);
}

PtyProcessPtr Session::GetProcess() const {
    std::lock_guard<std::mutex> lock(state_mutex);
    return process;
}

std::string Session::GetWorkspace() const {
    std::lock_guard<std::mutex> lock(state_mutex);
    return workspace;
}

std::string Session::GetStoreWorkspace() const {
    std::lock_guard<std::mutex> lock(state_mutex);
    return store_workspace;
}

bool Session::HasResources() const {
    std::lock_guard<std::mutex> lock(state_mutex);
    return process != nullptr || !workspace.empty() || !store_workspace.empty();
}

void Session::SetPumpThread(std::thread pump) {
    std::lock_guard<std::mutex> lock(state_mutex);
    if (IsClosing()) {
        pump.detach();
        return;
    }
    pump_thread = std::move(pump);
}

bool Session::BeginClose() {
    std::lock_guard<std::mutex> lock(emit_mutex);
    return !closing.exchange(true, std::memory_order_acq_rel);
}

Session::Resources Session::ReleaseResources() {
    std::lock_guard<std::mutex> lock(state_mutex);

    Resources resources;
    resources.process = std::move(process);
    resources.workspace = std::move(workspace);
    resources.store_workspace = std::move(store_workspace);

    process.reset();
    workspace.clear();
    store_workspace.clear();
    sent_artifacts.clear();

    // The pump may be the caller itself; it finishes on its own
    if (pump_thread.joinable()) {
        pump_thread.detach();
    }

    return resources;
}

void Session::MarkTornDown() {
    {
        std::lock_guard<std::mutex> lock(teardown_mutex);
        torn_down = true;
    }
    teardown_cv.notify_all();
}

bool Session::WaitTornDown(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(teardown_mutex);
    return teardown_cv.wait_for(lock, timeout, [this] { return torn_down; });
}

bool Session::Emit(const SessionEvent& event) {
    std::lock_guard<std::mutex> lock(emit_mutex);
    if (closing.load(std::memory_order_acquire)) {
        return false;
    }
    return sink && sink->Emit(event);
}

bool Session::EmitProcessEnded() {
    std::lock_guard<std::mutex> lock(emit_mutex);
    if (closing.load(std::memory_order_acquire)) {
        return false;
    }
    if (ended_notified.exchange(true, std::memory_order_acq_rel)) {
        return false;
    }
    return sink && sink->Emit(SessionEvent::ProcessEnded());
}

bool Session::NotifyProcessEnded() {
    std::lock_guard<std::mutex> lock(emit_mutex);
    if (ended_notified.exchange(true, std::memory_order_acq_rel)) {
        return false;
    }
    return sink && sink->Emit(SessionEvent::ProcessEnded());
}

bool Session::IsArtifactSent(const std::string& path) const {
    std::lock_guard<std::mutex> lock(state_mutex);
    return sent_artifacts.count(path) > 0;
}

void Session::MarkArtifactSent(const std::string& path) {
    std::lock_guard<std::mutex> lock(state_mutex);
    sent_artifacts.insert(path);
}

size_t Session::GetSentArtifactCount() const {
    std::lock_guard<std::mutex> lock(state_mutex);
    return sent_artifacts.size();
}

} // namespace runnerd
