//===----------------------------------------------------------------------===//
//                         runnerd
//
// pump/output_pump.cpp
//
// Output pump implementation
//===----------------------------------------------------------------------===//

#include "pump/output_pump.hpp"
#include "artifacts/artifact_scanner.hpp"
#include "process/pty_process.hpp"
#include "session/session.hpp"
#include "logging/logger.hpp"

namespace runnerd {

OutputPump::OutputPump(SessionPtr session_p, PtyProcessPtr process_p,
                       const ArtifactScanner& scanner_p, const Config& config_p)
    : session(std::move(session_p))
    , process(std::move(process_p))
    , scanner(scanner_p)
    , config(config_p) {
}

OutputPump::Outcome OutputPump::Run() {
    const std::string tag = "Session " + std::to_string(session->GetSessionId());
    bool io_error = false;

    while (!session->IsClosing() && process->IsAlive()) {
        auto result = process->Read(config.read_chunk_size, config.poll_interval);

        if (result.status == PtyProcess::ReadStatus::DATA) {
            if (!Forward(std::move(result.data))) {
                return Stall(tag);
            }
        } else if (result.status == PtyProcess::ReadStatus::TIMEOUT) {
            continue;
        } else if (result.status == PtyProcess::ReadStatus::END_OF_STREAM) {
            break;
        } else {
            LOG_WARN("pump", tag + " read failed: " + result.error);
            session->Emit(SessionEvent::Error(SessionErrorCode::IO_FAILURE,
                                              "Error reading process output: " + result.error));
            io_error = true;
            break;
        }
    }

    if (session->IsClosing()) {
        LOG_DEBUG("pump", tag + " closed while running");
        return Outcome::CLOSED;
    }

    std::string rest = Drain();
    if (!rest.empty() && !Forward(std::move(rest))) {
        return Stall(tag);
    }

    if (session->IsClosing()) {
        return Outcome::CLOSED;
    }

    artifacts_sent = scanner.Scan(*session, session->GetWorkspace());
    session->EmitProcessEnded();

    LOG_DEBUG("pump", tag + " finished after " + std::to_string(bytes_forwarded) + " bytes");
    return io_error ? Outcome::IO_ERROR : Outcome::FINISHED;
}

std::string OutputPump::Drain() {
    std::string rest;
    auto deadline = Clock::now() + config.poll_interval * config.drain_intervals;

    while (!session->IsClosing() && Clock::now() < deadline) {
        auto result = process->Read(config.read_chunk_size, config.poll_interval);
        if (result.status != PtyProcess::ReadStatus::DATA) {
            break;
        }
        rest += result.data;
    }

    return rest;
}

bool OutputPump::Forward(std::string chunk) {
    size_t size = chunk.size();
    if (session->Emit(SessionEvent::Output(std::move(chunk)))) {
        bytes_forwarded += size;
        return true;
    }
    // A closing session drops output silently; a session without a client
    // has nobody to stall
    return session->IsClosing() || !session->GetSink();
}

OutputPump::Outcome OutputPump::Stall(const std::string& tag) {
    LOG_WARN("pump", tag + " client is not taking output after " +
             std::to_string(bytes_forwarded) + " bytes, closing");
    session->Emit(SessionEvent::Error(SessionErrorCode::IO_FAILURE,
                                      "Output could not be delivered; session closed"));
    session->EmitProcessEnded();
    return Outcome::STALLED;
}

const char* OutputPump::OutcomeToString(Outcome outcome) {
    switch (outcome) {
        case Outcome::FINISHED: return "finished";
        case Outcome::CLOSED:   return "closed";
        case Outcome::IO_ERROR: return "io_error";
        case Outcome::STALLED:  return "stalled";
        default:                return "unknown";
    }
}

} // namespace runnerd
