//===----------------------------------------------------------------------===//
//                         runnerd
//
// pump/output_pump.hpp
//
// Forwards a session's terminal output until its program ends
//===----------------------------------------------------------------------===//

#pragma once

#include "common.hpp"

namespace runnerd {

class OutputPump {
public:
    struct Config {
        std::chrono::milliseconds poll_interval;
        size_t read_chunk_size;

        // Upper bound for the final drain, in poll intervals
        uint32_t drain_intervals;

        Config()
            : poll_interval(DEFAULT_POLL_INTERVAL_MS)
            , read_chunk_size(DEFAULT_READ_CHUNK_SIZE)
            , drain_intervals(10) {}
    };

    enum class Outcome {
        FINISHED,   // program ended, artifacts scanned, process_ended sent
        CLOSED,     // session was closed by someone else
        IO_ERROR,   // reading failed; reported, then treated as end of stream
        STALLED     // the client stopped taking output; reported, session must close
    };

    // `process` is held for the pump's whole run so the terminal stays open
    // even after the session released it.
    OutputPump(SessionPtr session_p, PtyProcessPtr process_p,
               const ArtifactScanner& scanner_p, const Config& config_p = Config{});

    // Runs on the pump thread. Does not close the session.
    Outcome Run();

    static const char* OutcomeToString(Outcome outcome);

    size_t GetBytesForwarded() const { return bytes_forwarded; }
    size_t GetArtifactsSent() const { return artifacts_sent; }

private:
    // Reads what is left after the program exited
    std::string Drain();

    // False if the client did not take the chunk while the session is open
    bool Forward(std::string chunk);

    // Tells the client why its output stopped
    Outcome Stall(const std::string& tag);

    SessionPtr session;
    PtyProcessPtr process;
    const ArtifactScanner& scanner;
    Config config;

    size_t bytes_forwarded = 0;
    size_t artifacts_sent = 0;
};

} // namespace runnerd
