//===----------------------------------------------------------------------===//
//                         runnerd
//
// common.hpp
//
// Common definitions and includes for runnerd
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include <functional>
#include <atomic>
#include <mutex>
#include <condition_variable>
#include <chrono>
#include <thread>

namespace runnerd {

// Type aliases
using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;
using Duration = Clock::duration;

// Forward declarations
class TcpServer;
class Session;
class SessionManager;
class ProcessLauncher;
class ArtifactScanner;
class QueryStore;
class PtyProcess;
struct ServerConfig;

// Shared pointer types
using SessionPtr = std::shared_ptr<Session>;
using PtyProcessPtr = std::shared_ptr<PtyProcess>;

// Protocol constants
constexpr uint32_t PROTOCOL_MAGIC = 0x444E5552;  // "RUND" in little-endian
constexpr uint8_t PROTOCOL_VERSION = 0x01;
constexpr uint32_t MAX_PAYLOAD_SIZE = 64 * 1024 * 1024;

// Constants
constexpr size_t DEFAULT_MAX_SESSIONS = 100;
constexpr uint32_t DEFAULT_MAX_PENDING_BYTES = 8 * 1024 * 1024;
constexpr uint32_t SESSIONS_PER_IO_THREAD = 32;
constexpr uint32_t DEFAULT_POLL_INTERVAL_MS = 100;
constexpr size_t DEFAULT_READ_CHUNK_SIZE = 4096;
constexpr uint32_t DEFAULT_MAX_IMAGE_DIMENSION = 800;
constexpr const char* DEFAULT_LANGUAGE = "python";
constexpr const char* DEFAULT_QUERY_ENGINE = "duckdb";

// User-facing notices carried as output payloads
constexpr const char* NOTICE_NO_ACTIVE_SESSION = "[No active session]\n";
constexpr const char* NOTICE_SESSION_CLOSED = "[Session closed]\n";
constexpr const char* NOTICE_SESSION_KILLED = "[Session killed by user]\n";

} // namespace runnerd
