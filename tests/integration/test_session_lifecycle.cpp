//===----------------------------------------------------------------------===//
//                         runnerd - Integration Tests
//
// tests/integration/test_session_lifecycle.cpp
//
// End-to-end session scenarios against real interpreters
//===----------------------------------------------------------------------===//

#include "session/session_manager.hpp"
#include "artifacts/image_resizer.hpp"
#include "process/workspace.hpp"
#include "utils/base64.hpp"
#include "../common/recording_sink.hpp"
#include <cassert>
#include <iostream>
#include <filesystem>
#include <thread>

using namespace runnerd;
using runnerd::test::RecordingSink;

namespace {

std::string g_root;

SessionManager::Config TestConfig() {
    SessionManager::Config config;
    config.workspace_root = g_root;
    config.poll_interval = std::chrono::milliseconds(20);
    config.query_engine = "sh -s";
    return config;
}

// No event may follow process_ended
void CheckEndsWithProcessEnded(const RecordingSink& sink) {
    auto events = sink.Events();
    assert(!events.empty());
    assert(events.front().type == SessionEventType::SESSION_STARTED);
    assert(events.back().type == SessionEventType::PROCESS_ENDED);
    assert(sink.Count(SessionEventType::PROCESS_ENDED) == 1);
}

// Writes a 4x3 red PNG using only the standard library
const char* kPlotProgram =
    "import struct, zlib\n"
    "def chunk(kind, data):\n"
    "    body = kind + data\n"
    "    return struct.pack('>I', len(data)) + body + struct.pack('>I', zlib.crc32(body) & 0xffffffff)\n"
    "w, h = 4, 3\n"
    "raw = b''.join(b'\\x00' + b'\\xff\\x00\\x00' * w for _ in range(h))\n"
    "png = (b'\\x89PNG\\r\\n\\x1a\\n'\n"
    "       + chunk(b'IHDR', struct.pack('>IIBBBBB', w, h, 8, 2, 0, 0, 0))\n"
    "       + chunk(b'IDAT', zlib.compress(raw))\n"
    "       + chunk(b'IEND', b''))\n"
    "with open('plot.png', 'wb') as f:\n"
    "    f.write(png)\n"
    "print('saved plot')\n";

} // anonymous namespace

//===----------------------------------------------------------------------===//
// Interactive Program Tests
//===----------------------------------------------------------------------===//

void TestInteractiveGreeting() {
    std::cout << "  Testing an interactive program..." << std::endl;

    SessionManager manager(TestConfig());
    auto sink = std::make_shared<RecordingSink>();

    auto session = manager.StartSession(1, "Python",
        "name = input('Enter your name: ')\nprint(f'Hello, {name}!')\n", sink);
    assert(session != nullptr);

    assert(sink->WaitForOutput("Enter your name: "));
    assert(manager.SendInput(1, "Alice", sink) == InputResult::DELIVERED);
    assert(sink->WaitForOutput("Hello, Alice!"));
    assert(sink->WaitForCount(SessionEventType::PROCESS_ENDED, 1));
    assert(manager.WaitForPumps(std::chrono::seconds(10)));

    CheckEndsWithProcessEnded(*sink);
    assert(manager.GetActiveSessionCount() == 0);

    std::cout << "    PASSED" << std::endl;
}

void TestSeveralInputs() {
    std::cout << "  Testing several input lines..." << std::endl;

    SessionManager manager(TestConfig());
    auto sink = std::make_shared<RecordingSink>();

    auto session = manager.StartSession(2, "python",
        "for _ in range(3):\n    print('double', int(input('n? ')) * 2)\n", sink);
    assert(session != nullptr);

    for (int n : {4, 10, 21}) {
        assert(sink->WaitForOutput("n? "));
        assert(manager.SendInput(2, std::to_string(n), sink) == InputResult::DELIVERED);
        assert(sink->WaitForOutput("double " + std::to_string(n * 2)));
    }

    assert(sink->WaitForCount(SessionEventType::PROCESS_ENDED, 1));
    assert(manager.WaitForPumps(std::chrono::seconds(10)));
    CheckEndsWithProcessEnded(*sink);

    std::cout << "    PASSED" << std::endl;
}

void TestProgramError() {
    std::cout << "  Testing a failing program..." << std::endl;

    SessionManager manager(TestConfig());
    auto sink = std::make_shared<RecordingSink>();

    assert(manager.StartSession(3, "python", "print('before')\nraise ValueError('boom')\n", sink));
    assert(sink->WaitForCount(SessionEventType::PROCESS_ENDED, 1));
    assert(manager.WaitForPumps(std::chrono::seconds(10)));

    // The traceback is ordinary terminal output
    std::string out = sink->Output();
    assert(out.find("before") != std::string::npos);
    assert(out.find("ValueError: boom") != std::string::npos);
    assert(sink->Count(SessionEventType::SESSION_ERROR) == 0);
    CheckEndsWithProcessEnded(*sink);

    std::cout << "    PASSED" << std::endl;
}

//===----------------------------------------------------------------------===//
// Artifact Tests
//===----------------------------------------------------------------------===//

void TestArtifactDelivered() {
    std::cout << "  Testing artifact delivery..." << std::endl;

    SessionManager manager(TestConfig());
    auto sink = std::make_shared<RecordingSink>();

    auto session = manager.StartSession(4, "python", kPlotProgram, sink);
    assert(session != nullptr);
    std::string workspace = session->GetWorkspace();

    assert(sink->WaitForCount(SessionEventType::PROCESS_ENDED, 1));
    assert(manager.WaitForPumps(std::chrono::seconds(10)));
    CheckEndsWithProcessEnded(*sink);

    auto events = sink->Events();
    const SessionEvent* artifact = nullptr;
    for (const auto& event : events) {
        if (event.type == SessionEventType::ARTIFACT) {
            assert(artifact == nullptr);
            artifact = &event;
        }
    }
    assert(artifact != nullptr);
    assert(artifact->filename == "plot.png");
    assert(sink->Output().find("saved plot") != std::string::npos);

    std::string bytes = Base64Decode(artifact->data);
    assert(bytes.compare(0, 8, std::string("\x89PNG\r\n\x1a\n", 8)) == 0);
#ifdef RUNNERD_WITH_IMAGE_CODEC
    RasterImage image = DecodeImage(bytes);
    assert(image.width == 4);
    assert(image.height == 3);
#endif

    assert(manager.GetStats().artifacts_sent == 1);
    assert(!std::filesystem::exists(workspace));

    std::cout << "    PASSED" << std::endl;
}

//===----------------------------------------------------------------------===//
// Kill and Replace Tests
//===----------------------------------------------------------------------===//

void TestKillMidRun() {
    std::cout << "  Testing kill of a running program..." << std::endl;

    SessionManager manager(TestConfig());
    auto sink = std::make_shared<RecordingSink>();

    auto session = manager.StartSession(5, "python",
        "import time\nprint('working', flush=True)\ntime.sleep(30)\nprint('never')\n", sink);
    assert(session != nullptr);
    auto process = session->GetProcess();
    assert(sink->WaitForOutput("working"));

    manager.Disconnect(5, sink);
    assert(manager.WaitForPumps(std::chrono::seconds(10)));

    assert(!process->IsAlive());
    assert(sink->Output().find(NOTICE_SESSION_KILLED) != std::string::npos);
    assert(sink->Output().find("never") == std::string::npos);
    CheckEndsWithProcessEnded(*sink);

    // Killing again finds nothing to kill
    manager.Disconnect(5, sink);
    assert(sink->Count(SessionEventType::PROCESS_ENDED) == 2);

    std::cout << "    PASSED" << std::endl;
}

void TestRestartReplaces() {
    std::cout << "  Testing a restart replaces the old program..." << std::endl;

    SessionManager manager(TestConfig());
    auto sink = std::make_shared<RecordingSink>();

    auto first = manager.StartSession(6, "python",
        "import time\nwhile True:\n    print('old tick', flush=True)\n    time.sleep(0.05)\n", sink);
    assert(first != nullptr);
    auto first_process = first->GetProcess();
    assert(sink->WaitForOutput("old tick"));

    auto second_sink = std::make_shared<RecordingSink>();
    auto second = manager.StartSession(6, "python", "print('new program')\n", second_sink);
    assert(second != nullptr);
    assert(!first_process->IsAlive());

    assert(second_sink->WaitForCount(SessionEventType::PROCESS_ENDED, 1));
    assert(manager.WaitForPumps(std::chrono::seconds(10)));

    assert(second_sink->Output().find("new program") != std::string::npos);
    assert(second_sink->Output().find("old tick") == std::string::npos);
    CheckEndsWithProcessEnded(*second_sink);

    std::cout << "    PASSED" << std::endl;
}

void TestConcurrentCleanup() {
    std::cout << "  Testing concurrent cleanup paths..." << std::endl;

    SessionManager manager(TestConfig());

    for (int round = 0; round < 10; round++) {
        auto sink = std::make_shared<RecordingSink>();
        auto session = manager.StartSession(7, "sql", "sleep 30", sink);
        assert(session != nullptr);
        std::string workspace = session->GetWorkspace();
        uint64_t closed_before = manager.GetStats().sessions_closed;

        std::thread killer([&]() { manager.Disconnect(7, sink); });
        std::thread closer([&]() { manager.CloseSession(session); });
        std::thread sweeper([&]() { manager.CloseAll(); });
        killer.join();
        closer.join();
        sweeper.join();
        assert(manager.WaitForPumps(std::chrono::seconds(10)));

        assert(manager.GetStats().sessions_closed == closed_before + 1);
        assert(!std::filesystem::exists(workspace));
        assert(manager.GetActiveSessionCount() == 0);
        assert(sink->Count(SessionEventType::PROCESS_ENDED) == 1);
    }

    std::cout << "    PASSED" << std::endl;
}

//===----------------------------------------------------------------------===//
// Multi-client Tests
//===----------------------------------------------------------------------===//

void TestIndependentClients() {
    std::cout << "  Testing independent clients..." << std::endl;

    SessionManager manager(TestConfig());
    std::vector<std::shared_ptr<RecordingSink>> sinks;

    for (uint64_t id = 10; id < 15; id++) {
        auto sink = std::make_shared<RecordingSink>();
        sinks.push_back(sink);
        std::string code = "print('client-" + std::to_string(id) + "')\n";
        assert(manager.StartSession(id, "python", code, sink) != nullptr);
    }

    for (size_t i = 0; i < sinks.size(); i++) {
        assert(sinks[i]->WaitForCount(SessionEventType::PROCESS_ENDED, 1));
    }
    assert(manager.WaitForPumps(std::chrono::seconds(10)));

    for (size_t i = 0; i < sinks.size(); i++) {
        std::string out = sinks[i]->Output();
        for (uint64_t id = 10; id < 15; id++) {
            bool own = (id == 10 + i);
            bool seen = out.find("client-" + std::to_string(id)) != std::string::npos;
            assert(seen == own);
        }
        CheckEndsWithProcessEnded(*sinks[i]);
    }

    std::cout << "    PASSED" << std::endl;
}

//===----------------------------------------------------------------------===//
// Main
//===----------------------------------------------------------------------===//

int main() {
    std::cout << "=== Session Lifecycle Integration Tests ===" << std::endl;

    g_root = CreateWorkspace("", "runnerd_test_lifecycle_");

    std::cout << "\n1. Interactive Programs:" << std::endl;
    TestInteractiveGreeting();
    TestSeveralInputs();
    TestProgramError();

    std::cout << "\n2. Artifacts:" << std::endl;
    TestArtifactDelivered();

    std::cout << "\n3. Kill and Replace:" << std::endl;
    TestKillMidRun();
    TestRestartReplaces();
    TestConcurrentCleanup();

    std::cout << "\n4. Multiple Clients:" << std::endl;
    TestIndependentClients();

    RemoveWorkspace(g_root);

    std::cout << "\n=== All tests PASSED ===" << std::endl;
    return 0;
}
