//===----------------------------------------------------------------------===//
//                         runnerd - Integration Tests
//
// tests/integration/test_tcp_protocol.cpp
//
// Drives a live TcpServer over the binary protocol
//===----------------------------------------------------------------------===//

#include "network/tcp_server.hpp"
#include "session/session_manager.hpp"
#include "config/server_config.hpp"
#include "protocol/message.hpp"
#include "process/workspace.hpp"
#include <asio.hpp>
#include <cassert>
#include <iostream>
#include <thread>

using namespace runnerd;

namespace {

std::string g_root;

class TestClient {
public:
    explicit TestClient(uint16_t port)
        : socket_(io_) {
        socket_.connect(asio::ip::tcp::endpoint(asio::ip::make_address("127.0.0.1"), port));
    }

    void Send(const Message& message) {
        auto bytes = message.Serialize();
        asio::write(socket_, asio::buffer(bytes));
    }

    void SendRaw(const std::vector<uint8_t>& bytes) {
        asio::write(socket_, asio::buffer(bytes));
    }

    void Start(const std::string& language, const std::string& code) {
        StartPayload start;
        start.language = language;
        start.code = code;
        Send(Message(MessageType::START, start.Serialize()));
    }

    void Input(const std::string& line) {
        TextPayload input;
        input.text = line;
        Send(Message(MessageType::INPUT, input.Serialize()));
    }

    // Blocks for the next frame. Returns false once the server hung up.
    bool Receive(Message& message) {
        asio::error_code ec;
        MessageHeader header;
        asio::read(socket_, asio::buffer(&header, MessageHeader::SIZE), ec);
        if (ec) {
            return false;
        }
        assert(header.IsValid());

        std::vector<uint8_t> payload(header.length);
        if (!payload.empty()) {
            asio::read(socket_, asio::buffer(payload), ec);
            if (ec) {
                return false;
            }
        }
        message = Message(header.GetType(), std::move(payload));
        return true;
    }

    // Reads frames up to and including the first one of `type`
    std::vector<Message> ReceiveUntil(MessageType type) {
        std::vector<Message> frames;
        Message message;
        while (Receive(message)) {
            frames.push_back(message);
            if (message.GetType() == type) {
                break;
            }
        }
        assert(!frames.empty() && frames.back().GetType() == type);
        return frames;
    }

    void Close() {
        asio::error_code ec;
        socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
        socket_.close(ec);
    }

private:
    asio::io_context io_;
    asio::ip::tcp::socket socket_;
};

std::string JoinOutput(const std::vector<Message>& frames) {
    std::string out;
    for (const auto& frame : frames) {
        if (frame.GetType() == MessageType::OUTPUT) {
            out += TextPayload::Deserialize(frame.GetPayload()).text;
        }
    }
    return out;
}

size_t CountType(const std::vector<Message>& frames, MessageType type) {
    size_t n = 0;
    for (const auto& frame : frames) {
        if (frame.GetType() == type) {
            n++;
        }
    }
    return n;
}

bool WaitForNoSessions(SessionManager& manager) {
    auto deadline = Clock::now() + std::chrono::seconds(10);
    while (Clock::now() < deadline) {
        if (manager.GetActiveSessionCount() == 0) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    return false;
}

} // anonymous namespace

//===----------------------------------------------------------------------===//
// Protocol Tests
//===----------------------------------------------------------------------===//

void TestPing(uint16_t port) {
    std::cout << "  Testing PING/PONG..." << std::endl;

    TestClient client(port);
    client.Send(Message(MessageType::PING));

    Message reply;
    assert(client.Receive(reply));
    assert(reply.GetType() == MessageType::PONG);
    assert(reply.GetPayloadLength() == 0);

    std::cout << "    PASSED" << std::endl;
}

void TestRunProgram(uint16_t port) {
    std::cout << "  Testing START to PROCESS_ENDED..." << std::endl;

    TestClient client(port);
    client.Start("python", "print('over the wire')\n");

    auto frames = client.ReceiveUntil(MessageType::PROCESS_ENDED);
    assert(frames.front().GetType() == MessageType::SESSION_STARTED);
    assert(JoinOutput(frames).find("over the wire") != std::string::npos);
    assert(CountType(frames, MessageType::SESSION_ERROR) == 0);

    std::cout << "    PASSED" << std::endl;
}

void TestInteractiveInput(uint16_t port) {
    std::cout << "  Testing INPUT..." << std::endl;

    TestClient client(port);
    client.Start("python", "name = input('Name: ')\nprint('Hi ' + name)\n");

    // Prompt first, then answer it
    std::string out;
    Message message;
    while (out.find("Name: ") == std::string::npos) {
        assert(client.Receive(message));
        assert(message.GetType() != MessageType::PROCESS_ENDED);
        if (message.GetType() == MessageType::OUTPUT) {
            out += TextPayload::Deserialize(message.GetPayload()).text;
        }
    }

    client.Input("Bob");
    auto frames = client.ReceiveUntil(MessageType::PROCESS_ENDED);
    assert(JoinOutput(frames).find("Hi Bob") != std::string::npos);

    std::cout << "    PASSED" << std::endl;
}

void TestInputWithoutSession(uint16_t port) {
    std::cout << "  Testing INPUT without a session..." << std::endl;

    TestClient client(port);
    client.Input("anyone there?");

    auto frames = client.ReceiveUntil(MessageType::PROCESS_ENDED);
    assert(frames.size() == 2);
    assert(JoinOutput(frames) == NOTICE_NO_ACTIVE_SESSION);

    std::cout << "    PASSED" << std::endl;
}

void TestStartErrors(uint16_t port) {
    std::cout << "  Testing START errors..." << std::endl;

    TestClient client(port);
    client.Start("brainfuck", "+++.");

    Message reply;
    assert(client.Receive(reply));
    assert(reply.GetType() == MessageType::SESSION_ERROR);
    auto error = SessionErrorPayload::Deserialize(reply.GetPayload());
    assert(error.error_code == static_cast<uint32_t>(SessionErrorCode::UNSUPPORTED_LANGUAGE));

    client.Start("python", "   ");
    assert(client.Receive(reply));
    error = SessionErrorPayload::Deserialize(reply.GetPayload());
    assert(error.error_code == static_cast<uint32_t>(SessionErrorCode::EMPTY_CODE));

    // A truncated START is a protocol error, the connection stays usable
    client.Send(Message(MessageType::START, {1, 0, 0}));
    assert(client.Receive(reply));
    error = SessionErrorPayload::Deserialize(reply.GetPayload());
    assert(error.error_code == static_cast<uint32_t>(SessionErrorCode::PROTOCOL_ERROR));

    client.Send(Message(MessageType::PING));
    assert(client.Receive(reply));
    assert(reply.GetType() == MessageType::PONG);

    std::cout << "    PASSED" << std::endl;
}

void TestDisconnect(uint16_t port) {
    std::cout << "  Testing DISCONNECT..." << std::endl;

    TestClient client(port);
    client.Start("sql", "echo started-sleeping; sleep 30");

    Message message;
    std::string out;
    while (out.find("started-sleeping") == std::string::npos) {
        assert(client.Receive(message));
        if (message.GetType() == MessageType::OUTPUT) {
            out += TextPayload::Deserialize(message.GetPayload()).text;
        }
    }

    client.Send(Message(MessageType::DISCONNECT));
    auto frames = client.ReceiveUntil(MessageType::PROCESS_ENDED);
    assert(JoinOutput(frames).find(NOTICE_SESSION_KILLED) != std::string::npos);

    // Nothing else arrives for the killed session
    client.Send(Message(MessageType::PING));
    assert(client.Receive(message));
    assert(message.GetType() == MessageType::PONG);

    std::cout << "    PASSED" << std::endl;
}

void TestUnknownType(uint16_t port) {
    std::cout << "  Testing an unknown message type..." << std::endl;

    TestClient client(port);
    client.Send(Message(static_cast<MessageType>(0x7E)));

    Message reply;
    assert(client.Receive(reply));
    assert(reply.GetType() == MessageType::SESSION_ERROR);
    auto error = SessionErrorPayload::Deserialize(reply.GetPayload());
    assert(error.error_code == static_cast<uint32_t>(SessionErrorCode::PROTOCOL_ERROR));
    assert(error.message == "Unknown message type");

    std::cout << "    PASSED" << std::endl;
}

//===----------------------------------------------------------------------===//
// Connection Tests
//===----------------------------------------------------------------------===//

void TestBadMagicDropsConnection(uint16_t port) {
    std::cout << "  Testing an invalid header..." << std::endl;

    TestClient client(port);
    client.SendRaw({'H', 'T', 'T', 'P', 1, 0x03, 0, 0, 0, 0, 0, 0});

    Message message;
    assert(!client.Receive(message));

    std::cout << "    PASSED" << std::endl;
}

void TestCloseCleansUp(uint16_t port, SessionManager& manager) {
    std::cout << "  Testing a dropped connection closes its session..." << std::endl;

    assert(WaitForNoSessions(manager));
    uint64_t closed_before = manager.GetStats().sessions_closed;

    TestClient client(port);
    client.Start("sql", "sleep 30");

    Message message;
    assert(client.Receive(message));
    assert(message.GetType() == MessageType::SESSION_STARTED);
    assert(manager.GetActiveSessionCount() == 1);

    client.Close();

    assert(WaitForNoSessions(manager));
    assert(manager.GetStats().sessions_closed == closed_before + 1);

    std::cout << "    PASSED" << std::endl;
}

void TestClientThatStopsReading(uint16_t port, SessionManager& manager) {
    std::cout << "  Testing a client that stops reading..." << std::endl;

    assert(WaitForNoSessions(manager));
    uint64_t stalled_before = manager.GetStats().stalled_sessions;

    TestClient client(port);
    client.Start("sql", "yes runnerd");

    // Read nothing until the server gives up on this client
    auto deadline = Clock::now() + std::chrono::seconds(30);
    while (manager.GetStats().stalled_sessions == stalled_before && Clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    assert(manager.GetStats().stalled_sessions == stalled_before + 1);
    assert(WaitForNoSessions(manager));

    // The backlog drains, then the error and the end of the session
    auto frames = client.ReceiveUntil(MessageType::PROCESS_ENDED);
    assert(frames.front().GetType() == MessageType::SESSION_STARTED);
    assert(CountType(frames, MessageType::OUTPUT) > 0);
    assert(CountType(frames, MessageType::SESSION_ERROR) == 1);

    const Message& error = frames[frames.size() - 2];
    assert(error.GetType() == MessageType::SESSION_ERROR);
    auto payload = SessionErrorPayload::Deserialize(error.GetPayload());
    assert(payload.error_code == static_cast<uint32_t>(SessionErrorCode::IO_FAILURE));
    assert(payload.message == "Output could not be delivered; session closed");

    // The connection itself stays usable
    client.Send(Message(MessageType::PING));
    Message message;
    assert(client.Receive(message));
    assert(message.GetType() == MessageType::PONG);

    std::cout << "    PASSED" << std::endl;
}

void TestCloseMessage(uint16_t port) {
    std::cout << "  Testing CLOSE..." << std::endl;

    TestClient client(port);
    client.Send(Message(MessageType::CLOSE));

    Message message;
    assert(!client.Receive(message));

    std::cout << "    PASSED" << std::endl;
}

//===----------------------------------------------------------------------===//
// Main
//===----------------------------------------------------------------------===//

int main() {
    std::cout << "=== TCP Protocol Integration Tests ===" << std::endl;

    g_root = CreateWorkspace("", "runnerd_test_tcp_");

    ServerConfig config;
    config.host = "127.0.0.1";
    config.port = 0;
    config.io_threads = 2;
    config.max_pending_bytes = 64 * 1024;

    SessionManager::Config manager_config;
    manager_config.workspace_root = g_root;
    manager_config.poll_interval = std::chrono::milliseconds(20);
    manager_config.query_engine = "sh -s";
    auto manager = std::make_shared<SessionManager>(manager_config);

    TcpServer server(config, manager);
    server.Start();
    uint16_t port = server.GetPort();
    assert(port != 0);
    assert(server.GetClientThreadCount() == 2);

    std::cout << "\n1. Protocol:" << std::endl;
    TestPing(port);
    TestRunProgram(port);
    TestInteractiveInput(port);
    TestInputWithoutSession(port);
    TestStartErrors(port);
    TestDisconnect(port);
    TestUnknownType(port);

    std::cout << "\n2. Connections:" << std::endl;
    TestBadMagicDropsConnection(port);
    TestCloseCleansUp(port, *manager);
    TestClientThatStopsReading(port, *manager);
    TestCloseMessage(port);

    server.Stop();
    manager->CloseAll();
    assert(manager->WaitForPumps(std::chrono::seconds(10)));
    assert(server.GetTotalConnections() >= 10);

    RemoveWorkspace(g_root);

    std::cout << "\n=== All tests PASSED ===" << std::endl;
    return 0;
}
