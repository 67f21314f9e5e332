//===----------------------------------------------------------------------===//
//                         runnerd CLI
//
// programs/client/main.cpp
//
// Interactive terminal client for runnerd. Sends a source file to the server,
// streams the program's output, forwards typed lines as program input and
// saves image artifacts into the current directory.
//
// Usage:
//   runnerd-cli -l python script.py
//   runnerd-cli -H 10.0.0.5 -p 5000 -l cpp main.cpp
//
// Ctrl-C (or Ctrl-D) kills the remote program; a second Ctrl-C exits at once.
//===----------------------------------------------------------------------===//

#include "protocol/message.hpp"
#include "session/session_event.hpp"
#include "utils/base64.hpp"

#include <asio.hpp>
#include <csignal>
#include <cstring>
#include <deque>
#include <fstream>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>
#include <poll.h>
#include <unistd.h>

#include <readline/readline.h>
#include <readline/history.h>

using namespace runnerd;

namespace {

int g_wake_pipe[2] = {-1, -1};
volatile sig_atomic_t g_interrupts = 0;

void OnInterrupt(int) {
    g_interrupts = g_interrupts + 1;
    char c = 'i';
    ssize_t ignored = write(g_wake_pipe[1], &c, 1);
    (void)ignored;
}

void Wake() {
    char c = 'm';
    ssize_t ignored = write(g_wake_pipe[1], &c, 1);
    (void)ignored;
}

void PrintUsage(const char* program) {
    std::cout <<
        "Usage: " << program << " [OPTIONS] -l LANGUAGE FILE\n"
        "\n"
        "Options:\n"
        "  -H, --host HOST         Server host (default: 127.0.0.1)\n"
        "  -p, --port PORT         Server port (default: 5000)\n"
        "  -l, --language LANG     python, c, cpp, java, js, php or sql\n"
        "  -h, --help              Show this help message\n";
}

bool ReadSource(const std::string& path, std::string& code) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return false;
    }
    std::ostringstream buf;
    buf << file.rdbuf();
    code = buf.str();
    return true;
}

// Artifacts may only land in the current directory
std::string SafeFilename(const std::string& name) {
    auto pos = name.find_last_of('/');
    std::string base = pos == std::string::npos ? name : name.substr(pos + 1);
    if (base.empty() || base == "." || base == "..") {
        return "artifact.png";
    }
    return base;
}

//===----------------------------------------------------------------------===//
// Inbox: frames read by the receive thread, consumed by the main loop
//===----------------------------------------------------------------------===//
class Inbox {
public:
    void Push(Message message) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            messages_.push_back(std::move(message));
        }
        Wake();
    }

    void SetClosed(const std::string& reason) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
            close_reason_ = reason;
        }
        Wake();
    }

    bool Pop(Message& message) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (messages_.empty()) {
            return false;
        }
        message = std::move(messages_.front());
        messages_.pop_front();
        return true;
    }

    bool IsClosed(std::string& reason) {
        std::lock_guard<std::mutex> lock(mutex_);
        reason = close_reason_;
        return closed_ && messages_.empty();
    }

private:
    std::mutex mutex_;
    std::deque<Message> messages_;
    bool closed_ = false;
    std::string close_reason_;
};

void ReceiveLoop(asio::ip::tcp::socket& socket, Inbox& inbox) {
    try {
        while (true) {
            Message message;
            asio::read(socket, asio::buffer(&message.GetHeader(), MessageHeader::SIZE));
            if (!message.IsValid()) {
                inbox.SetClosed("invalid frame from server");
                return;
            }
            if (message.GetPayloadLength() > 0) {
                message.GetPayload().resize(message.GetPayloadLength());
                asio::read(socket, asio::buffer(message.GetPayload()));
            }
            inbox.Push(std::move(message));
        }
    } catch (const std::system_error& e) {
        inbox.SetClosed(e.code() == asio::error::eof ? "server closed the connection" : e.what());
    }
}

//===----------------------------------------------------------------------===//
// Terminal: program output interleaved with the readline input line
//===----------------------------------------------------------------------===//
class Terminal {
public:
    // Prints program output. The trailing unterminated line becomes the
    // readline prompt, so program prompts stay in front of what is typed.
    void Write(const std::string& data) {
        std::string text = StripEcho(data);
        if (text.empty()) {
            return;
        }

        pending_ += text;
        std::string complete;
        auto nl = pending_.rfind('\n');
        if (nl != std::string::npos) {
            complete = pending_.substr(0, nl + 1);
            pending_.erase(0, nl + 1);
        }

        std::string saved_line(rl_line_buffer ? rl_line_buffer : "", rl_end);
        int saved_point = rl_point;

        rl_set_prompt("");
        rl_replace_line("", 0);
        rl_redisplay();

        std::cout << complete << std::flush;

        rl_set_prompt(pending_.c_str());
        rl_replace_line(saved_line.c_str(), 0);
        rl_point = saved_point;
        rl_on_new_line();
        rl_redisplay();
    }

    // Prints a client-side notice on its own line
    void Notice(const std::string& text) {
        Write((pending_.empty() ? "" : "\n") + text + "\n");
    }

    // Readline has already printed the prompt and line; the pty echoes the
    // same line back, which is dropped once.
    void LineSubmitted(const std::string& line) {
        pending_.clear();
        rl_set_prompt("");
        echo_ = line + "\r\n";
    }

private:
    std::string StripEcho(const std::string& data) {
        if (echo_.empty()) {
            return data;
        }
        size_t matched = 0;
        while (matched < data.size() && matched < echo_.size() && data[matched] == echo_[matched]) {
            matched++;
        }
        if (matched == echo_.size() || matched == data.size()) {
            echo_.erase(0, matched);
            return data.substr(matched);
        }
        echo_.clear();
        return data;
    }

    std::string pending_;
    std::string echo_;
};

//===----------------------------------------------------------------------===//
// Client
//===----------------------------------------------------------------------===//
class Client {
public:
    Client(asio::ip::tcp::socket& socket_p, Terminal& terminal_p)
        : socket(socket_p), terminal(terminal_p) {}

    void Send(const Message& message) {
        auto bytes = message.Serialize();
        asio::error_code ec;
        asio::write(socket, asio::buffer(bytes), ec);
        if (ec) {
            terminal.Notice("[Send failed: " + ec.message() + "]");
        }
    }

    void Start(const std::string& language, const std::string& code) {
        StartPayload payload;
        payload.language = language;
        payload.code = code;
        Send(Message(MessageType::START, payload.Serialize()));
    }

    void Input(const std::string& line) {
        TextPayload payload;
        payload.text = line;
        Send(Message(MessageType::INPUT, payload.Serialize()));
    }

    void Disconnect() {
        if (!disconnect_sent) {
            disconnect_sent = true;
            Send(Message(MessageType::DISCONNECT));
        }
    }

    // Returns false once the client should exit
    bool Handle(const Message& message) {
        switch (message.GetType()) {
            case MessageType::SESSION_STARTED:
                started = true;
                return true;

            case MessageType::OUTPUT:
                terminal.Write(TextPayload::Deserialize(message.GetPayload()).text);
                return true;

            case MessageType::ARTIFACT:
                SaveArtifact(ArtifactPayload::Deserialize(message.GetPayload()));
                return true;

            case MessageType::PROCESS_ENDED:
                terminal.Notice("[Process ended]");
                return false;

            case MessageType::SESSION_ERROR: {
                auto error = SessionErrorPayload::Deserialize(message.GetPayload());
                terminal.Notice("[Session error: " + error.message + "]");
                if (!started) {
                    exit_code = 1;
                    return false;
                }
                return true;
            }

            case MessageType::PING:
                Send(Message(MessageType::PONG));
                return true;

            default:
                return true;
        }
    }

    int GetExitCode() const { return exit_code; }

private:
    void SaveArtifact(const ArtifactPayload& artifact) {
        std::string filename = SafeFilename(artifact.filename);
        std::string bytes;
        try {
            bytes = Base64Decode(artifact.image_base64);
        } catch (const std::invalid_argument& e) {
            terminal.Notice("[Could not decode " + filename + ": " + e.what() + "]");
            return;
        }

        std::ofstream out(filename, std::ios::binary | std::ios::trunc);
        out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
        if (!out) {
            terminal.Notice("[Could not write " + filename + "]");
            return;
        }
        terminal.Notice("[Saved plot " + filename + " (" + std::to_string(bytes.size()) + " bytes)]");
    }

    asio::ip::tcp::socket& socket;
    Terminal& terminal;
    bool started = false;
    bool disconnect_sent = false;
    int exit_code = 0;
};

// Readline's callback interface has no user data pointer
Client* g_client = nullptr;
Terminal* g_terminal = nullptr;
bool g_input_closed = false;

void OnLine(char* raw) {
    if (!raw) {
        // Ctrl-D
        rl_callback_handler_remove();
        g_input_closed = true;
        g_client->Disconnect();
        return;
    }
    std::string line(raw);
    free(raw);

    if (!line.empty()) {
        add_history(line.c_str());
    }
    g_terminal->LineSubmitted(line);
    g_client->Input(line);
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    std::string host = "127.0.0.1";
    std::string port = "5000";
    std::string language;
    std::string path;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if ((arg == "-H" || arg == "--host") && i + 1 < argc) {
            host = argv[++i];
        } else if ((arg == "-p" || arg == "--port") && i + 1 < argc) {
            port = argv[++i];
        } else if ((arg == "-l" || arg == "--language") && i + 1 < argc) {
            language = argv[++i];
        } else if (arg == "-h" || arg == "--help") {
            PrintUsage(argv[0]);
            return 0;
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Unknown option: " << arg << "\n";
            PrintUsage(argv[0]);
            return 1;
        } else {
            path = arg;
        }
    }

    if (language.empty() || path.empty()) {
        PrintUsage(argv[0]);
        return 1;
    }

    std::string code;
    if (!ReadSource(path, code)) {
        std::cerr << "Cannot read " << path << ": " << strerror(errno) << "\n";
        return 1;
    }

    asio::io_context io_context;
    asio::ip::tcp::socket socket(io_context);
    try {
        asio::ip::tcp::resolver resolver(io_context);
        asio::connect(socket, resolver.resolve(host, port));
    } catch (const std::system_error& e) {
        std::cerr << "Failed to connect to " << host << ":" << port << ": " << e.what() << "\n";
        return 1;
    }

    if (pipe(g_wake_pipe) < 0) {
        std::cerr << "Failed to create pipe: " << strerror(errno) << "\n";
        return 1;
    }

    struct sigaction sa;
    std::memset(&sa, 0, sizeof(sa));
    sa.sa_handler = OnInterrupt;
    sigemptyset(&sa.sa_mask);
    sigaction(SIGINT, &sa, nullptr);
    std::signal(SIGPIPE, SIG_IGN);

    Inbox inbox;
    std::thread receiver([&socket, &inbox]() {
        ReceiveLoop(socket, inbox);
    });

    Terminal terminal;
    Client client(socket, terminal);
    g_client = &client;
    g_terminal = &terminal;

    rl_catch_signals = 0;
    using_history();
    rl_callback_handler_install("", OnLine);

    client.Start(language, code);

    bool running = true;
    int handled_interrupts = 0;
    while (running) {
        struct pollfd fds[2];
        fds[0].fd = g_input_closed ? -1 : STDIN_FILENO;
        fds[0].events = POLLIN;
        fds[1].fd = g_wake_pipe[0];
        fds[1].events = POLLIN;

        int rc = poll(fds, 2, -1);
        if (rc < 0) {
            if (errno == EINTR) {
                continue;
            }
            break;
        }

        if (fds[1].revents & POLLIN) {
            char drain[64];
            ssize_t ignored = read(g_wake_pipe[0], drain, sizeof(drain));
            (void)ignored;
        }

        int interrupts = g_interrupts;
        if (interrupts != handled_interrupts) {
            handled_interrupts = interrupts;
            if (interrupts > 1) {
                terminal.Notice("[Interrupted]");
                client.Disconnect();
                break;
            }
            client.Disconnect();
        }

        Message message;
        while (running && inbox.Pop(message)) {
            try {
                running = client.Handle(message);
            } catch (const std::runtime_error& e) {
                terminal.Notice("[Malformed " + std::string(MessageTypeToString(message.GetType())) +
                                " frame: " + e.what() + "]");
            }
        }

        std::string reason;
        if (running && inbox.IsClosed(reason)) {
            terminal.Notice("[Disconnected: " + reason + "]");
            running = false;
        }

        if (running && !g_input_closed && (fds[0].revents & POLLIN)) {
            rl_callback_read_char();
        }
    }

    if (!g_input_closed) {
        rl_callback_handler_remove();
    }
    std::cout << std::endl;

    asio::error_code ec;
    socket.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
    receiver.join();
    socket.close(ec);

    close(g_wake_pipe[0]);
    close(g_wake_pipe[1]);

    return client.GetExitCode();
}
