#pragma once
#include <asio.hpp>
#include <chrono>
#include <fstream>
#include <string>
#include "output_claims.hpp"
#include "protocol.hpp"
#include "status.hpp"

namespace chunkcast {

struct ClientConfig {
    std::string server_host{"127.0.0.1"};
    uint16_t server_port{kDefaultPort};
    uint64_t playback_threshold{10000};
    std::chrono::milliseconds control_timeout{5000};
    std::chrono::milliseconds chunk_timeout{5000};
    std::string output_dir{"."};
    std::string output_prefix{"streaming_"};
};

enum class SessionState {
    Idle,
    AwaitingControl,
    Streaming,
    Complete,
    NotFound,
    Timeout,
    TransportError,
    Rejected
};

enum class SessionOutcome { Complete, NotFound, Timeout, TransportError, Rejected };

const char* session_state_name(SessionState s);

// Client half of one request/response exchange. Owns a private io_context and
// an ephemeral socket per session, so engines on different threads share
// nothing but `claims`, which keeps two engines off the same output file.
// Every terminal state pushes exactly one terminal StatusEvent.
class ReceiveEngine {
public:
    using udp = asio::ip::udp;

    ReceiveEngine(const ClientConfig& cfg, StatusChannel& status,
                  OutputClaims* claims = nullptr);
    ~ReceiveEngine();

    // submit + await_control + stream_loop.
    SessionOutcome run(const std::string& filename);

    // Idle (or any terminal state) -> AwaitingControl. False when the session
    // ended immediately; outcome() says why.
    bool submit(const std::string& filename);
    // AwaitingControl -> Streaming | NotFound | Timeout | TransportError
    SessionState await_control();
    // Streaming -> Complete | Timeout | TransportError
    SessionState stream_loop();

    SessionState state() const { return state_; }
    SessionOutcome outcome() const;
    uint64_t bytes_received() const { return bytes_received_; }
    uint64_t chunks_received() const { return chunks_received_; }
    bool playback_ready() const { return playback_ready_; }
    const std::string& output_path() const { return output_path_; }
    const std::string& filename() const { return filename_; }

private:
    enum class RecvResult { Datagram, Timeout, Error };

    RecvResult receive(std::chrono::milliseconds timeout, std::size_t& n, std::error_code& ec);
    void emit(StatusKind kind, std::string text);
    SessionState terminate(SessionState st, StatusKind kind, std::string text);
    bool on_chunk(const uint8_t* data, std::size_t n);
    void release_output();

    ClientConfig cfg_;
    StatusChannel& status_;
    OutputClaims* claims_;
    bool claimed_{false};
    asio::io_context io_;
    udp::socket socket_;
    udp::endpoint server_ep_;
    udp::endpoint from_;
    std::vector<uint8_t> buf_;
    std::ofstream out_;

    SessionState state_{SessionState::Idle};
    std::string filename_;
    std::string output_path_;
    uint64_t bytes_received_{0};
    uint64_t chunks_received_{0};
    bool playback_ready_{false};
};

} // namespace chunkcast
