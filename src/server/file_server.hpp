#pragma once
#include <asio.hpp>
#include <atomic>
#include <chrono>
#include <deque>
#include <functional>
#include <istream>
#include <map>
#include <memory>
#include "protocol.hpp"
#include "chunker.hpp"
#include "file_namespace.hpp"

namespace chunkcast {

struct ServerConfig {
    std::string listen_host{"0.0.0.0"};
    uint16_t listen_port{kDefaultPort};
    int threads{4};
    std::string root{"."};
    std::size_t max_sessions{64};
    std::size_t chunk_min{kDefaultChunkMin};
    std::size_t chunk_max{kDefaultChunkMax};
    std::chrono::milliseconds pacing{50};
    std::chrono::milliseconds ok_delay{100};
};

class TransferSession;

// Owns the listening endpoint. Every request datagram becomes one
// TransferSession; all socket operations are serialised on strand_.
class FileServer {
public:
    using udp = asio::ip::udp;
    using SizerFactory = std::function<std::unique_ptr<ChunkSizer>()>;
    // Opens the byte stream a session reads from; a null or failed stream is
    // answered as not found.
    using SourceFactory = std::function<std::unique_ptr<std::istream>(const std::filesystem::path&)>;
    using SendHandler = std::function<void(std::error_code)>;

    FileServer(asio::io_context& io, const ServerConfig& cfg);
    ~FileServer();

    // Throws std::system_error when the endpoint cannot be bound.
    void start();
    void stop();

    udp::endpoint local_endpoint() const;
    std::size_t active_sessions() const { return active_.load(); }
    const ServerConfig& config() const { return cfg_; }
    void set_sizer_factory(SizerFactory f) { sizer_factory_ = std::move(f); }
    void set_source_factory(SourceFactory f) { source_factory_ = std::move(f); }

    // Queues one datagram for `peer`; safe from any thread.
    void send_to(const udp::endpoint& peer, std::shared_ptr<const std::vector<uint8_t>> data,
                 SendHandler done);

private:
    friend class TransferSession;

    struct Outgoing {
        udp::endpoint peer;
        std::shared_ptr<const std::vector<uint8_t>> data;
        SendHandler done;
    };

    asio::io_context& io_;
    ServerConfig cfg_;
    FileNamespace files_;
    asio::strand<asio::io_context::executor_type> strand_;
    udp::socket socket_;
    udp::endpoint sender_;
    std::vector<uint8_t> read_buf_;
    std::deque<Outgoing> send_q_;
    std::map<udp::endpoint, std::shared_ptr<TransferSession>> sessions_;
    std::atomic<std::size_t> active_{0};
    bool stopping_{false};
    SizerFactory sizer_factory_;
    SourceFactory source_factory_;

    void do_receive();
    void do_send();
    void handle_request(const udp::endpoint& peer, std::string filename);
    void reply_not_found(const udp::endpoint& peer);
    void session_finished(const udp::endpoint& peer);
};

} // namespace chunkcast
