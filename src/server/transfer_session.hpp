#pragma once
#include <asio.hpp>
#include <filesystem>
#include <istream>
#include <functional>
#include <memory>
#include "chunker.hpp"
#include "file_server.hpp"

namespace chunkcast {

// Streams one file to one peer: FOUND, paced data chunks, terminator.
class TransferSession : public std::enable_shared_from_this<TransferSession> {
public:
    using udp = asio::ip::udp;
    TransferSession(asio::io_context& io, FileServer& server, udp::endpoint peer,
                    std::string filename, std::filesystem::path path,
                    std::unique_ptr<ChunkSizer> sizer);
    void start();
    void cancel();

    uint64_t bytes_sent() const { return bytes_sent_; }
    uint64_t chunks_sent() const { return chunks_sent_; }

private:
    void send_next_chunk();
    void send_terminator(bool failed);
    void finish();
    void after(std::chrono::milliseconds delay, void (TransferSession::*step)());
    // Wraps a send completion so it runs on this session's strand.
    FileServer::SendHandler on_strand(std::function<void(std::error_code)> fn);

    FileServer& server_;
    udp::endpoint peer_;
    std::string filename_;
    std::filesystem::path path_;
    std::unique_ptr<ChunkSizer> sizer_;
    std::unique_ptr<std::istream> in_;
    std::unique_ptr<ChunkReader> reader_;
    asio::strand<asio::io_context::executor_type> strand_;
    asio::steady_timer timer_;

    uint64_t bytes_sent_{0};
    uint64_t chunks_sent_{0};
    bool done_{false};
    bool cancelled_{false};
};

} // namespace chunkcast
