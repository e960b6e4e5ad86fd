#include "file_server.hpp"
#include "logging.hpp"
#include "transfer_session.hpp"
#include <fstream>

namespace chunkcast {

static std::string peer_str(const asio::ip::udp::endpoint &ep) {
  return ep.address().to_string() + ":" + std::to_string(ep.port());
}

FileServer::FileServer(asio::io_context &io, const ServerConfig &cfg)
    : io_(io), cfg_(cfg), files_(cfg.root), strand_(asio::make_strand(io)),
      socket_(strand_), read_buf_(kRequestBufferSize) {
  validate_chunk_bounds(cfg_.chunk_min, cfg_.chunk_max);
  sizer_factory_ = [this]() -> std::unique_ptr<ChunkSizer> {
    return std::make_unique<RandomChunkSizer>(cfg_.chunk_min, cfg_.chunk_max);
  };
  source_factory_ =
      [](const std::filesystem::path &p) -> std::unique_ptr<std::istream> {
    return std::make_unique<std::ifstream>(p, std::ios::binary);
  };
}

FileServer::~FileServer() {
  std::error_code ec;
  socket_.close(ec);
}

void FileServer::start() {
  udp::endpoint ep(asio::ip::make_address(cfg_.listen_host), cfg_.listen_port);
  socket_.open(ep.protocol());
  socket_.bind(ep);
  Logger::instance().log(LogLevel::INFO, "serving %s on %s",
                         files_.root().string().c_str(),
                         peer_str(socket_.local_endpoint()).c_str());
  asio::post(strand_, [this]() { do_receive(); });
}

void FileServer::stop() {
  asio::post(strand_, [this]() {
    if (stopping_)
      return;
    stopping_ = true;
    for (auto &kv : sessions_)
      kv.second->cancel();
    std::error_code ec;
    socket_.close(ec);
  });
}

FileServer::udp::endpoint FileServer::local_endpoint() const {
  return socket_.local_endpoint();
}

void FileServer::do_receive() {
  socket_.async_receive_from(
      asio::buffer(read_buf_), sender_,
      asio::bind_executor(strand_, [this](std::error_code ec, std::size_t n) {
        if (stopping_ || ec == asio::error::operation_aborted)
          return;
        if (ec) {
          // ICMP port-unreachable from a departed client lands here on Linux
          Logger::instance().log(LogLevel::WARN, "receive failed: %s",
                                 ec.message().c_str());
        } else {
          handle_request(sender_, decode_request(read_buf_.data(), n));
        }
        do_receive();
      }));
}

void FileServer::handle_request(const udp::endpoint &peer,
                                std::string filename) {
  Logger::instance().log(LogLevel::INFO, "client %s requested: %s",
                         peer_str(peer).c_str(), filename.c_str());

  if (sessions_.count(peer)) {
    Logger::instance().log(LogLevel::WARN,
                           "dropping request from %s: stream already active",
                           peer_str(peer).c_str());
    return;
  }

  auto path = files_.resolve(filename);
  if (!path) {
    Logger::instance().log(LogLevel::INFO, "file not found: %s",
                           filename.c_str());
    reply_not_found(peer);
    return;
  }

  if (sessions_.size() >= cfg_.max_sessions) {
    Logger::instance().log(LogLevel::WARN,
                           "rejecting %s from %s: %zu sessions active",
                           filename.c_str(), peer_str(peer).c_str(),
                           sessions_.size());
    reply_not_found(peer);
    return;
  }

  std::unique_ptr<ChunkSizer> sizer = sizer_factory_();
  auto s = std::make_shared<TransferSession>(io_, *this, peer, filename, *path,
                                             std::move(sizer));
  sessions_[peer] = s;
  active_.store(sessions_.size());
  s->start();
}

void FileServer::reply_not_found(const udp::endpoint &peer) {
  send_to(peer,
          std::make_shared<const std::vector<uint8_t>>(
              sentinel_bytes(kReplyNotFound)),
          [peer](std::error_code ec) {
            if (ec)
              Logger::instance().log(LogLevel::WARN,
                                     "ERROR reply to %s failed: %s",
                                     peer_str(peer).c_str(),
                                     ec.message().c_str());
          });
}

void FileServer::session_finished(const udp::endpoint &peer) {
  asio::post(strand_, [this, peer]() {
    sessions_.erase(peer);
    active_.store(sessions_.size());
  });
}

void FileServer::send_to(const udp::endpoint &peer,
                         std::shared_ptr<const std::vector<uint8_t>> data,
                         SendHandler done) {
  asio::post(strand_, [this, peer, data, done]() {
    if (stopping_) {
      if (done)
        done(asio::error::operation_aborted);
      return;
    }
    send_q_.push_back(Outgoing{peer, data, done});
    if (send_q_.size() == 1)
      do_send();
  });
}

void FileServer::do_send() {
  if (send_q_.empty())
    return;
  auto &front = send_q_.front();
  socket_.async_send_to(
      asio::buffer(*front.data), front.peer,
      asio::bind_executor(strand_, [this](std::error_code ec, std::size_t) {
        Outgoing item = std::move(send_q_.front());
        send_q_.pop_front();
        if (!send_q_.empty())
          do_send();
        if (item.done)
          item.done(ec);
      }));
}

} // namespace chunkcast
