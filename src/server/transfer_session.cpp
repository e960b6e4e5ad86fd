#include "transfer_session.hpp"
#include "logging.hpp"

namespace chunkcast {

static std::string peer_str(const asio::ip::udp::endpoint &ep) {
  return ep.address().to_string() + ":" + std::to_string(ep.port());
}

static std::shared_ptr<const std::vector<uint8_t>>
sentinel(std::string_view s) {
  return std::make_shared<const std::vector<uint8_t>>(sentinel_bytes(s));
}

TransferSession::TransferSession(asio::io_context &io, FileServer &server,
                                 udp::endpoint peer, std::string filename,
                                 std::filesystem::path path,
                                 std::unique_ptr<ChunkSizer> sizer)
    : server_(server), peer_(std::move(peer)), filename_(std::move(filename)),
      path_(std::move(path)), sizer_(std::move(sizer)),
      strand_(asio::make_strand(io)), timer_(strand_) {}

FileServer::SendHandler
TransferSession::on_strand(std::function<void(std::error_code)> fn) {
  auto self = shared_from_this();
  return [this, self, fn](std::error_code ec) {
    asio::post(strand_, [self, fn, ec]() { fn(ec); });
  };
}

void TransferSession::start() {
  in_ = server_.source_factory_(path_);
  if (!in_ || !*in_) {
    // vanished between resolve and open
    Logger::instance().log(LogLevel::INFO, "file not found: %s (%s)",
                           filename_.c_str(), peer_str(peer_).c_str());
    server_.send_to(peer_, sentinel(kReplyNotFound),
                    on_strand([this](std::error_code) { finish(); }));
    return;
  }
  reader_ = std::make_unique<ChunkReader>(*in_, *sizer_);

  server_.send_to(peer_, sentinel(kReplyFound),
                  on_strand([this](std::error_code ec) {
                    if (ec) {
                      Logger::instance().log(LogLevel::ERROR,
                                             "send OK to %s failed: %s",
                                             peer_str(peer_).c_str(),
                                             ec.message().c_str());
                      finish();
                      return;
                    }
                    after(server_.cfg_.ok_delay,
                          &TransferSession::send_next_chunk);
                  }));
}

void TransferSession::cancel() {
  auto self = shared_from_this();
  asio::post(strand_, [this, self]() {
    cancelled_ = true;
    timer_.cancel();
  });
}

void TransferSession::after(std::chrono::milliseconds delay,
                            void (TransferSession::*step)()) {
  if (cancelled_) {
    finish();
    return;
  }
  auto self = shared_from_this();
  timer_.expires_after(delay);
  timer_.async_wait([this, self, step](std::error_code ec) {
    if (ec || cancelled_) {
      finish();
      return;
    }
    (this->*step)();
  });
}

void TransferSession::send_next_chunk() {
  auto chunk = std::make_shared<std::vector<uint8_t>>();
  if (!reader_->next(*chunk)) {
    send_terminator(reader_->failed());
    return;
  }

  std::size_t n = chunk->size();
  server_.send_to(peer_, chunk, on_strand([this, n](std::error_code ec) {
                    if (ec) {
                      Logger::instance().log(
                          LogLevel::ERROR,
                          "send chunk to %s failed after %llu bytes: %s",
                          peer_str(peer_).c_str(),
                          (unsigned long long)bytes_sent_,
                          ec.message().c_str());
                      send_terminator(true);
                      return;
                    }
                    bytes_sent_ += n;
                    chunks_sent_++;
                    Logger::instance().log(LogLevel::DEBUG,
                                           "sent %zu bytes to %s", n,
                                           peer_str(peer_).c_str());
                    after(server_.cfg_.pacing,
                          &TransferSession::send_next_chunk);
                  }));
}

void TransferSession::send_terminator(bool failed) {
  if (failed)
    Logger::instance().log(LogLevel::ERROR,
                           "aborting stream of %s to %s after %llu bytes",
                           filename_.c_str(), peer_str(peer_).c_str(),
                           (unsigned long long)bytes_sent_);
  server_.send_to(
      peer_, sentinel(kTerminator), on_strand([this, failed](std::error_code ec) {
        if (ec)
          Logger::instance().log(LogLevel::WARN,
                                 "terminator to %s not delivered: %s",
                                 peer_str(peer_).c_str(), ec.message().c_str());
        else if (!failed)
          Logger::instance().log(
              LogLevel::INFO,
              "streaming complete for %s to %s (%llu bytes, %llu chunks)",
              filename_.c_str(), peer_str(peer_).c_str(),
              (unsigned long long)bytes_sent_,
              (unsigned long long)chunks_sent_);
        finish();
      }));
}

void TransferSession::finish() {
  if (done_)
    return;
  done_ = true;
  reader_.reset();
  in_.reset();
  server_.session_finished(peer_);
}

} // namespace chunkcast
