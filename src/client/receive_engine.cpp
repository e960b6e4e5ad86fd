#include "receive_engine.hpp"
#include "logging.hpp"
#include "util.hpp"
#include <filesystem>
#include <stdexcept>

namespace chunkcast {

const char *session_state_name(SessionState s) {
  switch (s) {
  case SessionState::Idle:
    return "idle";
  case SessionState::AwaitingControl:
    return "awaiting-control";
  case SessionState::Streaming:
    return "streaming";
  case SessionState::Complete:
    return "complete";
  case SessionState::NotFound:
    return "not-found";
  case SessionState::Timeout:
    return "timeout";
  case SessionState::TransportError:
    return "transport-error";
  default:
    return "rejected";
  }
}

ReceiveEngine::ReceiveEngine(const ClientConfig &cfg, StatusChannel &status,
                             OutputClaims *claims)
    : cfg_(cfg), status_(status), claims_(claims), socket_(io_),
      buf_(kMaxDatagram) {}

ReceiveEngine::~ReceiveEngine() {
  std::error_code ec;
  socket_.close(ec);
  release_output();
}

void ReceiveEngine::release_output() {
  if (claimed_) {
    claims_->release(output_path_);
    claimed_ = false;
  }
}

SessionOutcome ReceiveEngine::outcome() const {
  switch (state_) {
  case SessionState::Complete:
    return SessionOutcome::Complete;
  case SessionState::NotFound:
    return SessionOutcome::NotFound;
  case SessionState::Timeout:
    return SessionOutcome::Timeout;
  case SessionState::TransportError:
    return SessionOutcome::TransportError;
  case SessionState::Rejected:
    return SessionOutcome::Rejected;
  default:
    throw std::logic_error(std::string("session still ") +
                           session_state_name(state_));
  }
}

SessionOutcome ReceiveEngine::run(const std::string &filename) {
  if (submit(filename) && await_control() == SessionState::Streaming)
    stream_loop();
  return outcome();
}

void ReceiveEngine::emit(StatusKind kind, std::string text) {
  StatusEvent ev;
  ev.kind = kind;
  ev.filename = filename_;
  ev.text = std::move(text);
  ev.bytes = bytes_received_;
  status_.push(std::move(ev));
}

SessionState ReceiveEngine::terminate(SessionState st, StatusKind kind,
                                      std::string text) {
  state_ = st;
  if (out_.is_open())
    out_.close();
  std::error_code ec;
  socket_.close(ec);
  release_output();
  Logger::instance().log(st == SessionState::Complete ? LogLevel::INFO
                                                      : LogLevel::WARN,
                         "session %s ended %s after %llu bytes",
                         filename_.c_str(), session_state_name(st),
                         (unsigned long long)bytes_received_);
  emit(kind, std::move(text));
  return st;
}

bool ReceiveEngine::submit(const std::string &filename) {
  if (state_ == SessionState::AwaitingControl ||
      state_ == SessionState::Streaming)
    throw std::logic_error("submit while a session is running");

  filename_ = trim_copy(filename);
  bytes_received_ = 0;
  chunks_received_ = 0;
  playback_ready_ = false;
  output_path_.clear();

  if (filename_.empty()) {
    terminate(SessionState::Rejected, StatusKind::Rejected,
              "Error: no filename given");
    return false;
  }

  emit(StatusKind::Requested, "You requested: " + filename_);

  std::filesystem::path out_path =
      std::filesystem::path(cfg_.output_dir) /
      output_name_for(cfg_.output_prefix, filename_);
  output_path_ = out_path.string();
  if (claims_) {
    if (!claims_->claim(output_path_)) {
      terminate(SessionState::Rejected, StatusKind::Rejected,
                "Error: " + output_path_ + " is already being received");
      return false;
    }
    claimed_ = true;
  }
  out_.open(out_path, std::ios::binary | std::ios::trunc);
  if (!out_.is_open()) {
    terminate(SessionState::Rejected, StatusKind::Rejected,
              "Error: cannot open output file " + output_path_);
    return false;
  }

  std::error_code ec;
  udp::resolver resolver(io_);
  auto results =
      resolver.resolve(cfg_.server_host, std::to_string(cfg_.server_port), ec);
  if (ec || results.empty()) {
    terminate(SessionState::TransportError, StatusKind::TransportError,
              "Error: cannot resolve " + cfg_.server_host + ": " +
                  ec.message());
    return false;
  }
  server_ep_ = *results.begin();

  socket_.close(ec);
  socket_.open(server_ep_.protocol(), ec);
  if (!ec) {
    auto req = encode_request(filename_);
    socket_.send_to(asio::buffer(req), server_ep_, 0, ec);
  }
  if (ec) {
    terminate(SessionState::TransportError, StatusKind::TransportError,
              "Error: Cannot send request! (" + ec.message() + ")");
    return false;
  }

  state_ = SessionState::AwaitingControl;
  emit(StatusKind::Waiting, "Waiting for server response...");
  return true;
}

ReceiveEngine::RecvResult
ReceiveEngine::receive(std::chrono::milliseconds timeout, std::size_t &n,
                       std::error_code &ec) {
  auto deadline = std::chrono::steady_clock::now() + timeout;
  for (;;) {
    auto now = std::chrono::steady_clock::now();
    if (now >= deadline)
      return RecvResult::Timeout;

    bool done = false;
    ec = asio::error::would_block;
    n = 0;
    io_.restart();
    socket_.async_receive_from(asio::buffer(buf_), from_,
                               [&](std::error_code e, std::size_t len) {
                                 ec = e;
                                 n = len;
                                 done = true;
                               });
    io_.run_for(deadline - now);
    if (!done) {
      socket_.cancel();
      io_.run();
    }
    if (ec == asio::error::operation_aborted)
      return RecvResult::Timeout;
    if (ec)
      return RecvResult::Error;
    // a wildcard-bound server answers from whatever local address the route
    // picks, so only the port identifies it
    if (from_.port() != server_ep_.port()) {
      Logger::instance().log(LogLevel::DEBUG,
                             "ignoring %zu bytes from unexpected peer %s", n,
                             from_.address().to_string().c_str());
      continue;
    }
    return RecvResult::Datagram;
  }
}

SessionState ReceiveEngine::await_control() {
  if (state_ != SessionState::AwaitingControl)
    throw std::logic_error("await_control outside AwaitingControl");

  std::size_t n = 0;
  std::error_code ec;
  switch (receive(cfg_.control_timeout, n, ec)) {
  case RecvResult::Timeout:
    return terminate(SessionState::Timeout, StatusKind::Timeout,
                     "Error: no response from server (timeout)");
  case RecvResult::Error:
    return terminate(SessionState::TransportError, StatusKind::TransportError,
                     "Error: " + ec.message());
  default:
    break;
  }

  if (classify_control(buf_.data(), n) != ControlReply::Found) {
    // an empty sink for a file that never existed is just noise
    out_.close();
    std::error_code rm_ec;
    std::filesystem::remove(output_path_, rm_ec);
    return terminate(SessionState::NotFound, StatusKind::NotFound,
                     "Error: File not found on server!");
  }

  state_ = SessionState::Streaming;
  emit(StatusKind::Started, "Streaming started...");
  return state_;
}

bool ReceiveEngine::on_chunk(const uint8_t *data, std::size_t n) {
  out_.write(reinterpret_cast<const char *>(data), (std::streamsize)n);
  out_.flush();
  if (!out_)
    return false;
  bytes_received_ += n;
  chunks_received_++;
  emit(StatusKind::Progress,
       "Received: " + std::to_string(bytes_received_) + " bytes");
  if (!playback_ready_ && bytes_received_ >= cfg_.playback_threshold) {
    playback_ready_ = true;
    emit(StatusKind::PlaybackReady,
         "Buffer reached " + std::to_string(cfg_.playback_threshold) +
             " bytes. You can now play: " + output_path_);
  }
  return true;
}

SessionState ReceiveEngine::stream_loop() {
  if (state_ != SessionState::Streaming)
    throw std::logic_error("stream_loop outside Streaming");

  for (;;) {
    std::size_t n = 0;
    std::error_code ec;
    switch (receive(cfg_.chunk_timeout, n, ec)) {
    case RecvResult::Timeout:
      return terminate(SessionState::Timeout, StatusKind::Timeout,
                       "Stream timeout!");
    case RecvResult::Error:
      return terminate(SessionState::TransportError,
                       StatusKind::TransportError, "Error: " + ec.message());
    default:
      break;
    }

    if (is_terminator(buf_.data(), n))
      return terminate(SessionState::Complete, StatusKind::Complete,
                       "Streaming complete!");

    if (!on_chunk(buf_.data(), n))
      return terminate(SessionState::TransportError,
                       StatusKind::TransportError,
                       "Error: write to " + output_path_ + " failed");
  }
}

} // namespace chunkcast
