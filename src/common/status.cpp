#include "status.hpp"

namespace chunkcast {

const char *status_kind_name(StatusKind k) {
  switch (k) {
  case StatusKind::Requested:
    return "requested";
  case StatusKind::Waiting:
    return "waiting";
  case StatusKind::Started:
    return "started";
  case StatusKind::Progress:
    return "progress";
  case StatusKind::PlaybackReady:
    return "playback-ready";
  case StatusKind::Complete:
    return "complete";
  case StatusKind::NotFound:
    return "not-found";
  case StatusKind::Timeout:
    return "timeout";
  case StatusKind::TransportError:
    return "transport-error";
  default:
    return "rejected";
  }
}

bool is_terminal(StatusKind k) {
  switch (k) {
  case StatusKind::Complete:
  case StatusKind::NotFound:
  case StatusKind::Timeout:
  case StatusKind::TransportError:
  case StatusKind::Rejected:
    return true;
  default:
    return false;
  }
}

void StatusChannel::push(StatusEvent ev) {
  {
    std::lock_guard<std::mutex> lk(mtx_);
    if (closed_)
      return;
    q_.push_back(std::move(ev));
  }
  cv_.notify_one();
}

bool StatusChannel::try_pop(StatusEvent &out) {
  std::lock_guard<std::mutex> lk(mtx_);
  if (q_.empty())
    return false;
  out = std::move(q_.front());
  q_.pop_front();
  return true;
}

bool StatusChannel::wait_pop(StatusEvent &out,
                             std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lk(mtx_);
  if (!cv_.wait_for(lk, timeout, [this] { return !q_.empty() || closed_; }))
    return false;
  if (q_.empty())
    return false;
  out = std::move(q_.front());
  q_.pop_front();
  return true;
}

void StatusChannel::close() {
  {
    std::lock_guard<std::mutex> lk(mtx_);
    closed_ = true;
  }
  cv_.notify_all();
}

bool StatusChannel::closed() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return closed_;
}

std::size_t StatusChannel::size() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return q_.size();
}

} // namespace chunkcast
