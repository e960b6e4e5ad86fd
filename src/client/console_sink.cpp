#include "console_sink.hpp"

namespace chunkcast {

ConsoleSink::~ConsoleSink() { stop(); }

void ConsoleSink::start() { th_ = std::thread([this]() { run(); }); }

void ConsoleSink::stop() {
  ch_.close();
  if (th_.joinable())
    th_.join();
}

std::string ConsoleSink::format(const StatusEvent &ev) {
  std::string line;
  if (!ev.filename.empty())
    line += "[" + ev.filename + "] ";
  line += ev.text;
  return line;
}

void ConsoleSink::run() {
  StatusEvent ev;
  for (;;) {
    if (ch_.wait_pop(ev, std::chrono::milliseconds(200))) {
      out_ << format(ev) << std::endl;
      printed_++;
      continue;
    }
    if (ch_.closed() && ch_.size() == 0)
      return;
  }
}

} // namespace chunkcast
