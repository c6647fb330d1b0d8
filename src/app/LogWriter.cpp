#include "app/LogWriter.hpp"
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <ctime>

namespace netsentry::app {

std::string format_alert_line(const netsentry::model::AlertEvent& e) {
  auto epoch_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
      e.timestamp.time_since_epoch()).count();
  std::string line = std::to_string(static_cast<long long>(epoch_ms));
  line += ' ';
  line += netsentry::model::to_string(e.kind);
  line += ' ';
  line += e.title;
  line += ": ";
  // Keep one alert per line
  for (char c : e.reason) line += (c == '\n' || c == '\r') ? ' ' : c;
  line += '\n';
  return line;
}

LogWriter::LogWriter(const SnapshotBuffers& buffers, std::filesystem::path log_dir,
                     std::chrono::milliseconds interval)
    : buffers_(buffers), log_dir_(std::move(log_dir)), interval_(interval) {
  std::error_code ec;
  std::filesystem::create_directories(log_dir_, ec);
  if (ec) {
    std::fprintf(stderr, "netsentry: LogWriter: failed to create %s: %s\n",
                 log_dir_.c_str(), ec.message().c_str());
  }
}

LogWriter::~LogWriter() { stop(); }

void LogWriter::start() {
  if (thread_.joinable()) return;
  thread_ = std::jthread([this](std::stop_token st){ run(st); });
}

void LogWriter::stop() {
  if (thread_.joinable()) {
    thread_.request_stop();
    thread_.join();
  }
}

void LogWriter::run(std::stop_token st) {
  std::ofstream file;
  std::filesystem::path current_path;

  std::fprintf(stderr, "netsentry: LogWriter: writing alerts to %s/\n", log_dir_.c_str());

  // Nothing to log before the first publish
  while (buffers_.seq() == 0 && !st.stop_requested()) {
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }

  // Republishes between cycles repeat the cycle's alerts; log each cycle once
  uint64_t last_cycle = 0;
  auto drain = [&]{
    auto snap = buffers_.front();
    if (snap->seq == 0 || snap->cycle == last_cycle) return;
    last_cycle = snap->cycle;
    if (snap->new_alerts.empty()) return;

    auto required_path = chunk_path();
    // Rotate on hour boundary
    if (required_path != current_path || !file.is_open()) {
      if (file.is_open()) file.close();
      file.open(required_path, std::ios::app);
      if (!file) {
        std::fprintf(stderr, "netsentry: LogWriter: failed to open %s: %s\n",
                     required_path.c_str(), std::strerror(errno));
        current_path.clear();
        return;
      }
      current_path = required_path;
    }
    for (const auto& a : snap->new_alerts) {
      auto line = format_alert_line(a);
      file.write(line.data(), static_cast<std::streamsize>(line.size()));
    }
    file.flush();
  };

  while (!st.stop_requested()) {
    drain();
    std::this_thread::sleep_for(interval_);
  }
  drain();

  if (file.is_open()) {
    file.flush();
    file.close();
  }
}

std::filesystem::path LogWriter::chunk_path() const {
  auto now = std::chrono::system_clock::now();
  auto now_t = std::chrono::system_clock::to_time_t(now);
  std::tm tm{};
  ::localtime_r(&now_t, &tm);

  char buf[64];
  std::snprintf(buf, sizeof(buf), "netsentry_%04d-%02d-%02d_%02d.log",
                tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday, tm.tm_hour);

  return log_dir_ / buf;
}

} // namespace netsentry::app
