#pragma once

#include <chrono>
#include <filesystem>
#include <fstream>
#include <stop_token>
#include <string>
#include <thread>
#include "app/SnapshotBuffers.hpp"

namespace netsentry::app {

// One line per alert: "<epoch_ms> <kind> <title>: <reason>"
[[nodiscard]] std::string format_alert_line(const netsentry::model::AlertEvent& e);

// Appends the alerts of each newly published cycle to hourly files
// <log_dir>/netsentry_YYYY-MM-DD_HH.log
class LogWriter {
public:
  LogWriter(const SnapshotBuffers& buffers, std::filesystem::path log_dir,
            std::chrono::milliseconds interval = std::chrono::milliseconds(250));
  ~LogWriter();
  LogWriter(const LogWriter&) = delete;
  LogWriter& operator=(const LogWriter&) = delete;

  void start();
  void stop();

private:
  void run(std::stop_token st);
  [[nodiscard]] std::filesystem::path chunk_path() const;

  const SnapshotBuffers& buffers_;
  std::filesystem::path log_dir_;
  std::chrono::milliseconds interval_;
  std::jthread thread_;
};

} // namespace netsentry::app
