#include "app/Alerts.hpp"
#include "util/Format.hpp"

using netsentry::model::AlertEvent;
using netsentry::model::AlertKind;
using netsentry::model::Classification;
using std::chrono::system_clock;

namespace netsentry::app {

static constexpr const char* kSuspiciousTitle = "Suspicious Connections";
static constexpr const char* kBandwidthTitle = "High Bandwidth";

AlertEngine::AlertEngine(AlertSettings settings) : settings_(settings) {}

std::vector<AlertEvent> AlertEngine::evaluate_connections(
    const std::vector<netsentry::model::Connection>& connections,
    const std::vector<std::string>& notes) {
  std::vector<AlertEvent> out;
  const bool emit = settings_.notifications && settings_.notify_suspicious;
  const auto now = system_clock::now();

  std::unordered_set<int32_t> current;
  size_t new_suspicious = 0;
  for (size_t i = 0; i < connections.size(); ++i) {
    const auto& c = connections[i];
    current.insert(c.pid);
    if (previous_pids_.count(c.pid)) continue;

    if (c.classification == Classification::Blocked) {
      if (!emit) continue;
      const std::string& note = i < notes.size() ? notes[i] : std::string{};
      AlertEvent e;
      e.kind = AlertKind::Suspicious;
      e.title = kSuspiciousTitle;
      e.subject = c.process_name;
      e.reason = note.empty()
          ? "Blocked connection detected from " + c.process_name + "."
          : "Blocked connection from " + c.process_name + ": " + note;
      e.timestamp = now;
      out.push_back(std::move(e));
    } else if (c.classification == Classification::Unclassified && c.heuristic_suspicious) {
      ++new_suspicious;
    }
  }

  if (emit && new_suspicious > 0) {
    AlertEvent e;
    e.kind = AlertKind::Suspicious;
    e.title = kSuspiciousTitle;
    e.reason = std::to_string(new_suspicious) + " suspicious outbound connection(s) detected.";
    e.timestamp = now;
    out.push_back(std::move(e));
  }

  previous_pids_ = std::move(current);
  return out;
}

std::vector<AlertEvent> AlertEngine::evaluate_bandwidth(const netsentry::model::BandwidthSnapshot& snapshot) {
  std::vector<AlertEvent> out;
  const bool emit = settings_.notifications && settings_.notify_bandwidth;
  const uint64_t threshold = settings_.threshold_bytes();
  const auto now = system_clock::now();

  for (const auto& p : snapshot.processes) {
    const uint64_t total = p.total_bytes();
    if (total > threshold) {
      if (!alerted_bandwidth_.insert(p.process_name).second) continue;
      if (!emit) continue;
      AlertEvent e;
      e.kind = AlertKind::Bandwidth;
      e.title = kBandwidthTitle;
      e.subject = p.process_name;
      std::string rate = snapshot.duration_s > 0
          ? netsentry::util::format_rate(static_cast<double>(total) / snapshot.duration_s)
          : netsentry::util::format_bytes(total);
      e.reason = p.process_name + " is using " + rate + ".";
      e.timestamp = now;
      out.push_back(std::move(e));
    } else {
      alerted_bandwidth_.erase(p.process_name);
    }
  }
  return out;
}

void AlertLog::add(AlertEvent e) {
  std::lock_guard<std::mutex> lk(mu_);
  entries_.push_front(std::move(e));
  while (entries_.size() > kMaxEntries) entries_.pop_back();
}

void AlertLog::clear() {
  std::lock_guard<std::mutex> lk(mu_);
  entries_.clear();
}

std::vector<AlertEvent> AlertLog::entries() const {
  std::lock_guard<std::mutex> lk(mu_);
  return {entries_.begin(), entries_.end()};
}

size_t AlertLog::size() const {
  std::lock_guard<std::mutex> lk(mu_);
  return entries_.size();
}

bool AlertLog::empty() const {
  std::lock_guard<std::mutex> lk(mu_);
  return entries_.empty();
}

} // namespace netsentry::app
