#pragma once
#include <cstdint>
#include <memory>
#include <mutex>
#include "model/Snapshot.hpp"

namespace netsentry::app {

// Single-writer publish point. Readers get an immutable snapshot that stays
// valid for as long as they hold it; a publish never tears a reader's view.
class SnapshotBuffers {
public:
  SnapshotBuffers();
  SnapshotBuffers(const SnapshotBuffers&) = delete;
  SnapshotBuffers& operator=(const SnapshotBuffers&) = delete;

  // Stamps the next sequence number and swaps it in
  void publish(netsentry::model::MonitorSnapshot snap);

  [[nodiscard]] std::shared_ptr<const netsentry::model::MonitorSnapshot> front() const;
  [[nodiscard]] uint64_t seq() const;

private:
  mutable std::mutex mu_;
  std::shared_ptr<const netsentry::model::MonitorSnapshot> front_;
};

} // namespace netsentry::app
