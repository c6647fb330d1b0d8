#include "app/SnapshotBuffers.hpp"

namespace netsentry::app {

SnapshotBuffers::SnapshotBuffers()
    : front_(std::make_shared<const netsentry::model::MonitorSnapshot>()) {}

void SnapshotBuffers::publish(netsentry::model::MonitorSnapshot snap) {
  std::lock_guard<std::mutex> lk(mu_);
  snap.seq = front_->seq + 1;
  front_ = std::make_shared<const netsentry::model::MonitorSnapshot>(std::move(snap));
}

std::shared_ptr<const netsentry::model::MonitorSnapshot> SnapshotBuffers::front() const {
  std::lock_guard<std::mutex> lk(mu_);
  return front_;
}

uint64_t SnapshotBuffers::seq() const {
  std::lock_guard<std::mutex> lk(mu_);
  return front_->seq;
}

} // namespace netsentry::app
