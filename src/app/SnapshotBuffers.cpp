#include "app/SnapshotBuffers.hpp"

namespace zenmon::app {

SnapshotBuffers::SnapshotBuffers()
  : front_(std::make_shared<const zenmon::model::Snapshot>()) {}

void SnapshotBuffers::publish() {
  // increment sequence before publish
  back_.seq = seq_.load(std::memory_order_relaxed) + 1;
  front_.store(std::make_shared<const zenmon::model::Snapshot>(back_), std::memory_order_release);
  seq_.store(back_.seq, std::memory_order_release);
}

std::shared_ptr<const zenmon::model::Snapshot> SnapshotBuffers::front() const {
  return front_.load(std::memory_order_acquire);
}

} // namespace zenmon::app
