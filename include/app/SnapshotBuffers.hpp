#pragma once
#include <atomic>
#include <cstdint>
#include <memory>
#include "model/Snapshot.hpp"

namespace zenmon::app {

// Single-writer snapshot handoff. The producer fills back() and publish()
// swaps it in as the new front; readers hold a shared reference to the
// front they loaded, so they never observe a half-written snapshot.
class SnapshotBuffers {
public:
  SnapshotBuffers();
  // Non-copyable
  SnapshotBuffers(const SnapshotBuffers&) = delete;
  SnapshotBuffers& operator=(const SnapshotBuffers&) = delete;

  // Staging snapshot; producer thread only.
  zenmon::model::Snapshot& back() { return back_; }
  void publish();

  std::shared_ptr<const zenmon::model::Snapshot> front() const;
  uint64_t seq() const { return seq_.load(std::memory_order_acquire); }

private:
  zenmon::model::Snapshot back_{};
  std::atomic<std::shared_ptr<const zenmon::model::Snapshot>> front_;
  std::atomic<uint64_t> seq_{0};
};

} // namespace zenmon::app
