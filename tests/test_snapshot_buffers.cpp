#include "minitest.hpp"
#include "app/SnapshotBuffers.hpp"

TEST(snapshot_buffers_start_empty) {
  zenmon::app::SnapshotBuffers bufs;
  ASSERT_EQ(bufs.seq(), 0u);
  auto front = bufs.front();
  ASSERT_TRUE(front != nullptr);
  ASSERT_TRUE(!front->status.has_data);
  ASSERT_TRUE(front->telemetry.cores.empty());
}

TEST(snapshot_buffers_publish_swaps_and_increments_seq) {
  zenmon::app::SnapshotBuffers bufs;
  auto& back = bufs.back();
  back.system.cpu_name = "first";
  back.telemetry.cores.resize(4);
  bufs.publish();
  auto front1 = bufs.front();
  ASSERT_EQ(front1->system.cpu_name, "first");
  ASSERT_EQ(front1->telemetry.cores.size(), 4u);
  auto seq1 = front1->seq;
  ASSERT_EQ(seq1, bufs.seq());

  auto& back2 = bufs.back();
  back2.system.cpu_name = "second";
  back2.telemetry.cores.resize(2);
  bufs.publish();
  auto front2 = bufs.front();
  ASSERT_TRUE(front2->seq == seq1 + 1);
  ASSERT_EQ(front2->system.cpu_name, "second");
  // A reader holding the old front still sees the old values
  ASSERT_EQ(front1->system.cpu_name, "first");
  ASSERT_EQ(front1->telemetry.cores.size(), 4u);
}
