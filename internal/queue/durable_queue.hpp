#pragma once

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>

#include "assetdiff/jobs/v1/job.pb.h"
#include "internal/util/file.hpp"

namespace assetdiff::runtime::config {
class QueueConfig;
}

namespace assetdiff::queue {

struct EnqueueAck {
  uint64_t sequence = 0;
};

struct QueueEntry {
  uint64_t                        sequence = 0;
  assetdiff::jobs::v1::DurableJob job;
};

struct QueueStats {
  uint64_t pending       = 0; // enqueued and not yet committed
  uint64_t next_sequence = 0;
  uint64_t segments      = 0;
};

/*
  Append-only, directory-backed job queue with at-least-once delivery.

  On disk:
      segment-<first sequence>.log   framed records
      cursor                         first uncommitted sequence

  Record frame (little endian):
      u32 magic | u32 length | u64 sequence | u64 fnv1a(payload) | payload

  Enqueue returns only after the record is written (and fsynced when
  configured). Entries are redelivered after a restart until committed. A torn
  record at the tail of the last segment is truncated on open; damage anywhere
  else raises QueueCorrupted.

  Enqueue/Stats are safe from any thread; Dequeue/Commit expect one consumer.
*/
class DurableQueue {
 public:
  explicit DurableQueue(const assetdiff::runtime::config::QueueConfig& config);

  DurableQueue(const DurableQueue&)            = delete;
  DurableQueue& operator=(const DurableQueue&) = delete;

  EnqueueAck Enqueue(const assetdiff::jobs::v1::DurableJob& job);

  // blocking wait; nullopt once shut down, leaving undelivered entries on disk
  std::optional<QueueEntry> Dequeue();

  // Durably marks `sequence` as processed.
  void Commit(uint64_t sequence);

  void Shutdown();

  QueueStats Stats() const;

  static uint64_t Fnv1a(const std::string& data);

 private:
  struct Segment {
    std::filesystem::path path;
    uint64_t              first = 0;
    uint64_t              last  = 0; // 0 while empty
    uint64_t              bytes = 0;
  };

  void Recover();
  void RecoverSegment(Segment& segment, bool is_last);
  void OpenActive();
  void RollSegment();
  void WriteCursor(uint64_t cursor);
  void DropConsumedSegments();

  std::filesystem::path SegmentPath(uint64_t first) const;
  std::filesystem::path CursorPath() const;

  std::filesystem::path directory_;
  uint64_t              segment_bytes_;
  bool                  fsync_;

  mutable std::mutex      mutex_;
  std::condition_variable cv_;
  bool                    shutdown_ = false;

  std::map<uint64_t, Segment> segments_; // by first sequence
  util::UniqueFd              active_;   // last segment, open for append

  std::deque<QueueEntry> ready_;
  std::set<uint64_t>     in_flight_;
  std::set<uint64_t>     committed_ahead_; // committed past a gap in the cursor

  uint64_t cursor_        = 1;
  uint64_t next_sequence_ = 1;
};

} // namespace assetdiff::queue
