#include "internal/queue/durable_queue.hpp"

#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <system_error>
#include <thread>

#include "config/config.pb.h"
#include "internal/util/errors.hpp"

namespace {

namespace fs = std::filesystem;

using assetdiff::jobs::v1::DurableJob;
using assetdiff::queue::DurableQueue;

assetdiff::runtime::config::QueueConfig Config(const std::string& name, uint64_t segment_bytes = 1 << 20, bool fsync = false) {
  const auto dir = fs::temp_directory_path() / "assetdiff_queue_tests" / name;
  fs::remove_all(dir);

  assetdiff::runtime::config::QueueConfig config;
  config.set_directory(dir.string());
  config.set_segment_bytes(segment_bytes);
  config.set_fsync(fsync);
  return config;
}

DurableJob DiffJob(uint64_t pull_request) {
  DurableJob job;
  auto*      diff = job.mutable_diff();
  diff->mutable_repo()->set_id(1);
  diff->mutable_repo()->set_full_name("org/game");
  diff->set_pull_request(pull_request);
  diff->set_report_handle("check-" + std::to_string(pull_request));
  job.set_enqueued_at_ms(1700000000000);
  return job;
}

std::size_t SegmentFiles(const fs::path& dir) {
  std::size_t count = 0;
  for (const auto& entry : fs::directory_iterator(dir)) {
    if (entry.path().filename().string().rfind("segment-", 0) == 0) ++count;
  }
  return count;
}

fs::path OnlySegment(const fs::path& dir) {
  for (const auto& entry : fs::directory_iterator(dir)) {
    if (entry.path().filename().string().rfind("segment-", 0) == 0) return entry.path();
  }
  return {};
}

void TestUncommittedEntriesAreRedelivered() {
  const auto config = Config("redeliver", 1 << 20, true);
  {
    DurableQueue queue(config);
    assert(queue.Enqueue(DiffJob(1)).sequence == 1);
    assert(queue.Enqueue(DiffJob(2)).sequence == 2);
    assert(queue.Enqueue(DiffJob(3)).sequence == 3);

    auto first = queue.Dequeue();
    assert(first && first->sequence == 1);
    // delivered but never committed
  }

  DurableQueue reopened(config);
  assert(reopened.Stats().pending == 3);
  for (uint64_t expected = 1; expected <= 3; ++expected) {
    auto entry = reopened.Dequeue();
    assert(entry.has_value());
    assert(entry->sequence == expected);
    assert(entry->job.diff().pull_request() == expected);
    assert(entry->job.diff().repo().full_name() == "org/game");
  }
  assert(reopened.Stats().next_sequence == 4);
}

void TestCommittedEntriesAreNotRedelivered() {
  const auto config = Config("commit");
  {
    DurableQueue queue(config);
    for (uint64_t pr = 1; pr <= 4; ++pr) queue.Enqueue(DiffJob(pr));
    for (int i = 0; i < 4; ++i) assert(queue.Dequeue().has_value());

    queue.Commit(1);
    queue.Commit(3); // ahead of the gap at 2
    queue.Commit(1); // already below the cursor
    assert(queue.Stats().pending == 2);
  }

  DurableQueue reopened(config);
  auto         second = reopened.Dequeue();
  auto         third  = reopened.Dequeue();
  auto         fourth = reopened.Dequeue();
  assert(second->sequence == 2);
  assert(third->sequence == 3);
  assert(fourth->sequence == 4);

  reopened.Commit(2);
  reopened.Commit(3);
  reopened.Commit(4);
  assert(reopened.Stats().pending == 0);
  assert(reopened.Enqueue(DiffJob(5)).sequence == 5);
}

void TestCommitOfUnknownSequenceThrows() {
  DurableQueue queue(Config("unknown"));
  queue.Enqueue(DiffJob(1));

  bool threw = false;
  try {
    queue.Commit(9);
  } catch (const assetdiff::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
}

void TestTornTailIsTruncated() {
  const auto config = Config("torn");
  uintmax_t  intact = 0;
  {
    DurableQueue queue(config);
    queue.Enqueue(DiffJob(1));
    queue.Enqueue(DiffJob(2));
    intact = fs::file_size(OnlySegment(config.directory()));
  }

  {
    std::ofstream out(OnlySegment(config.directory()), std::ios::binary | std::ios::app);
    out << "ADQ1\x05partial";
  }
  assert(fs::file_size(OnlySegment(config.directory())) > intact);

  DurableQueue reopened(config);
  assert(reopened.Stats().pending == 2);
  assert(fs::file_size(OnlySegment(config.directory())) == intact);
  assert(reopened.Enqueue(DiffJob(3)).sequence == 3);
}

void TestDamageBeforeTheTailIsCorruption() {
  const auto config = Config("damaged", 1);
  {
    DurableQueue queue(config);
    queue.Enqueue(DiffJob(1));
    queue.Enqueue(DiffJob(2));
    assert(queue.Stats().segments == 2);
  }

  const auto first = fs::path(config.directory()) / "segment-1.log";
  {
    std::fstream file(first, std::ios::binary | std::ios::in | std::ios::out);
    file.seekp(-1, std::ios::end);
    file.put('\x7f');
  }

  bool threw = false;
  try {
    DurableQueue reopened(config);
  } catch (const assetdiff::util::QueueCorrupted&) {
    threw = true;
  }
  assert(threw);
}

void TestConsumedSegmentsAreDeleted() {
  const auto config = Config("segments", 1);
  DurableQueue queue(config);
  for (uint64_t pr = 1; pr <= 3; ++pr) queue.Enqueue(DiffJob(pr));
  assert(queue.Stats().segments == 3);
  assert(SegmentFiles(config.directory()) == 3);

  for (int i = 0; i < 3; ++i) {
    auto entry = queue.Dequeue();
    queue.Commit(entry->sequence);
  }

  // the active segment is kept for appends
  assert(queue.Stats().segments == 1);
  assert(SegmentFiles(config.directory()) == 1);
  assert(fs::exists(fs::path(config.directory()) / "cursor"));
}

void TestShutdownReleasesBlockedConsumer() {
  DurableQueue queue(Config("shutdown"));

  bool        released = false;
  std::thread consumer([&] { released = !queue.Dequeue().has_value(); });
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  queue.Shutdown();
  consumer.join();
  assert(released);

  bool threw = false;
  try {
    queue.Enqueue(DiffJob(1));
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

void TestFailedCursorWriteKeepsEntryPending() {
  const auto     config = Config("cursor_failure");
  const fs::path dir(config.directory());
  {
    DurableQueue queue(config);
    queue.Enqueue(DiffJob(1));
    queue.Enqueue(DiffJob(2));
    auto first = queue.Dequeue();
    assert(first && first->sequence == 1);

    // a directory where the cursor's temp file goes makes the write fail
    fs::create_directories(dir / "cursor.tmp");
    bool threw = false;
    try {
      queue.Commit(1);
    } catch (const std::system_error&) {
      threw = true;
    }
    assert(threw);
    assert(queue.Stats().pending == 2);

    fs::remove_all(dir / "cursor.tmp");
    queue.Commit(1);
    assert(queue.Stats().pending == 1);
  }

  DurableQueue reopened(config);
  auto         next = reopened.Dequeue();
  assert(next && next->sequence == 2);
  assert(reopened.Stats().pending == 1);
}

void TestFnv1aMatchesReferenceVectors() {
  assert(DurableQueue::Fnv1a("") == 0xcbf29ce484222325ull);
  assert(DurableQueue::Fnv1a("a") == 0xaf63dc4c8601ec8cull);
}

} // namespace

int main() {
  TestUncommittedEntriesAreRedelivered();
  TestCommittedEntriesAreNotRedelivered();
  TestCommitOfUnknownSequenceThrows();
  TestTornTailIsTruncated();
  TestDamageBeforeTheTailIsCorruption();
  TestConsumedSegmentsAreDeleted();
  TestShutdownReleasesBlockedConsumer();
  TestFailedCursorWriteKeepsEntryPending();
  TestFnv1aMatchesReferenceVectors();

  std::cout << "assetdiff_unit_durable_queue: pass\n";
  return 0;
}
