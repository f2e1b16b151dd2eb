#include "internal/queue/durable_queue.hpp"

#include <algorithm>
#include <iterator>
#include <system_error>

#include <fcntl.h>
#include <unistd.h>

#include "config/config.pb.h"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace assetdiff::queue {

namespace {

using observability::StringField;
using observability::UintField;

constexpr uint32_t    kMagic         = 0x31514441; // "ADQ1"
constexpr std::size_t kHeaderSize    = 4 + 4 + 8 + 8;
constexpr uint32_t    kMaxRecordSize = 64u << 20;
constexpr const char* kSegmentPrefix = "segment-";
constexpr const char* kSegmentSuffix = ".log";

void PutU32(std::string& out, uint32_t v) {
  for (int i = 0; i < 4; ++i) out.push_back(static_cast<char>((v >> (8 * i)) & 0xff));
}

void PutU64(std::string& out, uint64_t v) {
  for (int i = 0; i < 8; ++i) out.push_back(static_cast<char>((v >> (8 * i)) & 0xff));
}

uint64_t GetLE(const std::string& in, std::size_t offset, int bytes) {
  uint64_t v = 0;
  for (int i = 0; i < bytes; ++i) {
    v |= static_cast<uint64_t>(static_cast<unsigned char>(in[offset + i])) << (8 * i);
  }
  return v;
}

std::optional<uint64_t> ParseSegmentName(const std::string& name) {
  const std::string prefix = kSegmentPrefix;
  const std::string suffix = kSegmentSuffix;
  if (name.size() <= prefix.size() + suffix.size()) return std::nullopt;
  if (name.compare(0, prefix.size(), prefix) != 0) return std::nullopt;
  if (name.compare(name.size() - suffix.size(), suffix.size(), suffix) != 0) return std::nullopt;

  const std::string digits = name.substr(prefix.size(), name.size() - prefix.size() - suffix.size());
  uint64_t          value  = 0;
  for (char c : digits) {
    if (c < '0' || c > '9') return std::nullopt;
    value = value * 10 + static_cast<uint64_t>(c - '0');
  }
  return value;
}

std::system_error Errno(const std::string& what, const std::filesystem::path& path) {
  return std::system_error(errno, std::generic_category(), what + " " + path.string());
}

} // namespace

uint64_t DurableQueue::Fnv1a(const std::string& data) {
  uint64_t hash = 1469598103934665603ull;
  for (unsigned char c : data) {
    hash ^= static_cast<uint64_t>(c);
    hash *= 1099511628211ull;
  }
  return hash;
}

DurableQueue::DurableQueue(const assetdiff::runtime::config::QueueConfig& config)
    : directory_(config.directory()), segment_bytes_(config.segment_bytes()), fsync_(config.fsync()) {
  if (directory_.empty()) {
    throw util::InvalidArgument("queue.directory must not be empty");
  }
  if (segment_bytes_ == 0) {
    throw util::InvalidArgument("queue.segment_bytes must be positive");
  }

  std::lock_guard lock(mutex_);
  Recover();

  ASSETDIFF_LOG_INFO("queue opened",
                     {StringField("directory", directory_.string()),
                      UintField("pending", ready_.size()),
                      UintField("cursor", cursor_),
                      UintField("segments", segments_.size())});
  observability::Metrics::Instance().SetQueueDepth(ready_.size());
}

std::filesystem::path DurableQueue::SegmentPath(uint64_t first) const {
  return directory_ / (kSegmentPrefix + std::to_string(first) + kSegmentSuffix);
}

std::filesystem::path DurableQueue::CursorPath() const {
  return directory_ / "cursor";
}

// ------------------------------------------------------------
// Recovery
// ------------------------------------------------------------

void DurableQueue::Recover() {
  std::filesystem::create_directories(directory_);

  if (std::filesystem::exists(CursorPath())) {
    const std::string text = util::ReadFile(CursorPath());
    try {
      cursor_ = std::stoull(text);
    } catch (const std::logic_error&) {
      throw util::QueueCorrupted("unreadable queue cursor: '" + text + "'");
    }
    if (cursor_ == 0) cursor_ = 1;
  }

  for (const auto& entry : std::filesystem::directory_iterator(directory_)) {
    if (!entry.is_regular_file()) continue;
    const auto first = ParseSegmentName(entry.path().filename().string());
    if (!first) continue;
    segments_[*first] = Segment{entry.path(), *first, 0, 0};
  }

  uint64_t last_sequence = 0;
  for (auto it = segments_.begin(); it != segments_.end(); ++it) {
    RecoverSegment(it->second, std::next(it) == segments_.end());
    if (it->second.last != 0) {
      if (it->second.first > it->second.last || it->second.last <= last_sequence) {
        throw util::QueueCorrupted("segment " + it->second.path.string() + " is out of sequence");
      }
      last_sequence = it->second.last;
    }
  }

  next_sequence_ = std::max(cursor_, last_sequence + 1);
  DropConsumedSegments();
  OpenActive();
}

void DurableQueue::RecoverSegment(Segment& segment, bool is_last) {
  const std::string data = util::ReadFile(segment.path);

  std::size_t offset = 0;
  uint64_t    last   = 0;
  while (data.size() - offset >= kHeaderSize) {
    const auto magic    = static_cast<uint32_t>(GetLE(data, offset, 4));
    const auto length   = static_cast<uint32_t>(GetLE(data, offset + 4, 4));
    const auto sequence = GetLE(data, offset + 8, 8);
    const auto checksum = GetLE(data, offset + 16, 8);

    if (magic != kMagic || length > data.size() - offset - kHeaderSize) break;
    const std::string payload = data.substr(offset + kHeaderSize, length);
    if (Fnv1a(payload) != checksum) break;

    if (sequence <= last) {
      throw util::QueueCorrupted("sequence " + std::to_string(sequence) + " repeats in " + segment.path.string());
    }
    last = sequence;

    if (sequence >= cursor_) {
      QueueEntry entry;
      entry.sequence = sequence;
      if (!entry.job.ParseFromString(payload)) {
        throw util::QueueCorrupted("undecodable job " + std::to_string(sequence) + " in " + segment.path.string());
      }
      ready_.push_back(std::move(entry));
    }
    offset += kHeaderSize + length;
  }

  if (offset < data.size()) {
    if (!is_last) {
      throw util::QueueCorrupted("damaged record in " + segment.path.string() + " at offset " + std::to_string(offset));
    }
    ASSETDIFF_LOG_WARN("truncating torn queue record",
                       {StringField("segment", segment.path.string()), UintField("offset", offset), UintField("bytes", data.size() - offset)});
    std::filesystem::resize_file(segment.path, offset);
  }

  segment.last  = last;
  segment.bytes = offset;
}

// ------------------------------------------------------------
// Segments
// ------------------------------------------------------------

void DurableQueue::OpenActive() {
  if (segments_.empty()) {
    const auto path = SegmentPath(next_sequence_);
    segments_[next_sequence_] = Segment{path, next_sequence_, 0, 0};
  }

  const auto& segment = segments_.rbegin()->second;
  active_             = util::UniqueFd(::open(segment.path.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0644));
  if (!active_.Valid()) throw Errno("open", segment.path);
  if (fsync_) util::FsyncDirectory(directory_);
}

void DurableQueue::RollSegment() {
  active_.Reset();
  segments_[next_sequence_] = Segment{SegmentPath(next_sequence_), next_sequence_, 0, 0};
  OpenActive();
}

void DurableQueue::DropConsumedSegments() {
  if (segments_.empty()) return;
  const uint64_t active_first = segments_.rbegin()->first;

  for (auto it = segments_.begin(); it != segments_.end() && it->first != active_first;) {
    const auto& segment = it->second;
    if (segment.last != 0 && segment.last >= cursor_) break;

    std::error_code ec;
    std::filesystem::remove(segment.path, ec);
    if (ec) {
      ASSETDIFF_LOG_WARN("failed to delete consumed segment", {StringField("segment", segment.path.string()), StringField("error", ec.message())});
      break;
    }
    it = segments_.erase(it);
  }
}

void DurableQueue::WriteCursor(uint64_t cursor) {
  util::WriteFileAtomic(CursorPath(), std::to_string(cursor) + "\n", fsync_);
}

// ------------------------------------------------------------
// Producer / consumer
// ------------------------------------------------------------

EnqueueAck DurableQueue::Enqueue(const assetdiff::jobs::v1::DurableJob& job) {
  std::string payload;
  if (!job.SerializeToString(&payload)) {
    throw util::InvalidArgument("job cannot be serialized");
  }
  if (payload.size() > kMaxRecordSize) {
    throw util::InvalidArgument("job exceeds " + std::to_string(kMaxRecordSize) + " bytes");
  }

  std::lock_guard lock(mutex_);
  if (shutdown_) {
    throw std::runtime_error("queue is shut down");
  }

  const uint64_t sequence = next_sequence_;

  std::string record;
  record.reserve(kHeaderSize + payload.size());
  PutU32(record, kMagic);
  PutU32(record, static_cast<uint32_t>(payload.size()));
  PutU64(record, sequence);
  PutU64(record, Fnv1a(payload));
  record += payload;

  if (segments_.rbegin()->second.bytes > 0 && segments_.rbegin()->second.bytes + record.size() > segment_bytes_) {
    RollSegment();
  }

  auto& segment = segments_.rbegin()->second;
  try {
    util::WriteAll(active_.Get(), record, segment.path);
    if (fsync_ && ::fsync(active_.Get()) != 0) throw Errno("fsync", segment.path);
  } catch (const std::system_error&) {
    // drop the partial record so later appends stay readable
    if (::ftruncate(active_.Get(), static_cast<off_t>(segment.bytes)) != 0) {
      ASSETDIFF_LOG_ERROR("failed to roll back partial queue record", {StringField("segment", segment.path.string())});
    }
    throw;
  }

  segment.bytes += record.size();
  segment.last = sequence;
  ++next_sequence_;

  QueueEntry entry;
  entry.sequence = sequence;
  entry.job      = job;
  ready_.push_back(std::move(entry));

  observability::Metrics::Instance().SetQueueDepth(ready_.size() + in_flight_.size());
  cv_.notify_one();
  return EnqueueAck{sequence};
}

std::optional<QueueEntry> DurableQueue::Dequeue() {
  std::unique_lock lock(mutex_);

  cv_.wait(lock, [&] { return shutdown_ || !ready_.empty(); });

  // undelivered entries stay on disk for the next start
  if (shutdown_) return std::nullopt;

  QueueEntry entry = std::move(ready_.front());
  ready_.pop_front();
  in_flight_.insert(entry.sequence);
  return entry;
}

void DurableQueue::Commit(uint64_t sequence) {
  std::lock_guard lock(mutex_);
  if (sequence < cursor_) return;
  if (sequence >= next_sequence_) {
    throw util::InvalidArgument("commit of unknown sequence " + std::to_string(sequence));
  }

  if (sequence != cursor_) {
    in_flight_.erase(sequence);
    committed_ahead_.insert(sequence);
    observability::Metrics::Instance().SetQueueDepth(ready_.size() + in_flight_.size());
    return;
  }

  uint64_t cursor = cursor_ + 1;
  while (committed_ahead_.count(cursor) > 0) ++cursor;

  // memory follows disk; a failed write leaves the entry uncommitted
  WriteCursor(cursor);
  committed_ahead_.erase(committed_ahead_.begin(), committed_ahead_.lower_bound(cursor));
  in_flight_.erase(sequence);
  cursor_ = cursor;
  DropConsumedSegments();

  observability::Metrics::Instance().SetQueueDepth(ready_.size() + in_flight_.size());
}

void DurableQueue::Shutdown() {
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
  }
  cv_.notify_all();
}

QueueStats DurableQueue::Stats() const {
  std::lock_guard lock(mutex_);
  QueueStats      stats;
  stats.pending       = ready_.size() + in_flight_.size();
  stats.next_sequence = next_sequence_;
  stats.segments      = segments_.size();
  return stats;
}

} // namespace assetdiff::queue
