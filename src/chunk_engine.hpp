#pragma once
#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "event_bus.hpp"
#include "log.hpp"
#include "model.hpp"
#include "protocol.hpp"
#include "transfer.hpp"

inline constexpr std::size_t kChunkSize = 1024 * 1024;
inline constexpr uint64_t kChunkThreshold = 70ull * 1024 * 1024;

struct ChunkLimits {
  std::size_t chunk_size = kChunkSize;
  uint64_t threshold = kChunkThreshold;
};

inline bool needs_chunking(uint64_t size, const ChunkLimits& limits) {
  return size > limits.threshold;
}

inline uint64_t chunk_count(uint64_t size, std::size_t chunk_size) {
  return size == 0 ? 1 : (size + chunk_size - 1) / chunk_size;
}

// Ephemeral progress entries, one per transfer in flight. An entry is
// dropped when it reaches 100% or is discarded.
class ProgressTracker {
public:
  explicit ProgressTracker(EventBus* bus = nullptr);

  void begin(const std::string& transfer_id, uint64_t total_bytes, ProgressDirection direction);
  // bytes_delivered is absolute; values below the last report are ignored.
  int update(const std::string& transfer_id, uint64_t bytes_delivered);
  void discard(const std::string& transfer_id);

  std::optional<ChunkProgress> get(const std::string& transfer_id) const;
  std::size_t active() const;

  static int percent(uint64_t delivered, uint64_t total);

private:
  EventBus* bus_ = nullptr;
  mutable std::mutex mutex_;
  std::unordered_map<std::string, ChunkProgress> entries_;
};

struct SendReport {
  std::string transfer_id;
  uint64_t frames_sent = 0;
  uint64_t bytes_sent = 0;
  bool completed = false;
  std::string error;
};

// Streams one transfer as file-chunk frames, one frame in flight at a time.
// The writer must call on_written once per frame; it may do so synchronously.
class ChunkSender : public std::enable_shared_from_this<ChunkSender> {
public:
  using WriteCallback = std::function<void(bool ok)>;
  using FrameWriter = std::function<void(const json& frame, WriteCallback on_written)>;
  using Completion = std::function<void(const SendReport& report)>;

  static std::shared_ptr<ChunkSender> create(Transfer transfer,
                                             ChunkLimits limits,
                                             FrameWriter writer,
                                             ProgressTracker* progress,
                                             Completion on_complete,
                                             std::string relay_to = std::string(),
                                             std::shared_ptr<Logger> logger = nullptr);

  void start();
  void cancel(const std::string& reason);

  const std::string& transfer_id() const { return transfer_.meta.id; }
  uint64_t total_chunks() const { return total_chunks_; }
  bool finished() const { return finished_; }

private:
  ChunkSender(Transfer transfer, ChunkLimits limits, FrameWriter writer, ProgressTracker* progress,
              Completion on_complete, std::string relay_to, std::shared_ptr<Logger> logger);

  void pump();
  bool send_next();
  void on_frame_written(bool ok, uint64_t frame_bytes);
  void finish(bool completed, const std::string& error);

  Transfer transfer_;
  ChunkLimits limits_;
  FrameWriter writer_;
  ProgressTracker* progress_ = nullptr;
  Completion on_complete_;
  std::string relay_to_;
  std::shared_ptr<Logger> logger_;

  uint64_t total_chunks_ = 0;
  uint64_t next_index_ = 0;
  // start(), cancel() and write completions may run on different threads;
  // state_mutex_ guards the pump flags and the counters.
  std::mutex state_mutex_;
  uint64_t bytes_sent_ = 0;
  uint64_t frames_written_ = 0;
  bool pumping_ = false;
  bool resume_ = false;
  bool awaiting_write_ = false;
  std::atomic<bool> cancelled_{false};
  std::atomic<bool> finished_{false};
  std::string cancel_reason_;
  std::mutex finish_mutex_;
};

struct AssembledPayload {
  std::string transfer_id;
  std::string source;
  std::string bytes;
  std::optional<TransferMeta> meta;
};

// Reassembles chunk streams keyed by transfer id. Indices may arrive in any
// order; a repeated index overwrites the earlier slice.
class ChunkAssembler {
public:
  using Clock = std::chrono::steady_clock;

  ChunkAssembler(ProgressTracker* progress,
                 std::chrono::milliseconds timeout,
                 std::shared_ptr<Logger> logger = nullptr);

  // Returns the payload once every index is present. Throws ProtocolError
  // when a frame disagrees with the stream it belongs to.
  std::optional<AssembledPayload> accept(const std::string& source,
                                         const ChunkFrame& frame,
                                         Clock::time_point now = Clock::now());

  bool abort(const std::string& transfer_id);
  std::vector<std::string> abort_from(const std::string& source);
  std::vector<std::string> expire(Clock::time_point now = Clock::now());

  bool has(const std::string& transfer_id) const;
  std::size_t in_flight() const;
  std::chrono::milliseconds timeout() const { return timeout_; }

private:
  struct Assembly {
    std::string source;
    uint64_t total_chunks = 0;
    uint64_t total_size = 0;
    uint64_t bytes_received = 0;
    std::map<uint64_t, std::string> chunks;
    std::optional<TransferMeta> meta;
    Clock::time_point last_activity;
  };

  ProgressTracker* progress_ = nullptr;
  std::chrono::milliseconds timeout_;
  std::shared_ptr<Logger> logger_;
  mutable std::mutex mutex_;
  std::unordered_map<std::string, Assembly> assemblies_;
};
