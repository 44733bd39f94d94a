#include "chunk_engine.hpp"

#include <algorithm>

// ---- ProgressTracker ------------------------------------------------------

ProgressTracker::ProgressTracker(EventBus* bus) : bus_(bus) {}

int ProgressTracker::percent(uint64_t delivered, uint64_t total) {
  if(total == 0) return 100;
  if(delivered >= total) return 100;
  return static_cast<int>((delivered * 100) / total);
}

void ProgressTracker::begin(const std::string& transfer_id,
                            uint64_t total_bytes,
                            ProgressDirection direction) {
  std::lock_guard lg(mutex_);
  ChunkProgress p;
  p.transfer_id = transfer_id;
  p.total_bytes = total_bytes;
  p.direction = direction;
  entries_[transfer_id] = p;
}

int ProgressTracker::update(const std::string& transfer_id, uint64_t bytes_delivered) {
  ChunkProgress snapshot;
  int pct = 0;
  {
    std::lock_guard lg(mutex_);
    auto it = entries_.find(transfer_id);
    if(it == entries_.end()) return 100;
    auto& entry = it->second;
    entry.bytes_delivered = std::min(std::max(entry.bytes_delivered, bytes_delivered), entry.total_bytes);
    pct = percent(entry.bytes_delivered, entry.total_bytes);
    snapshot = entry;
    if(pct >= 100) entries_.erase(it);
  }
  if(bus_) bus_->publish(Event{ChunkProgressed{snapshot, pct}});
  return pct;
}

void ProgressTracker::discard(const std::string& transfer_id) {
  std::lock_guard lg(mutex_);
  entries_.erase(transfer_id);
}

std::optional<ChunkProgress> ProgressTracker::get(const std::string& transfer_id) const {
  std::lock_guard lg(mutex_);
  auto it = entries_.find(transfer_id);
  if(it == entries_.end()) return std::nullopt;
  return it->second;
}

std::size_t ProgressTracker::active() const {
  std::lock_guard lg(mutex_);
  return entries_.size();
}

// ---- ChunkSender ----------------------------------------------------------

std::shared_ptr<ChunkSender> ChunkSender::create(Transfer transfer,
                                                 ChunkLimits limits,
                                                 FrameWriter writer,
                                                 ProgressTracker* progress,
                                                 Completion on_complete,
                                                 std::string relay_to,
                                                 std::shared_ptr<Logger> logger) {
  return std::shared_ptr<ChunkSender>(new ChunkSender(std::move(transfer), limits, std::move(writer),
                                                      progress, std::move(on_complete),
                                                      std::move(relay_to), std::move(logger)));
}

ChunkSender::ChunkSender(Transfer transfer, ChunkLimits limits, FrameWriter writer,
                         ProgressTracker* progress, Completion on_complete,
                         std::string relay_to, std::shared_ptr<Logger> logger)
  : transfer_(std::move(transfer)),
    limits_(limits),
    writer_(std::move(writer)),
    progress_(progress),
    on_complete_(std::move(on_complete)),
    relay_to_(std::move(relay_to)),
    logger_(std::move(logger)) {
  if(limits_.chunk_size == 0) limits_.chunk_size = kChunkSize;
  uint64_t size = transfer_.payload ? transfer_.payload->size() : 0;
  transfer_.meta.size = size;
  total_chunks_ = chunk_count(size, limits_.chunk_size);
}

void ChunkSender::start() {
  log_info(logger_.get(), "Sending {} ({} bytes) as {} chunks",
           transfer_.meta.filename, transfer_.meta.size, total_chunks_);
  if(!transfer_.payload) {
    finish(false, "no payload");
    return;
  }
  if(progress_) progress_->begin(transfer_.meta.id, transfer_.meta.size, ProgressDirection::Send);
  pump();
}

void ChunkSender::cancel(const std::string& reason) {
  if(finished_) return;
  {
    std::lock_guard lg(finish_mutex_);
    cancel_reason_ = reason;
  }
  cancelled_ = true;
  // With a frame outstanding, its completion pumps and sees the flag.
  pump();
}

// Only one thread runs send_next at a time. A caller that finds the pump busy
// leaves resume_ set and the running pump goes round again.
void ChunkSender::pump() {
  {
    std::lock_guard lg(state_mutex_);
    if(pumping_) {
      resume_ = true;
      return;
    }
    pumping_ = true;
  }
  for(;;) {
    {
      std::lock_guard lg(state_mutex_);
      resume_ = false;
    }
    send_next();
    std::lock_guard lg(state_mutex_);
    if(!resume_) {
      pumping_ = false;
      return;
    }
  }
}

bool ChunkSender::send_next() {
  if(finished_) return false;
  {
    std::lock_guard lg(state_mutex_);
    if(awaiting_write_) return false;
  }
  if(cancelled_) {
    std::string reason;
    {
      std::lock_guard lg(finish_mutex_);
      reason = cancel_reason_;
    }
    finish(false, reason);
    return false;
  }
  if(next_index_ >= total_chunks_) {
    finish(true, std::string());
    return false;
  }

  ChunkFrame frame;
  frame.transfer_id = transfer_.meta.id;
  frame.index = next_index_;
  frame.total_chunks = total_chunks_;
  frame.total_size = transfer_.meta.size;
  frame.relay_to = relay_to_;
  if(frame.index == 0) frame.meta = transfer_.meta;
  try {
    frame.data = transfer_.payload->read(frame.index * limits_.chunk_size, limits_.chunk_size);
  } catch(const std::exception& e) {
    finish(false, std::string("read failed: ") + e.what());
    return false;
  }

  ++next_index_;
  {
    std::lock_guard lg(state_mutex_);
    awaiting_write_ = true;
  }
  const uint64_t frame_bytes = frame.data.size();
  auto self = shared_from_this();
  writer_(encode_message(frame), [self, frame_bytes](bool ok){
    self->on_frame_written(ok, frame_bytes);
  });
  return true;
}

void ChunkSender::on_frame_written(bool ok, uint64_t frame_bytes) {
  uint64_t sent = 0;
  {
    std::lock_guard lg(state_mutex_);
    awaiting_write_ = false;
    if(ok) {
      bytes_sent_ += frame_bytes;
      ++frames_written_;
    }
    sent = bytes_sent_;
  }
  if(!ok) {
    finish(false, "channel closed");
    return;
  }
  if(progress_) progress_->update(transfer_.meta.id, sent);
  pump();
}

void ChunkSender::finish(bool completed, const std::string& error) {
  if(finished_.exchange(true)) return;
  if(!completed && progress_) progress_->discard(transfer_.meta.id);

  SendReport report;
  report.transfer_id = transfer_.meta.id;
  {
    std::lock_guard lg(state_mutex_);
    report.frames_sent = frames_written_;
    report.bytes_sent = bytes_sent_;
  }
  report.completed = completed;
  report.error = error;

  if(completed) {
    log_info(logger_.get(), "Finished sending {} ({} chunks)", transfer_.meta.filename, total_chunks_);
  } else {
    log_warn(logger_.get(), "Aborted sending {} after {} of {} chunks: {}",
             transfer_.meta.filename, report.frames_sent, total_chunks_, error);
  }
  auto done = std::move(on_complete_);
  on_complete_ = nullptr;
  if(done) done(report);
}

// ---- ChunkAssembler -------------------------------------------------------

ChunkAssembler::ChunkAssembler(ProgressTracker* progress,
                               std::chrono::milliseconds timeout,
                               std::shared_ptr<Logger> logger)
  : progress_(progress), timeout_(timeout), logger_(std::move(logger)) {}

std::optional<AssembledPayload> ChunkAssembler::accept(const std::string& source,
                                                       const ChunkFrame& frame,
                                                       Clock::time_point now) {
  if(frame.total_chunks == 0 || frame.index >= frame.total_chunks) {
    throw ProtocolError("chunk index out of range for " + frame.transfer_id);
  }

  std::optional<AssembledPayload> done;
  bool started = false;
  uint64_t received = 0;
  uint64_t total = 0;
  std::string mismatch;
  {
    std::lock_guard lg(mutex_);
    auto it = assemblies_.find(frame.transfer_id);
    if(it == assemblies_.end()) {
      Assembly a;
      a.source = source;
      a.total_chunks = frame.total_chunks;
      a.total_size = frame.total_size;
      it = assemblies_.emplace(frame.transfer_id, std::move(a)).first;
      started = true;
    } else if(it->second.total_chunks != frame.total_chunks ||
              it->second.total_size != frame.total_size) {
      throw ProtocolError("chunk totals changed mid-stream for " + frame.transfer_id);
    } else if(it->second.source != source) {
      throw ProtocolError("chunk for " + frame.transfer_id + " arrived from a different channel");
    }

    auto& a = it->second;
    auto [slot, inserted] = a.chunks.try_emplace(frame.index);
    if(!inserted) a.bytes_received -= slot->second.size();
    slot->second = frame.data;
    a.bytes_received += frame.data.size();
    if(frame.meta) a.meta = frame.meta;
    a.last_activity = now;
    received = a.bytes_received;
    total = a.total_size;

    if(a.chunks.size() == a.total_chunks) {
      AssembledPayload out;
      out.transfer_id = frame.transfer_id;
      out.source = a.source;
      out.meta = std::move(a.meta);
      out.bytes.reserve(static_cast<std::size_t>(a.bytes_received));
      for(auto& entry : a.chunks) out.bytes += entry.second;
      if(out.bytes.size() != a.total_size) {
        mismatch = "reassembled " + std::to_string(out.bytes.size()) + " bytes, expected " +
                   std::to_string(a.total_size);
      } else {
        done = std::move(out);
      }
      assemblies_.erase(it);
    }
  }

  if(progress_) {
    if(started) progress_->begin(frame.transfer_id, total, ProgressDirection::Receive);
    if(!mismatch.empty()) {
      progress_->discard(frame.transfer_id);
    } else {
      progress_->update(frame.transfer_id, done ? total : received);
    }
  }
  if(!mismatch.empty()) {
    throw ProtocolError("transfer " + frame.transfer_id + ": " + mismatch);
  }
  if(done) {
    log_info(logger_.get(), "Reassembled {} ({} chunks, {} bytes)",
             frame.transfer_id, frame.total_chunks, done->bytes.size());
  }
  return done;
}

bool ChunkAssembler::abort(const std::string& transfer_id) {
  bool erased = false;
  {
    std::lock_guard lg(mutex_);
    erased = assemblies_.erase(transfer_id) > 0;
  }
  if(erased) {
    if(progress_) progress_->discard(transfer_id);
    log_info(logger_.get(), "Discarded partial transfer {}", transfer_id);
  }
  return erased;
}

std::vector<std::string> ChunkAssembler::abort_from(const std::string& source) {
  std::vector<std::string> ids;
  {
    std::lock_guard lg(mutex_);
    for(auto it = assemblies_.begin(); it != assemblies_.end();) {
      if(it->second.source == source) {
        ids.push_back(it->first);
        it = assemblies_.erase(it);
      } else {
        ++it;
      }
    }
  }
  for(const auto& id : ids) {
    if(progress_) progress_->discard(id);
    log_info(logger_.get(), "Discarded partial transfer {} from {}", id, source);
  }
  return ids;
}

std::vector<std::string> ChunkAssembler::expire(Clock::time_point now) {
  std::vector<std::string> ids;
  {
    std::lock_guard lg(mutex_);
    for(auto it = assemblies_.begin(); it != assemblies_.end();) {
      if(now - it->second.last_activity > timeout_) {
        ids.push_back(it->first);
        it = assemblies_.erase(it);
      } else {
        ++it;
      }
    }
  }
  for(const auto& id : ids) {
    if(progress_) progress_->discard(id);
    log_warn(logger_.get(), "Gave up on transfer {}: chunks missing after {} ms", id, timeout_.count());
  }
  return ids;
}

bool ChunkAssembler::has(const std::string& transfer_id) const {
  std::lock_guard lg(mutex_);
  return assemblies_.count(transfer_id) > 0;
}

std::size_t ChunkAssembler::in_flight() const {
  std::lock_guard lg(mutex_);
  return assemblies_.size();
}
