#pragma once
#include <chrono>
#include <memory>
#include <optional>
#include <string>

#include "chunk_engine.hpp"
#include "event_bus.hpp"
#include "file_store.hpp"
#include "log.hpp"
#include "protocol.hpp"
#include "transfer.hpp"
#include "transfer_store.hpp"

// The receive-complete path shared by both node types, plus the local
// bookkeeping for sends. Nothing partial ever reaches TransferReceived.
class TransferInbox {
public:
  TransferInbox(EventBus& bus,
                const FileStore& files,
                std::shared_ptr<TransferStore> store,
                ChunkLimits limits,
                std::chrono::milliseconds assembly_timeout,
                std::shared_ptr<Logger> logger = nullptr);

  void accept_inline(TransferMeta meta, const std::string& bytes);
  // Returns the metadata once the stream is complete. Throws ProtocolError
  // for frames that conflict with their stream.
  std::optional<TransferMeta> accept_chunk(const std::string& source, const ChunkFrame& frame);

  bool abort(const std::string& transfer_id, const std::string& reason);
  void abort_from(const std::string& source, const std::string& reason);
  void expire(ChunkAssembler::Clock::time_point now = ChunkAssembler::Clock::now());

  // Local target, or a broadcast with nobody to send to.
  void save_local(const Transfer& transfer);
  void record_sent(const Transfer& transfer, TransferDirection direction);

  ProgressTracker& progress() { return progress_; }
  bool receiving(const std::string& transfer_id) const { return assembler_.has(transfer_id); }
  std::size_t receiving_count() const { return assembler_.in_flight(); }
  const ChunkLimits& limits() const { return limits_; }

private:
  EventBus& bus_;
  const FileStore& files_;
  std::shared_ptr<TransferStore> store_;
  ChunkLimits limits_;
  std::shared_ptr<Logger> logger_;
  ProgressTracker progress_;
  ChunkAssembler assembler_;
};
