#include "transfer_inbox.hpp"

TransferInbox::TransferInbox(EventBus& bus,
                             const FileStore& files,
                             std::shared_ptr<TransferStore> store,
                             ChunkLimits limits,
                             std::chrono::milliseconds assembly_timeout,
                             std::shared_ptr<Logger> logger)
  : bus_(bus),
    files_(files),
    store_(std::move(store)),
    limits_(limits),
    logger_(std::move(logger)),
    progress_(&bus),
    assembler_(&progress_, assembly_timeout, logger_) {}

void TransferInbox::accept_inline(TransferMeta meta, const std::string& bytes) {
  meta.direction = TransferDirection::Received;
  meta.size = bytes.size();
  if(meta.filename.empty()) meta.filename = meta.original_name.empty() ? meta.id : meta.original_name;

  TransferReceived received;
  if(meta.is_clipboard) {
    received.text = bytes;
    log_info(logger_.get(), "Clipboard text from {} ({} bytes)", meta.from_device, bytes.size());
  } else {
    auto stored = files_.write_bytes(meta.filename, bytes);
    if(!stored) {
      log_error(logger_.get(), "Could not store {} from {}", meta.filename, meta.from_device);
      bus_.publish(Event{TransferFailed{meta.id, ErrorKind::Protocol, "could not store " + meta.filename}});
      return;
    }
    received.stored_path = *stored;
    log_info(logger_.get(), "Received {} from {} ({} bytes) -> {}",
             meta.filename, meta.from_device, bytes.size(), stored->string());
  }
  if(store_) {
    store_->record_received_transfer(
      make_transfer_record(meta, &bytes, received.stored_path, limits_.threshold, limits_.chunk_size));
  }
  received.meta = std::move(meta);
  bus_.publish(Event{std::move(received)});
}

std::optional<TransferMeta> TransferInbox::accept_chunk(const std::string& source, const ChunkFrame& frame) {
  auto payload = assembler_.accept(source, frame);
  if(!payload) return std::nullopt;
  TransferMeta meta;
  if(payload->meta) {
    meta = *payload->meta;
  } else {
    meta.filename = payload->transfer_id;
  }
  meta.id = payload->transfer_id;
  log_info(logger_.get(), "Reassembled {} ({} frames, {} bytes)", meta.id, frame.total_chunks, payload->bytes.size());
  accept_inline(meta, payload->bytes);
  return meta;
}

bool TransferInbox::abort(const std::string& transfer_id, const std::string& reason) {
  if(!assembler_.abort(transfer_id)) return false;
  log_warn(logger_.get(), "Receive of {} aborted: {}", transfer_id, reason);
  bus_.publish(Event{TransferFailed{transfer_id, ErrorKind::ChannelLost, reason}});
  return true;
}

void TransferInbox::abort_from(const std::string& source, const std::string& reason) {
  for(const auto& id : assembler_.abort_from(source)) {
    log_warn(logger_.get(), "Receive of {} aborted: {}", id, reason);
    bus_.publish(Event{TransferFailed{id, ErrorKind::ChannelLost, reason}});
  }
}

void TransferInbox::expire(ChunkAssembler::Clock::time_point now) {
  for(const auto& id : assembler_.expire(now)) {
    bus_.publish(Event{TransferFailed{id, ErrorKind::ChunkAssemblyTimeout, "chunk assembly timed out"}});
  }
}

void TransferInbox::save_local(const Transfer& transfer) {
  auto meta = transfer.meta;
  meta.direction = TransferDirection::SavedLocal;
  std::filesystem::path stored;
  std::string content;
  if(transfer.payload) {
    if(auto file = std::dynamic_pointer_cast<FilePayload>(transfer.payload)) {
      stored = file->path();
    } else {
      content = transfer.payload->read_all();
      if(!meta.is_clipboard) {
        if(auto written = files_.write_bytes(meta.filename, content)) stored = *written;
      }
    }
  }
  log_info(logger_.get(), "Saved {} locally", meta.filename);
  if(store_) {
    store_->record_sent_transfer(make_transfer_record(meta, content.empty() && !meta.is_clipboard ? nullptr : &content,
                                                      stored, limits_.threshold, limits_.chunk_size));
  }
  bus_.publish(Event{TransferSavedLocal{meta}});
}

void TransferInbox::record_sent(const Transfer& transfer, TransferDirection direction) {
  if(!store_) return;
  auto meta = transfer.meta;
  meta.direction = direction;
  std::filesystem::path stored;
  std::string content;
  const std::string* content_ptr = nullptr;
  if(auto file = std::dynamic_pointer_cast<FilePayload>(transfer.payload)) {
    stored = file->path();
  } else if(transfer.payload && meta.is_clipboard) {
    content = transfer.payload->read_all();
    content_ptr = &content;
  }
  store_->record_sent_transfer(make_transfer_record(meta, content_ptr, stored, limits_.threshold, limits_.chunk_size));
}
