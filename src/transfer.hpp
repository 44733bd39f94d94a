#pragma once
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <string>

#include "model.hpp"

// Random access to a payload. Chunked sends read one slice at a time so a
// large file is never held in memory whole.
class PayloadSource {
public:
  virtual ~PayloadSource() = default;
  virtual uint64_t size() const = 0;
  virtual std::string read(uint64_t offset, std::size_t length) = 0;

  std::string read_all() { return read(0, static_cast<std::size_t>(size())); }
};

class MemoryPayload : public PayloadSource {
public:
  explicit MemoryPayload(std::string bytes) : bytes_(std::move(bytes)) {}
  uint64_t size() const override { return bytes_.size(); }
  std::string read(uint64_t offset, std::size_t length) override;
  const std::string& bytes() const { return bytes_; }

private:
  std::string bytes_;
};

class FilePayload : public PayloadSource {
public:
  // Throws std::runtime_error if the file cannot be opened.
  explicit FilePayload(const std::filesystem::path& path);
  uint64_t size() const override { return size_; }
  std::string read(uint64_t offset, std::size_t length) override;
  const std::filesystem::path& path() const { return path_; }

private:
  std::filesystem::path path_;
  uint64_t size_ = 0;
  std::mutex mutex_;
  std::ifstream in_;
};

struct Transfer {
  TransferMeta meta;
  std::shared_ptr<PayloadSource> payload;
};

// A transfer held until a pairing with its target becomes active.
struct PendingTransfer {
  Transfer transfer;
  std::string origin_handle;
  std::string origin_stable_id;
  std::string target_key;      // stable id, or "relay:<handle>" for relayed clients
  SystemClock::time_point queued_at{};
  uint64_t sequence = 0;
};

std::string guess_mime_type(const std::filesystem::path& path);

Transfer make_file_transfer(const std::filesystem::path& path, const TargetDescriptor& target);
Transfer make_clipboard_transfer(const std::string& text, const TargetDescriptor& target);
