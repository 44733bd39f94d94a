#pragma once
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "log.hpp"
#include "model.hpp"

struct TransferRecord {
  TransferMeta meta;
  bool chunked = false;
  uint64_t total_chunks = 0;
  std::string content_path;              // where the bytes live, if stored
  std::string sha256;                    // of the full payload
  std::optional<std::string> inline_content;
  SystemClock::time_point recorded_at{};
};

// Builds the persisted form of a transfer. Content is kept inline only for
// clipboard text at or below the inline threshold.
TransferRecord make_transfer_record(const TransferMeta& meta,
                                    const std::string* content,
                                    const std::filesystem::path& stored_path,
                                    uint64_t inline_threshold,
                                    std::size_t chunk_size);

nlohmann::json record_to_json(const TransferRecord& record);
TransferRecord record_from_json(const nlohmann::json& j);

// Persistence collaborator.
class TransferStore {
public:
  virtual ~TransferStore() = default;
  virtual void record_sent_transfer(const TransferRecord& record) = 0;
  virtual void record_received_transfer(const TransferRecord& record) = 0;
  virtual std::vector<TransferRecord> list_transfers() const = 0;
  virtual bool delete_transfer(const std::string& id) = 0;
};

// Keeps records in memory and mirrors them to a JSON file.
class JsonTransferStore : public TransferStore {
public:
  explicit JsonTransferStore(std::filesystem::path path, std::shared_ptr<Logger> logger = nullptr);

  void record_sent_transfer(const TransferRecord& record) override;
  void record_received_transfer(const TransferRecord& record) override;
  std::vector<TransferRecord> list_transfers() const override;
  bool delete_transfer(const std::string& id) override;

  const std::filesystem::path& path() const { return path_; }

private:
  void upsert_locked(TransferRecord record);
  bool load();
  bool save_locked() const;

  std::filesystem::path path_;
  std::shared_ptr<Logger> logger_;
  mutable std::mutex mutex_;
  std::vector<TransferRecord> records_;
};
