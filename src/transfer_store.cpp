#include "transfer_store.hpp"
#include "utils.hpp"

#include <algorithm>
#include <fstream>

using json = nlohmann::json;

TransferRecord make_transfer_record(const TransferMeta& meta,
                                    const std::string* content,
                                    const std::filesystem::path& stored_path,
                                    uint64_t inline_threshold,
                                    std::size_t chunk_size) {
  TransferRecord r;
  r.meta = meta;
  r.recorded_at = SystemClock::now();
  r.chunked = meta.size > inline_threshold;
  if(r.chunked && chunk_size > 0) {
    r.total_chunks = (meta.size + chunk_size - 1) / chunk_size;
  }
  if(!stored_path.empty()) r.content_path = stored_path.string();
  if(content) {
    r.sha256 = sha256_hex(*content);
    if(meta.is_clipboard && !r.chunked) r.inline_content = *content;
  }
  return r;
}

json record_to_json(const TransferRecord& record) {
  json j = meta_to_json(record.meta);
  j["chunked"] = record.chunked;
  if(record.chunked) j["totalChunks"] = record.total_chunks;
  if(!record.content_path.empty() || !record.sha256.empty()) {
    j["contentRef"] = json{{"path", record.content_path}, {"sha256", record.sha256}};
  }
  if(record.inline_content) j["content"] = *record.inline_content;
  j["recordedAt"] = to_epoch_ms(record.recorded_at);
  return j;
}

TransferRecord record_from_json(const json& j) {
  TransferRecord r;
  r.meta = meta_from_json(j);
  r.chunked = j.value("chunked", false);
  r.total_chunks = j.value("totalChunks", uint64_t{0});
  if(j.contains("contentRef")) {
    const auto& ref = j.at("contentRef");
    r.content_path = ref.value("path", "");
    r.sha256 = ref.value("sha256", "");
  }
  if(j.contains("content") && !r.chunked) r.inline_content = j.at("content").get<std::string>();
  r.recorded_at = from_epoch_ms(j.value("recordedAt", int64_t{0}));
  return r;
}

JsonTransferStore::JsonTransferStore(std::filesystem::path path, std::shared_ptr<Logger> logger)
  : path_(std::move(path)), logger_(std::move(logger)) {
  load();
}

bool JsonTransferStore::load() {
  std::ifstream in(path_);
  if(!in) return false;
  try {
    json doc;
    in >> doc;
    std::lock_guard lg(mutex_);
    records_.clear();
    for(const auto& item : doc.value("transfers", json::array())) {
      records_.push_back(record_from_json(item));
    }
    return true;
  } catch(const std::exception& e) {
    log_warn(logger_.get(), "Ignoring unreadable transfer store {}: {}", path_.string(), e.what());
    return false;
  }
}

bool JsonTransferStore::save_locked() const {
  std::error_code ec;
  if(path_.has_parent_path()) std::filesystem::create_directories(path_.parent_path(), ec);
  json doc;
  doc["transfers"] = json::array();
  for(const auto& r : records_) doc["transfers"].push_back(record_to_json(r));
  std::ofstream out(path_, std::ios::trunc);
  if(!out) {
    log_error(logger_.get(), "Unable to write {}", path_.string());
    return false;
  }
  out << doc.dump(2, ' ', false, json::error_handler_t::replace);
  return true;
}

void JsonTransferStore::upsert_locked(TransferRecord record) {
  auto it = std::find_if(records_.begin(), records_.end(),
                         [&](const TransferRecord& r){
                           return r.meta.id == record.meta.id && r.meta.direction == record.meta.direction;
                         });
  if(it != records_.end()) {
    *it = std::move(record);
  } else {
    records_.push_back(std::move(record));
  }
  save_locked();
}

void JsonTransferStore::record_sent_transfer(const TransferRecord& record) {
  std::lock_guard lg(mutex_);
  auto copy = record;
  if(copy.meta.direction == TransferDirection::Received) copy.meta.direction = TransferDirection::Sent;
  // A queued entry becomes a sent one once it is delivered.
  if(copy.meta.direction == TransferDirection::Sent) {
    records_.erase(std::remove_if(records_.begin(), records_.end(),
                                  [&](const TransferRecord& r){
                                    return r.meta.id == copy.meta.id &&
                                           r.meta.direction == TransferDirection::Queued;
                                  }),
                   records_.end());
  }
  upsert_locked(std::move(copy));
}

void JsonTransferStore::record_received_transfer(const TransferRecord& record) {
  std::lock_guard lg(mutex_);
  auto copy = record;
  copy.meta.direction = TransferDirection::Received;
  upsert_locked(std::move(copy));
}

std::vector<TransferRecord> JsonTransferStore::list_transfers() const {
  std::lock_guard lg(mutex_);
  return records_;
}

bool JsonTransferStore::delete_transfer(const std::string& id) {
  std::lock_guard lg(mutex_);
  auto before = records_.size();
  records_.erase(std::remove_if(records_.begin(), records_.end(),
                                [&](const TransferRecord& r){ return r.meta.id == id; }),
                 records_.end());
  if(records_.size() == before) return false;
  save_locked();
  return true;
}
