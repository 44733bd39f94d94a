#include "identity.hpp"
#include "utils.hpp"

#include <fstream>

#include <nlohmann/json.hpp>

FileIdentityProvider::FileIdentityProvider(std::filesystem::path config_dir, std::shared_ptr<Logger> logger)
  : path_(std::move(config_dir) / "identity.json"), logger_(std::move(logger)) {}

std::string FileIdentityProvider::load_or_create_identity() {
  if(!cached_.empty()) return cached_;
  std::ifstream in(path_);
  if(in) {
    try {
      nlohmann::json doc;
      in >> doc;
      auto id = doc.value("stableId", "");
      if(!id.empty()) {
        cached_ = id;
        return cached_;
      }
    } catch(const std::exception& e) {
      log_warn(logger_.get(), "Replacing unreadable identity file {}: {}", path_.string(), e.what());
    }
  }

  cached_ = random_id("dev");
  std::error_code ec;
  std::filesystem::create_directories(path_.parent_path(), ec);
  std::ofstream out(path_, std::ios::trunc);
  if(out) {
    out << nlohmann::json{{"stableId", cached_}}.dump(2);
    log_info(logger_.get(), "Created device identity {}", cached_);
  } else {
    log_warn(logger_.get(), "Unable to persist identity to {}; using {} for this run", path_.string(), cached_);
  }
  return cached_;
}
