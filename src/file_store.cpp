#include "file_store.hpp"

#include <fstream>

FileStore::FileStore(std::filesystem::path download_dir, std::shared_ptr<Logger> logger)
  : download_dir_(std::move(download_dir)), logger_(std::move(logger)) {}

std::shared_ptr<PayloadSource> FileStore::read_bytes(const std::filesystem::path& path) const {
  try {
    return std::make_shared<FilePayload>(path);
  } catch(const std::runtime_error& e) {
    log_warn(logger_.get(), "Unable to read {}: {}", path.string(), e.what());
    return nullptr;
  }
}

std::string FileStore::sanitize_name(const std::string& name) {
  std::string base = std::filesystem::path(name).filename().string();
  std::string out;
  out.reserve(base.size());
  for(char c : base) {
    if(c == '/' || c == '\\' || c == ':' || static_cast<unsigned char>(c) < 0x20) {
      out.push_back('_');
    } else {
      out.push_back(c);
    }
  }
  if(out.empty() || out == "." || out == "..") out = "download";
  return out;
}

std::filesystem::path FileStore::unique_path(const std::string& name) const {
  // A status error (name too long, permissions) ends the search; opening the
  // file then fails and is reported by the caller.
  std::error_code ec;
  std::filesystem::path candidate = download_dir_ / name;
  if(!std::filesystem::exists(candidate, ec)) return candidate;
  const auto stem = candidate.stem().string();
  const auto ext = candidate.extension().string();
  for(int n = 1;; ++n) {
    candidate = download_dir_ / (stem + " (" + std::to_string(n) + ")" + ext);
    if(!std::filesystem::exists(candidate, ec)) return candidate;
  }
}

std::optional<std::filesystem::path> FileStore::write_bytes(const std::string& name,
                                                            const std::string& bytes) const {
  std::error_code ec;
  std::filesystem::create_directories(download_dir_, ec);
  if(ec) {
    log_error(logger_.get(), "Unable to create {}: {}", download_dir_.string(), ec.message());
    return std::nullopt;
  }
  auto path = unique_path(sanitize_name(name));
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if(!out) {
    log_error(logger_.get(), "Unable to write {}", path.string());
    return std::nullopt;
  }
  out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
  if(!out) {
    log_error(logger_.get(), "Short write to {}", path.string());
    return std::nullopt;
  }
  log_debug(logger_.get(), "Stored {} bytes at {}", bytes.size(), path.string());
  return path;
}
