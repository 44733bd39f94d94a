#pragma once
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

#include "log.hpp"
#include "transfer.hpp"

// Filesystem collaborator. Incoming payloads land in the download directory
// under collision-free names.
class FileStore {
public:
  explicit FileStore(std::filesystem::path download_dir, std::shared_ptr<Logger> logger = nullptr);

  // nullptr when the path cannot be opened.
  std::shared_ptr<PayloadSource> read_bytes(const std::filesystem::path& path) const;
  std::optional<std::filesystem::path> write_bytes(const std::string& name, const std::string& bytes) const;

  const std::filesystem::path& download_dir() const { return download_dir_; }

  static std::string sanitize_name(const std::string& name);

private:
  std::filesystem::path unique_path(const std::string& name) const;

  std::filesystem::path download_dir_;
  std::shared_ptr<Logger> logger_;
};
