#pragma once
#include <filesystem>
#include <memory>
#include <string>

#include "log.hpp"

class IdentityProvider {
public:
  virtual ~IdentityProvider() = default;
  virtual std::string load_or_create_identity() = 0;
};

// {"stableId": "dev-<32 hex>"} in <config_dir>/identity.json
class FileIdentityProvider : public IdentityProvider {
public:
  explicit FileIdentityProvider(std::filesystem::path config_dir, std::shared_ptr<Logger> logger = nullptr);
  std::string load_or_create_identity() override;

private:
  std::filesystem::path path_;
  std::shared_ptr<Logger> logger_;
  std::string cached_;
};

class StaticIdentityProvider : public IdentityProvider {
public:
  explicit StaticIdentityProvider(std::string id) : id_(std::move(id)) {}
  std::string load_or_create_identity() override { return id_; }

private:
  std::string id_;
};
