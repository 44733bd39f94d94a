#include "transfer.hpp"
#include "utils.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <unordered_map>

std::string MemoryPayload::read(uint64_t offset, std::size_t length) {
  if(offset >= bytes_.size()) return {};
  return bytes_.substr(static_cast<std::size_t>(offset), length);
}

FilePayload::FilePayload(const std::filesystem::path& path)
  : path_(path), in_(path, std::ios::binary) {
  if(!in_) {
    throw std::runtime_error("cannot open " + path.string());
  }
  std::error_code ec;
  size_ = std::filesystem::file_size(path, ec);
  if(ec) {
    throw std::runtime_error("cannot stat " + path.string() + ": " + ec.message());
  }
}

std::string FilePayload::read(uint64_t offset, std::size_t length) {
  std::lock_guard lg(mutex_);
  if(offset >= size_) return {};
  length = static_cast<std::size_t>(std::min<uint64_t>(length, size_ - offset));
  std::string out(length, '\0');
  in_.clear();
  in_.seekg(static_cast<std::streamoff>(offset));
  in_.read(out.data(), static_cast<std::streamsize>(length));
  out.resize(static_cast<std::size_t>(in_.gcount()));
  if(out.size() != length) {
    throw std::runtime_error("short read from " + path_.string());
  }
  return out;
}

std::string guess_mime_type(const std::filesystem::path& path) {
  static const std::unordered_map<std::string, std::string> kTypes = {
    {".txt", "text/plain"}, {".md", "text/markdown"}, {".csv", "text/csv"},
    {".html", "text/html"}, {".json", "application/json"},
    {".png", "image/png"}, {".jpg", "image/jpeg"}, {".jpeg", "image/jpeg"},
    {".gif", "image/gif"}, {".webp", "image/webp"}, {".pdf", "application/pdf"},
    {".zip", "application/zip"}, {".mp4", "video/mp4"}, {".mp3", "audio/mpeg"}
  };
  std::string ext = path.extension().string();
  std::transform(ext.begin(), ext.end(), ext.begin(),
                 [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
  auto it = kTypes.find(ext);
  return it == kTypes.end() ? "application/octet-stream" : it->second;
}

Transfer make_file_transfer(const std::filesystem::path& path, const TargetDescriptor& target) {
  Transfer t;
  t.payload = std::make_shared<FilePayload>(path);
  t.meta.id = random_id("xfer");
  t.meta.original_name = path.filename().string();
  t.meta.filename = t.meta.original_name;
  t.meta.mime_type = guess_mime_type(path);
  t.meta.size = t.payload->size();
  t.meta.target = target;
  return t;
}

Transfer make_clipboard_transfer(const std::string& text, const TargetDescriptor& target) {
  Transfer t;
  t.payload = std::make_shared<MemoryPayload>(text);
  t.meta.id = random_id("xfer");
  t.meta.original_name = "clipboard.txt";
  t.meta.filename = t.meta.original_name;
  t.meta.mime_type = "text/plain";
  t.meta.size = text.size();
  t.meta.is_clipboard = true;
  t.meta.target = target;
  return t;
}
