#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

using SystemClock = std::chrono::system_clock;

// std::visit helper.
template<class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template<class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

struct Device {
  std::string handle;        // transient: socket id or peer address
  std::string stable_id;     // persisted per installation
  std::string display_name;
  bool online = false;
  SystemClock::time_point last_seen{};
};

enum class PairingStatus { Requested, Active, Terminated };

struct Pairing {
  std::string id;
  std::string device_a;
  std::string device_b;
  PairingStatus status = PairingStatus::Requested;
  SystemClock::time_point created_at{};
  std::optional<SystemClock::time_point> terminated_at;

  bool involves(const std::string& handle) const {
    return device_a == handle || device_b == handle;
  }
  const std::string& partner_of(const std::string& handle) const {
    return device_a == handle ? device_b : device_a;
  }
};

struct TargetDescriptor {
  enum class Kind { Local, Device, RelayedClient, Broadcast };
  Kind kind = Kind::Broadcast;
  std::string handle;

  static TargetDescriptor local() { return {Kind::Local, ""}; }
  static TargetDescriptor broadcast() { return {Kind::Broadcast, ""}; }
  static TargetDescriptor device(std::string h) { return {Kind::Device, std::move(h)}; }
  static TargetDescriptor relayed(std::string h) { return {Kind::RelayedClient, std::move(h)}; }

  // "local", "all", "relay:<handle>" or a bare device handle.
  static TargetDescriptor parse(const std::string& text);
  std::string to_string() const;
};

enum class TransferDirection { Sent, Received, Queued, SavedLocal };

const char* to_string(TransferDirection direction);
TransferDirection direction_from_string(const std::string& text);

struct TransferMeta {
  std::string id;
  std::string filename;       // name used on disk
  std::string original_name;
  std::string mime_type = "application/octet-stream";
  uint64_t size = 0;
  bool is_clipboard = false;
  TransferDirection direction = TransferDirection::Sent;
  TargetDescriptor target;
  std::string from_device;    // display name of the sender
};

enum class ProgressDirection { Send, Receive };

struct ChunkProgress {
  std::string transfer_id;
  uint64_t total_bytes = 0;
  uint64_t bytes_delivered = 0;
  ProgressDirection direction = ProgressDirection::Send;
};

// Wire forms used inside message payloads.
nlohmann::json device_to_json(const Device& device);
Device device_from_json(const nlohmann::json& j);
nlohmann::json pairing_to_json(const Pairing& pairing);
Pairing pairing_from_json(const nlohmann::json& j);
nlohmann::json meta_to_json(const TransferMeta& meta);
TransferMeta meta_from_json(const nlohmann::json& j);
