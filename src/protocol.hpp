#pragma once
#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "errors.hpp"
#include "model.hpp"

using json = nlohmann::json;

// One envelope per line; an inline payload at the chunk threshold must fit.
inline constexpr std::size_t kMaxLineBytes = 128u * 1024u * 1024u;

struct DeviceSetup {
  std::string name;
  std::string stable_id;
};

struct SetupRequired {};

struct DeviceListMessage {
  enum class Kind { SetupComplete, Connected, Disconnected };
  Kind kind = Kind::Connected;
  Device device;
  std::vector<Device> online;
};

struct PairRequest {
  std::string target_handle;
};

// pair-accepted, or auto-paired when automatic is set.
struct PairAccepted {
  Pairing pairing;
  Device partner;
  bool automatic = false;
};

struct TerminateConnection {
  std::string pairing_id;
};

struct ConnectionTerminated {
  std::string pairing_id;
  std::string terminated_by;
};

// file-transfer, or relay-file-transfer when meta.target names a relayed client.
// content is raw text when encoding == "text", base64 otherwise.
struct FileTransferMessage {
  TransferMeta meta;
  std::string content;
  std::string encoding = "base64";
};

struct FileReceived {
  TransferMeta meta;
  std::string content;
  std::string encoding = "base64";
  std::string from_device;
};

struct FileSentConfirmation {
  std::string transfer_id;
  std::string filename;
  std::size_t recipient_count = 0;
  bool is_clipboard = false;
};

struct FileQueued {
  std::string transfer_id;
  std::string filename;
  std::string target_handle;
};

struct FileSaved {
  std::string transfer_id;
  std::string filename;
};

struct TransferFailedMessage {
  std::string transfer_id;
  std::string reason;
};

struct TransferAbort {
  std::string transfer_id;
  std::string reason;
};

struct ClipboardSync {
  std::string transfer_id;
  std::string content;
  std::string from_device;
};

struct DeviceNameUpdate {
  std::string name;
};

struct NameUpdated {
  Device device;
};

struct ErrorMessage {
  std::string message;
};

// peer-handshake, or peer-handshake-ack when ack is set.
struct PeerHandshake {
  std::string id;
  std::string name;
  uint16_t port = 0;
  bool ack = false;
};

struct FileReceivedAck {
  std::string transfer_id;
  std::string filename;
};

struct RelayDevices {
  std::vector<Device> devices;
};

// data holds raw bytes; it travels base64 encoded. meta rides on frame 0.
struct ChunkFrame {
  std::string transfer_id;
  uint64_t index = 0;
  uint64_t total_chunks = 0;
  uint64_t total_size = 0;
  std::string data;
  std::optional<TransferMeta> meta;
  std::string relay_to;
};

using Message = std::variant<DeviceSetup,
                             SetupRequired,
                             DeviceListMessage,
                             PairRequest,
                             PairAccepted,
                             TerminateConnection,
                             ConnectionTerminated,
                             FileTransferMessage,
                             FileReceived,
                             FileSentConfirmation,
                             FileQueued,
                             FileSaved,
                             TransferFailedMessage,
                             TransferAbort,
                             ClipboardSync,
                             DeviceNameUpdate,
                             NameUpdated,
                             ErrorMessage,
                             PeerHandshake,
                             FileReceivedAck,
                             RelayDevices,
                             ChunkFrame>;

// Throws ProtocolError for unknown tags and malformed payloads.
Message decode_message(const json& envelope);
Message parse_line(const std::string& line);

json encode_message(const Message& message);
std::string message_type(const Message& message);

json make_error(const std::string& text);

// Inline content helpers. Text and clipboard payloads travel raw.
FileTransferMessage make_inline_transfer(const TransferMeta& meta, const std::string& bytes);
std::string decode_inline_content(const std::string& content, const std::string& encoding);
