#include "protocol.hpp"
#include "utils.hpp"

#include <stdexcept>

namespace {

json envelope(const char* type, json data) {
  return json{{"type", type}, {"data", std::move(data)}};
}

std::string require_string(const json& data, const char* key) {
  auto it = data.find(key);
  if(it == data.end() || !it->is_string()) {
    throw ProtocolError(std::string("missing string field '") + key + "'");
  }
  return it->get<std::string>();
}

uint64_t require_count(const json& data, const char* key) {
  auto it = data.find(key);
  if(it == data.end() || !it->is_number_unsigned()) {
    if(it != data.end() && it->is_number_integer() && it->get<int64_t>() >= 0) {
      return it->get<uint64_t>();
    }
    throw ProtocolError(std::string("missing or negative field '") + key + "'");
  }
  return it->get<uint64_t>();
}

std::vector<Device> devices_from(const json& data, const char* key) {
  std::vector<Device> out;
  auto it = data.find(key);
  if(it == data.end()) return out;
  if(!it->is_array()) throw ProtocolError(std::string("field '") + key + "' is not an array");
  for(const auto& item : *it) out.push_back(device_from_json(item));
  return out;
}

json devices_to(const std::vector<Device>& devices) {
  json arr = json::array();
  for(const auto& d : devices) arr.push_back(device_to_json(d));
  return arr;
}

// file-transfer carries the meta fields flat, next to the content.
TransferMeta flat_meta(const json& data) {
  TransferMeta meta;
  meta.id = data.value("transferId", "");
  meta.filename = require_string(data, "filename");
  meta.original_name = data.value("originalName", meta.filename);
  meta.mime_type = data.value("mimeType", "application/octet-stream");
  meta.size = data.value("size", uint64_t{0});
  meta.is_clipboard = data.value("isClipboard", false);
  meta.from_device = data.value("fromDevice", "");
  return meta;
}

json flat_meta_json(const TransferMeta& meta) {
  json data{
    {"transferId", meta.id},
    {"filename", meta.filename},
    {"originalName", meta.original_name},
    {"mimeType", meta.mime_type},
    {"size", meta.size},
    {"isClipboard", meta.is_clipboard}
  };
  if(!meta.from_device.empty()) data["fromDevice"] = meta.from_device;
  return data;
}

Message decode_data(const std::string& type, const json& data) {
  if(type == "device-setup") {
    return DeviceSetup{data.value("name", ""), data.value("stableId", "")};
  }
  if(type == "setup-required") {
    return SetupRequired{};
  }
  if(type == "setup-complete" || type == "device-connected" || type == "device-disconnected") {
    DeviceListMessage m;
    m.kind = type == "setup-complete" ? DeviceListMessage::Kind::SetupComplete
           : type == "device-connected" ? DeviceListMessage::Kind::Connected
           : DeviceListMessage::Kind::Disconnected;
    m.device = device_from_json(data.at("device"));
    m.online = devices_from(data, "onlineDevices");
    return m;
  }
  if(type == "pair-request") {
    return PairRequest{require_string(data, "targetDeviceHandle")};
  }
  if(type == "pair-accepted" || type == "auto-paired") {
    PairAccepted m;
    m.pairing = pairing_from_json(data.at("pairing"));
    m.partner = device_from_json(data.at("partnerDevice"));
    m.automatic = type == "auto-paired";
    return m;
  }
  if(type == "terminate-connection") {
    return TerminateConnection{require_string(data, "pairingId")};
  }
  if(type == "connection-terminated") {
    return ConnectionTerminated{require_string(data, "pairingId"), data.value("terminatedBy", "")};
  }
  if(type == "file-transfer" || type == "relay-file-transfer") {
    FileTransferMessage m;
    m.meta = flat_meta(data);
    m.content = data.value("content", "");
    m.encoding = data.value("encoding", "base64");
    if(type == "relay-file-transfer") {
      m.meta.target = TargetDescriptor::relayed(require_string(data, "targetClientId"));
    } else if(data.contains("targetDeviceHandle") && !data.at("targetDeviceHandle").is_null()) {
      m.meta.target = TargetDescriptor::device(require_string(data, "targetDeviceHandle"));
    } else {
      m.meta.target = TargetDescriptor::broadcast();
    }
    return m;
  }
  if(type == "file-received") {
    FileReceived m;
    const auto& file = data.at("file");
    m.meta = meta_from_json(file);
    m.meta.direction = TransferDirection::Received;
    m.content = file.value("content", "");
    m.encoding = file.value("encoding", "base64");
    m.from_device = data.value("fromDevice", "");
    return m;
  }
  if(type == "file-sent-confirmation") {
    FileSentConfirmation m;
    m.transfer_id = data.value("transferId", "");
    m.filename = data.value("filename", "");
    m.recipient_count = data.value("recipientCount", std::size_t{0});
    m.is_clipboard = data.value("isClipboard", false);
    return m;
  }
  if(type == "file-queued") {
    return FileQueued{require_string(data, "transferId"), data.value("filename", ""),
                      data.value("targetDeviceHandle", "")};
  }
  if(type == "file-saved") {
    return FileSaved{require_string(data, "transferId"), data.value("filename", "")};
  }
  if(type == "transfer-failed") {
    return TransferFailedMessage{require_string(data, "transferId"), data.value("reason", "")};
  }
  if(type == "transfer-abort") {
    return TransferAbort{require_string(data, "transferId"), data.value("reason", "")};
  }
  if(type == "clipboard-sync") {
    return ClipboardSync{data.value("transferId", ""), require_string(data, "content"),
                         data.value("fromDevice", "")};
  }
  if(type == "device-name-update") {
    return DeviceNameUpdate{require_string(data, "name")};
  }
  if(type == "name-updated") {
    return NameUpdated{device_from_json(data.at("device"))};
  }
  if(type == "error") {
    return ErrorMessage{data.value("message", "")};
  }
  if(type == "peer-handshake" || type == "peer-handshake-ack") {
    PeerHandshake m;
    m.id = require_string(data, "id");
    m.name = data.value("name", m.id);
    auto port = require_count(data, "port");
    if(port == 0 || port > 65535) throw ProtocolError("handshake port out of range");
    m.port = static_cast<uint16_t>(port);
    m.ack = type == "peer-handshake-ack";
    return m;
  }
  if(type == "file-received-ack") {
    return FileReceivedAck{data.value("transferId", ""), data.value("filename", "")};
  }
  if(type == "relay-devices") {
    return RelayDevices{devices_from(data, "devices")};
  }
  if(type == "file-chunk") {
    ChunkFrame f;
    f.transfer_id = require_string(data, "transferId");
    f.index = require_count(data, "index");
    f.total_chunks = require_count(data, "totalChunks");
    f.total_size = require_count(data, "totalSize");
    if(f.total_chunks == 0 || f.index >= f.total_chunks) {
      throw ProtocolError("chunk index " + std::to_string(f.index) + " outside 0.." +
                          std::to_string(f.total_chunks));
    }
    try {
      f.data = base64_decode(require_string(data, "data"));
    } catch(const std::invalid_argument& e) {
      throw ProtocolError(std::string("chunk data: ") + e.what());
    }
    if(data.contains("meta")) f.meta = meta_from_json(data.at("meta"));
    f.relay_to = data.value("relayTo", "");
    return f;
  }
  throw ProtocolError("unknown message type '" + type + "'");
}

} // namespace

Message decode_message(const json& j) {
  if(!j.is_object()) throw ProtocolError("envelope is not an object");
  auto type_it = j.find("type");
  if(type_it == j.end() || !type_it->is_string()) throw ProtocolError("envelope has no type");
  const std::string type = type_it->get<std::string>();
  static const json kEmpty = json::object();
  auto data_it = j.find("data");
  const json& data = (data_it == j.end() || data_it->is_null()) ? kEmpty : *data_it;
  if(!data.is_object()) throw ProtocolError("'" + type + "' data is not an object");
  try {
    return decode_data(type, data);
  } catch(const json::exception& e) {
    throw ProtocolError("'" + type + "': " + e.what());
  } catch(const std::invalid_argument& e) {
    throw ProtocolError("'" + type + "': " + e.what());
  }
}

Message parse_line(const std::string& line) {
  json j;
  try {
    j = json::parse(line);
  } catch(const json::parse_error& e) {
    throw ProtocolError(std::string("invalid JSON: ") + e.what());
  }
  return decode_message(j);
}

json make_error(const std::string& text) {
  return envelope("error", json{{"message", text}});
}

json encode_message(const Message& message) {
  return std::visit(overloaded{
    [](const DeviceSetup& m) {
      return envelope("device-setup", {{"name", m.name}, {"stableId", m.stable_id}});
    },
    [](const SetupRequired&) {
      return envelope("setup-required", json::object());
    },
    [](const DeviceListMessage& m) {
      const char* type = m.kind == DeviceListMessage::Kind::SetupComplete ? "setup-complete"
                       : m.kind == DeviceListMessage::Kind::Connected ? "device-connected"
                       : "device-disconnected";
      return envelope(type, {{"device", device_to_json(m.device)}, {"onlineDevices", devices_to(m.online)}});
    },
    [](const PairRequest& m) {
      return envelope("pair-request", {{"targetDeviceHandle", m.target_handle}});
    },
    [](const PairAccepted& m) {
      return envelope(m.automatic ? "auto-paired" : "pair-accepted",
                      {{"pairing", pairing_to_json(m.pairing)}, {"partnerDevice", device_to_json(m.partner)}});
    },
    [](const TerminateConnection& m) {
      return envelope("terminate-connection", {{"pairingId", m.pairing_id}});
    },
    [](const ConnectionTerminated& m) {
      return envelope("connection-terminated", {{"pairingId", m.pairing_id}, {"terminatedBy", m.terminated_by}});
    },
    [](const FileTransferMessage& m) {
      json data = flat_meta_json(m.meta);
      data["content"] = m.content;
      data["encoding"] = m.encoding;
      if(m.meta.target.kind == TargetDescriptor::Kind::RelayedClient) {
        data["targetClientId"] = m.meta.target.handle;
        return envelope("relay-file-transfer", std::move(data));
      }
      if(m.meta.target.kind == TargetDescriptor::Kind::Device) {
        data["targetDeviceHandle"] = m.meta.target.handle;
      }
      return envelope("file-transfer", std::move(data));
    },
    [](const FileReceived& m) {
      json file = meta_to_json(m.meta);
      file["content"] = m.content;
      file["encoding"] = m.encoding;
      return envelope("file-received", {{"file", std::move(file)}, {"fromDevice", m.from_device}});
    },
    [](const FileSentConfirmation& m) {
      return envelope("file-sent-confirmation", {{"transferId", m.transfer_id}, {"filename", m.filename},
                                                 {"recipientCount", m.recipient_count},
                                                 {"isClipboard", m.is_clipboard}});
    },
    [](const FileQueued& m) {
      return envelope("file-queued", {{"transferId", m.transfer_id}, {"filename", m.filename},
                                      {"targetDeviceHandle", m.target_handle}});
    },
    [](const FileSaved& m) {
      return envelope("file-saved", {{"transferId", m.transfer_id}, {"filename", m.filename}});
    },
    [](const TransferFailedMessage& m) {
      return envelope("transfer-failed", {{"transferId", m.transfer_id}, {"reason", m.reason}});
    },
    [](const TransferAbort& m) {
      return envelope("transfer-abort", {{"transferId", m.transfer_id}, {"reason", m.reason}});
    },
    [](const ClipboardSync& m) {
      return envelope("clipboard-sync", {{"transferId", m.transfer_id}, {"content", m.content},
                                         {"fromDevice", m.from_device}});
    },
    [](const DeviceNameUpdate& m) {
      return envelope("device-name-update", {{"name", m.name}});
    },
    [](const NameUpdated& m) {
      return envelope("name-updated", {{"device", device_to_json(m.device)}});
    },
    [](const ErrorMessage& m) {
      return make_error(m.message);
    },
    [](const PeerHandshake& m) {
      return envelope(m.ack ? "peer-handshake-ack" : "peer-handshake",
                      {{"id", m.id}, {"name", m.name}, {"port", m.port}});
    },
    [](const FileReceivedAck& m) {
      return envelope("file-received-ack", {{"transferId", m.transfer_id}, {"filename", m.filename}});
    },
    [](const RelayDevices& m) {
      return envelope("relay-devices", {{"devices", devices_to(m.devices)}});
    },
    [](const ChunkFrame& f) {
      json data{
        {"transferId", f.transfer_id},
        {"index", f.index},
        {"totalChunks", f.total_chunks},
        {"totalSize", f.total_size},
        {"data", base64_encode(f.data)}
      };
      if(f.meta) data["meta"] = meta_to_json(*f.meta);
      if(!f.relay_to.empty()) data["relayTo"] = f.relay_to;
      return envelope("file-chunk", std::move(data));
    }
  }, message);
}

std::string message_type(const Message& message) {
  if(std::holds_alternative<ChunkFrame>(message)) return "file-chunk";
  return encode_message(message).at("type").get<std::string>();
}

FileTransferMessage make_inline_transfer(const TransferMeta& meta, const std::string& bytes) {
  FileTransferMessage m;
  m.meta = meta;
  if(looks_like_text(bytes, meta.is_clipboard ? "text/plain" : meta.mime_type)) {
    m.content = bytes;
    m.encoding = "text";
  } else {
    m.content = base64_encode(bytes);
    m.encoding = "base64";
  }
  return m;
}

std::string decode_inline_content(const std::string& content, const std::string& encoding) {
  if(encoding == "text") return content;
  if(encoding != "base64") throw ProtocolError("unknown content encoding '" + encoding + "'");
  try {
    return base64_decode(content);
  } catch(const std::invalid_argument& e) {
    throw ProtocolError(std::string("content: ") + e.what());
  }
}
