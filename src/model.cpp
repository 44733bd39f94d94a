#include "model.hpp"
#include "utils.hpp"

#include <stdexcept>

using json = nlohmann::json;

TargetDescriptor TargetDescriptor::parse(const std::string& text) {
  if(text.empty() || text == "all" || text == "broadcast") return broadcast();
  if(text == "local") return local();
  const std::string relay_prefix = "relay:";
  if(text.rfind(relay_prefix, 0) == 0) return relayed(text.substr(relay_prefix.size()));
  return device(text);
}

std::string TargetDescriptor::to_string() const {
  switch(kind) {
    case Kind::Local: return "local";
    case Kind::Broadcast: return "all";
    case Kind::RelayedClient: return "relay:" + handle;
    case Kind::Device: return handle;
  }
  return "all";
}

const char* to_string(TransferDirection direction) {
  switch(direction) {
    case TransferDirection::Sent: return "sent";
    case TransferDirection::Received: return "received";
    case TransferDirection::Queued: return "queued";
    case TransferDirection::SavedLocal: return "saved-local";
  }
  return "sent";
}

TransferDirection direction_from_string(const std::string& text) {
  if(text == "received") return TransferDirection::Received;
  if(text == "queued") return TransferDirection::Queued;
  if(text == "saved-local") return TransferDirection::SavedLocal;
  if(text == "sent") return TransferDirection::Sent;
  throw std::invalid_argument("unknown transfer direction '" + text + "'");
}

namespace {

const char* status_name(PairingStatus status) {
  switch(status) {
    case PairingStatus::Requested: return "requested";
    case PairingStatus::Active: return "active";
    case PairingStatus::Terminated: return "terminated";
  }
  return "terminated";
}

PairingStatus status_from_name(const std::string& name) {
  if(name == "active") return PairingStatus::Active;
  if(name == "requested") return PairingStatus::Requested;
  return PairingStatus::Terminated;
}

} // namespace

json device_to_json(const Device& device) {
  return json{
    {"id", device.handle},
    {"stableId", device.stable_id},
    {"name", device.display_name},
    {"online", device.online},
    {"lastSeen", to_epoch_ms(device.last_seen)}
  };
}

Device device_from_json(const json& j) {
  Device d;
  d.handle = j.at("id").get<std::string>();
  d.stable_id = j.value("stableId", "");
  d.display_name = j.value("name", d.handle);
  d.online = j.value("online", true);
  d.last_seen = from_epoch_ms(j.value("lastSeen", int64_t{0}));
  return d;
}

json pairing_to_json(const Pairing& pairing) {
  json j{
    {"id", pairing.id},
    {"deviceA", pairing.device_a},
    {"deviceB", pairing.device_b},
    {"status", status_name(pairing.status)},
    {"createdAt", to_epoch_ms(pairing.created_at)}
  };
  if(pairing.terminated_at) {
    j["terminatedAt"] = to_epoch_ms(*pairing.terminated_at);
  }
  return j;
}

Pairing pairing_from_json(const json& j) {
  Pairing p;
  p.id = j.at("id").get<std::string>();
  p.device_a = j.at("deviceA").get<std::string>();
  p.device_b = j.at("deviceB").get<std::string>();
  p.status = status_from_name(j.value("status", "active"));
  p.created_at = from_epoch_ms(j.value("createdAt", int64_t{0}));
  if(j.contains("terminatedAt")) {
    p.terminated_at = from_epoch_ms(j.at("terminatedAt").get<int64_t>());
  }
  return p;
}

json meta_to_json(const TransferMeta& meta) {
  return json{
    {"id", meta.id},
    {"filename", meta.filename},
    {"originalName", meta.original_name},
    {"mimeType", meta.mime_type},
    {"size", meta.size},
    {"isClipboard", meta.is_clipboard},
    {"direction", to_string(meta.direction)},
    {"target", meta.target.to_string()},
    {"fromDevice", meta.from_device}
  };
}

TransferMeta meta_from_json(const json& j) {
  TransferMeta m;
  m.id = j.value("id", "");
  m.filename = j.at("filename").get<std::string>();
  m.original_name = j.value("originalName", m.filename);
  m.mime_type = j.value("mimeType", "application/octet-stream");
  m.size = j.value("size", uint64_t{0});
  m.is_clipboard = j.value("isClipboard", false);
  m.direction = direction_from_string(j.value("direction", "sent"));
  m.target = TargetDescriptor::parse(j.value("target", "all"));
  m.from_device = j.value("fromDevice", "");
  return m;
}
