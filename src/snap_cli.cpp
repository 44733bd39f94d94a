#include "snap_cli.hpp"

#include <algorithm>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <sstream>

#ifdef HAVE_READLINE
#include <readline/readline.h>
#include <readline/history.h>
#endif

#include "relay_server.hpp"
#include "settings_manager.hpp"
#include "transfer.hpp"
#include "transfer_node.hpp"
#include "utils.hpp"

namespace {

std::string rest_of(std::istringstream& iss) {
  std::string rest;
  std::getline(iss, rest);
  return trim(rest);
}

std::string describe(const TransferMeta& meta) {
  if(meta.is_clipboard) return "clipboard (" + std::to_string(meta.size) + " bytes)";
  return meta.filename + " (" + std::to_string(meta.size) + " bytes)";
}

} // namespace

SnapCLI::SnapCLI(std::shared_ptr<TransferNode> node,
                 std::shared_ptr<RelayServer> relay_server,
                 std::shared_ptr<SettingsManager> settings,
                 std::shared_ptr<Logger> logger,
                 QuitCallback on_quit)
  : node_(std::move(node)),
    relay_server_(std::move(relay_server)),
    settings_(std::move(settings)),
    logger_(std::move(logger)),
    on_quit_(std::move(on_quit)) {
  if(auto* b = bus()) {
    subscription_ = b->subscribe([this](const Event& ev){ on_event(ev); });
  }
}

SnapCLI::~SnapCLI() {
  stop();
  if(auto* b = bus(); b && subscription_ != 0) {
    b->unsubscribe(subscription_);
  }
}

EventBus* SnapCLI::bus() const {
  if(node_) return &node_->bus();
  if(relay_server_) return &relay_server_->hub().bus();
  return nullptr;
}

void SnapCLI::start() {
  cli_thread_ = std::thread([this](){ run_loop(); });
}

void SnapCLI::stop() {
  running_ = false;
  if(!cli_thread_.joinable()) return;
  if(finished_ && std::this_thread::get_id() != cli_thread_.get_id()) {
    cli_thread_.join();
  } else {
    // Still blocked reading stdin.
    cli_thread_.detach();
  }
}

void SnapCLI::run_loop() {
  while(running_) {
    auto input = read_command_line("> ");
    if(!input || !running_) break;
    if(input->empty()) continue;
    if(!execute_command(*input)) break;
  }
  finished_ = true;
  if(running_ && on_quit_) on_quit_();
}

bool SnapCLI::execute_command(const std::string& line) {
  std::istringstream iss(line);
  std::string cmd;
  iss >> cmd;
  if(cmd.empty()) return true;

  if(cmd == "help" || cmd == "h" || cmd == "?") {
    print_help();
  } else if(cmd == "devices" || cmd == "d") {
    list_devices();
  } else if(cmd == "pairings" || cmd == "p") {
    list_pairings();
  } else if(cmd == "pair") {
    pair_command(rest_of(iss));
  } else if(cmd == "unpair") {
    unpair_command(rest_of(iss));
  } else if(cmd == "send") {
    send_command(rest_of(iss));
  } else if(cmd == "clip") {
    clip_command("all", rest_of(iss));
  } else if(cmd == "clipto") {
    std::string target;
    iss >> target;
    clip_command(target, rest_of(iss));
  } else if(cmd == "transfers" || cmd == "t") {
    list_transfers();
  } else if(cmd == "rm") {
    remove_transfer(rest_of(iss));
  } else if(cmd == "queue" || cmd == "q") {
    list_queue();
  } else if(cmd == "rename") {
    rename_command(rest_of(iss));
  } else if(cmd == "stats") {
    print_stats();
  } else if(cmd == "settings" || cmd == "s") {
    auto args = rest_of(iss);
    handle_settings_command(args.empty() ? "list" : args);
  } else if(cmd == "set") {
    auto args = rest_of(iss);
    handle_settings_command(args.empty() ? "list" : "set " + args);
  } else if(cmd == "get") {
    auto args = rest_of(iss);
    handle_settings_command(args.empty() ? "get" : "get " + args);
  } else if(cmd == "save") {
    handle_settings_command("save");
  } else if(cmd == "load") {
    handle_settings_command("load");
  } else if(cmd == "quit" || cmd == "exit") {
    out("Quitting...");
    return false;
  } else {
    print_help();
    out("Unknown command: {}", cmd);
  }
  return true;
}

void SnapCLI::print_help() {
  out("Commands:");
  out("  devices                      list online devices and relayed clients");
  out("  pairings                     list active pairings");
  out("  pair <handle|host:port>      pair with a device");
  out("  unpair <pairingId>           end a pairing");
  out("  send <path> [target]         send a file; target is all, local, <handle> or relay:<handle>");
  out("  clip <text>                  share clipboard text with every partner");
  out("  clipto <target> <text>       share clipboard text with one target");
  out("  transfers                    list recorded transfers");
  out("  rm <transferId>              delete a transfer record");
  out("  queue                        list transfers waiting for a pairing");
  out("  rename <name>                change this device's display name");
  out("  stats                        connection and queue counters");
  out("  settings [list|get|set|save|load]");
  out("  quit");
}

void SnapCLI::list_devices() {
  std::vector<Device> devices;
  std::vector<Device> clients;
  std::string self;
  if(node_) {
    devices = node_->devices();
    clients = node_->relayed_clients();
    self = node_->local_handle();
  } else if(relay_server_) {
    devices = relay_server_->hub().online_devices();
  }
  if(devices.empty() && clients.empty()) {
    out("No devices online.");
    return;
  }
  for(const auto& d : devices) {
    out("  {}{}  {}  [{}]", d.handle, d.handle == self ? " (you)" : "", d.display_name, d.stable_id);
  }
  for(const auto& c : clients) {
    out("  relay:{}  {}  (relayed)", c.handle, c.display_name);
  }
}

void SnapCLI::list_pairings() {
  std::vector<Pairing> pairings;
  if(node_) pairings = node_->pairings();
  else if(relay_server_) pairings = relay_server_->hub().pairings();
  if(pairings.empty()) {
    out("No active pairings.");
    return;
  }
  for(const auto& p : pairings) {
    out("  {}  {} <-> {}", p.id, p.device_a, p.device_b);
  }
}

void SnapCLI::list_queue() {
  std::vector<PendingTransfer> pending;
  if(node_) pending = node_->pending();
  else if(relay_server_) pending = relay_server_->hub().pending();
  if(pending.empty()) {
    out("Queue is empty.");
    return;
  }
  for(const auto& p : pending) {
    out("  #{} {}  {} -> {}", p.sequence, describe(p.transfer.meta), p.origin_handle, p.target_key);
  }
}

void SnapCLI::list_transfers() {
  auto store = node_ ? node_->store() : nullptr;
  if(!store) {
    out("No transfer store in this mode.");
    return;
  }
  auto records = store->list_transfers();
  if(records.empty()) {
    out("No transfers recorded.");
    return;
  }
  for(const auto& r : records) {
    out("  {}  {:<10} {}  {}", r.meta.id, to_string(r.meta.direction), describe(r.meta),
        r.content_path.empty() ? r.meta.target.to_string() : r.content_path);
  }
}

void SnapCLI::remove_transfer(const std::string& id) {
  auto store = node_ ? node_->store() : nullptr;
  if(!store) {
    out("No transfer store in this mode.");
    return;
  }
  if(id.empty()) {
    out("Usage: rm <transferId>");
    return;
  }
  if(store->delete_transfer(id)) out("Removed {}", id);
  else out("No transfer {}", id);
}

void SnapCLI::pair_command(const std::string& handle) {
  if(!node_) {
    out("Pairing is made by devices, not the relay.");
    return;
  }
  if(handle.empty()) {
    out("Usage: pair <handle|host:port>");
    return;
  }
  if(node_->request_pair(handle)) out("Pair request sent to {}", handle);
  else out("Unable to pair with {}", handle);
}

void SnapCLI::unpair_command(const std::string& pairing_id) {
  if(!node_) {
    out("Pairings are ended by devices, not the relay.");
    return;
  }
  if(pairing_id.empty()) {
    out("Usage: unpair <pairingId>");
    return;
  }
  if(!node_->end_pairing(pairing_id)) out("No active pairing {}", pairing_id);
}

void SnapCLI::send_command(const std::string& args) {
  if(!node_) {
    out("The relay does not send files.");
    return;
  }
  std::istringstream iss(args);
  std::string path;
  iss >> std::quoted(path);
  if(path.empty()) {
    out("Usage: send <path> [target]");
    return;
  }
  std::string target = "all";
  iss >> target;
  try {
    auto transfer = make_file_transfer(path, TargetDescriptor::parse(target));
    auto id = node_->send(std::move(transfer));
    out("Sending {} as {}", path, id);
  } catch(const std::exception& e) {
    out("Unable to send {}: {}", path, e.what());
  }
}

void SnapCLI::clip_command(const std::string& target, const std::string& text) {
  if(!node_) {
    out("The relay does not share clipboards.");
    return;
  }
  if(target.empty() || text.empty()) {
    out("Usage: clip <text> | clipto <target> <text>");
    return;
  }
  auto id = node_->send(make_clipboard_transfer(text, TargetDescriptor::parse(target)));
  out("Clipboard queued as {}", id);
}

void SnapCLI::rename_command(const std::string& name) {
  if(!node_) {
    out("The relay has no display name.");
    return;
  }
  if(name.empty()) {
    out("Usage: rename <name>");
    return;
  }
  node_->rename(name);
  if(settings_) {
    std::string error;
    if(!settings_->set_from_string("device_name", name, error)) {
      out("Renamed, but device_name was not updated: {}", error);
      return;
    }
  }
  out("Now known as {}", name);
}

void SnapCLI::print_stats() {
  if(relay_server_) {
    auto s = relay_server_->hub().stats();
    out("connections={} devices={} pairings={} pending={} streams={}",
        s.connections, s.online_devices, s.active_pairings, s.pending_transfers, s.streams_in_flight);
    return;
  }
  if(node_) {
    out("devices={} clients={} pairings={} pending={}",
        node_->devices().size(), node_->relayed_clients().size(),
        node_->pairings().size(), node_->pending().size());
  }
}

void SnapCLI::on_event(const Event& event) {
  std::visit(overloaded{
    [&](const PairingEstablished& e){
      out("[paired] {} <-> {} ({})", e.pairing.device_a, e.pairing.device_b, e.pairing.id);
    },
    [&](const PairingEnded& e){
      out("[unpaired] {} by {}: {}", e.pairing.id, e.terminated_by, e.reason);
    },
    [&](const TransferQueued& e){
      out("[queued] {} for {}", describe(e.meta), e.target_key);
    },
    [&](const TransferSavedLocal& e){
      out("[saved] {} kept locally", describe(e.meta));
    },
    [&](const TransferSent& e){
      progress_shown_.erase(e.meta.id);
      out("[sent] {} to {} recipient(s)", describe(e.meta), e.recipient_count);
    },
    [&](const TransferReceived& e){
      progress_shown_.erase(e.meta.id);
      if(e.meta.is_clipboard) {
        out("[clipboard] from {}: {}", e.meta.from_device, e.text);
      } else {
        out("[received] {} from {} -> {}", describe(e.meta), e.meta.from_device, e.stored_path.string());
      }
    },
    [&](const TransferFailed& e){
      progress_shown_.erase(e.transfer_id);
      out("[failed] {} ({}): {}", e.transfer_id, to_string(e.kind), e.reason);
    },
    [&](const ChunkProgressed& e){
      int step = e.percent / 10 * 10;
      auto& shown = progress_shown_[e.progress.transfer_id];
      if(step <= shown && e.percent != 100) return;
      shown = step;
      out("[{}] {} {}%", e.progress.direction == ProgressDirection::Send ? "upload" : "download",
          e.progress.transfer_id, e.percent);
    },
    [&](const PeerError& e){
      out("[error] {}: {}", e.handle.empty() ? "peer" : e.handle, e.message);
    },
    [&](const RegistryChanged& e){
      switch(e.change) {
        case RegistryChanged::Change::Registered:
          out("[online] {} ({})", e.device.display_name, e.device.handle);
          break;
        case RegistryChanged::Change::Offline:
          out("[offline] {} ({})", e.device.display_name, e.retired_handle);
          break;
        case RegistryChanged::Change::Renamed:
          out("[renamed] {} is now {}", e.device.handle, e.device.display_name);
          break;
        case RegistryChanged::Change::HandleReplaced:
          break;
      }
    },
    [&](const DeviceListUpdated&){}
  }, event);
}

void SnapCLI::handle_settings_command(const std::string& args) {
  if(!settings_) {
    out("Settings manager unavailable.");
    return;
  }

  std::istringstream iss(args);
  std::string action;
  iss >> action;

  if(action.empty() || action == "list") {
    list_settings();
    return;
  }

  if(action == "get") {
    std::string key;
    iss >> key;
    if(key.empty()) {
      out("Usage: settings get <key>");
      return;
    }
    auto resolved = settings_->resolve_key(key);
    if(!resolved) {
      out("Unknown setting '{}'.", key);
      return;
    }
    out("{} = {}", *resolved, settings_->value_as_string(*resolved));
    return;
  }

  if(action == "set") {
    std::string key;
    iss >> key;
    auto value = rest_of(iss);
    if(key.empty() || value.empty()) {
      out("Usage: settings set <key> <value>");
      return;
    }
    auto resolved = settings_->resolve_key(key);
    if(!resolved) {
      out("Unknown setting '{}'.", key);
      return;
    }
    std::string error;
    if(settings_->set_from_string(*resolved, value, error)) {
      if(*resolved == "verbose") init(settings_->get<bool>("verbose"));
      if(*resolved == "device_name" && node_) node_->rename(settings_->get<std::string>("device_name"));
      out("{} = {}", *resolved, settings_->value_as_string(*resolved));
    } else {
      out("Failed to set {}: {}", *resolved, error);
    }
    return;
  }

  if(action == "save") {
    if(settings_->save()) out("Saved settings to {}", settings_->settings_path().string());
    else out("Failed to save settings.");
    return;
  }

  if(action == "load") {
    if(settings_->load()) out("Loaded settings from {} (network settings apply on restart)", settings_->settings_path().string());
    else out("Settings file not found; defaults kept.");
    return;
  }

  out("Unknown settings command.");
}

void SnapCLI::list_settings() {
  auto keys = settings_->keys();
  std::sort(keys.begin(), keys.end());
  for(const auto& key : keys) {
    out("{} = {}", key, settings_->value_as_string(key));
  }
}

std::optional<std::string> SnapCLI::read_command_line(const char* prompt) {
#ifdef HAVE_READLINE
  char* line = readline(prompt);
  if(!line) return std::nullopt;
  std::string result(line);
  if(!result.empty()) add_history(result.c_str());
  free(line);
  return result;
#else
  return read_command_line_simple(prompt);
#endif
}

#if !defined(HAVE_READLINE)
void SnapCLI::append_history_entry(const std::string& line) {
  if(line.empty()) return;
  if(!cli_history_.empty() && cli_history_.back() == line) return;
  cli_history_.push_back(line);
  if(cli_history_.size() > history_limit_) {
    cli_history_.erase(cli_history_.begin());
  }
}

std::optional<std::string> SnapCLI::read_command_line_simple(const char* prompt) {
  std::cout << prompt;
  std::cout.flush();
  std::string line;
  if(!std::getline(std::cin, line)) return std::nullopt;
  append_history_entry(line);
  return line;
}
#endif
