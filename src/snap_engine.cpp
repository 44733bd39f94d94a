#include "snap_engine.hpp"

#include <csignal>
#include <stdexcept>

#include "chunk_engine.hpp"
#include "direct_node.hpp"
#include "file_store.hpp"
#include "identity.hpp"
#include "lan_discovery.hpp"
#include "relay_client.hpp"
#include "relay_server.hpp"
#include "settings_manager.hpp"
#include "snap_cli.hpp"
#include "static_discovery.hpp"
#include "transfer_store.hpp"
#include "utils.hpp"

namespace {

std::chrono::milliseconds setting_ms(const SettingsManager& settings, const std::string& key) {
  return std::chrono::milliseconds(settings.get<int>(key));
}

} // namespace

SnapEngine::SnapEngine(std::shared_ptr<SettingsManager> settings, Options options)
  : options_(std::move(options)),
    settings_(settings ? std::move(settings) : std::make_shared<SettingsManager>()),
    logger_(std::make_shared<Logger>("snapsend")) {
  if(options_.workspace_root.empty()) {
    options_.workspace_root = std::filesystem::current_path();
  }
}

SnapEngine::~SnapEngine() {
  stop();
}

void SnapEngine::ensure_workspace() const {
  std::error_code ec;
  std::filesystem::create_directories(options_.workspace_root / ".config", ec);
}

std::filesystem::path SnapEngine::workspace_path(const std::string& value) const {
  std::filesystem::path p(value);
  return p.is_absolute() ? p : options_.workspace_root / p;
}

std::optional<SnapEngine::Mode> SnapEngine::parse_mode(const std::string& text) {
  if(text == "direct") return Mode::Direct;
  if(text == "relay-server") return Mode::RelayServer;
  if(text == "relay-client") return Mode::RelayClient;
  return std::nullopt;
}

const char* SnapEngine::to_string(Mode mode) {
  switch(mode) {
    case Mode::Direct: return "direct";
    case Mode::RelayServer: return "relay-server";
    case Mode::RelayClient: return "relay-client";
  }
  return "unknown";
}

void SnapEngine::start() {
  if(started_) return;

  ensure_workspace();
  init(settings_->get<bool>("verbose"));

  auto log_file = settings_->get<std::string>("log_file");
  if(!log_file.empty() && !set_log_file(workspace_path(log_file))) {
    logger_->warn("Continuing without log file {}", log_file);
  }

  auto mode = parse_mode(settings_->get<std::string>("mode"));
  if(!mode) {
    logger_->error("Unknown mode '{}'", settings_->get<std::string>("mode"));
    throw std::runtime_error("Invalid mode");
  }
  mode_ = *mode;

  FileIdentityProvider identity(options_.workspace_root / ".config", logger_);
  stable_id_ = identity.load_or_create_identity();

  display_name_ = settings_->get<std::string>("device_name");
  if(display_name_.empty()) display_name_ = options_.display_name;
  if(display_name_.empty()) display_name_ = stable_id_;
  logger_->set_name(display_name_);

  work_.emplace(asio::make_work_guard(io_));

  switch(mode_) {
    case Mode::RelayServer: start_relay_server(); break;
    case Mode::RelayClient: start_relay_client(); break;
    case Mode::Direct: start_direct(); break;
  }
  started_ = true;

  if(options_.handle_signals) {
    signals_ = std::make_unique<asio::signal_set>(io_, SIGINT, SIGTERM);
    signals_->async_wait([this](const std::error_code& ec, int signo){
      if(ec) return;
      logger_->info("Caught signal {}, shutting down", signo);
      io_.stop();
    });
  }

  cli_ = std::make_unique<SnapCLI>(node_, relay_server_, settings_, logger_, [this](){
    io_.stop();
  });
  if(options_.start_cli_thread) {
    start_cli();
  }
}

void SnapEngine::start_relay_server() {
  RelayServer::Options opts;
  opts.listen_ip = settings_->get<std::string>("listen_ip");
  opts.listen_port = static_cast<uint16_t>(settings_->get<int>("listen_port"));
  opts.hub.assembly_timeout = setting_ms(*settings_, "chunk_assembly_timeout_ms");
  opts.hub.auto_pair = settings_->get<bool>("auto_pair");
  relay_server_ = RelayServer::create(io_, opts, logger_);
  relay_server_->start();
  logger_->info("Relay server listening on {}:{}", opts.listen_ip, relay_server_->port());
}

void SnapEngine::start_relay_client() {
  auto relay = settings_->get<std::string>("relay_server");
  auto endpoint = parse_host_port(relay);
  if(!endpoint) {
    logger_->error("relay_server must be host:port (got '{}')", relay);
    throw std::runtime_error("Invalid relay_server");
  }

  RelayClient::Options opts;
  opts.relay_host = endpoint->host;
  opts.relay_port = endpoint->port;
  opts.stable_id = stable_id_;
  opts.display_name = display_name_;
  opts.reconnect_delay = setting_ms(*settings_, "reconnect_delay_ms");
  opts.assembly_timeout = setting_ms(*settings_, "chunk_assembly_timeout_ms");

  auto files = std::make_shared<FileStore>(workspace_path(settings_->get<std::string>("download_dir")), logger_);
  auto store = std::make_shared<JsonTransferStore>(options_.workspace_root / ".config" / "transfers.json", logger_);
  relay_client_ = RelayClient::create(io_, opts, files, store, logger_);
  node_ = relay_client_;
  relay_client_->start();
}

void SnapEngine::start_direct() {
  DirectNode::Options opts;
  opts.listen_ip = settings_->get<std::string>("listen_ip");
  opts.listen_port = static_cast<uint16_t>(settings_->get<int>("listen_port"));
  opts.stable_id = stable_id_;
  opts.display_name = display_name_;
  opts.reconnect_delay = setting_ms(*settings_, "reconnect_delay_ms");
  opts.assembly_timeout = setting_ms(*settings_, "chunk_assembly_timeout_ms");

  auto files = std::make_shared<FileStore>(workspace_path(settings_->get<std::string>("download_dir")), logger_);
  auto store = std::make_shared<JsonTransferStore>(options_.workspace_root / ".config" / "transfers.json", logger_);
  direct_ = DirectNode::create(io_, opts, files, store, logger_);
  node_ = direct_;
  direct_->start();

  const bool auto_connect = settings_->get<bool>("auto_connect");
  auto static_peers = settings_->get<std::string>("static_peers");
  if(!static_peers.empty()) {
    std::string error;
    auto seeds = StaticDiscovery::parse_seeds(static_peers, error);
    if(!error.empty()) {
      logger_->error("Invalid static_peers: {}", error);
      throw std::runtime_error("Invalid static_peers");
    }
    direct_->attach_discovery(std::make_shared<StaticDiscovery>(std::move(seeds), auto_connect, logger_));
    return;
  }

  const int discovery_port = settings_->get<int>("discovery_port");
  if(discovery_port == 0) {
    logger_->info("Local-network discovery disabled; use 'pair <host:port>' to link");
    direct_->attach_discovery(std::make_shared<StaticDiscovery>(std::vector<HostPort>{}, auto_connect, logger_));
    return;
  }

  LanDiscovery::Options lan;
  lan.discovery_port = static_cast<uint16_t>(discovery_port);
  lan.advertise_interval = setting_ms(*settings_, "advertise_interval_ms");
  lan.advert_ttl = setting_ms(*settings_, "advert_ttl_ms");
  lan.auto_connect = auto_connect;
  lan.stable_id = stable_id_;
  lan.display_name = display_name_;
  lan.transfer_port = direct_->port();
  direct_->attach_discovery(LanDiscovery::create(io_, lan, logger_));
}

void SnapEngine::run() {
  if(!started_) start();
  io_.run();
}

void SnapEngine::start_background() {
  if(!started_) start();
  if(io_thread_.joinable()) return;
  io_thread_ = std::thread([this](){
    io_.run();
  });
}

void SnapEngine::stop() {
  if(!started_) return;
  started_ = false;

  if(cli_) {
    cli_->stop();
    cli_thread_running_ = false;
  }
  if(signals_) {
    std::error_code ec;
    signals_->cancel(ec);
  }
  if(node_) node_->stop();
  if(relay_server_) relay_server_->stop();

  // Closes were posted above; let them run before the loop stops.
  work_.reset();
  if(io_thread_.joinable()) {
    asio::post(io_, [this]{ io_.stop(); });
    io_thread_.join();
  } else {
    io_.restart();
    io_.poll();
  }
  io_.restart();
}

LogListenerHandle SnapEngine::add_log_listener(Logger::Listener listener, void* user_data) {
  if(!logger_) return 0;
  return logger_->add_listener(std::move(listener), user_data);
}

void SnapEngine::remove_log_listener(LogListenerHandle handle) {
  if(logger_ && handle != 0) {
    logger_->remove_listener(handle);
  }
}

void SnapEngine::clear_log_listeners() {
  if(logger_) {
    logger_->clear_listeners();
  }
}

void SnapEngine::start_cli() {
  if(!cli_ || cli_thread_running_) return;
  cli_->start();
  cli_thread_running_ = true;
}

void SnapEngine::execute_command(const std::string& line) {
  if(cli_) {
    cli_->execute_command(line);
  }
}

uint16_t SnapEngine::listen_port() const {
  if(relay_server_) return relay_server_->port();
  if(direct_) return direct_->port();
  return 0;
}

SnapEngine::Stats SnapEngine::stats() const {
  Stats s;
  s.mode = mode_;
  if(relay_server_) {
    auto hub = relay_server_->hub().stats();
    s.devices = hub.online_devices;
    s.pairings = hub.active_pairings;
    s.pending = hub.pending_transfers;
    s.connections = hub.connections;
  } else if(node_) {
    s.devices = node_->devices().size();
    s.pairings = node_->pairings().size();
    s.pending = node_->pending().size();
    if(direct_) {
      auto ds = direct_->stats();
      s.connections = ds.links + ds.clients;
    } else if(relay_client_) {
      s.connections = relay_client_->connected() ? 1 : 0;
    }
  }
  return s;
}
