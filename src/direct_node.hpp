#pragma once
#include <asio.hpp>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "chunk_engine.hpp"
#include "connection.hpp"
#include "device_registry.hpp"
#include "discovery.hpp"
#include "event_bus.hpp"
#include "file_store.hpp"
#include "log.hpp"
#include "pairing_coordinator.hpp"
#include "protocol.hpp"
#include "target_resolver.hpp"
#include "transfer_inbox.hpp"
#include "transfer_node.hpp"

// Local-network peer. Runs a transfer server, links to discovered peers and
// pairs with each one as the link comes up. Thin clients that connect with
// device-setup are hosted and announced to linked peers as relayed clients.
class DirectNode : public ConnectionHandler,
                   public LinkDialer,
                   public TransferNode,
                   public std::enable_shared_from_this<DirectNode> {
public:
  struct Options {
    std::string listen_ip = "0.0.0.0";
    uint16_t listen_port = 7420;
    std::string stable_id;
    std::string display_name;
    std::chrono::milliseconds reconnect_delay{3000};
    std::chrono::milliseconds sweep_interval{5000};
    std::chrono::milliseconds assembly_timeout{120000};
    ChunkLimits limits;
  };

  struct Stats {
    std::size_t links = 0;
    std::size_t clients = 0;
    std::size_t pairings = 0;
    std::size_t pending = 0;
    std::size_t sending = 0;
    std::size_t receiving = 0;
  };

  static constexpr const char* kSelfHandle = "self";

  static std::shared_ptr<DirectNode> create(asio::io_context& io,
                                            Options options,
                                            std::shared_ptr<FileStore> files,
                                            std::shared_ptr<TransferStore> store,
                                            std::shared_ptr<Logger> logger = nullptr);
  ~DirectNode() override;

  // Starts discovery now if the node is running, otherwise on start().
  void attach_discovery(std::shared_ptr<NetworkDiscovery> discovery);

  // TransferNode. start() binds the transfer server and throws
  // std::system_error if the port is taken.
  void start() override;
  void stop() override;
  EventBus& bus() override { return bus_; }
  std::string local_handle() const override { return kSelfHandle; }
  std::vector<Device> devices() const override;
  std::vector<Device> relayed_clients() const override;
  std::vector<Pairing> pairings() const override;
  std::vector<PendingTransfer> pending() const override;
  bool request_pair(const std::string& handle) override;
  bool end_pairing(const std::string& pairing_id) override;
  std::string send(Transfer transfer) override;
  void rename(const std::string& name) override;
  std::shared_ptr<TransferStore> store() const override { return store_; }

  // LinkDialer
  void dial(const std::string& handle, const std::string& host, uint16_t port) override;
  void hang_up(const std::string& handle) override;

  // ConnectionHandler
  void on_message(const std::shared_ptr<Connection>& conn, const nlohmann::json& message) override;
  void on_closed(const std::shared_ptr<Connection>& conn) override;

  uint16_t port() const { return bound_port_; }
  const std::string& stable_id() const { return options_.stable_id; }
  bool linked(const std::string& handle) const;
  Stats stats() const;

private:
  enum class PeerKind { Pending, Link, Client, Dropped };

  struct Peer {
    std::shared_ptr<Connection> conn;
    PeerKind kind = PeerKind::Pending;
    bool outgoing = false;
    std::string handle;
    std::string dialed_as;
    std::string stable_id;
    std::string name;
    std::string initiator;     // stable id of the side that dialed
  };

  struct Outgoing {
    std::shared_ptr<ChunkSender> sender;
    std::string channel;
    std::string pairing_id;
  };

  struct RelayedStream {
    std::string client;
    std::string origin;
  };

  DirectNode(asio::io_context& io, Options options, std::shared_ptr<FileStore> files,
             std::shared_ptr<TransferStore> store, std::shared_ptr<Logger> logger);

  void do_accept();
  void schedule_sweep();
  void schedule_redial(const std::string& handle);
  void on_discovery(const DiscoveryEvent& event);
  void on_event(const Event& event);

  void on_handshake(Peer& peer, const PeerHandshake& m);
  void establish_link(Peer& peer, const PeerHandshake& m, const std::string& handle);
  void teardown_link(const std::string& handle, const std::string& reason);
  void on_client_setup(Peer& peer, const DeviceSetup& m);
  void drop_client(const Peer& peer);
  void announce_clients();

  void handle_link_message(Peer& peer, const Message& message, const nlohmann::json& raw);
  void handle_client_message(Peer& peer, const Message& message);
  void forward_to_client(const std::string& origin, const ChunkFrame& frame, const nlohmann::json& raw);
  void deliver_inline_to_client(const std::string& client, const TransferMeta& meta, const std::string& bytes);

  // Sends to each route and reports the transfer once every route finished.
  void deliver_all(const Transfer& transfer, const std::vector<Route>& routes);
  void deliver(const Transfer& transfer, const Route& route, std::function<void(bool ok)> done);

  Peer* find_peer(const Connection* conn);
  Peer* find_link_by_stable_id(const std::string& stable_id);
  std::shared_ptr<Connection> connection_for(const std::string& handle) const;
  bool send_to(const std::string& handle, const Message& message, Connection::WriteCallback on_written = nullptr);
  Device self_device() const;

  asio::io_context& io_;
  Options options_;
  std::shared_ptr<FileStore> files_;
  std::shared_ptr<TransferStore> store_;
  std::shared_ptr<Logger> logger_;

  mutable std::recursive_mutex state_mutex_;
  EventBus bus_;
  DeviceRegistry registry_;
  PairingCoordinator coordinator_;
  TargetResolver resolver_;
  TransferInbox inbox_;
  SubscriptionHandle subscription_ = 0;

  std::unique_ptr<asio::ip::tcp::acceptor> acceptor_;
  asio::steady_timer sweep_timer_;
  std::atomic<bool> started_{false};
  uint16_t bound_port_ = 0;
  std::shared_ptr<NetworkDiscovery> discovery_;

  std::unordered_map<const Connection*, Peer> peers_;
  std::unordered_map<std::string, std::shared_ptr<Connection>> links_;     // link handle
  std::unordered_map<std::string, std::shared_ptr<Connection>> clients_;   // hosted client handle
  std::unordered_map<std::string, Device> hosted_;                         // hosted client devices
  std::unordered_map<std::string, std::vector<Device>> remote_clients_;    // by host link handle
  std::unordered_set<std::string> dialing_;
  std::unordered_map<std::string, std::shared_ptr<asio::steady_timer>> redials_;
  std::unordered_map<std::string, Outgoing> outgoing_;                     // "<id>@<channel>"
  std::unordered_map<std::string, RelayedStream> relayed_streams_;
};
