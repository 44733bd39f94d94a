#pragma once
#include <asio.hpp>
#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "discovery.hpp"

// UDP broadcast advertiser and resolver. Adverts are
// {"service":"snapsend","id":...,"name":...,"port":...}.
class LanDiscovery : public NetworkDiscovery,
                     public std::enable_shared_from_this<LanDiscovery> {
public:
  struct Options {
    uint16_t discovery_port = 7421;
    std::chrono::milliseconds advertise_interval{2000};
    std::chrono::milliseconds advert_ttl{7000};
    bool auto_connect = true;
    std::string stable_id;
    std::string display_name;
    uint16_t transfer_port = 0;
  };

  static std::shared_ptr<LanDiscovery> create(asio::io_context& io,
                                              Options options,
                                              std::shared_ptr<Logger> logger = nullptr);

  // Binds the discovery port. Throws std::system_error on failure.
  void discover(Listener listener) override;
  void stop() override;

  void set_display_name(const std::string& name) override;

  struct Advert {
    std::string id;
    std::string name;
    uint16_t port = 0;
  };

  static std::string make_advert(const std::string& id, const std::string& name, uint16_t port);
  // Empty for anything but a well-formed snapsend advert, whatever its field types.
  static std::optional<Advert> parse_advert(const std::string& payload);

private:
  LanDiscovery(asio::io_context& io, Options options, std::shared_ptr<Logger> logger);

  void do_receive();
  void handle_datagram(const std::string& payload, const asio::ip::udp::endpoint& from);
  void schedule_advertise();
  void advertise();
  void prune();

  asio::io_context& io_;
  Options options_;
  asio::ip::udp::socket socket_;
  asio::steady_timer advertise_timer_;
  asio::ip::udp::endpoint sender_;
  std::array<char, 2048> buffer_{};
  std::atomic<bool> running_{false};
  std::mutex name_mutex_;
};
