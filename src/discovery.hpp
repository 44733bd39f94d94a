#pragma once
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

#include "log.hpp"
#include "model.hpp"

struct DeviceAppeared {
  Device device;
  std::string host;
  uint16_t port = 0;
};

struct DeviceLost {
  std::string handle;
  std::string reason;
};

using DiscoveryEvent = std::variant<DeviceAppeared, DeviceLost>;

// One discovery strategy. Events arrive on the provider's own thread.
class DiscoveryProvider {
public:
  using Listener = std::function<void(const DiscoveryEvent&)>;

  virtual ~DiscoveryProvider() = default;
  virtual void discover(Listener listener) = 0;
  virtual void connect(const std::string& handle) = 0;
  virtual void disconnect(const std::string& handle) = 0;
  virtual void stop() = 0;
};

// Opens and closes direct links on behalf of a network discovery strategy.
class LinkDialer {
public:
  virtual ~LinkDialer() = default;
  virtual void dial(const std::string& handle, const std::string& host, uint16_t port) = 0;
  virtual void hang_up(const std::string& handle) = 0;
};

// Shared bookkeeping for strategies that find peers by address. Handles are
// "<host>:<port>" of the peer's transfer server.
class NetworkDiscovery : public DiscoveryProvider {
public:
  using Clock = std::chrono::steady_clock;

  NetworkDiscovery(bool auto_connect, std::shared_ptr<Logger> logger);

  void set_dialer(std::weak_ptr<LinkDialer> dialer);

  // Dials a known peer, or a literal host:port.
  void connect(const std::string& handle) override;
  void disconnect(const std::string& handle) override;

  std::optional<DeviceAppeared> lookup(const std::string& handle) const;
  std::vector<DeviceAppeared> known() const;
  bool auto_connect() const { return auto_connect_; }

  // Name carried in outgoing adverts, for strategies that advertise.
  virtual void set_display_name(const std::string& name) { (void)name; }

  static std::string make_handle(const std::string& host, uint16_t port);

protected:
  void set_listener(Listener listener);
  void appeared(DeviceAppeared event);
  void lost(const std::string& handle, const std::string& reason);
  std::vector<std::string> seen_before(Clock::time_point cutoff) const;

  std::shared_ptr<Logger> logger_;

private:
  struct Entry {
    DeviceAppeared event;
    Clock::time_point last_seen;
  };

  void emit(const DiscoveryEvent& event);
  std::shared_ptr<LinkDialer> dialer() const;

  bool auto_connect_ = true;
  mutable std::mutex mutex_;
  std::unordered_map<std::string, Entry> peers_;
  Listener listener_;
  std::weak_ptr<LinkDialer> dialer_;
};
