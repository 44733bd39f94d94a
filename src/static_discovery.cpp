#include "static_discovery.hpp"

StaticDiscovery::StaticDiscovery(std::vector<HostPort> seeds, bool auto_connect, std::shared_ptr<Logger> logger)
  : NetworkDiscovery(auto_connect, logger ? std::move(logger) : std::make_shared<Logger>("static-peers")),
    seeds_(std::move(seeds)) {}

std::vector<HostPort> StaticDiscovery::parse_seeds(const std::string& list, std::string& error) {
  std::vector<HostPort> out;
  for(const auto& item : split_list(list)) {
    auto hp = parse_host_port(item);
    if(!hp) {
      error = "invalid peer address '" + item + "' (expected host:port)";
      return {};
    }
    out.push_back(*hp);
  }
  return out;
}

void StaticDiscovery::discover(Listener listener) {
  set_listener(std::move(listener));
  for(const auto& seed : seeds_) {
    DeviceAppeared ev;
    ev.host = seed.host;
    ev.port = seed.port;
    ev.device.handle = make_handle(seed.host, seed.port);
    ev.device.display_name = ev.device.handle;
    ev.device.online = true;
    ev.device.last_seen = SystemClock::now();
    appeared(std::move(ev));
  }
}

void StaticDiscovery::stop() {
  set_listener(nullptr);
}
