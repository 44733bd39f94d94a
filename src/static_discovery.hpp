#pragma once
#include <vector>

#include "discovery.hpp"
#include "utils.hpp"

// Fixed host:port seeds. Each appears once on discover() and never expires.
class StaticDiscovery : public NetworkDiscovery {
public:
  StaticDiscovery(std::vector<HostPort> seeds, bool auto_connect, std::shared_ptr<Logger> logger = nullptr);

  void discover(Listener listener) override;
  void stop() override;

  static std::vector<HostPort> parse_seeds(const std::string& list, std::string& error);

private:
  std::vector<HostPort> seeds_;
};
