#include "lan_discovery.hpp"

#include <nlohmann/json.hpp>

using asio::ip::udp;
using json = nlohmann::json;

namespace {
const char* kService = "snapsend";
}

std::shared_ptr<LanDiscovery> LanDiscovery::create(asio::io_context& io,
                                                   Options options,
                                                   std::shared_ptr<Logger> logger) {
  return std::shared_ptr<LanDiscovery>(new LanDiscovery(io, std::move(options), std::move(logger)));
}

LanDiscovery::LanDiscovery(asio::io_context& io, Options options, std::shared_ptr<Logger> logger)
  : NetworkDiscovery(options.auto_connect, logger ? std::move(logger) : std::make_shared<Logger>("lan-discovery")),
    io_(io),
    options_(std::move(options)),
    socket_(io),
    advertise_timer_(io) {}

std::string LanDiscovery::make_advert(const std::string& id, const std::string& name, uint16_t port) {
  json j;
  j["service"] = kService;
  j["id"] = id;
  j["name"] = name;
  j["port"] = port;
  return j.dump();
}

std::optional<LanDiscovery::Advert> LanDiscovery::parse_advert(const std::string& payload) {
  json j = json::parse(payload, nullptr, false);
  if(j.is_discarded() || !j.is_object()) return std::nullopt;
  auto service = j.find("service");
  if(service == j.end() || !service->is_string() || service->get<std::string>() != kService) return std::nullopt;
  auto id = j.find("id");
  if(id == j.end() || !id->is_string() || id->get<std::string>().empty()) return std::nullopt;
  auto port = j.find("port");
  if(port == j.end() || !port->is_number_unsigned()) return std::nullopt;
  const auto value = port->get<uint64_t>();
  if(value == 0 || value > 65535) return std::nullopt;

  Advert advert;
  advert.id = id->get<std::string>();
  advert.port = static_cast<uint16_t>(value);
  auto name = j.find("name");
  if(name != j.end() && name->is_string()) advert.name = name->get<std::string>();
  return advert;
}

void LanDiscovery::set_display_name(const std::string& name) {
  std::lock_guard lg(name_mutex_);
  options_.display_name = name;
}

void LanDiscovery::discover(Listener listener) {
  set_listener(std::move(listener));
  udp::endpoint endpoint(udp::v4(), options_.discovery_port);
  socket_.open(endpoint.protocol());
  socket_.set_option(udp::socket::reuse_address(true));
  socket_.set_option(asio::socket_base::broadcast(true));
  socket_.bind(endpoint);
  running_ = true;
  log_info(logger_.get(), "Advertising on UDP {} every {} ms", options_.discovery_port,
           options_.advertise_interval.count());
  do_receive();
  advertise();
  schedule_advertise();
}

void LanDiscovery::stop() {
  if(!running_.exchange(false)) return;
  set_listener(nullptr);
  auto self = shared_from_this();
  asio::post(io_, [self]{
    std::error_code ec;
    self->advertise_timer_.cancel();
    self->socket_.close(ec);
  });
}

void LanDiscovery::do_receive() {
  auto self = shared_from_this();
  socket_.async_receive_from(asio::buffer(buffer_), sender_,
    [this, self](std::error_code ec, std::size_t n){
      if(ec) {
        if(ec != asio::error::operation_aborted) {
          log_info(logger_.get(), "Discovery receive error: {}", ec.message());
        }
        if(!running_) return;
      } else {
        handle_datagram(std::string(buffer_.data(), n), sender_);
      }
      if(running_) do_receive();
    });
}

void LanDiscovery::handle_datagram(const std::string& payload, const udp::endpoint& from) {
  auto advert = parse_advert(payload);
  if(!advert) {
    log_debug(logger_.get(), "Ignoring datagram from {}", from.address().to_string());
    return;
  }
  if(advert->id == options_.stable_id) return;

  DeviceAppeared ev;
  ev.host = from.address().to_string();
  ev.port = advert->port;
  ev.device.handle = make_handle(ev.host, ev.port);
  ev.device.stable_id = advert->id;
  ev.device.display_name = advert->name.empty() ? ev.device.handle : advert->name;
  ev.device.online = true;
  ev.device.last_seen = SystemClock::now();
  appeared(std::move(ev));
}

void LanDiscovery::advertise() {
  std::string advert;
  {
    std::lock_guard lg(name_mutex_);
    advert = make_advert(options_.stable_id, options_.display_name, options_.transfer_port);
  }
  auto buffer = std::make_shared<std::string>(std::move(advert));
  udp::endpoint target(asio::ip::address_v4::broadcast(), options_.discovery_port);
  auto self = shared_from_this();
  socket_.async_send_to(asio::buffer(*buffer), target,
    [this, self, buffer](std::error_code ec, std::size_t){
      if(ec && ec != asio::error::operation_aborted) {
        log_debug(logger_.get(), "Advert send failed: {}", ec.message());
      }
    });
}

void LanDiscovery::prune() {
  const auto cutoff = Clock::now() - options_.advert_ttl;
  for(const auto& handle : seen_before(cutoff)) {
    lost(handle, "advert expired");
  }
}

void LanDiscovery::schedule_advertise() {
  advertise_timer_.expires_after(options_.advertise_interval);
  auto self = shared_from_this();
  advertise_timer_.async_wait([this, self](const std::error_code& ec){
    if(ec || !running_) return;
    advertise();
    prune();
    schedule_advertise();
  });
}
