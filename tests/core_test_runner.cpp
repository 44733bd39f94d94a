#include "chunk_engine.hpp"
#include "command_line_parser.hpp"
#include "device_registry.hpp"
#include "event_bus.hpp"
#include "file_store.hpp"
#include "lan_discovery.hpp"
#include "log.hpp"
#include "pairing_coordinator.hpp"
#include "protocol.hpp"
#include "relay_hub.hpp"
#include "settings_manager.hpp"
#include "target_resolver.hpp"
#include "test_runner_utils.hpp"
#include "transfer.hpp"
#include "transfer_inbox.hpp"
#include "transfer_store.hpp"
#include "utils.hpp"

#include <asio.hpp>
#include <nlohmann/json.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <mutex>
#include <numeric>
#include <random>
#include <string>
#include <thread>
#include <unordered_set>
#include <vector>

using snapsend::test::EventRecorder;
using snapsend::test::TestCase;
using snapsend::test::TestContext;
using namespace std::chrono_literals;

namespace {

std::string patterned_bytes(std::size_t size) {
  std::string out(size, '\0');
  for(std::size_t i = 0; i < size; ++i) {
    out[i] = static_cast<char>((i * 31 + 7) % 251);
  }
  return out;
}

Transfer memory_transfer(const std::string& id, const std::string& name, std::string bytes,
                         TargetDescriptor target = TargetDescriptor::broadcast()) {
  Transfer t;
  t.meta.id = id;
  t.meta.filename = name;
  t.meta.original_name = name;
  t.meta.size = bytes.size();
  t.meta.target = target;
  t.payload = std::make_shared<MemoryPayload>(std::move(bytes));
  return t;
}

// Collects every frame a ChunkSender writes, acknowledging each at once.
std::vector<nlohmann::json> collect_frames(Transfer transfer, ChunkLimits limits, SendReport* report = nullptr) {
  std::vector<nlohmann::json> frames;
  auto sender = ChunkSender::create(
    std::move(transfer), limits,
    [&](const nlohmann::json& frame, ChunkSender::WriteCallback cb){
      frames.push_back(frame);
      cb(true);
    },
    nullptr,
    [&](const SendReport& r){ if(report) *report = r; });
  sender->start();
  return frames;
}

ChunkFrame as_frame(const nlohmann::json& j) {
  return std::get<ChunkFrame>(decode_message(j));
}

// Registry, coordinator and resolver wired the way the nodes wire them.
struct Signaling {
  EventBus bus;
  DeviceRegistry registry{&bus};
  PairingCoordinator coordinator{registry, bus};
  TargetResolver resolver{registry, coordinator};
  SubscriptionHandle sub = 0;

  explicit Signaling(bool auto_pair = true) {
    coordinator.set_auto_pair(auto_pair);
    sub = bus.subscribe([this](const Event& ev){
      if(auto* rc = std::get_if<RegistryChanged>(&ev)) coordinator.on_registry_changed(*rc);
    });
  }
  ~Signaling() { bus.unsubscribe(sub); }
};

class FakeOutbox : public Outbox {
public:
  struct Sent {
    std::string handle;
    nlohmann::json message;
  };

  void send(const std::string& handle, const nlohmann::json& message, WriteCallback on_written) override {
    bool open = false;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      sent_.push_back({handle, message});
      open = closed_.count(handle) == 0;
    }
    if(on_written) on_written(open);
  }

  void close(const std::string& handle) override {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_.insert(handle);
  }

  std::vector<nlohmann::json> to(const std::string& handle, const std::string& type) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<nlohmann::json> out;
    for(const auto& s : sent_) {
      if(s.handle == handle && s.message.value("type", "") == type) out.push_back(s.message);
    }
    return out;
  }

  std::size_t count(const std::string& handle, const std::string& type) const {
    return to(handle, type).size();
  }

  void clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    sent_.clear();
  }

private:
  mutable std::mutex mutex_;
  std::vector<Sent> sent_;
  std::unordered_set<std::string> closed_;
};

void join(RelayHub& hub, const std::string& handle, const std::string& name, const std::string& stable_id) {
  hub.on_connected(handle);
  hub.on_message(handle, encode_message(DeviceSetup{name, stable_id}));
}

nlohmann::json inline_transfer(const std::string& id, const std::string& name, const std::string& bytes,
                               TargetDescriptor target, bool clipboard = false) {
  TransferMeta meta;
  meta.id = id;
  meta.filename = name;
  meta.original_name = name;
  meta.size = bytes.size();
  meta.is_clipboard = clipboard;
  const bool text = clipboard || (name.size() > 4 && name.compare(name.size() - 4, 4, ".txt") == 0);
  meta.mime_type = text ? "text/plain" : "application/octet-stream";
  meta.target = target;
  return encode_message(make_inline_transfer(meta, bytes));
}

std::string received_content(const nlohmann::json& j) {
  auto m = std::get<FileReceived>(decode_message(j));
  return decode_inline_content(m.content, m.encoding);
}

// ---------------------------------------------------------------------------
// protocol

bool test_protocol_rejects_malformed(TestContext&) {
  auto throws = [](const nlohmann::json& j){
    try {
      decode_message(j);
    } catch(const ProtocolError&) {
      return true;
    }
    return false;
  };
  SNAPSEND_CHECK(throws(nlohmann::json::array()));
  SNAPSEND_CHECK(throws({{"data", nlohmann::json::object()}}));
  SNAPSEND_CHECK(throws({{"type", "launch-missiles"}}));
  SNAPSEND_CHECK(throws({{"type", "pair-request"}, {"data", nlohmann::json::object()}}));
  SNAPSEND_CHECK(throws({{"type", "file-chunk"}, {"data", {{"transferId", "x"}, {"index", 3},
                                                           {"totalChunks", 3}, {"totalSize", 9},
                                                           {"data", ""}}}}));
  SNAPSEND_CHECK(throws({{"type", "file-chunk"}, {"data", {{"transferId", "x"}, {"index", 0},
                                                           {"totalChunks", 1}, {"totalSize", 3},
                                                           {"data", "not*base64"}}}}));
  SNAPSEND_CHECK(throws({{"type", "peer-handshake"}, {"data", {{"id", "dev-1"}, {"port", 0}}}}));

  try {
    parse_line("{not json");
    return false;
  } catch(const ProtocolError&) {
  }
  return true;
}

bool test_protocol_wire_shapes(TestContext&) {
  auto setup = encode_message(DeviceSetup{"Laptop", "dev-1"});
  SNAPSEND_CHECK(setup["type"] == "device-setup");
  SNAPSEND_CHECK(setup["data"]["name"] == "Laptop");
  SNAPSEND_CHECK(setup["data"]["stableId"] == "dev-1");

  auto directed = nlohmann::json::parse(inline_transfer("x1", "notes.txt", "hello", TargetDescriptor::device("conn-2")).dump());
  SNAPSEND_CHECK(directed["type"] == "file-transfer");
  SNAPSEND_CHECK(directed["data"]["targetDeviceHandle"] == "conn-2");
  SNAPSEND_CHECK(directed["data"]["encoding"] == "text");
  auto decoded = std::get<FileTransferMessage>(decode_message(directed));
  SNAPSEND_CHECK(decoded.meta.target.kind == TargetDescriptor::Kind::Device);
  SNAPSEND_CHECK(decoded.meta.target.handle == "conn-2");
  SNAPSEND_CHECK(decode_inline_content(decoded.content, decoded.encoding) == "hello");

  std::string binary("\x00\x01\xff\xfe", 4);
  auto relayed = inline_transfer("x2", "blob.bin", binary, TargetDescriptor::relayed("rc-1"));
  SNAPSEND_CHECK(relayed["type"] == "relay-file-transfer");
  SNAPSEND_CHECK(relayed["data"]["targetClientId"] == "rc-1");
  SNAPSEND_CHECK(relayed["data"]["encoding"] == "base64");
  auto back = std::get<FileTransferMessage>(decode_message(relayed));
  SNAPSEND_CHECK(decode_inline_content(back.content, back.encoding) == binary);

  auto all = std::get<FileTransferMessage>(decode_message(inline_transfer("x3", "a", "b", TargetDescriptor::broadcast())));
  SNAPSEND_CHECK(all.meta.target.kind == TargetDescriptor::Kind::Broadcast);

  SNAPSEND_CHECK(message_type(PairAccepted{Pairing{}, Device{}, true}) == "auto-paired");
  SNAPSEND_CHECK(message_type(PeerHandshake{"dev-1", "n", 7420, true}) == "peer-handshake-ack");
  return true;
}

// ---------------------------------------------------------------------------
// registry and pairing

bool test_registry_reconnect_keeps_one_record(TestContext&) {
  EventBus bus;
  EventRecorder events(bus);
  DeviceRegistry registry(&bus);

  registry.register_device("dev-a", "Laptop", "conn-1");
  registry.register_device("dev-a", "Laptop", "conn-2");
  SNAPSEND_CHECK(registry.list_known().size() == 1);
  auto online = registry.list_online();
  SNAPSEND_CHECK(online.size() == 1);
  SNAPSEND_CHECK(online[0].handle == "conn-2");
  SNAPSEND_CHECK(registry.find_by_handle("conn-1").has_value());

  // The stale channel closing does not take the device offline.
  auto replaced = registry.mark_offline("conn-1");
  SNAPSEND_CHECK(replaced && replaced->online);
  SNAPSEND_CHECK(registry.online_count() == 1);
  auto changes = events.all<RegistryChanged>();
  SNAPSEND_CHECK(changes.back().change == RegistryChanged::Change::HandleReplaced);

  auto gone = registry.mark_offline("conn-2");
  SNAPSEND_CHECK(gone && !gone->online);
  SNAPSEND_CHECK(registry.online_count() == 0);
  SNAPSEND_CHECK(events.all<RegistryChanged>().back().change == RegistryChanged::Change::Offline);
  SNAPSEND_CHECK(!registry.mark_offline("conn-2"));

  SNAPSEND_CHECK(registry.rename("dev-a", "Work Laptop"));
  SNAPSEND_CHECK(registry.find_by_stable_id("dev-a")->display_name == "Work Laptop");
  SNAPSEND_CHECK(!registry.rename("dev-a", ""));
  SNAPSEND_CHECK(!registry.rename("dev-missing", "x"));
  return true;
}

bool test_registry_forgets_old_handles(TestContext&) {
  DeviceRegistry registry;
  for(int i = 1; i <= 20; ++i) {
    const auto handle = "conn-" + std::to_string(i);
    registry.register_device("dev-a", "Laptop", handle);
    registry.mark_offline(handle);
  }
  // The last handle plus the one before it.
  SNAPSEND_CHECK(registry.indexed_handles() == 2);
  SNAPSEND_CHECK(registry.find_by_handle("conn-20").has_value());
  SNAPSEND_CHECK(registry.find_by_handle("conn-19").has_value());
  SNAPSEND_CHECK(!registry.find_by_handle("conn-18").has_value());
  SNAPSEND_CHECK(!registry.find_by_handle("conn-1").has_value());

  // Aliases of an online device go when their channel closes.
  registry.register_device("dev-b", "Phone", "b-1");
  registry.register_device("dev-b", "Phone", "b-2");
  registry.register_device("dev-b", "Phone", "b-3");
  SNAPSEND_CHECK(registry.indexed_handles() == 5);
  registry.mark_offline("b-1");
  registry.mark_offline("b-2");
  SNAPSEND_CHECK(registry.indexed_handles() == 3);
  SNAPSEND_CHECK(registry.is_online_handle("b-3"));
  return true;
}

bool test_auto_pair_only_with_two_online(TestContext&) {
  Signaling s;
  EventRecorder events(s.bus);
  s.registry.register_device("dev-a", "A", "h1");
  SNAPSEND_CHECK(s.coordinator.active_pairings().empty());
  s.registry.register_device("dev-b", "B", "h2");
  auto established = events.all<PairingEstablished>();
  SNAPSEND_CHECK(established.size() == 1);
  SNAPSEND_CHECK(established[0].origin == PairOrigin::Automatic);
  SNAPSEND_CHECK(established[0].pairing.device_a == "h2");
  SNAPSEND_CHECK(established[0].pairing.device_b == "h1");

  s.registry.register_device("dev-c", "C", "h3");
  SNAPSEND_CHECK(events.count<PairingEstablished>() == 1);
  SNAPSEND_CHECK(s.coordinator.active_pairings().size() == 1);
  return true;
}

bool test_auto_pair_when_count_drops_to_two(TestContext&) {
  Signaling s;
  EventRecorder events(s.bus);
  s.registry.register_device("dev-a", "A", "h1");
  s.registry.register_device("dev-b", "B", "h2");
  s.registry.register_device("dev-c", "C", "h3");
  const auto first = s.coordinator.active_pairings();
  SNAPSEND_CHECK(first.size() == 1);
  SNAPSEND_CHECK(first[0].involves("h1") && first[0].involves("h2"));

  // B leaves; A and C are the only two left and are not paired yet.
  s.registry.mark_offline("h2");
  auto now = s.coordinator.active_pairings();
  SNAPSEND_CHECK(now.size() == 1);
  SNAPSEND_CHECK(now[0].involves("h1") && now[0].involves("h3"));
  auto established = events.all<PairingEstablished>();
  SNAPSEND_CHECK(established.size() == 2);
  SNAPSEND_CHECK(established.back().origin == PairOrigin::Automatic);

  // Back to three and down to two again, with the survivors already paired.
  s.registry.register_device("dev-b", "B", "h4");
  s.registry.mark_offline("h4");
  SNAPSEND_CHECK(events.count<PairingEstablished>() == 2);
  SNAPSEND_CHECK(s.coordinator.active_pairings().size() == 1);
  return true;
}

bool test_reconnect_moves_pairing_to_new_handle(TestContext&) {
  Signaling s;
  EventRecorder events(s.bus);
  s.registry.register_device("dev-a", "A", "h1");
  s.registry.register_device("dev-b", "B", "h2");
  SNAPSEND_CHECK(s.coordinator.active_pairings().size() == 1);

  // B comes back on h3 while h2 is still listed as an alias.
  s.registry.register_device("dev-b", "B", "h3");
  auto pairings = s.coordinator.active_pairings();
  SNAPSEND_CHECK(pairings.size() == 1);
  SNAPSEND_CHECK(pairings[0].involves("h1") && pairings[0].involves("h3"));
  SNAPSEND_CHECK(s.coordinator.active_between_devices("dev-a", "dev-b").has_value());
  SNAPSEND_CHECK(events.count<PairingEnded>() == 1);
  SNAPSEND_CHECK(events.all<PairingEnded>()[0].reason == "handle replaced");

  // The old channel closing leaves the moved pairing alone.
  s.registry.mark_offline("h2");
  pairings = s.coordinator.active_pairings();
  SNAPSEND_CHECK(pairings.size() == 1);
  SNAPSEND_CHECK(pairings[0].involves("h3"));
  SNAPSEND_CHECK(events.count<PairingEstablished>() == 2);
  SNAPSEND_CHECK(events.count<PairingEnded>() == 1);
  return true;
}

bool test_pair_is_idempotent_and_unordered(TestContext&) {
  Signaling s(false);
  EventRecorder events(s.bus);
  s.registry.register_device("dev-a", "A", "h1");
  s.registry.register_device("dev-b", "B", "h2");

  auto first = s.coordinator.pair("h1", "h2");
  SNAPSEND_CHECK(first.status == PairOutcome::Status::Created);
  auto again = s.coordinator.pair("h1", "h2");
  SNAPSEND_CHECK(again.status == PairOutcome::Status::AlreadyActive);
  SNAPSEND_CHECK(again.pairing->id == first.pairing->id);
  auto reversed = s.coordinator.pair("h2", "h1");
  SNAPSEND_CHECK(reversed.status == PairOutcome::Status::AlreadyActive);
  SNAPSEND_CHECK(reversed.pairing->id == first.pairing->id);
  SNAPSEND_CHECK(events.count<PairingEstablished>() == 1);

  SNAPSEND_CHECK(!s.coordinator.pair("h1", "h1").ok());
  SNAPSEND_CHECK(!s.coordinator.pair("h1", "h9").ok());

  SNAPSEND_CHECK(!s.coordinator.terminate("pair-unknown", "h1"));
  auto ended = s.coordinator.terminate(first.pairing->id, "h1");
  SNAPSEND_CHECK(ended && ended->status == PairingStatus::Terminated);
  SNAPSEND_CHECK(!s.coordinator.terminate(first.pairing->id, "h1"));
  SNAPSEND_CHECK(events.count<PairingEnded>() == 1);
  return true;
}

bool test_device_lost_ends_its_pairings(TestContext&) {
  Signaling s(false);
  EventRecorder events(s.bus);
  s.registry.register_device("dev-a", "A", "h1");
  s.registry.register_device("dev-b", "B", "h2");
  s.registry.register_device("dev-c", "C", "h3");
  SNAPSEND_CHECK(s.coordinator.pair("h1", "h2").ok());
  SNAPSEND_CHECK(s.coordinator.pair("h1", "h3").ok());

  s.registry.mark_offline("h1");
  SNAPSEND_CHECK(s.coordinator.active_pairings().empty());
  auto ended = events.all<PairingEnded>();
  SNAPSEND_CHECK(ended.size() == 2);
  for(const auto& e : ended) {
    SNAPSEND_CHECK(e.reason == "device lost");
    SNAPSEND_CHECK(e.terminated_by == "h1");
  }
  return true;
}

// ---------------------------------------------------------------------------
// routing and the pending queue

bool test_resolver_outcomes(TestContext&) {
  Signaling s(false);
  s.registry.register_device("dev-a", "A", "h1");
  s.registry.register_device("dev-b", "B", "h2");
  s.registry.register_device("dev-c", "C", "h3");

  SNAPSEND_CHECK(s.resolver.route("h1", TargetDescriptor::local()).outcome == Resolution::Outcome::SaveLocal);
  // Broadcast with nobody paired falls back to a local save.
  SNAPSEND_CHECK(s.resolver.route("h1", TargetDescriptor::broadcast()).outcome == Resolution::Outcome::SaveLocal);

  auto queued = s.resolver.resolve("h1", memory_transfer("x1", "one.txt", "1", TargetDescriptor::device("h2")));
  SNAPSEND_CHECK(queued.outcome == Resolution::Outcome::Queue);
  SNAPSEND_CHECK(queued.queue_key == "dev-b");
  SNAPSEND_CHECK(s.resolver.pending_count() == 1);
  SNAPSEND_CHECK(s.resolver.pending()[0].transfer.meta.direction == TransferDirection::Queued);

  auto pairing = s.coordinator.pair("h1", "h2");
  SNAPSEND_CHECK(pairing.ok());
  auto now = s.resolver.route("h1", TargetDescriptor::device("h2"));
  SNAPSEND_CHECK(now.outcome == Resolution::Outcome::DeliverNow);
  SNAPSEND_CHECK(now.routes.size() == 1 && now.routes[0].recipient == "h2");
  SNAPSEND_CHECK(now.routes[0].pairing_id == pairing.pairing->id);

  auto all = s.resolver.route("h1", TargetDescriptor::broadcast());
  SNAPSEND_CHECK(all.outcome == Resolution::Outcome::DeliverNow);
  SNAPSEND_CHECK(all.routes.size() == 1);

  s.resolver.attach_relayed_client("rc-1", "h2");
  auto relayed = s.resolver.route("h1", TargetDescriptor::relayed("rc-1"));
  SNAPSEND_CHECK(relayed.outcome == Resolution::Outcome::DeliverNow);
  SNAPSEND_CHECK(relayed.routes[0].via == "h2");
  SNAPSEND_CHECK(relayed.routes[0].channel() == "h2");
  auto unreachable = s.resolver.route("h3", TargetDescriptor::relayed("rc-1"));
  SNAPSEND_CHECK(unreachable.outcome == Resolution::Outcome::Queue);
  SNAPSEND_CHECK(unreachable.queue_key == "relay:rc-1");

  SNAPSEND_CHECK(s.resolver.detach_host("h2") == std::vector<std::string>{"rc-1"});
  SNAPSEND_CHECK(!s.resolver.relay_host_for("rc-1"));
  return true;
}

bool test_queue_flushes_in_order_on_pairing(TestContext&) {
  Signaling s(false);
  s.registry.register_device("dev-a", "A", "h1");
  s.registry.register_device("dev-b", "B", "h2");
  s.registry.register_device("dev-c", "C", "h3");

  s.resolver.resolve("h1", memory_transfer("x1", "first.txt", "1", TargetDescriptor::device("h2")));
  s.resolver.resolve("h3", memory_transfer("x2", "other.txt", "2", TargetDescriptor::device("h2")));
  s.resolver.resolve("h1", memory_transfer("x3", "second.txt", "3", TargetDescriptor::device("h2")));
  SNAPSEND_CHECK(s.resolver.pending_count() == 3);

  auto pairing = s.coordinator.pair("h2", "h1");
  auto flushed = s.resolver.take_ready(*pairing.pairing);
  SNAPSEND_CHECK(flushed.size() == 2);
  SNAPSEND_CHECK(flushed[0].pending.transfer.meta.id == "x1");
  SNAPSEND_CHECK(flushed[1].pending.transfer.meta.id == "x3");
  SNAPSEND_CHECK(flushed[0].pending.sequence < flushed[1].pending.sequence);
  SNAPSEND_CHECK(flushed[0].route.recipient == "h2");
  SNAPSEND_CHECK(s.resolver.pending_count() == 1);
  SNAPSEND_CHECK(s.resolver.take_ready(*pairing.pairing).empty());

  // The target reconnecting under a new handle keeps its queue entry.
  s.registry.register_device("dev-b", "B", "h4");
  s.registry.mark_offline("h2");
  auto later = s.coordinator.pair("h3", "h4");
  auto rest = s.resolver.take_ready(*later.pairing);
  SNAPSEND_CHECK(rest.size() == 1);
  SNAPSEND_CHECK(rest[0].pending.transfer.meta.id == "x2");
  SNAPSEND_CHECK(rest[0].route.recipient == "h4");
  return true;
}

// ---------------------------------------------------------------------------
// chunk engine

bool test_chunk_two_hundred_frames_any_order(TestContext&) {
  const std::string payload = patterned_bytes(200 * 1024 - 10);
  SendReport report;
  auto frames = collect_frames(memory_transfer("x-big", "big.bin", payload), ChunkLimits{1024, 0}, &report);
  SNAPSEND_CHECK(report.completed);
  SNAPSEND_CHECK(report.frames_sent == 200);
  SNAPSEND_CHECK(report.bytes_sent == payload.size());
  SNAPSEND_CHECK(frames.size() == 200);
  SNAPSEND_CHECK(frames[0]["data"].contains("meta"));
  SNAPSEND_CHECK(!frames[1]["data"].contains("meta"));

  std::vector<std::size_t> order(frames.size());
  std::iota(order.begin(), order.end(), 0);
  std::mt19937 rng(20240611);
  std::shuffle(order.begin(), order.end(), rng);

  ProgressTracker progress;
  ChunkAssembler assembler(&progress, 60s);
  std::optional<AssembledPayload> done;
  std::size_t accepted = 0;
  for(auto idx : order) {
    auto result = assembler.accept("peer", as_frame(frames[idx]));
    ++accepted;
    if(result) {
      SNAPSEND_CHECK(accepted == frames.size());
      done = std::move(result);
    }
  }
  SNAPSEND_CHECK(done.has_value());
  SNAPSEND_CHECK(done->bytes == payload);
  SNAPSEND_CHECK(done->meta && done->meta->filename == "big.bin");
  SNAPSEND_CHECK(assembler.in_flight() == 0);
  SNAPSEND_CHECK(progress.active() == 0);
  return true;
}

bool test_chunk_duplicates_and_conflicts(TestContext&) {
  const std::string payload = patterned_bytes(2500);
  auto frames = collect_frames(memory_transfer("x-dup", "dup.bin", payload), ChunkLimits{1024, 0});
  SNAPSEND_CHECK(frames.size() == 3);

  ChunkAssembler assembler(nullptr, 60s);
  SNAPSEND_CHECK(!assembler.accept("peer", as_frame(frames[0])));
  SNAPSEND_CHECK(!assembler.accept("peer", as_frame(frames[0])));
  SNAPSEND_CHECK(!assembler.accept("peer", as_frame(frames[2])));

  auto wrong_source = as_frame(frames[1]);
  try {
    assembler.accept("intruder", wrong_source);
    return false;
  } catch(const ProtocolError&) {
  }
  auto wrong_total = as_frame(frames[1]);
  wrong_total.total_size += 1;
  try {
    assembler.accept("peer", wrong_total);
    return false;
  } catch(const ProtocolError&) {
  }

  auto done = assembler.accept("peer", as_frame(frames[1]));
  SNAPSEND_CHECK(done && done->bytes == payload);

  // Declared size that the slices do not add up to.
  ChunkFrame lying;
  lying.transfer_id = "x-lie";
  lying.total_chunks = 1;
  lying.total_size = 10;
  lying.data = "abc";
  try {
    assembler.accept("peer", lying);
    return false;
  } catch(const ProtocolError&) {
  }
  SNAPSEND_CHECK(!assembler.has("x-lie"));
  return true;
}

bool test_chunk_assembly_times_out(TestContext&) {
  auto frames = collect_frames(memory_transfer("x-slow", "slow.bin", patterned_bytes(3000)), ChunkLimits{1024, 0});
  ChunkAssembler assembler(nullptr, 1000ms);
  auto t0 = ChunkAssembler::Clock::now();
  assembler.accept("peer", as_frame(frames[0]), t0);
  auto other = collect_frames(memory_transfer("x-other", "o.bin", patterned_bytes(3000)), ChunkLimits{1024, 0});
  assembler.accept("other", as_frame(other[0]), t0 + 900ms);
  SNAPSEND_CHECK(assembler.expire(t0 + 500ms).empty());
  auto expired = assembler.expire(t0 + 1200ms);
  SNAPSEND_CHECK(expired == std::vector<std::string>{"x-slow"});
  SNAPSEND_CHECK(!assembler.has("x-slow"));
  SNAPSEND_CHECK(assembler.abort_from("other") == std::vector<std::string>{"x-other"});
  SNAPSEND_CHECK(assembler.in_flight() == 0);
  return true;
}

bool test_chunk_sender_cancel_between_frames(TestContext&) {
  std::vector<ChunkSender::WriteCallback> pending;
  std::size_t written = 0;
  SendReport report;
  bool finished = false;
  auto sender = ChunkSender::create(
    memory_transfer("x-cancel", "c.bin", patterned_bytes(4096)), ChunkLimits{1024, 0},
    [&](const nlohmann::json&, ChunkSender::WriteCallback cb){
      ++written;
      pending.push_back(std::move(cb));
    },
    nullptr,
    [&](const SendReport& r){ report = r; finished = true; });
  sender->start();
  SNAPSEND_CHECK(written == 1);
  sender->cancel("pairing ended");
  SNAPSEND_CHECK(!finished);
  pending.back()(true);
  SNAPSEND_CHECK(finished);
  SNAPSEND_CHECK(!report.completed);
  SNAPSEND_CHECK(report.error == "pairing ended");
  SNAPSEND_CHECK(report.frames_sent == 1);
  SNAPSEND_CHECK(written == 1);
  return true;
}

// Writes complete on an io thread while start() and cancel() run here.
bool test_chunk_sender_across_threads(TestContext&) {
  struct Round {
    std::atomic<bool> done{false};
    SendReport report;
  };
  asio::io_context io;
  auto work = asio::make_work_guard(io);
  std::thread io_thread([&]{ io.run(); });

  int completed = 0;
  int cancelled = 0;
  int stalled = 0;
  for(int i = 0; i < 300; ++i) {
    auto round = std::make_shared<Round>();
    auto sender = ChunkSender::create(
      memory_transfer("x-thread-" + std::to_string(i), "t.bin", patterned_bytes(8192)), ChunkLimits{512, 0},
      [&io](const nlohmann::json&, ChunkSender::WriteCallback cb){
        asio::post(io, [cb]{ cb(true); });
      },
      nullptr,
      [round](const SendReport& r){
        round->report = r;
        round->done = true;
      });
    sender->start();
    if(i % 3 == 0) sender->cancel("pairing ended");
    if(!snapsend::test::wait_for_condition([&]{ return round->done.load(); }, 2s, 1ms)) {
      ++stalled;
      continue;
    }
    if(round->report.completed && round->report.frames_sent == 16) ++completed;
    if(!round->report.completed && round->report.error == "pairing ended") ++cancelled;
  }
  work.reset();
  io_thread.join();

  SNAPSEND_CHECK(stalled == 0);
  SNAPSEND_CHECK(completed + cancelled == 300);
  SNAPSEND_CHECK(completed >= 200);
  return true;
}

bool test_lan_advert_rejects_mistyped_fields(TestContext&) {
  auto good = LanDiscovery::parse_advert(LanDiscovery::make_advert("dev-a", "Laptop", 7420));
  SNAPSEND_CHECK(good.has_value());
  SNAPSEND_CHECK(good->id == "dev-a");
  SNAPSEND_CHECK(good->name == "Laptop");
  SNAPSEND_CHECK(good->port == 7420);

  const std::vector<std::string> rejected = {
    "",
    "not json",
    "[1,2,3]",
    R"({"service":1})",
    R"({"service":null,"id":"dev-a","port":7420})",
    R"({"service":"other","id":"dev-a","port":7420})",
    R"({"service":"snapsend","id":7,"port":7420})",
    R"({"service":"snapsend","id":"","port":7420})",
    R"({"service":"snapsend","id":{"x":1},"port":7420})",
    R"({"service":"snapsend","id":"dev-a"})",
    R"({"service":"snapsend","id":"dev-a","port":"7420"})",
    R"({"service":"snapsend","id":"dev-a","port":-1})",
    R"({"service":"snapsend","id":"dev-a","port":0})",
    R"({"service":"snapsend","id":"dev-a","port":70000})",
    R"({"service":"snapsend","id":"dev-a","port":7420.5})",
  };
  for(const auto& payload : rejected) {
    SNAPSEND_CHECK(!LanDiscovery::parse_advert(payload).has_value());
  }

  // A name of the wrong type is dropped, the advert still counts.
  auto unnamed = LanDiscovery::parse_advert(R"({"service":"snapsend","id":"dev-b","name":[1],"port":9000})");
  SNAPSEND_CHECK(unnamed && unnamed->name.empty() && unnamed->port == 9000);
  return true;
}

bool test_progress_is_monotonic(TestContext&) {
  EventBus bus;
  EventRecorder events(bus);
  ProgressTracker progress(&bus);
  progress.begin("x", 200, ProgressDirection::Receive);
  SNAPSEND_CHECK(progress.update("x", 50) == 25);
  SNAPSEND_CHECK(progress.update("x", 10) == 25);
  SNAPSEND_CHECK(progress.get("x")->bytes_delivered == 50);
  SNAPSEND_CHECK(progress.update("x", 200) == 100);
  SNAPSEND_CHECK(!progress.get("x"));
  auto seen = events.all<ChunkProgressed>();
  SNAPSEND_CHECK(seen.size() == 3);
  for(std::size_t i = 1; i < seen.size(); ++i) {
    SNAPSEND_CHECK(seen[i].percent >= seen[i - 1].percent);
  }
  SNAPSEND_CHECK(ProgressTracker::percent(0, 0) == 100);
  SNAPSEND_CHECK(chunk_count(0, 1024) == 1);
  SNAPSEND_CHECK(chunk_count(1025, 1024) == 2);
  SNAPSEND_CHECK(!needs_chunking(kChunkThreshold, ChunkLimits{}));
  SNAPSEND_CHECK(needs_chunking(kChunkThreshold + 1, ChunkLimits{}));
  return true;
}

// ---------------------------------------------------------------------------
// storage

bool test_file_store_names(TestContext&) {
  auto root = snapsend::test::prepare_workspace("file_store");
  FileStore files(root / "downloads");
  SNAPSEND_CHECK(FileStore::sanitize_name("../../etc/passwd") == "passwd");
  SNAPSEND_CHECK(FileStore::sanitize_name("..") == "download");
  SNAPSEND_CHECK(FileStore::sanitize_name("a:b") == "a_b");

  auto first = files.write_bytes("report.pdf", "one");
  auto second = files.write_bytes("report.pdf", "two");
  SNAPSEND_CHECK(first && second);
  SNAPSEND_CHECK(first->filename() == "report.pdf");
  SNAPSEND_CHECK(second->filename() == "report (1).pdf");
  SNAPSEND_CHECK(snapsend::test::read_file(*second) == "two");

  // Longer than any filesystem allows: reported, not thrown.
  SNAPSEND_CHECK(!files.write_bytes(std::string(400, 'n') + ".txt", "x"));

  auto payload = files.read_bytes(*first);
  SNAPSEND_CHECK(payload && payload->read_all() == "one");
  SNAPSEND_CHECK(!files.read_bytes(root / "missing.bin"));
  std::error_code ec;
  std::filesystem::remove_all(root, ec);
  return true;
}

bool test_transfer_store_persists(TestContext&) {
  auto root = snapsend::test::prepare_workspace("transfer_store");
  auto path = root / ".config" / "transfers.json";

  TransferMeta clip;
  clip.id = "x-clip";
  clip.filename = "clipboard.txt";
  clip.is_clipboard = true;
  clip.size = 5;
  std::string text = "hello";
  auto record = make_transfer_record(clip, &text, {}, kChunkThreshold, kChunkSize);
  SNAPSEND_CHECK(record.inline_content && *record.inline_content == "hello");
  SNAPSEND_CHECK(record.sha256 == sha256_hex("hello"));

  TransferMeta big;
  big.id = "x-big";
  big.filename = "movie.mkv";
  big.size = kChunkThreshold + 1;
  auto big_record = make_transfer_record(big, nullptr, root / "movie.mkv", kChunkThreshold, kChunkSize);
  SNAPSEND_CHECK(big_record.chunked);
  SNAPSEND_CHECK(big_record.total_chunks == chunk_count(big.size, kChunkSize));
  SNAPSEND_CHECK(!big_record.inline_content);

  {
    JsonTransferStore store(path);
    auto queued = big_record;
    queued.meta.direction = TransferDirection::Queued;
    store.record_sent_transfer(queued);
    store.record_received_transfer(record);
    store.record_sent_transfer(big_record);
    auto list = store.list_transfers();
    SNAPSEND_CHECK(list.size() == 2);
  }

  JsonTransferStore reloaded(path);
  auto list = reloaded.list_transfers();
  SNAPSEND_CHECK(list.size() == 2);
  auto clip_it = std::find_if(list.begin(), list.end(), [](const TransferRecord& r){ return r.meta.id == "x-clip"; });
  SNAPSEND_CHECK(clip_it != list.end());
  SNAPSEND_CHECK(clip_it->meta.direction == TransferDirection::Received);
  SNAPSEND_CHECK(clip_it->inline_content && *clip_it->inline_content == "hello");
  SNAPSEND_CHECK(reloaded.delete_transfer("x-big"));
  SNAPSEND_CHECK(!reloaded.delete_transfer("x-big"));
  SNAPSEND_CHECK(JsonTransferStore(path).list_transfers().size() == 1);
  std::error_code ec;
  std::filesystem::remove_all(root, ec);
  return true;
}

bool test_inbox_receives_inline_and_chunked(TestContext&) {
  auto root = snapsend::test::prepare_workspace("inbox");
  EventBus bus;
  EventRecorder events(bus);
  FileStore files(root / "downloads");
  auto store = std::make_shared<JsonTransferStore>(root / ".config" / "transfers.json");
  TransferInbox inbox(bus, files, store, ChunkLimits{1024, 4096}, 60s);

  TransferMeta meta;
  meta.id = "x-inline";
  meta.filename = "note.txt";
  meta.from_device = "Phone";
  inbox.accept_inline(meta, "plain text");
  auto received = events.all<TransferReceived>();
  SNAPSEND_CHECK(received.size() == 1);
  SNAPSEND_CHECK(snapsend::test::read_file(received[0].stored_path) == "plain text");
  SNAPSEND_CHECK(received[0].meta.direction == TransferDirection::Received);

  TransferMeta clip;
  clip.id = "x-clip";
  clip.is_clipboard = true;
  clip.filename = "clipboard.txt";
  inbox.accept_inline(clip, "copied");
  received = events.all<TransferReceived>();
  SNAPSEND_CHECK(received.size() == 2);
  SNAPSEND_CHECK(received[1].text == "copied");
  SNAPSEND_CHECK(received[1].stored_path.empty());

  const auto payload = patterned_bytes(5000);
  auto frames = collect_frames(memory_transfer("x-chunked", "photo.raw", payload), ChunkLimits{1024, 0});
  std::optional<TransferMeta> done;
  for(auto it = frames.rbegin(); it != frames.rend(); ++it) {
    SNAPSEND_CHECK(!done);
    done = inbox.accept_chunk("link-1", as_frame(*it));
  }
  SNAPSEND_CHECK(done && done->filename == "photo.raw");
  received = events.all<TransferReceived>();
  SNAPSEND_CHECK(received.size() == 3);
  SNAPSEND_CHECK(snapsend::test::read_file(received[2].stored_path) == payload);
  SNAPSEND_CHECK(store->list_transfers().size() == 3);

  // A stream cut off mid-way never reaches the received set.
  inbox.accept_chunk("link-1", as_frame(frames[0]));
  inbox.abort_from("link-1", "link closed");
  auto failed = events.all<TransferFailed>();
  SNAPSEND_CHECK(failed.size() == 1);
  SNAPSEND_CHECK(failed[0].kind == ErrorKind::ChannelLost);
  SNAPSEND_CHECK(events.count<TransferReceived>() == 3);
  std::error_code ec;
  std::filesystem::remove_all(root, ec);
  return true;
}

// ---------------------------------------------------------------------------
// settings

bool test_settings_and_command_line(TestContext&) {
  SettingsManager settings;
  std::string error;
  SNAPSEND_CHECK(settings.get<std::string>("mode") == "direct");
  SNAPSEND_CHECK(settings.set_from_string("port", "9000", error));
  SNAPSEND_CHECK(settings.get<int>("listen_port") == 9000);
  SNAPSEND_CHECK(!settings.set_from_string("listen_port", "70000", error));
  SNAPSEND_CHECK(!settings.set_from_string("mode", "mesh", error));
  SNAPSEND_CHECK(!settings.set_from_string("no_such_key", "1", error));

  CommandLineParser parser("snapsend");
  const char* argv[] = {"snapsend", "relay-client", "Desk", "--relay=10.0.0.5:7000", "-v", "--auto_pair", "false"};
  SNAPSEND_CHECK(parser.parse(7, argv, settings, error));
  SNAPSEND_CHECK(settings.get<std::string>("mode") == "relay-client");
  SNAPSEND_CHECK(settings.get<std::string>("device_name") == "Desk");
  SNAPSEND_CHECK(settings.get<std::string>("relay_server") == "10.0.0.5:7000");
  SNAPSEND_CHECK(settings.get<bool>("verbose"));
  SNAPSEND_CHECK(!settings.get<bool>("auto_pair"));

  const char* bad[] = {"snapsend", "--listen_port"};
  SNAPSEND_CHECK(!parser.parse(2, bad, settings, error));
  SNAPSEND_CHECK(!error.empty());

  auto root = snapsend::test::prepare_workspace("settings");
  settings.set_settings_path(root / ".config" / "settings.json");
  SNAPSEND_CHECK(settings.save());
  SettingsManager reloaded;
  reloaded.set_settings_path(settings.settings_path());
  SNAPSEND_CHECK(reloaded.load());
  SNAPSEND_CHECK(reloaded.get<std::string>("relay_server") == "10.0.0.5:7000");
  SNAPSEND_CHECK(!reloaded.get_json().contains("help"));
  std::error_code ec;
  std::filesystem::remove_all(root, ec);

  auto hp = parse_host_port("example.org:7420");
  SNAPSEND_CHECK(hp && hp->host == "example.org" && hp->port == 7420);
  SNAPSEND_CHECK(!parse_host_port("example.org"));
  SNAPSEND_CHECK(!parse_host_port("example.org:99999"));
  return true;
}

// ---------------------------------------------------------------------------
// relay hub

bool test_hub_setup_and_auto_pair(TestContext& ctx) {
  FakeOutbox out;
  auto logger = std::make_shared<Logger>("hub");
  ctx.logs.attach(logger);
  RelayHub hub(out, RelayHub::Options{}, logger);

  hub.on_connected("conn-1");
  SNAPSEND_CHECK(out.count("conn-1", "setup-required") == 1);
  hub.on_message("conn-1", encode_message(DeviceSetup{"Laptop", "dev-a"}));
  SNAPSEND_CHECK(out.count("conn-1", "setup-complete") == 1);

  join(hub, "conn-2", "Phone", "dev-b");
  SNAPSEND_CHECK(out.count("conn-1", "device-connected") == 1);
  SNAPSEND_CHECK(out.count("conn-1", "auto-paired") == 1);
  SNAPSEND_CHECK(out.count("conn-2", "auto-paired") == 1);
  auto paired = std::get<PairAccepted>(decode_message(out.to("conn-1", "auto-paired")[0]));
  SNAPSEND_CHECK(paired.partner.handle == "conn-2");
  SNAPSEND_CHECK(paired.partner.display_name == "Phone");
  SNAPSEND_CHECK(hub.pairings().size() == 1);

  // A third device does not trigger another automatic pairing.
  join(hub, "conn-3", "Tablet", "dev-c");
  SNAPSEND_CHECK(hub.pairings().size() == 1);
  SNAPSEND_CHECK(out.count("conn-3", "auto-paired") == 0);
  auto complete = std::get<DeviceListMessage>(decode_message(out.to("conn-3", "setup-complete")[0]));
  SNAPSEND_CHECK(complete.online.size() == 3);

  // Blank names get a generated one.
  join(hub, "conn-4", "   ", "dev-d");
  auto named = std::get<DeviceListMessage>(decode_message(out.to("conn-4", "setup-complete")[0]));
  SNAPSEND_CHECK(named.device.display_name == "Device conn-4");
  SNAPSEND_CHECK(hub.stats().online_devices == 4);
  return true;
}

bool test_hub_broadcast_and_clipboard(TestContext&) {
  FakeOutbox out;
  RelayHub hub(out, RelayHub::Options{});
  EventRecorder events(hub.bus());
  join(hub, "conn-1", "Laptop", "dev-a");
  join(hub, "conn-2", "Phone", "dev-b");

  hub.on_message("conn-1", inline_transfer("x1", "hello.txt", "hello", TargetDescriptor::broadcast()));
  auto got = out.to("conn-2", "file-received");
  SNAPSEND_CHECK(got.size() == 1);
  SNAPSEND_CHECK(received_content(got[0]) == "hello");
  SNAPSEND_CHECK(got[0]["data"]["fromDevice"] == "Laptop");
  auto confirm = out.to("conn-1", "file-sent-confirmation");
  SNAPSEND_CHECK(confirm.size() == 1);
  SNAPSEND_CHECK(confirm[0]["data"]["recipientCount"] == 1);
  SNAPSEND_CHECK(events.count<TransferSent>() == 1);

  hub.on_message("conn-2", inline_transfer("x2", "clipboard.txt", "copied text", TargetDescriptor::broadcast(), true));
  auto clip = out.to("conn-1", "clipboard-sync");
  SNAPSEND_CHECK(clip.size() == 1);
  SNAPSEND_CHECK(clip[0]["data"]["content"] == "copied text");
  SNAPSEND_CHECK(clip[0]["data"]["fromDevice"] == "Phone");
  SNAPSEND_CHECK(out.count("conn-2", "file-received") == 1);
  return true;
}

bool test_hub_broadcast_without_partner_saves_local(TestContext&) {
  FakeOutbox out;
  RelayHub hub(out, RelayHub::Options{});
  EventRecorder events(hub.bus());
  join(hub, "conn-1", "Laptop", "dev-a");
  hub.on_message("conn-1", inline_transfer("x1", "alone.txt", "solo", TargetDescriptor::broadcast()));
  SNAPSEND_CHECK(out.count("conn-1", "file-saved") == 1);
  SNAPSEND_CHECK(out.count("conn-1", "file-sent-confirmation") == 0);
  SNAPSEND_CHECK(events.count<TransferSavedLocal>() == 1);
  SNAPSEND_CHECK(hub.pending().empty());
  return true;
}

bool test_hub_queue_flushes_on_pair_request(TestContext&) {
  FakeOutbox out;
  RelayHub hub(out, RelayHub::Options{});
  join(hub, "conn-1", "Laptop", "dev-a");
  join(hub, "conn-2", "Phone", "dev-b");
  join(hub, "conn-3", "Tablet", "dev-c");

  hub.on_message("conn-1", inline_transfer("x1", "first.txt", "one", TargetDescriptor::device("conn-3")));
  hub.on_message("conn-1", inline_transfer("x2", "second.txt", "two", TargetDescriptor::device("conn-3")));
  SNAPSEND_CHECK(out.count("conn-1", "file-queued") == 2);
  SNAPSEND_CHECK(hub.pending().size() == 2);
  SNAPSEND_CHECK(out.count("conn-3", "file-received") == 0);

  hub.on_message("conn-1", encode_message(PairRequest{"conn-3"}));
  SNAPSEND_CHECK(out.count("conn-1", "pair-accepted") == 1);
  SNAPSEND_CHECK(out.count("conn-3", "pair-accepted") == 1);
  auto delivered = out.to("conn-3", "file-received");
  SNAPSEND_CHECK(delivered.size() == 2);
  SNAPSEND_CHECK(received_content(delivered[0]) == "one");
  SNAPSEND_CHECK(received_content(delivered[1]) == "two");
  SNAPSEND_CHECK(out.count("conn-1", "file-sent-confirmation") == 2);
  SNAPSEND_CHECK(hub.pending().empty());

  // Asking again answers with the existing pairing.
  const auto pairings = hub.pairings().size();
  hub.on_message("conn-3", encode_message(PairRequest{"conn-1"}));
  SNAPSEND_CHECK(hub.pairings().size() == pairings);
  auto again = out.to("conn-3", "pair-accepted");
  SNAPSEND_CHECK(again.size() == 2);
  SNAPSEND_CHECK(again[0]["data"]["pairing"]["id"] == again[1]["data"]["pairing"]["id"]);
  SNAPSEND_CHECK(out.count("conn-1", "pair-accepted") == 1);

  hub.on_message("conn-1", encode_message(PairRequest{"conn-9"}));
  SNAPSEND_CHECK(out.count("conn-1", "error") == 1);
  return true;
}

bool test_hub_disconnect_and_terminate(TestContext&) {
  FakeOutbox out;
  RelayHub hub(out, RelayHub::Options{});
  EventRecorder events(hub.bus());
  join(hub, "conn-1", "Laptop", "dev-a");
  join(hub, "conn-2", "Phone", "dev-b");
  SNAPSEND_CHECK(hub.pairings().size() == 1);
  const auto id = hub.pairings()[0].id;

  hub.on_message("conn-2", encode_message(TerminateConnection{id}));
  SNAPSEND_CHECK(hub.pairings().empty());
  SNAPSEND_CHECK(out.count("conn-1", "connection-terminated") == 1);
  SNAPSEND_CHECK(out.count("conn-2", "connection-terminated") == 1);

  hub.on_message("conn-1", encode_message(TerminateConnection{id}));
  SNAPSEND_CHECK(out.count("conn-1", "error") == 1);

  hub.on_message("conn-1", encode_message(PairRequest{"conn-2"}));
  SNAPSEND_CHECK(hub.pairings().size() == 1);
  hub.on_disconnected("conn-2");
  SNAPSEND_CHECK(hub.pairings().empty());
  SNAPSEND_CHECK(out.count("conn-1", "device-disconnected") == 1);
  SNAPSEND_CHECK(out.count("conn-1", "connection-terminated") == 2);
  SNAPSEND_CHECK(hub.online_devices().size() == 1);
  SNAPSEND_CHECK(events.count<PairingEnded>() == 2);
  return true;
}

bool test_hub_reconnect_keeps_identity(TestContext&) {
  FakeOutbox out;
  RelayHub hub(out, RelayHub::Options{});
  join(hub, "conn-1", "Laptop", "dev-a");
  join(hub, "conn-2", "Phone", "dev-b");

  // Phone comes back on a new socket before the old one times out.
  join(hub, "conn-3", "Phone", "dev-b");
  SNAPSEND_CHECK(hub.online_devices().size() == 2);
  hub.on_disconnected("conn-2");
  auto online = hub.online_devices();
  SNAPSEND_CHECK(online.size() == 2);
  SNAPSEND_CHECK(std::any_of(online.begin(), online.end(), [](const Device& d){ return d.handle == "conn-3"; }));
  auto pairings = hub.pairings();
  SNAPSEND_CHECK(pairings.size() == 1);
  SNAPSEND_CHECK(pairings[0].involves("conn-1") && pairings[0].involves("conn-3"));
  return true;
}

bool test_hub_protocol_errors_keep_connection(TestContext&) {
  FakeOutbox out;
  RelayHub hub(out, RelayHub::Options{});
  EventRecorder events(hub.bus());
  hub.on_connected("conn-1");

  hub.on_message("conn-1", inline_transfer("x1", "early.txt", "x", TargetDescriptor::broadcast()));
  SNAPSEND_CHECK(out.count("conn-1", "error") == 1);
  hub.on_message("conn-1", nlohmann::json{{"type", "bogus"}});
  SNAPSEND_CHECK(out.count("conn-1", "error") == 2);
  hub.on_message("conn-1", encode_message(PeerHandshake{"dev-x", "x", 7420, false}));
  SNAPSEND_CHECK(out.count("conn-1", "error") == 3);
  SNAPSEND_CHECK(events.count<PeerError>() == 3);

  hub.on_message("conn-1", encode_message(DeviceSetup{"Late", "dev-late"}));
  SNAPSEND_CHECK(out.count("conn-1", "setup-complete") == 1);
  SNAPSEND_CHECK(hub.stats().connections == 1);
  return true;
}

bool test_hub_rename_broadcasts(TestContext&) {
  FakeOutbox out;
  RelayHub hub(out, RelayHub::Options{});
  join(hub, "conn-1", "Laptop", "dev-a");
  join(hub, "conn-2", "Phone", "dev-b");
  hub.on_message("conn-1", encode_message(DeviceNameUpdate{"Work Laptop"}));
  auto updates = out.to("conn-2", "name-updated");
  SNAPSEND_CHECK(updates.size() == 1);
  SNAPSEND_CHECK(updates[0]["data"]["device"]["name"] == "Work Laptop");
  hub.on_message("conn-1", encode_message(DeviceNameUpdate{"  "}));
  SNAPSEND_CHECK(out.count("conn-1", "error") == 1);
  return true;
}

bool test_hub_forwards_chunk_streams(TestContext&) {
  FakeOutbox out;
  RelayHub hub(out, RelayHub::Options{});
  EventRecorder events(hub.bus());
  join(hub, "conn-1", "Laptop", "dev-a");
  join(hub, "conn-2", "Phone", "dev-b");

  const auto payload = patterned_bytes(3000);
  auto frames = collect_frames(memory_transfer("x-stream", "stream.bin", payload), ChunkLimits{1024, 0});
  for(const auto& f : frames) hub.on_message("conn-1", f);

  auto forwarded = out.to("conn-2", "file-chunk");
  SNAPSEND_CHECK(forwarded.size() == 3);
  SNAPSEND_CHECK(!forwarded[0]["data"].contains("relayTo"));
  SNAPSEND_CHECK(forwarded[0]["data"]["meta"]["fromDevice"] == "Laptop");
  ChunkAssembler assembler(nullptr, 60s);
  std::optional<AssembledPayload> done;
  for(const auto& f : forwarded) done = assembler.accept("relay", as_frame(f));
  SNAPSEND_CHECK(done && done->bytes == payload);
  SNAPSEND_CHECK(out.count("conn-1", "file-sent-confirmation") == 1);
  SNAPSEND_CHECK(events.count<TransferSent>() == 1);
  SNAPSEND_CHECK(hub.stats().streams_in_flight == 0);
  return true;
}

bool test_hub_aborts_stream_when_sender_lost(TestContext&) {
  FakeOutbox out;
  RelayHub hub(out, RelayHub::Options{});
  EventRecorder events(hub.bus());
  join(hub, "conn-1", "Laptop", "dev-a");
  join(hub, "conn-2", "Phone", "dev-b");

  auto frames = collect_frames(memory_transfer("x-cut", "cut.bin", patterned_bytes(3000)), ChunkLimits{1024, 0});
  hub.on_message("conn-1", frames[0]);
  SNAPSEND_CHECK(out.count("conn-2", "file-chunk") == 1);
  hub.on_disconnected("conn-1");
  auto aborts = out.to("conn-2", "transfer-abort");
  SNAPSEND_CHECK(aborts.size() == 1);
  SNAPSEND_CHECK(aborts[0]["data"]["transferId"] == "x-cut");
  auto failed = events.all<TransferFailed>();
  SNAPSEND_CHECK(failed.size() == 1 && failed[0].kind == ErrorKind::ChannelLost);
  SNAPSEND_CHECK(hub.stats().streams_in_flight == 0);
  return true;
}

bool test_hub_queues_chunked_stream_until_paired(TestContext&) {
  FakeOutbox out;
  RelayHub::Options options;
  options.limits = ChunkLimits{1024, 1024};
  RelayHub hub(out, options);
  join(hub, "conn-1", "Laptop", "dev-a");
  join(hub, "conn-2", "Phone", "dev-b");
  join(hub, "conn-3", "Tablet", "dev-c");

  const auto payload = patterned_bytes(2500);
  auto frames = collect_frames(memory_transfer("x-later", "later.bin", payload, TargetDescriptor::device("conn-3")),
                               ChunkLimits{1024, 0});
  for(const auto& f : frames) hub.on_message("conn-1", f);
  SNAPSEND_CHECK(out.count("conn-1", "file-queued") == 1);
  SNAPSEND_CHECK(hub.pending().size() == 1);

  hub.on_message("conn-3", encode_message(PairRequest{"conn-1"}));
  auto forwarded = out.to("conn-3", "file-chunk");
  SNAPSEND_CHECK(forwarded.size() == 3);
  ChunkAssembler assembler(nullptr, 60s);
  std::optional<AssembledPayload> done;
  for(const auto& f : forwarded) done = assembler.accept("relay", as_frame(f));
  SNAPSEND_CHECK(done && done->bytes == payload);
  SNAPSEND_CHECK(out.count("conn-1", "file-sent-confirmation") == 1);
  SNAPSEND_CHECK(hub.pending().empty());
  return true;
}

bool test_hub_expires_stalled_queued_stream(TestContext&) {
  FakeOutbox out;
  RelayHub::Options options;
  options.assembly_timeout = 1000ms;
  RelayHub hub(out, options);
  EventRecorder events(hub.bus());
  join(hub, "conn-1", "Laptop", "dev-a");
  join(hub, "conn-2", "Phone", "dev-b");
  join(hub, "conn-3", "Tablet", "dev-c");

  auto frames = collect_frames(memory_transfer("x-stall", "stall.bin", patterned_bytes(3000),
                                               TargetDescriptor::device("conn-3")), ChunkLimits{1024, 0});
  hub.on_message("conn-1", frames[0]);
  hub.expire_assemblies(std::chrono::steady_clock::now() + 5s);
  auto failed = out.to("conn-1", "transfer-failed");
  SNAPSEND_CHECK(failed.size() == 1);
  auto timeouts = events.all<TransferFailed>();
  SNAPSEND_CHECK(timeouts.size() == 1 && timeouts[0].kind == ErrorKind::ChunkAssemblyTimeout);
  return true;
}

bool test_hub_routes_to_relayed_client(TestContext&) {
  FakeOutbox out;
  RelayHub hub(out, RelayHub::Options{});
  join(hub, "conn-1", "Laptop", "dev-a");
  join(hub, "conn-2", "Phone", "dev-b");

  Device thin;
  thin.handle = "rc-1";
  thin.display_name = "Browser";
  hub.on_message("conn-2", encode_message(RelayDevices{{thin}}));
  SNAPSEND_CHECK(hub.relayed_clients().size() == 1);

  hub.on_message("conn-1", inline_transfer("x1", "for-thin.txt", "hi thin", TargetDescriptor::relayed("rc-1")));
  auto relayed = out.to("conn-2", "relay-file-transfer");
  SNAPSEND_CHECK(relayed.size() == 1);
  SNAPSEND_CHECK(relayed[0]["data"]["targetClientId"] == "rc-1");
  auto m = std::get<FileTransferMessage>(decode_message(relayed[0]));
  SNAPSEND_CHECK(decode_inline_content(m.content, m.encoding) == "hi thin");
  SNAPSEND_CHECK(out.count("conn-1", "file-sent-confirmation") == 1);

  // The client leaving its host queues further sends until it is listed again.
  hub.on_message("conn-2", encode_message(RelayDevices{}));
  hub.on_message("conn-1", inline_transfer("x2", "later.txt", "later", TargetDescriptor::relayed("rc-1")));
  SNAPSEND_CHECK(out.count("conn-1", "file-queued") == 1);
  hub.on_message("conn-2", encode_message(RelayDevices{{thin}}));
  SNAPSEND_CHECK(out.to("conn-2", "relay-file-transfer").size() == 2);
  SNAPSEND_CHECK(hub.pending().empty());
  return true;
}

} // namespace

int main(int argc, char** argv) {
  std::vector<TestCase> tests = {
    {"protocol_rejects_malformed", test_protocol_rejects_malformed},
    {"protocol_wire_shapes", test_protocol_wire_shapes},
    {"registry_reconnect_keeps_one_record", test_registry_reconnect_keeps_one_record},
    {"registry_forgets_old_handles", test_registry_forgets_old_handles},
    {"auto_pair_only_with_two_online", test_auto_pair_only_with_two_online},
    {"auto_pair_when_count_drops_to_two", test_auto_pair_when_count_drops_to_two},
    {"reconnect_moves_pairing_to_new_handle", test_reconnect_moves_pairing_to_new_handle},
    {"pair_is_idempotent_and_unordered", test_pair_is_idempotent_and_unordered},
    {"device_lost_ends_its_pairings", test_device_lost_ends_its_pairings},
    {"resolver_outcomes", test_resolver_outcomes},
    {"queue_flushes_in_order_on_pairing", test_queue_flushes_in_order_on_pairing},
    {"chunk_two_hundred_frames_any_order", test_chunk_two_hundred_frames_any_order},
    {"chunk_duplicates_and_conflicts", test_chunk_duplicates_and_conflicts},
    {"chunk_assembly_times_out", test_chunk_assembly_times_out},
    {"chunk_sender_cancel_between_frames", test_chunk_sender_cancel_between_frames},
    {"chunk_sender_across_threads", test_chunk_sender_across_threads},
    {"lan_advert_rejects_mistyped_fields", test_lan_advert_rejects_mistyped_fields},
    {"progress_is_monotonic", test_progress_is_monotonic},
    {"file_store_names", test_file_store_names},
    {"transfer_store_persists", test_transfer_store_persists},
    {"inbox_receives_inline_and_chunked", test_inbox_receives_inline_and_chunked},
    {"settings_and_command_line", test_settings_and_command_line},
    {"hub_setup_and_auto_pair", test_hub_setup_and_auto_pair},
    {"hub_broadcast_and_clipboard", test_hub_broadcast_and_clipboard},
    {"hub_broadcast_without_partner_saves_local", test_hub_broadcast_without_partner_saves_local},
    {"hub_queue_flushes_on_pair_request", test_hub_queue_flushes_on_pair_request},
    {"hub_disconnect_and_terminate", test_hub_disconnect_and_terminate},
    {"hub_reconnect_keeps_identity", test_hub_reconnect_keeps_identity},
    {"hub_protocol_errors_keep_connection", test_hub_protocol_errors_keep_connection},
    {"hub_rename_broadcasts", test_hub_rename_broadcasts},
    {"hub_forwards_chunk_streams", test_hub_forwards_chunk_streams},
    {"hub_aborts_stream_when_sender_lost", test_hub_aborts_stream_when_sender_lost},
    {"hub_queues_chunked_stream_until_paired", test_hub_queues_chunked_stream_until_paired},
    {"hub_expires_stalled_queued_stream", test_hub_expires_stalled_queued_stream},
    {"hub_routes_to_relayed_client", test_hub_routes_to_relayed_client},
  };
  return snapsend::test::run_tests("core", argc, argv, tests);
}
