#pragma once

#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "log.hpp"

// key, aliases, type, default, description, persistent; optional "choices"
// for strings and "min"/"max" for ints.
inline const nlohmann::json SETTINGS_SPECIFICATION = nlohmann::json::array({
  {{"key","mode"},                      {"aliases", {"m"}},                {"type","string"}, {"default","direct"},     {"choices", {"direct","relay-server","relay-client"}}, {"description","Node role"}, {"persistent", true}},
  {{"key","listen_ip"},                 {"aliases", {"li"}},               {"type","string"}, {"default","0.0.0.0"},    {"description","Interface/IP to bind"}, {"persistent", true}},
  {{"key","listen_port"},               {"aliases", {"lp","port"}},        {"type","int"},    {"default",7420},         {"min",0}, {"max",65535}, {"description","TCP port for the relay or transfer server"}, {"persistent", true}},
  {{"key","relay_server"},              {"aliases", {"relay","rs"}},       {"type","string"}, {"default","127.0.0.1:7420"}, {"description","Relay host:port (relay-client mode)"}, {"persistent", true}},
  {{"key","device_name"},               {"aliases", {"name","n"}},         {"type","string"}, {"default",""},           {"description","Display name (defaults to host name)"}, {"persistent", true}},
  {{"key","discovery_port"},            {"aliases", {"dp"}},               {"type","int"},    {"default",7421},         {"min",0}, {"max",65535}, {"description","UDP port for local-network adverts (0 disables)"}, {"persistent", true}},
  {{"key","advertise_interval_ms"},     {"aliases", {"aim"}},              {"type","int"},    {"default",2000},         {"min",100}, {"max",600000}, {"description","Milliseconds between adverts"}, {"persistent", true}},
  {{"key","advert_ttl_ms"},             {"aliases", {"ttl"}},              {"type","int"},    {"default",7000},         {"min",200}, {"max",3600000}, {"description","A peer is lost when no advert arrives for this long"}, {"persistent", true}},
  {{"key","auto_connect"},              {"aliases", {"ac"}},               {"type","bool"},   {"default",true},         {"description","Open a link to every discovered peer"}, {"persistent", true}},
  {{"key","static_peers"},              {"aliases", {"peers","sp"}},       {"type","string"}, {"default",""},           {"description","Comma separated host:port peers (disables UDP discovery)"}, {"persistent", true}},
  {{"key","reconnect_delay_ms"},        {"aliases", {"rdm"}},              {"type","int"},    {"default",3000},         {"min",10}, {"max",600000}, {"description","Delay before reconnecting a dropped channel"}, {"persistent", true}},
  {{"key","chunk_assembly_timeout_ms"}, {"aliases", {"cat"}},              {"type","int"},    {"default",120000},       {"min",100}, {"max",86400000}, {"description","Give up on a chunked transfer after this long without a chunk"}, {"persistent", true}},
  {{"key","auto_pair"},                 {"aliases", {"ap"}},               {"type","bool"},   {"default",true},         {"description","Pair automatically when exactly two devices are online"}, {"persistent", true}},
  {{"key","download_dir"},              {"aliases", {"dd","downloads"}},   {"type","string"}, {"default","downloads"},  {"description","Where received files are stored (relative to the workspace)"}, {"persistent", true}},
  {{"key","log_file"},                  {"aliases", {"lf"}},               {"type","string"}, {"default",""},           {"description","Also write logs to this file"}, {"persistent", true}},
  {{"key","verbose"},                   {"aliases", {"v"}},                {"type","bool"},   {"default",false},        {"description","Enable verbose logging"}, {"persistent", true}},
  {{"key","help"},                      {"aliases", {"h","?"}},            {"type","bool"},   {"default",false},        {"description","Show command help and exit"}, {"persistent", false}},
  {{"key","save"},                      {"aliases", {"persist"}},          {"type","bool"},   {"default",false},        {"description","Persist current settings to disk"}, {"persistent", false}}
});

class SettingsManager {
public:
  SettingsManager();
  explicit SettingsManager(const nlohmann::json& specification);

  template<typename T>
  T get(const std::string& key) const;

  bool has(const std::string& key) const;

  bool set_from_string(const std::string& key, const std::string& value, std::string& error);
  bool set_from_json(const std::string& key, const nlohmann::json& value, std::string& error);

  bool load();
  bool save() const;
  bool load_from_file(const std::filesystem::path& path);
  bool save_to_file(const std::filesystem::path& path) const;

  bool save_requested() const { return has("save") && get<bool>("save"); }
  bool help_requested() const { return has("help") && get<bool>("help"); }

  std::vector<std::string> keys() const;
  std::string value_as_string(const std::string& key) const;
  std::string description(const std::string& key) const;
  std::optional<std::string> resolve_key(const std::string& token) const;
  bool is_bool_setting(const std::string& key) const;

  std::filesystem::path settings_path() const;
  void set_settings_path(const std::filesystem::path& path);

  nlohmann::json get_json(bool persistent_only = true) const;
  void set_json(const nlohmann::json& doc);

  static std::string to_lower(std::string value);
  static std::string trim_copy(std::string value);
  static bool is_bool_literal(const std::string& value);

private:
  struct SettingSpec {
    std::string key;
    std::vector<std::string> aliases;
    std::string type;
    nlohmann::json default_value;
    std::vector<std::string> choices;
    std::optional<int64_t> min;
    std::optional<int64_t> max;
    std::string description;
    bool persistent = true;
  };

  static std::vector<SettingSpec> build_setting_specs(const nlohmann::json& specification);
  const SettingSpec* find_spec(const std::string& token) const;

  void apply_defaults();
  void merge_from_json(const nlohmann::json& doc);
  bool store(const SettingSpec& spec, const nlohmann::json& value, std::string& error);
  nlohmann::json parse_string_value(const SettingSpec& spec, const std::string& value, std::string& error) const;

  nlohmann::json settings_;
  std::vector<SettingSpec> specs_;
  std::filesystem::path settings_path_override_;
};

template<typename T>
T SettingsManager::get(const std::string& key) const {
  if(!has(key)) {
    throw std::runtime_error("Unknown setting: " + key);
  }
  return settings_.at(key).get<T>();
}
