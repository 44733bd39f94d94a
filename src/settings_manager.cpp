#include "settings_manager.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <fstream>

using json = nlohmann::json;

std::vector<SettingsManager::SettingSpec> SettingsManager::build_setting_specs(const json& specification) {
  std::vector<SettingSpec> result;
  for(const auto& entry : specification) {
    SettingSpec spec;
    spec.key = entry.at("key").get<std::string>();
    for(const auto& alias : entry.value("aliases", json::array())) {
      spec.aliases.push_back(to_lower(alias.get<std::string>()));
    }
    spec.type = entry.at("type").get<std::string>();
    spec.default_value = entry.at("default");
    if(entry.contains("choices")) spec.choices = entry.at("choices").get<std::vector<std::string>>();
    if(entry.contains("min")) spec.min = entry.at("min").get<int64_t>();
    if(entry.contains("max")) spec.max = entry.at("max").get<int64_t>();
    spec.description = entry.value("description", "");
    spec.persistent = entry.value("persistent", true);
    result.push_back(std::move(spec));
  }
  return result;
}

SettingsManager::SettingsManager()
  : SettingsManager(SETTINGS_SPECIFICATION) {}

SettingsManager::SettingsManager(const json& specification)
  : specs_(build_setting_specs(specification)) {
  apply_defaults();
}

void SettingsManager::apply_defaults() {
  settings_ = json::object();
  for(const auto& spec : specs_) settings_[spec.key] = spec.default_value;
}

const SettingsManager::SettingSpec* SettingsManager::find_spec(const std::string& token) const {
  const std::string lowered = to_lower(trim_copy(token));
  for(const auto& spec : specs_) {
    if(lowered == to_lower(spec.key)) return &spec;
  }
  for(const auto& spec : specs_) {
    if(std::find(spec.aliases.begin(), spec.aliases.end(), lowered) != spec.aliases.end()) return &spec;
  }
  return nullptr;
}

bool SettingsManager::has(const std::string& key) const {
  return settings_.contains(key);
}

std::vector<std::string> SettingsManager::keys() const {
  std::vector<std::string> out;
  out.reserve(specs_.size());
  for(const auto& spec : specs_) out.push_back(spec.key);
  return out;
}

std::string SettingsManager::value_as_string(const std::string& key) const {
  if(!has(key)) return "<unknown>";
  const auto& value = settings_.at(key);
  if(value.is_string()) return value.get<std::string>();
  if(value.is_boolean()) return value.get<bool>() ? "true" : "false";
  return value.dump();
}

std::string SettingsManager::description(const std::string& key) const {
  const auto* spec = find_spec(key);
  return spec ? spec->description : std::string();
}

std::optional<std::string> SettingsManager::resolve_key(const std::string& token) const {
  if(const auto* spec = find_spec(token)) return spec->key;
  return std::nullopt;
}

bool SettingsManager::is_bool_setting(const std::string& key) const {
  const auto* spec = find_spec(key);
  return spec && spec->type == "bool";
}

void SettingsManager::set_settings_path(const std::filesystem::path& path) {
  settings_path_override_ = path;
}

std::filesystem::path SettingsManager::settings_path() const {
  if(!settings_path_override_.empty()) return settings_path_override_;
  return std::filesystem::current_path() / ".config" / "settings.json";
}

bool SettingsManager::load() {
  return load_from_file(settings_path());
}

bool SettingsManager::save() const {
  return save_to_file(settings_path());
}

bool SettingsManager::load_from_file(const std::filesystem::path& path) {
  std::ifstream in(path);
  if(!in) return false;
  try {
    json doc;
    in >> doc;
    merge_from_json(doc);
    return true;
  } catch(const json::exception& e) {
    print_err(nullptr, "Failed to parse {}: {}", path.string(), e.what());
    return false;
  }
}

bool SettingsManager::save_to_file(const std::filesystem::path& path) const {
  if(path.empty()) return false;
  std::error_code ec;
  if(path.has_parent_path()) std::filesystem::create_directories(path.parent_path(), ec);
  std::ofstream out(path, std::ios::trunc);
  if(!out) {
    print_err(nullptr, "Unable to write {}", path.string());
    return false;
  }
  out << get_json(true).dump(2);
  return true;
}

void SettingsManager::merge_from_json(const json& doc) {
  if(!doc.is_object()) return;
  for(const auto& item : doc.items()) {
    const auto* spec = find_spec(item.key());
    if(!spec) continue;
    std::string error;
    if(!store(*spec, item.value(), error)) {
      print_err(nullptr, "Ignoring invalid setting '{}': {}", item.key(), error);
    }
  }
}

void SettingsManager::set_json(const json& doc) {
  merge_from_json(doc);
}

json SettingsManager::get_json(bool persistent_only) const {
  json doc = json::object();
  for(const auto& spec : specs_) {
    if(persistent_only && !spec.persistent) continue;
    doc[spec.key] = settings_.at(spec.key);
  }
  return doc;
}

bool SettingsManager::store(const SettingSpec& spec, const json& value, std::string& error) {
  if(spec.type == "bool") {
    if(value.is_boolean()) {
      settings_[spec.key] = value.get<bool>();
      return true;
    }
    if(value.is_number_integer()) {
      settings_[spec.key] = value.get<int64_t>() != 0;
      return true;
    }
    error = "expected boolean";
    return false;
  }
  if(spec.type == "int") {
    if(!value.is_number_integer()) {
      error = "expected integer";
      return false;
    }
    auto v = value.get<int64_t>();
    if((spec.min && v < *spec.min) || (spec.max && v > *spec.max)) {
      error = "out of range [" + std::to_string(spec.min.value_or(INT64_MIN)) + ", " +
              std::to_string(spec.max.value_or(INT64_MAX)) + "]";
      return false;
    }
    settings_[spec.key] = static_cast<int>(v);
    return true;
  }
  if(spec.type == "string") {
    if(!value.is_string()) {
      error = "expected string";
      return false;
    }
    auto s = value.get<std::string>();
    if(!spec.choices.empty() &&
       std::find(spec.choices.begin(), spec.choices.end(), s) == spec.choices.end()) {
      error = "expected one of";
      for(const auto& c : spec.choices) error += " " + c;
      return false;
    }
    settings_[spec.key] = s;
    return true;
  }
  error = "unknown type '" + spec.type + "'";
  return false;
}

json SettingsManager::parse_string_value(const SettingSpec& spec,
                                         const std::string& value,
                                         std::string& error) const {
  error.clear();
  const std::string clean = trim_copy(value);
  if(spec.type == "bool") {
    const std::string v = to_lower(clean);
    if(v == "true" || v == "1" || v == "on" || v == "yes") return true;
    if(v == "false" || v == "0" || v == "off" || v == "no") return false;
    error = "expected boolean (true|false|on|off)";
    return {};
  }
  if(spec.type == "int") {
    try {
      std::size_t used = 0;
      long long parsed = std::stoll(clean, &used);
      if(used != clean.size()) {
        error = "trailing characters in '" + clean + "'";
        return {};
      }
      return static_cast<int64_t>(parsed);
    } catch(const std::exception& e) {
      error = e.what();
      return {};
    }
  }
  return clean;
}

bool SettingsManager::set_from_string(const std::string& key, const std::string& value, std::string& error) {
  const auto* spec = find_spec(key);
  if(!spec) {
    error = "unknown setting";
    return false;
  }
  auto parsed = parse_string_value(*spec, value, error);
  if(!error.empty()) return false;
  return store(*spec, parsed, error);
}

bool SettingsManager::set_from_json(const std::string& key, const json& value, std::string& error) {
  const auto* spec = find_spec(key);
  if(!spec) {
    error = "unknown setting";
    return false;
  }
  error.clear();
  return store(*spec, value, error);
}

std::string SettingsManager::to_lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char ch){ return static_cast<char>(std::tolower(ch)); });
  return value;
}

std::string SettingsManager::trim_copy(std::string value) {
  value.erase(value.begin(), std::find_if(value.begin(), value.end(),
    [](unsigned char ch){ return !std::isspace(ch); }));
  value.erase(std::find_if(value.rbegin(), value.rend(),
    [](unsigned char ch){ return !std::isspace(ch); }).base(), value.end());
  return value;
}

bool SettingsManager::is_bool_literal(const std::string& value) {
  const std::string lowered = to_lower(trim_copy(value));
  return lowered == "true" || lowered == "false" ||
         lowered == "on" || lowered == "off" ||
         lowered == "1" || lowered == "0" ||
         lowered == "yes" || lowered == "no";
}
